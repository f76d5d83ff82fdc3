/**
 * @file drawdown_segmenter.hpp
 * @brief Segmentation of a valuation series into drawdown events.
 *
 * A drawdown event is one peak-to-trough-to-recovery episode. It opens
 * when the value first drops below the running peak, tracks the lowest
 * value while no recovery has happened, and closes on the first
 * observation whose value is at or above the peak that started it. At
 * most one event is open at a time; if the series ends underwater the
 * last event is returned unrecovered.
 *
 * Day counts are exclusive calendar-day differences between dates.
 */

#ifndef DRAWDOWN_ANALYTICS_DRAWDOWN_SEGMENTER_HPP
#define DRAWDOWN_ANALYTICS_DRAWDOWN_SEGMENTER_HPP

#include "analytics/high_water_mark.hpp"
#include "core/date.hpp"
#include "data/valuation_series.hpp"

#include <optional>
#include <vector>

namespace drawdown
{
    namespace analytics
    {

        /**
         * @struct DrawdownEvent
         * @brief A single drawdown episode.
         *
         * Recovery fields are empty while the event is open.
         */
        struct DrawdownEvent
        {
            double peak_value; ///< High-water mark that started the episode
            Date peak_date;    ///< Date the peak was first reached
            size_t peak_index; ///< Series index of the peak

            double trough_value; ///< Lowest value before recovery
            Date trough_date;    ///< Earliest date of the lowest value
            size_t trough_index; ///< Series index of the trough

            std::optional<double> recovery_value; ///< First value >= peak_value after the trough
            std::optional<Date> recovery_date;    ///< Date of recovery
            std::optional<size_t> recovery_index; ///< Series index of recovery

            double max_drawdown_amount;  ///< peak_value - trough_value (>= 0)
            double max_drawdown_percent; ///< -amount / peak_value (<= 0)

            int duration_days;                ///< trough_date - peak_date
            std::optional<int> recovery_days; ///< recovery_date - trough_date
            std::optional<int> total_days;    ///< recovery_date - peak_date

            bool is_recovered; ///< True once recovery fields are set
        };

        /**
         * @struct SegmentationResult
         * @brief Events in chronological order plus the open-event flag.
         */
        struct SegmentationResult
        {
            std::vector<DrawdownEvent> events;
            bool has_open_event = false; ///< True if the last event is unrecovered

            /**
             * @brief The currently open event, if the series ends underwater.
             */
            std::optional<DrawdownEvent> open_event() const;
        };

        /**
         * @class DrawdownSegmenter
         * @brief State machine over the series and its high-water marks.
         *
         * The segmenter records every decline, however small; materiality
         * filtering is applied afterwards with filter_by_magnitude().
         *
         * Usage:
         * @code
         *   HighWaterMarkTracker hwm(series);
         *   DrawdownSegmenter segmenter(series, hwm);
         *   for (const auto &event : segmenter.events()) { ... }
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class DrawdownSegmenter
        {
        public:
            /**
             * @brief Segment a series.
             * @param series Validated valuation series.
             * @param marks High-water marks computed from the same series.
             * @throws std::invalid_argument If marks and series differ in size.
             * @throws InvalidSeriesError If a running peak is not positive.
             *
             * A series with fewer than 2 points produces no events.
             */
            DrawdownSegmenter(const ValuationSeries &series,
                              const HighWaterMarkTracker &marks);

            ~DrawdownSegmenter() = default;

            const SegmentationResult &result() const { return result_; }
            const std::vector<DrawdownEvent> &events() const { return result_.events; }
            bool has_open_event() const { return result_.has_open_event; }
            std::optional<DrawdownEvent> open_event() const { return result_.open_event(); }

        private:
            SegmentationResult result_;
        };

        // -------------------------------------------------------------------
        // Event selection helpers
        // -------------------------------------------------------------------

        /**
         * @brief Keep events at least as deep as a minimum magnitude.
         * @param min_drawdown_percent Unsigned percent, e.g. 5.0 keeps events of 5% or deeper.
         * @throws std::invalid_argument If the threshold is negative or not finite.
         */
        std::vector<DrawdownEvent> filter_by_magnitude(const std::vector<DrawdownEvent> &events,
                                                       double min_drawdown_percent);

        /**
         * @brief The n deepest events, deepest first.
         *
         * Events of equal depth keep chronological order.
         *
         * @throws std::invalid_argument If n < 1.
         */
        std::vector<DrawdownEvent> top_drawdowns(const std::vector<DrawdownEvent> &events, int n);

    } // namespace analytics
} // namespace drawdown

#endif // DRAWDOWN_ANALYTICS_DRAWDOWN_SEGMENTER_HPP
