/**
 * @file drawdown_segmenter.cpp
 * @brief Implementation of the drawdown event state machine.
 */

#include "analytics/drawdown_segmenter.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace drawdown
{
    namespace analytics
    {

        namespace
        {

            /// No drawdown in progress.
            struct AtPeak
            {
            };

            /// Tracking the candidate trough of the current episode.
            struct InDrawdown
            {
                double peak_value;
                Date peak_date;
                size_t peak_index;
                double trough_value;
                Date trough_date;
                size_t trough_index;
            };

            using SegmenterState = std::variant<AtPeak, InDrawdown>;

            DrawdownEvent make_event(const InDrawdown &state)
            {
                DrawdownEvent event;
                event.peak_value = state.peak_value;
                event.peak_date = state.peak_date;
                event.peak_index = state.peak_index;
                event.trough_value = state.trough_value;
                event.trough_date = state.trough_date;
                event.trough_index = state.trough_index;
                event.max_drawdown_amount = state.peak_value - state.trough_value;
                event.max_drawdown_percent = -event.max_drawdown_amount / state.peak_value;
                event.duration_days = state.trough_date - state.peak_date;
                event.is_recovered = false;
                return event;
            }

        } // anonymous namespace

        // ===================================================================
        // SegmentationResult
        // ===================================================================

        std::optional<DrawdownEvent> SegmentationResult::open_event() const
        {
            if (!has_open_event || events.empty())
            {
                return std::nullopt;
            }
            return events.back();
        }

        // ===================================================================
        // DrawdownSegmenter
        // ===================================================================

        DrawdownSegmenter::DrawdownSegmenter(const ValuationSeries &series,
                                             const HighWaterMarkTracker &marks)
        {
            if (series.size() != marks.size())
            {
                throw std::invalid_argument(
                    "High-water mark count (" + std::to_string(marks.size()) + ") must match series size (" + std::to_string(series.size()) + ")");
            }
            if (series.size() < 2)
            {
                return;
            }

            SegmenterState state = AtPeak{};

            // Start of the next episode: the last new high, or the last recovery point
            size_t episode_peak_index = 0;
            Date episode_peak_date = series.date(0);

            for (size_t i = 0; i < series.size(); ++i)
            {
                const HighWaterMark &mark = marks.at(i);
                double value = series.value(i);

                if (mark.peak_value <= 0.0)
                {
                    std::ostringstream oss;
                    oss << "Running peak must be positive for percentage drawdown, got "
                        << mark.peak_value << " on " << mark.date;
                    throw InvalidSeriesError(oss.str(), mark.date, mark.peak_value);
                }

                if (mark.peak_date == series.date(i))
                {
                    episode_peak_index = i;
                    episode_peak_date = series.date(i);
                }

                if (auto *open = std::get_if<InDrawdown>(&state))
                {
                    if (value >= open->peak_value)
                    {
                        DrawdownEvent event = make_event(*open);
                        event.recovery_value = value;
                        event.recovery_date = series.date(i);
                        event.recovery_index = i;
                        event.recovery_days = series.date(i) - open->trough_date;
                        event.total_days = series.date(i) - open->peak_date;
                        event.is_recovered = true;
                        result_.events.push_back(event);
                        state = AtPeak{};

                        // A recovery that only matches the peak restarts the episode here
                        episode_peak_index = i;
                        episode_peak_date = series.date(i);
                    }
                    else if (value < open->trough_value)
                    {
                        // Strictly lower only: the earliest of equal lows stays the trough
                        open->trough_value = value;
                        open->trough_date = series.date(i);
                        open->trough_index = i;
                    }
                }
                else if (value < mark.peak_value)
                {
                    state = InDrawdown{mark.peak_value, episode_peak_date, episode_peak_index,
                                       value, series.date(i), i};
                }
            }

            if (const auto *open = std::get_if<InDrawdown>(&state))
            {
                result_.events.push_back(make_event(*open));
                result_.has_open_event = true;
            }
        }

        // ===================================================================
        // Event selection helpers
        // ===================================================================

        std::vector<DrawdownEvent> filter_by_magnitude(const std::vector<DrawdownEvent> &events,
                                                       double min_drawdown_percent)
        {
            if (!std::isfinite(min_drawdown_percent) || min_drawdown_percent < 0.0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'min_drawdown_percent', got: " + std::to_string(min_drawdown_percent));
            }

            std::vector<DrawdownEvent> result;
            std::copy_if(events.begin(), events.end(), std::back_inserter(result),
                         [min_drawdown_percent](const DrawdownEvent &e)
                         {
                             return e.max_drawdown_amount * 100.0 / e.peak_value >= min_drawdown_percent;
                         });
            return result;
        }

        std::vector<DrawdownEvent> top_drawdowns(const std::vector<DrawdownEvent> &events, int n)
        {
            if (n < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'n', got: " + std::to_string(n));
            }

            std::vector<DrawdownEvent> sorted_events(events);
            std::stable_sort(sorted_events.begin(), sorted_events.end(),
                             [](const DrawdownEvent &a, const DrawdownEvent &b)
                             {
                                 return a.max_drawdown_percent < b.max_drawdown_percent; // deepest first
                             });

            size_t count = std::min(static_cast<size_t>(n), sorted_events.size());
            sorted_events.resize(count);
            return sorted_events;
        }

    } // namespace analytics
} // namespace drawdown
