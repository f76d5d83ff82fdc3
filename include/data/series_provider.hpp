/**
 * @file series_provider.hpp
 * @brief Port through which the engine obtains valuation series.
 *
 * The analytics code depends only on ValuationSeriesProvider; where the
 * snapshots are stored (memory, CSV files, a database adapter owned by
 * the caller) is an implementation choice of the provider.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include "core/date.hpp"
#include "data/valuation_series.hpp"

#include <map>
#include <optional>
#include <string>

namespace drawdown
{

    /**
     * @class ValuationSeriesProvider
     * @brief Abstract source of per-account valuation series
     *
     * Usage Example:
     * @code
     * std::unique_ptr<ValuationSeriesProvider> provider =
     *     std::make_unique<CsvSeriesProvider>("data/valuations");
     * ValuationSeries series = provider->load_series("acct-1", start, std::nullopt);
     * @endcode
     */
    class ValuationSeriesProvider
    {
    public:
        virtual ~ValuationSeriesProvider() = default;

        /**
         * @brief Load the series of an account restricted to an inclusive window
         * @param account_id Account or user identifier
         * @param start_date Window start, nullopt for the beginning of history
         * @param end_date Window end, nullopt for the latest observation
         * @return Series, empty when the account has no observations in the window
         * @throws std::invalid_argument if the window is inverted
         */
        virtual ValuationSeries load_series(const std::string &account_id,
                                            const std::optional<Date> &start_date,
                                            const std::optional<Date> &end_date) const = 0;

        /**
         * @brief Get the name of the provider
         */
        virtual std::string get_name() const = 0;
    };

    /**
     * @class InMemorySeriesProvider
     * @brief Provider backed by series registered in memory
     */
    class InMemorySeriesProvider : public ValuationSeriesProvider
    {
    public:
        InMemorySeriesProvider() = default;

        /**
         * @brief Register (or replace) the series of an account
         */
        void add_series(const std::string &account_id, const ValuationSeries &series);

        ValuationSeries load_series(const std::string &account_id,
                                    const std::optional<Date> &start_date,
                                    const std::optional<Date> &end_date) const override;

        std::string get_name() const override { return "InMemory"; }

    private:
        std::map<std::string, ValuationSeries> series_;
    };

    /**
     * @class CsvSeriesProvider
     * @brief Provider reading <directory>/<account_id>.csv files
     *
     * Files use the DataLoader valuation format. An account without a
     * file has no observations.
     */
    class CsvSeriesProvider : public ValuationSeriesProvider
    {
    public:
        explicit CsvSeriesProvider(const std::string &directory);

        /**
         * @throws std::invalid_argument if account_id is empty or contains a path separator
         * @throws std::runtime_error if an existing file cannot be parsed
         */
        ValuationSeries load_series(const std::string &account_id,
                                    const std::optional<Date> &start_date,
                                    const std::optional<Date> &end_date) const override;

        std::string get_name() const override { return "Csv"; }

        /**
         * @brief Path of the file holding an account's valuations
         */
        std::string path_for(const std::string &account_id) const;

    private:
        std::string directory_;
    };

} // namespace drawdown
