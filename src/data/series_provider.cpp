/**
 * @file series_provider.cpp
 * @brief Implementations of the valuation series providers
 */

#include "data/series_provider.hpp"
#include "data/data_loader.hpp"

#include <filesystem>
#include <stdexcept>

namespace drawdown
{

    // ============================================
    // InMemorySeriesProvider
    // ============================================

    void InMemorySeriesProvider::add_series(const std::string &account_id, const ValuationSeries &series)
    {
        series_[account_id] = series;
    }

    ValuationSeries InMemorySeriesProvider::load_series(const std::string &account_id,
                                                        const std::optional<Date> &start_date,
                                                        const std::optional<Date> &end_date) const
    {
        auto it = series_.find(account_id);
        if (it == series_.end())
        {
            if (start_date && end_date && *start_date > *end_date)
            {
                throw std::invalid_argument("Start date must not be after end date");
            }
            return ValuationSeries();
        }
        return it->second.filter_by_date(start_date, end_date);
    }

    // ============================================
    // CsvSeriesProvider
    // ============================================

    CsvSeriesProvider::CsvSeriesProvider(const std::string &directory)
        : directory_(directory)
    {
    }

    std::string CsvSeriesProvider::path_for(const std::string &account_id) const
    {
        if (account_id.empty() || account_id.find('/') != std::string::npos || account_id.find('\\') != std::string::npos || account_id == "." || account_id == "..")
        {
            throw std::invalid_argument("Invalid account id: '" + account_id + "'");
        }
        return (std::filesystem::path(directory_) / (account_id + ".csv")).string();
    }

    ValuationSeries CsvSeriesProvider::load_series(const std::string &account_id,
                                                   const std::optional<Date> &start_date,
                                                   const std::optional<Date> &end_date) const
    {
        std::string path = path_for(account_id);
        if (!std::filesystem::exists(path))
        {
            if (start_date && end_date && *start_date > *end_date)
            {
                throw std::invalid_argument("Start date must not be after end date");
            }
            return ValuationSeries();
        }
        return DataLoader::load_valuations_csv(path).filter_by_date(start_date, end_date);
    }

} // namespace drawdown
