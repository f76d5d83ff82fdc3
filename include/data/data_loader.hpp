/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 * 
 * Loads valuation series from CSV files and engine configuration from
 * JSON files, and writes analytics output as CSV.
 */

#ifndef DATA_LOADER_HPP
#define DATA_LOADER_HPP

#include "valuation_series.hpp"
#include "alerts/alert_evaluator.hpp"
#include "analytics/drawdown_segmenter.hpp"
#include "analytics/underwater_curve.hpp"
#include "core/date.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>


namespace drawdown {

/**
 * @struct DataConfig
 * @brief Where the valuation data lives and which window to analyze
 */
struct DataConfig {
    std::string valuation_file;                ///< CSV with date,value rows
    std::string valuation_dir;                 ///< Directory of <account>.csv files
    std::string benchmark_file;                ///< Optional benchmark CSV
    std::optional<Date> start_date;            ///< Inclusive window start
    std::optional<Date> end_date;              ///< Inclusive window end
    std::string period;                        ///< 1D, 7D, 1M, 3M, 6M, 1Y, YTD or ALL
    
    /**
     * @brief Load from JSON object
     * @throws std::invalid_argument if a date is malformed
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AnalyticsConfig
 * @brief Statistics and event selection parameters
 */
struct AnalyticsConfig {
    double risk_free_rate;                     ///< Annualized, as a fraction
    int trading_days_per_year;                 ///< Annualization factor
    double min_drawdown_percent;               ///< Event materiality, percent
    int top_events;                            ///< Events shown in the report
    
    static AnalyticsConfig from_json(const nlohmann::json& j);
};

/**
 * @struct EngineConfig
 * @brief Complete engine configuration
 */
struct EngineConfig {
    DataConfig data;
    AnalyticsConfig analytics;
    std::optional<alerts::AlertThresholdConfig> alerts;                   ///< Default thresholds
    std::map<std::string, alerts::AlertThresholdConfig> user_alerts;      ///< Per-user overrides
    
    EngineConfig();

    /**
     * @brief Load complete configuration from JSON file
     */
    static EngineConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Reads valuation series and configuration, writes analytics CSVs
 * 
 * Valuation CSV format:
 * date,value
 * 2024-01-02,10523.17
 * 
 * The value column may also be named total_value.
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;
    
    // ========================================================================
    // CSV Loading Methods
    // ========================================================================
    
    /**
     * @brief Load a valuation series from CSV
     * 
     * Rows with an invalid date or value are reported on stderr and skipped.
     * 
     * @param filepath Path to CSV file
     * @return Validated ValuationSeries
     * @throws std::runtime_error if the file cannot be read, has no
     *         recognized header, or contains no valid rows
     * @throws InvalidSeriesError if the rows are unsorted or duplicated
     */
    static ValuationSeries load_valuations_csv(const std::string& filepath);
    
    // ========================================================================
    // Configuration Loading
    // ========================================================================
    
    /**
     * @brief Load JSON configuration file
     * @param filepath Path to JSON config file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);
    
    /**
     * @brief Load complete engine configuration
     * @param config_path Path to config JSON file
     * @return EngineConfig struct
     * @throws InvalidThresholdConfigError if an alerts block is misconfigured
     */
    static EngineConfig load_config(const std::string& config_path);
    
    // ========================================================================
    // Output
    // ========================================================================
    
    /**
     * @brief Write the underwater curve as CSV (parent directories are created)
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_underwater_csv(const std::string& filepath,
                                    const std::vector<analytics::UnderwaterPoint>& curve);
    
    /**
     * @brief Write drawdown events as CSV (parent directories are created)
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_events_csv(const std::string& filepath,
                                const std::vector<analytics::DrawdownEvent>& events);
    
    /**
     * @brief Write a valuation series in the date,value format read by load_valuations_csv
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_valuations_csv(const std::string& filepath, const ValuationSeries& series);
    
    // ========================================================================
    // Synthetic Data
    // ========================================================================
    
    /**
     * @brief Generate a valuation series following a geometric random walk
     * 
     * Observations fall on weekdays only, starting at the first weekday
     * on or after start_date.
     * 
     * @param num_days Number of observations
     * @param start_date First calendar date
     * @param start_value Value of the first observation
     * @param volatility Daily return standard deviation
     * @param drift Daily mean return
     * @param seed Seed of the random generator
     * @return Generated series
     * @throws std::invalid_argument if start_value <= 0 or volatility < 0
     */
    static ValuationSeries generate_synthetic_series(
        size_t num_days,
        const Date& start_date,
        double start_value,
        double volatility,
        double drift,
        unsigned seed);
    
private:
    // ========================================================================
    // Helper Methods
    // ========================================================================
    
    /**
     * @brief Parse CSV line into tokens
     */
    static std::vector<std::string> parse_csv_line(const std::string& line);
    
    /**
     * @brief Trim whitespace from string
     */
    static std::string trim(const std::string& str);
    
    /**
     * @brief Convert string to double, NaN when not a number
     */
    static double safe_stod(const std::string& str);
    
    static void prepare_output_path(const std::string& filepath);
};

} // namespace drawdown

#endif // DATA_LOADER_HPP
