/**
 * @file main.cpp
 * @brief Main entry point for the drawdown report tool
 *
 * Command-line application that loads configuration and a valuation
 * series, runs the drawdown analytics engine, prints the report and
 * writes the results.
 */

#include "alerts/threshold_store.hpp"
#include "analytics/drawdown_analytics.hpp"
#include "data/data_loader.hpp"
#include "data/series_provider.hpp"
#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

using namespace drawdown;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Drawdown Report v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --user ID             Account to analyze and whose alert thresholds apply\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/drawdown_config.json --verbose\n"
              << "  " << program_name << " --config data/config/drawdown_config.json --user acct-1\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Drawdown Report v1.0.0                                   \n"
              << "       Drawdown and Performance Analytics                       \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir = "results";
    std::string user_id;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--user" && i + 1 < argc)
            {
                args.user_id = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Load the series named by the configuration
 */
ValuationSeries load_series(const EngineConfig &config, const CommandLineArgs &args)
{
    if (!config.data.valuation_dir.empty() && !args.user_id.empty())
    {
        CsvSeriesProvider provider(config.data.valuation_dir);
        if (args.verbose)
        {
            std::cout << "  - Provider: " << provider.get_name() << " ("
                      << provider.path_for(args.user_id) << ")\n";
        }
        return provider.load_series(args.user_id, std::nullopt, std::nullopt);
    }

    if (config.data.valuation_file.empty())
    {
        throw std::runtime_error(
            "Configuration must set data.valuation_file, or data.valuation_dir together with --user");
    }
    return DataLoader::load_valuations_csv(config.data.valuation_file);
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);
        alerts::ConfiguredThresholdStore threshold_store(config.alerts, config.user_alerts);

        if (args.verbose)
        {
            std::cout << "  - Period: " << config.data.period << "\n";
            if (config.data.start_date || config.data.end_date)
            {
                std::cout << "  - Date range: "
                          << (config.data.start_date ? config.data.start_date->to_string() : "start")
                          << " to "
                          << (config.data.end_date ? config.data.end_date->to_string() : "end") << "\n";
            }
            std::cout << "  - Risk-free rate: " << config.analytics.risk_free_rate << "\n";
            std::cout << "  - Min drawdown: " << config.analytics.min_drawdown_percent << "%\n";
            std::cout << "  - Alerts: " << (config.alerts ? "enabled" : "disabled") << "\n";
        }

        // ====================================================================
        // 2. Load Valuations
        // ====================================================================
        std::cout << "[2/5] Loading valuations..." << std::endl;

        auto series = load_series(config, args);
        std::cout << "  - Loaded " << series.size() << " observations" << std::endl;

        std::optional<ValuationSeries> benchmark;
        if (!config.data.benchmark_file.empty())
        {
            benchmark = DataLoader::load_valuations_csv(config.data.benchmark_file);
            std::cout << "  - Loaded " << benchmark->size() << " benchmark observations" << std::endl;
        }

        // ====================================================================
        // 3. Build Query
        // ====================================================================
        std::cout << "[3/5] Building query..." << std::endl;

        analytics::AnalyticsQuery query;
        if (!series.empty())
        {
            Date as_of = config.data.end_date.value_or(series.back().date);
            query = analytics::AnalyticsQuery::for_period(config.data.period, as_of);
        }
        if (config.data.start_date)
        {
            query.start_date = config.data.start_date;
        }
        if (config.data.end_date)
        {
            query.end_date = config.data.end_date;
        }
        query.min_drawdown_percent = config.analytics.min_drawdown_percent;
        query.top_events = config.analytics.top_events;
        query.benchmark = benchmark;
        query.thresholds = threshold_store.thresholds_for(args.user_id);

        if (args.verbose && query.thresholds)
        {
            std::cout << "  - Thresholds: " << query.thresholds->to_json().dump() << "\n";
        }

        // ====================================================================
        // 4. Run Analytics
        // ====================================================================
        std::cout << "[4/5] Running drawdown analytics..." << std::endl;

        analytics::StatisticsSettings settings;
        settings.risk_free_rate = config.analytics.risk_free_rate;
        settings.trading_days_per_year = config.analytics.trading_days_per_year;

        analytics::DrawdownAnalyticsFacade facade(settings);
        auto result = facade.analyze(series, query);

        std::cout << "  - " << result.events.size() << " drawdown events, "
                  << result.alerts.size() << " alerts" << std::endl;

        std::cout << "\n"
                  << result.report() << std::endl;

        // ====================================================================
        // 5. Write Output
        // ====================================================================
        std::cout << "[5/5] Writing results to " << args.output_dir << "..." << std::endl;

        DataLoader::save_underwater_csv(args.output_dir + "/underwater.csv", result.underwater_curve);
        DataLoader::save_events_csv(args.output_dir + "/events.csv", result.events);

        std::string json_file = args.output_dir + "/analytics.json";
        std::ofstream json_out(json_file);
        if (!json_out.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + json_file);
        }
        json_out << result.to_json() << "\n";

        if (args.verbose)
        {
            std::cout << "  - " << json_file << "\n"
                      << "  - " << args.output_dir << "/underwater.csv\n"
                      << "  - " << args.output_dir << "/events.csv\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    // Print banner
    print_banner();

    // Run analysis
    return run(args);
}
