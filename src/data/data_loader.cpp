/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>

namespace drawdown
{

    namespace
    {
        std::optional<Date> optional_date(const nlohmann::json &j, const char *key)
        {
            std::string text = j.value(key, "");
            if (text.empty())
            {
                return std::nullopt;
            }
            return Date::parse(text);
        }

        bool is_weekend(const Date &date)
        {
            // 1970-01-01 was a Thursday
            long weekday = ((date.serial() + 4) % 7 + 7) % 7;
            return weekday == 0 || weekday == 6;
        }

        std::string lowercase(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }
    } // anonymous namespace

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.valuation_file = j.value("valuation_file", "");
        config.valuation_dir = j.value("valuation_dir", "");
        config.benchmark_file = j.value("benchmark_file", "");
        config.start_date = optional_date(j, "start_date");
        config.end_date = optional_date(j, "end_date");
        config.period = j.value("period", "ALL");
        return config;
    }

    AnalyticsConfig AnalyticsConfig::from_json(const nlohmann::json &j)
    {
        AnalyticsConfig config;
        config.risk_free_rate = j.value("risk_free_rate", 0.0);
        config.trading_days_per_year = j.value("trading_days_per_year", 252);
        config.min_drawdown_percent = j.value("min_drawdown_percent", 0.0);
        config.top_events = j.value("top_events", 5);
        return config;
    }

    EngineConfig::EngineConfig()
    {
        data = DataConfig::from_json(nlohmann::json::object());
        analytics = AnalyticsConfig::from_json(nlohmann::json::object());
    }

    EngineConfig EngineConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading
    // ===========================

    ValuationSeries DataLoader::load_valuations_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;

        // Read header line
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.size() < 2 || lowercase(trim(header[0])) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column: " + filepath);
        }

        // Locate the value column
        size_t value_column = 0;
        for (size_t i = 1; i < header.size(); ++i)
        {
            std::string name = lowercase(trim(header[i]));
            if (name == "value" || name == "total_value")
            {
                value_column = i;
                break;
            }
        }
        if (value_column == 0)
        {
            throw std::runtime_error("CSV must have a 'value' or 'total_value' column: " + filepath);
        }

        std::vector<ValuationPoint> points;
        int line_number = 1;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() <= value_column)
            {
                std::cerr << "Warning: Skipping line " << line_number << " of " << filepath
                          << ": expected " << (value_column + 1) << " fields, got " << fields.size() << std::endl;
                continue;
            }

            std::string date_text = trim(fields[0]);
            if (!Date::is_valid(date_text))
            {
                std::cerr << "Warning: Skipping line " << line_number << " of " << filepath
                          << ": invalid date '" << date_text << "'" << std::endl;
                continue;
            }

            double value = safe_stod(fields[value_column]);
            if (std::isnan(value))
            {
                std::cerr << "Warning: Skipping line " << line_number << " of " << filepath
                          << ": invalid value '" << trim(fields[value_column]) << "'" << std::endl;
                continue;
            }

            points.push_back(ValuationPoint{Date::parse(date_text), value});
        }

        file.close();

        if (points.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        return ValuationSeries(points);
    }

    // ===========================
    // Configuration Loading
    // ===========================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    EngineConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        EngineConfig config;

        if (j.contains("data"))
        {
            config.data = DataConfig::from_json(j["data"]);
        }

        if (j.contains("analytics"))
        {
            config.analytics = AnalyticsConfig::from_json(j["analytics"]);
        }

        if (j.contains("alerts"))
        {
            config.alerts = alerts::AlertThresholdConfig::from_json(j["alerts"]);
        }

        if (j.contains("users"))
        {
            for (const auto &[user_id, user_config] : j["users"].items())
            {
                // Per-user values override the global block key by key
                nlohmann::json merged = config.alerts ? config.alerts->to_json() : nlohmann::json::object();
                merged.update(user_config);
                config.user_alerts[user_id] = alerts::AlertThresholdConfig::from_json(merged);
            }
        }

        return config;
    }

    // ===========================
    // Output
    // ===========================

    void DataLoader::save_underwater_csv(const std::string &filepath,
                                         const std::vector<analytics::UnderwaterPoint> &curve)
    {
        prepare_output_path(filepath);

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,portfolio_value,peak_value,drawdown_amount,drawdown_percent\n";
        file << std::fixed;

        for (const auto &p : curve)
        {
            file << p.date << ","
                 << std::setprecision(2) << p.portfolio_value << ","
                 << p.peak_value << ","
                 << p.drawdown_amount << ","
                 << std::setprecision(8) << p.drawdown_percent << "\n";
        }
    }

    void DataLoader::save_events_csv(const std::string &filepath,
                                     const std::vector<analytics::DrawdownEvent> &events)
    {
        prepare_output_path(filepath);

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "peak_date,peak_value,trough_date,trough_value,recovery_date,recovery_value,"
             << "max_drawdown_amount,max_drawdown_percent,duration_days,recovery_days,total_days,is_recovered\n";
        file << std::fixed;

        for (const auto &e : events)
        {
            file << e.peak_date << ","
                 << std::setprecision(2) << e.peak_value << ","
                 << e.trough_date << ","
                 << e.trough_value << ",";
            if (e.recovery_date)
            {
                file << *e.recovery_date << "," << *e.recovery_value;
            }
            else
            {
                file << ",";
            }
            file << "," << e.max_drawdown_amount << ","
                 << std::setprecision(8) << e.max_drawdown_percent << ","
                 << e.duration_days << ",";
            if (e.recovery_days)
            {
                file << *e.recovery_days;
            }
            file << ",";
            if (e.total_days)
            {
                file << *e.total_days;
            }
            file << "," << (e.is_recovered ? "true" : "false") << "\n";
        }
    }

    void DataLoader::save_valuations_csv(const std::string &filepath, const ValuationSeries &series)
    {
        prepare_output_path(filepath);

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,value\n";
        file << std::fixed << std::setprecision(2);

        for (size_t i = 0; i < series.size(); ++i)
        {
            file << series.date(i) << "," << series.value(i) << "\n";
        }
    }

    // ===========================
    // Synthetic Data
    // ===========================

    ValuationSeries DataLoader::generate_synthetic_series(
        size_t num_days,
        const Date &start_date,
        double start_value,
        double volatility,
        double drift,
        unsigned seed)
    {
        if (!(start_value > 0.0))
        {
            throw std::invalid_argument("Expected positive value for parameter 'start_value', got: " + std::to_string(start_value));
        }
        if (!(volatility >= 0.0))
        {
            throw std::invalid_argument("Expected non-negative value for parameter 'volatility', got: " + std::to_string(volatility));
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);

        std::vector<ValuationPoint> points;
        points.reserve(num_days);

        Date date = start_date;
        double value = start_value;
        while (points.size() < num_days)
        {
            if (!is_weekend(date))
            {
                points.push_back(ValuationPoint{date, value});
                // Geometric random walk, floored so the series stays positive
                value = std::max(value * (1.0 + dist(gen)), 0.01);
            }
            date = date.add_days(1);
        }

        return ValuationSeries(points);
    }

    // ===========================
    // Helper Methods
    // ===========================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            if (consumed != trimmed.size())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

    void DataLoader::prepare_output_path(const std::string &filepath)
    {
        std::filesystem::path path(filepath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }
    }

} // namespace drawdown
