// src/data/csv_bar_loader.cpp

#include "signal_ngin/data/csv_bar_loader.hpp"
#include <fstream>
#include <sstream>
#include "signal_ngin/core/bar_validation.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {
namespace data {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool parse_time(const std::string& field, EpochSeconds& out) {
    if (field.find('-') == std::string::npos || field.find('T') == std::string::npos) {
        try {
            size_t consumed = 0;
            long long value = std::stoll(field, &consumed);
            if (consumed != field.size())
                return false;
            out = static_cast<EpochSeconds>(value);
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

    auto parsed = core::parse_iso_utc(field);
    if (!parsed)
        return false;
    out = *parsed;
    return true;
}

bool parse_number(const std::string& field, double& out) {
    try {
        size_t consumed = 0;
        out = std::stod(field, &consumed);
        return consumed == field.size();
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

Result<std::vector<Bar>> parse_bars_csv(std::istream& input) {
    std::vector<Bar> bars;
    std::string line;
    size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty())
            continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, ',')) {
            fields.push_back(trim(token));
        }

        if (fields.size() != 6) {
            return make_error<std::vector<Bar>>(
                ErrorCode::INVALID_DATA,
                "Expected 6 columns on line " + std::to_string(line_number) + ", found " +
                    std::to_string(fields.size()),
                "CsvBarLoader");
        }

        Bar bar;
        double values[5];
        bool ok = parse_time(fields[0], bar.time);
        for (size_t i = 0; ok && i < 5; ++i) {
            ok = parse_number(fields[i + 1], values[i]);
        }
        if (!ok) {
            if (bars.empty() && line_number == 1) {
                DEBUG("Skipping CSV header: " << line);
                continue;
            }
            return make_error<std::vector<Bar>>(
                ErrorCode::INVALID_DATA,
                "Unparseable bar on line " + std::to_string(line_number) + ": " + line,
                "CsvBarLoader");
        }

        bar.open = values[0];
        bar.high = values[1];
        bar.low = values[2];
        bar.close = values[3];
        bar.volume = values[4];
        bars.push_back(bar);
    }

    auto valid = validate_bars(bars, "CsvBarLoader");
    if (valid.is_error()) {
        return make_error<std::vector<Bar>>(valid.error()->code(), valid.error()->what(),
                                            "CsvBarLoader");
    }
    return Result<std::vector<Bar>>(std::move(bars));
}

Result<std::vector<Bar>> load_bars_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<std::vector<Bar>>(ErrorCode::FILE_IO_ERROR,
                                            "Failed to open bar file: " + path, "CsvBarLoader");
    }

    auto bars = parse_bars_csv(file);
    if (bars.is_ok()) {
        INFO("Loaded " << bars.value().size() << " bars from " << path);
    }
    return bars;
}

}  // namespace data
}  // namespace signal_ngin
