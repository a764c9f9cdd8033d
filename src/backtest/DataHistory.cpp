#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace phoenix {
namespace backtest {

namespace {
constexpr Timestamp MS_THRESHOLD = 1000000000000LL;

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

// Full-cell parse; "nan" and "inf" count as numbers here
bool tryParseNumber(const std::string& cell, double& value) {
    size_t consumed = 0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return consumed != 0 && consumed == cell.size();
}

double parseNumber(const std::string& cell, size_t line_no) {
    double value = 0.0;
    if (!tryParseNumber(cell, value)) {
        throw FeedIntegrityError("malformed bar row " + std::to_string(line_no) +
                                 ": bad number '" + cell + "'", 0);
    }
    return value;
}

// 2^63, the first double past the Timestamp range
constexpr double TIMESTAMP_LIMIT = 9223372036854775808.0;

Timestamp checkedTimestamp(double raw, const std::string& where) {
    if (!std::isfinite(raw)) {
        throw FeedIntegrityError(where + ": non-finite timestamp", 0);
    }
    if (raw >= TIMESTAMP_LIMIT || raw < -TIMESTAMP_LIMIT) {
        throw FeedIntegrityError(where + ": timestamp out of range", 0);
    }
    if (std::floor(raw) != raw) {
        throw FeedIntegrityError(where + ": fractional timestamp", 0);
    }
    return static_cast<Timestamp>(raw);
}

Timestamp readTimestamp(const nlohmann::json& value, const std::string& where) {
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<Timestamp>::max())) {
            throw FeedIntegrityError(where + ": timestamp out of range", 0);
        }
        return value.get<Timestamp>();
    }
    if (value.is_number_integer()) {
        return value.get<Timestamp>();
    }
    return checkedTimestamp(value.get<double>(), where);
}

double readField(const nlohmann::json& item, const char* key, const char* short_key, size_t index) {
    if (item.contains(key)) return item[key].get<double>();
    if (item.contains(short_key)) return item[short_key].get<double>();
    throw FeedIntegrityError("malformed bar #" + std::to_string(index) +
                             ": missing " + key, 0);
}
}

Timestamp DataHistory::toMsTimestamp(Timestamp ts) {
    if (ts > 0 && ts < MS_THRESHOLD) {
        return ts * 1000;
    }
    return ts;
}

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw FeedIntegrityError("cannot open bar file: " + file_path, 0);
    }

    std::string line;
    size_t line_no = 0;
    bool first_row = true;

    while (std::getline(file, line)) {
        ++line_no;
        if (trim(line).empty()) {
            continue;
        }

        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;
        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (first_row) {
            first_row = false;
            double first_cell = 0.0;
            if (!row.empty() && !tryParseNumber(row[0], first_cell)) {
                continue;   // header
            }
        }

        if (row.size() < 6) {
            throw FeedIntegrityError("malformed bar row " + std::to_string(line_no) +
                                     ": expected 6 columns", 0);
        }

        const Timestamp ts = checkedTimestamp(parseNumber(row[0], line_no),
                                              "malformed bar row " + std::to_string(line_no));
        Bar bar(parseNumber(row[1], line_no),
                parseNumber(row[2], line_no),
                parseNumber(row[3], line_no),
                parseNumber(row[4], line_no),
                parseNumber(row[5], line_no),
                toMsTimestamp(ts));
        bars.push_back(bar);
    }

    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw FeedIntegrityError("cannot open bar file: " + file_path, 0);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw FeedIntegrityError("malformed bar file " + file_path + ": " + e.what(), 0);
    }
    if (!j.is_array()) {
        throw FeedIntegrityError("bar file must hold an array: " + file_path, 0);
    }

    size_t index = 0;
    for (const auto& item : j) {
        try {
            const std::string where = "malformed bar #" + std::to_string(index);
            Timestamp ts = 0;
            if (item.contains("timestamp")) ts = readTimestamp(item["timestamp"], where);
            else if (item.contains("t")) ts = readTimestamp(item["t"], where);
            else throw FeedIntegrityError("malformed bar #" + std::to_string(index) + ": missing timestamp", 0);

            Bar bar(readField(item, "open", "o", index),
                    readField(item, "high", "h", index),
                    readField(item, "low", "l", index),
                    readField(item, "close", "c", index),
                    item.contains("volume") || item.contains("v")
                        ? readField(item, "volume", "v", index) : 0.0,
                    toMsTimestamp(ts));
            bars.push_back(bar);
        } catch (const nlohmann::json::exception& e) {
            throw FeedIntegrityError("malformed bar #" + std::to_string(index) + ": " + e.what(), 0);
        }
        ++index;
    }

    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::load(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

} // namespace backtest
} // namespace phoenix
