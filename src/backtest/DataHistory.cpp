#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include "common/Logger.h"

namespace stratbench {
namespace backtest {

namespace {
// Anything below this is taken as epoch seconds (year 5138 in seconds).
constexpr long long SECONDS_EPOCH_LIMIT = 100000000000LL;

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

    // Strip UTF-8 BOM if present at first cell.
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

template <typename T>
bool readField(const nlohmann::json& item, const char* key, const char* short_key, T& out) {
    if (item.contains(key)) {
        out = item.at(key).get<T>();
        return true;
    }
    if (item.contains(short_key)) {
        out = item.at(short_key).get<T>();
        return true;
    }
    return false;
}
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;
    size_t line_no = 0;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        line_no++;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 5 || row[0].empty()) {
            if (!trim(line).empty()) skipped++;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = std::stoll(row[0]);
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = (row.size() > 5 && !row[5].empty()) ? std::stod(row[5]) : 0.0;
            candles.push_back(candle);
        } catch (const std::exception& e) {
            skipped++;
            LOG_WARN("Skipping malformed row {} in {}: {}", line_no, file_path, e.what());
        }
    }

    normalize(candles);
    LOG_INFO("Loaded {} candles from {} ({} rows skipped)", candles.size(), file_path, skipped);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            LOG_ERROR("JSON price history must be an array: {}", file_path);
            return candles;
        }

        for (const auto& item : j) {
            Candle candle;
            if (!readField(item, "timestamp", "t", candle.timestamp) ||
                !readField(item, "open", "o", candle.open) ||
                !readField(item, "high", "h", candle.high) ||
                !readField(item, "low", "l", candle.low) ||
                !readField(item, "close", "c", candle.close)) {
                LOG_WARN("Skipping JSON bar with missing fields: {}", item.dump());
                continue;
            }
            readField(item, "volume", "v", candle.volume);
            candles.push_back(candle);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
        return candles;
    }

    normalize(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    auto ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".json" ? loadJSON(file_path) : loadCSV(file_path);
}

bool DataHistory::hasGaps(const std::vector<Candle>& candles, long long interval_ms) {
    for (size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].timestamp - candles[i - 1].timestamp > interval_ms) {
            return true;
        }
    }
    return false;
}

void DataHistory::normalize(std::vector<Candle>& candles) {
    for (auto& candle : candles) {
        if (candle.timestamp > 0 && candle.timestamp < SECONDS_EPOCH_LIMIT) {
            candle.timestamp *= 1000;
        }
    }

    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });

    const auto before = candles.size();
    candles.erase(std::unique(candles.begin(), candles.end(),
                              [](const Candle& a, const Candle& b) { return a.timestamp == b.timestamp; }),
                  candles.end());
    if (candles.size() != before) {
        LOG_WARN("Dropped {} bars with duplicate timestamps", before - candles.size());
    }
}

} // namespace backtest
} // namespace stratbench
