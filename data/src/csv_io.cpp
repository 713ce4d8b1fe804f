#include "csv_io.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace data {

namespace {

enum Column { kTime = 0, kOpen, kHigh, kLow, kClose, kColumnCount };

struct RawRow {
    std::string time;
    std::string open;
    std::string high;
    std::string low;
    std::string close;
};

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n\"");
    return value.substr(first, last - first + 1);
}

std::vector<std::string> splitLine(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

int columnFor(std::string header) {
    std::transform(header.begin(), header.end(), header.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (header == "timestamp" || header == "time" || header == "datetime" ||
        header == "date" || header == "open_time_ms") return kTime;
    if (header == "open" || header == "open_") return kOpen;
    if (header == "high" || header == "high_") return kHigh;
    if (header == "low" || header == "low_") return kLow;
    if (header == "close" || header == "close_") return kClose;
    return -1;
}

// All-numeric timestamp columns are epoch values; below 1e12 they are seconds
bool numericTimes(const std::vector<RawRow>& rows, double& scale_to_ms) {
    std::vector<double> values;
    values.reserve(rows.size());
    for (const auto& row : rows) {
        if (!core::utils::isDecimalString(row.time)) {
            return false;
        }
        values.push_back(std::stod(row.time));
    }
    if (values.empty()) {
        return false;
    }
    std::nth_element(values.begin(), values.begin() + values.size() / 2, values.end());
    scale_to_ms = values[values.size() / 2] > 1e12 ? 1.0 : 1000.0;
    return true;
}

} // namespace

std::size_t writeCandlesCsv(const std::string& path, const core::TimeSeries<core::Candle>& candles)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw core::DataLoadException("Failed to open CSV for writing: " + path);
    }

    out << "open_time_ms,open,high,low,close\n";
    for (const auto& candle : candles) {
        out << candle.open_time_ms << ',' << candle.open << ',' << candle.high << ','
            << candle.low << ',' << candle.close << '\n';
    }
    out.flush();
    if (!out) {
        throw core::DataLoadException("Failed while writing CSV: " + path);
    }

    core::logging::getLogger()->info("Wrote {} candles to {}", candles.size(), path);
    return candles.size();
}

core::TimeSeries<core::Candle> readCandlesCsv(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw core::DataLoadException("Failed to open CSV: " + path);
    }

    std::string line;
    if (!std::getline(in, line)) {
        throw core::DataLoadException("CSV is empty: " + path);
    }
    // Spreadsheet exports often start with a UTF-8 BOM
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    std::array<int, kColumnCount> index;
    index.fill(-1);
    const std::vector<std::string> headers = splitLine(line);
    for (std::size_t i = 0; i < headers.size(); ++i) {
        const int column = columnFor(headers[i]);
        if (column >= 0 && index[column] < 0) {
            index[column] = static_cast<int>(i);
        }
    }

    static const char* kNames[kColumnCount] = {"timestamp", "open", "high", "low", "close"};
    std::string missing;
    for (int c = 0; c < kColumnCount; ++c) {
        if (index[c] < 0) {
            missing += missing.empty() ? kNames[c] : std::string(", ") + kNames[c];
        }
    }
    if (!missing.empty()) {
        throw core::DataLoadException("CSV " + path + " is missing required columns: " + missing);
    }

    const int widest = *std::max_element(index.begin(), index.end());
    std::vector<RawRow> rows;
    std::size_t dropped = 0;
    while (std::getline(in, line)) {
        if (trim(line).empty()) {
            continue;
        }
        const std::vector<std::string> fields = splitLine(line);
        if (static_cast<int>(fields.size()) <= widest) {
            ++dropped;
            continue;
        }
        RawRow row{fields[index[kTime]], fields[index[kOpen]], fields[index[kHigh]],
                   fields[index[kLow]], fields[index[kClose]]};
        if (row.time.empty() || !core::utils::isDecimalString(row.open) || !core::utils::isDecimalString(row.high) ||
            !core::utils::isDecimalString(row.low) || !core::utils::isDecimalString(row.close)) {
            ++dropped;
            continue;
        }
        rows.push_back(std::move(row));
    }

    double scale_to_ms = 1.0;
    const bool numeric = numericTimes(rows, scale_to_ms);

    core::TimeSeries<core::Candle> candles;
    candles.reserve(rows.size());
    for (auto& row : rows) {
        core::Candle candle;
        if (numeric) {
            candle.open_time_ms = static_cast<core::Millis>(std::llround(std::stod(row.time) * scale_to_ms));
        } else {
            try {
                candle.open_time_ms = core::utils::isoStringToMillis(row.time);
            } catch (const std::runtime_error& e) {
                core::logging::getLogger()->debug("Dropping CSV row with bad timestamp '{}': {}", row.time, e.what());
                ++dropped;
                continue;
            }
        }
        candle.open = std::move(row.open);
        candle.high = std::move(row.high);
        candle.low = std::move(row.low);
        candle.close = std::move(row.close);
        candles.push_back(std::move(candle));
    }

    std::stable_sort(candles.begin(), candles.end());
    if (dropped > 0) {
        core::logging::getLogger()->warn("Dropped {} unusable rows from {}", dropped, path);
    }
    core::logging::getLogger()->info("Read {} candles from {}", candles.size(), path);
    return candles;
}

} // namespace data
