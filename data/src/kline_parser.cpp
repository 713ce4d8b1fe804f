#include "kline_parser.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <limits>

namespace data {

namespace {

using json = nlohmann::json;

constexpr std::size_t kMinKlineFields = 5;

core::Millis readOpenTime(const json& field, std::size_t row) {
    if (field.is_number_integer()) {
        return field.get<core::Millis>();
    }
    if (field.is_string()) {
        const std::string text = field.get<std::string>();
        bool digits_only = !text.empty();
        for (std::size_t i = (text.size() > 1 && text[0] == '-') ? 1 : 0; i < text.size(); ++i) {
            digits_only = digits_only && std::isdigit(static_cast<unsigned char>(text[i]));
        }
        if (digits_only) {
            try {
                return std::stoll(text);
            } catch (const std::out_of_range&) {
                throw core::DataLoadException(fmt::format("Row {}: open time out of range: {}", row, text));
            }
        }
    }
    throw core::DataLoadException(fmt::format("Row {}: open time is not an integer: {}", row, field.dump()));
}

std::string readDecimal(const json& field, std::size_t row, const char* name) {
    std::string text;
    if (field.is_string()) {
        text = field.get<std::string>();
    } else if (field.is_number()) {
        text = field.dump();
    }
    if (!core::utils::isDecimalString(text)) {
        throw core::DataLoadException(fmt::format("Row {}: {} is not a decimal value: {}", row, name, field.dump()));
    }
    return text;
}

} // namespace

core::TimeSeries<core::Candle> parseKlinePage(const std::string& body)
{
    json page;
    try {
        page = json::parse(body);
    } catch (const json::parse_error& e) {
        throw core::DataLoadException(fmt::format("Klines body is not valid JSON: {}", e.what()));
    }

    if (!page.is_array()) {
        throw core::DataLoadException(fmt::format("Klines body is not a JSON array: {}", body.substr(0, 200)));
    }

    core::TimeSeries<core::Candle> candles;
    candles.reserve(page.size());

    core::Millis previous = std::numeric_limits<core::Millis>::min();
    for (std::size_t row = 0; row < page.size(); ++row) {
        const json& kline = page[row];
        if (!kline.is_array() || kline.size() < kMinKlineFields) {
            throw core::DataLoadException(fmt::format("Row {}: expected an array of at least {} fields", row, kMinKlineFields));
        }

        core::Candle candle;
        candle.open_time_ms = readOpenTime(kline[0], row);
        candle.open  = readDecimal(kline[1], row, "open");
        candle.high  = readDecimal(kline[2], row, "high");
        candle.low   = readDecimal(kline[3], row, "low");
        candle.close = readDecimal(kline[4], row, "close");

        if (row > 0 && candle.open_time_ms <= previous) {
            throw core::DataLoadException(fmt::format("Row {}: open time {} does not follow {}", row, candle.open_time_ms, previous));
        }
        previous = candle.open_time_ms;
        candles.push_back(std::move(candle));
    }

    return candles;
}

} // namespace data
