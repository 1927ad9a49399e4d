#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include "common/Logger.h"

namespace confluence {
namespace backtest {

namespace {
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

double fullDouble(const std::string& cell) {
    size_t pos = 0;
    const double value = std::stod(cell, &pos);
    if (pos != cell.size()) {
        throw std::invalid_argument("Malformed number: " + cell);
    }
    return value;
}

double numberField(const nlohmann::json& item, const char* name, const char* short_name) {
    if (item.contains(name)) return item[name].get<double>();
    if (item.contains(short_name)) return item[short_name].get<double>();
    return 0.0;
}

// Days since 1970-01-01 for a proleptic Gregorian date
long long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}
}

TimestampMs DataHistory::toMsTimestamp(long long ts) {
    // anything below 1e11 cannot be a millisecond epoch after 1973
    return (ts > -100000000000LL && ts < 100000000000LL) ? ts * 1000LL : ts;
}

TimestampMs DataHistory::parseDate(const std::string& date) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    char dash1 = 0;
    char dash2 = 0;
    std::istringstream iss(date);
    if (!(iss >> y >> dash1 >> m >> dash2 >> d) || dash1 != '-' || dash2 != '-' ||
        m < 1 || m > 12 || d < 1 || d > 31) {
        throw std::invalid_argument("Malformed date (expected YYYY-MM-DD): " + date);
    }
    iss >> std::ws;
    if (!iss.eof()) {
        throw std::invalid_argument("Malformed date (expected YYYY-MM-DD): " + date);
    }
    return daysFromCivil(y, m, d) * MS_PER_DAY;
}

TimestampMs DataHistory::parseDateTime(const std::string& text) {
    const auto split = text.find_first_of(" T");
    if (split == std::string::npos) {
        return parseDate(text);
    }
    const TimestampMs day = parseDate(text.substr(0, split));

    std::string clock = text.substr(split + 1);
    if (!clock.empty() && clock.back() == 'Z') {
        clock.pop_back();
    }
    unsigned h = 0;
    unsigned mi = 0;
    unsigned sec = 0;
    char colon1 = 0;
    char colon2 = ':';
    std::istringstream iss(clock);
    if (!(iss >> h >> colon1 >> mi) || colon1 != ':') {
        throw std::invalid_argument("Malformed time (expected HH:MM[:SS]): " + text);
    }
    if (iss >> colon2 && !(iss >> sec)) {
        throw std::invalid_argument("Malformed time (expected HH:MM[:SS]): " + text);
    }
    iss >> std::ws;
    if (!iss.eof() || colon2 != ':' || h > 23 || mi > 59 || sec > 59) {
        throw std::invalid_argument("Malformed time (expected HH:MM[:SS]): " + text);
    }
    return day + (static_cast<TimestampMs>(h) * 3600 + mi * 60 + sec) * 1000LL;
}

TimestampMs DataHistory::parseTimestampCell(const std::string& cell) {
    const bool numeric = !cell.empty() &&
        std::all_of(cell.begin() + (cell[0] == '-' ? 1 : 0), cell.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!numeric) {
        return parseDateTime(cell);
    }
    size_t pos = 0;
    const long long value = std::stoll(cell, &pos);
    if (pos != cell.size()) {
        throw std::invalid_argument("Malformed epoch timestamp: " + cell);
    }
    return toMsTimestamp(value);
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    std::string lower = file_path;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".json") == 0) {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // header or malformed row
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = parseTimestampCell(row[0]);
            candle.open = fullDouble(row[1]);
            candle.high = fullDouble(row[2]);
            candle.low = fullDouble(row[3]);
            candle.close = fullDouble(row[4]);
            candle.volume = fullDouble(row[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
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
        for (const auto& item : j) {
            Candle candle;
            const char* key = item.contains("timestamp") ? "timestamp" : "t";
            if (item.contains(key)) {
                const auto& ts = item[key];
                candle.timestamp = ts.is_string() ? parseTimestampCell(ts.get<std::string>())
                                                  : toMsTimestamp(ts.get<long long>());
            }

            candle.open = numberField(item, "open", "o");
            candle.high = numberField(item, "high", "h");
            candle.low = numberField(item, "low", "l");
            candle.close = numberField(item, "close", "c");
            candle.volume = numberField(item, "volume", "v");
            candles.push_back(candle);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Bad timestamp in JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              const std::string& start_date,
                                              const std::string& end_date) {
    const TimestampMs from = start_date.empty() ? std::numeric_limits<TimestampMs>::min()
                                                : parseDate(start_date);
    const TimestampMs to = end_date.empty() ? std::numeric_limits<TimestampMs>::max()
                                            : parseDate(end_date) + MS_PER_DAY - 1;

    std::vector<Candle> out;
    for (const auto& candle : candles) {
        if (candle.timestamp >= from && candle.timestamp <= to) {
            out.push_back(candle);
        }
    }
    return out;
}

} // namespace backtest
} // namespace confluence
