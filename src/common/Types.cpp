#include "common/Types.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace confluence {

int resolutionMinutes(Resolution res) {
    switch (res) {
        case Resolution::M1: return 1;
        case Resolution::M5: return 5;
        case Resolution::M15: return 15;
        case Resolution::M30: return 30;
        case Resolution::H1: return 60;
        case Resolution::H4: return 240;
        case Resolution::D1: return 1440;
    }
    return 1;
}

TimestampMs resolutionMs(Resolution res) {
    return static_cast<TimestampMs>(resolutionMinutes(res)) * MS_PER_MINUTE;
}

std::string resolutionToString(Resolution res) {
    switch (res) {
        case Resolution::M1: return "M1";
        case Resolution::M5: return "M5";
        case Resolution::M15: return "M15";
        case Resolution::M30: return "M30";
        case Resolution::H1: return "H1";
        case Resolution::H4: return "H4";
        case Resolution::D1: return "D1";
    }
    return "M1";
}

Resolution parseResolution(const std::string& text) {
    std::string value = text;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (value == "M1" || value == "1M") return Resolution::M1;
    if (value == "M5" || value == "5M") return Resolution::M5;
    if (value == "M15" || value == "15M") return Resolution::M15;
    if (value == "M30" || value == "30M") return Resolution::M30;
    if (value == "H1" || value == "1H" || value == "60M") return Resolution::H1;
    if (value == "H4" || value == "4H" || value == "240M") return Resolution::H4;
    if (value == "D1" || value == "1D" || value == "D") return Resolution::D1;

    throw std::runtime_error("Unknown resolution: " + text);
}

} // namespace confluence
