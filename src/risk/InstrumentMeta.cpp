#include "risk/InstrumentMeta.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace confluence {
namespace risk {

InstrumentClass parseInstrumentClass(const std::string& text) {
    std::string value = text;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "forex" || value == "fx") return InstrumentClass::FOREX;
    if (value == "metal" || value == "metals") return InstrumentClass::METAL;
    if (value == "index" || value == "indices") return InstrumentClass::INDEX;
    if (value == "crypto") return InstrumentClass::CRYPTO;
    throw std::runtime_error("Unknown instrument class: " + text);
}

std::string instrumentClassToString(InstrumentClass cls) {
    switch (cls) {
        case InstrumentClass::FOREX: return "FOREX";
        case InstrumentClass::METAL: return "METAL";
        case InstrumentClass::INDEX: return "INDEX";
        case InstrumentClass::CRYPTO: return "CRYPTO";
    }
    return "FOREX";
}

} // namespace risk
} // namespace confluence
