#pragma once

#include <cmath>
#include <string>

namespace confluence {
namespace risk {

enum class InstrumentClass { FOREX, METAL, INDEX, CRYPTO };

// Static per-instrument metadata. unit_value has no default on purpose:
// an instrument without one cannot be sized.
struct InstrumentMeta {
    std::string symbol;
    InstrumentClass instrument_class = InstrumentClass::FOREX;
    double unit_value = 0.0;        // money per price unit per 1.0 size
    double pip_size = 0.0;          // one price unit
    double min_increment = 0.01;    // size step
    double spread = 0.0;            // in price

    bool isResolved() const {
        return std::isfinite(unit_value) && unit_value > 0.0 &&
               std::isfinite(pip_size) && pip_size > 0.0;
    }

    double toPriceUnits(double price_delta) const { return price_delta / pip_size; }
};

// Case-insensitive "forex"/"metal"/"index"/"crypto". Throws std::runtime_error otherwise.
InstrumentClass parseInstrumentClass(const std::string& text);
std::string instrumentClassToString(InstrumentClass cls);

} // namespace risk
} // namespace confluence
