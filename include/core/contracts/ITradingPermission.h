#pragma once

#include <string>

namespace confluence {
namespace core {

// Embargo oracle consulted once per prospective signal
class ITradingPermission {
public:
    virtual ~ITradingPermission() = default;

    virtual bool isTradingPermitted(const std::string& instrument, long long ts_ms) const = 0;
};

} // namespace core
} // namespace confluence
