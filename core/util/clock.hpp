#pragma once

#include "model/item.hpp"

namespace itemvault {
namespace util {

// Interface for the wall clock to enable deterministic tests
class IClock {
public:
    virtual ~IClock() = default;
    virtual model::Timestamp now() const = 0;
};

class SystemClock : public IClock {
public:
    model::Timestamp now() const override { return std::chrono::system_clock::now(); }
};

}  // namespace util
}  // namespace itemvault
