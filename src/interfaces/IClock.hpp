#pragma once

#include <chrono>

// Wall clock used by TodoStore for timestamps and expiry.
class IClock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~IClock() = default;
    virtual time_point now() const = 0;
};
