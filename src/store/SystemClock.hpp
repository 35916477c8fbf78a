#pragma once

#include "../interfaces/IClock.hpp"

class SystemClock : public IClock {
public:
    time_point now() const override {
        return std::chrono::system_clock::now();
    }
};
