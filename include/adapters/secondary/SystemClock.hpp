#pragma once

#include "ports/output/IClock.hpp"

namespace sessions::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace sessions::adapters::secondary
