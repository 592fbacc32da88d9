#pragma once

#include <chrono>

namespace stackstop {

class IClock {
public:
    virtual ~IClock() = default;

    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

} // namespace stackstop
