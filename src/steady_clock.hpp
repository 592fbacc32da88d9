#pragma once

#include "interfaces/i_clock.hpp"

namespace stackstop {

// Real time: blocks the calling thread
class SteadyClock : public IClock {
public:
    void sleep_for(std::chrono::milliseconds duration) override;
};

} // namespace stackstop
