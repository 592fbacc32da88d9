#include "steady_clock.hpp"
#include <thread>

namespace stackstop {

void SteadyClock::sleep_for(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

} // namespace stackstop
