#pragma once

#include <chrono>
#include <thread>

namespace util {

struct ThreadSleeper {
    void sleep_for(std::chrono::seconds delay) const {
        std::this_thread::sleep_for(delay);
    }
};

} // namespace util
