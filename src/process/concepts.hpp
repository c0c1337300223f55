#pragma once

#include <workflow/model.hpp>

#include <chrono>
#include <string>
#include <type_traits>
#include <vector>

// clang-format off
template <typename T>
concept CommandRunner = requires(T const a, std::string s, std::vector<std::string> v, variables_t e, std::chrono::seconds t) {
    { a.run(s, v, e, t) } -> std::convertible_to<std::string>;
};

template <typename T>
concept BackoffSleeper = requires(T const a, std::chrono::seconds d) {
    { a.sleep_for(d) };
};
// clang-format on
