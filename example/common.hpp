#pragma once

// some common utils for the examples

#include <limits>
#include <string>
#include <utility>
#include <iostream>
#include <string_view>

#include "fmt/core.h"

#include "numpat/format.hpp"
#include "numpat/pattern_map.hpp"

template <typename... Args>
void print(fmt::format_string<Args...> format, Args&&... args) {
    fmt::print(format, std::forward<Args>(args)...);
}
template <typename... Args>
void println(fmt::format_string<Args...> format, Args&&... args) {
    fmt::print(format, std::forward<Args>(args)...);
    fmt::print("\n");
}
