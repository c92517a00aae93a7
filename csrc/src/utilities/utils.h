// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_UTILITIES_UTILS_H
#define DISTSHAMPOO_SRC_UTILITIES_UTILS_H

#include <concepts>
#include <cstdint>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

template<std::integral T>
constexpr T div_ceil(T dividend, T divisor) {
    return (dividend + divisor - 1) / divisor;
}

//! Rounds `value` up to the next multiple of `alignment`.
template<std::integral T>
constexpr T align_up(T value, T alignment) {
    return div_ceil(value, alignment) * alignment;
}

template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if constexpr (std::is_signed_v<Src>) {
        if (std::is_unsigned_v<Dst> && input < 0) {
            throw std::out_of_range("Cannot convert negative number to unsigned");
        }
        if (std::is_signed_v<Dst> && input < std::numeric_limits<Dst>::min())
        {
            throw std::out_of_range("Out of range in integer conversion: underflow");
        }
    }

    if (input > std::numeric_limits<Dst>::max())
    {
        throw std::out_of_range("Out of range in integer conversion: overflow");
    }

    return static_cast<Dst>(input);
}

//! Product of all entries; 1 for an empty shape.
inline long shape_numel(const std::vector<long>& shape) {
    return std::accumulate(shape.begin(), shape.end(), 1l, std::multiplies<>());
}

bool iequals(std::string_view lhs, std::string_view rhs);

//! "2048x64" style formatting used in log output
std::string shape_to_str(const std::vector<long>& shape);

#endif //DISTSHAMPOO_SRC_UTILITIES_UTILS_H
