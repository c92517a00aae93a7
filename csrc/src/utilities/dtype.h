// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_UTILITIES_DTYPE_H
#define DISTSHAMPOO_SRC_UTILITIES_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

//! Element types the optimizer can store. BYTE is used for the raw communication buffers.
enum class ETensorDType : int {
    FP32,
    FP64,
    BYTE
};

constexpr std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return 4;
        case ETensorDType::FP64: return 8;
        case ETensorDType::BYTE: return 1;
    }
    throw std::logic_error("Unknown dtype");
}

constexpr bool is_floating(ETensorDType dtype) {
    return dtype == ETensorDType::FP32 || dtype == ETensorDType::FP64;
}

const char* dtype_to_str(ETensorDType dtype);

//! Parses "fp32"/"float32"/"float" and friends (case insensitive).
ETensorDType dtype_from_str(std::string_view name);

//! safetensors spells dtypes as F32/F64/U8
const char* dtype_to_safetensors(ETensorDType dtype);
ETensorDType dtype_from_safetensors(std::string_view name);

template<class T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<double> = ETensorDType::FP64;
template<> inline constexpr ETensorDType dtype_from_type<std::byte> = ETensorDType::BYTE;

#endif //DISTSHAMPOO_SRC_UTILITIES_DTYPE_H
