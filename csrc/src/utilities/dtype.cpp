// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

#include <fmt/format.h>

#include "utils.h"

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "fp32";
        case ETensorDType::FP64: return "fp64";
        case ETensorDType::BYTE: return "byte";
    }
    return "unknown";
}

ETensorDType dtype_from_str(std::string_view name) {
    if (iequals(name, "fp32") || iequals(name, "float32") || iequals(name, "float")) {
        return ETensorDType::FP32;
    }
    if (iequals(name, "fp64") || iequals(name, "float64") || iequals(name, "double")) {
        return ETensorDType::FP64;
    }
    if (iequals(name, "byte") || iequals(name, "uint8")) {
        return ETensorDType::BYTE;
    }
    throw std::invalid_argument(fmt::format("Unknown dtype '{}'", name));
}

const char* dtype_to_safetensors(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "F32";
        case ETensorDType::FP64: return "F64";
        case ETensorDType::BYTE: return "U8";
    }
    throw std::logic_error("Unknown dtype");
}

ETensorDType dtype_from_safetensors(std::string_view name) {
    if (name == "F32") return ETensorDType::FP32;
    if (name == "F64") return ETensorDType::FP64;
    if (name == "U8") return ETensorDType::BYTE;
    throw std::runtime_error(fmt::format("Unsupported safetensors dtype '{}'", name));
}
