// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <cstring>

#include <fmt/core.h>

namespace {

void check_floating(ETensorDType dtype, const char* what) {
    if(!is_floating(dtype)) {
        throw std::logic_error(fmt::format("{}: expected floating point tensor, got {}", what, dtype_to_str(dtype)));
    }
}

} // namespace

void fill_zero(Tensor& dst) {
    if(dst.Data) {
        std::memset(dst.Data, 0, dst.bytes());
    }
}

void load_raw(const std::byte* src, ETensorDType dtype, std::size_t count, double* out) {
    check_floating(dtype, "load_raw");
    if(dtype == ETensorDType::FP32) {
        const float* f = reinterpret_cast<const float*>(src);
        std::copy(f, f + count, out);
    } else {
        std::memcpy(out, src, count * sizeof(double));
    }
}

void store_raw(std::byte* dst, ETensorDType dtype, std::size_t count, const double* in) {
    check_floating(dtype, "store_raw");
    if(dtype == ETensorDType::FP32) {
        float* f = reinterpret_cast<float*>(dst);
        for(std::size_t i = 0; i < count; ++i) {
            f[i] = static_cast<float>(in[i]);
        }
    } else {
        std::memcpy(dst, in, count * sizeof(double));
    }
}

void load_range(const Tensor& src, std::size_t offset, std::size_t count, double* out) {
    if(offset + count > src.nelem()) {
        throw std::out_of_range(fmt::format("load_range: [{}, {}) exceeds {} elements", offset, offset + count, src.nelem()));
    }
    load_raw(src.Data + offset * get_dtype_size(src.DType), src.DType, count, out);
}

void store_range(Tensor& dst, std::size_t offset, std::size_t count, const double* in) {
    if(offset + count > dst.nelem()) {
        throw std::out_of_range(fmt::format("store_range: [{}, {}) exceeds {} elements", offset, offset + count, dst.nelem()));
    }
    store_raw(dst.Data + offset * get_dtype_size(dst.DType), dst.DType, count, in);
}

std::vector<double> to_double(const Tensor& src) {
    std::vector<double> values(src.nelem());
    load_range(src, 0, values.size(), values.data());
    return values;
}

void from_double(Tensor& dst, const std::vector<double>& values) {
    if(values.size() != dst.nelem()) {
        throw std::logic_error(fmt::format("from_double: {} values for tensor of {} elements", values.size(), dst.nelem()));
    }
    store_range(dst, 0, values.size(), values.data());
}
