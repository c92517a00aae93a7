// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_UTILITIES_TENSOR_H
#define DISTSHAMPOO_SRC_UTILITIES_TENSOR_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "dtype.h"
#include "utils.h"

constexpr int MAX_TENSOR_DIM = 5;

//! \brief The Tensor class represents a contiguous view on host memory that is associated
//! with a specific data type and shape. It does not own its memory.
struct Tensor {
    ETensorDType DType = ETensorDType::FP32;
    std::array<long, MAX_TENSOR_DIM> Sizes{};
    std::byte* Data = nullptr;
    int Rank = 0;

    [[nodiscard]] constexpr std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] constexpr std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool has_value() const { return Data != nullptr; }

    [[nodiscard]] std::vector<long> shape() const {
        return {Sizes.begin(), Sizes.begin() + Rank};
    }

    template<class TargetType>
    [[nodiscard]] constexpr const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] constexpr TargetType* get() {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<TargetType*>(Data);
    }

    template<typename Container>
    static Tensor from_pointer(std::byte* ptr, ETensorDType dtype, const Container& shape)
    {
        if(shape.size() > MAX_TENSOR_DIM) {
            throw std::runtime_error("Tensor rank too large");
        }

        int rank = narrow<int>(shape.size());
        std::array<long, MAX_TENSOR_DIM> sizes{};
        std::copy(shape.begin(), shape.end(), sizes.begin());
        std::fill(sizes.begin() + shape.size(), sizes.end(), 1);

        return Tensor{dtype, sizes, ptr, rank};
    }

    template<typename T>
    static Tensor from_vector(std::vector<T>& data, const std::vector<long>& shape) {
        if(static_cast<long>(data.size()) != shape_numel(shape)) {
            throw std::logic_error("Tensor::from_vector: shape does not match element count");
        }
        return from_pointer(reinterpret_cast<std::byte*>(data.data()), dtype_from_type<T>, shape);
    }
};

void fill_zero(Tensor& dst);

//! Widens `count` elements starting at `offset` into `out`.
void load_range(const Tensor& src, std::size_t offset, std::size_t count, double* out);
void store_range(Tensor& dst, std::size_t offset, std::size_t count, const double* in);

std::vector<double> to_double(const Tensor& src);
void from_double(Tensor& dst, const std::vector<double>& values);

//! Narrows `count` doubles into raw memory of type `dtype`.
void store_raw(std::byte* dst, ETensorDType dtype, std::size_t count, const double* in);
void load_raw(const std::byte* src, ETensorDType dtype, std::size_t count, double* out);

#endif //DISTSHAMPOO_SRC_UTILITIES_TENSOR_H
