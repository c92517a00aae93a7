// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "allocator.h"

#include <algorithm>
#include <cstdio>
#include <map>
#include <new>

#include <fmt/core.h>

TensorAllocator::TensorAllocator() = default;
TensorAllocator::~TensorAllocator() noexcept = default;
TensorAllocator::TensorAllocator(TensorAllocator&&) noexcept = default;
TensorAllocator& TensorAllocator::operator=(TensorAllocator&&) noexcept = default;

/**
 * @brief Allocate zero-initialized host storage and wrap it in a Tensor view.
 *
 * @param dtype Element type of the tensor.
 * @param name Logical name used for stats and error reporting.
 * @param shape Tensor shape (rank = shape.size()).
 * @return A Tensor describing the allocated storage.
 * @throws std::runtime_error If the tensor rank exceeds MAX_TENSOR_DIM or memory is exhausted.
 */
template<typename Container>
Tensor TensorAllocator::allocate_impl(ETensorDType dtype, const std::string& name, const Container& shape) {
    if(shape.size() > MAX_TENSOR_DIM) {
        throw std::runtime_error(fmt::format("Tensor rank too large for '{}'", name));
    }
    long total = 1;
    for(long s : shape) {
        if(s < 0) {
            throw std::invalid_argument(fmt::format("Negative extent in shape of '{}'", name));
        }
        total *= s;
    }
    std::size_t bytes = static_cast<std::size_t>(total) * get_dtype_size(dtype);

    std::unique_ptr<std::byte[]> storage;
    try {
        // value-initialized: all state starts out as zeros
        storage = std::make_unique<std::byte[]>(std::max<std::size_t>(bytes, 1));
    } catch (const std::bad_alloc&) {
        throw std::runtime_error(fmt::format("Out of memory allocating {} bytes for '{}' (context '{}', {} bytes already allocated)",
                                             bytes, name, mContext, total_allocation()));
    }

    Tensor result = Tensor::from_pointer(storage.get(), dtype, shape);
    m_Pointers.push_back({std::move(storage), bytes, name, mContext});
    return result;
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const std::string& name, const std::vector<long>& shape) {
    return allocate_impl(dtype, name, shape);
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const std::string& name, const std::initializer_list<long>& shape) {
    return allocate_impl(dtype, name, shape);
}

std::size_t TensorAllocator::total_allocation() const {
    std::size_t total = 0;
    for(const auto& alloc : m_Pointers) {
        total += alloc.Size;
    }
    return total;
}

void TensorAllocator::set_context(const std::string& ctx) {
    mContext = ctx;
}

const std::string& TensorAllocator::get_context() const {
    return mContext;
}

std::vector<std::pair<std::string, std::size_t>> TensorAllocator::get_allocation_segments() const {
    std::map<std::string, std::size_t> per_context;
    for(const auto& alloc : m_Pointers) {
        per_context[alloc.Context] += alloc.Size;
    }
    return {per_context.begin(), per_context.end()};
}

std::vector<std::pair<std::string, std::size_t>> TensorAllocator::get_tensor_stats() const {
    std::vector<std::pair<std::string, std::size_t>> result;
    result.reserve(m_Pointers.size());
    for(const auto& alloc : m_Pointers) {
        result.emplace_back(alloc.Name, alloc.Size);
    }
    std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    return result;
}

void TensorAllocator::print_stats() const {
    printf("[Allocator]\n");
    for(const auto& [ctx, bytes] : get_allocation_segments()) {
        printf(" %-24s : %10.3f MiB\n", ctx.empty() ? "<none>" : ctx.c_str(), static_cast<double>(bytes) / 1024.0 / 1024.0);
    }
    printf(" %-24s : %10.3f MiB\n", "total", static_cast<double>(total_allocation()) / 1024.0 / 1024.0);

    auto tensors = get_tensor_stats();
    const std::size_t shown = std::min<std::size_t>(tensors.size(), 8);
    for(std::size_t i = 0; i < shown; ++i) {
        printf("   %-40s : %10.3f MiB\n", tensors[i].first.c_str(), static_cast<double>(tensors[i].second) / 1024.0 / 1024.0);
    }
    printf("\n");
}

/**
 * @brief RAII helper that sets an allocator context for the lifetime of the monitor.
 *
 * @param name Context name to activate.
 * @param alloc Allocator whose context is modified.
 */
TensorAllocator::AllocationMonitor::AllocationMonitor(const std::string& name, TensorAllocator* alloc) :
    mName(name), mParent(alloc->get_context()), mAllocator(alloc) {
    alloc->set_context(mName);
}

TensorAllocator::AllocationMonitor::AllocationMonitor(AllocationMonitor&& other) noexcept
    : mName(std::move(other.mName)),
      mParent(std::move(other.mParent)),
      mAllocator(other.mAllocator),
      mActive(other.mActive) {
    other.mAllocator = nullptr;
    other.mActive = false;
}

TensorAllocator::AllocationMonitor& TensorAllocator::AllocationMonitor::operator=(AllocationMonitor&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    if (mActive && mAllocator) {
        mAllocator->set_context(mParent);
    }
    mName = std::move(other.mName);
    mParent = std::move(other.mParent);
    mAllocator = other.mAllocator;
    mActive = other.mActive;
    other.mAllocator = nullptr;
    other.mActive = false;
    return *this;
}

/**
 * @brief Destructor; restores the allocator's previous context if still active.
 *
 * Never throws. Improper nesting is reported on stderr.
 */
TensorAllocator::AllocationMonitor::~AllocationMonitor() noexcept {
    if (!mActive || !mAllocator) {
        return;
    }
    if (mAllocator->get_context() != mName) {
        fprintf(stderr,
                "WARNING: AllocationMonitor improper nesting: expected ctx='%s' but got ctx='%s' (restoring parent='%s')\n",
                mName.c_str(), mAllocator->get_context().c_str(), mParent.c_str());
        fflush(stderr);
    }
    mAllocator->set_context(mParent);
}
