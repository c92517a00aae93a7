// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_UTILITIES_ALLOCATOR_H
#define DISTSHAMPOO_SRC_UTILITIES_ALLOCATOR_H

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "tensor.h"

//! Owns every host buffer the optimizer allocates. All allocations are zero-initialized
//! and live until the allocator is destroyed; tensors handed out are non-owning views.
class TensorAllocator {
public:
    TensorAllocator();
    ~TensorAllocator() noexcept;
    TensorAllocator(TensorAllocator&&) noexcept;
    TensorAllocator(const TensorAllocator&) = delete;
    TensorAllocator& operator=(TensorAllocator&&) noexcept;
    TensorAllocator& operator=(const TensorAllocator&) = delete;

    void print_stats() const;

    Tensor allocate(ETensorDType dtype, const std::string& name, const std::vector<long>& shape);
    Tensor allocate(ETensorDType dtype, const std::string& name, const std::initializer_list<long>& shape);

    [[nodiscard]] std::size_t total_allocation() const;

    void set_context(const std::string& ctx);
    [[nodiscard]] const std::string& get_context() const;

    class AllocationMonitor {
    public:
        AllocationMonitor(const std::string& name, TensorAllocator*);
        AllocationMonitor(const AllocationMonitor&) = delete;
        AllocationMonitor& operator=(const AllocationMonitor&) = delete;
        AllocationMonitor(AllocationMonitor&& other) noexcept;
        AllocationMonitor& operator=(AllocationMonitor&& other) noexcept;
        ~AllocationMonitor() noexcept;
    private:
        std::string mName;
        std::string mParent;
        TensorAllocator* mAllocator;
        bool mActive = true;
    };

    [[nodiscard]] AllocationMonitor with_context(const std::string& ctx) { return AllocationMonitor(ctx, this); }

    //! Bytes per allocation context, sorted by context name.
    [[nodiscard]] std::vector<std::pair<std::string, std::size_t>> get_allocation_segments() const;

    /**
     * @brief Get per-tensor allocation statistics.
     * @return Vector of (tensor_name, bytes) pairs sorted by size descending.
     */
    [[nodiscard]] std::vector<std::pair<std::string, std::size_t>> get_tensor_stats() const;
private:
    template<typename Container>
    Tensor allocate_impl(ETensorDType dtype, const std::string& name, const Container& shape);

    struct sAllocationData {
        std::unique_ptr<std::byte[]> Pointer;
        std::size_t Size;
        std::string Name;
        std::string Context;
    };

    std::vector<sAllocationData> m_Pointers;
    std::string mContext;
};

#endif //DISTSHAMPOO_SRC_UTILITIES_ALLOCATOR_H
