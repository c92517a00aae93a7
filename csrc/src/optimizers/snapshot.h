// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_SNAPSHOT_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_SNAPSHOT_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utilities/tensor.h"

namespace shampoo {

//! A host copy of one optimizer buffer.
struct SnapshotTensor {
    ETensorDType DType = ETensorDType::FP32;
    std::vector<long> Shape;
    std::vector<std::byte> Data;

    static SnapshotTensor copy_of(const Tensor& tensor);
    //! Non-owning view of Data.
    Tensor view();
};

/**
 * @brief Optimizer state of one worker, detached from the optimizer.
 *
 * `Metadata` holds the configuration, the per-group hyperparameters, the group size and
 * the per-tensor scalar state (steps, inverse factor bookkeeping). Buffers are keyed by
 * position, `group<g>.param<i>.<buffer>`, so a snapshot can be loaded into an optimizer
 * over different tensor objects with the same structure.
 */
struct ShampooSnapshot {
    nlohmann::json Metadata;
    std::map<std::string, SnapshotTensor> Tensors;
};

/**
 * @brief Writes the snapshot as a safetensors file, metadata under the `shampoo` key.
 * @throws std::runtime_error On I/O errors, naming the file.
 */
void save_snapshot(const ShampooSnapshot& snapshot, const std::string& file_name);

//! @throws std::runtime_error If the file cannot be read or carries no optimizer metadata.
ShampooSnapshot load_snapshot(const std::string& file_name);

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_SNAPSHOT_H
