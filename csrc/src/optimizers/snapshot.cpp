// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/snapshot.h"

#include <cstring>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/safetensors.h"

namespace shampoo {

namespace {

constexpr const char* METADATA_KEY = "shampoo";

} // namespace

SnapshotTensor SnapshotTensor::copy_of(const Tensor& tensor) {
    SnapshotTensor result;
    result.DType = tensor.DType;
    result.Shape = tensor.shape();
    result.Data.resize(tensor.bytes());
    if (tensor.bytes() > 0) {
        std::memcpy(result.Data.data(), tensor.Data, tensor.bytes());
    }
    return result;
}

Tensor SnapshotTensor::view() {
    return Tensor::from_pointer(Data.data(), DType, Shape);
}

void save_snapshot(const ShampooSnapshot& snapshot, const std::string& file_name) {
    SafeTensorWriter writer(file_name);
    for (const auto& [name, tensor] : snapshot.Tensors) {
        // the writer only reads through the view
        writer.register_tensor(name, Tensor::from_pointer(const_cast<std::byte*>(tensor.Data.data()), tensor.DType, tensor.Shape));
    }
    writer.set_metadata(METADATA_KEY, snapshot.Metadata.dump());
    writer.finalize();
}

ShampooSnapshot load_snapshot(const std::string& file_name) {
    SafeTensorsReader reader(file_name);

    ShampooSnapshot snapshot;
    const auto meta = reader.metadata().find(METADATA_KEY);
    if (meta == reader.metadata().end()) {
        throw std::runtime_error(fmt::format("File {} does not contain an optimizer snapshot", file_name));
    }
    try {
        snapshot.Metadata = nlohmann::json::parse(meta->second);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("Invalid optimizer metadata in {}: {}", file_name, e.what()));
    }

    for (const auto& entry : reader.entries()) {
        SnapshotTensor tensor;
        tensor.DType = entry.dtype();
        tensor.Shape = entry.shape();
        tensor.Data.resize(entry.bytes());
        Tensor target = tensor.view();
        entry.read_tensor(target);
        snapshot.Tensors.emplace(entry.name(), std::move(tensor));
    }
    return snapshot;
}

} // namespace shampoo
