// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_UTILITIES_SAFETENSORS_H
#define DISTSHAMPOO_SRC_UTILITIES_SAFETENSORS_H

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "tensor.h"

/**
 * @brief One tensor entry of a safetensors file.
 *
 * Offsets are relative to the start of the data section (after the JSON header).
 */
class SafeTensorEntry {
public:
    SafeTensorEntry(std::string name, std::vector<long> shape, ETensorDType dtype,
                    std::string file_name, std::uint64_t begin, std::uint64_t size);

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] ETensorDType dtype() const { return mDType; }
    [[nodiscard]] std::uint64_t bytes() const { return mSize; }

    //! Reads the entry into `target`, which must have matching dtype and element count.
    void read_tensor(Tensor& target) const;

private:
    std::string mName;
    std::vector<long> mShape;
    ETensorDType mDType;
    std::string mFileName;
    std::uint64_t mBegin;
    std::uint64_t mSize;
};

class SafeTensorsReader {
public:
    explicit SafeTensorsReader(const std::string& file_name);

    [[nodiscard]] const std::vector<SafeTensorEntry>& entries() const { return mEntries; }
    [[nodiscard]] const SafeTensorEntry& find_entry(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;

    //! String entries of the `__metadata__` header field.
    [[nodiscard]] const std::map<std::string, std::string>& metadata() const { return mMetaData; }

private:
    std::vector<SafeTensorEntry> mEntries;
    std::map<std::string, std::string> mMetaData;
};

/**
 * @brief Writes host tensors into a safetensors file.
 *
 * Register all tensors first, then call finalize(). Data goes to `<file>.tmp`, which is
 * renamed to the final name once everything is on disk.
 */
class SafeTensorWriter {
public:
    explicit SafeTensorWriter(std::string file_name);

    void register_tensor(const std::string& name, const Tensor& tensor);
    void set_metadata(const std::string& key, std::string value);
    void finalize();

private:
    std::string mFileName;
    std::map<std::string, Tensor> mRegisteredTensors;
    std::map<std::string, std::string> mMetaData;
    bool mFinalized = false;
};

#endif //DISTSHAMPOO_SRC_UTILITIES_SAFETENSORS_H
