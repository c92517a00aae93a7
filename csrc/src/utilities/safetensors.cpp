// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "safetensors.h"

#include <bit>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

static_assert(std::endian::native == std::endian::little, "safetensors header length is little-endian");

/**
 * @brief Parsed SafeTensors header data.
 *
 * The SafeTensors file starts with an 8-byte little-endian unsigned integer
 * indicating the JSON header size in bytes, followed by the JSON header.
 */
struct sSafeTensorsHeader {
    /** @brief Size of the JSON header (bytes), not including this 8-byte length field. */
    std::uint64_t HeaderSize;
    /** @brief Parsed JSON metadata for all tensor entries and optional "__metadata__". */
    nlohmann::json MetaData;
};

/**
 * @brief Read and parse the SafeTensors JSON header from a file.
 *
 * @param file_name Path to the `.safetensors` file.
 * @return A struct containing the header size (bytes) and parsed JSON metadata.
 *
 * @throws std::runtime_error If the file cannot be read or the header is invalid.
 */
sSafeTensorsHeader read_safetensors_header(const std::string& file_name) {
    std::uint64_t header_size = 0;
    std::ifstream file(file_name, std::ios_base::binary);
    file.read(reinterpret_cast<char*>(&header_size), sizeof(header_size));
    if (!file) {
        throw std::runtime_error("Error opening safetensors file '" + file_name + "'");
    }

    const auto file_size = std::filesystem::file_size(file_name);
    if (header_size > file_size - sizeof(header_size)) {
        throw std::runtime_error(fmt::format("Invalid header size {} in safetensors file '{}'", header_size, file_name));
    }

    std::vector<char> header(header_size, '\0');
    file.read(header.data(), static_cast<std::streamsize>(header_size));
    if (!file) {
        throw std::runtime_error("Error reading header of safetensors file '" + file_name + "'");
    }
    try {
        return {header_size, nlohmann::json::parse(header.begin(), header.end())};
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("Invalid JSON header in safetensors file '{}': {}", file_name, e.what()));
    }
}

SafeTensorEntry::SafeTensorEntry(std::string name, std::vector<long> shape, ETensorDType dtype,
                                 std::string file_name, std::uint64_t begin, std::uint64_t size) :
    mName(std::move(name)), mShape(std::move(shape)), mDType(dtype), mFileName(std::move(file_name)),
    mBegin(begin), mSize(size) {
}

void SafeTensorEntry::read_tensor(Tensor& target) const {
    if (target.DType != mDType) {
        throw std::runtime_error(fmt::format("DType mismatch for tensor `{}`: file has {}, target is {}",
                                             mName, dtype_to_str(mDType), dtype_to_str(target.DType)));
    }
    if (target.bytes() != mSize) {
        throw std::runtime_error(fmt::format("Size mismatch for tensor `{}`: file has {} bytes, target has {}",
                                             mName, mSize, target.bytes()));
    }
    std::ifstream file(mFileName, std::ios_base::binary);
    file.seekg(static_cast<std::streamoff>(mBegin));
    file.read(reinterpret_cast<char*>(target.Data), static_cast<std::streamsize>(mSize));
    if (!file) {
        throw std::runtime_error(fmt::format("Error reading tensor `{}` from '{}'", mName, mFileName));
    }
}

/**
 * @brief Construct a reader for a single SafeTensors file.
 *
 * @param file_name Path to a `.safetensors` file.
 * @throws std::runtime_error On I/O errors, malformed headers or unsupported dtypes.
 */
SafeTensorsReader::SafeTensorsReader(const std::string& file_name) {
    auto header = read_safetensors_header(file_name);
    const std::uint64_t data_begin = sizeof(std::uint64_t) + header.HeaderSize;
    const auto file_size = std::filesystem::file_size(file_name);

    for (const auto& [key, value] : header.MetaData.items()) {
        if (key == "__metadata__") {
            for (const auto& [meta_key, meta_value] : value.items()) {
                if (!meta_value.is_string()) {
                    throw std::runtime_error(fmt::format("Metadata entry '{}' in '{}' is not a string", meta_key, file_name));
                }
                mMetaData[meta_key] = meta_value.get<std::string>();
            }
            continue;
        }
        auto offsets = value.at("data_offsets").get<std::vector<std::uint64_t>>();
        if (offsets.size() != 2 || offsets[1] < offsets[0] || data_begin + offsets[1] > file_size) {
            throw std::runtime_error(fmt::format("Invalid data offsets for tensor `{}` in '{}'", key, file_name));
        }
        mEntries.emplace_back(key, value.at("shape").get<std::vector<long>>(),
                              dtype_from_safetensors(value.at("dtype").get<std::string>()),
                              file_name, data_begin + offsets[0], offsets[1] - offsets[0]);
    }
}

const SafeTensorEntry& SafeTensorsReader::find_entry(std::string_view name) const {
    for (const auto& entry : mEntries) {
        if (entry.name() == name) {
            return entry;
        }
    }
    throw std::out_of_range(fmt::format("Tensor `{}` not found in safetensors file", name));
}

bool SafeTensorsReader::contains(std::string_view name) const {
    for (const auto& entry : mEntries) {
        if (entry.name() == name) {
            return true;
        }
    }
    return false;
}

SafeTensorWriter::SafeTensorWriter(std::string file_name) : mFileName(std::move(file_name)) {
}

void SafeTensorWriter::register_tensor(const std::string& name, const Tensor& tensor) {
    if (mFinalized)
        throw std::logic_error("Cannot register tensor after the file has been written");
    if (name == "__metadata__")
        throw std::logic_error("Tensor name `__metadata__` is reserved");
    if (!mRegisteredTensors.emplace(name, tensor).second)
        throw std::logic_error("Tensor " + name + " has already been registered");
}

void SafeTensorWriter::set_metadata(const std::string& key, std::string value) {
    mMetaData[key] = std::move(value);
}

/**
 * @brief Write header and tensor data, then atomically move the file into place.
 *
 * @throws std::runtime_error If the file cannot be written.
 */
void SafeTensorWriter::finalize() {
    if (mFinalized)
        throw std::logic_error("SafeTensorWriter::finalize called twice");

    nlohmann::json meta_data;
    nlohmann::json user_meta = nlohmann::json::object({{"format", "pt"}, {"writer", "distshampoo"}});
    for (const auto& [key, value] : mMetaData) {
        user_meta[key] = value;
    }
    meta_data["__metadata__"] = user_meta;

    std::uint64_t offset = 0;
    for (const auto& [name, tensor] : mRegisteredTensors) {
        meta_data[name]["dtype"] = dtype_to_safetensors(tensor.DType);
        meta_data[name]["shape"] = tensor.shape();
        meta_data[name]["data_offsets"] = std::vector<std::uint64_t>{offset, offset + tensor.bytes()};
        offset += tensor.bytes();
    }

    std::string header = meta_data.dump();
    std::uint64_t header_size = header.size();

    auto parent = std::filesystem::path(mFileName).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::string temp_name = mFileName + ".tmp";
    {
        std::ofstream file(temp_name, std::ios_base::binary | std::ios_base::trunc);
        if (!file) {
            throw std::runtime_error("Error opening file '" + temp_name + "' for writing");
        }
        file.write(reinterpret_cast<const char*>(&header_size), sizeof(header_size));
        file.write(header.data(), static_cast<std::streamsize>(header.size()));
        for (const auto& [name, tensor] : mRegisteredTensors) {
            if (tensor.bytes() > 0) {
                file.write(reinterpret_cast<const char*>(tensor.Data), static_cast<std::streamsize>(tensor.bytes()));
            }
        }
        if (!file) {
            throw std::runtime_error("Error writing file '" + temp_name + "'");
        }
    }
    std::filesystem::rename(temp_name, mFileName);
    mFinalized = true;
}
