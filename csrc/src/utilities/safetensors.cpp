// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "safetensors.h"

#include <bit>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

#include <fmt/core.h>

#include "utils.h"

static_assert(std::endian::native == std::endian::little, "safetensors files are little-endian");

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

namespace {

sSafeTensorsHeader read_safetensors_header(std::ifstream& file, const std::string& file_name) {
    std::uint64_t header_size = 0;
    file.read(reinterpret_cast<char*>(&header_size), sizeof(header_size));
    if (!file) {
        throw checkpoint_error("Error opening safetensors file '" + file_name + "'");
    }

    std::vector<char> header(header_size, '\0');
    file.read(header.data(), static_cast<std::streamsize>(header_size));
    if (!file) {
        throw checkpoint_error(fmt::format("Truncated header in safetensors file '{}'", file_name));
    }
    try {
        return {header_size, nlohmann::json::parse(header.begin(), header.end())};
    } catch (const nlohmann::json::parse_error& e) {
        throw checkpoint_error(fmt::format("Invalid header in safetensors file '{}': {}", file_name, e.what()));
    }
}

} // namespace

/**
 * @brief Write a SafeTensors file from host tensors.
 *
 * Builds the JSON header with dtype/shape/data_offsets for every tensor, encodes each
 * top-level metadata entry as a JSON string (safetensors metadata is a string map),
 * then streams header and data to `<file_name>.tmp` and renames it over @p file_name.
 *
 * @param file_name Destination path.
 * @param tensors Tensors to store.
 * @param metadata JSON object stored under "__metadata__".
 *
 * @throws checkpoint_error If the file cannot be written.
 */
void write_safetensors(const std::string& file_name, const TensorMap& tensors, const nlohmann::json& metadata) {
    nlohmann::json header = nlohmann::json::object();
    nlohmann::json encoded_meta = nlohmann::json::object();
    for (const auto& [key, value] : metadata.items()) {
        encoded_meta[key] = value.dump();
    }
    header["__metadata__"] = encoded_meta;

    std::uint64_t offset = 0;
    for (const auto& [name, tensor] : tensors) {
        header[name]["dtype"] = "F32";
        header[name]["shape"] = tensor.shape();
        header[name]["data_offsets"] = std::vector<std::uint64_t>{offset, offset + tensor.bytes()};
        offset += tensor.bytes();
    }

    std::string header_str = header.dump();
    std::uint64_t header_size = header_str.size();

    std::string tmp_name = file_name + ".tmp";
    {
        std::ofstream file(tmp_name, std::ios_base::binary | std::ios_base::trunc);
        if (!file) {
            throw checkpoint_error(fmt::format("Could not open '{}' for writing", tmp_name));
        }
        file.write(reinterpret_cast<const char*>(&header_size), sizeof(header_size));
        file.write(header_str.data(), static_cast<std::streamsize>(header_size));
        for (const auto& [name, tensor] : tensors) {
            file.write(reinterpret_cast<const char*>(tensor.data()), static_cast<std::streamsize>(tensor.bytes()));
        }
        file.flush();
        if (!file) {
            throw checkpoint_error(fmt::format("Error while writing '{}'", tmp_name));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_name, file_name, ec);
    if (ec) {
        throw checkpoint_error(fmt::format("Could not move '{}' to '{}': {}", tmp_name, file_name, ec.message()));
    }
}

/**
 * @brief Read every tensor and the metadata of a SafeTensors file into host memory.
 *
 * @param file_name Path to the file.
 * @return Tensors by name, and the decoded "__metadata__" object.
 *
 * @throws checkpoint_error If the file is missing, truncated, or uses a dtype other than F32.
 */
SafeTensorsContents read_safetensors(const std::string& file_name) {
    std::ifstream file(file_name, std::ios_base::binary);
    if (!file) {
        throw checkpoint_error(fmt::format("Could not open safetensors file '{}'", file_name));
    }
    auto [header_size, header] = read_safetensors_header(file, file_name);
    const std::streamoff data_start = static_cast<std::streamoff>(sizeof(header_size) + header_size);

    SafeTensorsContents contents;
    for (const auto& [name, entry] : header.items()) {
        if (name == "__metadata__") {
            for (const auto& [key, value] : entry.items()) {
                contents.MetaData[key] = nlohmann::json::parse(value.get<std::string>());
            }
            continue;
        }
        if (entry.at("dtype").get<std::string>() != "F32") {
            throw checkpoint_error(fmt::format("Tensor '{}' in '{}' has unsupported dtype {}",
                                               name, file_name, entry.at("dtype").get<std::string>()));
        }
        auto shape = entry.at("shape").get<std::vector<long>>();
        auto begin = entry.at("data_offsets")[0].get<std::uint64_t>();
        auto end = entry.at("data_offsets")[1].get<std::uint64_t>();

        Tensor t = Tensor::zeros(shape);
        if (end - begin != t.bytes()) {
            throw checkpoint_error(fmt::format("Tensor '{}' in '{}': data size {} does not match shape {}",
                                               name, file_name, end - begin, shape_to_str(shape)));
        }
        file.seekg(data_start + static_cast<std::streamoff>(begin));
        file.read(reinterpret_cast<char*>(t.data()), static_cast<std::streamsize>(t.bytes()));
        if (!file) {
            throw checkpoint_error(fmt::format("Truncated data for tensor '{}' in '{}'", name, file_name));
        }
        contents.Tensors.emplace(name, std::move(t));
    }
    return contents;
}
