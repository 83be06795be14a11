// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_UTILS_SAFETENSORS_H
#define NMTCORE_SRC_UTILS_SAFETENSORS_H

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "tensor.h"

//! Named tensors, ordered by name so that files are written deterministically.
using TensorMap = std::map<std::string, Tensor>;

struct SafeTensorsContents {
    TensorMap Tensors;
    //! Contents of "__metadata__", with every value decoded back from its JSON string.
    nlohmann::json MetaData = nlohmann::json::object();
};

//! Write @p tensors as F32 entries, plus @p metadata (a JSON object) into "__metadata__".
//! The file is written to a temporary name and renamed into place.
void write_safetensors(const std::string& file_name, const TensorMap& tensors, const nlohmann::json& metadata);

SafeTensorsContents read_safetensors(const std::string& file_name);

#endif //NMTCORE_SRC_UTILS_SAFETENSORS_H
