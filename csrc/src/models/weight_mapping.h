// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Checkpoint key fix-up - maps parameter names written by older model versions
// to the names registered by NMTModel.

#ifndef NMTCORE_SRC_MODELS_WEIGHT_MAPPING_H
#define NMTCORE_SRC_MODELS_WEIGHT_MAPPING_H

#include <string>

#include "training/checkpoint.h"
#include "utilities/safetensors.h"

namespace models {

/**
 * @brief Current name of a possibly legacy parameter name.
 *
 * - `<x>.layer_norm[_N].b_2` -> `<x>.layer_norm[_N].bias`
 * - `<x>.layer_norm[_N].a_2` -> `<x>.layer_norm[_N].weight`
 * - `<x>.make_embedding.emb_luts.0.0.weight` -> `<x>.word_lut.weight`
 * - `<x>.make_embedding.emb_luts.0.<i>.weight` -> `<x>.feat_luts.<i-1>.weight`
 */
std::string fix_key(const std::string& key);

//! Rename all keys of @p state with fix_key(). @return Number of renamed keys.
int fix_state_dict_keys(TensorMap& state);

//! fix_state_dict_keys() over the model, generator and secondary generator states of @p checkpoint.
int fix_checkpoint_keys(Checkpoint& checkpoint);

} // namespace models

#endif //NMTCORE_SRC_MODELS_WEIGHT_MAPPING_H
