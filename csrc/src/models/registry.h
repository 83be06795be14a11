// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "config/run_options.h"

namespace modules {
class ParameterStore;
class IEncoder;
class IDecoder;
class IGenerator;
}

namespace models {

/**
 * @brief Construction entry for one encoder type.
 *
 * Each encoder family provides a constructor taking the parameter store, the
 * width of the embedded source and the model options.
 */
struct EncoderOps {
    EEncoderType id;
    std::string_view name;
    std::unique_ptr<modules::IEncoder> (*create)(modules::ParameterStore& params, int input_size, const ModelOptions& options);
};

struct DecoderOps {
    EDecoderType id;
    std::string_view name;
    std::unique_ptr<modules::IDecoder> (*create)(modules::ParameterStore& params, int input_size, const ModelOptions& options);
};

const EncoderOps& encoder_from_id(EEncoderType id);
const DecoderOps& decoder_from_id(EDecoderType id);

//! Decoder actually built for @p options: "rnn" with input feeding is INPUT_FEED_RNN.
EDecoderType resolve_decoder_type(const ModelOptions& options);

std::vector<std::string_view> supported_encoders();
std::vector<std::string_view> supported_decoders();

/**
 * @brief Build the output generator selected by @p options.
 *
 * @param vocab_size Size of the target word vocabulary.
 * @param output_size Width of the continuous output space (ignored otherwise).
 */
std::unique_ptr<modules::IGenerator> create_generator(modules::ParameterStore& params, const ModelOptions& options,
                                                      int vocab_size, int output_size);

} // namespace models
