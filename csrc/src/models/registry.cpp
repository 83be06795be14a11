// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/registry.h"

#include <stdexcept>

#include <fmt/core.h>

#include "modules/decoders.h"
#include "modules/encoders.h"
#include "modules/generators.h"
#include "utilities/utils.h"

namespace models {

namespace {

float initial_dropout(const ModelOptions& options) {
    return options.Dropout.empty() ? 0.f : options.Dropout.front();
}

std::unique_ptr<modules::IEncoder> create_mean_encoder(modules::ParameterStore& params, int input_size, const ModelOptions& options) {
    return std::make_unique<modules::MeanEncoder>(params, input_size, options.EncRnnSize);
}

std::unique_ptr<modules::IEncoder> create_rnn_encoder(modules::ParameterStore& params, int input_size, const ModelOptions& options) {
    return std::make_unique<modules::RnnEncoder>(params, input_size, options.EncRnnSize);
}

std::unique_ptr<modules::IDecoder> create_rnn_decoder(modules::ParameterStore& params, int input_size, const ModelOptions& options) {
    return std::make_unique<modules::RnnDecoder>(params, input_size, options.DecRnnSize, initial_dropout(options));
}

std::unique_ptr<modules::IDecoder> create_input_feed_decoder(modules::ParameterStore& params, int input_size, const ModelOptions& options) {
    return std::make_unique<modules::InputFeedRnnDecoder>(params, input_size, options.DecRnnSize, initial_dropout(options));
}

const EncoderOps kMeanEncoder{EEncoderType::MEAN, "mean", &create_mean_encoder};
const EncoderOps kRnnEncoder{EEncoderType::RNN, "rnn", &create_rnn_encoder};
const DecoderOps kRnnDecoder{EDecoderType::RNN, "rnn", &create_rnn_decoder};
const DecoderOps kInputFeedDecoder{EDecoderType::INPUT_FEED_RNN, "ifrnn", &create_input_feed_decoder};

} // namespace

// The switches have no default: a new enumerator without an entry is a -Wswitch warning.
const EncoderOps& encoder_from_id(EEncoderType id) {
    switch (id) {
        case EEncoderType::MEAN: return kMeanEncoder;
        case EEncoderType::RNN: return kRnnEncoder;
    }
    throw std::logic_error(fmt::format(
        "Unknown EEncoderType {}. This is a programming error - all encoder types should be registered.",
        static_cast<int>(id)));
}

const DecoderOps& decoder_from_id(EDecoderType id) {
    switch (id) {
        case EDecoderType::RNN: return kRnnDecoder;
        case EDecoderType::INPUT_FEED_RNN: return kInputFeedDecoder;
    }
    throw std::logic_error(fmt::format(
        "Unknown EDecoderType {}. This is a programming error - all decoder types should be registered.",
        static_cast<int>(id)));
}

EDecoderType resolve_decoder_type(const ModelOptions& options) {
    if (options.Decoder == EDecoderType::RNN && options.InputFeed) {
        return EDecoderType::INPUT_FEED_RNN;
    }
    return options.Decoder;
}

std::vector<std::string_view> supported_encoders() {
    return {kMeanEncoder.name, kRnnEncoder.name};
}

std::vector<std::string_view> supported_decoders() {
    return {kRnnDecoder.name, kInputFeedDecoder.name};
}

std::unique_ptr<modules::IGenerator> create_generator(modules::ParameterStore& params, const ModelOptions& options,
                                                      int vocab_size, int output_size) {
    const bool bias = !options.NoGeneratorBias;
    switch (options.Generator) {
        case EGeneratorFunction::SOFTMAX:
            if (options.CopyAttn) {
                return std::make_unique<modules::CopyGenerator>(params, options.DecRnnSize, vocab_size, bias);
            }
            return std::make_unique<modules::SoftmaxGenerator>(params, "generator", options.DecRnnSize, vocab_size, bias);
        case EGeneratorFunction::SPARSEMAX:
            if (options.CopyAttn) {
                throw config_error("copy_attn is only available with the softmax generator");
            }
            return std::make_unique<modules::SparsemaxGenerator>(params, options.DecRnnSize, vocab_size, bias);
        case EGeneratorFunction::CONTINUOUS_LINEAR:
            return std::make_unique<modules::ContinuousGenerator>(params, options.DecRnnSize, output_size, false,
                                                                  options.GeneratorLayerNorm, bias);
        case EGeneratorFunction::CONTINUOUS_NONLINEAR:
            return std::make_unique<modules::ContinuousGenerator>(params, options.DecRnnSize, output_size, true,
                                                                  options.GeneratorLayerNorm, bias);
    }
    throw std::logic_error(fmt::format(
        "Unknown EGeneratorFunction {}. This is a programming error - all generators should be registered.",
        static_cast<int>(options.Generator)));
}

} // namespace models
