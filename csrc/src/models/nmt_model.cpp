// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "nmt_model.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "models/registry.h"
#include "utilities/utils.h"

namespace models {

namespace {

bool is_generator_name(std::string_view name) {
    return name.starts_with(GENERATOR_PREFIX) || name.starts_with(SECONDARY_GENERATOR_PREFIX);
}

std::vector<int> embedded_feature_sizes(const SideVocab& side, bool use_feat_emb) {
    std::vector<int> sizes;
    if (!use_feat_emb) return sizes;
    for (const auto& f : side.Features) sizes.push_back(f.size());
    return sizes;
}

} // namespace

NMTModel::NMTModel(const ModelOptions& options, const VocabularySet& vocab, int output_vec_size,
                   int secondary_vocab_size, unsigned seed)
    : mOptions(options), mRng(seed) {
    const float dropout = options.Dropout.empty() ? 0.f : options.Dropout.front();
    mTgtVocabSize = vocab.Tgt.Words.size();

    modules::EmbeddingModule::Config src_cfg{
        vocab.Src.Words.size(), options.SrcWordVecSize, embedded_feature_sizes(vocab.Src, options.UseFeatEmb),
        options.FeatMerge, options.FeatVecSize, options.FeatVecExponent, dropout};
    mSrcEmb = std::make_unique<modules::EmbeddingModule>(mParams, "encoder.embeddings", src_cfg);
    mEncoder = encoder_from_id(options.Encoder).create(mParams, mSrcEmb->output_size(), options);

    modules::EmbeddingModule::Config tgt_cfg{
        vocab.Tgt.Words.size(), options.TgtWordVecSize, embedded_feature_sizes(vocab.Tgt, options.UseFeatEmb),
        options.FeatMerge, options.FeatVecSize, options.FeatVecExponent, dropout};
    mTgtEmb = std::make_unique<modules::EmbeddingModule>(mParams, "decoder.embeddings", tgt_cfg);

    if (mEncoder->hidden_size() != options.DecRnnSize) {
        throw config_error(fmt::format("enc_rnn_size ({}) must equal dec_rnn_size ({}) for attention",
                                       mEncoder->hidden_size(), options.DecRnnSize));
    }

    if (options.ShareEmbeddings) {
        mParams.tie(mTgtEmb->word_slot(), mSrcEmb->word_slot());
        mParams.set_trainable(mSrcEmb->word_slot(), false);
    }

    mDecoder = decoder_from_id(resolve_decoder_type(options)).create(mParams, mTgtEmb->output_size(), options);

    if (is_continuous(options.Generator)) {
        mOutputEmbedding = mParams.add(OUTPUT_EMBEDDING_NAME, {mTgtVocabSize, output_vec_size}, false);
    }

    mGenerator = create_generator(mParams, options, mTgtVocabSize, output_vec_size);
    if (options.ShareDecoderEmbeddings) {
        if (is_continuous(options.Generator)) {
            mTgtEmb->tie_embeddings(mOutputEmbedding);
        } else {
            mParams.tie(mGenerator->proj_weight_slot(), mTgtEmb->word_slot());
        }
    }

    if (secondary_vocab_size > 0) {
        mSecondaryGenerator = std::make_unique<modules::SoftmaxGenerator>(
            mParams, "secondary_generator", options.DecRnnSize, secondary_vocab_size, true);
    }

    mSrcToTgt.resize(vocab.Src.Words.size());
    for (int i = 0; i < vocab.Src.Words.size(); ++i) {
        mSrcToTgt[i] = vocab.Tgt.Words.lookup(vocab.Src.Words.Itos[i]);
    }
}

NMTModel::WindowOutput NMTModel::forward(const Batch& batch, int begin, int length, bool bptt) {
    // the last target position is never a decoder input
    if (begin < 0 || length <= 0 || begin + length > batch.Tgt.Len - 1) {
        throw std::out_of_range(fmt::format("Decoder window [{}, {}) outside the {} decoder inputs",
                                            begin, begin + length, batch.Tgt.Len - 1));
    }
    const int src_len = batch.Src.Len;
    Tensor src = mSrcEmb->forward(batch.Src, 0, src_len, mTraining, mRng);
    modules::EncoderOutput enc = mEncoder->forward(src, src_len, batch.SrcLengths);
    if (!bptt || !mDecoder->has_state()) {
        mDecoder->init_state(enc);
    }
    Tensor tgt = mTgtEmb->forward(batch.Tgt, begin, begin + length, mTraining, mRng);
    modules::DecoderOutput dec = mDecoder->forward(tgt, length, enc, batch.SrcLengths, mTraining, mRng);

    if (mGradEnabled) {
        mLastSrc = batch.Src;
        mLastTgt = batch.Tgt;
        mLastBegin = begin;
        mLastLength = length;
    }
    mHasWindow = mGradEnabled;

    WindowOutput out;
    out.DecOut = std::move(dec.Outputs);
    out.Attention = std::move(dec.Attention);
    out.Begin = begin;
    out.Length = length;
    return out;
}

void NMTModel::backward(const Tensor& d_dec_out, const Tensor* d_attention) {
    if (!mHasWindow) {
        throw std::logic_error("NMTModel::backward called without a recorded forward window");
    }
    modules::DecoderGradients grads = mDecoder->backward(d_dec_out, d_attention);
    mTgtEmb->backward(mLastTgt, mLastBegin, mLastBegin + mLastLength, grads.DEmbedded);
    Tensor d_src = mEncoder->backward(grads.DMemory, grads.DFinal);
    mSrcEmb->backward(mLastSrc, 0, mLastSrc.Len, d_src);
}

void NMTModel::update_dropout(float p) {
    mSrcEmb->update_dropout(p);
    mTgtEmb->update_dropout(p);
    mDecoder->update_dropout(p);
}

const Tensor* NMTModel::output_embeddings() const {
    return mOutputEmbedding < 0 ? nullptr : &mParams.value(mOutputEmbedding);
}

std::vector<int> NMTModel::copy_targets(const Batch& batch) const {
    std::vector<int> targets(static_cast<std::size_t>(batch.Src.Len) * batch.Src.Batch);
    for (int s = 0; s < batch.Src.Len; ++s) {
        for (int b = 0; b < batch.Src.Batch; ++b) {
            targets[static_cast<std::size_t>(s) * batch.Src.Batch + b] = mSrcToTgt.at(batch.Src.at(s, b));
        }
    }
    return targets;
}

TensorMap NMTModel::section_state(std::string_view prefix) const {
    TensorMap state;
    for (const auto& [name, slot] : mParams.named_slots()) {
        if (prefix.empty()) {
            if (is_generator_name(name)) continue;
            state.emplace(name, mParams.value(slot));
        } else if (std::string_view(name).starts_with(prefix)) {
            state.emplace(name.substr(prefix.size()), mParams.value(slot));
        }
    }
    return state;
}

TensorMap NMTModel::model_state_dict() const {
    return section_state("");
}

TensorMap NMTModel::generator_state_dict() const {
    return section_state(GENERATOR_PREFIX);
}

TensorMap NMTModel::secondary_generator_state_dict() const {
    return section_state(SECONDARY_GENERATOR_PREFIX);
}

std::vector<std::string> NMTModel::load_state(const TensorMap& state, std::string_view prefix,
                                              const std::set<std::string>& leading_rows,
                                              const std::set<std::string>& skip) {
    std::vector<std::string> missing;
    for (const auto& [name, slot] : mParams.named_slots()) {
        std::string key;
        if (prefix.empty()) {
            if (is_generator_name(name)) continue;
            key = name;
        } else if (std::string_view(name).starts_with(prefix)) {
            key = name.substr(prefix.size());
        } else {
            continue;
        }
        if (skip.contains(name)) continue;

        auto it = state.find(key);
        if (it == state.end()) {
            missing.push_back(name);
            continue;
        }
        Tensor& dst = mParams.value(slot);
        const Tensor& src = it->second;
        if (src.same_shape(dst)) {
            dst.Data = src.Data;
        } else if (leading_rows.contains(name) && src.Rank == dst.Rank && src.row_size() == dst.row_size() &&
                   src.rows() <= dst.rows()) {
            std::copy(src.Data.begin(), src.Data.end(), dst.Data.begin());
        } else {
            throw checkpoint_error(fmt::format("Shape mismatch for '{}': checkpoint has {}, model expects {}",
                                               name, shape_to_str(src), shape_to_str(dst)));
        }
    }
    return missing;
}

std::vector<int> NMTModel::section_parameters(std::string_view prefix) const {
    std::vector<int> slots;
    for (const auto& [name, slot] : mParams.named_slots()) {
        if (!std::string_view(name).starts_with(prefix)) continue;
        int owner = mParams.resolve(slot);
        if (std::find(slots.begin(), slots.end(), owner) == slots.end()) slots.push_back(owner);
    }
    return slots;
}

ParameterTally NMTModel::tally_parameters() const {
    ParameterTally tally;
    for (int slot : mParams.parameters()) {
        const auto& p = mParams.at(slot);
        long n = static_cast<long>(p.Value.nelem());
        tally.Total += n;
        if (!p.Trainable) tally.NonTrainable += n;
        std::string_view name = p.Name;
        if (name.starts_with("encoder.")) {
            tally.Encoder += n;
        } else if (name.starts_with("decoder.")) {
            tally.Decoder += n;
        } else {
            tally.Generator += n;
        }
    }
    return tally;
}

} // namespace models
