// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODELS_NMT_MODEL_H
#define NMTCORE_SRC_MODELS_NMT_MODEL_H

#include <memory>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "config/run_options.h"
#include "modules/decoders.h"
#include "modules/encoders.h"
#include "modules/generators.h"
#include "modules/parameter_store.h"
#include "modules/primitives/embedding.h"
#include "training/batch.h"
#include "training/vocab.h"
#include "utilities/safetensors.h"

namespace models {

inline constexpr std::string_view GENERATOR_PREFIX = "generator.";
inline constexpr std::string_view SECONDARY_GENERATOR_PREFIX = "secondary_generator.";
inline constexpr const char* OUTPUT_EMBEDDING_NAME = "decoder.tgt_out_emb.weight";

//! Parameter counts reported after assembly.
struct ParameterTally {
    long Encoder = 0;
    long Decoder = 0;
    long Generator = 0;
    long NonTrainable = 0;
    long Total = 0;
};

/**
 * @brief Encoder-decoder model with its generators.
 *
 * All parameters live in one ParameterStore; weight sharing is expressed through its
 * aliases, which the constructor sets up from the sharing options. The model does not
 * initialise or load weights, see build_model().
 */
class NMTModel {
public:
    struct WindowOutput {
        Tensor DecOut;      ///< (T * B, H)
        Tensor Attention;   ///< (T * B, S)
        int Begin = 0;      ///< first decoder input position of the window
        int Length = 0;     ///< number of positions T
    };

    /**
     * @brief Create all modules and tie shared weights.
     *
     * @param output_vec_size Width of the continuous output space, ignored for
     *        non-continuous generators.
     * @param secondary_vocab_size Size of the secondary label vocabulary, 0 for none.
     * @throws config_error When shared tensors disagree in shape.
     */
    NMTModel(const ModelOptions& options, const VocabularySet& vocab, int output_vec_size,
             int secondary_vocab_size, unsigned seed);

    NMTModel(const NMTModel&) = delete;
    NMTModel& operator=(const NMTModel&) = delete;

    /**
     * @brief Run encoder and decoder for decoder input positions [begin, begin + length).
     *
     * @param bptt When false the decoder restarts from the encoder state, otherwise it
     *        continues from the state left by the previous window.
     */
    WindowOutput forward(const Batch& batch, int begin, int length, bool bptt);

    //! Backpropagate through the last forward window.
    void backward(const Tensor& d_dec_out, const Tensor* d_attention);

    void train() { mTraining = true; }
    void eval() { mTraining = false; }
    [[nodiscard]] bool is_training() const { return mTraining; }

    void set_grad_enabled(bool enabled) { mGradEnabled = enabled; }
    [[nodiscard]] bool grad_enabled() const { return mGradEnabled; }

    void update_dropout(float p);
    void detach_state() { mDecoder->detach_state(); }

    modules::ParameterStore& params() { return mParams; }
    [[nodiscard]] const modules::ParameterStore& params() const { return mParams; }

    //! Canonical parameter slots, registration order.
    [[nodiscard]] std::vector<int> parameters() const { return mParams.parameters(); }

    modules::IGenerator& generator() { return *mGenerator; }
    modules::IGenerator* secondary_generator() { return mSecondaryGenerator.get(); }

    //! Frozen unit-norm target table of continuous generators, nullptr otherwise.
    [[nodiscard]] const Tensor* output_embeddings() const;

    //! Target vocabulary id of every source token, (S * B), for the copy generator.
    [[nodiscard]] std::vector<int> copy_targets(const Batch& batch) const;

    [[nodiscard]] const ModelOptions& options() const { return mOptions; }
    [[nodiscard]] int tgt_vocab_size() const { return mTgtVocabSize; }

    [[nodiscard]] int src_word_slot() const { return mSrcEmb->word_slot(); }
    [[nodiscard]] int tgt_word_slot() const { return mTgtEmb->word_slot(); }
    [[nodiscard]] int output_embedding_slot() const { return mOutputEmbedding; }

    //! Parameters outside the generators, by full name (aliases included).
    [[nodiscard]] TensorMap model_state_dict() const;
    //! Generator parameters with the "generator." prefix stripped.
    [[nodiscard]] TensorMap generator_state_dict() const;
    [[nodiscard]] TensorMap secondary_generator_state_dict() const;

    /**
     * @brief Copy matching entries of @p state into the parameters of one section.
     *
     * Keys are matched against the parameter names with @p prefix stripped; an empty
     * prefix selects everything outside the generators.
     *
     * @param leading_rows Names whose stored tensor may have fewer rows than the parameter;
     *        only the stored rows are copied.
     * @param skip Names left untouched.
     * @return Parameter names for which @p state has no entry.
     * @throws checkpoint_error On a shape mismatch.
     */
    std::vector<std::string> load_state(const TensorMap& state, std::string_view prefix,
                                        const std::set<std::string>& leading_rows = {},
                                        const std::set<std::string>& skip = {});

    [[nodiscard]] ParameterTally tally_parameters() const;

    //! Slots registered under @p prefix (aliases resolved and deduplicated).
    [[nodiscard]] std::vector<int> section_parameters(std::string_view prefix) const;

private:
    [[nodiscard]] TensorMap section_state(std::string_view prefix) const;

    ModelOptions mOptions;
    modules::ParameterStore mParams;
    std::unique_ptr<modules::EmbeddingModule> mSrcEmb;
    std::unique_ptr<modules::IEncoder> mEncoder;
    std::unique_ptr<modules::EmbeddingModule> mTgtEmb;
    std::unique_ptr<modules::IDecoder> mDecoder;
    std::unique_ptr<modules::IGenerator> mGenerator;
    std::unique_ptr<modules::IGenerator> mSecondaryGenerator;
    int mOutputEmbedding = -1;
    int mTgtVocabSize = 0;
    std::vector<int> mSrcToTgt;

    bool mTraining = true;
    bool mGradEnabled = true;
    std::mt19937 mRng;

    // inputs of the last forward window
    TokenTensor mLastSrc;
    TokenTensor mLastTgt;
    int mLastBegin = 0;
    int mLastLength = 0;
    bool mHasWindow = false;
};

//! Disables gradient caching of @p model for the lifetime of the guard.
class NoGradGuard {
public:
    explicit NoGradGuard(NMTModel& model) : mModel(model), mPrevious(model.grad_enabled()) {
        model.set_grad_enabled(false);
    }
    ~NoGradGuard() { mModel.set_grad_enabled(mPrevious); }

    NoGradGuard(const NoGradGuard&) = delete;
    NoGradGuard& operator=(const NoGradGuard&) = delete;

private:
    NMTModel& mModel;
    bool mPrevious;
};

} // namespace models

#endif //NMTCORE_SRC_MODELS_NMT_MODEL_H
