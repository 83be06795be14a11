// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODELS_MODEL_BUILDER_H
#define NMTCORE_SRC_MODELS_MODEL_BUILDER_H

#include <memory>
#include <random>

#include "config/run_options.h"
#include "models/nmt_model.h"
#include "training/vocab.h"

struct Checkpoint;
class TrainingRunLogger;

namespace models {

/**
 * @brief Assemble a model for @p vocab and initialize or restore its weights.
 *
 * Without a checkpoint the parameters are drawn uniformly from +-param_init, then
 * Xavier-uniform when param_init_glorot is set, then the pretrained vocabulary vectors
 * are copied into the word tables requested by pre_word_vecs_enc/dec. With a checkpoint
 * the model, generator and secondary generator states are restored independently after
 * the key fix-up; missing entries keep their initialization.
 *
 * The output table of continuous generators is rebuilt from the target vectors
 * (optionally centered, then L2-normalized) whenever the vocabulary has them.
 * In detached mode the vocabulary vectors are dropped afterwards.
 *
 * @param vocab Vocabulary of this replica; its vectors are cleared in detached mode.
 * @param checkpoint State to restore, or nullptr.
 * @param seed Seed of the initialization; equal seeds give identical replicas.
 * @throws config_error On inconsistent dimensions or a continuous generator without target vectors.
 * @throws checkpoint_error On a shape mismatch with the checkpoint.
 */
std::unique_ptr<NMTModel> build_model(const ModelOptions& options, VocabularySet& vocab, const Checkpoint* checkpoint,
                                      TrainingRunLogger& logger, unsigned seed);

//! Uniform and Xavier initialization of the owning slots in @p slots.
void initialize_parameters(modules::ParameterStore& params, const std::vector<int>& slots,
                           const ModelOptions& options, std::mt19937& rng);

//! Freezing requested by the training options: freeze_encoder, freeze_decoder, train_only_sec_task.
void apply_freezing(NMTModel& model, const TrainingOptions& training, TrainingRunLogger& logger);

//! Log encoder, decoder, generator and non-trainable parameter counts.
void log_parameter_tally(const NMTModel& model, TrainingRunLogger& logger);

} // namespace models

#endif //NMTCORE_SRC_MODELS_MODEL_BUILDER_H
