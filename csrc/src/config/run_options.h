// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_CONFIG_RUN_OPTIONS_H
#define NMTCORE_SRC_CONFIG_RUN_OPTIONS_H

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "utilities/dtype.h"

enum class EEncoderType {
    MEAN,
    RNN,
};

//! "rnn" with input feeding enabled is dispatched to INPUT_FEED_RNN.
enum class EDecoderType {
    RNN,
    INPUT_FEED_RNN,
};

enum class EGeneratorFunction {
    SOFTMAX,
    SPARSEMAX,
    CONTINUOUS_LINEAR,
    CONTINUOUS_NONLINEAR,
};

enum class EFeatMerge {
    CONCAT,
    SUM,
};

enum class ENormMethod {
    SENTS,
    TOKENS,
};

enum class EOptimMethod {
    SGD,
    ADAM,
};

enum class EDecayMethod {
    NONE,
    COSINE,
    LINEAR,
    NOAM,
};

//! What part of the optimizer state is written into checkpoints.
enum class EResetOptim {
    NONE,       // full state
    STATES,     // counters only, per-parameter moments and their step history dropped
    ALL,        // no optimizer state
};

enum class EBiasPolicy {
    ZERO_EXCEPT_SPECIALS,
    DROP,
    LANGUAGE_FILTERED,
};

enum class EStoppingCriterion {
    PPL,
    ACCURACY,
};

/**
 * @brief Architecture and model-state options. Persisted inside every checkpoint.
 */
struct ModelOptions {
    EEncoderType Encoder = EEncoderType::RNN;
    EDecoderType Decoder = EDecoderType::RNN;
    bool InputFeed = true;

    int SrcWordVecSize = 64;
    int TgtWordVecSize = 64;
    int EncRnnSize = 64;
    int DecRnnSize = 64;

    // per-token feature embeddings
    EFeatMerge FeatMerge = EFeatMerge::CONCAT;
    int FeatVecSize = -1;
    float FeatVecExponent = 0.7f;
    bool UseFeatEmb = false;

    EGeneratorFunction Generator = EGeneratorFunction::SOFTMAX;
    bool CopyAttn = false;
    bool GeneratorLayerNorm = false;
    bool NoGeneratorBias = false;
    bool Center = false;

    bool ShareEmbeddings = false;
    bool ShareDecoderEmbeddings = false;
    bool FixWordVecsEnc = false;
    bool FixWordVecsDec = false;
    bool PreWordVecsEnc = false;
    bool PreWordVecsDec = false;

    float ParamInit = 0.1f;
    bool ParamInitGlorot = false;

    std::vector<float> Dropout = {0.3f};
    std::vector<int> DropoutSteps = {0};

    bool MultiTask = false;
    float SecondaryTaskWeight = 1.0f;

    bool DetachedEmbeddings = false;
    int DetachedEmbeddingRows = 32;

    ETensorDType ModelDType = ETensorDType::FP32;
};

/**
 * @brief Options of one training run.
 */
struct TrainingOptions {
    int TrainSteps = 100000;
    bool SinglePass = false;
    int BatchSize = 64;
    int Seed = 1234;

    std::string SaveModel = "model";
    int SaveCheckpointSteps = 5000;
    int KeepCheckpoint = -1;
    int ValidSteps = 10000;
    int ReportEvery = 50;

    std::vector<int> AccumCount = {1};
    std::vector<int> AccumSteps = {0};
    int TruncatedDecoder = 0;
    int MaxGeneratorBatches = 32;
    ENormMethod Normalization = ENormMethod::SENTS;

    float AverageDecay = 0.f;
    int AverageEvery = 1;

    int EarlyStopping = 0;
    std::vector<EStoppingCriterion> EarlyStoppingCriteria = {};

    int WorldSize = 1;

    EOptimMethod Optim = EOptimMethod::SGD;
    float LearningRate = 1.0f;
    float MaxGradNorm = 5.0f;
    float AdamBeta1 = 0.9f;
    float AdamBeta2 = 0.999f;
    EDecayMethod DecayMethod = EDecayMethod::NONE;
    int WarmupSteps = 4000;
    float FinalLrFraction = 0.f;
    EResetOptim ResetOptim = EResetOptim::NONE;

    bool Denoise = false;
    float WordShuffle = 3.f;
    float WordDropout = 0.f;
    float WordBlank = 0.f;

    std::string TrainFrom;
    std::string NewVocab;
    std::string Langcode;
    std::string UseLang;
    EBiasPolicy BiasPolicy = EBiasPolicy::LANGUAGE_FILTERED;
    std::string SrcEmbeddings;
    std::string TgtEmbeddings;

    bool TrainOnlySecTask = false;
    bool FreezeEncoder = false;
    bool FreezeDecoder = false;
    bool ModifyOpts = false;

    std::string LogFile;
};

struct RunOptions {
    ModelOptions Model;
    TrainingOptions Training;
};

EEncoderType encoder_type_from_str(std::string_view name);
EDecoderType decoder_type_from_str(std::string_view name);
EGeneratorFunction generator_function_from_str(std::string_view name);
EBiasPolicy bias_policy_from_str(std::string_view name);
EResetOptim reset_optim_from_str(std::string_view name);
EStoppingCriterion stopping_criterion_from_str(std::string_view name);
EFeatMerge feat_merge_from_str(std::string_view name);
ENormMethod norm_method_from_str(std::string_view name);
EOptimMethod optim_method_from_str(std::string_view name);
EDecayMethod decay_method_from_str(std::string_view name);

std::string_view to_string(EEncoderType type);
std::string_view to_string(EDecoderType type);
std::string_view to_string(EGeneratorFunction type);
std::string_view to_string(EBiasPolicy policy);
std::string_view to_string(EResetOptim policy);
std::string_view to_string(EStoppingCriterion criterion);
std::string_view to_string(EFeatMerge merge);
std::string_view to_string(ENormMethod norm);
std::string_view to_string(EOptimMethod method);
std::string_view to_string(EDecayMethod method);

[[nodiscard]] bool is_continuous(EGeneratorFunction generator);

ModelOptions model_options_from_json(const nlohmann::json& json, ModelOptions defaults = {});
TrainingOptions training_options_from_json(const nlohmann::json& json, TrainingOptions defaults = {});
nlohmann::json model_options_to_json(const ModelOptions& options);
nlohmann::json training_options_to_json(const TrainingOptions& options);

//! Read {"model": {...}, "training": {...}}; missing keys keep their defaults.
RunOptions load_run_config(const std::string& file_name);
void save_run_config(const RunOptions& options, const std::string& file_name);

/**
 * @brief Check all cross-option constraints; applies single-pass mode.
 * @throws config_error On the first violated constraint.
 */
void validate_options(RunOptions& options);

#endif //NMTCORE_SRC_CONFIG_RUN_OPTIONS_H
