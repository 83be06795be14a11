// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/run_options.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <type_traits>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/utils.h"

namespace {

std::optional<int> as_int(const nlohmann::json& value) {
    if (value.is_number_integer()) return value.get<int>();
    if (value.is_number_unsigned()) return static_cast<int>(value.get<std::uint64_t>());
    if (value.is_number_float()) return static_cast<int>(value.get<double>());
    return std::nullopt;
}

std::optional<float> as_float(const nlohmann::json& value) {
    if (value.is_number_float() || value.is_number_integer() || value.is_number_unsigned()) {
        return static_cast<float>(value.get<double>());
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int>() != 0;
    if (value.is_string()) {
        const std::string v = value.get<std::string>();
        if (iequals(v, "true") || v == "1") return true;
        if (iequals(v, "false") || v == "0") return false;
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> get_opt(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    std::optional<T> result;
    if constexpr (std::is_same_v<T, int>) {
        result = as_int(*it);
    } else if constexpr (std::is_same_v<T, float>) {
        result = as_float(*it);
    } else if constexpr (std::is_same_v<T, bool>) {
        result = as_bool(*it);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) result = it->get<std::string>();
    }
    if (!result) {
        throw config_error(fmt::format("Option '{}' has an invalid value: {}", key, it->dump()));
    }
    return result;
}

//! Accepts a scalar or a list; scalars become one-element lists.
template<typename T>
std::optional<std::vector<T>> get_list(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    std::vector<T> out;
    auto convert = [&](const nlohmann::json& v) {
        std::optional<T> r;
        if constexpr (std::is_same_v<T, int>) r = as_int(v);
        else if constexpr (std::is_same_v<T, float>) r = as_float(v);
        else r = v.is_string() ? std::optional<T>(v.get<std::string>()) : std::nullopt;
        if (!r) throw config_error(fmt::format("Option '{}' has an invalid element: {}", key, v.dump()));
        out.push_back(*r);
    };
    if (it->is_array()) {
        for (const auto& v : *it) convert(v);
    } else {
        convert(*it);
    }
    return out;
}

template<typename T>
void assign(T& target, std::optional<T> value) {
    if (value) target = std::move(*value);
}

} // namespace

EEncoderType encoder_type_from_str(std::string_view name) {
    if (iequals(name, "mean")) return EEncoderType::MEAN;
    if (iequals(name, "rnn")) return EEncoderType::RNN;
    throw config_error(fmt::format("Unknown encoder type '{}'. Supported: mean, rnn", name));
}

EDecoderType decoder_type_from_str(std::string_view name) {
    if (iequals(name, "rnn")) return EDecoderType::RNN;
    if (iequals(name, "ifrnn")) return EDecoderType::INPUT_FEED_RNN;
    throw config_error(fmt::format("Unknown decoder type '{}'. Supported: rnn, ifrnn", name));
}

EGeneratorFunction generator_function_from_str(std::string_view name) {
    if (iequals(name, "softmax")) return EGeneratorFunction::SOFTMAX;
    if (iequals(name, "sparsemax")) return EGeneratorFunction::SPARSEMAX;
    if (iequals(name, "continuous-linear")) return EGeneratorFunction::CONTINUOUS_LINEAR;
    if (iequals(name, "continuous-nonlinear")) return EGeneratorFunction::CONTINUOUS_NONLINEAR;
    throw config_error(fmt::format(
        "Unknown generator function '{}'. Supported: softmax, sparsemax, continuous-linear, continuous-nonlinear", name));
}

EBiasPolicy bias_policy_from_str(std::string_view name) {
    if (iequals(name, "zero-specials")) return EBiasPolicy::ZERO_EXCEPT_SPECIALS;
    if (iequals(name, "drop")) return EBiasPolicy::DROP;
    if (iequals(name, "lang-filter")) return EBiasPolicy::LANGUAGE_FILTERED;
    throw config_error(fmt::format("Unknown bias policy '{}'. Supported: zero-specials, drop, lang-filter", name));
}

EResetOptim reset_optim_from_str(std::string_view name) {
    if (iequals(name, "none")) return EResetOptim::NONE;
    if (iequals(name, "states")) return EResetOptim::STATES;
    if (iequals(name, "all")) return EResetOptim::ALL;
    throw config_error(fmt::format("Unknown reset_optim '{}'. Supported: none, states, all", name));
}

EStoppingCriterion stopping_criterion_from_str(std::string_view name) {
    if (iequals(name, "ppl")) return EStoppingCriterion::PPL;
    if (iequals(name, "accuracy")) return EStoppingCriterion::ACCURACY;
    throw config_error(fmt::format("Unknown early stopping criterion '{}'. Supported: ppl, accuracy", name));
}

EFeatMerge feat_merge_from_str(std::string_view name) {
    if (iequals(name, "concat")) return EFeatMerge::CONCAT;
    if (iequals(name, "sum")) return EFeatMerge::SUM;
    throw config_error(fmt::format("Unknown feat_merge '{}'. Supported: concat, sum", name));
}

ENormMethod norm_method_from_str(std::string_view name) {
    if (iequals(name, "sents")) return ENormMethod::SENTS;
    if (iequals(name, "tokens")) return ENormMethod::TOKENS;
    throw config_error(fmt::format("Unknown normalization '{}'. Supported: sents, tokens", name));
}

EOptimMethod optim_method_from_str(std::string_view name) {
    if (iequals(name, "sgd")) return EOptimMethod::SGD;
    if (iequals(name, "adam")) return EOptimMethod::ADAM;
    throw config_error(fmt::format("Unknown optimizer '{}'. Supported: sgd, adam", name));
}

EDecayMethod decay_method_from_str(std::string_view name) {
    if (iequals(name, "none")) return EDecayMethod::NONE;
    if (iequals(name, "cosine")) return EDecayMethod::COSINE;
    if (iequals(name, "linear")) return EDecayMethod::LINEAR;
    if (iequals(name, "noam")) return EDecayMethod::NOAM;
    throw config_error(fmt::format("Unknown decay method '{}'. Supported: none, cosine, linear, noam", name));
}

std::string_view to_string(EFeatMerge merge) {
    return merge == EFeatMerge::SUM ? "sum" : "concat";
}

std::string_view to_string(ENormMethod norm) {
    return norm == ENormMethod::TOKENS ? "tokens" : "sents";
}

std::string_view to_string(EOptimMethod method) {
    return method == EOptimMethod::ADAM ? "adam" : "sgd";
}

std::string_view to_string(EDecayMethod method) {
    switch (method) {
        case EDecayMethod::NONE: return "none";
        case EDecayMethod::COSINE: return "cosine";
        case EDecayMethod::LINEAR: return "linear";
        case EDecayMethod::NOAM: return "noam";
    }
    return "unknown";
}

namespace {

template<typename Enum, typename Parse>
void assign_enum(Enum& target, const nlohmann::json& obj, const char* key, Parse parse) {
    if (auto name = get_opt<std::string>(obj, key)) target = parse(*name);
}

} // namespace

std::string_view to_string(EEncoderType type) {
    switch (type) {
        case EEncoderType::MEAN: return "mean";
        case EEncoderType::RNN: return "rnn";
    }
    return "unknown";
}

std::string_view to_string(EDecoderType type) {
    switch (type) {
        case EDecoderType::RNN: return "rnn";
        case EDecoderType::INPUT_FEED_RNN: return "ifrnn";
    }
    return "unknown";
}

std::string_view to_string(EGeneratorFunction type) {
    switch (type) {
        case EGeneratorFunction::SOFTMAX: return "softmax";
        case EGeneratorFunction::SPARSEMAX: return "sparsemax";
        case EGeneratorFunction::CONTINUOUS_LINEAR: return "continuous-linear";
        case EGeneratorFunction::CONTINUOUS_NONLINEAR: return "continuous-nonlinear";
    }
    return "unknown";
}

std::string_view to_string(EBiasPolicy policy) {
    switch (policy) {
        case EBiasPolicy::ZERO_EXCEPT_SPECIALS: return "zero-specials";
        case EBiasPolicy::DROP: return "drop";
        case EBiasPolicy::LANGUAGE_FILTERED: return "lang-filter";
    }
    return "unknown";
}

std::string_view to_string(EResetOptim policy) {
    switch (policy) {
        case EResetOptim::NONE: return "none";
        case EResetOptim::STATES: return "states";
        case EResetOptim::ALL: return "all";
    }
    return "unknown";
}

std::string_view to_string(EStoppingCriterion criterion) {
    return criterion == EStoppingCriterion::ACCURACY ? "accuracy" : "ppl";
}

bool is_continuous(EGeneratorFunction generator) {
    return generator == EGeneratorFunction::CONTINUOUS_LINEAR || generator == EGeneratorFunction::CONTINUOUS_NONLINEAR;
}

ModelOptions model_options_from_json(const nlohmann::json& json, ModelOptions opt) {
    assign_enum(opt.Encoder, json, "encoder_type", encoder_type_from_str);
    assign_enum(opt.Decoder, json, "decoder_type", decoder_type_from_str);
    assign(opt.InputFeed, get_opt<bool>(json, "input_feed"));
    if (auto size = get_opt<int>(json, "word_vec_size")) {
        opt.SrcWordVecSize = opt.TgtWordVecSize = *size;
    }
    assign(opt.SrcWordVecSize, get_opt<int>(json, "src_word_vec_size"));
    assign(opt.TgtWordVecSize, get_opt<int>(json, "tgt_word_vec_size"));
    if (auto size = get_opt<int>(json, "rnn_size")) {
        opt.EncRnnSize = opt.DecRnnSize = *size;
    }
    assign(opt.EncRnnSize, get_opt<int>(json, "enc_rnn_size"));
    assign(opt.DecRnnSize, get_opt<int>(json, "dec_rnn_size"));

    assign_enum(opt.FeatMerge, json, "feat_merge", feat_merge_from_str);
    assign(opt.FeatVecSize, get_opt<int>(json, "feat_vec_size"));
    assign(opt.FeatVecExponent, get_opt<float>(json, "feat_vec_exponent"));
    assign(opt.UseFeatEmb, get_opt<bool>(json, "use_feat_emb"));

    assign_enum(opt.Generator, json, "generator_function", generator_function_from_str);
    assign(opt.CopyAttn, get_opt<bool>(json, "copy_attn"));
    assign(opt.GeneratorLayerNorm, get_opt<bool>(json, "generator_layer_norm"));
    assign(opt.NoGeneratorBias, get_opt<bool>(json, "no_generator_bias"));
    assign(opt.Center, get_opt<bool>(json, "center"));

    assign(opt.ShareEmbeddings, get_opt<bool>(json, "share_embeddings"));
    assign(opt.ShareDecoderEmbeddings, get_opt<bool>(json, "share_decoder_embeddings"));
    assign(opt.FixWordVecsEnc, get_opt<bool>(json, "fix_word_vecs_enc"));
    assign(opt.FixWordVecsDec, get_opt<bool>(json, "fix_word_vecs_dec"));
    assign(opt.PreWordVecsEnc, get_opt<bool>(json, "pre_word_vecs_enc"));
    assign(opt.PreWordVecsDec, get_opt<bool>(json, "pre_word_vecs_dec"));

    assign(opt.ParamInit, get_opt<float>(json, "param_init"));
    assign(opt.ParamInitGlorot, get_opt<bool>(json, "param_init_glorot"));
    assign(opt.Dropout, get_list<float>(json, "dropout"));
    assign(opt.DropoutSteps, get_list<int>(json, "dropout_steps"));

    assign(opt.MultiTask, get_opt<bool>(json, "multi_task"));
    assign(opt.SecondaryTaskWeight, get_opt<float>(json, "secondary_task_weight"));
    assign(opt.DetachedEmbeddings, get_opt<bool>(json, "detached_embeddings"));
    assign(opt.DetachedEmbeddingRows, get_opt<int>(json, "detached_embedding_rows"));
    assign_enum(opt.ModelDType, json, "model_dtype", dtype_from_str);
    return opt;
}

TrainingOptions training_options_from_json(const nlohmann::json& json, TrainingOptions opt) {
    assign(opt.TrainSteps, get_opt<int>(json, "train_steps"));
    assign(opt.SinglePass, get_opt<bool>(json, "single_pass"));
    assign(opt.BatchSize, get_opt<int>(json, "batch_size"));
    assign(opt.Seed, get_opt<int>(json, "seed"));

    assign(opt.SaveModel, get_opt<std::string>(json, "save_model"));
    assign(opt.SaveCheckpointSteps, get_opt<int>(json, "save_checkpoint_steps"));
    assign(opt.KeepCheckpoint, get_opt<int>(json, "keep_checkpoint"));
    assign(opt.ValidSteps, get_opt<int>(json, "valid_steps"));
    assign(opt.ReportEvery, get_opt<int>(json, "report_every"));

    assign(opt.AccumCount, get_list<int>(json, "accum_count"));
    assign(opt.AccumSteps, get_list<int>(json, "accum_steps"));
    assign(opt.TruncatedDecoder, get_opt<int>(json, "truncated_decoder"));
    assign(opt.MaxGeneratorBatches, get_opt<int>(json, "max_generator_batches"));
    assign_enum(opt.Normalization, json, "normalization", norm_method_from_str);

    assign(opt.AverageDecay, get_opt<float>(json, "average_decay"));
    assign(opt.AverageEvery, get_opt<int>(json, "average_every"));
    assign(opt.EarlyStopping, get_opt<int>(json, "early_stopping"));
    if (auto names = get_list<std::string>(json, "early_stopping_criteria")) {
        opt.EarlyStoppingCriteria.clear();
        for (const auto& name : *names) opt.EarlyStoppingCriteria.push_back(stopping_criterion_from_str(name));
    }
    assign(opt.WorldSize, get_opt<int>(json, "world_size"));

    assign_enum(opt.Optim, json, "optim", optim_method_from_str);
    assign(opt.LearningRate, get_opt<float>(json, "learning_rate"));
    assign(opt.MaxGradNorm, get_opt<float>(json, "max_grad_norm"));
    assign(opt.AdamBeta1, get_opt<float>(json, "adam_beta1"));
    assign(opt.AdamBeta2, get_opt<float>(json, "adam_beta2"));
    assign_enum(opt.DecayMethod, json, "decay_method", decay_method_from_str);
    assign(opt.WarmupSteps, get_opt<int>(json, "warmup_steps"));
    assign(opt.FinalLrFraction, get_opt<float>(json, "final_lr_fraction"));
    assign_enum(opt.ResetOptim, json, "reset_optim", reset_optim_from_str);

    assign(opt.Denoise, get_opt<bool>(json, "denoise"));
    assign(opt.WordShuffle, get_opt<float>(json, "word_shuffle"));
    assign(opt.WordDropout, get_opt<float>(json, "word_dropout"));
    assign(opt.WordBlank, get_opt<float>(json, "word_blank"));

    assign(opt.TrainFrom, get_opt<std::string>(json, "train_from"));
    assign(opt.NewVocab, get_opt<std::string>(json, "new_vocab"));
    assign(opt.Langcode, get_opt<std::string>(json, "langcode"));
    assign(opt.UseLang, get_opt<std::string>(json, "use_lang"));
    assign_enum(opt.BiasPolicy, json, "bias_policy", bias_policy_from_str);
    assign(opt.SrcEmbeddings, get_opt<std::string>(json, "src_embeddings"));
    assign(opt.TgtEmbeddings, get_opt<std::string>(json, "tgt_embeddings"));

    assign(opt.TrainOnlySecTask, get_opt<bool>(json, "train_only_sec_task"));
    assign(opt.FreezeEncoder, get_opt<bool>(json, "freeze_encoder"));
    assign(opt.FreezeDecoder, get_opt<bool>(json, "freeze_decoder"));
    assign(opt.ModifyOpts, get_opt<bool>(json, "modify_opts"));
    assign(opt.LogFile, get_opt<std::string>(json, "log_file"));
    return opt;
}

nlohmann::json model_options_to_json(const ModelOptions& opt) {
    nlohmann::json json;
    json["encoder_type"] = to_string(opt.Encoder);
    json["decoder_type"] = to_string(opt.Decoder);
    json["input_feed"] = opt.InputFeed;
    json["src_word_vec_size"] = opt.SrcWordVecSize;
    json["tgt_word_vec_size"] = opt.TgtWordVecSize;
    json["enc_rnn_size"] = opt.EncRnnSize;
    json["dec_rnn_size"] = opt.DecRnnSize;
    json["feat_merge"] = to_string(opt.FeatMerge);
    json["feat_vec_size"] = opt.FeatVecSize;
    json["feat_vec_exponent"] = opt.FeatVecExponent;
    json["use_feat_emb"] = opt.UseFeatEmb;
    json["generator_function"] = to_string(opt.Generator);
    json["copy_attn"] = opt.CopyAttn;
    json["generator_layer_norm"] = opt.GeneratorLayerNorm;
    json["no_generator_bias"] = opt.NoGeneratorBias;
    json["center"] = opt.Center;
    json["share_embeddings"] = opt.ShareEmbeddings;
    json["share_decoder_embeddings"] = opt.ShareDecoderEmbeddings;
    json["fix_word_vecs_enc"] = opt.FixWordVecsEnc;
    json["fix_word_vecs_dec"] = opt.FixWordVecsDec;
    json["pre_word_vecs_enc"] = opt.PreWordVecsEnc;
    json["pre_word_vecs_dec"] = opt.PreWordVecsDec;
    json["param_init"] = opt.ParamInit;
    json["param_init_glorot"] = opt.ParamInitGlorot;
    json["dropout"] = opt.Dropout;
    json["dropout_steps"] = opt.DropoutSteps;
    json["multi_task"] = opt.MultiTask;
    json["secondary_task_weight"] = opt.SecondaryTaskWeight;
    json["detached_embeddings"] = opt.DetachedEmbeddings;
    json["detached_embedding_rows"] = opt.DetachedEmbeddingRows;
    json["model_dtype"] = dtype_to_str(opt.ModelDType);
    return json;
}

nlohmann::json training_options_to_json(const TrainingOptions& opt) {
    nlohmann::json json;
    json["train_steps"] = opt.TrainSteps;
    json["single_pass"] = opt.SinglePass;
    json["batch_size"] = opt.BatchSize;
    json["seed"] = opt.Seed;
    json["save_model"] = opt.SaveModel;
    json["save_checkpoint_steps"] = opt.SaveCheckpointSteps;
    json["keep_checkpoint"] = opt.KeepCheckpoint;
    json["valid_steps"] = opt.ValidSteps;
    json["report_every"] = opt.ReportEvery;
    json["accum_count"] = opt.AccumCount;
    json["accum_steps"] = opt.AccumSteps;
    json["truncated_decoder"] = opt.TruncatedDecoder;
    json["max_generator_batches"] = opt.MaxGeneratorBatches;
    json["normalization"] = to_string(opt.Normalization);
    json["average_decay"] = opt.AverageDecay;
    json["average_every"] = opt.AverageEvery;
    json["early_stopping"] = opt.EarlyStopping;
    std::vector<std::string> criteria;
    for (auto c : opt.EarlyStoppingCriteria) criteria.emplace_back(to_string(c));
    json["early_stopping_criteria"] = criteria;
    json["world_size"] = opt.WorldSize;
    json["optim"] = to_string(opt.Optim);
    json["learning_rate"] = opt.LearningRate;
    json["max_grad_norm"] = opt.MaxGradNorm;
    json["adam_beta1"] = opt.AdamBeta1;
    json["adam_beta2"] = opt.AdamBeta2;
    json["decay_method"] = to_string(opt.DecayMethod);
    json["warmup_steps"] = opt.WarmupSteps;
    json["final_lr_fraction"] = opt.FinalLrFraction;
    json["reset_optim"] = to_string(opt.ResetOptim);
    json["denoise"] = opt.Denoise;
    json["word_shuffle"] = opt.WordShuffle;
    json["word_dropout"] = opt.WordDropout;
    json["word_blank"] = opt.WordBlank;
    json["train_from"] = opt.TrainFrom;
    json["new_vocab"] = opt.NewVocab;
    json["langcode"] = opt.Langcode;
    json["use_lang"] = opt.UseLang;
    json["bias_policy"] = to_string(opt.BiasPolicy);
    json["src_embeddings"] = opt.SrcEmbeddings;
    json["tgt_embeddings"] = opt.TgtEmbeddings;
    json["train_only_sec_task"] = opt.TrainOnlySecTask;
    json["freeze_encoder"] = opt.FreezeEncoder;
    json["freeze_decoder"] = opt.FreezeDecoder;
    json["modify_opts"] = opt.ModifyOpts;
    json["log_file"] = opt.LogFile;
    return json;
}

/**
 * @brief Load run options from a JSON file.
 *
 * @param file_name Path to a JSON object with optional "model" and "training" sections.
 * @return Parsed options; not yet validated.
 *
 * @throws std::runtime_error If the file cannot be opened or parsed.
 * @throws config_error If an option has an invalid value.
 */
RunOptions load_run_config(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open config file {}", file_name));
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("could not parse config file {}: {}", file_name, e.what()));
    }

    RunOptions options;
    if (auto it = json.find("model"); it != json.end()) {
        options.Model = model_options_from_json(*it);
    }
    if (auto it = json.find("training"); it != json.end()) {
        options.Training = training_options_from_json(*it);
    }
    return options;
}

void save_run_config(const RunOptions& options, const std::string& file_name) {
    std::ofstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open file for writing {}", file_name));
    }
    nlohmann::json json;
    json["model"] = model_options_to_json(options.Model);
    json["training"] = training_options_to_json(options.Training);
    file << json.dump(4);
}

void validate_options(RunOptions& options) {
    const ModelOptions& m = options.Model;
    TrainingOptions& t = options.Training;

    if (m.SrcWordVecSize <= 0 || m.TgtWordVecSize <= 0 || m.EncRnnSize <= 0 || m.DecRnnSize <= 0) {
        throw config_error("Embedding and hidden sizes must be positive");
    }
    if (m.Dropout.empty() || m.Dropout.size() != m.DropoutSteps.size()) {
        throw config_error(fmt::format("Number of dropout values ({}) does not match number of dropout_steps ({})",
                                       m.Dropout.size(), m.DropoutSteps.size()));
    }
    for (float p : m.Dropout) {
        if (p < 0.f || p >= 1.f) throw config_error(fmt::format("Dropout {} out of range [0, 1)", p));
    }
    if (m.ShareEmbeddings && m.SrcWordVecSize != m.TgtWordVecSize) {
        throw config_error(fmt::format("share_embeddings requires src_word_vec_size ({}) == tgt_word_vec_size ({})",
                                       m.SrcWordVecSize, m.TgtWordVecSize));
    }
    if (m.ShareDecoderEmbeddings && !is_continuous(m.Generator) && m.TgtWordVecSize != m.DecRnnSize) {
        throw config_error(fmt::format("share_decoder_embeddings requires tgt_word_vec_size ({}) == dec_rnn_size ({})",
                                       m.TgtWordVecSize, m.DecRnnSize));
    }
    if (is_continuous(m.Generator) && m.ShareDecoderEmbeddings && m.PreWordVecsDec) {
        throw config_error("share_decoder_embeddings with pre_word_vecs_dec is not supported for continuous generators");
    }
    if (is_continuous(m.Generator) && m.CopyAttn) {
        throw config_error("copy_attn cannot be combined with a continuous generator");
    }
    if (m.DetachedEmbeddingRows <= 0) {
        throw config_error("detached_embedding_rows must be positive");
    }

    if (t.SinglePass) {
        t.TrainSteps = 0;
    }
    if (t.AccumCount.empty() || t.AccumCount.size() != t.AccumSteps.size()) {
        throw config_error(fmt::format("Number of accum_count values ({}) does not match number of accum_steps ({})",
                                       t.AccumCount.size(), t.AccumSteps.size()));
    }
    if (t.AccumSteps.front() != 0) {
        throw config_error("The first accum_steps entry must be 0");
    }
    for (int count : t.AccumCount) {
        if (count <= 0) throw config_error(fmt::format("accum_count must be positive, got {}", count));
        if (count > 1 && t.TruncatedDecoder > 0) {
            throw config_error("To enable accumulated gradients, you must disable target sequence truncating");
        }
    }
    if (t.TruncatedDecoder < 0 || t.MaxGeneratorBatches < 0) {
        throw config_error("truncated_decoder and max_generator_batches must not be negative");
    }
    if (t.AverageEvery < 1) throw config_error("average_every must be >= 1");
    if (t.AverageDecay < 0.f || t.AverageDecay >= 1.f) throw config_error("average_decay must be in [0, 1)");
    if (t.WorldSize < 1) throw config_error("world_size must be >= 1");
    if (t.BatchSize < 1) throw config_error("batch_size must be >= 1");
    if (t.ReportEvery < 1) throw config_error("report_every must be >= 1");
    if (t.WordDropout < 0.f || t.WordDropout >= 1.f) throw config_error("word_dropout must be in [0, 1)");
    if (t.WordBlank < 0.f || t.WordBlank >= 1.f) throw config_error("word_blank must be in [0, 1)");
    if (t.WordShuffle < 0.f) throw config_error("word_shuffle must not be negative");
    if (t.TrainOnlySecTask && !m.MultiTask) {
        throw config_error("train_only_sec_task requires multi_task");
    }
    if (!t.UseLang.empty() && t.TrainFrom.empty()) {
        throw config_error("use_lang requires train_from");
    }
}
