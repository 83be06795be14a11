// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "config/run_options.h"
#include "models/model_builder.h"
#include "models/nmt_model.h"
#include "models/vocab_migration.h"
#include "models/weight_mapping.h"
#include "training/checkpoint.h"
#include "training/dataloader.h"
#include "training/logging.h"
#include "training/optimizer.h"
#include "training/trainer.h"
#include "training/vocab.h"
#include "utilities/comm.h"
#include "utilities/utils.h"

struct TrainingRunner {
    /// JSON file with the "model" and "training" sections.
    std::string ConfigFile;
    /// Vocabulary container; not needed when resuming, the checkpoint carries its vocabulary.
    std::string VocabFile;
    std::string TrainSrc;
    std::string TrainTgt;
    std::string ValidSrc;
    std::string ValidTgt;

    // command line overrides of the config file
    std::optional<int> TrainSteps;
    std::optional<std::string> SaveModel;
    std::optional<int> WorldSize;
    std::optional<std::string> LogFile;
    std::optional<std::string> TrainFrom;

    TrainingRunLogger::EVerbosity Verbosity = TrainingRunLogger::DEFAULT;

    RunOptions Options;

    /**
     * @brief Parse CLI flags, read the config file and apply the overrides.
     * @throws config_error If the resulting options are inconsistent.
     */
    void load_training_config(int argc, const char** argv);

    //! Run one training worker per rank and wait for all of them.
    void launch_training(int argc, const char** argv);

    /**
     * @brief Everything one rank does: model assembly or resume, then the training loop.
     * @param comm Communicator of this rank.
     */
    void run_training(int argc, const char** argv, Communicator& comm);

    /**
     * @brief Load the resume checkpoint and apply vocabulary changes to it.
     *
     * Handles use_lang (target subsetting), new_vocab, and src/tgt_embeddings, in that
     * order of precedence. The returned checkpoint carries the vocabulary to train with.
     */
    Checkpoint load_resume_checkpoint(TrainingRunLogger& logger) const;
};

void TrainingRunner::load_training_config(int argc, const char** argv) {
    CLI::App app{"Train a sequence-to-sequence translation model"};

    const std::map<std::string, TrainingRunLogger::EVerbosity> verbosity_map{
        {"silent", TrainingRunLogger::SILENT},
        {"quiet", TrainingRunLogger::QUIET},
        {"default", TrainingRunLogger::DEFAULT},
        {"verbose", TrainingRunLogger::VERBOSE},
    };

    app.add_option("--config", ConfigFile, "JSON run configuration")->required()->check(CLI::ExistingFile);
    app.add_option("--vocab", VocabFile, "Vocabulary file; required unless --train-from is given")->check(CLI::ExistingFile);
    app.add_option("--train-src", TrainSrc, "Tokenized source side of the training corpus")->required()->check(CLI::ExistingFile);
    app.add_option("--train-tgt", TrainTgt, "Tokenized target side of the training corpus")->required()->check(CLI::ExistingFile);
    auto valid_src = app.add_option("--valid-src", ValidSrc, "Tokenized source side of the validation corpus")->check(CLI::ExistingFile);
    app.add_option("--valid-tgt", ValidTgt, "Tokenized target side of the validation corpus")->check(CLI::ExistingFile)->needs(valid_src);
    valid_src->needs("--valid-tgt");

    app.add_option("--train-steps", TrainSteps, "Number of training steps; overrides the config file")->check(CLI::NonNegativeNumber);
    app.add_option("--save-model", SaveModel, "Checkpoint path prefix; overrides the config file");
    app.add_option("--world-size", WorldSize, "Number of training workers")->check(CLI::PositiveNumber);
    app.add_option("--log-file", LogFile, "Where to save the training log");
    app.add_option("--train-from", TrainFrom, "Resume from this checkpoint")->check(CLI::ExistingFile);
    app.add_option("--verbosity", Verbosity, "Console verbosity: silent, quiet, default or verbose")
        ->transform(CLI::CheckedTransformer(verbosity_map, CLI::ignore_case));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    Options = load_run_config(ConfigFile);
    TrainingOptions& training = Options.Training;
    if (TrainSteps) training.TrainSteps = *TrainSteps;
    if (SaveModel) training.SaveModel = *SaveModel;
    if (WorldSize) training.WorldSize = *WorldSize;
    if (LogFile) training.LogFile = *LogFile;
    if (TrainFrom) training.TrainFrom = *TrainFrom;

    if (training.TrainFrom.empty() && VocabFile.empty()) {
        throw config_error("--vocab is required when not resuming from a checkpoint");
    }
    validate_options(Options);
}

void TrainingRunner::launch_training(int argc, const char** argv) {
    Communicator::run_communicators(Options.Training.WorldSize,
                                    [&](Communicator& comm) { run_training(argc, argv, comm); });
}

Checkpoint TrainingRunner::load_resume_checkpoint(TrainingRunLogger& logger) const {
    const TrainingOptions& training = Options.Training;
    Checkpoint checkpoint = [&] {
        auto section = logger.log_section_start(0, fmt::format("Loading checkpoint from `{}`", training.TrainFrom));
        return load_checkpoint(training.TrainFrom);
    }();

    if (training.ModifyOpts) {
        checkpoint.Model = Options.Model;
    }
    if (int renamed = models::fix_checkpoint_keys(checkpoint); renamed > 0) {
        logger.log_message(0, fmt::format("Renamed {} legacy checkpoint keys", renamed));
    }

    const VocabularySet old_vocab = checkpoint.Vocab;
    if (!training.UseLang.empty()) {
        VocabularySet subset = models::subset_target_language(old_vocab, training.UseLang, checkpoint.ModelState);
        logger.log_message(0, fmt::format("Target vocabulary reduced to language '{}': {} tokens",
                                          training.UseLang, subset.Tgt.Words.size()));
        checkpoint = models::migrate_vocabulary(std::move(subset), std::move(checkpoint), training, &old_vocab, logger);
    } else if (!training.NewVocab.empty()) {
        VocabularySet new_vocab = load_vocab_file(training.NewVocab);
        checkpoint = models::migrate_vocabulary(std::move(new_vocab), std::move(checkpoint), training, &old_vocab, logger);
    } else if (!training.SrcEmbeddings.empty() || !training.TgtEmbeddings.empty()) {
        VocabularySet new_vocab = old_vocab;
        if (!training.SrcEmbeddings.empty()) {
            models::set_vocab_from_embeddings(new_vocab, "src", training.SrcEmbeddings, checkpoint.ModelState);
        }
        if (!training.TgtEmbeddings.empty()) {
            models::set_vocab_from_embeddings(new_vocab, "tgt", training.TgtEmbeddings, checkpoint.ModelState);
        }
        checkpoint = models::migrate_vocabulary(std::move(new_vocab), std::move(checkpoint), training, &old_vocab, logger);
    }
    return checkpoint;
}

void TrainingRunner::run_training(int argc, const char** argv, Communicator& comm) {
    const TrainingOptions& training = Options.Training;
    auto setup_start = std::chrono::steady_clock::now();

    TrainingRunLogger logger(training.LogFile, comm.rank(), Verbosity);
    logger.log_cmd(argc, argv);
    logger.log_options({
        {"config",            ConfigFile},
        {"train-steps",       static_cast<std::int64_t>(training.TrainSteps)},
        {"batch-size",        static_cast<std::int64_t>(training.BatchSize)},
        {"world-size",        static_cast<std::int64_t>(training.WorldSize)},
        {"save-model",        training.SaveModel},
        {"save-every",        static_cast<std::int64_t>(training.SaveCheckpointSteps)},
        {"keep-checkpoint",   static_cast<std::int64_t>(training.KeepCheckpoint)},
        {"valid-steps",       static_cast<std::int64_t>(training.ValidSteps)},
        {"truncated-decoder", static_cast<std::int64_t>(training.TruncatedDecoder)},
        {"learning-rate",     training.LearningRate},
        {"max-grad-norm",     training.MaxGradNorm},
        {"average-decay",     training.AverageDecay},
        {"early-stopping",    static_cast<std::int64_t>(training.EarlyStopping)},
        {"denoise",           training.Denoise},
        {"train-from",        training.TrainFrom},
        {"seed",              static_cast<std::int64_t>(training.Seed)},
    });

    std::optional<Checkpoint> checkpoint;
    VocabularySet vocab;
    ModelOptions model_options = Options.Model;
    if (!training.TrainFrom.empty()) {
        checkpoint = load_resume_checkpoint(logger);
        model_options = checkpoint->Model;
        vocab = checkpoint->Vocab;
    } else {
        vocab = load_vocab_file(VocabFile);
    }
    logger.log_message(0, fmt::format(" * src vocab size = {}", vocab.Src.Words.size()));
    logger.log_message(0, fmt::format(" * tgt vocab size = {}", vocab.Tgt.Words.size()));

    // every rank builds its replica from the same seed
    std::unique_ptr<models::NMTModel> model = models::build_model(model_options, vocab, checkpoint ? &*checkpoint : nullptr,
                                                                  logger, static_cast<unsigned>(training.Seed));
    models::apply_freezing(*model, training, logger);
    models::log_parameter_tally(*model, logger);

    Optimizer optim(model->params(), training, make_lr_schedule(training, model_options.DecRnnSize));
    if (checkpoint && checkpoint->Optim) {
        if (training.TrainOnlySecTask) {
            logger.log_message(0, "train_only_sec_task is set; the stored optimizer state is not restored");
        } else {
            optim.load_state_dict(*checkpoint->Optim);
            logger.log_message(0, fmt::format("Restored optimizer state at step {}", optim.training_step()));
        }
    }
    // the vocabulary vectors and tensors are not needed anymore
    checkpoint.reset();

    ParallelTextLoader train_iter(TrainSrc, TrainTgt, vocab, training.BatchSize, comm.rank(), comm.world_size(),
                                  !training.SinglePass, static_cast<unsigned long>(training.Seed));
    std::unique_ptr<ParallelTextLoader> valid_iter;
    if (!ValidSrc.empty()) {
        valid_iter = std::make_unique<ParallelTextLoader>(ValidSrc, ValidTgt, vocab, training.BatchSize, comm.rank(),
                                                          comm.world_size(), false, static_cast<unsigned long>(training.Seed));
    }
    logger.log_message(0, fmt::format("Training corpus: {} examples, {} batches per epoch and rank",
                                      train_iter.num_examples(), train_iter.batches_per_epoch()));

    std::unique_ptr<ModelSaver> saver;
    if (comm.rank() == 0) {
        saver = std::make_unique<ModelSaver>(training.SaveModel, *model, vocab, training, optim, logger);
    }

    Trainer trainer(*model, optim, training, comm, logger, saver.get());
    logger.log_message(0, fmt::format("Setup took {} seconds",
                                      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - setup_start).count()));

    TrainResult result = trainer.train(train_iter, training.TrainSteps, training.SaveCheckpointSteps,
                                       valid_iter.get(), training.ValidSteps);
    logger.log_message(result.LastStep, fmt::format("Exit reason: {} after step {}, train ppl {:.4f}, acc {:.2f}",
                                                    to_string(result.Reason), result.LastStep,
                                                    result.Stats.ppl(), result.Stats.accuracy()));
}

int main(int argc, const char** argv) {
    try {
        TrainingRunner runner;
        runner.load_training_config(argc, argv);
        runner.launch_training(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
