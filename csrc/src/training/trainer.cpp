// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "trainer.h"

#include <algorithm>
#include <optional>

#include <fmt/core.h>

#include "models/nmt_model.h"
#include "training/checkpoint.h"
#include "training/dataloader.h"
#include "training/logging.h"
#include "training/optimizer.h"
#include "utilities/comm.h"
#include "utilities/utils.h"

namespace {

StepwiseSchedule<int> make_accum_schedule(const TrainingOptions& options) {
    if (options.AccumCount.size() != options.AccumSteps.size()) {
        throw config_error(fmt::format("accum_count has {} entries but accum_steps has {}",
                                       options.AccumCount.size(), options.AccumSteps.size()));
    }
    for (int count : options.AccumCount) {
        if (count <= 0) {
            throw config_error(fmt::format("accum_count must be positive, got {}", count));
        }
        if (count > 1 && options.TruncatedDecoder > 0) {
            throw config_error("To enable accumulated gradients, you must disable target sequence truncating");
        }
    }
    return {options.AccumSteps, options.AccumCount};
}

StepwiseSchedule<float> make_dropout_schedule(const ModelOptions& options) {
    if (options.Dropout.size() != options.DropoutSteps.size()) {
        throw config_error(fmt::format("dropout has {} entries but dropout_steps has {}",
                                       options.Dropout.size(), options.DropoutSteps.size()));
    }
    return {options.DropoutSteps, options.Dropout};
}

//! Puts the model back into training mode when validation ends.
class TrainModeRestore {
public:
    explicit TrainModeRestore(models::NMTModel& model) : mModel(model) {}
    ~TrainModeRestore() { mModel.train(); }

    TrainModeRestore(const TrainModeRestore&) = delete;
    TrainModeRestore& operator=(const TrainModeRestore&) = delete;

private:
    models::NMTModel& mModel;
};

} // namespace

std::string_view to_string(EExitReason reason) {
    switch (reason) {
        case EExitReason::STEP_BUDGET: return "step-budget";
        case EExitReason::EARLY_STOPPED: return "early-stopped";
        case EExitReason::INPUT_EXHAUSTED: return "input-exhausted";
    }
    throw std::logic_error(fmt::format("Unknown EExitReason {}. This is a programming error.", static_cast<int>(reason)));
}

Trainer::Trainer(models::NMTModel& model, Optimizer& optim, const TrainingOptions& training, Communicator& comm,
                 TrainingRunLogger& logger, ModelSaver* saver, std::unique_ptr<ILossCompute> train_loss,
                 std::unique_ptr<ILossCompute> valid_loss) :
    mModel(&model), mOptim(&optim), mOptions(training), mComm(&comm), mLogger(&logger), mSaver(saver),
    mTrainLoss(std::move(train_loss)), mValidLoss(std::move(valid_loss)),
    mAccumSchedule(make_accum_schedule(training)),
    mDropoutSchedule(make_dropout_schedule(model.options())),
    mModelDType(model.options().ModelDType),
    mUseFeatEmb(model.options().UseFeatEmb),
    mNoise(static_cast<unsigned>(training.Seed + comm.rank())),
    mReportManager(training.ReportEvery, logger, &comm)
{
    if (!mTrainLoss) {
        mTrainLoss = std::make_unique<LossCompute>(model, true);
    }
    if (!mValidLoss) {
        mValidLoss = std::make_unique<LossCompute>(model, false);
    }
    if (training.AverageDecay > 0.f) {
        mMovingAverage = std::make_unique<MovingAverage>(training.AverageDecay);
    }
    if (training.EarlyStopping > 0) {
        mEarlyStopper = std::make_unique<EarlyStopping>(training.EarlyStopping, training.EarlyStoppingCriteria);
    }
}

void Trainer::maybe_update_dropout(int step) {
    if (auto p = mDropoutSchedule.changed_at(step)) {
        mModel->update_dropout(*p);
        mLogger->log_message(step, fmt::format("Updated dropout to {} from step {}", *p, step));
    }
}

float Trainer::normalization(const std::vector<Batch>& batches) {
    long total = 0;
    for (const Batch& batch : batches) {
        total += mOptions.Normalization == ENormMethod::TOKENS ? batch.num_tgt_tokens() : batch.BatchSize;
    }
    if (mComm->world_size() > 1) {
        total = mComm->all_reduce_sum(total);
    }
    return static_cast<float>(total);
}

void Trainer::prepare_batch(Batch& batch) {
    if (mOptions.Denoise) {
        mNoise.add_noise(batch, mOptions.WordShuffle, mOptions.WordDropout);
    }
}

void Trainer::reduce_gradients() {
    if (mComm->world_size() <= 1) return;
    modules::ParameterStore& params = mModel->params();
    for (int slot : params.trainable_parameters()) {
        Tensor& grad = params.grad(slot);
        mComm->all_reduce_sum(grad.data(), grad.nelem());
    }
}

/**
 * @brief Forward, loss and backward of one decoder window.
 *
 * Only the loss and its backward pass are recoverable; an exception there turns into a
 * failed outcome. The forward pass is not guarded, errors in it abort training.
 */
WindowOutcome Trainer::run_window(const Batch& batch, int begin, int length, bool bptt, float normalization) {
    models::NMTModel::WindowOutput out = mModel->forward(batch, begin, length, bptt);
    WindowOutcome outcome;
    try {
        LossOutput loss = mTrainLoss->compute(batch, out.DecOut, out.Attention, normalization,
                                              mOptions.MaxGeneratorBatches, begin, length);
        if (loss.Result) {
            mOptim->backward(*loss.Result);
        }
        outcome.Stats = loss.Stats;
    } catch (const std::exception& e) {
        outcome.Ok = false;
        outcome.Error = e.what();
    }
    return outcome;
}

void Trainer::gradient_accumulation(std::vector<Batch>& batches, float normalization, Statistics& total_stats,
                                    Statistics& report_stats) {
    const int count = static_cast<int>(batches.size());
    if (count > 1) {
        mOptim->zero_grad();
    }

    for (int k = 0; k < count; ++k) {
        Batch& batch = batches[k];
        prepare_batch(batch);
        const long src_words = batch.num_src_tokens();
        report_stats.NSrcWords += src_words;
        total_stats.NSrcWords += src_words;

        // the multilingual tag of the first target position is the one of the first word
        if (mUseFeatEmb && batch.Tgt.Feats > 1 && batch.Tgt.Len > 1) {
            for (int b = 0; b < batch.Tgt.Batch; ++b) {
                batch.Tgt.at(0, b, 1) = batch.Tgt.at(1, b, 1);
            }
        }

        const int target_size = batch.Tgt.Len - 1;
        const int trunc = mOptions.TruncatedDecoder > 0 ? mOptions.TruncatedDecoder : target_size;
        bool bptt = false;
        for (int j = 0; j < target_size; j += trunc) {
            const int length = std::min(trunc, target_size - j);
            if (count == 1) {
                mState = ETrainerState::ACCUMULATING;
                mOptim->zero_grad();
            }

            WindowOutcome outcome = run_window(batch, j, length, bptt, normalization);
            bptt = true;
            if (outcome.Ok) {
                total_stats.update(outcome.Stats);
                report_stats.update(outcome.Stats);
            } else {
                mLogger->log_warning(mOptim->training_step(), fmt::format("At step {}, we removed a batch - accum {}",
                                                                          mOptim->training_step(), k));
                mLogger->log_message(mOptim->training_step(), outcome.Error);
            }

            // the optimizer steps even after a failed window so that all ranks reach the same collectives
            if (count == 1) {
                mState = ETrainerState::STEPPING;
                reduce_gradients();
                mOptim->step();
            }
        }
        mModel->detach_state();
    }

    if (count > 1) {
        mState = ETrainerState::STEPPING;
        reduce_gradients();
        mOptim->step();
    }
}

TrainResult Trainer::train(IBatchSource& train_iter, int train_steps, int save_checkpoint_steps,
                           IBatchSource* valid_iter, int valid_steps) {
    if (valid_iter) {
        mLogger->log_message(mOptim->training_step(), fmt::format("Start training loop and validate every {} steps", valid_steps));
    } else {
        mLogger->log_message(mOptim->training_step(), "Start training loop without validation");
    }

    TrainResult result;
    Statistics report_stats;
    mModel->train();
    mState = ETrainerState::ACCUMULATING;

    int group_index = 0;
    bool ran_step = false;
    while (true) {
        const int step = mOptim->training_step();

        std::vector<Batch> batches;
        const int count = mAccumSchedule.eval(step);
        while (static_cast<int>(batches.size()) < count) {
            std::optional<Batch> batch = train_iter.next();
            if (!batch) break;
            batches.push_back(std::move(*batch));
        }
        if (batches.empty()) {
            result.Reason = EExitReason::INPUT_EXHAUSTED;
            break;
        }

        maybe_update_dropout(step);
        const float norm = normalization(batches);
        gradient_accumulation(batches, norm, result.Stats, report_stats);
        ran_step = true;
        result.LastStep = step;

        if (mMovingAverage && group_index % std::max(mOptions.AverageEvery, 1) == 0) {
            mMovingAverage->update(mModel->params(), step);
        }
        ++group_index;

        report_stats = mReportManager.report_training(step, train_steps, mOptim->learning_rate(), report_stats);

        if (valid_iter && valid_steps > 0 && step % valid_steps == 0) {
            Statistics valid_stats = validate(*valid_iter);
            mReportManager.report_step(mOptim->learning_rate(), step, nullptr, &valid_stats);
            if (mEarlyStopper) {
                mEarlyStopper->update(valid_stats, step, *mLogger);
                if (mEarlyStopper->has_stopped()) {
                    mState = ETrainerState::EARLY_STOPPED;
                    result.Reason = EExitReason::EARLY_STOPPED;
                    break;
                }
            }
        }

        if (mSaver && save_checkpoint_steps != 0 && step % save_checkpoint_steps == 0) {
            mSaver->save(step, mMovingAverage.get());
        }

        if (train_steps > 0 && step >= train_steps) {
            result.Reason = EExitReason::STEP_BUDGET;
            break;
        }
    }

    // an exhausted source leaves the optimizer one step ahead of the last group
    if (mSaver && ran_step) {
        mSaver->save(result.LastStep, mMovingAverage.get());
    }
    if (mState != ETrainerState::EARLY_STOPPED) {
        mState = ETrainerState::DONE;
    }
    mLogger->log_message(result.LastStep, fmt::format("Training finished ({})", to_string(result.Reason)));
    return result;
}

Statistics Trainer::validate(IBatchSource& valid_iter) {
    const ETrainerState previous = mState;
    mState = ETrainerState::VALIDATING;
    valid_iter.reset();

    Statistics stats;
    {
        // destroyed in reverse order: the live weights come back before training mode
        TrainModeRestore train_mode(*mModel);
        AverageSwapGuard average(mModel->params(), mMovingAverage.get(), mModelDType);
        models::NoGradGuard no_grad(*mModel);
        mModel->eval();
        while (std::optional<Batch> batch = valid_iter.next()) {
            prepare_batch(*batch);
            if (!mUseFeatEmb) {
                batch->Tgt = batch->Tgt.first_features(1);
            }
            const int length = batch->Tgt.Len - 1;
            if (length <= 0) continue;
            models::NMTModel::WindowOutput out = mModel->forward(*batch, 0, length, false);
            LossOutput loss = mValidLoss->compute(*batch, out.DecOut, out.Attention, 1.f, 0, 0, length);
            stats.update(loss.Stats);
            stats.NSrcWords += batch->num_src_tokens();
            mModel->detach_state();
        }
    }

    if (mComm->world_size() > 1) {
        stats = all_gather_stats(stats, *mComm);
    }
    mState = previous;
    return stats;
}
