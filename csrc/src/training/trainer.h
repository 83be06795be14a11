// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_TRAINER_H
#define NMTCORE_SRC_TRAINING_TRAINER_H

#include <memory>
#include <string>

#include "config/run_options.h"
#include "training/early_stopping.h"
#include "training/loss.h"
#include "training/moving_average.h"
#include "training/noise.h"
#include "training/schedule.h"
#include "training/statistics.h"

namespace models {
class NMTModel;
}

class Communicator;
class IBatchSource;
class ModelSaver;
class Optimizer;
class TrainingRunLogger;

enum class ETrainerState {
    ACCUMULATING,
    STEPPING,
    VALIDATING,
    EARLY_STOPPED,
    DONE,
};

enum class EExitReason {
    STEP_BUDGET,
    EARLY_STOPPED,
    INPUT_EXHAUSTED,
};

std::string_view to_string(EExitReason reason);

struct TrainResult {
    EExitReason Reason = EExitReason::INPUT_EXHAUSTED;
    int LastStep = 0;
    Statistics Stats;
};

//! Result of one truncation window; a failed window carries the error message.
struct WindowOutcome {
    bool Ok = true;
    std::string Error;
    Statistics Stats;
};

/**
 * @brief Training loop of one worker.
 *
 * Groups batches for gradient accumulation, runs every batch in truncated decoder
 * windows, steps the optimizer, keeps the moving average, validates, consults early
 * stopping and saves checkpoints. With more than one worker, every rank runs its own
 * Trainer; the normalization and the gradients are summed over all ranks, so all ranks
 * must process the same number of groups and windows.
 */
class Trainer {
public:
    /**
     * @brief Set up the loop.
     *
     * @param saver Checkpoint writer; nullptr on ranks that do not save.
     * @param train_loss Loss used for training windows; defaults to LossCompute.
     * @param valid_loss Loss used for validation; defaults to LossCompute in eval mode.
     * @throws config_error If accumulation counts are not positive, accumulation is combined
     *         with decoder truncation, or step lists and value lists differ in length.
     */
    Trainer(models::NMTModel& model, Optimizer& optim, const TrainingOptions& training, Communicator& comm,
            TrainingRunLogger& logger, ModelSaver* saver = nullptr,
            std::unique_ptr<ILossCompute> train_loss = nullptr,
            std::unique_ptr<ILossCompute> valid_loss = nullptr);

    /**
     * @brief Run the training loop.
     *
     * @param train_steps Stop once this step was reached; 0 trains until the input is exhausted.
     * @param save_checkpoint_steps Save every this many steps; 0 only saves at the end.
     * @param valid_iter Restartable validation source; nullptr disables validation.
     * @param valid_steps Validate every this many steps.
     */
    TrainResult train(IBatchSource& train_iter, int train_steps, int save_checkpoint_steps,
                      IBatchSource* valid_iter = nullptr, int valid_steps = 10000);

    //! Statistics of one pass over @p valid_iter with the averaged weights swapped in.
    Statistics validate(IBatchSource& valid_iter);

    [[nodiscard]] ETrainerState state() const { return mState; }
    [[nodiscard]] int accum_count(int step) const { return mAccumSchedule.eval(step); }
    [[nodiscard]] const MovingAverage* moving_average() const { return mMovingAverage.get(); }
    [[nodiscard]] const EarlyStopping* early_stopper() const { return mEarlyStopper.get(); }

private:
    void maybe_update_dropout(int step);
    float normalization(const std::vector<Batch>& batches);
    void gradient_accumulation(std::vector<Batch>& batches, float normalization, Statistics& total_stats,
                               Statistics& report_stats);
    WindowOutcome run_window(const Batch& batch, int begin, int length, bool bptt, float normalization);
    void reduce_gradients();
    void prepare_batch(Batch& batch);

    models::NMTModel* mModel;
    Optimizer* mOptim;
    TrainingOptions mOptions;
    Communicator* mComm;
    TrainingRunLogger* mLogger;
    ModelSaver* mSaver;
    std::unique_ptr<ILossCompute> mTrainLoss;
    std::unique_ptr<ILossCompute> mValidLoss;

    StepwiseSchedule<int> mAccumSchedule;
    StepwiseSchedule<float> mDropoutSchedule;
    ETensorDType mModelDType;
    bool mUseFeatEmb;
    std::unique_ptr<MovingAverage> mMovingAverage;
    std::unique_ptr<EarlyStopping> mEarlyStopper;
    NoiseGenerator mNoise;
    ReportManager mReportManager;

    ETrainerState mState = ETrainerState::ACCUMULATING;
};

#endif //NMTCORE_SRC_TRAINING_TRAINER_H
