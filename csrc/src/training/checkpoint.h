// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_TRAINING_CHECKPOINT_H
#define NMTCORE_SRC_TRAINING_CHECKPOINT_H

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "config/run_options.h"
#include "training/optimizer.h"
#include "training/vocab.h"
#include "utilities/safetensors.h"

namespace models {
class NMTModel;
}
class MovingAverage;
class TrainingRunLogger;

inline constexpr const char* CHECKPOINT_FORMAT = "nmtcore-checkpoint";
inline constexpr int CHECKPOINT_VERSION = 1;

/**
 * @brief Everything persisted at a training step.
 *
 * ModelState holds the parameters outside the generators under their full names;
 * Generator and SecondaryGenerator hold theirs with the section prefix stripped.
 */
struct Checkpoint {
    int Step = 0;
    ModelOptions Model;
    TrainingOptions Training;
    VocabularySet Vocab;
    TensorMap ModelState;
    TensorMap Generator;
    std::optional<TensorMap> SecondaryGenerator;
    std::optional<OptimizerState> Optim;
};

//! "{base}_step_{step}.pt", or "{base}_sec_step_{step}.pt" for secondary-task-only runs.
std::string get_checkpoint_path(const std::string& base_path, int step, bool only_sec = false);

//! Write @p checkpoint to @p file_name, creating the parent directory if needed.
void write_checkpoint(const Checkpoint& checkpoint, const std::string& file_name);

/**
 * @brief Read a checkpoint file.
 * @throws checkpoint_error If the file cannot be read or is not a supported checkpoint.
 */
Checkpoint load_checkpoint(const std::string& file_name);

//! Lists the steps of all "{base}_step_{N}.pt" files.
std::vector<int> get_all_checkpoints(const std::string& base_path);

//! Path of the checkpoint with the highest step, std::nullopt if there is none.
std::optional<std::string> find_latest_checkpoint(const std::string& base_path);

/**
 * @brief Writes checkpoints of a training run and enforces the retention bound.
 *
 * keep_checkpoint == 0 disables saving, a negative bound keeps every checkpoint, and a
 * positive bound K keeps the K most recent files: once K paths are queued, the oldest
 * is removed from the queue and from disk before the new one is admitted.
 */
class ModelSaver {
public:
    ModelSaver(std::string base_path, models::NMTModel& model, const VocabularySet& vocab,
               const TrainingOptions& training, const Optimizer& optim, TrainingRunLogger& logger);

    /**
     * @brief Save the state at @p step.
     *
     * When @p moving_average is given, the averaged weights are swapped in while the
     * checkpoint is assembled and swapped back afterwards.
     *
     * @return The written path; std::nullopt when saving is disabled or @p step was
     *         already saved.
     * @throws checkpoint_error On I/O errors.
     */
    std::optional<std::string> save(int step, const MovingAverage* moving_average = nullptr);

    //! Assemble the checkpoint of the current model state without writing it.
    [[nodiscard]] Checkpoint make_checkpoint(int step) const;

    [[nodiscard]] const std::deque<std::string>& checkpoint_queue() const { return mQueue; }
    [[nodiscard]] std::optional<int> last_saved_step() const { return mLastSavedStep; }

private:
    std::string mBasePath;
    models::NMTModel* mModel;
    const VocabularySet* mVocab;
    const TrainingOptions* mTraining;
    const Optimizer* mOptim;
    TrainingRunLogger* mLogger;

    int mKeepCheckpoint;
    std::optional<int> mLastSavedStep;
    std::deque<std::string> mQueue;
};

#endif //NMTCORE_SRC_TRAINING_CHECKPOINT_H
