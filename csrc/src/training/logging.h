// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_TRAINING_LOGGING_H
#define NMTCORE_TRAINING_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Structured event log of one training run.
 *
 * Every component that reports events receives the logger explicitly. Only rank 0
 * writes: the log file is a JSON array with one object per line, and a short
 * human readable form goes to stdout depending on the verbosity.
 */
class TrainingRunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    //! An empty @p file_name disables the JSON file, console output is unaffected.
    TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity);
    ~TrainingRunLogger();

    TrainingRunLogger(const TrainingRunLogger&) = delete;
    TrainingRunLogger& operator=(const TrainingRunLogger&) = delete;

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options);
    void log_step(int step, int num_steps, float xent, float ppl, float accuracy, float lr,
                  long src_tokens, long tgt_tokens, int duration_ms);
    void log_eval(int step, float xent, float ppl, float accuracy, int duration_ms);
    void log_checkpoint(int step, const std::string& path, std::string_view action);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(TrainingRunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        TrainingRunLogger* mLogger;

        friend class TrainingRunLogger;
    };

    void log_message(int step, const std::string& msg);
    void log_warning(int step, const std::string& msg);
    RAII_Section log_section_start(int step, const std::string& info);
    void log_section_end();

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }

private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    int mRank;
    EVerbosity mVerbosity;

    // running mean for training loss since the last eval
    double mTotalTrainingLoss = 0.0;
    int mTotalTrainingSteps = 0;
    float mPreviousLoss = -1.f;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we safe intermediaries
    std::string mSectionInfo;
    int mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

#endif //NMTCORE_TRAINING_LOGGING_H
