// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

namespace {

//! JSON string literal (quoted and escaped) for free-form text.
std::string json_quoted(std::string_view text) {
    return nlohmann::json(std::string(text)).dump();
}

} // namespace

/**
 * @brief Create a logger that writes a JSON array to @p file_name (rank 0 only).
 *
 * On rank 0, ensures the parent directory exists, opens the file for output,
 * and initializes it as a JSON array (writes "[ ... ]").
 *
 * @param file_name Output path for the JSON log; empty disables the file.
 * @param rank Worker rank; only rank 0 writes the JSON file and prints output.
 * @param verbosity Verbosity level controlling stdout printing.
 */
TrainingRunLogger::TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity) :
    mFileName(file_name), mRank(rank), mVerbosity(verbosity)
{
    if(mRank == 0 && !mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        mLogFile.open(mFileName, std::fstream::out);
        mLogFile << "[\n";
        mLogFile << "\n]\n";
    }
}

/**
 * @brief Destructor; closes the log file if open.
 */
TrainingRunLogger::~TrainingRunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

void TrainingRunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

/**
 * @brief Log the command line used to start the run (rank 0 only).
 *
 * @param argc Argument count.
 * @param argv Argument vector; expected to be @p argc entries.
 */
void TrainingRunLogger::log_cmd(int argc, const char** argv)
{
    if(mRank != 0) return;
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "step": 0, "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += json_quoted(argv[i]);
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Log configuration options (rank 0 only).
 *
 * Each option is written as a JSON log line and, in verbose mode, printed.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void TrainingRunLogger::log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options) {
    if(mRank != 0) return;

    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, json_quoted(v)));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
            if (mVerbosity >= VERBOSE) {
                printf("  %-28s %s\n", std::string(name).c_str(), fmt::format("{}", v).c_str());
            }
        };
        std::visit(log, value);
    }
}

/**
 * @brief Log a training report (rank 0 only).
 *
 * Updates running totals used to compute the train/valid gap at the next eval.
 *
 * @param step Optimizer step the report belongs to.
 * @param num_steps Step budget, 0 when unbounded.
 * @param xent Mean cross entropy per target token.
 * @param ppl Perplexity.
 * @param accuracy Token accuracy in percent.
 * @param lr Learning rate at @p step.
 * @param src_tokens Source tokens processed since the last report.
 * @param tgt_tokens Target tokens processed since the last report.
 * @param duration_ms Wall time since the last report.
 */
void TrainingRunLogger::log_step(int step, int num_steps, float xent, float ppl, float accuracy, float lr,
                                 long src_tokens, long tgt_tokens, int duration_ms)
{
    if(mRank != 0) return;
    mTotalTrainingLoss += xent;
    ++mTotalTrainingSteps;

    if(mVerbosity >= DEFAULT) {
        char trend = ' ';
        if (mPreviousLoss > 0) {
            if (xent < mPreviousLoss) {
                trend = '\\';
            } else if (xent > mPreviousLoss) {
                trend = '/';
            }
        }
        mPreviousLoss = xent;

        long tps = (duration_ms > 0) ? (1000ll * tgt_tokens / duration_ms) : 0;
        std::string progress = num_steps > 0 ? fmt::format("{:7d}/{:7d}", step, num_steps) : fmt::format("{:7d}", step);

        printf(":: step %s %c xent %6.4f | ppl %8.2f | acc %5.2f | lr %.3e | %5.1fk tgt tps | %5d ms\n",
               progress.c_str(), trend, xent, ppl, accuracy, lr, tps / 1000.0f, duration_ms);
        fflush(stdout);
    }
    log_line(fmt::format(R"(  {{"log": "step", "time": "{}", "step": {}, "xent": {}, "ppl": {}, "accuracy": {}, "lr": {}, "src_tokens": {}, "tgt_tokens": {}, "duration_ms": {}}})",
        std::chrono::system_clock::now(), step, xent, ppl, accuracy, lr, src_tokens, tgt_tokens, duration_ms));
}

/**
 * @brief Log a validation result (rank 0 only).
 *
 * Prints the gap to the mean training loss since the previous eval and resets it.
 *
 * @param step Optimizer step at which validation ran.
 * @param xent Validation cross entropy per target token.
 * @param ppl Validation perplexity.
 * @param accuracy Validation token accuracy in percent.
 * @param duration_ms Validation duration in milliseconds.
 */
void TrainingRunLogger::log_eval(int step, float xent, float ppl, float accuracy, int duration_ms)
{
    if(mRank != 0) return;
    if(mVerbosity >= QUIET) {
        float train_avg = static_cast<float>(mTotalTrainingLoss / std::max(mTotalTrainingSteps, 1));
        float gap = mTotalTrainingSteps > 0 ? xent - train_avg : 0.f;

        printf("\x1b[1m>> eval  step %7d       xent %6.4f | ppl %8.2f | acc %5.2f | gap %+7.4f | %5d ms\x1b[22m\n",
               step, xent, ppl, accuracy, gap, duration_ms);
        fflush(stdout);
    }
    mTotalTrainingLoss = 0;
    mTotalTrainingSteps = 0;
    log_line(fmt::format(R"(  {{"log": "eval", "time": "{}", "step": {}, "xent": {}, "ppl": {}, "accuracy": {}, "duration_ms": {}}})",
        std::chrono::system_clock::now(), step, xent, ppl, accuracy, duration_ms));
}

/**
 * @brief Record that a checkpoint was written or removed (rank 0 only).
 *
 * @param step Step of the checkpoint.
 * @param path File path.
 * @param action "save" or "remove".
 */
void TrainingRunLogger::log_checkpoint(int step, const std::string& path, std::string_view action) {
    if(mRank != 0) return;
    if(mVerbosity >= DEFAULT) {
        printf("[checkpoint] %s %s\n", std::string(action).c_str(), path.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "checkpoint", "time": "{}", "step": {}, "action": "{}", "path": {}}})",
                         std::chrono::system_clock::now(), step, action, json_quoted(path)));
}

/**
 * @brief Append a JSON object line to the log file and invoke the callback.
 *
 * Maintains a valid JSON array by rewriting the closing bracket each time.
 *
 * @param line JSON object line to append.
 */
void TrainingRunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    if(!mLogFile.is_open()) return;
    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

/**
 * @brief Log an informational message (rank 0 only).
 *
 * @param step Step associated with this message.
 * @param msg Message text.
 */
void TrainingRunLogger::log_message(int step, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= DEFAULT) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}}})",
                         std::chrono::system_clock::now(), step, json_quoted(msg)));
}

/**
 * @brief Log a warning (rank 0 only). Printed unless the logger is silent.
 *
 * @param step Step associated with this warning.
 * @param msg Message text.
 */
void TrainingRunLogger::log_warning(int step, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity > SILENT) {
        fprintf(stderr, "WARNING: %s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "warning", "time": "{}", "step": {}, "message": {}}})",
                         std::chrono::system_clock::now(), step, json_quoted(msg)));
}

/**
 * @brief Begin a timed logging section (rank 0 only).
 *
 * @param step Step associated with this section.
 * @param info Human-readable description printed to stdout and stored in JSON.
 * @return RAII_Section handle; on non-zero ranks, contains nullptr and is a no-op.
 */
TrainingRunLogger::RAII_Section TrainingRunLogger::log_section_start(int step, const std::string& info) {
    if(mRank != 0) return RAII_Section{nullptr};
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= DEFAULT) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

/**
 * @brief End the current timed section and emit its duration (rank 0 only).
 */
void TrainingRunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionStep, json_quoted(mSectionInfo), milliseconds));

    if(mVerbosity >= DEFAULT) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}
