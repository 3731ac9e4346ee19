/**
 * @file fake_sandbox_driver.hpp
 * @brief In-memory SandboxDriver for orchestrator tests
 *
 * Records every call, returns scripted outputs and can be told to fail at
 * any step or to hang inside Run() until the sandbox is killed.
 *
 * @date 2025
 */

#pragma once

#include "coderun/core/execution_errors.hpp"
#include "coderun/sandbox/sandbox_driver.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace coderun {
namespace test {

class FakeSandboxDriver : public sandbox::SandboxDriver {
public:
    enum class FailAt { NONE, CREATE, INJECT, COMPILE, RUN };

    // ------------------------------------------------------------------
    // Scripting
    // ------------------------------------------------------------------

    /// Outputs returned by successive Run() calls; exit 0 once exhausted.
    void QueueOutput(const sandbox::RunOutput& output) {
        std::lock_guard<std::mutex> lock(mutex_);
        outputs_.push_back(output);
    }

    /// Computes the output from the command instead of the queue.
    void SetRunHandler(std::function<sandbox::RunOutput(const std::vector<std::string>&)> handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        run_handler_ = std::move(handler);
    }

    void FailAtStep(FailAt step) { fail_at_ = step; }
    void SetDestroyResult(bool result) { destroy_result_ = result; }
    void SetDestroyThrows(bool throws) { destroy_throws_ = throws; }

    /// Run() ignores its timeout and blocks until Kill() is called.
    void SetHangUntilKilled(bool hang) { hang_until_killed_ = hang; }

    /// Run() sleeps this long before answering.
    void SetRunDelay(std::chrono::milliseconds delay) { run_delay_ = delay; }

    // ------------------------------------------------------------------
    // SandboxDriver
    // ------------------------------------------------------------------

    sandbox::SandboxHandle Create(const std::string& image,
                                  const sandbox::SandboxLimits& limits) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++create_calls_;
        if (fail_at_ == FailAt::CREATE) {
            throw core::SandboxUnavailableError("image " + image + " is not available");
        }
        sandbox::SandboxHandle handle{"fake-" + std::to_string(next_id_++), image};
        live_.insert(handle.id);
        max_live_ = std::max(max_live_, live_.size());
        last_limits_ = limits;
        images_.push_back(image);
        return handle;
    }

    void InjectFile(const sandbox::SandboxHandle& handle,
                    const std::string& filename,
                    const std::string& contents) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_at_ == FailAt::INJECT) {
            throw core::SandboxUnavailableError("copy into " + handle.id + " failed");
        }
        files_[handle.id][filename] = contents;
    }

    sandbox::RunOutput Run(const sandbox::SandboxHandle& handle,
                           const std::vector<std::string>& command,
                           std::chrono::milliseconds timeout,
                           std::size_t max_output_bytes) override {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool compile_step = run_calls_.empty() && expect_compile_;
        run_calls_.push_back(command);
        run_timeouts_.push_back(timeout);
        last_max_output_ = max_output_bytes;

        if ((fail_at_ == FailAt::COMPILE && compile_step) ||
            (fail_at_ == FailAt::RUN && !compile_step)) {
            throw core::SandboxUnavailableError("exec in " + handle.id + " failed");
        }

        if (hang_until_killed_) {
            killed_cv_.wait(lock, [this, &handle]() { return killed_.count(handle.id) > 0; });
            sandbox::RunOutput output;
            output.stdout_output = "partial";
            output.exit_code = 137;
            return output;
        }

        if (run_delay_.count() > 0) {
            lock.unlock();
            std::this_thread::sleep_for(run_delay_);
            lock.lock();
        }

        if (run_handler_) {
            return run_handler_(command);
        }
        if (!outputs_.empty()) {
            auto output = outputs_.front();
            outputs_.pop_front();
            return output;
        }
        sandbox::RunOutput output;
        output.exit_code = 0;
        return output;
    }

    bool Kill(const sandbox::SandboxHandle& handle) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++kill_calls_;
            killed_.insert(handle.id);
        }
        killed_cv_.notify_all();
        return true;
    }

    bool Destroy(const sandbox::SandboxHandle& handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++destroy_calls_;
        destroyed_ids_.push_back(handle.id);
        live_.erase(handle.id);
        if (destroy_throws_) {
            throw std::runtime_error("daemon went away");
        }
        return destroy_result_;
    }

    // ------------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------------

    /// Treats the first Run() call as the compile step for FailAt::COMPILE.
    void ExpectCompileStep(bool expect) { expect_compile_ = expect; }

    int CreateCalls() const { std::lock_guard<std::mutex> lock(mutex_); return create_calls_; }
    int DestroyCalls() const { std::lock_guard<std::mutex> lock(mutex_); return destroy_calls_; }
    int KillCalls() const { std::lock_guard<std::mutex> lock(mutex_); return kill_calls_; }
    std::size_t MaxLive() const { std::lock_guard<std::mutex> lock(mutex_); return max_live_; }
    std::size_t Live() const { std::lock_guard<std::mutex> lock(mutex_); return live_.size(); }

    std::vector<std::vector<std::string>> RunCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return run_calls_;
    }

    std::vector<std::chrono::milliseconds> RunTimeouts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return run_timeouts_;
    }

    std::vector<std::string> DestroyedIds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return destroyed_ids_;
    }

    std::vector<std::string> Images() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return images_;
    }

    std::map<std::string, std::map<std::string, std::string>> Files() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_;
    }

    sandbox::SandboxLimits LastLimits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_limits_;
    }

    std::size_t LastMaxOutput() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_max_output_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable killed_cv_;

    std::deque<sandbox::RunOutput> outputs_;
    std::function<sandbox::RunOutput(const std::vector<std::string>&)> run_handler_;
    FailAt fail_at_{FailAt::NONE};
    bool destroy_result_{true};
    bool destroy_throws_{false};
    bool hang_until_killed_{false};
    bool expect_compile_{false};
    std::chrono::milliseconds run_delay_{0};

    int next_id_{1};
    int create_calls_{0};
    int destroy_calls_{0};
    int kill_calls_{0};
    std::set<std::string> live_;
    std::set<std::string> killed_;
    std::size_t max_live_{0};
    sandbox::SandboxLimits last_limits_;
    std::size_t last_max_output_{0};
    std::vector<std::vector<std::string>> run_calls_;
    std::vector<std::chrono::milliseconds> run_timeouts_;
    std::vector<std::string> destroyed_ids_;
    std::vector<std::string> images_;
    std::map<std::string, std::map<std::string, std::string>> files_;
};

} // namespace test
} // namespace coderun
