#include "coderun/core/execution_orchestrator.hpp"
#include "fake_sandbox_driver.hpp"

#include <gtest/gtest.h>

#include <future>
#include <stdexcept>

using namespace coderun::core;
using coderun::sandbox::RunOutput;
using coderun::test::FakeSandboxDriver;

namespace {

RunOutput Exited(int code, const std::string& out = "", const std::string& err = "") {
    RunOutput output;
    output.exit_code = code;
    output.stdout_output = out;
    output.stderr_output = err;
    return output;
}

RunOutput Killed() {
    RunOutput output;
    output.killed = true;
    return output;
}

class ExecutionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<LanguageRegistry>();
        registry_->Register(LanguageProfileBuilder("python")
            .WithImage("python:3.12-slim")
            .WithSourceFile("main.py")
            .WithRunCommand({"python3", "main.py"})
            .WithMemoryLimit(256)
            .WithCPULimit(0.5)
            .WithTimeLimit(std::chrono::milliseconds(200))
            .Build());
        registry_->Register(LanguageProfileBuilder("c")
            .WithImage("gcc:13")
            .WithSourceFile("main.c")
            .WithCompileCommand({"gcc", "-o", "main", "main.c"})
            .WithRunCommand({"./main"})
            .WithTimeLimit(std::chrono::milliseconds(200))
            .Build());

        driver_ = std::make_shared<FakeSandboxDriver>();
        config_.kill_grace = std::chrono::milliseconds(100);
        config_.compile_time_limit = std::chrono::milliseconds(300);
    }

    ExecutionOrchestrator& Orchestrator(std::size_t capacity = 4,
                                        std::chrono::milliseconds queue_wait = std::chrono::seconds(5)) {
        admission_ = std::make_shared<AdmissionController>(capacity, queue_wait);
        orchestrator_ = std::make_unique<ExecutionOrchestrator>(registry_, driver_, admission_, config_);
        return *orchestrator_;
    }

    std::shared_ptr<LanguageRegistry> registry_;
    std::shared_ptr<FakeSandboxDriver> driver_;
    std::shared_ptr<AdmissionController> admission_;
    ExecutionOrchestrator::Config config_;
    std::unique_ptr<ExecutionOrchestrator> orchestrator_;
};

} // anonymous namespace

TEST_F(ExecutionOrchestratorTest, RejectsMissingCollaborators) {
    auto admission = std::make_shared<AdmissionController>(1, std::chrono::seconds(1));
    EXPECT_THROW(ExecutionOrchestrator(nullptr, driver_, admission), std::invalid_argument);
    EXPECT_THROW(ExecutionOrchestrator(registry_, nullptr, admission), std::invalid_argument);
    EXPECT_THROW(ExecutionOrchestrator(registry_, driver_, nullptr), std::invalid_argument);
}

TEST_F(ExecutionOrchestratorTest, PythonProgramPrintsResult) {
    driver_->SetRunHandler([](const std::vector<std::string>& command) {
        return command == std::vector<std::string>{"python3", "main.py"} ? Exited(0, "2\n") : Exited(127);
    });

    auto result = Orchestrator().Execute({"print(1+1)", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.stdout_output, "2\n");
    EXPECT_EQ(result.stderr_output, "");
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.language, "python");
    EXPECT_FALSE(result.teardown_failed);

    auto files = driver_->Files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files.begin()->second.at("main.py"), "print(1+1)");
    EXPECT_EQ(driver_->Images(), std::vector<std::string>{"python:3.12-slim"});
    EXPECT_EQ(driver_->CreateCalls(), 1);
    EXPECT_EQ(driver_->DestroyCalls(), 1);
    EXPECT_EQ(driver_->Live(), 0u);
}

TEST_F(ExecutionOrchestratorTest, SandboxGetsProfileLimitsWithoutNetwork) {
    Orchestrator().Execute({"print(1)", "python"});

    auto limits = driver_->LastLimits();
    EXPECT_EQ(limits.memory_limit_mb, 256u);
    EXPECT_DOUBLE_EQ(limits.cpu_limit, 0.5);
    EXPECT_FALSE(limits.network_enabled);
    EXPECT_EQ(driver_->RunTimeouts().front(), std::chrono::milliseconds(200));
    EXPECT_EQ(driver_->LastMaxOutput(), config_.max_output_bytes);
}

TEST_F(ExecutionOrchestratorTest, UnknownLanguageNeverProvisions) {
    auto result = Orchestrator().Execute({"print(1)", "Python"});

    EXPECT_EQ(result.status, ExecutionStatus::UNKNOWN_LANGUAGE);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_NE(result.error_message.find("Python"), std::string::npos);
    EXPECT_EQ(driver_->CreateCalls(), 0);
    EXPECT_EQ(driver_->DestroyCalls(), 0);
}

TEST_F(ExecutionOrchestratorTest, EmptyCodeIsInvalidRequest) {
    auto result = Orchestrator().Execute({"", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::INVALID_REQUEST);
    EXPECT_EQ(driver_->CreateCalls(), 0);
}

TEST_F(ExecutionOrchestratorTest, OversizedCodeIsInvalidRequest) {
    config_.max_code_bytes = 8;
    auto result = Orchestrator().Execute({"print('too long')", "nosuchlanguage"});

    // Validation happens before the registry lookup.
    EXPECT_EQ(result.status, ExecutionStatus::INVALID_REQUEST);
    EXPECT_EQ(driver_->CreateCalls(), 0);
}

TEST_F(ExecutionOrchestratorTest, NonZeroExitIsRuntimeError) {
    driver_->QueueOutput(Exited(3, "", "Traceback: boom\n"));

    auto result = Orchestrator().Execute({"raise SystemExit(3)", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::RUNTIME_ERROR);
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 3);
    EXPECT_EQ(result.stderr_output, "Traceback: boom\n");
    EXPECT_EQ(driver_->DestroyCalls(), 1);
}

TEST_F(ExecutionOrchestratorTest, DriverTimeoutIsTimedOut) {
    driver_->QueueOutput(Killed());

    auto result = Orchestrator().Execute({"while True: pass", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_EQ(driver_->DestroyCalls(), 1);
}

TEST_F(ExecutionOrchestratorTest, WatchdogKillsHungRun) {
    driver_->SetHangUntilKilled(true);

    auto result = Orchestrator().Execute({"while True: pass", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_EQ(driver_->KillCalls(), 1);
    EXPECT_EQ(driver_->DestroyCalls(), 1);
    EXPECT_GE(result.elapsed, std::chrono::milliseconds(300));
}

TEST_F(ExecutionOrchestratorTest, CompileErrorSkipsRun) {
    driver_->QueueOutput(Exited(1, "", "main.c:1: error: expected ';'\n"));

    auto result = Orchestrator().Execute({"int main() { return 0 }", "c"});

    EXPECT_EQ(result.status, ExecutionStatus::COMPILE_ERROR);
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 1);
    EXPECT_NE(result.stderr_output.find("expected ';'"), std::string::npos);

    auto calls = driver_->RunCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].front(), "gcc");
    EXPECT_EQ(driver_->DestroyCalls(), 1);
}

TEST_F(ExecutionOrchestratorTest, CompileTimeoutIsCompileError) {
    driver_->QueueOutput(Killed());

    auto result = Orchestrator().Execute({"#include </dev/zero>", "c"});

    EXPECT_EQ(result.status, ExecutionStatus::COMPILE_ERROR);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_EQ(driver_->RunCalls().size(), 1u);
    EXPECT_EQ(driver_->RunTimeouts().front(), std::chrono::milliseconds(300));
}

TEST_F(ExecutionOrchestratorTest, CompiledProgramRunsAfterCompile) {
    driver_->QueueOutput(Exited(0));
    driver_->QueueOutput(Exited(0, "hello\n"));

    auto result = Orchestrator().Execute({"int main() { puts(\"hello\"); }", "c"});

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.stdout_output, "hello\n");

    auto calls = driver_->RunCalls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1], std::vector<std::string>{"./main"});
    EXPECT_EQ(driver_->DestroyCalls(), 1);
}

TEST_F(ExecutionOrchestratorTest, OutputIsCappedAndFlagged) {
    config_.max_output_bytes = 10;
    driver_->QueueOutput(Exited(0, std::string(100, 'x')));

    auto result = Orchestrator().Execute({"print('x' * 100)", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.stdout_output.size(), 10u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST_F(ExecutionOrchestratorTest, CreateFailureIsSandboxUnavailable) {
    driver_->FailAtStep(FakeSandboxDriver::FailAt::CREATE);

    auto result = Orchestrator().Execute({"print(1)", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::SANDBOX_UNAVAILABLE);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_EQ(driver_->DestroyCalls(), 0);
    EXPECT_EQ(admission_->InUse(), 0u);
}

class DriverFailureTest
    : public ExecutionOrchestratorTest
    , public ::testing::WithParamInterface<FakeSandboxDriver::FailAt> {
};

TEST_P(DriverFailureTest, DestroysExactlyOnce) {
    driver_->ExpectCompileStep(true);
    driver_->FailAtStep(GetParam());

    auto result = Orchestrator().Execute({"int main() { return 0; }", "c"});

    EXPECT_EQ(result.status, ExecutionStatus::SANDBOX_UNAVAILABLE);
    EXPECT_EQ(driver_->CreateCalls(), 1);
    EXPECT_EQ(driver_->DestroyCalls(), 1);
    EXPECT_EQ(driver_->Live(), 0u);
    EXPECT_EQ(admission_->InUse(), 0u);
}

INSTANTIATE_TEST_SUITE_P(EveryStepAfterCreate, DriverFailureTest,
                         ::testing::Values(FakeSandboxDriver::FailAt::INJECT,
                                           FakeSandboxDriver::FailAt::COMPILE,
                                           FakeSandboxDriver::FailAt::RUN));

TEST_F(ExecutionOrchestratorTest, UnexpectedDriverExceptionIsSandboxUnavailable) {
    driver_->SetRunHandler([](const std::vector<std::string>&) -> RunOutput {
        throw std::runtime_error("socket closed");
    });

    auto result = Orchestrator().Execute({"print(1)", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::SANDBOX_UNAVAILABLE);
    EXPECT_EQ(result.error_message, "socket closed");
    EXPECT_EQ(driver_->DestroyCalls(), 1);
}

TEST_F(ExecutionOrchestratorTest, TeardownFailureKeepsStatus) {
    driver_->QueueOutput(Exited(0, "ok\n"));
    driver_->SetDestroyResult(false);

    auto& orchestrator = Orchestrator();
    auto result = orchestrator.Execute({"print('ok')", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_TRUE(result.teardown_failed);
    EXPECT_EQ(driver_->DestroyCalls(), 1);
    EXPECT_EQ(orchestrator.GetStatistics().teardown_failures, 1u);
}

TEST_F(ExecutionOrchestratorTest, TeardownExceptionIsContained) {
    driver_->SetDestroyThrows(true);

    auto& orchestrator = Orchestrator();
    auto result = orchestrator.Execute({"print('ok')", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_TRUE(result.teardown_failed);
    EXPECT_EQ(driver_->DestroyCalls(), 1);
    EXPECT_EQ(orchestrator.GetStatistics().teardown_failures, 1u);
}

TEST_F(ExecutionOrchestratorTest, AdmissionTimeoutNeverProvisions) {
    auto& orchestrator = Orchestrator(1, std::chrono::milliseconds(50));
    auto held = admission_->Acquire();

    auto result = orchestrator.Execute({"print(1)", "python"});

    EXPECT_EQ(result.status, ExecutionStatus::ADMISSION_TIMEOUT);
    EXPECT_EQ(driver_->CreateCalls(), 0);
}

TEST_F(ExecutionOrchestratorTest, ConcurrencyNeverExceedsCapacity) {
    driver_->SetRunDelay(std::chrono::milliseconds(30));
    auto& orchestrator = Orchestrator(2);

    std::vector<std::future<ExecutionResult>> pending;
    for (int i = 0; i < 6; ++i) {
        pending.push_back(orchestrator.ExecuteAsync({"print(1)", "python"}));
    }
    for (auto& future : pending) {
        EXPECT_EQ(future.get().status, ExecutionStatus::SUCCESS);
    }

    EXPECT_LE(driver_->MaxLive(), 2u);
    EXPECT_EQ(driver_->CreateCalls(), 6);
    EXPECT_EQ(driver_->DestroyCalls(), 6);
    EXPECT_EQ(admission_->InUse(), 0u);
}

TEST_F(ExecutionOrchestratorTest, SameRequestSameOutcome) {
    driver_->SetRunHandler([](const std::vector<std::string>&) { return Exited(0, "2\n"); });
    auto& orchestrator = Orchestrator();

    auto first = orchestrator.Execute({"print(1+1)", "python"});
    auto second = orchestrator.Execute({"print(1+1)", "python"});

    EXPECT_EQ(first.status, second.status);
    EXPECT_EQ(first.stdout_output, second.stdout_output);
    EXPECT_EQ(first.exit_code, second.exit_code);

    // Each request gets its own sandbox.
    auto destroyed = driver_->DestroyedIds();
    ASSERT_EQ(destroyed.size(), 2u);
    EXPECT_NE(destroyed[0], destroyed[1]);
}

TEST_F(ExecutionOrchestratorTest, StatisticsCountOutcomes) {
    driver_->QueueOutput(Exited(0));
    driver_->QueueOutput(Exited(1));
    auto& orchestrator = Orchestrator();

    orchestrator.Execute({"print(1)", "python"});
    orchestrator.Execute({"exit(1)", "python"});
    orchestrator.Execute({"x", "cobol"});

    auto stats = orchestrator.GetStatistics();
    EXPECT_EQ(stats.total_requests, 3u);
    EXPECT_EQ(stats.by_status[ExecutionStatus::SUCCESS], 1u);
    EXPECT_EQ(stats.by_status[ExecutionStatus::RUNTIME_ERROR], 1u);
    EXPECT_EQ(stats.by_status[ExecutionStatus::UNKNOWN_LANGUAGE], 1u);
    EXPECT_EQ(stats.teardown_failures, 0u);
    EXPECT_EQ(stats.in_flight, 0u);
}
