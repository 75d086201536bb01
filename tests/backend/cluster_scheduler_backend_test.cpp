// =============================================================================
// railmr - Cluster Scheduler (SLURM) Backend Tests
// =============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <string>

#include "backend_test_support.h"
#include "pipeline/job_test_support.h"
#include "railmr/backend/cluster_scheduler_backend.h"
#include "railmr/pipeline/orchestrator.h"
#include "railmr/pipeline/worker.h"
#include "test_support.h"

namespace railmr::backend::test {

using railmr::test::readTextFile;
using railmr::test::TempDir;

namespace {

/// @brief Answers squeue and sacct for every job id.
struct SchedulerScript {
    std::string queueState;
    std::string accounting;
    bool purged = false;

    Result<io::ProcessResult> operator()(const std::vector<std::string>& argv) const {
        const auto& program = argv.front();
        if (program == "squeue") {
            if (purged) {
                return commandFailure(1, "slurm_load_jobs error: Invalid job id specified");
            }
            return commandOutput(queueState.empty() ? "" : queueState + "\n");
        }
        if (program == "sacct") {
            return commandOutput(accounting.empty() ? "" : accounting + "\n");
        }
        if (program == "scancel") {
            return commandOutput("");
        }
        return commandOutput("777\n");
    }
};

class ClusterSchedulerBackendTest : public ::testing::Test {
protected:
    ClusterSchedulerBackend makeBackend(std::size_t maxQueued = 4) {
        ClusterSchedulerOptions options;
        options.maxQueued = maxQueued;
        options.extraArgs = {"--qos=short"};
        BackendEnvironment env;
        env.worker = "/opt/railmr/bin/railmr";
        return ClusterSchedulerBackend(options, env, quickRetry(), std::chrono::seconds{5},
                                       launcher_);
    }

    TempDir dir_;
    FakeLauncher launcher_;
};

}  // namespace

TEST(BatchScriptTest, CarriesDirectivesAndWorkerCommand) {
    TempDir dir;
    auto attempt = makeAttempt(dir.path(), 3, 2);
    ClusterSchedulerOptions options;
    options.partition = "long";
    options.account = "genomics";
    options.memoryMb = 8000;
    options.cpusPerTask = 4;

    auto script = makeBatchScript(options, "/opt/railmr/bin/railmr", attempt.spec, attempt.files);
    EXPECT_EQ(script.rfind("#!/bin/sh\n", 0), 0U);
    EXPECT_NE(script.find("#SBATCH --job-name=railmr-count-01-00003-a2\n"), std::string::npos);
    EXPECT_NE(script.find("#SBATCH --output=" + attempt.files.log.string()), std::string::npos);
    EXPECT_NE(script.find("#SBATCH --cpus-per-task=4\n"), std::string::npos);
    EXPECT_NE(script.find("#SBATCH --partition=long\n"), std::string::npos);
    EXPECT_NE(script.find("#SBATCH --account=genomics\n"), std::string::npos);
    EXPECT_NE(script.find("#SBATCH --mem=8000M\n"), std::string::npos);
    EXPECT_NE(script.find("exec /opt/railmr/bin/railmr exec-task --descriptor " +
                          attempt.files.descriptor.string()),
              std::string::npos);

    auto bare = makeBatchScript(ClusterSchedulerOptions{}, "railmr", attempt.spec, attempt.files);
    EXPECT_EQ(bare.find("--partition"), std::string::npos);
    EXPECT_EQ(bare.find("--mem"), std::string::npos);
}

TEST(SchedulerStateTest, ActiveStates) {
    EXPECT_TRUE(isActiveSchedulerState("PENDING"));
    EXPECT_TRUE(isActiveSchedulerState("RUNNING"));
    EXPECT_TRUE(isActiveSchedulerState("COMPLETING"));
    EXPECT_FALSE(isActiveSchedulerState("COMPLETED"));
    EXPECT_FALSE(isActiveSchedulerState("FAILED"));
    EXPECT_FALSE(isActiveSchedulerState(""));
}

TEST_F(ClusterSchedulerBackendTest, SubmitsBatchScript) {
    launcher_.onRun = [](const std::vector<std::string>&) -> Result<io::ProcessResult> {
        return commandOutput("4242;cluster-a\n");
    };
    auto backend = makeBackend(4);
    auto attempt = makeAttempt(dir_.path());

    auto handle = backend.submit(attempt.spec, attempt.files);
    ASSERT_TRUE(handle.has_value()) << handle.error().message();
    EXPECT_EQ(handle->externalId, "4242");
    EXPECT_EQ(handle->id, "01-00000-a1");
    EXPECT_EQ(backend.capacity(), 3U);

    auto calls = launcher_.callsTo("sbatch");
    ASSERT_EQ(calls.size(), 1U);
    EXPECT_EQ(calls[0], (std::vector<std::string>{"sbatch", "--parsable", "--qos=short",
                                                  attempt.files.script.string()}));
    EXPECT_NE(readTextFile(attempt.files.script).find("exec-task"), std::string::npos);
}

TEST_F(ClusterSchedulerBackendTest, SubmitFailures) {
    auto backend = makeBackend();
    auto attempt = makeAttempt(dir_.path());

    launcher_.onRun = [](const std::vector<std::string>&) -> Result<io::ProcessResult> {
        return commandOutput("Submitted batch job\n");
    };
    auto garbled = backend.submit(attempt.spec, attempt.files);
    ASSERT_FALSE(garbled.has_value());
    EXPECT_EQ(garbled.error().code(), ErrorCode::kTaskExecutionError);

    launcher_.onRun = [](const std::vector<std::string>&) -> Result<io::ProcessResult> {
        return commandFailure(1, "Unable to contact slurm controller");
    };
    auto before = launcher_.callsTo("sbatch").size();
    auto down = backend.submit(attempt.spec, attempt.files);
    ASSERT_FALSE(down.has_value());
    EXPECT_EQ(down.error().code(), ErrorCode::kTaskExecutionError);
    EXPECT_NE(down.error().message().find("Unable to contact slurm controller"),
              std::string::npos);
    EXPECT_EQ(launcher_.callsTo("sbatch").size() - before, 3U);
    EXPECT_EQ(backend.capacity(), 4U);
}

TEST_F(ClusterSchedulerBackendTest, PollFollowsQueueThenStatusFile) {
    SchedulerScript scheduler{"PENDING", ""};
    launcher_.onRun = [&scheduler](const std::vector<std::string>& argv) {
        return scheduler(argv);
    };
    auto backend = makeBackend();
    auto attempt = makeAttempt(dir_.path());
    auto handle = backend.submit(attempt.spec, attempt.files).value();

    EXPECT_FALSE(backend.poll(handle).value().finished());
    scheduler.queueState = "RUNNING";
    EXPECT_FALSE(backend.poll(handle).value().finished());

    // Left the queue but accounting still says it is completing.
    scheduler.queueState.clear();
    scheduler.accounting = "COMPLETING|0:0";
    EXPECT_FALSE(backend.poll(handle).value().finished());

    writeStatus(attempt, successOutcome(9));
    scheduler.accounting = "COMPLETED|0:0";
    auto status = backend.poll(handle).value();
    EXPECT_EQ(status.state, TaskState::kSucceeded);
    ASSERT_TRUE(status.counters.has_value());
    EXPECT_EQ(status.counters->recordsWritten, 9U);
    EXPECT_EQ(backend.capacity(), 4U);
}

TEST_F(ClusterSchedulerBackendTest, JobWithoutStatusFileFails) {
    SchedulerScript scheduler{"", "FAILED|1:0", true};
    launcher_.onRun = [&scheduler](const std::vector<std::string>& argv) {
        return scheduler(argv);
    };
    auto backend = makeBackend();
    auto attempt = makeAttempt(dir_.path());
    auto handle = backend.submit(attempt.spec, attempt.files).value();

    auto status = backend.poll(handle).value();
    EXPECT_EQ(status.state, TaskState::kFailed);
    EXPECT_EQ(status.code, ErrorCode::kTaskExecutionError);
    EXPECT_NE(status.reason.find("ended FAILED (exit 1)"), std::string::npos) << status.reason;
}

TEST_F(ClusterSchedulerBackendTest, UnaccountedJobIsDeclaredLostAfterThreePolls) {
    SchedulerScript scheduler{"", ""};
    launcher_.onRun = [&scheduler](const std::vector<std::string>& argv) {
        return scheduler(argv);
    };
    auto backend = makeBackend();
    auto attempt = makeAttempt(dir_.path());
    auto handle = backend.submit(attempt.spec, attempt.files).value();

    EXPECT_FALSE(backend.poll(handle).value().finished());
    EXPECT_FALSE(backend.poll(handle).value().finished());
    auto status = backend.poll(handle).value();
    EXPECT_EQ(status.state, TaskState::kFailed);
    EXPECT_NE(status.reason.find("without accounting record"), std::string::npos);

    auto unknown = backend.poll(handle);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code(), ErrorCode::kInternalError);
}

TEST_F(ClusterSchedulerBackendTest, CancelRunsScancel) {
    SchedulerScript scheduler{"RUNNING", ""};
    launcher_.onRun = [&scheduler](const std::vector<std::string>& argv) {
        return scheduler(argv);
    };
    auto backend = makeBackend();
    auto attempt = makeAttempt(dir_.path());
    auto handle = backend.submit(attempt.spec, attempt.files).value();

    ASSERT_TRUE(backend.cancel(handle).has_value());
    auto scancel = launcher_.callsTo("scancel");
    ASSERT_EQ(scancel.size(), 1U);
    EXPECT_EQ(scancel[0], (std::vector<std::string>{"scancel", "777"}));

    scheduler.queueState.clear();
    scheduler.accounting = "CANCELLED by 1000|0:15";
    auto status = backend.poll(handle).value();
    EXPECT_EQ(status.state, TaskState::kCancelled);
    EXPECT_EQ(status.code, ErrorCode::kCancelled);
}

TEST_F(ClusterSchedulerBackendTest, ShutdownCancelsOutstandingJobs) {
    std::atomic<int> nextId{100};
    launcher_.onRun = [&nextId](const std::vector<std::string>& argv) {
        if (argv.front() == "sbatch") {
            return Result<io::ProcessResult>(commandOutput(std::to_string(nextId++)));
        }
        return Result<io::ProcessResult>(commandOutput(""));
    };
    auto backend = makeBackend(2);
    auto first = makeAttempt(dir_.path(), 0);
    auto second = makeAttempt(dir_.path(), 1);
    ASSERT_TRUE(backend.submit(first.spec, first.files).has_value());
    ASSERT_TRUE(backend.submit(second.spec, second.files).has_value());
    EXPECT_EQ(backend.capacity(), 0U);

    backend.shutdown();
    EXPECT_EQ(launcher_.callsTo("scancel").size(), 2U);
    EXPECT_EQ(backend.capacity(), 2U);
}

// =============================================================================
// Whole job through a simulated scheduler
// =============================================================================

TEST(ClusterSchedulerJobTest, RunsJobThroughSimulatedScheduler) {
    TempDir dir;
    auto registry = stage::StageRegistry::withBuiltins();
    auto samples =
        pipeline::test::makeSampleSet(dir.path(), 3, 10, pipeline::test::randomPool(8, 40));

    // sbatch runs the worker to completion before returning the job id.
    FakeLauncher launcher;
    std::atomic<int> jobs{0};
    launcher.onRun = [&](const std::vector<std::string>& argv) -> Result<io::ProcessResult> {
        if (argv.front() == "sbatch") {
            auto script = readTextFile(argv.back());
            auto marker = script.find("--descriptor ");
            auto end = script.find('\n', marker);
            std::filesystem::path descriptor =
                script.substr(marker + 13, end - marker - 13);
            CancellationToken cancel;
            (void)pipeline::runTaskDescriptor(descriptor, registry, cancel);
            return commandOutput(std::to_string(++jobs) + "\n");
        }
        if (argv.front() == "sacct") {
            return commandOutput("COMPLETED|0:0\n");
        }
        return commandOutput("");
    };

    ClusterSchedulerOptions options;
    options.maxQueued = 2;
    BackendEnvironment env;
    env.worker = "railmr";
    ClusterSchedulerBackend backend(options, env, quickRetry(), std::chrono::seconds{5},
                                    launcher);

    auto config = pipeline::test::fastConfig(dir.path());
    pipeline::Job job(samples.manifest, stage::PipelineDef::preset("collapse"), config);
    pipeline::Orchestrator orchestrator(backend, registry);
    auto result = orchestrator.run(job);

    ASSERT_TRUE(result.succeeded()) << result.reason;
    EXPECT_EQ(jobs.load(), 3 + 2);
    EXPECT_EQ(pipeline::test::readOutputs(result).size(), 8U);
}

}  // namespace railmr::backend::test
