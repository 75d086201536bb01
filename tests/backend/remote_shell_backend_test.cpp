// =============================================================================
// railmr - Remote Shell (ssh) Backend Tests
// =============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <memory>
#include <string>

#include "backend_test_support.h"
#include "pipeline/job_test_support.h"
#include "railmr/backend/remote_shell_backend.h"
#include "railmr/pipeline/orchestrator.h"
#include "railmr/pipeline/worker.h"
#include "test_support.h"

namespace railmr::backend::test {

using railmr::test::TempDir;

namespace {

/// @brief Spawns fake ssh clients and keeps their exit state by host.
class SshFarm {
public:
    explicit SshFarm(FakeLauncher& launcher) {
        launcher.onSpawn = [this](const std::vector<std::string>& argv,
                                  const std::filesystem::path& /*log*/)
            -> Result<std::unique_ptr<io::ChildProcess>> {
            auto state = std::make_shared<ChildState>();
            // argv: ssh <options...> <host> <command>
            children.emplace_back(argv[argv.size() - 2], state);
            return std::unique_ptr<io::ChildProcess>(
                std::make_unique<FakeChild>(state, 1000 + static_cast<int>(children.size())));
        };
    }

    std::vector<std::pair<std::string, std::shared_ptr<ChildState>>> children;
};

RemoteShellBackend makeBackend(FakeLauncher& launcher, std::vector<HostSlots> hosts) {
    RemoteShellOptions options;
    options.hosts = std::move(hosts);
    options.sshOptions = {"-o", "ConnectTimeout=5"};
    BackendEnvironment env;
    env.worker = "/opt/railmr/bin/railmr";
    return RemoteShellBackend(options, env, quickRetry(), launcher);
}

}  // namespace

TEST(RemoteCommandTest, BuildsSshArgv) {
    BackendEnvironment env;
    env.worker = "/opt/railmr/bin/railmr";
    RemoteShellOptions options;
    options.sshOptions = {"-p", "2222"};
    auto argv = makeRemoteCommand(env, options, "node7", "/shared/work dir", "/shared/t.task");
    EXPECT_EQ(argv, (std::vector<std::string>{
                        "ssh", "-o", "BatchMode=yes", "-p", "2222", "node7",
                        "cd '/shared/work dir' && exec /opt/railmr/bin/railmr exec-task "
                        "--descriptor /shared/t.task"}));
}

TEST(RemoteShellBackendTest, SpreadsAttemptsOverHostSlots) {
    TempDir dir;
    FakeLauncher launcher;
    SshFarm farm(launcher);
    auto backend = makeBackend(launcher, {{"a", 1}, {"b", 2}});
    EXPECT_EQ(backend.capacity(), 3U);

    std::vector<TaskHandle> handles;
    for (TaskIndex t = 0; t < 3; ++t) {
        auto attempt = makeAttempt(dir.path(), t);
        auto handle = backend.submit(attempt.spec, attempt.files);
        ASSERT_TRUE(handle.has_value()) << handle.error().message();
        handles.push_back(*handle);
    }
    ASSERT_EQ(farm.children.size(), 3U);
    EXPECT_EQ(farm.children[0].first, "b");
    EXPECT_EQ(farm.children[1].first, "a");
    EXPECT_EQ(farm.children[2].first, "b");
    EXPECT_EQ(handles[0].externalId, "b:1001");
    EXPECT_EQ(backend.capacity(), 0U);

    auto attempt = makeAttempt(dir.path(), 3);
    auto full = backend.submit(attempt.spec, attempt.files);
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(full.error().code(), ErrorCode::kBackendUnavailable);

    // Finishing the attempt on "a" frees its slot.
    farm.children[1].second->exit(1);
    EXPECT_TRUE(backend.poll(handles[1]).value().finished());
    EXPECT_EQ(backend.capacity(), 1U);
    ASSERT_TRUE(backend.submit(attempt.spec, attempt.files).has_value());
    EXPECT_EQ(farm.children.back().first, "a");
}

TEST(RemoteShellBackendTest, ExitMapsToStatus) {
    TempDir dir;
    FakeLauncher launcher;
    SshFarm farm(launcher);
    auto backend = makeBackend(launcher, {{"node", 4}});

    auto ok = makeAttempt(dir.path(), 0);
    auto lost = makeAttempt(dir.path(), 1);
    auto failed = makeAttempt(dir.path(), 2);
    auto crashed = makeAttempt(dir.path(), 3);
    auto okHandle = backend.submit(ok.spec, ok.files).value();
    auto lostHandle = backend.submit(lost.spec, lost.files).value();
    auto failedHandle = backend.submit(failed.spec, failed.files).value();
    auto crashedHandle = backend.submit(crashed.spec, crashed.files).value();

    EXPECT_FALSE(backend.poll(okHandle).value().finished());

    writeStatus(ok, successOutcome(3));
    farm.children[0].second->exit(0);
    auto okStatus = backend.poll(okHandle).value();
    EXPECT_EQ(okStatus.state, TaskState::kSucceeded);
    EXPECT_EQ(okStatus.counters->recordsWritten, 3U);

    farm.children[1].second->exit(kSshChannelFailure);
    auto lostStatus = backend.poll(lostHandle).value();
    EXPECT_EQ(lostStatus.state, TaskState::kFailed);
    EXPECT_EQ(lostStatus.code, ErrorCode::kBackendUnavailable);
    EXPECT_NE(lostStatus.reason.find("ssh connection to node failed"), std::string::npos);

    writeStatus(failed, format::TaskOutcome::failure(ErrorCode::kFormatError, "bad record"));
    farm.children[2].second->exit(4);
    auto failedStatus = backend.poll(failedHandle).value();
    EXPECT_EQ(failedStatus.state, TaskState::kFailed);
    EXPECT_EQ(failedStatus.code, ErrorCode::kFormatError);
    EXPECT_EQ(failedStatus.reason, "bad record");

    farm.children[3].second->exit(139);
    auto crashedStatus = backend.poll(crashedHandle).value();
    EXPECT_EQ(crashedStatus.code, ErrorCode::kTaskExecutionError);
    EXPECT_NE(crashedStatus.reason.find("exited with code 139"), std::string::npos);
    EXPECT_EQ(backend.capacity(), 4U);
}

TEST(RemoteShellBackendTest, CancelTerminatesTheClient) {
    TempDir dir;
    FakeLauncher launcher;
    SshFarm farm(launcher);
    auto backend = makeBackend(launcher, {{"node", 1}});
    auto attempt = makeAttempt(dir.path());
    auto handle = backend.submit(attempt.spec, attempt.files).value();

    ASSERT_TRUE(backend.cancel(handle).has_value());
    EXPECT_TRUE(farm.children[0].second->terminated);
    auto status = backend.poll(handle).value();
    EXPECT_EQ(status.state, TaskState::kCancelled);
    EXPECT_EQ(backend.capacity(), 1U);
}

TEST(RemoteShellBackendTest, SpawnFailuresAreRetriedThenReleased) {
    TempDir dir;
    FakeLauncher launcher;
    int spawns = 0;
    launcher.onSpawn = [&spawns](const std::vector<std::string>&, const std::filesystem::path&)
        -> Result<std::unique_ptr<io::ChildProcess>> {
        ++spawns;
        return makeError<std::unique_ptr<io::ChildProcess>>(ErrorCode::kBackendUnavailable,
                                                            "fork failed");
    };
    auto backend = makeBackend(launcher, {{"node", 1}});
    auto attempt = makeAttempt(dir.path());

    auto handle = backend.submit(attempt.spec, attempt.files);
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code(), ErrorCode::kTaskExecutionError);
    EXPECT_EQ(spawns, 3);
    EXPECT_EQ(backend.capacity(), 1U);
}

TEST(RemoteShellBackendTest, ShutdownTerminatesEveryClient) {
    TempDir dir;
    FakeLauncher launcher;
    SshFarm farm(launcher);
    auto backend = makeBackend(launcher, {{"x", 2}});
    for (TaskIndex t = 0; t < 2; ++t) {
        auto attempt = makeAttempt(dir.path(), t);
        ASSERT_TRUE(backend.submit(attempt.spec, attempt.files).has_value());
    }
    backend.shutdown();
    for (const auto& [host, state] : farm.children) {
        EXPECT_TRUE(state->terminated) << host;
    }
    EXPECT_EQ(backend.capacity(), 2U);
}

TEST(RemoteShellJobTest, RunsJobOverSimulatedHosts) {
    TempDir dir;
    auto registry = stage::StageRegistry::withBuiltins();
    auto samples =
        pipeline::test::makeSampleSet(dir.path(), 4, 10, pipeline::test::randomPool(12, 40));

    // The "remote" worker runs inside spawn(); the client has exited by the first poll.
    FakeLauncher launcher;
    std::map<std::string, int> perHost;
    launcher.onSpawn = [&](const std::vector<std::string>& argv, const std::filesystem::path&)
        -> Result<std::unique_ptr<io::ChildProcess>> {
        const auto& command = argv.back();
        auto descriptor = command.substr(command.find("--descriptor ") + 13);
        CancellationToken cancel;
        auto state = std::make_shared<ChildState>();
        state->exit(pipeline::runTaskDescriptor(descriptor, registry, cancel));
        ++perHost[argv[argv.size() - 2]];
        return std::unique_ptr<io::ChildProcess>(std::make_unique<FakeChild>(state, 1));
    };
    auto backend = makeBackend(launcher, {{"n1", 1}, {"n2", 1}});

    auto config = pipeline::test::fastConfig(dir.path());
    pipeline::Job job(samples.manifest, stage::PipelineDef::preset("collapse"), config);
    pipeline::Orchestrator orchestrator(backend, registry);
    auto result = orchestrator.run(job);

    ASSERT_TRUE(result.succeeded()) << result.reason;
    EXPECT_EQ(perHost["n1"] + perHost["n2"], 4 + 2);
    EXPECT_GT(perHost["n1"], 0);
    EXPECT_GT(perHost["n2"], 0);
    EXPECT_EQ(pipeline::test::readOutputs(result).size(), 12U);
}

}  // namespace railmr::backend::test
