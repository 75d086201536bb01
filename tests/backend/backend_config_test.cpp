// =============================================================================
// railmr - Backend Configuration Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "backend_test_support.h"
#include "railmr/backend/backend_config.h"
#include "railmr/backend/backend_factory.h"
#include "railmr/stage/stage_body.h"

namespace railmr::backend::test {

TEST(RemoteShellOptionsTest, ParsesHostSlots) {
    auto hosts = RemoteShellOptions::parseHosts("node1:4,node2,,user@node3:2");
    ASSERT_TRUE(hosts.has_value()) << hosts.error().message();
    ASSERT_EQ(hosts->size(), 3U);
    EXPECT_EQ((*hosts)[0], (HostSlots{"node1", 4}));
    EXPECT_EQ((*hosts)[1], (HostSlots{"node2", 1}));
    EXPECT_EQ((*hosts)[2], (HostSlots{"user@node3", 2}));

    RemoteShellOptions options;
    options.hosts = *hosts;
    EXPECT_EQ(options.totalSlots(), 7U);
    EXPECT_TRUE(options.validate().has_value());
}

TEST(RemoteShellOptionsTest, RejectsBadHosts) {
    for (const char* text : {"node1:0", "node1:", "node1:x", ":3", "node1:2x"}) {
        auto hosts = RemoteShellOptions::parseHosts(text);
        ASSERT_FALSE(hosts.has_value()) << text;
        EXPECT_EQ(hosts.error().code(), ErrorCode::kConfigurationError);
    }
    EXPECT_FALSE(RemoteShellOptions{}.validate().has_value());
}

TEST(LocalOptionsTest, ResolvesWorkerCount) {
    BackendEnvironment env;
    LocalOptions options;
    options.workers = 6;
    EXPECT_EQ(options.resolvedWorkers(env), 6U);

    options.workers = 0;
    env.ntasks = 3;
    EXPECT_EQ(options.resolvedWorkers(env), 3U);

    env.ntasks.reset();
    EXPECT_GE(options.resolvedWorkers(env), 1U);

    options.workers = kMaxLocalWorkers + 1;
    EXPECT_FALSE(options.validate().has_value());
}

TEST(BackendConfigTest, ValidatesOnlyTheSelectedBackend) {
    BackendConfig config;
    config.kind = BackendKind::kLocal;
    EXPECT_TRUE(config.validate().has_value());

    config.kind = BackendKind::kRemoteShell;
    EXPECT_FALSE(config.validate().has_value());

    config.kind = BackendKind::kElasticCluster;
    EXPECT_FALSE(config.validate().has_value());
    config.elastic.clusterId = "j-ABC";
    EXPECT_TRUE(config.validate().has_value());
    config.elastic.actionOnFailure = "EXPLODE";
    EXPECT_FALSE(config.validate().has_value());

    config.kind = BackendKind::kClusterScheduler;
    config.scheduler.maxQueued = 0;
    EXPECT_FALSE(config.validate().has_value());

    config.kind = BackendKind::kLocal;
    config.submitRetry.maxAttempts = 0;
    EXPECT_FALSE(config.validate().has_value());
}

TEST(BackendEnvironmentTest, CapturesToolOverrides) {
    ::setenv("RAILMR_SBATCH", "/opt/slurm/bin/sbatch", 1);
    ::setenv("RAILMR_WORKER", "/opt/railmr/bin/railmr", 1);
    ::setenv("NTASKS", "12", 1);
    auto env = BackendEnvironment::capture();
    ::unsetenv("RAILMR_SBATCH");
    ::unsetenv("RAILMR_WORKER");
    ::unsetenv("NTASKS");

    EXPECT_EQ(env.sbatch, "/opt/slurm/bin/sbatch");
    EXPECT_EQ(env.worker, "/opt/railmr/bin/railmr");
    EXPECT_EQ(env.squeue, "squeue");
    EXPECT_EQ(env.ntasks, std::optional<std::size_t>{12});

    ::setenv("NTASKS", "many", 1);
    EXPECT_FALSE(BackendEnvironment::capture().ntasks.has_value());
    ::unsetenv("NTASKS");
}

TEST(MakeBackendTest, CreatesTheSelectedAdapter) {
    auto registry = stage::StageRegistry::withBuiltins();
    FakeLauncher launcher;

    BackendConfig config;
    config.local.workers = 2;
    auto local = makeBackend(config, registry, launcher);
    EXPECT_EQ(local->kind(), BackendKind::kLocal);
    EXPECT_EQ(local->capacity(), 2U);

    config.kind = BackendKind::kRemoteShell;
    config.remoteShell.hosts = {{"a", 2}, {"b", 3}};
    auto ssh = makeBackend(config, registry, launcher);
    EXPECT_EQ(ssh->kind(), BackendKind::kRemoteShell);
    EXPECT_EQ(ssh->capacity(), 5U);

    config.kind = BackendKind::kClusterScheduler;
    config.scheduler.maxQueued = 10;
    EXPECT_EQ(makeBackend(config, registry, launcher)->capacity(), 10U);

    config.kind = BackendKind::kElasticCluster;
    EXPECT_THROW((void)makeBackend(config, registry, launcher), ConfigurationError);
    EXPECT_EQ(launcher.callCount(), 0U);
}

}  // namespace railmr::backend::test
