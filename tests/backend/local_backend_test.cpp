// =============================================================================
// railmr - Local Backend Tests
// =============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "railmr/backend/local_backend.h"
#include "railmr/format/storage_layout.h"
#include "railmr/stage/stage_body.h"
#include "test_support.h"

namespace railmr::backend::test {

using railmr::test::makeRead;
using railmr::test::TempDir;
using railmr::test::waitUntil;
using railmr::test::writeFastq;

namespace {

/// @brief Holds every task until it is cancelled.
class BlockingBody final : public stage::StageBody {
public:
    void begin(const stage::StageContext& context) override { cancel_ = context.cancel; }

    void process(const WorkUnit& unit, stage::Emitter& out) override {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{20};
        while (!cancel_->isCancelled() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        out.emit(unit.key, "late");
    }

private:
    const CancellationToken* cancel_ = nullptr;
};

class LocalBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.add("blocking", [] { return std::make_unique<BlockingBody>(); });
        layout_.create();
        writeFastq(dir_ / "reads.fq", {makeRead("r1", "ACGTTGCA"), makeRead("r2", "GGGGCCCC")});
    }

    format::TaskSpec specFor(const std::string& body, TaskIndex task) const {
        format::TaskSpec spec;
        spec.runId = "run";
        spec.stage = stage::parseStageLine("ingest map " + body).value();
        spec.taskIndex = task;
        spec.outputPartitions = 1;
        spec.manifestEntry =
            format::parseManifestLine((dir_ / "reads.fq").string() + "\t0\tg-1-1").value();
        spec.outputDir = layout_.stageDir(0, "ingest");
        spec.cacheDir = layout_.cacheDir();
        spec.scratchDir = layout_.taskScratchDir(0, task, 1);
        spec.statusPath = layout_.taskFile(0, task, 1, "status");
        return spec;
    }

    TempDir dir_;
    format::StorageLayout layout_{dir_.path(), "run"};
    stage::StageRegistry registry_ = stage::StageRegistry::withBuiltins();
    TaskFiles files_;
};

}  // namespace

TEST_F(LocalBackendTest, RunsTaskAndReportsOutcome) {
    LocalBackend backend(registry_, 2);
    std::atomic<int> completions{0};
    backend.setCompletionListener([&completions] { ++completions; });
    EXPECT_EQ(backend.kind(), BackendKind::kLocal);
    EXPECT_EQ(backend.capacity(), 2U);

    auto spec = specFor("identity", 0);
    auto handle = backend.submit(spec, files_);
    ASSERT_TRUE(handle.has_value()) << handle.error().message();
    EXPECT_EQ(handle->id, "00-00000-a1");

    TaskStatus status;
    ASSERT_TRUE(waitUntil([&] {
        auto polled = backend.poll(*handle);
        status = polled.value();
        return status.finished();
    }));
    EXPECT_EQ(status.state, TaskState::kSucceeded) << status.reason;
    ASSERT_TRUE(status.counters.has_value());
    EXPECT_EQ(status.counters->recordsWritten, 2U);
    EXPECT_EQ(completions.load(), 1);
    EXPECT_TRUE(std::filesystem::exists(spec.statusPath));
    EXPECT_TRUE(std::filesystem::exists(spec.outputFiles().front()));
    EXPECT_EQ(backend.capacity(), 2U);

    // A finished attempt is forgotten once its status has been delivered.
    auto again = backend.poll(*handle);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code(), ErrorCode::kInternalError);
}

TEST_F(LocalBackendTest, CapacityBoundsSubmissions) {
    LocalBackend backend(registry_, 1);
    auto first = backend.submit(specFor("blocking", 0), files_);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(backend.capacity(), 0U);

    auto second = backend.submit(specFor("blocking", 1), files_);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code(), ErrorCode::kBackendUnavailable);

    auto duplicate = backend.submit(specFor("blocking", 0), files_);
    ASSERT_FALSE(duplicate.has_value());
    ASSERT_TRUE(backend.cancel(*first).has_value());
    ASSERT_TRUE(waitUntil([&] { return backend.poll(*first).value().finished(); }));
    EXPECT_EQ(backend.capacity(), 1U);
}

TEST_F(LocalBackendTest, CancelledTaskPublishesNothing) {
    LocalBackend backend(registry_, 2);
    auto spec = specFor("blocking", 0);
    auto handle = backend.submit(spec, files_);
    ASSERT_TRUE(handle.has_value());
    EXPECT_FALSE(backend.poll(*handle).value().finished());

    ASSERT_TRUE(backend.cancel(*handle).has_value());
    TaskStatus status;
    ASSERT_TRUE(waitUntil([&] {
        status = backend.poll(*handle).value();
        return status.finished();
    }));
    EXPECT_EQ(status.state, TaskState::kCancelled);
    EXPECT_EQ(status.code, ErrorCode::kCancelled);
    EXPECT_FALSE(std::filesystem::exists(spec.outputFiles().front()));
}

TEST_F(LocalBackendTest, ShutdownCancelsInFlightAttempts) {
    LocalBackend backend(registry_, 2);
    ASSERT_TRUE(backend.submit(specFor("blocking", 0), files_).has_value());
    ASSERT_TRUE(backend.submit(specFor("blocking", 1), files_).has_value());

    auto start = std::chrono::steady_clock::now();
    backend.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{10});
    EXPECT_EQ(backend.capacity(), 0U);

    auto late = backend.submit(specFor("identity", 2), files_);
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().code(), ErrorCode::kCancelled);
}

TEST_F(LocalBackendTest, UnknownHandleIsAnError) {
    LocalBackend backend(registry_, 1);
    TaskHandle handle;
    handle.id = "09-00009-a9";
    auto polled = backend.poll(handle);
    ASSERT_FALSE(polled.has_value());
    EXPECT_EQ(polled.error().code(), ErrorCode::kInternalError);
    EXPECT_TRUE(backend.cancel(handle).has_value());
}

}  // namespace railmr::backend::test
