// Repository: ReelForge
// Component: Export Coordinator Contract Tests
// Purpose: Job lifecycle, progress delivery, cancellation, submission
//          policy and shutdown through the public coordinator surface.
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "reelforge/engine/SoftwareEncoderEngine.hpp"
#include "reelforge/runtime/ExportCoordinator.hpp"
#include "reelforge/util/ScopedTempDir.hpp"
#include "fixtures/EngineHarness.h"
#include "fixtures/FakeVisualSource.h"
#include "fixtures/RecordingEncoder.h"
#include "fixtures/SyntheticAudioDecoder.h"

using namespace reelforge;
using pipeline::ExportError;
using pipeline::JobState;
using runtime::ExportCoordinator;
using runtime::ExportRequest;
using tests::fixtures::EncoderLog;

namespace {

namespace fs = std::filesystem;

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

class ExportCoordinatorContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(out_dir_.Create("", "coord-out", nullptr));
    ASSERT_TRUE(temp_root_.Create("", "coord-root", nullptr));
    log_ = std::make_shared<EncoderLog>();
    config_.temp_root = temp_root_.path();
    config_.progress_min_interval_ms = 0;
    config_.progress_min_delta = 0.0;
  }

  void TearDown() override { coordinator_.reset(); }

  runtime::ExportServices Services() {
    runtime::ExportServices services;
    services.audio_decoder = std::make_shared<tests::fixtures::SyntheticAudioDecoder>();
    services.decode_cache = std::make_shared<audio::AudioDecodeCache>();
    services.visual_source_factory = [](pipeline::SourceResolver) {
      return std::make_shared<tests::fixtures::FakeVisualSource>();
    };
    auto log = log_;
    const std::string root = temp_root_.path();
    services.engine_factory =
        [log, root](const engine::EngineCandidate& candidate)
        -> std::unique_ptr<engine::IBackendEngine> {
      if (candidate.kind != engine::EngineKind::kSoftwareEncoder) return nullptr;
      engine::SoftwareEncoderOptions options;
      options.queue_depth = 4;
      options.temp_root = root;
      return std::make_unique<engine::SoftwareEncoderEngine>(
          tests::fixtures::RecordingEncoderFactory(log), options);
    };
    services.capability_probe = [](const pipeline::ExportSettings&) {
      pipeline::CapabilityProfile profile;
      profile.has_shared_memory = true;
      profile.performance_score = 80;
      return profile;
    };
    return services;
  }

  void Start() { coordinator_ = std::make_unique<ExportCoordinator>(config_, Services()); }

  ExportRequest Request(const std::string& name, double duration, int fps = 10) {
    ExportRequest request;
    request.settings = tests::fixtures::SmallSettings(
        fps, duration, (fs::path(out_dir_.path()) / (name + ".mp4")).string());
    request.elements = tests::fixtures::SimpleTimeline(duration);
    request.on_progress = [this](double value, JobState state) {
      std::lock_guard<std::mutex> lock(events_mutex_);
      events_.emplace_back(value, state);
    };
    return request;
  }

  // A job that spends seconds in Encoding.
  ExportRequest SlowRequest(const std::string& name) {
    log_->frame_delay_ms = 20;
    return Request(name, 30.0);
  }

  bool WaitForState(uint64_t id, JobState state) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < until) {
      auto current = coordinator_->GetState(id);
      if (current && *current == state) return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
  }

  std::vector<std::pair<double, JobState>> events() {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return events_;
  }

  bool TempRootEmpty() const { return fs::is_empty(temp_root_.path()); }

  util::ScopedTempDir out_dir_;
  util::ScopedTempDir temp_root_;
  std::shared_ptr<EncoderLog> log_;
  pipeline::ExportPipelineConfig config_;
  std::mutex events_mutex_;
  std::vector<std::pair<double, JobState>> events_;
  std::unique_ptr<ExportCoordinator> coordinator_;
};

}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(ExportCoordinatorContractTest, JobCompletesWithMonotonicProgress) {
  Start();
  auto submit = coordinator_->Submit(Request("done", 1.0));
  ASSERT_TRUE(submit.accepted);
  EXPECT_EQ(submit.job_id, 1u);

  auto result = coordinator_->Wait(submit.job_id);
  ASSERT_EQ(result.state, JobState::kCompleted) << result.message;
  EXPECT_EQ(result.job_id, submit.job_id);
  EXPECT_EQ(result.backend, "SoftwareEncoder");
  EXPECT_FALSE(result.HasGaps());
  EXPECT_EQ(ReadFile(result.output_path), tests::fixtures::kFakeContainer);
  EXPECT_EQ(coordinator_->GetState(submit.job_id), JobState::kCompleted);
  EXPECT_DOUBLE_EQ(coordinator_->GetProgress(submit.job_id).value_or(0.0), 1.0);
  EXPECT_EQ(coordinator_->illegal_transition_total(), 0u);
  EXPECT_EQ(log_->Live(), 0);
  EXPECT_TRUE(TempRootEmpty());

  auto seen = events();
  ASSERT_GE(seen.size(), 2u);
  bool saw_encoding = false;
  for (size_t i = 0; i < seen.size(); ++i) {
    if (seen[i].second == JobState::kEncoding) saw_encoding = true;
    if (i > 0) EXPECT_GE(seen[i].first, seen[i - 1].first) << "event " << i;
    if (i + 1 < seen.size()) EXPECT_LT(seen[i].first, 1.0) << "event " << i;
  }
  EXPECT_TRUE(saw_encoding);
  EXPECT_DOUBLE_EQ(seen.back().first, 1.0);
  EXPECT_EQ(seen.back().second, JobState::kCompleted);
}

TEST_F(ExportCoordinatorContractTest, DegradedSourceCompletesWithGaps) {
  Start();
  auto request = Request("gaps", 1.0);
  pipeline::TimelineElement broken;
  broken.id = "audio-broken";
  broken.kind = pipeline::ElementKind::kAudio;
  broken.source_ref = "fail";
  broken.duration = 1.0;
  request.elements.push_back(broken);

  auto result = coordinator_->Wait(coordinator_->Submit(std::move(request)).job_id);
  ASSERT_EQ(result.state, JobState::kCompleted) << result.message;
  EXPECT_TRUE(result.HasGaps());
  EXPECT_FALSE(result.warnings.empty());
}

TEST_F(ExportCoordinatorContractTest, InvalidSettingsFailTheJob) {
  Start();
  auto request = Request("odd", 1.0);
  request.settings.width = 15;
  auto result = coordinator_->Wait(coordinator_->Submit(std::move(request)).job_id);
  EXPECT_EQ(result.state, JobState::kFailed);
  EXPECT_EQ(result.error, ExportError::kInvalidSettings);
  EXPECT_NE(result.message.find("even"), std::string::npos) << result.message;
  EXPECT_EQ(log_->opens, 0);
}

TEST_F(ExportCoordinatorContractTest, NoWorkingEngineFailsInitialization) {
  log_->fail_open = true;
  Start();
  auto result = coordinator_->Wait(coordinator_->Submit(Request("noengine", 1.0)).job_id);
  EXPECT_EQ(result.state, JobState::kFailed);
  EXPECT_EQ(result.error, ExportError::kEngineInitialization);
  EXPECT_FALSE(fs::exists(fs::path(out_dir_.path()) / "noengine.mp4"));
  EXPECT_TRUE(TempRootEmpty());
}

TEST_F(ExportCoordinatorContractTest, JobsRunInSubmissionOrder) {
  Start();
  auto first = coordinator_->Submit(Request("first", 0.5));
  auto second = coordinator_->Submit(Request("second", 0.5));
  ASSERT_TRUE(first.accepted);
  ASSERT_TRUE(second.accepted);
  EXPECT_LT(first.job_id, second.job_id);

  EXPECT_EQ(coordinator_->Wait(second.job_id).state, JobState::kCompleted);
  EXPECT_EQ(coordinator_->GetState(first.job_id), JobState::kCompleted);
  EXPECT_EQ(coordinator_->pending_count(), 0u);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(ExportCoordinatorContractTest, CancelRunningJobTearsDownFirst) {
  Start();
  auto submit = coordinator_->Submit(SlowRequest("slow"));
  ASSERT_TRUE(WaitForState(submit.job_id, JobState::kEncoding));

  const auto start = std::chrono::steady_clock::now();
  coordinator_->Cancel(submit.job_id);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));

  // Cancel returns only after teardown.
  EXPECT_EQ(coordinator_->GetState(submit.job_id), JobState::kCancelled);
  EXPECT_EQ(log_->Live(), 0);
  EXPECT_TRUE(TempRootEmpty());

  auto result = coordinator_->Wait(submit.job_id);
  EXPECT_EQ(result.state, JobState::kCancelled);
  EXPECT_EQ(result.error, ExportError::kCancelled);
  EXPECT_FALSE(fs::exists(fs::path(out_dir_.path()) / "slow.mp4"));

  coordinator_->Cancel(submit.job_id);
  coordinator_->Cancel(9999);
  EXPECT_EQ(coordinator_->GetState(submit.job_id), JobState::kCancelled);
  EXPECT_EQ(coordinator_->illegal_transition_total(), 0u);

  auto seen = events();
  ASSERT_FALSE(seen.empty());
  EXPECT_EQ(seen.back().second, JobState::kCancelled);
}

TEST_F(ExportCoordinatorContractTest, CancelQueuedJobNeverStartsIt) {
  Start();
  auto running = coordinator_->Submit(SlowRequest("running"));
  auto queued = coordinator_->Submit(Request("queued", 0.5));
  ASSERT_TRUE(queued.accepted);

  coordinator_->Cancel(queued.job_id);
  EXPECT_EQ(coordinator_->GetState(queued.job_id), JobState::kCancelled);
  EXPECT_EQ(coordinator_->Wait(queued.job_id).error, ExportError::kCancelled);

  coordinator_->Cancel(running.job_id);
  EXPECT_EQ(coordinator_->Wait(running.job_id).state, JobState::kCancelled);
  EXPECT_FALSE(fs::exists(fs::path(out_dir_.path()) / "queued.mp4"));
}

// =============================================================================
// Submission policy
// =============================================================================

TEST_F(ExportCoordinatorContractTest, RejectPolicyRefusesWhileBusy) {
  config_.concurrency_policy = pipeline::ConcurrencyPolicy::kReject;
  Start();
  auto first = coordinator_->Submit(SlowRequest("busy"));
  ASSERT_TRUE(first.accepted);

  auto second = coordinator_->Submit(Request("refused", 0.5));
  EXPECT_FALSE(second.accepted);
  EXPECT_EQ(second.error, ExportError::kRejected);
  EXPECT_FALSE(second.message.empty());

  coordinator_->Cancel(first.job_id);
  auto third = coordinator_->Submit(Request("after", 0.5));
  ASSERT_TRUE(third.accepted);
  EXPECT_EQ(coordinator_->Wait(third.job_id).state, JobState::kCompleted);
}

TEST_F(ExportCoordinatorContractTest, CancelReturnsWithCoordinatorIdle) {
  config_.concurrency_policy = pipeline::ConcurrencyPolicy::kReject;
  Start();
  for (int round = 0; round < 5; ++round) {
    auto busy = coordinator_->Submit(SlowRequest("busy" + std::to_string(round)));
    ASSERT_TRUE(busy.accepted) << "round " << round;
    ASSERT_TRUE(WaitForState(busy.job_id, JobState::kEncoding));
    coordinator_->Cancel(busy.job_id);
    // No window where the cancelled job still counts as running.
    EXPECT_EQ(coordinator_->pending_count(), 0u) << "round " << round;
  }
  log_->frame_delay_ms = 0;
  auto next = coordinator_->Submit(Request("next", 0.5));
  ASSERT_TRUE(next.accepted) << next.message;
  EXPECT_EQ(coordinator_->Wait(next.job_id).state, JobState::kCompleted);
}

TEST_F(ExportCoordinatorContractTest, WaitReturnsWithNothingPending) {
  config_.concurrency_policy = pipeline::ConcurrencyPolicy::kReject;
  Start();
  for (int round = 0; round < 5; ++round) {
    auto submit = coordinator_->Submit(Request("quick" + std::to_string(round), 0.2));
    ASSERT_TRUE(submit.accepted) << "round " << round << ": " << submit.message;
    EXPECT_EQ(coordinator_->Wait(submit.job_id).state, JobState::kCompleted);
    EXPECT_EQ(coordinator_->pending_count(), 0u) << "round " << round;
  }
}

// =============================================================================
// Finished job retention
// =============================================================================

TEST_F(ExportCoordinatorContractTest, FinishedJobsReleaseTheirRequest) {
  Start();
  auto token = std::make_shared<int>(0);
  std::weak_ptr<int> weak = token;
  auto request = Request("released", 0.5);
  request.resolver = [token](const std::string& ref) {
    return std::optional<pipeline::ResolvedSource>(pipeline::ResolvedSource{ref, nullptr});
  };
  token.reset();

  auto submit = coordinator_->Submit(std::move(request));
  ASSERT_TRUE(submit.accepted);
  ASSERT_EQ(coordinator_->Wait(submit.job_id).state, JobState::kCompleted);
  EXPECT_TRUE(weak.expired());

  coordinator_->Shutdown();
  EXPECT_EQ(coordinator_->tracked_job_count(), 0u);
  EXPECT_EQ(coordinator_->GetState(submit.job_id), JobState::kCompleted);
  EXPECT_DOUBLE_EQ(coordinator_->GetProgress(submit.job_id).value_or(0.0), 1.0);
  EXPECT_EQ(coordinator_->Wait(submit.job_id).output_path,
            (fs::path(out_dir_.path()) / "released.mp4").string());
}

TEST_F(ExportCoordinatorContractTest, HistoryKeepsOnlyTheNewestResults) {
  config_.finished_job_history = 2;
  Start();
  std::vector<uint64_t> ids;
  for (int i = 0; i < 3; ++i) {
    auto submit = coordinator_->Submit(Request("h" + std::to_string(i), 0.2));
    ASSERT_TRUE(submit.accepted);
    ids.push_back(submit.job_id);
  }
  EXPECT_EQ(coordinator_->Wait(ids[2]).state, JobState::kCompleted);
  coordinator_->Shutdown();

  EXPECT_EQ(coordinator_->tracked_job_count(), 0u);
  EXPECT_FALSE(coordinator_->GetState(ids[0]).has_value());
  EXPECT_EQ(coordinator_->Wait(ids[0]).message, "unknown job " + std::to_string(ids[0]));
  EXPECT_EQ(coordinator_->GetState(ids[1]), JobState::kCompleted);
  EXPECT_EQ(coordinator_->GetState(ids[2]), JobState::kCompleted);
  EXPECT_EQ(coordinator_->illegal_transition_total(), 0u);
}

TEST_F(ExportCoordinatorContractTest, CancelledQueuedJobIsReleased) {
  Start();
  auto running = coordinator_->Submit(SlowRequest("running"));
  auto queued = coordinator_->Submit(Request("queued", 0.5));
  coordinator_->Cancel(queued.job_id);
  EXPECT_EQ(coordinator_->tracked_job_count(), 1u);
  EXPECT_EQ(coordinator_->GetState(queued.job_id), JobState::kCancelled);

  coordinator_->Cancel(running.job_id);
  EXPECT_EQ(coordinator_->Wait(running.job_id).state, JobState::kCancelled);
  coordinator_->Shutdown();
  EXPECT_EQ(coordinator_->tracked_job_count(), 0u);
  EXPECT_EQ(coordinator_->GetState(queued.job_id), JobState::kCancelled);
}

TEST_F(ExportCoordinatorContractTest, NonFiniteElementValuesFailTheJob) {
  Start();
  auto request = Request("nan", 1.0);
  request.elements.front().transform.scale = std::numeric_limits<double>::quiet_NaN();
  auto result = coordinator_->Wait(coordinator_->Submit(std::move(request)).job_id);
  EXPECT_EQ(result.state, JobState::kFailed);
  EXPECT_EQ(result.error, ExportError::kInvalidSettings);
  EXPECT_NE(result.message.find("non-finite"), std::string::npos) << result.message;
  EXPECT_EQ(log_->opens, 0);
}

// =============================================================================
// Shutdown and lookups
// =============================================================================

TEST_F(ExportCoordinatorContractTest, ShutdownCancelsEverything) {
  Start();
  auto running = coordinator_->Submit(SlowRequest("running"));
  auto queued = coordinator_->Submit(Request("queued", 0.5));

  coordinator_->Shutdown();
  EXPECT_EQ(coordinator_->Wait(running.job_id).state, JobState::kCancelled);
  EXPECT_EQ(coordinator_->Wait(queued.job_id).state, JobState::kCancelled);
  EXPECT_EQ(log_->Live(), 0);
  EXPECT_TRUE(TempRootEmpty());

  auto late = coordinator_->Submit(Request("late", 0.5));
  EXPECT_FALSE(late.accepted);
  EXPECT_EQ(late.error, ExportError::kRejected);
  coordinator_->Shutdown();
}

TEST_F(ExportCoordinatorContractTest, UnknownJobLookups) {
  Start();
  EXPECT_FALSE(coordinator_->GetState(42).has_value());
  EXPECT_FALSE(coordinator_->GetProgress(42).has_value());
  auto result = coordinator_->Wait(42);
  EXPECT_EQ(result.state, JobState::kFailed);
  EXPECT_EQ(result.message, "unknown job 42");
}
