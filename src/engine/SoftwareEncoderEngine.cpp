// Repository: ReelForge
// Component: Software Encoder Engine
// Purpose: Frame-by-frame export through an in-process encoder fed by a
//          bounded producer/consumer queue.
// Copyright (c) 2025 ReelForge

#include "reelforge/engine/SoftwareEncoderEngine.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <sstream>

#include "reelforge/capture/CaptureStreamBuilder.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::engine {

using pipeline::EngineStatus;
using pipeline::ExportError;
using pipeline::JobState;
using pipeline::PixelBuffer;

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);

}  // namespace

SoftwareEncoderEngine::SoftwareEncoderEngine(encode::MediaEncoderFactory encoder_factory,
                                             SoftwareEncoderOptions options)
    : encoder_factory_(std::move(encoder_factory)), options_(std::move(options)) {}

SoftwareEncoderEngine::~SoftwareEncoderEngine() {
  Release();
}

size_t SoftwareEncoderEngine::ComputeQueueDepth(size_t depth, size_t frame_bytes,
                                                size_t ceiling) {
  depth = std::max<size_t>(depth, 1);
  if (frame_bytes == 0 || depth * frame_bytes <= ceiling) return depth;
  return std::max<size_t>(1, ceiling / frame_bytes);
}

EngineStatus SoftwareEncoderEngine::Initialize(const pipeline::ExportSettings& settings) {
  if (!encoder_factory_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "no software encoder available");
  }

  const size_t frame_bytes =
      static_cast<size_t>(settings.width) * static_cast<size_t>(settings.height) * 4;
  effective_depth_ = ComputeQueueDepth(options_.queue_depth, frame_bytes,
                                       options_.frame_memory_ceiling_bytes);
  if (effective_depth_ < options_.queue_depth) {
    std::ostringstream oss;
    oss << "[SoftwareEncoderEngine] queue depth reduced " << options_.queue_depth << " -> "
        << effective_depth_ << " (frame=" << frame_bytes
        << " bytes, ceiling=" << options_.frame_memory_ceiling_bytes << " bytes)";
    util::Logger::Warn(oss.str());
  }

  std::string error;
  if (!temp_dir_.Create(options_.temp_root, "sw", &error)) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "cannot create encoder temp directory", error);
  }
  temp_output_path_ =
      (std::filesystem::path(temp_dir_.path()) /
       (std::string("output") + pipeline::ContainerExtension(settings.format)))
          .string();

  encoder_ = encoder_factory_();
  if (!encoder_) {
    temp_dir_.Remove();
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "software encoder could not be created");
  }

  encode::EncoderOpenParams params;
  params.width = settings.width;
  params.height = settings.height;
  params.fps = settings.fps;
  params.format = settings.format;
  params.quality = settings.quality;
  params.output_path = temp_output_path_;
  EngineStatus status = encoder_->Open(params);
  if (!status.ok) {
    Release();
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "software encoder failed to open: " + status.message,
                                 status.diagnostic);
  }

  pool_.clear();
  for (size_t i = 0; i < effective_depth_; ++i) {
    auto buffer = std::make_unique<PixelBuffer>();
    buffer->Resize(settings.width, settings.height);
    pool_.push_back(std::move(buffer));
  }
  cancel_requested_.store(false, std::memory_order_release);

  std::ostringstream oss;
  oss << "[SoftwareEncoderEngine] initialized " << settings.width << "x" << settings.height
      << "@" << settings.fps << " " << pipeline::ContainerFormatToString(settings.format)
      << " depth=" << effective_depth_;
  util::Logger::Info(oss.str());
  return EngineStatus::Success();
}

std::unique_ptr<PixelBuffer> SoftwareEncoderEngine::AcquireBuffer(const EngineContext& ctx) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (pool_.empty()) {
    if (worker_done_) return nullptr;
    if (!CheckInterrupted(ctx, cancel_requested_).ok) return nullptr;
    cv_.wait_for(lock, kWaitSlice);
  }
  auto buffer = std::move(pool_.back());
  pool_.pop_back();
  return buffer;
}

void SoftwareEncoderEngine::ReturnBuffer(std::unique_ptr<PixelBuffer> buffer) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_.push_back(std::move(buffer));
  }
  cv_.notify_all();
}

void SoftwareEncoderEngine::WorkerLoop() {
  for (;;) {
    QueuedFrame item;
    bool finish = false;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return worker_stop_ || input_closed_ || !queue_.empty(); });
      if (worker_stop_) {
        worker_status_ = EngineStatus::Failure(ExportError::kCancelled, "encoder stopped");
        worker_done_ = true;
        break;
      }
      if (queue_.empty()) {
        finish = true;
      } else {
        item = std::move(queue_.front());
        queue_.pop_front();
      }
    }

    if (finish) {
      EngineStatus status = encoder_->Finish();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        worker_status_ = status;
        worker_done_ = true;
      }
      break;
    }

    pipeline::EncodedFrame frame;
    frame.index = item.index;
    frame.timestamp_seconds = item.timestamp_seconds;
    frame.pixels = item.pixels.get();

    // Audio window first, then the frame it belongs to.
    EngineStatus status = encoder_->EncodeAudio(item.audio);
    if (status.ok) status = encoder_->EncodeFrame(frame);
    ReturnBuffer(std::move(item.pixels));

    if (!status.ok) {
      std::lock_guard<std::mutex> lock(mutex_);
      worker_status_ = status;
      worker_done_ = true;
      break;
    }
    frames_encoded_.fetch_add(1, std::memory_order_acq_rel);
  }
  cv_.notify_all();
}

EngineStatus SoftwareEncoderEngine::Encode(EngineContext& ctx) {
  if (!encoder_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "software encoder used before Initialize()");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    input_closed_ = false;
    worker_stop_ = false;
    worker_done_ = false;
    worker_status_ = EngineStatus::Success();
  }
  frames_encoded_.store(0, std::memory_order_release);
  worker_ = std::thread(&SoftwareEncoderEngine::WorkerLoop, this);

  capture::FrameSequence sequence(ctx.settings, ctx.frames, ctx.mixer);
  const double total = static_cast<double>(std::max<int64_t>(sequence.total_frames(), 1));

  while (sequence.HasNext()) {
    EngineStatus interrupted = CheckInterrupted(ctx, cancel_requested_);
    if (!interrupted.ok) return Teardown(interrupted);

    auto buffer = AcquireBuffer(ctx);
    if (!buffer) {
      interrupted = CheckInterrupted(ctx, cancel_requested_);
      if (!interrupted.ok) return Teardown(interrupted);
      EngineStatus failed;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        failed = worker_status_;
      }
      if (failed.ok) {
        failed = EngineStatus::Failure(ExportError::kIo, "encoder worker stopped early");
      }
      return Teardown(failed);
    }

    QueuedFrame item;
    pipeline::EncodedFrame frame;
    sequence.Next(&frame, &item.audio);
    buffer->Resize(frame.pixels->width, frame.pixels->height);
    std::copy(frame.pixels->rgba.begin(), frame.pixels->rgba.end(), buffer->rgba.begin());
    item.index = frame.index;
    item.timestamp_seconds = frame.timestamp_seconds;
    item.pixels = std::move(buffer);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(std::move(item));
    }
    cv_.notify_all();

    ctx.ReportProgress(JobState::kEncoding, frames_encoded() / total);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    input_closed_ = true;
  }
  cv_.notify_all();

  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_for(lock, kWaitSlice, [this] { return worker_done_; })) break;
    }
    EngineStatus interrupted = CheckInterrupted(ctx, cancel_requested_);
    if (!interrupted.ok) return Teardown(interrupted);
    ctx.ReportProgress(JobState::kEncoding, frames_encoded() / total);
  }
  if (worker_.joinable()) worker_.join();

  if (!worker_status_.ok) {
    return Teardown(worker_status_);
  }
  encoded_ = true;
  ctx.ReportProgress(JobState::kEncoding, 1.0);

  util::JobLog("SoftwareEncoderEngine", ctx.job_id)
      .Info("encoded " + std::to_string(frames_encoded()) + " frames");
  return EngineStatus::Success();
}

EngineStatus SoftwareEncoderEngine::Mux(EngineContext& ctx) {
  if (!encoded_) {
    return EngineStatus::Failure(ExportError::kIo, "nothing encoded to deliver");
  }
  EngineStatus status = DeliverOutputFile(temp_output_path_, ctx.settings.output_path);
  if (!status.ok) return status;
  ctx.ReportProgress(JobState::kMuxing, 1.0);
  temp_dir_.Remove();
  return EngineStatus::Success();
}

void SoftwareEncoderEngine::Cancel() {
  cancel_requested_.store(true, std::memory_order_release);
  cv_.notify_all();
}

void SoftwareEncoderEngine::StopWorker() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    worker_stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

EngineStatus SoftwareEncoderEngine::Teardown(EngineStatus status) {
  Release();
  return status;
}

void SoftwareEncoderEngine::Release() {
  StopWorker();
  if (encoder_) {
    encoder_->Abort();
    encoder_.reset();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    pool_.clear();
  }
  temp_dir_.Remove();
  encoded_ = false;
}

}  // namespace reelforge::engine
