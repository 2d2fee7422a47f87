// Repository: ReelForge
// Component: WAV Writer
// Purpose: Writes mixed PCM to a 16-bit little-endian WAV file.
// Copyright (c) 2025 ReelForge

#include "reelforge/audio/WavWriter.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

namespace reelforge::audio {

namespace {

constexpr std::streamoff kRiffSizeOffset = 4;
constexpr std::streamoff kDataSizeOffset = 40;
constexpr uint32_t kHeaderTail = 36;

void PutU16(std::vector<uint8_t>* out, uint16_t v) {
  out->push_back(static_cast<uint8_t>(v & 0xff));
  out->push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void PutU32(std::vector<uint8_t>* out, uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
  }
}

void PutTag(std::vector<uint8_t>* out, const char* tag) {
  out->insert(out->end(), tag, tag + 4);
}

std::vector<uint8_t> Header(uint16_t channels, uint32_t sample_rate, uint32_t data_bytes) {
  std::vector<uint8_t> bytes;
  bytes.reserve(44);
  PutTag(&bytes, "RIFF");
  PutU32(&bytes, kHeaderTail + data_bytes);
  PutTag(&bytes, "WAVE");
  PutTag(&bytes, "fmt ");
  PutU32(&bytes, 16);                           // PCM fmt chunk size
  PutU16(&bytes, 1);                            // PCM
  PutU16(&bytes, channels);
  PutU32(&bytes, sample_rate);
  PutU32(&bytes, sample_rate * channels * 2);   // byte rate
  PutU16(&bytes, static_cast<uint16_t>(channels * 2));  // block align
  PutU16(&bytes, 16);                           // bits per sample
  PutTag(&bytes, "data");
  PutU32(&bytes, data_bytes);
  return bytes;
}

void WriteBytes(std::ofstream* out, const std::vector<uint8_t>& bytes) {
  out->write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
}

}  // namespace

WavStreamWriter::~WavStreamWriter() {
  if (out_.is_open()) out_.close();
}

bool WavStreamWriter::Open(const std::string& path, int sample_rate, int channels,
                           std::string* error) {
  if (sample_rate <= 0 || channels <= 0) {
    if (error) *error = "invalid wav format";
    return false;
  }
  out_.open(path, std::ios::binary | std::ios::trunc);
  if (!out_) {
    if (error) *error = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  path_ = path;
  sample_rate_ = sample_rate;
  channels_ = channels;
  data_bytes_ = 0;
  WriteBytes(&out_, Header(static_cast<uint16_t>(channels), static_cast<uint32_t>(sample_rate), 0));
  if (!out_) {
    if (error) *error = "write failed for " + path;
    return false;
  }
  return true;
}

bool WavStreamWriter::Append(const float* samples, size_t sample_count, std::string* error) {
  if (!out_.is_open()) {
    if (error) *error = "wav writer is not open";
    return false;
  }
  if (sample_count % static_cast<size_t>(channels_) != 0) {
    if (error) *error = "partial sample frame";
    return false;
  }
  if (data_bytes_ + sample_count * 2 > std::numeric_limits<uint32_t>::max() - kHeaderTail) {
    if (error) *error = "wav data exceeds 4 GiB";
    return false;
  }
  std::vector<uint8_t> bytes;
  bytes.reserve(sample_count * 2);
  for (size_t i = 0; i < sample_count; ++i) {
    float clipped = std::clamp(samples[i], -1.0f, 1.0f);
    auto q = static_cast<int16_t>(std::lrint(clipped * 32767.0f));
    PutU16(&bytes, static_cast<uint16_t>(q));
  }
  WriteBytes(&out_, bytes);
  if (!out_) {
    if (error) *error = "write failed for " + path_;
    return false;
  }
  data_bytes_ += bytes.size();
  return true;
}

bool WavStreamWriter::Append(const pipeline::PcmBuffer& pcm, std::string* error) {
  if (pcm.sample_rate != sample_rate_ || pcm.channels != channels_) {
    if (error) *error = "pcm format does not match the wav stream";
    return false;
  }
  return Append(pcm.samples.data(), pcm.samples.size(), error);
}

bool WavStreamWriter::Finish(std::string* error) {
  if (!out_.is_open()) {
    if (error) *error = "wav writer is not open";
    return false;
  }
  const auto data = static_cast<uint32_t>(data_bytes_);
  std::vector<uint8_t> riff;
  PutU32(&riff, kHeaderTail + data);
  std::vector<uint8_t> size;
  PutU32(&size, data);
  out_.seekp(kRiffSizeOffset);
  WriteBytes(&out_, riff);
  out_.seekp(kDataSizeOffset);
  WriteBytes(&out_, size);
  out_.close();
  if (!out_) {
    if (error) *error = "write failed for " + path_;
    return false;
  }
  return true;
}

bool WriteWav16(const std::string& path, const pipeline::PcmBuffer& pcm,
                std::string* error) {
  WavStreamWriter writer;
  if (!writer.Open(path, pcm.sample_rate, pcm.channels, error)) return false;
  if (!writer.Append(pcm, error)) return false;
  return writer.Finish(error);
}

}  // namespace reelforge::audio
