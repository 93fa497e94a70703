// Repository: Talkturn
// Component: Segment Builder Implementation
// Copyright (c) 2025 Talkturn

#include "talkturn/segmentation/SegmentBuilder.hpp"

#include <limits>
#include <sstream>
#include <utility>

#include "talkturn/util/Logger.hpp"

namespace talkturn::segmentation {

using talkturn::util::Logger;

namespace {

// start_ms - end_ms, saturated so unvalidated extreme timestamps cannot
// overflow.
int64_t GapMs(int64_t start_ms, int64_t end_ms) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  if (end_ms < 0 && start_ms > kMax + end_ms) return kMax;
  if (end_ms > 0 && start_ms < kMin + end_ms) return kMin;
  return start_ms - end_ms;
}

}  // namespace

SegmentAccumulator::SegmentAccumulator(SegmenterConfig config)
    : config_(config) {}

SegmentKey SegmentAccumulator::ResolveKey(const WordFrame& frame) {
  if (!frame.is_final) {
    auto it = open_by_channel_.find(frame.channel);
    if (it != open_by_channel_.end()) {
      metrics_.interim_continuity_reuses++;
      return segments_[it->second].key;
    }
  }
  return SegmentKey::FromIdentity(frame.channel, frame.identity);
}

void SegmentAccumulator::Ingest(const WordFrame& frame) {
  metrics_.frames_ingested++;
  if (frame.is_final) {
    metrics_.final_frames++;
  } else {
    metrics_.interim_frames++;
  }

  SegmentKey key = ResolveKey(frame);

  // Merge eligibility is decided against the global tail only.
  if (!segments_.empty()) {
    ProtoSegment& last = segments_.back();
    const int64_t gap = GapMs(frame.start_ms, last.words.back().end_ms);
    if (last.key == key) {
      if (gap <= config_.max_gap_ms) {
        last.words.push_back(frame);
        open_by_channel_[frame.channel] = segments_.size() - 1;
        if (gap > metrics_.max_merged_gap_ms) {
          metrics_.max_merged_gap_ms = gap;
        }
        return;
      }
      metrics_.splits_by_gap++;
    } else {
      metrics_.splits_by_key++;
    }
  }

  ProtoSegment segment;
  segment.key = std::move(key);
  segment.words.push_back(frame);
  segments_.push_back(std::move(segment));
  open_by_channel_[frame.channel] = segments_.size() - 1;
  metrics_.segments_opened++;

  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[SegmentAccumulator] SEGMENT_OPEN index=" << (segments_.size() - 1)
        << " " << segments_.back().key.ToString()
        << " start_ms=" << frame.start_ms
        << " final=" << (frame.is_final ? 1 : 0);
    Logger::Debug(oss.str());
  }
}

void SegmentAccumulator::IngestAll(const std::vector<WordFrame>& frames) {
  for (const auto& frame : frames) {
    Ingest(frame);
  }
}

std::optional<SegmentKey> SegmentAccumulator::OpenSegmentKey(
    ChannelId channel) const {
  auto it = open_by_channel_.find(channel);
  if (it == open_by_channel_.end()) {
    return std::nullopt;
  }
  return segments_[it->second].key;
}

std::vector<ProtoSegment> SegmentAccumulator::Release() {
  std::vector<ProtoSegment> out = std::move(segments_);
  Clear();
  return out;
}

void SegmentAccumulator::Clear() {
  segments_.clear();
  open_by_channel_.clear();
  metrics_ = SegmentationMetrics{};
}

std::vector<ProtoSegment> BuildSegments(const std::vector<WordFrame>& frames,
                                        const SegmenterConfig& config) {
  SegmentAccumulator accumulator(config);
  accumulator.IngestAll(frames);
  return accumulator.Release();
}

}  // namespace talkturn::segmentation
