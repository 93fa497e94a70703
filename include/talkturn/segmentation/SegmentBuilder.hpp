// Repository: Talkturn
// Component: Segment Builder
// Purpose: Single-pass grouping of word frames into speaker-attributed segments
// Copyright (c) 2025 Talkturn

#ifndef TALKTURN_SEGMENTATION_SEGMENT_BUILDER_HPP_
#define TALKTURN_SEGMENTATION_SEGMENT_BUILDER_HPP_

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "talkturn/segmentation/SegmentationMetrics.hpp"
#include "talkturn/segmentation/SegmentationTypes.hpp"

namespace talkturn::segmentation {

// =============================================================================
// Segment Accumulator
// Long-lived fold state for live transcription. Each Ingest() applies the
// per-frame step once; BuildSegments() is a fold over a fresh accumulator.
//
// Two notions of "last segment" are kept on purpose:
//   - the global tail of segments_ decides whether a frame MERGES;
//   - open_by_channel_ decides which KEY an interim frame gets.
// A channel can never extend one of its own earlier segments once another
// segment has been appended after it.
//
// Preconditions: frames arrive in non-decreasing start_ms order (checked,
// if at all, by FrameOrderValidator before Ingest). Not thread-safe; callers
// serialize ingestion.
// =============================================================================

class SegmentAccumulator {
 public:
  explicit SegmentAccumulator(SegmenterConfig config = {});

  // Fold one frame. Never fails.
  void Ingest(const WordFrame& frame);

  // Fold frames in order.
  void IngestAll(const std::vector<WordFrame>& frames);

  // Segments built so far, in output order.
  const std::vector<ProtoSegment>& Segments() const { return segments_; }

  // Key of the segment most recently created or extended on channel, or
  // nullopt if the channel has not been seen.
  std::optional<SegmentKey> OpenSegmentKey(ChannelId channel) const;

  // Move the segments out and reset to the empty state.
  std::vector<ProtoSegment> Release();

  // Drop all state (segments, channel map, metrics).
  void Clear();

  const SegmentationMetrics& Metrics() const { return metrics_; }
  const SegmenterConfig& Config() const { return config_; }

 private:
  // Continuity rule: interim frames inherit the open key of their channel;
  // final frames always derive a fresh key from their own identity.
  SegmentKey ResolveKey(const WordFrame& frame);

  SegmenterConfig config_;
  std::vector<ProtoSegment> segments_;

  // channel -> index into segments_ (indices survive vector growth)
  std::unordered_map<ChannelId, size_t> open_by_channel_;

  SegmentationMetrics metrics_;
};

// Batch form: deterministic, total, O(n). Empty input yields empty output.
std::vector<ProtoSegment> BuildSegments(const std::vector<WordFrame>& frames,
                                        const SegmenterConfig& config = {});

}  // namespace talkturn::segmentation

#endif  // TALKTURN_SEGMENTATION_SEGMENT_BUILDER_HPP_
