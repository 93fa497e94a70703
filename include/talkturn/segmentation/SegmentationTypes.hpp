// Repository: Talkturn
// Component: Segmentation Types
// Purpose: Data structures for speaker-attributed transcript segmentation
// Copyright (c) 2025 Talkturn

#ifndef TALKTURN_SEGMENTATION_TYPES_HPP_
#define TALKTURN_SEGMENTATION_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace talkturn::segmentation {

// Opaque audio source / diarization track identifier.
using ChannelId = int32_t;

// =============================================================================
// Error Codes
// Reported at the pipeline boundary only. The segmentation fold itself is
// total and never fails.
// =============================================================================

enum class SegmentationError {
  // No error
  kNone = 0,

  // start_ms lower than the previous frame's start_ms
  kTimestampRegression,

  // end_ms < start_ms
  kInvertedFrameTiming,

  // start_ms < 0
  kNegativeTimestamp,

  // SegmenterConfig::max_gap_ms < 0
  kInvalidMaxGap,

  // Frame file line could not be parsed
  kMalformedFrameLine,

  // Frame file could not be opened
  kFrameFileUnreadable,
};

// Convert error code to string for logging
const char* SegmentationErrorToString(SegmentationError error);

// =============================================================================
// Speaker Identity
// Tentative identity attached upstream by diarization / user assignment.
// Either, both, or neither field may be present.
// =============================================================================

struct SpeakerIdentity {
  std::optional<int32_t> speaker_index;  // Provider diarization index
  std::optional<std::string> human_id;   // Resolved person

  bool operator==(const SpeakerIdentity& other) const {
    return speaker_index == other.speaker_index && human_id == other.human_id;
  }
  bool operator!=(const SpeakerIdentity& other) const { return !(*this == other); }
};

// =============================================================================
// Word Frame
// One recognized word. Owned by the caller; the engine only reads it.
// =============================================================================

struct WordFrame {
  std::string text;     // Never inspected by the engine
  int64_t start_ms = 0;
  int64_t end_ms = 0;   // Expected >= start_ms
  ChannelId channel = 0;
  bool is_final = false;  // false = interim hypothesis
  std::optional<SpeakerIdentity> identity;  // nullopt = unknown speaker

  bool operator==(const WordFrame& other) const {
    return text == other.text && start_ms == other.start_ms &&
           end_ms == other.end_ms && channel == other.channel &&
           is_final == other.is_final && identity == other.identity;
  }
  bool operator!=(const WordFrame& other) const { return !(*this == other); }
};

// =============================================================================
// Segment Key
// (channel, speaker_index?, human_id?). Presence is part of the value:
// a present field never equals an absent one, even if it holds 0 / "".
// =============================================================================

struct SegmentKey {
  ChannelId channel = 0;
  std::optional<int32_t> speaker_index;
  std::optional<std::string> human_id;

  // Copies only the fields present on identity; nullopt yields a
  // channel-only key.
  static SegmentKey FromIdentity(ChannelId channel,
                                 const std::optional<SpeakerIdentity>& identity);

  bool operator==(const SegmentKey& other) const {
    return channel == other.channel &&
           speaker_index == other.speaker_index &&
           human_id == other.human_id;
  }
  bool operator!=(const SegmentKey& other) const { return !(*this == other); }

  // "ch=1 idx=5 human=alice"; absent fields are omitted.
  std::string ToString() const;
};

// =============================================================================
// Proto-Segment
// Maximal same-key run of frames bounded by the gap threshold.
// Non-empty; key fixed at creation; words append-only within a pass.
// =============================================================================

struct ProtoSegment {
  SegmentKey key;
  std::vector<WordFrame> words;

  int64_t StartMs() const { return words.empty() ? 0 : words.front().start_ms; }
  int64_t EndMs() const { return words.empty() ? 0 : words.back().end_ms; }

  // True while any word is still an interim hypothesis. The key of such a
  // segment may be an approximation that a later final frame contradicts.
  bool HasInterimWords() const;

  // Word texts joined with single spaces; empty texts are skipped.
  std::string JoinedText() const;
};

// =============================================================================
// Segmenter Configuration
// POD struct - read-only during a fold, reusable across calls.
// =============================================================================

struct SegmenterConfig {
  static constexpr int64_t kDefaultMaxGapMs = 2000;

  // Max silence between the open segment's last word end and the next
  // candidate's start for the candidate to extend the segment.
  int64_t max_gap_ms = kDefaultMaxGapMs;
};

}  // namespace talkturn::segmentation

#endif  // TALKTURN_SEGMENTATION_TYPES_HPP_
