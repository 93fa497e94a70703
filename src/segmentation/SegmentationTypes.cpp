// Repository: Talkturn
// Component: Segmentation Types Implementation
// Copyright (c) 2025 Talkturn

#include "talkturn/segmentation/SegmentationTypes.hpp"

#include <sstream>

namespace talkturn::segmentation {

// New error codes may be added; existing codes must not change meaning
const char* SegmentationErrorToString(SegmentationError error) {
  switch (error) {
    case SegmentationError::kNone:
      return "NONE";
    case SegmentationError::kTimestampRegression:
      return "TIMESTAMP_REGRESSION";
    case SegmentationError::kInvertedFrameTiming:
      return "INVERTED_FRAME_TIMING";
    case SegmentationError::kNegativeTimestamp:
      return "NEGATIVE_TIMESTAMP";
    case SegmentationError::kInvalidMaxGap:
      return "INVALID_MAX_GAP";
    case SegmentationError::kMalformedFrameLine:
      return "MALFORMED_FRAME_LINE";
    case SegmentationError::kFrameFileUnreadable:
      return "FRAME_FILE_UNREADABLE";
  }
  return "UNKNOWN_ERROR";
}

SegmentKey SegmentKey::FromIdentity(
    ChannelId channel,
    const std::optional<SpeakerIdentity>& identity) {
  SegmentKey key;
  key.channel = channel;
  if (identity.has_value()) {
    if (identity->speaker_index.has_value()) {
      key.speaker_index = identity->speaker_index;
    }
    if (identity->human_id.has_value()) {
      key.human_id = identity->human_id;
    }
  }
  return key;
}

std::string SegmentKey::ToString() const {
  std::ostringstream oss;
  oss << "ch=" << channel;
  if (speaker_index.has_value()) {
    oss << " idx=" << *speaker_index;
  }
  if (human_id.has_value()) {
    oss << " human=" << *human_id;
  }
  return oss.str();
}

bool ProtoSegment::HasInterimWords() const {
  for (const auto& word : words) {
    if (!word.is_final) {
      return true;
    }
  }
  return false;
}

std::string ProtoSegment::JoinedText() const {
  std::string out;
  for (const auto& word : words) {
    if (word.text.empty()) continue;
    if (!out.empty()) out += ' ';
    out += word.text;
  }
  return out;
}

}  // namespace talkturn::segmentation
