// Repository: Talkturn
// Component: Frame Order Validator Implementation
// Copyright (c) 2025 Talkturn

#include "talkturn/segmentation/FrameOrderValidator.hpp"

#include <sstream>

#include "talkturn/util/Logger.hpp"

namespace talkturn::segmentation {

using talkturn::util::Logger;

FrameOrderValidator::ValidationResult FrameOrderValidator::CheckFrame(
    const WordFrame& frame,
    std::optional<int64_t> previous_start_ms,
    int64_t index) {
  if (frame.start_ms < 0) {
    std::ostringstream detail;
    detail << "start_ms (" << frame.start_ms << ") < 0";
    return ValidationResult::Failure(
        SegmentationError::kNegativeTimestamp, index, detail.str());
  }

  if (frame.end_ms < frame.start_ms) {
    std::ostringstream detail;
    detail << "end_ms (" << frame.end_ms
           << ") < start_ms (" << frame.start_ms << ")";
    return ValidationResult::Failure(
        SegmentationError::kInvertedFrameTiming, index, detail.str());
  }

  // Equal start_ms is allowed (non-decreasing).
  if (previous_start_ms.has_value() && frame.start_ms < *previous_start_ms) {
    std::ostringstream detail;
    detail << "start_ms (" << frame.start_ms
           << ") regressed below previous start_ms (" << *previous_start_ms
           << ") on channel " << frame.channel;
    return ValidationResult::Failure(
        SegmentationError::kTimestampRegression, index, detail.str());
  }

  return ValidationResult::Success();
}

void FrameOrderValidator::LogViolation(const ValidationResult& result) {
  std::ostringstream oss;
  oss << "[FrameOrderValidator] VIOLATION error="
      << SegmentationErrorToString(result.error)
      << " frame_index=" << result.frame_index << " " << result.detail;
  Logger::Error(oss.str());
}

FrameOrderValidator::ValidationResult FrameOrderValidator::Validate(
    const std::vector<WordFrame>& frames) const {
  std::optional<int64_t> previous;
  for (size_t i = 0; i < frames.size(); ++i) {
    auto result = CheckFrame(frames[i], previous, static_cast<int64_t>(i));
    if (!result.valid) {
      LogViolation(result);
      return result;
    }
    previous = frames[i].start_ms;
  }
  return ValidationResult::Success();
}

FrameOrderValidator::ValidationResult FrameOrderValidator::ValidateNext(
    const WordFrame& frame) {
  const int64_t index = presented_count_++;
  auto result = CheckFrame(frame, last_start_ms_, index);
  if (!result.valid) {
    LogViolation(result);
    return result;
  }
  last_start_ms_ = frame.start_ms;
  accepted_count_++;
  return result;
}

void FrameOrderValidator::Reset() {
  last_start_ms_.reset();
  presented_count_ = 0;
  accepted_count_ = 0;
}

FrameOrderValidator::ValidationResult ValidateSegmenterConfig(
    const SegmenterConfig& config) {
  if (config.max_gap_ms < 0) {
    std::ostringstream detail;
    detail << "max_gap_ms (" << config.max_gap_ms << ") < 0";
    return FrameOrderValidator::ValidationResult::Failure(
        SegmentationError::kInvalidMaxGap, -1, detail.str());
  }
  return FrameOrderValidator::ValidationResult::Success();
}

}  // namespace talkturn::segmentation
