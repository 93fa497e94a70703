// Repository: Talkturn
// Component: Frame Order Validator
// Purpose: Pipeline-boundary check of the upstream frame ordering contract
// Copyright (c) 2025 Talkturn

#ifndef TALKTURN_SEGMENTATION_FRAME_ORDER_VALIDATOR_HPP_
#define TALKTURN_SEGMENTATION_FRAME_ORDER_VALIDATOR_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "talkturn/segmentation/SegmentationTypes.hpp"

namespace talkturn::segmentation {

// =============================================================================
// Frame Order Validator
// The segmentation fold assumes frames arrive in non-decreasing start_ms
// order and does not check it. Hosts run this validator where frames enter
// the pipeline so violations are reported there, with the offending frame,
// instead of silently corrupting grouping.
//
// The validator never reorders or corrects frames. Each violation is logged
// once via Logger::Error.
// =============================================================================

class FrameOrderValidator {
 public:
  FrameOrderValidator() = default;

  struct ValidationResult {
    bool valid;
    SegmentationError error;
    std::string detail;
    int64_t frame_index;  // Offending frame, -1 if valid

    static ValidationResult Success() {
      return {true, SegmentationError::kNone, "", -1};
    }

    static ValidationResult Failure(SegmentationError err, int64_t index,
                                    const std::string& detail = "") {
      return {false, err, detail, index};
    }
  };

  // Batch check of a whole sequence, fail fast on first violation.
  // Does not touch the streaming watermark.
  ValidationResult Validate(const std::vector<WordFrame>& frames) const;

  // Streaming check of the next frame against the last accepted one.
  // Accepted frames advance the watermark; rejected frames do not.
  // frame_index is the frame's position in the stream since the last Reset,
  // counting rejected frames.
  ValidationResult ValidateNext(const WordFrame& frame);

  // Forget the watermark (new session).
  void Reset();

  // Number of frames accepted by ValidateNext since the last Reset.
  int64_t AcceptedCount() const { return accepted_count_; }

 private:
  // Checks in order: negative start, inverted timing, regression.
  static ValidationResult CheckFrame(const WordFrame& frame,
                                     std::optional<int64_t> previous_start_ms,
                                     int64_t index);

  static void LogViolation(const ValidationResult& result);

  std::optional<int64_t> last_start_ms_;
  int64_t presented_count_ = 0;
  int64_t accepted_count_ = 0;
};

// Rejects negative max_gap_ms.
FrameOrderValidator::ValidationResult ValidateSegmenterConfig(
    const SegmenterConfig& config);

}  // namespace talkturn::segmentation

#endif  // TALKTURN_SEGMENTATION_FRAME_ORDER_VALIDATOR_HPP_
