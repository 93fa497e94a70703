// Repository: Talkturn
// Component: Frame File Reader
// Purpose: Parse recorded word-frame streams for replay and tests
// Copyright (c) 2025 Talkturn
//
// Format: one frame per line, tab-separated:
//
//   start_ms  end_ms  channel  final  speaker_index  human_id  text
//
//   final          F / I (or 1 / 0)
//   speaker_index  integer, or '-' when absent
//   human_id       string, or '-' when absent
//   text           rest of the line, may contain spaces, may be missing
//
// Blank lines and lines starting with '#' are skipped. A frame whose
// speaker_index and human_id are both '-' has no identity.

#ifndef TALKTURN_SEGMENTATION_FRAME_FILE_READER_HPP_
#define TALKTURN_SEGMENTATION_FRAME_FILE_READER_HPP_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "talkturn/segmentation/SegmentationTypes.hpp"

namespace talkturn::segmentation {

struct FrameLineResult {
  bool valid;
  bool skipped;  // Blank or comment line; frame is unset
  SegmentationError error;
  std::string detail;
  WordFrame frame;

  static FrameLineResult Success(WordFrame f) {
    return {true, false, SegmentationError::kNone, "", std::move(f)};
  }
  static FrameLineResult Skip() {
    return {true, true, SegmentationError::kNone, "", {}};
  }
  static FrameLineResult Failure(SegmentationError err, const std::string& detail) {
    return {false, false, err, detail, {}};
  }
};

struct FrameFileResult {
  bool valid;
  SegmentationError error;
  std::string detail;
  int64_t line_number;  // 1-based line of the failure, 0 if valid or unreadable
  std::vector<WordFrame> frames;

  static FrameFileResult Success(std::vector<WordFrame> f) {
    return {true, SegmentationError::kNone, "", 0, std::move(f)};
  }
  static FrameFileResult Failure(SegmentationError err, int64_t line,
                                 const std::string& detail) {
    return {false, err, detail, line, {}};
  }
};

// Parse a single line (without its trailing newline; a trailing '\r' is
// tolerated).
FrameLineResult ParseFrameLine(const std::string& line);

// Parse a whole document, fail fast on the first malformed line.
FrameFileResult ParseFrameText(const std::string& text);

// Read and parse a file.
FrameFileResult ReadFrameFile(const std::string& path);

}  // namespace talkturn::segmentation

#endif  // TALKTURN_SEGMENTATION_FRAME_FILE_READER_HPP_
