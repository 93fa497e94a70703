// Repository: Talkturn
// Component: Frame File Reader Implementation
// Copyright (c) 2025 Talkturn

#include "talkturn/segmentation/FrameFileReader.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace talkturn::segmentation {

namespace {

constexpr char kAbsentField[] = "-";
constexpr size_t kFixedFieldCount = 6;

template <typename T>
bool ParseInteger(const std::string& field, T& out) {
  if (field.empty()) return false;
  const char* begin = field.data();
  const char* end = field.data() + field.size();
  auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end;
}

bool ParseFinality(const std::string& field, bool& out) {
  if (field == "F" || field == "1") {
    out = true;
    return true;
  }
  if (field == "I" || field == "0") {
    out = false;
    return true;
  }
  return false;
}

// Splits off the first kFixedFieldCount tab-separated fields; whatever
// follows the sixth tab is the text.
bool SplitFields(const std::string& line,
                 std::vector<std::string>& fields,
                 std::string& text) {
  size_t pos = 0;
  for (size_t i = 0; i < kFixedFieldCount; ++i) {
    size_t tab = line.find('\t', pos);
    if (tab == std::string::npos) {
      if (i + 1 != kFixedFieldCount) return false;
      fields.push_back(line.substr(pos));
      return true;
    }
    fields.push_back(line.substr(pos, tab - pos));
    pos = tab + 1;
  }
  text = line.substr(pos);
  return true;
}

}  // namespace

FrameLineResult ParseFrameLine(const std::string& raw_line) {
  std::string line = raw_line;
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  if (line.find_first_not_of(" \t") == std::string::npos || line[0] == '#') {
    return FrameLineResult::Skip();
  }

  std::vector<std::string> fields;
  std::string text;
  if (!SplitFields(line, fields, text)) {
    std::ostringstream detail;
    detail << "expected at least " << kFixedFieldCount << " tab-separated fields";
    return FrameLineResult::Failure(SegmentationError::kMalformedFrameLine,
                                    detail.str());
  }

  WordFrame frame;
  if (!ParseInteger(fields[0], frame.start_ms)) {
    return FrameLineResult::Failure(SegmentationError::kMalformedFrameLine,
                                    "bad start_ms '" + fields[0] + "'");
  }
  if (!ParseInteger(fields[1], frame.end_ms)) {
    return FrameLineResult::Failure(SegmentationError::kMalformedFrameLine,
                                    "bad end_ms '" + fields[1] + "'");
  }
  if (!ParseInteger(fields[2], frame.channel)) {
    return FrameLineResult::Failure(SegmentationError::kMalformedFrameLine,
                                    "bad channel '" + fields[2] + "'");
  }
  if (!ParseFinality(fields[3], frame.is_final)) {
    return FrameLineResult::Failure(SegmentationError::kMalformedFrameLine,
                                    "bad finality '" + fields[3] + "' (want F or I)");
  }

  SpeakerIdentity identity;
  if (fields[4] != kAbsentField) {
    int32_t index = 0;
    if (!ParseInteger(fields[4], index)) {
      return FrameLineResult::Failure(SegmentationError::kMalformedFrameLine,
                                      "bad speaker_index '" + fields[4] + "'");
    }
    identity.speaker_index = index;
  }
  if (fields[5] != kAbsentField) {
    if (fields[5].empty()) {
      return FrameLineResult::Failure(SegmentationError::kMalformedFrameLine,
                                      "empty human_id (use '-' for absent)");
    }
    identity.human_id = fields[5];
  }
  if (identity.speaker_index.has_value() || identity.human_id.has_value()) {
    frame.identity = std::move(identity);
  }

  frame.text = std::move(text);
  return FrameLineResult::Success(std::move(frame));
}

FrameFileResult ParseFrameText(const std::string& text) {
  std::vector<WordFrame> frames;
  std::istringstream stream(text);
  std::string line;
  int64_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    auto parsed = ParseFrameLine(line);
    if (!parsed.valid) {
      return FrameFileResult::Failure(parsed.error, line_number, parsed.detail);
    }
    if (parsed.skipped) continue;
    frames.push_back(std::move(parsed.frame));
  }

  return FrameFileResult::Success(std::move(frames));
}

FrameFileResult ReadFrameFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return FrameFileResult::Failure(SegmentationError::kFrameFileUnreadable, 0,
                                    "cannot open " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ParseFrameText(buffer.str());
}

}  // namespace talkturn::segmentation
