// Repository: Talkturn
// Component: Segmentation Replay Harness
// Purpose: Replay a recorded word-frame stream through the segment builder
// Copyright (c) 2025 Talkturn
//
// This binary is for diagnostics and fixture inspection. It plays the role
// of the upstream recognizer (frames come from a file) and of the
// downstream renderer (segments go to stdout).
//
// MODES OF OPERATION:
// 1. Batch mode (default): BuildSegments over the whole file
// 2. Incremental mode: --incremental folds frame by frame, as a live host would

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "talkturn/segmentation/FrameFileReader.hpp"
#include "talkturn/segmentation/FrameOrderValidator.hpp"
#include "talkturn/segmentation/SegmentBuilder.hpp"
#include "talkturn/segmentation/SegmentationTypes.hpp"
#include "talkturn/util/Logger.hpp"

namespace {

using talkturn::segmentation::FrameOrderValidator;
using talkturn::segmentation::ProtoSegment;
using talkturn::segmentation::SegmentAccumulator;
using talkturn::segmentation::SegmenterConfig;
using talkturn::segmentation::SegmentationErrorToString;
using talkturn::segmentation::SegmentationMetrics;
using talkturn::segmentation::WordFrame;
using talkturn::util::Logger;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitValidation = 2;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string frames_path;
  int64_t max_gap_ms = SegmenterConfig::kDefaultMaxGapMs;
  bool validate = false;
  bool incremental = false;
  bool metrics = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --frames PATH [OPTIONS]\n"
            << "\n"
            << "Replays a recorded word-frame stream and prints speaker segments.\n"
            << "\n"
            << "INPUT:\n"
            << "  --frames PATH        Tab-separated frame file\n"
            << "                       (start end channel F|I speaker_index|- human_id|- text)\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --max-gap-ms N       Max silence that still extends a segment (default: "
            << SegmenterConfig::kDefaultMaxGapMs << ")\n"
            << "  --validate           Reject out-of-order or malformed timing (exit 2)\n"
            << "  --incremental        Fold frame by frame through SegmentAccumulator\n"
            << "  --metrics            Print Prometheus metrics after the segments (implies --incremental)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  TALKTURN_DEBUG=1     Log every segment open\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --frames session.tsv --validate\n"
            << "  " << program_name << " --frames session.tsv --max-gap-ms 800 --incremental --metrics\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--frames" && i + 1 < argc) {
      args.frames_path = argv[++i];
    } else if (arg == "--max-gap-ms" && i + 1 < argc) {
      std::string value = argv[++i];
      try {
        size_t consumed = 0;
        args.max_gap_ms = std::stoll(value, &consumed);
        if (consumed != value.size()) {
          args.error = "Invalid --max-gap-ms: " + value;
          return args;
        }
      } catch (const std::exception&) {
        args.error = "Invalid --max-gap-ms: " + value;
        return args;
      }
    } else if (arg == "--validate") {
      args.validate = true;
    } else if (arg == "--incremental") {
      args.incremental = true;
    } else if (arg == "--metrics") {
      args.metrics = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.frames_path.empty()) {
    args.error = "Must specify --frames";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Output
// =============================================================================

void PrintSegment(const ProtoSegment& segment) {
  std::cout << "[" << std::setw(8) << segment.StartMs() << " - "
            << std::setw(8) << segment.EndMs() << "] "
            << segment.key.ToString()
            << " words=" << segment.words.size();
  if (segment.HasInterimWords()) {
    std::cout << " [interim]";
  }
  std::cout << " " << segment.JoinedText() << "\n";
}

}  // namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  SegmenterConfig config;
  config.max_gap_ms = args.max_gap_ms;
  auto config_result = talkturn::segmentation::ValidateSegmenterConfig(config);
  if (!config_result.valid) {
    std::cerr << "Error: " << SegmentationErrorToString(config_result.error)
              << " " << config_result.detail << "\n";
    return kExitUsage;
  }

  auto file = talkturn::segmentation::ReadFrameFile(args.frames_path);
  if (!file.valid) {
    std::cerr << "[REPLAY] " << SegmentationErrorToString(file.error);
    if (file.line_number > 0) {
      std::cerr << " line=" << file.line_number;
    }
    std::cerr << " " << file.detail << "\n";
    return kExitUsage;
  }

  if (args.validate) {
    FrameOrderValidator validator;
    auto result = validator.Validate(file.frames);
    if (!result.valid) {
      // Validator already logged the violation.
      return kExitValidation;
    }
  }

  // --metrics needs the accumulator's counters, so it implies a
  // frame-by-frame fold.
  std::vector<ProtoSegment> segments;
  SegmentationMetrics metrics;
  const bool incremental = args.incremental || args.metrics;
  if (incremental) {
    SegmentAccumulator accumulator(config);
    for (const WordFrame& frame : file.frames) {
      accumulator.Ingest(frame);
    }
    metrics = accumulator.Metrics();
    segments = accumulator.Release();
  } else {
    segments = talkturn::segmentation::BuildSegments(file.frames, config);
  }

  {
    std::ostringstream oss;
    oss << "[REPLAY] frames=" << file.frames.size()
        << " segments=" << segments.size()
        << " max_gap_ms=" << config.max_gap_ms
        << " mode=" << (incremental ? "incremental" : "batch");
    Logger::Info(oss.str());
  }

  for (const auto& segment : segments) {
    PrintSegment(segment);
  }

  if (args.metrics) {
    std::cout << "\n" << metrics.GeneratePrometheusText();
  }

  return kExitOk;
}
