// Repository: Talkturn
// Component: Segmentation Metrics
// Purpose: Passive observability counters for a segmentation fold
// Copyright (c) 2025 Talkturn
//
// These metrics are passive observations only. They do NOT affect grouping
// decisions. They exist so a live host can see why segments are being cut
// (gap vs. identity change) without re-deriving it from the output.

#ifndef TALKTURN_SEGMENTATION_METRICS_HPP_
#define TALKTURN_SEGMENTATION_METRICS_HPP_

#include <cstdint>
#include <sstream>
#include <string>

namespace talkturn::segmentation {

// =============================================================================
// SegmentationMetrics
// Accumulated per-fold counters, owned by a SegmentAccumulator.
// Not thread-safe; same serialization rule as the accumulator itself.
// =============================================================================

struct SegmentationMetrics {
  // ---- Input ----
  int64_t frames_ingested = 0;
  int64_t final_frames = 0;
  int64_t interim_frames = 0;

  // ---- Output ----
  int64_t segments_opened = 0;

  // ---- Split Causes ----
  // A tail segment existed but the candidate could not extend it.
  int64_t splits_by_gap = 0;   // Same key, gap > max_gap_ms
  int64_t splits_by_key = 0;   // Key differed from the tail's key

  // ---- Continuity ----
  int64_t interim_continuity_reuses = 0;  // Interim key taken from open segment
  int64_t max_merged_gap_ms = 0;          // Largest gap that still merged

  // Generate Prometheus text exposition format
  std::string GeneratePrometheusText() const {
    std::ostringstream oss;

    oss << "# HELP talkturn_segmentation_frames_ingested_total Frames folded into segments\n";
    oss << "# TYPE talkturn_segmentation_frames_ingested_total counter\n";
    oss << "talkturn_segmentation_frames_ingested_total " << frames_ingested << "\n";

    oss << "# HELP talkturn_segmentation_frames_total Frames by finality\n";
    oss << "# TYPE talkturn_segmentation_frames_total counter\n";
    oss << "talkturn_segmentation_frames_total{finality=\"final\"} " << final_frames << "\n";
    oss << "talkturn_segmentation_frames_total{finality=\"interim\"} " << interim_frames << "\n";

    oss << "# HELP talkturn_segmentation_segments_opened_total Proto-segments created\n";
    oss << "# TYPE talkturn_segmentation_segments_opened_total counter\n";
    oss << "talkturn_segmentation_segments_opened_total " << segments_opened << "\n";

    oss << "# HELP talkturn_segmentation_splits_total Segment cuts by cause\n";
    oss << "# TYPE talkturn_segmentation_splits_total counter\n";
    oss << "talkturn_segmentation_splits_total{cause=\"gap\"} " << splits_by_gap << "\n";
    oss << "talkturn_segmentation_splits_total{cause=\"key\"} " << splits_by_key << "\n";

    oss << "# HELP talkturn_segmentation_interim_continuity_reuses_total Interim frames keyed by open segment\n";
    oss << "# TYPE talkturn_segmentation_interim_continuity_reuses_total counter\n";
    oss << "talkturn_segmentation_interim_continuity_reuses_total "
        << interim_continuity_reuses << "\n";

    oss << "# HELP talkturn_segmentation_max_merged_gap_ms Largest gap that extended a segment\n";
    oss << "# TYPE talkturn_segmentation_max_merged_gap_ms gauge\n";
    oss << "talkturn_segmentation_max_merged_gap_ms " << max_merged_gap_ms << "\n";

    return oss.str();
  }
};

}  // namespace talkturn::segmentation

#endif  // TALKTURN_SEGMENTATION_METRICS_HPP_
