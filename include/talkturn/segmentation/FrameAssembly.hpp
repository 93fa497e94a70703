// Repository: Talkturn
// Component: Frame Assembly
// Purpose: Merge committed and interim recognizer words into one ordered stream
// Copyright (c) 2025 Talkturn

#ifndef TALKTURN_SEGMENTATION_FRAME_ASSEMBLY_HPP_
#define TALKTURN_SEGMENTATION_FRAME_ASSEMBLY_HPP_

#include <vector>

#include "talkturn/segmentation/SegmentationTypes.hpp"

namespace talkturn::segmentation {

// Recognizers report committed words and the current interim tail as two
// lists. AssembleFrames stamps is_final on each (true for final_words, false
// for interim_words) and returns them as one sequence ordered by start_ms,
// ready for BuildSegments.
//
// Ordering is stable: on equal start_ms, finals precede interims and each
// list keeps its own relative order.
std::vector<WordFrame> AssembleFrames(std::vector<WordFrame> final_words,
                                      std::vector<WordFrame> interim_words);

}  // namespace talkturn::segmentation

#endif  // TALKTURN_SEGMENTATION_FRAME_ASSEMBLY_HPP_
