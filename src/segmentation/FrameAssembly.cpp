// Repository: Talkturn
// Component: Frame Assembly Implementation
// Copyright (c) 2025 Talkturn

#include "talkturn/segmentation/FrameAssembly.hpp"

#include <algorithm>
#include <iterator>

namespace talkturn::segmentation {

std::vector<WordFrame> AssembleFrames(std::vector<WordFrame> final_words,
                                      std::vector<WordFrame> interim_words) {
  std::vector<WordFrame> frames;
  frames.reserve(final_words.size() + interim_words.size());

  for (auto& word : final_words) {
    word.is_final = true;
  }
  for (auto& word : interim_words) {
    word.is_final = false;
  }

  std::move(final_words.begin(), final_words.end(), std::back_inserter(frames));
  std::move(interim_words.begin(), interim_words.end(), std::back_inserter(frames));

  std::stable_sort(frames.begin(), frames.end(),
                   [](const WordFrame& a, const WordFrame& b) {
                     return a.start_ms < b.start_ms;
                   });
  return frames;
}

}  // namespace talkturn::segmentation
