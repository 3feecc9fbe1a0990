#pragma once

#include <cstdint>
#include <vector>

namespace sitescan::vision {

/// Raw model output (boxes, class scores) before decoding into HazardDetections.
struct InferenceResult {
  std::vector<float> boxes;  // [x1,y1,x2,y2] per detection
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
  /// Model input size the boxes refer to. 0 means boxes are already normalized (0-1).
  std::uint32_t input_width{0};
  std::uint32_t input_height{0};
};

}  // namespace sitescan::vision
