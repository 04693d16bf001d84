#pragma once

#include "accel/backend.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace mediaprep::accel {

struct Dimensions {
  int width = 0;
  int height = 0;
};

// Aspect-preserving fit. When the longer side exceeds `max_dimension` it is
// scaled down to exactly `max_dimension`; otherwise the source size is kept.
// Each returned side is at least 1.
Dimensions FitWithin(int width, int height, int max_dimension);

// Exact fit into a `box_width` x `box_height` box keeping aspect ratio; used by
// `image.preprocess` with keep_aspect=true.
Dimensions FitInsideBox(int width, int height, int box_width, int box_height);

// What a resize call actually did. `executed` differs from `requested` when
// the requested backend had no kernel for this input and the reference path
// ran instead; `fallback_reason` then says why.
struct ResizeReport {
  Backend requested = Backend::kReference;
  Backend executed = Backend::kReference;
  std::string fallback_reason;

  bool fell_back() const {
    return requested != executed;
  }
};

// Resizes `src` to exactly `dst_width` x `dst_height`.
//
// Filter choice is the same on every backend: area averaging when shrinking,
// Lanczos when enlarging. Pixel values may differ slightly between backends;
// dimensions never do. Accelerated paths that cannot handle the input fall
// back to the reference path within this call instead of failing.
bool Resize(const cv::Mat& src, int dst_width, int dst_height, Backend backend, cv::Mat& dst,
            ResizeReport& report, std::string& error);

} // namespace mediaprep::accel
