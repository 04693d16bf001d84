#include "accel/resizer.hpp"

#include <opencv2/core/ocl.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <string>

#ifndef MEDIAPREP_ENABLE_CUDA
#define MEDIAPREP_ENABLE_CUDA 0
#endif

#if MEDIAPREP_ENABLE_CUDA
#include <opencv2/core/cuda.hpp>
#include <opencv2/cudawarping.hpp>
#endif

namespace mediaprep::accel {

namespace {

bool IsDownscale(const cv::Mat& src, int dst_width, int dst_height) {
  return dst_width <= src.cols && dst_height <= src.rows;
}

int InterpolationFor(const cv::Mat& src, int dst_width, int dst_height) {
  return IsDownscale(src, dst_width, dst_height) ? cv::INTER_AREA : cv::INTER_LANCZOS4;
}

bool ResizeReference(const cv::Mat& src, int dst_width, int dst_height, cv::Mat& dst,
                     std::string& error) {
  try {
    cv::resize(src, dst, cv::Size(dst_width, dst_height), 0.0, 0.0,
               InterpolationFor(src, dst_width, dst_height));
  } catch (const cv::Exception& ex) {
    error = std::string("reference resize failed: ") + ex.what();
    return false;
  }
  return true;
}

// OpenCL through the transparent API. Returns false with `reason` when the
// runtime went away or the kernel threw, so the caller can fall back.
bool ResizeOpenCl(const cv::Mat& src, int dst_width, int dst_height, cv::Mat& dst,
                  std::string& reason) {
  if (!cv::ocl::useOpenCL()) {
    reason = "OpenCL disabled at call time";
    return false;
  }
  try {
    cv::UMat device_src = src.getUMat(cv::ACCESS_READ);
    cv::UMat device_dst;
    cv::resize(device_src, device_dst, cv::Size(dst_width, dst_height), 0.0, 0.0,
               InterpolationFor(src, dst_width, dst_height));
    device_dst.copyTo(dst);
  } catch (const cv::Exception& ex) {
    reason = std::string("OpenCL resize failed: ") + ex.what();
    return false;
  }
  return true;
}

bool ResizeCuda(const cv::Mat& src, int dst_width, int dst_height, cv::Mat& dst,
                std::string& reason) {
#if MEDIAPREP_ENABLE_CUDA
  if (src.depth() != CV_8U || (src.channels() != 1 && src.channels() != 3 &&
                               src.channels() != 4)) {
    reason = "CUDA resize supports 8-bit 1/3/4-channel images only";
    return false;
  }
  // cv::cuda::resize has no Lanczos kernel, and its area mode only shrinks.
  if (!IsDownscale(src, dst_width, dst_height)) {
    reason = "CUDA resize has no Lanczos kernel for upscaling";
    return false;
  }
  try {
    cv::cuda::GpuMat device_src;
    device_src.upload(src);
    cv::cuda::GpuMat device_dst;
    cv::cuda::resize(device_src, device_dst, cv::Size(dst_width, dst_height), 0.0, 0.0,
                     cv::INTER_AREA);
    device_dst.download(dst);
  } catch (const cv::Exception& ex) {
    reason = std::string("CUDA resize failed: ") + ex.what();
    return false;
  }
  return true;
#else
  (void)src;
  (void)dst_width;
  (void)dst_height;
  (void)dst;
  reason = "CUDA resize not compiled (MEDIAPREP_ENABLE_CUDA=OFF)";
  return false;
#endif
}

} // namespace

Dimensions FitWithin(int width, int height, int max_dimension) {
  Dimensions fitted{std::max(width, 1), std::max(height, 1)};
  if (max_dimension < 1) {
    return fitted;
  }

  const int longer = std::max(fitted.width, fitted.height);
  if (longer <= max_dimension) {
    return fitted;
  }

  const double scale = static_cast<double>(max_dimension) / static_cast<double>(longer);
  if (fitted.width >= fitted.height) {
    fitted.height = std::max(1, static_cast<int>(std::lround(fitted.height * scale)));
    fitted.width = max_dimension;
  } else {
    fitted.width = std::max(1, static_cast<int>(std::lround(fitted.width * scale)));
    fitted.height = max_dimension;
  }
  return fitted;
}

Dimensions FitInsideBox(int width, int height, int box_width, int box_height) {
  const int src_width = std::max(width, 1);
  const int src_height = std::max(height, 1);
  const int target_width = std::max(box_width, 1);
  const int target_height = std::max(box_height, 1);

  const double scale = std::min(static_cast<double>(target_width) / src_width,
                                static_cast<double>(target_height) / src_height);
  Dimensions fitted;
  fitted.width = std::clamp(static_cast<int>(std::lround(src_width * scale)), 1, target_width);
  fitted.height =
      std::clamp(static_cast<int>(std::lround(src_height * scale)), 1, target_height);
  return fitted;
}

bool Resize(const cv::Mat& src, int dst_width, int dst_height, Backend backend, cv::Mat& dst,
            ResizeReport& report, std::string& error) {
  report = ResizeReport{};
  report.requested = backend;
  report.executed = backend;

  if (src.empty()) {
    error = "cannot resize an empty image";
    return false;
  }
  if (dst_width < 1 || dst_height < 1) {
    error = "target dimensions must be positive, got " + std::to_string(dst_width) + "x" +
            std::to_string(dst_height);
    return false;
  }

  if (src.cols == dst_width && src.rows == dst_height) {
    dst = src.clone();
    return true;
  }

  std::string reason;
  switch (backend) {
  case Backend::kCuda:
    if (ResizeCuda(src, dst_width, dst_height, dst, reason)) {
      return true;
    }
    break;
  case Backend::kOpenCl:
    if (ResizeOpenCl(src, dst_width, dst_height, dst, reason)) {
      return true;
    }
    break;
  case Backend::kVulkan:
    reason = "no Vulkan resize kernel";
    break;
  case Backend::kReference:
    return ResizeReference(src, dst_width, dst_height, dst, error);
  }

  report.executed = Backend::kReference;
  report.fallback_reason = reason;
  return ResizeReference(src, dst_width, dst_height, dst, error);
}

} // namespace mediaprep::accel
