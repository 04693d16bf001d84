#include "raw/libraw_decoder.hpp"

#include "imaging/codec.hpp"

#include <libraw/libraw.h>
#include <opencv2/imgproc.hpp>

#include <memory>
#include <span>
#include <system_error>

namespace mediaprep::raw {

namespace {

struct ProcessedImageDeleter {
  void operator()(libraw_processed_image_t* image) const {
    if (image != nullptr) {
      LibRaw::dcraw_clear_mem(image);
    }
  }
};

using ProcessedImagePtr = std::unique_ptr<libraw_processed_image_t, ProcessedImageDeleter>;

DecodeStatus ClassifyLibRawError(int code) {
  switch (code) {
  case LIBRAW_NO_THUMBNAIL:
  case LIBRAW_UNSUPPORTED_THUMBNAIL:
    return DecodeStatus::kAbsent;
  case LIBRAW_FILE_UNSUPPORTED:
  case LIBRAW_DATA_ERROR:
  case LIBRAW_BAD_CROP:
  case LIBRAW_REQUEST_FOR_NONEXISTENT_IMAGE:
    return DecodeStatus::kCorruptSource;
  default:
    return DecodeStatus::kFailed;
  }
}

// Positive LibRaw return codes are errno values from the I/O layer.
std::string DescribeLibRawError(int code) {
  if (code > 0) {
    return std::generic_category().message(code);
  }
  return libraw_strerror(code);
}

DecodeStatus Fail(int code, std::string_view step, std::string& message) {
  message = std::string(step) + ": " + DescribeLibRawError(code) + " (code " +
            std::to_string(code) + ")";
  return ClassifyLibRawError(code);
}

DecodeStatus OpenSource(LibRaw& processor, const std::filesystem::path& path,
                        std::string& message) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    message = "input file not found: " + path.string();
    return DecodeStatus::kFailed;
  }

  const int rc = processor.open_file(path.c_str());
  if (rc != LIBRAW_SUCCESS) {
    return Fail(rc, "open_file", message);
  }
  return DecodeStatus::kOk;
}

// Wraps LibRaw's RGB bitmap into a BGR cv::Mat that owns its pixels.
DecodeStatus BitmapToMat(const libraw_processed_image_t& processed, cv::Mat& image,
                         std::string& message) {
  if (processed.type != LIBRAW_IMAGE_BITMAP) {
    message = "decoder returned a non-bitmap image";
    return DecodeStatus::kFailed;
  }
  if (processed.colors != 1 && processed.colors != 3) {
    message = "unsupported channel count " + std::to_string(processed.colors);
    return DecodeStatus::kFailed;
  }
  if (processed.bits != 8 && processed.bits != 16) {
    message = "unsupported bit depth " + std::to_string(processed.bits);
    return DecodeStatus::kFailed;
  }

  const int depth = processed.bits == 16 ? CV_16U : CV_8U;
  const cv::Mat view(processed.height, processed.width, CV_MAKETYPE(depth, processed.colors),
                     const_cast<unsigned char*>(processed.data));
  if (processed.colors == 3) {
    cv::cvtColor(view, image, cv::COLOR_RGB2BGR);
  } else {
    image = view.clone();
  }
  return DecodeStatus::kOk;
}

void ApplyFlip(int flip, cv::Mat& image) {
  switch (flip) {
  case 3:
    cv::rotate(image, image, cv::ROTATE_180);
    break;
  case 5:
    cv::rotate(image, image, cv::ROTATE_90_COUNTERCLOCKWISE);
    break;
  case 6:
    cv::rotate(image, image, cv::ROTATE_90_CLOCKWISE);
    break;
  default:
    break;
  }
}

} // namespace

std::string LibRawVersionText() {
  return LibRaw::version();
}

std::string_view LibRawDecoder::Name() const {
  return "libraw";
}

DecodeStatus LibRawDecoder::TryEmbeddedPreview(const std::filesystem::path& path,
                                               cv::Mat& image, std::string& message) {
  auto processor = std::make_unique<LibRaw>();
  const DecodeStatus open_status = OpenSource(*processor, path, message);
  if (open_status != DecodeStatus::kOk) {
    return open_status;
  }

  int rc = processor->unpack_thumb();
  if (rc != LIBRAW_SUCCESS) {
    return Fail(rc, "unpack_thumb", message);
  }

  ProcessedImagePtr thumb(processor->dcraw_make_mem_thumb(&rc));
  if (thumb == nullptr) {
    return Fail(rc, "dcraw_make_mem_thumb", message);
  }

  if (thumb->type == LIBRAW_IMAGE_JPEG) {
    std::string decode_error;
    if (!imaging::DecodeBytes(std::span<const unsigned char>(thumb->data, thumb->data_size),
                              image, decode_error)) {
      message = "embedded JPEG preview is unreadable: " + decode_error;
      return DecodeStatus::kCorruptSource;
    }
  } else {
    const DecodeStatus bitmap_status = BitmapToMat(*thumb, image, message);
    if (bitmap_status != DecodeStatus::kOk) {
      // An odd thumbnail layout is a missing preview, not a broken file.
      return DecodeStatus::kAbsent;
    }
  }

  ApplyFlip(processor->imgdata.sizes.flip, image);
  return DecodeStatus::kOk;
}

DecodeStatus LibRawDecoder::DecodeReduced(const std::filesystem::path& path, cv::Mat& image,
                                          std::string& message) {
  return Demosaic(path, true, image, message);
}

DecodeStatus LibRawDecoder::DecodeFull(const std::filesystem::path& path, cv::Mat& image,
                                       std::string& message) {
  return Demosaic(path, false, image, message);
}

DecodeStatus LibRawDecoder::Demosaic(const std::filesystem::path& path, bool half_size,
                                     cv::Mat& image, std::string& message) {
  auto processor = std::make_unique<LibRaw>();
  const DecodeStatus open_status = OpenSource(*processor, path, message);
  if (open_status != DecodeStatus::kOk) {
    return open_status;
  }

  libraw_output_params_t& params = processor->imgdata.params;
  params.use_camera_wb = 1;
  params.use_auto_wb = 0;
  if (half_size) {
    params.half_size = 1;
    params.user_qual = 0;
    params.output_bps = 8;
  } else {
    params.half_size = 0;
    params.user_qual = 3;
    params.output_bps = 16;
  }

  int rc = processor->unpack();
  if (rc != LIBRAW_SUCCESS) {
    return Fail(rc, "unpack", message);
  }
  rc = processor->dcraw_process();
  if (rc != LIBRAW_SUCCESS) {
    return Fail(rc, "dcraw_process", message);
  }

  ProcessedImagePtr processed(processor->dcraw_make_mem_image(&rc));
  if (processed == nullptr) {
    return Fail(rc, "dcraw_make_mem_image", message);
  }
  return BitmapToMat(*processed, image, message);
}

DecodeStatus LibRawDecoder::ReadMetadata(const std::filesystem::path& path,
                                         RawMetadata& metadata, std::string& message) {
  auto processor = std::make_unique<LibRaw>();
  const DecodeStatus open_status = OpenSource(*processor, path, message);
  if (open_status != DecodeStatus::kOk) {
    return open_status;
  }

  const libraw_data_t& data = processor->imgdata;
  metadata = RawMetadata{};
  metadata.make = data.idata.make;
  metadata.model = data.idata.model;
  metadata.lens = data.lens.Lens;
  metadata.iso = data.other.iso_speed;
  metadata.aperture = data.other.aperture;
  metadata.shutter_speed = data.other.shutter;
  metadata.focal_length = data.other.focal_len;
  metadata.width = data.sizes.width;
  metadata.height = data.sizes.height;
  metadata.orientation = data.sizes.flip;
  if (data.other.timestamp > 0) {
    metadata.timestamp = static_cast<std::int64_t>(data.other.timestamp);
  }

  metadata.extra["raw_count"] = std::to_string(data.idata.raw_count);
  metadata.extra["colors"] = std::to_string(data.idata.colors);
  metadata.extra["filters"] = std::to_string(data.idata.filters);
  if (data.idata.software[0] != '\0') {
    metadata.extra["software"] = data.idata.software;
  }
  if (data.idata.dng_version != 0U) {
    metadata.extra["dng_version"] = std::to_string(data.idata.dng_version);
  }
  if (data.other.artist[0] != '\0') {
    metadata.extra["artist"] = data.other.artist;
  }
  return DecodeStatus::kOk;
}

} // namespace mediaprep::raw
