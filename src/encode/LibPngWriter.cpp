// Repository: ReelForge
// Component: Frame Image Writer
// Purpose: Writes one composited frame to a PNG file through libpng.
// Copyright (c) 2025 ReelForge

#include "reelforge/encode/FrameImageWriter.hpp"

#include <png.h>

#include <cstring>

namespace reelforge::encode {

bool LibPngWriter::WriteImage(const pipeline::PixelBuffer& pixels, const std::string& path,
                              std::string* error) {
  if (pixels.width <= 0 || pixels.height <= 0 ||
      pixels.rgba.size() != static_cast<size_t>(pixels.width) * pixels.height * 4) {
    if (error) *error = "png: invalid pixel buffer";
    return false;
  }

  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;
  image.width = static_cast<png_uint_32>(pixels.width);
  image.height = static_cast<png_uint_32>(pixels.height);
  image.format = PNG_FORMAT_RGBA;

  if (!png_image_write_to_file(&image, path.c_str(), 0, pixels.rgba.data(),
                               static_cast<png_int_32>(pixels.width * 4), nullptr)) {
    if (error) *error = "png write " + path + ": " + image.message;
    png_image_free(&image);
    return false;
  }
  png_image_free(&image);
  return true;
}

}  // namespace reelforge::encode
