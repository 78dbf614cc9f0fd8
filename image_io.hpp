#ifndef PIXELVAULT_IMAGE_IO_HPP
#define PIXELVAULT_IMAGE_IO_HPP

#include "stego_types.hpp"

#include <string>

namespace pixelvault {

    constexpr int kDefaultPngCompression = 3;

    // Decodes an image file into continuous RGBA.
    // ImageLoadFailure: unreadable or not an image.
    // MissingRenderContext: decoded, but not convertible to 8-bit RGBA.
    Status loadRgba(const std::string& path, PixelBuffer& outPixels);

    // Converts an arbitrary decoded Mat (BGR / BGRA / gray, 8 or 16 bit) to RGBA.
    Status toRgba(const cv::Mat& decoded, PixelBuffer& outPixels);

    // Lossless PNG; pngCompression 0..9.
    bool saveRgba(const std::string& path, const PixelBuffer& pixels,
                  int pngCompression = kDefaultPngCompression);

} // namespace pixelvault

#endif // PIXELVAULT_IMAGE_IO_HPP
