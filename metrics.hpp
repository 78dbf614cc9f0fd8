#ifndef PIXELVAULT_METRICS_HPP
#define PIXELVAULT_METRICS_HPP

#include "stego_types.hpp"

#include <string>

namespace metrics {

    // Both take RGBA buffers of equal size; alpha is ignored.
    // PSNR returns 100 for identical color planes, -1 on mismatched inputs.
    double computePSNR(const pixelvault::PixelBuffer& cover, const pixelvault::PixelBuffer& stego);
    double computeSSIM(const pixelvault::PixelBuffer& cover, const pixelvault::PixelBuffer& stego);

    // Fraction of differing bits; 1.0 when the lengths differ.
    double computeBER(const pixelvault::Bits& original, const pixelvault::Bits& extracted);
    double computeBER(const std::string& original, const std::string& extracted);

    // Samples (R, G, B) whose value differs.
    size_t countChangedSamples(const pixelvault::PixelBuffer& cover,
                               const pixelvault::PixelBuffer& stego);
}

#endif // PIXELVAULT_METRICS_HPP
