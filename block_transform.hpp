#ifndef PIXELVAULT_BLOCK_TRANSFORM_HPP
#define PIXELVAULT_BLOCK_TRANSFORM_HPP

#include "stego_types.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace pixelvault {

    // Orthonormal DCT-II over one 8x8 CV_64F block.
    // coeffs(v, u): v = vertical frequency (row), u = horizontal (column),
    // so the flat index v * 8 + u matches a row-major walk.
    void forwardDct8x8(const cv::Mat& block, cv::Mat& coeffs);
    void inverseDct8x8(const cv::Mat& coeffs, cv::Mat& block);

    // Detail sub-bands of one Haar level.
    // hl: high horizontal / low vertical, lh: low horizontal / high vertical.
    struct WaveletLevel {
        cv::Mat hl;
        cv::Mat lh;
        cv::Mat hh;
    };

    // details[0] is the finest level; ll is the approximation left after the last one.
    struct WaveletDecomposition {
        cv::Mat ll;
        std::vector<WaveletLevel> details;
    };

    // Orthonormal 2D Haar, `levels` times on the running LL band.
    // patch must be square CV_64F with a side divisible by 2^levels.
    void forwardHaar2d(const cv::Mat& patch, int levels, WaveletDecomposition& out);
    void inverseHaar2d(const WaveletDecomposition& dec, cv::Mat& patch);

    // Samples are pulled into [kHeadroom, 255 - kHeadroom] before a coefficient
    // is changed, so the inverse transform never clips.
    constexpr double kHeadroom = 4.0;
    void applyHeadroom(cv::Mat& block);

    // Copy one channel of the 8x8 block at (blockX, blockY) into / out of a CV_64F block.
    // Writing rounds to nearest and clamps to [0, 255].
    void readChannelBlock(const PixelBuffer& pixels, int blockX, int blockY,
                          int channel, cv::Mat& block);
    void writeChannelBlock(PixelBuffer& pixels, int blockX, int blockY,
                           int channel, const cv::Mat& block);

} // namespace pixelvault

#endif // PIXELVAULT_BLOCK_TRANSFORM_HPP
