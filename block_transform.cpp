#include "block_transform.hpp"

#include <cmath>
#include <stdexcept>

namespace pixelvault {

    static const double kInvSqrt2 = 1.0 / std::sqrt(2.0);

    void forwardDct8x8(const cv::Mat& block, cv::Mat& coeffs)
    {
        if (block.rows != kBlockSize || block.cols != kBlockSize || block.type() != CV_64F)
            throw std::invalid_argument("forwardDct8x8: expected 8x8 CV_64F block");
        cv::dct(block, coeffs);
    }

    void inverseDct8x8(const cv::Mat& coeffs, cv::Mat& block)
    {
        if (coeffs.rows != kBlockSize || coeffs.cols != kBlockSize || coeffs.type() != CV_64F)
            throw std::invalid_argument("inverseDct8x8: expected 8x8 CV_64F coefficients");
        cv::idct(coeffs, block);
    }

    // one level: src (n x n) -> ll, hl, lh, hh (n/2 x n/2)
    static void haarLevel(const cv::Mat& src, cv::Mat& ll, WaveletLevel& lvl)
    {
        const int n = src.rows;
        const int h = n / 2;

        // row pass: low half / high half along x
        cv::Mat lo(n, h, CV_64F), hi(n, h, CV_64F);
        for (int y = 0; y < n; ++y) {
            for (int i = 0; i < h; ++i) {
                double a = src.at<double>(y, 2 * i);
                double b = src.at<double>(y, 2 * i + 1);
                lo.at<double>(y, i) = (a + b) * kInvSqrt2;
                hi.at<double>(y, i) = (a - b) * kInvSqrt2;
            }
        }

        // column pass
        ll.create(h, h, CV_64F);
        lvl.lh.create(h, h, CV_64F);
        lvl.hl.create(h, h, CV_64F);
        lvl.hh.create(h, h, CV_64F);
        for (int x = 0; x < h; ++x) {
            for (int j = 0; j < h; ++j) {
                double l0 = lo.at<double>(2 * j, x);
                double l1 = lo.at<double>(2 * j + 1, x);
                double h0 = hi.at<double>(2 * j, x);
                double h1 = hi.at<double>(2 * j + 1, x);
                ll.at<double>(j, x)     = (l0 + l1) * kInvSqrt2;
                lvl.lh.at<double>(j, x) = (l0 - l1) * kInvSqrt2;
                lvl.hl.at<double>(j, x) = (h0 + h1) * kInvSqrt2;
                lvl.hh.at<double>(j, x) = (h0 - h1) * kInvSqrt2;
            }
        }
    }

    static void inverseHaarLevel(const cv::Mat& ll, const WaveletLevel& lvl, cv::Mat& dst)
    {
        const int h = ll.rows;
        const int n = h * 2;

        cv::Mat lo(n, h, CV_64F), hi(n, h, CV_64F);
        for (int x = 0; x < h; ++x) {
            for (int j = 0; j < h; ++j) {
                double a  = ll.at<double>(j, x);
                double dv = lvl.lh.at<double>(j, x);
                double hd = lvl.hl.at<double>(j, x);
                double dd = lvl.hh.at<double>(j, x);
                lo.at<double>(2 * j, x)     = (a + dv) * kInvSqrt2;
                lo.at<double>(2 * j + 1, x) = (a - dv) * kInvSqrt2;
                hi.at<double>(2 * j, x)     = (hd + dd) * kInvSqrt2;
                hi.at<double>(2 * j + 1, x) = (hd - dd) * kInvSqrt2;
            }
        }

        dst.create(n, n, CV_64F);
        for (int y = 0; y < n; ++y) {
            for (int i = 0; i < h; ++i) {
                double l = lo.at<double>(y, i);
                double r = hi.at<double>(y, i);
                dst.at<double>(y, 2 * i)     = (l + r) * kInvSqrt2;
                dst.at<double>(y, 2 * i + 1) = (l - r) * kInvSqrt2;
            }
        }
    }

    void forwardHaar2d(const cv::Mat& patch, int levels, WaveletDecomposition& out)
    {
        if (patch.type() != CV_64F || patch.rows != patch.cols)
            throw std::invalid_argument("forwardHaar2d: expected square CV_64F patch");
        if (levels < 1 || (patch.rows % (1 << levels)) != 0)
            throw std::invalid_argument("forwardHaar2d: patch side not divisible by 2^levels");

        out.details.assign(static_cast<size_t>(levels), WaveletLevel());
        cv::Mat current = patch;
        for (int l = 0; l < levels; ++l) {
            cv::Mat ll;
            haarLevel(current, ll, out.details[static_cast<size_t>(l)]);
            current = ll;
        }
        out.ll = current;
    }

    void inverseHaar2d(const WaveletDecomposition& dec, cv::Mat& patch)
    {
        if (dec.details.empty())
            throw std::invalid_argument("inverseHaar2d: no detail levels");

        cv::Mat current = dec.ll;
        for (size_t l = dec.details.size(); l-- > 0;) {
            cv::Mat up;
            inverseHaarLevel(current, dec.details[l], up);
            current = up;
        }
        patch = current;
    }

    void applyHeadroom(cv::Mat& block)
    {
        cv::max(block, kHeadroom, block);
        cv::min(block, 255.0 - kHeadroom, block);
    }

    void readChannelBlock(const PixelBuffer& pixels, int blockX, int blockY,
                          int channel, cv::Mat& block)
    {
        block.create(kBlockSize, kBlockSize, CV_64F);
        for (int y = 0; y < kBlockSize; ++y) {
            const cv::Vec4b* row = pixels.ptr<cv::Vec4b>(blockY * kBlockSize + y);
            for (int x = 0; x < kBlockSize; ++x) {
                block.at<double>(y, x) = row[blockX * kBlockSize + x][channel];
            }
        }
    }

    void writeChannelBlock(PixelBuffer& pixels, int blockX, int blockY,
                           int channel, const cv::Mat& block)
    {
        for (int y = 0; y < kBlockSize; ++y) {
            cv::Vec4b* row = pixels.ptr<cv::Vec4b>(blockY * kBlockSize + y);
            for (int x = 0; x < kBlockSize; ++x) {
                row[blockX * kBlockSize + x][channel] = cv::saturate_cast<uint8_t>(block.at<double>(y, x));
            }
        }
    }

} // namespace pixelvault
