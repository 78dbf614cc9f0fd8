#include <gtest/gtest.h>

#include "block_transform.hpp"
#include "test_images.hpp"

#include <cmath>
#include <stdexcept>

using namespace pixelvault;

static cv::Mat rampBlock(int n)
{
    cv::Mat m(n, n, CV_64F);
    for (int y = 0; y < n; ++y)
        for (int x = 0; x < n; ++x)
            m.at<double>(y, x) = 40.0 + 3.0 * x + 7.0 * y + ((x * y) % 5);
    return m;
}

TEST(DctTest, ConstantBlockHasOnlyDc)
{
    cv::Mat block(8, 8, CV_64F, cv::Scalar(100.0));
    cv::Mat coeffs;
    forwardDct8x8(block, coeffs);

    EXPECT_NEAR(coeffs.at<double>(0, 0), 800.0, 1e-9);
    for (int i = 1; i < 64; ++i)
        EXPECT_NEAR(coeffs.at<double>(i / 8, i % 8), 0.0, 1e-9) << "coefficient " << i;
}

TEST(DctTest, InverseRestoresBlock)
{
    cv::Mat block = rampBlock(8);
    cv::Mat coeffs, back;
    forwardDct8x8(block, coeffs);
    inverseDct8x8(coeffs, back);
    EXPECT_LT(cv::norm(block, back, cv::NORM_INF), 1e-9);
}

TEST(DctTest, RejectsWrongShape)
{
    cv::Mat wrongSize(4, 4, CV_64F, cv::Scalar(1.0));
    cv::Mat wrongType(8, 8, CV_32F, cv::Scalar(1.0));
    cv::Mat out;
    EXPECT_THROW(forwardDct8x8(wrongSize, out), std::invalid_argument);
    EXPECT_THROW(forwardDct8x8(wrongType, out), std::invalid_argument);
    EXPECT_THROW(inverseDct8x8(wrongSize, out), std::invalid_argument);
}

TEST(HaarTest, ConstantPatchHasNoDetail)
{
    cv::Mat patch(8, 8, CV_64F, cv::Scalar(50.0));
    WaveletDecomposition dec;
    forwardHaar2d(patch, 2, dec);

    ASSERT_EQ(dec.details.size(), 2u);
    EXPECT_EQ(dec.details[0].hl.rows, 4);
    EXPECT_EQ(dec.details[1].hl.rows, 2);
    EXPECT_EQ(dec.ll.rows, 2);

    for (const WaveletLevel& lvl : dec.details) {
        EXPECT_LT(cv::norm(lvl.hl, cv::NORM_INF), 1e-9);
        EXPECT_LT(cv::norm(lvl.lh, cv::NORM_INF), 1e-9);
        EXPECT_LT(cv::norm(lvl.hh, cv::NORM_INF), 1e-9);
    }
    // orthonormal: each level doubles the approximation of a flat patch
    EXPECT_NEAR(dec.ll.at<double>(0, 0), 200.0, 1e-9);
}

TEST(HaarTest, InverseRestoresPatchAndKeepsEnergy)
{
    cv::Mat patch = rampBlock(8);
    WaveletDecomposition dec;
    forwardHaar2d(patch, 2, dec);

    double energy = cv::norm(dec.ll, cv::NORM_L2SQR);
    for (const WaveletLevel& lvl : dec.details) {
        energy += cv::norm(lvl.hl, cv::NORM_L2SQR);
        energy += cv::norm(lvl.lh, cv::NORM_L2SQR);
        energy += cv::norm(lvl.hh, cv::NORM_L2SQR);
    }
    EXPECT_NEAR(energy, cv::norm(patch, cv::NORM_L2SQR), 1e-6);

    cv::Mat back;
    inverseHaar2d(dec, back);
    EXPECT_LT(cv::norm(patch, back, cv::NORM_INF), 1e-9);
}

TEST(HaarTest, HorizontalEdgeShowsInLh)
{
    // rows alternate: vertical high frequency, horizontal constant
    cv::Mat patch(8, 8, CV_64F);
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 8; ++x)
            patch.at<double>(y, x) = (y % 2) ? 10.0 : 30.0;

    WaveletDecomposition dec;
    forwardHaar2d(patch, 1, dec);
    EXPECT_GT(cv::norm(dec.details[0].lh, cv::NORM_INF), 1.0);
    EXPECT_LT(cv::norm(dec.details[0].hl, cv::NORM_INF), 1e-9);
    EXPECT_LT(cv::norm(dec.details[0].hh, cv::NORM_INF), 1e-9);
}

TEST(HaarTest, RejectsIndivisibleSide)
{
    cv::Mat patch(6, 6, CV_64F, cv::Scalar(1.0));
    WaveletDecomposition dec;
    EXPECT_THROW(forwardHaar2d(patch, 2, dec), std::invalid_argument);
    EXPECT_THROW(forwardHaar2d(patch, 0, dec), std::invalid_argument);
}

TEST(BlockIoTest, HeadroomClampsBothEnds)
{
    cv::Mat block(8, 8, CV_64F, cv::Scalar(128.0));
    block.at<double>(0, 0) = 0.0;
    block.at<double>(7, 7) = 255.0;
    applyHeadroom(block);
    EXPECT_DOUBLE_EQ(block.at<double>(0, 0), kHeadroom);
    EXPECT_DOUBLE_EQ(block.at<double>(7, 7), 255.0 - kHeadroom);
    EXPECT_DOUBLE_EQ(block.at<double>(3, 3), 128.0);
}

TEST(BlockIoTest, WriteTouchesOnlyOneChannel)
{
    PixelBuffer img = testutil::makeTexturedImage(16, 16);
    PixelBuffer before = img.clone();

    cv::Mat block;
    readChannelBlock(img, 1, 1, 2, block);
    block += 0.6;  // rounds up by one
    writeChannelBlock(img, 1, 1, 2, block);

    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) {
            const cv::Vec4b a = before.at<cv::Vec4b>(y, x);
            const cv::Vec4b b = img.at<cv::Vec4b>(y, x);
            const bool inBlock = x >= 8 && y >= 8;
            EXPECT_EQ(a[0], b[0]);
            EXPECT_EQ(a[1], b[1]);
            EXPECT_EQ(a[3], b[3]);
            EXPECT_EQ(b[2], inBlock ? a[2] + 1 : a[2]);
        }
    }
}
