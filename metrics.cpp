#include "metrics.hpp"
#include "bitstream.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <vector>

namespace metrics {

    static bool sameShape(const cv::Mat& a, const cv::Mat& b)
    {
        return pixelvault::isValidPixelBuffer(a) && pixelvault::isValidPixelBuffer(b)
            && a.size() == b.size();
    }

    static void colorPlanes(const cv::Mat& rgba, cv::Mat& rgb)
    {
        cv::cvtColor(rgba, rgb, cv::COLOR_RGBA2RGB);
    }

    // --- PSNR ---
    double computePSNR(const pixelvault::PixelBuffer& cover, const pixelvault::PixelBuffer& stego)
    {
        if (!sameShape(cover, stego))
            return -1.0;

        cv::Mat a, b;
        colorPlanes(cover, a);
        colorPlanes(stego, b);

        cv::Mat diff;
        cv::absdiff(a, b, diff);
        diff.convertTo(diff, CV_32F);
        diff = diff.mul(diff);

        const cv::Scalar s = cv::sum(diff);
        const double sse = s.val[0] + s.val[1] + s.val[2];
        if (sse <= 1e-10)
            return 100.0;  // identical

        const double mse = sse / static_cast<double>(a.channels() * a.total());
        return 10.0 * std::log10((255.0 * 255.0) / mse);
    }

    // --- SSIM, Gaussian 11x11 sigma 1.5 ---
    static double ssimPlane(const cv::Mat& p1, const cv::Mat& p2)
    {
        const double C1 = 6.5025, C2 = 58.5225;  // (0.01 * 255)^2, (0.03 * 255)^2
        const cv::Size win(11, 11);

        cv::Mat I1, I2;
        p1.convertTo(I1, CV_32F);
        p2.convertTo(I2, CV_32F);

        cv::Mat mu1, mu2;
        cv::GaussianBlur(I1, mu1, win, 1.5);
        cv::GaussianBlur(I2, mu2, win, 1.5);

        const cv::Mat mu1Sq = mu1.mul(mu1);
        const cv::Mat mu2Sq = mu2.mul(mu2);
        const cv::Mat mu12  = mu1.mul(mu2);

        cv::Mat sigma1Sq, sigma2Sq, sigma12;
        cv::GaussianBlur(I1.mul(I1), sigma1Sq, win, 1.5);
        sigma1Sq -= mu1Sq;
        cv::GaussianBlur(I2.mul(I2), sigma2Sq, win, 1.5);
        sigma2Sq -= mu2Sq;
        cv::GaussianBlur(I1.mul(I2), sigma12, win, 1.5);
        sigma12 -= mu12;

        cv::Mat num = (2 * mu12 + C1).mul(2 * sigma12 + C2);
        cv::Mat den = (mu1Sq + mu2Sq + C1).mul(sigma1Sq + sigma2Sq + C2);

        cv::Mat map;
        cv::divide(num, den, map);
        return cv::mean(map).val[0];
    }

    double computeSSIM(const pixelvault::PixelBuffer& cover, const pixelvault::PixelBuffer& stego)
    {
        if (!sameShape(cover, stego))
            return 0.0;

        std::vector<cv::Mat> ch1, ch2;
        cv::split(cover, ch1);
        cv::split(stego, ch2);

        double total = 0;
        for (int i = 0; i < pixelvault::kColorChannels; i++)
            total += ssimPlane(ch1[i], ch2[i]);
        return total / pixelvault::kColorChannels;
    }

    // --- BER ---
    double computeBER(const pixelvault::Bits& original, const pixelvault::Bits& extracted)
    {
        if (original.size() != extracted.size() || original.empty())
            return original.size() == extracted.size() ? 0.0 : 1.0;

        size_t errors = 0;
        for (size_t i = 0; i < original.size(); ++i) {
            if ((original[i] & 1) != (extracted[i] & 1))
                ++errors;
        }
        return static_cast<double>(errors) / static_cast<double>(original.size());
    }

    double computeBER(const std::string& original, const std::string& extracted)
    {
        return computeBER(pixelvault::textToBits(original), pixelvault::textToBits(extracted));
    }

    size_t countChangedSamples(const pixelvault::PixelBuffer& cover,
                               const pixelvault::PixelBuffer& stego)
    {
        if (!sameShape(cover, stego))
            return 0;

        cv::Mat a, b, diff;
        colorPlanes(cover, a);
        colorPlanes(stego, b);
        cv::absdiff(a, b, diff);
        return static_cast<size_t>(cv::countNonZero(diff.reshape(1)));
    }
}
