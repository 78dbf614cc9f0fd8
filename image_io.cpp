#include "image_io.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <iostream>
#include <vector>

namespace pixelvault {

    Status toRgba(const cv::Mat& decoded, PixelBuffer& outPixels)
    {
        if (decoded.empty())
            return Status::ImageLoadFailure;

        cv::Mat eight;
        if (decoded.depth() == CV_8U) {
            eight = decoded;
        } else if (decoded.depth() == CV_16U) {
            decoded.convertTo(eight, CV_8U, 1.0 / 257.0);
        } else {
            std::cerr << "[image] unsupported sample depth " << decoded.depth() << "\n";
            return Status::MissingRenderContext;
        }

        cv::Mat rgba;
        switch (eight.channels()) {
            case 1: cv::cvtColor(eight, rgba, cv::COLOR_GRAY2RGBA); break;
            case 3: cv::cvtColor(eight, rgba, cv::COLOR_BGR2RGBA);  break;
            case 4: cv::cvtColor(eight, rgba, cv::COLOR_BGRA2RGBA); break;
            default:
                std::cerr << "[image] unsupported channel count " << eight.channels() << "\n";
                return Status::MissingRenderContext;
        }

        if (!rgba.isContinuous())
            rgba = rgba.clone();
        outPixels = rgba;
        return Status::Ok;
    }

    Status loadRgba(const std::string& path, PixelBuffer& outPixels)
    {
        cv::Mat img;
        try {
            img = cv::imread(path, cv::IMREAD_UNCHANGED);
        } catch (const cv::Exception& e) {
            std::cerr << "[image] Failed to decode " << path << ": " << e.what() << "\n";
            return Status::ImageLoadFailure;
        }
        if (img.empty()) {
            std::cerr << "[image] Failed to load image: " << path << "\n";
            return Status::ImageLoadFailure;
        }
        return toRgba(img, outPixels);
    }

    bool saveRgba(const std::string& path, const PixelBuffer& pixels, int pngCompression)
    {
        if (!isValidPixelBuffer(pixels)) {
            std::cerr << "[image] refusing to save an invalid pixel buffer\n";
            return false;
        }
        if (pngCompression < 0 || pngCompression > 9) {
            std::cerr << "[image] PNG compression must be 0..9, got " << pngCompression << "\n";
            return false;
        }

        cv::Mat bgra;
        cv::cvtColor(pixels, bgra, cv::COLOR_RGBA2BGRA);

        std::vector<int> params;
        params.push_back(cv::IMWRITE_PNG_COMPRESSION);
        params.push_back(pngCompression);

        try {
            if (!cv::imwrite(path, bgra, params)) {
                std::cerr << "[image] Failed to save image: " << path << "\n";
                return false;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "[image] Failed to save image " << path << ": " << e.what() << "\n";
            return false;
        }
        return true;
    }

} // namespace pixelvault
