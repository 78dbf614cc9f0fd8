#include "dct_image_stego.hpp"
#include "block_transform.hpp"

#include <cmath>
#include <iostream>

namespace pixelvault {

    namespace {

        struct SlotPos {
            int blockX;
            int blockY;
            int channel;
        };

        // slot = blockIndex * 3 + channel, blocks in row-major order
        SlotPos slotPosition(size_t slot, int blocksPerRow)
        {
            const size_t block = slot / kColorChannels;
            SlotPos p;
            p.blockX  = static_cast<int>(block % blocksPerRow);
            p.blockY  = static_cast<int>(block / blocksPerRow);
            p.channel = static_cast<int>(slot % kColorChannels);
            return p;
        }

        double& carrier(cv::Mat& coeffs)
        {
            return coeffs.at<double>(FrequencyCodec::kCoeffIndex / kBlockSize,
                                     FrequencyCodec::kCoeffIndex % kBlockSize);
        }

        uint8_t parityOf(double coeff)
        {
            const long long q = std::llround(coeff / FrequencyCodec::kStep);
            return static_cast<uint8_t>(q & 1);
        }

        uint8_t readSlot(const PixelBuffer& pixels, const SlotPos& p)
        {
            cv::Mat block, coeffs;
            readChannelBlock(pixels, p.blockX, p.blockY, p.channel, block);
            forwardDct8x8(block, coeffs);
            return parityOf(carrier(coeffs));
        }

        bool embedSlot(PixelBuffer& pixels, const SlotPos& p, uint8_t bit)
        {
            cv::Mat block, coeffs;
            readChannelBlock(pixels, p.blockX, p.blockY, p.channel, block);
            applyHeadroom(block);
            forwardDct8x8(block, coeffs);

            // floor, then step once towards the wanted parity (even = 0, odd = 1)
            const double original = carrier(coeffs);
            long long q = static_cast<long long>(std::floor(original / FrequencyCodec::kStep));
            if ((q & 1) != bit)
                q += bit ? 1 : -1;

            // q +/- 2 keeps the parity if rounding to 8-bit samples pulled the first choice off
            const long long candidates[] = { q, q + 2, q - 2 };
            for (long long cand : candidates) {
                cv::Mat adjusted = coeffs.clone();
                carrier(adjusted) = static_cast<double>(cand) * FrequencyCodec::kStep;

                cv::Mat spatial;
                inverseDct8x8(adjusted, spatial);
                writeChannelBlock(pixels, p.blockX, p.blockY, p.channel, spatial);

                if (readSlot(pixels, p) == bit)
                    return true;
            }
            return false;
        }

    } // namespace

    size_t FrequencyCodec::slotCount(int width, int height) const
    {
        return static_cast<size_t>(width / kBlockSize) * (height / kBlockSize) * kColorChannels;
    }

    bool FrequencyCodec::fitsStandalone(size_t totalBits, int width, int height) const
    {
        const size_t maxBlocks = static_cast<size_t>(width / kBlockSize) * (height / kBlockSize);
        return totalBits <= maxBlocks;
    }

    bool FrequencyCodec::embedAt(PixelBuffer& pixels, const Bits& bits, size_t address) const
    {
        if (!checkRange(pixels, address, bits.size(), "dct embed"))
            return false;

        const int blocksPerRow = pixels.cols / kBlockSize;
        for (size_t i = 0; i < bits.size(); ++i) {
            const SlotPos p = slotPosition(address + i, blocksPerRow);
            if (!embedSlot(pixels, p, bits[i] & 1)) {
                std::cerr << "[dct embed] block (" << p.blockX << ", " << p.blockY
                          << ") channel " << p.channel << " did not keep its bit\n";
                return false;
            }
        }
        return true;
    }

    bool FrequencyCodec::extractAt(const PixelBuffer& pixels, size_t address, size_t count,
                                   Bits& outBits) const
    {
        if (!checkRange(pixels, address, count, "dct extract"))
            return false;

        const int blocksPerRow = pixels.cols / kBlockSize;
        Bits bits;
        bits.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            bits.push_back(readSlot(pixels, slotPosition(address + i, blocksPerRow)));
        }
        outBits.swap(bits);
        return true;
    }

} // namespace pixelvault
