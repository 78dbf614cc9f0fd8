#include "dwt_image_stego.hpp"
#include "block_transform.hpp"

#include <cmath>
#include <iostream>

namespace pixelvault {

    namespace {

        constexpr int kBandsPerBlock = 3;

        // (band, row, column) inside details[0], indexed by slot % 3
        struct BandPos {
            int band;  // 0 = HL, 1 = LH, 2 = HH
            int row;
            int col;
        };

        const BandPos kBands[kBandsPerBlock] = {
            { 0, 1, 1 },  // HL x=1 y=1
            { 1, 1, 2 },  // LH x=2 y=1
            { 2, 2, 1 }   // HH x=1 y=2
        };

        double& coefficient(WaveletDecomposition& dec, int slotInBlock)
        {
            const BandPos& b = kBands[slotInBlock];
            WaveletLevel& lvl = dec.details[0];
            cv::Mat& band = (b.band == 0) ? lvl.hl : (b.band == 1) ? lvl.lh : lvl.hh;
            return band.at<double>(b.row, b.col);
        }

        uint8_t parityOf(double coeff)
        {
            const long long q = std::llround(coeff / WaveletCodec::kStep);
            return static_cast<uint8_t>(q & 1);
        }

        void decompose(const PixelBuffer& pixels, int bx, int by, int channel,
                       WaveletDecomposition& dec)
        {
            cv::Mat block;
            readChannelBlock(pixels, bx, by, channel, block);
            forwardHaar2d(block, WaveletCodec::kLevels, dec);
        }

        // requested[i] < 0 keeps the parity slot i already has in this channel,
        // re-quantised, so a neighbouring write cannot disturb it
        bool embedChannel(PixelBuffer& pixels, int bx, int by, int channel,
                          const int (&requested)[kBandsPerBlock])
        {
            int wanted[kBandsPerBlock];
            WaveletDecomposition current;
            decompose(pixels, bx, by, channel, current);
            for (int i = 0; i < kBandsPerBlock; ++i)
                wanted[i] = requested[i] >= 0 ? requested[i] : parityOf(coefficient(current, i));

            cv::Mat block;
            readChannelBlock(pixels, bx, by, channel, block);
            applyHeadroom(block);

            WaveletDecomposition base;
            forwardHaar2d(block, WaveletCodec::kLevels, base);

            // round, then nudge by one only when the parity is wrong
            long long baseQ[kBandsPerBlock] = { 0, 0, 0 };
            long long q[kBandsPerBlock] = { 0, 0, 0 };
            for (int i = 0; i < kBandsPerBlock; ++i) {
                long long r = std::llround(coefficient(base, i) / WaveletCodec::kStep);
                if ((r & 1) != wanted[i])
                    r += wanted[i] ? 1 : -1;
                baseQ[i] = r;
                q[i] = r;
            }

            const long long retry[] = { 0, 2, -2 };
            for (long long offset : retry) {
                WaveletDecomposition dec = base;
                dec.details[0].hl = base.details[0].hl.clone();
                dec.details[0].lh = base.details[0].lh.clone();
                dec.details[0].hh = base.details[0].hh.clone();
                for (int i = 0; i < kBandsPerBlock; ++i)
                    coefficient(dec, i) = static_cast<double>(q[i]) * WaveletCodec::kStep;

                cv::Mat spatial;
                inverseHaar2d(dec, spatial);
                writeChannelBlock(pixels, bx, by, channel, spatial);

                WaveletDecomposition check;
                decompose(pixels, bx, by, channel, check);
                bool allKept = true;
                for (int i = 0; i < kBandsPerBlock; ++i) {
                    if (parityOf(coefficient(check, i)) != wanted[i]) {
                        allKept = false;
                        q[i] = baseQ[i] + (offset == 0 ? 2 : -2);
                    }
                }
                if (allKept)
                    return true;
            }
            return false;
        }

    } // namespace

    size_t WaveletCodec::slotCount(int width, int height) const
    {
        return static_cast<size_t>(width / kBlockSize) * (height / kBlockSize) * kBandsPerBlock;
    }

    bool WaveletCodec::embedAt(PixelBuffer& pixels, const Bits& bits, size_t address) const
    {
        if (!checkRange(pixels, address, bits.size(), "dwt embed"))
            return false;

        const int blocksPerRow = pixels.cols / kBlockSize;
        size_t i = 0;
        while (i < bits.size()) {
            // gather every bit that lands in this block so it is transformed once
            const size_t block = (address + i) / kBandsPerBlock;
            int wanted[kBandsPerBlock] = { -1, -1, -1 };
            while (i < bits.size() && (address + i) / kBandsPerBlock == block) {
                wanted[(address + i) % kBandsPerBlock] = bits[i] & 1;
                ++i;
            }

            const int bx = static_cast<int>(block % blocksPerRow);
            const int by = static_cast<int>(block / blocksPerRow);
            for (int ch = 0; ch < kColorChannels; ++ch) {
                if (!embedChannel(pixels, bx, by, ch, wanted)) {
                    std::cerr << "[dwt embed] block (" << bx << ", " << by
                              << ") channel " << ch << " did not keep its bits\n";
                    return false;
                }
            }
        }
        return true;
    }

    bool WaveletCodec::extractAt(const PixelBuffer& pixels, size_t address, size_t count,
                                 Bits& outBits) const
    {
        if (!checkRange(pixels, address, count, "dwt extract"))
            return false;

        const int blocksPerRow = pixels.cols / kBlockSize;
        Bits bits;
        bits.reserve(count);

        size_t cachedBlock = static_cast<size_t>(-1);
        WaveletDecomposition dec[kColorChannels];
        for (size_t i = 0; i < count; ++i) {
            const size_t slot = address + i;
            const size_t block = slot / kBandsPerBlock;
            if (block != cachedBlock) {
                const int bx = static_cast<int>(block % blocksPerRow);
                const int by = static_cast<int>(block / blocksPerRow);
                for (int ch = 0; ch < kColorChannels; ++ch)
                    decompose(pixels, bx, by, ch, dec[ch]);
                cachedBlock = block;
            }

            int votes = 0;
            for (int ch = 0; ch < kColorChannels; ++ch)
                votes += parityOf(coefficient(dec[ch], static_cast<int>(slot % kBandsPerBlock)));
            bits.push_back(votes >= 2 ? 1 : 0);
        }
        outBits.swap(bits);
        return true;
    }

} // namespace pixelvault
