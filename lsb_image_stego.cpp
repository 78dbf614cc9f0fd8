#include "lsb_image_stego.hpp"

#include <iostream>
#include <stdexcept>

namespace pixelvault {

    // color sample index -> byte offset in the RGBA buffer
    static inline size_t sampleOffset(size_t sample)
    {
        return (sample / kColorChannels) * kChannels + sample % kColorChannels;
    }

    size_t SpatialCodec::slotCount(int width, int height) const
    {
        return static_cast<size_t>(width) * height * kColorChannels;
    }

    bool SpatialCodec::embedAt(PixelBuffer& pixels, const Bits& bits, size_t address) const
    {
        if (!checkRange(pixels, address, bits.size(), "lsb embed"))
            return false;

        uint8_t* data = pixels.ptr<uint8_t>();
        for (size_t i = 0; i < bits.size(); ++i) {
            uint8_t& sample = data[sampleOffset(address + i)];
            sample = static_cast<uint8_t>((sample & 0xFE) | (bits[i] & 1));  // clear LSB, then write
        }
        return true;
    }

    bool SpatialCodec::extractAt(const PixelBuffer& pixels, size_t address, size_t count,
                                 Bits& outBits) const
    {
        if (!checkRange(pixels, address, count, "lsb extract"))
            return false;

        const uint8_t* data = pixels.ptr<uint8_t>();
        Bits bits;
        bits.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            bits.push_back(data[sampleOffset(address + i)] & 1);
        }
        outBits.swap(bits);
        return true;
    }

    MultiBitSpatialCodec::MultiBitSpatialCodec(int depth)
        : depth_(depth)
    {
        if (depth < 1 || depth > 8)
            throw std::invalid_argument("MultiBitSpatialCodec: depth must be 1..8");
    }

    size_t MultiBitSpatialCodec::slotCount(int width, int height) const
    {
        return static_cast<size_t>(width) * height * kColorChannels;
    }

    bool MultiBitSpatialCodec::embedAt(PixelBuffer& pixels, const Bits& bits, size_t address) const
    {
        if (!checkRange(pixels, address, bits.size(), "multibit embed"))
            return false;

        uint8_t* data = pixels.ptr<uint8_t>();
        for (size_t i = 0; i < bits.size(); ++i) {
            const size_t a = address + i;
            const int shift = depth_ - 1 - static_cast<int>(a % depth_);
            uint8_t& sample = data[sampleOffset(a / depth_)];
            sample = static_cast<uint8_t>((sample & ~(1u << shift)) | ((bits[i] & 1u) << shift));
        }
        return true;
    }

    bool MultiBitSpatialCodec::extractAt(const PixelBuffer& pixels, size_t address, size_t count,
                                         Bits& outBits) const
    {
        if (!checkRange(pixels, address, count, "multibit extract"))
            return false;

        const uint8_t* data = pixels.ptr<uint8_t>();
        Bits bits;
        bits.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            const size_t a = address + i;
            const int shift = depth_ - 1 - static_cast<int>(a % depth_);
            bits.push_back((data[sampleOffset(a / depth_)] >> shift) & 1);
        }
        outBits.swap(bits);
        return true;
    }

} // namespace pixelvault
