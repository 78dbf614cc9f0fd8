#include "transform_codec.hpp"
#include "bitstream.hpp"
#include "lsb_image_stego.hpp"
#include "dct_image_stego.hpp"
#include "dwt_image_stego.hpp"

#include <iostream>
#include <memory>

namespace pixelvault {

    bool TransformCodec::fitsStandalone(size_t totalBits, int width, int height) const
    {
        return totalBits <= capacityBits(width, height);
    }

    bool TransformCodec::checkRange(const PixelBuffer& pixels, size_t address, size_t count,
                                    const char* tag) const
    {
        if (!isValidPixelBuffer(pixels)) {
            std::cerr << "[" << tag << "] pixel buffer must be continuous CV_8UC4\n";
            return false;
        }
        const size_t capacity = capacityBits(pixels.cols, pixels.rows);
        if (address > capacity || count > capacity - address) {
            std::cerr << "[" << tag << "] range [" << address << ", " << address + count
                      << ") exceeds capacity " << capacity << " bits\n";
            return false;
        }
        return true;
    }

    bool TransformCodec::encode(const PixelBuffer& cover, const Bits& bits,
                                PixelBuffer& outPixels) const
    {
        if (!isValidPixelBuffer(cover)) {
            std::cerr << "[" << transformName(id()) << " encode] invalid pixel buffer\n";
            return false;
        }
        if (bits.empty()) {
            std::cerr << "[" << transformName(id()) << " encode] nothing to embed\n";
            return false;
        }

        const size_t totalBits = 32 + bits.size();
        if (bits.size() > 0xFFFFFFFFu || !fitsStandalone(totalBits, cover.cols, cover.rows)) {
            std::cerr << "[" << transformName(id()) << " encode] Message too long. Need "
                      << totalBits << " bits, capacity = "
                      << capacityBits(cover.cols, cover.rows) << " bits.\n";
            return false;
        }

        Bits stream;
        stream.reserve(totalBits);
        appendUint32(stream, static_cast<uint32_t>(bits.size()));
        stream.insert(stream.end(), bits.begin(), bits.end());

        PixelBuffer out = cover.clone();
        if (!embedAt(out, stream, 0))
            return false;

        outPixels = out;
        return true;
    }

    bool TransformCodec::decode(const PixelBuffer& stego, Bits& outBits) const
    {
        Bits header;
        if (!extractAt(stego, 0, 32, header)) {
            std::cerr << "[" << transformName(id()) << " decode] Not enough bits for length header.\n";
            return false;
        }

        const uint32_t msgLen = readUint32(header, 0);
        const size_t capacity = capacityBits(stego.cols, stego.rows);
        if (msgLen == 0 || msgLen > capacity - 32) {
            std::cerr << "[" << transformName(id()) << " decode] invalid message length "
                      << msgLen << " bits\n";
            return false;
        }

        return extractAt(stego, 32, msgLen, outBits);
    }

    std::unique_ptr<TransformCodec> makeCodec(TransformId id, int depth)
    {
        switch (id) {
            case TransformId::Spatial:
                return std::make_unique<SpatialCodec>();
            case TransformId::Frequency:
                return std::make_unique<FrequencyCodec>();
            case TransformId::Wavelet:
                return std::make_unique<WaveletCodec>();
            case TransformId::MultiBitSpatial:
                if (depth < 1 || depth > 8) {
                    std::cerr << "[codec] multi-bit depth must be 1..8, got " << depth << "\n";
                    return nullptr;
                }
                return std::make_unique<MultiBitSpatialCodec>(depth);
        }
        return nullptr;
    }

    size_t capacityFor(int width, int height, TransformId id, int depth)
    {
        if (width <= 0 || height <= 0)
            return 0;
        std::unique_ptr<TransformCodec> codec = makeCodec(id, depth);
        if (!codec)
            return 0;
        return codec->capacityBits(width, height);
    }

} // namespace pixelvault
