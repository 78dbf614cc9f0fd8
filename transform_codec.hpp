#ifndef PIXELVAULT_TRANSFORM_CODEC_HPP
#define PIXELVAULT_TRANSFORM_CODEC_HPP

#include "stego_types.hpp"

#include <memory>

namespace pixelvault {

    constexpr int kDefaultMultiBitDepth = 2;

    // Common contract of the embedding transforms.
    // The carrier is slotCount() slots of bitsPerSlot() bits; bit address a
    // lives in slot a / bitsPerSlot(). embedAt/extractAt take any range inside
    // the capacity. encode/decode are the standalone form with a 32-bit length
    // header at address 0.
    class TransformCodec
    {
    public:
        virtual ~TransformCodec() = default;

        virtual TransformId id() const = 0;

        virtual size_t slotCount(int width, int height) const = 0;

        virtual int bitsPerSlot() const { return 1; }

        size_t capacityBits(int width, int height) const
        {
            return slotCount(width, height) * static_cast<size_t>(bitsPerSlot());
        }

        // Writes bits in place from the given address. False if the range does
        // not fit or a carrier could not hold its bit.
        virtual bool embedAt(PixelBuffer& pixels, const Bits& bits, size_t address) const = 0;

        // Reads count bits from the given address.
        virtual bool extractAt(const PixelBuffer& pixels, size_t address, size_t count,
                               Bits& outBits) const = 0;

        // [32-bit length][bits] from address 0, into a copy of cover
        bool encode(const PixelBuffer& cover, const Bits& bits, PixelBuffer& outPixels) const;

        // Reads the 32 header bits, then the message bits from address 32.
        bool decode(const PixelBuffer& stego, Bits& outBits) const;

    protected:
        // Capacity rule for the standalone form; totalBits includes the 32-bit header.
        virtual bool fitsStandalone(size_t totalBits, int width, int height) const;

        bool checkRange(const PixelBuffer& pixels, size_t address, size_t count,
                        const char* tag) const;
    };

    // Codec by header identifier. depth only applies to MultiBitSpatial;
    // nullptr if it is out of range.
    std::unique_ptr<TransformCodec> makeCodec(TransformId id, int depth = kDefaultMultiBitDepth);

    // Maximum embeddable bits of an RGBA image under the given transform; 0 on bad arguments.
    size_t capacityFor(int width, int height, TransformId id, int depth = kDefaultMultiBitDepth);

} // namespace pixelvault

#endif // PIXELVAULT_TRANSFORM_CODEC_HPP
