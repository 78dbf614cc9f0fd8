#ifndef PIXELVAULT_DCT_IMAGE_STEGO_HPP
#define PIXELVAULT_DCT_IMAGE_STEGO_HPP

#include "transform_codec.hpp"

namespace pixelvault {

    // Parity of the quantised coefficient 5 (row 0, column 5) of each
    // 8x8 block, one slot per (block, channel) for R, G, B.
    class FrequencyCodec : public TransformCodec
    {
    public:
        static constexpr int    kCoeffIndex = 5;
        static constexpr double kStep       = 8.0;

        TransformId id() const override { return TransformId::Frequency; }

        size_t slotCount(int width, int height) const override;

        bool embedAt(PixelBuffer& pixels, const Bits& bits, size_t address) const override;
        bool extractAt(const PixelBuffer& pixels, size_t address, size_t count,
                       Bits& outBits) const override;

    protected:
        // 32 + bits must not exceed the number of blocks (not block-channel slots)
        bool fitsStandalone(size_t totalBits, int width, int height) const override;
    };

} // namespace pixelvault

#endif // PIXELVAULT_DCT_IMAGE_STEGO_HPP
