#ifndef PIXELVAULT_LSB_IMAGE_STEGO_HPP
#define PIXELVAULT_LSB_IMAGE_STEGO_HPP

#include "transform_codec.hpp"

namespace pixelvault {

    // Bit-plane substitution: one bit in the LSB of every R, G, B sample.
    // Row-major over pixels, R,G,B within a pixel, alpha never touched.
    class SpatialCodec : public TransformCodec
    {
    public:
        TransformId id() const override { return TransformId::Spatial; }

        size_t slotCount(int width, int height) const override;

        bool embedAt(PixelBuffer& pixels, const Bits& bits, size_t address) const override;
        bool extractAt(const PixelBuffer& pixels, size_t address, size_t count,
                       Bits& outBits) const override;
    };

    // Same traversal, `depth` low bits per sample, MSB-first inside the sample.
    class MultiBitSpatialCodec : public TransformCodec
    {
    public:
        explicit MultiBitSpatialCodec(int depth);

        TransformId id() const override { return TransformId::MultiBitSpatial; }

        size_t slotCount(int width, int height) const override;
        int bitsPerSlot() const override { return depth_; }

        bool embedAt(PixelBuffer& pixels, const Bits& bits, size_t address) const override;
        bool extractAt(const PixelBuffer& pixels, size_t address, size_t count,
                       Bits& outBits) const override;

    private:
        int depth_;
    };

} // namespace pixelvault

#endif // PIXELVAULT_LSB_IMAGE_STEGO_HPP
