#ifndef PIXELVAULT_DWT_IMAGE_STEGO_HPP
#define PIXELVAULT_DWT_IMAGE_STEGO_HPP

#include "transform_codec.hpp"

namespace pixelvault {

    // Parity of quantised detail coefficients of a 2-level Haar decomposition
    // of each 8x8 block. Three slots per block, cycling HL(1,1), LH(2,1), HH(1,2)
    // of the finest level. Every bit goes into R, G and B and is read back by
    // majority vote; alpha is carried through untouched.
    //
    // The standalone limit ceil((32 + bits) / 3) <= blocks is the slot count,
    // so the default capacity rule applies.
    class WaveletCodec : public TransformCodec
    {
    public:
        static constexpr int    kLevels = 2;
        static constexpr double kStep   = 4.0;

        TransformId id() const override { return TransformId::Wavelet; }

        size_t slotCount(int width, int height) const override;

        bool embedAt(PixelBuffer& pixels, const Bits& bits, size_t address) const override;
        bool extractAt(const PixelBuffer& pixels, size_t address, size_t count,
                       Bits& outBits) const override;
    };

} // namespace pixelvault

#endif // PIXELVAULT_DWT_IMAGE_STEGO_HPP
