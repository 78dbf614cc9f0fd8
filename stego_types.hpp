#ifndef PIXELVAULT_STEGO_TYPES_HPP
#define PIXELVAULT_STEGO_TYPES_HPP

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace pixelvault {

    // RGBA, CV_8UC4, continuous
    using PixelBuffer = cv::Mat;

    // one 0/1 value per element, MSB-first wherever a number is spread over bits
    using Bits = std::vector<uint8_t>;

    constexpr int kChannels      = 4;
    constexpr int kColorChannels = 3;
    constexpr int kBlockSize     = 8;

    // 4-bit identifiers stored in the global header
    enum class TransformId : uint8_t {
        Spatial         = 0,  // 0000
        Frequency       = 1,  // 0001
        Wavelet         = 2,  // 0010
        MultiBitSpatial = 3   // 0011
    };

    enum class CipherId : uint8_t {
        None,
        Aes256Gcm,
        ChaCha20Poly1305,
        Aes256Cbc
    };

    enum class Status {
        Ok,
        NotFound,
        PasswordRequired,
        Expired,
        CapacityExceeded,
        UnsupportedTransform,
        UnsupportedCipher,
        DecryptionFailure,
        InvalidLengthField,
        InvalidPixelBuffer,
        ImageLoadFailure,
        MissingRenderContext
    };

    const char* statusName(Status s);

    // "lsb", "dct", "dwt", "multibit-lsb"
    const char* transformName(TransformId id);
    bool parseTransformName(const std::string& name, TransformId& out);
    bool transformFromBits(uint8_t value, TransformId& out);

    // "none", "aes256-gcm", "chacha20-poly1305", "aes256-cbc"
    const char* cipherName(CipherId id);
    bool parseCipherName(const std::string& name, CipherId& out);

    bool isValidPixelBuffer(const PixelBuffer& pixels);

} // namespace pixelvault

#endif // PIXELVAULT_STEGO_TYPES_HPP
