#ifndef PIXELVAULT_BITSTREAM_HPP
#define PIXELVAULT_BITSTREAM_HPP

#include "stego_types.hpp"

#include <cstdint>
#include <string>

namespace pixelvault {

    constexpr const char* kRawTag       = "RAW:";
    constexpr const char* kEncTag       = "ENC:";
    constexpr const char* kBodySep      = "::";
    constexpr const char* kFrameVersion = "2.0";

    // Each byte of text -> 8 bits, MSB-first, in order.
    Bits textToBits(const std::string& text);

    // Consumes 8 bits at a time, stops at the first all-zero byte (exclusive).
    // Trailing bits that do not fill a byte are ignored.
    std::string bitsToText(const Bits& bits);

    // Big-endian 32-bit field helpers for the length headers.
    void appendUint32(Bits& bits, uint32_t value);
    uint32_t readUint32(const Bits& bits, size_t pos);

    struct PayloadMetadata {
        std::string version = kFrameVersion;
        TransformId transform = TransformId::Spatial;
        CipherId    cipher = CipherId::None;
        bool        hasExpiry = false;
        int64_t     expiry = 0;          // epoch seconds
        bool        isDecoy = false;
        int         priorityIndex = 0;
    };

    // JSON through cv::FileStorage, keys: ver, alg, enc, exp (optional), dec, idx.
    bool metadataToJson(const PayloadMetadata& meta, std::string& outJson);
    bool metadataFromJson(const std::string& json, PayloadMetadata& outMeta);

    // tag + JSON(meta) + "::" + body, bit-encoded, followed by one all-zero byte.
    bool buildFrame(const PayloadMetadata& meta, const std::string& body,
                    bool encrypted, Bits& outBits);

    struct Frame {
        bool encrypted = false;
        PayloadMetadata metadata;
        std::string body;
    };

    // Parses the decoded frame text (sentinel already stripped).
    bool parseFrame(const std::string& text, Frame& out);

} // namespace pixelvault

#endif // PIXELVAULT_BITSTREAM_HPP
