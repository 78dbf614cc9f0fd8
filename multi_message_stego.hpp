#ifndef PIXELVAULT_MULTI_MESSAGE_STEGO_HPP
#define PIXELVAULT_MULTI_MESSAGE_STEGO_HPP

#include "bitstream.hpp"
#include "crypto.hpp"
#include "payload_cipher.hpp"
#include "stego_types.hpp"
#include "transform_codec.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pixelvault {

    // Global header: 32-bit primary frame length + 4-bit transform id,
    // always in the LSB of RGB samples 0..35.
    constexpr size_t kLengthFieldBits    = 32;
    constexpr size_t kTransformFieldBits = 4;
    constexpr size_t kHeaderBits         = kLengthFieldBits + kTransformFieldBits;
    constexpr size_t kDecoyGapBits       = 100;
    constexpr double kSafetyFraction     = 0.75;

    struct Payload {
        std::string plaintext;
        std::string password;       // empty = stored as RAW
        int         priorityIndex = 0;
    };

    struct EncodeOptions {
        TransformId transform     = TransformId::Spatial;
        CipherId    cipher        = CipherId::Aes256Gcm;
        int         multiBitDepth = kDefaultMultiBitDepth;
        bool        hasExpiry     = false;
        int64_t     expiry        = 0;  // epoch seconds
    };

    struct DecodeOptions {
        int     multiBitDepth = kDefaultMultiBitDepth;
        bool    filterIndex   = false;  // only consider frames with priorityIndex
        int     priorityIndex = 0;      // 0 = primary
        bool    hasNow        = false;  // false = wall clock
        int64_t now           = 0;      // epoch seconds for expiry checks
    };

    enum class EncodeState {
        Idle,
        Framing,
        CapacityCheck,
        EmbeddingMain,
        EmbeddingDecoys,
        Done,
        Rejected
    };

    const char* encodeStateName(EncodeState s);

    struct OffsetEntry {
        int    priorityIndex = 0;
        bool   isDecoy       = false;
        size_t address       = 0;   // first bit address inside the codec's stream
        size_t bitLength     = 0;   // frame bits including the sentinel
    };

    using OffsetTable = std::vector<OffsetEntry>;

    struct EncodeReport {
        EncodeState state          = EncodeState::Idle;
        OffsetTable offsets;
        size_t      totalFrameBits = 0;
        size_t      capacity       = 0;
    };

    struct DecodeResult {
        std::string     plaintext;
        PayloadMetadata metadata;
        bool            encrypted = false;
        size_t          address   = 0;
    };

    struct FrameInfo {
        bool            encrypted = false;
        PayloadMetadata metadata;
        size_t          address   = 0;
        size_t          bitLength = 0;
    };

    // Packs a primary payload and any number of decoys into one image.
    // Layout in the codec's address space:
    //   [36 reserved slots][primary frame][100-bit gap][decoy 1][100-bit gap][decoy 2]...
    // The header sits in the spatial LSBs of the first 36 samples.
    class MultiMessageStego
    {
    public:
        explicit MultiMessageStego(crypto::RandomSource& rng);

        // primary may be nullptr for a decoy-only image. outPixels is set only
        // on Status::Ok. report, if given, receives the final state and layout.
        Status encode(const PixelBuffer& cover,
                      const Payload* primary,
                      const std::vector<Payload>& decoys,
                      const EncodeOptions& options,
                      PixelBuffer& outPixels,
                      EncodeReport* report = nullptr) const;

        // With a password: the first ENC frame it opens. Without: the first RAW
        // frame, or PasswordRequired if only ENC frames exist.
        Status decode(const PixelBuffer& stego,
                      const std::string& password,
                      const DecodeOptions& options,
                      DecodeResult& out) const;

        // Lists every frame found, without decrypting anything.
        Status inspect(const PixelBuffer& stego,
                       const DecodeOptions& options,
                       std::vector<FrameInfo>& outFrames) const;

        static size_t capacity(int width, int height, TransformId transform,
                               int multiBitDepth = kDefaultMultiBitDepth);

    private:
        struct FoundFrame {
            Frame  frame;
            size_t address;
            size_t bitLength;
        };

        Status buildPayloadFrame(const Payload& payload, bool isDecoy, int priorityIndex,
                                 const EncodeOptions& options, Bits& outBits) const;

        Status walkFrames(const PixelBuffer& stego, int multiBitDepth,
                          std::vector<FoundFrame>& outFrames) const;

        PayloadCipher cipher_;
    };

} // namespace pixelvault

#endif // PIXELVAULT_MULTI_MESSAGE_STEGO_HPP
