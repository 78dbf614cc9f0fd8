#include "multi_message_stego.hpp"
#include "lsb_image_stego.hpp"

#include <algorithm>
#include <ctime>
#include <iostream>

namespace pixelvault {

    namespace {

        constexpr size_t kReadChunkBytes = 64;

        // Reads bytes from address until the zero sentinel. Gives up early once the
        // first four bytes are not a frame tag, or when the capacity runs out.
        bool readUntilSentinel(const TransformCodec& codec, const PixelBuffer& pixels,
                               size_t address, size_t capacity,
                               std::string& text, size_t& bitLength)
        {
            const std::string rawTag(kRawTag);
            const std::string encTag(kEncTag);

            text.clear();
            size_t pos = address;
            while (pos < capacity && capacity - pos >= 8) {
                const size_t chunkBytes = std::min((capacity - pos) / 8, kReadChunkBytes);
                Bits bits;
                if (!codec.extractAt(pixels, pos, chunkBytes * 8, bits))
                    return false;

                for (size_t b = 0; b < chunkBytes; ++b) {
                    uint8_t cur = 0;
                    for (size_t i = 0; i < 8; ++i)
                        cur = static_cast<uint8_t>((cur << 1) | bits[b * 8 + i]);
                    if (cur == 0) {
                        bitLength = (text.size() + 1) * 8;
                        return text.size() >= rawTag.size();
                    }
                    text.push_back(static_cast<char>(cur));
                    if (text.size() == rawTag.size() && text != rawTag && text != encTag)
                        return false;
                }
                pos += chunkBytes * 8;
            }
            return false;
        }

        bool isExpired(const PayloadMetadata& meta, const DecodeOptions& options)
        {
            if (!meta.hasExpiry)
                return false;
            const int64_t clock = options.hasNow ? options.now
                                                 : static_cast<int64_t>(std::time(nullptr));
            return clock >= meta.expiry;
        }

    } // namespace

    const char* encodeStateName(EncodeState s)
    {
        switch (s) {
            case EncodeState::Idle:            return "Idle";
            case EncodeState::Framing:         return "Framing";
            case EncodeState::CapacityCheck:   return "CapacityCheck";
            case EncodeState::EmbeddingMain:   return "EmbeddingMain";
            case EncodeState::EmbeddingDecoys: return "EmbeddingDecoys";
            case EncodeState::Done:            return "Done";
            case EncodeState::Rejected:        return "Rejected";
        }
        return "Unknown";
    }

    MultiMessageStego::MultiMessageStego(crypto::RandomSource& rng)
        : cipher_(rng)
    {
    }

    size_t MultiMessageStego::capacity(int width, int height, TransformId transform,
                                       int multiBitDepth)
    {
        return capacityFor(width, height, transform, multiBitDepth);
    }

    Status MultiMessageStego::buildPayloadFrame(const Payload& payload, bool isDecoy,
                                                int priorityIndex,
                                                const EncodeOptions& options,
                                                Bits& outBits) const
    {
        PayloadMetadata meta;
        meta.transform     = options.transform;
        meta.cipher        = payload.password.empty() ? CipherId::None : options.cipher;
        meta.hasExpiry     = options.hasExpiry;
        meta.expiry        = options.expiry;
        meta.isDecoy       = isDecoy;
        meta.priorityIndex = priorityIndex;

        std::string body = payload.plaintext;
        const bool encrypted = !payload.password.empty();
        if (encrypted) {
            const Status st = cipher_.seal(options.cipher, payload.plaintext, payload.password, body);
            if (st != Status::Ok)
                return st;
        }

        if (!buildFrame(meta, body, encrypted, outBits)) {
            std::cerr << "[encode] could not serialise frame metadata\n";
            return Status::UnsupportedTransform;
        }
        return Status::Ok;
    }

    Status MultiMessageStego::encode(const PixelBuffer& cover,
                                     const Payload* primary,
                                     const std::vector<Payload>& decoys,
                                     const EncodeOptions& options,
                                     PixelBuffer& outPixels,
                                     EncodeReport* report) const
    {
        EncodeReport local;
        EncodeReport& rep = report ? *report : local;
        rep = EncodeReport();

        if (!isValidPixelBuffer(cover)) {
            std::cerr << "[encode] pixel buffer must be continuous CV_8UC4\n";
            rep.state = EncodeState::Rejected;
            return Status::InvalidPixelBuffer;
        }

        std::unique_ptr<TransformCodec> codec = makeCodec(options.transform, options.multiBitDepth);
        if (!codec) {
            std::cerr << "[encode] unsupported transform configuration\n";
            rep.state = EncodeState::Rejected;
            return Status::UnsupportedTransform;
        }
        if (options.cipher == CipherId::None) {
            const bool anyPassword = (primary && !primary->password.empty())
                || std::any_of(decoys.begin(), decoys.end(),
                               [](const Payload& d) { return !d.plaintext.empty() && !d.password.empty(); });
            if (anyPassword) {
                std::cerr << "[encode] a password was given but the cipher is 'none'\n";
                rep.state = EncodeState::Rejected;
                return Status::UnsupportedCipher;
            }
        }

        // --- Framing ---
        rep.state = EncodeState::Framing;

        Bits primaryBits;
        if (primary) {
            const Status st = buildPayloadFrame(*primary, false, 0, options, primaryBits);
            if (st != Status::Ok) {
                rep.state = EncodeState::Rejected;
                return st;
            }
        }

        std::vector<const Payload*> ordered;
        for (const Payload& d : decoys) {
            if (!d.plaintext.empty())
                ordered.push_back(&d);
        }
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const Payload* a, const Payload* b) {
                             return a->priorityIndex < b->priorityIndex;
                         });

        std::vector<Bits> decoyBits(ordered.size());
        for (size_t i = 0; i < ordered.size(); ++i) {
            const Status st = buildPayloadFrame(*ordered[i], true, ordered[i]->priorityIndex,
                                                options, decoyBits[i]);
            if (st != Status::Ok) {
                rep.state = EncodeState::Rejected;
                return st;
            }
        }

        // --- CapacityCheck ---
        rep.state = EncodeState::CapacityCheck;

        const size_t capacity = codec->capacityBits(cover.cols, cover.rows);
        const size_t start = kHeaderBits * static_cast<size_t>(codec->bitsPerSlot());
        rep.capacity = capacity;

        size_t total = primaryBits.size();
        for (const Bits& b : decoyBits)
            total += b.size();
        rep.totalFrameBits = total;

        OffsetTable offsets;
        size_t cursor = start;
        if (primary) {
            OffsetEntry e;
            e.priorityIndex = 0;
            e.isDecoy = false;
            e.address = cursor;
            e.bitLength = primaryBits.size();
            offsets.push_back(e);
            cursor += primaryBits.size();
        }
        for (size_t i = 0; i < decoyBits.size(); ++i) {
            OffsetEntry e;
            e.priorityIndex = ordered[i]->priorityIndex;
            e.isDecoy = true;
            e.address = cursor + kDecoyGapBits;
            e.bitLength = decoyBits[i].size();
            offsets.push_back(e);
            cursor = e.address + e.bitLength;
        }

        if (static_cast<double>(total) > kSafetyFraction * static_cast<double>(capacity)
            || cursor > capacity
            || primaryBits.size() > 0xFFFFFFFFu)
        {
            std::cerr << "[encode] Message too long. Need " << total << " frame bits ("
                      << cursor << " with header and gaps), capacity = " << capacity
                      << " bits, limit = " << static_cast<size_t>(kSafetyFraction * capacity) << "\n";
            rep.state = EncodeState::Rejected;
            return Status::CapacityExceeded;
        }
        rep.offsets = offsets;

        // --- Embedding ---
        PixelBuffer out = cover.clone();

        rep.state = EncodeState::EmbeddingMain;
        size_t next = 0;
        if (primary) {
            if (!codec->embedAt(out, primaryBits, offsets[next].address)) {
                std::cerr << "[encode] primary frame could not be embedded\n";
                rep.state = EncodeState::Rejected;
                return Status::CapacityExceeded;
            }
            ++next;
        }

        rep.state = EncodeState::EmbeddingDecoys;
        for (size_t i = 0; i < decoyBits.size(); ++i, ++next) {
            if (!codec->embedAt(out, decoyBits[i], offsets[next].address)) {
                std::cerr << "[encode] decoy " << ordered[i]->priorityIndex
                          << " could not be embedded\n";
                rep.state = EncodeState::Rejected;
                return Status::CapacityExceeded;
            }
        }

        // header goes last, straight into the sample LSBs the codec left reserved
        Bits header;
        header.reserve(kHeaderBits);
        appendUint32(header, static_cast<uint32_t>(primaryBits.size()));
        const uint8_t tid = static_cast<uint8_t>(options.transform);
        for (int i = static_cast<int>(kTransformFieldBits) - 1; i >= 0; --i)
            header.push_back((tid >> i) & 1);

        SpatialCodec headerCodec;
        if (!headerCodec.embedAt(out, header, 0)) {
            rep.state = EncodeState::Rejected;
            return Status::CapacityExceeded;
        }

        rep.state = EncodeState::Done;
        outPixels = out;
        return Status::Ok;
    }

    Status MultiMessageStego::walkFrames(const PixelBuffer& stego, int multiBitDepth,
                                         std::vector<FoundFrame>& outFrames) const
    {
        outFrames.clear();

        if (!isValidPixelBuffer(stego)) {
            std::cerr << "[decode] pixel buffer must be continuous CV_8UC4\n";
            return Status::InvalidPixelBuffer;
        }

        SpatialCodec headerCodec;
        if (headerCodec.capacityBits(stego.cols, stego.rows) < kHeaderBits) {
            std::cerr << "[decode] image too small for the header\n";
            return Status::InvalidLengthField;
        }

        Bits header;
        if (!headerCodec.extractAt(stego, 0, kHeaderBits, header))
            return Status::InvalidLengthField;

        const uint32_t length = readUint32(header, 0);
        uint8_t tid = 0;
        for (size_t i = kLengthFieldBits; i < kHeaderBits; ++i)
            tid = static_cast<uint8_t>((tid << 1) | header[i]);

        TransformId transform;
        if (!transformFromBits(tid, transform)) {
            std::cerr << "[decode] unknown transform id " << static_cast<int>(tid) << "\n";
            return Status::UnsupportedTransform;
        }

        std::unique_ptr<TransformCodec> codec = makeCodec(transform, multiBitDepth);
        if (!codec)
            return Status::UnsupportedTransform;

        const size_t capacity = codec->capacityBits(stego.cols, stego.rows);
        const size_t start = kHeaderBits * static_cast<size_t>(codec->bitsPerSlot());
        if (start > capacity || length > capacity - start) {
            std::cerr << "[decode] length field " << length << " exceeds the "
                      << (start > capacity ? 0 : capacity - start) << " addressable bits\n";
            return Status::InvalidLengthField;
        }

        size_t cursor = start;
        if (length > 0) {
            Bits bits;
            if (!codec->extractAt(stego, start, length, bits))
                return Status::InvalidLengthField;

            // the sentinel must sit exactly at the end of the declared length
            const std::string text = bitsToText(bits);
            FoundFrame found;
            if (length % 8 != 0 || (text.size() + 1) * 8 != length
                || !parseFrame(text, found.frame))
            {
                std::cerr << "[decode] no valid primary frame at bit " << start << "\n";
                return Status::NotFound;
            }
            found.address = start;
            found.bitLength = length;
            outFrames.push_back(found);
            cursor = start + length;
        }

        // decoys: keep walking while each gap is followed by a valid frame
        while (cursor <= capacity && capacity - cursor > kDecoyGapBits) {
            const size_t address = cursor + kDecoyGapBits;
            std::string text;
            size_t bitLength = 0;
            if (!readUntilSentinel(*codec, stego, address, capacity, text, bitLength))
                break;

            FoundFrame found;
            if (!parseFrame(text, found.frame))
                break;
            found.address = address;
            found.bitLength = bitLength;
            outFrames.push_back(found);
            cursor = address + bitLength;
        }

        if (length == 0 && outFrames.empty()) {
            std::cerr << "[decode] length field is 0 and no decoy frame follows\n";
            return Status::InvalidLengthField;
        }
        return Status::Ok;
    }

    Status MultiMessageStego::decode(const PixelBuffer& stego,
                                     const std::string& password,
                                     const DecodeOptions& options,
                                     DecodeResult& out) const
    {
        std::vector<FoundFrame> frames;
        const Status walked = walkFrames(stego, options.multiBitDepth, frames);
        if (walked != Status::Ok)
            return walked;

        bool sawEncrypted = false;
        for (const FoundFrame& f : frames) {
            const PayloadMetadata& meta = f.frame.metadata;
            if (options.filterIndex && meta.priorityIndex != options.priorityIndex)
                continue;

            if (f.frame.encrypted)
                sawEncrypted = true;
            if (password.empty() == f.frame.encrypted)
                continue;

            std::string plaintext;
            if (f.frame.encrypted) {
                if (cipher_.open(meta.cipher, f.frame.body, password, plaintext) != Status::Ok)
                    continue;
            } else {
                plaintext = f.frame.body;
            }

            if (isExpired(meta, options)) {
                std::cerr << "[decode] frame " << meta.priorityIndex << " expired at "
                          << meta.expiry << "\n";
                return Status::Expired;
            }

            out.plaintext = plaintext;
            out.metadata  = meta;
            out.encrypted = f.frame.encrypted;
            out.address   = f.address;
            return Status::Ok;
        }

        if (password.empty())
            return sawEncrypted ? Status::PasswordRequired : Status::NotFound;
        return sawEncrypted ? Status::DecryptionFailure : Status::NotFound;
    }

    Status MultiMessageStego::inspect(const PixelBuffer& stego,
                                      const DecodeOptions& options,
                                      std::vector<FrameInfo>& outFrames) const
    {
        std::vector<FoundFrame> frames;
        const Status walked = walkFrames(stego, options.multiBitDepth, frames);
        if (walked != Status::Ok)
            return walked;

        outFrames.clear();
        for (const FoundFrame& f : frames) {
            if (options.filterIndex && f.frame.metadata.priorityIndex != options.priorityIndex)
                continue;
            FrameInfo info;
            info.encrypted = f.frame.encrypted;
            info.metadata  = f.frame.metadata;
            info.address   = f.address;
            info.bitLength = f.bitLength;
            outFrames.push_back(info);
        }
        return outFrames.empty() ? Status::NotFound : Status::Ok;
    }

} // namespace pixelvault
