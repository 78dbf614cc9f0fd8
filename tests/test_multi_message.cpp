#include <gtest/gtest.h>

#include "lsb_image_stego.hpp"
#include "multi_message_stego.hpp"
#include "test_images.hpp"

#include <string>
#include <vector>

using namespace pixelvault;

namespace {

    class MultiMessageTest : public ::testing::Test
    {
    protected:
        MultiMessageTest() : rng_(1234), stego_(rng_) {}

        Status embed(const PixelBuffer& cover, const Payload* primary,
                     const std::vector<Payload>& decoys, const EncodeOptions& options,
                     PixelBuffer& out, EncodeReport* report = nullptr)
        {
            return stego_.encode(cover, primary, decoys, options, out, report);
        }

        Status extract(const PixelBuffer& img, const std::string& password, std::string& text,
                       const DecodeOptions& options = DecodeOptions())
        {
            DecodeResult result;
            const Status st = stego_.decode(img, password, options, result);
            text = result.plaintext;
            return st;
        }

        static Payload payload(const std::string& text, const std::string& password, int index = 0)
        {
            Payload p;
            p.plaintext = text;
            p.password = password;
            p.priorityIndex = index;
            return p;
        }

        // writes the 36 header bits directly
        static void writeHeader(PixelBuffer& img, uint32_t length, uint8_t transformId)
        {
            Bits header;
            appendUint32(header, length);
            for (int i = 3; i >= 0; --i)
                header.push_back((transformId >> i) & 1);
            SpatialCodec codec;
            ASSERT_TRUE(codec.embedAt(img, header, 0));
        }

        testutil::SeededRandom rng_;
        MultiMessageStego stego_;
    };

} // namespace

// --- concrete scenarios ---

TEST_F(MultiMessageTest, SpatialPlainHello)
{
    const PixelBuffer cover = testutil::makeTexturedImage(64, 64);
    const Payload primary = payload("HELLO", "");

    PixelBuffer out;
    ASSERT_EQ(embed(cover, &primary, {}, EncodeOptions(), out), Status::Ok);

    std::string text;
    ASSERT_EQ(extract(out, "", text), Status::Ok);
    EXPECT_EQ(text, "HELLO");
}

TEST_F(MultiMessageTest, FrequencyWithPassword)
{
    const PixelBuffer cover = testutil::makeTexturedImage(256, 256);
    const Payload primary = payload("TOP SECRET", "abc123456789");

    EncodeOptions options;
    options.transform = TransformId::Frequency;

    PixelBuffer out;
    ASSERT_EQ(embed(cover, &primary, {}, options, out), Status::Ok);

    std::string text;
    ASSERT_EQ(extract(out, "abc123456789", text), Status::Ok);
    EXPECT_EQ(text, "TOP SECRET");

    const Status wrong = extract(out, "abc123456780", text);
    EXPECT_EQ(wrong, Status::DecryptionFailure);
    EXPECT_NE(text, "TOP SECRET");
}

TEST_F(MultiMessageTest, PrimaryAndTwoDecoys)
{
    const PixelBuffer cover = testutil::makeTexturedImage(256, 256);
    const Payload primary = payload("MAIN", "p0");
    const std::vector<Payload> decoys = { payload("ALPHA", "p1", 1), payload("BETA", "p2", 2) };

    PixelBuffer out;
    ASSERT_EQ(embed(cover, &primary, decoys, EncodeOptions(), out), Status::Ok);

    std::string text;
    ASSERT_EQ(extract(out, "p0", text), Status::Ok);
    EXPECT_EQ(text, "MAIN");
    ASSERT_EQ(extract(out, "p1", text), Status::Ok);
    EXPECT_EQ(text, "ALPHA");
    ASSERT_EQ(extract(out, "p2", text), Status::Ok);
    EXPECT_EQ(text, "BETA");
    EXPECT_EQ(extract(out, "p3", text), Status::DecryptionFailure);
}

TEST_F(MultiMessageTest, DecoysUnderTransformCodecs)
{
    const PixelBuffer cover = testutil::makeTexturedImage(512, 512);
    const Payload primary = payload("MAIN", "p0");
    const std::vector<Payload> decoys = { payload("ALPHA", "p1", 1), payload("BETA", "p2", 2) };

    const TransformId transforms[] = { TransformId::Frequency, TransformId::Wavelet,
                                       TransformId::MultiBitSpatial };
    for (TransformId t : transforms) {
        EncodeOptions options;
        options.transform = t;

        PixelBuffer out;
        ASSERT_EQ(embed(cover, &primary, decoys, options, out), Status::Ok) << transformName(t);

        std::string text;
        ASSERT_EQ(extract(out, "p0", text), Status::Ok) << transformName(t);
        EXPECT_EQ(text, "MAIN");
        ASSERT_EQ(extract(out, "p1", text), Status::Ok) << transformName(t);
        EXPECT_EQ(text, "ALPHA");
        ASSERT_EQ(extract(out, "p2", text), Status::Ok) << transformName(t);
        EXPECT_EQ(text, "BETA");
    }
}

TEST_F(MultiMessageTest, OversizedMessageIsRejectedBeforeAnyWrite)
{
    const PixelBuffer cover = testutil::makeTexturedImage(64, 64);
    const PixelBuffer pristine = cover.clone();
    const Payload primary = payload(std::string(2000, 'x'), "");

    PixelBuffer out;
    EncodeReport report;
    EXPECT_EQ(embed(cover, &primary, {}, EncodeOptions(), out, &report), Status::CapacityExceeded);
    EXPECT_EQ(report.state, EncodeState::Rejected);
    EXPECT_EQ(report.capacity, 12288u);
    EXPECT_GT(static_cast<double>(report.totalFrameBits), 0.75 * 12288);
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(testutil::sameBytes(cover, pristine));
}

TEST_F(MultiMessageTest, SafetyFractionBoundary)
{
    // find the longest message that still fits under 3/4 of the capacity
    const PixelBuffer cover = testutil::makeTexturedImage(32, 32);  // 3072 bits, limit 2304
    size_t fits = 0;
    for (size_t n = 20; n < 300; ++n) {
        const Payload primary = payload(std::string(n, 'z'), "");
        PixelBuffer out;
        EncodeReport report;
        const Status st = embed(cover, &primary, {}, EncodeOptions(), out, &report);
        if (st != Status::Ok) {
            EXPECT_EQ(st, Status::CapacityExceeded);
            EXPECT_GT(static_cast<double>(report.totalFrameBits), 0.75 * report.capacity);
            break;
        }
        EXPECT_LE(static_cast<double>(report.totalFrameBits), 0.75 * report.capacity);
        fits = n;
    }
    EXPECT_GT(fits, 100u);
    EXPECT_LT(fits, 288u);
}

// --- layout ---

TEST_F(MultiMessageTest, OffsetsFollowHeaderAndGaps)
{
    const PixelBuffer cover = testutil::makeTexturedImage(128, 128);
    const Payload primary = payload("MAIN", "");
    const std::vector<Payload> decoys = { payload("ALPHA", "", 1), payload("BETA", "", 2) };

    PixelBuffer out;
    EncodeReport report;
    ASSERT_EQ(embed(cover, &primary, decoys, EncodeOptions(), out, &report), Status::Ok);
    EXPECT_EQ(report.state, EncodeState::Done);
    ASSERT_EQ(report.offsets.size(), 3u);

    const OffsetEntry& p = report.offsets[0];
    const OffsetEntry& d1 = report.offsets[1];
    const OffsetEntry& d2 = report.offsets[2];
    EXPECT_FALSE(p.isDecoy);
    EXPECT_EQ(p.address, 36u);
    EXPECT_EQ(d1.address, p.address + p.bitLength + 100);
    EXPECT_EQ(d2.address, d1.address + d1.bitLength + 100);
    EXPECT_EQ(report.totalFrameBits, p.bitLength + d1.bitLength + d2.bitLength);

    // header carries the primary frame length and the spatial id
    SpatialCodec codec;
    Bits header;
    ASSERT_TRUE(codec.extractAt(out, 0, 36, header));
    EXPECT_EQ(readUint32(header, 0), p.bitLength);
    for (size_t i = 32; i < 36; ++i)
        EXPECT_EQ(header[i], 0);

    std::vector<FrameInfo> frames;
    ASSERT_EQ(stego_.inspect(out, DecodeOptions(), frames), Status::Ok);
    ASSERT_EQ(frames.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(frames[i].address, report.offsets[i].address);
        EXPECT_EQ(frames[i].bitLength, report.offsets[i].bitLength);
    }
}

TEST_F(MultiMessageTest, TransformIdInHeader)
{
    const PixelBuffer cover = testutil::makeTexturedImage(256, 256);
    const Payload primary = payload("X", "");
    const uint8_t expected[] = { 0, 1, 2, 3 };
    const TransformId transforms[] = { TransformId::Spatial, TransformId::Frequency,
                                       TransformId::Wavelet, TransformId::MultiBitSpatial };

    for (int k = 0; k < 4; ++k) {
        EncodeOptions options;
        options.transform = transforms[k];
        PixelBuffer out;
        ASSERT_EQ(embed(cover, &primary, {}, options, out), Status::Ok);

        SpatialCodec codec;
        Bits header;
        ASSERT_TRUE(codec.extractAt(out, 0, 36, header));
        uint8_t id = 0;
        for (size_t i = 32; i < 36; ++i)
            id = static_cast<uint8_t>((id << 1) | header[i]);
        EXPECT_EQ(id, expected[k]);
    }
}

TEST_F(MultiMessageTest, MultiBitPrimaryStartsAfterReservedSamples)
{
    const PixelBuffer cover = testutil::makeTexturedImage(64, 64);
    const Payload primary = payload("deep", "pw");

    EncodeOptions options;
    options.transform = TransformId::MultiBitSpatial;
    options.multiBitDepth = 3;

    PixelBuffer out;
    EncodeReport report;
    ASSERT_EQ(embed(cover, &primary, {}, options, out, &report), Status::Ok);
    ASSERT_EQ(report.offsets.size(), 1u);
    EXPECT_EQ(report.offsets[0].address, 36u * 3u);

    DecodeOptions dopts;
    dopts.multiBitDepth = 3;
    DecodeResult result;
    ASSERT_EQ(stego_.decode(out, "pw", dopts, result), Status::Ok);
    EXPECT_EQ(result.plaintext, "deep");
    EXPECT_EQ(result.metadata.transform, TransformId::MultiBitSpatial);
}

TEST_F(MultiMessageTest, HeaderSurvivesDamageOutsideEmbeddedRegion)
{
    const PixelBuffer cover = testutil::makeTexturedImage(64, 64);
    const Payload primary = payload("HELLO", "");

    PixelBuffer out;
    EncodeReport report;
    ASSERT_EQ(embed(cover, &primary, {}, EncodeOptions(), out, &report), Status::Ok);

    PixelBuffer damaged = out.clone();
    damaged.at<cv::Vec4b>(63, 63)[0] ^= 0x80;
    damaged.at<cv::Vec4b>(40, 10)[2] ^= 0x01;
    damaged.at<cv::Vec4b>(0, 0)[0] ^= 0x80;   // high bit of a header sample
    damaged.at<cv::Vec4b>(0, 5)[3] ^= 0xFF;   // alpha is never read

    SpatialCodec codec;
    Bits before, after;
    ASSERT_TRUE(codec.extractAt(out, 0, 36, before));
    ASSERT_TRUE(codec.extractAt(damaged, 0, 36, after));
    EXPECT_EQ(before, after);

    std::string text;
    ASSERT_EQ(extract(damaged, "", text), Status::Ok);
    EXPECT_EQ(text, "HELLO");
}

// --- edge cases ---

TEST_F(MultiMessageTest, EmptyMessageRoundTrips)
{
    const PixelBuffer cover = testutil::makeTexturedImage(64, 64);

    const Payload plain = payload("", "");
    PixelBuffer out;
    ASSERT_EQ(embed(cover, &plain, {}, EncodeOptions(), out), Status::Ok);
    std::string text = "junk";
    ASSERT_EQ(extract(out, "", text), Status::Ok);
    EXPECT_EQ(text, "");

    const Payload locked = payload("", "secret");
    ASSERT_EQ(embed(cover, &locked, {}, EncodeOptions(), out), Status::Ok);
    text = "junk";
    ASSERT_EQ(extract(out, "secret", text), Status::Ok);
    EXPECT_EQ(text, "");
}

TEST_F(MultiMessageTest, DecoyIndependenceRegardlessOfOrder)
{
    const PixelBuffer cover = testutil::makeTexturedImage(256, 256);
    const Payload primary = payload("MAIN", "p0");
    const std::vector<Payload> forward = { payload("ALPHA", "p1", 1), payload("BETA", "p2", 2) };
    const std::vector<Payload> reversed = { payload("BETA", "p2", 2), payload("ALPHA", "p1", 1) };
    const std::vector<Payload> swapped = { payload("BETA", "p2", 1), payload("ALPHA", "p1", 2) };

    const std::vector<Payload>* sets[] = { &forward, &reversed, &swapped };
    for (const std::vector<Payload>* decoys : sets) {
        PixelBuffer out;
        ASSERT_EQ(embed(cover, &primary, *decoys, EncodeOptions(), out), Status::Ok);

        std::string text;
        ASSERT_EQ(extract(out, "p0", text), Status::Ok);
        EXPECT_EQ(text, "MAIN");
        ASSERT_EQ(extract(out, "p1", text), Status::Ok);
        EXPECT_EQ(text, "ALPHA");
        ASSERT_EQ(extract(out, "p2", text), Status::Ok);
        EXPECT_EQ(text, "BETA");
    }
}

TEST_F(MultiMessageTest, DecoysAreSortedByPriorityAndEmptyOnesSkipped)
{
    const PixelBuffer cover = testutil::makeTexturedImage(128, 128);
    const Payload primary = payload("MAIN", "");
    const std::vector<Payload> decoys = {
        payload("third", "", 5), payload("", "x", 1), payload("first", "", 2),
        payload("second", "", 2)
    };

    PixelBuffer out;
    EncodeReport report;
    ASSERT_EQ(embed(cover, &primary, decoys, EncodeOptions(), out, &report), Status::Ok);
    ASSERT_EQ(report.offsets.size(), 4u);
    EXPECT_EQ(report.offsets[1].priorityIndex, 2);
    EXPECT_EQ(report.offsets[2].priorityIndex, 2);
    EXPECT_EQ(report.offsets[3].priorityIndex, 5);

    std::vector<FrameInfo> frames;
    ASSERT_EQ(stego_.inspect(out, DecodeOptions(), frames), Status::Ok);
    ASSERT_EQ(frames.size(), 4u);
    EXPECT_FALSE(frames[0].metadata.isDecoy);
    EXPECT_TRUE(frames[1].metadata.isDecoy);

    // a priority filter picks one RAW frame out of several
    DecodeOptions only5;
    only5.filterIndex = true;
    only5.priorityIndex = 5;
    std::string text;
    ASSERT_EQ(extract(out, "", text, only5), Status::Ok);
    EXPECT_EQ(text, "third");

    DecodeOptions only2 = only5;
    only2.priorityIndex = 2;
    ASSERT_EQ(extract(out, "", text, only2), Status::Ok);
    EXPECT_EQ(text, "first");

    DecodeOptions only9 = only5;
    only9.priorityIndex = 9;
    EXPECT_EQ(extract(out, "", text, only9), Status::NotFound);
}

TEST_F(MultiMessageTest, DecoysWithoutPrimary)
{
    const PixelBuffer cover = testutil::makeTexturedImage(128, 128);
    const std::vector<Payload> decoys = { payload("ALPHA", "p1", 1) };

    PixelBuffer out;
    EncodeReport report;
    ASSERT_EQ(embed(cover, nullptr, decoys, EncodeOptions(), out, &report), Status::Ok);
    ASSERT_EQ(report.offsets.size(), 1u);
    EXPECT_EQ(report.offsets[0].address, 36u + 100u);

    SpatialCodec codec;
    Bits header;
    ASSERT_TRUE(codec.extractAt(out, 0, 36, header));
    EXPECT_EQ(readUint32(header, 0), 0u);

    std::string text;
    ASSERT_EQ(extract(out, "p1", text), Status::Ok);
    EXPECT_EQ(text, "ALPHA");
}

TEST_F(MultiMessageTest, PasswordRules)
{
    const PixelBuffer cover = testutil::makeTexturedImage(128, 128);
    const Payload locked = payload("hidden", "pw");
    const Payload open = payload("visible", "");

    PixelBuffer lockedImg, openImg;
    ASSERT_EQ(embed(cover, &locked, {}, EncodeOptions(), lockedImg), Status::Ok);
    ASSERT_EQ(embed(cover, &open, {}, EncodeOptions(), openImg), Status::Ok);

    std::string text;
    EXPECT_EQ(extract(lockedImg, "", text), Status::PasswordRequired);
    EXPECT_EQ(extract(openImg, "pw", text), Status::NotFound);
}

TEST_F(MultiMessageTest, AlternateCiphersRoundTrip)
{
    const PixelBuffer cover = testutil::makeTexturedImage(128, 128);
    const Payload primary = payload("cipher check", "pw");
    const CipherId ciphers[] = { CipherId::ChaCha20Poly1305, CipherId::Aes256Cbc };

    for (CipherId c : ciphers) {
        EncodeOptions options;
        options.cipher = c;
        PixelBuffer out;
        ASSERT_EQ(embed(cover, &primary, {}, options, out), Status::Ok) << cipherName(c);

        DecodeResult result;
        ASSERT_EQ(stego_.decode(out, "pw", DecodeOptions(), result), Status::Ok);
        EXPECT_EQ(result.plaintext, "cipher check");
        EXPECT_EQ(result.metadata.cipher, c);
        EXPECT_TRUE(result.encrypted);
    }
}

TEST_F(MultiMessageTest, CbcDecoysOnlyOpenWithTheirOwnPassword)
{
    const PixelBuffer cover = testutil::makeTexturedImage(256, 256);
    const Payload primary = payload("MAIN", "p0");
    const std::vector<Payload> decoys = { payload("ALPHA", "p1", 1), payload("BETA", "p2", 2) };

    EncodeOptions options;
    options.cipher = CipherId::Aes256Cbc;

    // several seeds so that a CBC frame opening under another frame's key would show up
    for (uint32_t seed = 1; seed <= 8; ++seed) {
        testutil::SeededRandom rng(seed);
        MultiMessageStego stego(rng);

        PixelBuffer out;
        ASSERT_EQ(stego.encode(cover, &primary, decoys, options, out), Status::Ok);

        const char* passwords[] = { "p0", "p1", "p2" };
        const char* expected[]  = { "MAIN", "ALPHA", "BETA" };
        for (int i = 0; i < 3; ++i) {
            DecodeResult result;
            ASSERT_EQ(stego.decode(out, passwords[i], DecodeOptions(), result), Status::Ok)
                << "seed " << seed;
            EXPECT_EQ(result.plaintext, expected[i]) << "seed " << seed;
        }

        DecodeResult none;
        EXPECT_EQ(stego.decode(out, "p3", DecodeOptions(), none), Status::DecryptionFailure);
    }
}

TEST_F(MultiMessageTest, ExpiryIsCheckedAgainstNow)
{
    const PixelBuffer cover = testutil::makeTexturedImage(64, 64);
    const Payload primary = payload("short lived", "");

    EncodeOptions options;
    options.hasExpiry = true;
    options.expiry = 1700000000;

    PixelBuffer out;
    ASSERT_EQ(embed(cover, &primary, {}, options, out), Status::Ok);

    DecodeOptions before;
    before.hasNow = true;
    before.now = 1600000000;
    std::string text;
    ASSERT_EQ(extract(out, "", text, before), Status::Ok);
    EXPECT_EQ(text, "short lived");

    DecodeOptions after;
    after.hasNow = true;
    after.now = 1800000000;
    EXPECT_EQ(extract(out, "", text, after), Status::Expired);

    DecodeOptions atExpiry;
    atExpiry.hasNow = true;
    atExpiry.now = 1700000000;
    EXPECT_EQ(extract(out, "", text, atExpiry), Status::Expired);

    // the wall clock is past the expiry
    EXPECT_EQ(extract(out, "", text), Status::Expired);
}

TEST_F(MultiMessageTest, EpochZeroIsAnExplicitClock)
{
    const PixelBuffer cover = testutil::makeTexturedImage(64, 64);
    const Payload primary = payload("from the past", "");

    EncodeOptions options;
    options.hasExpiry = true;
    options.expiry = 1700000000;

    PixelBuffer out;
    ASSERT_EQ(embed(cover, &primary, {}, options, out), Status::Ok);

    DecodeOptions epoch;
    epoch.hasNow = true;
    epoch.now = 0;
    std::string text;
    ASSERT_EQ(extract(out, "", text, epoch), Status::Ok);
    EXPECT_EQ(text, "from the past");

    DecodeOptions negative;
    negative.hasNow = true;
    negative.now = -1;
    EXPECT_EQ(extract(out, "", text, negative), Status::Ok);
}

// --- rejected inputs ---

TEST_F(MultiMessageTest, RejectsBadConfiguration)
{
    const PixelBuffer cover = testutil::makeTexturedImage(64, 64);
    const Payload primary = payload("HELLO", "pw");
    PixelBuffer out;
    EncodeReport report;

    EncodeOptions noCipher;
    noCipher.cipher = CipherId::None;
    EXPECT_EQ(embed(cover, &primary, {}, noCipher, out, &report), Status::UnsupportedCipher);
    EXPECT_EQ(report.state, EncodeState::Rejected);

    EncodeOptions badDepth;
    badDepth.transform = TransformId::MultiBitSpatial;
    badDepth.multiBitDepth = 0;
    EXPECT_EQ(embed(cover, &primary, {}, badDepth, out), Status::UnsupportedTransform);

    const PixelBuffer rgb(64, 64, CV_8UC3, cv::Scalar(1, 2, 3));
    EXPECT_EQ(embed(rgb, &primary, {}, EncodeOptions(), out), Status::InvalidPixelBuffer);
    EXPECT_TRUE(out.empty());
}

TEST_F(MultiMessageTest, DecodeRejectsBadHeaders)
{
    std::string text;

    // all LSBs zero: length 0 and nothing after it
    const PixelBuffer blank = testutil::makeFlatImage(64, 64, 100);
    EXPECT_EQ(extract(blank, "", text), Status::InvalidLengthField);

    PixelBuffer tooLong = blank.clone();
    writeHeader(tooLong, 0xFFFFFFFFu, 0);
    EXPECT_EQ(extract(tooLong, "", text), Status::InvalidLengthField);

    PixelBuffer unknownId = blank.clone();
    writeHeader(unknownId, 64, 0xF);
    EXPECT_EQ(extract(unknownId, "", text), Status::UnsupportedTransform);

    // plausible length but no frame behind it
    PixelBuffer noFrame = blank.clone();
    writeHeader(noFrame, 64, 0);
    EXPECT_EQ(extract(noFrame, "", text), Status::NotFound);

    const PixelBuffer rgb(64, 64, CV_8UC3, cv::Scalar(1, 2, 3));
    EXPECT_EQ(extract(rgb, "", text), Status::InvalidPixelBuffer);
}

TEST_F(MultiMessageTest, CapacityMatchesCodecs)
{
    EXPECT_EQ(MultiMessageStego::capacity(64, 64, TransformId::Spatial), 12288u);
    EXPECT_EQ(MultiMessageStego::capacity(256, 256, TransformId::Frequency), 3072u);
    EXPECT_EQ(MultiMessageStego::capacity(256, 256, TransformId::Wavelet), 3072u);
    EXPECT_EQ(MultiMessageStego::capacity(64, 64, TransformId::MultiBitSpatial, 2), 24576u);
}
