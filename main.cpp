#include "crypto.hpp"
#include "image_io.hpp"
#include "metrics.hpp"
#include "multi_message_stego.hpp"

#include <opencv2/core/utility.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pixelvault;

static const char* kKeys =
    "{@command     |            | embed, extract, inspect or capacity }"
    "{help h       |            | print this message }"
    "{in i         |            | input image }"
    "{out o        | stego.png  | output image (embed) }"
    "{message m    |            | primary message (embed) }"
    "{password p   |            | password for the primary message, or for extract }"
    "{transform t  | lsb        | lsb, dct, dwt or multibit-lsb }"
    "{cipher c     | aes256-gcm | aes256-gcm, chacha20-poly1305, aes256-cbc }"
    "{depth d      | 2          | bits per sample for multibit-lsb }"
    "{expiry       | 0          | expiry as epoch seconds, 0 = never }"
    "{decoys       |            | decoy file, one 'index<TAB>password<TAB>text' per line }"
    "{index        | -1         | only consider the frame with this priority index (0 = primary) }"
    "{quality q    | 3          | PNG compression level 0..9 }";

// '#' starts a comment line; empty lines are skipped
static bool readDecoyFile(const std::string& path, std::vector<Payload>& outDecoys)
{
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[decoys] cannot open " << path << "\n";
        return false;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == '#')
            continue;

        const size_t t1 = line.find('\t');
        const size_t t2 = (t1 == std::string::npos) ? std::string::npos : line.find('\t', t1 + 1);
        if (t2 == std::string::npos) {
            std::cerr << "[decoys] line " << lineNo << ": expected index<TAB>password<TAB>text\n";
            return false;
        }

        Payload decoy;
        try {
            decoy.priorityIndex = std::stoi(line.substr(0, t1));
        } catch (const std::exception&) {
            std::cerr << "[decoys] line " << lineNo << ": bad priority index\n";
            return false;
        }
        decoy.password  = line.substr(t1 + 1, t2 - t1 - 1);
        decoy.plaintext = line.substr(t2 + 1);
        outDecoys.push_back(decoy);
    }
    return true;
}

static int fail(Status st)
{
    std::cerr << "Error: " << statusName(st) << "\n";
    return 1;
}

static int runEmbed(const cv::CommandLineParser& parser, const PixelBuffer& cover)
{
    EncodeOptions options;
    if (!parseTransformName(parser.get<std::string>("transform"), options.transform))
        return fail(Status::UnsupportedTransform);
    if (!parseCipherName(parser.get<std::string>("cipher"), options.cipher))
        return fail(Status::UnsupportedCipher);
    options.multiBitDepth = parser.get<int>("depth");

    const double expiry = parser.get<double>("expiry");
    if (expiry > 0) {
        options.hasExpiry = true;
        options.expiry = static_cast<int64_t>(expiry);
    }

    Payload primary;
    const bool hasPrimary = parser.has("message");
    if (hasPrimary) {
        primary.plaintext = parser.get<std::string>("message");
        primary.password  = parser.get<std::string>("password");
    }

    std::vector<Payload> decoys;
    if (parser.has("decoys") && !readDecoyFile(parser.get<std::string>("decoys"), decoys))
        return 1;

    if (!hasPrimary && decoys.empty()) {
        std::cerr << "Error: nothing to embed, give --message and/or --decoys\n";
        return 1;
    }

    crypto::OpenSslRandom rng;
    MultiMessageStego stego(rng);

    PixelBuffer out;
    EncodeReport report;
    const Status st = stego.encode(cover, hasPrimary ? &primary : nullptr, decoys,
                                   options, out, &report);
    if (st != Status::Ok)
        return fail(st);

    const std::string outPath = parser.get<std::string>("out");
    if (!saveRgba(outPath, out, parser.get<int>("quality")))
        return 1;

    std::cout << "[embed] Done. Saved: " << outPath << "\n";
    std::cout << "  transform : " << transformName(options.transform) << "\n";
    std::cout << "  capacity  : " << report.capacity << " bits, frames use "
              << report.totalFrameBits << "\n";
    for (const OffsetEntry& e : report.offsets) {
        std::cout << "  " << (e.isDecoy ? "decoy  " : "primary") << " idx " << e.priorityIndex
                  << " @ bit " << e.address << ", " << e.bitLength << " bits\n";
    }
    std::cout << "  PSNR      : " << metrics::computePSNR(cover, out) << " dB\n";
    std::cout << "  SSIM      : " << metrics::computeSSIM(cover, out) << "\n";
    return 0;
}

static DecodeOptions decodeOptionsFrom(const cv::CommandLineParser& parser)
{
    DecodeOptions options;
    options.multiBitDepth = parser.get<int>("depth");
    const int index = parser.get<int>("index");
    if (index >= 0) {
        options.filterIndex = true;
        options.priorityIndex = index;
    }
    return options;
}

static int runExtract(const cv::CommandLineParser& parser, const PixelBuffer& stegoImg)
{
    crypto::OpenSslRandom rng;
    MultiMessageStego stego(rng);

    DecodeResult result;
    const Status st = stego.decode(stegoImg, parser.get<std::string>("password"),
                                   decodeOptionsFrom(parser), result);
    if (st != Status::Ok)
        return fail(st);

    std::cout << result.plaintext << "\n";
    return 0;
}

static int runInspect(const cv::CommandLineParser& parser, const PixelBuffer& stegoImg)
{
    crypto::OpenSslRandom rng;
    MultiMessageStego stego(rng);

    std::vector<FrameInfo> frames;
    const Status st = stego.inspect(stegoImg, decodeOptionsFrom(parser), frames);
    if (st != Status::Ok)
        return fail(st);

    for (const FrameInfo& f : frames) {
        const PayloadMetadata& m = f.metadata;
        std::cout << (f.encrypted ? "ENC" : "RAW")
                  << "  idx=" << m.priorityIndex
                  << "  decoy=" << (m.isDecoy ? "yes" : "no")
                  << "  alg=" << transformName(m.transform)
                  << "  enc=" << cipherName(m.cipher)
                  << "  ver=" << m.version;
        if (m.hasExpiry)
            std::cout << "  exp=" << m.expiry;
        std::cout << "  @ bit " << f.address << ", " << f.bitLength << " bits\n";
    }
    return 0;
}

static int runCapacity(const cv::CommandLineParser& parser, const PixelBuffer& img)
{
    const int depth = parser.get<int>("depth");
    const TransformId all[] = { TransformId::Spatial, TransformId::Frequency,
                                TransformId::Wavelet, TransformId::MultiBitSpatial };

    std::cout << img.cols << "x" << img.rows << "\n";
    for (TransformId id : all) {
        const size_t cap = MultiMessageStego::capacity(img.cols, img.rows, id, depth);
        std::cout << "  " << transformName(id) << ": " << cap << " bits, usable "
                  << static_cast<size_t>(kSafetyFraction * cap) << " bits\n";
    }
    return 0;
}

int main(int argc, char** argv)
{
    cv::CommandLineParser parser(argc, argv, kKeys);
    parser.about("pixelvault - hide password-protected messages and decoys in images");

    if (parser.has("help") || !parser.has("@command")) {
        parser.printMessage();
        return parser.has("help") ? 0 : 1;
    }

    const std::string command = parser.get<std::string>("@command");
    if (!parser.check()) {
        parser.printErrors();
        return 1;
    }
    if (!parser.has("in")) {
        std::cerr << "Error: --in is required\n";
        return 1;
    }

    PixelBuffer img;
    const Status loaded = loadRgba(parser.get<std::string>("in"), img);
    if (loaded != Status::Ok)
        return fail(loaded);

    if (command == "embed")
        return runEmbed(parser, img);
    if (command == "extract")
        return runExtract(parser, img);
    if (command == "inspect")
        return runInspect(parser, img);
    if (command == "capacity")
        return runCapacity(parser, img);

    std::cerr << "Error: unknown command '" << command << "'\n";
    parser.printMessage();
    return 1;
}
