#include "bitstream.hpp"

#include <opencv2/core.hpp>
#include <iostream>

namespace pixelvault {

    namespace {

        // drops whitespace outside string literals
        std::string compactJson(const std::string& json)
        {
            std::string out;
            out.reserve(json.size());
            bool inString = false;
            bool escaped = false;
            for (char c : json) {
                if (inString) {
                    out.push_back(c);
                    if (escaped)
                        escaped = false;
                    else if (c == '\\')
                        escaped = true;
                    else if (c == '"')
                        inString = false;
                    continue;
                }
                if (c == ' ' || c == '\n' || c == '\r' || c == '\t')
                    continue;
                if (c == '"')
                    inString = true;
                out.push_back(c);
            }
            return out;
        }

    } // namespace

    Bits textToBits(const std::string& text)
    {
        Bits bits;
        bits.reserve(text.size() * 8);
        for (unsigned char byte : text) {
            for (int i = 7; i >= 0; --i) {
                bits.push_back((byte >> i) & 1);
            }
        }
        return bits;
    }

    std::string bitsToText(const Bits& bits)
    {
        std::string text;
        for (size_t pos = 0; pos + 8 <= bits.size(); pos += 8) {
            uint8_t cur = 0;
            for (int i = 0; i < 8; ++i) {
                cur = static_cast<uint8_t>((cur << 1) | (bits[pos + i] & 1));
            }
            if (cur == 0)
                break;  // sentinel
            text.push_back(static_cast<char>(cur));
        }
        return text;
    }

    void appendUint32(Bits& bits, uint32_t value)
    {
        for (int i = 31; i >= 0; --i) {
            bits.push_back((value >> i) & 1);
        }
    }

    uint32_t readUint32(const Bits& bits, size_t pos)
    {
        uint32_t value = 0;
        for (int i = 0; i < 32; ++i) {
            value = (value << 1) | (bits[pos + i] & 1);
        }
        return value;
    }

    bool metadataToJson(const PayloadMetadata& meta, std::string& outJson)
    {
        try {
            cv::FileStorage fs(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY
                                        | cv::FileStorage::FORMAT_JSON);
            fs << "ver" << meta.version;
            fs << "alg" << std::string(transformName(meta.transform));
            fs << "enc" << std::string(cipherName(meta.cipher));
            if (meta.hasExpiry)
                fs << "exp" << static_cast<double>(meta.expiry);
            fs << "dec" << (meta.isDecoy ? 1 : 0);
            fs << "idx" << meta.priorityIndex;
            outJson = compactJson(fs.releaseAndGetString());
        } catch (const cv::Exception& e) {
            std::cerr << "[frame] metadata serialization failed: " << e.what() << "\n";
            return false;
        }
        return true;
    }

    bool metadataFromJson(const std::string& json, PayloadMetadata& outMeta)
    {
        if (json.empty() || json[0] != '{')
            return false;

        try {
            cv::FileStorage fs(json, cv::FileStorage::READ | cv::FileStorage::MEMORY
                                     | cv::FileStorage::FORMAT_JSON);
            if (!fs.isOpened())
                return false;

            cv::FileNode ver = fs["ver"];
            cv::FileNode alg = fs["alg"];
            cv::FileNode enc = fs["enc"];
            if (!ver.isString() || !alg.isString() || !enc.isString()) {
                std::cerr << "[frame] metadata is missing ver/alg/enc\n";
                return false;
            }

            PayloadMetadata meta;
            meta.version = static_cast<std::string>(ver);
            if (!parseTransformName(static_cast<std::string>(alg), meta.transform)) {
                std::cerr << "[frame] unknown transform in metadata: "
                          << static_cast<std::string>(alg) << "\n";
                return false;
            }
            if (!parseCipherName(static_cast<std::string>(enc), meta.cipher)) {
                std::cerr << "[frame] unknown cipher in metadata: "
                          << static_cast<std::string>(enc) << "\n";
                return false;
            }

            cv::FileNode exp = fs["exp"];
            if (!exp.empty()) {
                meta.hasExpiry = true;
                meta.expiry = static_cast<int64_t>(static_cast<double>(exp));
            }
            meta.isDecoy = static_cast<int>(fs["dec"]) != 0;
            meta.priorityIndex = static_cast<int>(fs["idx"]);

            outMeta = meta;
        } catch (const cv::Exception& e) {
            std::cerr << "[frame] metadata is not valid JSON: " << e.what() << "\n";
            return false;
        }
        return true;
    }

    bool buildFrame(const PayloadMetadata& meta, const std::string& body,
                    bool encrypted, Bits& outBits)
    {
        std::string json;
        if (!metadataToJson(meta, json))
            return false;

        if (body.find('\0') != std::string::npos) {
            // extraction stops at the first zero byte
            std::cerr << "[frame] body contains a NUL byte, it will be truncated on extraction\n";
        }

        std::string text = (encrypted ? kEncTag : kRawTag) + json + kBodySep + body;
        outBits = textToBits(text);
        outBits.insert(outBits.end(), 8, 0);
        return true;
    }

    bool parseFrame(const std::string& text, Frame& out)
    {
        const std::string rawTag(kRawTag);
        const std::string encTag(kEncTag);

        bool encrypted = false;
        if (text.compare(0, encTag.size(), encTag) == 0) {
            encrypted = true;
        } else if (text.compare(0, rawTag.size(), rawTag) != 0) {
            return false;
        }

        const size_t start = encTag.size();
        const size_t sep = text.find(kBodySep, start);
        if (sep == std::string::npos) {
            std::cerr << "[frame] missing metadata separator\n";
            return false;
        }

        Frame frame;
        frame.encrypted = encrypted;
        if (!metadataFromJson(text.substr(start, sep - start), frame.metadata))
            return false;
        frame.body = text.substr(sep + 2);

        out = frame;
        return true;
    }

} // namespace pixelvault
