#include "stego_types.hpp"

namespace pixelvault {

    const char* statusName(Status s)
    {
        switch (s) {
            case Status::Ok:                   return "Ok";
            case Status::NotFound:             return "NotFound";
            case Status::PasswordRequired:     return "PasswordRequired";
            case Status::Expired:              return "Expired";
            case Status::CapacityExceeded:     return "CapacityExceeded";
            case Status::UnsupportedTransform: return "UnsupportedTransform";
            case Status::UnsupportedCipher:    return "UnsupportedCipher";
            case Status::DecryptionFailure:    return "DecryptionFailure";
            case Status::InvalidLengthField:   return "InvalidLengthField";
            case Status::InvalidPixelBuffer:   return "InvalidPixelBuffer";
            case Status::ImageLoadFailure:     return "ImageLoadFailure";
            case Status::MissingRenderContext: return "MissingRenderContext";
        }
        return "Unknown";
    }

    const char* transformName(TransformId id)
    {
        switch (id) {
            case TransformId::Spatial:         return "lsb";
            case TransformId::Frequency:       return "dct";
            case TransformId::Wavelet:         return "dwt";
            case TransformId::MultiBitSpatial: return "multibit-lsb";
        }
        return "unknown";
    }

    bool parseTransformName(const std::string& name, TransformId& out)
    {
        if (name == "lsb" || name == "spatial") {
            out = TransformId::Spatial;
        } else if (name == "dct" || name == "frequency") {
            out = TransformId::Frequency;
        } else if (name == "dwt" || name == "wavelet") {
            out = TransformId::Wavelet;
        } else if (name == "multibit-lsb" || name == "multi-bit-spatial") {
            out = TransformId::MultiBitSpatial;
        } else {
            return false;
        }
        return true;
    }

    bool transformFromBits(uint8_t value, TransformId& out)
    {
        if (value > static_cast<uint8_t>(TransformId::MultiBitSpatial))
            return false;
        out = static_cast<TransformId>(value);
        return true;
    }

    const char* cipherName(CipherId id)
    {
        switch (id) {
            case CipherId::None:             return "none";
            case CipherId::Aes256Gcm:        return "aes256-gcm";
            case CipherId::ChaCha20Poly1305: return "chacha20-poly1305";
            case CipherId::Aes256Cbc:        return "aes256-cbc";
        }
        return "unknown";
    }

    bool parseCipherName(const std::string& name, CipherId& out)
    {
        if (name == "none") {
            out = CipherId::None;
        } else if (name == "aes256-gcm" || name == "aes") {
            out = CipherId::Aes256Gcm;
        } else if (name == "chacha20-poly1305" || name == "chacha20") {
            out = CipherId::ChaCha20Poly1305;
        } else if (name == "aes256-cbc") {
            out = CipherId::Aes256Cbc;
        } else {
            return false;
        }
        return true;
    }

    bool isValidPixelBuffer(const PixelBuffer& pixels)
    {
        return !pixels.empty()
            && pixels.type() == CV_8UC4
            && pixels.isContinuous();
    }

} // namespace pixelvault
