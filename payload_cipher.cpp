#include "payload_cipher.hpp"

#include <iostream>
#include <vector>

namespace pixelvault {

    Status PayloadCipher::seal(CipherId cipher, const std::string& plaintext,
                               const std::string& password, std::string& outBody) const
    {
        std::vector<uint8_t> blob;
        bool ok = false;
        switch (cipher) {
            case CipherId::Aes256Gcm:
                ok = crypto::encryptAES256GCM_PBKDF2(plaintext, password, rng_, blob);
                break;
            case CipherId::ChaCha20Poly1305:
                ok = crypto::encryptChaCha20Poly1305_PBKDF2(plaintext, password, rng_, blob);
                break;
            case CipherId::Aes256Cbc:
                ok = crypto::encryptAES256_PBKDF2(plaintext, password, rng_, blob);
                break;
            case CipherId::None:
                std::cerr << "[cipher] no algorithm selected for a password-protected payload\n";
                return Status::UnsupportedCipher;
        }
        if (!ok) {
            std::cerr << "[cipher] " << cipherName(cipher) << " encryption failed\n";
            return Status::UnsupportedCipher;
        }

        outBody = crypto::base64Encode(blob);
        return Status::Ok;
    }

    Status PayloadCipher::open(CipherId cipher, const std::string& body,
                               const std::string& password, std::string& outPlaintext) const
    {
        std::vector<uint8_t> blob;
        if (!crypto::base64Decode(body, blob))
            return Status::DecryptionFailure;

        bool ok = false;
        switch (cipher) {
            case CipherId::Aes256Gcm:
                ok = crypto::decryptAES256GCM_PBKDF2(blob, password, outPlaintext);
                break;
            case CipherId::ChaCha20Poly1305:
                ok = crypto::decryptChaCha20Poly1305_PBKDF2(blob, password, outPlaintext);
                break;
            case CipherId::Aes256Cbc:
                ok = crypto::decryptAES256_PBKDF2(blob, password, outPlaintext);
                break;
            case CipherId::None:
                return Status::UnsupportedCipher;
        }
        return ok ? Status::Ok : Status::DecryptionFailure;
    }

} // namespace pixelvault
