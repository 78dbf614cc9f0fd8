#ifndef PIXELVAULT_CRYPTO_HPP
#define PIXELVAULT_CRYPTO_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crypto {

    // Source of salts and nonces. Injected so tests can run with a fixed seed.
    class RandomSource
    {
    public:
        virtual ~RandomSource() = default;
        virtual bool fill(uint8_t* out, size_t len) = 0;
    };

    // RAND_bytes from the OpenSSL CSPRNG
    class OpenSslRandom : public RandomSource
    {
    public:
        bool fill(uint8_t* out, size_t len) override;
    };

    // Blob layouts, key always PBKDF2-HMAC-SHA256 over password + salt:
    //   AES-256-CBC       "STG1" | salt(16) | ciphertext | hmac(32)  (key, IV and MAC key derived)
    //   AES-256-GCM       "STG2" | salt(16) | iv(12) | ciphertext | tag(16)
    //   ChaCha20-Poly1305 "STG3" | salt(16) | nonce(12) | ciphertext | tag(16)

    bool encryptAES256_PBKDF2(const std::string& plaintext,
                              const std::string& password,
                              RandomSource& rng,
                              std::vector<uint8_t>& outBlob);

    // Fails on a wrong password or any modified byte (HMAC-SHA256 checked first).
    bool decryptAES256_PBKDF2(const std::vector<uint8_t>& blob,
                              const std::string& password,
                              std::string& outPlaintext);

    bool encryptAES256GCM_PBKDF2(const std::string& plaintext,
                                 const std::string& password,
                                 RandomSource& rng,
                                 std::vector<uint8_t>& outBlob);

    // Fails on a wrong password or any modified byte.
    bool decryptAES256GCM_PBKDF2(const std::vector<uint8_t>& blob,
                                 const std::string& password,
                                 std::string& outPlaintext);

    bool encryptChaCha20Poly1305_PBKDF2(const std::string& plaintext,
                                        const std::string& password,
                                        RandomSource& rng,
                                        std::vector<uint8_t>& outBlob);

    bool decryptChaCha20Poly1305_PBKDF2(const std::vector<uint8_t>& blob,
                                        const std::string& password,
                                        std::string& outPlaintext);

    // Standard base64 with padding, no line breaks.
    std::string base64Encode(const std::vector<uint8_t>& data);
    bool base64Decode(const std::string& text, std::vector<uint8_t>& outData);
}

#endif // PIXELVAULT_CRYPTO_HPP
