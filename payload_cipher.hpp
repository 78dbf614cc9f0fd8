#ifndef PIXELVAULT_PAYLOAD_CIPHER_HPP
#define PIXELVAULT_PAYLOAD_CIPHER_HPP

#include "crypto.hpp"
#include "stego_types.hpp"

#include <string>

namespace pixelvault {

    // Password-gated wrapper selected by CipherId. The frame body it produces is
    // base64 text, so it never contains a NUL byte or the "::" separator.
    class PayloadCipher
    {
    public:
        explicit PayloadCipher(crypto::RandomSource& rng) : rng_(rng) {}

        // UnsupportedCipher for CipherId::None or when the algorithm is unavailable.
        Status seal(CipherId cipher, const std::string& plaintext,
                    const std::string& password, std::string& outBody) const;

        // DecryptionFailure on a wrong password, a corrupt body or a body sealed
        // under another algorithm.
        Status open(CipherId cipher, const std::string& body,
                    const std::string& password, std::string& outPlaintext) const;

    private:
        crypto::RandomSource& rng_;
    };

} // namespace pixelvault

#endif // PIXELVAULT_PAYLOAD_CIPHER_HPP
