#include "crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <climits>
#include <cstring>
#include <iostream>

namespace crypto {

    static const int SALT_SIZE   = 16;
    static const int KEY_SIZE    = 32;     // 256 bit
    static const int CBC_IV_SIZE = 16;     // AES block size
    static const int MAC_KEY_SIZE = 32;
    static const int MAC_SIZE     = 32;    // HMAC-SHA256
    static const int CBC_DERIVED_SIZE = KEY_SIZE + CBC_IV_SIZE + MAC_KEY_SIZE;
    static const int AEAD_IV_SIZE  = 12;
    static const int AEAD_TAG_SIZE = 16;
    static const int PBKDF2_ITER = 100000;
    static const size_t MAGIC_SIZE = 4;

    static const uint8_t MAGIC_CBC[MAGIC_SIZE]    = { 'S', 'T', 'G', '1' };
    static const uint8_t MAGIC_GCM[MAGIC_SIZE]    = { 'S', 'T', 'G', '2' };
    static const uint8_t MAGIC_CHACHA[MAGIC_SIZE] = { 'S', 'T', 'G', '3' };

    bool OpenSslRandom::fill(uint8_t* out, size_t len)
    {
        if (len > static_cast<size_t>(INT_MAX))
            return false;
        if (RAND_bytes(out, static_cast<int>(len)) != 1) {
            std::cerr << "[crypto] RAND_bytes failed\n";
            return false;
        }
        return true;
    }

    static bool deriveKey(const std::string& password, const uint8_t* salt,
                          int outLen, uint8_t* out)
    {
        if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                              salt, SALT_SIZE,
                              PBKDF2_ITER,
                              EVP_sha256(),
                              outLen,
                              out) != 1)
        {
            std::cerr << "[crypto] PBKDF2 failed\n";
            return false;
        }
        return true;
    }

    static bool hasMagic(const std::vector<uint8_t>& blob, const uint8_t* magic)
    {
        return blob.size() >= MAGIC_SIZE && std::memcmp(blob.data(), magic, MAGIC_SIZE) == 0;
    }

    // --- AES-256-CBC + HMAC-SHA256 ---

    // HMAC-SHA256 over magic | salt | ciphertext
    static bool cbcMac(const uint8_t* macKey, const uint8_t* data, size_t len, uint8_t* out)
    {
        unsigned int outLen = 0;
        if (!HMAC(EVP_sha256(), macKey, MAC_KEY_SIZE, data, len, out, &outLen)
            || outLen != static_cast<unsigned int>(MAC_SIZE))
        {
            std::cerr << "[crypto] HMAC failed\n";
            return false;
        }
        return true;
    }

    bool encryptAES256_PBKDF2(const std::string& plaintext,
                              const std::string& password,
                              RandomSource& rng,
                              std::vector<uint8_t>& outBlob)
    {
        outBlob.clear();

        uint8_t salt[SALT_SIZE];
        if (!rng.fill(salt, SALT_SIZE)) {
            std::cerr << "[crypto] salt generation failed\n";
            return false;
        }

        // key, iv and mac key all come out of one PBKDF2 run
        uint8_t keys[CBC_DERIVED_SIZE];
        if (!deriveKey(password, salt, CBC_DERIVED_SIZE, keys))
            return false;

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            std::cerr << "[crypto] EVP_CIPHER_CTX_new failed\n";
            OPENSSL_cleanse(keys, sizeof(keys));
            return false;
        }

        if (EVP_EncryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, keys, keys + KEY_SIZE) != 1) {
            std::cerr << "[crypto] EVP_EncryptInit_ex failed\n";
            OPENSSL_cleanse(keys, sizeof(keys));
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        std::vector<uint8_t> cipher(plaintext.size() + EVP_CIPHER_block_size(EVP_aes_256_cbc()));

        int outLen1 = 0;
        if (EVP_EncryptUpdate(ctx,
                              cipher.data(), &outLen1,
                              reinterpret_cast<const uint8_t*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1)
        {
            std::cerr << "[crypto] EVP_EncryptUpdate failed\n";
            OPENSSL_cleanse(keys, sizeof(keys));
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        int outLen2 = 0;
        if (EVP_EncryptFinal_ex(ctx, cipher.data() + outLen1, &outLen2) != 1) {
            std::cerr << "[crypto] EVP_EncryptFinal_ex failed\n";
            OPENSSL_cleanse(keys, sizeof(keys));
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        EVP_CIPHER_CTX_free(ctx);
        cipher.resize(static_cast<size_t>(outLen1 + outLen2));

        std::vector<uint8_t> blob;
        blob.reserve(MAGIC_SIZE + SALT_SIZE + cipher.size() + MAC_SIZE);
        blob.insert(blob.end(), MAGIC_CBC, MAGIC_CBC + MAGIC_SIZE);
        blob.insert(blob.end(), salt, salt + SALT_SIZE);
        blob.insert(blob.end(), cipher.begin(), cipher.end());

        uint8_t mac[MAC_SIZE];
        const bool macOk = cbcMac(keys + KEY_SIZE + CBC_IV_SIZE, blob.data(), blob.size(), mac);
        OPENSSL_cleanse(keys, sizeof(keys));
        if (!macOk)
            return false;

        blob.insert(blob.end(), mac, mac + MAC_SIZE);
        outBlob.swap(blob);
        return true;
    }

    bool decryptAES256_PBKDF2(const std::vector<uint8_t>& blob,
                              const std::string& password,
                              std::string& outPlaintext)
    {
        outPlaintext.clear();

        if (blob.size() < MAGIC_SIZE + SALT_SIZE + CBC_IV_SIZE + MAC_SIZE) {
            std::cerr << "[crypto] Blob too small\n";
            return false;
        }
        if (!hasMagic(blob, MAGIC_CBC)) {
            std::cerr << "[crypto] Invalid magic header\n";
            return false;
        }

        const uint8_t* salt = blob.data() + MAGIC_SIZE;
        const size_t cipherOffset = MAGIC_SIZE + SALT_SIZE;
        const size_t macOffset = blob.size() - MAC_SIZE;
        const size_t cipherLen = macOffset - cipherOffset;
        if (cipherLen % CBC_IV_SIZE != 0) {
            std::cerr << "[crypto] ciphertext is not a whole number of blocks\n";
            return false;
        }

        uint8_t keys[CBC_DERIVED_SIZE];
        if (!deriveKey(password, salt, CBC_DERIVED_SIZE, keys))
            return false;

        // the mac is checked before any decryption
        uint8_t mac[MAC_SIZE];
        if (!cbcMac(keys + KEY_SIZE + CBC_IV_SIZE, blob.data(), macOffset, mac)) {
            OPENSSL_cleanse(keys, sizeof(keys));
            return false;
        }
        if (CRYPTO_memcmp(mac, blob.data() + macOffset, MAC_SIZE) != 0) {
            std::cerr << "[crypto] HMAC mismatch (wrong password?)\n";
            OPENSSL_cleanse(keys, sizeof(keys));
            return false;
        }

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            std::cerr << "[crypto] EVP_CIPHER_CTX_new failed\n";
            OPENSSL_cleanse(keys, sizeof(keys));
            return false;
        }

        const int initOk = EVP_DecryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr,
                                              keys, keys + KEY_SIZE);
        OPENSSL_cleanse(keys, sizeof(keys));
        if (initOk != 1) {
            std::cerr << "[crypto] EVP_DecryptInit_ex failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        std::vector<uint8_t> plain(cipherLen + EVP_CIPHER_block_size(EVP_aes_256_cbc()));
        int outLen1 = 0;
        if (EVP_DecryptUpdate(ctx,
                              plain.data(), &outLen1,
                              blob.data() + cipherOffset, static_cast<int>(cipherLen)) != 1)
        {
            std::cerr << "[crypto] EVP_DecryptUpdate failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        int outLen2 = 0;
        if (EVP_DecryptFinal_ex(ctx, plain.data() + outLen1, &outLen2) != 1) {
            std::cerr << "[crypto] EVP_DecryptFinal_ex failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        EVP_CIPHER_CTX_free(ctx);
        outPlaintext.assign(reinterpret_cast<const char*>(plain.data()),
                            static_cast<size_t>(outLen1 + outLen2));
        return true;
    }

    // --- AEAD (GCM and ChaCha20-Poly1305 share the 12-byte nonce / 16-byte tag layout) ---

    static bool aeadSeal(const EVP_CIPHER* algo, const uint8_t* magic,
                         const std::string& plaintext, const std::string& password,
                         RandomSource& rng, std::vector<uint8_t>& outBlob)
    {
        outBlob.clear();

        uint8_t salt[SALT_SIZE];
        uint8_t iv[AEAD_IV_SIZE];
        if (!rng.fill(salt, SALT_SIZE) || !rng.fill(iv, AEAD_IV_SIZE)) {
            std::cerr << "[crypto] salt/nonce generation failed\n";
            return false;
        }

        uint8_t key[KEY_SIZE];
        if (!deriveKey(password, salt, KEY_SIZE, key))
            return false;

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            std::cerr << "[crypto] EVP_CIPHER_CTX_new failed\n";
            OPENSSL_cleanse(key, sizeof(key));
            return false;
        }

        bool ok = EVP_EncryptInit_ex(ctx, algo, nullptr, nullptr, nullptr) == 1
               && EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, AEAD_IV_SIZE, nullptr) == 1
               && EVP_EncryptInit_ex(ctx, nullptr, nullptr, key, iv) == 1;
        OPENSSL_cleanse(key, sizeof(key));
        if (!ok) {
            std::cerr << "[crypto] AEAD init failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        // the magic is authenticated so a blob cannot be replayed under another algorithm
        int aadLen = 0;
        if (EVP_EncryptUpdate(ctx, nullptr, &aadLen, magic, static_cast<int>(MAGIC_SIZE)) != 1) {
            std::cerr << "[crypto] AEAD aad failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        std::vector<uint8_t> cipher(plaintext.size() + AEAD_TAG_SIZE);
        int outLen1 = 0;
        if (EVP_EncryptUpdate(ctx,
                              cipher.data(), &outLen1,
                              reinterpret_cast<const uint8_t*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1)
        {
            std::cerr << "[crypto] EVP_EncryptUpdate failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        int outLen2 = 0;
        if (EVP_EncryptFinal_ex(ctx, cipher.data() + outLen1, &outLen2) != 1) {
            std::cerr << "[crypto] EVP_EncryptFinal_ex failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }
        cipher.resize(static_cast<size_t>(outLen1 + outLen2));

        uint8_t tag[AEAD_TAG_SIZE];
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, AEAD_TAG_SIZE, tag) != 1) {
            std::cerr << "[crypto] AEAD tag retrieval failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }
        EVP_CIPHER_CTX_free(ctx);

        outBlob.reserve(MAGIC_SIZE + SALT_SIZE + AEAD_IV_SIZE + cipher.size() + AEAD_TAG_SIZE);
        outBlob.insert(outBlob.end(), magic, magic + MAGIC_SIZE);
        outBlob.insert(outBlob.end(), salt, salt + SALT_SIZE);
        outBlob.insert(outBlob.end(), iv, iv + AEAD_IV_SIZE);
        outBlob.insert(outBlob.end(), cipher.begin(), cipher.end());
        outBlob.insert(outBlob.end(), tag, tag + AEAD_TAG_SIZE);
        return true;
    }

    static bool aeadOpen(const EVP_CIPHER* algo, const uint8_t* magic,
                         const std::vector<uint8_t>& blob, const std::string& password,
                         std::string& outPlaintext)
    {
        outPlaintext.clear();

        const size_t overhead = MAGIC_SIZE + SALT_SIZE + AEAD_IV_SIZE + AEAD_TAG_SIZE;
        if (blob.size() < overhead) {
            std::cerr << "[crypto] Blob too small\n";
            return false;
        }
        if (!hasMagic(blob, magic)) {
            std::cerr << "[crypto] Invalid magic header\n";
            return false;
        }

        const uint8_t* salt = blob.data() + MAGIC_SIZE;
        const uint8_t* iv = salt + SALT_SIZE;
        const uint8_t* cipherData = iv + AEAD_IV_SIZE;
        const size_t cipherLen = blob.size() - overhead;
        uint8_t tag[AEAD_TAG_SIZE];
        std::memcpy(tag, cipherData + cipherLen, AEAD_TAG_SIZE);

        uint8_t key[KEY_SIZE];
        if (!deriveKey(password, salt, KEY_SIZE, key))
            return false;

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            std::cerr << "[crypto] EVP_CIPHER_CTX_new failed\n";
            OPENSSL_cleanse(key, sizeof(key));
            return false;
        }

        bool ok = EVP_DecryptInit_ex(ctx, algo, nullptr, nullptr, nullptr) == 1
               && EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, AEAD_IV_SIZE, nullptr) == 1
               && EVP_DecryptInit_ex(ctx, nullptr, nullptr, key, iv) == 1;
        OPENSSL_cleanse(key, sizeof(key));
        if (!ok) {
            std::cerr << "[crypto] AEAD init failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        int aadLen = 0;
        if (EVP_DecryptUpdate(ctx, nullptr, &aadLen, magic, static_cast<int>(MAGIC_SIZE)) != 1) {
            std::cerr << "[crypto] AEAD aad failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        std::vector<uint8_t> plain(cipherLen + AEAD_TAG_SIZE);
        int outLen1 = 0;
        if (EVP_DecryptUpdate(ctx, plain.data(), &outLen1,
                              cipherData, static_cast<int>(cipherLen)) != 1)
        {
            std::cerr << "[crypto] EVP_DecryptUpdate failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, AEAD_TAG_SIZE, tag) != 1) {
            std::cerr << "[crypto] AEAD tag setup failed\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        int outLen2 = 0;
        if (EVP_DecryptFinal_ex(ctx, plain.data() + outLen1, &outLen2) != 1) {
            std::cerr << "[crypto] authentication failed (wrong password?)\n";
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }

        EVP_CIPHER_CTX_free(ctx);
        outPlaintext.assign(reinterpret_cast<const char*>(plain.data()),
                            static_cast<size_t>(outLen1 + outLen2));
        return true;
    }

    bool encryptAES256GCM_PBKDF2(const std::string& plaintext,
                                 const std::string& password,
                                 RandomSource& rng,
                                 std::vector<uint8_t>& outBlob)
    {
        return aeadSeal(EVP_aes_256_gcm(), MAGIC_GCM, plaintext, password, rng, outBlob);
    }

    bool decryptAES256GCM_PBKDF2(const std::vector<uint8_t>& blob,
                                 const std::string& password,
                                 std::string& outPlaintext)
    {
        return aeadOpen(EVP_aes_256_gcm(), MAGIC_GCM, blob, password, outPlaintext);
    }

    bool encryptChaCha20Poly1305_PBKDF2(const std::string& plaintext,
                                        const std::string& password,
                                        RandomSource& rng,
                                        std::vector<uint8_t>& outBlob)
    {
        return aeadSeal(EVP_chacha20_poly1305(), MAGIC_CHACHA, plaintext, password, rng, outBlob);
    }

    bool decryptChaCha20Poly1305_PBKDF2(const std::vector<uint8_t>& blob,
                                        const std::string& password,
                                        std::string& outPlaintext)
    {
        return aeadOpen(EVP_chacha20_poly1305(), MAGIC_CHACHA, blob, password, outPlaintext);
    }

    // --- base64 ---

    std::string base64Encode(const std::vector<uint8_t>& data)
    {
        if (data.empty())
            return std::string();

        std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
        const int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                        data.data(), static_cast<int>(data.size()));
        out.resize(static_cast<size_t>(len));
        return out;
    }

    bool base64Decode(const std::string& text, std::vector<uint8_t>& outData)
    {
        outData.clear();
        if (text.empty())
            return true;
        if (text.size() % 4 != 0) {
            std::cerr << "[crypto] base64 length is not a multiple of 4\n";
            return false;
        }

        std::vector<uint8_t> out(text.size() / 4 * 3);
        const int len = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
        if (len < 0) {
            std::cerr << "[crypto] invalid base64 text\n";
            return false;
        }

        // EVP_DecodeBlock counts the bytes behind '=' padding as zeros
        size_t padding = 0;
        if (text[text.size() - 1] == '=') ++padding;
        if (text[text.size() - 2] == '=') ++padding;
        out.resize(static_cast<size_t>(len) - padding);
        outData.swap(out);
        return true;
    }
}
