#include "admin_payload.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace {

constexpr int KEY_SIZE = 32;
constexpr int IV_SIZE = 12;

std::string SealFragment(const unsigned char* key, const unsigned char* nonce, uint32_t sequence,
                         bool final_fragment, const char* data, size_t length) {
    unsigned char iv[IV_SIZE];
    std::copy(nonce, nonce + kAdminNonceSize, iv);
    for (int i = 0; i < 4; ++i) {
        iv[kAdminNonceSize + i] = static_cast<unsigned char>((sequence >> (8 * i)) & 0xFF);
    }
    unsigned char aad = final_fragment ? 0x80 : 0x00;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("Failed to create cipher context");

    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), NULL, NULL, NULL) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("EncryptInit failed");
    }

    if (EVP_EncryptInit_ex(ctx, NULL, NULL, key, iv) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("EncryptInit key/iv failed");
    }

    int outlen;
    if (EVP_EncryptUpdate(ctx, NULL, &outlen, &aad, 1) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("EncryptUpdate (AAD) failed");
    }

    std::string ciphertext(length + kAdminTagSize, '\0');
    int final_len = 0;
    if (length > 0) {
        if (EVP_EncryptUpdate(ctx, reinterpret_cast<unsigned char*>(&ciphertext[0]), &outlen,
                              reinterpret_cast<const unsigned char*>(data), static_cast<int>(length)) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            throw std::runtime_error("EncryptUpdate failed");
        }
        final_len = outlen;
    }

    if (EVP_EncryptFinal_ex(ctx, reinterpret_cast<unsigned char*>(&ciphertext[final_len]), &outlen) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("EncryptFinal failed");
    }
    final_len += outlen;

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAdminTagSize),
                            reinterpret_cast<unsigned char*>(&ciphertext[final_len])) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to get tag");
    }

    EVP_CIPHER_CTX_free(ctx);
    ciphertext.resize(final_len + kAdminTagSize);
    return ciphertext;
}

} // namespace

std::string EncryptAdminPayload(const std::string& password, const std::string& plaintext) {
    unsigned char salt[kAdminSaltSize];
    unsigned char nonce[kAdminNonceSize];
    if (RAND_bytes(salt, sizeof(salt)) != 1 || RAND_bytes(nonce, sizeof(nonce)) != 1) {
        throw std::runtime_error("Failed to generate salt/nonce");
    }

    unsigned char key[KEY_SIZE];
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt, sizeof(salt),
                          kAdminPbkdf2Iterations, EVP_sha256(), KEY_SIZE, key) != 1) {
        throw std::runtime_error("PBKDF2 key derivation failed");
    }

    std::string blob;
    blob.reserve(kAdminSaltSize + 1 + kAdminNonceSize + plaintext.size() +
                 (plaintext.size() / kAdminFragmentSize + 1) * kAdminTagSize);
    blob.append(reinterpret_cast<const char*>(salt), kAdminSaltSize);
    blob.push_back(static_cast<char>(kAdminPbkdf2AesGcm));
    blob.append(reinterpret_cast<const char*>(nonce), kAdminNonceSize);

    // Every fragment but the last is full; the last may be empty only for empty input.
    size_t offset = 0;
    uint32_t sequence = 0;
    try {
        do {
            size_t length = std::min(kAdminFragmentSize, plaintext.size() - offset);
            bool final_fragment = offset + length == plaintext.size();
            blob += SealFragment(key, nonce, sequence++, final_fragment, plaintext.data() + offset, length);
            offset += length;
        } while (offset < plaintext.size());
    } catch (...) {
        OPENSSL_cleanse(key, sizeof(key));
        throw;
    }

    OPENSSL_cleanse(key, sizeof(key));
    return blob;
}
