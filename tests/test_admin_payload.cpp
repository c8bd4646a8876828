#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include "admin_payload.hpp"

namespace {

std::string DeriveKey(const std::string& password, const std::string& blob) {
    unsigned char key[32];
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(blob.data()), kAdminSaltSize,
                          kAdminPbkdf2Iterations, EVP_sha256(), sizeof(key), key) != 1) {
        throw std::runtime_error("PBKDF2 failed");
    }
    return std::string(reinterpret_cast<char*>(key), sizeof(key));
}

// Opens one sealed fragment; throws if authentication fails.
std::string OpenFragment(const std::string& key, const std::string& nonce, uint32_t sequence, bool final_fragment,
                         const std::string& sealed) {
    unsigned char iv[12];
    std::copy(nonce.begin(), nonce.end(), iv);
    for (int i = 0; i < 4; ++i) iv[kAdminNonceSize + i] = static_cast<unsigned char>((sequence >> (8 * i)) & 0xFF);
    unsigned char aad = final_fragment ? 0x80 : 0x00;

    size_t length = sealed.size() - kAdminTagSize;
    std::string plain(length, '\0');
    std::string tag = sealed.substr(length);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    int outlen = 0;
    bool ok = EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr,
                                 reinterpret_cast<const unsigned char*>(key.data()), iv) == 1 &&
              EVP_DecryptUpdate(ctx, nullptr, &outlen, &aad, 1) == 1;
    if (ok && length > 0) {
        ok = EVP_DecryptUpdate(ctx, reinterpret_cast<unsigned char*>(&plain[0]), &outlen,
                               reinterpret_cast<const unsigned char*>(sealed.data()), static_cast<int>(length)) == 1;
    }
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kAdminTagSize), &tag[0]) == 1;
    unsigned char trailer[16];
    ok = ok && EVP_DecryptFinal_ex(ctx, trailer, &outlen) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok) throw std::runtime_error("fragment authentication failed");
    return plain;
}

std::string Open(const std::string& password, const std::string& blob) {
    const size_t header = kAdminSaltSize + 1 + kAdminNonceSize;
    std::string key = DeriveKey(password, blob);
    std::string nonce = blob.substr(kAdminSaltSize + 1, kAdminNonceSize);

    std::string plain;
    size_t offset = header;
    uint32_t sequence = 0;
    while (offset < blob.size()) {
        size_t sealed_length = std::min(kAdminFragmentSize + kAdminTagSize, blob.size() - offset);
        bool final_fragment = offset + sealed_length == blob.size();
        plain += OpenFragment(key, nonce, sequence++, final_fragment, blob.substr(offset, sealed_length));
        offset += sealed_length;
    }
    return plain;
}

} // namespace

TEST(AdminPayloadTest, HeaderLayout) {
    std::string blob = EncryptAdminPayload("root-secret", R"({"secretKey":"s","status":"enabled"})");

    ASSERT_GT(blob.size(), kAdminSaltSize + 1 + kAdminNonceSize);
    EXPECT_EQ(static_cast<unsigned char>(blob[kAdminSaltSize]), kAdminPbkdf2AesGcm);
    EXPECT_EQ(blob.size(), kAdminSaltSize + 1 + kAdminNonceSize + 36 + kAdminTagSize);
}

TEST(AdminPayloadTest, OpensWithTheSamePassword) {
    std::string plaintext = R"({"secretKey":"app-secret","status":"enabled"})";
    EXPECT_EQ(Open("root-secret", EncryptAdminPayload("root-secret", plaintext)), plaintext);
}

TEST(AdminPayloadTest, WrongPasswordFailsAuthentication) {
    std::string blob = EncryptAdminPayload("root-secret", "payload");
    EXPECT_THROW(Open("not-the-secret", blob), std::runtime_error);
}

TEST(AdminPayloadTest, FreshSaltAndNoncePerCall) {
    std::string a = EncryptAdminPayload("pw", "same");
    std::string b = EncryptAdminPayload("pw", "same");
    EXPECT_NE(a.substr(0, kAdminSaltSize + 1 + kAdminNonceSize), b.substr(0, kAdminSaltSize + 1 + kAdminNonceSize));
    EXPECT_NE(a, b);
}

TEST(AdminPayloadTest, LargeBodiesSpanSeveralFragments) {
    std::string plaintext(kAdminFragmentSize * 2 + 100, 'x');
    std::string blob = EncryptAdminPayload("pw", plaintext);

    EXPECT_EQ(blob.size(), kAdminSaltSize + 1 + kAdminNonceSize + plaintext.size() + 3 * kAdminTagSize);
    EXPECT_EQ(Open("pw", blob), plaintext);
}

TEST(AdminPayloadTest, ExactFragmentMultipleHasNoEmptyTrailer) {
    std::string plaintext(kAdminFragmentSize, 'y');
    std::string blob = EncryptAdminPayload("pw", plaintext);

    EXPECT_EQ(blob.size(), kAdminSaltSize + 1 + kAdminNonceSize + plaintext.size() + kAdminTagSize);
    EXPECT_EQ(Open("pw", blob), plaintext);
}
