#ifndef ADMIN_PAYLOAD_HPP
#define ADMIN_PAYLOAD_HPP

#include <cstddef>
#include <string>

// MinIO admin API bodies that carry secrets are sealed with the caller's
// secret key. Layout:
//   salt (32) | algorithm id (1, 0x02 = PBKDF2 + AES-256-GCM) | nonce (8) | fragments
// Each fragment holds up to 16 KiB of plaintext followed by a 16 byte GCM tag,
// sealed under nonce || little-endian sequence number with additional data
// 0x00 (more fragments follow) or 0x80 (final fragment).
constexpr size_t kAdminSaltSize = 32;
constexpr size_t kAdminNonceSize = 8;
constexpr size_t kAdminTagSize = 16;
constexpr size_t kAdminFragmentSize = 16 * 1024;
constexpr int kAdminPbkdf2Iterations = 8192;
constexpr unsigned char kAdminPbkdf2AesGcm = 0x02;

std::string EncryptAdminPayload(const std::string& password, const std::string& plaintext);

#endif // ADMIN_PAYLOAD_HPP
