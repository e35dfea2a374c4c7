#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;
typedef struct x509_st X509;

namespace spora {
namespace crypto {

constexpr std::size_t kDigestSize = 32;
constexpr std::size_t kKeySize = 32;
constexpr std::size_t kIvSize = 12;
constexpr std::size_t kTagSize = 16;
constexpr std::size_t kNonceSize = 32;

using Digest = std::array<std::uint8_t, kDigestSize>;
using Key = std::array<std::uint8_t, kKeySize>;

// Incremental SHA-256 over OpenSSL EVP.
class Sha256 {
public:
    Sha256();
    Sha256(Sha256&&) noexcept = default;
    Sha256& operator=(Sha256&&) noexcept = default;

    Sha256& update(const std::uint8_t* data, std::size_t len);
    Sha256& update(const std::vector<std::uint8_t>& data);
    Digest finish();

private:
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx_;
};

Digest sha256(const std::uint8_t* data, std::size_t len);
Digest sha256(const std::vector<std::uint8_t>& data);

// SHA-256(blob || nonce), the storage proof a node must return for a challenge.
Digest proof_digest(const std::vector<std::uint8_t>& blob, const std::vector<std::uint8_t>& nonce);

// Constant-time comparison.
bool digest_equal(const Digest& a, const Digest& b);

// Throws std::runtime_error if the CSPRNG fails.
void random_fill(std::uint8_t* out, std::size_t len);
std::vector<std::uint8_t> random_bytes(std::size_t len);
Key random_key();

// AES-256-GCM. seal returns ciphertext || tag.
std::vector<std::uint8_t> aes256_gcm_seal(const Key& key,
                                          const std::uint8_t* iv,
                                          const std::uint8_t* plaintext,
                                          std::size_t len);

// Input is ciphertext || tag. Returns std::nullopt when authentication fails.
std::optional<std::vector<std::uint8_t>> aes256_gcm_open(const Key& key,
                                                         const std::uint8_t* iv,
                                                         const std::uint8_t* sealed,
                                                         std::size_t len);

// Hex SHA-256 over the DER SubjectPublicKeyInfo of a certificate.
std::string public_key_fingerprint(X509* certificate);

} // namespace crypto
} // namespace spora
