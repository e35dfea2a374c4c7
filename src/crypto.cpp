#include "spora/crypto.hpp"
#include "spora/hex.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <algorithm>
#include <stdexcept>

namespace spora {
namespace crypto {

namespace {
using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
}

// --- Sha256 ---
Sha256::Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 context initialisation failed");
    }
}

Sha256& Sha256::update(const std::uint8_t* data, std::size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
    return *this;
}

Sha256& Sha256::update(const std::vector<std::uint8_t>& data) {
    return update(data.data(), data.size());
}

Digest Sha256::finish() {
    Digest digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &digest_len) != 1 || digest_len != kDigestSize) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    return digest;
}

Digest sha256(const std::uint8_t* data, std::size_t len) {
    return Sha256().update(data, len).finish();
}

Digest sha256(const std::vector<std::uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Digest proof_digest(const std::vector<std::uint8_t>& blob, const std::vector<std::uint8_t>& nonce) {
    return Sha256().update(blob).update(nonce).finish();
}

bool digest_equal(const Digest& a, const Digest& b) {
    return CRYPTO_memcmp(a.data(), b.data(), kDigestSize) == 0;
}

// --- Randomness ---
void random_fill(std::uint8_t* out, std::size_t len) {
    if (len > 0 && RAND_bytes(out, static_cast<int>(len)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

std::vector<std::uint8_t> random_bytes(std::size_t len) {
    std::vector<std::uint8_t> out(len);
    random_fill(out.data(), out.size());
    return out;
}

Key random_key() {
    Key key{};
    random_fill(key.data(), key.size());
    return key;
}

// --- AES-256-GCM ---
std::vector<std::uint8_t> aes256_gcm_seal(const Key& key,
                                          const std::uint8_t* iv,
                                          const std::uint8_t* plaintext,
                                          std::size_t len) {
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1) {
        throw std::runtime_error("AES-256-GCM encrypt init failed");
    }

    std::vector<std::uint8_t> out(len + kTagSize);
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &out_len, plaintext, static_cast<int>(len)) != 1) {
        throw std::runtime_error("AES-256-GCM encrypt failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + out_len, &final_len) != 1) {
        throw std::runtime_error("AES-256-GCM encrypt final failed");
    }
    const std::size_t cipher_len = static_cast<std::size_t>(out_len + final_len);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                            out.data() + cipher_len) != 1) {
        throw std::runtime_error("AES-256-GCM tag extraction failed");
    }
    out.resize(cipher_len + kTagSize);
    return out;
}

std::optional<std::vector<std::uint8_t>> aes256_gcm_open(const Key& key,
                                                         const std::uint8_t* iv,
                                                         const std::uint8_t* sealed,
                                                         std::size_t len) {
    if (len < kTagSize) {
        return std::nullopt;
    }
    const std::size_t cipher_len = len - kTagSize;

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1) {
        throw std::runtime_error("AES-256-GCM decrypt init failed");
    }

    std::vector<std::uint8_t> out(cipher_len + 1);
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &out_len, sealed, static_cast<int>(cipher_len)) != 1) {
        return std::nullopt;
    }
    std::uint8_t tag[kTagSize];
    std::copy(sealed + cipher_len, sealed + len, tag);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag) != 1) {
        return std::nullopt;
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + out_len, &final_len) != 1) {
        return std::nullopt;
    }
    out.resize(static_cast<std::size_t>(out_len + final_len));
    return out;
}

// --- Certificates ---
std::string public_key_fingerprint(X509* certificate) {
    if (certificate == nullptr) {
        return {};
    }
    EVP_PKEY_ptr key(X509_get_pubkey(certificate), &EVP_PKEY_free);
    if (!key) {
        return {};
    }
    const int der_len = i2d_PUBKEY(key.get(), nullptr);
    if (der_len <= 0) {
        return {};
    }
    std::vector<std::uint8_t> der(static_cast<std::size_t>(der_len));
    unsigned char* cursor = der.data();
    if (i2d_PUBKEY(key.get(), &cursor) != der_len) {
        return {};
    }
    return hex::encode(sha256(der));
}

} // namespace crypto
} // namespace spora
