#include "database/fingerprint_index.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <mutex>
#include <stdexcept>

namespace autoface {

// ==================== FINGERPRINT ====================

std::string content_fingerprint(const unsigned char* data, size_t size) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digest_len = 0;

    if (EVP_Digest(data, size, digest, &digest_len, EVP_sha256(), nullptr) != 1 ||
        digest_len != SHA256_DIGEST_LENGTH) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}

std::string content_fingerprint(const std::vector<unsigned char>& bytes) {
    return content_fingerprint(bytes.data(), bytes.size());
}

// ==================== INDEX ====================

void FingerprintIndex::load(const std::vector<std::pair<std::string, FingerprintHit>>& records) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    entries.clear();
    entries.reserve(records.size());
    for (const auto& [fingerprint, hit] : records) {
        entries.emplace(fingerprint, hit);
    }
}

std::optional<FingerprintHit> FingerprintIndex::lookup(const std::string& fingerprint) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = entries.find(fingerprint);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool FingerprintIndex::record(const std::string& fingerprint, const FingerprintHit& hit) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    return entries.emplace(fingerprint, hit).second;
}

size_t FingerprintIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return entries.size();
}

} // namespace autoface
