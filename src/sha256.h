#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// Forward declaration from <openssl/evp.h>
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace blockshare {

/**
 * Incremental SHA-256 over OpenSSL's EVP digest API.
 * Digests are reported as 64-character lowercase hex strings.
 */
class SHA256 {
public:
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    // Process a buffer
    void update(const uint8_t* data, size_t length);

    // Process a string
    void update(const std::string& str);

    // Get the final hash as a hex string; the object is reset afterwards
    std::string finalize();

    // Convenience function to hash a buffer directly
    static std::string hash(const std::vector<uint8_t>& input);
    static std::string hash(const std::string& input);

    /**
     * Hash a file by streaming it in chunks
     * @param path File to hash
     * @param digest_hex Output digest
     * @param chunk_size Read size per step
     * @return false if the file could not be opened or read
     */
    static bool hash_file(const std::string& path, std::string& digest_hex, size_t chunk_size = 64 * 1024);

private:
    void reset();

    EVP_MD_CTX* ctx_;
};

/**
 * Check that a string is a 64-character hex SHA-256 digest
 */
bool is_sha256_hex(const std::string& digest);

} // namespace blockshare
