#include "sha256.h"
#include "logger.h"
#include <openssl/evp.h>
#include <fstream>
#include <stdexcept>

#define LOG_SHA256_ERROR(message) LOG_ERROR("sha256", message)

namespace blockshare {

namespace {

std::string to_hex(const unsigned char* data, size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

} // anonymous namespace

SHA256::SHA256() : ctx_(EVP_MD_CTX_create()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_create failed");
    }
    reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_destroy(ctx_);
}

void SHA256::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

void SHA256::update(const uint8_t* data, size_t length) {
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, length) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

void SHA256::update(const std::string& str) {
    update(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

std::string SHA256::finalize() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &digest_length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    reset();
    return to_hex(digest, digest_length);
}

std::string SHA256::hash(const std::vector<uint8_t>& input) {
    SHA256 sha;
    sha.update(input.data(), input.size());
    return sha.finalize();
}

std::string SHA256::hash(const std::string& input) {
    SHA256 sha;
    sha.update(input);
    return sha.finalize();
}

bool SHA256::hash_file(const std::string& path, std::string& digest_hex, size_t chunk_size) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LOG_SHA256_ERROR("Failed to open file for hashing: " << path);
        return false;
    }

    SHA256 sha;
    std::vector<uint8_t> buffer(chunk_size);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            sha.update(buffer.data(), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        LOG_SHA256_ERROR("Read error while hashing: " << path);
        return false;
    }

    digest_hex = sha.finalize();
    return true;
}

bool is_sha256_hex(const std::string& digest) {
    if (digest.size() != 64) {
        return false;
    }
    for (char c : digest) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex) {
            return false;
        }
    }
    return true;
}

} // namespace blockshare
