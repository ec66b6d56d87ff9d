#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>

namespace blockshare {

// File existence check
bool file_exists(const std::string& path);
bool is_file(const std::string& path);

// File information; -1 when the file cannot be stat'ed
int64_t get_file_size(const std::string& path);
std::string get_filename_from_path(const std::string& path);

// Whole-file binary I/O
bool read_file_binary(const std::string& path, std::vector<uint8_t>& data);
bool create_file_binary(const std::string& path, const void* data, size_t size);
inline bool create_file_binary(const std::string& path, const std::vector<uint8_t>& data) {
    return create_file_binary(path, data.data(), data.size());
}

bool read_file_text(const std::string& path, std::string& text);

bool delete_file(const std::string& path);

/**
 * FILE* owner that closes on destruction. close() reports flush errors.
 */
class ScopedFile {
public:
    ScopedFile(const std::string& path, const char* mode);
    ~ScopedFile();

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    bool is_open() const { return file_ != nullptr; }
    FILE* get() const { return file_; }

    // Write all bytes; false on short write
    bool write(const void* data, size_t size);

    // Close explicitly; false if fclose failed
    bool close();

private:
    FILE* file_;
};

} // namespace blockshare
