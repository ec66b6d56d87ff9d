#include "fs.h"
#include "logger.h"
#include <cstring>
#include <sys/stat.h>

#ifdef _WIN32
    #include <io.h>
    #define stat _stat
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
#endif

#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace blockshare {

bool file_exists(const std::string& path) {
    if (path.empty()) return false;
    return access(path.c_str(), F_OK) == 0;
}

bool is_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return (st.st_mode & S_IFREG) != 0;
    }
    return false;
}

int64_t get_file_size(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return st.st_size;
    }
    return -1;
}

std::string get_filename_from_path(const std::string& path) {
    size_t last_sep = path.find_last_of("/\\");
    if (last_sep == std::string::npos) {
        return path;
    }
    return path.substr(last_sep + 1);
}

bool read_file_binary(const std::string& path, std::vector<uint8_t>& data) {
    int64_t size = get_file_size(path);
    if (size < 0) {
        LOG_FS_ERROR("Failed to get binary file size: " << path);
        return false;
    }

    ScopedFile file(path, "rb");
    if (!file.is_open()) {
        LOG_FS_ERROR("Failed to open binary file for reading: " << path);
        return false;
    }

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!buffer.empty()) {
        size_t bytes_read = fread(buffer.data(), 1, buffer.size(), file.get());
        if (bytes_read != buffer.size()) {
            LOG_FS_ERROR("Short read on " << path << ": " << bytes_read << " of " << buffer.size() << " bytes");
            return false;
        }
    }

    data.swap(buffer);
    return true;
}

bool create_file_binary(const std::string& path, const void* data, size_t size) {
    ScopedFile file(path, "wb");
    if (!file.is_open()) {
        LOG_FS_ERROR("Failed to create binary file: " << path);
        return false;
    }
    if (!file.write(data, size)) {
        LOG_FS_ERROR("Failed to write complete binary data to file: " << path);
        return false;
    }
    return file.close();
}

bool read_file_text(const std::string& path, std::string& text) {
    std::vector<uint8_t> data;
    if (!read_file_binary(path, data)) {
        return false;
    }
    text.assign(data.begin(), data.end());
    return true;
}

bool delete_file(const std::string& path) {
    return std::remove(path.c_str()) == 0;
}

//=============================================================================
// ScopedFile
//=============================================================================

ScopedFile::ScopedFile(const std::string& path, const char* mode)
    : file_(fopen(path.c_str(), mode)) {
}

ScopedFile::~ScopedFile() {
    if (file_) {
        fclose(file_);
    }
}

bool ScopedFile::write(const void* data, size_t size) {
    if (!file_) return false;
    if (size == 0) return true;
    return fwrite(data, 1, size, file_) == size;
}

bool ScopedFile::close() {
    if (!file_) return false;
    int result = fclose(file_);
    file_ = nullptr;
    return result == 0;
}

} // namespace blockshare
