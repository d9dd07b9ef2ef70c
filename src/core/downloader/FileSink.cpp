/**
 * FileSink.cpp
 */

#include "FileSink.hpp"
#include "../Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fastget::core::downloader {

namespace fs = std::filesystem;

FileSink::~FileSink() {
    if (m_fd >= 0) {
        std::string error;
        if (!close(error)) {
            FASTGET_LOG_WARN("Closing {} failed: {}", m_path.string(), error);
        }
    }
}

bool FileSink::open(const fs::path& path, std::string& error) {
    if (m_fd >= 0) {
        error = "sink already open on " + m_path.string();
        return false;
    }
    
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "cannot create directory " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }
    
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "cannot open " + path.string() + ": " + std::strerror(errno);
        return false;
    }
    
    m_fd = fd;
    m_path = path;
    m_highWater = 0;
    return true;
}

bool FileSink::close(std::string& error) {
    if (m_fd < 0) return true;
    
    int rc = ::close(m_fd);
    m_fd = -1;
    if (rc != 0) {
        error = "close failed for " + m_path.string() + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool FileSink::writeAt(uint64_t offset, const char* data, size_t size, std::string& error) {
    if (m_fd < 0) {
        error = "write to a closed file sink";
        return false;
    }
    
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::pwrite(m_fd, data + written, size - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            error = "write failed at offset " + std::to_string(offset + written) + " in " +
                    m_path.string() + ": " + std::strerror(errno);
            return false;
        }
        written += static_cast<size_t>(n);
    }
    
    const uint64_t end = offset + size;
    uint64_t current = m_highWater.load();
    while (end > current && !m_highWater.compare_exchange_weak(current, end)) {
    }
    return true;
}

} // namespace fastget::core::downloader
