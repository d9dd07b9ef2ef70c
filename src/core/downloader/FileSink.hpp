#pragma once

/**
 * FileSink.hpp
 * 
 * OutputSink writing straight into a file with positional writes.
 */

#include "OutputSink.hpp"

#include <atomic>
#include <filesystem>
#include <string>

namespace fastget::core::downloader {

/**
 * FileSink
 * 
 * open() creates missing parent directories and truncates the target, so a
 * repeated download overwrites the previous content. Writes use pwrite and
 * need no locking. The descriptor is closed by close() or the destructor.
 */
class FileSink : public OutputSink {
public:
    FileSink() = default;
    ~FileSink() override;
    
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;
    
    bool open(const std::filesystem::path& path, std::string& error);
    bool close(std::string& error);
    bool isOpen() const { return m_fd >= 0; }
    const std::filesystem::path& path() const { return m_path; }
    
    bool writeAt(uint64_t offset, const char* data, size_t size, std::string& error) override;
    uint64_t size() const override { return m_highWater.load(); }

private:
    int m_fd{-1};
    std::filesystem::path m_path;
    std::atomic<uint64_t> m_highWater{0};
};

} // namespace fastget::core::downloader
