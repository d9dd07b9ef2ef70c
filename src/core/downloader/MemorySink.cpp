/**
 * MemorySink.cpp
 */

#include "MemorySink.hpp"
#include "../Logger.hpp"

#include <cstring>
#include <mutex>
#include <new>

namespace fastget::core::downloader {

MemorySink::MemorySink(uint64_t knownLength, size_t reserveWhenUnknown) {
    if (knownLength > 0) {
        m_buffer.resize(static_cast<size_t>(knownLength));
        return;
    }
    
    try {
        m_buffer.reserve(reserveWhenUnknown);
    } catch (const std::bad_alloc&) {
        // Growth on write still works, just with reallocations
        FASTGET_LOG_WARN("Cannot reserve {} bytes for a download of unknown length", reserveWhenUnknown);
    }
}

bool MemorySink::writeAt(uint64_t offset, const char* data, size_t size, std::string& error) {
    if (size == 0) return true;
    
    const uint64_t end = offset + size;
    if (end < offset || end > m_buffer.max_size()) {
        error = "write beyond addressable memory at offset " + std::to_string(offset);
        return false;
    }
    
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (end <= m_buffer.size()) {
            std::memcpy(m_buffer.data() + offset, data, size);
            return true;
        }
    }
    
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    try {
        if (end > m_buffer.size()) {
            m_buffer.resize(static_cast<size_t>(end));
        }
    } catch (const std::bad_alloc&) {
        error = "out of memory growing buffer to " + std::to_string(end) + " bytes";
        return false;
    }
    std::memcpy(m_buffer.data() + offset, data, size);
    return true;
}

uint64_t MemorySink::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_buffer.size();
}

std::vector<uint8_t> MemorySink::release() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return std::move(m_buffer);
}

} // namespace fastget::core::downloader
