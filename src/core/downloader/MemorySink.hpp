#pragma once

/**
 * MemorySink.hpp
 * 
 * In-memory OutputSink backed by one contiguous buffer.
 */

#include "OutputSink.hpp"

#include <shared_mutex>
#include <vector>

namespace fastget::core::downloader {

/**
 * MemorySink
 * 
 * Pre-sized to the resource length when known, so parallel range writes
 * never reallocate. With an unknown length it starts empty with a generous
 * reserved capacity. A write past the end grows the logical size to exactly
 * offset + size under an exclusive lock; in-bounds writes share the lock.
 */
class MemorySink : public OutputSink {
public:
    static constexpr size_t kDefaultUnknownReserve = 16 * 1024 * 1024;
    
    explicit MemorySink(uint64_t knownLength = 0,
                        size_t reserveWhenUnknown = kDefaultUnknownReserve);
    
    MemorySink(const MemorySink&) = delete;
    MemorySink& operator=(const MemorySink&) = delete;
    
    bool writeAt(uint64_t offset, const char* data, size_t size, std::string& error) override;
    uint64_t size() const override;
    
    /**
     * Move the buffer out; the sink is empty afterwards.
     * Only valid once every writer has finished.
     */
    std::vector<uint8_t> release();

private:
    mutable std::shared_mutex m_mutex;
    std::vector<uint8_t> m_buffer;
};

} // namespace fastget::core::downloader
