#pragma once

/**
 * OutputSink.hpp
 * 
 * Random-access destination for downloaded bytes.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace fastget::core::downloader {

/**
 * OutputSink - "write payload P at absolute offset O"
 * 
 * Implementations must accept concurrent writes to disjoint spans and grow
 * to cover any offset beyond their current size.
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;
    
    /**
     * Write size bytes at offset
     * @param error Set to a description when the write fails
     * @return true on success
     */
    virtual bool writeAt(uint64_t offset, const char* data, size_t size, std::string& error) = 0;
    
    /**
     * Logical size: one past the highest byte written or pre-sized
     */
    virtual uint64_t size() const = 0;
};

} // namespace fastget::core::downloader
