#pragma once

/**
 * ByteRange.hpp
 * 
 * Byte ranges, download plans and probed resource metadata.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace fastget::core::downloader {

/**
 * Largest worker count a plan may use (one byte)
 */
inline constexpr int kMaxWorkers = 255;

/**
 * Inclusive, zero-indexed byte span [start, end]
 * 
 * end < start is the sentinel for "not a range request": the whole resource
 * is fetched with a plain GET.
 */
struct ByteRange {
    int64_t start{0};
    int64_t end{-1};
    
    static ByteRange wholeResource() { return ByteRange{0, -1}; }
    
    bool isWholeResource() const { return end < start; }
    
    /**
     * Number of bytes covered; 0 for the sentinel
     */
    uint64_t length() const {
        return isWholeResource() ? 0 : static_cast<uint64_t>(end - start + 1);
    }
    
    /**
     * Value for the Range request header, e.g. "bytes=0-335"
     */
    std::string toHeaderValue() const {
        return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
    }
    
    bool operator==(const ByteRange& other) const = default;
};

/**
 * Ordered, gap-free, non-overlapping ranges covering a resource
 */
using DownloadPlan = std::vector<ByteRange>;

/**
 * What the metadata probe learned about a resource
 */
struct ResourceInfo {
    // Total length in bytes, 0 when unknown
    uint64_t length{0};
    
    // Server advertised Accept-Ranges: bytes
    bool acceptsRanges{false};
    
    bool lengthKnown() const { return length > 0; }
};

} // namespace fastget::core::downloader
