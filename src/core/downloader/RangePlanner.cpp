/**
 * RangePlanner.cpp
 */

#include "RangePlanner.hpp"
#include "../Logger.hpp"

namespace fastget::core::downloader {

PlanResult RangePlanner::plan(uint64_t length, int workers) {
    PlanResult result;
    
    if (workers < 1) {
        result.error = DownloadError::make(DownloadErrorKind::Plan,
            workers == 0 ? std::string("cannot plan with zero workers")
                         : "cannot plan with " + std::to_string(workers) + " workers");
        return result;
    }
    
    if (workers > kMaxWorkers) {
        result.error = DownloadError::make(DownloadErrorKind::Plan,
            "oversized worker count: " + std::to_string(workers) +
            " (maximum " + std::to_string(kMaxWorkers) + ")");
        return result;
    }
    
    // Covers unknown length (0) as well
    if (length < static_cast<uint64_t>(workers)) {
        workers = 1;
    }
    
    if (workers == 1) {
        result.ranges.push_back(ByteRange::wholeResource());
        return result;
    }
    
    const uint64_t count = static_cast<uint64_t>(workers);
    const uint64_t blockSize = length / count;
    uint64_t remainder = length % count;
    
    result.ranges.reserve(count);
    uint64_t offset = 0;
    for (uint64_t i = 0; i < count; ++i) {
        const uint64_t size = blockSize + remainder;
        result.ranges.push_back(ByteRange{
            static_cast<int64_t>(offset),
            static_cast<int64_t>(offset + size - 1)
        });
        offset += size;
        remainder = 0;
    }
    
    FASTGET_LOG_TRACE("Planned {} ranges of {} bytes (+{} on the first)", count, blockSize,
                      length % count);
    return result;
}

} // namespace fastget::core::downloader
