#pragma once

/**
 * RangePlanner.hpp
 * 
 * Splits a resource's byte space into per-worker ranges.
 */

#include "ByteRange.hpp"
#include "DownloadError.hpp"

namespace fastget::core::downloader {

struct PlanResult {
    DownloadPlan ranges;
    DownloadError error;
    
    bool ok() const { return !error.failed(); }
};

/**
 * RangePlanner - Partition policy
 * 
 * - workers < 1 or > kMaxWorkers: Plan error
 * - unknown length (0), length < workers, or one worker: a single
 *   whole-resource sentinel range (no Range header is ever sent)
 * - otherwise `workers` contiguous ranges of length/workers bytes, the first
 *   one also absorbing length % workers
 */
class RangePlanner {
public:
    static PlanResult plan(uint64_t length, int workers);
};

} // namespace fastget::core::downloader
