#pragma once

/**
 * DownloadError.hpp
 * 
 * Error value reported by every stage of a download.
 */

#include "ByteRange.hpp"

#include <optional>
#include <string>

namespace fastget::core::downloader {

enum class DownloadErrorKind {
    None,
    Probe,          // metadata request failed or returned a non-success status
    Plan,           // invalid worker count
    RangeRequest,   // a fetch returned an unexpected status
    Transfer,       // the request or a body read failed
    Storage         // destination could not be created or written
};

inline const char* errorKindLabel(DownloadErrorKind kind) {
    switch (kind) {
        case DownloadErrorKind::None: return "None";
        case DownloadErrorKind::Probe: return "ProbeError";
        case DownloadErrorKind::Plan: return "PlanError";
        case DownloadErrorKind::RangeRequest: return "RangeRequestError";
        case DownloadErrorKind::Transfer: return "TransferError";
        case DownloadErrorKind::Storage: return "StorageError";
        default: return "Unknown";
    }
}

/**
 * DownloadError - Outcome of a download stage
 * 
 * A default-constructed value means success.
 */
struct DownloadError {
    DownloadErrorKind kind{DownloadErrorKind::None};
    std::string message;
    
    // Status the server actually returned (0 if none)
    int httpStatus{0};
    
    // Status that would have been accepted (200 or 206), 0 if not applicable
    int expectedStatus{0};
    
    // Byte span that was being fetched, if this was a range request
    std::optional<ByteRange> range;
    
    bool failed() const { return kind != DownloadErrorKind::None; }
    explicit operator bool() const { return failed(); }
    
    std::string describe() const {
        if (!failed()) return "ok";
        return std::string(errorKindLabel(kind)) + ": " + message;
    }
    
    static DownloadError make(DownloadErrorKind kind, std::string message) {
        DownloadError error;
        error.kind = kind;
        error.message = std::move(message);
        return error;
    }
};

} // namespace fastget::core::downloader
