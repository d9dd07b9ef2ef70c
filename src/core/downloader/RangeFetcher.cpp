/**
 * RangeFetcher.cpp
 */

#include "RangeFetcher.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace fastget::core::downloader {

namespace {

std::string spanText(const ByteRange& range) {
    return std::to_string(range.start) + " through " + std::to_string(range.end);
}

} // namespace

RangeFetcher::RangeFetcher(utils::HttpClient& client, OutputSink& sink, FetchOptions options)
    : m_client(client)
    , m_sink(sink)
    , m_options(std::move(options)) {
    if (m_options.writeBlockSize == 0) {
        m_options.writeBlockSize = 64 * 1024;
    }
}

DownloadError RangeFetcher::fetch(const std::string& url, const ByteRange& range) const {
    const bool isRange = !range.isWholeResource();
    const int expectedStatus = isRange ? 206 : 200;
    
    utils::HttpOptions options = m_options.http;
    options.headers.erase("Range");
    if (isRange) {
        options.headers["Range"] = range.toHeaderValue();
    }
    
    uint64_t offset = isRange ? static_cast<uint64_t>(range.start) : 0;
    uint64_t received = 0;
    int reportedStatus = 0;
    bool statusRejected = false;
    bool storageFailed = false;
    bool overrun = false;
    std::string storageError;
    
    utils::StreamCallbacks callbacks;
    callbacks.onStatus = [&](int status) {
        reportedStatus = status;
        if (status != expectedStatus) {
            statusRejected = true;
            return false;
        }
        return true;
    };
    callbacks.onData = [&](const char* data, size_t size) {
        // A range response must not spill into the neighbouring span
        if (isRange && size > range.length() - received) {
            size = static_cast<size_t>(range.length() - received);
            overrun = true;
        }
        while (size > 0) {
            const size_t block = std::min(size, m_options.writeBlockSize);
            if (!m_sink.writeAt(offset, data, block, storageError)) {
                storageFailed = true;
                return false;
            }
            offset += block;
            received += block;
            data += block;
            size -= block;
        }
        return !overrun;
    };
    
    FASTGET_LOG_TRACE("GET {} ({})", url, isRange ? options.headers["Range"] : "whole resource");
    utils::HttpResponse response = m_client.getStream(url, options, callbacks);
    
    DownloadError error;
    if (isRange) error.range = range;
    
    if (storageFailed) {
        error.kind = DownloadErrorKind::Storage;
        error.message = storageError;
        error.httpStatus = response.statusCode;
        return error;
    }
    
    const int status = statusRejected ? reportedStatus : response.statusCode;
    
    if (!statusRejected && response.isTransportFailure()) {
        error.kind = DownloadErrorKind::Transfer;
        error.message = "request failed: " +
            (response.error.empty() ? std::string("no response") : response.error);
        if (isRange) error.message += " while reading bytes " + spanText(range);
        return error;
    }
    
    if (status != expectedStatus) {
        error.kind = DownloadErrorKind::RangeRequest;
        error.httpStatus = status;
        error.expectedStatus = expectedStatus;
        error.message = "bad response code: " + std::to_string(status);
        if (isRange) {
            error.message += " while reading bytes " + spanText(range);
        }
        return error;
    }
    
    if (overrun) {
        error.kind = DownloadErrorKind::Transfer;
        error.httpStatus = status;
        error.message = "server sent more than bytes " + spanText(range);
        return error;
    }
    
    if (!response.error.empty()) {
        error.kind = DownloadErrorKind::Transfer;
        error.httpStatus = status;
        error.message = "read failed after " + std::to_string(received) + " bytes: " + response.error;
        if (isRange) error.message += " while reading bytes " + spanText(range);
        return error;
    }
    
    if (isRange && received != range.length()) {
        error.kind = DownloadErrorKind::Transfer;
        error.httpStatus = status;
        error.message = "short body: " + std::to_string(received) + " of " +
                        std::to_string(range.length()) + " bytes while reading bytes " + spanText(range);
        return error;
    }
    
    FASTGET_LOG_DEBUG("Fetched {} bytes of {} ({}) in {:.2f}s", received, url,
                      isRange ? spanText(range) : std::string("whole resource"),
                      response.downloadTime);
    return DownloadError{};
}

} // namespace fastget::core::downloader
