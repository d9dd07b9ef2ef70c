#pragma once

/**
 * RangeFetcher.hpp
 * 
 * Retrieves one byte range (or the whole resource) and streams it into an
 * OutputSink at its absolute offset.
 */

#include "ByteRange.hpp"
#include "DownloadError.hpp"
#include "OutputSink.hpp"
#include "../../utils/HttpClient.hpp"

#include <string>

namespace fastget::core::downloader {

struct FetchOptions {
    utils::HttpOptions http;
    
    // Largest slice handed to the sink in one write
    size_t writeBlockSize{64 * 1024};
};

/**
 * RangeFetcher
 * 
 * A sentinel range is a plain GET that must answer 200; any other range
 * carries "Range: bytes=<start>-<end>" and must answer 206. The body is
 * written at increasing offsets starting from range.start. There are no
 * retries. fetch() is safe to call from several threads at once.
 */
class RangeFetcher {
public:
    RangeFetcher(utils::HttpClient& client, OutputSink& sink, FetchOptions options);
    
    DownloadError fetch(const std::string& url, const ByteRange& range) const;

private:
    utils::HttpClient& m_client;
    OutputSink& m_sink;
    FetchOptions m_options;
};

} // namespace fastget::core::downloader
