#pragma once

/**
 * ResourceProber.hpp
 * 
 * Metadata-only (HEAD) request that discovers a resource's length and
 * whether the server honors byte-range requests.
 */

#include "ByteRange.hpp"
#include "DownloadError.hpp"
#include "../../utils/HttpClient.hpp"

#include <string>

namespace fastget::core::downloader {

struct ProbeResult {
    ResourceInfo resource;
    DownloadError error;
    
    bool ok() const { return !error.failed(); }
};

/**
 * ResourceProber
 * 
 * The length is reported only when the server answers 200, advertises
 * Accept-Ranges: bytes and sends a Content-Length. Anything less degrades
 * to an unknown length (0) so the caller falls back to a single stream.
 * A non-200 answer is a Probe error.
 */
class ResourceProber {
public:
    ResourceProber(utils::HttpClient& client, utils::HttpOptions options);
    
    ProbeResult probe(const std::string& url) const;

private:
    utils::HttpClient& m_client;
    utils::HttpOptions m_options;
};

} // namespace fastget::core::downloader
