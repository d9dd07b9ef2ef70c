/**
 * ResourceProber.cpp
 */

#include "ResourceProber.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

namespace fastget::core::downloader {

using utils::StringUtils;

ResourceProber::ResourceProber(utils::HttpClient& client, utils::HttpOptions options)
    : m_client(client)
    , m_options(std::move(options)) {
    // A probe never asks for a range
    m_options.headers.erase("Range");
}

ProbeResult ResourceProber::probe(const std::string& url) const {
    ProbeResult result;
    
    utils::HttpResponse response = m_client.head(url, m_options);
    
    if (response.isTransportFailure()) {
        result.error = DownloadError::make(DownloadErrorKind::Probe,
            "metadata request failed: " + (response.error.empty() ? std::string("no response")
                                                                  : response.error));
        return result;
    }
    
    if (response.statusCode != 200) {
        result.error = DownloadError::make(DownloadErrorKind::Probe,
            "bad response code: " + std::to_string(response.statusCode));
        result.error.httpStatus = response.statusCode;
        result.error.expectedStatus = 200;
        return result;
    }
    
    // Servers are not required to send Accept-Ranges, but without it we
    // cannot rely on ranges, so it is treated as "no".
    const std::string acceptRanges = StringUtils::trim(response.header("accept-ranges"));
    if (!StringUtils::equalsIgnoreCase(acceptRanges, "bytes")) {
        FASTGET_LOG_DEBUG("{} does not advertise byte ranges (Accept-Ranges: '{}')", url, acceptRanges);
        return result;
    }
    result.resource.acceptsRanges = true;
    
    if (response.contentLength < 0) {
        FASTGET_LOG_DEBUG("{} sent no usable Content-Length", url);
        return result;
    }
    
    result.resource.length = static_cast<uint64_t>(response.contentLength);
    FASTGET_LOG_DEBUG("Probed {}: {} bytes, ranges supported", url, result.resource.length);
    return result;
}

} // namespace fastget::core::downloader
