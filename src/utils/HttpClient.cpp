/**
 * HttpClient.cpp
 * 
 * HTTP client implementation using cpr (which wraps libcurl).
 * libcurl is used directly for global initialisation and URL escaping.
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

#include <cpr/cpr.h>
#include <mutex>
#include <string_view>

namespace fastget::utils {

namespace {

std::mutex g_curlInitMutex;

// "HTTP/1.1 206 Partial Content" -> 206; 0 when the line is not a status line
int parseStatusLine(std::string_view line) {
    if (line.substr(0, 5) != "HTTP/") return 0;
    auto space = line.find(' ');
    if (space == std::string_view::npos) return 0;
    int code = 0;
    int digits = 0;
    for (size_t i = space + 1; i < line.size() && digits < 3; ++i, ++digits) {
        char c = line[i];
        if (c < '0' || c > '9') return 0;
        code = code * 10 + (c - '0');
    }
    return digits == 3 ? code : 0;
}

cpr::Header toCprHeaders(const HttpOptions& options) {
    cpr::Header headers;
    for (const auto& [key, value] : options.headers) headers[key] = value;
    return headers;
}

} // namespace

// -- HttpResponse --

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(StringUtils::toLower(name));
    return it == headers.end() ? std::string() : it->second;
}

// -- CurlGlobalInit --

bool CurlGlobalInit::s_initialized = false;

bool CurlGlobalInit::init() {
    std::lock_guard<std::mutex> lock(g_curlInitMutex);
    if (!s_initialized) {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            return false;
        }
        s_initialized = true;
    }
    return true;
}

void CurlGlobalInit::cleanup() {
    std::lock_guard<std::mutex> lock(g_curlInitMutex);
    if (s_initialized) {
        curl_global_cleanup();
        s_initialized = false;
    }
}

// -- HttpClient::Impl --

struct HttpClient::Impl {
    HttpOptions defaultOptions;
};

// -- HttpClient --

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {
    // On failure curl_easy_init retries the global setup per handle and
    // reports through each request's error instead
    static_cast<void>(CurlGlobalInit::init());
}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

HttpClient& HttpClient::instance() {
    static HttpClient inst;
    return inst;
}

void HttpClient::setDefaultOptions(const HttpOptions& options) {
    m_impl->defaultOptions = options;
}

const HttpOptions& HttpClient::defaultOptions() const {
    return m_impl->defaultOptions;
}

HttpOptions HttpClient::mergeOptions(const HttpOptions& options) const {
    HttpOptions merged = options;
    for (const auto& [key, value] : m_impl->defaultOptions.headers) {
        merged.headers.emplace(key, value);
    }
    if (merged.userAgent.empty()) merged.userAgent = m_impl->defaultOptions.userAgent;
    if (merged.userAgent.empty()) merged.userAgent = "fastget/1.0";
    if (merged.timeoutSeconds <= 0) merged.timeoutSeconds = m_impl->defaultOptions.timeoutSeconds;
    if (merged.connectTimeoutSeconds <= 0) {
        merged.connectTimeoutSeconds = m_impl->defaultOptions.connectTimeoutSeconds;
    }
    return merged;
}

HttpResponse HttpClient::head(const std::string& url, const HttpOptions& options) {
    HttpResponse result;
    HttpOptions opts = mergeOptions(options);

    try {
        cpr::Response response = cpr::Head(
            cpr::Url{url},
            toCprHeaders(opts),
            cpr::Timeout{opts.timeoutSeconds * 1000},
            cpr::ConnectTimeout{opts.connectTimeoutSeconds * 1000},
            cpr::UserAgent{opts.userAgent},
            cpr::VerifySsl{opts.verifySSL}
        );

        result.statusCode = static_cast<int>(response.status_code);
        result.downloadTime = response.elapsed;
        if (response.error) result.error = response.error.message;

        for (const auto& [key, value] : response.header) {
            result.headers[StringUtils::toLower(key)] = StringUtils::trim(value);
        }

        auto contentLength = result.headers.find("content-length");
        if (contentLength != result.headers.end()) {
            auto parsed = StringUtils::parseInt64(contentLength->second);
            result.contentLength = parsed ? *parsed : -1;
        }
    } catch (const std::exception& e) {
        result.statusCode = 0;
        result.error = e.what();
    }

    return result;
}

HttpResponse HttpClient::getStream(const std::string& url, const HttpOptions& options,
                                   const StreamCallbacks& callbacks) {
    HttpResponse result;
    HttpOptions opts = mergeOptions(options);

    int lastStatus = 0;
    bool statusReported = false;
    bool aborted = false;

    try {
        cpr::Response response = cpr::Get(
            cpr::Url{url},
            toCprHeaders(opts),
            cpr::Timeout{opts.timeoutSeconds * 1000},
            cpr::ConnectTimeout{opts.connectTimeoutSeconds * 1000},
            cpr::UserAgent{opts.userAgent},
            cpr::VerifySsl{opts.verifySSL},
            cpr::HeaderCallback{[&](std::string_view line, intptr_t) -> bool {
                // Every redirect hop starts a new header block; the last status wins
                int status = parseStatusLine(line);
                if (status > 0) lastStatus = status;
                return true;
            }},
            cpr::WriteCallback{[&](std::string_view data, intptr_t) -> bool {
                if (!statusReported) {
                    statusReported = true;
                    if (callbacks.onStatus && !callbacks.onStatus(lastStatus)) {
                        aborted = true;
                        return false;
                    }
                }
                if (data.empty() || !callbacks.onData) return true;
                if (!callbacks.onData(data.data(), data.size())) {
                    aborted = true;
                    return false;
                }
                return true;
            }}
        );

        result.statusCode = response.status_code > 0 ? static_cast<int>(response.status_code)
                                                     : lastStatus;
        result.downloadTime = response.elapsed;
        if (response.error && !aborted) result.error = response.error.message;
    } catch (const std::exception& e) {
        result.statusCode = lastStatus;
        result.error = e.what();
    }

    return result;
}

std::string HttpClient::urlDecode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) return str;
    int outLen = 0;
    char* output = curl_easy_unescape(curl, str.c_str(), static_cast<int>(str.size()), &outLen);
    std::string result = output ? std::string(output, static_cast<size_t>(outLen)) : str;
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

} // namespace fastget::utils
