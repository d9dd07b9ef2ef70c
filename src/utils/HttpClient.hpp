// fastget - HTTP Client
// Blocking HTTP client with a streaming GET, built on cpr/libcurl

#pragma once

#include <string>
#include <map>
#include <functional>
#include <memory>
#include <cstdint>
#include <curl/curl.h>

namespace fastget::utils {

/**
 * @brief HTTP response structure
 *
 * Header names are stored lower-cased.
 */
struct HttpResponse {
    int statusCode{0};
    std::map<std::string, std::string> headers;
    std::string error;
    double downloadTime{0.0};
    
    // Value of Content-Length, -1 when the server did not send one
    int64_t contentLength{-1};
    
    // True when the request failed before any status line arrived
    bool isTransportFailure() const { return statusCode == 0; }
    
    /**
     * @brief Look up a header by (case-insensitive) name
     * @return Header value, empty if absent
     */
    std::string header(const std::string& name) const;
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutSeconds{0};          // 0 = no limit
    int connectTimeoutSeconds{0};   // 0 = libcurl default
    bool verifySSL{true};
    std::string userAgent{"fastget/1.0"};
};

/**
 * @brief Callbacks driving a streaming GET
 *
 * onStatus fires once with the final status code before the first body byte
 * is delivered. onData then receives the body in the chunks the transport
 * produces. Returning false from either aborts the transfer.
 */
struct StreamCallbacks {
    std::function<bool(int statusCode)> onStatus;
    std::function<bool(const char* data, size_t size)> onData;
};

/**
 * @brief Blocking HTTP client
 *
 * head() and getStream() are virtual so the download engine can be driven
 * by an in-process server in tests.
 */
class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient();
    
    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    
    // Move
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;
    
    // Singleton instance
    static HttpClient& instance();
    
    // Set default options
    void setDefaultOptions(const HttpOptions& options);
    const HttpOptions& defaultOptions() const;
    
    /**
     * @brief Metadata-only request; no body is transferred
     */
    virtual HttpResponse head(const std::string& url, const HttpOptions& options = {});
    
    /**
     * @brief GET whose body is streamed through callbacks instead of buffered
     *
     * The returned response carries the status, the transport error (if any)
     * and the elapsed time.
     */
    virtual HttpResponse getStream(const std::string& url, const HttpOptions& options,
                                   const StreamCallbacks& callbacks);
    
    // Percent-decoding of a URL component
    static std::string urlDecode(const std::string& str);
    
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
    
    HttpOptions mergeOptions(const HttpOptions& options) const;
};

/**
 * @brief Process-wide libcurl initialisation
 *
 * curl_global_init is not thread-safe, so it runs once before any worker
 * thread creates a handle.
 */
class CurlGlobalInit {
public:
    // false when libcurl could not be initialised
    static bool init();
    static void cleanup();
    
private:
    static bool s_initialized;
};

} // namespace fastget::utils
