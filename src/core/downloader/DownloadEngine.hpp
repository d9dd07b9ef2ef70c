#pragma once

/**
 * DownloadEngine.hpp
 * 
 * Parallel ranged HTTP download: probe the resource, plan byte ranges,
 * fetch them concurrently into one sink, and join.
 */

#include "ByteRange.hpp"
#include "DownloadError.hpp"
#include "OutputSink.hpp"
#include "../../utils/HttpClient.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fastget::core::downloader {

/**
 * Engine state machine
 * 
 * Probing -> Planning -> Fetching -> Done, or Failed from any of them.
 */
enum class EngineState {
    Probing,
    Planning,
    Fetching,
    Done,
    Failed
};

inline const char* engineStateLabel(EngineState state) {
    switch (state) {
        case EngineState::Probing: return "Probing";
        case EngineState::Planning: return "Planning";
        case EngineState::Fetching: return "Fetching";
        case EngineState::Done: return "Done";
        case EngineState::Failed: return "Failed";
        default: return "Unknown";
    }
}

using StateChangeCallback = std::function<void(EngineState state)>;

/**
 * Engine settings, passed explicitly for every engine instance
 */
struct EngineOptions {
    utils::HttpOptions http;
    
    // Largest slice handed to a sink in one write
    size_t writeBlockSize{64 * 1024};
    
    // Capacity reserved by the in-memory sink when the length is unknown
    size_t unknownLengthReserve{16 * 1024 * 1024};
    
    // Optional observer of state transitions
    StateChangeCallback onStateChange;
};

/**
 * Result of the Probing and Planning steps
 */
struct PreparedDownload {
    ResourceInfo resource;
    DownloadPlan plan;
    DownloadError error;
    
    bool ok() const { return !error.failed(); }
};

/**
 * Result of an in-memory download
 * 
 * data holds whatever was written even on failure; it is only meaningful
 * when ok() is true.
 */
struct MemoryDownload {
    std::vector<uint8_t> data;
    DownloadError error;
    
    bool ok() const { return !error.failed(); }
};

/**
 * DownloadEngine
 * 
 * One fetcher runs per planned range, each on its own pool thread, all
 * writing into the shared sink. The engine always waits for every fetcher
 * (no early cancellation) and then reports the error of the failed range
 * with the lowest start offset, or success.
 * 
 * The engine holds no per-download state; one instance may serve several
 * downloads in sequence or in parallel.
 */
class DownloadEngine {
public:
    explicit DownloadEngine(utils::HttpClient& client, EngineOptions options = {});
    
    /**
     * Probe the resource and compute the range plan
     * @param url Resource URL
     * @param workers Requested worker count (1..255)
     */
    PreparedDownload prepare(const std::string& url, int workers) const;
    
    /**
     * Fetch every range of a plan into sink and join
     */
    DownloadError execute(const std::string& url, const DownloadPlan& plan, OutputSink& sink) const;
    
    /**
     * Download the whole resource into memory
     */
    MemoryDownload fetchToMemory(const std::string& url, int workers) const;
    
    /**
     * Download the whole resource into a file, creating parent directories
     * and overwriting any existing file
     */
    DownloadError fetchToFile(const std::string& url, const std::filesystem::path& path,
                              int workers) const;
    
    const EngineOptions& options() const { return m_options; }

private:
    DownloadError runFetchers(const std::string& url, const DownloadPlan& plan,
                              OutputSink& sink) const;
    DownloadError finish(const std::string& url, DownloadError error) const;
    void setState(EngineState state) const;

private:
    utils::HttpClient& m_client;
    EngineOptions m_options;
};

/**
 * FetchToMemory on the process-wide HttpClient
 */
MemoryDownload fetchToMemory(const std::string& url, int workers,
                             const EngineOptions& options = {});

/**
 * FetchToFile on the process-wide HttpClient
 */
DownloadError fetchToFile(const std::string& url, const std::filesystem::path& path, int workers,
                          const EngineOptions& options = {});

} // namespace fastget::core::downloader
