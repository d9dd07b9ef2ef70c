/**
 * DownloadEngine.cpp
 * 
 * Implementation of the parallel ranged download engine.
 */

#include "DownloadEngine.hpp"
#include "FileSink.hpp"
#include "MemorySink.hpp"
#include "RangeFetcher.hpp"
#include "RangePlanner.hpp"
#include "ResourceProber.hpp"
#include "../Logger.hpp"
#include "../ThreadPool.hpp"

#include <future>
#include <system_error>

namespace fastget::core::downloader {

DownloadEngine::DownloadEngine(utils::HttpClient& client, EngineOptions options)
    : m_client(client)
    , m_options(std::move(options)) {
}

void DownloadEngine::setState(EngineState state) const {
    FASTGET_LOG_DEBUG("Engine state -> {}", engineStateLabel(state));
    if (m_options.onStateChange) {
        m_options.onStateChange(state);
    }
}

DownloadError DownloadEngine::finish(const std::string& url, DownloadError error) const {
    if (error) {
        FASTGET_LOG_ERROR("Download of {} failed: {}", url, error.describe());
        setState(EngineState::Failed);
    } else {
        setState(EngineState::Done);
    }
    return error;
}

PreparedDownload DownloadEngine::prepare(const std::string& url, int workers) const {
    PreparedDownload prepared;
    
    setState(EngineState::Probing);
    ResourceProber prober(m_client, m_options.http);
    ProbeResult probed = prober.probe(url);
    if (!probed.ok()) {
        prepared.error = finish(url, probed.error);
        return prepared;
    }
    prepared.resource = probed.resource;
    
    setState(EngineState::Planning);
    PlanResult planned = RangePlanner::plan(prepared.resource.length, workers);
    if (!planned.ok()) {
        prepared.error = finish(url, planned.error);
        return prepared;
    }
    prepared.plan = std::move(planned.ranges);
    
    FASTGET_LOG_INFO("Planned {} range(s) for {} (length {}, requested {} worker(s))",
                     prepared.plan.size(), url,
                     prepared.resource.lengthKnown() ? std::to_string(prepared.resource.length)
                                                     : std::string("unknown"),
                     workers);
    return prepared;
}

DownloadError DownloadEngine::runFetchers(const std::string& url, const DownloadPlan& plan,
                                          OutputSink& sink) const {
    setState(EngineState::Fetching);
    
    if (plan.empty()) {
        return DownloadError::make(DownloadErrorKind::Plan, "empty download plan");
    }
    
    RangeFetcher fetcher(m_client, sink, FetchOptions{m_options.http, m_options.writeBlockSize});
    
    if (plan.size() == 1) {
        return fetcher.fetch(url, plan.front());
    }
    
    // One result slot per range, filled in plan order once every fetcher
    // has been joined.
    std::vector<DownloadError> results(plan.size());
    
    try {
        ThreadPool pool(plan.size());
        FASTGET_LOG_DEBUG("Started {} fetch workers for {}", pool.size(), url);
        std::vector<std::future<DownloadError>> pending;
        pending.reserve(plan.size());
        
        for (const auto& range : plan) {
            FASTGET_LOG_DEBUG("Dispatching bytes {}-{} of {}", range.start, range.end, url);
            pending.push_back(pool.submit([&fetcher, &url, range]() {
                return fetcher.fetch(url, range);
            }));
        }
        
        for (size_t i = 0; i < pending.size(); ++i) {
            try {
                results[i] = pending[i].get();
            } catch (const std::exception& e) {
                results[i] = DownloadError::make(DownloadErrorKind::Transfer,
                    std::string("fetcher aborted: ") + e.what());
                results[i].range = plan[i];
            }
        }
    } catch (const std::system_error& e) {
        return DownloadError::make(DownloadErrorKind::Transfer,
            std::string("cannot start fetch workers: ") + e.what());
    }
    
    size_t failures = 0;
    const DownloadError* first = nullptr;
    for (const auto& result : results) {
        if (!result) continue;
        ++failures;
        FASTGET_LOG_WARN("Range fetch failed: {}", result.describe());
        if (!first) first = &result;
    }
    
    if (first) {
        if (failures > 1) {
            FASTGET_LOG_WARN("{} of {} ranges failed for {}", failures, results.size(), url);
        }
        return *first;
    }
    return DownloadError{};
}

DownloadError DownloadEngine::execute(const std::string& url, const DownloadPlan& plan,
                                      OutputSink& sink) const {
    return finish(url, runFetchers(url, plan, sink));
}

MemoryDownload DownloadEngine::fetchToMemory(const std::string& url, int workers) const {
    MemoryDownload result;
    
    PreparedDownload prepared = prepare(url, workers);
    if (!prepared.ok()) {
        result.error = prepared.error;
        return result;
    }
    
    MemorySink sink(prepared.resource.length, m_options.unknownLengthReserve);
    result.error = execute(url, prepared.plan, sink);
    result.data = sink.release();
    return result;
}

DownloadError DownloadEngine::fetchToFile(const std::string& url, const std::filesystem::path& path,
                                          int workers) const {
    PreparedDownload prepared = prepare(url, workers);
    if (!prepared.ok()) {
        return prepared.error;
    }
    
    FileSink sink;
    std::string storageError;
    if (!sink.open(path, storageError)) {
        return finish(url, DownloadError::make(DownloadErrorKind::Storage, storageError));
    }
    
    DownloadError error = runFetchers(url, prepared.plan, sink);
    
    if (!sink.close(storageError) && !error) {
        error = DownloadError::make(DownloadErrorKind::Storage, storageError);
    }
    
    if (!error) {
        FASTGET_LOG_INFO("Saved {} ({} bytes)", path.string(), sink.size());
    }
    return finish(url, std::move(error));
}

// -- Public operations --

MemoryDownload fetchToMemory(const std::string& url, int workers, const EngineOptions& options) {
    DownloadEngine engine(utils::HttpClient::instance(), options);
    return engine.fetchToMemory(url, workers);
}

DownloadError fetchToFile(const std::string& url, const std::filesystem::path& path, int workers,
                          const EngineOptions& options) {
    DownloadEngine engine(utils::HttpClient::instance(), options);
    return engine.fetchToFile(url, path, workers);
}

} // namespace fastget::core::downloader
