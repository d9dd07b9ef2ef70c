/**
 * DirectoryMirror.cpp
 */

#include "DirectoryMirror.hpp"
#include "../Logger.hpp"
#include "../../utils/HttpClient.hpp"
#include "../../utils/StringUtils.hpp"

#include <deque>
#include <regex>
#include <unordered_set>

namespace fastget::core::mirror {

using utils::StringUtils;
using downloader::DownloadError;
using downloader::DownloadErrorKind;

namespace {

struct WorkItem {
    MirrorUrl url;
    std::filesystem::path destination;
    int depth{0};
};

bool isSafeRelativeLink(const std::string& href) {
    if (href.empty()) return false;
    if (StringUtils::contains(href, ":")) return false;
    if (href[0] == '/' || href[0] == '?' || href[0] == '#') return false;
    if (href.find_first_of("?#") != std::string::npos) return false;
    for (const auto& segment : StringUtils::split(href, '/')) {
        if (segment == "." || segment == "..") return false;
    }
    return true;
}

} // namespace

// -- MirrorUrl --

MirrorUrl MirrorUrl::parse(const std::string& url) {
    MirrorUrl parsed;
    auto hash = url.find('#');
    parsed.location = url.substr(0, hash);
    if (hash != std::string::npos) {
        parsed.fragment = url.substr(hash + 1);
    }
    return parsed;
}

std::string MirrorUrl::withoutQuery() const {
    return location.substr(0, location.find('?'));
}

std::string MirrorUrl::path() const {
    std::string base = withoutQuery();
    auto scheme = base.find("://");
    size_t authorityStart = scheme == std::string::npos ? 0 : scheme + 3;
    auto slash = base.find('/', authorityStart);
    if (slash == std::string::npos) return "/";
    return base.substr(slash);
}

bool MirrorUrl::isDirectory() const {
    return StringUtils::endsWith(path(), "/");
}

std::string MirrorUrl::fileName() const {
    std::string p = path();
    return utils::HttpClient::urlDecode(p.substr(p.find_last_of('/') + 1));
}

// -- DirectoryMirror --

DirectoryMirror::DirectoryMirror(const downloader::DownloadEngine& engine, MirrorOptions options)
    : m_engine(engine)
    , m_options(options) {
}

int DirectoryMirror::workersFromFragment(const std::string& fragment) {
    // Only plain decimal digits are accepted; no whitespace, no sign
    if (fragment.empty() || fragment.find_first_not_of("0123456789") != std::string::npos) {
        return 1;
    }
    auto value = StringUtils::parseUInt64(fragment);
    if (!value || *value > static_cast<uint64_t>(downloader::kMaxWorkers)) {
        return 1;
    }
    return static_cast<int>(*value);
}

std::vector<std::string> DirectoryMirror::extractRelativeLinks(const std::string& html) {
    static const std::regex hrefPattern(R"re(\shref="([^"]+)")re", std::regex::icase);
    
    std::vector<std::string> links;
    std::unordered_set<std::string> seen;
    
    for (auto it = std::sregex_iterator(html.begin(), html.end(), hrefPattern);
         it != std::sregex_iterator(); ++it) {
        std::string href = (*it)[1].str();
        if (!isSafeRelativeLink(href)) continue;
        if (seen.insert(href).second) {
            links.push_back(href);
        }
    }
    return links;
}

MirrorResult DirectoryMirror::mirror(const std::string& url,
                                     const std::filesystem::path& destination) const {
    MirrorResult result;
    
    const MirrorUrl root = MirrorUrl::parse(url);
    const int workers = workersFromFragment(root.fragment);
    FASTGET_LOG_INFO("Mirroring {} into {} with {} worker(s)", root.location,
                     destination.string(), workers);
    
    std::deque<WorkItem> queue;
    std::unordered_set<std::string> visited;
    queue.push_back(WorkItem{root, destination, 0});
    
    while (!queue.empty()) {
        WorkItem item = std::move(queue.front());
        queue.pop_front();
        
        if (!visited.insert(item.url.location).second) {
            continue;
        }
        
        if (!item.url.isDirectory()) {
            const std::string name = item.url.fileName();
            if (name.empty()) {
                ++result.entriesSkipped;
                FASTGET_LOG_WARN("Skipping {}: no file name", item.url.location);
                continue;
            }
            
            DownloadError error = m_engine.fetchToFile(item.url.location, item.destination / name, workers);
            if (error) {
                result.error = error;
                return result;
            }
            ++result.filesSaved;
            continue;
        }
        
        if (item.depth > m_options.maxDepth) {
            ++result.entriesSkipped;
            FASTGET_LOG_WARN("Skipping {}: deeper than {} levels", item.url.location, m_options.maxDepth);
            continue;
        }
        
        auto listing = m_engine.fetchToMemory(item.url.location, workers);
        if (!listing.ok()) {
            result.error = listing.error;
            return result;
        }
        ++result.listingsVisited;
        
        const std::string html(listing.data.begin(), listing.data.end());
        const std::string base = item.url.withoutQuery();
        for (const auto& href : extractRelativeLinks(html)) {
            WorkItem child;
            child.url.location = base + href;
            child.depth = item.depth + 1;
            child.destination = StringUtils::endsWith(href, "/")
                ? item.destination / utils::HttpClient::urlDecode(href.substr(0, href.size() - 1))
                : item.destination;
            queue.push_back(std::move(child));
        }
    }
    
    FASTGET_LOG_INFO("Mirror finished: {} file(s), {} listing(s), {} skipped",
                     result.filesSaved, result.listingsVisited, result.entriesSkipped);
    return result;
}

} // namespace fastget::core::mirror
