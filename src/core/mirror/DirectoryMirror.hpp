#pragma once

/**
 * DirectoryMirror.hpp
 * 
 * Mirrors a file or an HTTP directory listing tree onto local storage,
 * using the download engine for every transfer.
 */

#include "../downloader/DownloadEngine.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace fastget::core::mirror {

struct MirrorOptions {
    // Listings deeper than this below the root are skipped
    int maxDepth{8};
};

struct MirrorResult {
    size_t filesSaved{0};
    size_t listingsVisited{0};
    size_t entriesSkipped{0};
    downloader::DownloadError error;
    
    bool ok() const { return !error.failed(); }
};

/**
 * URL split into the part sent on the wire and its fragment
 */
struct MirrorUrl {
    std::string location;   // scheme://host/path?query
    std::string fragment;   // text after '#', empty if none
    
    static MirrorUrl parse(const std::string& url);
    
    /**
     * Path component (no query), "/" when the URL has none
     */
    std::string path() const;
    
    bool isDirectory() const;
    
    /**
     * Last path segment, percent-decoded
     */
    std::string fileName() const;
    
    /**
     * location with any query removed
     */
    std::string withoutQuery() const;
};

/**
 * DirectoryMirror
 * 
 * - The worker count comes from the URL fragment ("#8"); a missing or
 *   unparsable fragment, or one above 255, means 1.
 * - A URL whose path does not end in '/' is saved as
 *   destination/<last segment>.
 * - A URL ending in '/' is a listing: its relative hrefs are queued, with
 *   directories (trailing '/') mapped to sub-directories of the destination.
 * 
 * Traversal uses an explicit FIFO queue with a visited set and a depth
 * limit. The first failed transfer stops the mirror.
 */
class DirectoryMirror {
public:
    explicit DirectoryMirror(const downloader::DownloadEngine& engine, MirrorOptions options = {});
    
    MirrorResult mirror(const std::string& url, const std::filesystem::path& destination) const;
    
    static int workersFromFragment(const std::string& fragment);
    
    /**
     * Relative hrefs of a listing page, in document order, without
     * duplicates. Absolute URLs, rooted paths, queries, anchors and
     * "." / ".." segments are dropped.
     */
    static std::vector<std::string> extractRelativeLinks(const std::string& html);

private:
    const downloader::DownloadEngine& m_engine;
    MirrorOptions m_options;
};

} // namespace fastget::core::mirror
