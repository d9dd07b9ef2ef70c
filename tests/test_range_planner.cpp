#include <catch2/catch.hpp>

#include "core/downloader/RangePlanner.hpp"

using namespace fastget::core::downloader;

namespace {

uint64_t totalLength(const DownloadPlan& plan) {
    uint64_t sum = 0;
    for (const auto& r : plan) sum += r.length();
    return sum;
}

} // namespace

TEST_CASE("plan splits 1000 bytes over 3 workers with the remainder first") {
    auto result = RangePlanner::plan(1000, 3);
    REQUIRE(result.ok());
    REQUIRE(result.ranges.size() == 3);
    REQUIRE(result.ranges[0] == ByteRange{0, 333});
    REQUIRE(result.ranges[1] == ByteRange{334, 666});
    REQUIRE(result.ranges[2] == ByteRange{667, 999});
}

TEST_CASE("plan ranges are contiguous and cover the resource exactly") {
    const uint64_t lengths[] = {2, 3, 7, 100, 1000, 4097, 65536, 1000003};
    const int workerCounts[] = {2, 3, 4, 8, 16, 100, 255};

    for (uint64_t length : lengths) {
        for (int workers : workerCounts) {
            if (length < static_cast<uint64_t>(workers)) continue;

            INFO("length=" << length << " workers=" << workers);
            auto result = RangePlanner::plan(length, workers);
            REQUIRE(result.ok());
            REQUIRE(result.ranges.size() == static_cast<size_t>(workers));
            REQUIRE(result.ranges.front().start == 0);
            REQUIRE(result.ranges.back().end == static_cast<int64_t>(length - 1));
            for (size_t i = 1; i < result.ranges.size(); ++i) {
                REQUIRE(result.ranges[i].start == result.ranges[i - 1].end + 1);
            }
            REQUIRE(totalLength(result.ranges) == length);

            const uint64_t block = length / static_cast<uint64_t>(workers);
            REQUIRE(result.ranges[0].length() == block + length % static_cast<uint64_t>(workers));
            for (size_t i = 1; i < result.ranges.size(); ++i) {
                REQUIRE(result.ranges[i].length() == block);
            }
        }
    }
}

TEST_CASE("a single worker always gets the whole-resource sentinel") {
    for (uint64_t length : {0ull, 1ull, 1000ull, 1ull << 40}) {
        auto result = RangePlanner::plan(length, 1);
        REQUIRE(result.ok());
        REQUIRE(result.ranges.size() == 1);
        REQUIRE(result.ranges[0].isWholeResource());
    }
}

TEST_CASE("fewer bytes than workers collapses to one sentinel range") {
    auto result = RangePlanner::plan(3, 4);
    REQUIRE(result.ok());
    REQUIRE(result.ranges.size() == 1);
    REQUIRE(result.ranges[0].isWholeResource());

    auto unknown = RangePlanner::plan(0, 8);
    REQUIRE(unknown.ok());
    REQUIRE(unknown.ranges.size() == 1);
    REQUIRE(unknown.ranges[0].isWholeResource());
}

TEST_CASE("exactly as many bytes as workers gives one byte per range") {
    auto result = RangePlanner::plan(4, 4);
    REQUIRE(result.ok());
    REQUIRE(result.ranges.size() == 4);
    for (size_t i = 0; i < 4; ++i) {
        REQUIRE(result.ranges[i] == ByteRange{static_cast<int64_t>(i), static_cast<int64_t>(i)});
    }
}

TEST_CASE("zero workers is a plan error") {
    auto result = RangePlanner::plan(1000, 0);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error.kind == DownloadErrorKind::Plan);
    REQUIRE(result.error.message == "cannot plan with zero workers");
    REQUIRE(result.ranges.empty());
}

TEST_CASE("negative workers is a plan error") {
    auto result = RangePlanner::plan(1000, -2);
    REQUIRE(result.error.kind == DownloadErrorKind::Plan);
}

TEST_CASE("worker count is limited to 255") {
    REQUIRE(RangePlanner::plan(100000, 255).ok());

    auto result = RangePlanner::plan(100000, 256);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error.kind == DownloadErrorKind::Plan);
    REQUIRE(result.error.message.find("oversized worker count") != std::string::npos);
}

TEST_CASE("range header value is inclusive and zero indexed") {
    REQUIRE(ByteRange{0, 333}.toHeaderValue() == "bytes=0-333");
    REQUIRE(ByteRange{0, 333}.length() == 334);
    REQUIRE(ByteRange::wholeResource().length() == 0);
}
