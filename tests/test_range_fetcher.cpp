#include <catch2/catch.hpp>

#include "fake_http_client.hpp"
#include "core/downloader/MemorySink.hpp"
#include "core/downloader/RangeFetcher.hpp"

using namespace fastget::core::downloader;
using fastget::test::FakeHttpClient;
using fastget::test::makePayload;

namespace {

const std::string kUrl = "http://files.test/blob";

// Records every write it receives
class RecordingSink : public OutputSink {
public:
    bool writeAt(uint64_t offset, const char* data, size_t size, std::string& error) override {
        (void)data;
        (void)error;
        writes.emplace_back(offset, size);
        return true;
    }
    uint64_t size() const override { return 0; }

    std::vector<std::pair<uint64_t, size_t>> writes;
};

class BrokenSink : public OutputSink {
public:
    bool writeAt(uint64_t, const char*, size_t, std::string& error) override {
        error = "disk full";
        return false;
    }
    uint64_t size() const override { return 0; }
};

} // namespace

TEST_CASE("range fetch sends a Range header and writes at the range offset") {
    FakeHttpClient client;
    const std::string body = makePayload(100);
    client.serve(kUrl, body);

    MemorySink sink(100);
    RangeFetcher fetcher(client, sink, {});
    auto error = fetcher.fetch(kUrl, ByteRange{40, 59});
    REQUIRE_FALSE(error.failed());

    auto requests = client.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].method == "GET");
    REQUIRE(requests[0].range == std::optional<std::string>("bytes=40-59"));

    auto data = sink.release();
    REQUIRE(std::string(data.begin() + 40, data.begin() + 60) == body.substr(40, 20));
    REQUIRE(data[39] == 0);
    REQUIRE(data[60] == 0);
}

TEST_CASE("whole-resource fetch sends no Range header and expects 200") {
    FakeHttpClient client;
    const std::string body = makePayload(2500);
    client.serve(kUrl, body);

    MemorySink sink;
    RangeFetcher fetcher(client, sink, {});
    REQUIRE_FALSE(fetcher.fetch(kUrl, ByteRange::wholeResource()).failed());

    REQUIRE_FALSE(client.requests()[0].range.has_value());
    auto data = sink.release();
    REQUIRE(std::string(data.begin(), data.end()) == body);
}

TEST_CASE("body is handed to the sink in bounded increasing slices") {
    FakeHttpClient client;
    client.serve(kUrl, makePayload(1000)).chunkSize = 300;

    RecordingSink sink;
    FetchOptions options;
    options.writeBlockSize = 128;
    RangeFetcher fetcher(client, sink, options);
    REQUIRE_FALSE(fetcher.fetch(kUrl, ByteRange{100, 899}).failed());

    uint64_t expected = 100;
    for (const auto& [offset, size] : sink.writes) {
        REQUIRE(size <= 128);
        REQUIRE(offset == expected);
        expected += size;
    }
    REQUIRE(expected == 900);
}

TEST_CASE("a 200 answer to a range request is a range request error") {
    FakeHttpClient client;
    client.serve(kUrl, makePayload(100)).honorRanges = false;

    RecordingSink sink;
    RangeFetcher fetcher(client, sink, {});
    auto error = fetcher.fetch(kUrl, ByteRange{0, 9});

    REQUIRE(error.kind == DownloadErrorKind::RangeRequest);
    REQUIRE(error.httpStatus == 200);
    REQUIRE(error.expectedStatus == 206);
    REQUIRE(error.range == std::optional<ByteRange>(ByteRange{0, 9}));
    REQUIRE(error.message == "bad response code: 200 while reading bytes 0 through 9");
    // Nothing from the rejected response reaches the sink
    REQUIRE(sink.writes.empty());
}

TEST_CASE("an error status on a whole-resource fetch carries no span") {
    FakeHttpClient client;

    RecordingSink sink;
    RangeFetcher fetcher(client, sink, {});
    auto error = fetcher.fetch("http://files.test/gone", ByteRange::wholeResource());

    REQUIRE(error.kind == DownloadErrorKind::RangeRequest);
    REQUIRE(error.httpStatus == 404);
    REQUIRE(error.expectedStatus == 200);
    REQUIRE(error.message == "bad response code: 404");
    REQUIRE_FALSE(error.range.has_value());
}

TEST_CASE("a dropped connection mid-body is a transfer error") {
    FakeHttpClient client;
    client.serve(kUrl, makePayload(5000)).dropAfter = 1234;

    MemorySink sink;
    RangeFetcher fetcher(client, sink, {});
    auto error = fetcher.fetch(kUrl, ByteRange::wholeResource());

    REQUIRE(error.kind == DownloadErrorKind::Transfer);
    REQUIRE(error.message.find("read failed after 1234 bytes") == 0);
}

TEST_CASE("an unreachable server is a transfer error") {
    FakeHttpClient client;
    client.serve(kUrl, "x").unreachable = true;

    RecordingSink sink;
    auto error = RangeFetcher(client, sink, {}).fetch(kUrl, ByteRange{0, 0});
    REQUIRE(error.kind == DownloadErrorKind::Transfer);
    REQUIRE(error.message.find("request failed") == 0);
}

TEST_CASE("a failing sink is a storage error") {
    FakeHttpClient client;
    client.serve(kUrl, makePayload(100));

    BrokenSink sink;
    auto error = RangeFetcher(client, sink, {}).fetch(kUrl, ByteRange{0, 49});
    REQUIRE(error.kind == DownloadErrorKind::Storage);
    REQUIRE(error.message == "disk full");
}

TEST_CASE("a 206 body longer than the range stops at the range end") {
    FakeHttpClient client;
    const std::string body = makePayload(1000);
    client.serve(kUrl, body).bodyForRange["bytes=0-499"] = body;

    MemorySink sink(1000);
    RangeFetcher fetcher(client, sink, {});
    auto error = fetcher.fetch(kUrl, ByteRange{0, 499});

    REQUIRE(error.kind == DownloadErrorKind::Transfer);
    REQUIRE(error.message == "server sent more than bytes 0 through 499");
    REQUIRE(error.range == std::optional<ByteRange>(ByteRange{0, 499}));

    // The neighbouring span is left untouched and the buffer never grows
    REQUIRE(sink.size() == 1000);
    auto data = sink.release();
    REQUIRE(std::string(data.begin(), data.begin() + 500) == body.substr(0, 500));
    for (size_t i = 500; i < data.size(); ++i) {
        REQUIRE(data[i] == 0);
    }
}

TEST_CASE("a 206 body shorter than the range is a transfer error") {
    FakeHttpClient client;
    client.serve(kUrl, makePayload(1000)).bodyForRange["bytes=100-199"] = std::string(60, 'z');

    MemorySink sink(1000);
    RangeFetcher fetcher(client, sink, {});
    auto error = fetcher.fetch(kUrl, ByteRange{100, 199});

    REQUIRE(error.kind == DownloadErrorKind::Transfer);
    REQUIRE(error.message == "short body: 60 of 100 bytes while reading bytes 100 through 199");
}

TEST_CASE("a whole-resource fetch accepts any body length") {
    FakeHttpClient client;
    client.serve(kUrl, makePayload(12345));

    MemorySink sink;
    REQUIRE_FALSE(RangeFetcher(client, sink, {}).fetch(kUrl, ByteRange::wholeResource()).failed());
    REQUIRE(sink.size() == 12345);
}
