#include <catch2/catch.hpp>

#include "temp_dir.hpp"
#include "core/downloader/FileSink.hpp"
#include "core/downloader/MemorySink.hpp"

#include <thread>
#include <vector>

using namespace fastget::core::downloader;
using fastget::test::TempDir;
using fastget::test::readFile;
using fastget::test::writeFile;

TEST_CASE("memory sink is pre-sized to a known length") {
    MemorySink sink(10);
    REQUIRE(sink.size() == 10);

    std::string err;
    REQUIRE(sink.writeAt(5, "world", 5, err));
    REQUIRE(sink.writeAt(0, "hello", 5, err));

    auto data = sink.release();
    REQUIRE(std::string(data.begin(), data.end()) == "helloworld");
}

TEST_CASE("memory sink grows to exactly the end of a write") {
    MemorySink sink(0, 16);
    REQUIRE(sink.size() == 0);

    std::string err;
    REQUIRE(sink.writeAt(0, "abc", 3, err));
    REQUIRE(sink.size() == 3);

    REQUIRE(sink.writeAt(10, "xyz", 3, err));
    REQUIRE(sink.size() == 13);

    auto data = sink.release();
    REQUIRE(data.size() == 13);
    REQUIRE(data[3] == 0);
    REQUIRE(std::string(data.begin() + 10, data.end()) == "xyz");
}

TEST_CASE("memory sink takes an empty write without growing") {
    MemorySink sink;
    std::string err;
    REQUIRE(sink.writeAt(100, "", 0, err));
    REQUIRE(sink.size() == 0);
}

TEST_CASE("memory sink survives concurrent growth from disjoint writers") {
    constexpr size_t kWriters = 8;
    constexpr size_t kSpan = 4096;
    constexpr size_t kChunk = 128;

    MemorySink sink(0, 0);
    std::vector<std::thread> threads;
    std::vector<int> failures(kWriters, 0);

    for (size_t w = 0; w < kWriters; ++w) {
        threads.emplace_back([&, w] {
            std::string chunk(kChunk, static_cast<char>('a' + w));
            std::string err;
            // Write back to front so every writer keeps forcing growth
            for (size_t off = kSpan; off >= kChunk; off -= kChunk) {
                if (!sink.writeAt(w * kSpan + off - kChunk, chunk.data(), chunk.size(), err)) {
                    ++failures[w];
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    for (int f : failures) REQUIRE(f == 0);
    auto data = sink.release();
    REQUIRE(data.size() == kWriters * kSpan);
    for (size_t i = 0; i < data.size(); ++i) {
        REQUIRE(data[i] == static_cast<uint8_t>('a' + i / kSpan));
    }
}

TEST_CASE("file sink creates missing parent directories") {
    TempDir tmp;
    auto target = tmp.path() / "a" / "b" / "out.bin";

    FileSink sink;
    std::string err;
    REQUIRE(sink.open(target, err));
    REQUIRE(sink.isOpen());
    REQUIRE(sink.writeAt(3, "def", 3, err));
    REQUIRE(sink.writeAt(0, "abc", 3, err));
    REQUIRE(sink.size() == 6);
    REQUIRE(sink.close(err));

    REQUIRE(readFile(target) == "abcdef");
}

TEST_CASE("file sink truncates an existing file") {
    TempDir tmp;
    auto target = tmp.path() / "out.txt";
    writeFile(target, "a much longer previous content");

    FileSink sink;
    std::string err;
    REQUIRE(sink.open(target, err));
    REQUIRE(sink.writeAt(0, "new", 3, err));
    REQUIRE(sink.close(err));

    REQUIRE(readFile(target) == "new");
}

TEST_CASE("file sink reports open and write failures") {
    TempDir tmp;
    writeFile(tmp.path() / "blocker", "file, not a directory");

    FileSink sink;
    std::string err;
    REQUIRE_FALSE(sink.open(tmp.path() / "blocker" / "out.bin", err));
    REQUIRE_FALSE(err.empty());

    err.clear();
    REQUIRE_FALSE(sink.writeAt(0, "x", 1, err));
    REQUIRE_FALSE(err.empty());
}
