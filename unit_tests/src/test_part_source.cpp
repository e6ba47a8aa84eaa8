#include <catch2/catch.hpp>

#include "s3_uploader/part_source.hpp"
#include "s3_uploader/types.hpp"
#include "s3_uploader/upload_request.hpp"
#include "temporary_file.hpp"

#include <irods/rodsErrorTable.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using s3_uploader::buffer_type;
using s3_uploader::part_source;

namespace
{
    constexpr std::int64_t KiB = 1024;
    constexpr std::int64_t MiB = 1024 * KiB;

    // reads the whole source, returning the size of every chunk
    std::vector<std::int64_t> read_all(part_source& _source, std::int64_t _chunk_size, std::string& _bytes)
    {
        std::vector<std::int64_t> sizes;
        while (true) {
            std::optional<buffer_type> chunk;
            const auto ret = _source.next(_chunk_size, chunk);
            REQUIRE(ret.ok());
            if (!chunk) {
                break;
            }
            sizes.push_back(static_cast<std::int64_t>(chunk->size()));
            _bytes.append(chunk->data(), chunk->size());
        }
        return sizes;
    }
} // namespace

TEST_CASE("part_source splits a file into ceil(S/C) chunks", "[part_source]")
{
    const std::int64_t chunk_size = 64 * KiB;

    const auto file_size = GENERATE(as<std::int64_t>{}, 1, 64 * 1024 - 1, 64 * 1024, 64 * 1024 + 1, 5 * 64 * 1024, 300 * 1024 + 17);

    temporary_file file{file_size};

    part_source source;
    REQUIRE(source.open(file.path()).ok());
    REQUIRE(source.file_size() == file_size);

    std::string bytes;
    const auto sizes = read_all(source, chunk_size, bytes);

    CHECK(sizes.size() == s3_uploader::expected_part_count(file_size, chunk_size));
    CHECK(source.offset() == file_size);

    // only the last chunk may be short, and no chunk is empty
    for (std::size_t i = 0; i + 1 < sizes.size(); ++i) {
        CHECK(sizes[i] == chunk_size);
    }
    REQUIRE_FALSE(sizes.empty());
    CHECK(sizes.back() > 0);
    CHECK(sizes.back() <= chunk_size);
}

TEST_CASE("part_source chunks reassemble the file byte for byte", "[part_source]")
{
    temporary_file file{std::int64_t{3 * MiB + 12345}};

    part_source source;
    REQUIRE(source.open(file.path()).ok());

    std::string bytes;
    const auto sizes = read_all(source, MiB, bytes);

    CHECK(sizes == std::vector<std::int64_t>{MiB, MiB, MiB, 12345});
    CHECK(bytes == file.contents());
}

TEST_CASE("part_source keeps reporting end of stream", "[part_source]")
{
    temporary_file file{std::int64_t{100}};

    part_source source;
    REQUIRE(source.open(file.path()).ok());

    std::optional<buffer_type> chunk;
    REQUIRE(source.next(MiB, chunk).ok());
    REQUIRE(chunk);
    CHECK(chunk->size() == 100);

    for (int i = 0; i < 3; ++i) {
        REQUIRE(source.next(MiB, chunk).ok());
        CHECK_FALSE(chunk);
    }
}

TEST_CASE("part_source on an empty file produces no chunks", "[part_source]")
{
    temporary_file file{std::int64_t{0}};

    part_source source;
    REQUIRE(source.open(file.path()).ok());
    CHECK(source.file_size() == 0);

    std::optional<buffer_type> chunk;
    REQUIRE(source.next(MiB, chunk).ok());
    CHECK_FALSE(chunk);
}

TEST_CASE("part_source errors", "[part_source][error]")
{
    part_source source;

    SECTION("missing file")
    {
        const auto ret = source.open("/this/path/does/not/exist/s3_uploader.bin");
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == UNIX_FILE_OPEN_ERR);
        CHECK_FALSE(source.is_open());
    }

    SECTION("a directory is not a source")
    {
        const auto ret = source.open(boost::filesystem::temp_directory_path().string());
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == UNIX_FILE_OPEN_ERR);
    }

    SECTION("reading before open")
    {
        std::optional<buffer_type> chunk;
        const auto ret = source.next(MiB, chunk);
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == UNIX_FILE_READ_ERR);
        CHECK_FALSE(chunk);
    }

    SECTION("non-positive chunk size")
    {
        temporary_file file{std::int64_t{10}};
        REQUIRE(source.open(file.path()).ok());

        std::optional<buffer_type> chunk;
        const auto ret = source.next(0, chunk);
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == SYS_INVALID_INPUT_PARAM);
    }

    SECTION("opening twice")
    {
        temporary_file file{std::int64_t{10}};
        REQUIRE(source.open(file.path()).ok());
        CHECK_FALSE(source.open(file.path()).ok());
    }
}

TEST_CASE("part_source close", "[part_source]")
{
    temporary_file file{std::int64_t{10}};

    part_source source;
    REQUIRE(source.open(file.path()).ok());
    REQUIRE(source.is_open());

    source.close();
    CHECK_FALSE(source.is_open());

    // closing again is harmless
    source.close();
    CHECK_FALSE(source.is_open());

    std::optional<buffer_type> chunk;
    CHECK_FALSE(source.next(MiB, chunk).ok());
}
