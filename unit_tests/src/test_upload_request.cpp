#include <catch2/catch.hpp>

#include "s3_uploader/types.hpp"
#include "s3_uploader/upload_request.hpp"

#include <irods/rodsErrorTable.h>

#include <cstdint>

using s3_uploader::upload_request;
namespace constants = s3_uploader::constants;

namespace
{
    constexpr std::int64_t MiB = 1024 * 1024;

    upload_request valid_request()
    {
        upload_request request;
        request.bucket_name = "bucket";
        request.object_key  = "path/to/object";
        request.file_path   = "/tmp/file.bin";
        return request;
    }
} // namespace

TEST_CASE("upload_request defaults", "[upload_request]")
{
    const upload_request request;
    CHECK(request.chunk_size == 15 * MiB);
    CHECK_FALSE(request.allow_empty_object);
}

TEST_CASE("validate_request", "[upload_request]")
{
    auto request = valid_request();

    SECTION("a complete request is valid")
    {
        CHECK(s3_uploader::validate_request(request).ok());
    }

    SECTION("the minimum chunk size is allowed")
    {
        request.chunk_size = 5 * MiB;
        CHECK(s3_uploader::validate_request(request).ok());
    }

    SECTION("missing bucket")
    {
        request.bucket_name.clear();
        const auto ret = s3_uploader::validate_request(request);
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == SYS_INVALID_INPUT_PARAM);
    }

    SECTION("missing key")
    {
        request.object_key.clear();
        CHECK_FALSE(s3_uploader::validate_request(request).ok());
    }

    SECTION("missing file")
    {
        request.file_path.clear();
        CHECK_FALSE(s3_uploader::validate_request(request).ok());
    }

    SECTION("chunk size below the minimum")
    {
        request.chunk_size = 5 * MiB - 1;
        const auto ret = s3_uploader::validate_request(request);
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == SYS_INVALID_INPUT_PARAM);
    }

    SECTION("chunk size above the maximum")
    {
        request.chunk_size = constants::MAXIMUM_PART_SIZE + 1;
        CHECK_FALSE(s3_uploader::validate_request(request).ok());
    }
}

TEST_CASE("expected_part_count", "[upload_request]")
{
    CHECK(s3_uploader::expected_part_count(0, 15 * MiB) == 0);
    CHECK(s3_uploader::expected_part_count(1, 15 * MiB) == 1);
    CHECK(s3_uploader::expected_part_count(15 * MiB, 15 * MiB) == 1);
    CHECK(s3_uploader::expected_part_count(15 * MiB + 1, 15 * MiB) == 2);
    CHECK(s3_uploader::expected_part_count(32 * MiB, 15 * MiB) == 3);
}

TEST_CASE("validate_part_count", "[upload_request]")
{
    auto request = valid_request();
    request.chunk_size = 5 * MiB;

    CHECK(s3_uploader::validate_part_count(request, 0).ok());
    CHECK(s3_uploader::validate_part_count(request, 10000 * 5 * MiB).ok());

    const auto ret = s3_uploader::validate_part_count(request, 10000 * 5 * MiB + 1);
    CHECK_FALSE(ret.ok());
    CHECK(ret.code() == SYS_INVALID_INPUT_PARAM);
}
