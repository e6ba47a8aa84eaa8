#include <catch2/catch.hpp>

#include "s3_uploader/completion_manifest.hpp"
#include "s3_uploader/libs3_callbacks.hpp"
#include "s3_uploader/types.hpp"

#include <libs3.h>

#include <cstdint>
#include <string>
#include <vector>

using s3_uploader::libs3_types;

namespace
{
    // Drains a request body callback the way libs3 does, _buffer_size bytes at a time.
    template <typename Callback>
    std::string drain(Callback _callback, void* _callback_data, int _buffer_size, std::vector<int>& _counts)
    {
        std::string out;
        std::vector<char> buffer(static_cast<std::size_t>(_buffer_size));

        // bounded so a callback that never ends fails the test instead of hanging
        for (int i = 0; i < 1000; ++i) {
            const int count = _callback(_buffer_size, buffer.data(), _callback_data);
            _counts.push_back(count);
            if (count <= 0) {
                break;
            }
            out.append(buffer.data(), static_cast<std::size_t>(count));
        }

        return out;
    }
} // namespace

TEST_CASE("part_callback streams the payload", "[libs3_callbacks]")
{
    libs3_types::bucket_context bucket_context{};

    std::string payload;
    for (int i = 0; i < 10000; ++i) {
        payload.push_back(static_cast<char>((i * 7) & 0xff));
    }

    s3_uploader::data_for_write_callback data{bucket_context};
    data.buffer         = payload.data();
    data.content_length = static_cast<std::int64_t>(payload.size());
    data.part_number    = 4;

    std::vector<int> counts;
    const auto sent = drain(s3_uploader::part_callback::on_response, &data, 4096, counts);

    CHECK(sent == payload);
    CHECK(counts == std::vector<int>{4096, 4096, 1808, 0});
    CHECK(data.bytes_written == 10000);

    // nothing left to send
    std::vector<char> buffer(16);
    CHECK(s3_uploader::part_callback::on_response(16, buffer.data(), &data) == 0);
}

TEST_CASE("part_callback with a buffer larger than the payload", "[libs3_callbacks]")
{
    libs3_types::bucket_context bucket_context{};

    const std::string payload = "0123456789";

    s3_uploader::data_for_write_callback data{bucket_context};
    data.buffer         = payload.data();
    data.content_length = static_cast<std::int64_t>(payload.size());

    std::vector<int> counts;
    CHECK(drain(s3_uploader::part_callback::on_response, &data, 64, counts) == payload);
    CHECK(counts == std::vector<int>{10, 0});
}

TEST_CASE("part_callback keeps the ETag", "[libs3_callbacks]")
{
    libs3_types::bucket_context bucket_context{};
    s3_uploader::data_for_write_callback data{bucket_context};

    libs3_types::response_properties properties{};

    SECTION("present")
    {
        properties.eTag = "\"9b2cf535f27731c974343645a3985328\"";
        CHECK(s3_uploader::part_callback::on_response_properties(&properties, &data) == libs3_types::status_ok);
        CHECK(data.etag == "\"9b2cf535f27731c974343645a3985328\"");
    }

    SECTION("missing")
    {
        data.etag = "stale";
        properties.eTag = nullptr;
        CHECK(s3_uploader::part_callback::on_response_properties(&properties, &data) == libs3_types::status_ok);
        CHECK(data.etag.empty());
    }
}

TEST_CASE("part_callback stores the completion status", "[libs3_callbacks]")
{
    libs3_types::bucket_context bucket_context{};
    s3_uploader::data_for_write_callback data{bucket_context};
    data.part_number = 2;

    s3_uploader::part_callback::on_response_completion(S3StatusErrorNoSuchUpload, nullptr, &data);
    CHECK(data.status == S3StatusErrorNoSuchUpload);

    s3_uploader::part_callback::on_response_completion(S3StatusOK, nullptr, &data);
    CHECK(data.status == libs3_types::status_ok);
}

TEST_CASE("commit_callback streams the completion body", "[libs3_callbacks]")
{
    libs3_types::bucket_context bucket_context{};

    s3_uploader::completion_manifest manifest;
    for (unsigned int part_number = 1; part_number <= 20; ++part_number) {
        manifest.add(part_number, "\"0123456789abcdef0123456789abcdef\"");
    }

    s3_uploader::upload_manager manager{bucket_context};
    manager.xml       = manifest.to_xml();
    manager.remaining = static_cast<std::int64_t>(manager.xml.size());
    manager.offset    = 0;

    const int buffer_size = 100;
    REQUIRE(manager.xml.size() > 3 * buffer_size);

    std::vector<int> counts;
    const auto sent = drain(s3_uploader::commit_callback::on_response, &manager, buffer_size, counts);

    CHECK(sent == manager.xml);
    CHECK(manager.remaining == 0);
    CHECK(manager.offset == static_cast<std::int64_t>(manager.xml.size()));

    REQUIRE(counts.size() >= 2);
    CHECK(counts.back() == 0);
    for (std::size_t i = 0; i + 2 < counts.size(); ++i) {
        CHECK(counts[i] == buffer_size);
    }

    std::vector<char> buffer(16);
    CHECK(s3_uploader::commit_callback::on_response(16, buffer.data(), &manager) == 0);
}

TEST_CASE("initialization_callback keeps the upload id", "[libs3_callbacks]")
{
    libs3_types::bucket_context bucket_context{};
    s3_uploader::upload_manager manager{bucket_context};

    CHECK(s3_uploader::initialization_callback::on_response("VXBsb2FkIElE", &manager) == libs3_types::status_ok);
    CHECK(manager.upload_id == "VXBsb2FkIElE");

    CHECK(s3_uploader::initialization_callback::on_response(nullptr, &manager) == libs3_types::status_ok);
    CHECK(manager.upload_id.empty());

    s3_uploader::initialization_callback::on_response_complete(S3StatusErrorAccessDenied, nullptr, &manager);
    CHECK(manager.status == S3StatusErrorAccessDenied);
}

TEST_CASE("cancel_callback reports through the globals", "[libs3_callbacks]")
{
    libs3_types::bucket_context bucket_context{};

    s3_uploader::cancel_callback::g_response_completion_status = libs3_types::status_ok;
    s3_uploader::cancel_callback::g_response_completion_saved_bucket_context = &bucket_context;

    s3_uploader::cancel_callback::on_response_completion(S3StatusErrorNoSuchUpload, nullptr, nullptr);
    CHECK(s3_uploader::cancel_callback::g_response_completion_status == S3StatusErrorNoSuchUpload);

    s3_uploader::cancel_callback::g_response_completion_saved_bucket_context = nullptr;
    s3_uploader::cancel_callback::g_response_completion_status = libs3_types::status_ok;
}
