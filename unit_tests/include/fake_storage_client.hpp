#ifndef S3_UPLOADER_UNIT_TESTS_FAKE_STORAGE_CLIENT_HPP
#define S3_UPLOADER_UNIT_TESTS_FAKE_STORAGE_CLIENT_HPP

#include "s3_uploader/completion_manifest.hpp"
#include "s3_uploader/storage_client.hpp"
#include "s3_uploader/types.hpp"

#include <irods/irods_error.hpp>
#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// In-memory storage_client that records every call.  Each operation can be
// told to fail.
class fake_storage_client : public s3_uploader::storage_client
{
public:

    irods::error create_session(const std::string& _bucket_name,
                                const std::string& _object_key,
                                std::string& _upload_id) override
    {
        ++create_calls;
        bucket_name = _bucket_name;
        object_key  = _object_key;

        if (fail_create) {
            return ERROR(S3_INIT_ERROR, "fake: access denied");
        }

        _upload_id = upload_id;
        return SUCCESS();
    }

    irods::error upload_part(const std::string& _bucket_name,
                             const std::string& _object_key,
                             const std::string& _upload_id,
                             unsigned int _part_number,
                             const s3_uploader::buffer_type& _payload,
                             std::string& _etag) override
    {
        attempted_parts.push_back(_part_number);
        part_upload_ids.push_back(_upload_id);

        if (_part_number == throw_on_part) {
            throw std::runtime_error{"fake: connection reset"};
        }

        if (_part_number == fail_on_part) {
            return ERROR(S3_PUT_ERROR, "fake: service unavailable");
        }

        part_sizes.push_back(static_cast<std::int64_t>(_payload.size()));
        received_bytes.append(_payload.data(), _payload.size());

        _etag = etag_for(_part_number);
        return SUCCESS();
    }

    irods::error complete_session(const std::string& _bucket_name,
                                  const std::string& _object_key,
                                  const std::string& _upload_id,
                                  const s3_uploader::completion_manifest& _manifest) override
    {
        ++complete_calls;
        completed_upload_id = _upload_id;
        completed_manifest  = _manifest;

        if (fail_complete) {
            return ERROR(S3_PUT_ERROR, "fake: InvalidPart");
        }

        return SUCCESS();
    }

    irods::error abort_session(const std::string& _bucket_name,
                               const std::string& _object_key,
                               const std::string& _upload_id) override
    {
        ++abort_calls;
        aborted_upload_id = _upload_id;

        if (throw_on_abort) {
            throw std::runtime_error{"fake: abort threw"};
        }

        if (fail_abort) {
            return ERROR(S3_PUT_ERROR, "fake: NoSuchUpload");
        }

        return SUCCESS();
    }

    static std::string etag_for(unsigned int _part_number)
    {
        return fmt::format("\"etag-{}\"", _part_number);
    }

    // behavior
    std::string  upload_id{"fake-upload-id"};
    bool         fail_create{false};
    unsigned int fail_on_part{0};
    bool         fail_complete{false};
    bool         fail_abort{false};
    unsigned int throw_on_part{0};
    bool         throw_on_abort{false};

    // recorded calls
    int                              create_calls{0};
    int                              complete_calls{0};
    int                              abort_calls{0};
    std::string                      bucket_name;
    std::string                      object_key;
    std::vector<unsigned int>        attempted_parts;
    std::vector<std::string>         part_upload_ids;
    std::vector<std::int64_t>        part_sizes;
    std::string                      received_bytes;
    std::string                      completed_upload_id;
    s3_uploader::completion_manifest completed_manifest;
    std::string                      aborted_upload_id;

}; // class fake_storage_client

#endif // S3_UPLOADER_UNIT_TESTS_FAKE_STORAGE_CLIENT_HPP
