#ifndef S3_UPLOADER_UPLOAD_REQUEST_HPP
#define S3_UPLOADER_UPLOAD_REQUEST_HPP

#include "s3_uploader/types.hpp"

#include <irods/irods_error.hpp>

#include <cstdint>
#include <string>

namespace s3_uploader
{
    // What the operator asked for.  Checked before anything is opened.
    struct upload_request
    {
        std::string  bucket_name;
        std::string  object_key;
        std::string  file_path;
        std::int64_t chunk_size{constants::DEFAULT_CHUNK_SIZE};

        // create an empty object instead of rejecting an empty file
        bool         allow_empty_object{false};
    };

    irods::error validate_request(const upload_request& _request);

    // Fails when the file would need more parts than a single upload allows.
    irods::error validate_part_count(const upload_request& _request, std::int64_t _file_size);

    // ceil(_file_size / _chunk_size), 0 for an empty file
    std::uint64_t expected_part_count(std::int64_t _file_size, std::int64_t _chunk_size);

} // namespace s3_uploader

#endif // S3_UPLOADER_UPLOAD_REQUEST_HPP
