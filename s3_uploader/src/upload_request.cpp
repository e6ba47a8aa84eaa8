#include "s3_uploader/upload_request.hpp"

#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

namespace s3_uploader
{
    irods::error validate_request(const upload_request& _request)
    {
        if (_request.bucket_name.empty()) {
            return ERROR(SYS_INVALID_INPUT_PARAM, "A bucket name is required.");
        }

        if (_request.object_key.empty()) {
            return ERROR(SYS_INVALID_INPUT_PARAM, "An object key is required.");
        }

        if (_request.file_path.empty()) {
            return ERROR(SYS_INVALID_INPUT_PARAM, "A file path is required.");
        }

        if (_request.chunk_size < constants::MINIMUM_PART_SIZE) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("Chunk size {} is below the minimum part size of {} bytes.",
                        _request.chunk_size, constants::MINIMUM_PART_SIZE));
        }

        if (_request.chunk_size > constants::MAXIMUM_PART_SIZE) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("Chunk size {} is above the maximum part size of {} bytes.",
                        _request.chunk_size, constants::MAXIMUM_PART_SIZE));
        }

        return SUCCESS();
    } // end validate_request

    irods::error validate_part_count(const upload_request& _request, std::int64_t _file_size)
    {
        if (_request.chunk_size <= 0) {
            return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("Invalid chunk size {}.", _request.chunk_size));
        }

        const std::uint64_t part_count = expected_part_count(_file_size, _request.chunk_size);

        if (part_count > constants::MAXIMUM_NUMBER_OF_PARTS_PER_UPLOAD) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("A file of {} bytes needs {} parts of {} bytes; at most {} parts are allowed. "
                                "Use a larger chunk size.",
                        _file_size, part_count, _request.chunk_size,
                        constants::MAXIMUM_NUMBER_OF_PARTS_PER_UPLOAD));
        }

        return SUCCESS();
    } // end validate_part_count

    std::uint64_t expected_part_count(std::int64_t _file_size, std::int64_t _chunk_size)
    {
        if (_file_size <= 0 || _chunk_size <= 0) {
            return 0;
        }

        return static_cast<std::uint64_t>((_file_size + _chunk_size - 1) / _chunk_size);
    } // end expected_part_count

} // namespace s3_uploader
