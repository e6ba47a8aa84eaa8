#ifndef S3_UPLOADER_TYPES_HPP
#define S3_UPLOADER_TYPES_HPP

#include <libs3.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace s3_uploader
{

    struct libs3_types
    {
        using status = S3Status;
        const static status status_ok = status::S3StatusOK;
        using bucket_context = S3BucketContext;
        using char_type   = char;
        using buffer_type = char_type*;
        using error_details = S3ErrorDetails;
        using response_properties = S3ResponseProperties;
    };

    // bytes of one part, owned by the loop iteration that reads it
    using buffer_type = std::vector<libs3_types::char_type>;

    namespace constants
    {
        inline constexpr std::int64_t DEFAULT_CHUNK_SIZE                = 15 * 1024 * 1024;
        inline constexpr std::int64_t MINIMUM_PART_SIZE                 = 5 * 1024 * 1024;
        // S3 allows 5 GiB but S3_upload_part takes the part length as an int
        inline constexpr std::int64_t MAXIMUM_PART_SIZE                 = std::numeric_limits<int>::max();
        inline constexpr std::uint64_t MAXIMUM_NUMBER_OF_PARTS_PER_UPLOAD = 10000;
        // libs3 takes request timeouts in milliseconds as an int
        inline constexpr std::int64_t MAXIMUM_TIMEOUT_SECONDS           = std::numeric_limits<int>::max() / 1000;
    } // namespace constants

    // the phase that failed, independent of the iRODS error code
    enum class error_codes
    {
        SUCCESS,
        CONFIG_ERROR,
        FILE_OPEN_ERROR,
        FILE_READ_ERROR,
        INITIATE_MULTIPART_UPLOAD_ERROR,
        UPLOAD_PART_ERROR,
        COMPLETE_MULTIPART_UPLOAD_ERROR,
        ABORT_MULTIPART_UPLOAD_ERROR,
        UPLOAD_CANCELLED
    };

    enum class upload_state
    {
        IDLE,
        SESSION_OPEN,
        PARTS_COMPLETE,
        ABORTING,
        ABORTED,
        DONE,
        COMPLETE_FAILED,
        FAILED
    };

    struct upload_session
    {
        std::string  upload_id;
        std::string  bucket_name;
        std::string  object_key;
        std::int64_t chunk_size{constants::DEFAULT_CHUNK_SIZE};
    };

    auto to_string(error_codes _code) -> const char*;
    auto to_string(upload_state _state) -> const char*;

} // namespace s3_uploader

#endif // S3_UPLOADER_TYPES_HPP
