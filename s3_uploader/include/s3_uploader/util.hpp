#ifndef S3_UPLOADER_UTIL_HPP
#define S3_UPLOADER_UTIL_HPP

#include "s3_uploader/types.hpp"

#include <string>

namespace s3_uploader
{
    void print_bucket_context(const libs3_types::bucket_context& bucket_context);

    // Stores status in _status and logs the service's error details.  Anything
    // other than OK is logged as an error.
    void store_and_log_status(libs3_types::status status,
                              const libs3_types::error_details *error,
                              const std::string& function,
                              const libs3_types::bucket_context& saved_bucket_context,
                              libs3_types::status& _status);

} // namespace s3_uploader

#endif // S3_UPLOADER_UTIL_HPP
