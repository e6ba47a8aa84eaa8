#include "s3_uploader/util.hpp"
#include "s3_uploader/logging_category.hpp"

#include <libs3.h>
#include <fmt/format.h>

#include <string>

namespace s3_uploader
{
    auto to_string(error_codes _code) -> const char*
    {
        switch (_code) {
            case error_codes::SUCCESS:                         return "success";
            case error_codes::CONFIG_ERROR:                    return "configuration";
            case error_codes::FILE_OPEN_ERROR:                 return "open";
            case error_codes::FILE_READ_ERROR:                 return "read";
            case error_codes::INITIATE_MULTIPART_UPLOAD_ERROR: return "create";
            case error_codes::UPLOAD_PART_ERROR:               return "upload";
            case error_codes::COMPLETE_MULTIPART_UPLOAD_ERROR: return "complete";
            case error_codes::ABORT_MULTIPART_UPLOAD_ERROR:    return "abort";
            case error_codes::UPLOAD_CANCELLED:                return "cancelled";
        }
        return "unknown";
    } // end to_string

    auto to_string(upload_state _state) -> const char*
    {
        switch (_state) {
            case upload_state::IDLE:            return "idle";
            case upload_state::SESSION_OPEN:    return "session_open";
            case upload_state::PARTS_COMPLETE:  return "parts_complete";
            case upload_state::ABORTING:        return "aborting";
            case upload_state::ABORTED:         return "aborted";
            case upload_state::DONE:            return "done";
            case upload_state::COMPLETE_FAILED: return "complete_failed";
            case upload_state::FAILED:          return "failed";
        }
        return "unknown";
    } // end to_string

    void print_bucket_context(const libs3_types::bucket_context& bucket_context)
    {
        // never log the secret
        logger::debug("BucketContext: [hostName={}] [bucketName={}][protocol={}]"
                      "[uriStyle={}][accessKeyId={}][secretAccessKey={}]"
                      "[securityToken={}][stsDate={}][region={}]",
                      bucket_context.hostName == nullptr ? "" : bucket_context.hostName,
                      bucket_context.bucketName == nullptr ? "" : bucket_context.bucketName,
                      bucket_context.protocol,
                      bucket_context.uriStyle,
                      bucket_context.accessKeyId == nullptr ? "" : bucket_context.accessKeyId,
                      bucket_context.secretAccessKey == nullptr ? "" : "********",
                      bucket_context.securityToken == nullptr ? "" : "********",
                      bucket_context.stsDate,
                      bucket_context.authRegion == nullptr ? "" : bucket_context.authRegion);
    } // end print_bucket_context

    void store_and_log_status(libs3_types::status status,
                              const libs3_types::error_details *error,
                              const std::string& function,
                              const libs3_types::bucket_context& saved_bucket_context,
                              libs3_types::status& _status)
    {
        _status = status;

        const bool failed = status != libs3_types::status_ok;

        const auto log_message = [failed](const std::string& _msg) {
            if (failed) {
                logger::error(_msg);
            }
            else {
                logger::debug(_msg);
            }
        };

        log_message(fmt::format("  S3Status: [{}] - {}", S3_get_status_name(status), status));

        if (saved_bucket_context.hostName) {
            log_message(fmt::format("  S3Host: {}", saved_bucket_context.hostName));
        }

        log_message(fmt::format("  Function: {}", function));

        if (error) {
            if (error->message) {
                log_message(fmt::format("  Message: {}", error->message));
            }
            if (error->resource) {
                log_message(fmt::format("  Resource: {}", error->resource));
            }
            if (error->furtherDetails) {
                log_message(fmt::format("  Further Details: {}", error->furtherDetails));
            }
            if (error->extraDetailsCount) {
                log_message("  Extra Details:");
                for (int i = 0; i < error->extraDetailsCount; i++) {
                    log_message(fmt::format("    {}: {}", error->extraDetails[i].name, error->extraDetails[i].value));
                }
            }
        }
    } // end store_and_log_status

} // namespace s3_uploader
