#ifndef S3_UPLOADER_LIBS3_CALLBACKS_HPP
#define S3_UPLOADER_LIBS3_CALLBACKS_HPP

#include "s3_uploader/types.hpp"

#include <cstdint>
#include <string>

namespace s3_uploader
{
    // Callback data for the initiate and commit requests.
    struct upload_manager
    {
        explicit upload_manager(libs3_types::bucket_context& _saved_bucket_context)
            : saved_bucket_context{_saved_bucket_context}
            , xml{""}
            , remaining{0}
            , offset{0}
            , status{libs3_types::status_ok}
            , upload_id{""}
        {
        }

        libs3_types::bucket_context& saved_bucket_context;   // To enable more detailed error messages

        /* Below used for the upload completion command, need to send in XML */
        std::string              xml;

        std::int64_t             remaining;
        std::int64_t             offset;
        libs3_types::status      status;                 // status returned by libs3
        std::string              upload_id;              // filled in by the initiate response
    };

    // Callback data for one part upload.  The payload is borrowed from the caller.
    struct data_for_write_callback
    {
        explicit data_for_write_callback(libs3_types::bucket_context& _saved_bucket_context)
            : buffer{nullptr}
            , content_length{0}
            , bytes_written{0}
            , status{libs3_types::status_ok}
            , part_number{0}
            , etag{""}
            , saved_bucket_context{_saved_bucket_context}
        {}

        const libs3_types::char_type* buffer;
        std::int64_t                  content_length;
        std::int64_t                  bytes_written;
        libs3_types::status           status;
        unsigned int                  part_number;
        std::string                   etag;

        libs3_types::bucket_context&  saved_bucket_context;   // To enable more detailed error messages
    };

    namespace initialization_callback
    {
        libs3_types::status on_response (const libs3_types::char_type* upload_id,
                                         void *callback_data);

        libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                    void *callback_data);

        void on_response_complete (libs3_types::status status,
                                   const libs3_types::error_details *error,
                                   void *callback_data);
    } // end namespace initialization_callback

    // Streams one part from memory and keeps the ETag of the response.
    namespace part_callback
    {
        int on_response (int buffer_size,
                         libs3_types::buffer_type buffer,
                         void *callback_data);

        libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                    void *callback_data);

        void on_response_completion (libs3_types::status status,
                                     const libs3_types::error_details *error,
                                     void *callback_data);
    } // end namespace part_callback

    /* Uploading the multipart completion XML from our buffer */
    namespace commit_callback
    {
        int on_response (int buffer_size,
                         libs3_types::buffer_type buffer,
                         void *callback_data);

        libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                    void *callback_data);

        void on_response_completion (libs3_types::status status,
                                     const libs3_types::error_details *error,
                                     void *callback_data);
    } // end namespace commit_callback

    namespace cancel_callback
    {
        libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                    void *callback_data);

        // S3_abort_multipart_upload() does not allow a callback_data parameter, so pass the
        // final operation status using this global.

        extern libs3_types::status g_response_completion_status;
        extern libs3_types::bucket_context *g_response_completion_saved_bucket_context;

        void on_response_completion (libs3_types::status status,
                                     const libs3_types::error_details *error,
                                     void *callback_data);
    } // end namespace cancel_callback

} // namespace s3_uploader

#endif // S3_UPLOADER_LIBS3_CALLBACKS_HPP
