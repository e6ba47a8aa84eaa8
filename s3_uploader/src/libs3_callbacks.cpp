#include "s3_uploader/libs3_callbacks.hpp"
#include "s3_uploader/util.hpp"

#include <libs3.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace s3_uploader
{
    namespace initialization_callback
    {
        libs3_types::status on_response (const libs3_types::char_type* upload_id,
                                         void *callback_data)
        {
            upload_manager *manager = static_cast<upload_manager*>(callback_data);
            manager->upload_id = upload_id ? upload_id : "";
            return libs3_types::status_ok;
        } // end on_response

        libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                    void *callback_data)
        {
            return libs3_types::status_ok;
        } // end on_response_properties

        void on_response_complete (libs3_types::status status,
                                   const libs3_types::error_details *error,
                                   void *callback_data)
        {
            upload_manager *data = static_cast<upload_manager*>(callback_data);
            store_and_log_status(status, error, "initialization_callback::on_response_complete",
                    data->saved_bucket_context, data->status);
        } // end on_response_complete

    } // end namespace initialization_callback

    namespace part_callback
    {
        int on_response (int buffer_size,
                         libs3_types::buffer_type buffer,
                         void *callback_data)
        {
            data_for_write_callback *data = static_cast<data_for_write_callback*>(callback_data);

            // returning 0 ends the request body
            if (data->content_length <= data->bytes_written) {
                return 0;
            }

            const std::int64_t bytes_to_return =
                std::min<std::int64_t>(buffer_size, data->content_length - data->bytes_written);

            std::memcpy(buffer, data->buffer + data->bytes_written, bytes_to_return);
            data->bytes_written += bytes_to_return;

            return static_cast<int>(bytes_to_return);
        } // end on_response

        libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                    void *callback_data)
        {
            data_for_write_callback *data = static_cast<data_for_write_callback*>(callback_data);
            data->etag = properties->eTag ? properties->eTag : "";
            return libs3_types::status_ok;
        } // end on_response_properties

        void on_response_completion (libs3_types::status status,
                                     const libs3_types::error_details *error,
                                     void *callback_data)
        {
            data_for_write_callback *data = static_cast<data_for_write_callback*>(callback_data);
            store_and_log_status(status, error,
                    fmt::format("part_callback::on_response_completion [part={}]", data->part_number),
                    data->saved_bucket_context, data->status);
        } // end on_response_completion

    } // end namespace part_callback

    namespace commit_callback
    {
        int on_response (int buffer_size,
                         libs3_types::buffer_type buffer,
                         void *callback_data)
        {
            upload_manager *manager = static_cast<upload_manager*>(callback_data);
            std::int64_t ret = 0;
            if (manager->remaining) {
                const std::int64_t to_read_count = std::min<std::int64_t>(manager->remaining, buffer_size);
                std::memcpy(buffer, manager->xml.c_str() + manager->offset, to_read_count);
                ret = to_read_count;
            }
            manager->remaining -= ret;
            manager->offset += ret;

            return static_cast<int>(ret);
        } // end on_response

        libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                    void *callback_data)
        {
            return libs3_types::status_ok;
        } // end on_response_properties

        void on_response_completion (libs3_types::status status,
                                     const libs3_types::error_details *error,
                                     void *callback_data)
        {
            upload_manager *data = static_cast<upload_manager*>(callback_data);
            store_and_log_status(status, error, "commit_callback::on_response_completion",
                    data->saved_bucket_context, data->status);
        } // end on_response_completion

    } // end namespace commit_callback

    namespace cancel_callback
    {
        libs3_types::status g_response_completion_status = libs3_types::status_ok;
        libs3_types::bucket_context *g_response_completion_saved_bucket_context = nullptr;

        libs3_types::status on_response_properties (const libs3_types::response_properties *properties,
                                                    void *callback_data)
        {
            return libs3_types::status_ok;
        } // end on_response_properties

        void on_response_completion (libs3_types::status status,
                                     const libs3_types::error_details *error,
                                     void *callback_data)
        {
            store_and_log_status(status, error, "cancel_callback::on_response_completion",
                    *g_response_completion_saved_bucket_context, g_response_completion_status);
        } // end on_response_completion

    } // end namespace cancel_callback

} // namespace s3_uploader
