#include "s3_uploader/libs3_storage_client.hpp"
#include "s3_uploader/libs3_callbacks.hpp"
#include "s3_uploader/logging_category.hpp"
#include "s3_uploader/util.hpp"

// iRODS includes
#include <irods/rodsErrorTable.h>

// misc includes
#include <libs3.h>
#include <fmt/format.h>

// boost includes
#include <boost/algorithm/string/predicate.hpp>

// stdlib includes
#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

namespace s3_uploader
{
    namespace
    {
        int to_timeout_ms(unsigned int _seconds)
        {
            const std::uint64_t ms = static_cast<std::uint64_t>(_seconds) * 1000;
            return static_cast<int>(std::min<std::uint64_t>(ms, std::numeric_limits<int>::max()));
        }
    } // namespace

    libs3_storage_client::libs3_storage_client(const config& _config)
        : config_{_config}
        , initialized_{false}
    {
    }

    libs3_storage_client::~libs3_storage_client()
    {
        if (initialized_) {
            S3_deinitialize();
        }
    }

    irods::error libs3_storage_client::initialize()
    {
        if (initialized_) {
            return SUCCESS();
        }

        const libs3_types::status status = S3_initialize("s3", S3_INIT_ALL, config_.hostname.c_str());
        if (status != libs3_types::status_ok) {
            return ERROR(S3_INIT_ERROR,
                    fmt::format("Error initializing the S3 library. Status = {}. - \"{}\"", status, S3_get_status_name(status)));
        }

        initialized_ = true;

        logger::debug("{}:{} ({}) libs3 initialized [hostname={}]", __FILE__, __LINE__, __func__, config_.hostname);

        return SUCCESS();
    } // end initialize

    libs3_types::bucket_context libs3_storage_client::make_bucket_context(const std::string& _bucket_name) const
    {
        libs3_types::bucket_context bucket_context{};

        bucket_context.hostName        = config_.hostname.c_str();
        bucket_context.bucketName      = _bucket_name.c_str();
        bucket_context.accessKeyId     = config_.access_key.c_str();
        bucket_context.secretAccessKey = config_.secret_access_key.c_str();
        bucket_context.securityToken   = config_.session_token.empty() ? nullptr : config_.session_token.c_str();
        bucket_context.authRegion      = config_.region_name.c_str();

        if (boost::iequals(config_.s3_protocol_str, "http")) {
            bucket_context.protocol    = S3ProtocolHTTP;
        } else {
            bucket_context.protocol    = S3ProtocolHTTPS;
        }

        if (boost::iequals(config_.s3_sts_date_str, "amz")) {
            bucket_context.stsDate     = S3STSAmzOnly;
        } else if (boost::iequals(config_.s3_sts_date_str, "both")) {
            bucket_context.stsDate     = S3STSAmzAndDate;
        } else {
            bucket_context.stsDate     = S3STSDateOnly;
        }

        if (boost::iequals(config_.s3_uri_request_style, "virtual") ||
                boost::iequals(config_.s3_uri_request_style, "host") ||
                boost::iequals(config_.s3_uri_request_style, "virtualhost")) {

            bucket_context.uriStyle    = S3UriStyleVirtualHost;
        } else {
            bucket_context.uriStyle    = S3UriStylePath;
        }

        return bucket_context;
    } // end make_bucket_context

    irods::error libs3_storage_client::create_session(const std::string& _bucket_name,
                                                      const std::string& _object_key,
                                                      std::string& _upload_id)
    {
        if (!initialized_) {
            return ERROR(S3_INIT_ERROR, "The S3 library has not been initialized.");
        }

        libs3_types::bucket_context bucket_context = make_bucket_context(_bucket_name);
        print_bucket_context(bucket_context);

        upload_manager manager{bucket_context};

        S3PutProperties put_props{};
        put_props.md5 = nullptr;
        put_props.expires = -1;

        S3MultipartInitialHandler mpu_initial_handler
            = { { initialization_callback::on_response_properties,
                  initialization_callback::on_response_complete },
                initialization_callback::on_response };

        logger::debug("{}:{} ({}) call S3_initiate_multipart [bucket={}][object_key={}]",
                __FILE__, __LINE__, __func__, _bucket_name, _object_key);

        S3_initiate_multipart(&bucket_context, _object_key.c_str(), &put_props, &mpu_initial_handler,
                nullptr, to_timeout_ms(config_.non_data_transfer_timeout_seconds), &manager);

        if (manager.status != libs3_types::status_ok) {
            return ERROR(S3_INIT_ERROR,
                    fmt::format("Failed to create multipart upload for \"{}/{}\" - \"{}\"",
                        _bucket_name, _object_key, S3_get_status_name(manager.status)));
        }

        if (manager.upload_id.empty()) {
            return ERROR(S3_INIT_ERROR,
                    fmt::format("Failed to create multipart upload for \"{}/{}\" - no upload id returned",
                        _bucket_name, _object_key));
        }

        logger::debug("{}:{} ({}) S3_initiate_multipart returned.  Upload ID = {}",
                __FILE__, __LINE__, __func__, manager.upload_id);

        _upload_id = manager.upload_id;

        return SUCCESS();
    } // end create_session

    irods::error libs3_storage_client::upload_part(const std::string& _bucket_name,
                                                   const std::string& _object_key,
                                                   const std::string& _upload_id,
                                                   unsigned int _part_number,
                                                   const buffer_type& _payload,
                                                   std::string& _etag)
    {
        if (!initialized_) {
            return ERROR(S3_INIT_ERROR, "The S3 library has not been initialized.");
        }

        if (_payload.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            return ERROR(S3_PUT_ERROR,
                    fmt::format("Part {} is {} bytes which is larger than a single request can send.",
                        _part_number, _payload.size()));
        }

        libs3_types::bucket_context bucket_context = make_bucket_context(_bucket_name);

        data_for_write_callback data{bucket_context};
        data.buffer         = _payload.data();
        data.content_length = static_cast<std::int64_t>(_payload.size());
        data.part_number    = _part_number;

        S3PutObjectHandler put_object_handler = {
            {
                part_callback::on_response_properties,
                part_callback::on_response_completion
            },
            part_callback::on_response
        };

        S3PutProperties put_props{};
        put_props.md5 = nullptr;
        put_props.expires = -1;

        // server encrypt flag not valid for part upload
        put_props.useServerSideEncryption = false;

        logger::debug("{}:{} ({}) Multipart:  Start part {}, key \"{}\", uploadid \"{}\", len {}",
                __FILE__, __LINE__, __func__, _part_number, _object_key, _upload_id, data.content_length);

        S3_upload_part(&bucket_context, _object_key.c_str(), &put_props, &put_object_handler,
                static_cast<int>(_part_number), _upload_id.c_str(), static_cast<int>(data.content_length),
                nullptr, to_timeout_ms(config_.part_upload_timeout_seconds), &data);

        logger::debug("{}:{} ({}) S3_upload_part returned [part={}][status={}]",
                __FILE__, __LINE__, __func__, _part_number, S3_get_status_name(data.status));

        if (data.status != libs3_types::status_ok) {
            return ERROR(S3_PUT_ERROR,
                    fmt::format("part {} upload failed - \"{}\"", _part_number, S3_get_status_name(data.status)));
        }

        if (data.etag.empty()) {
            return ERROR(S3_PUT_ERROR, fmt::format("part {} upload failed - no ETag returned", _part_number));
        }

        _etag = data.etag;

        return SUCCESS();
    } // end upload_part

    irods::error libs3_storage_client::complete_session(const std::string& _bucket_name,
                                                        const std::string& _object_key,
                                                        const std::string& _upload_id,
                                                        const completion_manifest& _manifest)
    {
        if (!initialized_) {
            return ERROR(S3_INIT_ERROR, "The S3 library has not been initialized.");
        }

        if (irods::error ret = _manifest.validate(); !ret.ok()) {
            return PASS(ret);
        }

        libs3_types::bucket_context bucket_context = make_bucket_context(_bucket_name);

        upload_manager manager{bucket_context};
        manager.xml       = _manifest.to_xml();
        manager.remaining = static_cast<std::int64_t>(manager.xml.size());
        manager.offset    = 0;

        logger::debug("{}:{} ({}) Multipart:  Completing key \"{}\" Upload ID \"{}\"",
                __FILE__, __LINE__, __func__, _object_key, _upload_id);
        logger::debug("{}:{} ({}) [key={}] Request: {}", __FILE__, __LINE__, __func__, _object_key, manager.xml);

        S3MultipartCommitHandler commit_handler
            = { { commit_callback::on_response_properties,
                  commit_callback::on_response_completion },
                commit_callback::on_response, nullptr };

        S3_complete_multipart_upload(&bucket_context, _object_key.c_str(), &commit_handler, _upload_id.c_str(),
                static_cast<int>(manager.remaining), nullptr,
                to_timeout_ms(config_.non_data_transfer_timeout_seconds),   // timeout (ms)
                &manager);

        logger::debug("{}:{} ({}) [key={}][manager.status={}]",
                __FILE__, __LINE__, __func__, _object_key, S3_get_status_name(manager.status));

        if (manager.status != libs3_types::status_ok) {
            return ERROR(S3_PUT_ERROR,
                    fmt::format("Error completing the multipart upload of \"{}/{}\" - \"{}\"",
                        _bucket_name, _object_key, S3_get_status_name(manager.status)));
        }

        return SUCCESS();
    } // end complete_session

    irods::error libs3_storage_client::abort_session(const std::string& _bucket_name,
                                                     const std::string& _object_key,
                                                     const std::string& _upload_id)
    {
        if (!initialized_) {
            return ERROR(S3_INIT_ERROR, "The S3 library has not been initialized.");
        }

        libs3_types::bucket_context bucket_context = make_bucket_context(_bucket_name);

        S3AbortMultipartUploadHandler abort_handler
            = { { cancel_callback::on_response_properties,
                  cancel_callback::on_response_completion } };

        logger::debug("{}:{} ({}) Cancelling multipart upload: key=\"{}\", upload_id=\"{}\"",
                __FILE__, __LINE__, __func__, _object_key, _upload_id);

        cancel_callback::g_response_completion_status = libs3_types::status_ok;
        cancel_callback::g_response_completion_saved_bucket_context = &bucket_context;

        S3_abort_multipart_upload(&bucket_context, _object_key.c_str(), _upload_id.c_str(),
                to_timeout_ms(config_.non_data_transfer_timeout_seconds), &abort_handler);

        const libs3_types::status status = cancel_callback::g_response_completion_status;
        cancel_callback::g_response_completion_saved_bucket_context = nullptr;

        if (status != libs3_types::status_ok) {
            return ERROR(S3_PUT_ERROR,
                    fmt::format("Error cancelling the multipart upload of \"{}/{}\" - \"{}\"",
                        _bucket_name, _object_key, S3_get_status_name(status)));
        }

        return SUCCESS();
    } // end abort_session

} // namespace s3_uploader
