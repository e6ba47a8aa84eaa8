#ifndef S3_UPLOADER_CONFIG_HPP
#define S3_UPLOADER_CONFIG_HPP

#include <irods/irods_error.hpp>

#include <string>

namespace s3_uploader
{
    extern const std::string s3_default_hostname;
    extern const std::string s3_region_name;
    extern const std::string s3_proto;
    extern const std::string s3_stsdate;
    extern const std::string s3_uri_request_style;
    extern const std::string s3_auth_file;
    extern const std::string s3_key_id;
    extern const std::string s3_access_key;
    extern const std::string aws_key_id;
    extern const std::string aws_access_key;
    extern const std::string aws_session_token;

    struct config
    {

        config()
            : hostname{"s3.amazonaws.com"}
            , region_name{"us-east-1"}
            , access_key{""}
            , secret_access_key{""}
            , session_token{""}
            , s3_protocol_str{"https"}
            , s3_sts_date_str{"amz"}
            , s3_uri_request_style{"path"}
            , auth_file{""}
            , part_upload_timeout_seconds{120}
            , non_data_transfer_timeout_seconds{300}
        {}

        std::string  hostname;
        std::string  region_name;
        std::string  access_key;
        std::string  secret_access_key;
        std::string  session_token;
        std::string  s3_protocol_str;        // "http" or "https"
        std::string  s3_sts_date_str;        // "amz", "date" or "both"
        std::string  s3_uri_request_style;   // "path" or "virtual" - default "path"
        std::string  auth_file;
        unsigned int part_upload_timeout_seconds;
        unsigned int non_data_transfer_timeout_seconds;
    };

    // Overlays the keys present in a JSON config file onto _config.
    irods::error load_config_file(const std::string& _filename, config& _config);

    // Overlays S3_DEFAULT_HOSTNAME, S3_REGIONNAME, S3_PROTO, S3_STSDATE,
    // S3_URI_REQUEST_STYLE and S3_AUTH_FILE when they are set.
    void apply_environment(config& _config);

    // Reads a two line auth file: access key id, then secret access key.
    irods::error read_auth_file(const std::string& _filename,
                                std::string& _access_key,
                                std::string& _secret_access_key);

    /// @brief Fills in the credentials from the environment or, failing that, from
    ///        the auth file.  Credentials already present in _config are kept.
    irods::error resolve_credentials(config& _config);

} // namespace s3_uploader

#endif // S3_UPLOADER_CONFIG_HPP
