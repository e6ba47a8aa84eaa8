#include "s3_uploader/config.hpp"
#include "s3_uploader/logging_category.hpp"
#include "s3_uploader/types.hpp"

// iRODS includes
#include <irods/rodsErrorTable.h>

// misc includes
#include <nlohmann/json.hpp>
#include <fmt/format.h>

// boost includes
#include <boost/algorithm/string.hpp>

// stdlib includes
#include <cerrno>
#include <cstdlib>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

namespace s3_uploader
{
    const std::string s3_default_hostname{"S3_DEFAULT_HOSTNAME"};
    const std::string s3_region_name{"S3_REGIONNAME"};
    const std::string s3_proto{"S3_PROTO"};
    const std::string s3_stsdate{"S3_STSDATE"};
    const std::string s3_uri_request_style{"S3_URI_REQUEST_STYLE"};   // either "path" or "virtual" - default "path"
    const std::string s3_auth_file{"S3_AUTH_FILE"};
    const std::string s3_key_id{"S3_ACCESS_KEY_ID"};
    const std::string s3_access_key{"S3_SECRET_ACCESS_KEY"};
    const std::string aws_key_id{"AWS_ACCESS_KEY_ID"};
    const std::string aws_access_key{"AWS_SECRET_ACCESS_KEY"};
    const std::string aws_session_token{"AWS_SESSION_TOKEN"};

    namespace
    {
        bool get_env(const std::string& _name, std::string& _value)
        {
            const char* tmp_ptr = std::getenv(_name.c_str());
            if (tmp_ptr == nullptr || *tmp_ptr == '\0') {
                return false;
            }
            _value = tmp_ptr;
            return true;
        }

        template <typename T>
        void set_if_present(const nlohmann::json& _json, const char* _key, T& _value)
        {
            if (const auto iter = _json.find(_key); iter != _json.end()) {
                _value = iter->template get<T>();
            }
        }

        // Timeouts are whole seconds in [1, MAXIMUM_TIMEOUT_SECONDS].
        irods::error set_timeout_if_present(const nlohmann::json& _json, const char* _key, unsigned int& _value)
        {
            const auto iter = _json.find(_key);
            if (iter == _json.end()) {
                return SUCCESS();
            }

            if (!iter->is_number_integer()) {
                return ERROR(SYS_CONFIG_FILE_ERR, fmt::format("\"{}\" must be an integer.", _key));
            }

            const auto seconds = iter->get<std::int64_t>();
            if (seconds < 1 || seconds > constants::MAXIMUM_TIMEOUT_SECONDS) {
                return ERROR(SYS_CONFIG_FILE_ERR,
                        fmt::format("\"{}\" is {}; it must be between 1 and {} seconds.",
                            _key, seconds, constants::MAXIMUM_TIMEOUT_SECONDS));
            }

            _value = static_cast<unsigned int>(seconds);
            return SUCCESS();
        }
    } // namespace

    irods::error load_config_file(const std::string& _filename, config& _config)
    {
        std::ifstream ifs{_filename};
        if (!ifs) {
            return ERROR(SYS_CONFIG_FILE_ERR,
                    fmt::format("Failed to open config file: \"{}\", errno = \"{}\".", _filename, std::strerror(errno)));
        }

        try {
            const auto json = nlohmann::json::parse(ifs);

            if (!json.is_object()) {
                return ERROR(SYS_CONFIG_FILE_ERR,
                        fmt::format("Config file \"{}\" must hold a JSON object.", _filename));
            }

            set_if_present(json, "hostname", _config.hostname);
            set_if_present(json, "region_name", _config.region_name);
            set_if_present(json, "protocol", _config.s3_protocol_str);
            set_if_present(json, "sts_date", _config.s3_sts_date_str);
            set_if_present(json, "uri_request_style", _config.s3_uri_request_style);
            set_if_present(json, "auth_file", _config.auth_file);
            set_if_present(json, "access_key_id", _config.access_key);
            set_if_present(json, "secret_access_key", _config.secret_access_key);
            set_if_present(json, "session_token", _config.session_token);

            if (irods::error ret = set_timeout_if_present(json, "part_upload_timeout_seconds",
                        _config.part_upload_timeout_seconds); !ret.ok()) {
                return PASS(ret);
            }

            if (irods::error ret = set_timeout_if_present(json, "non_data_transfer_timeout_seconds",
                        _config.non_data_transfer_timeout_seconds); !ret.ok()) {
                return PASS(ret);
            }
        }
        catch (const nlohmann::json::exception& e) {
            return ERROR(SYS_CONFIG_FILE_ERR,
                    fmt::format("Failed to parse config file \"{}\": {}", _filename, e.what()));
        }

        logger::debug("{}:{} ({}) loaded config file [{}]", __FILE__, __LINE__, __func__, _filename);

        return SUCCESS();
    } // end load_config_file

    void apply_environment(config& _config)
    {
        get_env(s3_default_hostname, _config.hostname);
        get_env(s3_region_name, _config.region_name);
        get_env(s3_proto, _config.s3_protocol_str);
        get_env(s3_stsdate, _config.s3_sts_date_str);
        get_env(s3_uri_request_style, _config.s3_uri_request_style);
        get_env(s3_auth_file, _config.auth_file);
    } // end apply_environment

    irods::error read_auth_file(const std::string& _filename,
                                std::string& _access_key,
                                std::string& _secret_access_key)
    {
        std::ifstream key_ifs{_filename};
        if (!key_ifs) {
            return ERROR(SYS_CONFIG_FILE_ERR,
                    fmt::format("Failed to open S3 auth file: \"{}\", errno = \"{}\".", _filename, std::strerror(errno)));
        }

        std::vector<std::string> keys;
        std::string line;
        while (keys.size() < 2 && std::getline(key_ifs, line)) {
            boost::algorithm::trim(line);
            if (!line.empty()) {
                keys.push_back(line);
            }
        }

        if (keys.size() != 2) {
            return ERROR(SYS_CONFIG_FILE_ERR,
                    fmt::format("Read {} lines in the auth file \"{}\". Expected 2.", keys.size(), _filename));
        }

        _access_key = keys[0];
        _secret_access_key = keys[1];

        return SUCCESS();
    } // end read_auth_file

    irods::error resolve_credentials(config& _config)
    {
        if (!_config.access_key.empty() && !_config.secret_access_key.empty()) {
            return SUCCESS();
        }

        std::string key_id;
        std::string access_key;

        if (get_env(s3_key_id, key_id) && get_env(s3_access_key, access_key)) {
            logger::debug("{}:{} ({}) using credentials from {}", __FILE__, __LINE__, __func__, s3_key_id);
        }
        else if (get_env(aws_key_id, key_id) && get_env(aws_access_key, access_key)) {
            logger::debug("{}:{} ({}) using credentials from {}", __FILE__, __LINE__, __func__, aws_key_id);
            get_env(aws_session_token, _config.session_token);
        }
        else if (!_config.auth_file.empty()) {
            irods::error ret = read_auth_file(_config.auth_file, key_id, access_key);
            if (!ret.ok()) {
                return PASS(ret);
            }
            logger::debug("{}:{} ({}) using credentials from auth file [{}]", __FILE__, __LINE__, __func__, _config.auth_file);
        }
        else {
            return ERROR(SYS_CONFIG_FILE_ERR,
                    fmt::format("No S3 credentials found. Set {} and {}, or provide an auth file.", s3_key_id, s3_access_key));
        }

        _config.access_key = key_id;
        _config.secret_access_key = access_key;

        return SUCCESS();
    } // end resolve_credentials

} // namespace s3_uploader
