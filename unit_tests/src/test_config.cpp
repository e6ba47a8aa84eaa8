#include <catch2/catch.hpp>

#include "s3_uploader/config.hpp"
#include "temporary_file.hpp"

#include <irods/rodsErrorTable.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

using s3_uploader::config;

namespace
{
    // Clears the variables the config reads and restores them afterwards.
    class environment_guard
    {
    public:

        environment_guard()
        {
            for (const auto* name : names_) {
                const char* value = std::getenv(name);
                saved_.emplace_back(value ? std::optional<std::string>{value} : std::nullopt);
                ::unsetenv(name);
            }
        }

        environment_guard(const environment_guard&) = delete;
        auto operator=(const environment_guard&) -> environment_guard& = delete;

        ~environment_guard()
        {
            for (std::size_t i = 0; i < names_.size(); ++i) {
                if (saved_[i]) {
                    ::setenv(names_[i], saved_[i]->c_str(), 1);
                }
                else {
                    ::unsetenv(names_[i]);
                }
            }
        }

        void set(const std::string& _name, const std::string& _value)
        {
            ::setenv(_name.c_str(), _value.c_str(), 1);
        }

    private:

        const std::vector<const char*> names_{
            "S3_DEFAULT_HOSTNAME", "S3_REGIONNAME", "S3_PROTO", "S3_STSDATE", "S3_URI_REQUEST_STYLE",
            "S3_AUTH_FILE", "S3_ACCESS_KEY_ID", "S3_SECRET_ACCESS_KEY", "AWS_ACCESS_KEY_ID",
            "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN"};

        std::vector<std::optional<std::string>> saved_;

    }; // class environment_guard
} // namespace

TEST_CASE("config defaults", "[config]")
{
    const config cfg;

    CHECK(cfg.hostname == "s3.amazonaws.com");
    CHECK(cfg.region_name == "us-east-1");
    CHECK(cfg.s3_protocol_str == "https");
    CHECK(cfg.s3_sts_date_str == "amz");
    CHECK(cfg.s3_uri_request_style == "path");
    CHECK(cfg.access_key.empty());
    CHECK(cfg.secret_access_key.empty());
    CHECK(cfg.part_upload_timeout_seconds == 120);
    CHECK(cfg.non_data_transfer_timeout_seconds == 300);
}

TEST_CASE("load_config_file", "[config]")
{
    config cfg;

    SECTION("present keys are applied, others keep their defaults")
    {
        temporary_file file{std::string{R"({
            "hostname": "minio.example.org:9000",
            "protocol": "http",
            "uri_request_style": "virtual",
            "part_upload_timeout_seconds": 30,
            "some_unknown_key": true
        })"}};

        REQUIRE(s3_uploader::load_config_file(file.path(), cfg).ok());

        CHECK(cfg.hostname == "minio.example.org:9000");
        CHECK(cfg.s3_protocol_str == "http");
        CHECK(cfg.s3_uri_request_style == "virtual");
        CHECK(cfg.part_upload_timeout_seconds == 30);
        CHECK(cfg.region_name == "us-east-1");
        CHECK(cfg.non_data_transfer_timeout_seconds == 300);
    }

    SECTION("missing file")
    {
        const auto ret = s3_uploader::load_config_file("/this/path/does/not/exist.json", cfg);
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == SYS_CONFIG_FILE_ERR);
    }

    SECTION("malformed JSON")
    {
        temporary_file file{std::string{"{ \"hostname\": "}};
        const auto ret = s3_uploader::load_config_file(file.path(), cfg);
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == SYS_CONFIG_FILE_ERR);
    }

    SECTION("not an object")
    {
        temporary_file file{std::string{"[1, 2, 3]"}};
        CHECK_FALSE(s3_uploader::load_config_file(file.path(), cfg).ok());
    }

    SECTION("wrong value type")
    {
        temporary_file file{std::string{R"({"part_upload_timeout_seconds": "soon"})"}};
        const auto ret = s3_uploader::load_config_file(file.path(), cfg);
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == SYS_CONFIG_FILE_ERR);
    }
}

TEST_CASE("load_config_file rejects timeouts libs3 cannot take", "[config]")
{
    config cfg;

    const auto body = GENERATE(as<std::string>{},
        R"({"part_upload_timeout_seconds": -1})",
        R"({"part_upload_timeout_seconds": 0})",
        R"({"non_data_transfer_timeout_seconds": 2147484})",
        R"({"non_data_transfer_timeout_seconds": 4294967296})",
        R"({"part_upload_timeout_seconds": 1.5})");

    temporary_file file{body};

    const auto ret = s3_uploader::load_config_file(file.path(), cfg);
    CHECK_FALSE(ret.ok());
    CHECK(ret.code() == SYS_CONFIG_FILE_ERR);
    CHECK(cfg.part_upload_timeout_seconds == 120);
    CHECK(cfg.non_data_transfer_timeout_seconds == 300);
}

TEST_CASE("load_config_file accepts the largest timeout", "[config]")
{
    config cfg;
    temporary_file file{std::string{R"({"non_data_transfer_timeout_seconds": 2147483})"}};

    REQUIRE(s3_uploader::load_config_file(file.path(), cfg).ok());
    CHECK(cfg.non_data_transfer_timeout_seconds == 2147483);
}

TEST_CASE("apply_environment overrides the config", "[config]")
{
    environment_guard env;
    env.set("S3_DEFAULT_HOSTNAME", "localhost:9000");
    env.set("S3_REGIONNAME", "eu-west-1");
    env.set("S3_PROTO", "HTTP");

    config cfg;
    cfg.s3_uri_request_style = "virtual";

    s3_uploader::apply_environment(cfg);

    CHECK(cfg.hostname == "localhost:9000");
    CHECK(cfg.region_name == "eu-west-1");
    CHECK(cfg.s3_protocol_str == "HTTP");

    // unset variables leave the value alone
    CHECK(cfg.s3_uri_request_style == "virtual");
    CHECK(cfg.s3_sts_date_str == "amz");
}

TEST_CASE("read_auth_file", "[config]")
{
    std::string access_key;
    std::string secret_access_key;

    SECTION("two keys, blank lines and whitespace ignored")
    {
        temporary_file file{std::string{"\n  AKIAEXAMPLE  \n\nwJalrXUtnFEMI/K7MDENG\n"}};
        REQUIRE(s3_uploader::read_auth_file(file.path(), access_key, secret_access_key).ok());
        CHECK(access_key == "AKIAEXAMPLE");
        CHECK(secret_access_key == "wJalrXUtnFEMI/K7MDENG");
    }

    SECTION("only one key")
    {
        temporary_file file{std::string{"AKIAEXAMPLE\n"}};
        const auto ret = s3_uploader::read_auth_file(file.path(), access_key, secret_access_key);
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == SYS_CONFIG_FILE_ERR);
    }

    SECTION("missing file")
    {
        CHECK_FALSE(s3_uploader::read_auth_file("/this/path/does/not/exist.keypair", access_key, secret_access_key).ok());
    }
}

TEST_CASE("resolve_credentials", "[config]")
{
    environment_guard env;
    temporary_file auth_file{std::string{"FILE_KEY\nFILE_SECRET\n"}};

    config cfg;
    cfg.auth_file = auth_file.path();

    SECTION("S3 variables come first")
    {
        env.set("S3_ACCESS_KEY_ID", "S3_KEY");
        env.set("S3_SECRET_ACCESS_KEY", "S3_SECRET");
        env.set("AWS_ACCESS_KEY_ID", "AWS_KEY");
        env.set("AWS_SECRET_ACCESS_KEY", "AWS_SECRET");

        REQUIRE(s3_uploader::resolve_credentials(cfg).ok());
        CHECK(cfg.access_key == "S3_KEY");
        CHECK(cfg.secret_access_key == "S3_SECRET");
        CHECK(cfg.session_token.empty());
    }

    SECTION("then the AWS variables with the session token")
    {
        env.set("AWS_ACCESS_KEY_ID", "AWS_KEY");
        env.set("AWS_SECRET_ACCESS_KEY", "AWS_SECRET");
        env.set("AWS_SESSION_TOKEN", "TOKEN");

        REQUIRE(s3_uploader::resolve_credentials(cfg).ok());
        CHECK(cfg.access_key == "AWS_KEY");
        CHECK(cfg.secret_access_key == "AWS_SECRET");
        CHECK(cfg.session_token == "TOKEN");
    }

    SECTION("a lone S3 key id is not enough")
    {
        env.set("S3_ACCESS_KEY_ID", "S3_KEY");

        REQUIRE(s3_uploader::resolve_credentials(cfg).ok());
        CHECK(cfg.access_key == "FILE_KEY");
        CHECK(cfg.secret_access_key == "FILE_SECRET");
    }

    SECTION("then the auth file")
    {
        REQUIRE(s3_uploader::resolve_credentials(cfg).ok());
        CHECK(cfg.access_key == "FILE_KEY");
        CHECK(cfg.secret_access_key == "FILE_SECRET");
    }

    SECTION("credentials already in the config are kept")
    {
        env.set("S3_ACCESS_KEY_ID", "S3_KEY");
        env.set("S3_SECRET_ACCESS_KEY", "S3_SECRET");
        cfg.access_key = "CONFIG_KEY";
        cfg.secret_access_key = "CONFIG_SECRET";

        REQUIRE(s3_uploader::resolve_credentials(cfg).ok());
        CHECK(cfg.access_key == "CONFIG_KEY");
    }

    SECTION("nothing found")
    {
        cfg.auth_file.clear();

        const auto ret = s3_uploader::resolve_credentials(cfg);
        CHECK_FALSE(ret.ok());
        CHECK(ret.code() == SYS_CONFIG_FILE_ERR);
    }
}
