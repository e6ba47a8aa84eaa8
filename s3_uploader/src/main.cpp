#include "s3_uploader/config.hpp"
#include "s3_uploader/libs3_storage_client.hpp"
#include "s3_uploader/logging_category.hpp"
#include "s3_uploader/part_source.hpp"
#include "s3_uploader/types.hpp"
#include "s3_uploader/upload_orchestrator.hpp"
#include "s3_uploader/upload_request.hpp"

// iRODS includes
#include <irods/irods_error.hpp>

// misc includes
#include <fmt/format.h>

// boost includes
#include <boost/program_options.hpp>

// stdlib includes
#include <atomic>
#include <csignal>
#include <cstdint>
#include <exception>
#include <sstream>
#include <string>

namespace po = boost::program_options;

namespace
{
    constexpr int exit_success      = 0;
    constexpr int exit_upload_error = 1;
    constexpr int exit_config_error = 2;

    std::atomic<s3_uploader::upload_orchestrator*> g_orchestrator{nullptr};

    void handle_termination_signal(int)
    {
        if (auto* orchestrator = g_orchestrator.load(); orchestrator) {
            orchestrator->request_cancel();
        }
    }

    auto print_usage(const po::options_description& _opts_desc) -> void
    {
        fmt::print(R"_(s3_multipart_upload - Uploads one local file to S3 as a multipart upload

Usage: s3_multipart_upload --bucket BUCKET --key KEY --file PATH [OPTION]...

The file is sent in parts of --chunk-size bytes, one part at a time, and the
parts are committed as a single object. If any part fails the upload is
aborted. If the final commit fails the upload is left open and its upload id
is reported so the commit can be retried.

Credentials are taken from S3_ACCESS_KEY_ID and S3_SECRET_ACCESS_KEY, then
AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY, then the auth file.

Exit status is 0 on success, 1 if the upload failed and 2 for invalid input
or configuration.

)_");

        std::ostringstream out;
        out << _opts_desc;
        fmt::print("{}\n", out.str());
    } // print_usage

    auto exit_code_for(s3_uploader::error_codes _code) -> int
    {
        return _code == s3_uploader::error_codes::CONFIG_ERROR ? exit_config_error : exit_upload_error;
    } // exit_code_for

} // anonymous namespace

auto main(int _argc, char* _argv[]) -> int
{
    using namespace s3_uploader;

    po::options_description opts_desc{"Options"};

    std::int64_t chunk_size = constants::DEFAULT_CHUNK_SIZE;

    // clang-format off
    opts_desc.add_options()
        ("bucket,b", po::value<std::string>(), "Target bucket (required).")
        ("key,k", po::value<std::string>(), "Target object key (required).")
        ("file,f", po::value<std::string>(), "Local file to upload (required).")
        ("chunk-size,c", po::value<std::int64_t>(&chunk_size),
            fmt::format("Bytes per part. At least {}. Default {}.",
                constants::MINIMUM_PART_SIZE, constants::DEFAULT_CHUNK_SIZE).c_str())
        ("config-file", po::value<std::string>(), "JSON file with connection settings.")
        ("auth-file", po::value<std::string>(), "Two line file holding the access key id and the secret access key.")
        ("hostname", po::value<std::string>(), "S3 endpoint. Default s3.amazonaws.com.")
        ("region", po::value<std::string>(), "Signing region. Default us-east-1.")
        ("protocol", po::value<std::string>(), "http or https. Default https.")
        ("uri-style", po::value<std::string>(), "path or virtual. Default path.")
        ("allow-empty", "Create an empty object when the file is empty instead of failing.")
        ("verbose,v", "Log libs3 requests and responses.")
        ("help,h", "Display this help message and exit.");
    // clang-format on

    po::variables_map vm;

    try {
        po::store(po::command_line_parser(_argc, _argv).options(opts_desc).run(), vm);
        po::notify(vm);
    }
    catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return exit_config_error;
    }

    if (vm.count("help") > 0) {
        print_usage(opts_desc);
        return exit_success;
    }

    if (vm.count("verbose") > 0) {
        logger::set_level(s3_uploader::log::level::debug);
    }

    upload_request request;
    request.chunk_size = chunk_size;
    request.allow_empty_object = vm.count("allow-empty") > 0;

    if (vm.count("bucket") > 0) {
        request.bucket_name = vm["bucket"].as<std::string>();
    }
    if (vm.count("key") > 0) {
        request.object_key = vm["key"].as<std::string>();
    }
    if (vm.count("file") > 0) {
        request.file_path = vm["file"].as<std::string>();
    }

    if (irods::error ret = validate_request(request); !ret.ok()) {
        fmt::print(stderr, "Error: configuration: {}\n", ret.user_result());
        fmt::print(stderr, "Run with --help for usage.\n");
        return exit_config_error;
    }

    // defaults, then the config file, then the environment, then the command line
    config cfg;

    if (vm.count("config-file") > 0) {
        if (irods::error ret = load_config_file(vm["config-file"].as<std::string>(), cfg); !ret.ok()) {
            fmt::print(stderr, "Error: configuration: {}\n", ret.user_result());
            return exit_config_error;
        }
    }

    apply_environment(cfg);

    if (vm.count("auth-file") > 0) {
        cfg.auth_file = vm["auth-file"].as<std::string>();
    }
    if (vm.count("hostname") > 0) {
        cfg.hostname = vm["hostname"].as<std::string>();
    }
    if (vm.count("region") > 0) {
        cfg.region_name = vm["region"].as<std::string>();
    }
    if (vm.count("protocol") > 0) {
        cfg.s3_protocol_str = vm["protocol"].as<std::string>();
    }
    if (vm.count("uri-style") > 0) {
        cfg.s3_uri_request_style = vm["uri-style"].as<std::string>();
    }

    if (irods::error ret = resolve_credentials(cfg); !ret.ok()) {
        fmt::print(stderr, "Error: configuration: {}\n", ret.user_result());
        return exit_config_error;
    }

    libs3_storage_client client{cfg};

    if (irods::error ret = client.initialize(); !ret.ok()) {
        fmt::print(stderr, "Error: {}\n", ret.user_result());
        return exit_upload_error;
    }

    upload_orchestrator orchestrator{client, request};

    orchestrator.set_session_callback([](const upload_session& _session) {
        fmt::print("Upload ID: {}\n", _session.upload_id);
    });

    orchestrator.set_progress_callback([](unsigned int _part_number, const std::string& _etag, std::int64_t) {
        fmt::print("Uploaded part {}, ETag: {}\n", _part_number, _etag);
    });

    g_orchestrator.store(&orchestrator);
    std::signal(SIGINT, handle_termination_signal);
    std::signal(SIGTERM, handle_termination_signal);

    part_source source;
    const irods::error ret = orchestrator.run(source);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_orchestrator.store(nullptr);

    if (!ret.ok()) {
        fmt::print(stderr, "Error ({}): {}\n", to_string(orchestrator.last_error_code()), ret.result());

        if (!orchestrator.abort_error().ok()) {
            fmt::print(stderr, "Warning: abort of upload {} also failed: {}\n",
                    orchestrator.session().upload_id, orchestrator.abort_error().user_result());
        }

        if (orchestrator.state() == upload_state::COMPLETE_FAILED) {
            fmt::print(stderr, "Upload {} was left open; its {} parts are still stored.\n",
                    orchestrator.session().upload_id, orchestrator.parts_uploaded());
        }

        return exit_code_for(orchestrator.last_error_code());
    }

    fmt::print("Upload completed successfully!\n");

    return exit_success;
} // main
