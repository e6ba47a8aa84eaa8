#include "s3_uploader/upload_orchestrator.hpp"
#include "s3_uploader/logging_category.hpp"

// iRODS includes
#include <irods/irods_at_scope_exit.hpp>
#include <irods/rodsErrorTable.h>

// misc includes
#include <fmt/format.h>

// stdlib includes
#include <cstdio>
#include <exception>
#include <optional>
#include <utility>

namespace s3_uploader
{
    upload_orchestrator::upload_orchestrator(storage_client& _client, upload_request _request)
        : client_{_client}
        , request_{std::move(_request)}
        , session_{}
        , state_{upload_state::IDLE}
        , last_error_code_{error_codes::SUCCESS}
        , abort_error_{SUCCESS()}
        , cancel_requested_{false}
        , progress_callback_{}
        , session_callback_{}
        , parts_uploaded_{0}
        , bytes_uploaded_{0}
    {
        session_.bucket_name = request_.bucket_name;
        session_.object_key  = request_.object_key;
        session_.chunk_size  = request_.chunk_size;
    }

    irods::error upload_orchestrator::fail(error_codes _code, const irods::error& _error)
    {
        // the first failure is the one reported
        if (last_error_code_ == error_codes::SUCCESS) {
            last_error_code_ = _code;
        }

        if (!session_is_open() && state_ != upload_state::ABORTED && state_ != upload_state::COMPLETE_FAILED) {
            state_ = upload_state::FAILED;
        }

        logger::error("{}:{} ({}) {} failed [bucket={}][key={}][upload_id={}] - {}",
                __FILE__, __LINE__, __func__, to_string(_code), session_.bucket_name,
                session_.object_key, session_.upload_id, _error.user_result());

        return PASS(_error);
    } // end fail

    irods::error upload_orchestrator::run(part_source& _source)
    {
        if (state_ != upload_state::IDLE) {
            return ERROR(SYS_NOT_ALLOWED,
                    fmt::format("An upload has already been run [state={}].", to_string(state_)));
        }

        if (irods::error ret = validate_request(request_); !ret.ok()) {
            return fail(error_codes::CONFIG_ERROR, ret);
        }

        bool opened_here = false;
        if (!_source.is_open()) {
            if (irods::error ret = _source.open(request_.file_path); !ret.ok()) {
                return fail(error_codes::FILE_OPEN_ERROR, ret);
            }
            opened_here = true;
        }

        // A source opened by this run is released by this run.
        const irods::at_scope_exit close_source{[&_source, opened_here] {
            if (opened_here) {
                _source.close();
            }
        }};

        if (irods::error ret = validate_part_count(request_, _source.file_size()); !ret.ok()) {
            return fail(error_codes::CONFIG_ERROR, ret);
        }

        if (_source.file_size() == 0 && !request_.allow_empty_object) {
            return fail(error_codes::CONFIG_ERROR,
                    ERROR(SYS_INVALID_INPUT_PARAM,
                        fmt::format("Source \"{}\" is empty. Allow empty objects to upload it anyway.",
                            _source.path())));
        }

        if (cancel_requested()) {
            return fail(error_codes::UPLOAD_CANCELLED,
                    ERROR(SYS_NOT_ALLOWED, "Upload cancelled before the session was created."));
        }

        if (irods::error ret = initiate(); !ret.ok()) {
            return PASS(ret);
        }

        // Whatever path leaves this function, an open session does not outlive it.
        const irods::at_scope_exit abort_open_session{[this] {
            if (!session_is_open()) {
                return;
            }

            try {
                logger::warn("{}:{} ({}) leaving with an open session, aborting [upload_id={}]",
                        __FILE__, __LINE__, __func__, session_.upload_id);

                // a failure is kept in abort_error_
                abort();
            }
            catch (const std::exception& e) {
                // runs from a destructor, so nothing may escape
                state_ = upload_state::ABORTED;
                abort_error_ = ERROR(SYS_INTERNAL_ERR, e.what());

                std::fprintf(stderr, "%s:%d (%s) abort of upload %s threw: %s\n",
                        __FILE__, __LINE__, __func__, session_.upload_id.c_str(), e.what());
            }
        }};

        completion_manifest manifest;
        const irods::error outcome = run_part_loop(_source, manifest);

        return finalize(manifest, outcome);
    } // end run

    irods::error upload_orchestrator::initiate()
    {
        if (state_ != upload_state::IDLE) {
            return ERROR(SYS_NOT_ALLOWED,
                    fmt::format("Cannot create a session from state {}.", to_string(state_)));
        }

        logger::debug("{}:{} ({}) creating session [bucket={}][key={}]",
                __FILE__, __LINE__, __func__, session_.bucket_name, session_.object_key);

        std::string upload_id;
        if (irods::error ret = client_.create_session(session_.bucket_name, session_.object_key, upload_id); !ret.ok()) {
            return fail(error_codes::INITIATE_MULTIPART_UPLOAD_ERROR,
                    PASSMSG(fmt::format("create of \"{}/{}\" failed", session_.bucket_name, session_.object_key), ret));
        }

        session_.upload_id = std::move(upload_id);
        state_ = upload_state::SESSION_OPEN;

        logger::info("Upload ID: {} [bucket={}][key={}][chunk_size={}]",
                session_.upload_id, session_.bucket_name, session_.object_key, session_.chunk_size);

        if (session_callback_) {
            session_callback_(session_);
        }

        return SUCCESS();
    } // end initiate

    irods::error upload_orchestrator::run_part_loop(part_source& _source, completion_manifest& _manifest)
    {
        if (state_ != upload_state::SESSION_OPEN) {
            return ERROR(SYS_NOT_ALLOWED,
                    fmt::format("Cannot upload parts from state {}.", to_string(state_)));
        }

        unsigned int part_number = 1;

        while (true) {

            if (cancel_requested()) {
                return fail(error_codes::UPLOAD_CANCELLED,
                        ERROR(SYS_NOT_ALLOWED, fmt::format("Upload cancelled before part {}.", part_number)));
            }

            std::optional<buffer_type> chunk;
            if (irods::error ret = _source.next(session_.chunk_size, chunk); !ret.ok()) {
                return fail(error_codes::FILE_READ_ERROR,
                        PASSMSG(fmt::format("read of part {} failed", part_number), ret));
            }

            if (!chunk) {
                break;
            }

            const auto bytes = static_cast<std::int64_t>(chunk->size());

            std::string etag;
            if (irods::error ret = client_.upload_part(session_.bucket_name, session_.object_key,
                        session_.upload_id, part_number, *chunk, etag); !ret.ok()) {
                return fail(error_codes::UPLOAD_PART_ERROR,
                        PASSMSG(fmt::format("part {} upload failed", part_number), ret));
            }

            ++parts_uploaded_;
            bytes_uploaded_ += bytes;

            logger::info("Uploaded part {}, ETag: {} [bytes={}][upload_id={}]",
                    part_number, etag, bytes, session_.upload_id);

            if (progress_callback_) {
                progress_callback_(part_number, etag, bytes);
            }

            _manifest.add(part_number, std::move(etag));
            ++part_number;
        }

        state_ = upload_state::PARTS_COMPLETE;

        logger::debug("{}:{} ({}) all parts uploaded [parts={}][bytes={}]",
                __FILE__, __LINE__, __func__, parts_uploaded_, bytes_uploaded_);

        return SUCCESS();
    } // end run_part_loop

    irods::error upload_orchestrator::finalize(completion_manifest& _manifest, const irods::error& _outcome)
    {
        if (!_outcome.ok()) {
            _manifest.clear();

            // a failed abort is secondary, the caller gets the original failure
            abort();

            return PASS(_outcome);
        }

        if (state_ != upload_state::PARTS_COMPLETE) {
            return ERROR(SYS_NOT_ALLOWED,
                    fmt::format("Cannot complete the session from state {}.", to_string(state_)));
        }

        _manifest.sort();

        logger::debug("{}:{} ({}) completing [upload_id={}][parts={}]",
                __FILE__, __LINE__, __func__, session_.upload_id, _manifest.size());

        if (irods::error ret = client_.complete_session(session_.bucket_name, session_.object_key,
                    session_.upload_id, _manifest); !ret.ok()) {

            // The parts are stored on the service.  Leave the session open so
            // completion can be retried by hand.
            state_ = upload_state::COMPLETE_FAILED;

            logger::warn("Completion failed; the multipart upload is left open. [bucket={}][key={}][upload_id={}]",
                    session_.bucket_name, session_.object_key, session_.upload_id);

            return fail(error_codes::COMPLETE_MULTIPART_UPLOAD_ERROR,
                    PASSMSG(fmt::format("complete of upload {} failed", session_.upload_id), ret));
        }

        state_ = upload_state::DONE;

        logger::info("Upload completed [bucket={}][key={}][parts={}][bytes={}]",
                session_.bucket_name, session_.object_key, parts_uploaded_, bytes_uploaded_);

        return SUCCESS();
    } // end finalize

    irods::error upload_orchestrator::abort()
    {
        if (state_ == upload_state::ABORTED) {
            logger::debug("{}:{} ({}) already aborted [upload_id={}]",
                    __FILE__, __LINE__, __func__, session_.upload_id);
            return SUCCESS();
        }

        if (state_ == upload_state::DONE) {
            return ERROR(SYS_NOT_ALLOWED,
                    fmt::format("Upload {} has already been completed.", session_.upload_id));
        }

        if (session_.upload_id.empty()) {
            logger::debug("{}:{} ({}) no session to abort", __FILE__, __LINE__, __func__);
            return SUCCESS();
        }

        state_ = upload_state::ABORTING;

        logger::info("Aborting multipart upload [bucket={}][key={}][upload_id={}]",
                session_.bucket_name, session_.object_key, session_.upload_id);

        irods::error ret = client_.abort_session(session_.bucket_name, session_.object_key, session_.upload_id);

        // The attempt is not repeated; the session may have to be removed by hand.
        state_ = upload_state::ABORTED;

        if (!ret.ok()) {
            abort_error_ = ret;

            if (last_error_code_ == error_codes::SUCCESS) {
                last_error_code_ = error_codes::ABORT_MULTIPART_UPLOAD_ERROR;
            }

            logger::warn("Abort of multipart upload failed [bucket={}][key={}][upload_id={}] - {}",
                    session_.bucket_name, session_.object_key, session_.upload_id, ret.user_result());

            return PASS(ret);
        }

        return SUCCESS();
    } // end abort

} // namespace s3_uploader
