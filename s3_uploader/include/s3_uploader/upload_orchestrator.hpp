#ifndef S3_UPLOADER_UPLOAD_ORCHESTRATOR_HPP
#define S3_UPLOADER_UPLOAD_ORCHESTRATOR_HPP

#include "s3_uploader/completion_manifest.hpp"
#include "s3_uploader/part_source.hpp"
#include "s3_uploader/storage_client.hpp"
#include "s3_uploader/types.hpp"
#include "s3_uploader/upload_request.hpp"

#include <irods/irods_error.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace s3_uploader
{
    /// @brief Runs one multipart upload from start to finish.
    ///
    /// Parts are read and uploaded one at a time, numbered from 1.  The first
    /// failure stops the loop and aborts the session.  A failed completion leaves
    /// the session open so the uploaded parts are not lost.
    ///
    /// An orchestrator is good for a single run.
    class upload_orchestrator
    {
    public:

        using progress_callback = std::function<void(unsigned int _part_number,
                                                     const std::string& _etag,
                                                     std::int64_t _bytes)>;

        using session_callback  = std::function<void(const upload_session& _session)>;

        upload_orchestrator(storage_client& _client, upload_request _request);

        upload_orchestrator(const upload_orchestrator&) = delete;
        auto operator=(const upload_orchestrator&) -> upload_orchestrator& = delete;

        /// @brief Uploads the file named by the request.
        ///
        /// Opens _source on the request's file path unless it is already open.
        /// Returns the primary error of a failed run; an error from the abort that
        /// followed is available from abort_error().
        irods::error run(part_source& _source);

        irods::error initiate();

        // Uploads every chunk _source has left and records it in _manifest.
        irods::error run_part_loop(part_source& _source, completion_manifest& _manifest);

        // Completes the session when _outcome is a success, otherwise aborts it
        // and returns _outcome.
        irods::error finalize(completion_manifest& _manifest, const irods::error& _outcome);

        // Aborts the open session.  Once aborted, later calls do nothing.
        irods::error abort();

        // May be called from a signal handler.  Takes effect before the next part.
        void request_cancel() noexcept
        {
            cancel_requested_.store(true);
        }

        bool cancel_requested() const noexcept
        {
            return cancel_requested_.load();
        }

        void set_progress_callback(progress_callback _callback)
        {
            progress_callback_ = std::move(_callback);
        }

        // Called once the service has issued the upload id.
        void set_session_callback(session_callback _callback)
        {
            session_callback_ = std::move(_callback);
        }

        upload_state state() const noexcept
        {
            return state_;
        }

        error_codes last_error_code() const noexcept
        {
            return last_error_code_;
        }

        const irods::error& abort_error() const noexcept
        {
            return abort_error_;
        }

        const upload_session& session() const noexcept
        {
            return session_;
        }

        const upload_request& request() const noexcept
        {
            return request_;
        }

        std::uint64_t parts_uploaded() const noexcept
        {
            return parts_uploaded_;
        }

        std::int64_t bytes_uploaded() const noexcept
        {
            return bytes_uploaded_;
        }

    private:

        irods::error fail(error_codes _code, const irods::error& _error);

        bool session_is_open() const noexcept
        {
            return state_ == upload_state::SESSION_OPEN || state_ == upload_state::PARTS_COMPLETE;
        }

        storage_client&    client_;
        upload_request     request_;
        upload_session     session_;
        upload_state       state_;
        error_codes        last_error_code_;
        irods::error       abort_error_;
        std::atomic<bool>  cancel_requested_;
        progress_callback  progress_callback_;
        session_callback   session_callback_;
        std::uint64_t      parts_uploaded_;
        std::int64_t       bytes_uploaded_;

    }; // class upload_orchestrator

} // namespace s3_uploader

#endif // S3_UPLOADER_UPLOAD_ORCHESTRATOR_HPP
