#ifndef S3_UPLOADER_STORAGE_CLIENT_HPP
#define S3_UPLOADER_STORAGE_CLIENT_HPP

#include "s3_uploader/completion_manifest.hpp"
#include "s3_uploader/types.hpp"

#include <irods/irods_error.hpp>

#include <string>

namespace s3_uploader
{
    // The four multipart calls the orchestrator needs from the object store.
    class storage_client
    {
    public:

        virtual ~storage_client() = default;

        virtual irods::error create_session(const std::string& _bucket_name,
                                            const std::string& _object_key,
                                            std::string& _upload_id) = 0;

        virtual irods::error upload_part(const std::string& _bucket_name,
                                         const std::string& _object_key,
                                         const std::string& _upload_id,
                                         unsigned int _part_number,
                                         const buffer_type& _payload,
                                         std::string& _etag) = 0;

        virtual irods::error complete_session(const std::string& _bucket_name,
                                              const std::string& _object_key,
                                              const std::string& _upload_id,
                                              const completion_manifest& _manifest) = 0;

        // Safe to call on a session that is already aborted or completed; the
        // service may answer with an error in that case.
        virtual irods::error abort_session(const std::string& _bucket_name,
                                           const std::string& _object_key,
                                           const std::string& _upload_id) = 0;

    }; // class storage_client

} // namespace s3_uploader

#endif // S3_UPLOADER_STORAGE_CLIENT_HPP
