#ifndef S3_UPLOADER_LIBS3_STORAGE_CLIENT_HPP
#define S3_UPLOADER_LIBS3_STORAGE_CLIENT_HPP

#include "s3_uploader/config.hpp"
#include "s3_uploader/storage_client.hpp"
#include "s3_uploader/types.hpp"

#include <irods/irods_error.hpp>

#include <string>

namespace s3_uploader
{
    // storage_client backed by libs3.  Requests are synchronous and are not
    // retried.
    class libs3_storage_client : public storage_client
    {
    public:

        explicit libs3_storage_client(const config& _config);

        libs3_storage_client(const libs3_storage_client&) = delete;
        auto operator=(const libs3_storage_client&) -> libs3_storage_client& = delete;

        ~libs3_storage_client() override;

        // Must succeed before any other call.
        irods::error initialize();

        irods::error create_session(const std::string& _bucket_name,
                                    const std::string& _object_key,
                                    std::string& _upload_id) override;

        irods::error upload_part(const std::string& _bucket_name,
                                 const std::string& _object_key,
                                 const std::string& _upload_id,
                                 unsigned int _part_number,
                                 const buffer_type& _payload,
                                 std::string& _etag) override;

        irods::error complete_session(const std::string& _bucket_name,
                                      const std::string& _object_key,
                                      const std::string& _upload_id,
                                      const completion_manifest& _manifest) override;

        irods::error abort_session(const std::string& _bucket_name,
                                   const std::string& _object_key,
                                   const std::string& _upload_id) override;

    private:

        libs3_types::bucket_context make_bucket_context(const std::string& _bucket_name) const;

        const config config_;
        bool         initialized_;

    }; // class libs3_storage_client

} // namespace s3_uploader

#endif // S3_UPLOADER_LIBS3_STORAGE_CLIENT_HPP
