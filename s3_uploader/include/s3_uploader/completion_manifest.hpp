#ifndef S3_UPLOADER_COMPLETION_MANIFEST_HPP
#define S3_UPLOADER_COMPLETION_MANIFEST_HPP

#include <irods/irods_error.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace s3_uploader
{
    // What outlives an uploaded part: its number and the service's ETag.
    struct completed_part
    {
        unsigned int part_number;
        std::string  etag;
    };

    class completion_manifest
    {
    public:

        using container_type = std::vector<completed_part>;
        using const_iterator = container_type::const_iterator;

        void add(unsigned int _part_number, std::string _etag);

        // Orders the parts by ascending part number.
        void sort();

        // Succeeds when the parts are sorted and numbered 1..N without gaps or
        // duplicates and every part has an ETag.
        irods::error validate() const;

        // Body of the CompleteMultipartUpload request.
        std::string to_xml() const;

        void clear()
        {
            parts_.clear();
        }

        bool empty() const
        {
            return parts_.empty();
        }

        std::size_t size() const
        {
            return parts_.size();
        }

        const container_type& parts() const
        {
            return parts_;
        }

        const_iterator begin() const
        {
            return parts_.begin();
        }

        const_iterator end() const
        {
            return parts_.end();
        }

    private:

        container_type parts_;

    }; // class completion_manifest

} // namespace s3_uploader

#endif // S3_UPLOADER_COMPLETION_MANIFEST_HPP
