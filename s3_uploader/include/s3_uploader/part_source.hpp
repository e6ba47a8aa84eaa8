#ifndef S3_UPLOADER_PART_SOURCE_HPP
#define S3_UPLOADER_PART_SOURCE_HPP

#include "s3_uploader/types.hpp"

#include <irods/irods_error.hpp>

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

namespace s3_uploader
{
    // Presents a local file as a sequence of chunks read front to back.
    // The file is closed when the object is destroyed, whatever path the
    // caller leaves on.
    class part_source
    {
    public:

        part_source() = default;

        part_source(const part_source&) = delete;
        auto operator=(const part_source&) -> part_source& = delete;

        ~part_source();

        irods::error open(const std::string& _path);

        // Reads up to _chunk_size bytes following the previous read.  On success
        // _chunk holds the bytes, or is empty once the file has been consumed.
        // Only the last chunk before end of stream may be shorter than _chunk_size.
        irods::error next(std::int64_t _chunk_size, std::optional<buffer_type>& _chunk);

        void close();

        bool is_open() const
        {
            return ifs_.is_open();
        }

        const std::string& path() const
        {
            return path_;
        }

        std::int64_t file_size() const
        {
            return file_size_;
        }

        std::int64_t offset() const
        {
            return offset_;
        }

    private:

        std::string   path_;
        std::ifstream ifs_;
        std::int64_t  file_size_{0};
        std::int64_t  offset_{0};

    }; // class part_source

} // namespace s3_uploader

#endif // S3_UPLOADER_PART_SOURCE_HPP
