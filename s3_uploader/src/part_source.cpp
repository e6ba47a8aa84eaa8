#include "s3_uploader/part_source.hpp"
#include "s3_uploader/logging_category.hpp"

// iRODS includes
#include <irods/rodsErrorTable.h>

// misc includes
#include <fmt/format.h>

// boost includes
#include <boost/filesystem.hpp>

// stdlib includes
#include <cerrno>
#include <cstring>
#include <new>

namespace s3_uploader
{
    part_source::~part_source()
    {
        close();
    }

    irods::error part_source::open(const std::string& _path)
    {
        namespace fs = boost::filesystem;

        if (is_open()) {
            return ERROR(UNIX_FILE_OPEN_ERR, fmt::format("Source \"{}\" is already open.", path_));
        }

        boost::system::error_code ec;
        if (!fs::is_regular_file(_path, ec)) {
            return ERROR(UNIX_FILE_OPEN_ERR,
                    fmt::format("Source \"{}\" does not exist or is not a regular file.", _path));
        }

        const auto size = fs::file_size(_path, ec);
        if (ec) {
            return ERROR(UNIX_FILE_OPEN_ERR,
                    fmt::format("Failed to stat source \"{}\": {}", _path, ec.message()));
        }

        ifs_.open(_path, std::ios_base::in | std::ios_base::binary);
        if (!ifs_) {
            return ERROR(UNIX_FILE_OPEN_ERR,
                    fmt::format("Failed to open source \"{}\", errno = \"{}\".", _path, std::strerror(errno)));
        }

        path_      = _path;
        file_size_ = static_cast<std::int64_t>(size);
        offset_    = 0;

        logger::debug("{}:{} ({}) opened [path={}][file_size={}]", __FILE__, __LINE__, __func__, path_, file_size_);

        return SUCCESS();
    } // end open

    irods::error part_source::next(std::int64_t _chunk_size, std::optional<buffer_type>& _chunk)
    {
        _chunk.reset();

        if (!is_open()) {
            return ERROR(UNIX_FILE_READ_ERR, "Source is not open.");
        }

        if (_chunk_size <= 0) {
            return ERROR(SYS_INVALID_INPUT_PARAM, fmt::format("Invalid chunk size [{}].", _chunk_size));
        }

        buffer_type buffer;
        try {
            buffer.resize(static_cast<buffer_type::size_type>(_chunk_size));
        }
        catch (const std::bad_alloc& ba) {
            return ERROR(SYS_MALLOC_ERR,
                    fmt::format("Failed to allocate a buffer of {} bytes. [{}]", _chunk_size, ba.what()));
        }

        // istream::read keeps reading until the request is satisfied or the
        // stream ends, so a short count means end of file.
        ifs_.read(buffer.data(), _chunk_size);
        const auto bytes_read = static_cast<std::int64_t>(ifs_.gcount());

        if (ifs_.bad()) {
            return ERROR(UNIX_FILE_READ_ERR,
                    fmt::format("Failed to read source \"{}\" at offset {}.", path_, offset_));
        }

        if (bytes_read == 0) {
            logger::debug("{}:{} ({}) end of stream [path={}][offset={}]", __FILE__, __LINE__, __func__, path_, offset_);
            return SUCCESS();
        }

        buffer.resize(static_cast<buffer_type::size_type>(bytes_read));
        offset_ += bytes_read;
        _chunk = std::move(buffer);

        return SUCCESS();
    } // end next

    void part_source::close()
    {
        if (ifs_.is_open()) {
            ifs_.close();
            logger::debug("{}:{} ({}) closed [path={}]", __FILE__, __LINE__, __func__, path_);
        }
    } // end close

} // namespace s3_uploader
