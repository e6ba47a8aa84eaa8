#ifndef S3_UPLOADER_UNIT_TESTS_TEMPORARY_FILE_HPP
#define S3_UPLOADER_UNIT_TESTS_TEMPORARY_FILE_HPP

#include <boost/filesystem.hpp>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>

// A file under the system temp directory that is removed with the object.
class temporary_file
{
public:

    // _size bytes of a repeating, non-trivial pattern
    explicit temporary_file(std::int64_t _size)
        : path_{make_path()}
    {
        std::string contents;
        contents.resize(static_cast<std::string::size_type>(_size));
        for (std::int64_t i = 0; i < _size; ++i) {
            contents[static_cast<std::string::size_type>(i)] = static_cast<char>((i * 31 + i / 4099) & 0xff);
        }
        write(contents);
    }

    explicit temporary_file(const std::string& _contents)
        : path_{make_path()}
    {
        write(_contents);
    }

    temporary_file(const temporary_file&) = delete;
    auto operator=(const temporary_file&) -> temporary_file& = delete;

    ~temporary_file()
    {
        boost::system::error_code ec;
        boost::filesystem::remove(path_, ec);
    }

    std::string path() const
    {
        return path_.string();
    }

    std::string contents() const
    {
        std::ifstream ifs{path_.string(), std::ios_base::in | std::ios_base::binary};
        return {std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
    }

private:

    static boost::filesystem::path make_path()
    {
        return boost::filesystem::temp_directory_path() /
            boost::filesystem::unique_path("s3_uploader_test_%%%%-%%%%-%%%%-%%%%");
    }

    void write(const std::string& _contents)
    {
        std::ofstream ofs{path_.string(), std::ios_base::out | std::ios_base::binary | std::ios_base::trunc};
        ofs.write(_contents.data(), static_cast<std::streamsize>(_contents.size()));
    }

    boost::filesystem::path path_;

}; // class temporary_file

#endif // S3_UPLOADER_UNIT_TESTS_TEMPORARY_FILE_HPP
