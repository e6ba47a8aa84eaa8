#include "s3_uploader/completion_manifest.hpp"

// iRODS includes
#include <irods/rodsErrorTable.h>

// misc includes
#include <fmt/format.h>

// stdlib includes
#include <algorithm>
#include <utility>

namespace s3_uploader
{
    void completion_manifest::add(unsigned int _part_number, std::string _etag)
    {
        parts_.push_back(completed_part{_part_number, std::move(_etag)});
    }

    void completion_manifest::sort()
    {
        std::stable_sort(parts_.begin(), parts_.end(),
                [](const completed_part& _lhs, const completed_part& _rhs) {
                    return _lhs.part_number < _rhs.part_number;
                });
    }

    irods::error completion_manifest::validate() const
    {
        unsigned int expected_part_number = 1;

        for (const auto& part : parts_) {
            if (part.part_number != expected_part_number) {
                return ERROR(S3_PUT_ERROR,
                        fmt::format("Manifest is not contiguous: found part {} where part {} was expected.",
                            part.part_number, expected_part_number));
            }

            if (part.etag.empty()) {
                return ERROR(S3_PUT_ERROR, fmt::format("Part {} has no ETag.", part.part_number));
            }

            ++expected_part_number;
        }

        return SUCCESS();
    } // end validate

    std::string completion_manifest::to_xml() const
    {
        auto xml = fmt::format("<CompleteMultipartUpload>\n");
        for (const auto& part : parts_) {
            xml += fmt::format("<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>\n", part.part_number, part.etag);
        }
        xml += fmt::format("</CompleteMultipartUpload>\n");
        return xml;
    } // end to_xml

} // namespace s3_uploader
