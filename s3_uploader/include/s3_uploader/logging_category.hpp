#ifndef S3_UPLOADER_LOGGING_CATEGORY_HPP
#define S3_UPLOADER_LOGGING_CATEGORY_HPP

#include <libs3.h>

#include <irods/irods_logger.hpp>

#include <fmt/format.h>

#include <type_traits>

// Tag for the uploader's log category. It needs no body; the logger
// only uses it to find the configuration below.
struct s3_uploader_logging_category;

namespace irods::experimental
{
    template <>
    class log::logger_config<s3_uploader_logging_category>
    {
        // Shows up under the "log_category" key of every message.
        static constexpr const char* name = "s3_uploader_logging_category";

        // Initial level. The command line can lower it with set_level().
        static inline log::level level = log::level::info;

        friend class logger<s3_uploader_logging_category>;
    };
} // namespace irods::experimental

namespace s3_uploader
{
    namespace log  = irods::experimental::log;
    using logger   = log::logger<s3_uploader_logging_category>;
} // namespace s3_uploader

template <>
struct fmt::formatter<S3Status> : fmt::formatter<std::underlying_type_t<S3Status>>
{
    constexpr auto format(const S3Status& e, format_context& ctx) const
    {
        return fmt::formatter<std::underlying_type_t<S3Status>>::format(
            static_cast<std::underlying_type_t<S3Status>>(e), ctx);
    }
};

template <>
struct fmt::formatter<S3Protocol> : fmt::formatter<std::underlying_type_t<S3Protocol>>
{
    constexpr auto format(const S3Protocol& e, format_context& ctx) const
    {
        return fmt::formatter<std::underlying_type_t<S3Protocol>>::format(
            static_cast<std::underlying_type_t<S3Protocol>>(e), ctx);
    }
};

template <>
struct fmt::formatter<S3UriStyle> : fmt::formatter<std::underlying_type_t<S3UriStyle>>
{
    constexpr auto format(const S3UriStyle& e, format_context& ctx) const
    {
        return fmt::formatter<std::underlying_type_t<S3UriStyle>>::format(
            static_cast<std::underlying_type_t<S3UriStyle>>(e), ctx);
    }
};

template <>
struct fmt::formatter<S3STSDate> : fmt::formatter<std::underlying_type_t<S3STSDate>>
{
    constexpr auto format(const S3STSDate& e, format_context& ctx) const
    {
        return fmt::formatter<std::underlying_type_t<S3STSDate>>::format(
            static_cast<std::underlying_type_t<S3STSDate>>(e), ctx);
    }
};

#endif // S3_UPLOADER_LOGGING_CATEGORY_HPP
