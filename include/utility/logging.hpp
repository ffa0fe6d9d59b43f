#ifndef INCLUDED_UTILTIY_LOGGING
#define INCLUDED_UTILTIY_LOGGING

#include "macro_definitions.hpp"
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#ifdef USE_BOOST_LOGGING

#    include <boost/core/null_deleter.hpp>
#    include <boost/date_time/posix_time/posix_time_types.hpp>
#    include <boost/log/attributes.hpp>
#    include <boost/log/attributes/scoped_attribute.hpp>
#    include <boost/log/expressions.hpp>
#    include <boost/log/sinks/sync_frontend.hpp>
#    include <boost/log/sinks/text_ostream_backend.hpp>
#    include <boost/log/sources/record_ostream.hpp>
#    include <boost/log/sources/severity_logger.hpp>
#    include <boost/log/support/date_time.hpp>
#    include <boost/log/utility/setup/common_attributes.hpp>
#    include <boost/smart_ptr/make_shared_object.hpp>
#    include <boost/smart_ptr/shared_ptr.hpp>
#    include <iomanip>
#    include <ios>
#    include <iostream>
#    include <mutex>
#    include <string>
#else
#    ifndef DEBUG_OSTREAM
#        include <iostream>
#        define DEBUG_OSTREAM std::clog
#    endif
#endif

#ifndef ZCURVE_DEFAULT_LOG_LEVEL_TRACE
#    define ZCURVE_DEFAULT_LOG_LEVEL_TRACE 1
#endif
#ifndef ZCURVE_DEFAULT_LOG_LEVEL_DEBUG
#    define ZCURVE_DEFAULT_LOG_LEVEL_DEBUG 2
#endif
#ifndef ZCURVE_DEFAULT_LOG_LEVEL_INFO
#    define ZCURVE_DEFAULT_LOG_LEVEL_INFO 3
#endif
#ifndef ZCURVE_DEFAULT_LOG_LEVEL_WARNING
#    define ZCURVE_DEFAULT_LOG_LEVEL_WARNING 4
#endif
#ifndef ZCURVE_DEFAULT_LOG_LEVEL_ERROR
#    define ZCURVE_DEFAULT_LOG_LEVEL_ERROR 5
#endif
#ifndef ZCURVE_DEFAULT_LOG_LEVEL_FATAL
#    define ZCURVE_DEFAULT_LOG_LEVEL_FATAL 6
#endif
#ifndef ZCURVE_DEFAULT_LOG_LEVEL_OFF
#    define ZCURVE_DEFAULT_LOG_LEVEL_OFF 7
#endif

#define DEFAULT_SOURCE_LOG_LEVEL_TRACE   ZCURVE_DEFAULT_LOG_LEVEL_TRACE
#define DEFAULT_SOURCE_LOG_LEVEL_DEBUG   ZCURVE_DEFAULT_LOG_LEVEL_DEBUG
#define DEFAULT_SOURCE_LOG_LEVEL_INFO    ZCURVE_DEFAULT_LOG_LEVEL_INFO
#define DEFAULT_SOURCE_LOG_LEVEL_WARNING ZCURVE_DEFAULT_LOG_LEVEL_WARNING
#define DEFAULT_SOURCE_LOG_LEVEL_ERROR   ZCURVE_DEFAULT_LOG_LEVEL_ERROR
#define DEFAULT_SOURCE_LOG_LEVEL_FATAL   ZCURVE_DEFAULT_LOG_LEVEL_FATAL
#define DEFAULT_SOURCE_LOG_LEVEL_OFF     ZCURVE_DEFAULT_LOG_LEVEL_OFF

#ifdef ZCURVE_LOG_LEVEL
#    define DEFAULT_SOURCE_LOG_LEVEL \
        UTILITY_CONCATENATE_MACRO(DEFAULT_SOURCE_LOG_LEVEL_, ZCURVE_LOG_LEVEL)
#else
#    define DEFAULT_SOURCE_LOG_LEVEL DEFAULT_SOURCE_LOG_LEVEL_INFO
#endif

#define DEFAULT_SOURCE_LOG_IGNORE(msg) ((void)0)

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_TRACE
#    define DEFAULT_SOURCE_LOG_TRACE(msg)                \
        utility::logging::default_source::log(           \
            utility::logging::severity_level::trace, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_TRACE(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_DEBUG
#    define DEFAULT_SOURCE_LOG_DEBUG(msg)                \
        utility::logging::default_source::log(           \
            utility::logging::severity_level::debug, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_DEBUG(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_INFO
#    define DEFAULT_SOURCE_LOG_INFO(msg) \
        utility::logging::default_source::log(utility::logging::severity_level::info, msg)
#else
#    define DEFAULT_SOURCE_LOG_INFO(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_WARNING
#    define DEFAULT_SOURCE_LOG_WARNING(msg)                \
        utility::logging::default_source::log(             \
            utility::logging::severity_level::warning, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_WARNING(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_ERROR
#    define DEFAULT_SOURCE_LOG_ERROR(msg)                \
        utility::logging::default_source::log(           \
            utility::logging::severity_level::error, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_ERROR(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

#if DEFAULT_SOURCE_LOG_LEVEL <= DEFAULT_SOURCE_LOG_LEVEL_FATAL
#    define DEFAULT_SOURCE_LOG_FATAL(msg)                \
        utility::logging::default_source::log(           \
            utility::logging::severity_level::fatal, msg \
        )
#else
#    define DEFAULT_SOURCE_LOG_FATAL(msg) DEFAULT_SOURCE_LOG_IGNORE(msg)
#endif

namespace utility::logging
{
// Define our own severity levels
enum severity_level
{
    trace,
    debug,
    info,
    warning,
    error,
    fatal,
};

#ifdef USE_BOOST_LOGGING
namespace log   = boost::log;
namespace src   = boost::log::sources;
namespace expr  = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace attrs = boost::log::attributes;

#    define LOGGING_UTILITY_SCOPED_ADD_TAG(tag) \
        BOOST_LOG_SCOPED_THREAD_ATTR(           \
            "Tag", utility::logging::attrs::constant<std::string>(tag) \
        );

// Enable streaming of severity_level enum
inline auto operator<<(std::ostream& strm, severity_level level) -> std::ostream&
{
    using namespace std::literals;
    static const std::string_view strings[] = { "trace"sv,   "debug"sv, "info"sv,
                                                "warning"sv, "error"sv, "fatal"sv };
    if (static_cast<std::size_t>(level) < sizeof(strings) / sizeof(*strings))
    {
        const auto s = strings[level];
        strm << "<" << s << std::setw(static_cast<int>(9uz - s.size()))
             << std::setfill(' ') << ">";
    }
    else
    {
        strm << "<" << static_cast<int>(level) << ">";
    }
    return strm;
}

// Define attribute keywords
BOOST_LOG_ATTRIBUTE_KEYWORD(line_id, "LineID", unsigned int)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(tag_attr, "Tag", std::string)

inline auto init() -> void
{
    using text_sink   = sinks::synchronous_sink<sinks::text_ostream_backend>;
    auto console_sink = boost::make_shared<text_sink>();

    console_sink->locked_backend()->add_stream(
        boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter())
    );

    console_sink->set_formatter(
        expr::stream
        << std::setw(5) << std::left << std::dec << std::setfill(' ')
        << expr::attr<unsigned int>("LineID") << " "
        << expr::format_date_time<boost::posix_time::ptime>(
               "TimeStamp", "  %Y-%m-%d %H:%M:%S    "
           )
        << severity
        << expr::if_(expr::has_attr(tag_attr))[expr::stream << "  [" << tag_attr << "]"]
        << "  " << expr::smessage
    );
    console_sink->locked_backend()->auto_flush(true);

    log::core::get()->add_sink(console_sink);
    log::add_common_attributes();
}
#else
#    define LOGGING_UTILITY_SCOPED_ADD_TAG(tag)
#endif

/// @brief Streams every part into one string, for building log messages
[[nodiscard]]
inline auto concat(auto&&... parts) -> std::string
{
    std::ostringstream oss;
    (oss << ... << std::forward<decltype(parts)>(parts));
    return oss.str();
}

class default_source
{
    inline static constexpr std::string_view s_info_repr    = "info";
    inline static constexpr std::string_view s_debug_repr   = "debug";
    inline static constexpr std::string_view s_error_repr   = "error";
    inline static constexpr std::string_view s_fatal_repr   = "fatal";
    inline static constexpr std::string_view s_trace_repr   = "trace";
    inline static constexpr std::string_view s_warning_repr = "warning";
    inline static constexpr std::string_view s_unknown_repr = "UNKNOWN";

public:
    inline static auto log(severity_level sev, auto&& message) -> void
    {
#ifdef USE_BOOST_LOGGING
        std::call_once(s_initialized, init);
        static src::severity_logger_mt<severity_level> lg;
        BOOST_LOG_SEV(lg, sev) << std::forward<decltype(message)>(message);
#else
        DEBUG_OSTREAM << "Log <" << severity_name(sev) << "> "
                      << std::forward<decltype(message)>(message) << '\n';
#endif
    }

    inline static auto severity_name(severity_level sev) noexcept -> std::string_view
    {
        switch (sev)
        {
            case utility::logging::severity_level::info: return s_info_repr;
            case utility::logging::severity_level::debug: return s_debug_repr;
            case utility::logging::severity_level::error: return s_error_repr;
            case utility::logging::severity_level::fatal: return s_fatal_repr;
            case utility::logging::severity_level::trace: return s_trace_repr;
            case utility::logging::severity_level::warning: return s_warning_repr;
            default: return s_unknown_repr;
        }
    };

#ifdef USE_BOOST_LOGGING
private:
    inline static std::once_flag s_initialized;
#endif
};

} // namespace utility::logging

#endif // INCLUDED_UTILTIY_LOGGING
