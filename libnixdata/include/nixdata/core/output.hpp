// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef NIXDATA_CORE_OUTPUT_HPP
#define NIXDATA_CORE_OUTPUT_HPP

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace nixdata
{
    // Same ordering and values as spdlog::level::level_enum
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    [[nodiscard]] auto log_level_from_string(std::string_view name) -> std::optional<log_level>;

    struct LoggingParams
    {
        log_level level{ log_level::warn };
        std::string pattern{ "%^%-9!l%-8n%$ %v" };
    };

    /**
     * Install the ``nixdata`` stderr logger as the spdlog default logger.
     *
     * Safe to call several times, the previous logger is replaced.
     */
    void init_logging(const LoggingParams& params);

    void set_log_level(log_level level);

    class MessageLogger
    {
    public:

        MessageLogger(log_level level);
        ~MessageLogger();

        MessageLogger(const MessageLogger&) = delete;
        MessageLogger& operator=(const MessageLogger&) = delete;

        std::stringstream& stream();

    private:

        log_level m_level;
        std::stringstream m_stream;

        static void emit(const std::string& msg, const log_level& level);
    };

}  // namespace nixdata

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

#define LOG(severity) nixdata::MessageLogger(severity).stream()
#define LOG_TRACE LOG(nixdata::log_level::trace)
#define LOG_DEBUG LOG(nixdata::log_level::debug)
#define LOG_INFO LOG(nixdata::log_level::info)
#define LOG_WARNING LOG(nixdata::log_level::warn)
#define LOG_ERROR LOG(nixdata::log_level::err)
#define LOG_CRITICAL LOG(nixdata::log_level::critical)

#endif  // NIXDATA_CORE_OUTPUT_HPP
