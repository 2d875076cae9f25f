// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <memory>
#include <utility>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "nixdata/core/output.hpp"
#include "nixdata/util/string.hpp"

namespace nixdata
{
    namespace
    {
        constexpr const char* logger_name = "nixdata";

        spdlog::level::level_enum convert_log_level(log_level l)
        {
            return static_cast<spdlog::level::level_enum>(l);
        }

        auto make_logger(const LoggingParams& params) -> std::shared_ptr<spdlog::logger>
        {
            auto logger = std::make_shared<spdlog::logger>(
                logger_name,
                std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
            );
            logger->set_formatter(std::make_unique<spdlog::pattern_formatter>(
                params.pattern,
                spdlog::pattern_time_type::local,
                "\n"
            ));
            logger->set_level(convert_log_level(params.level));
            return logger;
        }
    }

    auto log_level_from_string(std::string_view name) -> std::optional<log_level>
    {
        static constexpr std::array<std::pair<std::string_view, log_level>, 8> names = { {
            { "trace", log_level::trace },
            { "debug", log_level::debug },
            { "info", log_level::info },
            { "warn", log_level::warn },
            { "warning", log_level::warn },
            { "error", log_level::err },
            { "critical", log_level::critical },
            { "off", log_level::off },
        } };
        const auto lowered = util::to_lower(util::strip(name));
        for (const auto& [key, level] : names)
        {
            if (key == lowered)
            {
                return level;
            }
        }
        return std::nullopt;
    }

    void init_logging(const LoggingParams& params)
    {
        spdlog::drop(logger_name);
        auto logger = make_logger(params);
        spdlog::register_logger(logger);
        spdlog::set_default_logger(std::move(logger));
        spdlog::set_level(convert_log_level(params.level));
    }

    void set_log_level(log_level level)
    {
        spdlog::set_level(convert_log_level(level));
    }

    /*****************
     * MessageLogger *
     *****************/

    MessageLogger::MessageLogger(log_level level)
        : m_level(level)
        , m_stream()
    {
    }

    MessageLogger::~MessageLogger()
    {
        emit(m_stream.str(), m_level);
    }

    std::stringstream& MessageLogger::stream()
    {
        return m_stream;
    }

    void MessageLogger::emit(const std::string& msg, const log_level& level)
    {
        switch (level)
        {
            case log_level::critical:
                SPDLOG_CRITICAL(msg);
                break;
            case log_level::err:
                SPDLOG_ERROR(msg);
                break;
            case log_level::warn:
                SPDLOG_WARN(msg);
                break;
            case log_level::info:
                SPDLOG_INFO(msg);
                break;
            case log_level::debug:
                SPDLOG_DEBUG(msg);
                break;
            case log_level::trace:
                SPDLOG_TRACE(msg);
                break;
            default:
                break;
        }
    }
}
