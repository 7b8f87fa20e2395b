// uyd_log.hpp - Unity YAML Document (uyd) - Logging
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.
//
// Levelled diagnostics. Everything goes to stderr so that stdout stays
// free for command output. UYD_LOG_LEVEL (error|warn|info|debug) and
// UYD_LOG_FILE are read once, on first use.

#ifndef UYD_LOG_HPP
#define UYD_LOG_HPP

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "uyd_core.hpp"

namespace uyd::log
{
    enum class level
    {
        error = 0,
        warn  = 1,
        info  = 2,
        debug = 3,
    };

    void set_level(level lvl);
    level current_level();
    std::optional<level> parse_level(std::string_view text);

    void error(std::string const & message);
    void warn(std::string const & message);
    void info(std::string const & message);
    void debug(std::string const & message);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline level & global_level()
        {
            static level lvl = level::warn;
            return lvl;
        }

        inline bool & env_initialised()
        {
            static bool done = false;
            return done;
        }

        inline std::unique_ptr<std::ofstream> & file_sink()
        {
            static std::unique_ptr<std::ofstream> f{};
            return f;
        }

        inline std::chrono::steady_clock::time_point & time_origin()
        {
            static auto t0 = std::chrono::steady_clock::now();
            return t0;
        }

        inline void init_from_env_once()
        {
            if (env_initialised())
                return;
            env_initialised() = true;

            if (char const * v = std::getenv("UYD_LOG_LEVEL"))
            {
                if (auto lvl = parse_level(v))
                    global_level() = *lvl;
            }

            char const * file = std::getenv("UYD_LOG_FILE");
            if (file && *file)
            {
                auto ofs = std::make_unique<std::ofstream>(file, std::ios::out | std::ios::app);
                if (ofs->good())
                    file_sink() = std::move(ofs);
            }
        }

        inline char const * level_tag(level lvl)
        {
            switch (lvl)
            {
                case level::error: return "ERROR";
                case level::warn:  return "WARN";
                case level::info:  return "INFO";
                case level::debug: return "DEBUG";
            }
            return "INFO";
        }

        inline void write_line(level lvl, std::string const & message)
        {
            init_from_env_once();
            if (static_cast<int>(lvl) > static_cast<int>(global_level()))
                return;

            using namespace std::chrono;
            double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();

            std::ostringstream line;
            line.setf(std::ios::fixed);
            line << "[uyd " << level_tag(lvl) << "] +" << std::setprecision(3) << secs << "s: " << message << '\n';

            std::cerr << line.str();
            std::cerr.flush();

            if (file_sink())
            {
                (*file_sink()) << line.str();
                file_sink()->flush();
            }
        }
    }

//========================================================================
// API implementation
//========================================================================

    inline std::optional<level> parse_level(std::string_view text)
    {
        auto lower = uyd::detail::to_lower(uyd::detail::trim_sv(text));
        if (lower == "error") return level::error;
        if (lower == "warn" || lower == "warning") return level::warn;
        if (lower == "info") return level::info;
        if (lower == "debug") return level::debug;
        return std::nullopt;
    }

    inline void set_level(level lvl)
    {
        detail::init_from_env_once();
        detail::global_level() = lvl;
    }

    inline level current_level()
    {
        detail::init_from_env_once();
        return detail::global_level();
    }

    inline void error(std::string const & message) { detail::write_line(level::error, message); }
    inline void warn (std::string const & message) { detail::write_line(level::warn,  message); }
    inline void info (std::string const & message) { detail::write_line(level::info,  message); }
    inline void debug(std::string const & message) { detail::write_line(level::debug, message); }

} // namespace uyd::log

#endif // UYD_LOG_HPP
