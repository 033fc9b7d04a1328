#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    class Logger
    {
      public:
        static constexpr std::string_view defaultName = "suite-launcher";
        static constexpr std::string_view defaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

        Logger()
            : guard_{}
            , logger_{}
            , level_{Level::Info}
        {}

        /**
         * @brief Replaces the underlying spdlog logger. Everything is written to stderr, stdout belongs to the
         * launched processes.
         *
         * @param name Logger name shown in every line.
         */
        void setup(std::string const& name)
        {
            std::scoped_lock lock{guard_};
            setupUnlocked(name);
        }

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            level_ = level;
            if (logger_)
                logger_->set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            std::scoped_lock lock{guard_};
            return level_;
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (level < this->level())
                return;

            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            std::shared_ptr<spdlog::logger> target;
            {
                std::scoped_lock lock{guard_};
                if (!logger_)
                    setupUnlocked(std::string{defaultName});
                target = logger_;
            }
            target->log(toSpdlogLevel(level), msg);
        }

      private:
        void setupUnlocked(std::string const& name)
        {
            logger_ = std::make_shared<spdlog::logger>(
                name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>(spdlog::color_mode::automatic));
            logger_->set_pattern(std::string{defaultPattern});
            logger_->set_level(toSpdlogLevel(level_));
        }

      private:
        mutable std::recursive_mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
        Log::Level level_;
    };
}
