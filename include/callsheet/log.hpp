#pragma once

#include "format.hpp"
#include "utils.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace callsheet {

    using namespace std::string_view_literals;

    enum class log_level : uint8_t { debug, info, warn, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "warn"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        for (auto level : {log_level::debug, log_level::info, log_level::warn, log_level::error, log_level::off}) {
            if (utils::str_case_eq(text, to_string(level))) {
                out = level;
                return true;
            }
        }
        if (utils::str_case_eq(text, "warning"sv)) {
            out = log_level::warn;
            return true;
        }
        return false;
    }

    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    /*
     * Logging handle passed by value into every component that reports anything.
     *
     * Copies share one sink and one mutex, so a logger handed to worker threads serializes their lines.
     * A default-constructed logger has no sink and drops every message.
     */
    class logger {
      public:
        using sink_fn = std::function<void(log_level, std::string_view)>;

        logger() = default;
        logger(log_level threshold, sink_fn sink);

        // Writes "level [file:line] message" lines to `os`; `os` must outlive every copy.
        static logger to_stream(std::ostream& os, log_level threshold);

        bool enabled(log_level level) const;
        log_level threshold() const { return threshold_; }

        void write(log_level level,
                   std::string_view message,
                   const std::source_location& loc = std::source_location::current()) const;

        void debug(std::string_view message, const std::source_location& loc = std::source_location::current()) const {
            write(log_level::debug, message, loc);
        }
        void info(std::string_view message, const std::source_location& loc = std::source_location::current()) const {
            write(log_level::info, message, loc);
        }
        void warn(std::string_view message, const std::source_location& loc = std::source_location::current()) const {
            write(log_level::warn, message, loc);
        }
        void error(std::string_view message, const std::source_location& loc = std::source_location::current()) const {
            write(log_level::error, message, loc);
        }

      private:
        struct shared_sink;

        log_level threshold_{log_level::off};
        std::shared_ptr<shared_sink> sink_{};
    };

}  // namespace callsheet
