#include "callsheet/log.hpp"

#include <mutex>
#include <ostream>

namespace callsheet {

    using namespace callsheet::literals;

    struct logger::shared_sink {
        std::mutex mutex;
        sink_fn fn;
    };

    logger::logger(log_level threshold, sink_fn sink)
        : threshold_{threshold}, sink_{sink ? std::make_shared<shared_sink>() : nullptr} {
        if (sink_) {
            sink_->fn = std::move(sink);
        }
    }

    logger logger::to_stream(std::ostream& os, log_level threshold) {
        return logger{threshold, [&os](log_level level, std::string_view line) {
                          os << to_string(level) << ' ' << line << '\n';
                          os.flush();
                      }};
    }

    bool logger::enabled(log_level level) const {
        return sink_ && threshold_ != log_level::off && level != log_level::off && level >= threshold_;
    }

    void logger::write(log_level level, std::string_view message, const std::source_location& loc) const {
        if (!enabled(level)) {
            return;
        }
        auto line = "[{}:{}] {}"_format(sloc_fname(loc), loc.line(), message);
        std::lock_guard lock{sink_->mutex};
        sink_->fn(level, line);
    }

}  // namespace callsheet
