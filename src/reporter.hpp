#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace stackstop {

enum class LogLevel {
    debug,
    info,
    warn,
    error,
};

// Human-readable status output: one "[LEVEL] message" line per event,
// plus progress dots while waiting on a process.
class Reporter {
public:
    // Escape sequences per level; all empty means plain output
    struct Colors {
        std::string debug;
        std::string info;
        std::string warn;
        std::string error;
        std::string reset;
    };

    explicit Reporter(std::ostream& out, Colors colors = {}, bool verbose = false);

    // Colors from the terminal's terminfo entry, or none when fd is not
    // a terminal, NO_COLOR is set, or the terminal has no color support
    static Colors detect_colors(int fd);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void progress_tick();
    void progress_done();
    void blank_line();

    [[nodiscard]] bool verbose() const { return verbose_; }

private:
    void write(LogLevel level, std::string_view message);

    std::ostream& out_;
    Colors colors_;
    bool verbose_ = false;
    bool progress_pending_ = false;
};

} // namespace stackstop
