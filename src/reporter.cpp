#include "reporter.hpp"
#include <cstdlib>
#include <unistd.h>

// terminfo access only; no curses pseudo-function macros (move, clear, ...)
#define NCURSES_NOMACROS
#include <curses.h>
#include <term.h>

namespace stackstop {

namespace {

bool is_capability(const char* cap) {
    // tigetstr returns (char*)-1 for a name that is not a string capability
    return cap != nullptr && cap != reinterpret_cast<const char*>(-1);
}

} // namespace

Reporter::Reporter(std::ostream& out, Colors colors, bool verbose)
    : out_(out), colors_(std::move(colors)), verbose_(verbose) {}

Reporter::Colors Reporter::detect_colors(int fd) {
    Colors result;
    if (!isatty(fd) || std::getenv("NO_COLOR") != nullptr) {
        return result;
    }

    int status = 0;
    if (setupterm(nullptr, fd, &status) != OK) {
        return result;
    }

    const char* set_fg = tigetstr("setaf");
    const char* attrs_off = tigetstr("sgr0");
    const char* bold_on = tigetstr("bold");
    if (is_capability(set_fg) && is_capability(attrs_off)) {
        auto paint = [set_fg](int color) { return std::string(tiparm(set_fg, color)); };
        result.debug = paint(COLOR_CYAN);
        result.info = paint(COLOR_GREEN);
        result.warn = (is_capability(bold_on) ? std::string(bold_on) : std::string()) + paint(COLOR_YELLOW);
        result.error = paint(COLOR_RED);
        result.reset = attrs_off;
    }

    del_curterm(cur_term);
    return result;
}

void Reporter::write(LogLevel level, std::string_view message) {
    if (progress_pending_) {
        progress_done();
    }

    const std::string* color = &colors_.info;
    std::string_view tag = "[INFO]";
    switch (level) {
        case LogLevel::debug: color = &colors_.debug; tag = "[DEBUG]"; break;
        case LogLevel::info: break;
        case LogLevel::warn: color = &colors_.warn; tag = "[WARN]"; break;
        case LogLevel::error: color = &colors_.error; tag = "[ERROR]"; break;
    }

    out_ << *color << tag << colors_.reset << ' ' << message << '\n';
    out_.flush();
}

void Reporter::debug(std::string_view message) {
    if (verbose_) {
        write(LogLevel::debug, message);
    }
}

void Reporter::info(std::string_view message) {
    write(LogLevel::info, message);
}

void Reporter::warn(std::string_view message) {
    write(LogLevel::warn, message);
}

void Reporter::error(std::string_view message) {
    write(LogLevel::error, message);
}

void Reporter::progress_tick() {
    out_ << '.';
    out_.flush();
    progress_pending_ = true;
}

void Reporter::progress_done() {
    if (progress_pending_) {
        out_ << '\n';
        out_.flush();
        progress_pending_ = false;
    }
}

void Reporter::blank_line() {
    progress_done();
    out_ << '\n';
    out_.flush();
}

} // namespace stackstop
