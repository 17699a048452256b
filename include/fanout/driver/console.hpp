#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <unistd.h>

namespace fanout::driver {

// =============================================================================
// ANSI Color Support
// =============================================================================

namespace color {

namespace ansi {
    inline constexpr const char* reset      = "\033[0m";
    inline constexpr const char* red        = "\033[31m";
    inline constexpr const char* green      = "\033[32m";
    inline constexpr const char* yellow     = "\033[33m";
} // namespace ansi

struct scheme_t {
    const char* reset   = ansi::reset;
    const char* info    = ansi::green;
    const char* warning = ansi::yellow;
    const char* error   = ansi::red;
};

inline auto enabled() -> scheme_t { return scheme_t{}; }
inline auto disabled() -> scheme_t {
    return scheme_t{"", "", "", ""};
}

inline auto is_tty(int fd) -> bool { return isatty(fd) != 0; }
inline auto is_tty(std::ostream& os) -> bool {
    if (&os == &std::cout) return is_tty(STDOUT_FILENO);
    if (&os == &std::cerr) return is_tty(STDERR_FILENO);
    return false;
}

inline auto for_stream(std::ostream& os) -> scheme_t {
    return is_tty(os) ? enabled() : disabled();
}

} // namespace color

// =============================================================================
// console_t - line-atomic output shared by concurrently running jobs
// =============================================================================
//
// Results go to `out`; progress, warnings and errors go to `err`, so that
// stdout stays usable in pipelines.

class console_t {
public:
    explicit console_t(std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : out_(out)
        , err_(err)
        , err_colors_(color::for_stream(err)) {}

    console_t(const console_t&) = delete;
    console_t& operator=(const console_t&) = delete;

    void print(const std::string& line) {
        auto lock = std::lock_guard<std::mutex>(mutex_);
        out_ << line << "\n";
        out_.flush();
    }

    void info(const std::string& line) { emit(err_colors_.info, line); }
    void warn(const std::string& line) { emit(err_colors_.warning, line); }
    void error(const std::string& line) { emit(err_colors_.error, line); }

private:
    std::ostream& out_;
    std::ostream& err_;
    color::scheme_t err_colors_;
    std::mutex mutex_;

    void emit(const char* c, const std::string& line) {
        auto lock = std::lock_guard<std::mutex>(mutex_);
        err_ << c << line << err_colors_.reset << "\n";
        err_.flush();
    }
};

} // namespace fanout::driver
