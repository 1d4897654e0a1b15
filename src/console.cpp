#include "console.hpp"
#include <cstdlib>

namespace mkq {

Console::Console(std::ostream& out) : out_(out), colors_enabled_(true) {
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") {
        colors_enabled_ = false;
    }
}

void Console::println(const std::string& text) const {
    out_ << text << std::endl;
}

void Console::print_line(const std::string& text, const char* color) const {
    if (colors_enabled_) {
        out_ << color << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_error(const std::string& text) const {
    print_line(text, ansi::RED);
}

void Console::print_warning(const std::string& text) const {
    print_line(text, ansi::YELLOW);
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        out_ << "* " << text << std::endl;
    }
}

void Console::print_info(const std::string& text) const {
    print_line(text, ansi::CYAN);
}

void Console::print_colored(const std::string& text, const char* color) const {
    if (colors_enabled_) {
        out_ << color << text << ansi::RESET;
    } else {
        out_ << text;
    }
}

} // namespace mkq
