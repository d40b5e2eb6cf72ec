#include "polyp/ui.h"

#include <iostream>
#include <string>

#include <unistd.h>

namespace {

bool g_color_enabled = true;

const char* RESET = "\033[0m";
const char* BOLD_RED = "\033[1;31m";
const char* RED = "\033[31m";
const char* BOLD_GREEN = "\033[1;32m";
const char* GREEN = "\033[32m";
const char* BOLD_YELLOW = "\033[1;33m";
const char* YELLOW = "\033[33m";
const char* BOLD_BLUE = "\033[1;34m";
const char* BOLD_CYAN = "\033[1;36m";
const char* CYAN = "\033[36m";

std::string paint(const char* color, const std::string& text) {
    if (!g_color_enabled) return text;
    return std::string(color) + text + RESET;
}

}

void set_color_enabled(bool enabled) { g_color_enabled = enabled; }
bool color_enabled() { return g_color_enabled; }

std::string format_error(const std::string& message) {
    return paint(BOLD_RED, "Error: ") + paint(RED, message);
}

std::string format_warning(const std::string& message) {
    return paint(BOLD_YELLOW, "Warning: ") + paint(YELLOW, message);
}

std::string format_success(const std::string& message) {
    return paint(BOLD_GREEN, "✓ ") + paint(GREEN, message);
}

std::string format_info(const std::string& message) {
    return paint(BOLD_BLUE, "→ ") + message;
}

std::string format_header(const std::string& message) {
    return paint(BOLD_CYAN, message);
}

std::string format_branch(const std::string& name) {
    return paint(BOLD_GREEN, name);
}

std::string format_commit(const std::string& sha) {
    return paint(YELLOW, sha.substr(0, 8));
}

std::string format_command(const std::string& command) {
    return paint(BOLD_CYAN, "  $ ") + paint(CYAN, command);
}

bool confirm(const std::string& question, std::istream& in, std::ostream& out) {
    out << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(in, answer)) {
        out << std::endl;
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes" || answer == "Yes" || answer == "YES";
}

bool stdin_is_terminal() { return isatty(STDIN_FILENO) != 0; }
bool stdout_is_terminal() { return isatty(STDOUT_FILENO) != 0; }
