#ifndef POLYP_UI_H
#define POLYP_UI_H

#include <iosfwd>
#include <string>

void set_color_enabled(bool enabled);
bool color_enabled();

std::string format_error(const std::string& message);
std::string format_warning(const std::string& message);
std::string format_success(const std::string& message);
std::string format_info(const std::string& message);
std::string format_header(const std::string& message);
std::string format_branch(const std::string& name);
std::string format_commit(const std::string& sha);
std::string format_command(const std::string& command);

// Prints "<question> [y/N] " and reads one line. EOF counts as no.
bool confirm(const std::string& question, std::istream& in, std::ostream& out);

bool stdin_is_terminal();
bool stdout_is_terminal();

#endif
