#pragma once

#include <ostream>
#include <string>

/// Escape a string for correct printing as an argument or command on the shell
void write_shell_escaped(std::ostream& out_stream, const std::string& input);

/// Return a shell-escaped copy of a string
std::string shell_escaped(const std::string& input);
