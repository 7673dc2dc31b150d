#include "util/shell.hh"

#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>

using std::ostream;
using std::string;

void write_shell_escaped(ostream& out_stream, const string& input) {
  if (!input.empty() && input.find_first_of(" \t\n&();|<>!{}'\"$`*?[]~#") == string::npos) {
    out_stream << input;
    return;
  }

  out_stream << '\'';
  size_t escaped_so_far = 0;
  while (true) {
    size_t quote_offset = input.find('\'', escaped_so_far);
    if (quote_offset == string::npos) {
      out_stream.write(input.data() + escaped_so_far, input.size() - escaped_so_far);
      out_stream << '\'';
      return;
    } else {
      out_stream.write(input.data() + escaped_so_far, quote_offset - escaped_so_far);
      out_stream << "'\\''";
      escaped_so_far = quote_offset + 1;
    }
  }
}

string shell_escaped(const string& input) {
  std::ostringstream ss;
  write_shell_escaped(ss, input);
  return ss.str();
}
