#include "ColorPolicy.hpp"

namespace ds9samp {
string addColor(const string& text, bool isTerminal, bool noColorRequested) {
  if (!isTerminal || noColorRequested) {
    return text;
  }
  return ERROR_COLOR_START + text + ERROR_COLOR_END;
}

bool noColorRequested() { return ::getenv(NO_COLOR_ENV.c_str()) != NULL; }

bool diagnosticStreamIsTerminal() { return ::isatty(STDERR_FILENO) != 0; }

string decorate(const string& text) {
  return addColor(text, diagnosticStreamIsTerminal(), noColorRequested());
}
}  // namespace ds9samp
