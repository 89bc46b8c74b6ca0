#ifndef __DS9SAMP_COLOR_POLICY__
#define __DS9SAMP_COLOR_POLICY__

#include "Headers.hpp"

namespace ds9samp {
/** @brief Environment variable that disables color, see https://no-color.org/ */
const string NO_COLOR_ENV = "NO_COLOR";

const string ERROR_COLOR_START = "\033[1;31m";
const string ERROR_COLOR_END = "\033[0;0m";

/**
 * @brief Wraps `text` in bold red unless color is unwanted.
 * @param isTerminal Whether the diagnostic stream is an interactive terminal.
 * @param noColorRequested Whether NO_COLOR is present in the environment.
 */
string addColor(const string& text, bool isTerminal, bool noColorRequested);

/** @brief True when NO_COLOR is set, whatever its value (even empty). */
bool noColorRequested();

/** @brief True when stderr is attached to a terminal. */
bool diagnosticStreamIsTerminal();

/**
 * @brief Applies addColor() using the current stderr and environment state.
 */
string decorate(const string& text);
}  // namespace ds9samp

#endif  // __DS9SAMP_COLOR_POLICY__
