#ifndef __DS9SAMP_COMMAND_SOURCE__
#define __DS9SAMP_COMMAND_SOURCE__

#include "Headers.hpp"

namespace ds9samp {
/** @brief Separator inside a literal command: a backslash then an 'n'. */
const string LITERAL_COMMAND_SEPARATOR = "\\n";
/** @brief Separator inside a command file or standard input. */
const string STREAM_COMMAND_SEPARATOR = "\n";

/**
 * @brief Thrown when the file named by `@path` cannot be read.
 */
class FileAccessException : public std::runtime_error {
 public:
  explicit FileAccessException(const string& msg) : std::runtime_error(msg) {}
};

enum class CommandSourceType { LITERAL, FILE, STDIN };

/**
 * @brief Where the commands of a set run come from.
 *
 * `text` is the command itself for LITERAL, the path for FILE and empty for
 * STDIN.
 */
struct CommandSource {
  CommandSourceType type;
  string text;
};

/**
 * @brief "@-" is standard input, "@path" is a file, anything else is the
 * command itself.
 */
CommandSource resolveCommandSource(const string& raw);

/**
 * @brief Splits `text` on `separator` and trims each piece.
 *
 * Blank pieces are kept as empty strings, the executor decides what to do
 * with them.
 */
vector<string> splitCommands(const string& text, const string& separator);

/**
 * @brief Reads the commands of `source`.
 *
 * Files and standard input are split on real newlines. A literal is split on
 * the two character sequence "\n" because that is what reaches argv when a
 * user types it inside quotes.
 * @param in Stream read to the end for STDIN.
 * @throws FileAccessException when a FILE source cannot be opened or read.
 */
vector<string> readCommandBatch(const CommandSource& source, std::istream& in);
}  // namespace ds9samp

#endif  // __DS9SAMP_COMMAND_SOURCE__
