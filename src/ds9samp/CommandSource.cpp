#include "CommandSource.hpp"

namespace ds9samp {
namespace {
const string STDIN_MARKER = "@-";
const char FILE_PREFIX = '@';

string readStream(std::istream& in) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}
}  // namespace

CommandSource resolveCommandSource(const string& raw) {
  if (raw == STDIN_MARKER) {
    return {CommandSourceType::STDIN, ""};
  }
  if (!raw.empty() && raw[0] == FILE_PREFIX) {
    return {CommandSourceType::FILE, raw.substr(1)};
  }
  return {CommandSourceType::LITERAL, raw};
}

vector<string> splitCommands(const string& text, const string& separator) {
  vector<string> commands = splitOn(text, separator);
  for (auto& command : commands) {
    command = trim(command);
  }
  return commands;
}

vector<string> readCommandBatch(const CommandSource& source, std::istream& in) {
  switch (source.type) {
    case CommandSourceType::STDIN: {
      VLOG(1) << "Reading commands from stdin";
      // An empty stdin leaves the failbit set by operator<<, not an error
      string text = in.peek() == EOF ? "" : readStream(in);
      if (in.bad()) {
        throw FileAccessException("Unable to read commands from stdin");
      }
      return splitCommands(text, STREAM_COMMAND_SEPARATOR);
    }
    case CommandSourceType::FILE: {
      VLOG(1) << "Reading commands from " << source.text;
      std::error_code ec;
      if (fs::is_directory(source.text, ec)) {
        throw FileAccessException("Unable to read commands from '" +
                                  source.text + "': " +
                                  strerror(EISDIR));
      }
      std::ifstream file(source.text, std::ios::in | std::ios::binary);
      if (!file.is_open()) {
        throw FileAccessException("Unable to read commands from '" +
                                  source.text + "': " + strerror(errno));
      }
      string text = file.peek() == EOF ? "" : readStream(file);
      if (file.bad()) {
        throw FileAccessException("Error while reading commands from '" +
                                  source.text + "'");
      }
      return splitCommands(text, STREAM_COMMAND_SEPARATOR);
    }
    case CommandSourceType::LITERAL:
      return splitCommands(source.text, LITERAL_COMMAND_SEPARATOR);
  }
  return {};
}
}  // namespace ds9samp
