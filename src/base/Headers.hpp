#ifndef __DS9SAMP_HEADERS__
#define __DS9SAMP_HEADERS__

#if defined(_MSC_VER)
#include <io.h>
#include <signal.h>
#include <windows.h>
#else
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "easylogging++.h"

using namespace std;
namespace fs = std::filesystem;

#ifndef DS9SAMP_VERSION
#define DS9SAMP_VERSION "unknown"
#endif

// Timeout (seconds) applied to each hub call unless overridden
const int DEFAULT_TIMEOUT_SECONDS = 10;
// Largest timeout accepted from the command line or the config file (a week)
const int MAX_TIMEOUT_SECONDS = 7 * 24 * 60 * 60;

#if defined(_MSC_VER)
#define STDERR_FILENO _fileno(stderr)
#define isatty _isatty
#endif

namespace ds9samp {
/**
 * @brief Splits on every occurrence of a multi-character separator.
 *
 * Empty fields, including a trailing one, are kept: "a\n" yields {"a", ""}.
 */
inline std::vector<std::string> splitOn(const std::string &s,
                                        const std::string &separator) {
  std::vector<std::string> elems;
  if (separator.empty()) {
    elems.push_back(s);
    return elems;
  }
  size_t start = 0;
  while (true) {
    auto pos = s.find(separator, start);
    if (pos == std::string::npos) {
      elems.push_back(s.substr(start));
      break;
    }
    elems.push_back(s.substr(start, pos - start));
    start = pos + separator.length();
  }
  return elems;
}

inline std::string trim(const std::string &s) {
  static const char *whitespace = " \t\r\n\f\v";
  auto first = s.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return "";
  }
  auto last = s.find_last_not_of(whitespace);
  return s.substr(first, last - first + 1);
}

inline std::string join(const std::vector<std::string> &elems,
                        const std::string &separator) {
  std::string retval;
  for (size_t i = 0; i < elems.size(); ++i) {
    if (i) {
      retval += separator;
    }
    retval += elems[i];
  }
  return retval;
}

inline int replaceAll(std::string &str, const std::string &from,
                      const std::string &to) {
  if (from.empty()) return 0;
  int retval = 0;
  size_t start_pos = 0;
  while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
    retval++;
    str.replace(start_pos, from.length(), to);
    start_pos += to.length();  // In case 'to' contains 'from', like replacing
                               // 'x' with 'yx'
  }
  return retval;
}

inline string toLower(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

inline string GetTempDirectory() {
#ifdef WIN32
  char buf[MAX_PATH + 1];
  auto retval = GetTempPathA(MAX_PATH + 1, buf);
  return string(buf, retval);
#else
  return fs::temp_directory_path().string() + "/";
#endif
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        LOG(FATAL) << "Uncaught c++ exception: " << e.what();
      }
    } else {
      LOG(FATAL) << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace ds9samp

#endif
