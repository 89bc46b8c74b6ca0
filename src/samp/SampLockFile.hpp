#ifndef __DS9SAMP_SAMP_LOCK_FILE__
#define __DS9SAMP_SAMP_LOCK_FILE__

#include "Headers.hpp"

namespace ds9samp {
/** @brief Environment variable pointing at a non-default hub lockfile. */
const string SAMP_HUB_ENV = "SAMP_HUB";
/** @brief Prefix of SAMP_HUB values that name a lockfile URL. */
const string SAMP_LOCKURL_PREFIX = "std-lockurl:";

/**
 * @brief Connection details a running hub advertises in its lockfile.
 */
struct SampLockInfo {
  string secret;
  string xmlrpcUrl;
  /** @brief Every key found, including the two required ones. */
  map<string, string> entries;
};

/**
 * @brief Works out where the lockfile lives.
 *
 * SAMP_HUB=std-lockurl:file://<path> wins, otherwise it is $HOME/.samp.
 * @throws SampException for a SAMP_HUB value that is not a file URL.
 */
string locateLockFile();

/**
 * @brief Reads a lockfile: `key=value` lines, `#` comments.
 * @throws SampException when the file is missing or lacks samp.secret or
 * samp.hub.xmlrpc.url.
 */
SampLockInfo readLockFile(const string& path);
}  // namespace ds9samp

#endif  // __DS9SAMP_SAMP_LOCK_FILE__
