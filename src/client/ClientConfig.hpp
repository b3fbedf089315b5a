#ifndef __MW_CLIENT_CONFIG__
#define __MW_CLIENT_CONFIG__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace mw {
/**
 * @brief Browser identity announced in the session-init frame.
 */
struct UserAgentConfig {
  string deviceType = "WEB";
  string locale = "ru";
  string deviceLocale = "ru";
  string osVersion = "Linux";
  string deviceName = "Firefox";
  string headerUserAgent =
      "Mozilla/5.0 (X11; Ubuntu; Linux x86_64; rv:135.0) Gecko/20100101 "
      "Firefox/135.0";
  string appVersion = "4.8.42";
  string screen = "1080x1920 1.0x";
  string timezone = "Europe/Moscow";

  json toJson() const;
};

/**
 * @brief Everything needed to run a client.  Compiled-in defaults, then the
 * config file, then command-line flags.
 */
struct ClientConfig {
  string host = "localhost";
  int port = 8443;
  string token;
  string phone;
  int64_t timeoutMs = DEFAULT_REQUEST_TIMEOUT_MS;
  int verbose = 0;
  bool logToStdout = false;
  string logDir = GetTempDirectory();
  UserAgentConfig userAgent;
};

/**
 * @brief Overlays the values found in an INI file onto `config`.  Keys that
 * are absent keep their current value.
 * @throws std::runtime_error if the file cannot be read or a number does not
 * parse.
 */
void loadClientConfig(const string& path, ClientConfig* config);
}  // namespace mw

#endif  // __MW_CLIENT_CONFIG__
