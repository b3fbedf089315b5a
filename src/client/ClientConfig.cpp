#include "ClientConfig.hpp"

#include "SimpleIni.h"

namespace mw {
namespace {
void readString(const CSimpleIniA& ini, const char* section, const char* key,
                string* value) {
  const char* raw = ini.GetValue(section, key, NULL);
  if (raw) {
    *value = string(raw);
  }
}

template <class T>
void readInteger(const CSimpleIniA& ini, const char* section, const char* key,
                 T* value) {
  const char* raw = ini.GetValue(section, key, NULL);
  if (!raw) {
    return;
  }
  try {
    *value = T(stoll(raw));
  } catch (const std::logic_error& e) {
    throw std::runtime_error(string("Invalid value for ") + section + "." +
                             key + ": " + raw + " (" + e.what() + ")");
  }
}
}  // namespace

json UserAgentConfig::toJson() const {
  return {
      {"deviceType", deviceType},
      {"locale", locale},
      {"osVersion", osVersion},
      {"deviceName", deviceName},
      {"headerUserAgent", headerUserAgent},
      {"deviceLocale", deviceLocale},
      {"appVersion", appVersion},
      {"screen", screen},
      {"timezone", timezone},
  };
}

void loadClientConfig(const string& path, ClientConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  readString(ini, "Connection", "host", &config->host);
  readInteger(ini, "Connection", "port", &config->port);
  readString(ini, "Connection", "token", &config->token);
  readString(ini, "Connection", "phone", &config->phone);
  readInteger(ini, "Connection", "timeout_ms", &config->timeoutMs);

  UserAgentConfig& ua = config->userAgent;
  readString(ini, "UserAgent", "deviceType", &ua.deviceType);
  readString(ini, "UserAgent", "locale", &ua.locale);
  readString(ini, "UserAgent", "deviceLocale", &ua.deviceLocale);
  readString(ini, "UserAgent", "osVersion", &ua.osVersion);
  readString(ini, "UserAgent", "deviceName", &ua.deviceName);
  readString(ini, "UserAgent", "headerUserAgent", &ua.headerUserAgent);
  readString(ini, "UserAgent", "appVersion", &ua.appVersion);
  readString(ini, "UserAgent", "screen", &ua.screen);
  readString(ini, "UserAgent", "timezone", &ua.timezone);

  readInteger(ini, "Debug", "verbose", &config->verbose);
  int logToStdout = config->logToStdout ? 1 : 0;
  readInteger(ini, "Debug", "logtostdout", &logToStdout);
  config->logToStdout = logToStdout != 0;
  readString(ini, "Debug", "logdir", &config->logDir);

  if (config->port <= 0 || config->port > 65535) {
    throw std::runtime_error("Invalid port in " + path + ": " +
                             to_string(config->port));
  }
  LOG(INFO) << "Loaded config file " << path;
}
}  // namespace mw
