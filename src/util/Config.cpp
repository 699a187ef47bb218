#include "hunt/util/Config.hpp"
#include "hunt/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace hunt {
namespace util {

namespace {

bool parseBool(const std::string& v) {
  std::string x = v;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return x == "1" || x == "true" || x == "yes" || x == "on";
}

int    toInt(const std::string& v)    { return std::atoi(v.c_str()); }
double toDouble(const std::string& v) { return std::atof(v.c_str()); }
size_t toSize(const std::string& v)   { return static_cast<size_t>(std::max(0, std::atoi(v.c_str()))); }

} // namespace

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::assign(const std::string& key, const std::string& val) {
  if      (key == "apiKey")              apiKey = val;
  else if (key == "secretKey")           secretKey = val;
  else if (key == "passphrase")          passphrase = val;
  else if (key == "tradingMode")         tradingMode = val;
  else if (key == "wsHost")              wsHost = val;
  else if (key == "wsPaperHost")         wsPaperHost = val;
  else if (key == "wsPort")              wsPort = val;
  else if (key == "wsPublicPath")        wsPublicPath = val;
  else if (key == "wsPrivatePath")       wsPrivatePath = val;
  else if (key == "instrument")          instrument = val;
  else if (key == "bookChannel")         bookChannel = val;
  else if (key == "tradeChannel")        tradeChannel = val;
  else if (key == "reconnectDelayMs")    reconnectDelayMs = std::max(0, toInt(val));
  else if (key == "receiveTimeoutMs")    receiveTimeoutMs = std::max(1, toInt(val));
  else if (key == "loginTimeoutMs")      loginTimeoutMs = std::max(1, toInt(val));
  else if (key == "logLevel")            logLevel = val;
  else if (key == "logFile")             logFile = val;
  else if (key == "logJson")             logJson = parseBool(val);
  else if (key == "metricsReportSec")    metricsReportSec = std::max(0, toInt(val));
  else if (key == "historyCapacity")     historyCapacity = std::max<size_t>(2, toSize(val));
  else if (key == "tradeTapeCapacity")   tradeTapeCapacity = std::max<size_t>(1, toSize(val));
  else if (key == "tickSize")            tickSize = toDouble(val);
  else if (key == "voidGapThreshold")    voidGapThreshold = toDouble(val);
  else if (key == "voidScanLevels")      voidScanLevels = toSize(val);
  else if (key == "featureWallDepth")    featureWallDepth = toDouble(val);
  else if (key == "featureWallLevels")   featureWallLevels = toSize(val);
  else if (key == "squeezeThreshold")    squeezeThreshold = toDouble(val);
  else if (key == "largeTradeThreshold") largeTradeThreshold = toDouble(val);
  else if (key == "depthDropThreshold")  depthDropThreshold = toDouble(val);
  else if (key == "depthHistoryLength")  depthHistoryLength = std::max<size_t>(1, toSize(val));
  else if (key == "frontRunSize")        frontRunSize = toDouble(val);
  else if (key == "wallDepthThreshold")  wallDepthThreshold = toDouble(val);
  else if (key == "wallPersistenceSec")  wallPersistenceSec = toDouble(val);
  else if (key == "wallAbsenceSec")      wallAbsenceSec = toDouble(val);
  else if (key == "wallScanLevels")      wallScanLevels = toSize(val);
  else if (key == "wallRideSize")        wallRideSize = toDouble(val);
  else if (key == "wallRideConfidence")  wallRideConfidence = toDouble(val);
  else if (key == "minSpreadBps")        minSpreadBps = toDouble(val);
  else if (key == "maxSpreadBps")        maxSpreadBps = toDouble(val);
  else if (key == "spreadSize")          spreadSize = toDouble(val);
  else if (key == "spreadConfidence")    spreadConfidence = toDouble(val);
  else if (key == "maxPositionSize")     maxPositionSize = toDouble(val);
  else if (key == "maxDailyLoss")        maxDailyLoss = toDouble(val);
  else if (key == "leverageLimit")       leverageLimit = toDouble(val);
  else if (key == "maxLatencyMs")        maxLatencyMs = toDouble(val);
  else if (key == "monitorPeriodMs")     monitorPeriodMs = std::max(1, toInt(val));
  else if (key == "latencyWindow")       latencyWindow = std::max<size_t>(1, toSize(val));
  else if (key == "kellyWinRate")        kellyWinRate = toDouble(val);
  else if (key == "kellyAvgWin")         kellyAvgWin = toDouble(val);
  else if (key == "kellyAvgLoss")        kellyAvgLoss = toDouble(val);
  else if (key == "syncPeriodSec")       syncPeriodSec = std::max(1, toInt(val));
  else if (key == "dryRunBalance")       dryRunBalance = toDouble(val);
  else return false;
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // key=value per line, '#' or ';' start comments.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue;

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    if (!assign(key, val)) {
      logger().log(LogLevel::Debug, "config.unknown_key", {{"key", key}});
    }
  }

  std::fclose(f);

  if (maxSpreadBps < minSpreadBps) std::swap(maxSpreadBps, minSpreadBps);
  return true;
}

void Config::applyEnvironment() {
  auto env = [](const char* name) -> const char* {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
  };
  if (auto v = env("OKX_API_KEY"))    apiKey = v;
  if (auto v = env("OKX_SECRET_KEY")) secretKey = v;
  if (auto v = env("OKX_PASSPHRASE")) passphrase = v;
  if (auto v = env("TRADING_MODE"))   tradingMode = v;
  if (auto v = env("LOG_LEVEL"))      logLevel = v;
  if (auto v = env("LOG_FILE"))       logFile = v;
}

bool Config::validate(std::string* whyNot) const {
  auto fail = [whyNot](const std::string& why) {
    if (whyNot) *whyNot = why;
    return false;
  };

  if (tradingMode != "paper" && tradingMode != "live")
    return fail("tradingMode must be paper or live");
  if (needsPrivateChannel() && (apiKey.empty() || secretKey.empty() || passphrase.empty()))
    return fail("paper trading uses the private channel: apiKey, secretKey and passphrase are required");
  if (instrument.empty())
    return fail("instrument is empty");
  if (tickSize <= 0.0)
    return fail("tickSize must be positive");
  if (minSpreadBps < 0.0 || maxSpreadBps < minSpreadBps)
    return fail("spread band must satisfy 0 <= minSpreadBps <= maxSpreadBps");
  if (wallDepthThreshold <= 0.0 || largeTradeThreshold <= 0.0)
    return fail("wall and large-trade thresholds must be positive");
  if (depthDropThreshold <= 0.0 || depthDropThreshold > 1.0)
    return fail("depthDropThreshold must be in (0, 1]");
  if (maxDailyLoss <= 0.0 || maxDailyLoss >= 1.0)
    return fail("maxDailyLoss must be in (0, 1)");
  if (leverageLimit <= 0.0 || maxPositionSize <= 0.0 || maxLatencyMs <= 0.0)
    return fail("leverageLimit, maxPositionSize and maxLatencyMs must be positive");
  if (kellyAvgWin <= 0.0 || kellyWinRate < 0.0 || kellyWinRate > 1.0)
    return fail("Kelly inputs out of range");
  return true;
}

} // namespace util
} // namespace hunt
