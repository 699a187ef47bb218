#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace hunt {
namespace util {

// Every tunable of the process, with the defaults the desk trades on.
// Loaded once at startup; components copy the values they need.
class Config {
public:
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Overlay credentials / mode / logging from OKX_* and LOG_* environment variables.
  void applyEnvironment();

  // Returns false and fills whyNot when the values cannot run together.
  bool validate(std::string* whyNot = nullptr) const;

  bool paperTrading() const { return tradingMode != "live"; }
  bool needsPrivateChannel() const { return paperTrading(); }

  // --- Credentials / endpoints ---
  std::string apiKey;
  std::string secretKey;
  std::string passphrase;
  std::string tradingMode   = "paper";         // paper | live
  std::string wsHost        = "ws.okx.com";
  std::string wsPaperHost   = "wspap.okx.com";
  std::string wsPort        = "8443";
  std::string wsPublicPath  = "/ws/v5/public";
  std::string wsPrivatePath = "/ws/v5/private";

  // --- Stream ---
  std::string instrument   = "BTC-USDT-SWAP";
  std::string bookChannel  = "books-l2-tbt";
  std::string tradeChannel = "trades";
  int reconnectDelayMs = 5000;
  int receiveTimeoutMs = 30000;
  int loginTimeoutMs   = 10000;

  // --- Logging ---
  std::string logLevel = "info";
  std::string logFile;                // empty -> stdout
  bool        logJson  = false;
  int         metricsReportSec = 0;   // 0 disables the reporter thread

  // --- Book / features ---
  size_t historyCapacity   = 100;
  size_t tradeTapeCapacity = 1000;
  double tickSize          = 0.1;
  double voidGapThreshold  = 0.002;
  size_t voidScanLevels    = 50;
  double featureWallDepth  = 50.0;
  size_t featureWallLevels = 20;
  double squeezeThreshold  = 0.7;

  // --- Front-running ---
  double largeTradeThreshold = 10.0;
  double depthDropThreshold  = 0.5;
  size_t depthHistoryLength  = 10;
  double frontRunSize        = 0.01;

  // --- Wall-riding ---
  double wallDepthThreshold  = 100.0;
  double wallPersistenceSec  = 5.0;
  double wallAbsenceSec      = 2.0;
  size_t wallScanLevels      = 20;
  double wallRideSize        = 0.01;
  double wallRideConfidence  = 0.7;

  // --- Spread-capturing ---
  double minSpreadBps     = 50.0;
  double maxSpreadBps     = 200.0;
  double spreadSize       = 0.01;
  double spreadConfidence = 0.8;

  // --- Risk ---
  double maxPositionSize = 1000.0;
  double maxDailyLoss    = 0.05;
  double leverageLimit   = 20.0;
  double maxLatencyMs    = 100.0;
  int    monitorPeriodMs = 1000;
  size_t latencyWindow   = 100;
  double kellyWinRate    = 0.55;
  double kellyAvgWin     = 0.02;
  double kellyAvgLoss    = 0.015;

  // --- Orchestration ---
  int    syncPeriodSec  = 60;
  double dryRunBalance  = 10000.0;

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
  bool assign(const std::string& key, const std::string& val);
};

} // namespace util
} // namespace hunt
