#include "hunt/util/Config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace hunt::util;

namespace {
std::string writeTemp(const std::string& name, const std::string& body) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream(path) << body;
    return path;
}
} // namespace

TEST(ConfigTest, DefaultsMatchTheDesk) {
    Config c;
    EXPECT_EQ(c.instrument, "BTC-USDT-SWAP");
    EXPECT_EQ(c.bookChannel, "books-l2-tbt");
    EXPECT_EQ(c.reconnectDelayMs, 5000);
    EXPECT_DOUBLE_EQ(c.maxDailyLoss, 0.05);
    EXPECT_DOUBLE_EQ(c.maxLatencyMs, 100);
    EXPECT_DOUBLE_EQ(c.leverageLimit, 20);
    EXPECT_DOUBLE_EQ(c.minSpreadBps, 50);
    EXPECT_DOUBLE_EQ(c.maxSpreadBps, 200);
    EXPECT_EQ(c.syncPeriodSec, 60);
    EXPECT_TRUE(c.paperTrading());
    EXPECT_TRUE(c.needsPrivateChannel());
}

TEST(ConfigTest, LoadsKeyValueFileWithComments) {
    const auto path = writeTemp("hunt_cfg_basic.conf",
        "# comment\n"
        "; another\n"
        "instrument = ETH-USDT-SWAP\n"
        "tradingMode=live\n"
        "wallPersistenceSec=3.5\n"
        "logJson=yes\n"
        "unknownKey=1\n"
        "no equals sign here\n");
    Config c;
    ASSERT_TRUE(c.loadFromFile(path));
    EXPECT_EQ(c.instrument, "ETH-USDT-SWAP");
    EXPECT_FALSE(c.paperTrading());
    EXPECT_DOUBLE_EQ(c.wallPersistenceSec, 3.5);
    EXPECT_TRUE(c.logJson);
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingFileReturnsFalse) {
    Config c;
    EXPECT_FALSE(c.loadFromFile("/nonexistent/hunt.conf"));
    EXPECT_EQ(c.instrument, "BTC-USDT-SWAP");
}

TEST(ConfigTest, SwappedSpreadBandIsNormalized) {
    const auto path = writeTemp("hunt_cfg_band.conf", "minSpreadBps=300\nmaxSpreadBps=40\n");
    Config c;
    ASSERT_TRUE(c.loadFromFile(path));
    EXPECT_DOUBLE_EQ(c.minSpreadBps, 40);
    EXPECT_DOUBLE_EQ(c.maxSpreadBps, 300);
    std::remove(path.c_str());
}

TEST(ConfigTest, EnvironmentOverlaysCredentials) {
    ::setenv("OKX_API_KEY", "k", 1);
    ::setenv("OKX_SECRET_KEY", "s", 1);
    ::setenv("OKX_PASSPHRASE", "p", 1);
    ::setenv("TRADING_MODE", "live", 1);
    Config c;
    c.applyEnvironment();
    EXPECT_EQ(c.apiKey, "k");
    EXPECT_EQ(c.secretKey, "s");
    EXPECT_EQ(c.passphrase, "p");
    EXPECT_EQ(c.tradingMode, "live");
    ::unsetenv("OKX_API_KEY");
    ::unsetenv("OKX_SECRET_KEY");
    ::unsetenv("OKX_PASSPHRASE");
    ::unsetenv("TRADING_MODE");
}

TEST(ConfigTest, ValidateRequiresCredentialsInPaperMode) {
    Config c;
    std::string why;
    EXPECT_FALSE(c.validate(&why));
    EXPECT_NE(why.find("apiKey"), std::string::npos);

    c.apiKey = "k";
    c.secretKey = "s";
    c.passphrase = "p";
    EXPECT_TRUE(c.validate(&why));
}

TEST(ConfigTest, ValidateRejectsBadValues) {
    Config c;
    c.tradingMode = "live";
    EXPECT_TRUE(c.validate());

    c.tradingMode = "demo";
    EXPECT_FALSE(c.validate());
    c.tradingMode = "live";

    c.depthDropThreshold = 1.5;
    EXPECT_FALSE(c.validate());
    c.depthDropThreshold = 0.5;

    c.maxDailyLoss = 0;
    EXPECT_FALSE(c.validate());
}
