#include "hunt/exec/DryRunExecutionClient.hpp"
#include <gtest/gtest.h>

using namespace hunt;

TEST(DryRunExecutionClientTest, PlacesAndCancelsOrders) {
    DryRunExecutionClient exec(5000);
    OrderRequest req;
    req.instrument = "BTC-USDT-SWAP";
    req.size = 0.01;

    auto a = exec.placeOrder(req);
    auto b = exec.placeOrder(req);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(*a, *b);
    EXPECT_EQ(a->rfind("dry-", 0), 0u);
    EXPECT_EQ(exec.openOrders("BTC-USDT-SWAP"), 2u);
    EXPECT_EQ(exec.placed(), 2u);

    auto n = exec.cancelAll("BTC-USDT-SWAP");
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 2u);
    EXPECT_EQ(exec.openOrders("BTC-USDT-SWAP"), 0u);
    EXPECT_EQ(exec.cancelCalls(), 1u);
}

TEST(DryRunExecutionClientTest, RejectsInvalidOrders) {
    DryRunExecutionClient exec;
    OrderRequest req;
    req.instrument = "X";
    req.size = 0;
    EXPECT_FALSE(exec.placeOrder(req).has_value());

    req.size = 1;
    req.type = OrderType::Limit;
    auto r = exec.placeOrder(req);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().path, "X");
    EXPECT_EQ(exec.placed(), 0u);
}

TEST(DryRunExecutionClientTest, AccountStateIsWhatWasSet) {
    DryRunExecutionClient exec(10000);
    EXPECT_DOUBLE_EQ(exec.balance()->total, 10000);

    exec.setBalance(9000, 8000);
    EXPECT_DOUBLE_EQ(exec.balance()->available, 8000);

    Position p;
    p.instrument = "ETH-USDT-SWAP";
    p.size = 2;
    exec.setPosition(p);
    ASSERT_EQ(exec.positions()->size(), 1u);
    p.size = 0;
    exec.setPosition(p);
    EXPECT_TRUE(exec.positions()->empty());

    EXPECT_DOUBLE_EQ(exec.averageLatencyMs(), 0.0);
    exec.setLatencyMs(12.5);
    EXPECT_DOUBLE_EQ(exec.averageLatencyMs(), 12.5);
}
