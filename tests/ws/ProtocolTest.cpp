#include <gtest/gtest.h>
#include "hunt/ws/Protocol.hpp"

#include <limits>

using namespace hunt;
using namespace hunt::ws;

TEST(ProtocolTest, ChannelsRouteToTheirSubscriberLists) {
    EXPECT_EQ(routeForChannel("tickers"), Route::Ticker);
    EXPECT_EQ(routeForChannel("books"), Route::OrderBook);
    EXPECT_EQ(routeForChannel("books5"), Route::OrderBook);
    EXPECT_EQ(routeForChannel("books-l2-tbt"), Route::OrderBook);
    EXPECT_EQ(routeForChannel("trades"), Route::Trades);
    EXPECT_EQ(routeForChannel("liquidation-orders"), Route::Liquidation);
    EXPECT_EQ(routeForChannel("account"), Route::Account);
    EXPECT_EQ(routeForChannel("orders"), Route::Orders);
    EXPECT_EQ(routeForChannel("candle1m"), Route::Unknown);
    EXPECT_STREQ(routeName(Route::OrderBook), "orderbook");
}

TEST(ProtocolTest, SubscribeFrameListsEveryArgument) {
    std::string f = buildSubscribe({ {"books", "BTC-USDT-SWAP"}, {"trades", "BTC-USDT-SWAP"} });
    EXPECT_EQ(f, R"({"op":"subscribe","args":[{"channel":"books","instId":"BTC-USDT-SWAP"},)"
                 R"({"channel":"trades","instId":"BTC-USDT-SWAP"}]})");
}

TEST(ProtocolTest, EmptyInstrumentIsOmitted) {
    EXPECT_EQ(buildUnsubscribe({ {"account", ""} }),
              R"({"op":"unsubscribe","args":[{"channel":"account"}]})");
}

TEST(ProtocolTest, LoginFrameCarriesCredentials) {
    std::string f = buildLogin("key", "pass", "1538054050975", "sig=");
    EXPECT_EQ(f, R"({"op":"login","args":[{"apiKey":"key","passphrase":"pass",)"
                 R"("timestamp":"1538054050975","sign":"sig="}]})");
}

TEST(ProtocolTest, PongIsRecognised) {
    auto m = decode("pong");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->kind, MessageKind::Pong);
}

TEST(ProtocolTest, MalformedJsonIsAnError) {
    auto m = decode("{\"arg\":");
    ASSERT_FALSE(m);
    EXPECT_NE(m.error().message.find("bad json"), std::string::npos);
}

TEST(ProtocolTest, FrameWithoutEventOrArgIsAnError) {
    auto m = decode(R"({"data":[]})");
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().message, "frame has neither 'event' nor 'arg'");
    EXPECT_FALSE(decode("[1,2]"));
}

TEST(ProtocolTest, EventFrameFields) {
    auto m = decode(R"({"event":"subscribe","arg":{"channel":"books","instId":"ETH-USDT"}})");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->kind, MessageKind::Event);
    EXPECT_EQ(m->event, "subscribe");
    EXPECT_EQ(m->channel, "books");
    EXPECT_EQ(m->instId, "ETH-USDT");
    EXPECT_FALSE(isLoginAck(*m));
}

TEST(ProtocolTest, LoginAckRequiresZeroCode) {
    auto ok = decode(R"({"event":"login","code":"0","msg":""})");
    ASSERT_TRUE(ok);
    EXPECT_TRUE(isLoginAck(*ok));

    auto bad = decode(R"({"event":"login","code":"60009","msg":"Login failed."})");
    ASSERT_TRUE(bad);
    EXPECT_FALSE(isLoginAck(*bad));
    EXPECT_EQ(bad->msg, "Login failed.");
}

TEST(ProtocolTest, DataFrameCarriesRouteAndAction) {
    auto m = decode(R"({"arg":{"channel":"books","instId":"BTC-USDT"},"action":"update","data":[]})");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->kind, MessageKind::Data);
    EXPECT_EQ(m->route, Route::OrderBook);
    EXPECT_EQ(m->action, "update");
    EXPECT_EQ(m->instId, "BTC-USDT");
}

TEST(ProtocolTest, BookSnapshotDecodes) {
    auto m = decode(R"({"arg":{"channel":"books","instId":"BTC-USDT"},"action":"snapshot",)"
                    R"("data":[{"asks":[["101","2","0","4"]],)"
                    R"("bids":[["100","5","0","7"],["99","3","0","1"]],)"
                    R"("ts":"1597026383085","checksum":-2009969321,"seqId":123,"prevSeqId":-1}]})");
    ASSERT_TRUE(m);
    auto books = decodeBooks(*m);
    ASSERT_TRUE(books);
    ASSERT_EQ(books->size(), 1u);
    const BookUpdate& u = books->front();
    EXPECT_TRUE(u.snapshot);
    EXPECT_EQ(u.instrument, "BTC-USDT");
    ASSERT_EQ(u.bids.size(), 2u);
    ASSERT_EQ(u.asks.size(), 1u);
    EXPECT_DOUBLE_EQ(u.bids[0].price, 100.0);
    EXPECT_DOUBLE_EQ(u.bids[0].size, 5.0);
    EXPECT_EQ(u.bids[0].orderCount, 7u);
    EXPECT_EQ(u.asks[0].orderCount, 4u);
    EXPECT_EQ(u.checksum, -2009969321);
    EXPECT_EQ(u.seq.seqId, 123);
    EXPECT_EQ(u.seq.prevSeqId, -1);
    EXPECT_EQ(u.timestampMs, 1597026383085);
}

TEST(ProtocolTest, BookUpdateWithThreeElementLevels) {
    auto m = decode(R"({"arg":{"channel":"books","instId":"BTC-USDT"},"action":"update",)"
                    R"("data":[{"asks":[["101","0","3"]],"bids":[],"checksum":"5"}]})");
    ASSERT_TRUE(m);
    auto books = decodeBooks(*m);
    ASSERT_TRUE(books);
    const BookUpdate& u = books->front();
    EXPECT_FALSE(u.snapshot);
    ASSERT_EQ(u.asks.size(), 1u);
    EXPECT_DOUBLE_EQ(u.asks[0].size, 0.0);
    EXPECT_EQ(u.asks[0].orderCount, 3u);
    EXPECT_EQ(u.checksum, 5);
    EXPECT_EQ(u.seq.seqId, -1);
}

TEST(ProtocolTest, ChannelWithoutActionIsSnapshot) {
    auto m = decode(R"({"arg":{"channel":"books5","instId":"X"},"data":[{"asks":[],"bids":[]}]})");
    ASSERT_TRUE(m);
    auto books = decodeBooks(*m);
    ASSERT_TRUE(books);
    EXPECT_TRUE(books->front().snapshot);
}

TEST(ProtocolTest, MalformedBookLevelsAreErrors) {
    auto missing = decode(R"({"arg":{"channel":"books","instId":"X"}})");
    ASSERT_TRUE(missing);
    EXPECT_FALSE(decodeBooks(*missing));

    auto shortLevel = decode(R"({"arg":{"channel":"books","instId":"X"},"data":[{"bids":[["100"]]}]})");
    ASSERT_TRUE(shortLevel);
    EXPECT_FALSE(decodeBooks(*shortLevel));

    auto text = decode(R"({"arg":{"channel":"books","instId":"X"},"data":[{"bids":[["abc","1"]]}]})");
    ASSERT_TRUE(text);
    EXPECT_FALSE(decodeBooks(*text));
}

TEST(ProtocolTest, TradesDecode) {
    auto m = decode(R"({"arg":{"channel":"trades","instId":"BTC-USDT"},"data":[)"
                    R"({"instId":"BTC-USDT","tradeId":"130639474","px":"42219.9","sz":"0.12",)"
                    R"("side":"sell","ts":"1630048897897"},)"
                    R"({"instId":"BTC-USDT","tradeId":"130639475","px":"42220","sz":"1","side":"buy","ts":"1630048897900"}]})");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->route, Route::Trades);
    auto trades = decodeTrades(*m);
    ASSERT_TRUE(trades);
    ASSERT_EQ(trades->size(), 2u);
    EXPECT_EQ((*trades)[0].side, TradeSide::Sell);
    EXPECT_DOUBLE_EQ((*trades)[0].price, 42219.9);
    EXPECT_DOUBLE_EQ((*trades)[0].size, 0.12);
    EXPECT_EQ((*trades)[0].tradeId, "130639474");
    EXPECT_EQ((*trades)[0].timestampMs, 1630048897897);
    EXPECT_EQ((*trades)[1].side, TradeSide::Buy);
}

TEST(ProtocolTest, TradeWithoutPriceIsAnError) {
    auto m = decode(R"({"arg":{"channel":"trades","instId":"X"},"data":[{"sz":"1","side":"buy"}]})");
    ASSERT_TRUE(m);
    auto trades = decodeTrades(*m);
    ASSERT_FALSE(trades);
    EXPECT_EQ(trades.error().path, "trades");
}

TEST(ProtocolTest, NonFiniteLevelValuesAreErrors) {
    auto nanPrice = decode(R"({"arg":{"channel":"books","instId":"X"},"data":[{"bids":[["nan","1"]]}]})");
    ASSERT_TRUE(nanPrice);
    EXPECT_FALSE(decodeBooks(*nanPrice));

    auto infSize = decode(R"({"arg":{"channel":"books","instId":"X"},"data":[{"asks":[["101","inf"]]}]})");
    ASSERT_TRUE(infSize);
    EXPECT_FALSE(decodeBooks(*infSize));
}

TEST(ProtocolTest, NonFiniteTradePriceIsAnError) {
    auto m = decode(R"({"arg":{"channel":"trades","instId":"X"},"data":[{"px":"inf","sz":"1","side":"buy"}]})");
    ASSERT_TRUE(m);
    EXPECT_FALSE(decodeTrades(*m));
}

TEST(ProtocolTest, HugeOrderCountIsClamped) {
    auto m = decode(R"({"arg":{"channel":"books","instId":"X"},"data":[{"bids":[["100","1","0","1e12"]]}]})");
    ASSERT_TRUE(m);
    auto books = decodeBooks(*m);
    ASSERT_TRUE(books);
    EXPECT_EQ(books->front().bids[0].orderCount, std::numeric_limits<uint32_t>::max());
}
