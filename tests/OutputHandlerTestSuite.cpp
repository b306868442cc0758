#include <gtest/gtest.h>
#include <thread>
#include <limits>
#include <format>
#include "OutputHandler.hpp"
#include "TestDoubles.hpp"

class OutputHandlerTestSuite : public ::testing::Test {
protected:
    std::shared_ptr<ThreadSafeQueue<OutputEnvelope>> queue;
    OutputHandler handler;

    OutputHandlerTestSuite()
        : queue(std::make_shared<ThreadSafeQueue<OutputEnvelope>>()),
          handler(queue) {}
};

// --- SECTION 1: Event Formatting ---

TEST_F(OutputHandlerTestSuite, SupplyEventLines) {
    handler.printSupplyIncrease({4, D("1.05"), D("0.5"), D("12"), D("7.25")});
    handler.printSupplyDecrease({5, D("0.95"), D("2"), std::nullopt});
    handler.printSupplyNeutral({6});

    auto lines = drainLines(*queue);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "SupplyIncrease, 4, 1.05, 0.5, 12, 7.25\n");
    EXPECT_EQ(lines[1], "SupplyDecrease, 5, 0.95, 2\n");
    EXPECT_EQ(lines[2], "SupplyNeutral, 6\n");
}

TEST_F(OutputHandlerTestSuite, AuctionEventLines) {
    handler.printBidPlaced({8, 3, 58, D("100"), D("110")});
    handler.printAuctionCanceled(8);

    SettlementReport empty;
    empty.auctionEpoch = 9;
    handler.printAuctionSettled(empty);

    auto lines = drainLines(*queue);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "CouponBidPlaced, 8, 3, 58, 100, 110\n");
    EXPECT_EQ(lines[1], "CouponAuctionCanceled, 8\n");
    EXPECT_EQ(lines[2], "CouponAuctionSettled, 9, 0, 0, 0\n");
}

TEST_F(OutputHandlerTestSuite, DiagnosticsAreTagged) {
    handler.logError("boom");
    handler.logInfo("hello");

    auto first = queue->try_pop();
    auto second = queue->try_pop();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->type, MsgType::Error);
    EXPECT_EQ(first->view(), "[ERROR] boom\n");
    EXPECT_EQ(second->type, MsgType::Info);
    EXPECT_EQ(second->view(), "[INFO] hello\n");
}

TEST_F(OutputHandlerTestSuite, WidestEventFitsAtFullPrecision) {
    Decimal widest = Decimal::max();
    std::string w = widest.toString();
    ASSERT_EQ(w.size(), 79u);

    handler.printSupplyIncrease({std::numeric_limits<Epoch>::max(), widest, widest, widest, widest});

    auto lines = drainLines(*queue);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], std::format("SupplyIncrease, {}, {}, {}, {}, {}\n",
                                    std::numeric_limits<Epoch>::max(), w, w, w, w));
}

TEST_F(OutputHandlerTestSuite, LongMessagesAreTruncatedNotOverflowed) {
    handler.logError(std::string(1000, 'x'));

    auto env = queue->try_pop();
    ASSERT_TRUE(env.has_value());
    EXPECT_EQ(env->length, Config::ENVELOPE_SIZE - 1);
    EXPECT_EQ(env->buffer[env->length], '\0');
}

// --- SECTION 2: Queue ---

TEST_F(OutputHandlerTestSuite, PopAllDrainsBatchAndStops) {
    handler.printSupplyNeutral({1});
    handler.printSupplyNeutral({2});

    std::queue<OutputEnvelope> batch;
    ASSERT_TRUE(queue->pop_all(batch));
    EXPECT_EQ(batch.size(), 2u);
    EXPECT_TRUE(queue->empty());

    queue->stop();
    std::queue<OutputEnvelope> after;
    EXPECT_FALSE(queue->pop_all(after));
}

TEST_F(OutputHandlerTestSuite, ConsumerThreadReceivesEvents) {
    std::vector<std::string> received;
    std::thread consumer([&] {
        std::queue<OutputEnvelope> batch;
        while (queue->pop_all(batch)) {
            while (!batch.empty()) {
                received.emplace_back(batch.front().view());
                batch.pop();
            }
        }
    });

    for (Epoch e = 1; e <= 50; ++e) handler.printSupplyNeutral({e});
    queue->stop();
    consumer.join();

    ASSERT_EQ(received.size(), 50u);
    EXPECT_EQ(received.front(), "SupplyNeutral, 1\n");
    EXPECT_EQ(received.back(), "SupplyNeutral, 50\n");
}
