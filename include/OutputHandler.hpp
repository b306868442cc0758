#pragma once

#include <string_view>
#include <format>
#include <array>
#include <algorithm>
#include <memory>

#include "Constants.hpp"
#include "ThreadSafeQueue.hpp"
#include "Types.hpp"

/**
 * @brief Output Category
 * @details Events are data for downstream consumers (stdout); diagnostics
 * go to stderr. The regulator never decides the stream itself.
 */
enum class MsgType {
    Data,   // Supply / auction events
    Error,  // [ERROR] diagnostics
    Info    // [INFO] diagnostics
};

/**
 * @brief Fixed-size message carrier.
 * @details A std::array instead of std::string keeps every push a single
 * contiguous copy with no heap allocation.
 */
struct OutputEnvelope {
    // Sized for the widest event at full 256-bit precision; only free-text diagnostics truncate.
    std::array<char, Config::ENVELOPE_SIZE> buffer;
    size_t length{0};
    MsgType type{MsgType::Data};

    OutputEnvelope() = default;
    explicit OutputEnvelope(MsgType t) noexcept : type(t) { buffer.fill(0); }

    std::string_view view() const { return {buffer.data(), length}; }
};

/**
 * @brief The Event & Log Gateway
 * @details Formats each event as one CSV line into an OutputEnvelope and
 * hands it to the queue. Consumers decide where the line ends up.
 */
class OutputHandler {
private:
    std::shared_ptr<ThreadSafeQueue<OutputEnvelope>> queue_;

    /**
     * @brief Formats straight into a stack envelope and moves it into the queue.
     * @details std::format_to_n truncates instead of overflowing; length is
     * clamped to what was actually written.
     */
    template <typename... Args>
    void enqueue(MsgType type, std::format_string<Args...> fmt, Args&&... args) {
        OutputEnvelope env(type);

        auto result = std::format_to_n(env.buffer.data(),
                                       env.buffer.size() - 1,
                                       fmt,
                                       std::forward<Args>(args)...);

        env.length = std::min(static_cast<size_t>(result.size), env.buffer.size() - 1);
        env.buffer[env.length] = '\0';

        queue_->push(std::move(env));
    }

public:
    explicit OutputHandler(std::shared_ptr<ThreadSafeQueue<OutputEnvelope>> queue) : queue_(std::move(queue)) {}

    // --- Supply Events ---

    void printSupplyIncrease(const SupplyIncrease& e) {
        enqueue(MsgType::Data, "SupplyIncrease, {}, {}, {}, {}, {}\n",
                e.epoch, e.price, e.newRedeemable, e.lessDebt, e.newBonded);
    }

    void printSupplyDecrease(const SupplyDecrease& e) {
        enqueue(MsgType::Data, "SupplyDecrease, {}, {}, {}\n", e.epoch, e.price, e.newDebt);
    }

    void printSupplyNeutral(const SupplyNeutral& e) {
        enqueue(MsgType::Data, "SupplyNeutral, {}\n", e.epoch);
    }

    // --- Auction Events ---

    void printBidPlaced(const BidReceipt& r) {
        enqueue(MsgType::Data, "CouponBidPlaced, {}, {}, {}, {}, {}\n",
                r.auctionEpoch, r.bidder, r.expiryEpoch, r.dollarAmount, r.couponAmount);
    }

    /**
     * @brief Settlement summary. bidToCover is 0 when nothing filled.
     */
    void printAuctionSettled(const SettlementReport& report) {
        uint64_t filled = report.stats ? report.stats->totalFilled : 0;
        Decimal bidToCover = report.stats ? report.stats->bidToCover : Decimal::zero();
        enqueue(MsgType::Data, "CouponAuctionSettled, {}, {}, {}, {}\n",
                report.auctionEpoch, report.ranked.size(), filled, bidToCover);
    }

    void printAuctionCanceled(Epoch epoch) {
        enqueue(MsgType::Data, "CouponAuctionCanceled, {}\n", epoch);
    }

    // --- Diagnostics ---

    void logError(std::string_view err) {
        enqueue(MsgType::Error, "[ERROR] {}\n", err);
    }

    void logInfo(std::string_view msg) {
        enqueue(MsgType::Info, "[INFO] {}\n", msg);
    }
};
