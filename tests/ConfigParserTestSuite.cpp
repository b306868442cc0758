#include <gtest/gtest.h>
#include <sstream>
#include "AccountLedger.hpp"
#include "ConfigParser.hpp"
#include "TestDoubles.hpp"

/**
 * @brief Accessor Wrapper
 * Inherits from ConfigParser to expose protected helpers for unit testing.
 */
class ConfigParserTester : public ConfigParser {
public:
    using ConfigParser::ConfigParser;
    using ConfigParser::next_field;
    using ConfigParser::try_parse_decimal;
    using ConfigParser::try_parse_uint64_t;
};

class ConfigParserTestSuite : public ::testing::Test {
protected:
    std::shared_ptr<ThreadSafeQueue<OutputEnvelope>> queue;
    OutputHandler handler;
    ConfigParserTester parser;
    RegulatorConfig config;

    ConfigParserTestSuite()
        : queue(std::make_shared<ThreadSafeQueue<OutputEnvelope>>()),
          handler(queue),
          parser(handler) {}

    std::vector<std::string> errors() { return drainLines(*queue, MsgType::Error); }
};

// --- SECTION 1: Tokenizer Helpers ---

TEST_F(ConfigParserTestSuite, TokenizerSlicing) {
    std::string_view data = "supplyChangeLimit,0.05";
    EXPECT_EQ(parser.next_field(data), "supplyChangeLimit");
    EXPECT_EQ(parser.next_field(data), "0.05");
    EXPECT_TRUE(data.empty());
}

TEST_F(ConfigParserTestSuite, TokenizerTrimming) {
    std::string_view data = "  oraclePoolRatio  ,   15 ";
    EXPECT_EQ(parser.next_field(data), "oraclePoolRatio");
    EXPECT_EQ(parser.next_field(data), "15");
}

TEST_F(ConfigParserTestSuite, TokenizerLeavesExtraFieldsBehind) {
    std::string_view data = "maxCouponExpiry, 10, 20";
    EXPECT_EQ(parser.next_field(data), "maxCouponExpiry");
    EXPECT_EQ(parser.next_field(data), "10");
    EXPECT_EQ(data, " 20");
}

// --- SECTION 2: Numeric Parsing ---

TEST_F(ConfigParserTestSuite, ParseDecimal) {
    Decimal val;
    EXPECT_TRUE(parser.try_parse_decimal("0.03", val));
    EXPECT_EQ(val, D("0.03"));
    EXPECT_FALSE(parser.try_parse_decimal("-0.03", val));
    EXPECT_FALSE(parser.try_parse_decimal("3%", val));
    EXPECT_EQ(val, D("0.03"));   // untouched on failure
}

TEST_F(ConfigParserTestSuite, ParseUint) {
    uint64_t val = 0;
    EXPECT_TRUE(parser.try_parse_uint64_t("90", val));
    EXPECT_EQ(val, 90u);
    EXPECT_FALSE(parser.try_parse_uint64_t("90.5", val));
    EXPECT_FALSE(parser.try_parse_uint64_t("", val));
    EXPECT_FALSE(parser.try_parse_uint64_t("99999999999999999999999", val));
}

// --- SECTION 3: Line Handling ---

TEST_F(ConfigParserTestSuite, AppliesKnownKeys) {
    EXPECT_TRUE(parser.parseAndApply("supplyChangeLimit, 0.05", config));
    EXPECT_TRUE(parser.parseAndApply("bootstrappingPeriod, 30", config));
    EXPECT_TRUE(parser.parseAndApply("maxBidsPerAuction, 64", config));
    EXPECT_TRUE(parser.parseAndApply("bootstrappingPrice, 1.2", config));

    EXPECT_EQ(config.supplyChangeLimit, D("0.05"));
    EXPECT_EQ(config.bootstrappingPeriod, 30u);
    EXPECT_EQ(config.maxBidsPerAuction, 64u);
    EXPECT_EQ(config.bootstrappingPrice, D("1.2"));
    EXPECT_TRUE(errors().empty());
}

TEST_F(ConfigParserTestSuite, SkipsCommentsAndBlankLines) {
    EXPECT_TRUE(parser.parseAndApply("# tuned for testnet", config));
    EXPECT_TRUE(parser.parseAndApply("   ", config));
    EXPECT_EQ(config.supplyChangeDivisor, D("25"));
}

TEST_F(ConfigParserTestSuite, RejectsUnknownKey) {
    EXPECT_FALSE(parser.parseAndApply("supplyChangeDivisr, 10", config));
    auto errs = errors();
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_NE(errs[0].find("Unknown key"), std::string::npos);
}

TEST_F(ConfigParserTestSuite, RejectsTruncatedAndExtraFields) {
    EXPECT_FALSE(parser.parseAndApply("supplyChangeLimit", config));
    EXPECT_FALSE(parser.parseAndApply("supplyChangeLimit, 0.05, 0.06", config));
    EXPECT_EQ(config.supplyChangeLimit, D("0.03"));
    EXPECT_EQ(errors().size(), 2u);
}

TEST_F(ConfigParserTestSuite, RejectsValueThatFailsValidation) {
    EXPECT_FALSE(parser.parseAndApply("oraclePoolRatio, 100", config));
    EXPECT_FALSE(parser.parseAndApply("supplyChangeDivisor, 0", config));
    EXPECT_FALSE(parser.parseAndApply("couponSupplyChangeLimit, 1.5", config));

    EXPECT_EQ(config.oraclePoolRatio, 20u);
    EXPECT_EQ(config.supplyChangeDivisor, D("25"));
    EXPECT_EQ(config.couponSupplyChangeLimit, D("0.06"));
}

// --- SECTION 4: Stream Loading ---

TEST_F(ConfigParserTestSuite, LoadsWholeStream) {
    std::istringstream in(
        "# regulator overrides\n"
        "supplyChangeDivisor, 20\n"
        "\n"
        "couponSupplyChangeDivisor, 40\n"
        "advanceIncentive, 50.5\n"
        "maxCouponExpiry, 5000\n");

    ASSERT_TRUE(parser.load(in, config));

    EXPECT_EQ(config.supplyChangeDivisor, D("20"));
    EXPECT_EQ(config.couponSupplyChangeDivisor, D("40"));
    EXPECT_EQ(config.advanceIncentive, D("50.5"));
    EXPECT_EQ(config.maxCouponExpiry, 5000u);
}

TEST_F(ConfigParserTestSuite, LoadIsAllOrNothing) {
    std::istringstream in(
        "supplyChangeDivisor, 20\n"
        "maxCouponYield, lots\n");

    EXPECT_FALSE(parser.load(in, config));
    EXPECT_EQ(config.supplyChangeDivisor, D("25"));

    auto errs = errors();
    ASSERT_EQ(errs.size(), 2u);
    EXPECT_NE(errs[1].find("line 2"), std::string::npos);
}

TEST_F(ConfigParserTestSuite, LoadedPoolRatioReachesTheLedger) {
    std::istringstream in("oraclePoolRatio, 50\n");
    ASSERT_TRUE(parser.load(in, config));

    AccountLedger ledger(config);
    ledger.incrementBalanceOfCoupons(1, 5, D("100"));

    // Half of every coupon top-up goes to the pool: 200 lands 100 in redeemable.
    SupplyAllocation a = ledger.increaseSupply(D("200"));

    EXPECT_EQ(a.newRedeemable, D("100"));
    EXPECT_EQ(ledger.poolBalance(), D("100"));
}
