/*
Vigil — Timeframe & Symbol Tests
Role: Verify timeframe parsing/ordering and symbol normalization
Testing Strategy: Table of inputs → parsed value or rejection
Coverage: Standard frames, custom frames, m/M disambiguation, bad input, symbols, analysis kinds
*/
#include <gtest/gtest.h>
#include "marketintel/model/Errors.hpp"
#include "marketintel/model/MarketTypes.hpp"
#include "marketintel/model/Timeframe.hpp"
#include <algorithm>

using namespace Vigil;

// =============================================================================
// Parsing
// =============================================================================

TEST(Timeframe, ParsesStandardFrames) {
    for (const char* text : {"1m", "5m", "15m", "30m", "1h", "4h", "1d", "1w", "1M"}) {
        auto tf = Timeframe::parse(text);
        ASSERT_TRUE(tf.has_value()) << text;
        EXPECT_TRUE(tf->isStandard()) << text;
        EXPECT_EQ(tf->toString(), text);
    }
}

TEST(Timeframe, MinutesAndMonthsAreDistinct) {
    auto minute = Timeframe::parse("1m");
    auto month = Timeframe::parse("1M");
    ASSERT_TRUE(minute && month);

    EXPECT_EQ(minute->unit(), TimeUnit::Minutes);
    EXPECT_EQ(month->unit(), TimeUnit::Months);
    EXPECT_EQ(minute->seconds(), 60u);
    EXPECT_EQ(month->seconds(), 30u * 86400u);
}

TEST(Timeframe, CustomFramesAreAccepted) {
    auto tf = Timeframe::parse("90m");
    ASSERT_TRUE(tf.has_value());
    EXPECT_EQ(tf->value(), 90u);
    EXPECT_FALSE(tf->isStandard());
    EXPECT_EQ(tf->seconds(), 5400u);
}

TEST(Timeframe, SurroundingSpacesAreTrimmed) {
    auto tf = Timeframe::parse(" 4h ");
    ASSERT_TRUE(tf.has_value());
    EXPECT_EQ(tf->toString(), "4h");
}

TEST(Timeframe, RejectsMalformedInput) {
    for (const char* text : {"", "m", "0m", "1x", "h1", "1.5h", "-1m", "1 m", "abc"}) {
        EXPECT_FALSE(Timeframe::parse(text).has_value()) << "'" << text << "'";
    }
}

TEST(Timeframe, MakeRejectsZero) {
    EXPECT_FALSE(Timeframe::make(0, TimeUnit::Hours).has_value());
    EXPECT_TRUE(Timeframe::make(2, TimeUnit::Hours).has_value());
}

// =============================================================================
// Ordering
// =============================================================================

TEST(Timeframe, OrderedByLength) {
    auto frames = Timeframe::standard();
    EXPECT_TRUE(std::is_sorted(frames.begin(), frames.end()));

    EXPECT_TRUE(*Timeframe::parse("60m") < *Timeframe::parse("2h"));
    EXPECT_TRUE(*Timeframe::parse("1d") > *Timeframe::parse("4h"));
}

// =============================================================================
// Symbols & analysis kinds
// =============================================================================

TEST(Symbols, NormalizedToUpperCase) {
    EXPECT_EQ(normalizeSymbol("btc-usd"), "BTC-USD");
    EXPECT_EQ(normalizeSymbol("AAPL"), "AAPL");
}

TEST(Symbols, RejectsEmptyLongAndWhitespace) {
    EXPECT_FALSE(normalizeSymbol("").has_value());
    EXPECT_FALSE(normalizeSymbol("BTC USD").has_value());
    EXPECT_FALSE(normalizeSymbol(std::string(21, 'A')).has_value());
    EXPECT_TRUE(normalizeSymbol(std::string(20, 'A')).has_value());
}

TEST(AnalysisKinds, ParseAndPrint) {
    EXPECT_EQ(parseAnalysisKind("technical"), AnalysisKind::Technical);
    EXPECT_EQ(parseAnalysisKind("Pattern"), AnalysisKind::Pattern);
    EXPECT_EQ(parseAnalysisKind("ai_insight"), AnalysisKind::AiInsight);
    EXPECT_EQ(parseAnalysisKind("ai-insight"), AnalysisKind::AiInsight);
    EXPECT_FALSE(parseAnalysisKind("astrology").has_value());

    EXPECT_EQ(toString(AnalysisKind::Sentiment), "sentiment");
    EXPECT_EQ(toString(AnalysisKind::AiInsight), "ai-insight");
}

TEST(ContextBundle, CountsAndMissingKinds) {
    ContextBundle bundle;
    bundle.symbols = {"BTC-USD"};
    bundle.slots[AnalysisKind::Technical].result = nlohmann::json{{"last", 1.0}};
    bundle.slots[AnalysisKind::Sentiment].error = make_error_code(Errc::timeout);

    EXPECT_EQ(bundle.successCount(), 1u);
    EXPECT_FALSE(bundle.allFailed());
    ASSERT_EQ(bundle.missingKinds().size(), 1u);
    EXPECT_EQ(bundle.missingKinds()[0], AnalysisKind::Sentiment);

    auto j = bundle.toJson();
    EXPECT_TRUE(j["slots"]["technical"]["ok"].get<bool>());
    EXPECT_EQ(j["slots"]["sentiment"]["error"], "Timeout");
}
