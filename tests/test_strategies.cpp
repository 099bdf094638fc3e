#include <gtest/gtest.h>
#include "strategy/rules.h"
#include "strategy/strategy.h"
#include "test_helpers.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// Flat history, then the last `n_move` closes stepping by `step` percent.
static Bars flat_then_move(size_t n, size_t n_move, double step) {
  std::vector<double> closes(n, 100.0);
  for (size_t i = n - n_move; i < n; i++)
    closes[i] = closes[i - 1] * (1.0 + step);
  return bars_from_closes(closes, 0.5);
}

/// Uptrend that gives back 3% on each of its last three bars.
static Bars uptrend_then_pullback() {
  auto closes = geometric_closes(70, 100.0, 0.01);
  for (int k = 0; k < 3; k++)
    closes.push_back(closes.back() * 0.97);
  return bars_from_closes(closes, 0.5);
}

static void expect_atr_exits(const Signal& sig,
                             double stop_mult,
                             double target_mult) {
  ASSERT_TRUE(sig.atr.has_value());
  ASSERT_TRUE(sig.stop_loss.has_value());
  ASSERT_TRUE(sig.target.has_value());
  double sign = sig.direction == Direction::Buy ? 1.0 : -1.0;
  EXPECT_NEAR(*sig.stop_loss, sig.price - sign * stop_mult * *sig.atr, 1e-9);
  EXPECT_NEAR(*sig.target, sig.price + sign * target_mult * *sig.atr, 1e-9);
}

static IndicatorMap indicator_map(std::vector<std::pair<std::string, Bars>> xs) {
  IndicatorMap out;
  for (auto& [symbol, bars] : xs)
    out.emplace(symbol, Indicators{symbol, std::move(bars)});
  return out;
}

// ─── Multi indicator vote ────────────────────────────────────────────────────

TEST(Voting, FlatThirtyBarsIsWatchWithNoMajority) {
  auto ind = make_indicators("FLAT", flat_bars(30));
  auto sig = indicator_vote(ind);

  EXPECT_EQ(sig.direction, Direction::Watch);
  EXPECT_EQ(sig.strategy, StrategyType::Voting);
  EXPECT_EQ(sig.rationale, "no majority: 0 buy / 0 sell / 7 neutral");
  ASSERT_TRUE(sig.tally.has_value());
  EXPECT_EQ(*sig.tally, (VoteTally{0, 0, 7}));
  EXPECT_FALSE(sig.stop_loss.has_value());
  EXPECT_FALSE(sig.target.has_value());
  EXPECT_TRUE(sig.valid());
}

TEST(Voting, TallyAlwaysCountsSevenVotes) {
  for (unsigned seed = 0; seed < 20; seed++) {
    auto ind = make_indicators("W", random_bars(120, seed));
    auto sig = indicator_vote(ind);
    ASSERT_TRUE(sig.tally.has_value());
    EXPECT_EQ(sig.tally->total(), N_VOTES);
    EXPECT_TRUE(sig.valid()) << sig.rationale;
  }
}

TEST(Voting, DirectionalConfidenceIsVoteShare) {
  for (unsigned seed = 0; seed < 40; seed++) {
    auto ind = make_indicators("W", random_bars(120, seed));
    auto sig = indicator_vote(ind);
    if (!sig.directional())
      continue;
    int n = sig.direction == Direction::Buy ? sig.tally->buy : sig.tally->sell;
    EXPECT_NEAR(sig.confidence, static_cast<double>(n) / N_VOTES, 1e-12);
    EXPECT_GE(n, 3);
  }
}

TEST(VoteTally, DecideNeedsMajorityAndLead) {
  EXPECT_EQ((VoteTally{3, 1, 3}.decide(3)), Direction::Buy);
  EXPECT_EQ((VoteTally{1, 4, 2}.decide(3)), Direction::Sell);
  EXPECT_EQ((VoteTally{3, 3, 1}.decide(3)), Direction::Watch);
  EXPECT_EQ((VoteTally{2, 0, 5}.decide(3)), Direction::Watch);
}

// ─── Single pattern rules ────────────────────────────────────────────────────

TEST(Rules, FlatSeriesKeepsPatternRulesSilent) {
  auto ind = make_indicators("FLAT", flat_bars(30));
  EXPECT_FALSE(breakout(ind, -1).has_value());
  EXPECT_FALSE(mean_reversion(ind, -1).has_value());
  EXPECT_FALSE(trend_following(ind, -1).has_value());
  EXPECT_FALSE(momentum(ind, -1).has_value());
}

TEST(Rules, MeanReversionBuysDeepSelloff) {
  // a long flat base then a sharp slide: rsi near 0, close under the band
  auto ind = make_indicators("DROP", flat_then_move(60, 6, -0.03));
  auto sig = mean_reversion(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_LT(*sig->stop_loss, sig->price);
  EXPECT_GT(*sig->target, sig->price);
  EXPECT_LE(sig->confidence, 1.0);
}

TEST(Rules, MomentumNeedsLongHistory) {
  auto ind = make_indicators("G", flat_then_move(15, 5, 0.02));
  EXPECT_FALSE(momentum(ind, -1).has_value());
}

TEST(Rules, AtrEntryMirrorsExitsForSell) {
  auto ind = make_indicators("X", flat_bars(40, 100.0, 1.0));
  auto sig = atr_entry(ind, -1, StrategyType::Breakout, Direction::Sell, 3,
                       0.7, 1.5, 2.5, "test");
  EXPECT_NEAR(*sig.stop_loss, 103.0, 1e-9);
  EXPECT_NEAR(*sig.target, 95.0, 1e-9);
  ASSERT_TRUE(sig.atr.has_value());
  EXPECT_NEAR(*sig.atr, 2.0, 1e-12);
}

TEST(Rules, AtrEntryWithoutAtrThrows) {
  auto ind = make_indicators("X", flat_bars(5));
  EXPECT_THROW(atr_entry(ind, -1, StrategyType::Breakout, Direction::Buy, 3,
                         0.7, 1.5, 2.5, "test"),
               std::invalid_argument);
}

// ─── Trend following ─────────────────────────────────────────────────────────

TEST(TrendFollowing, SteadyUptrendAgreesOnAllFourWithAdxCapped) {
  auto ind = make_indicators("USO", bars_from_closes(
                                        geometric_closes(80, 100.0, 0.01), 0.5));
  auto sig = trend_following(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->strategy, StrategyType::TrendFollowing);
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_EQ(sig->strength, 4);
  // 4/4 plus the adx bonus stays at 1
  EXPECT_DOUBLE_EQ(sig->confidence, 1.0);
  EXPECT_NE(sig->rationale.find("4/4"), std::string::npos);
  EXPECT_NE(sig->rationale.find("adx"), std::string::npos);
  expect_atr_exits(*sig, 2.0, 3.0);
}

TEST(TrendFollowing, PullbackLeavesTooFewConditions) {
  auto ind = make_indicators("USO", uptrend_then_pullback());
  EXPECT_FALSE(trend_following(ind, -1).has_value());
}

// ─── Breakout ────────────────────────────────────────────────────────────────

TEST(Breakout, CloseAboveBandOnHeavyVolumeBuys) {
  auto closes = alternating_closes(60, 100.0, 101.0);
  closes.back() = 103.0;
  auto ind = make_indicators(
      "DBC", with_last_volume(bars_from_closes(closes, 0.5), 5000));

  auto sig = breakout(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->strategy, StrategyType::Breakout);
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_GT(sig->price, *ind.bb_upper(-1));
  EXPECT_NEAR(sig->confidence, 0.7, 1e-12);
  expect_atr_exits(*sig, 1.5, 2.5);
}

TEST(Breakout, SameCloseOnOrdinaryVolumeIsSilent) {
  auto closes = alternating_closes(60, 100.0, 101.0);
  closes.back() = 103.0;
  // 1500 against a 1025 average is under 1.5x
  auto ind = make_indicators(
      "DBC", with_last_volume(bars_from_closes(closes, 0.5), 1500));

  EXPECT_GT(ind.price(-1), *ind.bb_upper(-1));
  EXPECT_FALSE(breakout(ind, -1).has_value());
}

// ─── Momentum breakout ───────────────────────────────────────────────────────

TEST(MomentumBreakout, VolumeAddsTheFourthCondition) {
  auto closes = geometric_closes(80, 100.0, 0.01);

  auto quiet = make_indicators("NVDA", bars_from_closes(closes, 0.5));
  auto sig = momentum_breakout(quiet, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_EQ(sig->strength, 3);
  EXPECT_NEAR(sig->confidence, 0.75, 1e-12);

  auto loud = make_indicators(
      "NVDA", with_last_volume(bars_from_closes(closes, 0.5), 5000));
  sig = momentum_breakout(loud, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->strategy, StrategyType::MomentumBreakout);
  EXPECT_EQ(sig->strength, 4);
  EXPECT_NEAR(sig->confidence, 1.0, 1e-12);
  expect_atr_exits(*sig, 2.0, 3.0);
}

TEST(MomentumBreakout, PriceUnderFastAverageIsSilent) {
  auto ind = make_indicators("NVDA", uptrend_then_pullback());
  EXPECT_LT(ind.price(-1), *ind.sma20(-1));
  EXPECT_FALSE(momentum_breakout(ind, -1).has_value());
}

// ─── Moving average breakout ─────────────────────────────────────────────────

TEST(MovingAverageBreakout, ChoppyAdvanceAboveBothAveragesBuys) {
  auto ind = make_indicators(
      "LQD", bars_from_closes(zigzag_closes(80, 100.0, 0.015, 0.01), 0.5));

  auto sig = ma_breakout(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->strategy, StrategyType::MovingAverageBreakout);
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_LE(*ind.rsi(-1), 70.0);
  EXPECT_NEAR(sig->confidence, 0.6, 1e-12);
  expect_atr_exits(*sig, 1.5, 2.0);
}

TEST(MovingAverageBreakout, OverboughtAdvanceIsSilent) {
  auto ind = make_indicators(
      "LQD", bars_from_closes(geometric_closes(80, 100.0, 0.01), 0.5));
  EXPECT_GT(*ind.rsi(-1), 70.0);
  EXPECT_FALSE(ma_breakout(ind, -1).has_value());
}

// ─── Gold rules ──────────────────────────────────────────────────────────────

TEST(TrendBreakout, BandBreakWithTrendAndVolumeBuys) {
  auto closes = zigzag_closes(79, 100.0, 0.015, 0.01);
  closes.push_back(closes.back() * 1.04);
  auto ind = make_indicators(
      "GLD", with_last_volume(bars_from_closes(closes, 0.5), 5000));

  auto sig = trend_breakout(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->strategy, StrategyType::TrendBreakout);
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_GT(*ind.rsi(-1), 50.0);
  EXPECT_LT(*ind.rsi(-1), 80.0);
  EXPECT_NEAR(sig->confidence, 0.8, 1e-12);
  expect_atr_exits(*sig, 2.0, 3.0);
}

TEST(TrendBreakout, BandBreakWithoutVolumeIsSilent) {
  auto closes = zigzag_closes(79, 100.0, 0.015, 0.01);
  closes.push_back(closes.back() * 1.04);
  auto ind = make_indicators("GLD", bars_from_closes(closes, 0.5));
  EXPECT_FALSE(trend_breakout(ind, -1).has_value());
}

TEST(Momentum, StrongAdvanceBuys) {
  auto ind = make_indicators(
      "GLD", bars_from_closes(geometric_closes(80, 100.0, 0.01), 0.5));
  auto sig = momentum(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->strategy, StrategyType::Momentum);
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_NEAR(sig->confidence, 0.7, 1e-12);
  expect_atr_exits(*sig, 1.5, 2.5);
}

TEST(Momentum, SlowAdvanceUnderThresholdsIsSilent) {
  // 10 day move near 2%, under the 3% bar
  auto ind = make_indicators(
      "GLD", bars_from_closes(geometric_closes(80, 100.0, 0.002), 0.5));
  EXPECT_LT(*ind.mom10(-1), 0.03);
  EXPECT_FALSE(momentum(ind, -1).has_value());
}

TEST(Fibonacci, SelloffIntoShallowRetracementBuys) {
  // range 99.5-150.5 puts the 0.382 level at 118.98
  std::vector<double> closes(20, 100.0);
  append_ramp(closes, 150.0, 15);
  append_ramp(closes, 119.0, 15);
  auto ind = make_indicators("IAU", bars_from_closes(closes, 0.5));

  auto sig = fibonacci_retracement(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->strategy, StrategyType::Fibonacci);
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_LT(*ind.rsi(-1), 40.0);
  EXPECT_NE(sig->rationale.find("0.382"), std::string::npos);
  expect_atr_exits(*sig, 1.5, 2.0);
}

TEST(Fibonacci, RallyIntoDeepRetracementSells) {
  // the 0.786 level of 99.5-150.5 is 139.59
  std::vector<double> closes(20, 150.0);
  append_ramp(closes, 100.0, 15);
  append_ramp(closes, 139.6, 15);
  auto ind = make_indicators("IAU", bars_from_closes(closes, 0.5));

  auto sig = fibonacci_retracement(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->direction, Direction::Sell);
  EXPECT_GT(*ind.rsi(-1), 60.0);
  EXPECT_NE(sig->rationale.find("0.786"), std::string::npos);
  expect_atr_exits(*sig, 1.5, 2.0);
}

TEST(Fibonacci, PriceBetweenLevelsIsSilent) {
  // 125 is more than 2% from both 118.98 and 131.02
  std::vector<double> closes(20, 100.0);
  append_ramp(closes, 150.0, 15);
  append_ramp(closes, 125.0, 15);
  auto ind = make_indicators("IAU", bars_from_closes(closes, 0.5));
  EXPECT_FALSE(fibonacci_retracement(ind, -1).has_value());
}

// ─── Bond proxies ────────────────────────────────────────────────────────────

TEST(Proxies, YieldCurveBuysLeadingLongEnd) {
  auto inds = indicator_map({
      {"TLT", flat_then_move(60, 5, 0.01)},
      {"IEF", flat_bars(60, 100.0, 0.5)},
      {"SHY", flat_bars(60, 100.0, 0.5)},
  });

  auto sigs = yield_curve(inds);
  ASSERT_EQ(sigs.size(), 1u);
  EXPECT_EQ(sigs[0].symbol, "TLT");
  EXPECT_EQ(sigs[0].strategy, StrategyType::YieldCurve);
  EXPECT_EQ(sigs[0].direction, Direction::Buy);
  EXPECT_NEAR(sigs[0].confidence, 0.8, 1e-12);
  EXPECT_NE(sigs[0].rationale.find("IEF"), std::string::npos);
}

TEST(Proxies, YieldCurveBuysShortEndWhenItLeads) {
  auto inds = indicator_map({
      {"TLT", flat_then_move(60, 5, -0.01)},
      {"SHY", flat_bars(60, 100.0, 0.5)},
  });

  auto sigs = yield_curve(inds);
  ASSERT_EQ(sigs.size(), 1u);
  EXPECT_EQ(sigs[0].symbol, "SHY");
  EXPECT_EQ(sigs[0].direction, Direction::Buy);
}

TEST(Proxies, SmallCurveMoveProducesNothing) {
  auto inds = indicator_map({
      {"TLT", flat_then_move(60, 5, 0.001)},
      {"SHY", flat_bars(60, 100.0, 0.5)},
  });
  EXPECT_TRUE(yield_curve(inds).empty());
}

TEST(Proxies, MissingProxyProducesNothing) {
  auto inds = indicator_map({{"TLT", flat_then_move(60, 5, 0.01)}});
  EXPECT_TRUE(yield_curve(inds).empty());
  EXPECT_TRUE(credit_spread(inds).empty());
}

TEST(Proxies, CreditSpreadNarrowingBuysHighYield) {
  auto inds = indicator_map({
      {"HYG", flat_then_move(60, 10, 0.005)},
      {"LQD", flat_bars(60, 100.0, 0.5)},
  });

  auto sigs = credit_spread(inds);
  ASSERT_EQ(sigs.size(), 1u);
  EXPECT_EQ(sigs[0].symbol, "HYG");
  EXPECT_EQ(sigs[0].strategy, StrategyType::CreditSpread);
  EXPECT_NEAR(sigs[0].confidence, 0.7, 1e-12);
}

TEST(Proxies, CreditSpreadWideningBuysInvestmentGrade) {
  auto inds = indicator_map({
      {"HYG", flat_then_move(60, 10, -0.005)},
      {"LQD", flat_bars(60, 100.0, 0.5)},
  });

  auto sigs = credit_spread(inds);
  ASSERT_EQ(sigs.size(), 1u);
  EXPECT_EQ(sigs[0].symbol, "LQD");
  EXPECT_EQ(sigs[0].direction, Direction::Buy);
  EXPECT_NE(sigs[0].rationale.find("widening"), std::string::npos);
  // flat bars with a 0.5 spread have an atr of 1
  EXPECT_NEAR(*sigs[0].stop_loss, 98.5, 1e-9);
  EXPECT_NEAR(*sigs[0].target, 102.0, 1e-9);
}

// ─── Strategy modules ────────────────────────────────────────────────────────

TEST(Strategy, FactoryCoversEveryClass) {
  for (auto cls : asset_classes) {
    auto st = make_strategy(cls);
    ASSERT_NE(st, nullptr);
    EXPECT_EQ(st->asset_class(), cls);
    EXPECT_FALSE(st->description().empty());
  }
}

TEST(Strategy, EveryInstrumentGetsAVote) {
  auto inds = indicator_map({
      {"A", random_bars(120, 1)},
      {"B", random_bars(120, 2)},
      {"C", flat_bars(30)},
  });

  auto candidates = make_strategy(AssetClass::Equities)->generate(inds);
  ASSERT_EQ(candidates.size(), 3u);
  for (auto& [symbol, sigs] : candidates) {
    ASSERT_FALSE(sigs.empty());
    EXPECT_EQ(sigs.front().strategy, StrategyType::Voting);
    EXPECT_EQ(sigs.front().symbol, symbol);
  }
}

TEST(Strategy, BondsAddProxySignals) {
  auto inds = indicator_map({
      {"TLT", flat_then_move(60, 5, 0.01)},
      {"SHY", flat_bars(60, 100.0, 0.5)},
  });

  auto candidates = make_strategy(AssetClass::Bonds)->generate(inds);
  auto& tlt = candidates.at("TLT");
  EXPECT_TRUE(std::any_of(tlt.begin(), tlt.end(), [](auto& s) {
    return s.strategy == StrategyType::YieldCurve;
  }));
}

TEST(Strategy, CandidatesAreWellFormedAcrossClasses) {
  for (auto cls : asset_classes) {
    IndicatorMap inds;
    for (unsigned seed = 0; seed < 8; seed++) {
      auto symbol = std::format("S{}", seed);
      inds.emplace(symbol, Indicators{symbol, random_bars(300, seed * 13 + 1)});
    }

    for (auto& [symbol, sigs] : make_strategy(cls)->generate(inds))
      for (auto& sig : sigs) {
        EXPECT_TRUE(sig.valid()) << symbol << " " << sig.name();
        EXPECT_GE(sig.confidence, 0.0);
        EXPECT_LE(sig.confidence, 1.0);
        if (sig.directional()) {
          EXPECT_TRUE(sig.stop_loss.has_value());
          EXPECT_TRUE(sig.target.has_value());
        }
      }
  }
}

// ─── Gold factors ────────────────────────────────────────────────────────────

TEST(GoldFactors, ScoresAreBounded) {
  auto ind = make_indicators("GLD", random_bars(300, 21));
  auto f = gold_factor_scores(ind, -1);
  ASSERT_TRUE(f.has_value());
  EXPECT_GE(f->score, 0.0);
  EXPECT_LE(f->score, 1.0);
}

TEST(GoldFactors, ShortHistoryHasNoScore) {
  auto ind = make_indicators("GLD", random_bars(60, 21));
  EXPECT_FALSE(gold_factor_scores(ind, -1).has_value());
}

TEST(GoldFactors, CalmSteadyAdvanceBuysAboveLongAverage) {
  // no return dispersion and 0.5% daily drift: 0.5 * 1 + 0.5 * 0.5
  auto ind = make_indicators(
      "GLD", bars_from_closes(geometric_closes(300, 100.0, 0.005), 0.5));

  auto f = gold_factor_scores(ind, -1);
  ASSERT_TRUE(f.has_value());
  EXPECT_NEAR(f->safe_haven, 1.0, 1e-6);
  EXPECT_NEAR(f->inflation_hedge, 0.5, 1e-6);

  auto sig = gold_factors(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->strategy, StrategyType::GoldFactors);
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_NEAR(sig->confidence, 0.75, 1e-6);
  EXPECT_NE(sig->rationale.find("sma200"), std::string::npos);
  expect_atr_exits(*sig, 2.0, 3.0);
}

TEST(GoldFactors, FallsBackToSma50WithoutLongAverage) {
  auto ind = make_indicators(
      "GLD", bars_from_closes(geometric_closes(150, 100.0, 0.005), 0.5));
  ASSERT_FALSE(ind.sma200(-1).has_value());

  auto sig = gold_factors(ind, -1);
  ASSERT_TRUE(sig.has_value());
  EXPECT_EQ(sig->direction, Direction::Buy);
  EXPECT_NE(sig->rationale.find("sma50"), std::string::npos);
}

TEST(GoldFactors, MiddlingScoreIsSilent) {
  // drift of 0.1% scores 0.55, between the sell and buy bars
  auto ind = make_indicators(
      "GLD", bars_from_closes(geometric_closes(300, 100.0, 0.001), 0.5));

  auto f = gold_factor_scores(ind, -1);
  ASSERT_TRUE(f.has_value());
  EXPECT_NEAR(f->score, 0.55, 1e-6);
  EXPECT_FALSE(gold_factors(ind, -1).has_value());
}

TEST(GoldFactors, SafeHavenReadsBundleVolatility) {
  auto ind = make_indicators("GLD", random_bars(300, 21));
  auto f = gold_factor_scores(ind, -1);
  ASSERT_TRUE(f.has_value());
  ASSERT_TRUE(ind.volatility(-1).has_value());

  double daily = *ind.volatility(-1) / std::sqrt(TRADING_DAYS);
  EXPECT_NEAR(f->safe_haven, 1.0 - std::min(daily * 10.0, 1.0), 1e-12);
}
