/**
 * ============================================================================
 * NetGuard DecisionEngine Unit Tests
 * ============================================================================
 */

#include "../../../src/Detection/DecisionEngine.hpp"

#include <gtest/gtest.h>

using namespace NetGuard;
using namespace NetGuard::Detection;

namespace {

	Core::ClassificationResult Scored(double score) {
		Core::ClassificationResult r;
		r.subject = "subject";
		r.score = score;
		r.modelVersion = 1;
		return r;
	}

	Core::DomainOverride Override(const std::string& domain, Core::OverrideKind kind) {
		Core::DomainOverride ov;
		ov.domain = domain;
		ov.kind = kind;
		ov.createdAt = Core::Clock::now();
		return ov;
	}

}  // namespace

// ============================================================================
// THRESHOLD
// ============================================================================

/**
 * @brief Threshold is linear between the configured bounds
 */
TEST(DecisionEngineTest, ThresholdMapping) {
	const DecisionOptions options;
	EXPECT_NEAR(DecisionEngine::ThresholdFor(0, options), 0.95, 1e-12);
	EXPECT_NEAR(DecisionEngine::ThresholdFor(100, options), 0.05, 1e-12);
	EXPECT_NEAR(DecisionEngine::ThresholdFor(50, options), 0.5, 1e-12);
	EXPECT_LT(DecisionEngine::ThresholdFor(60, options), DecisionEngine::ThresholdFor(40, options));
}

/**
 * @brief Sensitivity outside 0..100 is rejected and the old value kept
 */
TEST(DecisionEngineTest, SensitivityValidation) {
	DecisionEngine engine;
	EXPECT_THROW(engine.SetSensitivity(-1), Core::ValidationError);
	EXPECT_THROW(engine.SetSensitivity(101), Core::ValidationError);
	EXPECT_EQ(engine.Sensitivity(), 50);
	EXPECT_THROW(DecisionEngine(DecisionOptions{}, 150), Core::ValidationError);
}

/**
 * @brief Raising sensitivity never turns a block into a weaker verdict
 */
TEST(DecisionEngineTest, MonotonicInSensitivity) {
	DecisionEngine engine;
	for (double score = 0.0; score <= 1.0; score += 0.05) {
		int previous = -1;
		for (int s = 0; s <= 100; s += 5) {
			engine.SetSensitivity(s);
			const int verdict = static_cast<int>(engine.Decide("d.example", Scored(score)).verdict);
			EXPECT_GE(verdict, previous) << "score=" << score << " sensitivity=" << s;
			previous = verdict;
		}
	}
}

// ============================================================================
// VERDICTS
// ============================================================================

/**
 * @brief Score bands map to block, observe and allow
 */
TEST(DecisionEngineTest, ScoreBands) {
	DecisionEngine engine(DecisionOptions{}, 50);   // threshold 0.5
	EXPECT_EQ(engine.Decide("a.example", Scored(0.51)).verdict, Core::Verdict::Block);
	EXPECT_EQ(engine.Decide("a.example", Scored(0.97)).verdict, Core::Verdict::Block);
	EXPECT_EQ(engine.Decide("a.example", Scored(0.49)).verdict, Core::Verdict::Observe);
	EXPECT_EQ(engine.Decide("a.example", Scored(0.41)).verdict, Core::Verdict::Observe);
	EXPECT_EQ(engine.Decide("a.example", Scored(0.39)).verdict, Core::Verdict::Allow);
	EXPECT_EQ(engine.Decide("a.example", Scored(0.0)).verdict, Core::Verdict::Allow);

	const auto d = engine.Decide("a.example", Scored(0.7));
	EXPECT_EQ(d.reason, Core::DecisionReason::Classifier);
	EXPECT_DOUBLE_EQ(d.score, 0.7);
	EXPECT_FALSE(d.conflict);
}

/**
 * @brief Manual block wins over a low score
 */
TEST(DecisionEngineTest, ManualBlockOverridesScore) {
	DecisionEngine engine;
	engine.UpsertOverride(Override("casino.example", Core::OverrideKind::Block));

	const auto d = engine.Decide("casino.example", Scored(0.01));
	EXPECT_EQ(d.verdict, Core::Verdict::Block);
	EXPECT_EQ(d.reason, Core::DecisionReason::ManualBlock);
}

/**
 * @brief Manual allow suppressing a classifier block is flagged as a conflict
 */
TEST(DecisionEngineTest, ManualAllowConflict) {
	DecisionEngine engine;
	engine.UpsertOverride(Override("games.example", Core::OverrideKind::Allow));

	const auto high = engine.Decide("games.example", Scored(0.99));
	EXPECT_EQ(high.verdict, Core::Verdict::Allow);
	EXPECT_EQ(high.reason, Core::DecisionReason::ManualAllow);
	EXPECT_TRUE(high.conflict);

	const auto low = engine.Decide("games.example", Scored(0.1));
	EXPECT_EQ(low.verdict, Core::Verdict::Allow);
	EXPECT_FALSE(low.conflict);
}

/**
 * @brief Overrides cover subdomains and the most specific one wins
 */
TEST(DecisionEngineTest, LongestOverrideWins) {
	DecisionEngine engine;
	engine.UpsertOverride(Override("example.com", Core::OverrideKind::Block));
	engine.UpsertOverride(Override("docs.example.com", Core::OverrideKind::Allow));

	EXPECT_EQ(engine.Decide("cdn.example.com", Scored(0.0)).verdict, Core::Verdict::Block);
	EXPECT_EQ(engine.Decide("api.docs.example.com", Scored(0.9)).verdict, Core::Verdict::Allow);
	EXPECT_FALSE(engine.FindOverride("notexample.com").has_value());
}

/**
 * @brief Upsert replaces, Remove restores classifier control
 */
TEST(DecisionEngineTest, UpsertAndRemoveOverride) {
	DecisionEngine engine;
	engine.UpsertOverride(Override("flip.example", Core::OverrideKind::Block));
	engine.UpsertOverride(Override("flip.example", Core::OverrideKind::Allow));
	EXPECT_EQ(engine.FindOverride("flip.example")->kind, Core::OverrideKind::Allow);

	engine.RemoveOverride("flip.example");
	const auto d = engine.Decide("flip.example", Scored(0.9));
	EXPECT_EQ(d.reason, Core::DecisionReason::Classifier);
	EXPECT_EQ(d.verdict, Core::Verdict::Block);
}
