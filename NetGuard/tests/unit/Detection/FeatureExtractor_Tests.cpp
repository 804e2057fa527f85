/**
 * ============================================================================
 * NetGuard FeatureExtractor / Lexicon Unit Tests
 * ============================================================================
 */

#include "../../../src/Detection/FeatureExtractor.hpp"
#include "../../TestHelpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

using namespace NetGuard;
using namespace NetGuard::Detection;

namespace {

	std::shared_ptr<const FeatureExtractor> MakeExtractor(const std::vector<std::string>& languages = { "en", "id" }) {
		auto lexicon = std::make_shared<const Lexicon>(Lexicon::Load(languages, {}));
		return std::make_shared<const FeatureExtractor>(lexicon);
	}

	bool Contains(const std::vector<std::string>& terms, const std::string& term) {
		return std::find(terms.begin(), terms.end(), term) != terms.end();
	}

}  // namespace

// ============================================================================
// TOKENIZATION
// ============================================================================

/**
 * @brief Words are lower-cased and split on punctuation
 */
TEST(FeatureExtractorTest, SplitWordsLowercases) {
	const auto words = SplitWords("Slot-Gacor.COM/Daftar?ref=123");
	const std::vector<std::string> expected = { "slot", "gacor", "com", "daftar", "ref", "123" };
	EXPECT_EQ(words, expected);
}

/**
 * @brief Stopwords and single characters are dropped
 */
TEST(FeatureExtractorTest, StopwordsRemoved) {
	auto extractor = MakeExtractor();
	const auto terms = extractor->Terms("the casino and a poker room www com");
	EXPECT_TRUE(Contains(terms, "casino"));
	EXPECT_TRUE(Contains(terms, "poker"));
	EXPECT_TRUE(Contains(terms, "room"));
	EXPECT_FALSE(Contains(terms, "the"));
	EXPECT_FALSE(Contains(terms, "and"));
	EXPECT_FALSE(Contains(terms, "a"));
	EXPECT_FALSE(Contains(terms, "www"));
}

/**
 * @brief Multi-word lexicon entries produce compound terms
 */
TEST(FeatureExtractorTest, PhraseDetection) {
	auto extractor = MakeExtractor();
	const auto terms = extractor->Terms("Agen Sabung Ayam terpercaya");
	EXPECT_TRUE(Contains(terms, "sabung_ayam"));
	EXPECT_TRUE(Contains(terms, "sabung"));
	EXPECT_TRUE(Contains(terms, "ayam"));
}

/**
 * @brief Keywords hidden inside concatenated domain labels are found
 */
TEST(FeatureExtractorTest, EmbeddedKeywordDetection) {
	auto extractor = MakeExtractor();
	const auto terms = extractor->Terms("megacasino88 slotgacorhariini");
	EXPECT_TRUE(Contains(terms, "casino"));
	EXPECT_TRUE(Contains(terms, "slot"));
	EXPECT_TRUE(Contains(terms, "megacasino88"));
}

/**
 * @brief Term counts accumulate repeated occurrences
 */
TEST(FeatureExtractorTest, TermCounts) {
	auto extractor = MakeExtractor();
	const auto counts = extractor->TermCounts("bonus bonus bonus jackpot");
	EXPECT_EQ(counts.at("bonus"), 3u);
	EXPECT_EQ(counts.at("jackpot"), 1u);
}

// ============================================================================
// TF-IDF
// ============================================================================

/**
 * @brief Unseen terms get the largest idf of the corpus
 */
TEST(FeatureExtractorTest, IdfOfUnseenTermIsMaximal) {
	Vocabulary vocab;
	vocab.documentCount = 4;
	vocab.documentFrequency = { {"common", 4}, {"rare", 1} };

	EXPECT_DOUBLE_EQ(vocab.Idf("common"), std::log(5.0 / 5.0) + 1.0);
	EXPECT_GT(vocab.Idf("rare"), vocab.Idf("common"));
	EXPECT_GT(vocab.Idf("never"), vocab.Idf("rare"));
}

/**
 * @brief Vectorize multiplies term frequency by idf
 */
TEST(FeatureExtractorTest, VectorizeWeights) {
	auto extractor = MakeExtractor({ "en" });
	Vocabulary vocab;
	vocab.documentCount = 3;
	vocab.documentFrequency = { {"poker", 1} };

	const auto fv = extractor->Vectorize("poker poker night", vocab);
	ASSERT_EQ(fv.count("poker"), 1u);
	EXPECT_DOUBLE_EQ(fv.at("poker"), 2.0 * vocab.Idf("poker"));
	EXPECT_DOUBLE_EQ(fv.at("night"), vocab.Idf("night"));
}

// ============================================================================
// TEXT COMPOSITION
// ============================================================================

/**
 * @brief URL text includes host labels, path and query
 */
TEST(FeatureExtractorTest, UrlText) {
	auto extractor = MakeExtractor();
	const std::string text = extractor->UrlText("https://judi-online.example/daftar?bonus=100");
	const auto terms = extractor->Terms(text);
	EXPECT_TRUE(Contains(terms, "judi"));
	EXPECT_TRUE(Contains(terms, "online"));
	EXPECT_TRUE(Contains(terms, "daftar"));
	EXPECT_TRUE(Contains(terms, "bonus"));
}

/**
 * @brief Page title, meta description and visible body text all contribute
 */
TEST(FeatureExtractorTest, TransactionText) {
	auto extractor = MakeExtractor();
	Core::CapturedTransaction tx;
	tx.url = "http://portal.example/";
	tx.host = "portal.example";
	tx.responseStatus = 200;
	tx.responseHeaders = { {"Content-Type", "text/html"}, {"X-Ignored", "ignoredvalue"} };
	tx.responseBody =
		"<html><head><title>Live Roulette</title>"
		"<meta name=\"description\" content=\"Best jackpot offers\">"
		"<script>var hiddenscript = 1;</script></head>"
		"<body><p>Register for a welcome bonus</p></body></html>";

	const auto terms = extractor->Terms(extractor->TransactionText(tx));
	EXPECT_TRUE(Contains(terms, "roulette"));
	EXPECT_TRUE(Contains(terms, "jackpot"));
	EXPECT_TRUE(Contains(terms, "bonus"));
	EXPECT_TRUE(Contains(terms, "portal"));
	EXPECT_FALSE(Contains(terms, "ignoredvalue"));
	EXPECT_FALSE(Contains(terms, "hiddenscript"));
}

/**
 * @brief Body text beyond the configured limit is ignored
 */
TEST(FeatureExtractorTest, BodyTruncation) {
	auto lexicon = std::make_shared<const Lexicon>();
	ExtractorOptions options;
	options.maxBodyChars = 20;
	FeatureExtractor extractor(lexicon, options);

	Core::CapturedTransaction tx;
	tx.url = "http://site.example/";
	tx.responseBody = std::string(40, 'x') + " farawayterm";
	EXPECT_FALSE(Contains(extractor.Terms(extractor.TransactionText(tx)), "farawayterm"));
}

// ============================================================================
// LEXICON
// ============================================================================

/**
 * @brief A lexicon file extends a built-in language and adds a new one
 */
TEST(LexiconTest, LoadMergesFiles) {
	Testing::TempDir dir("lexicon");
	Testing::WriteFile(dir / "en.json", R"({"language":"en","gambling":["pachinko"],"benign":["gardening"]})");
	Testing::WriteFile(dir / "ms.json", R"({"gambling":["judi bola"],"benign":["berita"]})");

	const Lexicon lexicon = Lexicon::Load({ "en", "ms" }, dir.Path());
	EXPECT_TRUE(lexicon.IsGamblingTerm("casino"));
	EXPECT_TRUE(lexicon.IsGamblingTerm("pachinko"));
	EXPECT_TRUE(lexicon.IsGamblingTerm("judi_bola"));
	EXPECT_EQ(lexicon.BenignTerms().count("gardening"), 1u);
	ASSERT_EQ(lexicon.Languages().size(), 2u);
	EXPECT_EQ(lexicon.Languages()[1], "ms");
}

/**
 * @brief Unknown language without a file is a configuration error
 */
TEST(LexiconTest, UnknownLanguageRejected) {
	Testing::TempDir dir("lexicon");
	EXPECT_THROW(Lexicon::Load({ "xx" }, dir.Path()), Core::ConfigError);
}

/**
 * @brief Malformed lexicon files are configuration errors
 */
TEST(LexiconTest, MalformedFileRejected) {
	Testing::TempDir dir("lexicon");
	Testing::WriteFile(dir / "en.json", R"({"gambling": "casino"})");
	EXPECT_THROW(Lexicon::Load({ "en" }, dir.Path()), Core::ConfigError);
}

/**
 * @brief Seed corpus yields one labelled example per keyword
 */
TEST(LexiconTest, SeedCorpusCoversBothClasses) {
	const Lexicon lexicon = Lexicon::Load({ "en" }, {});
	const auto corpus = lexicon.SeedCorpus();
	EXPECT_EQ(corpus.size(), lexicon.GamblingTerms().size() + lexicon.BenignTerms().size());
	const auto gambling = std::count_if(corpus.begin(), corpus.end(),
		[](const Core::TrainingExample& e) { return e.label == Core::Label::Gambling; });
	EXPECT_EQ(static_cast<size_t>(gambling), lexicon.GamblingTerms().size());
}
