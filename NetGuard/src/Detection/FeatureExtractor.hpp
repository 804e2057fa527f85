#pragma once

#include "Lexicon.hpp"
#include "../Core/Types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace NetGuard {
	namespace Detection {

		/**
		 * @brief Document frequencies of the training corpus.
		 */
		struct Vocabulary {
			uint64_t documentCount = 0;
			std::unordered_map<std::string, uint64_t> documentFrequency;

			/**
			 * @brief Smoothed inverse document frequency, ln((1+N)/(1+df)) + 1.
			 *
			 * A term never seen in training gets df = 0, which yields the largest
			 * weight of the corpus rather than zero.
			 */
			[[nodiscard]] double Idf(const std::string& term) const;

			[[nodiscard]] size_t Size() const noexcept { return documentFrequency.size(); }
		};

		struct ExtractorOptions {
			size_t maxBodyChars = 3000;
			size_t minTokenLength = 2;
		};

		/**
		 * @brief Turns URLs, domains, headers and page text into weighted term vectors.
		 *
		 * Stateless apart from the immutable lexicon, so one instance may be shared
		 * by every classification worker.
		 */
		class FeatureExtractor {
		public:
			explicit FeatureExtractor(std::shared_ptr<const Lexicon> lexicon, ExtractorOptions options = {});

			/**
			 * @brief Terms of @p text in order of appearance.
			 *
			 * Words minus stopwords and short tokens, then one compound term per
			 * lexicon phrase found, then lexicon keywords embedded in longer words.
			 */
			[[nodiscard]] std::vector<std::string> Terms(std::string_view text) const;

			[[nodiscard]] std::map<std::string, uint32_t> TermCounts(std::string_view text) const;

			/// tf * idf for every term of @p text
			[[nodiscard]] Core::FeatureVector Vectorize(std::string_view text, const Vocabulary& vocabulary) const;

			// --- text composition ---

			[[nodiscard]] std::string UrlText(const std::string& url) const;
			[[nodiscard]] std::string DomainText(const std::string& domain) const;
			[[nodiscard]] std::string TransactionText(const Core::CapturedTransaction& tx) const;

			[[nodiscard]] static bool IsStopword(const std::string& word);

			[[nodiscard]] const Lexicon& GetLexicon() const noexcept { return *m_lexicon; }
			[[nodiscard]] const ExtractorOptions& Options() const noexcept { return m_options; }

		private:
			std::shared_ptr<const Lexicon> m_lexicon;
			ExtractorOptions m_options;
		};

	}  // namespace Detection
}  // namespace NetGuard
