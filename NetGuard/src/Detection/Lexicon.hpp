#pragma once

#include "../Core/Types.hpp"
#include "../Utils/JSONUtils.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace NetGuard {
	namespace Detection {

		/**
		 * @brief Lower-cased alphanumeric runs of @p text.
		 *
		 * ASCII letters and digits form words; bytes >= 0x80 are kept inside words
		 * so UTF-8 text is not split mid-character. Everything else separates.
		 */
		std::vector<std::string> SplitWords(std::string_view text);

		/// "Sabung Ayam" -> "sabung_ayam"
		std::string CompoundTerm(const std::vector<std::string>& words);

		/**
		 * @brief Keyword table for one language.
		 *
		 * Entries may be single words ("casino") or phrases ("sabung ayam").
		 */
		struct LexiconTable {
			std::string language;
			std::vector<std::string> gambling;
			std::vector<std::string> benign;
		};

		/**
		 * @brief Merged, language-tagged keyword lexicon.
		 *
		 * Built from the compiled-in tables plus any <lang>.json file found in the
		 * lexicon directory. A file for a built-in language extends it; a file for
		 * any other language adds that language.
		 *
		 * File format:
		 * @code
		 *   { "language": "id", "gambling": ["judi", "togel"], "benign": ["berita"] }
		 * @endcode
		 */
		class Lexicon {
		public:
			Lexicon() = default;

			/// Compiled-in table, empty gambling/benign lists when unknown
			static LexiconTable BuiltIn(const std::string& language);
			static std::vector<std::string> BuiltInLanguages();

			/// @throws Core::ConfigError on unreadable or malformed file
			static LexiconTable LoadFile(const std::filesystem::path& path);
			static LexiconTable FromJson(const Utils::JSON::Json& doc, const std::string& fallbackLanguage);
			static Utils::JSON::Json ToJson(const LexiconTable& table);

			/**
			 * @brief Builds the lexicon for @p languages.
			 * @throws Core::ConfigError when a language has neither a built-in table nor a file
			 */
			static Lexicon Load(const std::vector<std::string>& languages, const std::filesystem::path& directory);

			void Add(const LexiconTable& table);

			[[nodiscard]] const std::vector<std::string>& Languages() const noexcept { return m_languages; }
			[[nodiscard]] const std::set<std::string>& GamblingTerms() const noexcept { return m_gambling; }
			[[nodiscard]] const std::set<std::string>& BenignTerms() const noexcept { return m_benign; }

			/// Multi-word entries, each as its token sequence
			[[nodiscard]] const std::vector<std::vector<std::string>>& Phrases() const noexcept { return m_phrases; }

			/// Single-word gambling keywords long enough to be searched inside longer tokens
			[[nodiscard]] const std::vector<std::string>& EmbeddableKeywords() const noexcept { return m_embeddable; }

			[[nodiscard]] bool IsGamblingTerm(const std::string& term) const { return m_gambling.count(term) != 0; }

			/// One labelled example per keyword
			[[nodiscard]] std::vector<Core::TrainingExample> SeedCorpus() const;

			static constexpr size_t MIN_EMBEDDED_KEYWORD_LENGTH = 4;

		private:
			void addEntry(const std::string& raw, bool gambling);

			std::vector<std::string> m_languages;
			std::set<std::string> m_gambling;
			std::set<std::string> m_benign;
			std::vector<std::vector<std::string>> m_phrases;
			std::vector<std::string> m_embeddable;
		};

	}  // namespace Detection
}  // namespace NetGuard
