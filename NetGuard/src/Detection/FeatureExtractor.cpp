#include "FeatureExtractor.hpp"
#include "../Utils/NetworkUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <cmath>
#include <unordered_set>

namespace NetGuard {
	namespace Detection {

		namespace {

			const std::unordered_set<std::string> STOPWORDS = {
				// English
				"the", "an", "and", "or", "of", "to", "in", "on", "for", "with", "is", "are", "was",
				"at", "by", "from", "this", "that", "it", "be", "as", "we", "you", "your", "our",
				// Indonesian
				"dan", "yang", "di", "ke", "dari", "untuk", "dengan", "ini", "itu", "atau", "pada", "juga",
				// web noise
				"www", "http", "https", "html", "htm", "php", "asp", "aspx", "jsp", "index", "com", "net",
				"org", "co"
			};

			// header names whose values carry page semantics
			const char* const SELECTED_HEADERS[] = { "content-type", "server", "title", "description" };

			std::string ExtractElement(const std::string& html, const std::string& open, const std::string& close) {
				const std::string lower = Utils::StringUtils::ToLowerCopy(html);
				auto start = lower.find(open);
				if (start == std::string::npos) return {};
				start = lower.find('>', start);
				if (start == std::string::npos) return {};
				const auto end = lower.find(close, start + 1);
				if (end == std::string::npos) return {};
				return html.substr(start + 1, end - start - 1);
			}

			std::string ExtractMetaDescription(const std::string& html) {
				const std::string lower = Utils::StringUtils::ToLowerCopy(html);
				const auto pos = lower.find("name=\"description\"");
				if (pos == std::string::npos) return {};
				const auto tagStart = lower.rfind('<', pos);
				const auto tagEnd = lower.find('>', pos);
				if (tagStart == std::string::npos || tagEnd == std::string::npos) return {};
				const auto content = lower.find("content=\"", tagStart);
				if (content == std::string::npos || content > tagEnd) return {};
				const auto valueStart = content + 9;
				const auto valueEnd = lower.find('"', valueStart);
				if (valueEnd == std::string::npos || valueEnd > tagEnd) return {};
				return html.substr(valueStart, valueEnd - valueStart);
			}

		}  // anonymous namespace

		double Vocabulary::Idf(const std::string& term) const {
			uint64_t df = 0;
			auto it = documentFrequency.find(term);
			if (it != documentFrequency.end()) df = it->second;
			return std::log((1.0 + static_cast<double>(documentCount)) / (1.0 + static_cast<double>(df))) + 1.0;
		}

		FeatureExtractor::FeatureExtractor(std::shared_ptr<const Lexicon> lexicon, ExtractorOptions options)
			: m_lexicon(lexicon ? std::move(lexicon) : std::make_shared<const Lexicon>())
			, m_options(options) {
		}

		bool FeatureExtractor::IsStopword(const std::string& word) {
			return STOPWORDS.count(word) != 0;
		}

		std::vector<std::string> FeatureExtractor::Terms(std::string_view text) const {
			const auto words = SplitWords(text);
			std::vector<std::string> terms;
			terms.reserve(words.size());

			for (const auto& w : words) {
				if (w.size() < m_options.minTokenLength || IsStopword(w)) continue;
				terms.push_back(w);
			}

			// phrases match on the raw word sequence so stopwords inside a phrase still count
			for (const auto& phrase : m_lexicon->Phrases()) {
				if (phrase.size() > words.size()) continue;
				for (size_t i = 0; i + phrase.size() <= words.size(); ++i) {
					bool match = true;
					for (size_t k = 0; k < phrase.size(); ++k) {
						if (words[i + k] != phrase[k]) {
							match = false;
							break;
						}
					}
					if (match) terms.push_back(CompoundTerm(phrase));
				}
			}

			for (const auto& w : words) {
				if (w.size() <= Lexicon::MIN_EMBEDDED_KEYWORD_LENGTH) continue;
				for (const auto& kw : m_lexicon->EmbeddableKeywords()) {
					if (w.size() > kw.size() && w.find(kw) != std::string::npos) {
						terms.push_back(kw);
					}
				}
			}
			return terms;
		}

		std::map<std::string, uint32_t> FeatureExtractor::TermCounts(std::string_view text) const {
			std::map<std::string, uint32_t> counts;
			for (auto& t : Terms(text)) ++counts[t];
			return counts;
		}

		Core::FeatureVector FeatureExtractor::Vectorize(std::string_view text, const Vocabulary& vocabulary) const {
			Core::FeatureVector fv;
			for (const auto& [term, tf] : TermCounts(text)) {
				fv.emplace(term, static_cast<double>(tf) * vocabulary.Idf(term));
			}
			return fv;
		}

		std::string FeatureExtractor::UrlText(const std::string& url) const {
			Utils::NetworkUtils::UrlComponents parts;
			if (!Utils::NetworkUtils::ParseUrl(url, parts)) {
				return url;
			}

			std::string text = parts.host;
			for (const auto& label : Utils::StringUtils::Split(parts.host, '.')) {
				text += ' ';
				text += label;
			}
			if (parts.path.size() > 1) {
				text += ' ';
				text += parts.path;
			}
			if (!parts.query.empty()) {
				text += ' ';
				text += parts.query;
			}
			return text;
		}

		std::string FeatureExtractor::DomainText(const std::string& domain) const {
			return UrlText("http://" + domain + "/");
		}

		std::string FeatureExtractor::TransactionText(const Core::CapturedTransaction& tx) const {
			std::string text = UrlText(tx.url.empty() ? "http://" + tx.host + "/" : tx.url);

			for (const auto& [name, value] : tx.responseHeaders) {
				for (const char* wanted : SELECTED_HEADERS) {
					if (Utils::StringUtils::IEquals(name, wanted)) {
						text += ' ';
						text += value;
					}
				}
			}

			if (!tx.responseBody.empty()) {
				const std::string title = ExtractElement(tx.responseBody, "<title", "</title>");
				if (!title.empty()) {
					text += ' ';
					text += title;
				}
				const std::string description = ExtractMetaDescription(tx.responseBody);
				if (!description.empty()) {
					text += ' ';
					text += description;
				}
				const std::string plain = Utils::StringUtils::StripHtmlTags(tx.responseBody);
				text += ' ';
				text += Utils::StringUtils::TruncateUtf8(plain, m_options.maxBodyChars);
			}
			return text;
		}

	}  // namespace Detection
}  // namespace NetGuard
