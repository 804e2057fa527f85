#include "Lexicon.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>

namespace NetGuard {
	namespace Detection {

		namespace {

			const LexiconTable BUILTIN_EN{
				"en",
				{
					"casino", "poker", "betting", "jackpot", "slots", "roulette", "blackjack", "gambling",
					"wager", "lottery", "bingo", "dice", "sportsbook", "odds", "bet365", "william hill",
					"ladbrokes", "baccarat", "sicbo", "dragon tiger", "wheel fortune", "keno", "live casino",
					"deposit", "withdraw", "bonus", "promo", "spin", "win", "lucky", "fortune", "chance",
					"prize", "bet now", "play now", "register", "sign up bonus", "sbobet", "maxbet", "ibcbet",
					"cmd368", "mansion88", "dafabet", "fun88", "w88", "m88", "agent"
				},
				{
					"news", "education", "shopping", "social", "business", "health", "technology", "sports",
					"entertainment", "government", "bank", "wikipedia", "google", "facebook", "youtube",
					"amazon", "microsoft", "apple", "netflix", "linkedin", "twitter", "instagram", "whatsapp",
					"telegram", "email", "weather", "learn", "study", "course", "tutorial", "guide", "help",
					"information", "knowledge", "research", "academic", "company", "corporate", "professional",
					"service", "support", "contact", "about", "career", "job", "work", "shop", "store", "buy",
					"sell", "product", "price", "cart", "checkout", "shipping", "delivery"
				}
			};

			const LexiconTable BUILTIN_ID{
				"id",
				{
					"judol", "judi", "taruhan", "kasino", "slot", "slot gacor", "bandar", "togel",
					"bola tangkas", "domino", "capsa", "ceme", "gaple", "sabung ayam", "tembak ikan",
					"agen", "maxwin", "daftar", "deposit pulsa"
				},
				{
					"berita", "pendidikan", "belanja", "sosial", "bisnis", "kesehatan", "teknologi",
					"olahraga", "hiburan", "pemerintah", "belajar", "kursus", "panduan", "bantuan",
					"informasi", "penelitian", "perusahaan", "layanan", "kontak", "tentang", "karir",
					"pekerjaan", "toko", "beli", "jual", "produk", "harga", "keranjang", "pengiriman"
				}
			};

			std::vector<std::string> ReadStringArray(const Utils::JSON::Json& doc, const char* key,
				const std::string& origin) {
				std::vector<std::string> out;
				auto it = doc.find(key);
				if (it == doc.end()) return out;
				if (!it->is_array()) {
					throw Core::ConfigError(origin + ": '" + key + "' must be an array of strings");
				}
				for (const auto& v : *it) {
					if (!v.is_string()) throw Core::ConfigError(origin + ": '" + key + "' must be an array of strings");
					out.push_back(v.get<std::string>());
				}
				return out;
			}

		}  // anonymous namespace

		std::vector<std::string> SplitWords(std::string_view text) {
			std::vector<std::string> words;
			std::string current;
			for (char ch : text) {
				const auto c = static_cast<unsigned char>(ch);
				if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c >= 0x80) {
					current.push_back(ch);
				}
				else if (c >= 'A' && c <= 'Z') {
					current.push_back(static_cast<char>(c - 'A' + 'a'));
				}
				else if (!current.empty()) {
					words.push_back(std::move(current));
					current.clear();
				}
			}
			if (!current.empty()) words.push_back(std::move(current));
			return words;
		}

		std::string CompoundTerm(const std::vector<std::string>& words) {
			std::string out;
			for (size_t i = 0; i < words.size(); ++i) {
				if (i) out.push_back('_');
				out += words[i];
			}
			return out;
		}

		LexiconTable Lexicon::BuiltIn(const std::string& language) {
			if (language == "en") return BUILTIN_EN;
			if (language == "id") return BUILTIN_ID;
			return LexiconTable{ language, {}, {} };
		}

		std::vector<std::string> Lexicon::BuiltInLanguages() {
			return { "en", "id" };
		}

		LexiconTable Lexicon::FromJson(const Utils::JSON::Json& doc, const std::string& fallbackLanguage) {
			if (!doc.is_object()) throw Core::ConfigError("lexicon '" + fallbackLanguage + "' must be a JSON object");

			LexiconTable table;
			table.language = fallbackLanguage;
			if (auto it = doc.find("language"); it != doc.end()) {
				if (!it->is_string()) throw Core::ConfigError("lexicon '" + fallbackLanguage + "': 'language' must be a string");
				table.language = it->get<std::string>();
			}
			table.gambling = ReadStringArray(doc, "gambling", "lexicon '" + table.language + "'");
			table.benign = ReadStringArray(doc, "benign", "lexicon '" + table.language + "'");
			return table;
		}

		Utils::JSON::Json Lexicon::ToJson(const LexiconTable& table) {
			return Utils::JSON::Json{
				{"language", table.language},
				{"gambling", table.gambling},
				{"benign", table.benign}
			};
		}

		LexiconTable Lexicon::LoadFile(const std::filesystem::path& path) {
			Utils::JSON::Json doc;
			Utils::JSON::Error err;
			if (!Utils::JSON::LoadFromFile(path, doc, &err)) {
				throw Core::ConfigError("cannot load lexicon " + path.string() + ": " + err.message);
			}
			return FromJson(doc, path.stem().string());
		}

		Lexicon Lexicon::Load(const std::vector<std::string>& languages, const std::filesystem::path& directory) {
			Lexicon lexicon;
			const auto builtIns = BuiltInLanguages();

			for (const auto& lang : languages) {
				if (lang.empty()) continue;
				bool found = false;

				if (std::find(builtIns.begin(), builtIns.end(), lang) != builtIns.end()) {
					lexicon.Add(BuiltIn(lang));
					found = true;
				}

				const auto file = directory / (lang + ".json");
				std::error_code ec;
				if (!directory.empty() && std::filesystem::is_regular_file(file, ec)) {
					LexiconTable table = LoadFile(file);
					table.language = lang;
					lexicon.Add(table);
					found = true;
					NG_LOG_DEBUG("Lexicon", "Loaded %s (%zu gambling, %zu benign)",
						file.string().c_str(), table.gambling.size(), table.benign.size());
				}

				if (!found) {
					throw Core::ConfigError("no lexicon available for language '" + lang + "'");
				}
			}

			NG_LOG_INFO("Lexicon", "Lexicon ready: %zu languages, %zu gambling terms, %zu benign terms",
				lexicon.m_languages.size(), lexicon.m_gambling.size(), lexicon.m_benign.size());
			return lexicon;
		}

		void Lexicon::Add(const LexiconTable& table) {
			if (std::find(m_languages.begin(), m_languages.end(), table.language) == m_languages.end()) {
				m_languages.push_back(table.language);
			}
			for (const auto& e : table.gambling) addEntry(e, true);
			for (const auto& e : table.benign) addEntry(e, false);
		}

		void Lexicon::addEntry(const std::string& raw, bool gambling) {
			const auto words = SplitWords(raw);
			if (words.empty()) return;

			const std::string term = CompoundTerm(words);
			auto& target = gambling ? m_gambling : m_benign;
			if (!target.insert(term).second) return;

			if (words.size() > 1) {
				if (std::find(m_phrases.begin(), m_phrases.end(), words) == m_phrases.end()) {
					m_phrases.push_back(words);
				}
			}
			else if (gambling && term.size() >= MIN_EMBEDDED_KEYWORD_LENGTH) {
				m_embeddable.push_back(term);
			}
		}

		std::vector<Core::TrainingExample> Lexicon::SeedCorpus() const {
			std::vector<Core::TrainingExample> corpus;
			corpus.reserve(m_gambling.size() + m_benign.size());
			// underscores split back into words in the extractor, and the phrase rule restores the compound
			for (const auto& t : m_gambling) corpus.push_back({ t, Core::Label::Gambling });
			for (const auto& t : m_benign) corpus.push_back({ t, Core::Label::Benign });
			return corpus;
		}

	}  // namespace Detection
}  // namespace NetGuard
