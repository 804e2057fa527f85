#include "NaiveBayesClassifier.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace NetGuard {
	namespace Detection {

		namespace {

			constexpr int MODEL_FORMAT_VERSION = 1;
			constexpr double LOG_ODDS_LIMIT = 40.0;

			double Logistic(double x) {
				x = std::clamp(x, -LOG_ODDS_LIMIT, LOG_ODDS_LIMIT);
				return 1.0 / (1.0 + std::exp(-x));
			}

			template<typename T>
			T Require(const Utils::JSON::Json& doc, const char* key) {
				auto it = doc.find(key);
				if (it == doc.end()) throw Core::ConfigError(std::string("model snapshot is missing '") + key + "'");
				try {
					return it->get<T>();
				}
				catch (const nlohmann::json::exception& ex) {
					throw Core::ConfigError(std::string("model snapshot field '") + key + "': " + ex.what());
				}
			}

		}  // anonymous namespace

		// ============================================================================
		// NaiveBayesModel
		// ============================================================================

		std::shared_ptr<const NaiveBayesModel> NaiveBayesModel::Train(const std::vector<Core::TrainingExample>& examples,
			const FeatureExtractor& extractor, uint64_t version) {
			size_t gamblingDocs = 0;
			size_t benignDocs = 0;
			for (const auto& ex : examples) {
				(ex.label == Core::Label::Gambling ? gamblingDocs : benignDocs)++;
			}
			if (gamblingDocs == 0 || benignDocs == 0) {
				throw Core::InsufficientDataError(gamblingDocs, benignDocs);
			}

			std::shared_ptr<NaiveBayesModel> model(new NaiveBayesModel());
			model->m_version = version;
			model->m_trainedAt = Core::Clock::now();

			// pass 1: term counts per document and document frequencies
			std::vector<std::map<std::string, uint32_t>> counts;
			counts.reserve(examples.size());
			for (const auto& ex : examples) {
				counts.push_back(extractor.TermCounts(ex.text));
				for (const auto& [term, tf] : counts.back()) {
					++model->m_vocabulary.documentFrequency[term];
				}
			}
			model->m_vocabulary.documentCount = examples.size();

			// pass 2: tf-idf weighted class totals
			for (size_t i = 0; i < examples.size(); ++i) {
				ClassStats& stats = examples[i].label == Core::Label::Gambling ? model->m_gambling : model->m_benign;
				++stats.documents;
				for (const auto& [term, tf] : counts[i]) {
					const double w = static_cast<double>(tf) * model->m_vocabulary.Idf(term);
					stats.termWeight[term] += w;
					stats.totalWeight += w;
				}
			}

			NG_LOG_INFO("Classifier", "Trained model v%llu: %zu terms, %zu gambling / %zu benign documents",
				static_cast<unsigned long long>(version), model->m_vocabulary.Size(), gamblingDocs, benignDocs);
			return model;
		}

		double NaiveBayesModel::termLogRatio(const std::string& term) const {
			const double vocab = static_cast<double>(m_vocabulary.Size());

			auto g = m_gambling.termWeight.find(term);
			auto b = m_benign.termWeight.find(term);
			const double wg = g != m_gambling.termWeight.end() ? g->second : 0.0;
			const double wb = b != m_benign.termWeight.end() ? b->second : 0.0;

			const double pg = (wg + 1.0) / (m_gambling.totalWeight + vocab);
			const double pb = (wb + 1.0) / (m_benign.totalWeight + vocab);
			return std::log(pg) - std::log(pb);
		}

		double NaiveBayesModel::LogOdds(const Core::FeatureVector& features) const {
			double llr = std::log(static_cast<double>(m_gambling.documents)) -
				std::log(static_cast<double>(m_benign.documents));
			for (const auto& [term, weight] : features) {
				llr += weight * termLogRatio(term);
			}
			return llr;
		}

		double NaiveBayesModel::Score(const Core::FeatureVector& features) const {
			return Logistic(LogOdds(features));
		}

		std::vector<Core::TermContribution> NaiveBayesModel::Explain(const Core::FeatureVector& features,
			size_t topN) const {
			std::vector<Core::TermContribution> all;
			all.reserve(features.size());
			for (const auto& [term, weight] : features) {
				all.push_back({ term, weight * termLogRatio(term) });
			}
			std::sort(all.begin(), all.end(), [](const Core::TermContribution& a, const Core::TermContribution& b) {
				const double ma = std::fabs(a.contribution);
				const double mb = std::fabs(b.contribution);
				if (ma != mb) return ma > mb;
				return a.term < b.term;
			});
			if (all.size() > topN) all.resize(topN);
			return all;
		}

		Core::ModelInfo NaiveBayesModel::Info() const {
			Core::ModelInfo info;
			info.version = m_version;
			info.vocabularySize = m_vocabulary.Size();
			info.gamblingDocuments = m_gambling.documents;
			info.benignDocuments = m_benign.documents;
			info.trainedAt = m_trainedAt;
			return info;
		}

		Utils::JSON::Json NaiveBayesModel::ToJson() const {
			// sorted keys keep snapshots diffable
			Utils::JSON::Json df = Utils::JSON::Json::object();
			for (const auto& [term, n] : m_vocabulary.documentFrequency) df[term] = n;

			const auto classJson = [](const ClassStats& s) {
				Utils::JSON::Json weights = Utils::JSON::Json::object();
				for (const auto& [term, w] : s.termWeight) weights[term] = w;
				return Utils::JSON::Json{
					{"documents", s.documents},
					{"total_weight", s.totalWeight},
					{"term_weights", std::move(weights)}
				};
			};

			return Utils::JSON::Json{
				{"format", MODEL_FORMAT_VERSION},
				{"version", m_version},
				{"trained_at", Core::ToEpochMillis(m_trainedAt)},
				{"document_count", m_vocabulary.documentCount},
				{"document_frequency", std::move(df)},
				{"gambling", classJson(m_gambling)},
				{"benign", classJson(m_benign)}
			};
		}

		std::shared_ptr<const NaiveBayesModel> NaiveBayesModel::FromJson(const Utils::JSON::Json& doc) {
			if (!doc.is_object()) throw Core::ConfigError("model snapshot must be a JSON object");
			if (Require<int>(doc, "format") != MODEL_FORMAT_VERSION) {
				throw Core::ConfigError("unsupported model snapshot format");
			}

			std::shared_ptr<NaiveBayesModel> model(new NaiveBayesModel());
			model->m_version = Require<uint64_t>(doc, "version");
			model->m_trainedAt = Core::FromEpochMillis(Require<int64_t>(doc, "trained_at"));
			model->m_vocabulary.documentCount = Require<uint64_t>(doc, "document_count");

			const auto df = Require<Utils::JSON::Json>(doc, "document_frequency");
			if (!df.is_object()) throw Core::ConfigError("model snapshot 'document_frequency' must be an object");
			for (auto it = df.begin(); it != df.end(); ++it) {
				if (!it.value().is_number_unsigned()) throw Core::ConfigError("bad document frequency for '" + it.key() + "'");
				model->m_vocabulary.documentFrequency.emplace(it.key(), it.value().get<uint64_t>());
			}

			const auto readClass = [](const Utils::JSON::Json& j, ClassStats& out, const char* name) {
				if (!j.is_object()) throw Core::ConfigError(std::string("model snapshot '") + name + "' must be an object");
				out.documents = Require<uint64_t>(j, "documents");
				out.totalWeight = Require<double>(j, "total_weight");
				const auto weights = Require<Utils::JSON::Json>(j, "term_weights");
				if (!weights.is_object()) throw Core::ConfigError(std::string("model snapshot '") + name + ".term_weights' must be an object");
				for (auto it = weights.begin(); it != weights.end(); ++it) {
					if (!it.value().is_number()) throw Core::ConfigError("bad term weight for '" + it.key() + "'");
					out.termWeight.emplace(it.key(), it.value().get<double>());
				}
			};
			readClass(Require<Utils::JSON::Json>(doc, "gambling"), model->m_gambling, "gambling");
			readClass(Require<Utils::JSON::Json>(doc, "benign"), model->m_benign, "benign");

			if (model->m_gambling.documents == 0 || model->m_benign.documents == 0) {
				throw Core::ConfigError("model snapshot has an empty class");
			}
			return model;
		}

		// ============================================================================
		// NaiveBayesClassifier
		// ============================================================================

		NaiveBayesClassifier::NaiveBayesClassifier(std::shared_ptr<const FeatureExtractor> extractor)
			: m_extractor(std::move(extractor)) {
		}

		uint64_t NaiveBayesClassifier::Train(const std::vector<Core::TrainingExample>& examples) {
			std::lock_guard<std::mutex> trainLock(m_trainMutex);

			const uint64_t version = m_lastVersion.load() + 1;
			auto model = NaiveBayesModel::Train(examples, *m_extractor, version);

			{
				std::unique_lock<std::shared_mutex> lock(m_modelMutex);
				m_model = std::move(model);
			}
			m_lastVersion.store(version);
			return version;
		}

		std::shared_ptr<const NaiveBayesModel> NaiveBayesClassifier::ActiveModel() const {
			std::shared_lock<std::shared_mutex> lock(m_modelMutex);
			return m_model;
		}

		bool NaiveBayesClassifier::HasModel() const {
			return ActiveModel() != nullptr;
		}

		std::shared_ptr<const NaiveBayesModel> NaiveBayesClassifier::requireModel() const {
			auto model = ActiveModel();
			if (!model) throw Core::InsufficientDataError(0, 0);
			return model;
		}

		double NaiveBayesClassifier::Score(const Core::FeatureVector& features) const {
			return requireModel()->Score(features);
		}

		std::vector<Core::TermContribution> NaiveBayesClassifier::Explain(const Core::FeatureVector& features,
			size_t topN) const {
			return requireModel()->Explain(features, topN);
		}

		Core::FeatureVector NaiveBayesClassifier::Vectorize(std::string_view text) const {
			return m_extractor->Vectorize(text, requireModel()->GetVocabulary());
		}

		Core::ClassificationResult NaiveBayesClassifier::Classify(const std::string& subject, std::string_view text,
			size_t topN) const {
			const auto model = requireModel();
			const auto features = m_extractor->Vectorize(text, model->GetVocabulary());

			Core::ClassificationResult result;
			result.subject = subject;
			result.score = model->Score(features);
			result.topTerms = model->Explain(features, topN);
			result.modelVersion = model->Version();
			result.timestamp = Core::Clock::now();
			return result;
		}

		Core::ModelInfo NaiveBayesClassifier::Info() const {
			auto model = ActiveModel();
			return model ? model->Info() : Core::ModelInfo{};
		}

		Core::ValidationReport NaiveBayesClassifier::Validate(const std::vector<Core::TrainingExample>& samples,
			double threshold) const {
			const auto model = requireModel();
			Core::ValidationReport report;
			for (const auto& s : samples) {
				const double p = model->Score(m_extractor->Vectorize(s.text, model->GetVocabulary()));
				const Core::Label predicted = p >= threshold ? Core::Label::Gambling : Core::Label::Benign;
				++report.total;
				if (predicted == s.label) ++report.correct;
			}
			report.accuracy = report.total ? static_cast<double>(report.correct) / static_cast<double>(report.total) : 0.0;
			return report;
		}

		void NaiveBayesClassifier::Save(const std::filesystem::path& path) const {
			const auto model = requireModel();
			Utils::JSON::Error err;
			if (!Utils::JSON::SaveToFile(path, model->ToJson(), &err, { false, 0 })) {
				throw Core::StorageError("model", {}, "cannot save model to " + path.string() + ": " + err.message);
			}
			NG_LOG_DEBUG("Classifier", "Saved model v%llu to %s",
				static_cast<unsigned long long>(model->Version()), path.string().c_str());
		}

		bool NaiveBayesClassifier::Load(const std::filesystem::path& path) {
			std::error_code ec;
			if (!std::filesystem::exists(path, ec)) return false;

			Utils::JSON::Json doc;
			Utils::JSON::Error err;
			if (!Utils::JSON::LoadFromFile(path, doc, &err)) {
				throw Core::ConfigError("cannot load model " + path.string() + ": " + err.message);
			}
			auto model = NaiveBayesModel::FromJson(doc);

			std::lock_guard<std::mutex> trainLock(m_trainMutex);
			const uint64_t version = model->Version();
			{
				std::unique_lock<std::shared_mutex> lock(m_modelMutex);
				m_model = std::move(model);
			}
			// later retrains continue from the loaded version
			if (version > m_lastVersion.load()) m_lastVersion.store(version);
			NG_LOG_INFO("Classifier", "Loaded model v%llu from %s",
				static_cast<unsigned long long>(version), path.string().c_str());
			return true;
		}

	}  // namespace Detection
}  // namespace NetGuard
