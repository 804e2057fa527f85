#pragma once

#include "FeatureExtractor.hpp"
#include "../Core/Types.hpp"
#include "../Utils/JSONUtils.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace NetGuard {
	namespace Detection {

		// ============================================================================
		// NaiveBayesModel - one immutable trained version
		// ============================================================================

		/**
		 * @brief Multinomial naive Bayes over tf-idf weighted term counts.
		 *
		 * P(t|c) = (W_c(t) + 1) / (W_c + |V|) where W_c(t) is the summed tf-idf
		 * weight of t over class-c training documents. The score of a vector x is
		 * the logistic of
		 *
		 *   log P(g)/P(b) + sum_t x_t * (log P(t|g) - log P(t|b))
		 *
		 * Instances are never modified after Train()/FromJson(); readers share
		 * them through shared_ptr<const NaiveBayesModel>.
		 */
		class NaiveBayesModel {
		public:
			/**
			 * @brief Fits a model to @p examples.
			 * @throws Core::InsufficientDataError when either class has no example
			 */
			static std::shared_ptr<const NaiveBayesModel> Train(const std::vector<Core::TrainingExample>& examples,
				const FeatureExtractor& extractor, uint64_t version);

			/// @throws Core::ConfigError when the snapshot is malformed
			static std::shared_ptr<const NaiveBayesModel> FromJson(const Utils::JSON::Json& doc);
			[[nodiscard]] Utils::JSON::Json ToJson() const;

			/// Gambling probability in [0,1]
			[[nodiscard]] double Score(const Core::FeatureVector& features) const;

			/// Log-odds before the logistic transform
			[[nodiscard]] double LogOdds(const Core::FeatureVector& features) const;

			/// Terms ordered by |contribution|, largest first
			[[nodiscard]] std::vector<Core::TermContribution> Explain(const Core::FeatureVector& features,
				size_t topN) const;

			[[nodiscard]] uint64_t Version() const noexcept { return m_version; }
			[[nodiscard]] const Vocabulary& GetVocabulary() const noexcept { return m_vocabulary; }
			[[nodiscard]] Core::ModelInfo Info() const;

		private:
			NaiveBayesModel() = default;

			[[nodiscard]] double termLogRatio(const std::string& term) const;

			struct ClassStats {
				uint64_t documents = 0;
				double totalWeight = 0.0;
				std::unordered_map<std::string, double> termWeight;
			};

			uint64_t m_version = 0;
			Core::Timestamp m_trainedAt{};
			Vocabulary m_vocabulary;
			ClassStats m_gambling;
			ClassStats m_benign;
		};

		// ============================================================================
		// NaiveBayesClassifier - holds the active model and swaps it on retrain
		// ============================================================================

		class NaiveBayesClassifier {
		public:
			explicit NaiveBayesClassifier(std::shared_ptr<const FeatureExtractor> extractor);

			/**
			 * @brief Trains a new version and makes it active.
			 *
			 * In-flight Classify calls keep the model they started with. On
			 * failure the previous version stays active.
			 * @return the new model version
			 * @throws Core::InsufficientDataError
			 */
			uint64_t Train(const std::vector<Core::TrainingExample>& examples);

			/// @throws Core::InsufficientDataError when no model has been trained or loaded
			[[nodiscard]] double Score(const Core::FeatureVector& features) const;
			[[nodiscard]] std::vector<Core::TermContribution> Explain(const Core::FeatureVector& features,
				size_t topN = 5) const;

			/// Vectorizes against the active vocabulary, scores and explains with one model snapshot
			[[nodiscard]] Core::ClassificationResult Classify(const std::string& subject, std::string_view text,
				size_t topN = 5) const;

			[[nodiscard]] Core::FeatureVector Vectorize(std::string_view text) const;

			[[nodiscard]] std::shared_ptr<const NaiveBayesModel> ActiveModel() const;
			[[nodiscard]] bool HasModel() const;
			[[nodiscard]] Core::ModelInfo Info() const;

			/// Accuracy of the active model at probability cut-off @p threshold
			[[nodiscard]] Core::ValidationReport Validate(const std::vector<Core::TrainingExample>& samples,
				double threshold = 0.5) const;

			/// @throws Core::StorageError
			void Save(const std::filesystem::path& path) const;

			/**
			 * @brief Activates the snapshot at @p path.
			 * @return false when the file does not exist
			 * @throws Core::ConfigError on a malformed snapshot
			 */
			bool Load(const std::filesystem::path& path);

			[[nodiscard]] const FeatureExtractor& Extractor() const noexcept { return *m_extractor; }

		private:
			[[nodiscard]] std::shared_ptr<const NaiveBayesModel> requireModel() const;

			std::shared_ptr<const FeatureExtractor> m_extractor;

			mutable std::shared_mutex m_modelMutex;
			std::shared_ptr<const NaiveBayesModel> m_model;

			std::mutex m_trainMutex;
			std::atomic<uint64_t> m_lastVersion{ 0 };
		};

	}  // namespace Detection
}  // namespace NetGuard
