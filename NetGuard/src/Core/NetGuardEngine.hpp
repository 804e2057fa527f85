#pragma once

#include "DetectionPipeline.hpp"
#include "Errors.hpp"
#include "Types.hpp"
#include "../Config/ConfigManager.hpp"
#include "../Database/AuditLogDB.hpp"
#include "../Database/BlockedSiteStore.hpp"
#include "../Database/DatabaseManager.hpp"
#include "../Detection/DecisionEngine.hpp"
#include "../Detection/FeatureExtractor.hpp"
#include "../Detection/Lexicon.hpp"
#include "../Detection/NaiveBayesClassifier.hpp"
#include "../Enforcement/EnforcementManager.hpp"
#include "../Enforcement/HostsFile.hpp"
#include "../Monitoring/BandwidthMonitor.hpp"
#include "../Monitoring/ConnectionSampler.hpp"
#include "../Monitoring/ConnectionSource.hpp"
#include "../Monitoring/TrafficInterceptor.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace NetGuard {
	namespace Core {

		/// Replaceable collaborators; empty members get the Linux defaults.
		struct EngineDependencies {
			std::shared_ptr<Monitoring::IConnectionSource> connectionSource;
			std::unique_ptr<Enforcement::IHostsTableIO> hostsTable;
		};

		/**
		 * @brief Facade owning every NetGuard component.
		 *
		 * Data flow: sampler and interceptor submit DetectionRequests to the
		 * DetectionPipeline; its writer commits each outcome to the audit log and
		 * the blocked-site store, then reconciles the override table. A ticker
		 * thread reconciles periodically, samples bandwidth and prunes the
		 * capture buffer.
		 *
		 * Public operations report failures as NetGuardError subclasses. Errors
		 * raised on background threads are logged and written to error_events.
		 */
		class NetGuardEngine {
		public:
			static constexpr int MAX_BANDWIDTH_HOURS = 24 * 30;
			static constexpr size_t MAX_BANDWIDTH_SAMPLES = 20000;

			explicit NetGuardEngine(Config::NetGuardConfig config, EngineDependencies dependencies = {});
			~NetGuardEngine();

			NetGuardEngine(const NetGuardEngine&) = delete;
			NetGuardEngine& operator=(const NetGuardEngine&) = delete;

			/**
			 * @brief Opens the database, applies persisted settings, loads lexicons and the model.
			 *
			 * When no model snapshot exists the lexicon seed corpus is trained and saved.
			 * @throws ConfigError, StorageError
			 */
			void Initialize();

			// ============================================================================
			// Lifecycle
			// ============================================================================

			/// @return running state; idempotent
			bool Start();

			/// Drains captures and queued detections, then reconciles once. @return running state
			bool Stop();

			[[nodiscard]] bool IsRunning() const noexcept { return m_running.load(); }

			// ============================================================================
			// Queries
			// ============================================================================

			[[nodiscard]] EngineStats CurrentStats();
			[[nodiscard]] std::vector<DetectionLogEntry> ListDetections(const DetectionFilter& filter);
			[[nodiscard]] std::vector<ErrorEvent> ListErrors(const ErrorFilter& filter);
			[[nodiscard]] std::vector<EnforcementAction> ListEnforcementActions(const EnforcementActionFilter& filter);
			/// Logged connection openings, newest first
			[[nodiscard]] std::vector<Connection> RecentConnections(size_t limit = 100);

			/**
			 * @brief Bandwidth samples of the last @p hours, oldest first.
			 * @throws ValidationError outside 1..MAX_BANDWIDTH_HOURS
			 */
			[[nodiscard]] std::vector<BandwidthSample> BandwidthHistory(int hours = 24);
			[[nodiscard]] std::vector<std::shared_ptr<const CapturedTransaction>> RecentCaptures() const;

			// ============================================================================
			// Manual control
			// ============================================================================

			/// @throws ValidationError for an invalid domain
			void BlockDomain(const std::string& domain, const std::string& reason);
			/// @throws ValidationError for an invalid domain
			void UnblockDomain(const std::string& domain);
			/// Drops any manual override so the classifier decides again
			void ClearOverride(const std::string& domain);

			/// @throws ValidationError outside 0..100
			void SetSensitivity(int sensitivity);
			[[nodiscard]] int Sensitivity() const noexcept { return m_decisions->Sensitivity(); }

			/// Starts or stops the interceptor when monitoring is running
			void SetDevMode(bool enabled);
			[[nodiscard]] bool DevMode() const noexcept { return m_devMode.load(); }

			/**
			 * @brief Records a user correction for the next retrain.
			 * @return feedback row id
			 */
			int64_t SubmitFeedback(const std::string& domain, Label correctedLabel);

			// ============================================================================
			// Model
			// ============================================================================

			/**
			 * @brief Trains on the lexicon corpus plus all feedback and swaps the model.
			 * @return new version, or nullopt when training was skipped for lack of data
			 */
			std::optional<uint64_t> Retrain();

			[[nodiscard]] ModelInfo GetModelInfo() const { return m_classifier->Info(); }
			[[nodiscard]] ValidationReport ValidateModel(const std::vector<TrainingExample>& samples) const;

			/**
			 * @brief Classifies and commits @p text for @p domain on the calling thread.
			 * @throws InsufficientDataError without a model
			 */
			BlockDecision Analyze(const std::string& domain, const std::string& text,
				const std::string& source = "manual", const std::string& subject = {});

			/// Queues a detection; false when dropped
			bool Submit(DetectionRequest request);

			// ============================================================================
			// Blocked sites
			// ============================================================================

			[[nodiscard]] std::vector<BlockedSite> ExportBlockedSites();
			int ImportBlockedSites(const std::vector<BlockedSite>& sites);

			/// @throws StorageError
			void ExportBlockedSitesToFile(const std::filesystem::path& path);
			/// @throws ConfigError on an unreadable or invalid file, StorageError on write failure
			int ImportBlockedSitesFromFile(const std::filesystem::path& path);

			// ============================================================================
			// Maintenance
			// ============================================================================

			CleanupReport Cleanup(int retentionDays);
			CleanupReport Cleanup(Timestamp horizon);

			/**
			 * @brief Aligns the override table with the active blocked sites now.
			 * @throws PermissionError, StorageError (also recorded in error_events)
			 */
			Enforcement::ReconcileReport ReconcileNow();

			[[nodiscard]] std::optional<std::string> GetSetting(const std::string& key);
			void SetSetting(const std::string& key, const std::string& value);

			/// Logs @p error and appends it to error_events
			void RecordError(const NetGuardError& error);

			// ============================================================================
			// Component access
			// ============================================================================

			[[nodiscard]] Detection::NaiveBayesClassifier& Classifier() noexcept { return *m_classifier; }
			[[nodiscard]] const Detection::DecisionEngine& Decisions() const noexcept { return *m_decisions; }
			[[nodiscard]] Monitoring::ConnectionSampler& Sampler() noexcept { return *m_sampler; }
			[[nodiscard]] Database::AuditLogDB& Audit() noexcept { return *m_audit; }
			[[nodiscard]] Database::BlockedSiteStore& Sites() noexcept { return *m_sites; }
			[[nodiscard]] Config::NetGuardConfig ConfigSnapshot() const { return m_config.Snapshot(); }
			/// 0 unless the interceptor is listening
			[[nodiscard]] uint16_t InterceptorPort() const;

		private:
			void requireInitialized() const;
			void commit(const DetectionOutcome& outcome);
			void reconcileQuietly(const char* trigger);
			void onConnectionEvent(const Monitoring::ConnectionEvent& event);
			void onCapture(std::shared_ptr<const CapturedTransaction> tx);
			void startInterceptor();
			void stopInterceptor();
			void tickerLoop();
			std::vector<TrainingExample> trainingCorpus(int64_t& lastFeedbackId);
			[[noreturn]] void throwStorage(const char* stage, const std::string& domain,
				const Database::DatabaseError& err) const;

			Config::ConfigManager m_config;
			EngineDependencies m_deps;

			Database::DatabaseManager m_db;
			std::unique_ptr<Database::AuditLogDB> m_audit;
			std::unique_ptr<Database::BlockedSiteStore> m_sites;

			std::shared_ptr<const Detection::Lexicon> m_lexicon;
			std::shared_ptr<const Detection::FeatureExtractor> m_extractor;
			std::unique_ptr<Detection::NaiveBayesClassifier> m_classifier;
			std::unique_ptr<Detection::DecisionEngine> m_decisions;
			std::unique_ptr<Enforcement::EnforcementManager> m_enforcement;

			std::unique_ptr<Monitoring::ConnectionSampler> m_sampler;
			std::unique_ptr<Monitoring::BandwidthMonitor> m_bandwidth;
			std::unique_ptr<Monitoring::CaptureBuffer> m_captures;
			std::unique_ptr<Monitoring::TrafficInterceptor> m_interceptor;
			std::unique_ptr<DetectionPipeline> m_pipeline;

			std::mutex m_lifecycleMutex;
			mutable std::mutex m_interceptorMutex;
			std::mutex m_commitMutex;
			std::mutex m_retrainMutex;

			std::thread m_ticker;
			std::mutex m_tickerMutex;
			std::condition_variable m_tickerWake;
			bool m_tickerStop = false;

			std::atomic<bool> m_initialized{ false };
			std::atomic<bool> m_running{ false };
			std::atomic<bool> m_devMode{ false };
			std::atomic<int64_t> m_lastClassificationMs{ 0 };
			std::atomic<double> m_currentMbps{ 0.0 };
		};

	}  // namespace Core
}  // namespace NetGuard
