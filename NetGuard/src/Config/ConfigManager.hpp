#pragma once

#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace NetGuard {
	namespace Config {

		// ============================================================================
		// Configuration sections
		// ============================================================================

		struct DatabaseSettings {
			std::string path = "netguard.db";
			bool enableWAL = true;
			int busyTimeoutMs = 5000;
			size_t maxConnections = 8;
		};

		struct LoggingSettings {
			std::string level = "info";           ///< trace|debug|info|warn|error|fatal
			bool console = true;
			bool file = false;
			bool jsonLines = false;
			bool async = true;
			std::string directory = "logs";
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;
			size_t maxFileCount = 5;
		};

		struct MonitoringSettings {
			bool enabled = true;
			std::chrono::milliseconds pollInterval{ 2000 };
			std::chrono::milliseconds idleTimeout{ 30000 };
			std::chrono::milliseconds reanalysisCooldown{ 300000 };
			std::chrono::milliseconds bandwidthInterval{ 300000 };
			bool skipPrivateAddresses = true;
			bool resolveHostnames = true;
			std::string procRoot = "/proc";
		};

		struct InterceptorSettings {
			bool devMode = false;
			std::string listenAddress = "127.0.0.1";
			uint16_t listenPort = 8080;
			std::chrono::milliseconds ioTimeout{ 30000 };
			std::string caCertPath;               ///< empty: HTTPS is tunnelled, not inspected
			std::string caKeyPath;
			size_t bodyExcerptBytes = 4096;
			size_t captureBufferSize = 500;
			std::chrono::milliseconds captureWindow{ 600000 };
			size_t workerThreads = 0;             ///< 0: hardware concurrency
			size_t pendingSessions = 64;          ///< clients queued for a worker before new ones are refused
		};

		struct ClassifierSettings {
			std::string modelPath = "netguard-model.json";
			size_t maxBodyChars = 3000;
			size_t lanes = 4;
			size_t laneCapacity = 256;
			size_t topTerms = 5;
		};

		struct DecisionSettings {
			int sensitivity = 50;                 ///< 0..100
			double observeBand = 0.10;
			double minThreshold = 0.05;
			double maxThreshold = 0.95;
		};

		struct EnforcementSettings {
			std::string hostsPath = "/etc/hosts";
			std::string redirectAddress = "127.0.0.1";
			bool includeWww = true;
			std::chrono::milliseconds reconcileInterval{ 5000 };
		};

		struct RetentionSettings {
			int horizonDays = 30;
		};

		struct LexiconSettings {
			std::string directory = "data/lexicons";
			std::vector<std::string> languages{ "en", "id" };
		};

		struct NetGuardConfig {
			DatabaseSettings database;
			LoggingSettings logging;
			MonitoringSettings monitoring;
			InterceptorSettings interceptor;
			ClassifierSettings classifier;
			DecisionSettings decision;
			EnforcementSettings enforcement;
			RetentionSettings retention;
			LexiconSettings lexicons;
		};

		// Keys of the user-adjustable values kept in the settings table
		inline constexpr const char* SETTING_SENSITIVITY = "sensitivity";
		inline constexpr const char* SETTING_DEV_MODE = "dev_mode";
		inline constexpr const char* SETTING_LANGUAGES = "languages";
		inline constexpr const char* SETTING_MONITORING_ENABLED = "monitoring_enabled";

		// ============================================================================
		// ConfigManager
		// ============================================================================

		/**
		 * @brief Loads, validates and holds the NetGuard configuration.
		 *
		 * Missing keys keep their compiled defaults. A key present with the wrong
		 * JSON type, or a value out of range, raises Core::ConfigError naming the
		 * offending path (e.g. "decision.sensitivity").
		 */
		class ConfigManager {
		public:
			ConfigManager() = default;
			explicit ConfigManager(NetGuardConfig config);

			/// @throws Core::ConfigError when the file is unreadable or invalid
			void LoadFromFile(const std::filesystem::path& path);

			/// @throws Core::ConfigError
			void LoadFromJson(const Utils::JSON::Json& root);

			/**
			 * @brief Overlays values persisted in the settings table.
			 * @throws Core::ConfigError when a stored value does not parse
			 */
			void ApplySettings(const std::map<std::string, std::string>& settings);

			[[nodiscard]] NetGuardConfig Snapshot() const;
			[[nodiscard]] Utils::JSON::Json ToJson() const;

			void SetSensitivity(int sensitivity);
			void SetDevMode(bool enabled);

			/// @throws Core::ConfigError
			static void Validate(const NetGuardConfig& config);
			static NetGuardConfig Parse(const Utils::JSON::Json& root);
			static Utils::LoggerConfig ToLoggerConfig(const LoggingSettings& logging);
			static Utils::LogLevel ParseLogLevel(const std::string& name);

		private:
			mutable std::shared_mutex m_mutex;
			NetGuardConfig m_config;
		};

	}  // namespace Config
}  // namespace NetGuard
