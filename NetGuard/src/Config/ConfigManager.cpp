#include "ConfigManager.hpp"
#include "../Core/Errors.hpp"
#include "../Utils/StringUtils.hpp"

#include <limits>
#include <type_traits>

namespace NetGuard {
	namespace Config {

		using Utils::JSON::Json;

		namespace {

			template<typename T>
			void ReadField(const Json& section, const std::string& sectionName, const char* key, T& out) {
				auto it = section.find(key);
				if (it == section.end() || it->is_null()) return;

				const std::string path = sectionName + "." + key;

				if constexpr (std::is_same_v<T, bool>) {
					if (!it->is_boolean()) throw Core::ConfigError(path + " must be a boolean");
					out = it->template get<bool>();
				}
				else if constexpr (std::is_same_v<T, std::string>) {
					if (!it->is_string()) throw Core::ConfigError(path + " must be a string");
					out = it->template get<std::string>();
				}
				else if constexpr (std::is_same_v<T, std::chrono::milliseconds>) {
					if (!it->is_number_integer() || it->template get<int64_t>() < 0) {
						throw Core::ConfigError(path + " must be a non-negative integer (milliseconds)");
					}
					out = std::chrono::milliseconds(it->template get<int64_t>());
				}
				else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
					if (!it->is_array()) throw Core::ConfigError(path + " must be an array of strings");
					std::vector<std::string> values;
					for (const auto& v : *it) {
						if (!v.is_string()) throw Core::ConfigError(path + " must be an array of strings");
						values.push_back(v.template get<std::string>());
					}
					out = std::move(values);
				}
				else if constexpr (std::is_floating_point_v<T>) {
					if (!it->is_number()) throw Core::ConfigError(path + " must be a number");
					out = it->template get<T>();
				}
				else if constexpr (std::is_integral_v<T>) {
					if (!it->is_number_integer()) throw Core::ConfigError(path + " must be an integer");
					const int64_t v = it->template get<int64_t>();
					if constexpr (std::is_unsigned_v<T>) {
						if (v < 0 || static_cast<uint64_t>(v) > std::numeric_limits<T>::max()) {
							throw Core::ConfigError(path + " is out of range");
						}
					}
					else {
						if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) {
							throw Core::ConfigError(path + " is out of range");
						}
					}
					out = static_cast<T>(v);
				}
				else {
					static_assert(sizeof(T) == 0, "Unsupported config field type");
				}
			}

			const Json& Section(const Json& root, const char* name) {
				static const Json empty = Json::object();
				auto it = root.find(name);
				if (it == root.end() || it->is_null()) return empty;
				if (!it->is_object()) throw Core::ConfigError(std::string(name) + " must be an object");
				return *it;
			}

			bool ParseBool(const std::string& key, const std::string& value) {
				const std::string v = Utils::StringUtils::ToLowerCopy(Utils::StringUtils::TrimCopy(value));
				if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
				if (v == "false" || v == "0" || v == "no" || v == "off") return false;
				throw Core::ConfigError("setting '" + key + "' is not a boolean: " + value);
			}

			int64_t Millis(std::chrono::milliseconds ms) { return ms.count(); }

		}  // anonymous namespace

		ConfigManager::ConfigManager(NetGuardConfig config) {
			Validate(config);
			m_config = std::move(config);
		}

		NetGuardConfig ConfigManager::Parse(const Json& root) {
			if (!root.is_object()) throw Core::ConfigError("configuration root must be an object");

			NetGuardConfig cfg;

			const Json& db = Section(root, "database");
			ReadField(db, "database", "path", cfg.database.path);
			ReadField(db, "database", "wal", cfg.database.enableWAL);
			ReadField(db, "database", "busy_timeout_ms", cfg.database.busyTimeoutMs);
			ReadField(db, "database", "max_connections", cfg.database.maxConnections);

			const Json& log = Section(root, "logging");
			ReadField(log, "logging", "level", cfg.logging.level);
			ReadField(log, "logging", "console", cfg.logging.console);
			ReadField(log, "logging", "file", cfg.logging.file);
			ReadField(log, "logging", "json_lines", cfg.logging.jsonLines);
			ReadField(log, "logging", "async", cfg.logging.async);
			ReadField(log, "logging", "directory", cfg.logging.directory);
			ReadField(log, "logging", "max_file_size_bytes", cfg.logging.maxFileSizeBytes);
			ReadField(log, "logging", "max_file_count", cfg.logging.maxFileCount);

			const Json& mon = Section(root, "monitoring");
			ReadField(mon, "monitoring", "enabled", cfg.monitoring.enabled);
			ReadField(mon, "monitoring", "poll_interval_ms", cfg.monitoring.pollInterval);
			ReadField(mon, "monitoring", "idle_timeout_ms", cfg.monitoring.idleTimeout);
			ReadField(mon, "monitoring", "reanalysis_cooldown_ms", cfg.monitoring.reanalysisCooldown);
			ReadField(mon, "monitoring", "bandwidth_interval_ms", cfg.monitoring.bandwidthInterval);
			ReadField(mon, "monitoring", "skip_private_addresses", cfg.monitoring.skipPrivateAddresses);
			ReadField(mon, "monitoring", "resolve_hostnames", cfg.monitoring.resolveHostnames);
			ReadField(mon, "monitoring", "proc_root", cfg.monitoring.procRoot);

			const Json& icp = Section(root, "interceptor");
			ReadField(icp, "interceptor", "dev_mode", cfg.interceptor.devMode);
			ReadField(icp, "interceptor", "listen_address", cfg.interceptor.listenAddress);
			ReadField(icp, "interceptor", "listen_port", cfg.interceptor.listenPort);
			ReadField(icp, "interceptor", "io_timeout_ms", cfg.interceptor.ioTimeout);
			ReadField(icp, "interceptor", "ca_cert", cfg.interceptor.caCertPath);
			ReadField(icp, "interceptor", "ca_key", cfg.interceptor.caKeyPath);
			ReadField(icp, "interceptor", "body_excerpt_bytes", cfg.interceptor.bodyExcerptBytes);
			ReadField(icp, "interceptor", "capture_buffer_size", cfg.interceptor.captureBufferSize);
			ReadField(icp, "interceptor", "capture_window_ms", cfg.interceptor.captureWindow);
			ReadField(icp, "interceptor", "worker_threads", cfg.interceptor.workerThreads);
			ReadField(icp, "interceptor", "pending_sessions", cfg.interceptor.pendingSessions);

			const Json& cls = Section(root, "classifier");
			ReadField(cls, "classifier", "model_path", cfg.classifier.modelPath);
			ReadField(cls, "classifier", "max_body_chars", cfg.classifier.maxBodyChars);
			ReadField(cls, "classifier", "lanes", cfg.classifier.lanes);
			ReadField(cls, "classifier", "lane_capacity", cfg.classifier.laneCapacity);
			ReadField(cls, "classifier", "top_terms", cfg.classifier.topTerms);

			const Json& dec = Section(root, "decision");
			ReadField(dec, "decision", "sensitivity", cfg.decision.sensitivity);
			ReadField(dec, "decision", "observe_band", cfg.decision.observeBand);
			ReadField(dec, "decision", "min_threshold", cfg.decision.minThreshold);
			ReadField(dec, "decision", "max_threshold", cfg.decision.maxThreshold);

			const Json& enf = Section(root, "enforcement");
			ReadField(enf, "enforcement", "hosts_path", cfg.enforcement.hostsPath);
			ReadField(enf, "enforcement", "redirect_address", cfg.enforcement.redirectAddress);
			ReadField(enf, "enforcement", "include_www", cfg.enforcement.includeWww);
			ReadField(enf, "enforcement", "reconcile_interval_ms", cfg.enforcement.reconcileInterval);

			const Json& ret = Section(root, "retention");
			ReadField(ret, "retention", "horizon_days", cfg.retention.horizonDays);

			const Json& lex = Section(root, "lexicons");
			ReadField(lex, "lexicons", "directory", cfg.lexicons.directory);
			ReadField(lex, "lexicons", "languages", cfg.lexicons.languages);

			Validate(cfg);
			return cfg;
		}

		void ConfigManager::Validate(const NetGuardConfig& cfg) {
			if (cfg.database.path.empty()) throw Core::ConfigError("database.path must not be empty");
			if (cfg.database.maxConnections == 0) throw Core::ConfigError("database.max_connections must be positive");
			(void)ParseLogLevel(cfg.logging.level);
			if (cfg.monitoring.pollInterval.count() <= 0) throw Core::ConfigError("monitoring.poll_interval_ms must be positive");
			if (cfg.monitoring.idleTimeout < cfg.monitoring.pollInterval) {
				throw Core::ConfigError("monitoring.idle_timeout_ms must not be shorter than the poll interval");
			}
			if (cfg.interceptor.ioTimeout.count() <= 0) throw Core::ConfigError("interceptor.io_timeout_ms must be positive");
			if (cfg.interceptor.caCertPath.empty() != cfg.interceptor.caKeyPath.empty()) {
				throw Core::ConfigError("interceptor.ca_cert and interceptor.ca_key must be set together");
			}
			if (cfg.interceptor.captureBufferSize == 0) throw Core::ConfigError("interceptor.capture_buffer_size must be positive");
			if (cfg.classifier.lanes == 0) throw Core::ConfigError("classifier.lanes must be positive");
			if (cfg.classifier.laneCapacity == 0) throw Core::ConfigError("classifier.lane_capacity must be positive");
			if (cfg.decision.sensitivity < 0 || cfg.decision.sensitivity > 100) {
				throw Core::ConfigError("decision.sensitivity must be within 0..100");
			}
			if (!(cfg.decision.minThreshold > 0.0 && cfg.decision.minThreshold < cfg.decision.maxThreshold &&
				cfg.decision.maxThreshold <= 1.0)) {
				throw Core::ConfigError("decision thresholds must satisfy 0 < min_threshold < max_threshold <= 1");
			}
			if (cfg.decision.observeBand < 0.0 || cfg.decision.observeBand >= 1.0) {
				throw Core::ConfigError("decision.observe_band must be within [0, 1)");
			}
			if (cfg.enforcement.hostsPath.empty()) throw Core::ConfigError("enforcement.hosts_path must not be empty");
			if (cfg.enforcement.redirectAddress.empty()) throw Core::ConfigError("enforcement.redirect_address must not be empty");
			if (cfg.retention.horizonDays < 1) throw Core::ConfigError("retention.horizon_days must be at least 1");
			if (cfg.lexicons.languages.empty()) throw Core::ConfigError("lexicons.languages must not be empty");
		}

		void ConfigManager::LoadFromFile(const std::filesystem::path& path) {
			Json root;
			Utils::JSON::Error err;
			if (!Utils::JSON::LoadFromFile(path, root, &err)) {
				throw Core::ConfigError("cannot load " + path.string() + ": " + err.message);
			}
			LoadFromJson(root);
			NG_LOG_INFO("Config", "Loaded configuration from %s", path.string().c_str());
		}

		void ConfigManager::LoadFromJson(const Json& root) {
			NetGuardConfig parsed = Parse(root);
			std::unique_lock<std::shared_mutex> lock(m_mutex);
			m_config = std::move(parsed);
		}

		void ConfigManager::ApplySettings(const std::map<std::string, std::string>& settings) {
			std::unique_lock<std::shared_mutex> lock(m_mutex);
			NetGuardConfig next = m_config;

			for (const auto& [key, value] : settings) {
				if (key == SETTING_SENSITIVITY) {
					try {
						size_t used = 0;
						const int s = std::stoi(value, &used);
						if (used != value.size()) throw std::invalid_argument(value);
						next.decision.sensitivity = s;
					}
					catch (const std::logic_error&) {
						throw Core::ConfigError("setting 'sensitivity' is not an integer: " + value);
					}
				}
				else if (key == SETTING_DEV_MODE) {
					next.interceptor.devMode = ParseBool(key, value);
				}
				else if (key == SETTING_MONITORING_ENABLED) {
					next.monitoring.enabled = ParseBool(key, value);
				}
				else if (key == SETTING_LANGUAGES) {
					next.lexicons.languages = Utils::StringUtils::Split(value, ',');
					for (auto& lang : next.lexicons.languages) Utils::StringUtils::Trim(lang);
				}
			}

			Validate(next);
			m_config = std::move(next);
		}

		NetGuardConfig ConfigManager::Snapshot() const {
			std::shared_lock<std::shared_mutex> lock(m_mutex);
			return m_config;
		}

		void ConfigManager::SetSensitivity(int sensitivity) {
			std::unique_lock<std::shared_mutex> lock(m_mutex);
			m_config.decision.sensitivity = sensitivity;
		}

		void ConfigManager::SetDevMode(bool enabled) {
			std::unique_lock<std::shared_mutex> lock(m_mutex);
			m_config.interceptor.devMode = enabled;
		}

		Json ConfigManager::ToJson() const {
			const NetGuardConfig c = Snapshot();
			return Json{
				{"database", {
					{"path", c.database.path},
					{"wal", c.database.enableWAL},
					{"busy_timeout_ms", c.database.busyTimeoutMs},
					{"max_connections", c.database.maxConnections}
				}},
				{"logging", {
					{"level", c.logging.level},
					{"console", c.logging.console},
					{"file", c.logging.file},
					{"json_lines", c.logging.jsonLines},
					{"async", c.logging.async},
					{"directory", c.logging.directory},
					{"max_file_size_bytes", c.logging.maxFileSizeBytes},
					{"max_file_count", c.logging.maxFileCount}
				}},
				{"monitoring", {
					{"enabled", c.monitoring.enabled},
					{"poll_interval_ms", Millis(c.monitoring.pollInterval)},
					{"idle_timeout_ms", Millis(c.monitoring.idleTimeout)},
					{"reanalysis_cooldown_ms", Millis(c.monitoring.reanalysisCooldown)},
					{"bandwidth_interval_ms", Millis(c.monitoring.bandwidthInterval)},
					{"skip_private_addresses", c.monitoring.skipPrivateAddresses},
					{"resolve_hostnames", c.monitoring.resolveHostnames},
					{"proc_root", c.monitoring.procRoot}
				}},
				{"interceptor", {
					{"dev_mode", c.interceptor.devMode},
					{"listen_address", c.interceptor.listenAddress},
					{"listen_port", c.interceptor.listenPort},
					{"io_timeout_ms", Millis(c.interceptor.ioTimeout)},
					{"ca_cert", c.interceptor.caCertPath},
					{"ca_key", c.interceptor.caKeyPath},
					{"body_excerpt_bytes", c.interceptor.bodyExcerptBytes},
					{"capture_buffer_size", c.interceptor.captureBufferSize},
					{"capture_window_ms", Millis(c.interceptor.captureWindow)},
					{"worker_threads", c.interceptor.workerThreads},
					{"pending_sessions", c.interceptor.pendingSessions}
				}},
				{"classifier", {
					{"model_path", c.classifier.modelPath},
					{"max_body_chars", c.classifier.maxBodyChars},
					{"lanes", c.classifier.lanes},
					{"lane_capacity", c.classifier.laneCapacity},
					{"top_terms", c.classifier.topTerms}
				}},
				{"decision", {
					{"sensitivity", c.decision.sensitivity},
					{"observe_band", c.decision.observeBand},
					{"min_threshold", c.decision.minThreshold},
					{"max_threshold", c.decision.maxThreshold}
				}},
				{"enforcement", {
					{"hosts_path", c.enforcement.hostsPath},
					{"redirect_address", c.enforcement.redirectAddress},
					{"include_www", c.enforcement.includeWww},
					{"reconcile_interval_ms", Millis(c.enforcement.reconcileInterval)}
				}},
				{"retention", {
					{"horizon_days", c.retention.horizonDays}
				}},
				{"lexicons", {
					{"directory", c.lexicons.directory},
					{"languages", c.lexicons.languages}
				}}
			};
		}

		Utils::LogLevel ConfigManager::ParseLogLevel(const std::string& name) {
			const std::string n = Utils::StringUtils::ToLowerCopy(name);
			if (n == "trace") return Utils::LogLevel::Trace;
			if (n == "debug") return Utils::LogLevel::Debug;
			if (n == "info") return Utils::LogLevel::Info;
			if (n == "warn" || n == "warning") return Utils::LogLevel::Warn;
			if (n == "error") return Utils::LogLevel::Error;
			if (n == "fatal") return Utils::LogLevel::Fatal;
			throw Core::ConfigError("logging.level '" + name + "' is not a log level");
		}

		Utils::LoggerConfig ConfigManager::ToLoggerConfig(const LoggingSettings& logging) {
			Utils::LoggerConfig lc;
			lc.async = logging.async;
			lc.toConsole = logging.console;
			lc.toFile = logging.file;
			lc.jsonLines = logging.jsonLines;
			lc.logDirectory = logging.directory;
			lc.maxFileSizeBytes = logging.maxFileSizeBytes;
			lc.maxFileCount = logging.maxFileCount;
			lc.minimalLevel = ParseLogLevel(logging.level);
			return lc;
		}

	}  // namespace Config
}  // namespace NetGuard
