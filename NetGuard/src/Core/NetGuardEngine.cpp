#include "NetGuardEngine.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <cstdio>

namespace NetGuard {
	namespace Core {

		namespace NU = Utils::NetworkUtils;

		namespace {

			std::string FormatScore(double score) {
				char buffer[32];
				std::snprintf(buffer, sizeof(buffer), "%.3f", score);
				return buffer;
			}

			std::string RequireDomain(const std::string& input, const char* stage) {
				std::string domain = NU::NormalizeDomain(input);
				if (domain.empty()) {
					throw ValidationError(stage, "not a valid domain: '" + input + "'");
				}
				return domain;
			}

			bool IsHtmlResponse(const CapturedTransaction& tx) {
				if (tx.responseStatus < 200 || tx.responseStatus >= 300) return false;
				for (const auto& [name, value] : tx.responseHeaders) {
					if (Utils::StringUtils::IEquals(name, "Content-Type")) {
						return Utils::StringUtils::ToLowerCopy(value).find("html") != std::string::npos;
					}
				}
				return true;
			}

		}  // anonymous namespace

		NetGuardEngine::NetGuardEngine(Config::NetGuardConfig config, EngineDependencies dependencies)
			: m_config(std::move(config)), m_deps(std::move(dependencies)) {}

		NetGuardEngine::~NetGuardEngine() {
			Stop();
			m_pipeline.reset();
			m_db.Shutdown();
		}

		void NetGuardEngine::throwStorage(const char* stage, const std::string& domain,
			const Database::DatabaseError& err) const {
			throw StorageError(stage, domain, err.context.empty() ? err.message : err.context + ": " + err.message);
		}

		void NetGuardEngine::requireInitialized() const {
			if (!m_initialized.load()) throw ValidationError("engine", "engine is not initialized");
		}

		// ============================================================================
		// Initialization
		// ============================================================================

		void NetGuardEngine::Initialize() {
			std::lock_guard<std::mutex> lock(m_lifecycleMutex);
			if (m_initialized.load()) return;

			Config::NetGuardConfig cfg = m_config.Snapshot();
			Database::DatabaseError err;

			Database::DatabaseConfig dbConfig;
			dbConfig.databasePath = cfg.database.path;
			dbConfig.enableWAL = cfg.database.enableWAL;
			dbConfig.busyTimeoutMs = cfg.database.busyTimeoutMs;
			dbConfig.maxConnections = std::max<size_t>(cfg.database.maxConnections, 1);
			dbConfig.minConnections = std::min<size_t>(2, dbConfig.maxConnections);
			if (!m_db.Initialize(dbConfig, &err)) throwStorage("init", {}, err);

			m_audit = std::make_unique<Database::AuditLogDB>(m_db);
			m_sites = std::make_unique<Database::BlockedSiteStore>(m_db);
			if (!m_audit->Initialize(&err) || !m_sites->Initialize(&err)) throwStorage("init", {}, err);

			// persisted user preferences win over the file
			const auto settings = m_audit->GetAllSettings(&err);
			if (err.HasError()) throwStorage("init", {}, err);
			m_config.ApplySettings(settings);
			cfg = m_config.Snapshot();
			m_devMode.store(cfg.interceptor.devMode);

			m_lexicon = std::make_shared<const Detection::Lexicon>(
				Detection::Lexicon::Load(cfg.lexicons.languages, cfg.lexicons.directory));
			Detection::ExtractorOptions extractorOptions;
			extractorOptions.maxBodyChars = cfg.classifier.maxBodyChars;
			m_extractor = std::make_shared<const Detection::FeatureExtractor>(m_lexicon, extractorOptions);
			m_classifier = std::make_unique<Detection::NaiveBayesClassifier>(m_extractor);

			Detection::DecisionOptions decisionOptions;
			decisionOptions.minThreshold = cfg.decision.minThreshold;
			decisionOptions.maxThreshold = cfg.decision.maxThreshold;
			decisionOptions.observeBand = cfg.decision.observeBand;
			m_decisions = std::make_unique<Detection::DecisionEngine>(decisionOptions, cfg.decision.sensitivity);
			auto overrides = m_sites->ListOverrides(&err);
			if (err.HasError()) throwStorage("init", {}, err);
			m_decisions->SetOverrides(std::move(overrides));

			std::unique_ptr<Enforcement::IHostsTableIO> hosts = std::move(m_deps.hostsTable);
			if (!hosts) hosts = std::make_unique<Enforcement::FileHostsTableIO>(cfg.enforcement.hostsPath);
			Enforcement::EnforcementOptions enforcementOptions;
			enforcementOptions.redirectAddress = cfg.enforcement.redirectAddress;
			enforcementOptions.includeWww = cfg.enforcement.includeWww;
			m_enforcement = std::make_unique<Enforcement::EnforcementManager>(std::move(hosts), enforcementOptions,
				m_audit.get());

			std::shared_ptr<Monitoring::IConnectionSource> source = m_deps.connectionSource;
			if (!source) {
				Monitoring::ProcNetSourceOptions sourceOptions;
				sourceOptions.procRoot = cfg.monitoring.procRoot;
				sourceOptions.skipPrivateAddresses = cfg.monitoring.skipPrivateAddresses;
				sourceOptions.resolveHostnames = cfg.monitoring.resolveHostnames;
				source = std::make_shared<Monitoring::ProcNetConnectionSource>(sourceOptions);
			}
			Monitoring::SamplerOptions samplerOptions;
			samplerOptions.pollInterval = cfg.monitoring.pollInterval;
			samplerOptions.idleTimeout = cfg.monitoring.idleTimeout;
			samplerOptions.reanalysisCooldown = cfg.monitoring.reanalysisCooldown;
			m_sampler = std::make_unique<Monitoring::ConnectionSampler>(std::move(source), samplerOptions);
			m_sampler->SetEventCallback([this](const Monitoring::ConnectionEvent& ev) { onConnectionEvent(ev); });
			m_sampler->SetErrorCallback([this](const NetGuardError& e) { RecordError(e); });

			m_bandwidth = std::make_unique<Monitoring::BandwidthMonitor>(cfg.monitoring.procRoot);
			m_captures = std::make_unique<Monitoring::CaptureBuffer>(cfg.interceptor.captureBufferSize,
				cfg.interceptor.captureWindow);

			PipelineOptions pipelineOptions;
			pipelineOptions.lanes = cfg.classifier.lanes;
			pipelineOptions.laneCapacity = cfg.classifier.laneCapacity;
			pipelineOptions.writerCapacity = cfg.classifier.lanes * cfg.classifier.laneCapacity;
			pipelineOptions.topTerms = cfg.classifier.topTerms;
			m_pipeline = std::make_unique<DetectionPipeline>(*m_classifier, *m_decisions, pipelineOptions);
			m_pipeline->SetCommitFunction([this](const DetectionOutcome& outcome) { commit(outcome); });
			m_pipeline->SetErrorCallback([this](const NetGuardError& e) { RecordError(e); });

			DetectionFilter latest;
			latest.maxResults = 1;
			const auto last = m_audit->QueryDetections(latest, &err);
			if (!last.empty()) m_lastClassificationMs.store(ToEpochMillis(last.front().timestamp));

			m_initialized.store(true);

			// model: snapshot on disk, else the lexicon corpus
			bool loaded = false;
			try {
				loaded = m_classifier->Load(cfg.classifier.modelPath);
			}
			catch (const ConfigError& e) {
				RecordError(e);
			}
			if (loaded) {
				NG_LOG_INFO("Engine", "Loaded model v%llu from %s",
					static_cast<unsigned long long>(m_classifier->Info().version), cfg.classifier.modelPath.c_str());
			}
			else {
				Retrain();
			}

			NG_LOG_INFO("Engine", "Initialized: db=%s hosts=%s sensitivity=%d languages=%s",
				cfg.database.path.c_str(), m_enforcement->Target().c_str(), m_decisions->Sensitivity(),
				Utils::StringUtils::Join(cfg.lexicons.languages, ",").c_str());
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		bool NetGuardEngine::Start() {
			std::lock_guard<std::mutex> lock(m_lifecycleMutex);
			requireInitialized();
			if (m_running.load()) return true;

			const Config::NetGuardConfig cfg = m_config.Snapshot();
			m_pipeline->Start();

			{
				std::lock_guard<std::mutex> tickerLock(m_tickerMutex);
				m_tickerStop = false;
			}
			m_ticker = std::thread(&NetGuardEngine::tickerLoop, this);

			if (cfg.monitoring.enabled) m_sampler->Start();
			m_running.store(true);
			if (m_devMode.load()) startInterceptor();

			reconcileQuietly("start");
			NG_LOG_INFO("Engine", "Monitoring started (sampler=%s, dev mode=%s)",
				cfg.monitoring.enabled ? "on" : "off", m_devMode.load() ? "on" : "off");
			return true;
		}

		bool NetGuardEngine::Stop() {
			std::lock_guard<std::mutex> lock(m_lifecycleMutex);
			if (!m_running.load()) return false;

			stopInterceptor();
			m_sampler->Stop();
			m_pipeline->Stop();

			{
				std::lock_guard<std::mutex> tickerLock(m_tickerMutex);
				m_tickerStop = true;
			}
			m_tickerWake.notify_all();
			if (m_ticker.joinable()) m_ticker.join();

			m_running.store(false);
			reconcileQuietly("stop");
			NG_LOG_INFO("Engine", "Monitoring stopped; %llu connections and %llu captures since initialization",
				static_cast<unsigned long long>(m_sampler->ObservedCount()),
				static_cast<unsigned long long>(m_captures->TotalAdded()));
			return false;
		}

		void NetGuardEngine::startInterceptor() {
			std::lock_guard<std::mutex> lock(m_interceptorMutex);
			if (m_interceptor) return;

			const Config::NetGuardConfig cfg = m_config.Snapshot();
			std::shared_ptr<Monitoring::CertificateAuthority> authority;
			try {
				authority = Monitoring::CertificateAuthority::Load(cfg.interceptor.caCertPath, cfg.interceptor.caKeyPath);
			}
			catch (const ConfigError& e) {
				// plain HTTP and connection sampling continue without it
				RecordError(e);
			}

			Monitoring::InterceptorOptions options;
			options.listenAddress = cfg.interceptor.listenAddress;
			options.listenPort = cfg.interceptor.listenPort;
			options.ioTimeout = cfg.interceptor.ioTimeout;
			options.bodyExcerptBytes = cfg.interceptor.bodyExcerptBytes;
			if (cfg.interceptor.workerThreads != 0) options.sessionThreads = cfg.interceptor.workerThreads;
			options.sessionBacklog = cfg.interceptor.pendingSessions;

			auto interceptor = std::make_unique<Monitoring::TrafficInterceptor>(options, std::move(authority));
			interceptor->SetCaptureCallback([this](std::shared_ptr<const CapturedTransaction> tx) { onCapture(std::move(tx)); });
			interceptor->SetErrorCallback([this](const NetGuardError& e) { RecordError(e); });
			try {
				interceptor->Start();
			}
			catch (const NetGuardError& e) {
				RecordError(e);
				return;
			}
			m_interceptor = std::move(interceptor);
		}

		void NetGuardEngine::stopInterceptor() {
			std::unique_ptr<Monitoring::TrafficInterceptor> interceptor;
			{
				std::lock_guard<std::mutex> lock(m_interceptorMutex);
				interceptor = std::move(m_interceptor);
			}
			if (interceptor) interceptor->Stop();
		}

		uint16_t NetGuardEngine::InterceptorPort() const {
			std::lock_guard<std::mutex> lock(m_interceptorMutex);
			return m_interceptor ? m_interceptor->BoundPort() : 0;
		}

		void NetGuardEngine::tickerLoop() {
			const Config::NetGuardConfig cfg = m_config.Snapshot();
			const auto reconcileEvery = cfg.enforcement.reconcileInterval;
			const auto bandwidthEvery = cfg.monitoring.bandwidthInterval;
			const auto retentionEvery = std::chrono::hours(1);

			try {
				m_bandwidth->Sample(0);
			}
			catch (const NetGuardError& e) {
				RecordError(e);
			}

			auto nextReconcile = std::chrono::steady_clock::now() + reconcileEvery;
			auto nextBandwidth = std::chrono::steady_clock::now() + bandwidthEvery;
			auto nextRetention = std::chrono::steady_clock::now() + retentionEvery;
			std::unique_lock<std::mutex> lock(m_tickerMutex);
			while (!m_tickerStop) {
				const auto wakeAt = std::min({ nextReconcile, nextBandwidth, nextRetention });
				m_tickerWake.wait_until(lock, wakeAt, [this] { return m_tickerStop; });
				if (m_tickerStop) break;
				lock.unlock();

				const auto now = std::chrono::steady_clock::now();
				if (now >= nextReconcile) {
					reconcileQuietly("tick");
					m_captures->Prune();
					nextReconcile = now + reconcileEvery;
				}
				if (now >= nextBandwidth) {
					try {
						BandwidthSample sample = m_bandwidth->Sample(static_cast<uint32_t>(m_sampler->ActiveCount()));
						m_currentMbps.store(sample.mbps);
						Database::DatabaseError err;
						if (!m_audit->AppendBandwidthSample(sample, &err)) throwStorage("bandwidth", {}, err);
					}
					catch (const NetGuardError& e) {
						RecordError(e);
					}
					nextBandwidth = now + bandwidthEvery;
				}
				if (now >= nextRetention) {
					try {
						Cleanup(cfg.retention.horizonDays);
					}
					catch (const NetGuardError& e) {
						RecordError(e);
					}
					nextRetention = now + retentionEvery;
				}
				lock.lock();
			}
		}

		// ============================================================================
		// Detection flow
		// ============================================================================

		void NetGuardEngine::onConnectionEvent(const Monitoring::ConnectionEvent& event) {
			const Connection& conn = event.connection;
			if (event.type == Monitoring::ConnectionEvent::Type::Closed) {
				NG_LOG_TRACE("Engine", "Closed %s:%u", conn.Subject().c_str(), static_cast<unsigned>(conn.remotePort));
				return;
			}

			Database::DatabaseError err;
			if (!m_audit->AppendConnection(conn, &err)) {
				RecordError(StorageError("sample", conn.Subject(), err.message));
			}

			// an address without a name cannot be enforced through the hosts table
			if (conn.remoteHost.empty()) return;
			const std::string domain = NU::NormalizeDomain(conn.remoteHost);
			if (domain.empty() || !m_sampler->ShouldAnalyze(domain)) return;

			DetectionRequest request;
			request.domain = domain;
			request.subject = domain;
			request.text = m_extractor->DomainText(domain);
			request.source = "sampler";
			Submit(std::move(request));
		}

		void NetGuardEngine::onCapture(std::shared_ptr<const CapturedTransaction> tx) {
			m_captures->Add(tx);

			Database::DatabaseError err;
			if (!m_audit->AppendCapture(*tx, &err)) {
				RecordError(StorageError("capture", tx->host, err.message));
			}

			if (!IsHtmlResponse(*tx)) return;
			const std::string domain = NU::NormalizeDomain(tx->host);
			// pages share the sampler's cooldown table under their own key space
			if (domain.empty() || !m_sampler->ShouldAnalyze("page:" + domain)) return;

			DetectionRequest request;
			request.domain = domain;
			request.subject = tx->url;
			request.text = m_extractor->TransactionText(*tx);
			request.source = "interceptor";
			Submit(std::move(request));
		}

		bool NetGuardEngine::Submit(DetectionRequest request) {
			requireInitialized();
			return m_pipeline->Submit(std::move(request));
		}

		BlockDecision NetGuardEngine::Analyze(const std::string& domain, const std::string& text,
			const std::string& source, const std::string& subject) {
			requireInitialized();
			DetectionRequest request;
			request.domain = RequireDomain(domain, "classify");
			request.subject = subject.empty() ? request.domain : subject;
			request.text = text.empty() ? m_extractor->DomainText(request.domain) : text;
			request.source = source;
			request.enqueuedAt = Clock::now();

			const DetectionOutcome outcome = m_pipeline->Evaluate(request);
			commit(outcome);
			return outcome.decision;
		}

		void NetGuardEngine::commit(const DetectionOutcome& outcome) {
			std::lock_guard<std::mutex> lock(m_commitMutex);
			const BlockDecision& decision = outcome.decision;
			const ClassificationResult& result = outcome.result;

			DetectionLogEntry entry;
			entry.domain = decision.domain;
			entry.subject = result.subject;
			entry.score = result.score;
			entry.modelVersion = result.modelVersion;
			entry.topTerms = result.topTerms;
			entry.verdict = decision.verdict;
			entry.reason = decision.reason;
			entry.conflict = decision.conflict;
			entry.source = outcome.request.source;
			entry.timestamp = decision.timestamp == Timestamp{} ? Clock::now() : decision.timestamp;

			Database::DatabaseError err;
			if (!m_audit->AppendDetection(entry, &err)) throwStorage("commit", entry.domain, err);
			m_lastClassificationMs.store(ToEpochMillis(entry.timestamp));

			if (decision.verdict != Verdict::Block) {
				NG_LOG_DEBUG("Engine", "%s %s (score %s, %s)", ToString(decision.verdict), entry.domain.c_str(),
					FormatScore(entry.score).c_str(), entry.source.c_str());
				return;
			}

			// an allow override set after this request was classified still wins
			if (decision.reason == DecisionReason::Classifier) {
				const auto ov = m_decisions->FindOverride(decision.domain);
				if (ov && ov->kind == OverrideKind::Allow) return;
			}

			BlockedSite site;
			site.domain = decision.domain;
			site.source = decision.reason == DecisionReason::ManualBlock ? SiteSource::Manual : SiteSource::Auto;
			site.addedAt = entry.timestamp;
			site.reason = decision.reason == DecisionReason::ManualBlock
				? std::string("manual block")
				: "classifier score " + FormatScore(decision.score) + " (model v" + std::to_string(entry.modelVersion) + ")";

			bool inserted = false;
			if (!m_sites->AddSite(site, &inserted, &err)) throwStorage("commit", site.domain, err);
			if (!inserted) return;

			NG_LOG_INFO("Engine", "Blocked %s (%s, score %s, via %s)", site.domain.c_str(), ToString(decision.reason),
				FormatScore(decision.score).c_str(), entry.source.c_str());
			reconcileQuietly("decision");
		}

		// ============================================================================
		// Enforcement
		// ============================================================================

		void NetGuardEngine::reconcileQuietly(const char* trigger) {
			try {
				const auto report = ReconcileNow();
				if (report.wrote) {
					NG_LOG_DEBUG("Engine", "Reconcile (%s): +%zu -%zu", trigger, report.added.size(), report.removed.size());
				}
			}
			catch (const NetGuardError& e) {
				// already recorded; retried on the next tick
				NG_LOG_DEBUG("Engine", "Reconcile (%s) deferred: %s", trigger, e.what());
			}
		}

		Enforcement::ReconcileReport NetGuardEngine::ReconcileNow() {
			requireInitialized();
			Database::DatabaseError err;
			const auto domains = m_sites->ActiveDomains(&err);
			try {
				if (err.HasError()) throwStorage("enforce", {}, err);
				return m_enforcement->Reconcile(domains);
			}
			catch (const NetGuardError& e) {
				RecordError(e);
				throw;
			}
		}

		void NetGuardEngine::BlockDomain(const std::string& domain, const std::string& reason) {
			requireInitialized();
			const std::string normalized = RequireDomain(domain, "block");
			const Timestamp now = Clock::now();

			DomainOverride ov;
			ov.domain = normalized;
			ov.kind = OverrideKind::Block;
			ov.note = reason;
			ov.createdAt = now;

			BlockedSite site;
			site.domain = normalized;
			site.source = SiteSource::Manual;
			site.addedAt = now;
			site.reason = reason.empty() ? "manual block" : reason;

			Database::DatabaseError err;
			{
				std::lock_guard<std::mutex> lock(m_commitMutex);
				if (!m_sites->SetOverride(ov, &err)) throwStorage("block", normalized, err);
				m_decisions->UpsertOverride(ov);
				bool inserted = false;
				if (!m_sites->AddSite(site, &inserted, &err)) throwStorage("block", normalized, err);
				// an automatic block already in force becomes the user's
				if (!inserted && !m_sites->MarkManual(normalized, site.reason, nullptr, &err)) {
					throwStorage("block", normalized, err);
				}
			}

			DetectionOutcome outcome;
			outcome.request.domain = normalized;
			outcome.request.subject = normalized;
			outcome.request.source = "manual";
			if (m_classifier->HasModel()) {
				outcome.result = m_classifier->Classify(normalized, m_extractor->DomainText(normalized));
			}
			else {
				outcome.result.subject = normalized;
				outcome.result.timestamp = now;
			}
			outcome.decision = m_decisions->Decide(normalized, outcome.result);
			commit(outcome);

			NG_LOG_INFO("Engine", "Manual block of %s: %s", normalized.c_str(), site.reason.c_str());
			reconcileQuietly("block");
		}

		void NetGuardEngine::UnblockDomain(const std::string& domain) {
			requireInitialized();
			const std::string normalized = RequireDomain(domain, "unblock");
			const Timestamp now = Clock::now();

			DomainOverride ov;
			ov.domain = normalized;
			ov.kind = OverrideKind::Allow;
			ov.note = "manual unblock";
			ov.createdAt = now;

			Database::DatabaseError err;
			bool changed = false;
			std::optional<BlockedSite> previous;
			{
				std::lock_guard<std::mutex> lock(m_commitMutex);
				if (!m_sites->SetOverride(ov, &err)) throwStorage("unblock", normalized, err);
				m_decisions->UpsertOverride(ov);
				previous = m_sites->GetActive(normalized, &err);
				if (!m_sites->Deactivate(normalized, now, &changed, &err)) throwStorage("unblock", normalized, err);
			}

			DetectionOutcome outcome;
			outcome.request.domain = normalized;
			outcome.request.subject = normalized;
			outcome.request.source = "manual";
			if (m_classifier->HasModel()) {
				outcome.result = m_classifier->Classify(normalized, m_extractor->DomainText(normalized));
			}
			else {
				outcome.result.subject = normalized;
				outcome.result.timestamp = now;
			}
			outcome.decision = m_decisions->Decide(normalized, outcome.result);
			commit(outcome);

			if (changed && previous) {
				NG_LOG_INFO("Engine", "Manual unblock of %s (was %s block)", normalized.c_str(), ToString(previous->source));
			}
			else {
				NG_LOG_INFO("Engine", "Manual allow of %s", normalized.c_str());
			}
			reconcileQuietly("unblock");
		}

		void NetGuardEngine::ClearOverride(const std::string& domain) {
			requireInitialized();
			const std::string normalized = RequireDomain(domain, "override");
			Database::DatabaseError err;
			std::lock_guard<std::mutex> lock(m_commitMutex);
			if (!m_sites->RemoveOverride(normalized, &err)) throwStorage("override", normalized, err);
			m_decisions->RemoveOverride(normalized);
		}

		// ============================================================================
		// Settings
		// ============================================================================

		void NetGuardEngine::SetSensitivity(int sensitivity) {
			requireInitialized();
			m_decisions->SetSensitivity(sensitivity);
			m_config.SetSensitivity(sensitivity);
			Database::DatabaseError err;
			if (!m_audit->SetSetting(Config::SETTING_SENSITIVITY, std::to_string(sensitivity), &err)) {
				throwStorage("settings", {}, err);
			}
			NG_LOG_INFO("Engine", "Sensitivity %d (threshold %s)", sensitivity, FormatScore(m_decisions->Threshold()).c_str());
		}

		void NetGuardEngine::SetDevMode(bool enabled) {
			requireInitialized();
			m_devMode.store(enabled);
			m_config.SetDevMode(enabled);
			Database::DatabaseError err;
			if (!m_audit->SetSetting(Config::SETTING_DEV_MODE, enabled ? "true" : "false", &err)) {
				throwStorage("settings", {}, err);
			}
			if (!m_running.load()) return;
			if (enabled) startInterceptor();
			else stopInterceptor();
		}

		std::optional<std::string> NetGuardEngine::GetSetting(const std::string& key) {
			requireInitialized();
			Database::DatabaseError err;
			auto value = m_audit->GetSetting(key, &err);
			if (err.HasError()) throwStorage("settings", {}, err);
			return value;
		}

		void NetGuardEngine::SetSetting(const std::string& key, const std::string& value) {
			requireInitialized();
			if (key.empty()) throw ValidationError("settings", "empty setting key");

			// known keys are validated and applied live
			m_config.ApplySettings({ { key, value } });
			const Config::NetGuardConfig cfg = m_config.Snapshot();
			if (key == Config::SETTING_SENSITIVITY) {
				SetSensitivity(cfg.decision.sensitivity);
				return;
			}
			if (key == Config::SETTING_DEV_MODE) {
				SetDevMode(cfg.interceptor.devMode);
				return;
			}

			Database::DatabaseError err;
			if (!m_audit->SetSetting(key, value, &err)) throwStorage("settings", {}, err);
		}

		// ============================================================================
		// Feedback & model
		// ============================================================================

		int64_t NetGuardEngine::SubmitFeedback(const std::string& domain, Label correctedLabel) {
			requireInitialized();
			FeedbackRecord record;
			record.domain = RequireDomain(domain, "feedback");
			record.label = correctedLabel;
			record.createdAt = Clock::now();

			Database::DatabaseError err;
			const int64_t id = m_audit->AppendFeedback(record, &err);
			if (id == 0) throwStorage("feedback", record.domain, err);
			NG_LOG_INFO("Engine", "Feedback #%lld: %s is %s (applies at next retrain)",
				static_cast<long long>(id), record.domain.c_str(), ToString(correctedLabel));
			return id;
		}

		std::vector<TrainingExample> NetGuardEngine::trainingCorpus(int64_t& lastFeedbackId) {
			std::vector<TrainingExample> examples = m_lexicon->SeedCorpus();
			lastFeedbackId = 0;

			Database::DatabaseError err;
			const auto feedback = m_audit->ListFeedback(true, &err);
			if (err.HasError()) throwStorage("train", {}, err);
			for (const auto& record : feedback) {
				examples.push_back({ m_extractor->DomainText(record.domain), record.label });
				lastFeedbackId = std::max(lastFeedbackId, record.id);
			}
			return examples;
		}

		std::optional<uint64_t> NetGuardEngine::Retrain() {
			requireInitialized();
			std::lock_guard<std::mutex> lock(m_retrainMutex);

			int64_t lastFeedbackId = 0;
			uint64_t version = 0;
			try {
				const auto corpus = trainingCorpus(lastFeedbackId);
				version = m_classifier->Train(corpus);
			}
			catch (const InsufficientDataError& e) {
				RecordError(e);
				return std::nullopt;
			}

			Database::DatabaseError err;
			if (lastFeedbackId > 0 && !m_audit->MarkFeedbackConsumed(lastFeedbackId, &err)) {
				RecordError(StorageError("train", {}, err.message));
			}

			const std::string modelPath = m_config.Snapshot().classifier.modelPath;
			try {
				m_classifier->Save(modelPath);
			}
			catch (const StorageError& e) {
				RecordError(e);
			}

			const ModelInfo info = m_classifier->Info();
			NG_LOG_INFO("Engine", "Model v%llu active: %zu terms, %llu gambling / %llu benign documents",
				static_cast<unsigned long long>(version), info.vocabularySize,
				static_cast<unsigned long long>(info.gamblingDocuments),
				static_cast<unsigned long long>(info.benignDocuments));
			return version;
		}

		ValidationReport NetGuardEngine::ValidateModel(const std::vector<TrainingExample>& samples) const {
			return m_classifier->Validate(samples, m_decisions->Threshold());
		}

		// ============================================================================
		// Queries
		// ============================================================================

		EngineStats NetGuardEngine::CurrentStats() {
			requireInitialized();
			EngineStats stats;
			stats.running = m_running.load();
			stats.devMode = m_devMode.load();
			stats.activeConnections = m_sampler->ActiveCount();
			stats.modelVersion = m_classifier->Info().version;
			stats.currentMbps = m_currentMbps.load();
			stats.sensitivity = m_decisions->Sensitivity();

			Database::DatabaseError err;
			const int64_t active = m_sites->CountActive(&err);
			if (err.HasError()) throwStorage("stats", {}, err);
			const int64_t detections = m_audit->CountDetections(&err);
			if (err.HasError()) throwStorage("stats", {}, err);
			// lifetime totals survive restarts, unlike the in-memory counters
			const int64_t connections = m_audit->CountConnections(&err);
			if (err.HasError()) throwStorage("stats", {}, err);
			const int64_t captures = m_audit->CountCaptures(&err);
			if (err.HasError()) throwStorage("stats", {}, err);
			stats.blockCount = static_cast<uint64_t>(std::max<int64_t>(active, 0));
			stats.totalDetections = static_cast<uint64_t>(std::max<int64_t>(detections, 0));
			stats.connectionsObserved = static_cast<uint64_t>(std::max<int64_t>(connections, 0));
			stats.transactionsCaptured = static_cast<uint64_t>(std::max<int64_t>(captures, 0));

			const int64_t lastMs = m_lastClassificationMs.load();
			if (lastMs > 0) stats.lastClassification = FromEpochMillis(lastMs);
			return stats;
		}

		std::vector<DetectionLogEntry> NetGuardEngine::ListDetections(const DetectionFilter& filter) {
			requireInitialized();
			Database::DatabaseError err;
			auto rows = m_audit->QueryDetections(filter, &err);
			if (err.HasError()) throwStorage("audit", {}, err);
			return rows;
		}

		std::vector<ErrorEvent> NetGuardEngine::ListErrors(const ErrorFilter& filter) {
			requireInitialized();
			Database::DatabaseError err;
			auto rows = m_audit->QueryErrors(filter, &err);
			if (err.HasError()) throwStorage("audit", {}, err);
			return rows;
		}

		std::vector<EnforcementAction> NetGuardEngine::ListEnforcementActions(const EnforcementActionFilter& filter) {
			requireInitialized();
			Database::DatabaseError err;
			auto rows = m_audit->QueryEnforcementActions(filter, &err);
			if (err.HasError()) throwStorage("audit", {}, err);
			return rows;
		}

		std::vector<Connection> NetGuardEngine::RecentConnections(size_t limit) {
			requireInitialized();
			Database::DatabaseError err;
			auto rows = m_audit->RecentConnections(limit, &err);
			if (err.HasError()) throwStorage("audit", {}, err);
			return rows;
		}

		std::vector<BandwidthSample> NetGuardEngine::BandwidthHistory(int hours) {
			requireInitialized();
			if (hours <= 0 || hours > MAX_BANDWIDTH_HOURS) {
				throw ValidationError("bandwidth", "history window must be 1.." +
					std::to_string(MAX_BANDWIDTH_HOURS) + " hours, got " + std::to_string(hours));
			}
			Database::DatabaseError err;
			auto rows = m_audit->BandwidthSince(Clock::now() - std::chrono::hours(hours), MAX_BANDWIDTH_SAMPLES, &err);
			if (err.HasError()) throwStorage("audit", {}, err);
			return rows;
		}

		std::vector<std::shared_ptr<const CapturedTransaction>> NetGuardEngine::RecentCaptures() const {
			return m_captures ? m_captures->Snapshot() : std::vector<std::shared_ptr<const CapturedTransaction>>{};
		}

		// ============================================================================
		// Export / import
		// ============================================================================

		std::vector<BlockedSite> NetGuardEngine::ExportBlockedSites() {
			requireInitialized();
			Database::DatabaseError err;
			auto sites = m_sites->Export(&err);
			if (err.HasError()) throwStorage("export", {}, err);
			return sites;
		}

		int NetGuardEngine::ImportBlockedSites(const std::vector<BlockedSite>& sites) {
			requireInitialized();
			std::vector<BlockedSite> normalized;
			normalized.reserve(sites.size());
			for (BlockedSite site : sites) {
				site.domain = RequireDomain(site.domain, "import");
				normalized.push_back(std::move(site));
			}

			Database::DatabaseError err;
			int written = 0;
			{
				std::lock_guard<std::mutex> lock(m_commitMutex);
				written = m_sites->Import(normalized, &err);
			}
			if (written < 0) throwStorage("import", {}, err);
			NG_LOG_INFO("Engine", "Imported %d of %zu blocked-site records", written, sites.size());
			reconcileQuietly("import");
			return written;
		}

		void NetGuardEngine::ExportBlockedSitesToFile(const std::filesystem::path& path) {
			const auto sites = ExportBlockedSites();
			Utils::JSON::Error jerr;
			if (!Utils::JSON::SaveToFile(path, Database::BlockedSiteStore::ToJson(sites), &jerr)) {
				throw StorageError("export", {}, "cannot write " + path.string() + ": " + jerr.message);
			}
			NG_LOG_INFO("Engine", "Exported %zu blocked-site records to %s", sites.size(), path.c_str());
		}

		int NetGuardEngine::ImportBlockedSitesFromFile(const std::filesystem::path& path) {
			Utils::JSON::Json doc;
			Utils::JSON::Error jerr;
			if (!Utils::JSON::LoadFromFile(path, doc, &jerr)) {
				throw ConfigError("cannot read " + path.string() + ": " + jerr.message);
			}
			std::vector<BlockedSite> sites;
			std::string message;
			if (!Database::BlockedSiteStore::FromJson(doc, sites, &message)) {
				throw ConfigError("invalid blocked-site file " + path.string() + ": " + message);
			}
			return ImportBlockedSites(sites);
		}

		// ============================================================================
		// Retention
		// ============================================================================

		CleanupReport NetGuardEngine::Cleanup(int retentionDays) {
			if (retentionDays < 0) throw ValidationError("cleanup", "retention days must not be negative");
			return Cleanup(Clock::now() - std::chrono::hours(24) * retentionDays);
		}

		CleanupReport NetGuardEngine::Cleanup(Timestamp horizon) {
			requireInitialized();
			CleanupReport report;
			Database::DatabaseError err;
			if (!m_audit->Cleanup(horizon, report, &err)) throwStorage("cleanup", {}, err);
			m_captures->Prune();
			NG_LOG_INFO("Engine", "Cleanup before %s: %zu detections, %zu captures, %zu errors, %zu connections removed",
				FormatTimestamp(horizon).c_str(), report.detectionsDeleted, report.capturesDeleted,
				report.errorsDeleted, report.connectionsDeleted);
			return report;
		}

		// ============================================================================
		// Errors
		// ============================================================================

		void NetGuardEngine::RecordError(const NetGuardError& error) {
			NG_LOG_WARN("Engine", "[%s/%s] %s: %s", ErrorKindToString(error.kind()), error.stage().c_str(),
				error.domain().empty() ? "-" : error.domain().c_str(), error.what());
			if (!m_audit) return;
			Database::DatabaseError err;
			if (m_audit->RecordError(error, &err) == 0) {
				NG_LOG_ERROR("Engine", "Could not record error event: %s", err.message.c_str());
			}
		}

	}  // namespace Core
}  // namespace NetGuard
