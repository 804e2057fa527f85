/**
 * ============================================================================
 * NetGuard Engine Unit Tests
 * ============================================================================
 *
 * Runs the full engine against a temporary database and an in-memory
 * override table. Connection sampling is disabled unless a test enables it.
 */

#include "../../../src/Core/NetGuardEngine.hpp"
#include "../../../src/Database/AuditLogDB.hpp"
#include "../../TestHelpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>

using namespace NetGuard;
using namespace NetGuard::Core;

namespace {

	struct MemoryTable {
		std::mutex mutex;
		std::string content = "127.0.0.1 localhost\n";
		bool denyWrites = false;
		int writes = 0;

		std::string Get() {
			std::lock_guard<std::mutex> lock(mutex);
			return content;
		}
	};

	class MemoryTableIO final : public Enforcement::IHostsTableIO {
	public:
		explicit MemoryTableIO(std::shared_ptr<MemoryTable> table) : m_table(std::move(table)) {}

		std::string Read() override {
			std::lock_guard<std::mutex> lock(m_table->mutex);
			return m_table->content;
		}

		void Write(const std::string& content) override {
			std::lock_guard<std::mutex> lock(m_table->mutex);
			if (m_table->denyWrites) throw PermissionError("enforce", "hosts table is read-only", EACCES);
			m_table->content = content;
			++m_table->writes;
		}

		std::string Describe() const override { return "memory"; }

	private:
		std::shared_ptr<MemoryTable> m_table;
	};

	std::vector<TrainingExample> GamblingCorpus() {
		return {
			{ "casino jackpot slots bonus", Label::Gambling },
			{ "poker betting odds tournament", Label::Gambling },
			{ "togel judi bandar online", Label::Gambling },
			{ "university library research", Label::Benign },
			{ "weather forecast news", Label::Benign },
			{ "cooking recipes garden", Label::Benign }
		};
	}

	class NetGuardEngineTest : public ::testing::Test {
	protected:
		NetGuardEngineTest() : dir("engine") {}

		void SetUp() override {
			table = std::make_shared<MemoryTable>();
			source = std::make_shared<Testing::FakeConnectionSource>();
		}

		Config::NetGuardConfig MakeConfig() {
			Config::NetGuardConfig cfg;
			cfg.database.path = (dir / "netguard.db").string();
			cfg.classifier.modelPath = (dir / "model.json").string();
			cfg.classifier.lanes = 2;
			cfg.lexicons.directory = (dir / "lexicons").string();
			cfg.lexicons.languages = { "en", "id" };
			cfg.monitoring.enabled = false;
			cfg.monitoring.pollInterval = std::chrono::milliseconds(50);
			cfg.monitoring.idleTimeout = std::chrono::milliseconds(1000);
			cfg.monitoring.procRoot = (dir / "proc").string();
			cfg.enforcement.reconcileInterval = std::chrono::milliseconds(100);
			return cfg;
		}

		std::unique_ptr<NetGuardEngine> Make(const Config::NetGuardConfig& cfg) {
			EngineDependencies deps;
			deps.connectionSource = source;
			deps.hostsTable = std::make_unique<MemoryTableIO>(table);
			auto engine = std::make_unique<NetGuardEngine>(cfg, std::move(deps));
			engine->Initialize();
			return engine;
		}

		std::unique_ptr<NetGuardEngine> Make() { return Make(MakeConfig()); }

		Testing::TempDir dir;
		std::shared_ptr<MemoryTable> table;
		std::shared_ptr<Testing::FakeConnectionSource> source;
	};

	bool Contains(const std::string& haystack, const std::string& needle) {
		return haystack.find(needle) != std::string::npos;
	}

}  // namespace

// ============================================================================
// INITIALIZATION & LIFECYCLE
// ============================================================================

/**
 * @brief Without a snapshot the engine trains the lexicon corpus and saves it
 */
TEST_F(NetGuardEngineTest, InitializeTrainsAndSavesSeedModel) {
	auto engine = Make();
	const ModelInfo info = engine->GetModelInfo();
	EXPECT_EQ(info.version, 1u);
	EXPECT_GT(info.gamblingDocuments, 0u);
	EXPECT_GT(info.benignDocuments, 0u);
	EXPECT_TRUE(std::filesystem::exists(dir / "model.json"));
	EXPECT_EQ(engine->Sensitivity(), 50);
	EXPECT_FALSE(engine->IsRunning());
}

/**
 * @brief A second engine loads the saved snapshot and continues its version counter
 */
TEST_F(NetGuardEngineTest, ReloadsSnapshotAcrossRestart) {
	{
		auto engine = Make();
		ASSERT_EQ(engine->GetModelInfo().version, 1u);
	}
	auto engine = Make();
	EXPECT_EQ(engine->GetModelInfo().version, 1u);
	const auto next = engine->Retrain();
	ASSERT_TRUE(next.has_value());
	EXPECT_EQ(*next, 2u);
}

/**
 * @brief A corrupt snapshot is recorded and replaced by a fresh model
 */
TEST_F(NetGuardEngineTest, CorruptSnapshotIsRetrained) {
	Testing::WriteFile(dir / "model.json", "{ not json");
	auto engine = Make();
	EXPECT_TRUE(engine->Classifier().HasModel());

	ErrorFilter filter;
	filter.kind = ErrorKind::Config;
	EXPECT_EQ(engine->ListErrors(filter).size(), 1u);
}

/**
 * @brief Operations before Initialize are rejected
 */
TEST_F(NetGuardEngineTest, RequiresInitialize) {
	NetGuardEngine engine(MakeConfig());
	EXPECT_THROW(engine.Start(), ValidationError);
	EXPECT_THROW(engine.Analyze("casino.example", "casino"), ValidationError);
	EXPECT_THROW((void)engine.CurrentStats(), ValidationError);
}

/**
 * @brief Start and Stop are idempotent
 */
TEST_F(NetGuardEngineTest, StartStopIdempotent) {
	auto engine = Make();
	EXPECT_TRUE(engine->Start());
	EXPECT_TRUE(engine->Start());
	EXPECT_TRUE(engine->IsRunning());
	EXPECT_TRUE(engine->CurrentStats().running);

	EXPECT_FALSE(engine->Stop());
	EXPECT_FALSE(engine->Stop());
	EXPECT_FALSE(engine->IsRunning());

	EXPECT_TRUE(engine->Start());
	EXPECT_FALSE(engine->Stop());
}

// ============================================================================
// DETECTION
// ============================================================================

/**
 * @brief A gambling page is blocked, logged and enforced with its www variant
 */
TEST_F(NetGuardEngineTest, AnalyzeBlocksGamblingDomain) {
	auto engine = Make();
	engine->Classifier().Train(GamblingCorpus());

	const BlockDecision decision = engine->Analyze("WWW.Casino-Royale.example.", "casino jackpot slots bonus");
	EXPECT_EQ(decision.verdict, Verdict::Block);
	EXPECT_EQ(decision.domain, "casino-royale.example");
	EXPECT_EQ(decision.reason, DecisionReason::Classifier);

	const std::string hosts = table->Get();
	EXPECT_TRUE(Contains(hosts, "127.0.0.1 casino-royale.example"));
	EXPECT_TRUE(Contains(hosts, "127.0.0.1 www.casino-royale.example"));
	EXPECT_TRUE(Contains(hosts, "127.0.0.1 localhost"));

	const EngineStats stats = engine->CurrentStats();
	EXPECT_EQ(stats.blockCount, 1u);
	EXPECT_EQ(stats.totalDetections, 1u);
	EXPECT_EQ(stats.modelVersion, 2u);
	EXPECT_TRUE(stats.lastClassification.has_value());

	const auto rows = engine->ListDetections({});
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].source, "manual");
	EXPECT_EQ(rows[0].modelVersion, 2u);
	EXPECT_FALSE(rows[0].topTerms.empty());

	const auto sites = engine->ExportBlockedSites();
	ASSERT_EQ(sites.size(), 1u);
	EXPECT_EQ(sites[0].source, SiteSource::Auto);
}

/**
 * @brief Benign text is allowed and nothing is enforced
 */
TEST_F(NetGuardEngineTest, AnalyzeAllowsBenignDomain) {
	auto engine = Make();
	engine->Classifier().Train(GamblingCorpus());
	const int writesBefore = table->writes;

	const BlockDecision decision = engine->Analyze("library.example", "university library research news");
	EXPECT_EQ(decision.verdict, Verdict::Allow);
	EXPECT_EQ(engine->CurrentStats().blockCount, 0u);
	EXPECT_EQ(engine->CurrentStats().totalDetections, 1u);
	EXPECT_FALSE(Contains(table->Get(), "library.example"));
	EXPECT_EQ(table->writes, writesBefore);
}

/**
 * @brief Queued detections are committed by the pipeline while running
 */
TEST_F(NetGuardEngineTest, SubmittedRequestsAreCommitted) {
	auto engine = Make();
	engine->Classifier().Train(GamblingCorpus());
	engine->Start();

	DetectionRequest request;
	request.domain = "queued-bet.example";
	request.subject = "https://queued-bet.example/lobby";
	request.text = "casino jackpot poker odds";
	request.source = "interceptor";
	ASSERT_TRUE(engine->Submit(request));

	ASSERT_TRUE(Testing::WaitUntil([&] { return engine->CurrentStats().totalDetections == 1; }));
	ASSERT_TRUE(Testing::WaitUntil([&] { return Contains(table->Get(), "queued-bet.example"); }));
	engine->Stop();

	const auto rows = engine->ListDetections({});
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].subject, "https://queued-bet.example/lobby");
	EXPECT_EQ(rows[0].source, "interceptor");
}

/**
 * @brief Sampled connections with a host name are classified
 */
TEST_F(NetGuardEngineTest, SampledConnectionsFeedDetection) {
	auto cfg = MakeConfig();
	cfg.monitoring.enabled = true;
	source->SetConnections({
		Testing::MakeConnection("203.0.113.9", "slots-jackpot-casino.example"),
		Testing::MakeConnection("203.0.113.10", "")
	});
	auto engine = Make(cfg);
	engine->Start();

	ASSERT_TRUE(Testing::WaitUntil([&] { return engine->CurrentStats().totalDetections >= 1; }));
	engine->Stop();

	const EngineStats stats = engine->CurrentStats();
	EXPECT_EQ(stats.connectionsObserved, 2u);
	const auto rows = engine->ListDetections({});
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].domain, "slots-jackpot-casino.example");
	EXPECT_EQ(rows[0].source, "sampler");
}

/**
 * @brief Connection and capture totals come from the database and survive a restart
 */
TEST_F(NetGuardEngineTest, StatsAndHistoryReadLoggedRows) {
	const auto cfg = MakeConfig();
	const auto now = Clock::now();
	{
		Database::DatabaseManager db;
		Database::DatabaseConfig dbConfig;
		dbConfig.databasePath = cfg.database.path;
		Database::DatabaseError err;
		ASSERT_TRUE(db.Initialize(dbConfig, &err)) << err.message;
		Database::AuditLogDB audit(db);
		ASSERT_TRUE(audit.Initialize(&err)) << err.message;

		auto older = Testing::MakeConnection("203.0.113.1", "first.example");
		older.lastSeen = now - std::chrono::minutes(5);
		auto newer = Testing::MakeConnection("203.0.113.2", "second.example");
		newer.lastSeen = now - std::chrono::minutes(1);
		ASSERT_GT(audit.AppendConnection(older), 0);
		ASSERT_GT(audit.AppendConnection(newer), 0);

		CapturedTransaction tx;
		tx.url = "http://second.example/";
		tx.host = "second.example";
		tx.method = "GET";
		tx.responseStatus = 200;
		ASSERT_GT(audit.AppendCapture(tx), 0);

		for (const auto age : { std::chrono::hours(30), std::chrono::hours(3), std::chrono::hours(0) }) {
			BandwidthSample sample;
			sample.mbps = 1.0 + static_cast<double>(age.count());
			sample.timestamp = now - age - std::chrono::minutes(1);
			ASSERT_GT(audit.AppendBandwidthSample(sample), 0);
		}
		db.Shutdown();
	}

	auto engine = Make(cfg);
	const EngineStats stats = engine->CurrentStats();
	EXPECT_EQ(stats.connectionsObserved, 2u);
	EXPECT_EQ(stats.transactionsCaptured, 1u);

	const auto connections = engine->RecentConnections(10);
	ASSERT_EQ(connections.size(), 2u);
	EXPECT_EQ(connections[0].remoteHost, "second.example");
	EXPECT_EQ(connections[1].remoteAddress, "203.0.113.1");
	EXPECT_EQ(engine->RecentConnections(1).size(), 1u);

	const auto day = engine->BandwidthHistory(24);
	ASSERT_EQ(day.size(), 2u);
	EXPECT_LT(day[0].timestamp, day[1].timestamp);
	EXPECT_DOUBLE_EQ(day[0].mbps, 4.0);
	EXPECT_EQ(engine->BandwidthHistory(1).size(), 1u);
	EXPECT_EQ(engine->BandwidthHistory(48).size(), 3u);
	EXPECT_THROW(engine->BandwidthHistory(0), ValidationError);
	EXPECT_THROW(engine->BandwidthHistory(NetGuardEngine::MAX_BANDWIDTH_HOURS + 1), ValidationError);
}

/**
 * @brief Invalid domains are rejected with ValidationError
 */
TEST_F(NetGuardEngineTest, RejectsInvalidDomain) {
	auto engine = Make();
	EXPECT_THROW(engine->BlockDomain("", "x"), ValidationError);
	EXPECT_THROW(engine->UnblockDomain("not a domain"), ValidationError);
	EXPECT_THROW(engine->Analyze("   ", "casino"), ValidationError);
}

// ============================================================================
// MANUAL CONTROL
// ============================================================================

/**
 * @brief Unblocking removes the entries and a later classifier block does not return them
 */
TEST_F(NetGuardEngineTest, ManualUnblockStaysUnblocked) {
	auto engine = Make();
	engine->Classifier().Train(GamblingCorpus());

	engine->BlockDomain("bet.example", "reported by parent");
	EXPECT_TRUE(Contains(table->Get(), "bet.example"));
	ASSERT_EQ(engine->ExportBlockedSites().size(), 1u);
	EXPECT_EQ(engine->ExportBlockedSites()[0].source, SiteSource::Manual);

	engine->UnblockDomain("bet.example");
	EXPECT_FALSE(Contains(table->Get(), "bet.example"));

	const BlockDecision decision = engine->Analyze("bet.example", "casino jackpot slots bonus poker");
	EXPECT_EQ(decision.verdict, Verdict::Allow);
	EXPECT_EQ(decision.reason, DecisionReason::ManualAllow);
	EXPECT_TRUE(decision.conflict);
	EXPECT_FALSE(Contains(table->Get(), "bet.example"));
	EXPECT_EQ(engine->CurrentStats().blockCount, 0u);

	EnforcementActionFilter filter;
	filter.domainSubstring = "bet";
	const auto actions = engine->ListEnforcementActions(filter);
	EXPECT_TRUE(std::any_of(actions.begin(), actions.end(),
		[](const EnforcementAction& a) { return a.action == "remove" && a.domain == "bet.example"; }));
	EXPECT_TRUE(std::all_of(actions.begin(), actions.end(),
		[](const EnforcementAction& a) { return a.domain == "bet.example"; }));
}

/**
 * @brief Clearing the override hands the domain back to the classifier
 */
TEST_F(NetGuardEngineTest, ClearOverrideRestoresClassifier) {
	auto engine = Make();
	engine->Classifier().Train(GamblingCorpus());
	engine->UnblockDomain("jackpot.example");
	engine->ClearOverride("jackpot.example");

	const BlockDecision decision = engine->Analyze("jackpot.example", "casino jackpot slots bonus");
	EXPECT_EQ(decision.verdict, Verdict::Block);
	EXPECT_EQ(decision.reason, DecisionReason::Classifier);
}

/**
 * @brief Manual block wins over a benign score
 */
TEST_F(NetGuardEngineTest, ManualBlockOverridesBenignScore) {
	auto engine = Make();
	engine->Classifier().Train(GamblingCorpus());
	engine->BlockDomain("weather.example", "");

	const BlockDecision decision = engine->Analyze("weather.example", "weather forecast news");
	EXPECT_EQ(decision.verdict, Verdict::Block);
	EXPECT_EQ(decision.reason, DecisionReason::ManualBlock);
	EXPECT_EQ(engine->CurrentStats().blockCount, 1u);
}

/**
 * @brief A manual block of an automatically blocked domain takes the record over
 */
TEST_F(NetGuardEngineTest, ManualBlockTakesOverAutomaticRecord) {
	auto engine = Make();
	engine->Classifier().Train(GamblingCorpus());
	ASSERT_EQ(engine->Analyze("casino-royale.example", "casino jackpot slots bonus").verdict, Verdict::Block);

	auto sites = engine->ExportBlockedSites();
	ASSERT_EQ(sites.size(), 1u);
	ASSERT_EQ(sites[0].source, SiteSource::Auto);
	const Timestamp addedAt = sites[0].addedAt;

	engine->BlockDomain("casino-royale.example", "reported by parent");
	sites = engine->ExportBlockedSites();
	ASSERT_EQ(sites.size(), 1u);
	EXPECT_TRUE(sites[0].active);
	EXPECT_EQ(sites[0].source, SiteSource::Manual);
	EXPECT_EQ(sites[0].reason, "reported by parent");
	EXPECT_EQ(ToEpochMillis(sites[0].addedAt), ToEpochMillis(addedAt));
	EXPECT_EQ(engine->CurrentStats().blockCount, 1u);
}

/**
 * @brief An unwritable table is recorded and enforcement catches up later
 */
TEST_F(NetGuardEngineTest, PermissionFailureIsRecordedAndRecovered) {
	auto engine = Make();
	table->denyWrites = true;

	engine->BlockDomain("lottery.example", "test");
	EXPECT_FALSE(Contains(table->Get(), "lottery.example"));

	ErrorFilter filter;
	filter.kind = ErrorKind::Permission;
	EXPECT_FALSE(engine->ListErrors(filter).empty());
	EXPECT_THROW(engine->ReconcileNow(), PermissionError);

	table->denyWrites = false;
	const auto report = engine->ReconcileNow();
	EXPECT_TRUE(report.wrote);
	EXPECT_TRUE(Contains(table->Get(), "lottery.example"));
	EXPECT_FALSE(engine->ReconcileNow().wrote);
}

// ============================================================================
// SETTINGS & FEEDBACK
// ============================================================================

/**
 * @brief Sensitivity is validated, applied and persisted
 */
TEST_F(NetGuardEngineTest, SensitivityPersists) {
	{
		auto engine = Make();
		EXPECT_THROW(engine->SetSensitivity(101), ValidationError);
		engine->SetSensitivity(80);
		EXPECT_EQ(engine->Sensitivity(), 80);
		EXPECT_EQ(engine->GetSetting(Config::SETTING_SENSITIVITY).value_or(""), "80");
	}
	auto engine = Make();
	EXPECT_EQ(engine->Sensitivity(), 80);
	EXPECT_EQ(engine->CurrentStats().sensitivity, 80);
}

/**
 * @brief Generic settings are stored; known keys are validated
 */
TEST_F(NetGuardEngineTest, SettingsStoreAndValidate) {
	auto engine = Make();
	engine->SetSetting("ui_theme", "dark");
	EXPECT_EQ(engine->GetSetting("ui_theme").value_or(""), "dark");
	EXPECT_FALSE(engine->GetSetting("missing").has_value());

	engine->SetSetting(Config::SETTING_SENSITIVITY, "30");
	EXPECT_EQ(engine->Sensitivity(), 30);
	EXPECT_THROW(engine->SetSetting(Config::SETTING_SENSITIVITY, "loud"), ConfigError);
	EXPECT_THROW(engine->SetSetting("", "x"), ValidationError);
	EXPECT_EQ(engine->Sensitivity(), 30);
}

/**
 * @brief Feedback is folded into the next retrain and marked consumed
 */
TEST_F(NetGuardEngineTest, FeedbackConsumedByRetrain) {
	auto engine = Make();
	EXPECT_GT(engine->SubmitFeedback("quiet-poker.example", Label::Gambling), 0);
	EXPECT_EQ(engine->Audit().ListFeedback(false).size(), 1u);

	const auto version = engine->Retrain();
	ASSERT_TRUE(version.has_value());
	EXPECT_EQ(*version, 2u);
	EXPECT_TRUE(engine->Audit().ListFeedback(false).empty());
	EXPECT_EQ(engine->Audit().ListFeedback(true).size(), 1u);
}

/**
 * @brief Held-out validation uses the current threshold
 */
TEST_F(NetGuardEngineTest, ValidateModelReportsAccuracy) {
	auto engine = Make();
	engine->Classifier().Train(GamblingCorpus());
	const ValidationReport report = engine->ValidateModel({
		{ "casino jackpot bonus", Label::Gambling },
		{ "library research", Label::Benign }
	});
	EXPECT_EQ(report.total, 2u);
	EXPECT_DOUBLE_EQ(report.accuracy, 1.0);
}

// ============================================================================
// EXPORT / IMPORT & RETENTION
// ============================================================================

/**
 * @brief Blocked sites move between installations through a JSON file
 */
TEST_F(NetGuardEngineTest, ExportImportFile) {
	const auto file = dir / "sites.json";
	{
		auto engine = Make();
		engine->BlockDomain("a-bet.example", "one");
		engine->BlockDomain("b-bet.example", "two");
		engine->ExportBlockedSitesToFile(file);
	}

	Testing::TempDir other("engine-import");
	auto cfg = MakeConfig();
	cfg.database.path = (other / "netguard.db").string();
	cfg.classifier.modelPath = (other / "model.json").string();
	table = std::make_shared<MemoryTable>();
	auto engine = Make(cfg);

	EXPECT_EQ(engine->ImportBlockedSitesFromFile(file), 2);
	EXPECT_EQ(engine->ImportBlockedSitesFromFile(file), 0);
	EXPECT_EQ(engine->CurrentStats().blockCount, 2u);
	EXPECT_TRUE(Contains(table->Get(), "a-bet.example"));

	Testing::WriteFile(other / "bad.json", R"({"sites": 5})");
	EXPECT_THROW(engine->ImportBlockedSitesFromFile(other / "bad.json"), ConfigError);
	EXPECT_THROW(engine->ImportBlockedSitesFromFile(other / "absent.json"), ConfigError);
}

/**
 * @brief Cleanup keeps the newest detection behind an active block
 */
TEST_F(NetGuardEngineTest, CleanupHonoursActiveBlocks) {
	auto engine = Make();
	engine->Classifier().Train(GamblingCorpus());
	engine->Analyze("casino-old.example", "casino jackpot slots");
	engine->Analyze("news-old.example", "weather forecast news");

	EXPECT_THROW(engine->Cleanup(-1), ValidationError);
	const CleanupReport report = engine->Cleanup(Clock::now() + std::chrono::hours(1));
	EXPECT_EQ(report.detectionsDeleted, 1u);

	const auto rows = engine->ListDetections({});
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].domain, "casino-old.example");
}
