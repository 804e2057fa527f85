/**
 * ============================================================================
 * NetGuard EnforcementManager Unit Tests
 * ============================================================================
 */

#include "../../../src/Enforcement/EnforcementManager.hpp"
#include "../../../src/Database/AuditLogDB.hpp"
#include "../../../src/Database/BlockedSiteStore.hpp"
#include "../../TestHelpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <memory>

using namespace NetGuard;
using namespace NetGuard::Enforcement;

namespace {

	struct SharedTable {
		std::string content;
		bool denyWrites = false;
		bool denyReads = false;
		int writes = 0;
	};

	/// In-memory override table with switchable permission failures.
	class FaultyTableIO final : public IHostsTableIO {
	public:
		explicit FaultyTableIO(std::shared_ptr<SharedTable> table) : m_table(std::move(table)) {}

		std::string Read() override {
			if (m_table->denyReads) throw Core::PermissionError("enforce", "read denied", EACCES);
			return m_table->content;
		}

		void Write(const std::string& content) override {
			if (m_table->denyWrites) throw Core::PermissionError("enforce", "write denied", EACCES);
			m_table->content = content;
			++m_table->writes;
		}

		std::string Describe() const override { return "memory"; }

	private:
		std::shared_ptr<SharedTable> m_table;
	};

	class EnforcementManagerTest : public ::testing::Test {
	protected:
		void SetUp() override {
			table = std::make_shared<SharedTable>();
			table->content = "127.0.0.1 localhost\n";
		}

		std::unique_ptr<EnforcementManager> Make(EnforcementOptions options = {}, Database::AuditLogDB* audit = nullptr) {
			return std::make_unique<EnforcementManager>(std::make_unique<FaultyTableIO>(table), options, audit);
		}

		std::shared_ptr<SharedTable> table;
	};

	size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
		size_t n = 0;
		for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
		return n;
	}

}  // namespace

// ============================================================================
// RECONCILIATION
// ============================================================================

/**
 * @brief Active domains and their www variants are written to the region
 */
TEST_F(EnforcementManagerTest, ReconcileAddsDomains) {
	auto manager = Make();
	const auto report = manager->Reconcile({ "casino.example", "10.1.1.1" });

	EXPECT_TRUE(report.wrote);
	EXPECT_EQ(report.added, (std::vector<std::string>{ "10.1.1.1", "casino.example", "www.casino.example" }));
	EXPECT_TRUE(report.removed.empty());
	EXPECT_EQ(manager->EnforcedHosts(), (std::set<std::string>{ "10.1.1.1", "casino.example", "www.casino.example" }));
	EXPECT_EQ(table->content.rfind("127.0.0.1 localhost\n", 0), 0u);
}

/**
 * @brief A second pass with the same set performs no write
 */
TEST_F(EnforcementManagerTest, ReconcileIsIdempotent) {
	auto manager = Make();
	manager->Reconcile({ "slot.example" });
	const std::string after = table->content;

	const auto second = manager->Reconcile({ "slot.example" });
	EXPECT_FALSE(second.wrote);
	EXPECT_TRUE(second.added.empty());
	EXPECT_EQ(table->content, after);
	EXPECT_EQ(table->writes, 1);
	EXPECT_EQ(manager->WriteCount(), 1u);
}

/**
 * @brief www expansion can be switched off
 */
TEST_F(EnforcementManagerTest, WwwExpansionOptional) {
	EnforcementOptions options;
	options.includeWww = false;
	options.redirectAddress = "0.0.0.0";
	auto manager = Make(options);
	manager->Reconcile({ "bet.example" });
	EXPECT_EQ(manager->EnforcedHosts(), (std::set<std::string>{ "bet.example" }));
	EXPECT_NE(table->content.find("0.0.0.0 bet.example"), std::string::npos);
}

/**
 * @brief Unblocked domains disappear and stay absent on later passes
 */
TEST_F(EnforcementManagerTest, UnblockRemovesAndStaysRemoved) {
	auto manager = Make();
	manager->Reconcile({ "example.com", "keep.example" });
	ASSERT_EQ(manager->EnforcedHosts().count("example.com"), 1u);

	const auto report = manager->Reconcile({ "keep.example" });
	EXPECT_EQ(report.removed, (std::vector<std::string>{ "example.com", "www.example.com" }));
	EXPECT_EQ(manager->EnforcedHosts().count("example.com"), 0u);

	const auto again = manager->Reconcile({ "keep.example" });
	EXPECT_FALSE(again.wrote);
	EXPECT_EQ(manager->EnforcedHosts().count("example.com"), 0u);
}

/**
 * @brief Hand-edited region entries not in the set are removed
 */
TEST_F(EnforcementManagerTest, ReconcileRepairsTamperedRegion) {
	auto manager = Make();
	manager->Reconcile({ "a.example" });
	const auto pos = table->content.find(END_MARKER);
	table->content.insert(pos, "127.0.0.1 injected.example\n");

	const auto report = manager->Reconcile({ "a.example" });
	EXPECT_TRUE(report.wrote);
	EXPECT_EQ(report.removed, (std::vector<std::string>{ "injected.example" }));
}

// ============================================================================
// FAILURES
// ============================================================================

/**
 * @brief Denied write surfaces PermissionError and leaves the table untouched;
 *        once permitted, the next pass converges without duplicates
 */
TEST_F(EnforcementManagerTest, PermissionFailureThenRecovery) {
	Testing::TempDir dir("enforce");
	Database::DatabaseManager db;
	Database::DatabaseConfig dbConfig;
	dbConfig.databasePath = (dir / "netguard.db").string();
	ASSERT_TRUE(db.Initialize(dbConfig));
	Database::AuditLogDB audit(db);
	Database::BlockedSiteStore sites(db);
	ASSERT_TRUE(audit.Initialize());
	ASSERT_TRUE(sites.Initialize());

	auto manager = Make({}, &audit);

	Core::BlockedSite site;
	site.domain = "judi.example";
	site.source = Core::SiteSource::Auto;
	ASSERT_TRUE(sites.AddSite(site));

	const std::string before = table->content;
	table->denyWrites = true;
	EXPECT_THROW(manager->Reconcile(sites.ActiveDomains()), Core::PermissionError);
	EXPECT_EQ(table->content, before);
	EXPECT_EQ(sites.ActiveDomains(), (std::vector<std::string>{ "judi.example" }));

	table->denyWrites = false;
	const auto report = manager->Reconcile(sites.ActiveDomains());
	EXPECT_TRUE(report.wrote);
	const auto again = manager->Reconcile(sites.ActiveDomains());
	EXPECT_FALSE(again.wrote);
	EXPECT_EQ(CountOccurrences(table->content, " judi.example\n"), 1u);
	EXPECT_EQ(CountOccurrences(table->content, BEGIN_MARKER), 1u);

	const auto actions = audit.QueryEnforcementActions(Core::EnforcementActionFilter{});
	const bool sawFailure = std::any_of(actions.begin(), actions.end(),
		[](const Core::EnforcementAction& a) { return a.action == "failed" && !a.success; });
	const bool sawAdd = std::any_of(actions.begin(), actions.end(),
		[](const Core::EnforcementAction& a) { return a.action == "add" && a.domain == "judi.example"; });
	EXPECT_TRUE(sawFailure);
	EXPECT_TRUE(sawAdd);
	db.Shutdown();
}

/**
 * @brief Denied read is reported the same way
 */
TEST_F(EnforcementManagerTest, PermissionFailureOnRead) {
	auto manager = Make();
	table->denyReads = true;
	try {
		manager->Reconcile({ "x.example" });
		FAIL() << "expected PermissionError";
	}
	catch (const Core::PermissionError& e) {
		EXPECT_EQ(e.kind(), Core::ErrorKind::Permission);
		EXPECT_EQ(e.sysError(), EACCES);
	}
	EXPECT_EQ(table->writes, 0);
}
