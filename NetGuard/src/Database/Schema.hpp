#pragma once

#include "DatabaseManager.hpp"

namespace NetGuard {
	namespace Database {

		constexpr int NETGUARD_SCHEMA_VERSION = 1;

		/**
		 * @brief Creates every NetGuard table and index that is missing.
		 *
		 * Safe to call from each store's Initialize; the DDL is idempotent and
		 * runs in one IMMEDIATE transaction.
		 */
		bool EnsureSchema(DatabaseManager& db, DatabaseError* err = nullptr);

	}  // namespace Database
}  // namespace NetGuard
