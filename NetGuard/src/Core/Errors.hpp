#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace NetGuard {
	namespace Core {

		// ============================================================================
		// Error taxonomy
		// ============================================================================

		enum class ErrorKind : uint8_t {
			Permission = 0,      ///< override table not writable
			InsufficientData,    ///< classifier cannot train
			Interception,        ///< certificate or TLS session failure
			CaptureTimeout,      ///< sampling/interception pass over budget, or a dropped request
			Config,              ///< invalid configuration value or file
			Validation,          ///< invalid caller argument
			Storage,             ///< persistence failure
			Internal
		};

		[[nodiscard]] const char* ErrorKindToString(ErrorKind kind) noexcept;
		[[nodiscard]] bool ErrorKindFromString(const std::string& s, ErrorKind& out) noexcept;

		/**
		 * @brief Base of every NetGuard domain error.
		 *
		 * Carries the pipeline stage that raised it and, where one applies, the
		 * domain being processed. Both end up in the audit error table.
		 */
		class NetGuardError : public std::runtime_error {
		public:
			NetGuardError(ErrorKind kind, std::string stage, std::string domain, const std::string& message)
				: std::runtime_error(message)
				, m_kind(kind)
				, m_stage(std::move(stage))
				, m_domain(std::move(domain))
				, m_timestamp(std::chrono::system_clock::now()) {}

			[[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }
			[[nodiscard]] const std::string& stage() const noexcept { return m_stage; }
			[[nodiscard]] const std::string& domain() const noexcept { return m_domain; }
			[[nodiscard]] std::chrono::system_clock::time_point timestamp() const noexcept { return m_timestamp; }

		private:
			ErrorKind m_kind;
			std::string m_stage;
			std::string m_domain;
			std::chrono::system_clock::time_point m_timestamp;
		};

		class PermissionError : public NetGuardError {
		public:
			PermissionError(std::string stage, const std::string& message, int sysError = 0)
				: NetGuardError(ErrorKind::Permission, std::move(stage), {}, message), m_sysError(sysError) {}

			[[nodiscard]] int sysError() const noexcept { return m_sysError; }

		private:
			int m_sysError;
		};

		class InsufficientDataError : public NetGuardError {
		public:
			InsufficientDataError(size_t gamblingExamples, size_t benignExamples)
				: NetGuardError(ErrorKind::InsufficientData, "train", {},
					"training needs at least one example per class (gambling=" + std::to_string(gamblingExamples) +
					", benign=" + std::to_string(benignExamples) + ")")
				, m_gambling(gamblingExamples), m_benign(benignExamples) {}

			[[nodiscard]] size_t gamblingExamples() const noexcept { return m_gambling; }
			[[nodiscard]] size_t benignExamples() const noexcept { return m_benign; }

		private:
			size_t m_gambling;
			size_t m_benign;
		};

		class InterceptionError : public NetGuardError {
		public:
			InterceptionError(std::string domain, const std::string& message)
				: NetGuardError(ErrorKind::Interception, "intercept", std::move(domain), message) {}
		};

		class CaptureTimeout : public NetGuardError {
		public:
			CaptureTimeout(std::string stage, std::string domain, std::chrono::milliseconds budget)
				: NetGuardError(ErrorKind::CaptureTimeout, std::move(stage), std::move(domain),
					"exceeded budget of " + std::to_string(budget.count()) + " ms")
				, m_budget(budget) {}

			CaptureTimeout(std::string stage, std::string domain, const std::string& message)
				: NetGuardError(ErrorKind::CaptureTimeout, std::move(stage), std::move(domain), message)
				, m_budget(0) {}

			[[nodiscard]] std::chrono::milliseconds budget() const noexcept { return m_budget; }

		private:
			std::chrono::milliseconds m_budget;
		};

		class ConfigError : public NetGuardError {
		public:
			explicit ConfigError(const std::string& message)
				: NetGuardError(ErrorKind::Config, "config", {}, message) {}
		};

		class ValidationError : public NetGuardError {
		public:
			ValidationError(std::string stage, const std::string& message)
				: NetGuardError(ErrorKind::Validation, std::move(stage), {}, message) {}
		};

		class StorageError : public NetGuardError {
		public:
			StorageError(std::string stage, std::string domain, const std::string& message)
				: NetGuardError(ErrorKind::Storage, std::move(stage), std::move(domain), message) {}
		};

	}  // namespace Core
}  // namespace NetGuard
