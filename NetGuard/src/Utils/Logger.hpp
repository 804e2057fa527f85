/*
 * ============================================================================
 * NetGuard Logger
 * ============================================================================
 *
 * Copyright (c) 2026 NetGuard Project
 * All rights reserved.
 *
 * Process-wide logging facility: async queue, console + rotating file sinks,
 * optional JSON Lines output.
 *
 * ============================================================================
 */
#pragma once

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdarg>
#include <cstdio>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <string>
#include <thread>
#include <vector>

namespace NetGuard {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages.
		 *
		 * Ordered from least to most severe. Messages below the configured
		 * minimum level are discarded.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			/// Maximum queue size for async logging
			size_t maxQueueSize = 1000;

			/// Policy when queue is full
			enum class BackPressurePolicy {
				DropOldest,  ///< Drop oldest messages
				DropNewest   ///< Drop newest messages
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;              ///< Enable asynchronous logging
			bool toConsole = true;          ///< Output to stderr
			bool toFile = false;            ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeProcThreadId = true;///< Include process/thread IDs

			std::string logDirectory = "logs";          ///< Log file directory
			std::string baseFileName = "netguard";      ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 5;                    ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;     ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;      ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger with async support.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   cfg.logDirectory = "/var/log/netguard";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   NG_LOG_INFO("Sampler", "Tracking %zu connections", count);
		 *   NG_LOG_ERROR("Hosts", "Write failed: %s", path.c_str());
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 *
		 * @note If Initialize() is never called the logger auto-initializes
		 *       with console-only defaults on first use.
		 */
		class Logger {
		public:
			[[nodiscard]] static Logger& Instance();

			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Stops the worker thread and writes remaining messages.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__)
				__attribute__((format(printf, 7, 8)))
#endif
				;

			/**
			 * @brief Log a message followed by the text of an errno value.
			 */
			void LogErrnoEx(LogLevel level,
			                const char* category,
			                const char* file,
			                int line,
			                const char* function,
			                int errorCode,
			                const char* contextFormat, ...)
#if defined(__GNUC__)
				__attribute__((format(printf, 8, 9)))
#endif
				;

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr,
			                int sysError = 0);

			void Flush();

			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      LogLevel level = LogLevel::Debug);
				~Scope();

				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				LogLevel m_level;
				std::chrono::steady_clock::time_point m_start;
			};

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				uint32_t pid = 0;
				uint32_t tid = 0;
				uint64_t tsMillis = 0;
				int sysError = 0;
			};

			void EnsureInitialized();
			void WorkerLoop();
			void Enqueue(LogItem&& item);
			[[nodiscard]] bool Dequeue(LogItem& out);
			void WriteItem(const LogItem& item);

			void WriteConsole(const LogItem& item);
			void WriteFile(const LogItem& item);

			[[nodiscard]] std::string FormatPrefix(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string EscapeJson(const std::string& s);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			void EnsureLogDirectory();
			[[nodiscard]] std::string BaseLogPath() const;

			[[nodiscard]] static uint64_t NowMillisUTC();
			[[nodiscard]] static std::string FormatIso8601UTC(uint64_t millis);

			std::atomic<bool> m_accepting{ false };
			std::atomic<bool> m_initialized{ false };
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			LoggerConfig m_cfg{};
			mutable std::mutex m_cfgMutex;

			std::deque<LogItem> m_queue;
			mutable std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::thread m_worker;
			std::atomic<bool> m_stop{ false };

			/// Serializes sink writes between the worker and synchronous callers
			std::mutex m_sinkMutex;
			std::FILE* m_file = nullptr;
			uint64_t m_currentSize = 0;
			bool m_consoleIsTty = false;
		};

	}  // namespace Utils
}  // namespace NetGuard

// ============================================================================
// LOGGING MACROS
// ============================================================================
//
//   NG_LOG_INFO("Category", "Message with %d format", value);
//   NG_LOG_ERRNO("Category", "open(%s) failed", path);   // appends strerror(errno)
//   NG_LOG_SCOPE("Category");                            // entry/exit with timing
//

#define NG_LOG_IMPL(level, category, fmt, ...)                                              \
	do {                                                                                    \
		auto& ng_logger_ = ::NetGuard::Utils::Logger::Instance();                           \
		if (ng_logger_.IsEnabled(level)) {                                                  \
			ng_logger_.LogEx(level, category, __FILE__, __LINE__, __func__, fmt __VA_OPT__(,) __VA_ARGS__); \
		}                                                                                   \
	} while (0)

#define NG_LOG_TRACE(category, fmt, ...) NG_LOG_IMPL(::NetGuard::Utils::LogLevel::Trace, category, fmt __VA_OPT__(,) __VA_ARGS__)
#define NG_LOG_DEBUG(category, fmt, ...) NG_LOG_IMPL(::NetGuard::Utils::LogLevel::Debug, category, fmt __VA_OPT__(,) __VA_ARGS__)
#define NG_LOG_INFO(category, fmt, ...)  NG_LOG_IMPL(::NetGuard::Utils::LogLevel::Info,  category, fmt __VA_OPT__(,) __VA_ARGS__)
#define NG_LOG_WARN(category, fmt, ...)  NG_LOG_IMPL(::NetGuard::Utils::LogLevel::Warn,  category, fmt __VA_OPT__(,) __VA_ARGS__)
#define NG_LOG_ERROR(category, fmt, ...) NG_LOG_IMPL(::NetGuard::Utils::LogLevel::Error, category, fmt __VA_OPT__(,) __VA_ARGS__)
#define NG_LOG_FATAL(category, fmt, ...) NG_LOG_IMPL(::NetGuard::Utils::LogLevel::Fatal, category, fmt __VA_OPT__(,) __VA_ARGS__)

#define NG_LOG_ERRNO(category, fmt, ...)                                                    \
	do {                                                                                    \
		const int ng_errno_ = errno;                                                        \
		::NetGuard::Utils::Logger::Instance().LogErrnoEx(::NetGuard::Utils::LogLevel::Error, \
			category, __FILE__, __LINE__, __func__, ng_errno_, fmt __VA_OPT__(,) __VA_ARGS__); \
	} while (0)

#define NG_LOG_SCOPE_CONCAT_INNER(a, b) a##b
#define NG_LOG_SCOPE_CONCAT(a, b) NG_LOG_SCOPE_CONCAT_INNER(a, b)
#define NG_LOG_SCOPE(category) \
	::NetGuard::Utils::Logger::Scope NG_LOG_SCOPE_CONCAT(ng_scope_, __LINE__)(category, __FILE__, __LINE__, __func__)
