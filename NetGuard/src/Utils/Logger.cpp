#include "Logger.hpp"

#include <algorithm>
#include <cstring>
#include <ctime>
#include <filesystem>

#include <sys/syscall.h>
#include <unistd.h>

namespace NetGuard {

	namespace Utils {

		static const char* LevelToStr(LogLevel lv) {
			switch (lv) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			default:              return "UNKNOWN";
			}
		}

		static const char* LevelColor(LogLevel lv) {
			switch (lv) {
			case LogLevel::Trace: return "\033[90m";
			case LogLevel::Debug: return "\033[36m";
			case LogLevel::Info:  return "\033[32m";
			case LogLevel::Warn:  return "\033[33m";
			case LogLevel::Error: return "\033[31m";
			case LogLevel::Fatal: return "\033[1;31m";
			default:              return "";
			}
		}

		Logger& Logger::Instance()
		{
			static Logger g_instance;
			g_instance.EnsureInitialized();
			return g_instance;
		}

		Logger::Logger()
		{
			m_consoleIsTty = ::isatty(STDERR_FILENO) == 1;
		}

		Logger::~Logger()
		{
			ShutDown();
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			const LogLevel minLevel = m_minLevel.load(std::memory_order_acquire);
			return static_cast<int>(level) >= static_cast<int>(minLevel);
		}

		bool Logger::IsInitialized() const noexcept
		{
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::EnsureInitialized() {
			if (!IsInitialized()) {
				Initialize(LoggerConfig{});
			}
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			bool expected = false;

			if (!m_initialized.compare_exchange_strong(expected, true)) {
				// already running: swap config, reopen file sink on next write
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				std::lock_guard<std::mutex> sink(m_sinkMutex);
				const bool sinkChanged = cfg.logDirectory != m_cfg.logDirectory ||
					cfg.baseFileName != m_cfg.baseFileName || cfg.toFile != m_cfg.toFile;
				m_cfg.toConsole = cfg.toConsole;
				m_cfg.toFile = cfg.toFile;
				m_cfg.jsonLines = cfg.jsonLines;
				m_cfg.includeSrcLocation = cfg.includeSrcLocation;
				m_cfg.includeProcThreadId = cfg.includeProcThreadId;
				m_cfg.logDirectory = cfg.logDirectory;
				m_cfg.baseFileName = cfg.baseFileName;
				m_cfg.maxFileSizeBytes = cfg.maxFileSizeBytes;
				m_cfg.maxFileCount = cfg.maxFileCount;
				m_cfg.maxQueueSize = cfg.maxQueueSize;
				m_cfg.bpPolicy = cfg.bpPolicy;
				m_cfg.minimalLevel = cfg.minimalLevel;
				m_cfg.flushLevel = cfg.flushLevel;
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
				if (sinkChanged && m_file) {
					std::fclose(m_file);
					m_file = nullptr;
					m_currentSize = 0;
				}
				return;
			}

			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				m_cfg = cfg;
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			}

			m_stop.store(false, std::memory_order_release);

			// worker must exist before the first message is accepted
			if (m_cfg.async) {
				try {
					m_worker = std::thread([this]() { WorkerLoop(); });
				}
				catch (const std::system_error& e) {
					std::fprintf(stderr, "[Logger] worker thread unavailable, logging synchronously: %s\n", e.what());
					m_cfg.async = false;
				}
			}

			m_accepting.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			bool expected = true;
			if (!m_initialized.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
				return;
			}

			m_accepting.store(false, std::memory_order_release);

			m_stop.store(true, std::memory_order_release);
			m_queueCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			LogItem item;
			while (Dequeue(item)) {
				WriteItem(item);
			}

			std::lock_guard<std::mutex> sink(m_sinkMutex);
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		void Logger::Enqueue(LogItem&& item) {
			if (!m_accepting.load(std::memory_order_acquire)) return;
			if (!IsEnabled(item.level)) return;

			if (m_cfg.async) {
				std::lock_guard<std::mutex> lk(m_queueMutex);

				if (m_queue.size() >= m_cfg.maxQueueSize) {
					switch (m_cfg.bpPolicy) {
					case LoggerConfig::BackPressurePolicy::DropOldest:
						m_queue.pop_front();
						break;
					case LoggerConfig::BackPressurePolicy::DropNewest:
						return;
					}
				}

				m_queue.emplace_back(std::move(item));
				m_queueCv.notify_one();
			}
			else {
				WriteItem(item);
			}
		}

		bool Logger::Dequeue(LogItem& out) {
			std::lock_guard<std::mutex> lk(m_queueMutex);
			if (m_queue.empty()) return false;
			out = std::move(m_queue.front());
			m_queue.pop_front();
			return true;
		}

		void Logger::WorkerLoop() {
			while (!m_stop.load(std::memory_order_acquire)) {
				LogItem item;

				{
					std::unique_lock<std::mutex> lk(m_queueMutex);
					m_queueCv.wait_for(lk, std::chrono::seconds(1), [this]() {
						return m_stop.load(std::memory_order_acquire) || !m_queue.empty();
						});

					if (m_stop.load(std::memory_order_acquire) && m_queue.empty()) break;
					if (m_queue.empty()) continue;

					item = std::move(m_queue.front());
					m_queue.pop_front();
				}

				WriteItem(item);
			}
		}

		void Logger::WriteItem(const LogItem& item) {
			std::lock_guard<std::mutex> sink(m_sinkMutex);
			if (m_cfg.toConsole) WriteConsole(item);
			if (m_cfg.toFile) WriteFile(item);
		}

		void Logger::LogEx(LogLevel level,
			const char* category,
			const char* file,
			int line,
			const char* function,
			const char* format, ...) {

			if (!IsEnabled(level)) return;

			va_list args;
			va_start(args, format);
			std::string msg = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, msg, file, line, function, 0);
		}

		void Logger::LogErrnoEx(LogLevel level,
			const char* category,
			const char* file,
			int line,
			const char* function,
			int errorCode,
			const char* contextFormat, ...) {

			if (!IsEnabled(level)) return;

			va_list args;
			va_start(args, contextFormat);
			std::string context = FormatMessageV(contextFormat, args);
			va_end(args);

			char errBuf[256] = { 0 };
			// GNU strerror_r may return a static string instead of filling errBuf
			const char* errText = ::strerror_r(errorCode, errBuf, sizeof(errBuf));

			std::string combined;
			combined.reserve(context.size() + 32);
			combined.append(context);
			combined.append(": errno ");
			combined.append(std::to_string(errorCode));
			combined.append(" (");
			combined.append(errText ? errText : "unknown");
			combined.append(")");

			LogMessage(level, category, combined, file, line, function, errorCode);
		}

		void Logger::LogMessage(LogLevel level,
			const char* category,
			const std::string& message,
			const char* file,
			int line,
			const char* function,
			int sysError) {

			LogItem item{};
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = file ? file : "";
			item.function = function ? function : "";
			item.line = line;
			item.pid = static_cast<uint32_t>(::getpid());
			item.tid = static_cast<uint32_t>(::syscall(SYS_gettid));
			item.tsMillis = NowMillisUTC();
			item.sysError = sysError;

			Enqueue(std::move(item));

			if (static_cast<int>(level) >= static_cast<int>(m_cfg.flushLevel))
				Flush();
		}

		void Logger::Flush()
		{
			if (m_cfg.async)
			{
				auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

				while (std::chrono::steady_clock::now() < deadline) {
					{
						std::lock_guard<std::mutex> lk(m_queueMutex);
						if (m_queue.empty()) break;
					}
					m_queueCv.notify_all();
					std::this_thread::sleep_for(std::chrono::milliseconds(5));
				}
			}

			std::lock_guard<std::mutex> sink(m_sinkMutex);
			if (m_file) {
				std::fflush(m_file);
			}
			std::fflush(stderr);
		}

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return "";

			std::string out;
			out.resize(512);

			va_list argsCopy;
			va_copy(argsCopy, args);
			int needed = std::vsnprintf(&out[0], out.size(), fmt, argsCopy);
			va_end(argsCopy);

			if (needed < 0) {
				return "[Logger] formatting error";
			}

			if (static_cast<size_t>(needed) >= out.size()) {
				// cap at 1MB
				const size_t cap = std::min<size_t>(static_cast<size_t>(needed) + 1, 1u << 20);
				out.resize(cap);
				va_copy(argsCopy, args);
				int n = std::vsnprintf(&out[0], out.size(), fmt, argsCopy);
				va_end(argsCopy);
				if (n < 0) return "[Logger] formatting error";
				out.resize(std::min(static_cast<size_t>(n), cap - 1));
			}
			else {
				out.resize(static_cast<size_t>(needed));
			}

			return out;
		}

		uint64_t Logger::NowMillisUTC() {
			using namespace std::chrono;
			return static_cast<uint64_t>(
				duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
		}

		std::string Logger::FormatIso8601UTC(uint64_t millis) {
			const std::time_t secs = static_cast<std::time_t>(millis / 1000);
			std::tm tmUtc{};
			if (!::gmtime_r(&secs, &tmUtc)) {
				return "[Invalid timestamp]";
			}

			char buf[40] = { 0 };
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
				tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
				tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec,
				static_cast<unsigned>(millis % 1000));
			return std::string(buf);
		}

		std::string Logger::EscapeJson(const std::string& s) {
			std::string out;
			out.reserve(s.size() + 16);

			for (unsigned char c : s)
			{
				switch (c)
				{
				case '\\': out += "\\\\"; break;
				case '"':  out += "\\\""; break;
				case '\b': out += "\\b"; break;
				case '\f': out += "\\f"; break;
				case '\n': out += "\\n"; break;
				case '\r': out += "\\r"; break;
				case '\t': out += "\\t"; break;
				default:
					if (c < 0x20) {
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", c);
						out += buf;
					}
					else {
						out += static_cast<char>(c);
					}
				}
			}
			return out;
		}

		std::string Logger::FormatPrefix(const LogItem& item) const {
			std::string prefix;
			prefix.reserve(96);
			prefix += FormatIso8601UTC(item.tsMillis);
			prefix += " [";
			prefix += LevelToStr(item.level);
			prefix += "]";

			if (m_cfg.includeProcThreadId) {
				char buf[48];
				std::snprintf(buf, sizeof(buf), " [%u:%u]", item.pid, item.tid);
				prefix += buf;
			}

			if (!item.category.empty()) {
				prefix += " [";
				prefix += item.category;
				prefix += "]";
			}

			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				const std::filesystem::path p(item.file);
				prefix += " (";
				prefix += p.filename().string();
				prefix += ":";
				prefix += std::to_string(item.line);
				if (!item.function.empty()) {
					prefix += " ";
					prefix += item.function;
				}
				prefix += ")";
			}
			return prefix;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::string j;
			j.reserve(256 + item.message.size());
			j += "{\"ts\":\"";
			j += FormatIso8601UTC(item.tsMillis);
			j += "\",\"level\":\"";
			j += LevelToStr(item.level);
			j += "\",\"category\":\"";
			j += EscapeJson(item.category);
			j += "\"";

			if (m_cfg.includeProcThreadId) {
				j += ",\"pid\":" + std::to_string(item.pid);
				j += ",\"tid\":" + std::to_string(item.tid);
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				j += ",\"file\":\"" + EscapeJson(item.file) + "\"";
				j += ",\"line\":" + std::to_string(item.line);
				j += ",\"function\":\"" + EscapeJson(item.function) + "\"";
			}
			if (item.sysError != 0) {
				j += ",\"errno\":" + std::to_string(item.sysError);
			}
			j += ",\"msg\":\"";
			j += EscapeJson(item.message);
			j += "\"}";
			return j;
		}

		void Logger::WriteConsole(const LogItem& item) {
			std::string line = m_cfg.jsonLines ? FormatAsJson(item)
				: FormatPrefix(item) + " " + item.message;

			if (m_consoleIsTty && !m_cfg.jsonLines) {
				std::fprintf(stderr, "%s%s\033[0m\n", LevelColor(item.level), line.c_str());
			}
			else {
				std::fprintf(stderr, "%s\n", line.c_str());
			}
		}

		void Logger::WriteFile(const LogItem& item) {
			OpenLogFileIfNeeded();
			if (!m_file) return;

			std::string line = m_cfg.jsonLines ? FormatAsJson(item)
				: FormatPrefix(item) + " " + item.message;
			line += '\n';

			RotateIfNeeded(line.size());
			if (!m_file) return;

			const size_t written = std::fwrite(line.data(), 1, line.size(), m_file);
			m_currentSize += written;

			if (static_cast<int>(item.level) >= static_cast<int>(m_cfg.flushLevel)) {
				std::fflush(m_file);
			}
		}

		std::string Logger::BaseLogPath() const {
			std::filesystem::path p(m_cfg.logDirectory);
			p /= m_cfg.baseFileName + ".log";
			return p.string();
		}

		void Logger::EnsureLogDirectory() {
			std::error_code ec;
			std::filesystem::create_directories(m_cfg.logDirectory, ec);
			if (ec) {
				std::fprintf(stderr, "[Logger] cannot create log directory %s: %s\n",
					m_cfg.logDirectory.c_str(), ec.message().c_str());
			}
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) return;

			EnsureLogDirectory();
			const std::string path = BaseLogPath();
			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::fprintf(stderr, "[Logger] cannot open %s: %s\n", path.c_str(), std::strerror(errno));
				return;
			}

			std::error_code ec;
			const auto size = std::filesystem::file_size(path, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0) return;
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) return;
			PerformRotation();
		}

		void Logger::PerformRotation() {
			if (m_file) {
				std::fclose(m_file);
				m_file = nullptr;
			}

			const std::string base = BaseLogPath();
			std::error_code ec;

			// netguard.log.N is the oldest; shift everything up one slot
			if (m_cfg.maxFileCount > 0) {
				const std::string oldest = base + "." + std::to_string(m_cfg.maxFileCount);
				std::filesystem::remove(oldest, ec);

				for (size_t i = m_cfg.maxFileCount; i > 1; --i) {
					const std::string from = base + "." + std::to_string(i - 1);
					const std::string to = base + "." + std::to_string(i);
					if (std::filesystem::exists(from, ec)) {
						std::filesystem::rename(from, to, ec);
					}
				}
				std::filesystem::rename(base, base + ".1", ec);
			}
			else {
				std::filesystem::remove(base, ec);
			}

			m_currentSize = 0;
			OpenLogFileIfNeeded();
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
			const char* file,
			int line,
			const char* function,
			LogLevel level)
			: m_category(category), m_file(file), m_function(function),
			m_line(line), m_level(level), m_start(std::chrono::steady_clock::now())
		{
			auto& lg = Logger::Instance();
			if (lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, std::string("> ") + (m_function ? m_function : ""),
					m_file, m_line, m_function, 0);
			}
		}

		Logger::Scope::~Scope()
		{
			auto& lg = Logger::Instance();
			if (!lg.IsEnabled(m_level)) return;

			const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start).count();
			lg.LogMessage(m_level, m_category,
				std::string("< ") + (m_function ? m_function : "") + " (" + std::to_string(elapsed) + " us)",
				m_file, m_line, m_function, 0);
		}

	}  // namespace Utils
}  // namespace NetGuard
