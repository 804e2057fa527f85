#include "HostsFile.hpp"
#include "../Core/Errors.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace NetGuard {
	namespace Enforcement {

		namespace {

			bool IsPermissionErrno(int e) {
				return e == EACCES || e == EPERM || e == EROFS;
			}

			[[noreturn]] void ThrowIoError(const std::string& op, const std::filesystem::path& path, int e) {
				const std::string msg = op + " " + path.string() + ": " + std::strerror(e);
				if (IsPermissionErrno(e)) throw Core::PermissionError("enforce", msg, e);
				throw Core::StorageError("enforce", {}, msg);
			}

			class FileDescriptor {
			public:
				explicit FileDescriptor(int fd) noexcept : m_fd(fd) {}
				~FileDescriptor() { if (m_fd >= 0) ::close(m_fd); }
				FileDescriptor(const FileDescriptor&) = delete;
				FileDescriptor& operator=(const FileDescriptor&) = delete;

				int get() const noexcept { return m_fd; }
				int release() noexcept { int fd = m_fd; m_fd = -1; return fd; }

			private:
				int m_fd;
			};

			class TempFileGuard {
			public:
				explicit TempFileGuard(std::string path) : m_path(std::move(path)) {}
				~TempFileGuard() { if (!m_path.empty()) ::unlink(m_path.c_str()); }
				TempFileGuard(const TempFileGuard&) = delete;
				TempFileGuard& operator=(const TempFileGuard&) = delete;

				void Dismiss() noexcept { m_path.clear(); }

			private:
				std::string m_path;
			};

			std::string ReadAll(int fd, const std::filesystem::path& path) {
				std::string content;
				char buf[8192];
				off_t offset = 0;
				while (true) {
					const ssize_t n = ::pread(fd, buf, sizeof(buf), offset);
					if (n < 0) {
						if (errno == EINTR) continue;
						ThrowIoError("cannot read", path, errno);
					}
					if (n == 0) break;
					content.append(buf, static_cast<size_t>(n));
					offset += n;
				}
				return content;
			}

			/// Writes @p content from offset 0
			void WriteAt(int fd, const std::string& content, const std::filesystem::path& path) {
				size_t written = 0;
				while (written < content.size()) {
					const ssize_t n = ::pwrite(fd, content.data() + written, content.size() - written,
						static_cast<off_t>(written));
					if (n < 0) {
						if (errno == EINTR) continue;
						ThrowIoError("cannot write", path, errno);
					}
					written += static_cast<size_t>(n);
				}
			}

			void Overwrite(int fd, const std::string& content, const std::filesystem::path& path) {
				if (::ftruncate(fd, 0) != 0) ThrowIoError("cannot truncate", path, errno);
				WriteAt(fd, content, path);
				if (::fsync(fd) != 0 && errno != EINVAL) ThrowIoError("cannot sync", path, errno);
			}

			void SyncDirectory(const std::filesystem::path& dir) {
				FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
				if (fd.get() < 0 || ::fsync(fd.get()) != 0) {
					NG_LOG_DEBUG("Enforcement", "cannot sync directory %s: %s", dir.c_str(), std::strerror(errno));
				}
			}

			std::string_view TrimView(std::string_view s) {
				while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
				while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
				return s;
			}

		}  // anonymous namespace

		// ============================================================================
		// FileHostsTableIO
		// ============================================================================

		std::string FileHostsTableIO::Read() {
			FileDescriptor fd(::open(m_path.c_str(), O_RDONLY | O_CLOEXEC));
			if (fd.get() < 0) {
				if (errno == ENOENT) return {};
				ThrowIoError("cannot open", m_path, errno);
			}
			return ReadAll(fd.get(), m_path);
		}

		void FileHostsTableIO::Write(const std::string& content) {
			const std::filesystem::path target = resolveTarget();
			if (m_strategy == ReplaceStrategy::RenameOrInPlace) {
				if (replaceByRename(target, content)) return;
				NG_LOG_WARN("Enforcement", "%s cannot be replaced by rename, rewriting in place", target.c_str());
			}
			rewriteInPlace(target, content);
		}

		std::filesystem::path FileHostsTableIO::resolveTarget() const {
			std::error_code ec;
			if (!std::filesystem::is_symlink(m_path, ec)) return m_path;
			const auto resolved = std::filesystem::canonical(m_path, ec);
			if (ec) {
				NG_LOG_DEBUG("Enforcement", "cannot resolve symlink %s: %s", m_path.c_str(), ec.message().c_str());
				return m_path;
			}
			return resolved;
		}

		bool FileHostsTableIO::replaceByRename(const std::filesystem::path& target, const std::string& content) {
			const std::filesystem::path dir = target.has_parent_path() ? target.parent_path() : std::filesystem::path(".");
			std::string tempName = (dir / ("." + target.filename().string() + ".netguard-XXXXXX")).string();

			FileDescriptor fd(::mkostemp(tempName.data(), O_CLOEXEC));
			if (fd.get() < 0) ThrowIoError("cannot create temporary file in", dir, errno);
			TempFileGuard guard(tempName);

			// the replacement keeps the mode and owner of the table it replaces
			struct stat st {};
			if (::stat(target.c_str(), &st) == 0) {
				if (::fchmod(fd.get(), st.st_mode & 07777) != 0) ThrowIoError("cannot chmod", tempName, errno);
				if (::fchown(fd.get(), st.st_uid, st.st_gid) != 0) {
					NG_LOG_DEBUG("Enforcement", "cannot keep owner of %s: %s", target.c_str(), std::strerror(errno));
				}
			}
			else if (::fchmod(fd.get(), 0644) != 0) {
				ThrowIoError("cannot chmod", tempName, errno);
			}

			WriteAt(fd.get(), content, tempName);
			if (::fsync(fd.get()) != 0 && errno != EINVAL) ThrowIoError("cannot sync", tempName, errno);
			if (::close(fd.release()) != 0) ThrowIoError("cannot close", tempName, errno);

			if (::rename(tempName.c_str(), target.c_str()) != 0) {
				const int e = errno;
				if (e == EXDEV || e == EBUSY) return false;
				ThrowIoError("cannot replace", target, e);
			}
			guard.Dismiss();
			SyncDirectory(dir);
			return true;
		}

		void FileHostsTableIO::rewriteInPlace(const std::filesystem::path& target, const std::string& content) {
			FileDescriptor fd(::open(target.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
			if (fd.get() < 0) ThrowIoError("cannot open for writing", target, errno);

			const std::string original = ReadAll(fd.get(), target);
			try {
				Overwrite(fd.get(), content, target);
			}
			catch (const Core::NetGuardError& writeError) {
				try {
					Overwrite(fd.get(), original, target);
					NG_LOG_WARN("Enforcement", "restored %s after failed write: %s", target.c_str(), writeError.what());
				}
				catch (const Core::NetGuardError& restoreError) {
					NG_LOG_ERROR("Enforcement", "cannot restore %s after failed write: %s", target.c_str(),
						restoreError.what());
				}
				throw;
			}
			if (::close(fd.release()) != 0) ThrowIoError("cannot close", target, errno);
		}

		// ============================================================================
		// HostsFile
		// ============================================================================

		namespace HostsFile {

			Layout Split(std::string_view content) {
				Layout layout;
				size_t pos = 0;
				enum class State { Before, Inside, After } state = State::Before;

				while (pos < content.size()) {
					size_t eol = content.find('\n', pos);
					const size_t next = eol == std::string_view::npos ? content.size() : eol + 1;
					const std::string_view line = content.substr(pos, next - pos);
					const std::string_view bare = TrimView(line.substr(0, line.size() - (line.back() == '\n' ? 1 : 0)));

					switch (state) {
					case State::Before:
						if (bare == BEGIN_MARKER) {
							layout.hasRegion = true;
							state = State::Inside;
						}
						else {
							layout.before.append(line);
						}
						break;
					case State::Inside:
						if (bare == END_MARKER) {
							layout.terminated = true;
							state = State::After;
						}
						else {
							layout.region.append(line);
						}
						break;
					case State::After:
						layout.after.append(line);
						break;
					}
					pos = next;
				}
				return layout;
			}

			std::set<std::string> ManagedHosts(std::string_view content) {
				std::set<std::string> hosts;
				const Layout layout = Split(content);
				if (!layout.hasRegion) return hosts;

				for (const auto& line : Utils::StringUtils::Split(layout.region, '\n')) {
					std::string_view l = TrimView(line);
					if (l.empty() || l.front() == '#') continue;
					const auto hash = l.find('#');
					if (hash != std::string_view::npos) l = l.substr(0, hash);

					std::string normalized(l);
					for (auto& c : normalized) if (c == '\t') c = ' ';
					auto fields = Utils::StringUtils::Split(normalized, ' ');
					// first field is the redirect address, the rest are host names
					for (size_t i = 1; i < fields.size(); ++i) {
						hosts.insert(Utils::StringUtils::ToLowerCopy(fields[i]));
					}
				}
				return hosts;
			}

			std::string Render(std::string_view content, const std::set<std::string>& hosts,
				const std::string& redirectAddress) {
				const Layout layout = Split(content);

				std::string out = layout.before;
				if (!hosts.empty()) {
					if (!out.empty() && out.back() != '\n') out.push_back('\n');
					out += BEGIN_MARKER;
					out.push_back('\n');
					for (const auto& h : hosts) {
						out += redirectAddress;
						out.push_back(' ');
						out += h;
						out.push_back('\n');
					}
					out += END_MARKER;
					out.push_back('\n');
				}
				out += layout.after;
				return out;
			}

		}  // namespace HostsFile

	}  // namespace Enforcement
}  // namespace NetGuard
