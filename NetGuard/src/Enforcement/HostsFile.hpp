#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace NetGuard {
	namespace Enforcement {

		inline constexpr const char* BEGIN_MARKER = "# BEGIN NETGUARD MANAGED BLOCK";
		inline constexpr const char* END_MARKER = "# END NETGUARD MANAGED BLOCK";

		// ============================================================================
		// Override table storage
		// ============================================================================

		/**
		 * @brief Storage backend of the host-resolution override table.
		 *
		 * Both calls throw Core::PermissionError when access is denied and
		 * Core::StorageError on any other I/O failure.
		 */
		class IHostsTableIO {
		public:
			virtual ~IHostsTableIO() = default;

			/// Whole table; empty when it does not exist yet
			virtual std::string Read() = 0;
			virtual void Write(const std::string& content) = 0;
			virtual std::string Describe() const = 0;
		};

		/**
		 * @brief Reads and replaces a hosts file.
		 *
		 * A write goes to a temporary file beside the target which is synced
		 * and renamed over it, so a failed write leaves the old table intact.
		 * A symlinked hosts file is replaced at its resolved target. When the
		 * rename is refused with EXDEV or EBUSY (a bind-mounted file) the table
		 * is rewritten in place and the original bytes are put back if that
		 * write fails.
		 */
		class FileHostsTableIO final : public IHostsTableIO {
		public:
			enum class ReplaceStrategy {
				RenameOrInPlace,
				InPlace
			};

			explicit FileHostsTableIO(std::filesystem::path path,
				ReplaceStrategy strategy = ReplaceStrategy::RenameOrInPlace)
				: m_path(std::move(path)), m_strategy(strategy) {}

			std::string Read() override;
			void Write(const std::string& content) override;
			std::string Describe() const override { return m_path.string(); }

			const std::filesystem::path& Path() const noexcept { return m_path; }

		private:
			std::filesystem::path resolveTarget() const;

			/// @return false when the filesystem refuses the rename (EXDEV, EBUSY)
			bool replaceByRename(const std::filesystem::path& target, const std::string& content);
			void rewriteInPlace(const std::filesystem::path& target, const std::string& content);

			std::filesystem::path m_path;
			ReplaceStrategy m_strategy;
		};

		// ============================================================================
		// Managed region
		// ============================================================================

		namespace HostsFile {

			/**
			 * @brief A hosts table split around the managed region.
			 *
			 * A BEGIN marker without an END marker is treated as a region that
			 * runs to end of file.
			 */
			struct Layout {
				std::string before;         ///< verbatim text preceding the BEGIN line
				std::string region;         ///< lines between the markers
				std::string after;          ///< verbatim text following the END line
				bool hasRegion = false;
				bool terminated = false;    ///< END marker found
			};

			[[nodiscard]] Layout Split(std::string_view content);

			/// Hostnames listed inside the managed region
			[[nodiscard]] std::set<std::string> ManagedHosts(std::string_view content);

			/**
			 * @brief @p content with its managed region replaced by @p hosts.
			 *
			 * Lines are "<redirect> <host>" sorted by host. An empty @p hosts set
			 * removes the region altogether. Text outside the region is preserved
			 * byte for byte.
			 */
			[[nodiscard]] std::string Render(std::string_view content, const std::set<std::string>& hosts,
				const std::string& redirectAddress);

		}  // namespace HostsFile

	}  // namespace Enforcement
}  // namespace NetGuard
