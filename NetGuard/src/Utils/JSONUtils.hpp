#pragma once
/**
 * @file JSONUtils.hpp
 * @brief JSON parsing, serialization and file I/O helpers for NetGuard.
 *
 * Thin wrappers over nlohmann/json that report failures through an Error
 * out-parameter instead of exceptions. Used for configuration, lexicon
 * tables, model snapshots and blocklist export files.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace NetGuard {
	namespace Utils {
		namespace JSON {

			using Json = nlohmann::json;

			/// Default file size limit for LoadFromFile (32MB)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 32ULL * 1024 * 1024;

			/// Maximum nesting depth accepted by Parse
			inline constexpr size_t MAX_JSON_DEPTH = 256;

			/**
			 * @brief Error information for JSON operations.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
				}
			};

			struct StringifyOptions {
				bool pretty = false;               ///< Enable pretty printing with indentation
				int indentSpaces = 2;              ///< Number of spaces per indent level
			};

			/**
			 * @brief Parse JSON text. Comments are accepted.
			 *
			 * @param out Output Json object (null on failure)
			 * @return true on success, false on parse error or excessive depth
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr) noexcept;

			/**
			 * @brief Serialize Json object to string.
			 */
			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			/**
			 * @brief Load JSON from file, stripping a UTF-8 BOM if present.
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr,
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			/**
			 * @brief Save JSON to file by writing a sibling temp file and renaming it.
			 *
			 * Creates parent directories if they don't exist.
			 */
			[[nodiscard]] bool SaveToFile(const std::filesystem::path& path, const Json& j,
			                              Error* err = nullptr, const StringifyOptions& opt = { true, 2 }) noexcept;

		}  // namespace JSON
	}  // namespace Utils
}  // namespace NetGuard
