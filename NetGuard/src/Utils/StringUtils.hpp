#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace NetGuard {
	namespace Utils {
		namespace StringUtils {

			// ASCII case conversion; non-ASCII bytes pass through unchanged
			void ToLower(std::string& str);
			[[nodiscard]] std::string ToLowerCopy(std::string_view str);

			// Trimming functions
			void TrimLeft(std::string& str);
			void TrimRight(std::string& str);
			void Trim(std::string& str);
			[[nodiscard]] std::string TrimCopy(std::string_view str);

			[[nodiscard]] bool StartsWith(std::string_view str, std::string_view prefix) noexcept;
			[[nodiscard]] bool EndsWith(std::string_view str, std::string_view suffix) noexcept;
			[[nodiscard]] bool IEquals(std::string_view a, std::string_view b) noexcept;

			/**
			 * @brief Split on a single delimiter.
			 * @param keepEmpty When false, empty fields are dropped.
			 */
			[[nodiscard]] std::vector<std::string> Split(std::string_view str, char delimiter, bool keepEmpty = false);
			[[nodiscard]] std::string Join(const std::vector<std::string>& parts, std::string_view separator);

			void ReplaceAll(std::string& str, std::string_view from, std::string_view to);

			/**
			 * @brief Removes <...> markup and collapses entities to spaces.
			 *
			 * Contents of <script> and <style> elements are dropped entirely.
			 */
			[[nodiscard]] std::string StripHtmlTags(std::string_view html);

			/// Cuts at a byte limit without splitting a UTF-8 sequence.
			[[nodiscard]] std::string TruncateUtf8(std::string_view str, size_t maxBytes);

			/// 64-bit FNV-1a, stable across runs and platforms.
			[[nodiscard]] uint64_t StableHash(std::string_view str) noexcept;

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace NetGuard
