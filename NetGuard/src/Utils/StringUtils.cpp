#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>

namespace NetGuard {
	namespace Utils {
		namespace StringUtils {

			void ToLower(std::string& str) {
				std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
					return static_cast<char>(std::tolower(c));
					});
			}

			std::string ToLowerCopy(std::string_view str) {
				std::string result(str);
				ToLower(result);
				return result;
			}

			//Trimming functions

			void TrimLeft(std::string& str) {
				auto it = std::find_if(str.begin(), str.end(), [](unsigned char c) {
					return !std::isspace(c);
					});
				str.erase(str.begin(), it);
			}

			void TrimRight(std::string& str) {
				auto it = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) {
					return !std::isspace(c);
					});
				str.erase(it.base(), str.end());
			}

			void Trim(std::string& str) {
				TrimRight(str);
				TrimLeft(str);
			}

			std::string TrimCopy(std::string_view str) {
				std::string result(str);
				Trim(result);
				return result;
			}

			bool StartsWith(std::string_view str, std::string_view prefix) noexcept {
				return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
			}

			bool EndsWith(std::string_view str, std::string_view suffix) noexcept {
				return str.size() >= suffix.size() &&
					str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
			}

			bool IEquals(std::string_view a, std::string_view b) noexcept {
				if (a.size() != b.size()) return false;
				for (size_t i = 0; i < a.size(); ++i) {
					if (std::tolower(static_cast<unsigned char>(a[i])) !=
						std::tolower(static_cast<unsigned char>(b[i]))) {
						return false;
					}
				}
				return true;
			}

			std::vector<std::string> Split(std::string_view str, char delimiter, bool keepEmpty) {
				std::vector<std::string> out;
				size_t start = 0;
				while (start <= str.size()) {
					size_t pos = str.find(delimiter, start);
					if (pos == std::string_view::npos) pos = str.size();
					std::string_view field = str.substr(start, pos - start);
					if (keepEmpty || !field.empty()) {
						out.emplace_back(field);
					}
					start = pos + 1;
				}
				return out;
			}

			std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
				std::string out;
				for (size_t i = 0; i < parts.size(); ++i) {
					if (i > 0) out.append(separator);
					out.append(parts[i]);
				}
				return out;
			}

			void ReplaceAll(std::string& str, std::string_view from, std::string_view to) {
				if (from.empty()) return;
				size_t pos = 0;
				while ((pos = str.find(from, pos)) != std::string::npos) {
					str.replace(pos, from.size(), to);
					pos += to.size();
				}
			}

			std::string StripHtmlTags(std::string_view html) {
				std::string out;
				out.reserve(html.size());

				size_t i = 0;
				while (i < html.size()) {
					const char c = html[i];
					if (c == '<') {
						const size_t close = html.find('>', i + 1);
						if (close == std::string_view::npos) break;

						std::string tag = ToLowerCopy(html.substr(i + 1, std::min<size_t>(close - i - 1, 7)));
						i = close + 1;

						// skip raw text elements entirely
						for (const char* raw : { "script", "style" }) {
							if (StartsWith(tag, raw)) {
								const std::string endTag = std::string("</") + raw;
								std::string rest = ToLowerCopy(html.substr(i));
								const size_t end = rest.find(endTag);
								if (end == std::string::npos) {
									i = html.size();
								}
								else {
									const size_t endClose = html.find('>', i + end);
									i = (endClose == std::string_view::npos) ? html.size() : endClose + 1;
								}
								break;
							}
						}
						out.push_back(' ');
					}
					else if (c == '&') {
						const size_t semi = html.find(';', i);
						if (semi != std::string_view::npos && semi - i <= 8) {
							out.push_back(' ');
							i = semi + 1;
						}
						else {
							out.push_back(c);
							++i;
						}
					}
					else {
						out.push_back(c);
						++i;
					}
				}
				return out;
			}

			std::string TruncateUtf8(std::string_view str, size_t maxBytes) {
				if (str.size() <= maxBytes) return std::string(str);
				size_t cut = maxBytes;
				// back off continuation bytes (10xxxxxx)
				while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
					--cut;
				}
				return std::string(str.substr(0, cut));
			}

			uint64_t StableHash(std::string_view str) noexcept {
				uint64_t h = 1469598103934665603ULL;
				for (unsigned char c : str) {
					h ^= c;
					h *= 1099511628211ULL;
				}
				return h;
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace NetGuard
