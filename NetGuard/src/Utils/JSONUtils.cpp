#include "JSONUtils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace NetGuard {
	namespace Utils {
		namespace JSON {

			namespace {

				void SetError(Error* err, std::string msg, const std::filesystem::path& p = {}, size_t offset = 0) {
					if (err) {
						err->message = std::move(msg);
						err->path = p;
						err->byteOffset = offset;
					}
				}

				size_t Depth(const Json& j, size_t current = 1) {
					if (!j.is_structured()) return current;
					size_t deepest = current;
					for (const auto& child : j) {
						deepest = std::max(deepest, Depth(child, current + 1));
						if (deepest > MAX_JSON_DEPTH) break;
					}
					return deepest;
				}

			}  // namespace

			bool Parse(std::string_view jsonText, Json& out, Error* err) noexcept {
				if (err) err->clear();
				try {
					out = Json::parse(jsonText.begin(), jsonText.end(), nullptr, true, true);
				}
				catch (const Json::parse_error& e) {
					out = nullptr;
					SetError(err, e.what(), {}, e.byte);
					return false;
				}
				catch (const std::exception& e) {
					out = nullptr;
					SetError(err, e.what());
					return false;
				}

				if (Depth(out) > MAX_JSON_DEPTH) {
					out = nullptr;
					SetError(err, "JSON nesting too deep");
					return false;
				}
				return true;
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = opt.pretty ? j.dump(opt.indentSpaces) : j.dump();
					return true;
				}
				catch (const Json::type_error&) {
					// invalid UTF-8 in a string value
					try {
						out = j.dump(opt.pretty ? opt.indentSpaces : -1, ' ', false, Json::error_handler_t::replace);
						return true;
					}
					catch (const std::exception&) {
						out.clear();
						return false;
					}
				}
				catch (const std::exception&) {
					out.clear();
					return false;
				}
			}

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err, size_t maxBytes) noexcept {
				if (err) err->clear();
				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						SetError(err, "cannot stat file: " + ec.message(), path);
						return false;
					}
					if (size > maxBytes) {
						SetError(err, "file exceeds size limit", path);
						return false;
					}

					std::ifstream in(path, std::ios::binary);
					if (!in) {
						SetError(err, "cannot open file", path);
						return false;
					}
					std::ostringstream ss;
					ss << in.rdbuf();
					std::string text = ss.str();

					if (text.size() >= 3 &&
						static_cast<unsigned char>(text[0]) == 0xEF &&
						static_cast<unsigned char>(text[1]) == 0xBB &&
						static_cast<unsigned char>(text[2]) == 0xBF) {
						text.erase(0, 3);
					}

					if (!Parse(text, out, err)) {
						if (err) err->path = path;
						return false;
					}
					return true;
				}
				catch (const std::exception& e) {
					SetError(err, e.what(), path);
					return false;
				}
			}

			bool SaveToFile(const std::filesystem::path& path, const Json& j, Error* err, const StringifyOptions& opt) noexcept {
				if (err) err->clear();
				try {
					std::string text;
					if (!Stringify(j, text, opt)) {
						SetError(err, "serialization failed", path);
						return false;
					}
					text.push_back('\n');

					std::error_code ec;
					if (path.has_parent_path()) {
						std::filesystem::create_directories(path.parent_path(), ec);
						if (ec) {
							SetError(err, "cannot create directory: " + ec.message(), path);
							return false;
						}
					}

					std::filesystem::path tmp = path;
					tmp += ".tmp." + std::to_string(::getpid());

					{
						std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
						if (!out) {
							SetError(err, "cannot open temp file for writing", tmp);
							return false;
						}
						out.write(text.data(), static_cast<std::streamsize>(text.size()));
						out.flush();
						if (!out) {
							SetError(err, "write failed", tmp);
							out.close();
							std::filesystem::remove(tmp, ec);
							return false;
						}
					}

					std::filesystem::rename(tmp, path, ec);
					if (ec) {
						SetError(err, "rename failed: " + ec.message(), path);
						std::error_code ignore;
						std::filesystem::remove(tmp, ignore);
						return false;
					}
					return true;
				}
				catch (const std::exception& e) {
					SetError(err, e.what(), path);
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace NetGuard
