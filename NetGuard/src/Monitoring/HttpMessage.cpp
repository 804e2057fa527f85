#include "HttpMessage.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace NetGuard {
	namespace Monitoring {

		namespace SU = Utils::StringUtils;

		// ============================================================================
		// BufferedReader
		// ============================================================================

		bool BufferedReader::fill() {
			if (m_pos > 0 && m_pos == m_buffer.size()) {
				m_buffer.clear();
				m_pos = 0;
			}
			char chunk[16384];
			const size_t n = m_stream.ReadSome(chunk, sizeof(chunk));
			if (n == 0) return false;
			m_buffer.append(chunk, n);
			return true;
		}

		bool BufferedReader::ReadRawLine(std::string& raw, size_t maxBytes) {
			raw.clear();
			size_t scanned = m_pos;
			while (true) {
				const size_t nl = m_buffer.find('\n', scanned);
				if (nl != std::string::npos) {
					raw.assign(m_buffer, m_pos, nl + 1 - m_pos);
					m_pos = nl + 1;
					return true;
				}
				if (m_buffer.size() - m_pos > maxBytes) {
					throw Core::InterceptionError({}, "header line exceeds " + std::to_string(maxBytes) + " bytes");
				}
				scanned = m_buffer.size();
				if (!fill()) {
					if (m_buffer.size() == m_pos) return false;
					throw Core::InterceptionError({}, "stream ended inside a header line");
				}
			}
		}

		bool BufferedReader::ReadLine(std::string& line, size_t maxBytes) {
			if (!ReadRawLine(line, maxBytes)) return false;
			line.pop_back();
			if (!line.empty() && line.back() == '\r') line.pop_back();
			return true;
		}

		void BufferedReader::ReadExact(size_t count, std::string& out) {
			while (Buffered() < count) {
				if (!fill()) {
					throw Core::InterceptionError({}, "stream ended " + std::to_string(count - Buffered()) +
						" bytes before the end of the body");
				}
			}
			out.append(m_buffer, m_pos, count);
			m_pos += count;
		}

		size_t BufferedReader::ReadSome(std::string& out, size_t maxBytes) {
			if (Buffered() == 0 && !fill()) return 0;
			const size_t n = std::min(Buffered(), maxBytes);
			out.append(m_buffer, m_pos, n);
			m_pos += n;
			return n;
		}

		std::string BufferedReader::TakeBuffered() {
			std::string rest = m_buffer.substr(m_pos);
			m_buffer.clear();
			m_pos = 0;
			return rest;
		}

		// ============================================================================
		// BodyReader
		// ============================================================================

		namespace {

			constexpr size_t BODY_STEP = 16384;

			std::string_view StripEol(std::string_view raw) {
				if (!raw.empty() && raw.back() == '\n') raw.remove_suffix(1);
				if (!raw.empty() && raw.back() == '\r') raw.remove_suffix(1);
				return raw;
			}

			uint64_t ParseChunkSize(std::string_view line) {
				const std::string sizeText = SU::TrimCopy(line.substr(0, line.find(';')));
				if (sizeText.empty()) throw Core::InterceptionError({}, "missing chunk size");
				char* end = nullptr;
				errno = 0;
				const unsigned long long size = std::strtoull(sizeText.c_str(), &end, 16);
				if (!end || *end != '\0' || errno == ERANGE) {
					throw Core::InterceptionError({}, "invalid chunk size: " + sizeText);
				}
				return size;
			}

		}  // anonymous namespace

		BodyReader::BodyReader(BufferedReader& reader, BodyFraming framing, uint64_t contentLength,
			const HttpLimits& limits)
			: m_reader(reader), m_maxLineBytes(limits.maxLineBytes), m_state(State::Done) {
			switch (framing) {
			case BodyFraming::None:
				break;
			case BodyFraming::ContentLength:
				m_remaining = contentLength;
				if (contentLength > 0) m_state = State::Length;
				break;
			case BodyFraming::Chunked:
				m_state = State::ChunkSize;
				break;
			case BodyFraming::UntilClose:
				m_state = State::UntilClose;
				break;
			}
		}

		bool BodyReader::Next(std::string& wire, std::string* payload) {
			std::string line;
			switch (m_state) {
			case State::Done:
				return false;

			case State::Length:
			case State::ChunkData: {
				const size_t before = wire.size();
				const size_t step = static_cast<size_t>(std::min<uint64_t>(m_remaining, BODY_STEP));
				const size_t n = m_reader.ReadSome(wire, step);
				if (n == 0) {
					throw Core::InterceptionError({}, "stream ended " + std::to_string(m_remaining) +
						" bytes before the end of the body");
				}
				if (payload) payload->append(wire, before, n);
				m_remaining -= n;
				if (m_remaining == 0) m_state = m_state == State::Length ? State::Done : State::ChunkEnd;
				return true;
			}

			case State::UntilClose: {
				const size_t before = wire.size();
				if (m_reader.ReadSome(wire, BODY_STEP) == 0) {
					m_state = State::Done;
					return false;
				}
				if (payload) payload->append(wire, before, std::string::npos);
				return true;
			}

			case State::ChunkSize:
				if (!m_reader.ReadRawLine(line, m_maxLineBytes)) {
					throw Core::InterceptionError({}, "stream ended inside chunked body");
				}
				m_remaining = ParseChunkSize(StripEol(line));
				m_state = m_remaining == 0 ? State::Trailer : State::ChunkData;
				wire += line;
				return true;

			case State::ChunkEnd:
				if (!m_reader.ReadRawLine(line, m_maxLineBytes) || !StripEol(line).empty()) {
					throw Core::InterceptionError({}, "chunk not terminated by CRLF");
				}
				m_state = State::ChunkSize;
				wire += line;
				return true;

			case State::Trailer:
				// a peer that closes right after the last chunk is tolerated
				if (!m_reader.ReadRawLine(line, m_maxLineBytes)) {
					m_state = State::Done;
					return false;
				}
				if (StripEol(line).empty()) m_state = State::Done;
				wire += line;
				return true;
			}
			return false;
		}

		// ============================================================================
		// Http
		// ============================================================================

		namespace Http {

			namespace {

				void ReadHeaders(BufferedReader& reader, Core::HeaderList& headers, const HttpLimits& limits) {
					std::string line;
					while (true) {
						if (!reader.ReadLine(line, limits.maxLineBytes)) {
							throw Core::InterceptionError({}, "stream ended inside the header block");
						}
						if (line.empty()) return;
						if (headers.size() >= limits.maxHeaders) {
							throw Core::InterceptionError({}, "too many header fields");
						}
						const auto colon = line.find(':');
						if (colon == std::string::npos || colon == 0) {
							throw Core::InterceptionError({}, "malformed header field: " + SU::TruncateUtf8(line, 80));
						}
						headers.emplace_back(SU::TrimCopy(std::string_view(line).substr(0, colon)),
							SU::TrimCopy(std::string_view(line).substr(colon + 1)));
					}
				}

				uint64_t ParseContentLength(const std::string& value) {
					if (value.empty()) throw Core::InterceptionError({}, "empty Content-Length");
					for (char c : value) {
						if (c < '0' || c > '9') throw Core::InterceptionError({}, "invalid Content-Length: " + value);
					}
					errno = 0;
					const unsigned long long length = std::strtoull(value.c_str(), nullptr, 10);
					if (errno == ERANGE) throw Core::InterceptionError({}, "invalid Content-Length: " + value);
					return length;
				}

				/// Drains @p body into @p out, refusing more than @p maxBytes of payload
				void ReadWholeBody(BodyReader& body, std::string& out, size_t maxBytes) {
					std::string wire;
					while (body.Next(wire, &out)) {
						wire.clear();
						if (out.size() > maxBytes) {
							throw Core::InterceptionError({}, "body exceeds " + std::to_string(maxBytes) + " bytes");
						}
					}
				}

				bool IsChunked(const Core::HeaderList& headers) {
					return HasToken(headers, "Transfer-Encoding", "chunked");
				}

				void AppendHeaders(std::string& out, const Core::HeaderList& headers) {
					for (const auto& [name, value] : headers) {
						out += name;
						out += ": ";
						out += value;
						out += "\r\n";
					}
					out += "\r\n";
				}

				void AppendBody(std::string& out, const Core::HeaderList& headers, const std::string& body) {
					if (IsChunked(headers)) {
						if (!body.empty()) {
							char size[32];
							std::snprintf(size, sizeof(size), "%zx\r\n", body.size());
							out += size;
							out += body;
							out += "\r\n";
						}
						out += "0\r\n\r\n";
					}
					else {
						out += body;
					}
				}

			}  // anonymous namespace

			std::optional<std::string> FindHeader(const Core::HeaderList& headers, std::string_view name) {
				for (const auto& [n, v] : headers) {
					if (SU::IEquals(n, name)) return v;
				}
				return std::nullopt;
			}

			void RemoveHeader(Core::HeaderList& headers, std::string_view name) {
				for (auto it = headers.begin(); it != headers.end();) {
					if (SU::IEquals(it->first, name)) it = headers.erase(it);
					else ++it;
				}
			}

			bool HasToken(const Core::HeaderList& headers, std::string_view name, std::string_view token) {
				for (const auto& [n, v] : headers) {
					if (!SU::IEquals(n, name)) continue;
					for (const auto& part : SU::Split(v, ',')) {
						if (SU::IEquals(SU::TrimCopy(part), token)) return true;
					}
				}
				return false;
			}

			bool ReadRequestHead(BufferedReader& reader, HttpRequest& request, const HttpLimits& limits) {
				std::string line;
				// tolerate stray CRLF between pipelined requests
				do {
					if (!reader.ReadLine(line, limits.maxLineBytes)) return false;
				} while (line.empty());

				const auto sp1 = line.find(' ');
				const auto sp2 = line.rfind(' ');
				if (sp1 == std::string::npos || sp2 == sp1) {
					throw Core::InterceptionError({}, "malformed request line: " + SU::TruncateUtf8(line, 80));
				}
				request = HttpRequest{};
				request.method = line.substr(0, sp1);
				request.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
				request.version = line.substr(sp2 + 1);
				if (!SU::StartsWith(request.version, "HTTP/1.")) {
					throw Core::InterceptionError({}, "unsupported protocol version: " + request.version);
				}

				ReadHeaders(reader, request.headers, limits);
				return true;
			}

			void ReadResponseHead(BufferedReader& reader, HttpResponse& response, const HttpLimits& limits) {
				std::string line;
				do {
					if (!reader.ReadLine(line, limits.maxLineBytes)) {
						throw Core::InterceptionError({}, "upstream closed before sending a response");
					}
					response = HttpResponse{};
					const auto sp1 = line.find(' ');
					if (sp1 == std::string::npos || !SU::StartsWith(line, "HTTP/1.")) {
						throw Core::InterceptionError({}, "malformed status line: " + SU::TruncateUtf8(line, 80));
					}
					response.version = line.substr(0, sp1);
					const auto sp2 = line.find(' ', sp1 + 1);
					const std::string code = line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
					if (code.size() != 3) throw Core::InterceptionError({}, "malformed status code: " + code);
					response.status = std::atoi(code.c_str());
					if (sp2 != std::string::npos) response.reason = line.substr(sp2 + 1);
					ReadHeaders(reader, response.headers, limits);
				} while (response.status >= 100 && response.status < 200 && response.status != 101);
			}

			BodyFraming RequestFraming(const HttpRequest& request, uint64_t& length) {
				length = 0;
				if (IsChunked(request.headers)) return BodyFraming::Chunked;
				if (auto cl = FindHeader(request.headers, "Content-Length")) {
					length = ParseContentLength(*cl);
					return BodyFraming::ContentLength;
				}
				return BodyFraming::None;
			}

			BodyFraming ResponseFraming(const HttpResponse& response, std::string_view requestMethod, uint64_t& length) {
				length = 0;
				const bool noBody = SU::IEquals(requestMethod, "HEAD") || response.status == 204 ||
					response.status == 304 || response.status == 101;
				if (noBody) return BodyFraming::None;
				if (IsChunked(response.headers)) return BodyFraming::Chunked;
				if (auto cl = FindHeader(response.headers, "Content-Length")) {
					length = ParseContentLength(*cl);
					return BodyFraming::ContentLength;
				}
				return BodyFraming::UntilClose;
			}

			bool ReadRequest(BufferedReader& reader, HttpRequest& request, const HttpLimits& limits) {
				if (!ReadRequestHead(reader, request, limits)) return false;
				uint64_t length = 0;
				const BodyFraming framing = RequestFraming(request, length);
				if (length > limits.maxBodyBytes) throw Core::InterceptionError({}, "request body too large");
				BodyReader body(reader, framing, length, limits);
				ReadWholeBody(body, request.body, limits.maxBodyBytes);
				return true;
			}

			void ReadResponse(BufferedReader& reader, HttpResponse& response, std::string_view requestMethod,
				const HttpLimits& limits) {
				ReadResponseHead(reader, response, limits);
				uint64_t length = 0;
				const BodyFraming framing = ResponseFraming(response, requestMethod, length);
				if (length > limits.maxBodyBytes) throw Core::InterceptionError({}, "response body too large");
				response.closeDelimited = framing == BodyFraming::UntilClose;
				BodyReader body(reader, framing, length, limits);
				ReadWholeBody(body, response.body, limits.maxBodyBytes);
			}

			std::string SerializeHead(const HttpRequest& request) {
				std::string out = request.method + " " + request.target + " " + request.version + "\r\n";
				AppendHeaders(out, request.headers);
				return out;
			}

			std::string SerializeHead(const HttpResponse& response) {
				std::string out = response.version + " " + std::to_string(response.status);
				if (!response.reason.empty()) {
					out += ' ';
					out += response.reason;
				}
				out += "\r\n";
				AppendHeaders(out, response.headers);
				return out;
			}

			std::string Serialize(const HttpRequest& request) {
				std::string out = SerializeHead(request);
				AppendBody(out, request.headers, request.body);
				return out;
			}

			std::string Serialize(const HttpResponse& response) {
				std::string out = SerializeHead(response);
				AppendBody(out, response.headers, response.body);
				return out;
			}

			bool KeepAlive(const HttpRequest& request, const HttpResponse& response) {
				if (response.closeDelimited) return false;
				if (HasToken(request.headers, "Connection", "close") || HasToken(response.headers, "Connection", "close")) {
					return false;
				}
				if (request.version == "HTTP/1.0") {
					return HasToken(request.headers, "Connection", "keep-alive") ||
						HasToken(request.headers, "Proxy-Connection", "keep-alive");
				}
				return true;
			}

		}  // namespace Http

	}  // namespace Monitoring
}  // namespace NetGuard
