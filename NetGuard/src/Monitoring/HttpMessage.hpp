#pragma once

#include "Socket.hpp"
#include "../Core/Types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace NetGuard {
	namespace Monitoring {

		struct HttpLimits {
			size_t maxLineBytes = 16 * 1024;
			size_t maxHeaders = 256;
			size_t maxBodyBytes = 64ULL * 1024ULL * 1024ULL;  ///< whole-message reads only; relayed bodies are streamed
		};

		/// How the end of a message body is found
		enum class BodyFraming {
			None,
			ContentLength,
			Chunked,
			UntilClose
		};

		struct HttpRequest {
			std::string method;
			std::string target;        ///< as received: origin, absolute or authority form
			std::string version = "HTTP/1.1";
			Core::HeaderList headers;
			std::string body;          ///< de-chunked; only the excerpt when relayed
		};

		struct HttpResponse {
			std::string version = "HTTP/1.1";
			int status = 0;
			std::string reason;
			Core::HeaderList headers;
			std::string body;          ///< de-chunked; only the excerpt when relayed
			bool closeDelimited = false;  ///< body ran to end of stream
		};

		/**
		 * @brief Line and block reads over a Stream with an internal buffer.
		 */
		class BufferedReader {
		public:
			explicit BufferedReader(Stream& stream) : m_stream(stream) {}

			/**
			 * @brief Reads one line without its CRLF / LF.
			 * @return false at end of stream before any byte of the line
			 */
			bool ReadLine(std::string& line, size_t maxBytes);

			/// Like ReadLine but keeps the line terminator as received.
			bool ReadRawLine(std::string& raw, size_t maxBytes);

			/// Appends up to @p maxBytes to @p out. @return bytes appended, 0 at end of stream
			size_t ReadSome(std::string& out, size_t maxBytes);

			/// @throws Core::InterceptionError on premature end of stream
			void ReadExact(size_t count, std::string& out);

			[[nodiscard]] size_t Buffered() const noexcept { return m_buffer.size() - m_pos; }

			/// Hands over bytes read ahead of the parser (used when switching to a tunnel).
			[[nodiscard]] std::string TakeBuffered();

		private:
			bool fill();

			Stream& m_stream;
			std::string m_buffer;
			size_t m_pos = 0;
		};

		/**
		 * @brief Incremental reader of one message body.
		 *
		 * Each step hands back the wire bytes exactly as received, so a relay can
		 * forward them untouched, together with the de-chunked payload they carry.
		 */
		class BodyReader {
		public:
			BodyReader(BufferedReader& reader, BodyFraming framing, uint64_t contentLength, const HttpLimits& limits = {});

			/**
			 * @brief Appends the next wire bytes to @p wire and their payload to @p payload (when given).
			 * @return false once the body is complete and nothing was appended
			 * @throws Core::InterceptionError on malformed framing or a premature end of stream
			 */
			bool Next(std::string& wire, std::string* payload);

			[[nodiscard]] bool Done() const noexcept { return m_state == State::Done; }

		private:
			enum class State { Length, ChunkSize, ChunkData, ChunkEnd, Trailer, UntilClose, Done };

			BufferedReader& m_reader;
			size_t m_maxLineBytes;
			State m_state;
			uint64_t m_remaining = 0;
		};

		namespace Http {

			[[nodiscard]] std::optional<std::string> FindHeader(const Core::HeaderList& headers, std::string_view name);
			void RemoveHeader(Core::HeaderList& headers, std::string_view name);
			[[nodiscard]] bool HasToken(const Core::HeaderList& headers, std::string_view name, std::string_view token);

			/**
			 * @brief Reads a request line and header block.
			 * @return false on a clean end of stream before the request line
			 * @throws Core::InterceptionError on malformed input, Core::CaptureTimeout on timeout
			 */
			bool ReadRequestHead(BufferedReader& reader, HttpRequest& request, const HttpLimits& limits = {});

			/**
			 * @brief Reads a status line and header block, skipping interim 1xx responses other than 101.
			 * @throws Core::InterceptionError, Core::CaptureTimeout
			 */
			void ReadResponseHead(BufferedReader& reader, HttpResponse& response, const HttpLimits& limits = {});

			/// @param[out] length Content-Length when the framing is ContentLength
			[[nodiscard]] BodyFraming RequestFraming(const HttpRequest& request, uint64_t& length);

			/// @p requestMethod decides whether a body follows at all
			[[nodiscard]] BodyFraming ResponseFraming(const HttpResponse& response, std::string_view requestMethod,
				uint64_t& length);

			/// Reads a whole request, body included (at most limits.maxBodyBytes).
			bool ReadRequest(BufferedReader& reader, HttpRequest& request, const HttpLimits& limits = {});

			/// Reads a whole response, body included (at most limits.maxBodyBytes).
			void ReadResponse(BufferedReader& reader, HttpResponse& response, std::string_view requestMethod,
				const HttpLimits& limits = {});

			/// Start line and headers, up to and including the blank line
			[[nodiscard]] std::string SerializeHead(const HttpRequest& request);
			[[nodiscard]] std::string SerializeHead(const HttpResponse& response);

			/// Wire form; a chunked message is re-emitted as a single chunk
			[[nodiscard]] std::string Serialize(const HttpRequest& request);
			[[nodiscard]] std::string Serialize(const HttpResponse& response);

			/// Whether the connection may carry another request after this exchange
			[[nodiscard]] bool KeepAlive(const HttpRequest& request, const HttpResponse& response);

		}  // namespace Http

	}  // namespace Monitoring
}  // namespace NetGuard
