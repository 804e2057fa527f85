#include "CertificateAuthority.hpp"
#include "../Core/Errors.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace NetGuard {
	namespace Monitoring {

		namespace {

			constexpr const char* CA_COMMON_NAME = "NetGuard Local Interception Root";
			constexpr const char* CA_ORGANIZATION = "NetGuard";
			constexpr int LEAF_VALID_DAYS = 397;
			constexpr unsigned int RSA_BITS = 2048;

			struct BioDeleter {
				void operator()(BIO* bio) const noexcept { BIO_free_all(bio); }
			};
			using BioPtr = std::unique_ptr<BIO, BioDeleter>;

			EvpPkeyPtr GenerateKey() {
				EvpPkeyPtr key(EVP_RSA_gen(RSA_BITS));
				if (!key) {
					throw Core::InterceptionError({}, "RSA key generation failed: " + OpenSslErrorText());
				}
				return key;
			}

			void SetRandomSerial(X509* cert) {
				unsigned char bytes[8];
				if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
					throw Core::InterceptionError({}, "RAND_bytes failed: " + OpenSslErrorText());
				}
				int64_t serial = 0;
				for (unsigned char b : bytes) serial = (serial << 8) | b;
				serial &= INT64_MAX;
				if (serial == 0) serial = 1;
				ASN1_INTEGER_set_int64(X509_get_serialNumber(cert), serial);
			}

			void AddExtension(X509* cert, X509* issuer, int nid, const std::string& value) {
				X509V3_CTX ctx;
				X509V3_set_ctx_nodb(&ctx);
				X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
				X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
				if (!ext) {
					throw Core::InterceptionError({}, "cannot build extension " + value + ": " + OpenSslErrorText());
				}
				const int rc = X509_add_ext(cert, ext, -1);
				X509_EXTENSION_free(ext);
				if (rc != 1) throw Core::InterceptionError({}, "cannot add extension: " + OpenSslErrorText());
			}

			void WritePem(const std::filesystem::path& path, mode_t mode, const std::function<int(BIO*)>& writer) {
				const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
				if (fd < 0) {
					throw Core::ConfigError("cannot create " + path.string() + ": " + std::strerror(errno));
				}
				::fchmod(fd, mode);
				BioPtr bio(BIO_new_fd(fd, BIO_CLOSE));
				if (!bio) {
					::close(fd);
					throw Core::ConfigError("cannot open BIO for " + path.string());
				}
				if (writer(bio.get()) != 1 || BIO_flush(bio.get()) != 1) {
					throw Core::ConfigError("cannot write " + path.string() + ": " + OpenSslErrorText());
				}
			}

		}  // anonymous namespace

		// ============================================================================
		// Root generation & loading
		// ============================================================================

		CertificateAuthority::GeneratedFiles CertificateAuthority::Generate(const std::filesystem::path& directory,
			int validDays) {
			std::error_code ec;
			std::filesystem::create_directories(directory, ec);
			if (ec) {
				throw Core::ConfigError("cannot create directory " + directory.string() + ": " + ec.message());
			}

			EvpPkeyPtr key;
			X509Ptr cert(X509_new());
			try {
				key = GenerateKey();
				if (!cert) throw Core::InterceptionError({}, "X509_new failed");

				X509_set_version(cert.get(), 2);
				SetRandomSerial(cert.get());
				X509_gmtime_adj(X509_getm_notBefore(cert.get()), -3600);
				X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(validDays) * 86400L);
				X509_set_pubkey(cert.get(), key.get());

				X509_NAME* name = X509_get_subject_name(cert.get());
				X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
					reinterpret_cast<const unsigned char*>(CA_ORGANIZATION), -1, -1, 0);
				X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
					reinterpret_cast<const unsigned char*>(CA_COMMON_NAME), -1, -1, 0);
				X509_set_issuer_name(cert.get(), name);

				AddExtension(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE,pathlen:0");
				AddExtension(cert.get(), cert.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
				AddExtension(cert.get(), cert.get(), NID_subject_key_identifier, "hash");

				if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) {
					throw Core::InterceptionError({}, "signing root certificate failed: " + OpenSslErrorText());
				}
			}
			catch (const Core::InterceptionError& e) {
				throw Core::ConfigError(std::string("root certificate generation failed: ") + e.what());
			}

			GeneratedFiles files{ directory / CERT_FILE_NAME, directory / KEY_FILE_NAME };
			WritePem(files.privateKey, 0600, [&](BIO* bio) {
				return PEM_write_bio_PrivateKey(bio, key.get(), nullptr, nullptr, 0, nullptr, nullptr);
			});
			WritePem(files.certificate, 0644, [&](BIO* bio) {
				return PEM_write_bio_X509(bio, cert.get());
			});

			NG_LOG_INFO("Interceptor", "Generated root certificate %s", files.certificate.c_str());
			return files;
		}

		std::shared_ptr<CertificateAuthority> CertificateAuthority::Load(const std::filesystem::path& certificate,
			const std::filesystem::path& privateKey) {
			if (certificate.empty() || privateKey.empty()) {
				throw Core::ConfigError("interceptor root certificate is not configured; run netguardd --generate-ca <dir>");
			}

			BioPtr certBio(BIO_new_file(certificate.c_str(), "r"));
			if (!certBio) {
				ERR_clear_error();
				throw Core::ConfigError("cannot read root certificate " + certificate.string());
			}
			X509Ptr cert(PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr));
			if (!cert) {
				throw Core::ConfigError("invalid root certificate " + certificate.string() + ": " + OpenSslErrorText());
			}

			BioPtr keyBio(BIO_new_file(privateKey.c_str(), "r"));
			if (!keyBio) {
				ERR_clear_error();
				throw Core::ConfigError("cannot read root key " + privateKey.string());
			}
			EvpPkeyPtr key(PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr));
			if (!key) {
				throw Core::ConfigError("invalid root key " + privateKey.string() + ": " + OpenSslErrorText());
			}
			if (X509_check_private_key(cert.get(), key.get()) != 1) {
				ERR_clear_error();
				throw Core::ConfigError("root key does not match " + certificate.string());
			}

			try {
				return std::shared_ptr<CertificateAuthority>(new CertificateAuthority(std::move(cert), std::move(key)));
			}
			catch (const Core::InterceptionError& e) {
				throw Core::ConfigError(std::string("cannot prepare leaf key: ") + e.what());
			}
		}

		CertificateAuthority::CertificateAuthority(X509Ptr cert, EvpPkeyPtr key)
			: m_cert(std::move(cert)), m_key(std::move(key)), m_leafKey(GenerateKey()) {}

		// ============================================================================
		// Leaf minting
		// ============================================================================

		X509Ptr CertificateAuthority::mintLeaf(const std::string& host) const {
			X509Ptr leaf(X509_new());
			if (!leaf) throw Core::InterceptionError(host, "X509_new failed");

			X509_set_version(leaf.get(), 2);
			SetRandomSerial(leaf.get());
			X509_gmtime_adj(X509_getm_notBefore(leaf.get()), -3600);
			X509_gmtime_adj(X509_getm_notAfter(leaf.get()), static_cast<long>(LEAF_VALID_DAYS) * 86400L);
			X509_set_pubkey(leaf.get(), m_leafKey.get());

			X509_NAME* name = X509_get_subject_name(leaf.get());
			X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
				reinterpret_cast<const unsigned char*>(host.c_str()), -1, -1, 0);
			X509_set_issuer_name(leaf.get(), X509_get_subject_name(m_cert.get()));

			const bool isIp = Utils::NetworkUtils::IsValidIpAddress(host);
			AddExtension(leaf.get(), m_cert.get(), NID_subject_alt_name, (isIp ? "IP:" : "DNS:") + host);
			AddExtension(leaf.get(), m_cert.get(), NID_basic_constraints, "critical,CA:FALSE");
			AddExtension(leaf.get(), m_cert.get(), NID_ext_key_usage, "serverAuth");
			AddExtension(leaf.get(), m_cert.get(), NID_authority_key_identifier, "keyid:always");

			if (X509_sign(leaf.get(), m_key.get(), EVP_sha256()) == 0) {
				throw Core::InterceptionError(host, "signing leaf certificate failed: " + OpenSslErrorText());
			}
			return leaf;
		}

		std::shared_ptr<SSL_CTX> CertificateAuthority::ServerContextFor(const std::string& host) {
			{
				std::lock_guard<std::mutex> lock(m_cacheMutex);
				auto it = m_contexts.find(host);
				if (it != m_contexts.end()) return it->second;
			}

			X509Ptr leaf = mintLeaf(host);
			std::shared_ptr<SSL_CTX> ctx(SSL_CTX_new(TLS_server_method()), SslCtxDeleter{});
			if (!ctx) throw Core::InterceptionError(host, "cannot create server TLS context: " + OpenSslErrorText());
			SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
			if (SSL_CTX_use_certificate(ctx.get(), leaf.get()) != 1 ||
				SSL_CTX_use_PrivateKey(ctx.get(), m_leafKey.get()) != 1 ||
				SSL_CTX_add1_chain_cert(ctx.get(), m_cert.get()) != 1) {
				throw Core::InterceptionError(host, "cannot install leaf certificate: " + OpenSslErrorText());
			}

			std::lock_guard<std::mutex> lock(m_cacheMutex);
			if (m_contexts.size() >= MAX_CACHED_HOSTS) m_contexts.clear();
			auto [it, inserted] = m_contexts.emplace(host, ctx);
			if (inserted) NG_LOG_DEBUG("Interceptor", "Minted leaf certificate for %s", host.c_str());
			return it->second;
		}

		std::string CertificateAuthority::Fingerprint() const {
			unsigned char digest[EVP_MAX_MD_SIZE];
			unsigned int length = 0;
			if (X509_digest(m_cert.get(), EVP_sha256(), digest, &length) != 1) return {};
			std::string out;
			char hex[4];
			for (unsigned int i = 0; i < length; ++i) {
				std::snprintf(hex, sizeof(hex), i == 0 ? "%02X" : ":%02X", digest[i]);
				out += hex;
			}
			return out;
		}

		std::string CertificateAuthority::SubjectName() const {
			char buffer[256];
			X509_NAME_oneline(X509_get_subject_name(m_cert.get()), buffer, sizeof(buffer));
			return buffer;
		}

		size_t CertificateAuthority::CachedHosts() const {
			std::lock_guard<std::mutex> lock(m_cacheMutex);
			return m_contexts.size();
		}

	}  // namespace Monitoring
}  // namespace NetGuard
