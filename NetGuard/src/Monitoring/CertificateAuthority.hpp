#pragma once

#include "TlsStream.hpp"

#include <openssl/evp.h>
#include <openssl/x509.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace NetGuard {
	namespace Monitoring {

		struct X509Deleter {
			void operator()(X509* cert) const noexcept { X509_free(cert); }
		};
		struct EvpPkeyDeleter {
			void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
		};
		using X509Ptr = std::unique_ptr<X509, X509Deleter>;
		using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

		/**
		 * @brief Locally generated root used to mint per-host leaf certificates.
		 *
		 * The user installs the root certificate in the browser trust store. Leaf
		 * certificates share one RSA key and are cached per host name.
		 */
		class CertificateAuthority {
		public:
			static constexpr const char* CERT_FILE_NAME = "netguard-ca.crt";
			static constexpr const char* KEY_FILE_NAME = "netguard-ca.key";
			static constexpr size_t MAX_CACHED_HOSTS = 512;

			struct GeneratedFiles {
				std::filesystem::path certificate;
				std::filesystem::path privateKey;
			};

			/**
			 * @brief Creates a new root key pair and self-signed certificate in @p directory.
			 *
			 * The key file is written with mode 0600.
			 * @throws Core::ConfigError when the files cannot be written
			 */
			static GeneratedFiles Generate(const std::filesystem::path& directory, int validDays = 3650);

			/**
			 * @brief Loads a PEM certificate and matching private key.
			 * @throws Core::ConfigError when either file is missing, unreadable or mismatched
			 */
			static std::shared_ptr<CertificateAuthority> Load(const std::filesystem::path& certificate,
				const std::filesystem::path& privateKey);

			/**
			 * @brief Server context presenting a leaf certificate for @p host.
			 * @throws Core::InterceptionError when minting fails
			 */
			std::shared_ptr<SSL_CTX> ServerContextFor(const std::string& host);

			/// SHA-256 of the root certificate, colon-separated upper-case hex
			[[nodiscard]] std::string Fingerprint() const;

			[[nodiscard]] std::string SubjectName() const;
			[[nodiscard]] size_t CachedHosts() const;

		private:
			CertificateAuthority(X509Ptr cert, EvpPkeyPtr key);

			X509Ptr mintLeaf(const std::string& host) const;

			X509Ptr m_cert;
			EvpPkeyPtr m_key;
			EvpPkeyPtr m_leafKey;

			mutable std::mutex m_cacheMutex;
			std::unordered_map<std::string, std::shared_ptr<SSL_CTX>> m_contexts;
		};

	}  // namespace Monitoring
}  // namespace NetGuard
