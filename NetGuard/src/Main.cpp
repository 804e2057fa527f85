/*
 * ============================================================================
 * netguardd - NetGuard monitoring daemon
 * ============================================================================
 *
 * Runs the monitoring engine until SIGINT/SIGTERM, or performs one
 * maintenance command and exits.
 *
 *   netguardd [--config <file>]               run until signalled
 *   netguardd --generate-ca <dir>             write a root certificate for dev mode
 *   netguardd [--config <file>] --reconcile   align the hosts file once
 *   netguardd [--config <file>] --export <file> | --import <file>
 *   netguardd [--config <file>] --cleanup <days> | --retrain
 *
 * ============================================================================
 */

#include "Config/ConfigManager.hpp"
#include "Core/Errors.hpp"
#include "Core/NetGuardEngine.hpp"
#include "Monitoring/CertificateAuthority.hpp"
#include "Utils/Logger.hpp"

#include <csignal>
#include <pthread.h>
#include <signal.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

	constexpr const char* NETGUARD_VERSION = "1.0.0";

	struct CommandLine {
		std::optional<std::string> configPath;
		std::optional<std::string> generateCaDir;
		std::optional<std::string> exportPath;
		std::optional<std::string> importPath;
		std::optional<int> cleanupDays;
		bool reconcile = false;
		bool retrain = false;
		bool help = false;
		bool version = false;

		bool IsOneShot() const {
			return reconcile || retrain || exportPath || importPath || cleanupDays;
		}
	};

	void PrintUsage(const char* argv0) {
		std::cout
			<< "Usage: " << argv0 << " [options]\n\n"
			<< "  --config <file>        JSON configuration file\n"
			<< "  --generate-ca <dir>    create the interception root certificate and key in <dir>\n"
			<< "  --reconcile            align the hosts file with the active blocked sites and exit\n"
			<< "  --export <file>        write blocked sites as JSON and exit\n"
			<< "  --import <file>        load blocked sites from JSON and exit\n"
			<< "  --cleanup <days>       delete audit records older than <days> and exit\n"
			<< "  --retrain              retrain the model from lexicons and feedback and exit\n"
			<< "  --version              print the version\n"
			<< "  --help                 this text\n";
	}

	bool ParseCommandLine(int argc, char** argv, CommandLine& cmd, std::string& error) {
		for (int i = 1; i < argc; ++i) {
			const std::string arg = argv[i];
			auto value = [&](const char* name) -> std::optional<std::string> {
				if (i + 1 >= argc) {
					error = std::string(name) + " needs an argument";
					return std::nullopt;
				}
				return std::string(argv[++i]);
			};

			if (arg == "--help" || arg == "-h") cmd.help = true;
			else if (arg == "--version") cmd.version = true;
			else if (arg == "--reconcile") cmd.reconcile = true;
			else if (arg == "--retrain") cmd.retrain = true;
			else if (arg == "--config") {
				if (!(cmd.configPath = value("--config"))) return false;
			}
			else if (arg == "--generate-ca") {
				if (!(cmd.generateCaDir = value("--generate-ca"))) return false;
			}
			else if (arg == "--export") {
				if (!(cmd.exportPath = value("--export"))) return false;
			}
			else if (arg == "--import") {
				if (!(cmd.importPath = value("--import"))) return false;
			}
			else if (arg == "--cleanup") {
				auto days = value("--cleanup");
				if (!days) return false;
				char* end = nullptr;
				const long n = std::strtol(days->c_str(), &end, 10);
				if (days->empty() || *end != '\0' || n < 0 || n > 36500) {
					error = "--cleanup expects a number of days, got '" + *days + "'";
					return false;
				}
				cmd.cleanupDays = static_cast<int>(n);
			}
			else {
				error = "unknown option '" + arg + "'";
				return false;
			}
		}
		return true;
	}

	int RunOneShot(NetGuard::Core::NetGuardEngine& engine, const CommandLine& cmd) {
		if (cmd.importPath) {
			const int n = engine.ImportBlockedSitesFromFile(*cmd.importPath);
			std::cout << "Imported " << n << " records from " << *cmd.importPath << "\n";
		}
		if (cmd.retrain) {
			const auto version = engine.Retrain();
			if (!version) {
				std::cerr << "Retrain skipped: not enough labelled examples\n";
				return EXIT_FAILURE;
			}
			std::cout << "Model v" << *version << " active\n";
		}
		if (cmd.cleanupDays) {
			const auto report = engine.Cleanup(*cmd.cleanupDays);
			std::cout << "Removed " << report.detectionsDeleted << " detections, " << report.capturesDeleted
				<< " captures, " << report.errorsDeleted << " error events, " << report.connectionsDeleted
				<< " connections, " << report.bandwidthDeleted << " bandwidth samples, "
				<< report.actionsDeleted << " enforcement actions\n";
		}
		if (cmd.reconcile) {
			const auto report = engine.ReconcileNow();
			std::cout << "Reconciled: " << report.added.size() << " added, " << report.removed.size()
				<< " removed" << (report.wrote ? "" : " (no change)") << "\n";
		}
		if (cmd.exportPath) {
			engine.ExportBlockedSitesToFile(*cmd.exportPath);
			std::cout << "Exported blocked sites to " << *cmd.exportPath << "\n";
		}
		return EXIT_SUCCESS;
	}

	int RunDaemon(NetGuard::Core::NetGuardEngine& engine, const sigset_t& signals) {
		engine.Start();
		NG_LOG_INFO("Main", "netguardd %s running; waiting for SIGINT or SIGTERM", NETGUARD_VERSION);

		int received = 0;
		if (sigwait(&signals, &received) != 0) {
			NG_LOG_ERROR("Main", "sigwait failed");
		}
		NG_LOG_INFO("Main", "Received %s, stopping", received == SIGINT ? "SIGINT" : "SIGTERM");

		engine.Stop();
		const auto stats = engine.CurrentStats();
		NG_LOG_INFO("Main", "Observed %llu connections, captured %llu transactions, %llu sites blocked",
			static_cast<unsigned long long>(stats.connectionsObserved),
			static_cast<unsigned long long>(stats.transactionsCaptured),
			static_cast<unsigned long long>(stats.blockCount));
		return EXIT_SUCCESS;
	}

}  // anonymous namespace

int main(int argc, char** argv) {
	using namespace NetGuard;

	CommandLine cmd;
	std::string parseError;
	if (!ParseCommandLine(argc, argv, cmd, parseError)) {
		std::cerr << argv[0] << ": " << parseError << "\n";
		PrintUsage(argv[0]);
		return 2;
	}
	if (cmd.help) {
		PrintUsage(argv[0]);
		return EXIT_SUCCESS;
	}
	if (cmd.version) {
		std::cout << "netguardd " << NETGUARD_VERSION << "\n";
		return EXIT_SUCCESS;
	}

	// SIGINT/SIGTERM are consumed by sigwait; block them before any thread starts
	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);
	pthread_sigmask(SIG_BLOCK, &signals, nullptr);
	std::signal(SIGPIPE, SIG_IGN);

	int rc = EXIT_SUCCESS;
	try {
		Config::ConfigManager config;
		if (cmd.configPath) config.LoadFromFile(*cmd.configPath);
		const Config::NetGuardConfig snapshot = config.Snapshot();
		Utils::Logger::Instance().Initialize(Config::ConfigManager::ToLoggerConfig(snapshot.logging));

		if (cmd.generateCaDir) {
			const auto files = Monitoring::CertificateAuthority::Generate(*cmd.generateCaDir);
			const auto authority = Monitoring::CertificateAuthority::Load(files.certificate, files.privateKey);
			std::cout << "Root certificate: " << files.certificate.string() << "\n"
				<< "Private key:      " << files.privateKey.string() << "\n"
				<< "SHA-256:          " << authority->Fingerprint() << "\n"
				<< "Install the certificate in the browser trust store and set interceptor.ca_cert / ca_key.\n";
		}
		else {
			Core::NetGuardEngine engine(snapshot);
			engine.Initialize();
			rc = cmd.IsOneShot() ? RunOneShot(engine, cmd) : RunDaemon(engine, signals);
		}
	}
	catch (const Core::NetGuardError& e) {
		NG_LOG_FATAL("Main", "[%s/%s] %s", Core::ErrorKindToString(e.kind()), e.stage().c_str(), e.what());
		std::cerr << "netguardd: " << e.what() << "\n";
		rc = EXIT_FAILURE;
	}
	catch (const std::exception& e) {
		NG_LOG_FATAL("Main", "Unhandled exception: %s", e.what());
		std::cerr << "netguardd: " << e.what() << "\n";
		rc = EXIT_FAILURE;
	}

	Utils::Logger::Instance().ShutDown();
	return rc;
}
