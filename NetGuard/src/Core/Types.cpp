#include "Types.hpp"

#include <cstdio>
#include <ctime>

namespace NetGuard {
	namespace Core {

		int64_t ToEpochMillis(Timestamp t) noexcept {
			return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
		}

		Timestamp FromEpochMillis(int64_t ms) noexcept {
			return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
		}

		std::string FormatTimestamp(Timestamp t) {
			const int64_t ms = ToEpochMillis(t);
			const std::time_t secs = static_cast<std::time_t>(ms / 1000);
			std::tm tmUtc{};
			if (!::gmtime_r(&secs, &tmUtc)) return {};
			char buf[40] = { 0 };
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
				tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
				tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, static_cast<int>(ms % 1000));
			return buf;
		}

		const char* ErrorKindToString(ErrorKind kind) noexcept {
			switch (kind) {
			case ErrorKind::Permission:       return "permission";
			case ErrorKind::InsufficientData: return "insufficient_data";
			case ErrorKind::Interception:     return "interception";
			case ErrorKind::CaptureTimeout:   return "capture_timeout";
			case ErrorKind::Config:           return "config";
			case ErrorKind::Validation:       return "validation";
			case ErrorKind::Storage:          return "storage";
			case ErrorKind::Internal:         return "internal";
			}
			return "internal";
		}

		bool ErrorKindFromString(const std::string& s, ErrorKind& out) noexcept {
			static constexpr ErrorKind all[] = {
				ErrorKind::Permission, ErrorKind::InsufficientData, ErrorKind::Interception,
				ErrorKind::CaptureTimeout, ErrorKind::Config, ErrorKind::Validation,
				ErrorKind::Storage, ErrorKind::Internal
			};
			for (ErrorKind k : all) {
				if (s == ErrorKindToString(k)) {
					out = k;
					return true;
				}
			}
			return false;
		}

		const char* ToString(Label v) noexcept {
			return v == Label::Gambling ? "gambling" : "benign";
		}

		const char* ToString(Verdict v) noexcept {
			switch (v) {
			case Verdict::Allow:   return "allow";
			case Verdict::Observe: return "observe";
			case Verdict::Block:   return "block";
			}
			return "allow";
		}

		const char* ToString(DecisionReason v) noexcept {
			switch (v) {
			case DecisionReason::Classifier:  return "classifier";
			case DecisionReason::ManualAllow: return "manual-allow";
			case DecisionReason::ManualBlock: return "manual-block";
			}
			return "classifier";
		}

		const char* ToString(SiteSource v) noexcept {
			return v == SiteSource::Manual ? "manual" : "auto";
		}

		const char* ToString(OverrideKind v) noexcept {
			return v == OverrideKind::Allow ? "allow" : "block";
		}

		std::optional<Label> LabelFromString(const std::string& s) noexcept {
			if (s == "gambling") return Label::Gambling;
			if (s == "benign") return Label::Benign;
			return std::nullopt;
		}

		std::optional<Verdict> VerdictFromString(const std::string& s) noexcept {
			if (s == "block") return Verdict::Block;
			if (s == "allow") return Verdict::Allow;
			if (s == "observe") return Verdict::Observe;
			return std::nullopt;
		}

		std::optional<DecisionReason> DecisionReasonFromString(const std::string& s) noexcept {
			if (s == "classifier") return DecisionReason::Classifier;
			if (s == "manual-allow") return DecisionReason::ManualAllow;
			if (s == "manual-block") return DecisionReason::ManualBlock;
			return std::nullopt;
		}

		std::optional<SiteSource> SiteSourceFromString(const std::string& s) noexcept {
			if (s == "auto") return SiteSource::Auto;
			if (s == "manual") return SiteSource::Manual;
			return std::nullopt;
		}

		std::optional<OverrideKind> OverrideKindFromString(const std::string& s) noexcept {
			if (s == "allow") return OverrideKind::Allow;
			if (s == "block") return OverrideKind::Block;
			return std::nullopt;
		}

	}  // namespace Core
}  // namespace NetGuard
