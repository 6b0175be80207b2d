#include "tds/tds_error.hpp"

namespace sqlwire {
namespace tds {

const char *TdsErrorKindToString(TdsErrorKind kind) {
	switch (kind) {
	case TdsErrorKind::Io:
		return "io";
	case TdsErrorKind::Framing:
		return "framing";
	case TdsErrorKind::Decode:
		return "decode";
	case TdsErrorKind::Database:
		return "database";
	case TdsErrorKind::Tls:
		return "tls";
	case TdsErrorKind::Config:
		return "config";
	default:
		return "unknown";
	}
}

TdsException::TdsException(TdsErrorKind kind, const std::string &message)
    : std::runtime_error(message), kind_(kind) {
}

static std::string FormatDatabaseError(const TdsError &error) {
	std::string msg = "SQL Server error " + std::to_string(error.number) + " (state " +
	                  std::to_string(error.state) + ", class " + std::to_string(error.severity) + ")";
	if (!error.message.empty()) {
		msg += ": " + error.message;
	}
	return msg;
}

TdsDatabaseException::TdsDatabaseException(const TdsError &error)
    : TdsException(TdsErrorKind::Database, FormatDatabaseError(error)), error_(error) {
}

}  // namespace tds
}  // namespace sqlwire
