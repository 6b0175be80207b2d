#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sqlwire {
namespace tds {

// Category of a failure raised by the engine
enum class TdsErrorKind : uint8_t {
	Io = 0,        // Transport read/write failure, timeout or peer close
	Framing = 1,   // Bad packet header or unexpected packet type
	Decode = 2,    // Malformed or truncated token / PRELOGIN data
	Database = 3,  // ERROR token sent by the server
	Tls = 4,       // TLS negotiation or session failure
	Config = 5     // Invalid options or instance lookup failure
};

const char *TdsErrorKindToString(TdsErrorKind kind);

// Error details from an ERROR token
struct TdsError {
	uint32_t number;
	uint8_t state;
	uint8_t severity;  // class
	std::string message;
	std::string server_name;
	std::string proc_name;
	uint32_t line_number;

	TdsError() : number(0), state(0), severity(0), line_number(0) {}

	// Severity >= 11 is an error, < 11 is informational
	bool IsError() const { return severity >= 11; }
};

class TdsException : public std::runtime_error {
public:
	TdsException(TdsErrorKind kind, const std::string &message);

	TdsErrorKind GetKind() const { return kind_; }

private:
	TdsErrorKind kind_;
};

// Raised when the server reports an ERROR token
class TdsDatabaseException : public TdsException {
public:
	explicit TdsDatabaseException(const TdsError &error);

	const TdsError &GetError() const { return error_; }

private:
	TdsError error_;
};

}  // namespace tds
}  // namespace sqlwire
