#include "tds/tds_connect_options.hpp"
#include "tds/tds_error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <vector>

namespace sqlwire {
namespace tds {

//===----------------------------------------------------------------------===//
// String helpers
//===----------------------------------------------------------------------===//

static std::string Lower(const std::string &str) {
	std::string result(str);
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return result;
}

static std::string Trim(const std::string &str) {
	size_t start = 0;
	while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
		start++;
	}
	size_t end = str.size();
	while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
		end--;
	}
	return str.substr(start, end - start);
}

static std::vector<std::string> Split(const std::string &str, char delimiter) {
	std::vector<std::string> parts;
	size_t start = 0;
	while (true) {
		size_t pos = str.find(delimiter, start);
		if (pos == std::string::npos) {
			parts.push_back(str.substr(start));
			break;
		}
		parts.push_back(str.substr(start, pos - start));
		start = pos + 1;
	}
	return parts;
}

static int HexValue(char c) {
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

// URL decode a string (handles %XX encoding, and '+' as space in query values)
static std::string UrlDecode(const std::string &str, bool plus_as_space = false) {
	std::string result;
	result.reserve(str.size());
	for (size_t i = 0; i < str.size(); i++) {
		if (str[i] == '%' && i + 2 < str.size()) {
			int high = HexValue(str[i + 1]);
			int low = HexValue(str[i + 2]);
			if (high >= 0 && low >= 0) {
				result += static_cast<char>((high << 4) | low);
				i += 2;
				continue;
			}
		}
		if (plus_as_space && str[i] == '+') {
			result += ' ';
			continue;
		}
		result += str[i];
	}
	return result;
}

static uint64_t ParseNumber(const std::string &key, const std::string &value, uint64_t max_value) {
	if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
		throw TdsException(TdsErrorKind::Config, "Invalid value for '" + key + "': '" + value + "'");
	}
	errno = 0;
	unsigned long long parsed = std::strtoull(value.c_str(), nullptr, 10);
	if (errno == ERANGE || parsed > max_value) {
		throw TdsException(TdsErrorKind::Config, "Value out of range for '" + key + "': " + value);
	}
	return static_cast<uint64_t>(parsed);
}

static bool ParseBool(const std::string &key, const std::string &value) {
	std::string lower = Lower(value);
	if (lower == "true" || lower == "yes" || lower == "1") {
		return true;
	}
	if (lower == "false" || lower == "no" || lower == "0") {
		return false;
	}
	throw TdsException(TdsErrorKind::Config, "Invalid boolean for '" + key + "': '" + value + "'");
}

static uint16_t ParsePort(const std::string &value) {
	uint64_t port = ParseNumber("port", value, 65535);
	if (port == 0) {
		throw TdsException(TdsErrorKind::Config, "Port must be between 1 and 65535. Got: 0");
	}
	return static_cast<uint16_t>(port);
}

EncryptionOption ParseEncryptOption(const std::string &value) {
	std::string lower = Lower(value);
	if (lower == "strict") {
		return EncryptionOption::ENCRYPT_REQ;
	}
	if (lower == "mandatory" || lower == "true" || lower == "yes") {
		return EncryptionOption::ENCRYPT_ON;
	}
	if (lower == "optional" || lower == "false" || lower == "no") {
		return EncryptionOption::ENCRYPT_OFF;
	}
	if (lower == "not_supported") {
		return EncryptionOption::ENCRYPT_NOT_SUP;
	}
	throw TdsException(TdsErrorKind::Config,
	                   "encrypt=" + value +
	                       " is not a valid value for encrypt. Valid values are: strict, mandatory, optional, "
	                       "not_supported, true, false, yes, no");
}

//===----------------------------------------------------------------------===//
// ConnectOptions
//===----------------------------------------------------------------------===//

ConnectOptions::ConnectOptions()
    : host("localhost"),
      port(TDS_DEFAULT_PORT),
      username("sa"),
      has_password(false),
      database("master"),
      packet_size(static_cast<uint32_t>(TDS_DEFAULT_PACKET_SIZE)),
      client_program_version(0),
      client_pid(0),
      encrypt(EncryptionOption::ENCRYPT_ON),
      trust_server_certificate(true),
      connect_timeout(DEFAULT_CONNECTION_TIMEOUT),
      read_timeout(DEFAULT_READ_TIMEOUT) {
}

bool ConnectOptions::IsUriFormat(const std::string &str) {
	return Lower(str.substr(0, 8)) == "mssql://";
}

ConnectOptions ConnectOptions::FromString(const std::string &str) {
	if (IsUriFormat(str)) {
		return FromUrl(str);
	}
	return FromConnectionString(str);
}

// mssql://[user[:password]@]host[:port][/database][?key=value&...]
ConnectOptions ConnectOptions::FromUrl(const std::string &url) {
	size_t scheme_end = url.find("://");
	if (scheme_end == std::string::npos) {
		throw TdsException(TdsErrorKind::Config, "Invalid connection URL: missing scheme");
	}
	std::string scheme = Lower(url.substr(0, scheme_end));
	if (scheme != "mssql") {
		throw TdsException(TdsErrorKind::Config, "Unsupported URL scheme '" + scheme + "', expected mssql://");
	}

	ConnectOptions options;
	std::string rest = url.substr(scheme_end + 3);

	// Extract query parameters first (after ?)
	std::string query_string;
	size_t query_pos = rest.find('?');
	if (query_pos != std::string::npos) {
		query_string = rest.substr(query_pos + 1);
		rest = rest.substr(0, query_pos);
	}

	// Extract database (first / after the credentials)
	size_t at_pos = rest.rfind('@');
	size_t slash_pos = rest.find('/', at_pos == std::string::npos ? 0 : at_pos + 1);
	if (slash_pos != std::string::npos) {
		std::string database = UrlDecode(rest.substr(slash_pos + 1));
		if (!database.empty()) {
			options.database = database;
		}
		rest = rest.substr(0, slash_pos);
	}

	// Extract user:password, split at the last @ so user names may contain @
	if (at_pos != std::string::npos) {
		std::string user_pass = rest.substr(0, at_pos);
		rest = rest.substr(at_pos + 1);

		size_t colon_pos = user_pass.find(':');
		std::string user = user_pass.substr(0, colon_pos);
		if (!user.empty()) {
			options.username = UrlDecode(user);
		}
		if (colon_pos != std::string::npos) {
			options.password = UrlDecode(user_pass.substr(colon_pos + 1));
			options.has_password = true;
		}
	}

	// Parse host[:port], with [v6-address] brackets
	std::string host_port = rest;
	std::string port_str;
	if (!host_port.empty() && host_port[0] == '[') {
		size_t close = host_port.find(']');
		if (close == std::string::npos) {
			throw TdsException(TdsErrorKind::Config, "Invalid IPv6 host in URL: '" + host_port + "'");
		}
		options.host = host_port.substr(1, close - 1);
		std::string after = host_port.substr(close + 1);
		if (!after.empty()) {
			if (after[0] != ':') {
				throw TdsException(TdsErrorKind::Config, "Invalid host in URL: '" + host_port + "'");
			}
			port_str = after.substr(1);
		}
	} else {
		size_t colon_pos = host_port.rfind(':');
		if (colon_pos != std::string::npos) {
			options.host = host_port.substr(0, colon_pos);
			port_str = host_port.substr(colon_pos + 1);
		} else {
			options.host = host_port;
		}
	}
	if (options.host.empty()) {
		throw TdsException(TdsErrorKind::Config, "Missing host in connection URL");
	}
	if (!port_str.empty()) {
		options.port = ParsePort(port_str);
	}

	// Parse query parameters
	if (!query_string.empty()) {
		for (const std::string &param : Split(query_string, '&')) {
			if (param.empty()) {
				continue;
			}
			size_t eq_pos = param.find('=');
			std::string key = UrlDecode(param.substr(0, eq_pos), true);
			std::string value = eq_pos == std::string::npos ? "" : UrlDecode(param.substr(eq_pos + 1), true);

			if (key == "instance") {
				options.instance = value;
			} else if (key == "encrypt") {
				options.encrypt = ParseEncryptOption(value);
			} else if (key == "sslrootcert" || key == "ssl-root-cert" || key == "ssl-ca") {
				options.ssl_root_cert = value;
			} else if (key == "trust_server_certificate") {
				std::string lower = Lower(value);
				if (lower != "true" && lower != "false") {
					throw TdsException(TdsErrorKind::Config,
					                   "Invalid boolean for 'trust_server_certificate': '" + value + "'");
				}
				options.trust_server_certificate = lower == "true";
			} else if (key == "hostname_in_certificate") {
				options.hostname_in_certificate = value;
			} else if (key == "packet_size") {
				options.packet_size = static_cast<uint32_t>(ParseNumber(key, value, 0xFFFFFFFFULL));
			} else if (key == "client_program_version") {
				options.client_program_version = static_cast<uint32_t>(ParseNumber(key, value, 0xFFFFFFFFULL));
			} else if (key == "client_pid") {
				options.client_pid = static_cast<uint32_t>(ParseNumber(key, value, 0xFFFFFFFFULL));
			} else if (key == "hostname") {
				options.hostname = value;
			} else if (key == "app_name") {
				options.app_name = value;
			} else if (key == "server_name") {
				options.server_name = value;
			} else if (key == "client_interface_name") {
				options.client_interface_name = value;
			} else if (key == "language") {
				options.language = value;
			} else if (key == "connect_timeout") {
				options.connect_timeout = static_cast<int>(ParseNumber(key, value, 86400));
			} else if (key == "read_timeout") {
				options.read_timeout = static_cast<int>(ParseNumber(key, value, 86400));
			} else {
				throw TdsException(TdsErrorKind::Config, "`" + key + "` is not a valid mssql connection option");
			}
		}
	}

	options.Validate();
	return options;
}

// Parse key=value pairs from connection string
// Format: "Server=host,port;Database=db;User Id=user;Password=pass;Encrypt=yes/no"
ConnectOptions ConnectOptions::FromConnectionString(const std::string &connection_string) {
	ConnectOptions options;
	bool has_server = false;

	for (const std::string &part : Split(connection_string, ';')) {
		std::string trimmed = Trim(part);
		if (trimmed.empty()) {
			continue;
		}

		size_t eq_pos = trimmed.find('=');
		if (eq_pos == std::string::npos) {
			throw TdsException(TdsErrorKind::Config, "Invalid connection string segment: '" + trimmed + "'");
		}
		std::string key = Lower(Trim(trimmed.substr(0, eq_pos)));
		std::string value = Trim(trimmed.substr(eq_pos + 1));

		if (key == "server" || key == "data source" || key == "address" || key == "addr") {
			// [tcp:]host[\instance][,port]
			std::string server = value;
			if (Lower(server.substr(0, 4)) == "tcp:") {
				server = server.substr(4);
			}
			size_t comma_pos = server.find(',');
			if (comma_pos != std::string::npos) {
				options.port = ParsePort(Trim(server.substr(comma_pos + 1)));
				server = server.substr(0, comma_pos);
			}
			size_t backslash_pos = server.find('\\');
			if (backslash_pos != std::string::npos) {
				options.instance = server.substr(backslash_pos + 1);
				server = server.substr(0, backslash_pos);
			}
			options.host = Trim(server);
			has_server = true;
		} else if (key == "database" || key == "initial catalog") {
			options.database = value;
		} else if (key == "user id" || key == "uid" || key == "user") {
			options.username = value;
		} else if (key == "password" || key == "pwd") {
			options.password = value;
			options.has_password = true;
		} else if (key == "encrypt") {
			options.encrypt = ParseEncryptOption(value);
		} else if (key == "trustservercertificate" || key == "trust server certificate") {
			options.trust_server_certificate = ParseBool(key, value);
		} else if (key == "hostnameincertificate" || key == "host name in certificate") {
			options.hostname_in_certificate = value;
		} else if (key == "packet size") {
			options.packet_size = static_cast<uint32_t>(ParseNumber(key, value, 0xFFFFFFFFULL));
		} else if (key == "application name" || key == "app") {
			options.app_name = value;
		} else if (key == "workstation id" || key == "wsid") {
			options.hostname = value;
		} else if (key == "language" || key == "current language") {
			options.language = value;
		} else if (key == "connect timeout" || key == "connection timeout" || key == "timeout") {
			options.connect_timeout = static_cast<int>(ParseNumber(key, value, 86400));
		} else {
			throw TdsException(TdsErrorKind::Config, "Unknown connection string keyword: '" + key + "'");
		}
	}

	if (!has_server) {
		throw TdsException(TdsErrorKind::Config,
		                   "Missing 'Server' in connection string. Format: Server=host,port;Database=...;User "
		                   "Id=...;Password=...");
	}

	options.Validate();
	return options;
}

void ConnectOptions::Validate() const {
	if (host.empty()) {
		throw TdsException(TdsErrorKind::Config, "Host must not be empty");
	}
	if (packet_size < TDS_MIN_PACKET_SIZE || packet_size > TDS_MAX_PACKET_SIZE) {
		throw TdsException(TdsErrorKind::Config, "packet_size=" + std::to_string(packet_size) + " must be between " +
		                                             std::to_string(TDS_MIN_PACKET_SIZE) + " and " +
		                                             std::to_string(TDS_MAX_PACKET_SIZE));
	}
	if (connect_timeout <= 0 || read_timeout <= 0) {
		throw TdsException(TdsErrorKind::Config, "Timeouts must be positive");
	}
}

std::string ConnectOptions::GetServerDescription() const {
	if (!instance.empty()) {
		return host + "\\" + instance;
	}
	return host + ":" + std::to_string(port);
}

}  // namespace tds
}  // namespace sqlwire
