#include "tds/tds_ssrp.hpp"
#include "tds/tds_error.hpp"
#include "tds/tds_platform.hpp"
#include "tds_net.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// Debug logging
static int GetSqlwireDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLWIRE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLWIRE_SSRP_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                \
		if (GetSqlwireDebugLevel() >= lvl)                              \
			fprintf(stderr, "[SQLWIRE SSRP] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlwire {
namespace tds {

static TdsException SsrpError(const std::string &message) {
	return TdsException(TdsErrorKind::Config, "SSRP error: " + message);
}

static bool EqualsIgnoreCase(const std::string &a, const char *b) {
	size_t length = std::strlen(b);
	if (a.size() != length) {
		return false;
	}
	for (size_t i = 0; i < length; i++) {
		if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
			return false;
		}
	}
	return true;
}

std::vector<uint8_t> SsrpClient::BuildRequest(const std::string &instance) {
	if (instance.size() > SSRP_MAX_INSTANCE_NAME_LENGTH) {
		throw SsrpError("instance name exceeds maximum length of " + std::to_string(SSRP_MAX_INSTANCE_NAME_LENGTH) +
		                " bytes");
	}
	std::vector<uint8_t> request;
	request.reserve(instance.size() + 2);
	request.push_back(SSRP_CLNT_UCAST_INST);
	request.insert(request.end(), instance.begin(), instance.end());
	request.push_back(0);
	return request;
}

uint16_t SsrpClient::ParseResponse(const uint8_t *data, size_t length) {
	if (length < 3) {
		throw SsrpError("response too short");
	}
	if (data[0] != SSRP_SVR_RESP) {
		throw SsrpError("invalid response header: expected " + std::to_string(SSRP_SVR_RESP) + ", got " +
		                std::to_string(data[0]));
	}
	size_t size = static_cast<size_t>(data[1]) | (static_cast<size_t>(data[2]) << 8);
	if (size == 0 || size > SSRP_MAX_RESPONSE_SIZE) {
		throw SsrpError("invalid response size: " + std::to_string(size));
	}
	if (size > length - 3) {
		throw SsrpError("response truncated");
	}
	return ParseTcpPort(data + 3, size);
}

uint16_t SsrpClient::ParseTcpPort(const uint8_t *data, size_t length) {
	const void *nul = std::memchr(data, 0, length);
	size_t payload_length = nul ? static_cast<size_t>(static_cast<const uint8_t *>(nul) - data) : length;
	std::string payload(reinterpret_cast<const char *>(data), payload_length);

	size_t entry_start = 0;
	while (entry_start <= payload.size()) {
		size_t entry_end = payload.find(";;", entry_start);
		if (entry_end == std::string::npos) {
			entry_end = payload.size();
		}
		std::string entry = payload.substr(entry_start, entry_end - entry_start);

		// key;value;key;value...
		std::vector<std::string> tokens;
		size_t token_start = 0;
		while (!entry.empty()) {
			size_t pos = entry.find(';', token_start);
			if (pos == std::string::npos) {
				tokens.push_back(entry.substr(token_start));
				break;
			}
			tokens.push_back(entry.substr(token_start, pos - token_start));
			token_start = pos + 1;
		}

		for (size_t i = 0; i + 1 < tokens.size(); i += 2) {
			if (!EqualsIgnoreCase(tokens[i], "tcp")) {
				continue;
			}
			const std::string &value = tokens[i + 1];
			if (value.empty() || value.size() > 5 || value.find_first_not_of("0123456789") != std::string::npos) {
				throw SsrpError("invalid TCP port value: " + value);
			}
			unsigned long port = std::strtoul(value.c_str(), nullptr, 10);
			if (port == 0 || port > 65535) {
				throw SsrpError("invalid TCP port value: " + value);
			}
			return static_cast<uint16_t>(port);
		}

		entry_start = entry_end + 2;
	}

	throw SsrpError("response does not contain TCP port information");
}

// Send one request to addr and wait for the answer
static bool QueryAddress(const struct addrinfo *addr, const std::vector<uint8_t> &request, int timeout_ms,
                         std::vector<uint8_t> &response, std::string &error) {
	int fd = static_cast<int>(socket(addr->ai_family, SOCK_DGRAM, IPPROTO_UDP));
	if (fd == -1) {
		error = "failed to create UDP socket: " + std::string(strerror(SOCKET_ERROR_CODE));
		return false;
	}

	ssize_t sent = sendto(fd, SOCK_BUF_CONST_CAST(request.data()), SOCK_LEN_CAST(request.size()), 0, addr->ai_addr,
	                      static_cast<socklen_t>(addr->ai_addrlen));
	if (sent < 0) {
		error = "failed to send request: " + std::string(strerror(SOCKET_ERROR_CODE));
		CLOSE_SOCKET(fd);
		return false;
	}

	struct pollfd pfd;
	pfd.fd = fd;
	pfd.events = POLLIN;
	pfd.revents = 0;
	int ret = poll(&pfd, 1, timeout_ms);
	if (ret <= 0) {
		error = ret == 0 ? "request timed out" : "poll failed: " + std::string(strerror(SOCKET_ERROR_CODE));
		CLOSE_SOCKET(fd);
		return false;
	}

	response.resize(3 + SSRP_MAX_RESPONSE_SIZE);
	ssize_t received = recvfrom(fd, SOCK_BUF_CAST(response.data()), SOCK_LEN_CAST(response.size()), 0, nullptr,
	                            nullptr);
	CLOSE_SOCKET(fd);
	if (received < 0) {
		error = "failed to receive response: " + std::string(strerror(SOCKET_ERROR_CODE));
		return false;
	}
	response.resize(static_cast<size_t>(received));
	return true;
}

uint16_t SsrpClient::ResolveInstancePort(const std::string &host, const std::string &instance, int timeout_ms) {
	std::vector<uint8_t> request = BuildRequest(instance);

	if (!EnsureNetworkInitialized()) {
		throw SsrpError("failed to initialize socket library");
	}

	struct addrinfo hints, *result;
	std::memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_DGRAM;
	hints.ai_protocol = IPPROTO_UDP;

	std::string port_str = std::to_string(SSRP_PORT);
	int ret = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
	if (ret != 0) {
		throw SsrpError("failed to resolve '" + host + "': " + std::string(gai_strerror(ret)));
	}

	std::string last_error = "lookup returned no response";
	for (struct addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
		std::vector<uint8_t> response;
		if (!QueryAddress(rp, request, timeout_ms, response, last_error)) {
			SQLWIRE_SSRP_DEBUG_LOG(1, "ResolveInstancePort: %s", last_error.c_str());
			continue;
		}
		freeaddrinfo(result);
		uint16_t port = ParseResponse(response.data(), response.size());
		SQLWIRE_SSRP_DEBUG_LOG(1, "ResolveInstancePort: %s\\%s -> port %u", host.c_str(), instance.c_str(),
		                       static_cast<unsigned>(port));
		return port;
	}

	freeaddrinfo(result);
	throw SsrpError(last_error + " (" + host + "\\" + instance + ")");
}

}  // namespace tds
}  // namespace sqlwire
