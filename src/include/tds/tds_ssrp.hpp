#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlwire {
namespace tds {

// SQL Server Resolution Protocol (SQL Browser, UDP 1434)
constexpr uint16_t SSRP_PORT = 1434;
constexpr uint8_t SSRP_CLNT_UCAST_INST = 0x04;
constexpr uint8_t SSRP_SVR_RESP = 0x05;
constexpr size_t SSRP_MAX_INSTANCE_NAME_LENGTH = 32;
constexpr size_t SSRP_MAX_RESPONSE_SIZE = 1024;
constexpr int SSRP_RESPONSE_TIMEOUT_MS = 1000;

// Resolves a named instance to its TCP port.
// All failures throw TdsException(Config).
class SsrpClient {
public:
	// CLNT_UCAST_INST request: 0x04, instance name, 0x00
	static std::vector<uint8_t> BuildRequest(const std::string &instance);

	// Validate an SVR_RESP datagram and return the port from its payload
	static uint16_t ParseResponse(const uint8_t *data, size_t length);

	// Find the first "tcp" key in "key;value;...;;key;value;..." (up to the first NUL)
	static uint16_t ParseTcpPort(const uint8_t *data, size_t length);

	// Query every resolved address of host until one answers
	static uint16_t ResolveInstancePort(const std::string &host, const std::string &instance,
	                                    int timeout_ms = SSRP_RESPONSE_TIMEOUT_MS);
};

}  // namespace tds
}  // namespace sqlwire
