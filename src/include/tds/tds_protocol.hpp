#pragma once

#include "tds_packet.hpp"
#include "tds_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sqlwire {
namespace tds {

// Size of the TRACEID PRELOGIN option (16-byte connection id, 16-byte activity id, 4-byte sequence)
constexpr size_t PRELOGIN_TRACE_ID_SIZE = 36;

// Size of the fixed LOGIN7 header preceding the variable-length data
constexpr size_t LOGIN7_HEADER_SIZE = 94;

struct PreloginVersion {
	uint8_t major;
	uint8_t minor;
	uint16_t build;
	uint16_t sub_build;

	PreloginVersion() : major(0), minor(0), build(0), sub_build(0) {}
	PreloginVersion(uint8_t major_p, uint8_t minor_p, uint16_t build_p, uint16_t sub_build_p)
	    : major(major_p), minor(minor_p), build(build_p), sub_build(sub_build_p) {}
};

// PRELOGIN option block, sent by the client and echoed by the server.
// Options without their has_ flag set are omitted from the block.
struct PreloginMessage {
	bool has_version;
	PreloginVersion version;

	bool has_encryption;
	EncryptionOption encryption;

	bool has_instance;
	std::string instance;  // Encoded null-terminated, even when empty

	bool has_thread_id;
	uint32_t thread_id;

	bool has_trace_id;
	std::vector<uint8_t> trace_id;  // PRELOGIN_TRACE_ID_SIZE bytes

	bool has_mars;
	bool mars;

	PreloginMessage()
	    : has_version(false), has_encryption(false), encryption(EncryptionOption::ENCRYPT_OFF), has_instance(false),
	      has_thread_id(false), thread_id(0), has_trace_id(false), has_mars(false), mars(false) {}
};

// LOGIN7 request fields
struct Login7Request {
	uint32_t tds_version;
	uint32_t packet_size;
	uint32_t client_program_version;
	uint32_t client_pid;
	uint32_t connection_id;

	std::string hostname;
	std::string username;
	std::string password;
	std::string app_name;
	std::string server_name;
	std::string client_interface_name;
	std::string language;
	std::string database;

	uint8_t client_id[6];  // Client MAC address, zeros when unknown

	Login7Request();
};

// TDS Protocol message builders and parsers
// Implements PRELOGIN, LOGIN7 and SQL_BATCH payloads
class TdsProtocol {
public:
	// Build PRELOGIN packet from an option block
	static TdsPacket BuildPrelogin(const PreloginMessage &message);

	// Encode the PRELOGIN option block (triples, terminator, option data)
	static std::vector<uint8_t> EncodePrelogin(const PreloginMessage &message);

	// Decode a PRELOGIN option block.
	// Throws TdsException(Decode) on an unknown option token, out-of-bounds
	// option data, or a missing VERSION / ENCRYPTION option.
	static PreloginMessage DecodePrelogin(const uint8_t *data, size_t length);
	static PreloginMessage DecodePrelogin(const std::vector<uint8_t> &data);

	// Build LOGIN7 packet for SQL Server authentication
	static TdsPacket BuildLogin7(const Login7Request &request);

	// Password encoding for LOGIN7
	// UTF-16LE, then per byte: swap nibbles, XOR with 0xA5
	static std::vector<uint8_t> EncodePassword(const std::string &password);

	// Build SQL_BATCH packet with SQL text
	// ALL_HEADERS carries the transaction descriptor (0 = no active transaction)
	static TdsPacket BuildSqlBatch(const std::string &sql, uint64_t transaction_descriptor = 0);
};

}  // namespace tds
}  // namespace sqlwire
