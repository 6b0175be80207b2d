#pragma once

#include "tds_buffer_reader.hpp"
#include "tds_column_metadata.hpp"
#include "tds_error.hpp"
#include "tds_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sqlwire {
namespace tds {

// INFO tokens share the ERROR token layout
typedef TdsError TdsInfo;

//===----------------------------------------------------------------------===//
// DoneToken - Information from DONE/DONEPROC/DONEINPROC tokens
//===----------------------------------------------------------------------===//

struct DoneToken {
	uint16_t status;          // Status flags
	uint16_t cur_cmd;         // Current command
	uint64_t row_count;       // Row count (if DONE_COUNT set)

	DoneToken() : status(0), cur_cmd(0), row_count(0) {}

	bool IsFinal() const { return (status & static_cast<uint16_t>(DoneStatus::DONE_MORE)) == 0; }
	bool HasMore() const { return !IsFinal(); }
	bool HasError() const { return (status & static_cast<uint16_t>(DoneStatus::DONE_ERROR)) != 0; }
	bool HasRowCount() const { return (status & static_cast<uint16_t>(DoneStatus::DONE_COUNT)) != 0; }
	bool IsAttentionAck() const { return (status & static_cast<uint16_t>(DoneStatus::DONE_ATTN)) != 0; }
};

//===----------------------------------------------------------------------===//
// LoginAckToken - Server acknowledgement of LOGIN7
//===----------------------------------------------------------------------===//

struct LoginAckToken {
	uint8_t interface_type;
	uint32_t tds_version;      // Sent big-endian, e.g. 0x74000004
	std::string program_name;  // e.g. "Microsoft SQL Server"
	uint8_t major;
	uint8_t minor;
	uint8_t build_hi;
	uint8_t build_lo;

	LoginAckToken() : interface_type(0), tds_version(0), major(0), minor(0), build_hi(0), build_lo(0) {}

	// "major.minor.build"
	std::string GetVersionString() const;
};

//===----------------------------------------------------------------------===//
// EnvChangeToken - Session state change
//===----------------------------------------------------------------------===//

struct EnvChangeToken {
	uint8_t type;                    // EnvChangeType value
	std::string new_value;           // String subtypes (database, packet size, ...)
	std::string old_value;
	std::vector<uint8_t> new_bytes;  // Binary subtypes (transactions, collation)
	std::vector<uint8_t> old_bytes;

	EnvChangeToken() : type(0) {}

	EnvChangeType GetType() const { return static_cast<EnvChangeType>(type); }

	// BEGIN_TRANSACTION descriptor (8 bytes LE). Throws TdsException(Decode) otherwise.
	uint64_t GetTransactionDescriptor() const;

	// PACKET_SIZE new value. Throws TdsException(Decode) when not numeric.
	size_t GetPacketSize() const;
};

//===----------------------------------------------------------------------===//
// ReturnValueToken - Output parameter or UDF return value
//===----------------------------------------------------------------------===//

struct ReturnValueToken {
	uint16_t ordinal;
	std::string name;
	uint8_t status;
	uint32_t user_type;
	ColumnMetadata type_info;
	std::vector<uint8_t> value;
	bool is_null;

	ReturnValueToken() : ordinal(0), status(0), user_type(0), is_null(false) {}
};

// ORDER - result columns the server sorted by
struct OrderToken {
	std::vector<uint16_t> columns;
};

//===----------------------------------------------------------------------===//
// TokenParser - Decoders for individual token bodies
//
// Each decoder expects the reader positioned just past the token type byte
// and throws TdsException(Decode) on truncated or malformed data.
//===----------------------------------------------------------------------===//

class TokenParser {
public:
	// DONE, DONEPROC, DONEINPROC
	static DoneToken ParseDone(TdsBufferReader &reader);

	static TdsError ParseError(TdsBufferReader &reader);
	static TdsInfo ParseInfo(TdsBufferReader &reader);

	static LoginAckToken ParseLoginAck(TdsBufferReader &reader);

	static EnvChangeToken ParseEnvChange(TdsBufferReader &reader);

	static int32_t ParseReturnStatus(TdsBufferReader &reader);

	static OrderToken ParseOrder(TdsBufferReader &reader);

	static ReturnValueToken ParseReturnValue(TdsBufferReader &reader);

private:
	// Shared ERROR / INFO layout
	static TdsError ParseServerMessage(TdsBufferReader &reader);
};

}  // namespace tds
}  // namespace sqlwire
