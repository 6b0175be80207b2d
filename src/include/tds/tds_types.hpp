#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sqlwire {
namespace tds {

// TDS Protocol Version (TDS 7.4 for SQL Server 2012+)
constexpr uint32_t TDS_VERSION_7_4 = 0x74000004;

// TDS Packet Types
enum class PacketType : uint8_t {
	SQL_BATCH = 1,       // SQL batch request
	RPC = 3,             // Remote procedure call
	TABULAR_RESULT = 4,  // Server response
	ATTENTION = 6,       // Cancel signal
	BULK_LOAD = 7,       // Bulk data
	FEDAUTH_TOKEN = 8,   // Federated authentication token
	TRANSACTION = 14,    // Transaction management
	LOGIN7 = 16,         // Login request
	SSPI = 17,           // Windows authentication
	PRELOGIN = 18        // Pre-login handshake
};

// Returns true if the byte names one of the PacketType values above
bool IsKnownPacketType(uint8_t value);

// TDS Packet Status Flags
enum class PacketStatus : uint8_t {
	NORMAL = 0x00,               // Normal packet
	END_OF_MESSAGE = 0x01,       // Last packet of message (EOM)
	IGNORE_EVENT = 0x02,         // Ignore this event
	RESET_CONNECTION = 0x08,     // Reset connection
	RESET_SKIP_TRAN = 0x10       // Reset and skip transaction
};

// Connection State Machine
enum class ConnectionState : uint8_t {
	Disconnected = 0,    // No TCP connection
	Authenticating = 1,  // PRELOGIN/LOGIN7 in progress
	Idle = 2,            // Connected, ready for statements
	Executing = 3        // Statement submitted, results pending
};

// PRELOGIN Option Types
enum class PreloginOption : uint8_t {
	VERSION = 0,
	ENCRYPTION = 1,
	INSTOPT = 2,
	THREADID = 3,
	MARS = 4,
	TRACEID = 5,
	TERMINATOR = 0xFF
};

// Encryption Options
enum class EncryptionOption : uint8_t {
	ENCRYPT_OFF = 0x00,
	ENCRYPT_ON = 0x01,
	ENCRYPT_NOT_SUP = 0x02,
	ENCRYPT_REQ = 0x03
};

// TDS Token Types (response parsing)
enum class TokenType : uint8_t {
	DONE = 0xFD,
	DONEPROC = 0xFE,
	DONEINPROC = 0xFF,
	ERROR_TOKEN = 0xAA,
	INFO = 0xAB,
	LOGINACK = 0xAD,
	ENVCHANGE = 0xE3,
	COLMETADATA = 0x81,
	ROW = 0xD1,
	NBCROW = 0xD2,        // Null Bitmap Compressed Row
	RETURNSTATUS = 0x79,
	ORDER = 0xA9,
	RETURNVALUE = 0xAC
};

// DONE Token Status Flags
enum class DoneStatus : uint16_t {
	DONE_FINAL = 0x0000,
	DONE_MORE = 0x0001,
	DONE_ERROR = 0x0002,
	DONE_INXACT = 0x0004,
	DONE_COUNT = 0x0010,
	DONE_ATTN = 0x0020,      // ATTENTION acknowledgment
	DONE_SRVERROR = 0x0100
};

// ENVCHANGE token subtypes
enum class EnvChangeType : uint8_t {
	DATABASE = 1,
	LANGUAGE = 2,
	CHARSET = 3,
	PACKET_SIZE = 4,
	UNICODE_SORTING_LOCALE = 5,
	UNICODE_COMPARISON_FLAGS = 6,
	SQL_COLLATION = 7,
	BEGIN_TRANSACTION = 8,
	COMMIT_TRANSACTION = 9,
	ROLLBACK_TRANSACTION = 10,
	ENLIST_DTC_TRANSACTION = 11,
	DEFECT_TRANSACTION = 12,
	MIRROR_PARTNER = 13,
	PROMOTE_TRANSACTION = 15,
	TRANSACTION_MANAGER_ADDRESS = 16,
	TRANSACTION_ENDED = 17,
	RESET_CONNECTION_ACK = 18,
	USER_INSTANCE_STARTED = 19,
	ROUTING = 20
};

//===----------------------------------------------------------------------===//
// SQL Server Data Type IDs (TDS wire format)
//===----------------------------------------------------------------------===//

// Fixed-length types (no length prefix in wire format)
constexpr uint8_t TDS_TYPE_NULL = 0x1F;
constexpr uint8_t TDS_TYPE_TINYINT = 0x30;
constexpr uint8_t TDS_TYPE_BIT = 0x32;
constexpr uint8_t TDS_TYPE_SMALLINT = 0x34;
constexpr uint8_t TDS_TYPE_INT = 0x38;
constexpr uint8_t TDS_TYPE_SMALLDATETIME = 0x3A;
constexpr uint8_t TDS_TYPE_REAL = 0x3B;
constexpr uint8_t TDS_TYPE_MONEY = 0x3C;
constexpr uint8_t TDS_TYPE_DATETIME = 0x3D;
constexpr uint8_t TDS_TYPE_FLOAT = 0x3E;
constexpr uint8_t TDS_TYPE_SMALLMONEY = 0x7A;
constexpr uint8_t TDS_TYPE_BIGINT = 0x7F;

// Nullable fixed-length types (length prefix)
constexpr uint8_t TDS_TYPE_INTN = 0x26;
constexpr uint8_t TDS_TYPE_BITN = 0x68;
constexpr uint8_t TDS_TYPE_FLOATN = 0x6D;
constexpr uint8_t TDS_TYPE_MONEYN = 0x6E;
constexpr uint8_t TDS_TYPE_DATETIMEN = 0x6F;

// Decimal/Numeric types
constexpr uint8_t TDS_TYPE_DECIMAL = 0x6A;
constexpr uint8_t TDS_TYPE_NUMERIC = 0x6C;

// GUID type
constexpr uint8_t TDS_TYPE_UNIQUEIDENTIFIER = 0x24;

// String types (collation info in metadata)
constexpr uint8_t TDS_TYPE_BIGCHAR = 0xAF;     // CHAR
constexpr uint8_t TDS_TYPE_BIGVARCHAR = 0xA7; // VARCHAR
constexpr uint8_t TDS_TYPE_NCHAR = 0xEF;
constexpr uint8_t TDS_TYPE_NVARCHAR = 0xE7;

// Binary types
constexpr uint8_t TDS_TYPE_BIGBINARY = 0xAD;     // BINARY
constexpr uint8_t TDS_TYPE_BIGVARBINARY = 0xA5; // VARBINARY

// Legacy byte-length types (1 byte length in TYPE_INFO and in row data)
constexpr uint8_t TDS_TYPE_LEGACY_VARBINARY = 0x25;
constexpr uint8_t TDS_TYPE_LEGACY_VARCHAR = 0x27;
constexpr uint8_t TDS_TYPE_LEGACY_BINARY = 0x2D;
constexpr uint8_t TDS_TYPE_LEGACY_CHAR = 0x2F;
constexpr uint8_t TDS_TYPE_LEGACY_DECIMAL = 0x37;
constexpr uint8_t TDS_TYPE_LEGACY_NUMERIC = 0x3F;

// Date/Time types (SQL Server 2008+)
constexpr uint8_t TDS_TYPE_DATE = 0x28;
constexpr uint8_t TDS_TYPE_TIME = 0x29;
constexpr uint8_t TDS_TYPE_DATETIME2 = 0x2A;
constexpr uint8_t TDS_TYPE_DATETIMEOFFSET = 0x2B;

// Types whose values are not decoded by the row reader
constexpr uint8_t TDS_TYPE_XML = 0xF1;
constexpr uint8_t TDS_TYPE_UDT = 0xF0;         // Also GEOGRAPHY, GEOMETRY, HIERARCHYID
constexpr uint8_t TDS_TYPE_SQL_VARIANT = 0x62;
constexpr uint8_t TDS_TYPE_IMAGE = 0x22;       // Deprecated
constexpr uint8_t TDS_TYPE_TEXT = 0x23;        // Deprecated
constexpr uint8_t TDS_TYPE_NTEXT = 0x63;       // Deprecated

// Column flags bitmask (from COLMETADATA)
constexpr uint16_t COL_FLAG_NULLABLE = 0x0001;
constexpr uint16_t COL_FLAG_CASE_SENSITIVE = 0x0002;
constexpr uint16_t COL_FLAG_IDENTITY = 0x0010;
constexpr uint16_t COL_FLAG_COMPUTED = 0x0020;

// TDS Packet Header Size
constexpr size_t TDS_HEADER_SIZE = 8;

// Default and maximum packet sizes
constexpr size_t TDS_MIN_PACKET_SIZE = 512;
constexpr size_t TDS_DEFAULT_PACKET_SIZE = 4096;
constexpr size_t TDS_MAX_PACKET_SIZE = 32767;

// PRELOGIN envelopes around TLS handshake records always use this size
constexpr size_t TDS_PRELOGIN_TLS_PACKET_SIZE = 4096;

// Timeout defaults (in seconds)
constexpr int DEFAULT_CONNECTION_TIMEOUT = 30;
constexpr int DEFAULT_READ_TIMEOUT = 30;

// Default server endpoint
constexpr uint16_t TDS_DEFAULT_PORT = 1433;

// Clamp a negotiated packet size into [TDS_MIN_PACKET_SIZE, TDS_MAX_PACKET_SIZE]
size_t ClampPacketSize(size_t size);

// Convert enums to string for debugging
const char *ConnectionStateToString(ConnectionState state);
const char *PacketTypeToString(PacketType type);
const char *EncryptionOptionToString(EncryptionOption option);

}  // namespace tds
}  // namespace sqlwire
