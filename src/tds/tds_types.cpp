#include "tds/tds_types.hpp"

namespace sqlwire {
namespace tds {

bool IsKnownPacketType(uint8_t value) {
	switch (static_cast<PacketType>(value)) {
	case PacketType::SQL_BATCH:
	case PacketType::RPC:
	case PacketType::TABULAR_RESULT:
	case PacketType::ATTENTION:
	case PacketType::BULK_LOAD:
	case PacketType::FEDAUTH_TOKEN:
	case PacketType::TRANSACTION:
	case PacketType::LOGIN7:
	case PacketType::SSPI:
	case PacketType::PRELOGIN:
		return true;
	default:
		return false;
	}
}

size_t ClampPacketSize(size_t size) {
	if (size < TDS_MIN_PACKET_SIZE) {
		return TDS_MIN_PACKET_SIZE;
	}
	if (size > TDS_MAX_PACKET_SIZE) {
		return TDS_MAX_PACKET_SIZE;
	}
	return size;
}

const char *ConnectionStateToString(ConnectionState state) {
	switch (state) {
	case ConnectionState::Disconnected:
		return "Disconnected";
	case ConnectionState::Authenticating:
		return "Authenticating";
	case ConnectionState::Idle:
		return "Idle";
	case ConnectionState::Executing:
		return "Executing";
	default:
		return "Unknown";
	}
}

const char *PacketTypeToString(PacketType type) {
	switch (type) {
	case PacketType::SQL_BATCH:
		return "SQL_BATCH";
	case PacketType::RPC:
		return "RPC";
	case PacketType::TABULAR_RESULT:
		return "TABULAR_RESULT";
	case PacketType::ATTENTION:
		return "ATTENTION";
	case PacketType::BULK_LOAD:
		return "BULK_LOAD";
	case PacketType::FEDAUTH_TOKEN:
		return "FEDAUTH_TOKEN";
	case PacketType::TRANSACTION:
		return "TRANSACTION";
	case PacketType::LOGIN7:
		return "LOGIN7";
	case PacketType::SSPI:
		return "SSPI";
	case PacketType::PRELOGIN:
		return "PRELOGIN";
	default:
		return "Unknown";
	}
}

const char *EncryptionOptionToString(EncryptionOption option) {
	switch (option) {
	case EncryptionOption::ENCRYPT_OFF:
		return "Off";
	case EncryptionOption::ENCRYPT_ON:
		return "On";
	case EncryptionOption::ENCRYPT_NOT_SUP:
		return "NotSupported";
	case EncryptionOption::ENCRYPT_REQ:
		return "Required";
	default:
		return "Unknown";
	}
}

}  // namespace tds
}  // namespace sqlwire
