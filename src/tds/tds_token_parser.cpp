#include "tds/tds_token_parser.hpp"
#include "tds/tds_row_reader.hpp"
#include <cstdlib>

namespace sqlwire {
namespace tds {

//===----------------------------------------------------------------------===//
// Token structs
//===----------------------------------------------------------------------===//

std::string LoginAckToken::GetVersionString() const {
	uint16_t build = static_cast<uint16_t>((build_hi << 8) | build_lo);
	return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(build);
}

uint64_t EnvChangeToken::GetTransactionDescriptor() const {
	if (new_bytes.size() != 8) {
		throw TdsException(TdsErrorKind::Decode, "Invalid transaction descriptor length: " +
		                                             std::to_string(new_bytes.size()));
	}
	uint64_t descriptor = 0;
	for (size_t i = 0; i < 8; i++) {
		descriptor |= static_cast<uint64_t>(new_bytes[i]) << (8 * i);
	}
	return descriptor;
}

size_t EnvChangeToken::GetPacketSize() const {
	if (new_value.empty() || new_value.find_first_not_of("0123456789") != std::string::npos) {
		throw TdsException(TdsErrorKind::Decode, "Invalid packet size in ENVCHANGE: '" + new_value + "'");
	}
	return static_cast<size_t>(std::strtoul(new_value.c_str(), nullptr, 10));
}

//===----------------------------------------------------------------------===//
// TokenParser
//===----------------------------------------------------------------------===//

DoneToken TokenParser::ParseDone(TdsBufferReader &reader) {
	DoneToken done;
	done.status = reader.ReadUInt16LE();
	done.cur_cmd = reader.ReadUInt16LE();
	done.row_count = reader.ReadUInt64LE();
	return done;
}

TdsError TokenParser::ParseServerMessage(TdsBufferReader &reader) {
	uint16_t length = reader.ReadUInt16LE();
	TdsBufferReader body = reader.SubReader(length);

	TdsError message;
	message.number = body.ReadUInt32LE();
	message.state = body.ReadUInt8();
	message.severity = body.ReadUInt8();
	message.message = body.ReadUSVarchar();
	message.server_name = body.ReadBVarchar();
	message.proc_name = body.ReadBVarchar();
	message.line_number = body.ReadUInt32LE();
	return message;
}

TdsError TokenParser::ParseError(TdsBufferReader &reader) {
	return ParseServerMessage(reader);
}

TdsInfo TokenParser::ParseInfo(TdsBufferReader &reader) {
	return ParseServerMessage(reader);
}

LoginAckToken TokenParser::ParseLoginAck(TdsBufferReader &reader) {
	uint16_t length = reader.ReadUInt16LE();
	TdsBufferReader body = reader.SubReader(length);

	LoginAckToken ack;
	ack.interface_type = body.ReadUInt8();
	ack.tds_version = body.ReadUInt32BE();
	ack.program_name = body.ReadBVarchar();
	ack.major = body.ReadUInt8();
	ack.minor = body.ReadUInt8();
	ack.build_hi = body.ReadUInt8();
	ack.build_lo = body.ReadUInt8();
	return ack;
}

EnvChangeToken TokenParser::ParseEnvChange(TdsBufferReader &reader) {
	uint16_t length = reader.ReadUInt16LE();
	TdsBufferReader body = reader.SubReader(length);

	EnvChangeToken env;
	env.type = body.ReadUInt8();

	switch (env.type) {
	// B_VARCHAR new / old value
	case static_cast<uint8_t>(EnvChangeType::DATABASE):
	case static_cast<uint8_t>(EnvChangeType::LANGUAGE):
	case static_cast<uint8_t>(EnvChangeType::CHARSET):
	case static_cast<uint8_t>(EnvChangeType::PACKET_SIZE):
	case static_cast<uint8_t>(EnvChangeType::UNICODE_SORTING_LOCALE):
	case static_cast<uint8_t>(EnvChangeType::UNICODE_COMPARISON_FLAGS):
	case static_cast<uint8_t>(EnvChangeType::MIRROR_PARTNER):
	case static_cast<uint8_t>(EnvChangeType::USER_INSTANCE_STARTED):
		env.new_value = body.ReadBVarchar();
		env.old_value = body.ReadBVarchar();
		break;

	// B_VARBYTE new / old value
	case static_cast<uint8_t>(EnvChangeType::SQL_COLLATION):
	case static_cast<uint8_t>(EnvChangeType::BEGIN_TRANSACTION):
	case static_cast<uint8_t>(EnvChangeType::COMMIT_TRANSACTION):
	case static_cast<uint8_t>(EnvChangeType::ROLLBACK_TRANSACTION):
	case static_cast<uint8_t>(EnvChangeType::ENLIST_DTC_TRANSACTION):
	case static_cast<uint8_t>(EnvChangeType::DEFECT_TRANSACTION):
	case static_cast<uint8_t>(EnvChangeType::TRANSACTION_MANAGER_ADDRESS):
	case static_cast<uint8_t>(EnvChangeType::TRANSACTION_ENDED):
		body.ReadBVarbyte(env.new_bytes);
		body.ReadBVarbyte(env.old_bytes);
		break;

	// Routing, promote and reset acknowledgements are bounded by the token length
	default:
		break;
	}

	return env;
}

int32_t TokenParser::ParseReturnStatus(TdsBufferReader &reader) {
	return reader.ReadInt32LE();
}

OrderToken TokenParser::ParseOrder(TdsBufferReader &reader) {
	uint16_t length = reader.ReadUInt16LE();
	if (length % 2 != 0) {
		throw TdsException(TdsErrorKind::Decode, "Invalid ORDER token length: " + std::to_string(length));
	}
	TdsBufferReader body = reader.SubReader(length);

	OrderToken order;
	order.columns.reserve(length / 2);
	while (!body.AtEnd()) {
		order.columns.push_back(body.ReadUInt16LE());
	}
	return order;
}

ReturnValueToken TokenParser::ParseReturnValue(TdsBufferReader &reader) {
	ReturnValueToken ret;
	ret.ordinal = reader.ReadUInt16LE();
	ret.name = reader.ReadBVarchar();
	ret.status = reader.ReadUInt8();
	ret.user_type = reader.ReadUInt32LE();

	ret.type_info.ordinal = ret.ordinal;
	ret.type_info.name = ret.name;
	ret.type_info.flags = reader.ReadUInt16LE();
	ColumnMetadataParser::ParseTypeInfo(reader, ret.type_info);

	RowReader::ReadValue(reader, ret.type_info, ret.value, ret.is_null);
	return ret;
}

}  // namespace tds
}  // namespace sqlwire
