#pragma once

#include "tds_row_reader.hpp"
#include "tds_token_parser.hpp"
#include <cstdint>

namespace sqlwire {
namespace tds {

// Messages surfaced to callers. ENVCHANGE, INFO and COLMETADATA are consumed
// by the message stream; ERROR is raised as TdsDatabaseException.
enum class MessageType : uint8_t {
	LoginAck,
	Row,
	ReturnStatus,
	ReturnValue,
	Done,
	DoneInProc,
	DoneProc,
	Order
};

const char *MessageTypeToString(MessageType type);

// One decoded message; only the member matching type is meaningful
struct TdsMessage {
	MessageType type;

	LoginAckToken login_ack;
	RowData row;
	int32_t return_status;
	ReturnValueToken return_value;
	DoneToken done;
	OrderToken order;

	TdsMessage() : type(MessageType::Done), return_status(0) {}

	bool IsDone() const {
		return type == MessageType::Done || type == MessageType::DoneInProc || type == MessageType::DoneProc;
	}
};

}  // namespace tds
}  // namespace sqlwire
