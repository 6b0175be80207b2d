#include "tds/tds_message_stream.hpp"
#include "tds/tds_buffer_reader.hpp"
#include "tds/tds_error.hpp"
#include "tds/tds_row_reader.hpp"
#include "tds/tds_token_parser.hpp"

#include <cstdio>
#include <cstdlib>

// Debug logging
static int GetSqlwireDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLWIRE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLWIRE_STREAM_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                  \
		if (GetSqlwireDebugLevel() >= lvl)                                \
			fprintf(stderr, "[SQLWIRE STREAM] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlwire {
namespace tds {

const char *MessageTypeToString(MessageType type) {
	switch (type) {
	case MessageType::LoginAck:
		return "LoginAck";
	case MessageType::Row:
		return "Row";
	case MessageType::ReturnStatus:
		return "ReturnStatus";
	case MessageType::ReturnValue:
		return "ReturnValue";
	case MessageType::Done:
		return "Done";
	case MessageType::DoneInProc:
		return "DoneInProc";
	case MessageType::DoneProc:
		return "DoneProc";
	case MessageType::Order:
		return "Order";
	default:
		return "Unknown";
	}
}

MessageStream::MessageStream(std::unique_ptr<TdsByteStream> transport, const MessageStreamConfig &config)
    : prelogin_(new PreloginTlsStream(std::move(transport))),
      active_(nullptr),
      read_pos_(0),
      transaction_descriptor_(0),
      max_packet_size_(ClampPacketSize(config.max_packet_size)),
      read_timeout_ms_(config.read_timeout_ms) {
	active_ = prelogin_.get();
}

MessageStream::~MessageStream() {
	Close();
}

TdsByteStream &MessageStream::Active() {
	if (!active_) {
		throw TdsException(TdsErrorKind::Io, "Message stream is closed");
	}
	return *active_;
}

void MessageStream::Close() {
	if (tls_) {
		tls_->Close();
		tls_.reset();
	}
	prelogin_.reset();
	active_ = nullptr;
	write_buffer_.clear();
	read_buffer_.clear();
	read_pos_ = 0;
}

//===----------------------------------------------------------------------===//
// Write side
//===----------------------------------------------------------------------===//

void MessageStream::WriteMessage(const TdsPacket &message) {
	const std::vector<uint8_t> &payload = message.GetPayload();
	PacketCodec::WritePackets(write_buffer_, payload.data(), payload.size(), max_packet_size_, message.GetType());
}

void MessageStream::WriteMessage(PacketType type, const std::vector<uint8_t> &payload) {
	PacketCodec::WritePackets(write_buffer_, payload.data(), payload.size(), max_packet_size_, type);
}

void MessageStream::Flush() {
	TdsByteStream &stream = Active();

	size_t offset = 0;
	size_t packet_count = 0;
	while (offset < write_buffer_.size()) {
		// Buffer holds whole packets produced by PacketCodec
		size_t packet_length =
		    (static_cast<size_t>(write_buffer_[offset + 2]) << 8) | static_cast<size_t>(write_buffer_[offset + 3]);
		if (!stream.Send(write_buffer_.data() + offset, packet_length)) {
			throw TdsException(TdsErrorKind::Io, "Failed to send packet: " + stream.GetLastError());
		}
		offset += packet_length;
		packet_count++;
	}
	SQLWIRE_STREAM_DEBUG_LOG(2, "Flush: sent %zu packets, %zu bytes", packet_count, write_buffer_.size());
	write_buffer_.clear();

	if (!stream.Flush()) {
		throw TdsException(TdsErrorKind::Io, "Failed to flush transport: " + stream.GetLastError());
	}
}

//===----------------------------------------------------------------------===//
// Read side
//===----------------------------------------------------------------------===//

void MessageStream::ReadExact(uint8_t *buffer, size_t length) {
	TdsByteStream &stream = Active();
	size_t total = 0;
	while (total < length) {
		ssize_t received = stream.Receive(buffer + total, length - total, read_timeout_ms_);
		if (received == 0) {
			throw TdsException(TdsErrorKind::Io, "Read timed out after " + std::to_string(read_timeout_ms_) + " ms");
		}
		if (received < 0) {
			throw TdsException(TdsErrorKind::Io, "Read failed: " + stream.GetLastError());
		}
		total += static_cast<size_t>(received);
	}
}

std::vector<uint8_t> MessageStream::ReceivePacketSequence() {
	std::vector<uint8_t> payload;
	size_t packet_count = 0;

	while (true) {
		uint8_t header_bytes[TDS_HEADER_SIZE];
		ReadExact(header_bytes, TDS_HEADER_SIZE);
		PacketHeader header = PacketCodec::ReadHeader(header_bytes);

		if (header.type != PacketType::TABULAR_RESULT) {
			throw TdsException(TdsErrorKind::Framing, std::string("Unexpected packet type from server: ") +
			                                              PacketTypeToString(header.type));
		}

		size_t body_length = header.PayloadLength();
		size_t offset = payload.size();
		payload.resize(offset + body_length);
		if (body_length > 0) {
			ReadExact(payload.data() + offset, body_length);
		}
		packet_count++;

		if (header.IsEndOfMessage()) {
			break;
		}
	}

	SQLWIRE_STREAM_DEBUG_LOG(2, "ReceivePacketSequence: %zu packets, %zu payload bytes", packet_count, payload.size());
	return payload;
}

void MessageStream::ApplyEnvChange(const EnvChangeToken &env) {
	switch (env.GetType()) {
	case EnvChangeType::PACKET_SIZE:
		max_packet_size_ = ClampPacketSize(env.GetPacketSize());
		SQLWIRE_STREAM_DEBUG_LOG(1, "ENVCHANGE: packet size %s -> %zu", env.new_value.c_str(), max_packet_size_);
		break;
	case EnvChangeType::BEGIN_TRANSACTION:
		transaction_descriptor_ = env.GetTransactionDescriptor();
		SQLWIRE_STREAM_DEBUG_LOG(1, "ENVCHANGE: begin transaction, descriptor=0x%016llx",
		                         static_cast<unsigned long long>(transaction_descriptor_));
		break;
	case EnvChangeType::COMMIT_TRANSACTION:
	case EnvChangeType::ROLLBACK_TRANSACTION:
		transaction_descriptor_ = 0;
		SQLWIRE_STREAM_DEBUG_LOG(1, "ENVCHANGE: transaction ended (type %d)", static_cast<int>(env.type));
		break;
	case EnvChangeType::DATABASE:
		SQLWIRE_STREAM_DEBUG_LOG(1, "ENVCHANGE: database '%s' -> '%s'", env.old_value.c_str(), env.new_value.c_str());
		break;
	default:
		SQLWIRE_STREAM_DEBUG_LOG(2, "ENVCHANGE: ignoring type %d", static_cast<int>(env.type));
		break;
	}
}

TdsMessage MessageStream::ReceiveNextMessage() {
	while (true) {
		if (read_pos_ >= read_buffer_.size()) {
			read_buffer_ = ReceivePacketSequence();
			read_pos_ = 0;
			continue;
		}

		TdsBufferReader reader(read_buffer_.data() + read_pos_, read_buffer_.size() - read_pos_);
		uint8_t token = reader.ReadUInt8();
		TdsMessage message;
		bool surfaced = true;

		switch (static_cast<TokenType>(token)) {
		case TokenType::ENVCHANGE:
			ApplyEnvChange(TokenParser::ParseEnvChange(reader));
			surfaced = false;
			break;

		case TokenType::INFO: {
			TdsInfo info = TokenParser::ParseInfo(reader);
			SQLWIRE_STREAM_DEBUG_LOG(1, "INFO %u (class %u): %s", info.number, static_cast<unsigned>(info.severity),
			                         info.message.c_str());
			surfaced = false;
			break;
		}

		case TokenType::COLMETADATA: {
			std::shared_ptr<ColumnList> columns = std::make_shared<ColumnList>();
			ColumnMetadataParser::Parse(reader, *columns);
			SQLWIRE_STREAM_DEBUG_LOG(2, "COLMETADATA: %zu columns", columns->size());
			columns_ = columns;
			surfaced = false;
			break;
		}

		case TokenType::ROW:
		case TokenType::NBCROW: {
			if (!columns_ || columns_->empty()) {
				throw TdsException(TdsErrorKind::Decode, "ROW token received without column metadata");
			}
			message.type = MessageType::Row;
			message.row.columns = columns_;
			RowReader row_reader(*columns_);
			if (static_cast<TokenType>(token) == TokenType::ROW) {
				row_reader.ReadRow(reader, message.row);
			} else {
				row_reader.ReadNBCRow(reader, message.row);
			}
			break;
		}

		case TokenType::LOGINACK:
			message.type = MessageType::LoginAck;
			message.login_ack = TokenParser::ParseLoginAck(reader);
			break;

		case TokenType::RETURNSTATUS:
			message.type = MessageType::ReturnStatus;
			message.return_status = TokenParser::ParseReturnStatus(reader);
			break;

		case TokenType::RETURNVALUE:
			message.type = MessageType::ReturnValue;
			message.return_value = TokenParser::ParseReturnValue(reader);
			break;

		case TokenType::ORDER:
			message.type = MessageType::Order;
			message.order = TokenParser::ParseOrder(reader);
			break;

		case TokenType::DONE:
			message.type = MessageType::Done;
			message.done = TokenParser::ParseDone(reader);
			break;

		case TokenType::DONEINPROC:
			message.type = MessageType::DoneInProc;
			message.done = TokenParser::ParseDone(reader);
			break;

		case TokenType::DONEPROC:
			message.type = MessageType::DoneProc;
			message.done = TokenParser::ParseDone(reader);
			break;

		case TokenType::ERROR_TOKEN: {
			TdsError error = TokenParser::ParseError(reader);
			read_pos_ += reader.Position();
			SQLWIRE_STREAM_DEBUG_LOG(1, "ERROR %u (class %u): %s", error.number, static_cast<unsigned>(error.severity),
			                         error.message.c_str());
			throw TdsDatabaseException(error);
		}

		default:
			throw TdsException(TdsErrorKind::Decode, "Unknown token type: " + std::to_string(token));
		}

		read_pos_ += reader.Position();
		if (surfaced) {
			return message;
		}
	}
}

//===----------------------------------------------------------------------===//
// TLS
//===----------------------------------------------------------------------===//

void MessageStream::SetupEncryption(const TlsOptions &options, int timeout_ms) {
	if (!prelogin_) {
		throw TdsException(TdsErrorKind::Io, "Message stream is closed");
	}
	if (tls_) {
		throw TdsException(TdsErrorKind::Tls, "TLS is already enabled");
	}

	std::unique_ptr<TlsTdsContext> tls(new TlsTdsContext());
	prelogin_->StartHandshake();

	if (!tls->Initialize(options) || !tls->Attach(prelogin_.get()) || !tls->Handshake(timeout_ms)) {
		std::string error = tls->GetLastError();
		throw TdsException(TdsErrorKind::Tls, "TLS handshake failed: " + error);
	}

	prelogin_->HandshakeComplete();
	SQLWIRE_STREAM_DEBUG_LOG(1, "SetupEncryption: %s, cipher %s", tls->GetTlsVersion().c_str(),
	                         tls->GetCipherSuite().c_str());

	tls_ = std::move(tls);
	active_ = tls_.get();
}

void MessageStream::DisableEncryption() {
	if (!tls_) {
		throw TdsException(TdsErrorKind::Tls, "TLS is not enabled");
	}
	if (!write_buffer_.empty()) {
		throw TdsException(TdsErrorKind::Tls, "Cannot disable TLS with unsent packets");
	}

	tls_->Abandon();
	tls_.reset();
	active_ = prelogin_.get();
	SQLWIRE_STREAM_DEBUG_LOG(1, "DisableEncryption: continuing in plaintext");
}

}  // namespace tds
}  // namespace sqlwire
