#pragma once

// Test doubles for the wire layers: an in-memory byte stream standing in for
// the TCP socket, and a builder for server token streams.

#include "tds/encoding/utf16.hpp"
#include "tds/tds_byte_stream.hpp"
#include "tds/tds_packet.hpp"
#include "tds/tds_types.hpp"

#include <algorithm>
#include <cstring>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace sqlwire {
namespace tds {
namespace test {

// State shared between a MockByteStream and the test, so the test can keep
// inspecting traffic after the stream has been handed over (and destroyed).
struct MockStreamState {
	std::deque<uint8_t> input;
	std::vector<uint8_t> output;
	std::vector<size_t> send_sizes;  // Length of each Send() call
	size_t flush_count;
	size_t max_chunk;            // Largest Receive() answer, 0 = unlimited
	bool timeout_when_empty;     // Receive() on empty input: true = 0, false = -1
	bool fail_sends;
	bool destroyed;

	MockStreamState()
	    : flush_count(0), max_chunk(0), timeout_when_empty(false), fail_sends(false), destroyed(false) {}

	void Feed(const std::vector<uint8_t> &bytes) { input.insert(input.end(), bytes.begin(), bytes.end()); }
};

class MockByteStream : public TdsByteStream {
public:
	explicit MockByteStream(std::shared_ptr<MockStreamState> state) : state_(state) {}
	~MockByteStream() override { state_->destroyed = true; }

	bool Send(const uint8_t *data, size_t length) override {
		if (state_->fail_sends) {
			last_error_ = "send failed";
			return false;
		}
		state_->output.insert(state_->output.end(), data, data + length);
		state_->send_sizes.push_back(length);
		return true;
	}

	bool Flush() override {
		state_->flush_count++;
		return true;
	}

	ssize_t Receive(uint8_t *buffer, size_t max_length, int) override {
		if (state_->input.empty()) {
			if (state_->timeout_when_empty) {
				return 0;
			}
			last_error_ = "connection closed by peer";
			return -1;
		}
		size_t n = std::min(max_length, state_->input.size());
		if (state_->max_chunk > 0) {
			n = std::min(n, state_->max_chunk);
		}
		for (size_t i = 0; i < n; i++) {
			buffer[i] = state_->input.front();
			state_->input.pop_front();
		}
		return static_cast<ssize_t>(n);
	}

	const std::string &GetLastError() const override { return last_error_; }

private:
	std::shared_ptr<MockStreamState> state_;
	std::string last_error_;
};

// Builds server token streams byte by byte
class TokenBuilder {
public:
	TokenBuilder &Byte(uint8_t value) {
		bytes_.push_back(value);
		return *this;
	}
	TokenBuilder &UInt16(uint16_t value) {
		for (int shift = 0; shift < 16; shift += 8) {
			bytes_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
		}
		return *this;
	}
	TokenBuilder &UInt32(uint32_t value) {
		for (int shift = 0; shift < 32; shift += 8) {
			bytes_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
		}
		return *this;
	}
	TokenBuilder &UInt64(uint64_t value) {
		for (int shift = 0; shift < 64; shift += 8) {
			bytes_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
		}
		return *this;
	}
	TokenBuilder &Bytes(const std::vector<uint8_t> &data) {
		bytes_.insert(bytes_.end(), data.begin(), data.end());
		return *this;
	}
	// B_VARCHAR: 1-byte character count, UTF-16LE
	TokenBuilder &BVarchar(const std::string &str) {
		Byte(static_cast<uint8_t>(str.size()));
		return Bytes(encoding::Utf16LEEncode(str));
	}
	// US_VARCHAR: 2-byte character count, UTF-16LE
	TokenBuilder &USVarchar(const std::string &str) {
		UInt16(static_cast<uint16_t>(str.size()));
		return Bytes(encoding::Utf16LEEncode(str));
	}

	TokenBuilder &Done(TokenType token, uint16_t status, uint64_t row_count = 0) {
		Byte(static_cast<uint8_t>(token));
		UInt16(status);
		UInt16(0xC1);  // SELECT
		return UInt64(row_count);
	}
	TokenBuilder &Done(uint16_t status = 0, uint64_t row_count = 0) {
		return Done(TokenType::DONE, status, row_count);
	}

	// ERROR / INFO body: number, state, class, message, server, procedure, line
	TokenBuilder &ServerMessage(TokenType token, uint32_t number, uint8_t severity, const std::string &message) {
		TokenBuilder body;
		body.UInt32(number).Byte(1).Byte(severity).USVarchar(message).BVarchar("sqlserver").BVarchar("").UInt32(1);
		Byte(static_cast<uint8_t>(token));
		UInt16(static_cast<uint16_t>(body.Size()));
		return Bytes(body.Get());
	}
	TokenBuilder &Error(uint32_t number, uint8_t severity, const std::string &message) {
		return ServerMessage(TokenType::ERROR_TOKEN, number, severity, message);
	}
	TokenBuilder &Info(uint32_t number, const std::string &message) {
		return ServerMessage(TokenType::INFO, number, 0, message);
	}

	TokenBuilder &EnvChangeString(EnvChangeType type, const std::string &new_value, const std::string &old_value) {
		TokenBuilder body;
		body.Byte(static_cast<uint8_t>(type)).BVarchar(new_value).BVarchar(old_value);
		Byte(static_cast<uint8_t>(TokenType::ENVCHANGE));
		UInt16(static_cast<uint16_t>(body.Size()));
		return Bytes(body.Get());
	}
	TokenBuilder &EnvChangeBytes(EnvChangeType type, const std::vector<uint8_t> &new_value,
	                             const std::vector<uint8_t> &old_value) {
		TokenBuilder body;
		body.Byte(static_cast<uint8_t>(type));
		body.Byte(static_cast<uint8_t>(new_value.size())).Bytes(new_value);
		body.Byte(static_cast<uint8_t>(old_value.size())).Bytes(old_value);
		Byte(static_cast<uint8_t>(TokenType::ENVCHANGE));
		UInt16(static_cast<uint16_t>(body.Size()));
		return Bytes(body.Get());
	}
	TokenBuilder &BeginTransaction(uint64_t descriptor) {
		TokenBuilder value;
		value.UInt64(descriptor);
		return EnvChangeBytes(EnvChangeType::BEGIN_TRANSACTION, value.Get(), std::vector<uint8_t>());
	}

	TokenBuilder &LoginAck(const std::string &program, uint8_t major, uint8_t minor, uint16_t build) {
		TokenBuilder body;
		body.Byte(1);
		// TDS version is big-endian
		body.Byte(0x74).Byte(0x00).Byte(0x00).Byte(0x04);
		body.BVarchar(program);
		body.Byte(major).Byte(minor).Byte(static_cast<uint8_t>(build >> 8)).Byte(static_cast<uint8_t>(build & 0xFF));
		Byte(static_cast<uint8_t>(TokenType::LOGINACK));
		UInt16(static_cast<uint16_t>(body.Size()));
		return Bytes(body.Get());
	}

	// COLMETADATA with one INT NOT NULL column and one nullable NVARCHAR(50)
	TokenBuilder &IntAndNVarcharColumns(const std::string &int_name, const std::string &text_name) {
		Byte(static_cast<uint8_t>(TokenType::COLMETADATA));
		UInt16(2);
		// INT
		UInt32(0).UInt16(0).Byte(TDS_TYPE_INT).BVarchar(int_name);
		// NVARCHAR(50): max length in bytes, 5-byte collation
		UInt32(0).UInt16(COL_FLAG_NULLABLE).Byte(TDS_TYPE_NVARCHAR).UInt16(100);
		UInt32(0x00D00409).Byte(0x34);
		return BVarchar(text_name);
	}

	const std::vector<uint8_t> &Get() const { return bytes_; }
	size_t Size() const { return bytes_.size(); }

private:
	std::vector<uint8_t> bytes_;
};

// Wrap a token stream as the server would: TABULAR_RESULT packets
inline std::vector<uint8_t> ServerResponse(const std::vector<uint8_t> &tokens,
                                           size_t max_packet_size = TDS_DEFAULT_PACKET_SIZE) {
	return PacketCodec::WritePackets(tokens, max_packet_size, PacketType::TABULAR_RESULT);
}

inline std::vector<uint8_t> ServerResponse(const TokenBuilder &tokens,
                                           size_t max_packet_size = TDS_DEFAULT_PACKET_SIZE) {
	return ServerResponse(tokens.Get(), max_packet_size);
}

// Split a packet stream written by the client into (type, payload) messages
struct ClientMessage {
	PacketType type;
	std::vector<uint8_t> payload;
	size_t packet_count;
};

inline std::vector<ClientMessage> SplitClientMessages(const std::vector<uint8_t> &bytes) {
	std::vector<ClientMessage> messages;
	size_t offset = 0;
	bool open = false;
	while (offset + TDS_HEADER_SIZE <= bytes.size()) {
		PacketHeader header = PacketCodec::ReadHeader(bytes.data() + offset);
		if (!open) {
			ClientMessage message;
			message.type = header.type;
			message.packet_count = 0;
			messages.push_back(message);
			open = true;
		}
		ClientMessage &current = messages.back();
		current.payload.insert(current.payload.end(), bytes.begin() + offset + TDS_HEADER_SIZE,
		                       bytes.begin() + offset + header.length);
		current.packet_count++;
		offset += header.length;
		if (header.IsEndOfMessage()) {
			open = false;
		}
	}
	return messages;
}

}  // namespace test
}  // namespace tds
}  // namespace sqlwire
