#pragma once

#include "tds_byte_stream.hpp"
#include "tds_column_metadata.hpp"
#include "tds_message.hpp"
#include "tds_packet.hpp"
#include "tds_prelogin_stream.hpp"
#include "tds_types.hpp"
#include "tls/tds_tls_context.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace sqlwire {
namespace tds {

// Initial stream settings; the packet size is renegotiated by ENVCHANGE
struct MessageStreamConfig {
	size_t max_packet_size;
	int read_timeout_ms;

	MessageStreamConfig() : max_packet_size(TDS_DEFAULT_PACKET_SIZE), read_timeout_ms(DEFAULT_READ_TIMEOUT * 1000) {}
};

//===----------------------------------------------------------------------===//
// MessageStream - Packet sequences in, token messages out
//
// Owns the transport stack (socket -> PRELOGIN envelope adapter -> optional
// TLS session) and the session state carried by tokens: transaction
// descriptor, negotiated packet size and the current column metadata.
//
// All failures throw TdsException; an ERROR token throws TdsDatabaseException
// after the token has been consumed, so the stream stays usable.
//===----------------------------------------------------------------------===//

class MessageStream {
public:
	explicit MessageStream(std::unique_ptr<TdsByteStream> transport,
	                       const MessageStreamConfig &config = MessageStreamConfig());
	~MessageStream();

	// Non-copyable
	MessageStream(const MessageStream &) = delete;
	MessageStream &operator=(const MessageStream &) = delete;

	// Append message packets, fragmented at the current max packet size, to the write buffer
	void WriteMessage(const TdsPacket &message);
	void WriteMessage(PacketType type, const std::vector<uint8_t> &payload);

	// Send buffered packets one at a time through the active stream, then flush it
	void Flush();
	bool HasPendingWrites() const { return !write_buffer_.empty(); }

	// Read one complete packet sequence (all TABULAR_RESULT) and return the joined payload.
	// Throws TdsException(Framing) on any other packet type, TdsException(Io) on read failure.
	std::vector<uint8_t> ReceivePacketSequence();

	// Decode the next surfaced message, reading packet sequences as needed
	TdsMessage ReceiveNextMessage();

	// True when undecoded token bytes remain from the last packet sequence
	bool HasBufferedTokens() const { return read_pos_ < read_buffer_.size(); }

	// Run the TLS handshake inside PRELOGIN packets and switch all later
	// traffic to the TLS session. Throws TdsException(Tls) on failure.
	void SetupEncryption(const TlsOptions &options, int timeout_ms);
	// Drop the TLS session without close_notify and return to the plain
	// transport (login-only encryption). Throws TdsException(Tls) when TLS is off.
	void DisableEncryption();
	bool IsEncrypted() const { return tls_ != nullptr; }

	// Session state
	uint64_t GetTransactionDescriptor() const { return transaction_descriptor_; }
	size_t GetMaxPacketSize() const { return max_packet_size_; }
	void SetMaxPacketSize(size_t size) { max_packet_size_ = ClampPacketSize(size); }
	ColumnListPtr GetColumns() const { return columns_; }
	int GetReadTimeout() const { return read_timeout_ms_; }

	// Tear down TLS session and transport
	void Close();
	bool IsOpen() const { return active_ != nullptr; }

private:
	// Read exactly length bytes from the active stream; 0 = timeout, -1 = error
	void ReadExact(uint8_t *buffer, size_t length);

	// Apply an ENVCHANGE to the session state
	void ApplyEnvChange(const EnvChangeToken &env);

	TdsByteStream &Active();

	std::unique_ptr<PreloginTlsStream> prelogin_;
	// Declared after prelogin_ so it is destroyed first (it writes close_notify through it)
	std::unique_ptr<TlsTdsContext> tls_;
	TdsByteStream *active_;

	std::vector<uint8_t> write_buffer_;
	std::vector<uint8_t> read_buffer_;  // Payload of the current packet sequence
	size_t read_pos_;

	ColumnListPtr columns_;  // null until the first COLMETADATA
	uint64_t transaction_descriptor_;
	size_t max_packet_size_;
	int read_timeout_ms_;
};

}  // namespace tds
}  // namespace sqlwire
