#pragma once

#include "tds_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sqlwire {
namespace tds {

// TDS packet header
// Header format (all multi-byte values big-endian):
//   Offset 0: Type (1 byte)
//   Offset 1: Status (1 byte, bit 0 = end of message)
//   Offset 2-3: Length (2 bytes, includes header)
//   Offset 4-5: SPID (2 bytes)
//   Offset 6: Packet ID (1 byte)
//   Offset 7: Window (1 byte, reserved, always 0)
struct PacketHeader {
	PacketType type;
	uint8_t status;
	uint16_t length;
	uint16_t spid;
	uint8_t packet_id;

	PacketHeader()
	    : type(PacketType::TABULAR_RESULT), status(static_cast<uint8_t>(PacketStatus::END_OF_MESSAGE)),
	      length(static_cast<uint16_t>(TDS_HEADER_SIZE)), spid(0), packet_id(1) {}

	bool IsEndOfMessage() const {
		return (status & static_cast<uint8_t>(PacketStatus::END_OF_MESSAGE)) != 0;
	}

	size_t PayloadLength() const { return length - TDS_HEADER_SIZE; }

	// Write the 8 header bytes to out
	void Encode(uint8_t *out) const;
};

// Packet framing: fragmentation of a message payload into packets and header decoding
class PacketCodec {
public:
	// Split payload into packets of at most max_packet_size bytes (header included).
	// Only the last packet carries END_OF_MESSAGE. An empty payload yields one
	// header-only packet. Throws TdsException(Framing) if max_packet_size <= 8.
	static std::vector<uint8_t> WritePackets(const std::vector<uint8_t> &payload, size_t max_packet_size,
	                                         PacketType type);

	// Same as above, appending the packets to out
	static void WritePackets(std::vector<uint8_t> &out, const uint8_t *payload, size_t payload_length,
	                         size_t max_packet_size, PacketType type);

	// Number of packets WritePackets produces for a payload
	static size_t PacketCount(size_t payload_length, size_t max_packet_size);

	// Decode an 8-byte header.
	// Throws TdsException(Framing) on an unknown packet type or a length below 8.
	static PacketHeader ReadHeader(const uint8_t *data);
};

// Message payload builder; serialized into packets through PacketCodec
class TdsPacket {
public:
	explicit TdsPacket(PacketType type);

	PacketType GetType() const { return type_; }
	const std::vector<uint8_t> &GetPayload() const { return payload_; }
	std::vector<uint8_t> &GetPayload() { return payload_; }
	size_t GetPayloadSize() const { return payload_.size(); }

	// Payload manipulation
	void AppendPayload(const uint8_t *data, size_t length);
	void AppendPayload(const std::vector<uint8_t> &data);
	void AppendByte(uint8_t byte);
	void AppendUInt16BE(uint16_t value);
	void AppendUInt32BE(uint32_t value);
	void AppendUInt16LE(uint16_t value);
	void AppendUInt32LE(uint32_t value);
	void AppendUInt64LE(uint64_t value);
	void AppendUTF16LE(const std::string &str);  // UTF-8 input, UTF-16LE on the wire
	void ClearPayload();

	// Overwrite 4 bytes at offset (little-endian), used to patch length fields
	void PatchUInt32LE(size_t offset, uint32_t value);

	// Serialize payload into one or more packets
	std::vector<uint8_t> Serialize(size_t max_packet_size = TDS_DEFAULT_PACKET_SIZE) const;

private:
	PacketType type_;
	std::vector<uint8_t> payload_;
};

}  // namespace tds
}  // namespace sqlwire
