#include "tds/tds_packet.hpp"
#include "tds/encoding/utf16.hpp"
#include "tds/tds_error.hpp"
#include <cstring>

namespace sqlwire {
namespace tds {

//===----------------------------------------------------------------------===//
// PacketHeader
//===----------------------------------------------------------------------===//

void PacketHeader::Encode(uint8_t *out) const {
	out[0] = static_cast<uint8_t>(type);
	out[1] = status;
	// Length (big-endian)
	out[2] = static_cast<uint8_t>((length >> 8) & 0xFF);
	out[3] = static_cast<uint8_t>(length & 0xFF);
	// SPID (big-endian)
	out[4] = static_cast<uint8_t>((spid >> 8) & 0xFF);
	out[5] = static_cast<uint8_t>(spid & 0xFF);
	out[6] = packet_id;
	// Window (reserved)
	out[7] = 0;
}

//===----------------------------------------------------------------------===//
// PacketCodec
//===----------------------------------------------------------------------===//

size_t PacketCodec::PacketCount(size_t payload_length, size_t max_packet_size) {
	size_t chunk = max_packet_size - TDS_HEADER_SIZE;
	if (payload_length == 0) {
		return 1;
	}
	return (payload_length + chunk - 1) / chunk;
}

void PacketCodec::WritePackets(std::vector<uint8_t> &out, const uint8_t *payload, size_t payload_length,
                               size_t max_packet_size, PacketType type) {
	if (max_packet_size <= TDS_HEADER_SIZE) {
		throw TdsException(TdsErrorKind::Framing,
		                   "Packet size " + std::to_string(max_packet_size) + " leaves no room for payload");
	}
	if (max_packet_size > TDS_MAX_PACKET_SIZE) {
		max_packet_size = TDS_MAX_PACKET_SIZE;
	}

	const size_t chunk = max_packet_size - TDS_HEADER_SIZE;
	const size_t count = PacketCount(payload_length, max_packet_size);
	const size_t base = out.size();

	// Payload first, then make room for one header per packet
	out.resize(base + payload_length + count * TDS_HEADER_SIZE);
	uint8_t *buf = out.data() + base;
	if (payload_length > 0) {
		std::memcpy(buf, payload, payload_length);
	}

	// Walk packets from last to first. Chunk i moves from i*chunk to
	// i*max_packet_size + 8, which is never below its source, so every earlier
	// chunk is still in place when its turn comes.
	for (size_t i = count; i-- > 0;) {
		size_t src = i * chunk;
		size_t len = payload_length - src < chunk ? payload_length - src : chunk;
		size_t dst = i * max_packet_size;
		if (len > 0) {
			std::memmove(buf + dst + TDS_HEADER_SIZE, buf + src, len);
		}

		PacketHeader header;
		header.type = type;
		header.status = static_cast<uint8_t>(i + 1 == count ? PacketStatus::END_OF_MESSAGE : PacketStatus::NORMAL);
		header.length = static_cast<uint16_t>(TDS_HEADER_SIZE + len);
		header.spid = 0;
		header.packet_id = 1;
		header.Encode(buf + dst);
	}
}

std::vector<uint8_t> PacketCodec::WritePackets(const std::vector<uint8_t> &payload, size_t max_packet_size,
                                               PacketType type) {
	std::vector<uint8_t> out;
	WritePackets(out, payload.data(), payload.size(), max_packet_size, type);
	return out;
}

PacketHeader PacketCodec::ReadHeader(const uint8_t *data) {
	if (!IsKnownPacketType(data[0])) {
		throw TdsException(TdsErrorKind::Framing, "Unknown TDS packet type " + std::to_string(data[0]));
	}

	PacketHeader header;
	header.type = static_cast<PacketType>(data[0]);
	header.status = data[1];
	header.length = (static_cast<uint16_t>(data[2]) << 8) | static_cast<uint16_t>(data[3]);
	header.spid = (static_cast<uint16_t>(data[4]) << 8) | static_cast<uint16_t>(data[5]);
	header.packet_id = data[6];

	if (header.length < TDS_HEADER_SIZE) {
		throw TdsException(TdsErrorKind::Framing,
		                   "Invalid TDS packet length " + std::to_string(header.length));
	}
	return header;
}

//===----------------------------------------------------------------------===//
// TdsPacket
//===----------------------------------------------------------------------===//

TdsPacket::TdsPacket(PacketType type) : type_(type) {
}

void TdsPacket::AppendPayload(const uint8_t *data, size_t length) {
	payload_.insert(payload_.end(), data, data + length);
}

void TdsPacket::AppendPayload(const std::vector<uint8_t> &data) {
	payload_.insert(payload_.end(), data.begin(), data.end());
}

void TdsPacket::AppendByte(uint8_t byte) {
	payload_.push_back(byte);
}

void TdsPacket::AppendUInt16BE(uint16_t value) {
	payload_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
	payload_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void TdsPacket::AppendUInt32BE(uint32_t value) {
	payload_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
	payload_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
	payload_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
	payload_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void TdsPacket::AppendUInt16LE(uint16_t value) {
	payload_.push_back(static_cast<uint8_t>(value & 0xFF));
	payload_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void TdsPacket::AppendUInt32LE(uint32_t value) {
	for (int shift = 0; shift < 32; shift += 8) {
		payload_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
	}
}

void TdsPacket::AppendUInt64LE(uint64_t value) {
	for (int shift = 0; shift < 64; shift += 8) {
		payload_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
	}
}

void TdsPacket::AppendUTF16LE(const std::string &str) {
	encoding::Utf16LEAppend(str, payload_);
}

void TdsPacket::ClearPayload() {
	payload_.clear();
}

void TdsPacket::PatchUInt32LE(size_t offset, uint32_t value) {
	for (size_t i = 0; i < 4; i++) {
		payload_[offset + i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
	}
}

std::vector<uint8_t> TdsPacket::Serialize(size_t max_packet_size) const {
	return PacketCodec::WritePackets(payload_, max_packet_size, type_);
}

}  // namespace tds
}  // namespace sqlwire
