#include "catch.hpp"
#include "tds/tds_error.hpp"
#include "tds/tds_packet.hpp"

#include <string>
#include <vector>

using namespace sqlwire::tds;

static std::vector<uint8_t> Bytes(const std::string &str) {
	return std::vector<uint8_t>(str.begin(), str.end());
}

TEST_CASE("PacketCodec - Header encoding", "[sqlwire][packet][packet_codec]") {
	SECTION("Single packet carries EOM and big-endian length") {
		std::vector<uint8_t> out = PacketCodec::WritePackets(Bytes("abc"), 4096, PacketType::SQL_BATCH);
		REQUIRE(out.size() == 11);
		REQUIRE(out[0] == 0x01);
		REQUIRE(out[1] == 0x01);
		REQUIRE(out[2] == 0x00);
		REQUIRE(out[3] == 0x0B);
		REQUIRE(out[4] == 0x00);
		REQUIRE(out[5] == 0x00);
		REQUIRE(out[6] == 0x01);
		REQUIRE(out[7] == 0x00);
		REQUIRE(std::string(out.begin() + 8, out.end()) == "abc");
	}

	SECTION("Empty payload yields one header-only packet") {
		std::vector<uint8_t> out = PacketCodec::WritePackets(std::vector<uint8_t>(), 4096, PacketType::ATTENTION);
		REQUIRE(out.size() == 8);
		REQUIRE(out[0] == 0x06);
		REQUIRE(out[1] == 0x01);
		REQUIRE(out[3] == 0x08);
	}
}

TEST_CASE("PacketCodec - Fragmentation", "[sqlwire][packet][packet_codec]") {
	SECTION("Nine bytes with max size 12 split into 4 + 4 + 1") {
		std::vector<uint8_t> out = PacketCodec::WritePackets(Bytes("123456789"), 12, PacketType::SQL_BATCH);
		REQUIRE(out.size() == 12 + 12 + 9);

		PacketHeader first = PacketCodec::ReadHeader(out.data());
		REQUIRE(first.length == 12);
		REQUIRE_FALSE(first.IsEndOfMessage());
		REQUIRE(std::string(out.begin() + 8, out.begin() + 12) == "1234");

		PacketHeader second = PacketCodec::ReadHeader(out.data() + 12);
		REQUIRE(second.length == 12);
		REQUIRE_FALSE(second.IsEndOfMessage());
		REQUIRE(std::string(out.begin() + 20, out.begin() + 24) == "5678");

		PacketHeader third = PacketCodec::ReadHeader(out.data() + 24);
		REQUIRE(third.length == 9);
		REQUIRE(third.IsEndOfMessage());
		REQUIRE(out[32] == '9');
	}

	SECTION("Exact multiple of the chunk size does not add an empty packet") {
		std::vector<uint8_t> out = PacketCodec::WritePackets(Bytes("12345678"), 12, PacketType::SQL_BATCH);
		REQUIRE(out.size() == 24);
		REQUIRE(PacketCodec::PacketCount(8, 12) == 2);
		REQUIRE(PacketCodec::ReadHeader(out.data() + 12).IsEndOfMessage());
	}

	SECTION("Packet ids are all 1 and only the last packet has EOM") {
		std::vector<uint8_t> payload(10000, 0x5A);
		std::vector<uint8_t> out = PacketCodec::WritePackets(payload, 4096, PacketType::SQL_BATCH);
		REQUIRE(PacketCodec::PacketCount(payload.size(), 4096) == 3);

		size_t offset = 0;
		size_t packets = 0;
		size_t total = 0;
		while (offset < out.size()) {
			PacketHeader header = PacketCodec::ReadHeader(out.data() + offset);
			packets++;
			REQUIRE(header.packet_id == 1);
			REQUIRE(header.IsEndOfMessage() == (packets == 3));
			total += header.PayloadLength();
			offset += header.length;
		}
		REQUIRE(packets == 3);
		REQUIRE(total == payload.size());
	}

	SECTION("Appending keeps earlier buffer contents") {
		std::vector<uint8_t> out = Bytes("xy");
		std::vector<uint8_t> payload = Bytes("123456789");
		PacketCodec::WritePackets(out, payload.data(), payload.size(), 12, PacketType::SQL_BATCH);
		REQUIRE(out.size() == 2 + 33);
		REQUIRE(out[0] == 'x');
		REQUIRE(out[1] == 'y');
		REQUIRE(std::string(out.begin() + 10, out.begin() + 14) == "1234");
	}

	SECTION("Max packet size not above the header size is a framing error") {
		try {
			PacketCodec::WritePackets(Bytes("abc"), 8, PacketType::SQL_BATCH);
			FAIL("expected TdsException");
		} catch (const TdsException &ex) {
			REQUIRE(ex.GetKind() == TdsErrorKind::Framing);
		}
	}
}

TEST_CASE("PacketCodec - Header decoding", "[sqlwire][packet][packet_codec]") {
	SECTION("Valid header") {
		uint8_t data[] = {0x04, 0x01, 0x01, 0x00, 0x00, 0x35, 0x01, 0x00};
		PacketHeader header = PacketCodec::ReadHeader(data);
		REQUIRE(header.type == PacketType::TABULAR_RESULT);
		REQUIRE(header.IsEndOfMessage());
		REQUIRE(header.length == 256);
		REQUIRE(header.spid == 0x35);
		REQUIRE(header.PayloadLength() == 248);
	}

	SECTION("Encoded header decodes to the same fields") {
		PacketHeader header;
		header.type = PacketType::LOGIN7;
		header.status = static_cast<uint8_t>(PacketStatus::NORMAL);
		header.length = 4096;
		header.spid = 0x1234;
		header.packet_id = 7;

		uint8_t data[TDS_HEADER_SIZE];
		header.Encode(data);
		REQUIRE(data[7] == 0);

		PacketHeader decoded = PacketCodec::ReadHeader(data);
		REQUIRE(decoded.type == header.type);
		REQUIRE(decoded.status == header.status);
		REQUIRE(decoded.length == header.length);
		REQUIRE(decoded.spid == header.spid);
		REQUIRE(decoded.packet_id == header.packet_id);
	}

	SECTION("Unknown packet type") {
		uint8_t data[] = {0x63, 0x01, 0x00, 0x08, 0x00, 0x00, 0x01, 0x00};
		try {
			PacketCodec::ReadHeader(data);
			FAIL("expected TdsException");
		} catch (const TdsException &ex) {
			REQUIRE(ex.GetKind() == TdsErrorKind::Framing);
		}
	}

	SECTION("Length below header size") {
		uint8_t data[] = {0x04, 0x01, 0x00, 0x07, 0x00, 0x00, 0x01, 0x00};
		REQUIRE_THROWS_AS(PacketCodec::ReadHeader(data), TdsException);
	}
}

TEST_CASE("TdsPacket - Payload builders", "[sqlwire][packet][packet_codec]") {
	TdsPacket packet(PacketType::SQL_BATCH);
	packet.AppendUInt16BE(0x0102);
	packet.AppendUInt32LE(0x0A0B0C0D);
	packet.AppendUTF16LE("A");
	packet.PatchUInt32LE(2, 0x11223344);

	const std::vector<uint8_t> &payload = packet.GetPayload();
	REQUIRE(payload.size() == 8);
	REQUIRE(payload[0] == 0x01);
	REQUIRE(payload[1] == 0x02);
	REQUIRE(payload[2] == 0x44);
	REQUIRE(payload[5] == 0x11);
	REQUIRE(payload[6] == 'A');
	REQUIRE(payload[7] == 0x00);

	std::vector<uint8_t> wire = packet.Serialize();
	REQUIRE(wire.size() == 16);
	REQUIRE(wire[0] == static_cast<uint8_t>(PacketType::SQL_BATCH));
}
