#include "catch.hpp"
#include "tds/tds_error.hpp"
#include "tds/tds_protocol.hpp"

#include <vector>

using namespace sqlwire::tds;

TEST_CASE("Prelogin - Encode option block", "[sqlwire][prelogin]") {
	SECTION("All common options") {
		PreloginMessage message;
		message.has_version = true;
		message.version = PreloginVersion(9, 0, 0, 0);
		message.has_encryption = true;
		message.encryption = EncryptionOption::ENCRYPT_ON;
		message.has_instance = true;
		message.instance = "";
		message.has_thread_id = true;
		message.thread_id = 0xDB8;
		message.has_mars = true;
		message.mars = true;

		const uint8_t expected[] = {0x00, 0x00, 0x1A, 0x00, 0x06, 0x01, 0x00, 0x20, 0x00, 0x01, 0x02, 0x00, 0x21,
		                            0x00, 0x01, 0x03, 0x00, 0x22, 0x00, 0x04, 0x04, 0x00, 0x26, 0x00, 0x01, 0xFF,
		                            0x09, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0xB8, 0x0D, 0x00, 0x00, 0x01};
		std::vector<uint8_t> encoded = TdsProtocol::EncodePrelogin(message);
		REQUIRE(encoded == std::vector<uint8_t>(expected, expected + sizeof(expected)));
	}

	SECTION("Instance name is null-terminated") {
		PreloginMessage message;
		message.has_instance = true;
		message.instance = "SQLEXPRESS";
		std::vector<uint8_t> encoded = TdsProtocol::EncodePrelogin(message);
		// header (5) + terminator (1) + "SQLEXPRESS\0"
		REQUIRE(encoded.size() == 6 + 11);
		REQUIRE(encoded[4] == 11);
		REQUIRE(encoded.back() == 0x00);
	}

	SECTION("Build and sub-build are big-endian") {
		PreloginMessage message;
		message.has_version = true;
		message.version = PreloginVersion(14, 0, 3281, 0x0102);
		std::vector<uint8_t> encoded = TdsProtocol::EncodePrelogin(message);
		REQUIRE(encoded.size() == 6 + 6);
		const uint8_t expected[] = {0x0E, 0x00, 0x0C, 0xD1, 0x01, 0x02};
		REQUIRE(std::vector<uint8_t>(encoded.begin() + 6, encoded.end()) ==
		        std::vector<uint8_t>(expected, expected + sizeof(expected)));
	}

	SECTION("BuildPrelogin produces a PRELOGIN packet") {
		PreloginMessage message;
		message.has_encryption = true;
		TdsPacket packet = TdsProtocol::BuildPrelogin(message);
		REQUIRE(packet.GetType() == PacketType::PRELOGIN);
		REQUIRE(packet.GetPayload() == TdsProtocol::EncodePrelogin(message));
	}
}

TEST_CASE("Prelogin - Decode server response", "[sqlwire][prelogin]") {
	SECTION("Version and encryption") {
		const uint8_t data[] = {0x00, 0x00, 0x0B, 0x00, 0x06, 0x01, 0x00, 0x11, 0x00,
		                        0x01, 0xFF, 0x0E, 0x00, 0x0C, 0xD1, 0x00, 0x00, 0x00};
		PreloginMessage message = TdsProtocol::DecodePrelogin(data, sizeof(data));
		REQUIRE(message.has_version);
		REQUIRE(message.version.major == 14);
		REQUIRE(message.version.minor == 0);
		REQUIRE(message.version.build == 3281);
		REQUIRE(message.version.sub_build == 0);
		REQUIRE(message.has_encryption);
		REQUIRE(message.encryption == EncryptionOption::ENCRYPT_OFF);
		REQUIRE_FALSE(message.has_instance);
	}

	SECTION("Non-zero sub-build") {
		const uint8_t data[] = {0x00, 0x00, 0x0B, 0x00, 0x06, 0x01, 0x00, 0x11, 0x00,
		                        0x01, 0xFF, 0x0E, 0x00, 0x0C, 0xD1, 0x00, 0x05, 0x02};
		PreloginMessage message = TdsProtocol::DecodePrelogin(data, sizeof(data));
		REQUIRE(message.version.build == 3281);
		REQUIRE(message.version.sub_build == 5);
		REQUIRE(message.encryption == EncryptionOption::ENCRYPT_NOT_SUP);
	}

	SECTION("Encoded client block decodes to the same options") {
		PreloginMessage message;
		message.has_version = true;
		message.version = PreloginVersion(16, 0, 1000, 6);
		message.has_encryption = true;
		message.encryption = EncryptionOption::ENCRYPT_REQ;
		message.has_instance = true;
		message.instance = "MSSQLSERVER";
		message.has_mars = true;
		message.mars = false;

		PreloginMessage decoded = TdsProtocol::DecodePrelogin(TdsProtocol::EncodePrelogin(message));
		REQUIRE(decoded.version.major == 16);
		REQUIRE(decoded.version.build == 1000);
		REQUIRE(decoded.version.sub_build == 6);
		REQUIRE(decoded.encryption == EncryptionOption::ENCRYPT_REQ);
		REQUIRE(decoded.instance == "MSSQLSERVER");
		REQUIRE(decoded.has_mars);
		REQUIRE_FALSE(decoded.mars);
	}

	SECTION("Missing terminator") {
		const uint8_t data[] = {0x00, 0x00, 0x05, 0x00, 0x06};
		REQUIRE_THROWS_AS(TdsProtocol::DecodePrelogin(data, sizeof(data)), TdsException);
	}

	SECTION("Option data out of bounds") {
		const uint8_t data[] = {0x00, 0x00, 0x0B, 0x00, 0x06, 0x01, 0x00, 0x11, 0x00, 0x01, 0xFF, 0x0E};
		try {
			TdsProtocol::DecodePrelogin(data, sizeof(data));
			FAIL("expected TdsException");
		} catch (const TdsException &ex) {
			REQUIRE(ex.GetKind() == TdsErrorKind::Decode);
		}
	}

	SECTION("Unknown option token") {
		const uint8_t data[] = {0x42, 0x00, 0x06, 0x00, 0x00, 0xFF};
		REQUIRE_THROWS_AS(TdsProtocol::DecodePrelogin(data, sizeof(data)), TdsException);
	}

	SECTION("Response without ENCRYPTION") {
		const uint8_t data[] = {0x00, 0x00, 0x06, 0x00, 0x06, 0xFF, 0x0E, 0x00, 0x0C, 0xD1, 0x00, 0x00};
		REQUIRE_THROWS_AS(TdsProtocol::DecodePrelogin(data, sizeof(data)), TdsException);
	}
}
