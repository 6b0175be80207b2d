#include "catch.hpp"
#include "tds/tds_error.hpp"
#include "tds/tds_ssrp.hpp"

#include <string>
#include <vector>

using namespace sqlwire::tds;

static std::vector<uint8_t> Response(const std::string &payload) {
	std::vector<uint8_t> data;
	data.push_back(SSRP_SVR_RESP);
	data.push_back(static_cast<uint8_t>(payload.size() & 0xFF));
	data.push_back(static_cast<uint8_t>((payload.size() >> 8) & 0xFF));
	data.insert(data.end(), payload.begin(), payload.end());
	return data;
}

static uint16_t Port(const std::string &payload) {
	std::vector<uint8_t> data = Response(payload);
	return SsrpClient::ParseResponse(data.data(), data.size());
}

TEST_CASE("SSRP - Request", "[sqlwire][ssrp]") {
	SECTION("Unicast instance request") {
		std::vector<uint8_t> request = SsrpClient::BuildRequest("SQLEXPRESS");
		REQUIRE(request.size() == 12);
		REQUIRE(request[0] == 0x04);
		REQUIRE(std::string(request.begin() + 1, request.end() - 1) == "SQLEXPRESS");
		REQUIRE(request.back() == 0x00);
	}

	SECTION("Instance name longer than 32 bytes") {
		REQUIRE_THROWS_AS(SsrpClient::BuildRequest(std::string(33, 'A')), TdsException);
		REQUIRE(SsrpClient::BuildRequest(std::string(32, 'A')).size() == 34);
	}
}

TEST_CASE("SSRP - Response parsing", "[sqlwire][ssrp]") {
	SECTION("TCP port of a single instance") {
		REQUIRE(Port("ServerName;HOST;InstanceName;SQLEXPRESS;IsClustered;No;Version;15.0.2000.5;tcp;49172;;") ==
		        49172);
	}

	SECTION("First tcp entry wins and the key is case-insensitive") {
		REQUIRE(Port("ServerName;A;InstanceName;ONE;np;\\\\A\\pipe\\sql\\query;;"
		             "ServerName;A;InstanceName;TWO;TCP;50001;;ServerName;A;InstanceName;THREE;tcp;50002;;") ==
		        50001);
	}

	SECTION("Payload ends at the first NUL") {
		REQUIRE(Port(std::string("InstanceName;X;tcp;1500;;\0tcp;9;;", 33)) == 1500);
	}

	SECTION("Missing tcp entry") {
		REQUIRE_THROWS_AS(Port("ServerName;HOST;InstanceName;X;np;pipe;;"), TdsException);
	}

	SECTION("Invalid port values") {
		REQUIRE_THROWS_AS(Port("tcp;0;;"), TdsException);
		REQUIRE_THROWS_AS(Port("tcp;65536;;"), TdsException);
		REQUIRE_THROWS_AS(Port("tcp;12a;;"), TdsException);
		REQUIRE_THROWS_AS(Port("tcp;;;"), TdsException);
	}

	SECTION("Malformed datagrams") {
		std::vector<uint8_t> wrong_type = Response("tcp;1433;;");
		wrong_type[0] = 0x04;
		REQUIRE_THROWS_AS(SsrpClient::ParseResponse(wrong_type.data(), wrong_type.size()), TdsException);

		std::vector<uint8_t> truncated = Response("tcp;1433;;");
		truncated.resize(truncated.size() - 2);
		REQUIRE_THROWS_AS(SsrpClient::ParseResponse(truncated.data(), truncated.size()), TdsException);

		std::vector<uint8_t> empty = Response("");
		REQUIRE_THROWS_AS(SsrpClient::ParseResponse(empty.data(), empty.size()), TdsException);

		const uint8_t too_short[] = {0x05, 0x01};
		REQUIRE_THROWS_AS(SsrpClient::ParseResponse(too_short, sizeof(too_short)), TdsException);
	}

	SECTION("Errors are configuration errors") {
		try {
			Port("ServerName;HOST;;");
			FAIL("expected TdsException");
		} catch (const TdsException &ex) {
			REQUIRE(ex.GetKind() == TdsErrorKind::Config);
			REQUIRE(std::string(ex.what()).find("SSRP") != std::string::npos);
		}
	}
}
