#include "catch.hpp"
#include "tds/encoding/utf16.hpp"
#include "tds/tds_buffer_reader.hpp"
#include "tds/tds_column_metadata.hpp"
#include "tds/tds_error.hpp"
#include "tds/tds_row_reader.hpp"
#include "tds/tds_token_parser.hpp"
#include "tds_test_helpers.hpp"

#include <string>
#include <vector>

using namespace sqlwire::tds;
using namespace sqlwire::tds::test;

TEST_CASE("TdsBufferReader - Bounds", "[sqlwire][tokens][buffer_reader]") {
	const uint8_t data[] = {0x01, 0x02, 0x03, 0x04, 0x05};
	TdsBufferReader reader(data, sizeof(data));

	REQUIRE(reader.ReadUInt16LE() == 0x0201);
	REQUIRE(reader.ReadUInt8() == 0x03);
	REQUIRE(reader.Remaining() == 2);

	try {
		reader.ReadUInt32LE();
		FAIL("expected TdsException");
	} catch (const TdsException &ex) {
		REQUIRE(ex.GetKind() == TdsErrorKind::Decode);
	}
	// A failed read consumes nothing
	REQUIRE(reader.Position() == 3);

	TdsBufferReader sub = reader.SubReader(2);
	REQUIRE(reader.AtEnd());
	REQUIRE(sub.ReadUInt8() == 0x04);
	REQUIRE_THROWS_AS(sub.Skip(2), TdsException);
}

TEST_CASE("TokenParser - DONE", "[sqlwire][tokens]") {
	TokenBuilder tokens;
	tokens.UInt16(0x0011).UInt16(0x00C1).UInt64(12345);
	TdsBufferReader reader(tokens.Get().data(), tokens.Size());

	DoneToken done = TokenParser::ParseDone(reader);
	REQUIRE(done.HasMore());
	REQUIRE_FALSE(done.IsFinal());
	REQUIRE(done.HasRowCount());
	REQUIRE(done.row_count == 12345);
	REQUIRE(reader.AtEnd());
}

TEST_CASE("TokenParser - LOGINACK", "[sqlwire][tokens]") {
	TokenBuilder tokens;
	tokens.LoginAck("Microsoft SQL Server", 15, 0, 2000);
	TdsBufferReader reader(tokens.Get().data(), tokens.Size());
	REQUIRE(reader.ReadUInt8() == static_cast<uint8_t>(TokenType::LOGINACK));

	LoginAckToken ack = TokenParser::ParseLoginAck(reader);
	REQUIRE(ack.interface_type == 1);
	REQUIRE(ack.tds_version == 0x74000004);
	REQUIRE(ack.program_name == "Microsoft SQL Server");
	REQUIRE(ack.GetVersionString() == "15.0.2000");
	REQUIRE(reader.AtEnd());
}

TEST_CASE("TokenParser - ENVCHANGE", "[sqlwire][tokens][envchange]") {
	SECTION("String subtype") {
		TokenBuilder tokens;
		tokens.EnvChangeString(EnvChangeType::PACKET_SIZE, "16384", "4096");
		TdsBufferReader reader(tokens.Get().data() + 1, tokens.Size() - 1);
		EnvChangeToken env = TokenParser::ParseEnvChange(reader);
		REQUIRE(env.GetType() == EnvChangeType::PACKET_SIZE);
		REQUIRE(env.new_value == "16384");
		REQUIRE(env.old_value == "4096");
		REQUIRE(env.GetPacketSize() == 16384);
	}

	SECTION("Non-numeric packet size") {
		TokenBuilder tokens;
		tokens.EnvChangeString(EnvChangeType::PACKET_SIZE, "big", "4096");
		TdsBufferReader reader(tokens.Get().data() + 1, tokens.Size() - 1);
		EnvChangeToken env = TokenParser::ParseEnvChange(reader);
		REQUIRE_THROWS_AS(env.GetPacketSize(), TdsException);
	}

	SECTION("Transaction descriptor is little-endian") {
		TokenBuilder tokens;
		tokens.BeginTransaction(0x0807060504030201ULL);
		TdsBufferReader reader(tokens.Get().data() + 1, tokens.Size() - 1);
		EnvChangeToken env = TokenParser::ParseEnvChange(reader);
		REQUIRE(env.new_bytes.size() == 8);
		REQUIRE(env.new_bytes[0] == 0x01);
		REQUIRE(env.GetTransactionDescriptor() == 0x0807060504030201ULL);
		REQUIRE(env.old_bytes.empty());
	}

	SECTION("Unhandled subtype is skipped by its length") {
		TokenBuilder tokens;
		tokens.Byte(static_cast<uint8_t>(TokenType::ENVCHANGE)).UInt16(4).Byte(20).UInt16(1).Byte(0);
		tokens.Byte(0xFD);
		TdsBufferReader reader(tokens.Get().data() + 1, tokens.Size() - 1);
		EnvChangeToken env = TokenParser::ParseEnvChange(reader);
		REQUIRE(env.GetType() == EnvChangeType::ROUTING);
		REQUIRE(reader.ReadUInt8() == 0xFD);
	}
}

TEST_CASE("TokenParser - ERROR and INFO", "[sqlwire][tokens]") {
	TokenBuilder tokens;
	tokens.Error(2627, 14, "Violation of PRIMARY KEY constraint");
	TdsBufferReader reader(tokens.Get().data() + 1, tokens.Size() - 1);

	TdsError error = TokenParser::ParseError(reader);
	REQUIRE(error.number == 2627);
	REQUIRE(error.state == 1);
	REQUIRE(error.severity == 14);
	REQUIRE(error.IsError());
	REQUIRE(error.message == "Violation of PRIMARY KEY constraint");
	REQUIRE(error.server_name == "sqlserver");
	REQUIRE(error.proc_name.empty());
	REQUIRE(error.line_number == 1);
	REQUIRE(reader.AtEnd());

	TokenBuilder info;
	info.Info(5701, "Changed database context");
	TdsBufferReader info_reader(info.Get().data() + 1, info.Size() - 1);
	TdsInfo message = TokenParser::ParseInfo(info_reader);
	REQUIRE(message.number == 5701);
	REQUIRE_FALSE(message.IsError());
}

TEST_CASE("TokenParser - ORDER and RETURNSTATUS", "[sqlwire][tokens]") {
	SECTION("ORDER column list") {
		TokenBuilder tokens;
		tokens.UInt16(4).UInt16(1).UInt16(3);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());
		OrderToken order = TokenParser::ParseOrder(reader);
		REQUIRE(order.columns == std::vector<uint16_t>{1, 3});
	}

	SECTION("ORDER with odd length") {
		TokenBuilder tokens;
		tokens.UInt16(3).Byte(1).Byte(0).Byte(0);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());
		REQUIRE_THROWS_AS(TokenParser::ParseOrder(reader), TdsException);
	}

	SECTION("RETURNSTATUS") {
		TokenBuilder tokens;
		tokens.UInt32(0xFFFFFFFF);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());
		REQUIRE(TokenParser::ParseReturnStatus(reader) == -1);
	}
}

TEST_CASE("TokenParser - RETURNVALUE", "[sqlwire][tokens]") {
	SECTION("INTN output parameter") {
		TokenBuilder tokens;
		tokens.UInt16(1).BVarchar("@out").Byte(0x01).UInt32(0).UInt16(COL_FLAG_NULLABLE);
		tokens.Byte(TDS_TYPE_INTN).Byte(4);
		tokens.Byte(4).UInt32(99);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());

		ReturnValueToken ret = TokenParser::ParseReturnValue(reader);
		REQUIRE(ret.ordinal == 1);
		REQUIRE(ret.name == "@out");
		REQUIRE(ret.type_info.type_id == TDS_TYPE_INTN);
		REQUIRE(ret.type_info.max_length == 4);
		REQUIRE_FALSE(ret.is_null);
		REQUIRE(ret.value == std::vector<uint8_t>{99, 0, 0, 0});
		REQUIRE(reader.AtEnd());
	}

	SECTION("Legacy DECIMAL output parameter") {
		TokenBuilder tokens;
		tokens.UInt16(3).BVarchar("@total").Byte(0x01).UInt32(0).UInt16(COL_FLAG_NULLABLE);
		tokens.Byte(TDS_TYPE_LEGACY_DECIMAL).Byte(5).Byte(10).Byte(0);
		tokens.Byte(0);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());

		ReturnValueToken ret = TokenParser::ParseReturnValue(reader);
		REQUIRE(ret.type_info.type_id == TDS_TYPE_LEGACY_DECIMAL);
		REQUIRE(ret.type_info.precision == 10);
		REQUIRE(ret.is_null);
		REQUIRE(reader.AtEnd());
	}

	SECTION("NULL NVARCHAR output parameter") {
		TokenBuilder tokens;
		tokens.UInt16(2).BVarchar("@s").Byte(0x01).UInt32(0).UInt16(COL_FLAG_NULLABLE);
		tokens.Byte(TDS_TYPE_NVARCHAR).UInt16(40).UInt32(0x00D00409).Byte(0x34);
		tokens.UInt16(0xFFFF);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());

		ReturnValueToken ret = TokenParser::ParseReturnValue(reader);
		REQUIRE(ret.is_null);
		REQUIRE(ret.type_info.collation == 0x00D00409);
		REQUIRE(ret.type_info.sort_id == 0x34);
	}
}

TEST_CASE("ColumnMetadataParser - Type info", "[sqlwire][tokens][colmetadata]") {
	SECTION("Decimal, datetime2 and varbinary(max)") {
		TokenBuilder tokens;
		tokens.UInt16(3);
		tokens.UInt32(0).UInt16(COL_FLAG_NULLABLE).Byte(TDS_TYPE_DECIMAL).Byte(9).Byte(18).Byte(4).BVarchar("amount");
		tokens.UInt32(0).UInt16(0).Byte(TDS_TYPE_DATETIME2).Byte(7).BVarchar("ts");
		tokens.UInt32(0).UInt16(COL_FLAG_NULLABLE).Byte(TDS_TYPE_BIGVARBINARY).UInt16(0xFFFF).BVarchar("blob");
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());

		ColumnList columns;
		ColumnMetadataParser::Parse(reader, columns);
		REQUIRE(columns.size() == 3);
		REQUIRE(columns[0].name == "amount");
		REQUIRE(columns[0].precision == 18);
		REQUIRE(columns[0].scale == 4);
		REQUIRE(columns[1].scale == 7);
		REQUIRE_FALSE(columns[1].IsNullable());
		REQUIRE(columns[2].IsPLPType());
		REQUIRE(columns[2].ordinal == 2);
		REQUIRE(reader.AtEnd());
	}

	SECTION("Legacy byte-length types") {
		TokenBuilder tokens;
		tokens.UInt16(3);
		tokens.UInt32(0).UInt16(COL_FLAG_NULLABLE).Byte(TDS_TYPE_LEGACY_VARCHAR).Byte(20).BVarchar("code");
		tokens.UInt32(0).UInt16(COL_FLAG_NULLABLE).Byte(TDS_TYPE_LEGACY_BINARY).Byte(8).BVarchar("tag");
		tokens.UInt32(0).UInt16(0).Byte(TDS_TYPE_LEGACY_NUMERIC).Byte(5).Byte(9).Byte(2).BVarchar("price");
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());

		ColumnList columns;
		ColumnMetadataParser::Parse(reader, columns);
		REQUIRE(columns.size() == 3);
		REQUIRE(columns[0].max_length == 20);
		REQUIRE(columns[0].collation == 0);
		REQUIRE_FALSE(columns[0].IsPLPType());
		REQUIRE(columns[1].max_length == 8);
		REQUIRE(columns[2].precision == 9);
		REQUIRE(columns[2].scale == 2);
		REQUIRE(columns[2].name == "price");
		REQUIRE(reader.AtEnd());

		// 0xFF marks a NULL legacy string or binary, 0 a NULL legacy numeric
		TokenBuilder row_tokens;
		row_tokens.Byte(2).Byte('a').Byte('b');
		row_tokens.Byte(0xFF);
		row_tokens.Byte(5).Byte(0x01).UInt32(1999);
		TdsBufferReader row_data(row_tokens.Get().data(), row_tokens.Size());

		RowReader row_reader(columns);
		RowData row;
		row_reader.ReadRow(row_data, row);
		REQUIRE(std::string(row.values[0].begin(), row.values[0].end()) == "ab");
		REQUIRE(row.IsNull(1));
		REQUIRE_FALSE(row.IsNull(2));
		REQUIRE(row.values[2].size() == 5);
		REQUIRE(row_data.AtEnd());
	}

	SECTION("No metadata marker") {
		TokenBuilder tokens;
		tokens.UInt16(0xFFFF);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());
		ColumnList columns;
		ColumnMetadataParser::Parse(reader, columns);
		REQUIRE(columns.empty());
	}

	SECTION("Unsupported type") {
		TokenBuilder tokens;
		tokens.UInt16(1).UInt32(0).UInt16(0).Byte(0x99).BVarchar("x");
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());
		ColumnList columns;
		REQUIRE_THROWS_AS(ColumnMetadataParser::Parse(reader, columns), TdsException);
	}
}

TEST_CASE("RowReader - PLP values", "[sqlwire][tokens][rows]") {
	ColumnList columns(1);
	columns[0].name = "doc";
	columns[0].type_id = TDS_TYPE_NVARCHAR;
	columns[0].max_length = 0xFFFF;
	RowReader row_reader(columns);

	SECTION("Chunked value of unknown length") {
		std::vector<uint8_t> text = encoding::Utf16LEEncode("hello");
		TokenBuilder tokens;
		tokens.UInt64(0xFFFFFFFFFFFFFFFEULL);
		tokens.UInt32(4).Bytes(std::vector<uint8_t>(text.begin(), text.begin() + 4));
		tokens.UInt32(6).Bytes(std::vector<uint8_t>(text.begin() + 4, text.end()));
		tokens.UInt32(0);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());

		RowData row;
		row_reader.ReadRow(reader, row);
		REQUIRE_FALSE(row.IsNull(0));
		REQUIRE(encoding::Utf16LEDecode(row.values[0]) == "hello");
		REQUIRE(reader.AtEnd());
	}

	SECTION("PLP NULL") {
		TokenBuilder tokens;
		tokens.UInt64(0xFFFFFFFFFFFFFFFFULL);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());
		RowData row;
		row_reader.ReadRow(reader, row);
		REQUIRE(row.IsNull(0));
	}

	SECTION("Declared length mismatch") {
		TokenBuilder tokens;
		tokens.UInt64(10).UInt32(2).Byte('a').Byte(0).UInt32(0);
		TdsBufferReader reader(tokens.Get().data(), tokens.Size());
		RowData row;
		REQUIRE_THROWS_AS(row_reader.ReadRow(reader, row), TdsException);
	}
}
