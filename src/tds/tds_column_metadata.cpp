#include "tds/tds_column_metadata.hpp"
#include "tds/tds_error.hpp"

namespace sqlwire {
namespace tds {

//===----------------------------------------------------------------------===//
// ColumnMetadata Implementation
//===----------------------------------------------------------------------===//

std::string ColumnMetadata::GetTypeName() const {
	switch (type_id) {
	case TDS_TYPE_NULL: return "NULL";
	case TDS_TYPE_TINYINT: return "TINYINT";
	case TDS_TYPE_BIT: return "BIT";
	case TDS_TYPE_SMALLINT: return "SMALLINT";
	case TDS_TYPE_INT: return "INT";
	case TDS_TYPE_BIGINT: return "BIGINT";
	case TDS_TYPE_REAL: return "REAL";
	case TDS_TYPE_FLOAT: return "FLOAT";
	case TDS_TYPE_MONEY: return "MONEY";
	case TDS_TYPE_SMALLMONEY: return "SMALLMONEY";
	case TDS_TYPE_DATETIME: return "DATETIME";
	case TDS_TYPE_SMALLDATETIME: return "SMALLDATETIME";
	case TDS_TYPE_INTN: return "INTN";
	case TDS_TYPE_BITN: return "BITN";
	case TDS_TYPE_FLOATN: return "FLOATN";
	case TDS_TYPE_MONEYN: return "MONEYN";
	case TDS_TYPE_DATETIMEN: return "DATETIMEN";
	case TDS_TYPE_DECIMAL: return "DECIMAL";
	case TDS_TYPE_NUMERIC: return "NUMERIC";
	case TDS_TYPE_UNIQUEIDENTIFIER: return "UNIQUEIDENTIFIER";
	case TDS_TYPE_BIGCHAR: return "CHAR";
	case TDS_TYPE_BIGVARCHAR: return "VARCHAR";
	case TDS_TYPE_NCHAR: return "NCHAR";
	case TDS_TYPE_NVARCHAR: return "NVARCHAR";
	case TDS_TYPE_BIGBINARY: return "BINARY";
	case TDS_TYPE_BIGVARBINARY: return "VARBINARY";
	case TDS_TYPE_LEGACY_CHAR: return "LEGACY_CHAR";
	case TDS_TYPE_LEGACY_VARCHAR: return "LEGACY_VARCHAR";
	case TDS_TYPE_LEGACY_BINARY: return "LEGACY_BINARY";
	case TDS_TYPE_LEGACY_VARBINARY: return "LEGACY_VARBINARY";
	case TDS_TYPE_LEGACY_DECIMAL: return "LEGACY_DECIMAL";
	case TDS_TYPE_LEGACY_NUMERIC: return "LEGACY_NUMERIC";
	case TDS_TYPE_DATE: return "DATE";
	case TDS_TYPE_TIME: return "TIME";
	case TDS_TYPE_DATETIME2: return "DATETIME2";
	case TDS_TYPE_DATETIMEOFFSET: return "DATETIMEOFFSET";
	case TDS_TYPE_XML: return "XML";
	case TDS_TYPE_UDT: return "UDT";
	case TDS_TYPE_SQL_VARIANT: return "SQL_VARIANT";
	case TDS_TYPE_IMAGE: return "IMAGE";
	case TDS_TYPE_TEXT: return "TEXT";
	case TDS_TYPE_NTEXT: return "NTEXT";
	default: return "UNKNOWN(" + std::to_string(type_id) + ")";
	}
}

bool ColumnMetadata::IsVariableLength() const {
	switch (type_id) {
	case TDS_TYPE_BIGCHAR:
	case TDS_TYPE_BIGVARCHAR:
	case TDS_TYPE_NCHAR:
	case TDS_TYPE_NVARCHAR:
	case TDS_TYPE_BIGBINARY:
	case TDS_TYPE_BIGVARBINARY:
	case TDS_TYPE_LEGACY_CHAR:
	case TDS_TYPE_LEGACY_VARCHAR:
	case TDS_TYPE_LEGACY_BINARY:
	case TDS_TYPE_LEGACY_VARBINARY:
		return true;
	default:
		return false;
	}
}

bool ColumnMetadata::IsNullableVariant() const {
	switch (type_id) {
	case TDS_TYPE_INTN:
	case TDS_TYPE_BITN:
	case TDS_TYPE_FLOATN:
	case TDS_TYPE_MONEYN:
	case TDS_TYPE_DATETIMEN:
		return true;
	default:
		return false;
	}
}

bool ColumnMetadata::IsPLPType() const {
	return IsVariableLength() && max_length == 0xFFFF;
}

size_t ColumnMetadata::GetFixedSize() const {
	switch (type_id) {
	case TDS_TYPE_TINYINT: return 1;
	case TDS_TYPE_BIT: return 1;
	case TDS_TYPE_SMALLINT: return 2;
	case TDS_TYPE_INT: return 4;
	case TDS_TYPE_BIGINT: return 8;
	case TDS_TYPE_REAL: return 4;
	case TDS_TYPE_FLOAT: return 8;
	case TDS_TYPE_MONEY: return 8;
	case TDS_TYPE_SMALLMONEY: return 4;
	case TDS_TYPE_DATETIME: return 8;
	case TDS_TYPE_SMALLDATETIME: return 4;
	default:
		return 0;  // Variable length or has length prefix
	}
}

//===----------------------------------------------------------------------===//
// ColumnMetadataParser Implementation
//===----------------------------------------------------------------------===//

void ColumnMetadataParser::Parse(TdsBufferReader &reader, ColumnList &columns) {
	columns.clear();

	uint16_t count = reader.ReadUInt16LE();

	// 0xFFFF means no metadata (statement without a result set)
	if (count == 0xFFFF) {
		return;
	}

	columns.reserve(count);
	for (uint16_t i = 0; i < count; i++) {
		ColumnMetadata column;
		column.ordinal = i;

		// UserType (4 bytes, legacy)
		reader.Skip(4);
		column.flags = reader.ReadUInt16LE();

		ParseTypeInfo(reader, column);
		column.name = reader.ReadBVarchar();

		columns.push_back(std::move(column));
	}
}

void ColumnMetadataParser::ParseTypeInfo(TdsBufferReader &reader, ColumnMetadata &column) {
	column.type_id = reader.ReadUInt8();
	column.max_length = 0;
	column.precision = 0;
	column.scale = 0;
	column.collation = 0;
	column.sort_id = 0;

	switch (column.type_id) {
	// Fixed-length types (no additional metadata)
	case TDS_TYPE_NULL:
	case TDS_TYPE_TINYINT:
	case TDS_TYPE_BIT:
	case TDS_TYPE_SMALLINT:
	case TDS_TYPE_INT:
	case TDS_TYPE_BIGINT:
	case TDS_TYPE_REAL:
	case TDS_TYPE_FLOAT:
	case TDS_TYPE_MONEY:
	case TDS_TYPE_SMALLMONEY:
	case TDS_TYPE_DATETIME:
	case TDS_TYPE_SMALLDATETIME:
	case TDS_TYPE_DATE:
		break;

	// 1 byte length
	case TDS_TYPE_INTN:
	case TDS_TYPE_BITN:
	case TDS_TYPE_FLOATN:
	case TDS_TYPE_MONEYN:
	case TDS_TYPE_DATETIMEN:
	case TDS_TYPE_UNIQUEIDENTIFIER:
	case TDS_TYPE_LEGACY_CHAR:
	case TDS_TYPE_LEGACY_VARCHAR:
	case TDS_TYPE_LEGACY_BINARY:
	case TDS_TYPE_LEGACY_VARBINARY:
		column.max_length = reader.ReadUInt8();
		break;

	// DECIMAL/NUMERIC (1 byte length, 1 byte precision, 1 byte scale)
	case TDS_TYPE_DECIMAL:
	case TDS_TYPE_NUMERIC:
	case TDS_TYPE_LEGACY_DECIMAL:
	case TDS_TYPE_LEGACY_NUMERIC:
		column.max_length = reader.ReadUInt8();
		column.precision = reader.ReadUInt8();
		column.scale = reader.ReadUInt8();
		break;

	// Variable-length string types (2 bytes length + 5 bytes collation)
	case TDS_TYPE_BIGCHAR:
	case TDS_TYPE_BIGVARCHAR:
	case TDS_TYPE_NCHAR:
	case TDS_TYPE_NVARCHAR:
		column.max_length = reader.ReadUInt16LE();
		column.collation = reader.ReadUInt32LE();
		column.sort_id = reader.ReadUInt8();
		break;

	// Variable-length binary types (2 bytes length)
	case TDS_TYPE_BIGBINARY:
	case TDS_TYPE_BIGVARBINARY:
		column.max_length = reader.ReadUInt16LE();
		break;

	// TIME, DATETIME2, DATETIMEOFFSET (1 byte scale)
	case TDS_TYPE_TIME:
	case TDS_TYPE_DATETIME2:
	case TDS_TYPE_DATETIMEOFFSET:
		column.scale = reader.ReadUInt8();
		break;

	default:
		throw TdsException(TdsErrorKind::Decode, "Unsupported SQL Server type: " + column.GetTypeName());
	}
}

}  // namespace tds
}  // namespace sqlwire
