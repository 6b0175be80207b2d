#include "tds/tds_row_reader.hpp"
#include "tds/tds_error.hpp"

namespace sqlwire {
namespace tds {

// PLP total length markers
static constexpr uint64_t PLP_NULL = 0xFFFFFFFFFFFFFFFFULL;
static constexpr uint64_t PLP_UNKNOWN_LENGTH = 0xFFFFFFFFFFFFFFFEULL;

RowReader::RowReader(const ColumnList &columns) : columns_(columns) {
}

void RowReader::Prepare(RowData &row) const {
	row.values.assign(columns_.size(), std::vector<uint8_t>());
	row.null_mask.assign(columns_.size(), false);
}

void RowReader::ReadRow(TdsBufferReader &reader, RowData &row) {
	Prepare(row);
	for (size_t i = 0; i < columns_.size(); i++) {
		bool is_null = false;
		ReadValue(reader, columns_[i], row.values[i], is_null);
		row.null_mask[i] = is_null;
	}
}

void RowReader::ReadNBCRow(TdsBufferReader &reader, RowData &row) {
	Prepare(row);

	size_t bitmap_size = (columns_.size() + 7) / 8;
	const uint8_t *bitmap = reader.Take(bitmap_size);

	for (size_t i = 0; i < columns_.size(); i++) {
		// Bit set means NULL; nothing follows on the wire for that column
		if (bitmap[i / 8] & (1 << (i % 8))) {
			row.null_mask[i] = true;
			continue;
		}
		bool is_null = false;
		ReadValue(reader, columns_[i], row.values[i], is_null);
		row.null_mask[i] = is_null;
	}
}

void RowReader::ReadValue(TdsBufferReader &reader, const ColumnMetadata &column, std::vector<uint8_t> &value,
                          bool &is_null) {
	value.clear();
	is_null = false;

	switch (column.type_id) {
	case TDS_TYPE_NULL:
		is_null = true;
		return;

	// Fixed-length types (no length prefix)
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
		reader.ReadBytes(column.GetFixedSize(), value);
		return;

	// 1-byte length prefix, 0 = NULL
	case TDS_TYPE_INTN:
	case TDS_TYPE_BITN:
	case TDS_TYPE_FLOATN:
	case TDS_TYPE_MONEYN:
	case TDS_TYPE_DATETIMEN:
	case TDS_TYPE_UNIQUEIDENTIFIER:
	case TDS_TYPE_DECIMAL:
	case TDS_TYPE_NUMERIC:
	case TDS_TYPE_LEGACY_DECIMAL:
	case TDS_TYPE_LEGACY_NUMERIC:
	case TDS_TYPE_DATE:
	case TDS_TYPE_TIME:
	case TDS_TYPE_DATETIME2:
	case TDS_TYPE_DATETIMEOFFSET: {
		uint8_t length = reader.ReadUInt8();
		if (length == 0) {
			is_null = true;
			return;
		}
		reader.ReadBytes(length, value);
		return;
	}

	// Legacy strings and binaries: 1-byte length prefix, 0xFF = NULL
	case TDS_TYPE_LEGACY_CHAR:
	case TDS_TYPE_LEGACY_VARCHAR:
	case TDS_TYPE_LEGACY_BINARY:
	case TDS_TYPE_LEGACY_VARBINARY: {
		uint8_t length = reader.ReadUInt8();
		if (length == 0xFF) {
			is_null = true;
			return;
		}
		reader.ReadBytes(length, value);
		return;
	}

	// 2-byte length prefix (0xFFFF = NULL), or PLP for MAX types
	case TDS_TYPE_BIGCHAR:
	case TDS_TYPE_BIGVARCHAR:
	case TDS_TYPE_NCHAR:
	case TDS_TYPE_NVARCHAR:
	case TDS_TYPE_BIGBINARY:
	case TDS_TYPE_BIGVARBINARY: {
		if (column.IsPLPType()) {
			ReadPLPValue(reader, value, is_null);
			return;
		}
		uint16_t length = reader.ReadUInt16LE();
		if (length == 0xFFFF) {
			is_null = true;
			return;
		}
		reader.ReadBytes(length, value);
		return;
	}

	default:
		throw TdsException(TdsErrorKind::Decode,
		                   "Cannot read value of type " + column.GetTypeName() + " for column '" + column.name + "'");
	}
}

// PLP: u64 total length, then chunks of (u32 length, data) until a zero-length chunk
void RowReader::ReadPLPValue(TdsBufferReader &reader, std::vector<uint8_t> &value, bool &is_null) {
	uint64_t total_length = reader.ReadUInt64LE();
	if (total_length == PLP_NULL) {
		is_null = true;
		return;
	}

	if (total_length != PLP_UNKNOWN_LENGTH && total_length <= reader.Remaining()) {
		value.reserve(static_cast<size_t>(total_length));
	}

	while (true) {
		uint32_t chunk_length = reader.ReadUInt32LE();
		if (chunk_length == 0) {
			break;
		}
		reader.ReadBytes(chunk_length, value);
	}

	if (total_length != PLP_UNKNOWN_LENGTH && value.size() != total_length) {
		throw TdsException(TdsErrorKind::Decode, "PLP value length mismatch: declared " +
		                                             std::to_string(total_length) + ", received " +
		                                             std::to_string(value.size()));
	}
}

}  // namespace tds
}  // namespace sqlwire
