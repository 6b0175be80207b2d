#pragma once

#include "tds_buffer_reader.hpp"
#include "tds_column_metadata.hpp"
#include "tds_types.hpp"
#include <cstdint>
#include <vector>

namespace sqlwire {
namespace tds {

// One decoded ROW / NBCROW: raw wire bytes per column plus NULL tracking.
// columns is the metadata snapshot that was current when the row was decoded.
struct RowData {
	ColumnListPtr columns;
	std::vector<std::vector<uint8_t>> values;
	std::vector<bool> null_mask;

	bool IsNull(size_t column) const { return null_mask[column]; }
};

//===----------------------------------------------------------------------===//
// RowReader - Extracts raw column values from ROW token data
//===----------------------------------------------------------------------===//

class RowReader {
public:
	explicit RowReader(const ColumnList &columns);

	// Read a ROW body (after the token byte).
	// Throws TdsException(Decode) on truncated data or an unsupported type.
	void ReadRow(TdsBufferReader &reader, RowData &row);

	// Read a Null Bitmap Compressed (NBC) row
	// NBC rows have a bitmap indicating NULL columns, followed by data for non-NULL columns
	void ReadNBCRow(TdsBufferReader &reader, RowData &row);

	// Read a single value in its ROW wire encoding.
	// Value bytes exclude the length prefix; PLP chunks are concatenated.
	static void ReadValue(TdsBufferReader &reader, const ColumnMetadata &column, std::vector<uint8_t> &value,
	                      bool &is_null);

private:
	void Prepare(RowData &row) const;

	static void ReadPLPValue(TdsBufferReader &reader, std::vector<uint8_t> &value, bool &is_null);

	const ColumnList &columns_;
};

}  // namespace tds
}  // namespace sqlwire
