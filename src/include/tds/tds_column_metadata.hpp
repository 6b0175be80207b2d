#pragma once

#include "tds_buffer_reader.hpp"
#include "tds_types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlwire {
namespace tds {

//===----------------------------------------------------------------------===//
// ColumnMetadata - Describes a single result column from COLMETADATA token
//===----------------------------------------------------------------------===//

struct ColumnMetadata {
	uint16_t ordinal;           // Zero-based position in the result set
	std::string name;           // Column name (UTF-8)
	uint8_t type_id;            // TDS type identifier
	uint16_t max_length;        // Maximum length for variable types
	uint8_t precision;          // Precision for DECIMAL/NUMERIC
	uint8_t scale;              // Scale for DECIMAL/NUMERIC or TIME
	uint32_t collation;         // Collation LCID and flags for string types
	uint8_t sort_id;            // Collation sort id for string types
	uint16_t flags;             // Column flags (nullable, identity, etc.)

	ColumnMetadata()
	    : ordinal(0), type_id(0), max_length(0), precision(0), scale(0), collation(0), sort_id(0), flags(0) {}

	// Derived properties
	bool IsNullable() const { return (flags & COL_FLAG_NULLABLE) != 0; }
	bool IsIdentity() const { return (flags & COL_FLAG_IDENTITY) != 0; }
	bool IsComputed() const { return (flags & COL_FLAG_COMPUTED) != 0; }

	// Get human-readable type name for error messages
	std::string GetTypeName() const;

	// Check if this is a variable-length type (2-byte length prefix or PLP)
	bool IsVariableLength() const;

	// Check if this is a nullable variant (INTN, FLOATN, etc.)
	bool IsNullableVariant() const;

	// MAX types have max_length == 0xFFFF and use chunked encoding
	bool IsPLPType() const;

	// Get the fixed size for fixed-length types (0 for variable)
	size_t GetFixedSize() const;
};

// Column list announced by one COLMETADATA token, shared read-only by rows
typedef std::vector<ColumnMetadata> ColumnList;
typedef std::shared_ptr<const ColumnList> ColumnListPtr;

//===----------------------------------------------------------------------===//
// ColumnMetadataParser - Parse COLMETADATA token from TDS stream
//===----------------------------------------------------------------------===//

class ColumnMetadataParser {
public:
	// Parse the COLMETADATA body (after the token byte) into column definitions.
	// A column count of 0xFFFF means no metadata and yields an empty list.
	// Throws TdsException(Decode) on truncated data or an unsupported type.
	static void Parse(TdsBufferReader &reader, ColumnList &columns);

	// Parse TYPE_INFO (length, precision, scale, collation) for column.type_id
	// Also used for RETURNVALUE tokens.
	static void ParseTypeInfo(TdsBufferReader &reader, ColumnMetadata &column);
};

}  // namespace tds
}  // namespace sqlwire
