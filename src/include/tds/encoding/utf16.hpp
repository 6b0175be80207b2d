#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlwire {
namespace tds {
namespace encoding {

//===----------------------------------------------------------------------===//
// UTF-16 Encoding Utilities
//===----------------------------------------------------------------------===//

/// Encode a UTF-8 string to UTF-16LE bytes
/// @param input UTF-8 encoded string
/// @return UTF-16LE encoded byte vector
std::vector<uint8_t> Utf16LEEncode(const std::string &input);

/// Append the UTF-16LE encoding of a UTF-8 string to an existing buffer
/// @return Number of bytes appended
size_t Utf16LEAppend(const std::string &input, std::vector<uint8_t> &output);

/// Decode UTF-16LE bytes to a UTF-8 string
/// @param data Pointer to UTF-16LE encoded data
/// @param byte_length Length in bytes (not characters)
/// @return UTF-8 encoded string
std::string Utf16LEDecode(const uint8_t *data, size_t byte_length);

/// Decode UTF-16LE byte vector to a UTF-8 string
std::string Utf16LEDecode(const std::vector<uint8_t> &data);

/// Number of UTF-16 code units (TDS "characters") a UTF-8 string encodes to
size_t Utf16CodeUnitCount(const std::string &input);

}  // namespace encoding
}  // namespace tds
}  // namespace sqlwire
