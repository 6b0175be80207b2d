#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlwire {
namespace tds {

//===----------------------------------------------------------------------===//
// TdsBufferReader - bounds-checked little-endian cursor over token data
//
// Every read throws TdsException(Decode) when the buffer ends early, so a
// truncated token never reads past the end of the packet sequence.
//===----------------------------------------------------------------------===//

class TdsBufferReader {
public:
	TdsBufferReader(const uint8_t *data, size_t length);

	size_t Position() const { return pos_; }
	size_t Remaining() const { return length_ - pos_; }
	bool AtEnd() const { return pos_ >= length_; }

	uint8_t ReadUInt8();
	uint16_t ReadUInt16LE();
	uint32_t ReadUInt32LE();
	uint32_t ReadUInt32BE();
	uint64_t ReadUInt64LE();
	int32_t ReadInt32LE();

	// Return a pointer to the next length bytes and advance past them
	const uint8_t *Take(size_t length);
	void Skip(size_t length);
	void ReadBytes(size_t length, std::vector<uint8_t> &out);

	// Reader over the next length bytes; this reader advances past them
	TdsBufferReader SubReader(size_t length);

	// B_VARCHAR: 1-byte character count + UTF-16LE
	std::string ReadBVarchar();
	// US_VARCHAR: 2-byte character count + UTF-16LE
	std::string ReadUSVarchar();
	// B_VARBYTE: 1-byte length + bytes
	void ReadBVarbyte(std::vector<uint8_t> &out);

private:
	void Require(size_t length) const;

	const uint8_t *data_;
	size_t length_;
	size_t pos_;
};

}  // namespace tds
}  // namespace sqlwire
