#include "tds/tds_buffer_reader.hpp"
#include "tds/encoding/utf16.hpp"
#include "tds/tds_error.hpp"

namespace sqlwire {
namespace tds {

TdsBufferReader::TdsBufferReader(const uint8_t *data, size_t length) : data_(data), length_(length), pos_(0) {
}

void TdsBufferReader::Require(size_t length) const {
	if (length > length_ - pos_) {
		throw TdsException(TdsErrorKind::Decode, "Truncated token data: need " + std::to_string(length) +
		                                             " bytes at offset " + std::to_string(pos_) + ", have " +
		                                             std::to_string(length_ - pos_));
	}
}

uint8_t TdsBufferReader::ReadUInt8() {
	Require(1);
	return data_[pos_++];
}

uint16_t TdsBufferReader::ReadUInt16LE() {
	Require(2);
	uint16_t value = static_cast<uint16_t>(data_[pos_]) | (static_cast<uint16_t>(data_[pos_ + 1]) << 8);
	pos_ += 2;
	return value;
}

uint32_t TdsBufferReader::ReadUInt32LE() {
	Require(4);
	uint32_t value = 0;
	for (size_t i = 0; i < 4; i++) {
		value |= static_cast<uint32_t>(data_[pos_ + i]) << (8 * i);
	}
	pos_ += 4;
	return value;
}

uint32_t TdsBufferReader::ReadUInt32BE() {
	Require(4);
	uint32_t value = 0;
	for (size_t i = 0; i < 4; i++) {
		value = (value << 8) | data_[pos_ + i];
	}
	pos_ += 4;
	return value;
}

uint64_t TdsBufferReader::ReadUInt64LE() {
	Require(8);
	uint64_t value = 0;
	for (size_t i = 0; i < 8; i++) {
		value |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
	}
	pos_ += 8;
	return value;
}

int32_t TdsBufferReader::ReadInt32LE() {
	return static_cast<int32_t>(ReadUInt32LE());
}

const uint8_t *TdsBufferReader::Take(size_t length) {
	Require(length);
	const uint8_t *ptr = data_ + pos_;
	pos_ += length;
	return ptr;
}

void TdsBufferReader::Skip(size_t length) {
	Take(length);
}

void TdsBufferReader::ReadBytes(size_t length, std::vector<uint8_t> &out) {
	const uint8_t *ptr = Take(length);
	out.insert(out.end(), ptr, ptr + length);
}

TdsBufferReader TdsBufferReader::SubReader(size_t length) {
	const uint8_t *ptr = Take(length);
	return TdsBufferReader(ptr, length);
}

std::string TdsBufferReader::ReadBVarchar() {
	size_t byte_length = static_cast<size_t>(ReadUInt8()) * 2;
	return encoding::Utf16LEDecode(Take(byte_length), byte_length);
}

std::string TdsBufferReader::ReadUSVarchar() {
	size_t byte_length = static_cast<size_t>(ReadUInt16LE()) * 2;
	return encoding::Utf16LEDecode(Take(byte_length), byte_length);
}

void TdsBufferReader::ReadBVarbyte(std::vector<uint8_t> &out) {
	size_t length = ReadUInt8();
	ReadBytes(length, out);
}

}  // namespace tds
}  // namespace sqlwire
