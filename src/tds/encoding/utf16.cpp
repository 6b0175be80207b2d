#include "tds/encoding/utf16.hpp"

namespace sqlwire {
namespace tds {
namespace encoding {

//===----------------------------------------------------------------------===//
// UTF-8 decoding
//===----------------------------------------------------------------------===//

// Decode one codepoint starting at input[i], advancing i.
// Returns false when the sequence is truncated; invalid lead bytes are skipped
// and reported as codepoint 0xFFFFFFFF.
static bool NextCodepoint(const std::string &input, size_t &i, uint32_t &codepoint) {
	uint8_t byte = static_cast<uint8_t>(input[i]);
	size_t extra;

	if ((byte & 0x80) == 0) {
		codepoint = byte;
		extra = 0;
	} else if ((byte & 0xE0) == 0xC0) {
		codepoint = byte & 0x1F;
		extra = 1;
	} else if ((byte & 0xF0) == 0xE0) {
		codepoint = byte & 0x0F;
		extra = 2;
	} else if ((byte & 0xF8) == 0xF0) {
		codepoint = byte & 0x07;
		extra = 3;
	} else {
		i += 1;
		codepoint = 0xFFFFFFFF;
		return true;
	}

	if (i + extra >= input.size()) {
		return false;
	}
	for (size_t k = 1; k <= extra; k++) {
		codepoint = (codepoint << 6) | (static_cast<uint8_t>(input[i + k]) & 0x3F);
	}
	i += extra + 1;
	return true;
}

static inline void PushUnit(std::vector<uint8_t> &out, uint16_t unit) {
	out.push_back(static_cast<uint8_t>(unit & 0xFF));
	out.push_back(static_cast<uint8_t>((unit >> 8) & 0xFF));
}

//===----------------------------------------------------------------------===//
// Encoding
//===----------------------------------------------------------------------===//

size_t Utf16LEAppend(const std::string &input, std::vector<uint8_t> &output) {
	size_t start = output.size();
	output.reserve(start + input.size() * 2);

	size_t i = 0;
	while (i < input.size()) {
		uint32_t codepoint;
		if (!NextCodepoint(input, i, codepoint)) {
			break;
		}
		if (codepoint <= 0xFFFF) {
			PushUnit(output, static_cast<uint16_t>(codepoint));
		} else if (codepoint <= 0x10FFFF) {
			// Surrogate pair, high surrogate first
			codepoint -= 0x10000;
			PushUnit(output, static_cast<uint16_t>(0xD800 + ((codepoint >> 10) & 0x3FF)));
			PushUnit(output, static_cast<uint16_t>(0xDC00 + (codepoint & 0x3FF)));
		}
	}
	return output.size() - start;
}

std::vector<uint8_t> Utf16LEEncode(const std::string &input) {
	std::vector<uint8_t> result;
	Utf16LEAppend(input, result);
	return result;
}

size_t Utf16CodeUnitCount(const std::string &input) {
	size_t units = 0;
	size_t i = 0;
	while (i < input.size()) {
		uint32_t codepoint;
		if (!NextCodepoint(input, i, codepoint)) {
			break;
		}
		if (codepoint <= 0xFFFF) {
			units += 1;
		} else if (codepoint <= 0x10FFFF) {
			units += 2;
		}
	}
	return units;
}

//===----------------------------------------------------------------------===//
// Decoding
//===----------------------------------------------------------------------===//

static void AppendUtf8(std::string &out, uint32_t codepoint) {
	if (codepoint <= 0x7F) {
		out.push_back(static_cast<char>(codepoint));
	} else if (codepoint <= 0x7FF) {
		out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
		out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
	} else if (codepoint <= 0xFFFF) {
		out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
		out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
	} else {
		out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
		out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
	}
}

std::string Utf16LEDecode(const uint8_t *data, size_t byte_length) {
	std::string result;
	result.reserve(byte_length / 2);

	size_t i = 0;
	while (i + 1 < byte_length) {
		uint16_t unit = static_cast<uint16_t>(data[i]) | (static_cast<uint16_t>(data[i + 1]) << 8);
		i += 2;

		uint32_t codepoint = unit;
		if (unit >= 0xD800 && unit <= 0xDBFF) {
			if (i + 1 >= byte_length) {
				break;
			}
			uint16_t low = static_cast<uint16_t>(data[i]) | (static_cast<uint16_t>(data[i + 1]) << 8);
			i += 2;
			if (low >= 0xDC00 && low <= 0xDFFF) {
				codepoint = 0x10000 + ((static_cast<uint32_t>(unit - 0xD800) << 10) | (low - 0xDC00));
			} else {
				codepoint = 0xFFFD;
			}
		} else if (unit >= 0xDC00 && unit <= 0xDFFF) {
			// Lone low surrogate
			codepoint = 0xFFFD;
		}
		AppendUtf8(result, codepoint);
	}

	return result;
}

std::string Utf16LEDecode(const std::vector<uint8_t> &data) {
	return Utf16LEDecode(data.data(), data.size());
}

}  // namespace encoding
}  // namespace tds
}  // namespace sqlwire
