#include "tds/tds_protocol.hpp"
#include "tds/encoding/utf16.hpp"
#include "tds/tds_error.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

// Debug logging
static int GetSqlwireDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLWIRE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLWIRE_PROTOCOL_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                    \
		if (GetSqlwireDebugLevel() >= lvl)                                  \
			fprintf(stderr, "[SQLWIRE PROTOCOL] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlwire {
namespace tds {

//===----------------------------------------------------------------------===//
// PRELOGIN
//===----------------------------------------------------------------------===//

// One option of the PRELOGIN block: token plus its data bytes
struct PreloginOptionData {
	PreloginOption token;
	std::vector<uint8_t> data;

	PreloginOptionData(PreloginOption token_p) : token(token_p) {}
};

std::vector<uint8_t> TdsProtocol::EncodePrelogin(const PreloginMessage &message) {
	std::vector<PreloginOptionData> options;

	if (message.has_version) {
		PreloginOptionData opt(PreloginOption::VERSION);
		// major, minor, build, sub-build; build and sub-build big-endian
		opt.data.push_back(message.version.major);
		opt.data.push_back(message.version.minor);
		opt.data.push_back(static_cast<uint8_t>((message.version.build >> 8) & 0xFF));
		opt.data.push_back(static_cast<uint8_t>(message.version.build & 0xFF));
		opt.data.push_back(static_cast<uint8_t>((message.version.sub_build >> 8) & 0xFF));
		opt.data.push_back(static_cast<uint8_t>(message.version.sub_build & 0xFF));
		options.push_back(opt);
	}
	if (message.has_encryption) {
		PreloginOptionData opt(PreloginOption::ENCRYPTION);
		opt.data.push_back(static_cast<uint8_t>(message.encryption));
		options.push_back(opt);
	}
	if (message.has_instance) {
		PreloginOptionData opt(PreloginOption::INSTOPT);
		opt.data.insert(opt.data.end(), message.instance.begin(), message.instance.end());
		opt.data.push_back(0);
		options.push_back(opt);
	}
	if (message.has_thread_id) {
		PreloginOptionData opt(PreloginOption::THREADID);
		for (int shift = 0; shift < 32; shift += 8) {
			opt.data.push_back(static_cast<uint8_t>((message.thread_id >> shift) & 0xFF));
		}
		options.push_back(opt);
	}
	if (message.has_trace_id) {
		PreloginOptionData opt(PreloginOption::TRACEID);
		opt.data = message.trace_id;
		opt.data.resize(PRELOGIN_TRACE_ID_SIZE, 0);
		options.push_back(opt);
	}
	if (message.has_mars) {
		PreloginOptionData opt(PreloginOption::MARS);
		opt.data.push_back(message.mars ? 1 : 0);
		options.push_back(opt);
	}

	// Each header is 5 bytes: option(1) + offset(2) + length(2), then the 1-byte terminator
	size_t data_offset = options.size() * 5 + 1;

	std::vector<uint8_t> out;
	for (size_t i = 0; i < options.size(); i++) {
		uint16_t length = static_cast<uint16_t>(options[i].data.size());
		out.push_back(static_cast<uint8_t>(options[i].token));
		out.push_back(static_cast<uint8_t>((data_offset >> 8) & 0xFF));
		out.push_back(static_cast<uint8_t>(data_offset & 0xFF));
		out.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
		out.push_back(static_cast<uint8_t>(length & 0xFF));
		data_offset += length;
	}
	out.push_back(static_cast<uint8_t>(PreloginOption::TERMINATOR));

	for (size_t i = 0; i < options.size(); i++) {
		out.insert(out.end(), options[i].data.begin(), options[i].data.end());
	}
	return out;
}

TdsPacket TdsProtocol::BuildPrelogin(const PreloginMessage &message) {
	TdsPacket packet(PacketType::PRELOGIN);
	packet.AppendPayload(EncodePrelogin(message));
	return packet;
}

static EncryptionOption DecodeEncryption(uint8_t value) {
	switch (value) {
	case 0x00:
		return EncryptionOption::ENCRYPT_OFF;
	case 0x01:
		return EncryptionOption::ENCRYPT_ON;
	case 0x02:
		return EncryptionOption::ENCRYPT_NOT_SUP;
	case 0x03:
		return EncryptionOption::ENCRYPT_REQ;
	default:
		// Unknown values (e.g. client-certificate bits) are treated as no encryption
		return EncryptionOption::ENCRYPT_OFF;
	}
}

PreloginMessage TdsProtocol::DecodePrelogin(const uint8_t *data, size_t length) {
	PreloginMessage message;

	size_t pos = 0;
	while (true) {
		if (pos >= length) {
			throw TdsException(TdsErrorKind::Decode, "PRELOGIN block is missing its terminator");
		}
		uint8_t token = data[pos];
		if (token == static_cast<uint8_t>(PreloginOption::TERMINATOR)) {
			break;
		}
		if (pos + 5 > length) {
			throw TdsException(TdsErrorKind::Decode, "Truncated PRELOGIN option header");
		}

		size_t offset = (static_cast<size_t>(data[pos + 1]) << 8) | data[pos + 2];
		size_t opt_len = (static_cast<size_t>(data[pos + 3]) << 8) | data[pos + 4];
		pos += 5;

		if (offset + opt_len > length) {
			throw TdsException(TdsErrorKind::Decode, "PRELOGIN option " + std::to_string(token) +
			                                             " data out of bounds (offset " + std::to_string(offset) +
			                                             ", length " + std::to_string(opt_len) + ")");
		}
		const uint8_t *value = data + offset;

		switch (static_cast<PreloginOption>(token)) {
		case PreloginOption::VERSION:
			if (opt_len < 6) {
				throw TdsException(TdsErrorKind::Decode, "PRELOGIN VERSION option is too short");
			}
			message.has_version = true;
			message.version.major = value[0];
			message.version.minor = value[1];
			message.version.build = (static_cast<uint16_t>(value[2]) << 8) | value[3];
			message.version.sub_build = (static_cast<uint16_t>(value[4]) << 8) | value[5];
			break;
		case PreloginOption::ENCRYPTION:
			if (opt_len < 1) {
				throw TdsException(TdsErrorKind::Decode, "PRELOGIN ENCRYPTION option is empty");
			}
			message.has_encryption = true;
			message.encryption = DecodeEncryption(value[0]);
			break;
		case PreloginOption::INSTOPT: {
			message.has_instance = true;
			size_t end = 0;
			while (end < opt_len && value[end] != 0) {
				end++;
			}
			message.instance.assign(reinterpret_cast<const char *>(value), end);
			break;
		}
		case PreloginOption::THREADID:
			// Servers answer with an empty THREADID
			if (opt_len >= 4) {
				message.has_thread_id = true;
				message.thread_id = static_cast<uint32_t>(value[0]) | (static_cast<uint32_t>(value[1]) << 8) |
				                    (static_cast<uint32_t>(value[2]) << 16) | (static_cast<uint32_t>(value[3]) << 24);
			}
			break;
		case PreloginOption::MARS:
			if (opt_len >= 1) {
				message.has_mars = true;
				message.mars = value[0] != 0;
			}
			break;
		case PreloginOption::TRACEID:
			if (opt_len >= PRELOGIN_TRACE_ID_SIZE) {
				message.has_trace_id = true;
				message.trace_id.assign(value, value + PRELOGIN_TRACE_ID_SIZE);
			}
			break;
		default:
			throw TdsException(TdsErrorKind::Decode, "Unknown PRELOGIN option token " + std::to_string(token));
		}
	}

	if (!message.has_version) {
		throw TdsException(TdsErrorKind::Decode, "PRELOGIN response has no VERSION option");
	}
	if (!message.has_encryption) {
		throw TdsException(TdsErrorKind::Decode, "PRELOGIN response has no ENCRYPTION option");
	}

	SQLWIRE_PROTOCOL_DEBUG_LOG(2, "DecodePrelogin: version %d.%d.%d, encryption %s", message.version.major,
	                           message.version.minor, message.version.build,
	                           EncryptionOptionToString(message.encryption));
	return message;
}

PreloginMessage TdsProtocol::DecodePrelogin(const std::vector<uint8_t> &data) {
	return DecodePrelogin(data.data(), data.size());
}

//===----------------------------------------------------------------------===//
// LOGIN7
//===----------------------------------------------------------------------===//

Login7Request::Login7Request()
    : tds_version(TDS_VERSION_7_4), packet_size(static_cast<uint32_t>(TDS_DEFAULT_PACKET_SIZE)),
      client_program_version(0), client_pid(0), connection_id(0) {
	std::memset(client_id, 0, sizeof(client_id));
}

std::vector<uint8_t> TdsProtocol::EncodePassword(const std::string &password) {
	std::vector<uint8_t> encoded = encoding::Utf16LEEncode(password);

	// Per MS-TDS: swap nibbles first, then XOR with 0xA5
	for (auto &byte : encoded) {
		byte = static_cast<uint8_t>(((byte << 4) & 0xF0) | ((byte >> 4) & 0x0F));
		byte ^= 0xA5;
	}
	return encoded;
}

// Variable-length LOGIN7 field: UTF-16LE bytes plus the character count written to the header
struct Login7Field {
	std::vector<uint8_t> bytes;
	uint16_t offset;

	uint16_t CharCount() const { return static_cast<uint16_t>(bytes.size() / 2); }
};

TdsPacket TdsProtocol::BuildLogin7(const Login7Request &request) {
	// Fields in wire order: HostName, UserName, Password, AppName, ServerName,
	// (Extension, unused), CltIntName, Language, Database
	enum { HOST, USER, PASSWORD, APP, SERVER, CLT_INT, LANGUAGE, DATABASE, FIELD_COUNT };
	Login7Field fields[FIELD_COUNT];
	fields[HOST].bytes = encoding::Utf16LEEncode(request.hostname);
	fields[USER].bytes = encoding::Utf16LEEncode(request.username);
	fields[PASSWORD].bytes = EncodePassword(request.password);
	fields[APP].bytes = encoding::Utf16LEEncode(request.app_name);
	fields[SERVER].bytes = encoding::Utf16LEEncode(request.server_name);
	fields[CLT_INT].bytes = encoding::Utf16LEEncode(request.client_interface_name);
	fields[LANGUAGE].bytes = encoding::Utf16LEEncode(request.language);
	fields[DATABASE].bytes = encoding::Utf16LEEncode(request.database);

	size_t var_offset = LOGIN7_HEADER_SIZE;
	uint16_t extension_offset = 0;
	for (int i = 0; i < FIELD_COUNT; i++) {
		if (i == CLT_INT) {
			extension_offset = static_cast<uint16_t>(var_offset);
		}
		fields[i].offset = static_cast<uint16_t>(var_offset);
		var_offset += fields[i].bytes.size();
	}
	// SSPI, AtchDBFile and ChangePassword are empty and point at the end
	uint16_t tail_offset = static_cast<uint16_t>(var_offset);
	uint32_t total_length = static_cast<uint32_t>(var_offset);

	TdsPacket packet(PacketType::LOGIN7);

	// Offset 0: Length
	packet.AppendUInt32LE(total_length);
	// Offset 4: TDSVersion
	packet.AppendUInt32LE(request.tds_version);
	// Offset 8: PacketSize
	packet.AppendUInt32LE(request.packet_size);
	// Offset 12: ClientProgVer
	packet.AppendUInt32LE(request.client_program_version);
	// Offset 16: ClientPID
	packet.AppendUInt32LE(request.client_pid);
	// Offset 20: ConnectionID
	packet.AppendUInt32LE(request.connection_id);

	// Offset 24: OptionFlags1 = USE_DB | SET_LANG
	packet.AppendByte(0x20 | 0x80);
	// Offset 25: OptionFlags2 = fODBC (ANSI session defaults)
	packet.AppendByte(0x02);
	// Offset 26: TypeFlags
	packet.AppendByte(0x00);
	// Offset 27: OptionFlags3
	packet.AppendByte(0x00);
	// Offset 28: ClientTimeZone
	packet.AppendUInt32LE(0);
	// Offset 32: ClientLCID (en-US)
	packet.AppendUInt32LE(0x0409);

	// Offset 36: offset / character count pairs
	for (int i = HOST; i <= SERVER; i++) {
		packet.AppendUInt16LE(fields[i].offset);
		packet.AppendUInt16LE(fields[i].CharCount());
	}
	// Extension (unused)
	packet.AppendUInt16LE(extension_offset);
	packet.AppendUInt16LE(0);
	for (int i = CLT_INT; i <= DATABASE; i++) {
		packet.AppendUInt16LE(fields[i].offset);
		packet.AppendUInt16LE(fields[i].CharCount());
	}

	// ClientID
	packet.AppendPayload(request.client_id, sizeof(request.client_id));

	// SSPI
	packet.AppendUInt16LE(tail_offset);
	packet.AppendUInt16LE(0);
	// AtchDBFile
	packet.AppendUInt16LE(tail_offset);
	packet.AppendUInt16LE(0);
	// ChangePassword
	packet.AppendUInt16LE(tail_offset);
	packet.AppendUInt16LE(0);
	// cbSSPILong
	packet.AppendUInt32LE(0);

	// Variable data
	for (int i = 0; i < FIELD_COUNT; i++) {
		packet.AppendPayload(fields[i].bytes);
	}

	SQLWIRE_PROTOCOL_DEBUG_LOG(2, "BuildLogin7: %u bytes, user='%s', database='%s', packet_size=%u", total_length,
	                           request.username.c_str(), request.database.c_str(), request.packet_size);
	return packet;
}

//===----------------------------------------------------------------------===//
// SQL_BATCH
//===----------------------------------------------------------------------===//

TdsPacket TdsProtocol::BuildSqlBatch(const std::string &sql, uint64_t transaction_descriptor) {
	TdsPacket packet(PacketType::SQL_BATCH);

	// ALL_HEADERS (MS-TDS 2.2.5.3):
	//   TotalLength (4 bytes) = 4 + 18
	//   Transaction Descriptor Header:
	//     HeaderLength (4 bytes) = 18
	//     HeaderType (2 bytes) = 0x0002
	//     TransactionDescriptor (8 bytes)
	//     OutstandingRequestCount (4 bytes) = 1
	packet.AppendUInt32LE(22);
	packet.AppendUInt32LE(18);
	packet.AppendUInt16LE(0x0002);
	packet.AppendUInt64LE(transaction_descriptor);
	packet.AppendUInt32LE(1);

	// SQL text encoded as UTF-16LE
	packet.AppendUTF16LE(sql);
	return packet;
}

}  // namespace tds
}  // namespace sqlwire
