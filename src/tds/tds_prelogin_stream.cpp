#include "tds/tds_prelogin_stream.hpp"
#include "tds/tds_error.hpp"
#include "tds/tds_packet.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

// Debug logging
static int GetSqlwireDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLWIRE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLWIRE_PRELOGIN_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                    \
		if (GetSqlwireDebugLevel() >= lvl)                                  \
			fprintf(stderr, "[SQLWIRE PRELOGIN] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlwire {
namespace tds {

PreloginTlsStream::PreloginTlsStream(std::unique_ptr<TdsByteStream> inner)
    : inner_(std::move(inner)), mode_(Mode::Transparent), header_written_(false), read_remaining_(0) {
}

void PreloginTlsStream::StartHandshake() {
	mode_ = Mode::HandshakePending;
	write_buffer_.clear();
	header_written_ = false;
	read_remaining_ = 0;
}

void PreloginTlsStream::HandshakeComplete() {
	if (!write_buffer_.empty()) {
		SQLWIRE_PRELOGIN_DEBUG_LOG(1, "HandshakeComplete: dropping %zu unflushed bytes", write_buffer_.size());
	}
	mode_ = Mode::Transparent;
	write_buffer_.clear();
	header_written_ = false;
	read_remaining_ = 0;
}

bool PreloginTlsStream::Send(const uint8_t *data, size_t length) {
	if (mode_ == Mode::Transparent) {
		if (!inner_->Send(data, length)) {
			last_error_ = inner_->GetLastError();
			return false;
		}
		return true;
	}

	write_buffer_.insert(write_buffer_.end(), data, data + length);
	SQLWIRE_PRELOGIN_DEBUG_LOG(2, "Send: buffered %zu bytes (buffer now has %zu)", length, write_buffer_.size());
	return true;
}

bool PreloginTlsStream::Flush() {
	if (mode_ == Mode::HandshakePending && !write_buffer_.empty() && !header_written_) {
		std::vector<uint8_t> packets =
		    PacketCodec::WritePackets(write_buffer_, TDS_PRELOGIN_TLS_PACKET_SIZE, PacketType::PRELOGIN);
		header_written_ = true;

		SQLWIRE_PRELOGIN_DEBUG_LOG(2, "Flush: sending %zu TLS bytes in %zu bytes of PRELOGIN packets",
		                           write_buffer_.size(), packets.size());
		if (!inner_->Send(packets.data(), packets.size())) {
			last_error_ = inner_->GetLastError();
			return false;
		}
		write_buffer_.clear();
		header_written_ = false;
	}

	if (!inner_->Flush()) {
		last_error_ = inner_->GetLastError();
		return false;
	}
	return true;
}

ssize_t PreloginTlsStream::Receive(uint8_t *buffer, size_t max_length, int timeout_ms) {
	if (mode_ == Mode::Transparent) {
		ssize_t n = inner_->Receive(buffer, max_length, timeout_ms);
		if (n < 0) {
			last_error_ = inner_->GetLastError();
		}
		return n;
	}

	// Header-only packets carry no TLS bytes; keep reading until a body shows up
	while (read_remaining_ == 0) {
		uint8_t header_bytes[TDS_HEADER_SIZE];
		if (!ReadExact(header_bytes, TDS_HEADER_SIZE, timeout_ms)) {
			return -1;
		}
		try {
			PacketHeader header = PacketCodec::ReadHeader(header_bytes);
			read_remaining_ = header.PayloadLength();
			SQLWIRE_PRELOGIN_DEBUG_LOG(2, "Receive: %s packet with %zu body bytes",
			                           PacketTypeToString(header.type), read_remaining_);
		} catch (const TdsException &e) {
			last_error_ = e.what();
			return -1;
		}
	}

	size_t want = std::min(read_remaining_, max_length);
	ssize_t n = inner_->Receive(buffer, want, timeout_ms);
	if (n < 0) {
		last_error_ = inner_->GetLastError();
		return -1;
	}
	read_remaining_ -= static_cast<size_t>(n);
	return n;
}

bool PreloginTlsStream::ReadExact(uint8_t *buffer, size_t length, int timeout_ms) {
	size_t total = 0;
	while (total < length) {
		ssize_t n = inner_->Receive(buffer + total, length - total, timeout_ms);
		if (n < 0) {
			last_error_ = inner_->GetLastError();
			return false;
		}
		if (n == 0) {
			last_error_ = "Timed out reading PRELOGIN packet header";
			return false;
		}
		total += static_cast<size_t>(n);
	}
	return true;
}

}  // namespace tds
}  // namespace sqlwire
