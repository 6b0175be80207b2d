#pragma once

#include "tds_byte_stream.hpp"
#include "tds_types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sqlwire {
namespace tds {

// Byte stream shim between the TLS engine and the transport.
//
// While the TLS handshake is pending, the server expects every TLS record
// inside PRELOGIN packets: writes are collected and wrapped on Flush, reads
// strip the 8-byte packet header and serve the packet body. Once the
// handshake completes the stream is transparent and TLS records flow
// directly over the inner stream.
class PreloginTlsStream : public TdsByteStream {
public:
	enum class Mode : uint8_t {
		Transparent = 0,
		HandshakePending = 1
	};

	explicit PreloginTlsStream(std::unique_ptr<TdsByteStream> inner);

	void StartHandshake();
	void HandshakeComplete();
	bool IsHandshakePending() const { return mode_ == Mode::HandshakePending; }

	// TdsByteStream
	bool Send(const uint8_t *data, size_t length) override;
	bool Flush() override;
	ssize_t Receive(uint8_t *buffer, size_t max_length, int timeout_ms) override;
	const std::string &GetLastError() const override { return last_error_; }

	TdsByteStream &GetInner() { return *inner_; }

private:
	// Read exactly length bytes from the inner stream
	bool ReadExact(uint8_t *buffer, size_t length, int timeout_ms);

	std::unique_ptr<TdsByteStream> inner_;
	Mode mode_;

	std::vector<uint8_t> write_buffer_;  // TLS bytes awaiting a PRELOGIN envelope
	bool header_written_;                // write_buffer_ already wrapped in this cycle
	size_t read_remaining_;              // Body bytes left in the current inbound packet

	std::string last_error_;
};

}  // namespace tds
}  // namespace sqlwire
