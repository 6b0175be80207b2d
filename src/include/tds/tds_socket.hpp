#pragma once

#include "tds_byte_stream.hpp"
#include "tds_types.hpp"
#include <string>

namespace sqlwire {
namespace tds {

// Largest length handed to one send()/recv() call (Winsock lengths are int)
constexpr size_t TDS_MAX_SOCKET_IO_LENGTH = 0x7FFFFFFF;

// Low-level TCP socket wrapper for TDS connections
// Blocking I/O with poll-based timeouts; TLS is layered on top by the message stream
class TdsSocket : public TdsByteStream {
public:
	TdsSocket();
	~TdsSocket() override;

	// Non-copyable
	TdsSocket(const TdsSocket &) = delete;
	TdsSocket &operator=(const TdsSocket &) = delete;

	// Connection management
	bool Connect(const std::string &host, uint16_t port, int timeout_seconds);
	void Close();
	bool IsConnected() const;

	// TdsByteStream
	bool Send(const uint8_t *data, size_t length) override;
	bool Flush() override;
	ssize_t Receive(uint8_t *buffer, size_t max_length, int timeout_ms) override;
	const std::string &GetLastError() const override { return last_error_; }

	// Connection info
	const std::string &GetHost() const { return host_; }
	uint16_t GetPort() const { return port_; }
	int GetSocketFd() const { return fd_; }

	// Bytes to pass to a single socket call for a request of length bytes
	static size_t ClampIoLength(size_t length) {
		return length < TDS_MAX_SOCKET_IO_LENGTH ? length : TDS_MAX_SOCKET_IO_LENGTH;
	}

private:
	int fd_;                  // Socket file descriptor (-1 if closed)
	std::string host_;        // Remote hostname
	uint16_t port_;           // Remote port
	bool connected_;          // Connection status
	std::string last_error_;  // Last error message

	// Helper to set non-blocking mode
	bool SetNonBlocking(bool enable);

	// Helper to wait for socket ready (poll)
	bool WaitForReady(bool for_write, int timeout_ms);
};

}  // namespace tds
}  // namespace sqlwire
