#pragma once

#include "tds_platform.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace sqlwire {
namespace tds {

// Duplex byte stream the engine layers on: TCP socket, PRELOGIN envelope
// adapter and TLS session all implement it.
class TdsByteStream {
public:
	virtual ~TdsByteStream() = default;

	// Write all bytes (implementations may buffer until Flush)
	// Returns false on failure (check GetLastError())
	virtual bool Send(const uint8_t *data, size_t length) = 0;

	// Push buffered bytes to the peer
	virtual bool Flush() = 0;

	// Receive up to max_length bytes
	// Returns number of bytes received, 0 on timeout, -1 on error or peer close
	virtual ssize_t Receive(uint8_t *buffer, size_t max_length, int timeout_ms) = 0;

	virtual const std::string &GetLastError() const = 0;
};

}  // namespace tds
}  // namespace sqlwire
