//===----------------------------------------------------------------------===//
//                         sqlwire
//
// tds_tls_context.hpp
//
// TLS session using mbedTLS for encrypted TDS connections
//===----------------------------------------------------------------------===//

#pragma once

#include "tds/tds_byte_stream.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace sqlwire {
namespace tds {

// TLS error codes for distinct error handling
enum class TlsErrorCode {
	NONE = 0,
	INIT_FAILED,         // mbedTLS initialization error
	CA_LOAD_FAILED,      // Root certificate file could not be parsed
	HANDSHAKE_FAILED,    // TLS handshake error
	HANDSHAKE_TIMEOUT,   // TLS handshake timed out
	CERT_VERIFY_FAILED,  // Server certificate rejected
	SEND_FAILED,         // TLS write error
	RECV_FAILED,         // TLS read error
	NOT_INITIALIZED,     // TLS context not initialized
	PEER_CLOSED          // Peer closed connection gracefully
};

// Convert TLS error code to string
const char *TlsErrorCodeToString(TlsErrorCode code);

// Certificate trust settings for one session
struct TlsOptions {
	// Skip server certificate verification entirely
	bool trust_server_certificate;
	// PEM file with trusted root certificates (empty = system bundle)
	std::string ca_file;
	// Name sent as SNI and matched against the certificate
	std::string hostname;

	TlsOptions() : trust_server_certificate(true) {}
};

// Forward declaration for PIMPL
struct TlsTdsContextImpl;

// mbedTLS client session running over another byte stream.
// During the TDS handshake the transport is a PreloginTlsStream that wraps
// records in PRELOGIN packets; afterwards it is a passthrough to the socket.
// The session itself is a byte stream carrying TDS packets.
class TlsTdsContext : public TdsByteStream {
public:
	TlsTdsContext();
	~TlsTdsContext() override;

	// Non-copyable
	TlsTdsContext(const TlsTdsContext &) = delete;
	TlsTdsContext &operator=(const TlsTdsContext &) = delete;

	// Initialize TLS context (entropy, RNG, config, trust anchors)
	bool Initialize(const TlsOptions &options);

	// Bind the session to the transport it runs over (not owned)
	bool Attach(TdsByteStream *transport);

	// Perform TLS handshake
	// Returns true on success, false on failure (check GetLastError)
	bool Handshake(int timeout_ms = 30000);

	// TdsByteStream (valid after a successful handshake)
	bool Send(const uint8_t *data, size_t length) override;
	bool Flush() override;
	ssize_t Receive(uint8_t *buffer, size_t max_length, int timeout_ms) override;
	const std::string &GetLastError() const override;

	// Send close_notify and free resources
	void Close();

	// Free resources without close_notify; the peer continues in plaintext
	void Abandon();

	bool IsHandshakeComplete() const;
	TlsErrorCode GetLastErrorCode() const;

	// Negotiated cipher suite / protocol version (for logging)
	std::string GetCipherSuite() const;
	std::string GetTlsVersion() const;

private:
	// PIMPL - keeps mbedTLS types out of the header
	std::unique_ptr<TlsTdsContextImpl> impl_;
};

}  // namespace tds
}  // namespace sqlwire
