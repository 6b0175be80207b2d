#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "tds_byte_stream.hpp"
#include "tds_connect_options.hpp"
#include "tds_error.hpp"
#include "tds_message.hpp"
#include "tds_message_stream.hpp"
#include "tds_pending_results.hpp"
#include "tds_protocol.hpp"
#include "tds_types.hpp"

namespace sqlwire {
namespace tds {

// Outcome of the PRELOGIN encryption negotiation
enum class EncryptionMode : uint8_t {
	None = 0,       // Plaintext for the whole session
	LoginOnly = 1,  // TLS carries LOGIN7 only, later traffic is plaintext
	Full = 2        // TLS for the whole session
};

const char *EncryptionModeToString(EncryptionMode mode);

// Represents a single TDS connection to SQL Server
//
// Disconnected -> Authenticating -> Idle <-> Executing, transitions by
// compare-and-exchange. Operations return false on failure and record
// GetLastError() / GetLastErrorKind(); only server errors (Database) leave
// the connection usable, every other failure closes it.
class TdsConnection {
public:
	TdsConnection();
	~TdsConnection();

	// Non-copyable
	TdsConnection(const TdsConnection &) = delete;
	TdsConnection &operator=(const TdsConnection &) = delete;

	// Connection establishment
	// Resolves a named instance through SSRP, then opens the TCP connection
	bool Connect(const ConnectOptions &options);

	// Use an already-open byte stream as transport instead of TCP
	bool Attach(std::unique_ptr<TdsByteStream> transport, const ConnectOptions &options);

	// PRELOGIN, optional TLS upgrade, LOGIN7 and login response
	bool Authenticate();

	// Submit a SQL batch; results are read with NextMessage()
	bool ExecuteBatch(const std::string &sql);

	// Read the next message of the current batch.
	// Returns false on error; a server ERROR token reports kind Database and the
	// remaining messages (the closing DONE) can still be read.
	bool NextMessage(TdsMessage &message);

	// Drain all pending results so the connection is Idle again
	bool WaitUntilReady();

	// Close connection
	void Close();

	// Quick state check - no I/O, just checks internal state
	bool IsAlive() const;

	// State management
	ConnectionState GetState() const {
		return state_.load(std::memory_order_acquire);
	}

	// Attempt state transition (thread-safe)
	bool TransitionState(ConnectionState from, ConnectionState to);

	// Encryption outcome of a PRELOGIN exchange.
	// Throws TdsException(Tls) when the client requires encryption the server cannot offer.
	static EncryptionMode DecideEncryption(EncryptionOption client, EncryptionOption server);

	// Getters
	const ConnectOptions &GetOptions() const {
		return options_;
	}
	const std::string &GetLastError() const {
		return last_error_;
	}
	TdsErrorKind GetLastErrorKind() const {
		return last_error_kind_;
	}
	// Details of the last ERROR token (valid when GetLastErrorKind() == Database)
	const TdsError &GetLastServerError() const {
		return last_server_error_;
	}
	const LoginAckToken &GetLoginAck() const {
		return login_ack_;
	}
	const PreloginMessage &GetServerPrelogin() const {
		return server_prelogin_;
	}
	size_t GetPendingCount() const {
		return pending_.GetPendingCount();
	}
	bool IsTlsEnabled() const {
		return stream_ && stream_->IsEncrypted();
	}
	EncryptionMode GetEncryptionMode() const {
		return encryption_mode_;
	}
	uint64_t GetTransactionDescriptor() const {
		return stream_ ? stream_->GetTransactionDescriptor() : 0;
	}
	size_t GetPacketSize() const {
		return stream_ ? stream_->GetMaxPacketSize() : TDS_DEFAULT_PACKET_SIZE;
	}

private:
	// Internal helpers
	void DoPrelogin();
	void DoLogin7();
	Login7Request BuildLoginRequest() const;

	// Record a failure, close the transport, return false
	bool Fail(const std::string &context, const std::string &message, TdsErrorKind kind);
	void RecordServerError(const TdsError &error);

	ConnectOptions options_;
	std::unique_ptr<MessageStream> stream_;
	PendingResultTracker pending_;
	std::atomic<ConnectionState> state_;

	LoginAckToken login_ack_;
	PreloginMessage server_prelogin_;
	EncryptionMode encryption_mode_;

	// Error tracking
	std::string last_error_;
	TdsErrorKind last_error_kind_;
	TdsError last_server_error_;
};

}  // namespace tds
}  // namespace sqlwire
