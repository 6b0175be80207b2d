#include "tds/tds_connection.hpp"
#include "tds/tds_socket.hpp"
#include "tds/tds_ssrp.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace {

// Get local hostname for LOGIN7 HostName field (client workstation name)
std::string GetClientHostname() {
#if defined(_WIN32)
	char hostname[256];
	DWORD size = sizeof(hostname);
	if (GetComputerNameExA(ComputerNameDnsHostname, hostname, &size)) {
		return std::string(hostname);
	}
	// Fallback to NetBIOS name
	size = sizeof(hostname);
	if (GetComputerNameA(hostname, &size)) {
		return std::string(hostname);
	}
	return "sqlwire-client";
#else
	char hostname[256];
	if (gethostname(hostname, sizeof(hostname)) == 0) {
		hostname[sizeof(hostname) - 1] = '\0';  // Ensure null termination
		return std::string(hostname);
	}
	return "sqlwire-client";  // Fallback if hostname lookup fails
#endif
}

}  // anonymous namespace

// Debug logging
static int GetSqlwireDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLWIRE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLWIRE_CONN_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                \
		if (GetSqlwireDebugLevel() >= lvl)                              \
			fprintf(stderr, "[SQLWIRE CONN] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlwire {
namespace tds {

// Client version reported in PRELOGIN
static const PreloginVersion CLIENT_PRELOGIN_VERSION(1, 0, 0, 0);

// Client interface name reported in LOGIN7 when none is configured
static const char *DEFAULT_CLIENT_INTERFACE_NAME = "sqlwire";

const char *EncryptionModeToString(EncryptionMode mode) {
	switch (mode) {
	case EncryptionMode::None:
		return "None";
	case EncryptionMode::LoginOnly:
		return "LoginOnly";
	case EncryptionMode::Full:
		return "Full";
	default:
		return "Unknown";
	}
}

TdsConnection::TdsConnection()
    : state_(ConnectionState::Disconnected), encryption_mode_(EncryptionMode::None),
      last_error_kind_(TdsErrorKind::Io) {}

TdsConnection::~TdsConnection() {
	Close();
}

bool TdsConnection::Fail(const std::string &context, const std::string &message, TdsErrorKind kind) {
	last_error_ = context + ": " + message;
	last_error_kind_ = kind;
	SQLWIRE_CONN_DEBUG_LOG(1, "%s failed (%s): %s", context.c_str(), TdsErrorKindToString(kind), message.c_str());
	Close();
	return false;
}

void TdsConnection::RecordServerError(const TdsError &error) {
	last_server_error_ = error;
	last_error_kind_ = TdsErrorKind::Database;
}

bool TdsConnection::Connect(const ConnectOptions &options) {
	// Can only connect from Disconnected state
	ConnectionState expected = ConnectionState::Disconnected;
	if (!state_.compare_exchange_strong(expected, ConnectionState::Authenticating)) {
		last_error_ = "Invalid state for Connect: " + std::string(ConnectionStateToString(expected));
		last_error_kind_ = TdsErrorKind::Config;
		return false;
	}

	options_ = options;
	last_error_.clear();
	encryption_mode_ = EncryptionMode::None;

	uint16_t port = options_.port;
	try {
		options_.Validate();
		if (!options_.instance.empty()) {
			port = SsrpClient::ResolveInstancePort(options_.host, options_.instance);
		}
	} catch (const TdsException &ex) {
		return Fail("Connect", ex.what(), ex.GetKind());
	}

	std::unique_ptr<TdsSocket> socket(new TdsSocket());
	if (!socket->Connect(options_.host, port, options_.connect_timeout)) {
		return Fail("Connect to " + options_.GetServerDescription(), socket->GetLastError(), TdsErrorKind::Io);
	}

	MessageStreamConfig config;
	config.read_timeout_ms = options_.read_timeout * 1000;
	stream_.reset(new MessageStream(std::move(socket), config));

	// Stay in Authenticating state - caller must call Authenticate
	return true;
}

bool TdsConnection::Attach(std::unique_ptr<TdsByteStream> transport, const ConnectOptions &options) {
	ConnectionState expected = ConnectionState::Disconnected;
	if (!state_.compare_exchange_strong(expected, ConnectionState::Authenticating)) {
		last_error_ = "Invalid state for Attach: " + std::string(ConnectionStateToString(expected));
		last_error_kind_ = TdsErrorKind::Config;
		return false;
	}

	options_ = options;
	last_error_.clear();
	encryption_mode_ = EncryptionMode::None;

	MessageStreamConfig config;
	config.read_timeout_ms = options_.read_timeout * 1000;
	stream_.reset(new MessageStream(std::move(transport), config));
	return true;
}

EncryptionMode TdsConnection::DecideEncryption(EncryptionOption client, EncryptionOption server) {
	if (server == EncryptionOption::ENCRYPT_REQ || server == EncryptionOption::ENCRYPT_ON) {
		return EncryptionMode::Full;
	}
	if (client == EncryptionOption::ENCRYPT_REQ) {
		throw TdsException(TdsErrorKind::Tls, std::string("TLS encryption required but not supported by server (") +
		                                          EncryptionOptionToString(server) + ")");
	}
	// A side without TLS support rules out the login-only handshake
	if (client == EncryptionOption::ENCRYPT_NOT_SUP || server == EncryptionOption::ENCRYPT_NOT_SUP) {
		return EncryptionMode::None;
	}
	// Server OFF with client OFF or ON: LOGIN7 travels inside TLS, the rest in clear
	return EncryptionMode::LoginOnly;
}

bool TdsConnection::Authenticate() {
	// Must be in Authenticating state
	if (state_.load() != ConnectionState::Authenticating || !stream_) {
		last_error_ = "Cannot authenticate: not in Authenticating state";
		last_error_kind_ = TdsErrorKind::Config;
		return false;
	}

	try {
		// Step 1: PRELOGIN handshake (negotiates encryption)
		DoPrelogin();
		// Step 2: LOGIN7 authentication
		DoLogin7();
	} catch (const TdsDatabaseException &ex) {
		RecordServerError(ex.GetError());
		return Fail("Authentication failed", ex.what(), TdsErrorKind::Database);
	} catch (const TdsException &ex) {
		return Fail("Authentication failed", ex.what(), ex.GetKind());
	}

	// Success - transition to Idle
	state_.store(ConnectionState::Idle);
	return true;
}

void TdsConnection::DoPrelogin() {
	PreloginMessage prelogin;
	prelogin.has_version = true;
	prelogin.version = CLIENT_PRELOGIN_VERSION;
	prelogin.has_encryption = true;
	prelogin.encryption = options_.encrypt;
	if (!options_.instance.empty()) {
		prelogin.has_instance = true;
		prelogin.instance = options_.instance;
	}
	prelogin.has_mars = true;
	prelogin.mars = false;

	SQLWIRE_CONN_DEBUG_LOG(1, "DoPrelogin: requesting encryption=%s", EncryptionOptionToString(options_.encrypt));
	stream_->WriteMessage(TdsProtocol::BuildPrelogin(prelogin));
	stream_->Flush();

	std::vector<uint8_t> response = stream_->ReceivePacketSequence();
	server_prelogin_ = TdsProtocol::DecodePrelogin(response);

	SQLWIRE_CONN_DEBUG_LOG(1, "DoPrelogin: server version=%d.%d.%d, encryption=%s", server_prelogin_.version.major,
	                       server_prelogin_.version.minor, server_prelogin_.version.build,
	                       EncryptionOptionToString(server_prelogin_.encryption));

	encryption_mode_ = DecideEncryption(options_.encrypt, server_prelogin_.encryption);
	if (encryption_mode_ == EncryptionMode::None) {
		SQLWIRE_CONN_DEBUG_LOG(1, "DoPrelogin: WARNING connection is not encrypted, password is sent in clear");
		return;
	}

	TlsOptions tls;
	tls.trust_server_certificate = options_.trust_server_certificate;
	tls.ca_file = options_.ssl_root_cert;
	tls.hostname = options_.GetCertificateHostname();
	stream_->SetupEncryption(tls, options_.connect_timeout * 1000);
	if (encryption_mode_ == EncryptionMode::LoginOnly) {
		SQLWIRE_CONN_DEBUG_LOG(1, "DoPrelogin: TLS enabled for login, data packets will be unencrypted");
	} else {
		SQLWIRE_CONN_DEBUG_LOG(1, "DoPrelogin: TLS enabled");
	}
}

Login7Request TdsConnection::BuildLoginRequest() const {
	Login7Request request;
	request.packet_size = options_.packet_size;
	request.client_program_version = options_.client_program_version;
	request.client_pid = options_.client_pid;
	request.hostname = options_.hostname.empty() ? GetClientHostname() : options_.hostname;
	request.username = options_.username;
	request.password = options_.has_password ? options_.password : std::string();
	request.app_name = options_.app_name;
	request.server_name = options_.server_name.empty() ? options_.host : options_.server_name;
	request.client_interface_name =
	    options_.client_interface_name.empty() ? DEFAULT_CLIENT_INTERFACE_NAME : options_.client_interface_name;
	request.language = options_.language;
	request.database = options_.database;
	return request;
}

void TdsConnection::DoLogin7() {
	SQLWIRE_CONN_DEBUG_LOG(1, "DoLogin7: starting authentication for user='%s', db='%s'", options_.username.c_str(),
	                       options_.database.c_str());

	stream_->WriteMessage(TdsProtocol::BuildLogin7(BuildLoginRequest()));
	stream_->Flush();

	// The server answers LOGIN7 in clear once the login packet is through
	if (encryption_mode_ == EncryptionMode::LoginOnly) {
		stream_->DisableEncryption();
		SQLWIRE_CONN_DEBUG_LOG(1, "DoLogin7: TLS disabled after login packet");
	}

	// ERROR tokens surface as TdsDatabaseException and abort the login
	while (true) {
		TdsMessage message = stream_->ReceiveNextMessage();
		if (message.type == MessageType::LoginAck) {
			login_ack_ = message.login_ack;
			SQLWIRE_CONN_DEBUG_LOG(1, "DoLogin7: LOGINACK from %s %s, tds_version=0x%08x",
			                       login_ack_.program_name.c_str(), login_ack_.GetVersionString().c_str(),
			                       login_ack_.tds_version);
		} else if (message.type == MessageType::Done) {
			break;
		} else {
			SQLWIRE_CONN_DEBUG_LOG(2, "DoLogin7: ignoring %s", MessageTypeToString(message.type));
		}
	}

	SQLWIRE_CONN_DEBUG_LOG(1, "DoLogin7: authentication successful, packet_size=%zu", stream_->GetMaxPacketSize());
}

bool TdsConnection::ExecuteBatch(const std::string &sql) {
	// Can only execute from Idle state
	ConnectionState expected = ConnectionState::Idle;
	if (!state_.compare_exchange_strong(expected, ConnectionState::Executing)) {
		last_error_ =
		    "Cannot execute: connection not in Idle state (current: " + std::string(ConnectionStateToString(expected)) +
		    ")";
		last_error_kind_ = TdsErrorKind::Config;
		return false;
	}

	try {
		pending_.WaitUntilReady(*stream_);
		pending_.Increment();
		stream_->WriteMessage(TdsProtocol::BuildSqlBatch(sql, stream_->GetTransactionDescriptor()));
		stream_->Flush();
	} catch (const TdsException &ex) {
		return Fail("ExecuteBatch", ex.what(), ex.GetKind());
	}

	SQLWIRE_CONN_DEBUG_LOG(1, "ExecuteBatch: sent %zu chars, packet_size=%zu, transaction=0x%016llx", sql.size(),
	                       stream_->GetMaxPacketSize(),
	                       static_cast<unsigned long long>(stream_->GetTransactionDescriptor()));
	return true;
}

bool TdsConnection::NextMessage(TdsMessage &message) {
	if (state_.load() != ConnectionState::Executing || !stream_) {
		last_error_ = "No results pending (state: " + std::string(ConnectionStateToString(state_.load())) + ")";
		last_error_kind_ = TdsErrorKind::Config;
		return false;
	}

	try {
		message = stream_->ReceiveNextMessage();
	} catch (const TdsDatabaseException &ex) {
		// Server error: the batch continues and the connection stays usable
		last_error_ = ex.what();
		RecordServerError(ex.GetError());
		return false;
	} catch (const TdsException &ex) {
		return Fail("NextMessage", ex.what(), ex.GetKind());
	}

	if (pending_.OnMessage(message) && pending_.IsReady()) {
		TransitionState(ConnectionState::Executing, ConnectionState::Idle);
	}
	return true;
}

bool TdsConnection::WaitUntilReady() {
	ConnectionState current = state_.load();
	if (current == ConnectionState::Idle) {
		return true;
	}
	if (current != ConnectionState::Executing || !stream_) {
		last_error_ = "Cannot wait: connection not executing (state: " + std::string(ConnectionStateToString(current)) +
		              ")";
		last_error_kind_ = TdsErrorKind::Config;
		return false;
	}

	try {
		pending_.WaitUntilReady(*stream_);
	} catch (const TdsException &ex) {
		return Fail("WaitUntilReady", ex.what(), ex.GetKind());
	}

	TransitionState(ConnectionState::Executing, ConnectionState::Idle);
	return true;
}

void TdsConnection::Close() {
	if (stream_) {
		stream_->Close();
		stream_.reset();
	}
	pending_.Reset();
	state_.store(ConnectionState::Disconnected);
}

bool TdsConnection::IsAlive() const {
	ConnectionState current = state_.load(std::memory_order_acquire);
	return current != ConnectionState::Disconnected && stream_ && stream_->IsOpen();
}

bool TdsConnection::TransitionState(ConnectionState from, ConnectionState to) {
	return state_.compare_exchange_strong(from, to);
}

}  // namespace tds
}  // namespace sqlwire
