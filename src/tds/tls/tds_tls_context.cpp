//===----------------------------------------------------------------------===//
//                         sqlwire
//
// tds_tls_context.cpp
//
// TLS session using mbedTLS. All record I/O goes through the attached
// TdsByteStream so the same session works before and after the PRELOGIN
// envelope is dropped.
//===----------------------------------------------------------------------===//

#include "tds/tls/tds_tls_context.hpp"

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/debug.h>
#include <mbedtls/entropy.h>
#include <mbedtls/error.h>
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <mbedtls/x509_crt.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

// Debug logging controlled by SQLWIRE_DEBUG environment variable
static int GetSqlwireDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLWIRE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLWIRE_TLS_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                               \
		if (GetSqlwireDebugLevel() >= lvl)                             \
			fprintf(stderr, "[SQLWIRE TLS] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlwire {
namespace tds {

// System trust store used when no root certificate file is configured
static const char *DEFAULT_CA_PATH = "/etc/ssl/certs";

const char *TlsErrorCodeToString(TlsErrorCode code) {
	switch (code) {
	case TlsErrorCode::NONE:
		return "No error";
	case TlsErrorCode::INIT_FAILED:
		return "TLS initialization failed";
	case TlsErrorCode::CA_LOAD_FAILED:
		return "Failed to load root certificates";
	case TlsErrorCode::HANDSHAKE_FAILED:
		return "TLS handshake failed";
	case TlsErrorCode::HANDSHAKE_TIMEOUT:
		return "TLS handshake timed out";
	case TlsErrorCode::CERT_VERIFY_FAILED:
		return "Server certificate verification failed";
	case TlsErrorCode::SEND_FAILED:
		return "TLS send failed";
	case TlsErrorCode::RECV_FAILED:
		return "TLS receive failed";
	case TlsErrorCode::NOT_INITIALIZED:
		return "TLS not initialized";
	case TlsErrorCode::PEER_CLOSED:
		return "Server closed TLS connection";
	default:
		return "Unknown TLS error";
	}
}

struct TlsTdsContextImpl {
	mbedtls_ssl_context ssl;
	mbedtls_ssl_config conf;
	mbedtls_ctr_drbg_context ctr_drbg;
	mbedtls_entropy_context entropy;
	mbedtls_x509_crt ca_chain;

	bool initialized;
	bool handshake_complete;
	TdsByteStream *transport;
	int current_timeout_ms;  // Timeout for the current read
	std::string last_error;
	TlsErrorCode last_error_code;
	std::string transport_error;  // Last failure reported by the transport

	TlsTdsContextImpl()
	    : initialized(false), handshake_complete(false), transport(nullptr), current_timeout_ms(30000),
	      last_error_code(TlsErrorCode::NONE) {
		Init();
	}

	~TlsTdsContextImpl() {
		Free();
	}

	void Init() {
		mbedtls_ssl_init(&ssl);
		mbedtls_ssl_config_init(&conf);
		mbedtls_ctr_drbg_init(&ctr_drbg);
		mbedtls_entropy_init(&entropy);
		mbedtls_x509_crt_init(&ca_chain);
	}

	void Free() {
		mbedtls_ssl_free(&ssl);
		mbedtls_ssl_config_free(&conf);
		mbedtls_x509_crt_free(&ca_chain);
		mbedtls_ctr_drbg_free(&ctr_drbg);
		mbedtls_entropy_free(&entropy);
	}

	void SetError(TlsErrorCode code, const std::string &message) {
		last_error_code = code;
		last_error = message;
		if (!transport_error.empty()) {
			last_error += " (" + transport_error + ")";
		}
	}
};

// Helper to format mbedTLS error
static std::string FormatMbedTlsError(int ret) {
	char buf[256];
	mbedtls_strerror(ret, buf, sizeof(buf));
	return std::string(buf);
}

// mbedTLS debug callback
static void MbedTlsDebugCallback(void *ctx, int level, const char *file, int line, const char *str) {
	(void)ctx;
	if (GetSqlwireDebugLevel() >= level + 1) {  // level is 0-4 in mbedTLS, map to our 1-5
		std::string msg(str);
		if (!msg.empty() && msg[msg.size() - 1] == '\n') {
			msg.erase(msg.size() - 1);
		}
		SQLWIRE_TLS_DEBUG_LOG(level + 1, "[mbedTLS %d] %s:%04d: %s", level, file, line, msg.c_str());
	}
}

//===----------------------------------------------------------------------===//
// BIO callbacks: map TdsByteStream results onto mbedTLS return codes.
// These run inside mbedTLS C code, so nothing here may throw.
//===----------------------------------------------------------------------===//

static int BioSend(void *ctx, const unsigned char *buf, size_t len) {
	auto *impl = static_cast<TlsTdsContextImpl *>(ctx);
	SQLWIRE_TLS_DEBUG_LOG(3, "BioSend: len=%zu", len);

	if (!impl->transport->Send(reinterpret_cast<const uint8_t *>(buf), len)) {
		impl->transport_error = impl->transport->GetLastError();
		return MBEDTLS_ERR_NET_SEND_FAILED;
	}
	return static_cast<int>(len);
}

static int ReceiveFromTransport(TlsTdsContextImpl *impl, unsigned char *buf, size_t len, int timeout_ms) {
	// Pending handshake records must reach the server before we wait for its reply
	if (!impl->transport->Flush()) {
		impl->transport_error = impl->transport->GetLastError();
		return -1;
	}
	ssize_t n = impl->transport->Receive(reinterpret_cast<uint8_t *>(buf), len, timeout_ms);
	if (n < 0) {
		impl->transport_error = impl->transport->GetLastError();
	}
	return static_cast<int>(n);
}

static int BioRecv(void *ctx, unsigned char *buf, size_t len) {
	auto *impl = static_cast<TlsTdsContextImpl *>(ctx);
	SQLWIRE_TLS_DEBUG_LOG(3, "BioRecv: len=%zu", len);

	int ret = ReceiveFromTransport(impl, buf, len, impl->current_timeout_ms);
	if (ret < 0) {
		return MBEDTLS_ERR_NET_RECV_FAILED;
	}
	if (ret == 0) {
		return MBEDTLS_ERR_SSL_WANT_READ;
	}
	return ret;
}

static int BioRecvTimeout(void *ctx, unsigned char *buf, size_t len, uint32_t timeout) {
	auto *impl = static_cast<TlsTdsContextImpl *>(ctx);
	int effective = impl->current_timeout_ms > 0 ? impl->current_timeout_ms : static_cast<int>(timeout);
	SQLWIRE_TLS_DEBUG_LOG(3, "BioRecvTimeout: len=%zu, timeout=%d", len, effective);

	int ret = ReceiveFromTransport(impl, buf, len, effective);
	if (ret < 0) {
		return MBEDTLS_ERR_NET_RECV_FAILED;
	}
	if (ret == 0) {
		return MBEDTLS_ERR_SSL_TIMEOUT;
	}
	return ret;
}

//===----------------------------------------------------------------------===//
// TlsTdsContext
//===----------------------------------------------------------------------===//

TlsTdsContext::TlsTdsContext() : impl_(new TlsTdsContextImpl()) {}

TlsTdsContext::~TlsTdsContext() {
	Close();
}

bool TlsTdsContext::Initialize(const TlsOptions &options) {
	SQLWIRE_TLS_DEBUG_LOG(1, "Initialize: trust_server_certificate=%s, ca_file=%s, hostname=%s",
	                      options.trust_server_certificate ? "true" : "false",
	                      options.ca_file.empty() ? "(system)" : options.ca_file.c_str(),
	                      options.hostname.empty() ? "(none)" : options.hostname.c_str());

	if (impl_->initialized) {
		return true;
	}

	int ret;

	// Seed the random number generator
	const char *pers = "sqlwire_tds_tls";
	ret = mbedtls_ctr_drbg_seed(&impl_->ctr_drbg, mbedtls_entropy_func, &impl_->entropy,
	                            reinterpret_cast<const unsigned char *>(pers), strlen(pers));
	if (ret != 0) {
		impl_->SetError(TlsErrorCode::INIT_FAILED, "CTR DRBG seed failed: " + FormatMbedTlsError(ret));
		return false;
	}

	// Set up SSL config for client mode
	ret = mbedtls_ssl_config_defaults(&impl_->conf, MBEDTLS_SSL_IS_CLIENT, MBEDTLS_SSL_TRANSPORT_STREAM,
	                                  MBEDTLS_SSL_PRESET_DEFAULT);
	if (ret != 0) {
		impl_->SetError(TlsErrorCode::INIT_FAILED, "SSL config defaults failed: " + FormatMbedTlsError(ret));
		return false;
	}

	mbedtls_ssl_conf_rng(&impl_->conf, mbedtls_ctr_drbg_random, &impl_->ctr_drbg);

	// Enable debug output if SQLWIRE_DEBUG is set high enough
	if (GetSqlwireDebugLevel() >= 3) {
		mbedtls_ssl_conf_dbg(&impl_->conf, MbedTlsDebugCallback, nullptr);
		mbedtls_debug_set_threshold(4);
	}

	if (options.trust_server_certificate) {
		mbedtls_ssl_conf_authmode(&impl_->conf, MBEDTLS_SSL_VERIFY_NONE);
	} else {
		if (!options.ca_file.empty()) {
			ret = mbedtls_x509_crt_parse_file(&impl_->ca_chain, options.ca_file.c_str());
		} else {
			ret = mbedtls_x509_crt_parse_path(&impl_->ca_chain, DEFAULT_CA_PATH);
		}
		// Positive values count certificates that failed to parse; the rest are usable
		if (ret < 0) {
			impl_->SetError(TlsErrorCode::CA_LOAD_FAILED,
			                "Failed to load root certificates from " +
			                    (options.ca_file.empty() ? std::string(DEFAULT_CA_PATH) : options.ca_file) + ": " +
			                    FormatMbedTlsError(ret));
			return false;
		}
		mbedtls_ssl_conf_ca_chain(&impl_->conf, &impl_->ca_chain, nullptr);
		mbedtls_ssl_conf_authmode(&impl_->conf, MBEDTLS_SSL_VERIFY_REQUIRED);
	}

	// TLS 1.2 only (SQL Server TDS 7.x TLS)
	mbedtls_ssl_conf_min_tls_version(&impl_->conf, MBEDTLS_SSL_VERSION_TLS1_2);
	mbedtls_ssl_conf_max_tls_version(&impl_->conf, MBEDTLS_SSL_VERSION_TLS1_2);

	// Read timeout handed to BioRecvTimeout when no per-call timeout is set
	mbedtls_ssl_conf_read_timeout(&impl_->conf, 30000);

	ret = mbedtls_ssl_setup(&impl_->ssl, &impl_->conf);
	if (ret != 0) {
		impl_->SetError(TlsErrorCode::INIT_FAILED, "SSL setup failed: " + FormatMbedTlsError(ret));
		return false;
	}

	// Set hostname for SNI and certificate name checks
	if (!options.hostname.empty()) {
		ret = mbedtls_ssl_set_hostname(&impl_->ssl, options.hostname.c_str());
		if (ret != 0) {
			impl_->SetError(TlsErrorCode::INIT_FAILED, "Failed to set hostname: " + FormatMbedTlsError(ret));
			return false;
		}
	}

	impl_->initialized = true;
	SQLWIRE_TLS_DEBUG_LOG(1, "Initialize: success");
	return true;
}

bool TlsTdsContext::Attach(TdsByteStream *transport) {
	if (!impl_->initialized) {
		impl_->SetError(TlsErrorCode::NOT_INITIALIZED, "Call Initialize() first");
		return false;
	}
	impl_->transport = transport;
	mbedtls_ssl_set_bio(&impl_->ssl, impl_.get(), BioSend, BioRecv, BioRecvTimeout);
	return true;
}

bool TlsTdsContext::Handshake(int timeout_ms) {
	SQLWIRE_TLS_DEBUG_LOG(1, "Handshake: starting (timeout=%dms)", timeout_ms);

	if (!impl_->initialized || !impl_->transport) {
		impl_->SetError(TlsErrorCode::NOT_INITIALIZED, "TLS session not attached to a transport");
		return false;
	}

	impl_->current_timeout_ms = timeout_ms;
	auto start = std::chrono::steady_clock::now();

	int ret;
	while ((ret = mbedtls_ssl_handshake(&impl_->ssl)) != 0) {
		if (ret == MBEDTLS_ERR_X509_CERT_VERIFY_FAILED) {
			char info[512];
			uint32_t flags = mbedtls_ssl_get_verify_result(&impl_->ssl);
			mbedtls_x509_crt_verify_info(info, sizeof(info), "", flags);
			std::string detail(info);
			while (!detail.empty() && detail[detail.size() - 1] == '\n') {
				detail.erase(detail.size() - 1);
			}
			impl_->SetError(TlsErrorCode::CERT_VERIFY_FAILED, "Server certificate rejected: " + detail);
			SQLWIRE_TLS_DEBUG_LOG(1, "Handshake: FAILED - %s", impl_->last_error.c_str());
			return false;
		}
		if (ret != MBEDTLS_ERR_SSL_WANT_READ && ret != MBEDTLS_ERR_SSL_WANT_WRITE && ret != MBEDTLS_ERR_SSL_TIMEOUT) {
			impl_->SetError(TlsErrorCode::HANDSHAKE_FAILED, "Handshake failed: " + FormatMbedTlsError(ret));
			SQLWIRE_TLS_DEBUG_LOG(1, "Handshake: FAILED - %s", impl_->last_error.c_str());
			return false;
		}

		auto elapsed =
		    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
		if (elapsed >= timeout_ms) {
			impl_->SetError(TlsErrorCode::HANDSHAKE_TIMEOUT, "Timeout after " + std::to_string(elapsed) + "ms");
			SQLWIRE_TLS_DEBUG_LOG(1, "Handshake: TIMEOUT");
			return false;
		}
	}

	// The last flight may still sit in the transport (abbreviated handshakes end with a client write)
	if (!impl_->transport->Flush()) {
		impl_->transport_error = impl_->transport->GetLastError();
		impl_->SetError(TlsErrorCode::SEND_FAILED, "Failed to flush final handshake flight");
		return false;
	}

	impl_->handshake_complete = true;
	SQLWIRE_TLS_DEBUG_LOG(1, "Handshake: SUCCESS - %s, %s", GetTlsVersion().c_str(), GetCipherSuite().c_str());
	return true;
}

bool TlsTdsContext::Send(const uint8_t *data, size_t length) {
	if (!impl_->handshake_complete) {
		impl_->SetError(TlsErrorCode::NOT_INITIALIZED, "Handshake not complete");
		return false;
	}

	size_t total_sent = 0;
	while (total_sent < length) {
		int ret = mbedtls_ssl_write(&impl_->ssl, data + total_sent, length - total_sent);

		if (ret > 0) {
			total_sent += static_cast<size_t>(ret);
		} else if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
			continue;
		} else if (ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY) {
			impl_->SetError(TlsErrorCode::PEER_CLOSED, "Peer closed connection");
			return false;
		} else {
			impl_->SetError(TlsErrorCode::SEND_FAILED, "Send failed: " + FormatMbedTlsError(ret));
			return false;
		}
	}
	return true;
}

bool TlsTdsContext::Flush() {
	if (!impl_->transport) {
		impl_->SetError(TlsErrorCode::NOT_INITIALIZED, "TLS session not attached to a transport");
		return false;
	}
	if (!impl_->transport->Flush()) {
		impl_->transport_error = impl_->transport->GetLastError();
		impl_->SetError(TlsErrorCode::SEND_FAILED, "Flush failed");
		return false;
	}
	return true;
}

ssize_t TlsTdsContext::Receive(uint8_t *buffer, size_t max_length, int timeout_ms) {
	if (!impl_->handshake_complete) {
		impl_->SetError(TlsErrorCode::NOT_INITIALIZED, "Handshake not complete");
		return -1;
	}

	impl_->current_timeout_ms = timeout_ms;
	int ret;
	do {
		// WANT_READ / WANT_WRITE follow records that carry no application data
		ret = mbedtls_ssl_read(&impl_->ssl, buffer, max_length);
	} while (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE);

	if (ret > 0) {
		return ret;
	}
	if (ret == 0 || ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY) {
		impl_->SetError(TlsErrorCode::PEER_CLOSED, "Connection closed by peer");
		return -1;
	}
	if (ret == MBEDTLS_ERR_SSL_TIMEOUT) {
		return 0;
	}
	impl_->SetError(TlsErrorCode::RECV_FAILED, "Receive failed: " + FormatMbedTlsError(ret));
	return -1;
}

const std::string &TlsTdsContext::GetLastError() const {
	return impl_->last_error;
}

void TlsTdsContext::Close() {
	if (!impl_->initialized) {
		return;
	}
	SQLWIRE_TLS_DEBUG_LOG(1, "Close: closing TLS session");

	if (impl_->handshake_complete) {
		int ret = mbedtls_ssl_close_notify(&impl_->ssl);
		if (ret != 0) {
			SQLWIRE_TLS_DEBUG_LOG(2, "Close: close_notify failed - %s", FormatMbedTlsError(ret).c_str());
		}
	}

	impl_->initialized = false;
	impl_->handshake_complete = false;
	impl_->transport = nullptr;

	// Reinitialize mbedTLS structures for potential reuse
	impl_->Free();
	impl_->Init();
}

void TlsTdsContext::Abandon() {
	SQLWIRE_TLS_DEBUG_LOG(1, "Abandon: dropping TLS session without close_notify");
	impl_->handshake_complete = false;
	Close();
}

bool TlsTdsContext::IsHandshakeComplete() const {
	return impl_->handshake_complete;
}

TlsErrorCode TlsTdsContext::GetLastErrorCode() const {
	return impl_->last_error_code;
}

std::string TlsTdsContext::GetCipherSuite() const {
	if (!impl_->initialized) {
		return "";
	}
	const char *suite = mbedtls_ssl_get_ciphersuite(&impl_->ssl);
	return suite ? suite : "";
}

std::string TlsTdsContext::GetTlsVersion() const {
	if (!impl_->initialized) {
		return "";
	}
	const char *version = mbedtls_ssl_get_version(&impl_->ssl);
	return version ? version : "";
}

}  // namespace tds
}  // namespace sqlwire
