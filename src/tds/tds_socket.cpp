#include "tds/tds_socket.hpp"
#include "tds_net.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

// Debug logging
static int GetSqlwireDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("SQLWIRE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define SQLWIRE_SOCKET_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                  \
		if (GetSqlwireDebugLevel() >= lvl)                                \
			fprintf(stderr, "[SQLWIRE SOCKET] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlwire {
namespace tds {

#ifdef _WIN32
static std::once_flag winsock_init_flag;
static bool winsock_initialized = false;

static void InitializeWinsock() {
	WSADATA wsaData;
	int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
	if (result == 0) {
		winsock_initialized = true;
		atexit([]() { WSACleanup(); });
	}
}

bool EnsureNetworkInitialized() {
	std::call_once(winsock_init_flag, InitializeWinsock);
	return winsock_initialized;
}
#else
bool EnsureNetworkInitialized() {
	return true;
}
#endif

TdsSocket::TdsSocket() : fd_(-1), port_(0), connected_(false) {}

TdsSocket::~TdsSocket() {
	Close();
}

bool TdsSocket::Connect(const std::string &host, uint16_t port, int timeout_seconds) {
	SQLWIRE_SOCKET_DEBUG_LOG(1, "Connect: connecting to %s:%d (timeout=%ds)", host.c_str(), port, timeout_seconds);

	if (connected_) {
		Close();
	}

	host_ = host;
	port_ = port;
	last_error_.clear();

	if (!EnsureNetworkInitialized()) {
		last_error_ = "Failed to initialize Windows socket library (WSAStartup failed)";
		return false;
	}

	// Resolve hostname
	struct addrinfo hints, *result, *rp;
	std::memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;      // Allow IPv4 or IPv6
	hints.ai_socktype = SOCK_STREAM;  // TCP
	hints.ai_protocol = IPPROTO_TCP;

	std::string port_str = std::to_string(port);
	int ret = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
	if (ret != 0) {
		last_error_ = "Failed to resolve hostname: " + std::string(gai_strerror(ret));
		SQLWIRE_SOCKET_DEBUG_LOG(1, "Connect: DNS resolution failed: %s", last_error_.c_str());
		return false;
	}

	// Try each address until we connect
	int addr_index = 0;
	for (rp = result; rp != nullptr; rp = rp->ai_next, addr_index++) {
		const char *family_str = rp->ai_family == AF_INET ? "IPv4" : (rp->ai_family == AF_INET6 ? "IPv6" : "other");
		SQLWIRE_SOCKET_DEBUG_LOG(2, "Connect: trying address %d (%s)", addr_index, family_str);

		fd_ = static_cast<int>(socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol));
		if (fd_ == -1) {
			continue;
		}

		// Non-blocking connect so the timeout can be enforced with poll
		if (!SetNonBlocking(true)) {
			CLOSE_SOCKET(fd_);
			fd_ = -1;
			continue;
		}

		ret = connect(fd_, rp->ai_addr, static_cast<socklen_t>(rp->ai_addrlen));
		if (ret == 0) {
			connected_ = true;
			break;
		}

		int connect_error = SOCKET_ERROR_CODE;
#ifdef _WIN32
		if (connect_error == WSAEWOULDBLOCK) {
#else
		if (connect_error == EINPROGRESS || connect_error == EWOULDBLOCK) {
#endif
			if (WaitForReady(true, timeout_seconds * 1000)) {
				int error = 0;
				socklen_t len = sizeof(error);
				if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, SOCK_OPT_CAST(&error), &len) == 0 && error == 0) {
					connected_ = true;
					break;
				}
				last_error_ = "Connection failed: " + std::string(strerror(error));
			} else {
				last_error_ = "Connection timed out";
			}
			SQLWIRE_SOCKET_DEBUG_LOG(1, "Connect: address %d failed: %s", addr_index, last_error_.c_str());
		} else {
			last_error_ = "Connection failed: " + std::string(strerror(connect_error));
			SQLWIRE_SOCKET_DEBUG_LOG(1, "Connect: connect failed on address %d with error %d", addr_index,
			                         connect_error);
		}

		CLOSE_SOCKET(fd_);
		fd_ = -1;
	}

	freeaddrinfo(result);

	if (!connected_) {
		if (last_error_.empty()) {
			last_error_ = "Failed to connect to " + host + ":" + std::to_string(port);
		}
		SQLWIRE_SOCKET_DEBUG_LOG(1, "Connect: FAILED - %s", last_error_.c_str());
		return false;
	}

	// Set TCP_NODELAY for low latency
	int flag = 1;
	setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, SOCK_OPT_CONST_CAST(&flag), sizeof(flag));

#ifdef __APPLE__
	// On macOS, set SO_NOSIGPIPE to prevent SIGPIPE on write to closed socket
	setsockopt(fd_, SOL_SOCKET, SO_NOSIGPIPE, SOCK_OPT_CONST_CAST(&flag), sizeof(flag));
#endif

	// Back to blocking mode for simpler I/O
	SetNonBlocking(false);

	SQLWIRE_SOCKET_DEBUG_LOG(1, "Connect: connected to %s:%d", host.c_str(), port);
	return true;
}

void TdsSocket::Close() {
	if (fd_ >= 0) {
		CLOSE_SOCKET(fd_);
		fd_ = -1;
	}
	connected_ = false;
}

bool TdsSocket::IsConnected() const {
	return connected_ && fd_ >= 0;
}

bool TdsSocket::Send(const uint8_t *data, size_t length) {
	if (!IsConnected()) {
		last_error_ = "Not connected";
		return false;
	}

	size_t total_sent = 0;
	while (total_sent < length) {
		size_t chunk = ClampIoLength(length - total_sent);
		ssize_t sent = send(fd_, SOCK_BUF_CONST_CAST(data + total_sent), SOCK_LEN_CAST(chunk), MSG_NOSIGNAL);
		if (sent <= 0) {
			if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
				if (!WaitForReady(true, DEFAULT_CONNECTION_TIMEOUT * 1000)) {
					last_error_ = "Send timeout";
					return false;
				}
				continue;
			}
			last_error_ = "Send failed: " + std::string(strerror(errno));
			connected_ = false;
			return false;
		}
		total_sent += static_cast<size_t>(sent);
	}
	SQLWIRE_SOCKET_DEBUG_LOG(3, "Send: %zu bytes", length);
	return true;
}

bool TdsSocket::Flush() {
	// Writes go straight to the kernel
	return IsConnected();
}

ssize_t TdsSocket::Receive(uint8_t *buffer, size_t max_length, int timeout_ms) {
	if (!IsConnected()) {
		last_error_ = "Not connected";
		return -1;
	}

	if (!WaitForReady(false, timeout_ms)) {
		// If connected_ was set to false, it's an error not timeout
		if (!connected_) {
			return -1;
		}
		return 0;
	}

	ssize_t received = recv(fd_, SOCK_BUF_CAST(buffer), SOCK_LEN_CAST(ClampIoLength(max_length)), 0);
	if (received < 0) {
		if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
			return 0;
		}
		last_error_ = "Receive failed: " + std::string(strerror(errno));
		connected_ = false;
		return -1;
	}
	if (received == 0) {
		last_error_ = "Connection closed by server";
		connected_ = false;
		return -1;
	}

	SQLWIRE_SOCKET_DEBUG_LOG(3, "Receive: %zd bytes", received);
	return received;
}

bool TdsSocket::SetNonBlocking(bool enable) {
#ifdef _WIN32
	u_long mode = enable ? 1 : 0;
	return ioctlsocket(fd_, FIONBIO, &mode) == 0;
#else
	int flags = fcntl(fd_, F_GETFL, 0);
	if (flags < 0) {
		return false;
	}
	if (enable) {
		flags |= O_NONBLOCK;
	} else {
		flags &= ~O_NONBLOCK;
	}
	return fcntl(fd_, F_SETFL, flags) == 0;
#endif
}

bool TdsSocket::WaitForReady(bool for_write, int timeout_ms) {
	struct pollfd pfd;
	pfd.fd = fd_;
	pfd.events = for_write ? POLLOUT : POLLIN;
	pfd.revents = 0;

	int ret = poll(&pfd, 1, timeout_ms);
	if (ret < 0) {
		last_error_ = "Poll failed: " + std::string(strerror(errno));
		connected_ = false;
		return false;
	}
	if (ret == 0) {
		last_error_ = "Socket timeout waiting for data";
		return false;
	}

	if (pfd.revents & (POLLERR | POLLNVAL)) {
		last_error_ = "Socket error during poll";
		connected_ = false;
		return false;
	}

	// Pending data is still readable after the peer hung up
	if (!for_write && (pfd.revents & POLLIN)) {
		return true;
	}

	if (pfd.revents & POLLHUP) {
		last_error_ = "Connection closed by server (POLLHUP)";
		connected_ = false;
		return false;
	}

	return true;
}

}  // namespace tds
}  // namespace sqlwire
