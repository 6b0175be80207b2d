#pragma once

// Platform socket headers and helpers shared by the TCP and SSRP (UDP) code

#ifdef _WIN32
// NOMINMAX must be defined before including winsock2.h (which includes windows.h)
// to prevent min/max macros that conflict with std::min/std::max
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
#define CLOSE_SOCKET closesocket
#define SOCKET_ERROR_CODE WSAGetLastError()
#define poll WSAPoll
typedef int socklen_t;
// Windows socket functions use char* instead of void*
#define SOCK_OPT_CAST(x) reinterpret_cast<char *>(x)
#define SOCK_OPT_CONST_CAST(x) reinterpret_cast<const char *>(x)
#define SOCK_BUF_CAST(x) reinterpret_cast<char *>(x)
#define SOCK_BUF_CONST_CAST(x) reinterpret_cast<const char *>(x)
// Buffer lengths are int on Windows
#define SOCK_LEN_CAST(x) static_cast<int>(x)
// MSG_NOSIGNAL prevents SIGPIPE on Linux; Windows doesn't have SIGPIPE
#define MSG_NOSIGNAL 0
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#define CLOSE_SOCKET close
#define SOCKET_ERROR_CODE errno
// POSIX socket functions use void* - no cast needed
#define SOCK_OPT_CAST(x) (x)
#define SOCK_OPT_CONST_CAST(x) (x)
#define SOCK_BUF_CAST(x) (x)
#define SOCK_BUF_CONST_CAST(x) (x)
#define SOCK_LEN_CAST(x) (x)

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE instead
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif
#endif

namespace sqlwire {
namespace tds {

// One-time Winsock initialization; always true on POSIX
bool EnsureNetworkInitialized();

}  // namespace tds
}  // namespace sqlwire
