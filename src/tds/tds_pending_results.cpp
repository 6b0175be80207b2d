#include "tds/tds_pending_results.hpp"
#include "tds/tds_error.hpp"
#include "tds/tds_message_stream.hpp"

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

#define SQLWIRE_PENDING_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                   \
		if (GetSqlwireDebugLevel() >= lvl)                                 \
			fprintf(stderr, "[SQLWIRE PENDING] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace sqlwire {
namespace tds {

bool PendingResultTracker::OnMessage(const TdsMessage &message) {
	// DONEINPROC never ends a statement
	if (message.type != MessageType::Done && message.type != MessageType::DoneProc) {
		return false;
	}
	if (message.done.HasMore() || pending_ == 0) {
		return false;
	}
	pending_--;
	return true;
}

void PendingResultTracker::WaitUntilReady(MessageStream &stream) {
	if (stream.HasPendingWrites()) {
		stream.Flush();
	}

	size_t discarded = 0;
	while (pending_ > 0) {
		try {
			TdsMessage message = stream.ReceiveNextMessage();
			OnMessage(message);
			discarded++;
		} catch (const TdsDatabaseException &ex) {
			SQLWIRE_PENDING_DEBUG_LOG(1, "WaitUntilReady: discarding server error %u: %s", ex.GetError().number,
			                          ex.GetError().message.c_str());
		}
	}

	SQLWIRE_PENDING_DEBUG_LOG(2, "WaitUntilReady: drained %zu messages", discarded);
}

}  // namespace tds
}  // namespace sqlwire
