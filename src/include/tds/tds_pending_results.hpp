#pragma once

#include "tds_message.hpp"
#include <cstddef>

namespace sqlwire {
namespace tds {

class MessageStream;

// Counts submitted statements whose final DONE has not been read yet.
// A connection is reusable only once the count is back to zero.
class PendingResultTracker {
public:
	PendingResultTracker() : pending_(0) {}

	// Call before each statement submission
	void Increment() { pending_++; }

	size_t GetPendingCount() const { return pending_; }
	bool IsReady() const { return pending_ == 0; }

	// Observe a message; DONE / DONEPROC without DONE_MORE completes one statement.
	// Returns true if the message completed a statement.
	bool OnMessage(const TdsMessage &message);

	// Flush unsent writes and read until every statement has completed,
	// discarding all messages. Server errors are discarded as well.
	void WaitUntilReady(MessageStream &stream);

	void Reset() { pending_ = 0; }

private:
	size_t pending_;
};

}  // namespace tds
}  // namespace sqlwire
