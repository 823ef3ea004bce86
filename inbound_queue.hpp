#ifndef LANCHAT_INBOUND_QUEUE_HPP
#define LANCHAT_INBOUND_QUEUE_HPP

#include "chat_common.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace lanchat {

// FIFO between the receiver thread (producer) and the UI thread (consumer).
// Neither side ever waits for the other: push drops the oldest entry when
// the queue is full, drain takes whatever is there and returns at once.
class InboundQueue {
public:
	static constexpr std::size_t kDefaultCapacity=4096;

	explicit InboundQueue(std::size_t capacity=kDefaultCapacity);

	void push(InboundEnvelope env);

	// appends everything queued to out, returns how many were moved
	std::size_t drainInto(std::vector<InboundEnvelope> &out);

	std::size_t size() const;
	std::size_t capacity() const { return capacity_; }
	u64 droppedCount() const;

private:
	const std::size_t capacity_;
	mutable std::mutex mutex_;
	std::deque<InboundEnvelope> items_;
	u64 dropped_;
};

} // namespace lanchat

#endif
