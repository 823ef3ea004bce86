#ifndef LANCHAT_RECEIVER_HPP
#define LANCHAT_RECEIVER_HPP

#include "chat_common.hpp"

#include <atomic>
#include <stop_token>

namespace lanchat {

class BroadcastTransport;
class InboundQueue;
class Logger;

enum class ReceiveOutcome {
	Queued,
	Timeout,
	Malformed,
	Error,
	Closed,
};

// Pulls datagrams off the transport, decodes them and queues the good ones.
// Nothing that arrives on the wire can stop the loop; only a stop request or
// a closed transport does.
class Receiver {
public:
	Receiver(BroadcastTransport &transport,InboundQueue &queue,Logger &logger);

	void run(std::stop_token stop);

	// one receive/decode/push step
	ReceiveOutcome pollOnce();

	u64 receivedCount() const { return received_.load(); }
	u64 malformedCount() const { return malformed_.load(); }
	u64 errorCount() const { return errors_.load(); }

private:
	BroadcastTransport &transport_;
	InboundQueue &queue_;
	Logger &logger_;
	std::atomic<u64> received_;
	std::atomic<u64> malformed_;
	std::atomic<u64> errors_;
};

} // namespace lanchat

#endif
