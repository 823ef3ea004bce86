#ifndef LANCHAT_TRANSPORT_HPP
#define LANCHAT_TRANSPORT_HPP

#include "chat_common.hpp"

#include <atomic>
#include <cstddef>
#include <shared_mutex>
#include <string>

namespace lanchat {

class Logger;

enum class TransportStatus {
	Ok,
	NotOpen,
	BindConflict,
	AddressUnavailable,
	TransportError,
};

enum class RecvStatus {
	Ok,
	Timeout,
	Closed,
	Error,
};

const char *transportStatusName(TransportStatus st);

struct TransportOptions {
	int receiveTimeoutMs{kDefaultReceiveTimeoutMs};
	bool reuseAddress{true};
	bool reusePort{true};
	// bind the send socket to bindAddress:port instead of bindAddress:0;
	// with reuse enabled this lets several instances share one host, but
	// unicast loopback traffic may then land on the send socket
	bool bindSendToPort{false};
	std::string destinationAddress{"255.255.255.255"};
	std::size_t receiveBufferSize{2048};
};

struct Datagram {
	std::string payload;
	std::string sourceAddress;
	unsigned short sourcePort{0};
};

struct TransportSnapshot {
	bool open{false};
	std::string bindAddress;
	unsigned short port{0};
	int receiveTimeoutMs{0};
	std::size_t bufferSize{0};
};

// One broadcast-enabled send socket plus one receive socket bound to
// 0.0.0.0:port. receive() is meant for exactly one reader thread and
// broadcastSend() for one writer thread; close() may come from anywhere,
// including while receive() is blocked.
class BroadcastTransport {
public:
	explicit BroadcastTransport(Logger &logger);
	~BroadcastTransport();

	BroadcastTransport(const BroadcastTransport&)=delete;
	BroadcastTransport &operator=(const BroadcastTransport&)=delete;

	TransportStatus open(const std::string &bindAddress,unsigned short port,
		const TransportOptions &opts=TransportOptions{});
	void close();

	RecvStatus receive(Datagram &out);
	RecvStatus receive(Datagram &out,int timeoutMs);

	TransportStatus broadcastSend(const std::string &payload);

	void setReceiveTimeout(int timeoutMs);
	int receiveTimeout() const { return receiveTimeoutMs_.load(); }

	bool isOpen() const { return open_.load(); }
	unsigned short port() const { return port_; }
	const std::string &bindAddress() const { return bindAddress_; }
	const std::string &destinationAddress() const { return opts_.destinationAddress; }
	TransportSnapshot snapshot() const;

	// last errno text from a failed open, for the startup diagnostic
	const std::string &lastError() const { return lastError_; }

private:
	Logger &logger_;
	TransportOptions opts_;
	std::string bindAddress_;
	unsigned short port_;
	std::atomic<bool> open_;
	std::atomic<int> receiveTimeoutMs_;
	std::string lastError_;

	// receive/send hold it shared, close() exclusively
	mutable std::shared_mutex fdMutex_;
	int sendFd_;
	int recvFd_;
	int wakeFd_;

	TransportStatus openSendSocket(unsigned short port);
	TransportStatus openRecvSocket(unsigned short port);
	bool setFlag(int fd,int level,int opt,const char *name);
	void closeFds();
};

} // namespace lanchat

#endif
