#ifndef LANCHAT_DISPATCHER_HPP
#define LANCHAT_DISPATCHER_HPP

#include "chat_common.hpp"
#include "receiver.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace lanchat {

class BroadcastTransport;
class InboundQueue;
class Logger;

using UiLoop=std::function<void(std::stop_token)>;
using NicknameSource=std::function<std::string()>;
using StatusSink=std::function<void(const std::string&)>;

struct DispatcherStatus {
	bool running{false};
	bool receiverAlive{false};
	bool uiAlive{false};
	std::size_t inboundDepth{0};
	u64 inboundDropped{0};
	u64 received{0};
	u64 malformed{0};
	u64 receiveErrors{0};
	u64 sent{0};
	u64 sendFailures{0};
};

std::string describe(const DispatcherStatus &st);

// Owns the receiver thread and the UI thread. start/stop/waitForUi belong
// to the owning thread; sendMessage is called from the UI thread.
class Dispatcher {
public:
	Dispatcher(BroadcastTransport &transport,InboundQueue &queue,Logger &logger);
	~Dispatcher();

	Dispatcher(const Dispatcher&)=delete;
	Dispatcher &operator=(const Dispatcher&)=delete;

	void setNicknameSource(NicknameSource source);
	void setStatusSink(StatusSink sink);
	void setJoinTimeout(std::chrono::milliseconds timeout);

	bool start(UiLoop uiLoop);

	// stop request, transport close, then a bounded join of each task;
	// a task that overruns is logged and joined for good by the destructor
	void stop();

	bool sendMessage(const std::string &text);

	// true once the UI loop has returned
	bool waitForUi(std::chrono::milliseconds timeout);

	bool isRunning() const { return running_.load(); }
	DispatcherStatus status() const;

private:
	struct Task {
		std::string name;
		std::jthread thread;
		std::shared_future<void> done;
		std::shared_ptr<std::atomic<bool>> alive;
	};

	BroadcastTransport &transport_;
	InboundQueue &queue_;
	Logger &logger_;
	Receiver receiver_;

	mutable std::mutex lifecycleMutex_;
	std::atomic<bool> running_;
	std::chrono::milliseconds joinTimeout_;
	Task receiverTask_;
	Task uiTask_;
	// overrunning threads, still running past stop()
	std::vector<std::jthread> lingering_;

	NicknameSource nicknameSource_;
	StatusSink statusSink_;
	std::atomic<u64> sent_;
	std::atomic<u64> sendFailures_;

	bool spawn(Task &task,const std::string &name,std::function<void(std::stop_token)> body);
	void joinBounded(Task &task);
	void report(const std::string &status);
	DispatcherStatus statusLocked() const;
};

} // namespace lanchat

#endif
