#include "dispatcher.hpp"
#include "codec.hpp"
#include "inbound_queue.hpp"
#include "log.hpp"
#include "transport.hpp"

#include <exception>
#include <system_error>

namespace lanchat {

std::string describe(const DispatcherStatus &st) {
	std::string s;
	s+="running="+std::string(st.running?"yes":"no");
	s+=" receiver="+std::string(st.receiverAlive?"alive":"dead");
	s+=" ui="+std::string(st.uiAlive?"alive":"dead");
	s+=" queue="+std::to_string(st.inboundDepth);
	s+=" dropped="+std::to_string(st.inboundDropped);
	s+=" received="+std::to_string(st.received);
	s+=" malformed="+std::to_string(st.malformed);
	s+=" rx_errors="+std::to_string(st.receiveErrors);
	s+=" sent="+std::to_string(st.sent);
	s+=" send_failures="+std::to_string(st.sendFailures);
	return s;
}

Dispatcher::Dispatcher(BroadcastTransport &transport,InboundQueue &queue,Logger &logger)
	:transport_(transport),
	queue_(queue),
	logger_(logger),
	receiver_(transport,queue,logger),
	lifecycleMutex_(),
	running_(false),
	joinTimeout_(kDefaultJoinTimeoutMs),
	receiverTask_(),
	uiTask_(),
	lingering_(),
	nicknameSource_(),
	statusSink_(),
	sent_(0),
	sendFailures_(0) {}

Dispatcher::~Dispatcher() {
	stop();
	std::lock_guard<std::mutex> lock(lifecycleMutex_);
	for(std::jthread &t:lingering_){
		if(!t.joinable())continue;
		logger_.warning("waiting for an overrunning thread to finish");
		t.join();
	}
	lingering_.clear();
}

void Dispatcher::setNicknameSource(NicknameSource source) {
	nicknameSource_=std::move(source);
}

void Dispatcher::setStatusSink(StatusSink sink) {
	statusSink_=std::move(sink);
}

void Dispatcher::setJoinTimeout(std::chrono::milliseconds timeout) {
	joinTimeout_=timeout;
}

bool Dispatcher::spawn(Task &task,const std::string &name,std::function<void(std::stop_token)> body) {
	auto finished=std::make_shared<std::promise<void>>();
	task.name=name;
	task.done=finished->get_future().share();
	task.alive=std::make_shared<std::atomic<bool>>(true);
	// an overrunning thread is moved out of its Task, so the wrapper keeps
	// its completion state in shared_ptrs
	Logger &logger=logger_;
	try{
		task.thread=std::jthread([&logger,name,body=std::move(body),finished,alive=task.alive](std::stop_token st){
			try{
				body(st);
			}catch(const std::exception &e){
				logger.error(name+" task failed: "+e.what());
			}
			alive->store(false);
			finished->set_value();
		});
	}catch(const std::system_error &e){
		logger_.error("cannot start "+name+" thread: "+e.what());
		task.alive->store(false);
		task.done=std::shared_future<void>();
		return false;
	}
	logger_.info(name+" thread started");
	return true;
}

bool Dispatcher::start(UiLoop uiLoop) {
	std::lock_guard<std::mutex> lock(lifecycleMutex_);
	Logger::Scope scope(logger_,"Dispatcher::start");
	if(running_.load()){
		logger_.warning("threads already running");
		return true;
	}
	if(!transport_.isOpen()){
		logger_.error("cannot start: transport is not open");
		return false;
	}
	if(!uiLoop){
		logger_.error("cannot start: no UI loop");
		return false;
	}

	if(!spawn(receiverTask_,"receiver",[this](std::stop_token st){receiver_.run(st);})){
		return false;
	}
	if(!spawn(uiTask_,"ui",std::move(uiLoop))){
		receiverTask_.thread.request_stop();
		joinBounded(receiverTask_);
		return false;
	}
	running_.store(true);
	return true;
}

void Dispatcher::joinBounded(Task &task) {
	if(!task.thread.joinable())return;
	if(!task.done.valid() || task.done.wait_for(joinTimeout_)==std::future_status::ready){
		task.thread.join();
		logger_.info(task.name+" thread joined");
		return;
	}
	logger_.warning(task.name+" thread did not stop within "+std::to_string(joinTimeout_.count())+" ms");
	lingering_.push_back(std::move(task.thread));
}

void Dispatcher::stop() {
	std::lock_guard<std::mutex> lock(lifecycleMutex_);
	if(!running_.load())return;
	Logger::Scope scope(logger_,"Dispatcher::stop");

	receiverTask_.thread.request_stop();
	uiTask_.thread.request_stop();
	// wakes a receive() blocked in poll
	transport_.close();

	joinBounded(receiverTask_);
	joinBounded(uiTask_);
	running_.store(false);
	logger_.info("threads stopped: "+describe(statusLocked()));
}

bool Dispatcher::waitForUi(std::chrono::milliseconds timeout) {
	std::shared_future<void> done;
	{
		std::lock_guard<std::mutex> lock(lifecycleMutex_);
		done=uiTask_.done;
	}
	if(!done.valid())return true;
	return done.wait_for(timeout)==std::future_status::ready;
}

void Dispatcher::report(const std::string &status) {
	if(statusSink_)statusSink_(status);
}

bool Dispatcher::sendMessage(const std::string &text) {
	std::string nickname=nicknameSource_?nicknameSource_():std::string();
	std::string wire;
	CodecError err=encodeMessage(nickname,text,wire);
	if(err==CodecError::TooLarge){
		sendFailures_.fetch_add(1);
		logger_.warning("message not sent: encoding exceeds "+std::to_string(kMaxPayloadBytes)+" bytes");
		report("Message too large (max "+std::to_string(kMaxPayloadBytes)+" bytes)");
		return false;
	}
	if(err!=CodecError::None){
		sendFailures_.fetch_add(1);
		logger_.warning(std::string("message not sent: ")+codecErrorName(err));
		report(trim(nickname).empty()?"Set a nickname first":"Message is not valid text");
		return false;
	}

	TransportStatus st=transport_.broadcastSend(wire);
	if(st!=TransportStatus::Ok){
		sendFailures_.fetch_add(1);
		report(std::string("Send failed: ")+transportStatusName(st));
		return false;
	}
	sent_.fetch_add(1);
	logger_.info("message sent ("+std::to_string(wire.size())+" bytes)");
	report("Message sent");
	return true;
}

DispatcherStatus Dispatcher::status() const {
	std::lock_guard<std::mutex> lock(lifecycleMutex_);
	return statusLocked();
}

DispatcherStatus Dispatcher::statusLocked() const {
	DispatcherStatus st;
	st.running=running_.load();
	st.receiverAlive=receiverTask_.alive && receiverTask_.alive->load();
	st.uiAlive=uiTask_.alive && uiTask_.alive->load();
	st.inboundDepth=queue_.size();
	st.inboundDropped=queue_.droppedCount();
	st.received=receiver_.receivedCount();
	st.malformed=receiver_.malformedCount();
	st.receiveErrors=receiver_.errorCount();
	st.sent=sent_.load();
	st.sendFailures=sendFailures_.load();
	return st;
}

} // namespace lanchat
