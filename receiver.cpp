#include "receiver.hpp"
#include "codec.hpp"
#include "inbound_queue.hpp"
#include "log.hpp"
#include "transport.hpp"

#include <chrono>
#include <thread>

namespace lanchat {

namespace {

// back-off after a hard socket error so a broken socket cannot spin a core
constexpr auto kErrorBackoff=std::chrono::milliseconds(50);

} // namespace

Receiver::Receiver(BroadcastTransport &transport,InboundQueue &queue,Logger &logger)
	:transport_(transport),
	queue_(queue),
	logger_(logger),
	received_(0),
	malformed_(0),
	errors_(0) {}

ReceiveOutcome Receiver::pollOnce() {
	Datagram dg;
	switch(transport_.receive(dg)){
	case RecvStatus::Timeout:
		return ReceiveOutcome::Timeout;
	case RecvStatus::Closed:
		return ReceiveOutcome::Closed;
	case RecvStatus::Error:
		errors_.fetch_add(1);
		return ReceiveOutcome::Error;
	case RecvStatus::Ok:
		break;
	}

	InboundEnvelope env;
	if(decodeMessage(dg.payload,env.message)!=CodecError::None){
		malformed_.fetch_add(1);
		logger_.debug("dropped malformed datagram ("+std::to_string(dg.payload.size())+" bytes) from "
			+dg.sourceAddress+":"+std::to_string(dg.sourcePort));
		return ReceiveOutcome::Malformed;
	}
	env.sourceAddress=std::move(dg.sourceAddress);
	env.sourcePort=dg.sourcePort;
	env.receivedAt=std::chrono::system_clock::now();
	logger_.debug("message from "+env.sourceAddress+":"+std::to_string(env.sourcePort)+" <"+env.message.nickname+">");
	queue_.push(std::move(env));
	received_.fetch_add(1);
	return ReceiveOutcome::Queued;
}

void Receiver::run(std::stop_token stop) {
	Logger::Scope scope(logger_,"Receiver::run");
	while(!stop.stop_requested()){
		ReceiveOutcome r=pollOnce();
		if(r==ReceiveOutcome::Closed)break;
		if(r==ReceiveOutcome::Error){
			std::this_thread::sleep_for(kErrorBackoff);
		}
	}
	logger_.info("receiver stopped: "+std::to_string(received_.load())+" received, "
		+std::to_string(malformed_.load())+" malformed, "+std::to_string(errors_.load())+" errors");
}

} // namespace lanchat
