#include "receiver.hpp"
#include "codec.hpp"
#include "inbound_queue.hpp"
#include "log.hpp"
#include "transport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace lanchat;

namespace {

class ReceiverTest : public ::testing::Test {
protected:
	Logger logger;
	BroadcastTransport transport{logger};
	InboundQueue queue;

	void SetUp() override {
		TransportOptions opts;
		opts.destinationAddress="127.0.0.1";
		opts.receiveTimeoutMs=100;
		ASSERT_EQ(transport.open("127.0.0.1",0,opts),TransportStatus::Ok);
	}

	// polls until something other than a timeout comes back
	ReceiveOutcome next(Receiver &r) {
		ReceiveOutcome out=ReceiveOutcome::Timeout;
		for(int i=0;i<20 && out==ReceiveOutcome::Timeout;++i)out=r.pollOnce();
		return out;
	}
};

} // namespace

TEST_F(ReceiverTest,ValidMessageIsQueued) {
	Receiver r(transport,queue,logger);
	std::string wire;
	ASSERT_EQ(encodeMessage("a","hi",wire),CodecError::None);
	ASSERT_EQ(transport.broadcastSend(wire),TransportStatus::Ok);

	EXPECT_EQ(next(r),ReceiveOutcome::Queued);
	std::vector<InboundEnvelope> out;
	ASSERT_EQ(queue.drainInto(out),1u);
	EXPECT_EQ(out[0].message,(ChatMessage{"a","hi"}));
	EXPECT_EQ(out[0].sourceAddress,"127.0.0.1");
	EXPECT_EQ(r.receivedCount(),1u);
}

TEST_F(ReceiverTest,GarbageIsDroppedAndLoopContinues) {
	Receiver r(transport,queue,logger);
	ASSERT_EQ(transport.broadcastSend("definitely not json"),TransportStatus::Ok);
	ASSERT_EQ(transport.broadcastSend(std::string(1200,'{')),TransportStatus::Ok);
	std::string wire;
	ASSERT_EQ(encodeMessage("b","still here",wire),CodecError::None);
	ASSERT_EQ(transport.broadcastSend(wire),TransportStatus::Ok);

	EXPECT_EQ(next(r),ReceiveOutcome::Malformed);
	EXPECT_EQ(next(r),ReceiveOutcome::Malformed);
	EXPECT_EQ(next(r),ReceiveOutcome::Queued);
	EXPECT_EQ(r.malformedCount(),2u);
	EXPECT_EQ(queue.size(),1u);
}

TEST_F(ReceiverTest,RunEndsWhenTransportCloses) {
	Receiver r(transport,queue,logger);
	std::jthread worker([&r](std::stop_token st){r.run(st);});
	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	transport.close();
	worker.join();
	EXPECT_EQ(r.pollOnce(),ReceiveOutcome::Closed);
}

TEST_F(ReceiverTest,RunEndsOnStopRequest) {
	Receiver r(transport,queue,logger);
	std::jthread worker([&r](std::stop_token st){r.run(st);});
	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	auto t0=std::chrono::steady_clock::now();
	worker.request_stop();
	worker.join();
	// at most one receive timeout
	EXPECT_LT(std::chrono::steady_clock::now()-t0,std::chrono::seconds(1));
}
