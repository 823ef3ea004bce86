#include "inbound_queue.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace lanchat;

namespace {

InboundEnvelope envelope(const std::string &text) {
	InboundEnvelope env;
	env.message=ChatMessage{"n",text};
	env.sourceAddress="10.0.0.1";
	env.sourcePort=4000;
	return env;
}

} // namespace

TEST(InboundQueue,DrainKeepsArrivalOrder) {
	InboundQueue q;
	q.push(envelope("1"));
	q.push(envelope("2"));
	q.push(envelope("3"));
	EXPECT_EQ(q.size(),3u);

	std::vector<InboundEnvelope> out;
	EXPECT_EQ(q.drainInto(out),3u);
	ASSERT_EQ(out.size(),3u);
	EXPECT_EQ(out[0].message.text,"1");
	EXPECT_EQ(out[2].message.text,"3");
	EXPECT_EQ(q.size(),0u);

	EXPECT_EQ(q.drainInto(out),0u);
	EXPECT_EQ(out.size(),3u);
}

TEST(InboundQueue,FullQueueDropsOldest) {
	InboundQueue q(2);
	q.push(envelope("a"));
	q.push(envelope("b"));
	q.push(envelope("c"));
	EXPECT_EQ(q.droppedCount(),1u);

	std::vector<InboundEnvelope> out;
	q.drainInto(out);
	ASSERT_EQ(out.size(),2u);
	EXPECT_EQ(out[0].message.text,"b");
	EXPECT_EQ(out[1].message.text,"c");
}

TEST(InboundQueue,ConcurrentProducerLosesNothing) {
	InboundQueue q;
	constexpr int kCount=1000;
	std::thread producer([&q](){
		for(int i=0;i<kCount;++i)q.push(envelope(std::to_string(i)));
	});
	std::vector<InboundEnvelope> out;
	while(out.size()<static_cast<std::size_t>(kCount)){
		q.drainInto(out);
		std::this_thread::yield();
	}
	producer.join();
	ASSERT_EQ(out.size(),static_cast<std::size_t>(kCount));
	for(int i=0;i<kCount;++i){
		ASSERT_EQ(out[static_cast<std::size_t>(i)].message.text,std::to_string(i));
	}
}
