#include "inbound_queue.hpp"

#include <iterator>

namespace lanchat {

InboundQueue::InboundQueue(std::size_t capacity)
	:capacity_(capacity>0?capacity:1),
	mutex_(),
	items_(),
	dropped_(0) {}

void InboundQueue::push(InboundEnvelope env) {
	std::lock_guard<std::mutex> lock(mutex_);
	if(items_.size()>=capacity_){
		items_.pop_front();
		++dropped_;
	}
	items_.push_back(std::move(env));
}

std::size_t InboundQueue::drainInto(std::vector<InboundEnvelope> &out) {
	std::deque<InboundEnvelope> taken;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		taken.swap(items_);
	}
	out.insert(out.end(),std::make_move_iterator(taken.begin()),std::make_move_iterator(taken.end()));
	return taken.size();
}

std::size_t InboundQueue::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return items_.size();
}

u64 InboundQueue::droppedCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return dropped_;
}

} // namespace lanchat
