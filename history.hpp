#ifndef LANCHAT_HISTORY_HPP
#define LANCHAT_HISTORY_HPP

#include "chat_common.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace lanchat {

enum class EntryKind {
	Chat,
	System,
};

struct HistoryEntry {
	std::string text;
	EntryKind kind{EntryKind::Chat};
};

// Append-only, capped. Every entry ever appended has a sequence number;
// the oldest one still held is firstSeq(), the next one to come is
// totalAppended().
class MessageHistory {
public:
	explicit MessageHistory(std::size_t cap=kHistoryCap);

	// returns how many old entries were evicted to make room
	std::size_t append(HistoryEntry entry);

	const std::deque<HistoryEntry> &entries() const { return entries_; }
	std::size_t size() const { return entries_.size(); }
	std::size_t cap() const { return cap_; }
	u64 totalAppended() const { return total_; }
	u64 firstSeq() const { return total_-entries_.size(); }

private:
	std::size_t cap_;
	std::deque<HistoryEntry> entries_;
	u64 total_;
};

// "HH:MM:SS 192.168.1.7 <nick> text"; control characters in the peer's
// fields are shown as ^X
std::string formatEnvelope(const InboundEnvelope &env);

// Greedy word wrap to `width` terminal columns; wide CJK and emoji take two.
// Runs of whitespace collapse to one space; a word wider than the line is
// cut. Always returns at least one line.
std::vector<std::string> wrapLine(const std::string &line,int width);

} // namespace lanchat

#endif
