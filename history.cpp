#include "history.hpp"

namespace lanchat {

MessageHistory::MessageHistory(std::size_t cap)
	:cap_(cap>0?cap:1),
	entries_(),
	total_(0) {}

std::size_t MessageHistory::append(HistoryEntry entry) {
	entries_.push_back(std::move(entry));
	++total_;
	std::size_t evicted=0;
	while(entries_.size()>cap_){
		entries_.pop_front();
		++evicted;
	}
	return evicted;
}

std::string formatEnvelope(const InboundEnvelope &env) {
	std::string line=clockTime(env.receivedAt);
	line+=' ';
	line+=env.sourceAddress;
	line+=" <";
	line+=sanitizeForDisplay(env.message.nickname);
	line+="> ";
	line+=sanitizeForDisplay(env.message.text);
	return line;
}

std::vector<std::string> wrapLine(const std::string &line,int width) {
	std::vector<std::string> out;
	if(width<=1 || displayWidth(line)<=static_cast<std::size_t>(width)){
		out.push_back(line);
		return out;
	}
	const std::size_t w=static_cast<std::size_t>(width);

	std::string cur;
	std::size_t curLen=0;
	std::size_t i=0;
	while(i<line.size()){
		while(i<line.size() && (line[i]==' ' || line[i]=='\t'))++i;
		if(i>=line.size())break;
		std::size_t j=i;
		while(j<line.size() && line[j]!=' ' && line[j]!='\t')++j;
		std::string word=line.substr(i,j-i);
		std::size_t wordLen=displayWidth(word);
		i=j;

		if(curLen>0 && curLen+1+wordLen<=w){
			cur+=' ';
			cur+=word;
			curLen+=1+wordLen;
			continue;
		}
		if(curLen>0){
			out.push_back(cur);
			cur.clear();
			curLen=0;
		}
		while(wordLen>w){
			std::string head=fitWidth(word,w);
			if(head.empty())head=utf8Prefix(word,1);
			out.push_back(head);
			word.erase(0,head.size());
			wordLen=displayWidth(word);
		}
		cur=word;
		curLen=wordLen;
	}
	if(curLen>0 || out.empty())out.push_back(cur);
	return out;
}

} // namespace lanchat
