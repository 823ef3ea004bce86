#ifndef LANCHAT_COMMON_HPP
#define LANCHAT_COMMON_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>

namespace lanchat {

using u8=std::uint8_t;
using u64=std::uint64_t;

constexpr std::size_t kMaxPayloadBytes=1000;
constexpr std::size_t kHistoryCap=500;
constexpr std::size_t kMaxNicknameChars=50;
constexpr int kDefaultReceiveTimeoutMs=1000;
constexpr int kDefaultJoinTimeoutMs=2000;
constexpr int kKeyPollTimeoutMs=100;

struct ChatMessage {
	std::string nickname;
	std::string text;

	bool operator==(const ChatMessage &other) const=default;
};

struct InboundEnvelope {
	ChatMessage message;
	std::string sourceAddress;
	unsigned short sourcePort{0};
	std::chrono::system_clock::time_point receivedAt{};
};

inline std::string trim(const std::string &s) {
	std::size_t b=0;
	while(b<s.size() && static_cast<unsigned char>(s[b])<=32u)++b;
	std::size_t e=s.size();
	while(e>b && static_cast<unsigned char>(s[e-1])<=32u)--e;
	return s.substr(b,e-b);
}

// length of the UTF-8 sequence introduced by lead byte c, 0 if c cannot lead
inline std::size_t utf8SequenceLength(unsigned char c) {
	if(c<0x80u)return 1;
	if(c>=0xC2u && c<=0xDFu)return 2;
	if(c>=0xE0u && c<=0xEFu)return 3;
	if(c>=0xF0u && c<=0xF4u)return 4;
	return 0;
}

// strict check: no overlongs, no surrogates, nothing above U+10FFFF
inline bool isValidUtf8(const char *data,std::size_t len) {
	std::size_t i=0;
	while(i<len){
		unsigned char c=static_cast<unsigned char>(data[i]);
		std::size_t n=utf8SequenceLength(c);
		if(n==0 || i+n>len)return false;
		if(n>1){
			unsigned char c1=static_cast<unsigned char>(data[i+1]);
			if(c==0xE0u && c1<0xA0u)return false;
			if(c==0xEDu && c1>0x9Fu)return false;
			if(c==0xF0u && c1<0x90u)return false;
			if(c==0xF4u && c1>0x8Fu)return false;
			for(std::size_t k=1;k<n;++k){
				unsigned char cc=static_cast<unsigned char>(data[i+k]);
				if((cc&0xC0u)!=0x80u)return false;
			}
		}
		i+=n;
	}
	return true;
}

inline bool isValidUtf8(const std::string &s) {
	return isValidUtf8(s.data(),s.size());
}

// number of code points, continuation bytes are not counted
inline std::size_t utf8Length(const std::string &s) {
	std::size_t n=0;
	for(char c:s){
		if((static_cast<unsigned char>(c)&0xC0u)!=0x80u)++n;
	}
	return n;
}

// byte offset after the first `chars` code points of s
inline std::size_t utf8Offset(const std::string &s,std::size_t chars) {
	std::size_t i=0;
	while(i<s.size() && chars>0){
		++i;
		while(i<s.size() && (static_cast<unsigned char>(s[i])&0xC0u)==0x80u)++i;
		--chars;
	}
	return i;
}

inline std::string utf8Prefix(const std::string &s,std::size_t chars) {
	return s.substr(0,utf8Offset(s,chars));
}

// keeps the last `chars` code points
inline std::string utf8Suffix(const std::string &s,std::size_t chars) {
	std::size_t total=utf8Length(s);
	if(total<=chars)return s;
	return s.substr(utf8Offset(s,total-chars));
}

inline void utf8PopBack(std::string &s) {
	if(s.empty())return;
	std::size_t i=s.size()-1;
	while(i>0 && (static_cast<unsigned char>(s[i])&0xC0u)==0x80u)--i;
	s.erase(i);
}

// decodes the code point at s[i] and moves i past it; expects valid UTF-8
inline char32_t nextCodePoint(const std::string &s,std::size_t &i) {
	unsigned char c=static_cast<unsigned char>(s[i]);
	std::size_t n=utf8SequenceLength(c);
	if(n==0 || i+n>s.size()){
		++i;
		return 0xFFFDu;
	}
	char32_t cp=n==1?c:n==2?(c&0x1Fu):n==3?(c&0x0Fu):(c&0x07u);
	for(std::size_t k=1;k<n;++k)cp=(cp<<6)|(static_cast<unsigned char>(s[i+k])&0x3Fu);
	i+=n;
	return cp;
}

// terminal columns taken by one printable code point
inline int codePointWidth(char32_t cp) {
	// combining marks, zero width space/joiners, variation selectors
	if((cp>=0x0300u && cp<=0x036Fu) || (cp>=0x200Bu && cp<=0x200Fu) || (cp>=0xFE00u && cp<=0xFE0Fu)){
		return 0;
	}
	if((cp>=0x1100u && cp<=0x115Fu) ||
		(cp>=0x2E80u && cp<=0xA4CFu && cp!=0x303Fu) ||
		(cp>=0xAC00u && cp<=0xD7A3u) ||
		(cp>=0xF900u && cp<=0xFAFFu) ||
		(cp>=0xFE30u && cp<=0xFE4Fu) ||
		(cp>=0xFF00u && cp<=0xFF60u) ||
		(cp>=0xFFE0u && cp<=0xFFE6u) ||
		(cp>=0x1F300u && cp<=0x1F64Fu) ||
		(cp>=0x1F900u && cp<=0x1F9FFu) ||
		(cp>=0x20000u && cp<=0x3FFFDu)){
		return 2;
	}
	return 1;
}

inline std::size_t displayWidth(const std::string &s) {
	std::size_t w=0;
	std::size_t i=0;
	while(i<s.size())w+=static_cast<std::size_t>(codePointWidth(nextCodePoint(s,i)));
	return w;
}

// longest prefix that fits in `cols` columns
inline std::string fitWidth(const std::string &s,std::size_t cols) {
	std::size_t w=0;
	std::size_t i=0;
	while(i<s.size()){
		std::size_t j=i;
		std::size_t cw=static_cast<std::size_t>(codePointWidth(nextCodePoint(s,j)));
		if(w+cw>cols)break;
		w+=cw;
		i=j;
	}
	return s.substr(0,i);
}

// longest suffix that fits in `cols` columns
inline std::string fitWidthTail(const std::string &s,std::size_t cols) {
	std::size_t total=displayWidth(s);
	std::size_t i=0;
	while(total>cols && i<s.size()){
		total-=static_cast<std::size_t>(codePointWidth(nextCodePoint(s,i)));
	}
	return s.substr(i);
}

// Makes peer text safe to print: C0 controls and DEL become caret notation
// (ESC -> ^[, LF -> ^J, DEL -> ^?), C1 controls and invalid bytes become '?'.
inline std::string sanitizeForDisplay(const std::string &s) {
	std::string out;
	out.reserve(s.size());
	std::size_t i=0;
	while(i<s.size()){
		unsigned char c=static_cast<unsigned char>(s[i]);
		if(c<0x20u || c==0x7Fu){
			out+='^';
			out+=static_cast<char>(c==0x7Fu?'?':c+0x40u);
			++i;
			continue;
		}
		if(c<0x80u){
			out+=static_cast<char>(c);
			++i;
			continue;
		}
		std::size_t n=utf8SequenceLength(c);
		if(n==0 || i+n>s.size() || !isValidUtf8(s.data()+i,n)){
			out+='?';
			++i;
			continue;
		}
		std::size_t j=i;
		char32_t cp=nextCodePoint(s,j);
		if(cp>=0x80u && cp<=0x9Fu){
			out+='?';
		}else{
			out.append(s,i,n);
		}
		i=j;
	}
	return out;
}

inline std::string formatTime(std::chrono::system_clock::time_point tp,const char *fmt) {
	std::time_t t=std::chrono::system_clock::to_time_t(tp);
	struct tm local{};
	::localtime_r(&t,&local);
	char buf[64];
	std::size_t n=std::strftime(buf,sizeof(buf),fmt,&local);
	return std::string(buf,n);
}

inline std::string clockTime(std::chrono::system_clock::time_point tp) {
	return formatTime(tp,"%H:%M:%S");
}

} // namespace lanchat

#endif
