#include "codec.hpp"

#include <nlohmann/json.hpp>

namespace lanchat {

namespace {

constexpr const char *kNickField="nick";
constexpr const char *kTextField="msg";

bool readField(const nlohmann::json &obj,const char *key,std::string &out) {
	auto it=obj.find(key);
	if(it==obj.end() || !it->is_string())return false;
	out=trim(it->get<std::string>());
	return !out.empty();
}

} // namespace

const char *codecErrorName(CodecError err) {
	switch(err){
	case CodecError::None:return "ok";
	case CodecError::TooLarge:return "too large";
	case CodecError::Malformed:return "malformed";
	}
	return "unknown";
}

CodecError encodeMessage(const std::string &nickname,const std::string &text,std::string &out) {
	std::string nick=trim(nickname);
	std::string msg=trim(text);
	if(nick.empty() || msg.empty())return CodecError::Malformed;
	// dump() would throw on invalid UTF-8
	if(!isValidUtf8(nick) || !isValidUtf8(msg))return CodecError::Malformed;

	nlohmann::json obj=nlohmann::json::object();
	obj[kNickField]=std::move(nick);
	obj[kTextField]=std::move(msg);
	std::string wire=obj.dump();
	if(wire.size()>kMaxPayloadBytes)return CodecError::TooLarge;
	out=std::move(wire);
	return CodecError::None;
}

CodecError decodeMessage(const char *data,std::size_t len,ChatMessage &out) {
	if(data==nullptr || len==0 || len>kMaxPayloadBytes)return CodecError::Malformed;
	if(!isValidUtf8(data,len))return CodecError::Malformed;

	nlohmann::json obj=nlohmann::json::parse(data,data+len,nullptr,false);
	if(obj.is_discarded() || !obj.is_object())return CodecError::Malformed;

	ChatMessage msg;
	if(!readField(obj,kNickField,msg.nickname))return CodecError::Malformed;
	if(!readField(obj,kTextField,msg.text))return CodecError::Malformed;
	out=std::move(msg);
	return CodecError::None;
}

} // namespace lanchat
