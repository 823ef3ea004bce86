#include "input.hpp"
#include "chat_common.hpp"

namespace lanchat {

KeyDecoder::KeyDecoder()
	:state_(State::Ground),
	utf8_(),
	utf8Need_(0),
	lastWasCr_(false) {}

void KeyDecoder::reset() {
	state_=State::Ground;
	utf8_.clear();
	utf8Need_=0;
	lastWasCr_=false;
}

void KeyDecoder::ground(char ch,std::vector<KeyEvent> &out) {
	unsigned char c=static_cast<unsigned char>(ch);
	bool wasCr=lastWasCr_;
	lastWasCr_=false;

	if(c=='\r'){
		lastWasCr_=true;
		out.push_back(KeyEvent{KeyKind::Enter,{}});
		return;
	}
	if(c=='\n'){
		// CR LF from a paste is one Enter
		if(!wasCr)out.push_back(KeyEvent{KeyKind::Enter,{}});
		return;
	}
	if(c==127u || c=='\b'){
		out.push_back(KeyEvent{KeyKind::Backspace,{}});
		return;
	}
	if(c==3u){
		out.push_back(KeyEvent{KeyKind::Interrupt,{}});
		return;
	}
	if(c==0x1Bu){
		state_=State::Escape;
		return;
	}
	if(c<32u)return;
	if(c<128u){
		out.push_back(KeyEvent{KeyKind::Char,std::string(1,ch)});
		return;
	}
	std::size_t n=utf8SequenceLength(c);
	if(n<2)return; // stray continuation byte or invalid lead
	utf8_.assign(1,ch);
	utf8Need_=n;
	state_=State::Utf8;
}

void KeyDecoder::feed(const std::string &bytes,std::vector<KeyEvent> &out) {
	for(char ch:bytes){
		unsigned char c=static_cast<unsigned char>(ch);
		switch(state_){
		case State::Ground:
			ground(ch,out);
			break;
		case State::Escape:
			if(ch=='['){
				state_=State::Csi;
			}else if(ch=='O'){
				state_=State::Ss3;
			}else{
				// ESC + key is Alt+key, keep the key
				state_=State::Ground;
				ground(ch,out);
			}
			break;
		case State::Csi:
			if(c>=0x40u && c<=0x7Eu)state_=State::Ground;
			break;
		case State::Ss3:
			state_=State::Ground;
			break;
		case State::Utf8:
			if((c&0xC0u)!=0x80u){
				// truncated sequence, drop it and look at this byte afresh
				utf8_.clear();
				state_=State::Ground;
				ground(ch,out);
				break;
			}
			utf8_.push_back(ch);
			if(utf8_.size()==utf8Need_){
				if(isValidUtf8(utf8_))out.push_back(KeyEvent{KeyKind::Char,utf8_});
				utf8_.clear();
				state_=State::Ground;
			}
			break;
		}
	}
}

bool isQuitCommand(const std::string &line) {
	std::string s=trim(line);
	return s=="/quit" || s=="/exit" || s=="/q";
}

InputHandler::InputHandler()
	:mode_(InputMode::Nickname),
	buffer_(),
	nickname_() {}

const char *InputHandler::prompt() const {
	return mode_==InputMode::Nickname?"nickname: ":">> ";
}

InputResult InputHandler::submit() {
	InputResult res;
	std::string line=trim(buffer_);
	if(isQuitCommand(line)){
		buffer_.clear();
		res.action=InputAction::Quit;
		return res;
	}

	if(mode_==InputMode::Nickname){
		if(line.empty()){
			buffer_.clear();
			res.action=InputAction::NicknameRejected;
			res.status="Nickname cannot be empty";
			return res;
		}
		if(utf8Length(line)>kMaxNicknameChars){
			// keep the text so it can be shortened
			res.action=InputAction::NicknameRejected;
			res.status="Nickname too long (max "+std::to_string(kMaxNicknameChars)+" characters)";
			return res;
		}
		nickname_=line;
		buffer_.clear();
		mode_=InputMode::Message;
		res.action=InputAction::NicknameAccepted;
		return res;
	}

	buffer_.clear();
	if(line.empty())return res;
	res.action=InputAction::Submit;
	res.text=std::move(line);
	return res;
}

InputResult InputHandler::handleKey(const KeyEvent &ev) {
	InputResult res;
	switch(ev.kind){
	case KeyKind::Enter:
		return submit();
	case KeyKind::Interrupt:
		res.action=InputAction::Quit;
		return res;
	case KeyKind::Backspace:
		if(buffer_.empty())return res;
		utf8PopBack(buffer_);
		res.action=InputAction::Edited;
		return res;
	case KeyKind::Char:
		if(ev.text.empty())return res;
		buffer_+=ev.text;
		res.action=InputAction::Edited;
		return res;
	}
	return res;
}

} // namespace lanchat
