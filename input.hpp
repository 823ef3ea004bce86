#ifndef LANCHAT_INPUT_HPP
#define LANCHAT_INPUT_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace lanchat {

enum class KeyKind {
	Char,
	Enter,
	Backspace,
	Interrupt,
};

struct KeyEvent {
	KeyKind kind;
	std::string text; // one UTF-8 code point for KeyKind::Char
};

// Turns raw terminal bytes into key events. Multi-byte UTF-8 and escape
// sequences may arrive split over several reads; the partial tail is kept
// until the next feed. Escape sequences (arrows, function keys) are eaten.
class KeyDecoder {
public:
	KeyDecoder();

	void feed(const std::string &bytes,std::vector<KeyEvent> &out);
	void reset();

private:
	enum class State {
		Ground,
		Escape,
		Csi,
		Ss3,
		Utf8,
	};

	State state_;
	std::string utf8_;
	std::size_t utf8Need_;
	bool lastWasCr_;

	void ground(char c,std::vector<KeyEvent> &out);
};

enum class InputMode {
	Nickname,
	Message,
};

enum class InputAction {
	None,
	Edited,
	NicknameAccepted,
	NicknameRejected,
	Submit,
	Quit,
};

struct InputResult {
	InputAction action{InputAction::None};
	std::string text;   // the line to send for InputAction::Submit
	std::string status; // user-facing reason for InputAction::NicknameRejected
};

bool isQuitCommand(const std::string &line);

// Nickname -> Message, never back. The buffer always holds whole code points.
class InputHandler {
public:
	InputHandler();

	InputResult handleKey(const KeyEvent &ev);

	InputMode mode() const { return mode_; }
	const std::string &buffer() const { return buffer_; }
	const std::string &nickname() const { return nickname_; }
	const char *prompt() const;

private:
	InputMode mode_;
	std::string buffer_;
	std::string nickname_;

	InputResult submit();
};

} // namespace lanchat

#endif
