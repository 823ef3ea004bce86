#ifndef LANCHAT_TUI_HPP
#define LANCHAT_TUI_HPP

#include "chat_common.hpp"
#include "history.hpp"
#include "input.hpp"
#include "terminal.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <iostream>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace lanchat {

class InboundQueue;
class Logger;

using SendFn=std::function<bool(const std::string&)>;

struct RenderState {
	bool statusDirty{true};
	bool inputDirty{true};
	bool historyDirty{true};
	bool historyFullRedraw{true};
	int viewportHeight{0};
	int viewportWidth{0};
	// sequence number one past the last history entry on screen
	u64 lastRenderedHistoryLength{0};
};

// status on the first row, input on the last, history in between
struct Layout {
	int rows{0};
	int cols{0};
	int historyTop{2};
	int historyHeight{0};
	int inputRow{0};

	static Layout forSize(TermSize size);
	int textWidth() const { return cols>1?cols-1:cols; }
};

struct RenderContext {
	std::ostream &out;
	const Layout &layout;
	RenderState &state;
	const MessageHistory &history;
	InputHandler &input;
	const std::string &statusLine;
	InputResult lastInput;
};

class StatusRegion {
public:
	bool draw(RenderContext &ctx);
	bool handleKey(const KeyEvent &ev,RenderContext &ctx);
};

class HistoryRegion {
public:
	bool draw(RenderContext &ctx);
	bool handleKey(const KeyEvent &ev,RenderContext &ctx);
	void reset() { filled_=0; }
	int filledRows() const { return filled_; }

private:
	int filled_{0};

	void drawFull(RenderContext &ctx);
	void drawAppend(RenderContext &ctx);
	void putLine(RenderContext &ctx,int row,const std::string &text,EntryKind kind);
};

class InputRegion {
public:
	bool draw(RenderContext &ctx);
	bool handleKey(const KeyEvent &ev,RenderContext &ctx);

	// 1-based column just after the visible input text
	static int caretColumn(const Layout &layout,const InputHandler &input);
};

using Region=std::variant<StatusRegion,HistoryRegion,InputRegion>;

// The terminal front end. Everything here belongs to the UI thread; the
// only thing it shares with the receiver is the inbound queue.
class Tui {
public:
	Tui(InboundQueue &queue,Logger &logger,std::ostream &out=std::cout);

	void setIdentity(const std::string &ip,unsigned short port);
	void setSender(SendFn sender);

	void setStatus(const std::string &text);
	void addSystemLine(const std::string &text);

	const std::string &nickname() const { return input_.nickname(); }
	const std::string &status() const { return status_; }

	// full loop on the real terminal until quit, interrupt or stop
	void run(std::stop_token stop);

	// one render pass: resize check, queue drain, repaint of dirty regions
	void frame(TermSize size);
	// decode and dispatch raw key bytes
	void feedInput(const std::string &bytes);

	bool quitRequested() const { return quit_; }
	const RenderState &renderState() const { return state_; }
	const Layout &layout() const { return layout_; }
	const MessageHistory &history() const { return history_; }
	const InputHandler &input() const { return input_; }

	static void handleSignal(int sig);
	static bool interruptRequested() { return interrupted.load(std::memory_order_relaxed); }
	static void clearInterrupt() { interrupted.store(false,std::memory_order_relaxed); }

private:
	static inline std::atomic<bool> interrupted{false};

	InboundQueue &queue_;
	Logger &logger_;
	std::ostream &out_;
	SendFn sender_;
	bool quit_;

	std::string ifaceIp_;
	unsigned short ifacePort_;
	std::string status_;
	std::string statusLine_;

	RenderState state_;
	Layout layout_;
	MessageHistory history_;
	InputHandler input_;
	KeyDecoder decoder_;
	std::array<Region,3> regions_;

	std::vector<InboundEnvelope> batch_;
	std::vector<KeyEvent> keys_;

	void rebuildLayout(TermSize size);
	void drainInbound();
	void appendEntry(HistoryEntry entry);
	bool paint();
	void placeCaret();
	void refreshStatusLine();
	void apply(const InputResult &res);
};

} // namespace lanchat

#endif
