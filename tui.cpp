#include "tui.hpp"
#include "ansi.hpp"
#include "inbound_queue.hpp"
#include "log.hpp"

#include <deque>

#include <unistd.h>

namespace lanchat {

namespace {

const char *colorFor(EntryKind kind) {
	return kind==EntryKind::System?ansi::kFgSys:ansi::kFgMsg;
}

std::string spaces(int n) {
	return n>0?std::string(static_cast<std::size_t>(n),' '):std::string();
}

// the tail of the buffer that fits after the prompt
std::string visibleInput(const Layout &layout,const InputHandler &input) {
	const int width=layout.textWidth();
	const int plen=static_cast<int>(displayWidth(input.prompt()));
	const int avail=width>plen?width-plen:0;
	return fitWidthTail(input.buffer(),static_cast<std::size_t>(avail));
}

} // namespace

Layout Layout::forSize(TermSize size) {
	Layout l;
	l.rows=size.rows<Terminal::kMinRows?Terminal::kMinRows:size.rows;
	l.cols=size.cols<Terminal::kMinCols?Terminal::kMinCols:size.cols;
	l.historyTop=2;
	l.historyHeight=l.rows-2;
	l.inputRow=l.rows;
	return l;
}

bool StatusRegion::draw(RenderContext &ctx) {
	if(!ctx.state.statusDirty)return false;
	const int cols=ctx.layout.cols;
	std::string line=fitWidth(ctx.statusLine,static_cast<std::size_t>(cols));
	int pad=cols-static_cast<int>(displayWidth(line));
	ctx.out<<ansi::moveTo(1,1)<<ansi::kBgStatus<<ansi::kFgDefault<<line<<spaces(pad)<<ansi::kReset;
	ctx.state.statusDirty=false;
	return true;
}

bool StatusRegion::handleKey(const KeyEvent &ev,RenderContext &ctx) {
	(void)ev;
	(void)ctx;
	return false;
}

void HistoryRegion::putLine(RenderContext &ctx,int row,const std::string &text,EntryKind kind) {
	ctx.out<<ansi::moveTo(ctx.layout.historyTop+row,1)<<colorFor(kind)<<text<<ansi::kReset<<ansi::kClearEol;
}

void HistoryRegion::drawFull(RenderContext &ctx) {
	struct Line {
		std::string text;
		EntryKind kind;
	};
	const int height=ctx.layout.historyHeight;
	const int width=ctx.layout.textWidth();

	// only the tail that fits is wrapped
	std::deque<Line> lines;
	const auto &entries=ctx.history.entries();
	for(auto it=entries.rbegin();it!=entries.rend() && static_cast<int>(lines.size())<height;++it){
		std::vector<std::string> wrapped=wrapLine(it->text,width);
		for(auto w=wrapped.rbegin();w!=wrapped.rend() && static_cast<int>(lines.size())<height;++w){
			lines.push_front(Line{*w,it->kind});
		}
	}

	for(int row=0;row<height;++row){
		if(row<static_cast<int>(lines.size())){
			putLine(ctx,row,lines[static_cast<std::size_t>(row)].text,lines[static_cast<std::size_t>(row)].kind);
		}else{
			ctx.out<<ansi::moveTo(ctx.layout.historyTop+row,1)<<ansi::kClearEol;
		}
	}
	filled_=static_cast<int>(lines.size());
}

void HistoryRegion::drawAppend(RenderContext &ctx) {
	const int height=ctx.layout.historyHeight;
	const int width=ctx.layout.textWidth();
	const int bottom=ctx.layout.historyTop+height-1;
	const u64 first=ctx.history.firstSeq();
	const auto &entries=ctx.history.entries();

	for(u64 seq=ctx.state.lastRenderedHistoryLength;seq<ctx.history.totalAppended();++seq){
		const HistoryEntry &e=entries[static_cast<std::size_t>(seq-first)];
		for(const std::string &line:wrapLine(e.text,width)){
			if(filled_<height){
				putLine(ctx,filled_,line,e.kind);
				++filled_;
			}else{
				// the scroll region is the history area, so only it moves
				ctx.out<<ansi::moveTo(bottom,1)<<ansi::kScrollUp;
				putLine(ctx,height-1,line,e.kind);
			}
		}
	}
}

bool HistoryRegion::draw(RenderContext &ctx) {
	RenderState &st=ctx.state;
	if(!st.historyDirty && !st.historyFullRedraw)return false;
	if(st.historyFullRedraw || ctx.history.firstSeq()>st.lastRenderedHistoryLength){
		drawFull(ctx);
	}else{
		drawAppend(ctx);
	}
	st.lastRenderedHistoryLength=ctx.history.totalAppended();
	st.historyDirty=false;
	st.historyFullRedraw=false;
	return true;
}

bool HistoryRegion::handleKey(const KeyEvent &ev,RenderContext &ctx) {
	(void)ev;
	(void)ctx;
	return false;
}

int InputRegion::caretColumn(const Layout &layout,const InputHandler &input) {
	int col=static_cast<int>(displayWidth(input.prompt())+displayWidth(visibleInput(layout,input)))+1;
	return col>layout.cols?layout.cols:col;
}

bool InputRegion::draw(RenderContext &ctx) {
	if(!ctx.state.inputDirty)return false;
	const std::string prompt=ctx.input.prompt();
	const std::string shown=visibleInput(ctx.layout,ctx.input);
	int pad=ctx.layout.textWidth()-static_cast<int>(displayWidth(prompt)+displayWidth(shown));
	ctx.out<<ansi::moveTo(ctx.layout.inputRow,1)<<ansi::kBgInput<<ansi::kFgDefault
		<<prompt<<shown<<spaces(pad)<<ansi::kReset<<ansi::kClearEol;
	ctx.state.inputDirty=false;
	return true;
}

bool InputRegion::handleKey(const KeyEvent &ev,RenderContext &ctx) {
	ctx.lastInput=ctx.input.handleKey(ev);
	if(ctx.lastInput.action!=InputAction::None || ev.kind==KeyKind::Enter){
		ctx.state.inputDirty=true;
	}
	return true;
}

Tui::Tui(InboundQueue &queue,Logger &logger,std::ostream &out)
	:queue_(queue),
	logger_(logger),
	out_(out),
	sender_(),
	quit_(false),
	ifaceIp_("0.0.0.0"),
	ifacePort_(0),
	status_("Enter a nickname"),
	statusLine_(),
	state_(),
	layout_(),
	history_(kHistoryCap),
	input_(),
	decoder_(),
	regions_{StatusRegion{},HistoryRegion{},InputRegion{}},
	batch_(),
	keys_() {
	refreshStatusLine();
}

void Tui::setIdentity(const std::string &ip,unsigned short port) {
	ifaceIp_=ip;
	ifacePort_=port;
	refreshStatusLine();
	state_.statusDirty=true;
}

void Tui::setSender(SendFn sender) {
	sender_=std::move(sender);
}

void Tui::refreshStatusLine() {
	const std::string &nick=input_.nickname();
	statusLine_="iface="+ifaceIp_+":"+std::to_string(ifacePort_)
		+" | nickname="+(nick.empty()?std::string("---"):sanitizeForDisplay(nick))
		+" | status="+sanitizeForDisplay(status_);
}

void Tui::setStatus(const std::string &text) {
	status_=text;
	refreshStatusLine();
	state_.statusDirty=true;
}

void Tui::appendEntry(HistoryEntry entry) {
	history_.append(std::move(entry));
	state_.historyDirty=true;
	// some entries were evicted before they were ever drawn
	if(history_.firstSeq()>state_.lastRenderedHistoryLength){
		state_.historyFullRedraw=true;
	}
}

void Tui::addSystemLine(const std::string &text) {
	appendEntry(HistoryEntry{clockTime(std::chrono::system_clock::now())+" "+text,EntryKind::System});
}

void Tui::drainInbound() {
	batch_.clear();
	if(queue_.drainInto(batch_)==0)return;
	for(const InboundEnvelope &env:batch_){
		appendEntry(HistoryEntry{formatEnvelope(env),EntryKind::Chat});
	}
	batch_.clear();
}

void Tui::rebuildLayout(TermSize size) {
	layout_=Layout::forSize(size);
	state_.viewportHeight=layout_.historyHeight;
	state_.viewportWidth=layout_.cols;
	state_.statusDirty=true;
	state_.inputDirty=true;
	state_.historyDirty=true;
	state_.historyFullRedraw=true;
	std::get<HistoryRegion>(regions_[1]).reset();

	out_<<ansi::kResetScrollRegion<<ansi::kClear
		<<ansi::scrollRegion(layout_.historyTop,layout_.historyTop+layout_.historyHeight-1);
	logger_.debug("layout rebuilt for "+std::to_string(layout_.cols)+"x"+std::to_string(layout_.rows));
}

void Tui::placeCaret() {
	out_<<ansi::moveTo(layout_.inputRow,InputRegion::caretColumn(layout_,input_));
}

bool Tui::paint() {
	if(!state_.statusDirty && !state_.inputDirty && !state_.historyDirty && !state_.historyFullRedraw){
		return false;
	}
	out_<<ansi::kHideCursor;
	RenderContext ctx{out_,layout_,state_,history_,input_,statusLine_,{}};
	for(Region &r:regions_){
		std::visit([&ctx](auto &region){region.draw(ctx);},r);
	}
	placeCaret();
	out_<<ansi::kShowCursor<<std::flush;
	return true;
}

void Tui::frame(TermSize size) {
	if(size.rows!=layout_.rows || size.cols!=layout_.cols){
		rebuildLayout(size);
	}
	drainInbound();
	paint();
}

void Tui::apply(const InputResult &res) {
	switch(res.action){
	case InputAction::None:
	case InputAction::Edited:
		break;
	case InputAction::NicknameAccepted:
		logger_.info("nickname set to "+input_.nickname());
		setStatus("OK");
		break;
	case InputAction::NicknameRejected:
		setStatus(res.status);
		break;
	case InputAction::Submit:
		if(!sender_){
			setStatus("Not connected");
			break;
		}
		// the sender reports success or failure through setStatus
		if(!sender_(res.text))logger_.debug("send reported failure");
		break;
	case InputAction::Quit:
		logger_.info("quit requested");
		quit_=true;
		break;
	}
}

void Tui::feedInput(const std::string &bytes) {
	keys_.clear();
	decoder_.feed(bytes,keys_);
	for(const KeyEvent &ev:keys_){
		RenderContext ctx{out_,layout_,state_,history_,input_,statusLine_,{}};
		for(Region &r:regions_){
			if(std::visit([&ev,&ctx](auto &region){return region.handleKey(ev,ctx);},r))break;
		}
		apply(ctx.lastInput);
		if(quit_)break;
	}
}

void Tui::handleSignal(int sig) {
	(void)sig;
	interrupted.store(true,std::memory_order_relaxed);
}

void Tui::run(std::stop_token stop) {
	Logger::Scope scope(logger_,"Tui::run");
	Terminal term(out_,STDIN_FILENO,STDOUT_FILENO);
	if(!term.init()){
		logger_.warning("stdin is not a terminal, input is read as-is");
	}
	layout_=Layout{};

	while(!quit_ && !stop.stop_requested()){
		if(interruptRequested()){
			logger_.info("interrupt received");
			break;
		}
		frame(term.querySize());

		std::string bytes;
		int n=term.readInput(bytes,kKeyPollTimeoutMs);
		if(n<0){
			logger_.warning("terminal input closed");
			quit_=true;
			break;
		}
		if(n>0)feedInput(bytes);
	}
	term.restore();
}

} // namespace lanchat
