#include "terminal.hpp"
#include "ansi.hpp"

#include <cerrno>

#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <termios.h>

namespace lanchat {

struct Terminal::TermiosHolder {
	bool valid;
	struct termios orig;

	TermiosHolder():valid(false),orig{} {}
};

Terminal::Terminal(std::ostream &out,int inFd,int outFd)
	:out_(out),
	inFd_(inFd),
	outFd_(outFd),
	active_(false),
	saved_() {}

Terminal::~Terminal() {
	restore();
}

bool Terminal::init() {
	if(active_)return saved_ && saved_->valid;

	saved_=std::make_unique<TermiosHolder>();
	if(::tcgetattr(inFd_,&saved_->orig)==0){
		saved_->valid=true;
		struct termios raw=saved_->orig;
		raw.c_lflag&=static_cast<tcflag_t>(~(ICANON|ECHO));
		raw.c_cc[VMIN]=0;
		raw.c_cc[VTIME]=0;
		if(::tcsetattr(inFd_,TCSAFLUSH,&raw)!=0){
			saved_->valid=false;
		}
	}

	out_<<ansi::kAltScreenOn<<ansi::kClear<<ansi::kHome<<std::flush;
	active_=true;
	return saved_->valid;
}

void Terminal::restore() {
	if(!active_)return;

	out_<<ansi::kReset<<ansi::kResetScrollRegion<<ansi::kShowCursor<<ansi::kAltScreenOff<<std::flush;
	if(saved_ && saved_->valid){
		::tcsetattr(inFd_,TCSAFLUSH,&saved_->orig);
	}
	saved_.reset();
	active_=false;
}

TermSize Terminal::querySize() const {
	TermSize sz;
	struct winsize ws{};
	if(::ioctl(outFd_,TIOCGWINSZ,&ws)==0){
		if(ws.ws_row>0)sz.rows=static_cast<int>(ws.ws_row);
		if(ws.ws_col>0)sz.cols=static_cast<int>(ws.ws_col);
	}
	if(sz.rows<kMinRows)sz.rows=kMinRows;
	if(sz.cols<kMinCols)sz.cols=kMinCols;
	return sz;
}

int Terminal::readInput(std::string &out,int timeoutMs) {
	struct pollfd pfd{};
	pfd.fd=inFd_;
	pfd.events=POLLIN;
	int ret=::poll(&pfd,1,timeoutMs);
	if(ret<0)return errno==EINTR?0:-1;
	if(ret==0)return 0;
	if(pfd.revents&(POLLERR|POLLNVAL))return -1;

	char buf[64];
	ssize_t n=::read(inFd_,buf,sizeof(buf));
	if(n<0){
		if(errno==EINTR || errno==EAGAIN)return 0;
		return -1;
	}
	// readable with nothing to read: end of input
	if(n==0)return -1;
	out.append(buf,static_cast<std::size_t>(n));
	return static_cast<int>(n);
}

} // namespace lanchat
