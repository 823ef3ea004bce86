#include "transport.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>

namespace lanchat {

namespace {

TransportStatus statusFromErrno(int err) {
	if(err==EADDRINUSE)return TransportStatus::BindConflict;
	if(err==EADDRNOTAVAIL)return TransportStatus::AddressUnavailable;
	return TransportStatus::TransportError;
}

std::string endpoint(const std::string &ip,unsigned short port) {
	return ip+":"+std::to_string(port);
}

} // namespace

const char *transportStatusName(TransportStatus st) {
	switch(st){
	case TransportStatus::Ok:return "ok";
	case TransportStatus::NotOpen:return "not open";
	case TransportStatus::BindConflict:return "port already in use";
	case TransportStatus::AddressUnavailable:return "address not available";
	case TransportStatus::TransportError:return "transport error";
	}
	return "unknown";
}

BroadcastTransport::BroadcastTransport(Logger &logger)
	:logger_(logger),
	opts_(),
	bindAddress_(),
	port_(0),
	open_(false),
	receiveTimeoutMs_(kDefaultReceiveTimeoutMs),
	lastError_(),
	fdMutex_(),
	sendFd_(-1),
	recvFd_(-1),
	wakeFd_(-1) {}

BroadcastTransport::~BroadcastTransport() {
	close();
}

bool BroadcastTransport::setFlag(int fd,int level,int opt,const char *name) {
	int one=1;
	if(::setsockopt(fd,level,opt,&one,sizeof(one))<0){
		lastError_=std::string("setsockopt(")+name+"): "+std::strerror(errno);
		logger_.error(lastError_);
		return false;
	}
	return true;
}

TransportStatus BroadcastTransport::openRecvSocket(unsigned short port) {
	recvFd_=::socket(AF_INET,SOCK_DGRAM|SOCK_CLOEXEC,0);
	if(recvFd_<0){
		lastError_=std::string("socket: ")+std::strerror(errno);
		logger_.error(lastError_);
		return TransportStatus::TransportError;
	}
	if(opts_.reuseAddress && !setFlag(recvFd_,SOL_SOCKET,SO_REUSEADDR,"SO_REUSEADDR"))return TransportStatus::TransportError;
	if(opts_.reusePort && !setFlag(recvFd_,SOL_SOCKET,SO_REUSEPORT,"SO_REUSEPORT"))return TransportStatus::TransportError;
	if(!setFlag(recvFd_,SOL_SOCKET,SO_BROADCAST,"SO_BROADCAST"))return TransportStatus::TransportError;

	sockaddr_in addr{};
	addr.sin_family=AF_INET;
	addr.sin_addr.s_addr=htonl(INADDR_ANY);
	addr.sin_port=htons(port);
	if(::bind(recvFd_,reinterpret_cast<sockaddr*>(&addr),sizeof(addr))<0){
		int err=errno;
		lastError_="bind "+endpoint("0.0.0.0",port)+": "+std::strerror(err);
		logger_.error(lastError_);
		return statusFromErrno(err);
	}

	sockaddr_in bound{};
	socklen_t blen=sizeof(bound);
	if(::getsockname(recvFd_,reinterpret_cast<sockaddr*>(&bound),&blen)<0){
		lastError_=std::string("getsockname: ")+std::strerror(errno);
		logger_.error(lastError_);
		return TransportStatus::TransportError;
	}
	port_=ntohs(bound.sin_port);
	logger_.info("receive socket bound to "+endpoint("0.0.0.0",port_));
	return TransportStatus::Ok;
}

TransportStatus BroadcastTransport::openSendSocket(unsigned short port) {
	sendFd_=::socket(AF_INET,SOCK_DGRAM|SOCK_CLOEXEC,0);
	if(sendFd_<0){
		lastError_=std::string("socket: ")+std::strerror(errno);
		logger_.error(lastError_);
		return TransportStatus::TransportError;
	}
	if(!setFlag(sendFd_,SOL_SOCKET,SO_BROADCAST,"SO_BROADCAST"))return TransportStatus::TransportError;
	if(opts_.bindSendToPort){
		if(opts_.reuseAddress && !setFlag(sendFd_,SOL_SOCKET,SO_REUSEADDR,"SO_REUSEADDR"))return TransportStatus::TransportError;
		if(opts_.reusePort && !setFlag(sendFd_,SOL_SOCKET,SO_REUSEPORT,"SO_REUSEPORT"))return TransportStatus::TransportError;
	}

	sockaddr_in addr{};
	addr.sin_family=AF_INET;
	addr.sin_port=htons(opts_.bindSendToPort?port:0);
	if(::inet_pton(AF_INET,bindAddress_.c_str(),&addr.sin_addr)!=1){
		lastError_="invalid IPv4 address: "+bindAddress_;
		logger_.error(lastError_);
		return TransportStatus::AddressUnavailable;
	}
	if(::bind(sendFd_,reinterpret_cast<sockaddr*>(&addr),sizeof(addr))<0){
		int err=errno;
		if(err==EADDRINUSE && opts_.bindSendToPort){
			// the interface is fine, only the shared port is taken
			logger_.warning("send socket cannot share "+endpoint(bindAddress_,port)+", using an ephemeral port");
			addr.sin_port=htons(0);
			if(::bind(sendFd_,reinterpret_cast<sockaddr*>(&addr),sizeof(addr))==0){
				logger_.info("send socket bound to "+endpoint(bindAddress_,0));
				return TransportStatus::Ok;
			}
			err=errno;
		}
		lastError_="bind "+endpoint(bindAddress_,ntohs(addr.sin_port))+": "+std::strerror(err);
		logger_.error(lastError_);
		return statusFromErrno(err);
	}
	logger_.info("send socket bound to "+endpoint(bindAddress_,ntohs(addr.sin_port)));
	return TransportStatus::Ok;
}

TransportStatus BroadcastTransport::open(const std::string &bindAddress,unsigned short port,
	const TransportOptions &opts) {
	Logger::Scope scope(logger_,"BroadcastTransport::open");
	if(open_.load()){
		logger_.warning("transport already open on "+endpoint(bindAddress_,port_));
		return TransportStatus::Ok;
	}

	std::unique_lock<std::shared_mutex> lock(fdMutex_);
	opts_=opts;
	bindAddress_=bindAddress;
	port_=port;
	receiveTimeoutMs_.store(opts.receiveTimeoutMs);
	lastError_.clear();

	wakeFd_=::eventfd(0,EFD_CLOEXEC|EFD_NONBLOCK);
	if(wakeFd_<0){
		lastError_=std::string("eventfd: ")+std::strerror(errno);
		logger_.error(lastError_);
		closeFds();
		return TransportStatus::TransportError;
	}

	TransportStatus st=openRecvSocket(port);
	if(st==TransportStatus::Ok)st=openSendSocket(port_);
	if(st!=TransportStatus::Ok){
		closeFds();
		return st;
	}

	open_.store(true);
	logger_.info("transport open: "+endpoint(bindAddress_,port_)+" -> "+endpoint(opts_.destinationAddress,port_));
	return TransportStatus::Ok;
}

void BroadcastTransport::closeFds() {
	if(recvFd_>=0){
		::close(recvFd_);
		recvFd_=-1;
	}
	if(sendFd_>=0){
		::close(sendFd_);
		sendFd_=-1;
	}
	if(wakeFd_>=0){
		::close(wakeFd_);
		wakeFd_=-1;
	}
}

void BroadcastTransport::close() {
	if(!open_.exchange(false))return;

	// kick a receive() that is sitting in poll before taking the lock
	{
		std::shared_lock<std::shared_mutex> lock(fdMutex_);
		if(wakeFd_>=0){
			u64 one=1;
			if(::write(wakeFd_,&one,sizeof(one))<0 && errno!=EAGAIN){
				logger_.warning(std::string("wake write failed: ")+std::strerror(errno));
			}
		}
	}

	std::unique_lock<std::shared_mutex> lock(fdMutex_);
	closeFds();
	logger_.info("transport closed");
}

void BroadcastTransport::setReceiveTimeout(int timeoutMs) {
	if(timeoutMs<0)timeoutMs=0;
	receiveTimeoutMs_.store(timeoutMs);
	logger_.debug("receive timeout set to "+std::to_string(timeoutMs)+" ms");
}

RecvStatus BroadcastTransport::receive(Datagram &out) {
	return receive(out,receiveTimeoutMs_.load());
}

RecvStatus BroadcastTransport::receive(Datagram &out,int timeoutMs) {
	std::shared_lock<std::shared_mutex> lock(fdMutex_);
	if(!open_.load() || recvFd_<0)return RecvStatus::Closed;

	struct pollfd pfd[2]{};
	pfd[0].fd=recvFd_;
	pfd[0].events=POLLIN;
	pfd[1].fd=wakeFd_;
	pfd[1].events=POLLIN;
	int ret=::poll(pfd,2,timeoutMs);
	if(ret<0){
		if(errno==EINTR)return RecvStatus::Timeout;
		logger_.error(std::string("poll: ")+std::strerror(errno));
		return RecvStatus::Error;
	}
	if(ret==0)return RecvStatus::Timeout;
	if((pfd[1].revents&POLLIN) || !open_.load())return RecvStatus::Closed;

	std::string buf(opts_.receiveBufferSize,'\0');
	sockaddr_in from{};
	socklen_t flen=sizeof(from);
	ssize_t n=::recvfrom(recvFd_,buf.data(),buf.size(),MSG_DONTWAIT|MSG_TRUNC,
		reinterpret_cast<sockaddr*>(&from),&flen);
	if(n<0){
		if(errno==EAGAIN || errno==EWOULDBLOCK || errno==EINTR)return RecvStatus::Timeout;
		logger_.error(std::string("recvfrom: ")+std::strerror(errno));
		return RecvStatus::Error;
	}
	std::size_t len=static_cast<std::size_t>(n);
	if(len>buf.size()){
		logger_.debug("datagram of "+std::to_string(len)+" bytes truncated to "+std::to_string(buf.size()));
		len=buf.size();
	}
	buf.resize(len);

	char ipbuf[INET_ADDRSTRLEN];
	const char *ptr=::inet_ntop(AF_INET,&from.sin_addr,ipbuf,sizeof(ipbuf));
	out.payload=std::move(buf);
	out.sourceAddress=ptr!=nullptr?ptr:"unknown";
	out.sourcePort=ntohs(from.sin_port);
	return RecvStatus::Ok;
}

TransportStatus BroadcastTransport::broadcastSend(const std::string &payload) {
	std::shared_lock<std::shared_mutex> lock(fdMutex_);
	if(!open_.load() || sendFd_<0){
		logger_.warning("send attempted on a closed transport");
		return TransportStatus::NotOpen;
	}

	sockaddr_in dest{};
	dest.sin_family=AF_INET;
	dest.sin_port=htons(port_);
	if(::inet_pton(AF_INET,opts_.destinationAddress.c_str(),&dest.sin_addr)!=1){
		logger_.error("invalid destination address: "+opts_.destinationAddress);
		return TransportStatus::TransportError;
	}

	ssize_t n=::sendto(sendFd_,payload.data(),payload.size(),0,
		reinterpret_cast<sockaddr*>(&dest),sizeof(dest));
	if(n<0){
		logger_.error("sendto "+endpoint(opts_.destinationAddress,port_)+": "+std::strerror(errno));
		return TransportStatus::TransportError;
	}
	if(static_cast<std::size_t>(n)!=payload.size()){
		logger_.warning("short send: "+std::to_string(n)+"/"+std::to_string(payload.size())+" bytes");
		return TransportStatus::TransportError;
	}
	logger_.debug("broadcast "+std::to_string(n)+" bytes -> "+endpoint(opts_.destinationAddress,port_));
	return TransportStatus::Ok;
}

TransportSnapshot BroadcastTransport::snapshot() const {
	std::shared_lock<std::shared_mutex> lock(fdMutex_);
	TransportSnapshot s;
	s.open=open_.load();
	s.bindAddress=bindAddress_;
	s.port=port_;
	s.receiveTimeoutMs=receiveTimeoutMs_.load();
	s.bufferSize=opts_.receiveBufferSize;
	return s;
}

} // namespace lanchat
