#include "config.hpp"

#include <cerrno>
#include <cstdlib>
#include <ostream>

#include <arpa/inet.h>
#include <getopt.h>

namespace lanchat {

namespace {

constexpr int kMinTimeoutMs=50;
constexpr int kMaxTimeoutMs=10000;

bool parseInt(const char *s,long lo,long hi,long &out) {
	if(s==nullptr || *s=='\0')return false;
	errno=0;
	char *end=nullptr;
	long v=std::strtol(s,&end,10);
	if(errno!=0 || end==s || *end!='\0')return false;
	if(v<lo || v>hi)return false;
	out=v;
	return true;
}

} // namespace

bool isValidIPv4(const std::string &ip) {
	struct in_addr addr{};
	return ::inet_pton(AF_INET,ip.c_str(),&addr)==1;
}

void printUsage(std::ostream &out,const char *prog) {
	out<<"Usage: "<<prog<<" --ip <IPv4> --port <1-65535> [--log] [--log-dir <dir>] [--timeout-ms <n>]\n"
		<<"\nUDP broadcast chat for the local network\n\n"
		<<"  -i, --ip <IPv4>        interface address used to send\n"
		<<"  -p, --port <port>      UDP port to send and listen on\n"
		<<"  -l, --log              write a log file\n"
		<<"  -d, --log-dir <dir>    log directory (default: logs)\n"
		<<"  -t, --timeout-ms <n>   receive timeout in ms ("<<kMinTimeoutMs<<"-"<<kMaxTimeoutMs<<", default: "
		<<kDefaultReceiveTimeoutMs<<")\n"
		<<"  -h, --help             show this help\n"
		<<"\nExample: "<<prog<<" --ip 192.168.1.100 --port 12345 --log\n";
}

ParseResult parseCommandLine(int argc,char **argv,AppConfig &config,std::string &error) {
	static const struct option longOpts[]={
		{"ip",required_argument,nullptr,'i'},
		{"port",required_argument,nullptr,'p'},
		{"log",no_argument,nullptr,'l'},
		{"log-dir",required_argument,nullptr,'d'},
		{"timeout-ms",required_argument,nullptr,'t'},
		{"help",no_argument,nullptr,'h'},
		{nullptr,0,nullptr,0},
	};

	AppConfig cfg;
	bool haveIp=false;
	bool havePort=false;
	long value=0;

	// getopt keeps global state; 0 makes glibc start over
	optind=0;
	opterr=0;
	int opt;
	while((opt=::getopt_long(argc,argv,":i:p:ld:t:h",longOpts,nullptr))!=-1){
		switch(opt){
		case 'i':
			cfg.ip=optarg;
			if(!isValidIPv4(cfg.ip)){
				error="invalid IPv4 address: '"+cfg.ip+"'";
				return ParseResult::Invalid;
			}
			haveIp=true;
			break;
		case 'p':
			if(!parseInt(optarg,1,65535,value)){
				error=std::string("port must be in the range 1-65535: '")+optarg+"'";
				return ParseResult::Invalid;
			}
			cfg.port=static_cast<unsigned short>(value);
			havePort=true;
			break;
		case 'l':
			cfg.enableLogging=true;
			break;
		case 'd':
			cfg.logDir=optarg;
			if(cfg.logDir.empty()){
				error="log directory must not be empty";
				return ParseResult::Invalid;
			}
			break;
		case 't':
			if(!parseInt(optarg,kMinTimeoutMs,kMaxTimeoutMs,value)){
				error="timeout must be "+std::to_string(kMinTimeoutMs)+"-"+std::to_string(kMaxTimeoutMs)
					+" ms: '"+optarg+"'";
				return ParseResult::Invalid;
			}
			cfg.receiveTimeoutMs=static_cast<int>(value);
			break;
		case 'h':
			return ParseResult::Help;
		case ':':
			error="missing value for an option";
			return ParseResult::Missing;
		default:
			error="unknown option";
			return ParseResult::Invalid;
		}
	}
	if(optind<argc){
		error=std::string("unexpected argument: '")+argv[optind]+"'";
		return ParseResult::Invalid;
	}
	if(!haveIp || !havePort){
		error=!haveIp?"--ip is required":"--port is required";
		return ParseResult::Missing;
	}
	config=std::move(cfg);
	return ParseResult::Ok;
}

std::string describe(const AppConfig &config) {
	return "ip="+config.ip+" port="+std::to_string(config.port)
		+" logging="+(config.enableLogging?"enabled ("+config.logDir+")":std::string("disabled"))
		+" timeout="+std::to_string(config.receiveTimeoutMs)+"ms";
}

} // namespace lanchat
