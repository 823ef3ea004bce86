#include "log.hpp"
#include "chat_common.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <sys/stat.h>
#include <unistd.h>

namespace lanchat {

namespace {

thread_local int scopeDepth=0;

bool ensureDirectory(const std::string &dir,std::string &err) {
	if(dir.empty() || dir==".")return true;
	std::string partial;
	std::size_t pos=0;
	while(pos!=std::string::npos){
		pos=dir.find('/',pos+1);
		partial=dir.substr(0,pos);
		if(partial.empty())continue;
		if(::mkdir(partial.c_str(),0755)!=0 && errno!=EEXIST){
			err="cannot create "+partial+": "+std::strerror(errno);
			return false;
		}
	}
	if(::access(dir.c_str(),W_OK)!=0){
		err="no write access to "+dir;
		return false;
	}
	return true;
}

} // namespace

const char *logLevelTag(LogLevel level) {
	switch(level){
	case LogLevel::Debug:return "DBG";
	case LogLevel::Info:return "INF";
	case LogLevel::Warning:return "WAR";
	case LogLevel::Error:return "ERR";
	}
	return "???";
}

Logger::Logger()
	:mutex_(),
	console_(nullptr),
	minLevel_(LogLevel::Debug),
	file_(),
	filePath_() {}

Logger::~Logger() {
	closeFile();
}

void Logger::setConsole(std::ostream *out) {
	std::lock_guard<std::mutex> lock(mutex_);
	console_=out;
}

void Logger::setMinLevel(LogLevel level) {
	std::lock_guard<std::mutex> lock(mutex_);
	minLevel_=level;
}

bool Logger::tryOpen(const std::string &dir,const std::string &name,std::string &err) {
	if(!ensureDirectory(dir,err))return false;
	std::string path=dir.empty()?name:dir+"/"+name;
	std::ofstream out(path,std::ios::out|std::ios::trunc);
	if(!out.good()){
		err="cannot open "+path+": "+std::strerror(errno);
		return false;
	}
	std::lock_guard<std::mutex> lock(mutex_);
	file_=std::move(out);
	filePath_=path;
	return true;
}

bool Logger::openFile(const std::string &dir) {
	closeFile();
	const std::string stamp=formatTime(std::chrono::system_clock::now(),"%Y-%m-%d_%H-%M-%S");
	std::string err;
	if(tryOpen(dir,stamp+"_chat.log",err))return true;
	warning("log file: "+err);

	const char *home=std::getenv("HOME");
	if(home!=nullptr && *home!='\0'){
		if(tryOpen(std::string(home)+"/chat_logs",stamp+"_chat.log",err))return true;
		warning("log file: "+err);
	}
	if(tryOpen("",stamp+"_chat_fallback.log",err))return true;
	error("log file: "+err+", file logging disabled");
	return false;
}

void Logger::closeFile() {
	std::lock_guard<std::mutex> lock(mutex_);
	if(file_.is_open())file_.close();
	filePath_.clear();
}

bool Logger::fileEnabled() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return file_.is_open();
}

std::string Logger::filePath() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return filePath_;
}

void Logger::log(LogLevel level,const std::string &msg) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if(level<minLevel_)return;
	}
	std::string line=formatTime(std::chrono::system_clock::now(),"%Y-%m-%d %H:%M:%S");
	line+=" [";
	line+=logLevelTag(level);
	line+="] ";
	line.append(static_cast<std::size_t>(scopeDepth)*4u,' ');
	line+=msg;
	write(line);
}

void Logger::write(const std::string &line) {
	std::lock_guard<std::mutex> lock(mutex_);
	if(console_!=nullptr){
		(*console_)<<line<<'\n'<<std::flush;
	}
	if(file_.is_open()){
		file_<<line<<'\n';
		file_.flush();
	}
}

Logger::Scope::Scope(Logger &logger,std::string name)
	:logger_(logger),
	name_(std::move(name)) {
	logger_.info("[+] Start "+name_);
	++scopeDepth;
}

Logger::Scope::~Scope() {
	if(scopeDepth>0)--scopeDepth;
	logger_.info("[-] Stop "+name_);
}

} // namespace lanchat
