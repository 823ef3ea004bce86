#include "config.hpp"
#include "dispatcher.hpp"
#include "inbound_queue.hpp"
#include "log.hpp"
#include "transport.hpp"
#include "tui.hpp"

#include <chrono>
#include <csignal>
#include <iostream>

namespace {

void installSignalHandlers(lanchat::Logger &logger) {
	struct sigaction sa{};
	sa.sa_handler=lanchat::Tui::handleSignal;
	sigemptyset(&sa.sa_mask);
	// no SA_RESTART: a blocked poll should return EINTR
	sa.sa_flags=0;
	if(::sigaction(SIGINT,&sa,nullptr)<0)logger.warning("cannot install SIGINT handler");
	if(::sigaction(SIGTERM,&sa,nullptr)<0)logger.warning("cannot install SIGTERM handler");
}

} // namespace

int main(int argc,char **argv) {
	using namespace lanchat;
	const char *prog=argc>0?argv[0]:"lanchat";

	AppConfig config;
	std::string error;
	switch(parseCommandLine(argc,argv,config,error)){
	case ParseResult::Ok:
		break;
	case ParseResult::Help:
		printUsage(std::cout,prog);
		return kExitOk;
	case ParseResult::Missing:
	case ParseResult::Invalid:
		std::cerr<<"lanchat: "<<error<<"\n\n";
		printUsage(std::cerr,prog);
		return kExitUsage;
	}

	Logger logger;
	logger.setConsole(&std::cerr);
	logger.setMinLevel(LogLevel::Info);
	if(config.enableLogging){
		logger.setMinLevel(LogLevel::Debug);
		if(!logger.openFile(config.logDir)){
			std::cerr<<"lanchat: logging disabled, no writable log directory\n";
		}
	}
	logger.info("starting with "+describe(config));

	installSignalHandlers(logger);

	BroadcastTransport transport(logger);
	TransportOptions opts;
	opts.receiveTimeoutMs=config.receiveTimeoutMs;
	TransportStatus st=transport.open(config.ip,config.port,opts);
	if(st!=TransportStatus::Ok){
		std::cerr<<"lanchat: cannot open "<<config.ip<<":"<<config.port<<": "
			<<transportStatusName(st)<<" ("<<transport.lastError()<<")\n";
		logger.error(std::string("transport open failed: ")+transportStatusName(st));
		return kExitFailure;
	}

	InboundQueue queue;
	Tui tui(queue,logger);
	Dispatcher dispatcher(transport,queue,logger);

	tui.setIdentity(config.ip,config.port);
	tui.setSender([&dispatcher](const std::string &text){return dispatcher.sendMessage(text);});
	dispatcher.setNicknameSource([&tui](){return tui.nickname();});
	dispatcher.setStatusSink([&tui](const std::string &text){tui.setStatus(text);});
	tui.addSystemLine("Listening on 0.0.0.0:"+std::to_string(transport.port())
		+", sending to "+transport.destinationAddress()+":"+std::to_string(transport.port()));

	// the terminal belongs to the UI from here on
	logger.setConsole(nullptr);
	if(!dispatcher.start([&tui](std::stop_token stop){tui.run(stop);})){
		logger.setConsole(&std::cerr);
		logger.error("dispatcher failed to start");
		transport.close();
		return kExitFailure;
	}

	while(!dispatcher.waitForUi(std::chrono::milliseconds(100))){
		if(Tui::interruptRequested())break;
	}
	dispatcher.stop();
	logger.setConsole(&std::cerr);
	logger.info("stopped: "+describe(dispatcher.status()));
	transport.close();

	return Tui::interruptRequested()?kExitInterrupted:kExitOk;
}
