#ifndef LANCHAT_CONFIG_HPP
#define LANCHAT_CONFIG_HPP

#include "chat_common.hpp"

#include <iosfwd>
#include <string>

namespace lanchat {

struct AppConfig {
	std::string ip;
	unsigned short port{0};
	bool enableLogging{false};
	std::string logDir{"logs"};
	int receiveTimeoutMs{kDefaultReceiveTimeoutMs};
};

enum class ParseResult {
	Ok,
	Help,
	Missing,
	Invalid,
};

constexpr int kExitOk=0;
constexpr int kExitFailure=1;
constexpr int kExitUsage=2;
constexpr int kExitInterrupted=130;

// --ip and --port are required; on Missing/Invalid `error` says why
ParseResult parseCommandLine(int argc,char **argv,AppConfig &config,std::string &error);

bool isValidIPv4(const std::string &ip);
void printUsage(std::ostream &out,const char *prog);
std::string describe(const AppConfig &config);

} // namespace lanchat

#endif
