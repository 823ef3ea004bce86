#include "config.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <sstream>
#include <vector>

using namespace lanchat;

namespace {

// getopt may permute argv, so every call gets fresh storage
struct Args {
	std::vector<std::string> storage;
	std::vector<char*> argv;

	Args(std::initializer_list<const char*> list) {
		storage.emplace_back("lanchat");
		for(const char *a:list)storage.emplace_back(a);
		for(std::string &s:storage)argv.push_back(s.data());
		argv.push_back(nullptr);
	}
	int argc() const { return static_cast<int>(argv.size())-1; }
};

ParseResult parse(std::initializer_list<const char*> list,AppConfig &cfg,std::string &err) {
	Args args(list);
	return parseCommandLine(args.argc(),args.argv.data(),cfg,err);
}

} // namespace

TEST(Config,RequiredOptions) {
	AppConfig cfg;
	std::string err;
	ASSERT_EQ(parse({"--ip","192.168.1.10","--port","12345"},cfg,err),ParseResult::Ok);
	EXPECT_EQ(cfg.ip,"192.168.1.10");
	EXPECT_EQ(cfg.port,12345);
	EXPECT_FALSE(cfg.enableLogging);
	EXPECT_EQ(cfg.logDir,"logs");
	EXPECT_EQ(cfg.receiveTimeoutMs,kDefaultReceiveTimeoutMs);
}

TEST(Config,AllOptions) {
	AppConfig cfg;
	std::string err;
	ASSERT_EQ(parse({"-i","10.0.0.2","-p","1","--log","--log-dir","/tmp/x","--timeout-ms","250"},cfg,err),
		ParseResult::Ok);
	EXPECT_EQ(cfg.port,1);
	EXPECT_TRUE(cfg.enableLogging);
	EXPECT_EQ(cfg.logDir,"/tmp/x");
	EXPECT_EQ(cfg.receiveTimeoutMs,250);
}

TEST(Config,MissingOptions) {
	AppConfig cfg;
	std::string err;
	EXPECT_EQ(parse({},cfg,err),ParseResult::Missing);
	EXPECT_EQ(parse({"--ip","10.0.0.1"},cfg,err),ParseResult::Missing);
	EXPECT_NE(err.find("--port"),std::string::npos);
	EXPECT_EQ(parse({"--port","9000"},cfg,err),ParseResult::Missing);
	EXPECT_NE(err.find("--ip"),std::string::npos);
	EXPECT_EQ(parse({"--ip","10.0.0.1","--port"},cfg,err),ParseResult::Missing);
}

TEST(Config,InvalidValues) {
	AppConfig cfg;
	std::string err;
	EXPECT_EQ(parse({"--ip","300.1.1.1","--port","9000"},cfg,err),ParseResult::Invalid);
	EXPECT_EQ(parse({"--ip","localhost","--port","9000"},cfg,err),ParseResult::Invalid);
	EXPECT_EQ(parse({"--ip","10.0.0.1","--port","0"},cfg,err),ParseResult::Invalid);
	EXPECT_EQ(parse({"--ip","10.0.0.1","--port","65536"},cfg,err),ParseResult::Invalid);
	EXPECT_EQ(parse({"--ip","10.0.0.1","--port","12ab"},cfg,err),ParseResult::Invalid);
	EXPECT_EQ(parse({"--ip","10.0.0.1","--port","9000","--timeout-ms","10"},cfg,err),ParseResult::Invalid);
	EXPECT_EQ(parse({"--ip","10.0.0.1","--port","9000","--bogus"},cfg,err),ParseResult::Invalid);
	EXPECT_EQ(parse({"--ip","10.0.0.1","--port","9000","extra"},cfg,err),ParseResult::Invalid);
}

TEST(Config,FailedParseLeavesConfig) {
	AppConfig cfg;
	cfg.ip="keep";
	std::string err;
	EXPECT_EQ(parse({"--ip","10.0.0.1","--port","0"},cfg,err),ParseResult::Invalid);
	EXPECT_EQ(cfg.ip,"keep");
}

TEST(Config,Help) {
	AppConfig cfg;
	std::string err;
	EXPECT_EQ(parse({"--help"},cfg,err),ParseResult::Help);
	EXPECT_EQ(parse({"-h","--ip","10.0.0.1"},cfg,err),ParseResult::Help);

	std::ostringstream out;
	printUsage(out,"lanchat");
	EXPECT_NE(out.str().find("--ip"),std::string::npos);
	EXPECT_NE(out.str().find("--port"),std::string::npos);
}

TEST(Config,Describe) {
	AppConfig cfg;
	cfg.ip="10.0.0.1";
	cfg.port=9000;
	EXPECT_EQ(describe(cfg),"ip=10.0.0.1 port=9000 logging=disabled timeout=1000ms");
	cfg.enableLogging=true;
	EXPECT_NE(describe(cfg).find("enabled (logs)"),std::string::npos);
}
