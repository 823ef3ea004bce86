#ifndef LANCHAT_LOG_HPP
#define LANCHAT_LOG_HPP

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace lanchat {

enum class LogLevel {
	Debug,
	Info,
	Warning,
	Error,
};

const char *logLevelTag(LogLevel level);

class Logger {
public:
	Logger();
	~Logger();

	Logger(const Logger&)=delete;
	Logger &operator=(const Logger&)=delete;

	// nullptr disables console output (used while the TUI owns the terminal)
	void setConsole(std::ostream *out);
	void setMinLevel(LogLevel level);

	// opens <dir>/<date>_chat.log, falling back to ~/chat_logs and the cwd
	bool openFile(const std::string &dir);
	void closeFile();
	bool fileEnabled() const;
	std::string filePath() const;

	void log(LogLevel level,const std::string &msg);
	void debug(const std::string &msg) { log(LogLevel::Debug,msg); }
	void info(const std::string &msg) { log(LogLevel::Info,msg); }
	void warning(const std::string &msg) { log(LogLevel::Warning,msg); }
	void error(const std::string &msg) { log(LogLevel::Error,msg); }

	// logs "[+] Start name" / "[-] Stop name" and indents what is logged
	// in between on the same thread
	class Scope {
	public:
		Scope(Logger &logger,std::string name);
		~Scope();

		Scope(const Scope&)=delete;
		Scope &operator=(const Scope&)=delete;

	private:
		Logger &logger_;
		std::string name_;
	};

private:
	mutable std::mutex mutex_;
	std::ostream *console_;
	LogLevel minLevel_;
	std::ofstream file_;
	std::string filePath_;

	bool tryOpen(const std::string &dir,const std::string &name,std::string &err);
	void write(const std::string &line);
};

} // namespace lanchat

#endif
