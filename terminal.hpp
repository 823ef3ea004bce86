#ifndef LANCHAT_TERMINAL_HPP
#define LANCHAT_TERMINAL_HPP

#include <memory>
#include <ostream>
#include <string>

namespace lanchat {

struct TermSize {
	int rows{24};
	int cols{80};

	bool operator==(const TermSize &other) const=default;
};

// Raw-ish terminal for the lifetime of the object: no canonical input, no
// echo, alternate screen. The destructor puts everything back, so the
// terminal is restored however the UI loop ends.
class Terminal {
public:
	static constexpr int kMinRows=4;
	static constexpr int kMinCols=20;

	Terminal(std::ostream &out,int inFd,int outFd);
	~Terminal();

	Terminal(const Terminal&)=delete;
	Terminal &operator=(const Terminal&)=delete;

	// false if stdin is not a tty; the screen is still set up
	bool init();
	void restore();

	TermSize querySize() const;

	// waits up to timeoutMs, then appends what is available to out;
	// returns bytes read, 0 on timeout, -1 once input is gone
	int readInput(std::string &out,int timeoutMs);

private:
	struct TermiosHolder;

	std::ostream &out_;
	int inFd_;
	int outFd_;
	bool active_;
	std::unique_ptr<TermiosHolder> saved_;
};

} // namespace lanchat

#endif
