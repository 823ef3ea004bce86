#ifndef LANCHAT_ANSI_HPP
#define LANCHAT_ANSI_HPP

#include <string>

namespace lanchat::ansi {

inline constexpr const char *kAltScreenOn="\x1b[?1049h";
inline constexpr const char *kAltScreenOff="\x1b[?1049l";
inline constexpr const char *kClear="\x1b[2J";
inline constexpr const char *kClearEol="\x1b[K";
inline constexpr const char *kHome="\x1b[H";
inline constexpr const char *kHideCursor="\x1b[?25l";
inline constexpr const char *kShowCursor="\x1b[?25h";
inline constexpr const char *kReset="\x1b[0m";
inline constexpr const char *kResetScrollRegion="\x1b[r";
// scroll the scroll region up one line, cursor stays put
inline constexpr const char *kScrollUp="\x1b[S";

inline constexpr const char *kFgDefault="\x1b[38;2;230;230;230m";
inline constexpr const char *kFgSys="\x1b[38;2;255;255;128m";
inline constexpr const char *kFgMsg="\x1b[38;2;128;200;255m";

inline constexpr const char *kBgInput="\x1b[48;2;30;30;30m";
inline constexpr const char *kBgStatus="\x1b[48;2;0;70;140m";

// 1-based
inline std::string moveTo(int row,int col) {
	return "\x1b["+std::to_string(row)+";"+std::to_string(col)+"H";
}

inline std::string scrollRegion(int top,int bottom) {
	return "\x1b["+std::to_string(top)+";"+std::to_string(bottom)+"r";
}

} // namespace lanchat::ansi

#endif
