#pragma once

#include <string>
#include <cstdint>
#include <ctime>

// Format a unix timestamp (seconds) as ISO 8601 local time.
std::string format_unix_time(uint64_t seconds);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Human-readable byte count ("512 B", "4.0 KiB", "1.3 MiB").
std::string format_bytes(uint64_t bytes);

// Lowercase hex encoding of a byte buffer.
std::string to_hex(const unsigned char* data, size_t len);

// Quote a string for a POSIX shell command line: 'it'\''s'.
std::string shell_quote(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
