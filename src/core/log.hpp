#pragma once

#include <string>

// Debug log: timestamped lines appended to a file shared by all workers.
// Defaults to <tmp>/parcp_debug.log until set_log_path() is called.
void set_log_path(const std::string& path);

void parcp_log(const std::string& msg);
