#pragma once

#include <string>

namespace platform {

// Detaches from the controlling terminal. stdin and stdout go to /dev/null;
// stderr is appended to `log_path` so diagnostics survive detaching.
// Returns false (still attached) if the log file cannot be opened.
bool daemonize(const std::string& log_path);

} // namespace platform
