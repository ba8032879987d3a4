#pragma once

#include <string>

namespace platform {

// Empty when no home directory can be determined.
std::string config_dir();
std::string state_dir();

std::string ipc_endpoint();
std::string default_log_path();

} // namespace platform
