#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace platform {

namespace {

// $XDG_<var> or $HOME/<fallback>, with "/livescribe" appended.
std::string xdg_dir(const char* var, const char* fallback) {
    if (const char* xdg = std::getenv(var); xdg && *xdg) {
        return std::string(xdg) + "/livescribe";
    }
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/" + fallback + "/livescribe";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string state_dir() {
    return xdg_dir("XDG_STATE_HOME", ".local/state");
}

std::string ipc_endpoint() {
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) {
        return std::string(xdg) + "/livescribe.sock";
    }
    return "/tmp/livescribe.sock";
}

std::string default_log_path() {
    auto dir = state_dir();
    if (dir.empty()) return "/tmp/livescribed.log";

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return "/tmp/livescribed.log";
    return dir + "/livescribed.log";
}

} // namespace platform
