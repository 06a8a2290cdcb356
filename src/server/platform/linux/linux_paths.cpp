#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/audio-scribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/audio-scribe";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/audio-scribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/audio-scribe";
}

std::string temp_dir() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) return "/tmp";
    return dir.string();
}

} // namespace platform
