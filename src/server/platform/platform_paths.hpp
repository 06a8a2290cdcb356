#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();

// Directory for per-request scratch files.
std::string temp_dir();

} // namespace platform
