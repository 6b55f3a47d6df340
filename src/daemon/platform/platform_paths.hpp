#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();

// First non-loopback IPv4 address of an interface that is up, or
// "127.0.0.1" when there is none.
std::string local_ipv4();

} // namespace platform
