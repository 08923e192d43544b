#pragma once

#include "delta/client_base.hpp"

#include <string>
#include <vector>

namespace delta {

// Signature over "GET" + timestamp + "/live".
std::string build_auth_frame(const Credentials& credentials, const std::string& timestamp);

std::string build_subscribe_frame(const std::string& channel,
                                  const std::vector<std::string>& symbols = {"all"});

std::string build_enable_heartbeat_frame();

} // namespace delta
