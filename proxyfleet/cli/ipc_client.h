#pragma once
#include <string>
#include <string_view>

// Sends one command line to the daemon at `socket_path`.
// Returns the daemon's status byte (0 = success, 1 = bad input, 2 = failure),
// or -1 if the daemon could not be reached.
int ipc_send(const std::string& socket_path, std::string_view command, std::string& data);
