#pragma once

#include <chrono>
#include <string>

// Plain TCP connect with a timeout. Never throws; resolution or connect
// failures report the port as closed.
bool isPortOpen(const std::string& host, int port, std::chrono::milliseconds timeout);
