#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Called once per accepted connection with its first line (no '\n' / '\r').
// Returning false stops the server after the connection is closed.
using LineHandler = std::function<bool(const std::string &)>;

// Blocks until the handler asks to stop or accept() fails. The socket file is removed on exit.
bool        start_server(const std::string &sock_path, const LineHandler &on_line);
bool        send_line(const std::string &sock_path, const std::string &line);
std::string expand_user(const std::string &path);

}  // namespace ipc
