#pragma once

#include <memory>
#include <functional>
#include <chrono>

namespace apiproxy {
namespace network {

class TcpConnection;
class Buffer;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
using WriteCompleteCallback = std::function<void(const TcpConnectionPtr&)>;

using MessageCallback = std::function<void(const TcpConnectionPtr&,
                                           Buffer*,
                                           std::chrono::system_clock::time_point)>;

using HighWaterMarkCallback = std::function<void(const TcpConnectionPtr&, size_t)>;

// errno of a failed outbound connect (0 when the failure was not a socket error, e.g. TLS).
using ConnectFailureCallback = std::function<void(int savedErrno)>;

} // namespace network
} // namespace apiproxy
