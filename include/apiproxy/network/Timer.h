#pragma once

#include "apiproxy/common/noncopyable.h"

#include <functional>
#include <memory>

namespace apiproxy {
namespace network {

class Channel;
class EventLoop;

// One-shot timerfd timer bound to a loop. Not thread safe: arm, cancel and fire all
// happen in the loop thread. A started timer keeps itself alive until it fires or is
// cancelled.
class Timer : common::noncopyable,
              public std::enable_shared_from_this<Timer> {
public:
    using Callback = std::function<void()>;

    Timer(EventLoop* loop, Callback cb);
    ~Timer();

    bool Start(double delaySec);
    void Cancel();

    bool armed() const { return timerFd_ >= 0; }

private:
    void HandleRead();
    void Teardown();

    EventLoop* loop_;
    Callback callback_;
    int timerFd_{-1};
    std::unique_ptr<Channel> channel_;
};

} // namespace network
} // namespace apiproxy
