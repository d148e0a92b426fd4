#pragma once

#include "apiproxy/common/noncopyable.h"
#include <mutex>
#include <condition_variable>
#include <functional>
#include <thread>
#include <string>

namespace apiproxy {
namespace network {

class EventLoop;

// Runs one EventLoop on a dedicated thread.
class EventLoopThread : common::noncopyable {
public:
    using ThreadInitCallback = std::function<void(EventLoop*)>;

    explicit EventLoopThread(const std::string& name = std::string(),
                             ThreadInitCallback init = ThreadInitCallback());
    ~EventLoopThread();

    // Blocks until the loop exists in the new thread.
    EventLoop* StartLoop();

private:
    void ThreadFunc();

    EventLoop* loop_;
    bool exiting_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
    ThreadInitCallback init_;
};

} // namespace network
} // namespace apiproxy
