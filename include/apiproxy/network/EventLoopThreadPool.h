#pragma once

#include "apiproxy/common/noncopyable.h"
#include "apiproxy/network/EventLoopThread.h"
#include <string>
#include <vector>
#include <memory>

namespace apiproxy {
namespace network {

class EventLoop;

// Worker loops for accepted connections. With zero threads everything runs on baseLoop.
class EventLoopThreadPool : common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start(const EventLoopThread::ThreadInitCallback& init = EventLoopThread::ThreadInitCallback());

    // Round robin
    EventLoop* GetNextLoop();
    std::vector<EventLoop*> GetAllLoops() const;

    bool started() const { return started_; }
    const std::string& name() const { return name_; }

private:
    EventLoop* baseLoop_;
    std::string name_;
    bool started_;
    int numThreads_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace apiproxy
