#include "apiproxy/network/EventLoopThreadPool.h"
#include "apiproxy/network/EventLoop.h"

namespace apiproxy {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg)
    : baseLoop_(baseLoop),
      name_(nameArg),
      started_(false),
      numThreads_(0),
      next_(0) {
}

EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start(const EventLoopThread::ThreadInitCallback& init) {
    started_ = true;

    for (int i = 0; i < numThreads_; ++i) {
        auto t = std::make_unique<EventLoopThread>(name_ + std::to_string(i), init);
        loops_.push_back(t->StartLoop());
        threads_.push_back(std::move(t));
    }
    if (numThreads_ == 0 && init) {
        init(baseLoop_);
    }
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    EventLoop* loop = baseLoop_;

    if (!loops_.empty()) {
        loop = loops_[next_];
        ++next_;
        if (next_ >= loops_.size()) {
            next_ = 0;
        }
    }
    return loop;
}

std::vector<EventLoop*> EventLoopThreadPool::GetAllLoops() const {
    if (loops_.empty()) {
        return std::vector<EventLoop*>(1, baseLoop_);
    }
    return loops_;
}

} // namespace network
} // namespace apiproxy
