#include "apiproxy/network/EventLoopThread.h"
#include "apiproxy/network/EventLoop.h"

#include <pthread.h>

namespace apiproxy {
namespace network {

EventLoopThread::EventLoopThread(const std::string& name, ThreadInitCallback init)
    : loop_(nullptr),
      exiting_(false),
      name_(name),
      init_(std::move(init)) {
}

EventLoopThread::~EventLoopThread() {
    exiting_ = true;
    EventLoop* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_;
    }
    if (loop != nullptr) {
        loop->Quit();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread(std::bind(&EventLoopThread::ThreadFunc, this));

    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this]() { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::ThreadFunc() {
    if (!name_.empty()) {
        // Linux limits thread names to 15 characters.
        ::pthread_setname_np(::pthread_self(), name_.substr(0, 15).c_str());
    }

    EventLoop loop;
    if (init_) {
        init_(&loop);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
        cond_.notify_one();
    }

    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace apiproxy
