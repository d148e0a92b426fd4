#include "apiproxy/network/Timer.h"
#include "apiproxy/network/Channel.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/timerfd.h>

namespace apiproxy {
namespace network {

Timer::Timer(EventLoop* loop, Callback cb)
    : loop_(loop),
      callback_(std::move(cb)) {
}

Timer::~Timer() {
    if (timerFd_ >= 0) {
        ::close(timerFd_);
    }
}

bool Timer::Start(double delaySec) {
    Teardown();

    timerFd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timerFd_ < 0) {
        LOG_ERROR << "Timer timerfd_create failed errno=" << errno;
        return false;
    }

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    if (delaySec < 0.001) delaySec = 0.001; // zero would disarm
    const long sec = static_cast<long>(delaySec);
    howlong.it_value.tv_sec = sec;
    howlong.it_value.tv_nsec = static_cast<long>((delaySec - static_cast<double>(sec)) * 1e9);
    if (::timerfd_settime(timerFd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer timerfd_settime failed errno=" << errno;
        ::close(timerFd_);
        timerFd_ = -1;
        return false;
    }

    // The channel callback owns the timer until Teardown() hands the channel off.
    channel_.reset(new Channel(loop_, timerFd_));
    auto self = shared_from_this();
    channel_->SetReadCallback([self](std::chrono::system_clock::time_point) {
        self->HandleRead();
    });
    channel_->EnableReading();
    return true;
}

void Timer::Cancel() {
    callback_ = nullptr;
    Teardown();
}

void Timer::HandleRead() {
    uint64_t one = 0;
    if (::read(timerFd_, &one, sizeof one) != sizeof one) {
        LOG_DEBUG << "Timer fd=" << timerFd_ << " spurious wakeup";
    }
    Callback cb = std::move(callback_);
    callback_ = nullptr;
    auto guard = shared_from_this();
    Teardown();
    if (cb) cb();
}

void Timer::Teardown() {
    if (channel_) {
        channel_->DisableAll();
        channel_->Remove();
        // Never delete a Channel from inside its own callback.
        Channel* ch = channel_.release();
        loop_->QueueInLoop([ch]() { delete ch; });
    }
    if (timerFd_ >= 0) {
        ::close(timerFd_);
        timerFd_ = -1;
    }
}

} // namespace network
} // namespace apiproxy
