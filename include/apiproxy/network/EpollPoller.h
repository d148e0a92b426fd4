#pragma once

#include "apiproxy/common/noncopyable.h"
#include <vector>
#include <unordered_map>
#include <chrono>
#include <sys/epoll.h>

namespace apiproxy {
namespace network {

class Channel;
class EventLoop;

class EpollPoller : common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit EpollPoller(EventLoop* loop);
    ~EpollPoller();

    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int num_events, ChannelList* active_channels) const;
    void Update(int operation, Channel* channel);

    using ChannelMap = std::unordered_map<int, Channel*>;
    using EventList = std::vector<struct epoll_event>;

    EventLoop* loop_;
    int epollfd_;
    EventList events_;
    ChannelMap channels_;
};

} // namespace network
} // namespace apiproxy
