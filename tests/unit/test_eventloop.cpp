#include "apiproxy/network/EventLoop.h"
#include "apiproxy/network/Resolver.h"
#include "apiproxy/network/Timer.h"
#include "apiproxy/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <optional>
#include <string>
#include <thread>

using namespace apiproxy::network;
using namespace apiproxy::common;

void testQuitFromOtherThread() {
    EventLoop loop;
    std::atomic<bool> ran{false};
    loop.RunInLoop([&ran]() { ran = true; });

    std::thread t([&loop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        LOG_INFO << "Quitting main loop from thread";
        loop.Quit();
    });
    loop.Loop();
    t.join();
    assert(ran);
    LOG_INFO << "Quit From Other Thread PASS";
}

void testQueueInLoopFromOtherThread() {
    EventLoop loop;
    std::atomic<int> count{0};
    std::thread t([&]() {
        for (int i = 0; i < 100; ++i) {
            loop.QueueInLoop([&count]() { ++count; });
        }
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });
    loop.Loop();
    t.join();
    assert(count == 100);
    LOG_INFO << "QueueInLoop From Other Thread PASS";
}

void testTimers() {
    EventLoop loop;
    int fired = 0;
    bool cancelledRan = false;
    auto start = std::chrono::steady_clock::now();

    // Timers keep themselves alive; the result may be dropped.
    loop.RunAfter(0.05, [&fired]() { ++fired; });
    auto cancelled = loop.RunAfter(0.05, [&cancelledRan]() { cancelledRan = true; });
    assert(cancelled && cancelled->armed());
    cancelled->Cancel();
    assert(!cancelled->armed());

    // Re-arming replaces the pending expiry.
    auto rearmed = std::make_shared<Timer>(&loop, [&fired]() { fired += 10; });
    assert(rearmed->Start(5.0));
    assert(rearmed->Start(0.1));

    loop.RunAfter(0.3, [&loop]() { loop.Quit(); });
    loop.Loop();

    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(elapsed >= std::chrono::milliseconds(250));
    assert(elapsed < std::chrono::seconds(4));
    assert(fired == 11);
    assert(!cancelledRan);
    assert(!rearmed->armed());
    LOG_INFO << "Timers PASS";
}

void testResolver() {
    Resolver resolver(60.0);
    std::string error;
    auto numeric = resolver.Resolve("127.0.0.1", 8080, &error);
    assert(numeric);
    assert(numeric->toIpPort() == "127.0.0.1:8080");
    assert(resolver.CacheSize() == 0);

    assert(resolver.Prime("localhost", &error));
    assert(resolver.CacheSize() == 1);
    auto cached = resolver.Resolve("localhost", 443, &error);
    assert(cached);
    assert(cached->toPort() == 443);
    resolver.Clear();
    assert(resolver.CacheSize() == 0);
    LOG_INFO << "Resolver PASS";
}

void testResolveAsync() {
    EventLoop loop;
    Resolver resolver(0.05);

    bool inlineCall = false;
    resolver.ResolveAsync(&loop, "127.0.0.1", 80, [&](std::optional<InetAddress> addr, const std::string&) {
        assert(addr && addr->toPort() == 80);
        inlineCall = true;
    });
    assert(inlineCall);

    // A miss is answered later, on the loop, from the lookup thread.
    bool answered = false;
    resolver.ResolveAsync(&loop, "localhost", 8443, [&](std::optional<InetAddress> addr, const std::string& error) {
        assert(loop.IsInLoopThread());
        assert(addr);
        assert(addr->toPort() == 8443);
        assert(error.empty());
        answered = true;
        loop.Quit();
    });
    assert(!answered);
    loop.Loop();
    assert(answered);
    assert(resolver.CacheSize() == 1);

    // Expired: the old address is served at once while a refresh runs in the background.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    bool stale = false;
    resolver.ResolveAsync(&loop, "localhost", 1, [&](std::optional<InetAddress> addr, const std::string&) {
        assert(addr && addr->toPort() == 1);
        stale = true;
    });
    assert(stale);

    resolver.Stop();
    bool failed = false;
    resolver.ResolveAsync(&loop, "host.invalid", 80, [&](std::optional<InetAddress> addr, const std::string& error) {
        assert(!addr);
        assert(!error.empty());
        failed = true;
    });
    assert(failed);
    LOG_INFO << "Resolve Async PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    LOG_INFO << "Starting EventLoop test";
    testQuitFromOtherThread();
    testQueueInLoopFromOtherThread();
    testTimers();
    testResolver();
    testResolveAsync();
    return 0;
}
