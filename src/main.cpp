#include "apiproxy/ProxyServer.h"
#include "apiproxy/ProxySettings.h"
#include "apiproxy/network/Channel.h"
#include "apiproxy/network/EventLoop.h"
#include "apiproxy/common/Logger.h"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <pthread.h>
#include <sys/signalfd.h>
#include <unistd.h>

int main(int argc, char* argv[]) {
    using namespace apiproxy;

    ProxySettings settings;
    std::string error;
    const auto action = ProxySettings::Load(argc, argv, [](const char* name) { return std::getenv(name); },
                                            &settings, &error);
    if (action == ProxySettings::CliAction::kExit) return 0;
    if (action == ProxySettings::CliAction::kError) {
        fprintf(stderr, "%s: %s\n", argv[0], error.c_str());
        ProxySettings::PrintUsage(argv[0]);
        return 2;
    }

    common::Logger::Instance().SetLevel(settings.logLevel);

    if (!settings.Validate(&error)) {
        LOG_ERROR << "Invalid settings: " << error;
        return 1;
    }
    if (settings.checkOnly) {
        printf("OK: %s\n", settings.Summary().c_str());
        return 0;
    }
    LOG_INFO << "Starting api-proxy: " << settings.Summary();

    ::signal(SIGPIPE, SIG_IGN);

    // Block before any worker thread exists so they all inherit the mask and the
    // signals are only ever seen through the signalfd.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        LOG_ERROR << "pthread_sigmask failed";
        return 1;
    }
    const int sigFd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (sigFd < 0) {
        LOG_ERROR << "signalfd failed";
        return 1;
    }

    network::EventLoop loop;
    std::unique_ptr<network::Channel> sigChannel(new network::Channel(&loop, sigFd));
    sigChannel->SetReadCallback([&loop, sigFd](std::chrono::system_clock::time_point) {
        struct signalfd_siginfo info;
        if (::read(sigFd, &info, sizeof info) == static_cast<ssize_t>(sizeof info)) {
            LOG_INFO << "Received signal " << info.ssi_signo << ", shutting down";
        }
        loop.Quit();
    });
    sigChannel->EnableReading();

    ProxyServer server(&loop, settings);
    if (!server.Start()) {
        sigChannel->DisableAll();
        sigChannel->Remove();
        ::close(sigFd);
        return 1;
    }

    loop.Loop();

    server.Stop();
    sigChannel->DisableAll();
    sigChannel->Remove();
    ::close(sigFd);
    LOG_INFO << "api-proxy stopped";
    return 0;
}
