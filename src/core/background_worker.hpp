#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include "message_queue.hpp"

namespace camper {

// One thread running blocking jobs (stream URL resolution) off the player's
// owner thread. Jobs run in submission order.
class BackgroundWorker {
public:
    explicit BackgroundWorker(std::string name) : name(std::move(name)) {
        thread = std::make_unique<std::thread>([this] { run(); });
    }

    ~BackgroundWorker() {
        jobs.close();
        if (thread && thread->joinable()) {
            thread->join();
        }
    }

    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    void post(std::function<void()> job) {
        if (!jobs.push(std::move(job))) {
            spdlog::warn("{}: job submitted after shutdown was dropped", name);
        }
    }

private:
    void run() {
        while (!jobs.is_closed() || jobs.size() > 0) {
            auto job = jobs.pop_for(std::chrono::milliseconds(200));
            if (!job) {
                continue;
            }
            try {
                (*job)();
            } catch (const std::exception& e) {
                spdlog::error("{}: job failed: {}", name, e.what());
            }
        }
    }

    std::string name;
    MessageQueue<std::function<void()>> jobs;
    std::unique_ptr<std::thread> thread;
};

} // namespace camper
