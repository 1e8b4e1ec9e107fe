#pragma once

#include "sync/Mirror.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// In-process stand-in for rsync: records requests and answers with scripted exit codes.
class FakeMirror : public ms::sync::Mirror {
public:
    std::map<std::string, ms::sync::MirrorResult> scripted;  // by submodule
    std::function<void(const ms::sync::MirrorRequest&)> onRun;
    std::chrono::milliseconds delay{0};

    ms::sync::MirrorResult run(const ms::sync::MirrorRequest& req) override {
        const int now = ++active_;
        int seen = maxActive_.load();
        while (now > seen && !maxActive_.compare_exchange_weak(seen, now)) {}

        if (onRun) onRun(req);
        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        {
            std::scoped_lock lock(mutex_);
            requests_.push_back(req);
        }
        --active_;

        if (const auto it = scripted.find(req.submodule); it != scripted.end()) return it->second;
        return {};
    }

    std::vector<ms::sync::MirrorRequest> requests() const {
        std::scoped_lock lock(mutex_);
        return requests_;
    }

    int maxConcurrent() const { return maxActive_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<ms::sync::MirrorRequest> requests_;
    std::atomic<int> active_{0};
    std::atomic<int> maxActive_{0};
};
