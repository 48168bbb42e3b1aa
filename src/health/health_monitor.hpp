#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "process/child_process.hpp"
#include "rpc/rpc_channel.hpp"

namespace toolgate::health {

struct HealthOptions {
    std::chrono::milliseconds probe_timeout{2000};
    int failure_threshold = 3;
};

// One running server as the monitor sees it. `generation` identifies the
// run so a late verdict never lands on a newer start.
struct WatchTarget {
    std::string server_id;
    std::uint64_t generation = 0;
    std::chrono::milliseconds interval{30000};
    std::shared_ptr<rpc::RpcChannel> channel;
    std::shared_ptr<process::ChildProcess> process;
};

struct HealthCallbacks {
    std::function<void(const std::string& server_id, std::uint64_t generation)> on_probe;
    std::function<void(const std::string& server_id, std::uint64_t generation,
                       const std::string& reason)>
        on_unhealthy;
};

// Probes each watched server every interval on its own thread. It only
// reports; it never restarts anything.
class HealthMonitor {
public:
    HealthMonitor(HealthOptions options, HealthCallbacks callbacks);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void watch(WatchTarget target);
    // Blocks until the probe thread for this server has exited.
    void unwatch(const std::string& server_id);
    void unwatch_all();
    bool is_watching(const std::string& server_id) const;

private:
    struct Watch {
        std::thread thread;
        std::mutex mutex;
        std::condition_variable cv;
        bool stop = false;
    };

    void run(const WatchTarget& target, Watch& watch);

    HealthOptions options_;
    HealthCallbacks callbacks_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Watch>> watches_;
};

}  // namespace toolgate::health
