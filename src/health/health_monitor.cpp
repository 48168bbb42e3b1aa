#include "health/health_monitor.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolgate::health {

HealthMonitor::HealthMonitor(HealthOptions options, HealthCallbacks callbacks)
    : options_(options), callbacks_(std::move(callbacks)) {}

HealthMonitor::~HealthMonitor() {
    unwatch_all();
}

void HealthMonitor::watch(WatchTarget target) {
    unwatch(target.server_id);

    const std::string server_id = target.server_id;
    LOG_DEBUG("HealthMonitor: watching server " + server_id + " every " +
              std::to_string(target.interval.count()) + " ms");

    auto watch = std::make_shared<Watch>();
    Watch* raw_watch = watch.get();
    watch->thread = std::thread([this, target = std::move(target), raw_watch]() {
        run(target, *raw_watch);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    watches_[server_id] = watch;
}

void HealthMonitor::unwatch(const std::string& server_id) {
    std::shared_ptr<Watch> watch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = watches_.find(server_id);
        if (it == watches_.end()) {
            return;
        }
        watch = it->second;
        watches_.erase(it);
    }

    {
        std::lock_guard<std::mutex> lock(watch->mutex);
        watch->stop = true;
    }
    watch->cv.notify_all();
    if (watch->thread.joinable()) {
        watch->thread.join();
    }
}

void HealthMonitor::unwatch_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, watch] : watches_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        unwatch(id);
    }
}

bool HealthMonitor::is_watching(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return watches_.find(server_id) != watches_.end();
}

void HealthMonitor::run(const WatchTarget& target, Watch& watch) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(watch.mutex);
            if (watch.cv.wait_for(lock, target.interval, [&watch]() { return watch.stop; })) {
                return;
            }
        }

        if (target.process->has_exited()) {
            const auto code = target.process->exit_code();
            const std::string reason =
                "process exited" +
                (code.has_value() ? " with code " + std::to_string(code.value()) : "");
            LOG_ERROR("HealthMonitor: server " + target.server_id + " " + reason);
            if (callbacks_.on_unhealthy) {
                callbacks_.on_unhealthy(target.server_id, target.generation, reason);
            }
            return;
        }

        auto probe = target.channel->list_tools(options_.probe_timeout);
        if (callbacks_.on_probe) {
            callbacks_.on_probe(target.server_id, target.generation);
        }
        if (core::errors::is_error(probe)) {
            const auto& error = core::errors::get_error(probe);
            if (error.code == "channel_busy") {
                LOG_DEBUG("HealthMonitor: server " + target.server_id +
                          " busy, probe skipped");
                continue;
            }
            LOG_WARN("HealthMonitor: probe failed for server " + target.server_id + " [" +
                     error.code + "]: " + error.message);
        }

        const int failures = target.channel->consecutive_failures();
        if (failures >= options_.failure_threshold) {
            const std::string reason = std::to_string(failures) +
                                       " consecutive failed calls; last probe: " +
                                       (core::errors::is_error(probe)
                                            ? core::errors::get_error(probe).message
                                            : std::string("ok"));
            LOG_ERROR("HealthMonitor: server " + target.server_id + " unhealthy: " + reason);
            if (callbacks_.on_unhealthy) {
                callbacks_.on_unhealthy(target.server_id, target.generation, reason);
            }
            return;
        }
    }
}

}  // namespace toolgate::health
