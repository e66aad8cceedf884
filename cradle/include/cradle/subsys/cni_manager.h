#pragma once

#include "cradle/utils/error.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cradle {

class HostEnvironment;

/**
 * @brief One-shot notification that the network plugin became ready
 */
class ReadyChannel {
public:
    void send(bool ready);

    /**
     * @brief Wait for the value, or nullopt when nothing arrived in time
     */
    [[nodiscard]] std::optional<bool> wait_for(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<bool> try_receive();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<bool> value_;
};

/**
 * @brief Watches the CNI configuration directory until a usable network exists
 */
class CniManager {
public:
    CniManager(std::string default_network,
               std::string network_dir,
               std::vector<std::string> plugin_dirs,
               std::shared_ptr<HostEnvironment> host,
               std::chrono::milliseconds poll_interval = std::chrono::seconds(5));
    ~CniManager();

    CniManager(const CniManager&) = delete;
    CniManager& operator=(const CniManager&) = delete;

    /**
     * @brief Check readiness once and start the monitor thread if not ready yet
     */
    void start();

    /**
     * @brief Succeeds once a network configuration is usable; otherwise the last error
     */
    [[nodiscard]] Status ready_or_error() const;

    /**
     * @brief Channel that receives true once the plugin becomes ready
     */
    [[nodiscard]] std::shared_ptr<ReadyChannel> add_watcher();

    void shutdown();

    [[nodiscard]] const std::string& default_network() const { return default_network_; }
    [[nodiscard]] const std::string& network_dir() const { return network_dir_; }
    [[nodiscard]] const std::vector<std::string>& plugin_dirs() const { return plugin_dirs_; }

    /// Name of the network that made the plugin ready, empty before that.
    [[nodiscard]] std::string active_network() const;

private:
    std::string default_network_;
    std::string network_dir_;
    std::vector<std::string> plugin_dirs_;
    std::shared_ptr<HostEnvironment> host_;
    std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool ready_ = false;
    bool shutdown_ = false;
    std::optional<Error> last_error_;
    std::string active_network_;
    std::vector<std::shared_ptr<ReadyChannel>> watchers_;
    std::thread monitor_thread_;

    Result<std::string> find_network() const;
    bool poll_once();
    void monitor_loop();
};

} // namespace cradle
