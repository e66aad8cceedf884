#include "cradle/subsys/cni_manager.h"

#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"

#include <nlohmann/json.hpp>

namespace cradle {

// ============================================================================
// ReadyChannel
// ============================================================================

void ReadyChannel::send(bool ready) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (value_) {
            return;
        }
        value_ = ready;
    }
    cv_.notify_all();
}

std::optional<bool> ReadyChannel::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return value_.has_value(); });
    return value_;
}

std::optional<bool> ReadyChannel::try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
}

// ============================================================================
// CniManager
// ============================================================================

namespace {

bool is_network_config_file(const std::string& path) {
    return path.ends_with(".conf") || path.ends_with(".conflist") || path.ends_with(".json");
}

} // anonymous namespace

CniManager::CniManager(std::string default_network,
                       std::string network_dir,
                       std::vector<std::string> plugin_dirs,
                       std::shared_ptr<HostEnvironment> host,
                       std::chrono::milliseconds poll_interval)
    : default_network_(std::move(default_network))
    , network_dir_(std::move(network_dir))
    , plugin_dirs_(std::move(plugin_dirs))
    , host_(std::move(host))
    , poll_interval_(poll_interval) {
}

CniManager::~CniManager() {
    shutdown();
}

void CniManager::start() {
    if (poll_once()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!shutdown_ && !monitor_thread_.joinable()) {
        monitor_thread_ = std::thread(&CniManager::monitor_loop, this);
    }
}

Status CniManager::ready_or_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ready_) {
        return {};
    }
    if (last_error_) {
        return std::unexpected(*last_error_);
    }
    return make_error(ErrorCode::UNAVAILABLE, "network plugin status not yet checked");
}

std::shared_ptr<ReadyChannel> CniManager::add_watcher() {
    auto channel = std::make_shared<ReadyChannel>();

    std::lock_guard<std::mutex> lock(mutex_);
    if (ready_) {
        channel->send(true);
    } else {
        watchers_.push_back(channel);
    }
    return channel;
}

void CniManager::shutdown() {
    std::thread monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        if (monitor_thread_.joinable() && monitor_thread_.get_id() != std::this_thread::get_id()) {
            monitor = std::move(monitor_thread_);
        }
    }
    cv_.notify_all();

    if (monitor.joinable()) {
        monitor.join();
    }
}

std::string CniManager::active_network() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_network_;
}

Result<std::string> CniManager::find_network() const {
    auto entries = host_->list_directory(network_dir_);
    if (!entries) {
        return wrap_error(entries.error(), "no CNI configuration file in " + network_dir_);
    }

    std::string first_valid;
    for (const auto& path : *entries) {
        if (!is_network_config_file(path)) {
            continue;
        }

        auto content = host_->read_file(path);
        if (!content) {
            continue;
        }

        nlohmann::json document;
        try {
            document = nlohmann::json::parse(*content);
        } catch (const nlohmann::json::exception& e) {
            CRADLE_DEBUG(LoggerFactory::get_logger("cradle.cni"),
                         "Skipping invalid CNI config " + path + ": " + e.what());
            continue;
        }

        if (!document.is_object() || !document.contains("name") || !document["name"].is_string()) {
            continue;
        }

        auto name = document["name"].get<std::string>();
        if (default_network_.empty() || name == default_network_) {
            return name;
        }
        if (first_valid.empty()) {
            first_valid = name;
        }
    }

    if (!default_network_.empty() && !first_valid.empty()) {
        return make_error(ErrorCode::NOT_FOUND,
                          "default network \"" + default_network_ + "\" not found in " + network_dir_);
    }
    return make_error(ErrorCode::NOT_FOUND,
                      "no CNI configuration file in " + network_dir_ + ". Has your network provider started?");
}

bool CniManager::poll_once() {
    auto network = find_network();

    std::vector<std::shared_ptr<ReadyChannel>> to_notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!network) {
            last_error_ = network.error();
            return false;
        }
        ready_ = true;
        last_error_.reset();
        active_network_ = *network;
        to_notify.swap(watchers_);
    }

    LoggerFactory::get_logger("cradle.cni").info("Found CNI network " + *network + " in " + network_dir_);
    for (auto& watcher : to_notify) {
        watcher->send(true);
    }
    return true;
}

void CniManager::monitor_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, poll_interval_, [this] { return shutdown_; });
            if (shutdown_) {
                return;
            }
        }
        if (poll_once()) {
            return;
        }
    }
}

} // namespace cradle
