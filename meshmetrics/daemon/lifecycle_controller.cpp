// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <csignal>
#include <cstdio>
#include <optional>
#include <utility>

#include <fmt/format.h>
#include <tt-logger/tt-logger.hpp>

#include <daemon/lifecycle_controller.hpp>
#include <daemon/logging.hpp>
#include <daemon/process.hpp>
#include <telemetry/roster_loader.hpp>
#include <utils/assert.hpp>
#include <utils/cleanup.hpp>
#include <utils/version.hpp>

namespace meshmetrics {

namespace {

// The handlers can only reach the controller through these. They are set while a SignalBridge is alive.
std::atomic<bool>* g_run_flag = nullptr;
std::atomic<bool>* g_reload_flag = nullptr;

static_assert(std::atomic<bool>::is_always_lock_free);

void handle_stop_signal(int) {
    if (g_run_flag != nullptr) {
        g_run_flag->store(false);
    }
}

void handle_reload_signal(int) {
    if (g_reload_flag != nullptr) {
        g_reload_flag->store(true);
    }
}

// Points the signal handlers at the controller's flags and installs them. On destruction, or if installing
// fails part way, the previous dispositions are restored and the flags are detached again.
class SignalBridge {
public:
    SignalBridge(std::atomic<bool>& run_flag, std::atomic<bool>& reload_flag) {
        g_run_flag = &run_flag;
        g_reload_flag = &reload_flag;
        auto detach = make_cleanup([]() { detach_flags(); });
        handlers_.emplace(std::initializer_list<std::pair<int, SignalHandler>>{
            {SIGTERM, handle_stop_signal},
            {SIGINT, handle_stop_signal},
            {SIGHUP, handle_reload_signal},
            {SIGPIPE, SIG_IGN}});
        std::move(detach).release();
    }

    ~SignalBridge() {
        handlers_.reset();
        detach_flags();
    }

    SignalBridge(const SignalBridge&) = delete;
    SignalBridge& operator=(const SignalBridge&) = delete;

private:
    static void detach_flags() {
        g_run_flag = nullptr;
        g_reload_flag = nullptr;
    }

    std::optional<ScopedSignalHandlers> handlers_;
};

logging::LoggingOptions logging_options(const DaemonConfig& config, bool console) {
    return logging::LoggingOptions{
        .level = config.daemon.log_level, .log_file = config.daemon.log_file, .console = console};
}

}  // namespace

std::vector<Device> load_configured_roster(const DaemonConfig& config) {
    std::optional<std::string> password;
    if (config.roster.encrypted) {
        std::error_code ec;
        MESHMETRICS_FATAL(
            !config.roster.password_file.empty() && std::filesystem::exists(config.roster.password_file, ec),
            "Encrypted device file specified but no password file found: '{}'",
            config.roster.password_file);
        password = read_password_file(config.roster.password_file);
    }

    std::vector<Device> devices = RosterLoader().load(config.roster.file, password);
    MESHMETRICS_FATAL(!devices.empty(), "No devices found in device file {}", config.roster.file);
    log_info(tt::LogAlways, "Loaded {} devices from {}", devices.size(), config.roster.file);
    return devices;
}

DaemonConfig load_effective_config(const LifecycleOptions& options, uint64_t previous_version) {
    DaemonConfig config = load_daemon_config(options.config_path, previous_version);
    apply_overrides(config, options.overrides);
    validate(config);
    return config;
}

LifecycleController::LifecycleController(LifecycleOptions options) : options_(std::move(options)) {}

LifecycleController::~LifecycleController() = default;

DaemonConfigPtr LifecycleController::active_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return active_config_;
}

int LifecycleController::run() {
    try {
        return run_daemon();
    } catch (const std::exception& e) {
        std::string message = assert::short_message(e);
        log_critical(tt::LogAlways, "Fatal error: {}", message);
        fmt::print(stderr, "meshmetricsd: {}\n", message);
        return 1;
    }
}

int LifecycleController::run_daemon() {
    running_.store(true);

    auto config = std::make_shared<const DaemonConfig>(load_effective_config(options_));
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        active_config_ = config;
    }

    logging::configure(logging_options(*config, true));
    if (!options_.foreground) {
        daemonize();
        logging::configure(logging_options(*config, false));
    }

    log_info(tt::LogAlways, "Starting Meshtastic Telemetry Daemon {}", kDaemonVersion);
    stats_.start_time = current_iso_timestamp();

    SignalBridge signals(running_, reload_requested_);

    PrivilegeTarget privilege_target{.user = config->daemon.user, .group = config->daemon.group};
    bool dropped = drop_privileges(privilege_target);
    if (!dropped && (!privilege_target.user.empty() || !privilege_target.group.empty())) {
        log_warning(tt::LogAlways, "Not running as root, keeping current user and group");
    }

    std::filesystem::path pid_file = config->daemon.pid_file;
    if (!pid_file.empty()) {
        write_pid_file(pid_file);
    }
    auto remove_pid = make_cleanup([&pid_file]() {
        if (!pid_file.empty()) {
            remove_pid_file(pid_file);
        }
    });

    std::vector<Device> roster = load_configured_roster(*config);

    std::unique_ptr<TelemetrySource> source = source_factory_(config->source.mode);
    MESHMETRICS_FATAL(source != nullptr, "No telemetry source for mode {}", config->source.mode);
    auto close_source = make_cleanup([&source]() { source->close(); });

    Status connected = source->connect(config->source.mode, config->source.port);
    MESHMETRICS_FATAL(connected.ok, "Failed to connect to Meshtastic device: {}", connected.message);
    log_info(tt::LogAlways, "Connected to Meshtastic via {} ({})", config->source.mode, config->source.port);

    delivery_ = std::make_unique<DeliveryCoordinator>(*config, stats_);
    scheduler_ = std::make_unique<PollScheduler>(std::move(roster), *source, *delivery_, stats_, config, running_);
    auto release_loop = make_cleanup([this]() {
        scheduler_.reset();
        delivery_.reset();
    });
    scheduler_->set_sleeper(sleeper_);
    scheduler_->set_tick_callback([this]() { service_reload_request(); });

    if (!config->push.push_url.empty()) {
        log_info(tt::LogAlways, "Prometheus push gateway configured: {}", config->push.push_url);
    }

    if (options_.once) {
        scheduler_->run_once();
    } else if (running_.load()) {
        scheduler_->run();
    }

    log_info(tt::LogAlways, "Daemon shutdown complete");
    return 0;
}

void LifecycleController::service_reload_request() {
    if (reload_requested_.exchange(false)) {
        reload_config();
    }
}

bool LifecycleController::reload_config() {
    DaemonConfigPtr previous = active_config();
    uint64_t previous_version = previous ? previous->version : 0;
    log_info(tt::LogAlways, "Reloading configuration from {}", options_.config_path.string());

    try {
        auto config = std::make_shared<const DaemonConfig>(load_effective_config(options_, previous_version));
        if (delivery_) {
            delivery_->reload(*config);
        }
        if (scheduler_) {
            scheduler_->update_config(config);
        }
        if (auto level = logging::parse_level(config->daemon.log_level)) {
            logging::set_level(*level);
        }
        if (previous && (previous->source.mode != config->source.mode || previous->source.port != config->source.port ||
                         previous->roster.file != config->roster.file)) {
            log_warning(tt::LogAlways, "Changes to the device connection or roster take effect after a restart");
        }
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            active_config_ = config;
        }
        log_info(tt::LogAlways, "Configuration reloaded (version {})", config->version);
        return true;
    } catch (const std::exception& e) {
        log_error(
            tt::LogAlways, "Configuration reload failed, keeping version {}: {}", previous_version, e.what());
        return false;
    }
}

}  // namespace meshmetrics
