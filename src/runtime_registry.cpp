#include "devui/runtime_registry.hpp"
#include "devui/health_checker.hpp"
#include "devui/logger.hpp"
#include <fstream>
#include <iterator>
#include <set>

namespace devui {

    nlohmann::json RuntimeInfo::to_json() const {
        nlohmann::json j = {
            {"id", id},
            {"pid", pid},
            {"reflectionServerUrl", reflection_server_url},
            {"timestamp", timestamp}
        };
        if (project_name) {
            j["projectName"] = *project_name;
        }
        return j;
    }

    std::optional<RuntimeInfo> RuntimeInfo::from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return std::nullopt;
        }
        if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
            return std::nullopt;
        }
        if (!j.contains("pid") || !j["pid"].is_number_integer()) {
            return std::nullopt;
        }
        if (!j.contains("reflectionServerUrl") || !j["reflectionServerUrl"].is_string() ||
            j["reflectionServerUrl"].get<std::string>().empty()) {
            return std::nullopt;
        }
        if (!j.contains("timestamp") || !j["timestamp"].is_string()) {
            return std::nullopt;
        }

        RuntimeInfo info;
        info.id = j["id"].get<std::string>();
        info.pid = j["pid"].get<int>();
        info.reflection_server_url = j["reflectionServerUrl"].get<std::string>();
        info.timestamp = j["timestamp"].get<std::string>();
        if (j.contains("projectName") && j["projectName"].is_string()) {
            info.project_name = j["projectName"].get<std::string>();
        }
        return info;
    }

    Subscription::Subscription(std::function<void()> cancel)
        : cancel_(std::move(cancel)) {}

    Subscription::~Subscription() {
        reset();
    }

    Subscription::Subscription(Subscription&& other) noexcept
        : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }

    Subscription& Subscription::operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void Subscription::reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    FileRuntimeRegistry::FileRuntimeRegistry(std::filesystem::path runtimes_dir,
                                             HealthChecker& health_checker,
                                             Logger& logger,
                                             bool manage_health,
                                             std::chrono::milliseconds poll_interval,
                                             std::chrono::milliseconds health_interval)
        : runtimes_dir_(std::move(runtimes_dir))
        , health_checker_(health_checker)
        , logger_(logger)
        , manage_health_(manage_health)
        , poll_interval_(poll_interval)
        , health_interval_(health_interval) {}

    FileRuntimeRegistry::~FileRuntimeRegistry() {
        stop();
    }

    void FileRuntimeRegistry::start() {
        if (running_.exchange(true)) {
            return;
        }
        refresh();
        poll_thread_ = std::thread(&FileRuntimeRegistry::poll_loop, this);
    }

    void FileRuntimeRegistry::stop() {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            running_ = false;
        }
        wake_cv_.notify_all();
        if (poll_thread_.joinable()) {
            poll_thread_.join();
        }
    }

    void FileRuntimeRegistry::poll_loop() {
        auto next_sweep = std::chrono::steady_clock::now() + health_interval_;

        while (true) {
            {
                std::unique_lock<std::mutex> lock(wake_mutex_);
                wake_cv_.wait_for(lock, poll_interval_, [this] { return !running_.load(); });
                if (!running_) {
                    return;
                }
            }

            try {
                if (manage_health_ && std::chrono::steady_clock::now() >= next_sweep) {
                    check_health();
                    next_sweep = std::chrono::steady_clock::now() + health_interval_;
                }
                refresh();
            } catch (const std::exception& e) {
                logger_.debug(std::string("Runtime scan failed: ") + e.what());
            }
        }
    }

    void FileRuntimeRegistry::check_health() {
        if (!manage_health_) {
            return;
        }

        std::map<std::string, RuntimeInfo> snapshot;
        {
            std::lock_guard<std::mutex> lock(runtimes_mutex_);
            snapshot = runtimes_;
        }

        for (const auto& [name, runtime] : snapshot) {
            if (health_checker_.check(runtime.reflection_server_url, kReuseProbeTimeout)) {
                continue;
            }
            std::filesystem::path path = runtimes_dir_ / name;
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) {
                logger_.debug("Failed to delete runtime file " + path.string() + ": " + ec.message());
            }
            logger_.debug("Removed unhealthy runtime " + runtime.id + " (" + path.string() + ")");
        }
    }

    void FileRuntimeRegistry::refresh() {
        std::lock_guard<std::mutex> scan_lock(scan_mutex_);

        std::set<std::string> present;
        std::error_code ec;
        if (std::filesystem::is_directory(runtimes_dir_, ec)) {
            for (const auto& entry : std::filesystem::directory_iterator(runtimes_dir_, ec)) {
                if (entry.path().extension() == ".json") {
                    present.insert(entry.path().filename().string());
                }
            }
        }

        // Vanished files
        std::vector<RuntimeInfo> removed;
        {
            std::lock_guard<std::mutex> lock(runtimes_mutex_);
            for (auto it = runtimes_.begin(); it != runtimes_.end();) {
                if (present.count(it->first) == 0) {
                    removed.push_back(it->second);
                    it = runtimes_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto it = invalid_files_.begin(); it != invalid_files_.end();) {
            it = present.count(it->first) == 0 ? invalid_files_.erase(it) : std::next(it);
        }
        for (const auto& runtime : removed) {
            emit(RuntimeEvent::REMOVED, runtime);
        }

        // New files
        for (const auto& name : present) {
            {
                std::lock_guard<std::mutex> lock(runtimes_mutex_);
                if (runtimes_.count(name) != 0) {
                    continue;
                }
            }
            std::filesystem::path path = runtimes_dir_ / name;
            auto mtime = std::filesystem::last_write_time(path, ec);
            auto invalid = invalid_files_.find(name);
            if (invalid != invalid_files_.end() && invalid->second == mtime) {
                continue;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                continue;
            }
            nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
            std::optional<RuntimeInfo> runtime = RuntimeInfo::from_json(doc);
            if (!runtime) {
                // Reported once per version of the file
                logger_.error("Unexpected file in the runtimes directory: " + path.string());
                invalid_files_[name] = mtime;
                continue;
            }
            invalid_files_.erase(name);

            if (!health_checker_.check(runtime->reflection_server_url, kReuseProbeTimeout)) {
                if (manage_health_) {
                    logger_.debug("Runtime " + runtime->id + " at " + runtime->reflection_server_url +
                                  " is not healthy, removing " + path.string());
                    std::filesystem::remove(path, ec);
                }
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(runtimes_mutex_);
                runtimes_[name] = *runtime;
            }
            emit(RuntimeEvent::ADDED, *runtime);
        }
    }

    std::optional<RuntimeInfo> FileRuntimeRegistry::get_by_id(const std::string& id) const {
        std::lock_guard<std::mutex> lock(runtimes_mutex_);
        for (const auto& [name, runtime] : runtimes_) {
            if (runtime.id == id) {
                return runtime;
            }
        }
        return std::nullopt;
    }

    std::vector<RuntimeInfo> FileRuntimeRegistry::list() const {
        std::lock_guard<std::mutex> lock(runtimes_mutex_);
        std::vector<RuntimeInfo> out;
        out.reserve(runtimes_.size());
        for (const auto& [name, runtime] : runtimes_) {
            out.push_back(runtime);
        }
        return out;
    }

    std::optional<RuntimeInfo> FileRuntimeRegistry::most_recent() const {
        std::lock_guard<std::mutex> lock(runtimes_mutex_);
        const RuntimeInfo* latest = nullptr;
        for (const auto& [name, runtime] : runtimes_) {
            // ISO-8601 UTC strings order lexicographically
            if (!latest || runtime.timestamp > latest->timestamp) {
                latest = &runtime;
            }
        }
        if (!latest) {
            return std::nullopt;
        }
        return *latest;
    }

    Subscription FileRuntimeRegistry::subscribe(RuntimeCallback callback) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            id = next_listener_id_++;
            listeners_[id] = std::move(callback);
        }
        return Subscription([this, id] { unsubscribe(id); });
    }

    void FileRuntimeRegistry::unsubscribe(uint64_t id) {
        // Waits for an in-flight dispatch on another thread to finish
        std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_.erase(id);
    }

    void FileRuntimeRegistry::emit(RuntimeEvent event, const RuntimeInfo& runtime) {
        logger_.debug("Runtime " + runtime.id + " " + runtime_event_to_string(event) +
                      " (" + runtime.reflection_server_url + ")");

        std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);

        std::vector<uint64_t> ids;
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            for (const auto& [id, cb] : listeners_) {
                ids.push_back(id);
            }
        }

        for (uint64_t id : ids) {
            RuntimeCallback callback;
            {
                std::lock_guard<std::mutex> lock(listeners_mutex_);
                auto it = listeners_.find(id);
                if (it == listeners_.end()) {
                    continue;
                }
                callback = it->second;
            }
            try {
                callback(event, runtime);
            } catch (const std::exception& e) {
                logger_.error(std::string("Runtime listener failed: ") + e.what());
            }
        }
    }

} // namespace devui
