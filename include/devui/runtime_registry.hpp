/**
 * @file runtime_registry.hpp
 * @brief Tracks user application runtimes that announced themselves
 *
 * A running application announces itself by writing
 * <root>/.devui/runtimes/<name>.json:
 *
 *   {
 *     "id": "12345",
 *     "pid": 12345,
 *     "reflectionServerUrl": "http://localhost:3100",
 *     "timestamp": "2026-01-01T00:00:00.000Z",
 *     "projectName": "my-app"              (optional)
 *   }
 *
 * FileRuntimeRegistry watches that directory by polling and emits
 * ADDED / REMOVED events to subscribers.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <optional>
#include <functional>
#include <filesystem>
#include <condition_variable>
#include <nlohmann/json.hpp>

#include "devui/project_config.hpp"

namespace devui {

    class HealthChecker;
    class Logger;

    /**
     * @brief One registered runtime
     */
    struct RuntimeInfo {
        std::string id;                             ///< Runtime id (the app's PID as a string)
        int pid = 0;                                ///< Process id of the app
        std::string reflection_server_url;          ///< Base URL of the app's reflection server
        std::string timestamp;                      ///< ISO-8601 registration time
        std::optional<std::string> project_name;    ///< Optional display name

        [[nodiscard]] nlohmann::json to_json() const;

        /**
         * @brief Parses a runtime file document
         *
         * @return std::optional<RuntimeInfo> Empty if a required field is
         *         missing or has the wrong type
         */
        static std::optional<RuntimeInfo> from_json(const nlohmann::json& j);
    };

    enum class RuntimeEvent {
        ADDED,
        REMOVED
    };

    inline std::string runtime_event_to_string(RuntimeEvent event) {
        return event == RuntimeEvent::ADDED ? "added" : "removed";
    }

    using RuntimeCallback = std::function<void(RuntimeEvent, const RuntimeInfo&)>;

    /**
     * @brief RAII handle for a registry listener
     *
     * Destroying or reset()-ing the handle removes the listener. Once
     * reset() returns the callback will not be invoked again.
     */
    class Subscription {
    public:
        Subscription() = default;
        explicit Subscription(std::function<void()> cancel);
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();

        [[nodiscard]] bool active() const { return static_cast<bool>(cancel_); }

    private:
        std::function<void()> cancel_;
    };

    /**
     * @brief Read and subscribe interface to registered runtimes
     */
    class RuntimeRegistry {
    public:
        virtual ~RuntimeRegistry() = default;

        virtual std::optional<RuntimeInfo> get_by_id(const std::string& id) const = 0;

        virtual std::vector<RuntimeInfo> list() const = 0;

        /**
         * @brief Runtime with the latest timestamp, if any
         */
        virtual std::optional<RuntimeInfo> most_recent() const = 0;

        /**
         * @brief Registers a listener for ADDED / REMOVED events
         *
         * @param callback Invoked from the registry's polling thread
         * @return Subscription Keep alive for as long as events are wanted
         */
        [[nodiscard]] virtual Subscription subscribe(RuntimeCallback callback) = 0;
    };

    /**
     * @brief RuntimeRegistry backed by a directory of JSON files
     *
     * Usage:
     *   FileRuntimeRegistry registry(project.get_runtimes_dir(), health, logger);
     *   registry.start();                       // initial scan + polling thread
     *   auto sub = registry.subscribe([](RuntimeEvent e, const RuntimeInfo& r) { ... });
     *
     * A runtime is only added once its reflection server answers the
     * health probe. With manage_health enabled, files of runtimes that
     * fail the probe are deleted, and registered runtimes are re-probed
     * every health_interval; a runtime that stops answering has its file
     * deleted and is REMOVED on the next scan.
     */
    class FileRuntimeRegistry : public RuntimeRegistry {
    public:
        FileRuntimeRegistry(std::filesystem::path runtimes_dir,
                            HealthChecker& health_checker,
                            Logger& logger,
                            bool manage_health = true,
                            std::chrono::milliseconds poll_interval = kRuntimePollInterval,
                            std::chrono::milliseconds health_interval = kRuntimeHealthInterval);

        ~FileRuntimeRegistry() override;

        FileRuntimeRegistry(const FileRuntimeRegistry&) = delete;
        FileRuntimeRegistry& operator=(const FileRuntimeRegistry&) = delete;

        /**
         * @brief Scans once, then keeps scanning on a background thread
         */
        void start();

        /**
         * @brief Stops the polling thread (idempotent)
         */
        void stop();

        /**
         * @brief Performs a single scan of the runtimes directory
         */
        void refresh();

        /**
         * @brief Re-probes every registered runtime once
         *
         * Files of runtimes that fail are deleted; the REMOVED event
         * follows from the next refresh(). No-op without manage_health.
         */
        void check_health();

        std::optional<RuntimeInfo> get_by_id(const std::string& id) const override;
        std::vector<RuntimeInfo> list() const override;
        std::optional<RuntimeInfo> most_recent() const override;
        [[nodiscard]] Subscription subscribe(RuntimeCallback callback) override;

        [[nodiscard]] std::filesystem::path get_runtimes_dir() const { return runtimes_dir_; }

    private:
        std::filesystem::path runtimes_dir_;
        HealthChecker& health_checker_;
        Logger& logger_;
        bool manage_health_;
        std::chrono::milliseconds poll_interval_;
        std::chrono::milliseconds health_interval_;

        std::map<std::string, RuntimeInfo> runtimes_;     ///< Keyed by file name
        std::map<std::string, std::filesystem::file_time_type> invalid_files_;  ///< Reported once, keyed by mtime
        mutable std::mutex runtimes_mutex_;

        std::map<uint64_t, RuntimeCallback> listeners_;
        uint64_t next_listener_id_ = 1;
        std::mutex listeners_mutex_;
        std::recursive_mutex dispatch_mutex_;             ///< Held while callbacks run

        std::mutex scan_mutex_;
        std::thread poll_thread_;
        std::atomic<bool> running_{false};
        std::mutex wake_mutex_;
        std::condition_variable wake_cv_;

        void poll_loop();
        void emit(RuntimeEvent event, const RuntimeInfo& runtime);
        void unsubscribe(uint64_t id);
    };

} // namespace devui
