#include "devui/registration_waiter.hpp"
#include "devui/runtime_registry.hpp"
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>

namespace devui {

    namespace {

        /// How long one wait slice lasts before the lifecycle is polled again
        constexpr std::chrono::milliseconds kLifecycleSlice{50};

        /**
         * @brief Whichever branch of the race settled first
         *
         * Written once, under mutex.
         */
        struct RaceOutcome {
            std::mutex mutex;
            std::condition_variable cv;
            bool settled = false;
            std::exception_ptr failure;     ///< Set when the process failed first
        };

        /// Non-null when lifecycle is ready and holds an exit error
        std::exception_ptr failure_of(const std::shared_future<void>& lifecycle) {
            if (!lifecycle.valid() ||
                lifecycle.wait_for(std::chrono::milliseconds::zero()) != std::future_status::ready) {
                return nullptr;
            }
            try {
                lifecycle.get();
            } catch (...) {
                return std::current_exception();
            }
            return nullptr;
        }

    } // namespace

    void wait_for_registration(RuntimeRegistry& registry,
                               const std::string& target_id,
                               std::shared_future<void> lifecycle,
                               std::chrono::milliseconds timeout) {
        using namespace std::chrono;
        auto deadline = steady_clock::now() + timeout;

        auto outcome = std::make_shared<RaceOutcome>();

        // Subscribe before looking so a registration in between is not lost
        Subscription subscription = registry.subscribe(
            [outcome, target_id, lifecycle](RuntimeEvent event, const RuntimeInfo& runtime) {
                if (event != RuntimeEvent::ADDED || runtime.id != target_id) {
                    return;
                }
                {
                    std::lock_guard<std::mutex> lock(outcome->mutex);
                    if (outcome->settled) {
                        return;
                    }
                    // A process that already failed when the event arrives failed first
                    outcome->failure = failure_of(lifecycle);
                    outcome->settled = true;
                }
                outcome->cv.notify_all();
            });

        if (registry.get_by_id(target_id)) {
            return;
        }

        std::unique_lock<std::mutex> lock(outcome->mutex);
        while (true) {
            if (!outcome->settled) {
                if (std::exception_ptr failure = failure_of(lifecycle)) {
                    outcome->failure = failure;
                    outcome->settled = true;
                }
            }

            if (outcome->settled) {
                if (outcome->failure) {
                    // The subscription goes with the stack
                    std::rethrow_exception(outcome->failure);
                }
                return;
            }

            // A clean exit settles nothing; keep waiting for the event or the deadline
            auto now = steady_clock::now();
            if (now >= deadline) {
                throw RegistrationTimeoutError(target_id, timeout);
            }

            auto slice = std::min(duration_cast<milliseconds>(deadline - now), kLifecycleSlice);
            outcome->cv.wait_for(lock, slice);
        }
    }

} // namespace devui
