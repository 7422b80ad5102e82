#include "devui/process.hpp"
#include "devui/utils.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

extern char** environ;

namespace devui {

    namespace {

        /**
         * @brief State shared between a PosixProcess and its reaper thread
         *
         * Held by shared_ptr so a released handle can be destroyed while
         * the reaper is still blocked in waitpid().
         */
        struct ReapState {
            std::promise<void> promise;
            std::shared_future<void> future;
            std::mutex mutex;
            bool exited = false;
        };

        void reap(pid_t pid, std::shared_ptr<ReapState> state) {
            int status = 0;
            pid_t result;
            do {
                result = waitpid(pid, &status, 0);
            } while (result < 0 && errno == EINTR);

            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->exited = true;
            }

            if (result < 0) {
                state->promise.set_exception(std::make_exception_ptr(
                    ProcessExitError("Failed to wait for process " + std::to_string(pid) +
                                     ": " + std::strerror(errno), -1, 0)));
            } else if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
                state->promise.set_value();
            } else if (WIFEXITED(status)) {
                int code = WEXITSTATUS(status);
                state->promise.set_exception(std::make_exception_ptr(
                    ProcessExitError("Process " + std::to_string(pid) +
                                     " exited with code " + std::to_string(code), code, 0)));
            } else {
                int sig = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
                state->promise.set_exception(std::make_exception_ptr(
                    ProcessExitError("Process " + std::to_string(pid) +
                                     " was terminated by signal " + std::to_string(sig), -1, sig)));
            }
        }

        class PosixProcess : public Process {
        public:
            PosixProcess(pid_t pid, bool own_group, std::array<int, 3> stdio_fds)
                : pid_(pid)
                , own_group_(own_group)
                , stdio_fds_(stdio_fds)
                , state_(std::make_shared<ReapState>()) {
                state_->future = state_->promise.get_future().share();
                reaper_ = std::thread(reap, pid_, state_);
            }

            ~PosixProcess() override {
                if (!released_ && is_alive()) {
                    terminate();
                }
                if (reaper_.joinable()) {
                    if (released_) {
                        reaper_.detach();
                    } else {
                        reaper_.join();
                    }
                }
                for (int fd : stdio_fds_) {
                    if (fd >= 0) {
                        close(fd);
                    }
                }
            }

            pid_t get_pid() const override { return pid_; }

            bool is_alive() const override {
                std::lock_guard<std::mutex> lock(state_->mutex);
                return !state_->exited;
            }

            std::shared_future<void> lifecycle() const override {
                return state_->future;
            }

            std::string terminate() override {
                if (!is_alive()) {
                    return "Not running";
                }

                signal_child(SIGTERM);

                // Wait up to 5 seconds for graceful termination
                if (state_->future.wait_for(std::chrono::seconds(5)) == std::future_status::ready) {
                    return "Graceful termination";
                }

                signal_child(SIGKILL);
                state_->future.wait();
                return "Force killed";
            }

            void release() override {
                released_ = true;
            }

            int stdio_fd(int index) const override {
                if (index < 0 || index > 2) {
                    return -1;
                }
                return stdio_fds_[static_cast<size_t>(index)];
            }

        private:
            pid_t pid_;
            bool own_group_;
            std::array<int, 3> stdio_fds_;
            std::shared_ptr<ReapState> state_;
            std::thread reaper_;
            bool released_ = false;

            void signal_child(int sig) {
                if (own_group_) {
                    kill(-pid_, sig);
                } else {
                    kill(pid_, sig);
                }
            }
        };

        std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
            std::vector<std::string> env;
            for (char** entry = environ; entry && *entry; ++entry) {
                std::string kv(*entry);
                std::string key = kv.substr(0, kv.find('='));
                if (overrides.count(key) == 0) {
                    env.push_back(std::move(kv));
                }
            }
            for (const auto& [key, value] : overrides) {
                env.push_back(key + "=" + value);
            }
            return env;
        }

        std::vector<char*> to_c_array(std::vector<std::string>& strings) {
            std::vector<char*> out;
            out.reserve(strings.size() + 1);
            for (auto& s : strings) {
                out.push_back(s.data());
            }
            out.push_back(nullptr);
            return out;
        }

        void close_pair(int fds[2]) {
            if (fds[0] >= 0) close(fds[0]);
            if (fds[1] >= 0) close(fds[1]);
            fds[0] = fds[1] = -1;
        }

    } // namespace

    std::string PosixProcessLauncher::resolve_command(const std::string& command) {
        if (command.empty() || command.find('/') != std::string::npos) {
            return command;
        }

        const char* path_env = std::getenv("PATH");
        if (!path_env) {
            return command;
        }

        std::string path_list(path_env);
        size_t start = 0;
        while (start <= path_list.size()) {
            size_t end = path_list.find(':', start);
            if (end == std::string::npos) {
                end = path_list.size();
            }
            std::string dir = path_list.substr(start, end - start);
            if (dir.empty()) {
                dir = ".";
            }
            std::string candidate = dir + "/" + command;
            if (access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
            start = end + 1;
        }
        return command;
    }

    std::unique_ptr<Process> PosixProcessLauncher::launch(const SpawnConfig& config) {
        // Everything the child needs is prepared before fork()
        std::vector<std::string> argv_strings;
        std::string exec_path;
        if (config.options.use_shell) {
            std::vector<std::string> tokens = {config.command};
            tokens.insert(tokens.end(), config.args.begin(), config.args.end());
            exec_path = "/bin/sh";
            argv_strings = {"sh", "-c", join(tokens)};
        } else {
            exec_path = resolve_command(config.command);
            argv_strings.push_back(config.command);
            argv_strings.insert(argv_strings.end(), config.args.begin(), config.args.end());
        }
        std::vector<char*> argv = to_c_array(argv_strings);

        std::vector<std::string> env_strings = build_environment(config.options.env);
        std::vector<char*> envp = to_c_array(env_strings);

        int pipes[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
        for (int i = 0; i < 3; ++i) {
            if (config.options.stdio[i] == StdioMode::PIPE && pipe(pipes[i]) != 0) {
                int err = errno;
                for (auto& p : pipes) close_pair(p);
                throw SpawnError(std::string("Failed to create pipe: ") + std::strerror(err), err);
            }
        }

        // Child reports exec failure through this close-on-exec pipe
        int error_pipe[2];
        if (pipe2(error_pipe, O_CLOEXEC) != 0) {
            int err = errno;
            for (auto& p : pipes) close_pair(p);
            throw SpawnError(std::string("Failed to create pipe: ") + std::strerror(err), err);
        }

        pid_t pid = fork();

        if (pid < 0) {
            int err = errno;
            for (auto& p : pipes) close_pair(p);
            close_pair(error_pipe);
            throw SpawnError(std::string("Failed to fork: ") + std::strerror(err), err);
        }

        if (pid == 0) {
            // Child process
            close(error_pipe[0]);

            if (config.options.detached) {
                setsid();
            }

            for (int i = 0; i < 3; ++i) {
                switch (config.options.stdio[i]) {
                    case StdioMode::IGNORE: {
                        int null_fd = open("/dev/null", i == 0 ? O_RDONLY : O_WRONLY);
                        if (null_fd >= 0) {
                            dup2(null_fd, i);
                            close(null_fd);
                        }
                        break;
                    }
                    case StdioMode::PIPE:
                        dup2(i == 0 ? pipes[i][0] : pipes[i][1], i);
                        close(pipes[i][0]);
                        close(pipes[i][1]);
                        break;
                    case StdioMode::INHERIT:
                        break;
                }
            }

            execve(exec_path.c_str(), argv.data(), envp.data());

            // If we get here, exec failed
            int err = errno;
            ssize_t written = write(error_pipe[1], &err, sizeof(err));
            (void)written;
            _exit(127);
        }

        // Parent process
        close(error_pipe[1]);

        int child_errno = 0;
        ssize_t n;
        do {
            n = read(error_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close(error_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            int status;
            waitpid(pid, &status, 0);
            for (auto& p : pipes) close_pair(p);
            throw SpawnError("Failed to execute " + config.command + ": " +
                             std::strerror(child_errno), child_errno);
        }

        std::array<int, 3> parent_fds = {-1, -1, -1};
        for (int i = 0; i < 3; ++i) {
            if (config.options.stdio[i] == StdioMode::PIPE) {
                if (i == 0) {
                    close(pipes[i][0]);
                    parent_fds[0] = pipes[i][1];
                } else {
                    close(pipes[i][1]);
                    parent_fds[static_cast<size_t>(i)] = pipes[i][0];
                }
            }
        }

        return std::make_unique<PosixProcess>(pid, config.options.detached, parent_fds);
    }

} // namespace devui
