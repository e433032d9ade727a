#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

namespace {

constexpr size_t kReadChunkSize = 8192;

void close_descriptor(int &descriptor) {
    if (descriptor >= 0) {
        ::close(descriptor);
        descriptor = -1;
    }
}

bool is_executable_file(const std::string &path) {
    struct stat file_info;
    if (::stat(path.c_str(), &file_info) != 0) {
        return false;
    }
    return S_ISREG(file_info.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

// Our environment with extra_environment entries replacing same-named ones.
std::vector<std::string> build_environment(const std::map<std::string, std::string> &extra_environment) {
    std::vector<std::string> entries;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string line(*entry);
        std::string key = line.substr(0, line.find('='));
        if (extra_environment.count(key) > 0) {
            continue;
        }
        entries.push_back(line);
    }
    for (const auto &variable : extra_environment) {
        entries.push_back(variable.first + "=" + variable.second);
    }
    return entries;
}

std::vector<char *> to_pointer_array(std::vector<std::string> &strings) {
    std::vector<char *> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto &value : strings) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

int decode_wait_status(int wait_status) {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return 128 + WTERMSIG(wait_status);
    }
    return -1;
}

// The child leads its own process group, so this also reaches anything it forked
// (e.g. the `sleep` behind `bash -c`).
void kill_process_group(pid_t child_pid) {
    ::killpg(child_pid, SIGKILL);
    ::kill(child_pid, SIGKILL);
}

// Drain one readable pipe, keeping at most limit bytes. Closes the descriptor
// on EOF or hard error.
void read_available(int &descriptor, std::string &output, size_t limit, bool &truncated) {
    char buffer[kReadChunkSize];
    ssize_t count = ::read(descriptor, buffer, sizeof(buffer));
    if (count > 0) {
        size_t room = output.size() < limit ? limit - output.size() : 0;
        size_t kept = std::min(room, static_cast<size_t>(count));
        output.append(buffer, kept);
        if (kept < static_cast<size_t>(count)) {
            truncated = true;
        }
        return;
    }
    if (count < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
        return;
    }
    close_descriptor(descriptor);
}

} // namespace

ProcessResult run_process(const ProcessRequest &request) {
    ProcessResult result;

    if (request.working_directory) {
        std::error_code directory_error;
        if (!std::filesystem::is_directory(*request.working_directory, directory_error)) {
            result.status = ProcessStatus::SpawnFailed;
            result.error_message = "Working directory not found: " + *request.working_directory;
            return result;
        }
    }

    // Writes to a child that exited early must fail with EPIPE, not kill the server.
    ::signal(SIGPIPE, SIG_IGN);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int stdin_pipe[2] = {-1, -1};
    bool has_stdin = request.stdin_data.has_value();

    if (::pipe2(stdout_pipe, O_CLOEXEC) != 0 || ::pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        (has_stdin && ::pipe2(stdin_pipe, O_CLOEXEC) != 0)) {
        result.status = ProcessStatus::SpawnFailed;
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        for (int *descriptor : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                                &stdin_pipe[0], &stdin_pipe[1]}) {
            close_descriptor(*descriptor);
        }
        return result;
    }

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    if (has_stdin) {
        posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
    } else {
        posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    }
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);
    if (request.working_directory) {
        posix_spawn_file_actions_addchdir_np(&file_actions, request.working_directory->c_str());
    }

    // Own process group, default signal dispositions (we ignore SIGPIPE ourselves).
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF |
                                              POSIX_SPAWN_SETSIGMASK);
    posix_spawnattr_setpgroup(&attributes, 0);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    posix_spawnattr_setsigdefault(&attributes, &default_signals);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigmask(&attributes, &empty_mask);

    std::vector<std::string> argv_strings;
    argv_strings.push_back(request.executable_path);
    argv_strings.insert(argv_strings.end(), request.arguments.begin(), request.arguments.end());
    std::vector<char *> argv_pointers = to_pointer_array(argv_strings);

    std::vector<std::string> environment_strings = build_environment(request.extra_environment);
    std::vector<char *> environment_pointers = to_pointer_array(environment_strings);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, request.executable_path.c_str(),
                                   &file_actions, &attributes,
                                   argv_pointers.data(), environment_pointers.data());

    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attributes);

    // Parent keeps only its ends.
    close_descriptor(stdout_pipe[1]);
    close_descriptor(stderr_pipe[1]);
    close_descriptor(stdin_pipe[0]);

    int stdout_descriptor = stdout_pipe[0];
    int stderr_descriptor = stderr_pipe[0];
    int stdin_descriptor = stdin_pipe[1];

    if (spawn_status != 0) {
        close_descriptor(stdout_descriptor);
        close_descriptor(stderr_descriptor);
        close_descriptor(stdin_descriptor);
        if (spawn_status == ENOENT || spawn_status == EACCES || spawn_status == ENOEXEC) {
            result.status = ProcessStatus::NotFound;
            result.error_message = "Executable not found: " + request.executable_path;
        } else {
            result.status = ProcessStatus::SpawnFailed;
            result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        }
        return result;
    }

    debug_log::log("spawned pid=" + std::to_string(child_pid) + " " + request.executable_path);

    const std::string empty_payload;
    const std::string &payload = has_stdin ? *request.stdin_data : empty_payload;
    size_t payload_offset = 0;
    if (stdin_descriptor >= 0) {
        if (payload.empty()) {
            close_descriptor(stdin_descriptor);
        } else {
            int flags = ::fcntl(stdin_descriptor, F_GETFL, 0);
            if (flags >= 0) {
                ::fcntl(stdin_descriptor, F_SETFL, flags | O_NONBLOCK);
            }
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(request.timeout_seconds);
    bool timed_out = false;
    bool poll_failed = false;

    while (stdout_descriptor >= 0 || stderr_descriptor >= 0 || stdin_descriptor >= 0) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        long long remaining_milliseconds =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        struct pollfd poll_descriptors[3];
        int descriptor_count = 0;
        int stdout_index = -1;
        int stderr_index = -1;
        int stdin_index = -1;
        if (stdout_descriptor >= 0) {
            stdout_index = descriptor_count;
            poll_descriptors[descriptor_count++] = {stdout_descriptor, POLLIN, 0};
        }
        if (stderr_descriptor >= 0) {
            stderr_index = descriptor_count;
            poll_descriptors[descriptor_count++] = {stderr_descriptor, POLLIN, 0};
        }
        if (stdin_descriptor >= 0) {
            stdin_index = descriptor_count;
            poll_descriptors[descriptor_count++] = {stdin_descriptor, POLLOUT, 0};
        }

        // poll takes an int; long deadlines are waited out in INT_MAX slices.
        long long poll_milliseconds =
            std::min<long long>(std::max<long long>(1, remaining_milliseconds), INT_MAX);
        int ready = ::poll(poll_descriptors, static_cast<nfds_t>(descriptor_count),
                           static_cast<int>(poll_milliseconds));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            poll_failed = true;
            result.error_message = "poll failed: " + std::string(strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        if (stdout_index >= 0 && poll_descriptors[stdout_index].revents != 0) {
            read_available(stdout_descriptor, result.stdout_text, request.max_output_bytes, result.output_truncated);
        }
        if (stderr_index >= 0 && poll_descriptors[stderr_index].revents != 0) {
            read_available(stderr_descriptor, result.stderr_text, request.max_output_bytes, result.output_truncated);
        }
        if (stdin_index >= 0 && poll_descriptors[stdin_index].revents != 0) {
            ssize_t written = ::write(stdin_descriptor, payload.data() + payload_offset,
                                      payload.size() - payload_offset);
            if (written > 0) {
                payload_offset += static_cast<size_t>(written);
                if (payload_offset >= payload.size()) {
                    close_descriptor(stdin_descriptor);
                }
            } else if (written < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                // EPIPE: the child closed its stdin without reading everything.
                close_descriptor(stdin_descriptor);
            }
        }
    }

    int wait_status = 0;
    bool reaped = false;
    if (!timed_out && !poll_failed) {
        // Output streams are closed; the child may still be finishing up.
        while (true) {
            pid_t waited = ::waitpid(child_pid, &wait_status, WNOHANG);
            if (waited == child_pid) {
                reaped = true;
                break;
            }
            if (waited < 0 && errno != EINTR) {
                poll_failed = true;
                result.error_message = "waitpid failed: " + std::string(strerror(errno));
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    if (!reaped) {
        debug_log::log("killing process group of pid=" + std::to_string(child_pid));
        kill_process_group(child_pid);
        while (::waitpid(child_pid, &wait_status, 0) < 0 && errno == EINTR) {
        }
    }

    close_descriptor(stdout_descriptor);
    close_descriptor(stderr_descriptor);
    close_descriptor(stdin_descriptor);

    if (timed_out) {
        result.status = ProcessStatus::TimedOut;
        result.error_message = "Process timed out after " + std::to_string(request.timeout_seconds) + " seconds";
        return result;
    }
    if (poll_failed) {
        result.status = ProcessStatus::SpawnFailed;
        return result;
    }

    result.status = ProcessStatus::Exited;
    result.exit_code = decode_wait_status(wait_status);
    return result;
}

std::string find_executable(const std::string &name) {
    if (name.empty()) {
        return "";
    }
    if (name.find('/') != std::string::npos) {
        if (!is_executable_file(name)) {
            return "";
        }
        // Relative to our cwd, not the child's working directory.
        std::error_code path_error;
        std::filesystem::path absolute_path = std::filesystem::absolute(name, path_error);
        return path_error ? "" : absolute_path.string();
    }

    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            directory = ".";
        }
        std::string full_path = directory + "/" + name;
        if (is_executable_file(full_path)) {
            return full_path;
        }
    }
    return "";
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool write_file_contents(const std::string &file_path, const std::string &contents) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream.is_open()) {
        return false;
    }
    file_stream << contents;
    file_stream.flush();
    return static_cast<bool>(file_stream);
}

} // namespace platform
