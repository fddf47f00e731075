/**
 * @file npm.cpp
 * @brief `npm ls` subprocess and tree override loading
 */

#include "wormscan/npm.hpp"

#include "wormscan/json_io.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wormscan::npm {

namespace {

/**
 * @brief Owning pipe file descriptor
 */
class Fd
{
public:
    Fd() = default;
    explicit Fd(int fd)
        : m_fd(fd)
    {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept
        : m_fd(std::exchange(other.m_fd, -1))
    {}
    Fd& operator=(Fd&& other) noexcept
    {
        if (this != &other) {
            reset();
            m_fd = std::exchange(other.m_fd, -1);
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return m_fd; }
    [[nodiscard]] bool valid() const noexcept { return m_fd >= 0; }

    void reset() noexcept
    {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

private:
    int m_fd = -1;
};

struct Pipe
{
    Fd read;
    Fd write;
};

[[nodiscard]] wormscan::Result<Pipe> make_pipe()
{
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        return std::unexpected(
            Error::make("SpawnFailed", std::format("pipe: {}", std::strerror(errno))));
    }
    return Pipe{.read = Fd(fds[0]), .write = Fd(fds[1])};
}

// Runs in the forked child: async-signal-safe calls only
[[noreturn]] void exec_child(char* const* args,
                             const char* cwd,
                             const Pipe& out,
                             const Pipe& err,
                             const Pipe& status)
{
    if (::dup2(out.write.get(), STDOUT_FILENO) >= 0 && ::dup2(err.write.get(), STDERR_FILENO) >= 0
        && ::chdir(cwd) == 0) {
        ::execvp(args[0], args);
    }
    // Report errno through the close-on-exec status pipe
    const int code = errno;
    [[maybe_unused]] const auto written = ::write(status.write.get(), &code, sizeof(code));
    ::_exit(127);
}

[[nodiscard]] wormscan::VoidResult drain(Fd& out_fd, Fd& err_fd, ProcessOutput& output)
{
    std::array<char, 8192> buffer{};
    while (out_fd.valid() || err_fd.valid()) {
        std::array<pollfd, 2> fds = {
            {{.fd = out_fd.get(), .events = POLLIN, .revents = 0},
             {.fd = err_fd.get(), .events = POLLIN, .revents = 0}}
        };
        if (::poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(
                Error::make("SpawnFailed", std::format("poll: {}", std::strerror(errno))));
        }
        const std::array targets = {std::pair{&out_fd, &output.out},
                                    std::pair{&err_fd, &output.err}};
        for (auto [fd, target] : targets) {
            if (!fd->valid()) {
                continue;
            }
            const auto& entry = fd == &out_fd ? fds[0] : fds[1];
            if ((entry.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const auto n = ::read(fd->get(), buffer.data(), buffer.size());
            if (n > 0) {
                target->append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fd->reset();
            }
        }
    }
    return {};
}

[[nodiscard]] std::string_view trim(std::string_view input)
{
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

}  // namespace

wormscan::Result<ProcessOutput> run_process(const std::vector<std::string>& argv,
                                            const std::filesystem::path& cwd)
{
    if (argv.empty()) {
        return std::unexpected(Error::make("SpawnFailed", "empty command"));
    }
    auto out = make_pipe();
    auto err = make_pipe();
    auto status = make_pipe();
    for (const auto* pipe : {&out, &err, &status}) {
        if (!*pipe) {
            return std::unexpected(pipe->error());
        }
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(
            Error::make("SpawnFailed", std::format("fork: {}", std::strerror(errno))));
    }
    if (pid == 0) {
        exec_child(args.data(), cwd.c_str(), *out, *err, *status);
    }

    out->write.reset();
    err->write.reset();
    status->write.reset();

    int exec_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(status->read.get(), &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);

    ProcessOutput output;
    auto drained = drain(out->read, err->read, output);

    int wait_status = 0;
    while (::waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(
                Error::make("SpawnFailed", std::format("waitpid: {}", std::strerror(errno))));
        }
    }

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        return std::unexpected(Error::make("SpawnFailed", std::strerror(exec_errno)));
    }
    if (!drained) {
        return std::unexpected(drained.error());
    }
    output.exit_status = WIFEXITED(wait_status) ? WEXITSTATUS(wait_status) : -1;
    return output;
}

wormscan::Result<nlohmann::json> read_dependency_tree(const TreeOptions& options)
{
    if (options.override_path) {
        const auto path = options.override_path->is_absolute()
                              ? *options.override_path
                              : options.working_dir / *options.override_path;
        return common::read_json_file(path);
    }

    auto result = run_process({options.npm_command, "ls", "--all", "--json"}, options.working_dir);
    if (!result) {
        return std::unexpected(Error::make(
            "SpawnFailed", std::format("Failed to spawn npm ls: {}", result.error().message)));
    }
    if (trim(result->out).empty()) {
        const auto stderr_text = trim(result->err);
        const std::string detail = stderr_text.empty() ? std::string("npm ls produced no output")
                                                       : std::string(stderr_text);
        return std::unexpected(Error::make("NpmFailed", std::format("npm ls failed: {}", detail)));
    }
    return common::parse_json(result->out, "npm ls");
}

}  // namespace wormscan::npm
