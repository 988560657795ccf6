/**
 * Cloak - Obfuscating C Compiler
 *
 * preprocessor.cpp - Bridge to the system C preprocessor
 */

#include "preprocessor.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cloak {
namespace frontend {

namespace {

class FdCloser {
public:
    explicit FdCloser(int fd = -1) : fd_(fd) {}
    ~FdCloser() { reset(); }
    FdCloser(const FdCloser&) = delete;
    FdCloser& operator=(const FdCloser&) = delete;

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_;
};

bool makePipe(int fds[2]) {
    return ::pipe2(fds, O_CLOEXEC) == 0;
}

std::string firstLine(const std::string& text) {
    size_t nl = text.find('\n');
    return nl == std::string::npos ? text : text.substr(0, nl);
}

} // namespace

Preprocessor::Preprocessor(PreprocessorConfig config) : config_(std::move(config)) {}

std::vector<std::string> Preprocessor::buildCommand(const std::string& input) const {
    std::vector<std::string> args;
    args.push_back(config_.tool);
    if (config_.tool != "cpp") args.push_back("-E");
    if (config_.target_i386) args.push_back("-m32");
    for (const auto& path : config_.include_paths) {
        args.push_back("-I" + path);
    }
    for (const auto& d : config_.defines) {
        args.push_back(d.second ? "-D" + d.first + "=" + *d.second : "-D" + d.first);
    }
    for (const auto& flag : config_.extra_flags) {
        args.push_back(flag);
    }
    args.push_back(input);
    return args;
}

bool Preprocessor::isAvailable() const {
    ProcessOutput result = runProcess({config_.tool, "--version"});
    return !result.exec_failed && !result.timed_out && result.io_error.empty() &&
           result.status == 0;
}

PreprocessResult Preprocessor::preprocessFile(const std::string& path) const {
    PreprocessResult result;
    if (::access(path.c_str(), R_OK) != 0) {
        result.diagnostics.fatal(DiagCode::ExternalToolFailure,
                                 "cannot read input file '" + path + "'");
        return result;
    }

    auto args = buildCommand(path);
    logger_.debug("running {} ({} arguments)", config_.tool, args.size());
    return interpret(runProcess(args), path);
}

PreprocessResult Preprocessor::interpret(ProcessOutput proc, const std::string& path) const {
    PreprocessResult result;
    if (proc.exec_failed) {
        result.diagnostics.fatal(DiagCode::ExternalToolFailure,
                                 "preprocessor '" + config_.tool + "' not found");
    } else if (!proc.io_error.empty()) {
        result.diagnostics.fatal(DiagCode::ExternalToolFailure,
                                 "preprocessor output lost: " + proc.io_error);
    } else if (proc.timed_out) {
        result.diagnostics.fatal(DiagCode::ExternalToolFailure,
                                 "preprocessor timed out after " +
                                 std::to_string(config_.timeout_ms) + " ms");
    } else if (proc.status != 0) {
        std::string detail = firstLine(proc.err);
        result.diagnostics.fatal(DiagCode::ExternalToolFailure,
                                 "preprocessor exited with status " + std::to_string(proc.status) +
                                 (detail.empty() ? "" : ": " + detail));
    } else {
        result.success = true;
        result.output = std::move(proc.out);
        logger_.debug("preprocessed '{}' into {} bytes", path, result.output.size());
    }
    return result;
}

PreprocessResult Preprocessor::preprocessString(const std::string& source) const {
    const char* tmpdir = std::getenv("TMPDIR");
    std::string pattern = std::string(tmpdir && *tmpdir ? tmpdir : "/tmp") + "/cloak-XXXXXX.c";
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    FdCloser fd(::mkstemps(name.data(), 2));
    if (fd.get() < 0) {
        PreprocessResult result;
        result.diagnostics.fatal(DiagCode::ExternalToolFailure,
                                 std::string("cannot create temporary file: ") + std::strerror(errno));
        return result;
    }
    std::string path(name.data());

    size_t written = 0;
    while (written < source.size()) {
        ssize_t n = ::write(fd.get(), source.data() + written, source.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            ::unlink(path.c_str());
            PreprocessResult result;
            result.diagnostics.fatal(DiagCode::ExternalToolFailure,
                                     std::string("cannot write temporary file: ") + std::strerror(errno));
            return result;
        }
        written += static_cast<size_t>(n);
    }
    fd.reset();

    PreprocessResult result = preprocessFile(path);
    ::unlink(path.c_str());
    return result;
}

Preprocessor::ProcessOutput Preprocessor::runProcess(const std::vector<std::string>& args) const {
    ProcessOutput result;

    int out_pipe[2], err_pipe[2], exec_pipe[2];
    if (!makePipe(out_pipe)) throw CompileError(DiagCode::ExternalToolFailure, "pipe failed");
    FdCloser out_r(out_pipe[0]), out_w(out_pipe[1]);
    if (!makePipe(err_pipe)) throw CompileError(DiagCode::ExternalToolFailure, "pipe failed");
    FdCloser err_r(err_pipe[0]), err_w(err_pipe[1]);
    // closed by a successful exec; receives errno otherwise
    if (!makePipe(exec_pipe)) throw CompileError(DiagCode::ExternalToolFailure, "pipe failed");
    FdCloser exec_r(exec_pipe[0]), exec_w(exec_pipe[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw CompileError(DiagCode::ExternalToolFailure, "fork failed");
    }

    if (pid == 0) {
        ::dup2(out_w.get(), STDOUT_FILENO);
        ::dup2(err_w.get(), STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_w.get(), &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    out_w.reset();
    err_w.reset();
    exec_w.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_r.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.exec_failed = true;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeout_ms);
    bool out_open = true, err_open = true;
    char buf[65536];
    while ((out_open || err_open) && !result.exec_failed) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[2];
        int count = 0;
        if (out_open) fds[count++] = {out_r.get(), POLLIN, 0};
        if (err_open) fds[count++] = {err_r.get(), POLLIN, 0};
        int ready = ::poll(fds, static_cast<nfds_t>(count), static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.io_error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (ready == 0) continue;

        for (int i = 0; i < count; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            bool is_out = fds[i].fd == out_r.get();
            ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                (is_out ? result.out : result.err).append(buf, static_cast<size_t>(got));
            } else if (got == 0) {
                (is_out ? out_open : err_open) = false;
            } else if (errno != EINTR) {
                result.io_error = std::string("read failed: ") + std::strerror(errno);
                (is_out ? out_open : err_open) = false;
            }
        }
    }

    if (result.timed_out) {
        logger_.warn("killing {} after {} ms", args[0], config_.timeout_ms);
        ::kill(pid, SIGKILL);
    } else if (!result.io_error.empty()) {
        logger_.warn("killing {}: {}", args[0], result.io_error);
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }
    if (WIFEXITED(status)) {
        result.status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.status = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace frontend
} // namespace cloak
