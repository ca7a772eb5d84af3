/**
 * @file latex_converter.cpp
 * @brief csv2latex converter implementation
 */

#include "split/latex_converter.hpp"

#include <cerrno>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

#include "common/logger.hpp"
#include "common/macros.hpp"

namespace csvcols {

namespace {

/// Exit status of the child when exec fails
constexpr int kExecFailedStatus = 127;

/**
 * @brief Owns a file descriptor, closes it on destruction
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    CSVCOLS_DISALLOW_COPY_AND_MOVE(FileDescriptor);

    [[nodiscard]] int get() const noexcept { return fd_; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

}  // namespace

std::optional<char> latex_separator_code(char delimiter) noexcept {
    switch (delimiter) {
        case ',':  return 'c';
        case ';':  return 's';
        case '\t': return 't';
        case ' ':  return 'p';
        case ':':  return 'l';
        default:   return std::nullopt;
    }
}

Status LatexConverter::create(char delimiter, std::unique_ptr<LatexConverter>* out,
                              std::string program) {
    const auto separator = latex_separator_code(delimiter);
    if (!separator) {
        return Status::NotSupported(std::string("no ") + config::kLatexConverterProgram +
                                    " separator for delimiter '" + delimiter + "'");
    }
    *out = std::make_unique<LatexConverter>(Passkey{}, std::move(program), *separator);
    return Status::Ok();
}

std::vector<std::string> LatexConverter::arguments(const std::filesystem::path& input) const {
    return {
        "-s", std::string(1, separator_),
        "-n",
        "-r", config::kLatexRepeatRows,
        "-p", config::kLatexAlignment,
        "-e",
        "-c", config::kLatexColumnWidth,
        input.string(),
    };
}

Status LatexConverter::convert(const std::filesystem::path& input, std::string* output) {
    const std::vector<std::string> args = arguments(input);
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program_.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe(fds) != 0) {
        return Status::IOError(errno_message("pipe failed"));
    }
    FileDescriptor read_end(fds[0]);
    FileDescriptor write_end(fds[1]);

    LOG_DEBUG("Running {} on {}", program_, input.string());
    const pid_t pid = ::fork();
    if (pid < 0) {
        return Status::IOError(errno_message("fork failed"));
    }

    if (pid == 0) {
        if (::dup2(write_end.get(), STDOUT_FILENO) < 0) {
            _exit(kExecFailedStatus);
        }
        ::close(fds[0]);
        ::close(fds[1]);
        ::execvp(program_.c_str(), argv.data());
        _exit(kExecFailedStatus);
    }

    write_end.reset();

    output->clear();
    char buffer[4096];
    int read_errno = 0;
    while (true) {
        const ssize_t n = ::read(read_end.get(), buffer, sizeof(buffer));
        if (n > 0) {
            output->append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            read_errno = errno;
            break;
        }
    }
    read_end.reset();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Status::IOError(errno_message("waitpid failed"));
        }
    }

    if (read_errno != 0) {
        return Status::IOError(std::string("reading ") + program_ + " output failed: " +
                               std::strerror(read_errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return Status::Ok();
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == kExecFailedStatus) {
        return Status::Aborted(program_ + " could not be started for " + input.string());
    }
    if (WIFSIGNALED(status)) {
        return Status::Aborted(program_ + " killed by signal " +
                               std::to_string(WTERMSIG(status)) + " on " + input.string());
    }
    return Status::Aborted(program_ + " exited with status " +
                           std::to_string(WEXITSTATUS(status)) + " on " + input.string());
}

}  // namespace csvcols
