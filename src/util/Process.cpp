#include "util/Process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "util/Logger.hpp"

namespace mergereport {

namespace {

    void closeFd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    /// Read what is available on fd; returns false once the writer has closed it
    bool drain(int fd, std::string& out) {
        char buffer[4096];
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            return true;
        }
        return false;
    }

    std::string describeErrno(const std::string& what, int err) {
        return what + ": " + std::strerror(err);
    }

}

Expected<ProcessResult> Process::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        return Error{ErrorCode::InvalidArgs, "process: empty command line"};
    }

    // Everything the child needs is prepared before fork
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    const std::string workingDir = options.workingDir.string();

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};  // child reports exec/chdir errno here; closed on successful exec
    if (::pipe(outPipe) < 0 || ::pipe(errPipe) < 0 || ::pipe(execPipe) < 0) {
        int err = errno;
        for (int* p : {outPipe, errPipe, execPipe}) { closeFd(p[0]); closeFd(p[1]); }
        return Error{ErrorCode::ProcessError, describeErrno("pipe", err)};
    }
    ::fcntl(execPipe[1], F_SETFD, FD_CLOEXEC);

    Logger::instance().debug("exec: " + argv.front() + " (" + std::to_string(argv.size() - 1) + " args)");

    const pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int* p : {outPipe, errPipe, execPipe}) { closeFd(p[0]); closeFd(p[1]); }
        return Error{ErrorCode::ProcessError, describeErrno("fork", err)};
    }

    if (pid == 0) {
        // Child process
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        ::close(execPipe[0]);

        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[1]);
        ::close(errPipe[1]);

        if (!workingDir.empty() && ::chdir(workingDir.c_str()) != 0) {
            int err = errno;
            (void)!::write(execPipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        for (const auto& [key, value] : options.env) {
            ::setenv(key.c_str(), value.c_str(), 1);
        }

        ::execvp(cargv[0], cargv.data());
        int err = errno;
        (void)!::write(execPipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Parent process
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int childErrno = 0;
    ssize_t got;
    do {
        got = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (got < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    ProcessResult result;
    if (got == static_cast<ssize_t>(sizeof(childErrno))) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return Error{ErrorCode::ProcessError, describeErrno("cannot execute " + argv.front(), childErrno)};
    }

    bool outOpen = true;
    bool errOpen = true;
    while (outOpen || errOpen) {
        struct pollfd fds[2];
        nfds_t count = 0;
        if (outOpen) fds[count++] = {outPipe[0], POLLIN, 0};
        if (errOpen) fds[count++] = {errPipe[0], POLLIN, 0};

        int ready = ::poll(fds, count, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            closeFd(outPipe[0]);
            closeFd(errPipe[0]);
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return Error{ErrorCode::ProcessError, describeErrno("poll", err)};
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == outPipe[0]) {
                if (!drain(outPipe[0], result.stdoutText)) { closeFd(outPipe[0]); outOpen = false; }
            } else {
                if (!drain(errPipe[0], result.stderrText)) { closeFd(errPipe[0]); errOpen = false; }
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorCode::ProcessError, describeErrno("waitpid", errno)};
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}

}
