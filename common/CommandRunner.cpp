#include "CommandRunner.hpp"

#include <cerrno>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace netwake::common
{
    namespace
    {
        int DecodeStatus(int raw_status)
        {
            if (WIFEXITED(raw_status))
                return WEXITSTATUS(raw_status);
            return -1;
        }

        void KillAndReap(pid_t pid)
        {
            kill(pid, SIGKILL);
            int status = 0;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            {
            }
        }
    }

    CommandResult SystemCommandRunner::Run(const std::vector<std::string> &argv,
                                           std::chrono::milliseconds timeout)
    {
        CommandResult result;
        if (argv.empty())
            return result;

        // Built before fork(): the child may only touch async-signal-safe calls.
        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &arg : argv)
            args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        // Close-on-exec so children forked by other scan threads do not hold
        // this pipe open and delay EOF.
        int fds[2];
#ifdef __linux__
        if (pipe2(fds, O_CLOEXEC) != 0)
            return result;
#else
        if (pipe(fds) != 0)
            return result;
        fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif

        pid_t pid = fork();
        if (pid < 0)
        {
            close(fds[0]);
            close(fds[1]);
            return result;
        }

        if (pid == 0)
        {
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0)
            {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
            dup2(fds[1], STDOUT_FILENO);
            close(fds[0]);
            close(fds[1]);
            execvp(args[0], args.data());
            _exit(127);
        }

        close(fds[1]);
        result.started = true;

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        char buffer[4096];
        bool eof = false;

        while (!eof)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                result.timed_out = true;
                break;
            }

            struct pollfd pfd;
            pfd.fd = fds[0];
            pfd.events = POLLIN;
            pfd.revents = 0;

            int poll_ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (poll_ret < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (poll_ret == 0)
                continue;

            ssize_t bytes = read(fds[0], buffer, sizeof(buffer));
            if (bytes > 0)
                result.output.append(buffer, static_cast<size_t>(bytes));
            else if (bytes == 0)
                eof = true;
            else if (errno != EINTR && errno != EAGAIN)
                break;
        }
        close(fds[0]);

        if (result.timed_out)
        {
            KillAndReap(pid);
            return result;
        }

        // stdout closed; give the child until the deadline to exit.
        while (true)
        {
            int status = 0;
            pid_t done = waitpid(pid, &status, WNOHANG);
            if (done == pid)
            {
                result.exit_code = DecodeStatus(status);
                break;
            }
            if (done < 0 && errno != EINTR)
                break;
            if (std::chrono::steady_clock::now() >= deadline)
            {
                result.timed_out = true;
                KillAndReap(pid);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        return result;
    }
}
