#include "HostCheck.hpp"
#include "../common/Debug.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace netwake::discovery
{
    bool TcpConnect(const std::string &ip, int port, std::chrono::milliseconds timeout)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return false;

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            return false;

        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        {
            close(fd);
            return false;
        }

        bool connected = false;
        int rc = connect(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr));
        if (rc == 0)
        {
            connected = true;
        }
        else if (errno == EINPROGRESS)
        {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            int poll_ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (poll_ret > 0)
            {
                int err = 0;
                socklen_t len = sizeof(err);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0)
                    connected = true;
            }
        }

        close(fd);
        return connected;
    }

    SystemHostCheck::SystemHostCheck(std::shared_ptr<common::CommandRunner> runner,
                                     std::chrono::seconds pingTimeout,
                                     std::chrono::milliseconds processTimeout)
        : m_runner(std::move(runner)), m_pingTimeout(pingTimeout), m_processTimeout(processTimeout)
    {
    }

    bool SystemHostCheck::Ping(const std::string &ip)
    {
        if (!m_runner)
            return false;

#ifdef _WIN32
        std::vector<std::string> cmd = {"ping", "-n", "1", "-w",
                                        std::to_string(m_pingTimeout.count() * 1000), ip};
#else
        std::vector<std::string> cmd = {"ping", "-c", "1", "-W",
                                        std::to_string(m_pingTimeout.count()), ip};
#endif
        try
        {
            return m_runner->Run(cmd, m_processTimeout).Succeeded();
        }
        catch (const std::exception &e)
        {
            if (common::DebugEnabled())
                std::cerr << "[Ping] ping " << ip << " failed: " << e.what() << "\n";
            return false;
        }
    }

    bool SystemHostCheck::IsPortOpen(const std::string &ip, int port, std::chrono::milliseconds timeout)
    {
        return TcpConnect(ip, port, timeout);
    }
}
