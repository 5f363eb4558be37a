/**
 * @file TcpSocket.cpp
 * @brief POSIX TCP helpers implementation
 */

#include "stork/TcpSocket.h"
#include "stork/config.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>

namespace Stork {

namespace {

std::string errnoString(const char* what, int err) {
    return std::string(what) + " failed: " + std::strerror(err);
}

bool resolveIpv4(const std::string& host, uint16_t port, sockaddr_in& addr, std::string& errorMsg) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || !result) {
        errorMsg = "Cannot resolve host '" + host + "': " + gai_strerror(rc);
        return false;
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

bool setNonBlocking(int fd, bool enabled) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    const int updated = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, updated) == 0;
}

}  // namespace

//=============================================================================
// Endpoint / ScopedSocket
//=============================================================================

bool Endpoint::parse(const std::string& text, Endpoint& out, std::string& errorMsg) {
    const size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        errorMsg = "Expected host:port, got '" + text + "'";
        return false;
    }

    const std::string portText = text.substr(colon + 1);
    if (portText.size() > 5 ||
        portText.find_first_not_of("0123456789") != std::string::npos) {
        errorMsg = "Invalid port in '" + text + "'";
        return false;
    }
    const unsigned long port = std::stoul(portText);
    if (port == 0 || port > 65535) {
        errorMsg = "Port out of range in '" + text + "'";
        return false;
    }

    out.host = text.substr(0, colon);
    out.port = static_cast<uint16_t>(port);
    return true;
}

void ScopedSocket::reset(int fd) {
    if (m_fd != INVALID_SOCKET_FD) {
        ::close(m_fd);
    }
    m_fd = fd;
}

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        std::signal(SIGPIPE, SIG_IGN);
    });
}

//=============================================================================
// Connect / Listen
//=============================================================================

bool connectWithTimeout(const Endpoint& endpoint,
                        uint32_t timeoutMs,
                        const std::atomic<bool>* abortFlag,
                        ScopedSocket& out,
                        std::string& errorMsg)
{
    ignoreSigpipe();

    sockaddr_in addr{};
    if (!resolveIpv4(endpoint.host, endpoint.port, addr, errorMsg)) {
        return false;
    }

    ScopedSocket sock(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (!sock.valid()) {
        errorMsg = errnoString("socket()", errno);
        return false;
    }

    if (!setNonBlocking(sock.get(), true)) {
        errorMsg = errnoString("fcntl(O_NONBLOCK)", errno);
        return false;
    }

    int rc = ::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc != 0 && errno != EINPROGRESS) {
        errorMsg = "connect() to " + endpoint.toString() + " failed: " + std::strerror(errno);
        return false;
    }

    if (rc != 0) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (true) {
            if (abortFlag && abortFlag->load()) {
                errorMsg = "connect() to " + endpoint.toString() + " aborted";
                return false;
            }

            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                errorMsg = "connect() to " + endpoint.toString() + " timed out";
                return false;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            const int slice = static_cast<int>(std::min<int64_t>(remaining.count(), POLL_SLICE_MS));

            pollfd pfd{};
            pfd.fd = sock.get();
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, slice);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                errorMsg = errnoString("poll()", errno);
                return false;
            }
            if (rc > 0) {
                break;
            }
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
            errorMsg = "connect() to " + endpoint.toString() + " failed: " +
                       std::strerror(soError != 0 ? soError : errno);
            return false;
        }
    }

    if (!setNonBlocking(sock.get(), false)) {
        errorMsg = errnoString("fcntl(blocking)", errno);
        return false;
    }

    tuneSocket(sock.get());
    out = std::move(sock);
    return true;
}

bool listenTcp(const std::string& bindHost,
               uint16_t port,
               ScopedSocket& out,
               uint16_t& boundPort,
               std::string& errorMsg)
{
    ignoreSigpipe();

    sockaddr_in addr{};
    if (!resolveIpv4(bindHost, port, addr, errorMsg)) {
        return false;
    }

    ScopedSocket sock(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (!sock.valid()) {
        errorMsg = errnoString("socket()", errno);
        return false;
    }

    int one = 1;
    (void)setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        errorMsg = "bind() to " + bindHost + ":" + std::to_string(port) + " failed: " +
                   std::strerror(errno);
        return false;
    }

    if (::listen(sock.get(), LISTEN_BACKLOG) != 0) {
        errorMsg = errnoString("listen()", errno);
        return false;
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&bound), &boundLen) != 0) {
        errorMsg = errnoString("getsockname()", errno);
        return false;
    }

    boundPort = ntohs(bound.sin_port);
    out = std::move(sock);
    return true;
}

//=============================================================================
// Exact I/O
//=============================================================================

bool sendExact(int socket, const uint8_t* data, size_t size, std::string& errorMsg)
{
    if (!data || size == 0) {
        return true;  // Nothing to send
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        const ssize_t sent = ::send(socket, data + totalSent, size - totalSent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = errnoString("send()", errno);
            return false;
        }
        if (sent == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        totalSent += static_cast<size_t>(sent);
    }
    return true;
}

bool recvExact(int socket, uint8_t* buffer, size_t size, std::string& errorMsg)
{
    if (!buffer || size == 0) {
        return true;  // Nothing to receive
    }

    size_t totalReceived = 0;
    while (totalReceived < size) {
        const ssize_t received = ::recv(socket, buffer + totalReceived, size - totalReceived, 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                errorMsg = "Receive timeout - peer not responding";
            } else {
                errorMsg = errnoString("recv()", errno);
            }
            return false;
        }
        if (received == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        totalReceived += static_cast<size_t>(received);
    }
    return true;
}

bool setSocketRecvTimeout(int socket, uint32_t timeoutMs) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    return setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

void tuneSocket(int socket) {
    int one = 1;
    (void)setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    const int buf = 4 * 1024 * 1024;
    (void)setsockopt(socket, SOL_SOCKET, SO_SNDBUF, &buf, sizeof(buf));
    (void)setsockopt(socket, SOL_SOCKET, SO_RCVBUF, &buf, sizeof(buf));
}

void shutdownSocket(int socket) {
    if (socket != INVALID_SOCKET_FD) {
        (void)::shutdown(socket, SHUT_RDWR);
    }
}

//=============================================================================
// Line framing
//=============================================================================

bool sendLine(int socket, const std::string& line, std::string& errorMsg) {
    std::string framed = line;
    framed.push_back('\n');
    return sendExact(socket, reinterpret_cast<const uint8_t*>(framed.data()), framed.size(), errorMsg);
}

bool LineReader::readLine(std::string& line, std::string& errorMsg) {
    while (true) {
        const size_t newline = m_buffer.find('\n');
        if (newline != std::string::npos) {
            line = m_buffer.substr(0, newline);
            m_buffer.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (m_buffer.size() > MAX_LINE_LENGTH) {
            errorMsg = "Line exceeds maximum length";
            return false;
        }

        char chunk[4096];
        const ssize_t received = ::recv(m_socket, chunk, sizeof(chunk), 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                errorMsg = "Receive timeout - peer not responding";
            } else {
                errorMsg = errnoString("recv()", errno);
            }
            return false;
        }
        if (received == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        m_buffer.append(chunk, static_cast<size_t>(received));
    }
}

std::vector<uint8_t> LineReader::takeBuffered() {
    std::vector<uint8_t> out(m_buffer.begin(), m_buffer.end());
    m_buffer.clear();
    return out;
}

//=============================================================================
// Local addresses
//=============================================================================

std::vector<std::string> enumerateLocalAddresses() {
    std::vector<std::string> addresses;
    ifaddrs* list = nullptr;
    if (getifaddrs(&list) == 0) {
        for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
            if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if ((it->ifa_flags & IFF_UP) == 0) {
                continue;
            }
            if ((it->ifa_flags & IFF_LOOPBACK) != 0) {
                continue;
            }

            char ip[INET_ADDRSTRLEN] = {};
            const auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
            if (inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip)) != nullptr) {
                addresses.emplace_back(ip);
            }
        }
        freeifaddrs(list);
    }

    addresses.emplace_back("127.0.0.1");
    return addresses;
}

}  // namespace Stork
