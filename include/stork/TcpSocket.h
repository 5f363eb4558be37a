/**
 * @file TcpSocket.h
 * @brief POSIX TCP helpers: RAII sockets, exact I/O, timeouts, line framing
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Stork {

/// Sentinel for "no socket"
constexpr int INVALID_SOCKET_FD = -1;

/**
 * @brief Host and port pair, printed as "host:port"
 */
struct Endpoint {
    std::string host;
    uint16_t port = 0;

    std::string toString() const { return host + ":" + std::to_string(port); }

    /**
     * @brief Parse "host:port"
     */
    static bool parse(const std::string& text, Endpoint& out, std::string& errorMsg);

    bool operator==(const Endpoint& other) const {
        return host == other.host && port == other.port;
    }
};

/**
 * @class ScopedSocket
 * @brief Owns a socket file descriptor and closes it on destruction
 */
class ScopedSocket {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(int fd) : m_fd(fd) {}
    ~ScopedSocket() { reset(); }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    ScopedSocket(ScopedSocket&& other) noexcept : m_fd(other.release()) {}
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return m_fd; }
    bool valid() const { return m_fd != INVALID_SOCKET_FD; }

    /// Give up ownership without closing
    int release() {
        const int fd = m_fd;
        m_fd = INVALID_SOCKET_FD;
        return fd;
    }

    /// Close the current descriptor (if any) and take @p fd
    void reset(int fd = INVALID_SOCKET_FD);

private:
    int m_fd = INVALID_SOCKET_FD;
};

/**
 * @brief Ignore SIGPIPE process-wide (idempotent)
 *
 * Writes on a socket whose peer vanished must surface as EPIPE, not kill the
 * process. Called by every code path that creates sockets.
 */
void ignoreSigpipe();

/**
 * @brief Connect to host:port with a timeout
 * @param endpoint Numeric IPv4 address or resolvable host name
 * @param timeoutMs Connect timeout
 * @param abortFlag Optional flag polled every POLL_SLICE_MS; set to abort
 * @param out Connected blocking socket
 * @param errorMsg Output error message
 */
bool connectWithTimeout(const Endpoint& endpoint,
                        uint32_t timeoutMs,
                        const std::atomic<bool>* abortFlag,
                        ScopedSocket& out,
                        std::string& errorMsg);

/**
 * @brief Create a listening TCP socket
 * @param bindHost Address to bind ("0.0.0.0", "127.0.0.1", ...)
 * @param port Port, or 0 for an ephemeral port
 * @param out Listening socket
 * @param boundPort Port actually bound (read back via getsockname)
 */
bool listenTcp(const std::string& bindHost,
               uint16_t port,
               ScopedSocket& out,
               uint16_t& boundPort,
               std::string& errorMsg);

/**
 * @brief Send exactly N bytes (handles partial sends)
 */
bool sendExact(int socket, const uint8_t* data, size_t size, std::string& errorMsg);

/**
 * @brief Receive exactly N bytes (handles partial receives)
 *
 * Fails with "Connection closed by peer" on orderly EOF.
 */
bool recvExact(int socket, uint8_t* buffer, size_t size, std::string& errorMsg);

/**
 * @brief Set SO_RCVTIMEO (0 = block forever)
 */
bool setSocketRecvTimeout(int socket, uint32_t timeoutMs);

/**
 * @brief Enable TCP_NODELAY and generous buffers
 */
void tuneSocket(int socket);

/**
 * @brief shutdown(SHUT_RDWR); wakes any thread blocked on the socket
 */
void shutdownSocket(int socket);

/**
 * @brief Send @p line followed by '\n'
 */
bool sendLine(int socket, const std::string& line, std::string& errorMsg);

/**
 * @class LineReader
 * @brief Buffered reader for newline-delimited protocols
 *
 * Used for the mailbox JSON-lines protocol and the relay handshake line.
 * Reads at most MAX_LINE_LENGTH bytes per line.
 */
class LineReader {
public:
    explicit LineReader(int socket) : m_socket(socket) {}

    /**
     * @brief Read one line without its terminator
     * @return false on EOF, error or an over-long line
     */
    bool readLine(std::string& line, std::string& errorMsg);

    /**
     * @brief Bytes read past the last returned line
     *
     * After a handshake line, a relay connection switches to raw bytes; any
     * bytes already buffered belong to the raw stream.
     */
    std::vector<uint8_t> takeBuffered();

private:
    int m_socket;
    std::string m_buffer;
};

/**
 * @brief IPv4 addresses of all up interfaces, non-loopback first
 *
 * Loopback is always included last so two peers on one host still connect.
 */
std::vector<std::string> enumerateLocalAddresses();

}  // namespace Stork
