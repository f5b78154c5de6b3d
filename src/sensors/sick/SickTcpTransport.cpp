#include "SickTcpTransport.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

  constexpr size_t kRecvChunk = 4096;

  int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
  }

  bool is_unreachable_errno(int e) {
    return e == ECONNREFUSED || e == ENETUNREACH || e == EHOSTUNREACH ||
           e == EADDRNOTAVAIL || e == ECONNRESET || e == ENETDOWN || e == EHOSTDOWN;
  }

}

SickTcpTransport::SickTcpTransport() = default;

SickTcpTransport::~SickTcpTransport() {
    close();
}

std::string SickTcpTransport::lastError() const {
    std::lock_guard<std::mutex> lk(err_mu_);
    return last_error_;
}

TransportError SickTcpTransport::fail(TransportError e, const std::string& why) {
    {
        std::lock_guard<std::mutex> lk(err_mu_);
        last_error_ = why;
    }
    if (e != TransportError::Cancelled) {
        state_ = ConnectionState::Failed;
    }
    return e;
}

void SickTcpTransport::cancel() {
    cancelled_ = true;
}

void SickTcpTransport::close() {
    closeSocket();
    state_ = ConnectionState::Disconnected;
}

void SickTcpTransport::closeSocket() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    rx_.clear();
    in_frame_ = false;
}

TransportError SickTcpTransport::connect(const SensorConfig& cfg) {
    closeSocket();
    cfg_ = cfg;
    state_ = ConnectionState::Connecting;

    if (cancelled_) return fail(TransportError::Cancelled, "cancelled");

    std::cout << "[SickTcpTransport] connecting " << cfg_.host << ":" << cfg_.port << std::endl;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const std::string port_str = std::to_string(cfg_.port);
    const int gai = ::getaddrinfo(cfg_.host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        return fail(TransportError::Unreachable,
                    std::string("resolve ") + cfg_.host + ": " + ::gai_strerror(gai));
    }
    sockaddr_in addr{};
    std::memcpy(&addr, res->ai_addr, std::min<size_t>(sizeof(addr), res->ai_addrlen));
    ::freeaddrinfo(res);

    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
        return fail(TransportError::Unreachable, std::string("socket: ") + std::strerror(errno));
    }
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        const std::string why = std::string("fcntl: ") + std::strerror(errno);
        closeSocket();
        return fail(TransportError::Unreachable, why);
    }

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            const int e = errno;
            closeSocket();
            return fail(is_unreachable_errno(e) ? TransportError::Unreachable : TransportError::Timeout,
                        std::string("connect: ") + std::strerror(e));
        }

        // Poll in short slices so cancel() is honoured during a long timeout.
        const auto deadline = clock_mono::now() + std::chrono::milliseconds(cfg_.connect_timeout_ms);
        for (;;) {
            if (cancelled_) {
                closeSocket();
                return fail(TransportError::Cancelled, "cancelled");
            }
            const int left = remaining_ms(deadline);
            if (left == 0) {
                closeSocket();
                return fail(TransportError::Timeout,
                            "connect timed out after " + std::to_string(cfg_.connect_timeout_ms) + " ms");
            }
            pollfd pfd{fd_, POLLOUT, 0};
            const int pr = ::poll(&pfd, 1, std::min(left, cfg_.poll_interval_ms));
            if (pr < 0) {
                if (errno == EINTR) continue;
                const int e = errno;
                closeSocket();
                return fail(TransportError::Unreachable, std::string("poll: ") + std::strerror(e));
            }
            if (pr == 0) continue;

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) so_error = errno;
            if (so_error != 0) {
                closeSocket();
                return fail(is_unreachable_errno(so_error) ? TransportError::Unreachable : TransportError::Timeout,
                            std::string("connect: ") + std::strerror(so_error));
            }
            break;
        }
    }

    if (cfg_.subscribe) {
        const TransportError e = sendTelegram("sEN LMDscandata 1");
        if (e != TransportError::Ok) {
            closeSocket();
            return e;
        }
    }

    state_ = ConnectionState::Connected;
    std::cout << "[SickTcpTransport] connected " << cfg_.host << ":" << cfg_.port << std::endl;
    return TransportError::Ok;
}

TransportError SickTcpTransport::sendTelegram(const std::string& body) {
    std::string wire;
    wire.reserve(body.size() + 2);
    wire.push_back(STX);
    wire += body;
    wire.push_back(ETX);

    size_t sent = 0;
    const auto deadline = clock_mono::now() + std::chrono::milliseconds(cfg_.connect_timeout_ms);
    while (sent < wire.size()) {
        if (cancelled_) return fail(TransportError::Cancelled, "cancelled");
        const ssize_t n = ::send(fd_, wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            const int left = remaining_ms(deadline);
            if (left == 0) return fail(TransportError::Timeout, "send timed out");
            pollfd pfd{fd_, POLLOUT, 0};
            ::poll(&pfd, 1, std::min(left, cfg_.poll_interval_ms));
            continue;
        }
        return fail(TransportError::Closed, std::string("send: ") + std::strerror(errno));
    }
    return TransportError::Ok;
}

bool SickTcpTransport::extractFrame(RawFrame& out) {
    if (!in_frame_) {
        const auto stx = rx_.find(STX);
        if (stx == std::string::npos) {
            rx_.clear(); // nothing but inter-frame noise
            return false;
        }
        rx_.erase(0, stx + 1);
        in_frame_ = true;
    }
    const auto etx = rx_.find(ETX);
    if (etx == std::string::npos) return false;

    out.payload.assign(rx_, 0, etx);
    out.monotonic_ts_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                            clock_mono::now().time_since_epoch()).count();
    rx_.erase(0, etx + 1);
    in_frame_ = false;
    return true;
}

TransportError SickTcpTransport::readFrame(RawFrame& out) {
    if (fd_ < 0) return fail(TransportError::Closed, "not connected");

    const auto deadline = clock_mono::now() + std::chrono::milliseconds(cfg_.read_timeout_ms);
    char buf[kRecvChunk];

    for (;;) {
        if (cancelled_) return fail(TransportError::Cancelled, "cancelled");

        if (extractFrame(out)) return TransportError::Ok;
        if (in_frame_ && rx_.size() > static_cast<size_t>(cfg_.max_frame_bytes)) {
            const size_t dropped = rx_.size();
            rx_.clear();
            in_frame_ = false;
            return fail(TransportError::Overflow,
                        "telegram exceeds " + std::to_string(cfg_.max_frame_bytes) +
                        " bytes (" + std::to_string(dropped) + " buffered)");
        }

        const int left = remaining_ms(deadline);
        if (left == 0) {
            return fail(TransportError::Timeout,
                        "no telegram within " + std::to_string(cfg_.read_timeout_ms) + " ms");
        }

        pollfd pfd{fd_, POLLIN, 0};
        const int pr = ::poll(&pfd, 1, std::min(left, cfg_.poll_interval_ms));
        if (pr < 0) {
            if (errno == EINTR) continue;
            return fail(TransportError::Closed, std::string("poll: ") + std::strerror(errno));
        }
        if (pr == 0) continue;

        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) return fail(TransportError::Closed, "peer closed connection");
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return fail(TransportError::Closed, std::string("recv: ") + std::strerror(errno));
        }
        rx_.append(buf, static_cast<size_t>(n));
    }
}
