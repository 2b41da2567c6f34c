#pragma once

#include <raslink/datagram.hpp>

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace raslink {

    // UDP socket implementation using BSD sockets
    class UdpSocket : public DatagramSocket {
      private:
        std::atomic<dp::i32> fd_;
        bool bound_;
        dp::u32 current_timeout_ms_;

        static constexpr dp::usize MAX_UDP_SIZE = 65507; // Largest IPv4 UDP payload

        dp::Res<void> ensure_open() {
            if (fd_ >= 0) {
                return dp::result::ok();
            }
            fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("socket: ") + strerror(errno)));
            }
            current_timeout_ms_ = 0;
            echo::trace("udp socket created fd=", fd_.load());
            return dp::result::ok();
        }

        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) {
            if (timeout_ms == current_timeout_ms_) {
                return dp::result::ok();
            }
            struct timeval tv;
            tv.tv_sec = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;
            if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
                echo::error("setsockopt SO_RCVTIMEO failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("failed to set timeout"));
            }
            current_timeout_ms_ = timeout_ms;
            echo::trace("set recv timeout to ", timeout_ms, "ms");
            return dp::result::ok();
        }

      public:
        UdpSocket() : fd_(-1), bound_(false), current_timeout_ms_(0) {}

        ~UdpSocket() override { close(); }

        UdpSocket(const UdpSocket &) = delete;
        UdpSocket &operator=(const UdpSocket &) = delete;

        dp::Res<void> bind(const UdpEndpoint &endpoint) override {
            auto open_res = ensure_open();
            if (open_res.is_err()) {
                return open_res;
            }

            dp::i32 opt = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(endpoint.port);
            if (endpoint.host == "0.0.0.0" || endpoint.host.empty()) {
                addr.sin_addr.s_addr = INADDR_ANY;
            } else if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) <= 0) {
                echo::error("invalid address: ", endpoint.host.c_str());
                return dp::result::err(dp::Error::invalid_argument("invalid address"));
            }

            if (::bind(fd_, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0) {
                echo::error("bind failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("bind: ") + strerror(errno)));
            }

            bound_ = true;
            echo::debug("UdpSocket bound to ", endpoint.to_string());
            return dp::result::ok();
        }

        // Local port after bind (or after the first send picked an ephemeral one)
        dp::u16 local_port() const {
            if (fd_ < 0) {
                return 0;
            }
            struct sockaddr_in addr = {};
            socklen_t len = sizeof(addr);
            if (::getsockname(fd_, reinterpret_cast<struct sockaddr *>(&addr), &len) < 0) {
                return 0;
            }
            return ntohs(addr.sin_port);
        }

        dp::Res<void> send_to(const Message &msg, const UdpEndpoint &dest) override {
            auto open_res = ensure_open();
            if (open_res.is_err()) {
                return open_res;
            }

            if (msg.size() > MAX_UDP_SIZE) {
                echo::warn("message too large: ", msg.size(), " > ", MAX_UDP_SIZE);
                return dp::result::err(dp::Error::invalid_argument(dp::String("message too large: ") +
                                                                   std::to_string(msg.size()).c_str()));
            }

            struct addrinfo hints = {};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_DGRAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(dest.port).c_str());
            dp::i32 ret = ::getaddrinfo(dest.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0) {
                echo::error("getaddrinfo failed for ", dest.host.c_str(), ": ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("resolve: ") + gai_strerror(ret)));
            }

            dp::isize n = ::sendto(fd_, msg.data(), msg.size(), 0, result->ai_addr, result->ai_addrlen);
            ::freeaddrinfo(result);

            if (n < 0) {
                echo::error("sendto failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("sendto: ") + strerror(errno)));
            }

            echo::trace("sent ", n, " bytes to ", dest.to_string());
            return dp::result::ok();
        }

        dp::Res<dp::Pair<Message, UdpEndpoint>> recv_from(dp::u32 timeout_ms) override {
            if (fd_ < 0) {
                return dp::result::err(dp::Error::not_found("socket closed"));
            }

            auto timeout_res = set_recv_timeout(timeout_ms);
            if (timeout_res.is_err()) {
                return dp::result::err(timeout_res.error());
            }

            Message msg(MAX_UDP_SIZE);
            struct sockaddr_in src_addr = {};
            socklen_t src_len = sizeof(src_addr);

            dp::i32 fd = fd_.load();
            dp::isize n;
            do {
                n = ::recvfrom(fd, msg.data(), msg.size(), 0, reinterpret_cast<struct sockaddr *>(&src_addr),
                               &src_len);
            } while (n < 0 && errno == EINTR);

            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    echo::trace("recvfrom timeout after ", timeout_ms, "ms");
                    return dp::result::err(dp::Error::timeout("receive timeout"));
                }
                if (errno == EBADF || errno == ENOTSOCK) {
                    return dp::result::err(dp::Error::not_found("socket closed"));
                }
                echo::error("recvfrom failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("recvfrom: ") + strerror(errno)));
            }

            // close() from another thread wakes a blocked recvfrom with an empty read
            if (fd_.load() < 0) {
                return dp::result::err(dp::Error::not_found("socket closed"));
            }

            msg.resize(static_cast<dp::usize>(n));

            char src_ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &src_addr.sin_addr, src_ip, sizeof(src_ip));
            UdpEndpoint src_endpoint{dp::String(src_ip), ntohs(src_addr.sin_port)};

            echo::trace("recvfrom got ", n, " bytes from ", src_endpoint.to_string());
            return dp::result::ok(dp::Pair<Message, UdpEndpoint>(std::move(msg), src_endpoint));
        }

        void close() override {
            dp::i32 fd = fd_.exchange(-1);
            if (fd >= 0) {
                echo::trace("closing fd=", fd);
                ::shutdown(fd, SHUT_RDWR);
                ::close(fd);
                bound_ = false;
                echo::debug("UdpSocket closed");
            }
        }

        bool is_open() const override { return fd_ >= 0; }
    };

    // Plain sockets on the default route
    class UdpSocketFactory : public DatagramSocketFactory {
      public:
        dp::Res<std::unique_ptr<DatagramSocket>> create() override {
            return dp::result::ok(std::unique_ptr<DatagramSocket>(std::make_unique<UdpSocket>()));
        }
    };

} // namespace raslink
