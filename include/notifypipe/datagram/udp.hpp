#pragma once

#include <notifypipe/endpoint.hpp>
#include <notifypipe/request.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace notifypipe {

    // UDP datagram socket using BSD sockets
    // Unreliable, unordered, connectionless transport
    // Message boundaries preserved - no framing needed
    class UdpDatagram {
      private:
        dp::i32 fd_;
        bool bound_;
        Endpoint local_endpoint_;

      public:
        static constexpr dp::usize MAX_UDP_SIZE = 65507; // IPv4 limit: 65535 - 8 (UDP) - 20 (IP)

        UdpDatagram() : fd_(-1), bound_(false) { echo::trace("UdpDatagram constructed"); }

        ~UdpDatagram() {
            if (fd_ >= 0) {
                close();
            }
        }

        UdpDatagram(const UdpDatagram &) = delete;
        UdpDatagram &operator=(const UdpDatagram &) = delete;

        const Endpoint &local_endpoint() const { return local_endpoint_; }

        // Bind to local address for receiving
        dp::Res<void> bind(const Endpoint &endpoint) {
            echo::trace("binding to ", endpoint.to_string());

            fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
            if (fd_ < 0) {
                int err = errno;
                echo::error("socket creation failed: ", strerror(err));
                return dp::result::err(socket_error("socket", err));
            }
            echo::trace("udp socket created fd=", fd_);

            dp::i32 opt = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(endpoint.port);

            if (endpoint.host == "0.0.0.0" || endpoint.host.empty()) {
                addr.sin_addr.s_addr = INADDR_ANY;
            } else {
                if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) <= 0) {
                    ::close(fd_);
                    fd_ = -1;
                    echo::error("invalid address: ", endpoint.host.c_str());
                    return dp::result::err(dp::Error::invalid_argument("invalid address"));
                }
            }

            if (::bind(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                int err = errno;
                ::close(fd_);
                fd_ = -1;
                echo::error("bind failed: ", strerror(err));
                return dp::result::err(socket_error("bind", err));
            }

            bound_ = true;
            local_endpoint_ = endpoint;
            echo::debug("UdpDatagram bound to ", endpoint.to_string());

            return dp::result::ok();
        }

        // Send one datagram carrying the whole message
        dp::Res<void> send_to(const Message &msg, const Endpoint &dest) {
            // Oversized payloads are rejected before touching the network
            if (msg.size() > MAX_UDP_SIZE) {
                echo::warn("message too large: ", msg.size(), " > ", MAX_UDP_SIZE);
                return dp::result::err(dp::Error::invalid_argument(dp::String("message too large: ") +
                                                                   std::to_string(msg.size()).c_str()));
            }

            if (fd_ < 0) {
                fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
                if (fd_ < 0) {
                    int err = errno;
                    echo::error("socket creation failed: ", strerror(err));
                    return dp::result::err(socket_error("socket", err));
                }
                echo::trace("udp socket created fd=", fd_);
            }

            echo::trace("sendto ", dest.to_string(), " len=", msg.size());

            struct addrinfo hints = {};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_DGRAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(dest.port).c_str());
            dp::i32 ret = ::getaddrinfo(dest.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0) {
                echo::error("getaddrinfo failed: ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("cannot resolve ") + dest.host.c_str() + ": " +
                                                           gai_strerror(ret)));
            }

            dp::isize n = ::sendto(fd_, msg.data(), msg.size(), 0, result->ai_addr, result->ai_addrlen);
            int err = errno;
            ::freeaddrinfo(result);

            if (n < 0) {
                echo::error("sendto failed: ", strerror(err));
                return dp::result::err(socket_error("sendto", err));
            }

            echo::debug("sent ", n, " bytes to ", dest.to_string());
            return dp::result::ok();
        }

        // Receive one datagram
        dp::Res<dp::Pair<Message, Endpoint>> recv_from() {
            if (!bound_) {
                echo::error("recv_from called but not bound");
                return dp::result::err(dp::Error::invalid_argument("not bound"));
            }

            Message msg(MAX_UDP_SIZE);
            struct sockaddr_in src_addr = {};
            socklen_t src_len = sizeof(src_addr);

            dp::isize n = ::recvfrom(fd_, msg.data(), msg.size(), 0, (struct sockaddr *)&src_addr, &src_len);
            if (n < 0) {
                int err = errno;
                echo::error("recvfrom failed: ", strerror(err));
                return dp::result::err(socket_error("recvfrom", err));
            }

            msg.resize(static_cast<dp::usize>(n));

            char src_ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &src_addr.sin_addr, src_ip, sizeof(src_ip));
            Endpoint src_endpoint{dp::String(src_ip), ntohs(src_addr.sin_port)};

            echo::debug("received ", n, " bytes from ", src_endpoint.to_string());
            return dp::result::ok(dp::Pair<Message, Endpoint>(std::move(msg), src_endpoint));
        }

        // Set receive timeout in milliseconds, 0 blocks forever
        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) {
            if (fd_ < 0) {
                return dp::result::err(dp::Error::invalid_argument("socket not created"));
            }
            struct timeval tv;
            tv.tv_sec = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;
            if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
                int err = errno;
                echo::error("setsockopt SO_RCVTIMEO failed: ", strerror(err));
                return dp::result::err(socket_error("setsockopt", err));
            }
            return dp::result::ok();
        }

        void close() {
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                bound_ = false;
                echo::trace("UdpDatagram closed");
            }
        }
    };

    // Datagram transport: fire-and-forget, one packet per call, a fresh socket each time.
    // The request timeout is not used.
    inline dp::Res<void> send_udp(const SendRequest &request) {
        auto endpoint = parse_endpoint(request.destination.c_str());
        if (endpoint.is_err()) {
            return dp::result::err(endpoint.error());
        }

        UdpDatagram socket;
        auto res = socket.send_to(request.payload, endpoint.value());
        if (res.is_err()) {
            echo::error("udp notification to ", endpoint.value().to_string(), " failed: ", res.error().message.c_str());
        }
        return res;
    }

} // namespace notifypipe
