#pragma once

#include <notifypipe/endpoint.hpp>
#include <notifypipe/request.hpp>

#include <memory>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace notifypipe {

    // TCP stream using BSD sockets
    // Reliable, ordered, connection-oriented byte pipe. Bytes go out raw, no framing.
    class TcpStream {
      private:
        dp::i32 fd_;
        bool connected_;
        bool listening_;
        Endpoint remote_endpoint_;

        static constexpr dp::usize RECV_CHUNK = 4096;

        // Private constructor for accepted connections
        TcpStream(dp::i32 fd, const Endpoint &remote)
            : fd_(fd), connected_(true), listening_(false), remote_endpoint_(remote) {
            echo::debug("TcpStream created from accepted connection fd=", fd);
        }

        dp::Res<void> set_timeout_option(int option, dp::u32 timeout_ms) {
            if (fd_ < 0) {
                echo::error("set timeout called but socket not created");
                return dp::result::err(dp::Error::invalid_argument("socket not created"));
            }

            struct timeval tv;
            tv.tv_sec = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;

            if (::setsockopt(fd_, SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
                int err = errno;
                echo::error("setsockopt timeout failed: ", strerror(err));
                return dp::result::err(socket_error("setsockopt", err));
            }
            return dp::result::ok();
        }

        // Connect with a deadline: non-blocking connect, wait for writability, then back to blocking
        dp::Res<void> connect_with_timeout(const struct sockaddr *addr, socklen_t len, dp::u32 timeout_ms) {
            if (timeout_ms == 0) {
                if (::connect(fd_, addr, len) < 0) {
                    return dp::result::err(socket_error("connect", errno));
                }
                return dp::result::ok();
            }

            dp::i32 flags = ::fcntl(fd_, F_GETFL, 0);
            if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
                return dp::result::err(socket_error("fcntl", errno));
            }

            if (::connect(fd_, addr, len) < 0) {
                if (errno != EINPROGRESS) {
                    return dp::result::err(socket_error("connect", errno));
                }

                struct pollfd pfd = {};
                pfd.fd = fd_;
                pfd.events = POLLOUT;
                dp::i32 ready;
                do {
                    ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
                } while (ready < 0 && errno == EINTR);

                if (ready < 0) {
                    return dp::result::err(socket_error("poll", errno));
                }
                if (ready == 0) {
                    return dp::result::err(socket_error("connect", ETIMEDOUT));
                }

                dp::i32 so_error = 0;
                socklen_t so_len = sizeof(so_error);
                if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
                    return dp::result::err(socket_error("getsockopt", errno));
                }
                if (so_error != 0) {
                    return dp::result::err(socket_error("connect", so_error));
                }
            }

            if (::fcntl(fd_, F_SETFL, flags) < 0) {
                return dp::result::err(socket_error("fcntl", errno));
            }
            return dp::result::ok();
        }

      public:
        TcpStream() : fd_(-1), connected_(false), listening_(false) { echo::trace("TcpStream constructed"); }

        ~TcpStream() {
            if (fd_ >= 0) {
                close();
            }
        }

        TcpStream(const TcpStream &) = delete;
        TcpStream &operator=(const TcpStream &) = delete;

        // Client side: connect to remote endpoint
        // timeout_ms bounds the connect and becomes the socket's read/write timeout, 0 means none
        dp::Res<void> connect(const Endpoint &endpoint, dp::u32 timeout_ms = 0) {
            echo::trace("connecting to ", endpoint.to_string(), " timeout=", timeout_ms, "ms");

            struct addrinfo hints = {};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_STREAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(endpoint.port).c_str());
            dp::i32 ret = ::getaddrinfo(endpoint.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0) {
                echo::error("getaddrinfo failed: ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("cannot resolve ") + endpoint.host.c_str() +
                                                           ": " + gai_strerror(ret)));
            }

            fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd_ < 0) {
                int err = errno;
                ::freeaddrinfo(result);
                echo::error("socket creation failed: ", strerror(err));
                return dp::result::err(socket_error("socket", err));
            }
            echo::trace("socket created fd=", fd_);

            if (timeout_ms > 0) {
                auto res = set_timeout_option(SO_RCVTIMEO, timeout_ms);
                if (res.is_ok()) {
                    res = set_timeout_option(SO_SNDTIMEO, timeout_ms);
                }
                if (res.is_err()) {
                    ::freeaddrinfo(result);
                    close();
                    return res;
                }
            }

            auto res = connect_with_timeout(result->ai_addr, result->ai_addrlen, timeout_ms);
            ::freeaddrinfo(result);

            if (res.is_err()) {
                close();
                echo::error("connect to ", endpoint.to_string(), " failed: ", res.error().message.c_str());
                return res;
            }

            connected_ = true;
            remote_endpoint_ = endpoint;
            echo::debug("connected to ", endpoint.to_string());

            return dp::result::ok();
        }

        // Server side: bind and listen
        dp::Res<void> listen(const Endpoint &endpoint) {
            echo::trace("listening on ", endpoint.to_string());

            fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd_ < 0) {
                int err = errno;
                echo::error("socket creation failed: ", strerror(err));
                return dp::result::err(socket_error("socket", err));
            }

            // Set SO_REUSEADDR to avoid "address already in use" errors
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
                    close();
                    echo::error("invalid address: ", endpoint.host.c_str());
                    return dp::result::err(dp::Error::invalid_argument("invalid address"));
                }
            }

            if (::bind(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                int err = errno;
                close();
                echo::error("bind failed: ", strerror(err));
                return dp::result::err(socket_error("bind", err));
            }

            if (::listen(fd_, SOMAXCONN) < 0) {
                int err = errno;
                close();
                echo::error("listen failed: ", strerror(err));
                return dp::result::err(socket_error("listen", err));
            }

            listening_ = true;
            echo::debug("TcpStream listening on ", endpoint.to_string());

            return dp::result::ok();
        }

        // Server side: accept incoming connection
        dp::Res<std::unique_ptr<TcpStream>> accept() {
            if (!listening_) {
                echo::error("accept called but not listening");
                return dp::result::err(dp::Error::invalid_argument("not listening"));
            }

            struct sockaddr_in client_addr = {};
            socklen_t client_len = sizeof(client_addr);

            dp::i32 client_fd = ::accept(fd_, (struct sockaddr *)&client_addr, &client_len);
            if (client_fd < 0) {
                int err = errno;
                echo::error("accept failed: ", strerror(err));
                return dp::result::err(socket_error("accept", err));
            }

            char client_ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, sizeof(client_ip));
            Endpoint client_endpoint{dp::String(client_ip), ntohs(client_addr.sin_port)};

            echo::debug("accepted connection from ", client_endpoint.to_string(), " fd=", client_fd);

            return dp::result::ok(std::unique_ptr<TcpStream>(new TcpStream(client_fd, client_endpoint)));
        }

        // Write the whole message, unframed
        dp::Res<void> send(const Message &msg) {
            if (!connected_) {
                echo::error("send called but not connected");
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            if (!msg.empty()) {
                auto res = write_exact(fd_, msg.data(), msg.size());
                if (res.is_err()) {
                    connected_ = false;
                    echo::error("send payload failed: ", res.error().message.c_str());
                    return res;
                }
            }

            echo::debug("sent ", msg.size(), " bytes to ", remote_endpoint_.to_string());
            return dp::result::ok();
        }

        // Receive whatever is available, blocking for at least one byte
        // An empty message means the peer closed the connection
        dp::Res<Message> recv() {
            if (!connected_) {
                echo::error("recv called but not connected");
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            Message chunk(RECV_CHUNK);
            auto res = read_some(fd_, chunk.data(), chunk.size());
            if (res.is_err()) {
                connected_ = false;
                return dp::result::err(res.error());
            }
            chunk.resize(res.value());
            if (chunk.empty()) {
                connected_ = false;
                echo::trace("peer closed connection");
            }
            return dp::result::ok(std::move(chunk));
        }

        // Receive until the peer closes its side
        dp::Res<Message> recv_all() {
            Message all;
            while (true) {
                auto res = recv();
                if (res.is_err()) {
                    return res;
                }
                if (res.value().empty()) {
                    break;
                }
                all.insert(all.end(), res.value().begin(), res.value().end());
            }
            echo::debug("received ", all.size(), " bytes until close");
            return dp::result::ok(std::move(all));
        }

        // Set receive timeout in milliseconds
        // 0 means no timeout (blocking forever)
        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) { return set_timeout_option(SO_RCVTIMEO, timeout_ms); }

        // Close the connection
        void close() {
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                connected_ = false;
                listening_ = false;
                echo::trace("TcpStream closed");
            }
        }

        bool is_connected() const { return connected_; }
    };

    // Stream transport: fresh connection per call, timeout on connect and socket I/O,
    // the whole payload written raw, then closed. No retry.
    inline dp::Res<void> send_tcp(const SendRequest &request) {
        auto endpoint = parse_endpoint(request.destination.c_str());
        if (endpoint.is_err()) {
            return dp::result::err(endpoint.error());
        }

        TcpStream stream;
        auto res = stream.connect(endpoint.value(), request.timeout_ms);
        if (res.is_err()) {
            return res;
        }

        res = stream.send(request.payload);
        if (res.is_err()) {
            echo::error("tcp notification to ", endpoint.value().to_string(), " failed: ", res.error().message.c_str());
            return res;
        }

        stream.close();
        return dp::result::ok();
    }

} // namespace notifypipe
