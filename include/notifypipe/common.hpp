#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <unistd.h>

namespace notifypipe {

    // Payload bytes handed to a transport
    using Message = dp::Vector<dp::u8>;

    inline Message to_message(std::string_view text) { return Message(text.begin(), text.end()); }

    inline std::string to_std_string(const Message &msg) {
        return std::string(reinterpret_cast<const char *>(msg.data()), msg.size());
    }

    inline std::string_view trim(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.remove_prefix(1);
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.remove_suffix(1);
        }
        return s;
    }

    inline bool is_blank(std::string_view s) { return trim(s).empty(); }

    inline std::string to_lower(std::string_view s) {
        std::string out(s);
        for (auto &c : out) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

    // Maps a failed socket call to a categorized error
    // - timeout: EAGAIN/EWOULDBLOCK/ETIMEDOUT (SO_RCVTIMEO, SO_SNDTIMEO or connect deadline)
    // - not_found: peer went away (ECONNRESET, EPIPE, ENOTCONN, ECONNREFUSED)
    // - io_error: everything else
    inline dp::Error socket_error(const char *what, int err) {
        if (err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT) {
            return dp::Error::timeout(dp::String(what) + " timed out");
        }
        if (err == ECONNRESET || err == EPIPE || err == ENOTCONN || err == ECONNREFUSED) {
            return dp::Error::not_found(dp::String(what) + " failed: " + strerror(err));
        }
        return dp::Error::io_error(dp::String(what) + " failed: " + strerror(err));
    }

    // Helper to read up to count bytes from a file descriptor
    // Returns the number of bytes read, 0 on orderly shutdown by the peer
    inline dp::Res<dp::usize> read_some(dp::i32 fd, dp::u8 *buffer, dp::usize count) {
        while (true) {
            dp::isize n = ::read(fd, buffer, count);
            if (n < 0) {
                if (errno == EINTR) {
                    echo::trace("read interrupted by signal, retrying");
                    continue;
                }
                int err = errno;
                echo::trace("read failed: ", strerror(err), " (errno=", err, ", fd=", fd, ")");
                return dp::result::err(socket_error("read", err));
            }
            echo::trace("read ", n, " bytes (fd=", fd, ")");
            return dp::result::ok(static_cast<dp::usize>(n));
        }
    }

    // Helper to write exactly n bytes to a file descriptor
    // Returns dp::Res<void> - ok if all bytes written, error otherwise
    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count) {
        dp::usize total_written = 0;
        while (total_written < count) {
            dp::isize n = ::send(fd, buffer + total_written, count - total_written, MSG_NOSIGNAL);
            if (n < 0) {
                // EINTR: Interrupted by signal - retry transparently
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }
                int err = errno;
                echo::trace("write failed: ", strerror(err), " (errno=", err, ", fd=", fd, ")");
                return dp::result::err(socket_error("write", err));
            }

            total_written += static_cast<dp::usize>(n);
            echo::trace("wrote ", n, " bytes, total=", total_written, "/", count, " (fd=", fd, ")");
        }
        return dp::result::ok();
    }

} // namespace notifypipe
