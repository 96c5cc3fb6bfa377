#include <notifypipe/notifypipe.hpp>

// Print notifications as they arrive, for trying out notify_send.
//   notify_listen <udp|tcp> [port]

static void listen_udp(dp::u16 port) {
    notifypipe::UdpDatagram udp;
    auto res = udp.bind(notifypipe::Endpoint{"0.0.0.0", port});
    if (res.is_err()) {
        echo::error("Bind failed: ", res.error().message.c_str());
        return;
    }

    echo::info("Listening for UDP notifications on ", udp.local_endpoint().to_string().c_str());

    while (true) {
        auto recv_res = udp.recv_from();
        if (recv_res.is_err()) {
            echo::error("Recv failed: ", recv_res.error().message.c_str());
            break;
        }

        auto [msg, src] = std::move(recv_res.value());
        echo::info("Received ", msg.size(), " bytes from ", src.to_string().c_str());
        echo::info(notifypipe::to_std_string(msg).c_str());
    }

    udp.close();
}

static void listen_tcp(dp::u16 port) {
    notifypipe::TcpStream server;
    auto res = server.listen(notifypipe::Endpoint{"0.0.0.0", port});
    if (res.is_err()) {
        echo::error("Failed to listen: ", res.error().message.c_str());
        return;
    }

    echo::info("Listening for TCP notifications on port ", port);

    while (true) {
        auto client_res = server.accept();
        if (client_res.is_err()) {
            echo::error("Failed to accept: ", client_res.error().message.c_str());
            break;
        }

        auto client = std::move(client_res.value());
        client->set_recv_timeout(5000);

        // One notification per connection, delimited by the sender closing
        auto msg_res = client->recv_all();
        if (msg_res.is_err()) {
            echo::error("Recv failed: ", msg_res.error().message.c_str());
            continue;
        }

        echo::info("Received ", msg_res.value().size(), " bytes");
        echo::info(notifypipe::to_std_string(msg_res.value()).c_str());
        client->close();
    }

    server.close();
}

int main(int argc, char **argv) {
    if (argc < 2) {
        echo::info("Usage: ", argv[0], " <udp|tcp> [port]");
        return 1;
    }

    auto protocol = notifypipe::parse_protocol(argv[1]);
    if (protocol.is_err() || protocol.value() == notifypipe::Protocol::Http) {
        echo::error("Listener supports udp and tcp only");
        return 1;
    }

    dp::u16 port = 7447;
    if (argc > 2) {
        auto endpoint = notifypipe::parse_endpoint(std::string("0.0.0.0:") + argv[2]);
        if (endpoint.is_err()) {
            echo::error("Invalid port: ", argv[2]);
            return 1;
        }
        port = endpoint.value().port;
    }

    if (protocol.value() == notifypipe::Protocol::Udp) {
        listen_udp(port);
    } else {
        listen_tcp(port);
    }
    return 0;
}
