#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "uplink/server/config.hpp"
#include "uplink/server/filesystem.hpp"
#include "uplink/server/transfer_registry.hpp"

namespace uplink::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        /// Blocks until stop() is called or SIGINT/SIGTERM arrives.
        void run();

        /// Safe to call from any thread.
        void stop();

        /// Port actually bound; differs from the configured one when that was 0.
        std::uint16_t port() const;

        TransferRegistry &transfer_registry() { return transfer_registry_; }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        Filesystem filesystem_;
        TransferRegistry transfer_registry_;

        std::vector<std::thread> workers_;
    };

} // namespace uplink::server
