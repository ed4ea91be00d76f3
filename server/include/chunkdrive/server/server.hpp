#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <thread>
#include <vector>

#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/reassembler.hpp"
#include "chunkdrive/server/session_registry.hpp"
#include "chunkdrive/server/upload_handler.hpp"

namespace chunkdrive::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        /// Blocks until stop() or SIGINT/SIGTERM.
        void run();

        void stop();

        std::uint16_t port() const;

        SessionRegistry &registry() noexcept { return registry_; }

    private:
        void accept_next();
        void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
        void schedule_sweep();
        void handle_signal();

        ServerConfig config_;
        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::signal_set signals_;
        boost::asio::steady_timer sweep_timer_;

        ChunkStore chunk_store_;
        ReassemblyEngine reassembly_engine_;
        SessionRegistry registry_;
        UploadHandler handler_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkdrive::server
