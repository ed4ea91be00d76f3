#include "chunkdrive/server/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <csignal>
#include <memory>

#include <spdlog/spdlog.h>

#include "chunkdrive/server/connection.hpp"

namespace chunkdrive::server
{

    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    namespace
    {

        constexpr std::uint64_t kMultipartOverhead = 64 * 1024;

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          sweep_timer_(io_context_),
          chunk_store_(config_.staging_dir()),
          reassembly_engine_(config_.files_dir(), chunk_store_),
          registry_(chunk_store_, reassembly_engine_),
          handler_(registry_)
    {
        const auto address = net::ip::make_address(config_.address);
        const tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);

        spdlog::info("Listening on {}:{} (staging {}, files {})", config_.address, port(),
                     config_.staging_dir().string(), config_.files_dir().string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_sweep();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
    }

    void Server::stop()
    {
        net::post(io_context_, [this]
                  {
        boost::system::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        signals_.cancel(ec);
        io_context_.stop(); });
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(net::make_strand(io_context_),
                               [this](const boost::system::error_code &ec, tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(boost::system::error_code ec, tcp::socket socket)
    {
        if (!ec)
        {
            std::make_shared<Connection>(std::move(socket), handler_, config_.max_chunk_bytes + kMultipartOverhead)
                ->start();
        }
        if (!ec || ec == net::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_sweep()
    {
        if (config_.sweep_interval.count() <= 0)
        {
            return;
        }
        sweep_timer_.expires_after(config_.sweep_interval);
        sweep_timer_.async_wait([this](const boost::system::error_code &ec)
                                {
        if (ec) {
            return;
        }
        const auto evicted = registry_.cleanup_expired(config_.session_timeout);
        if (evicted > 0) {
            spdlog::info("Idle sweep evicted {} upload session(s)", evicted);
        }
        schedule_sweep(); });
    }

    void Server::handle_signal()
    {
        boost::system::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace chunkdrive::server
