#include "chunkvault/network/upload_server.hpp"
#include "chunkvault/core/logger.hpp"
#include <algorithm>

namespace chunkvault::network {

UploadServer::UploadServer(const ServerOptions& options, std::shared_ptr<RequestHandler> handler)
    : options_(options)
    , handler_(std::move(handler))
    , running_(false)
    , port_(options.port)
    , io_context_()
    , acceptor_(io_context_) {
}

UploadServer::~UploadServer() {
    stop();
}

bool UploadServer::start() {
    if (running_) {
        LOG_WARN("Upload server already running");
        return false;
    }

    try {
        auto address = boost::asio::ip::make_address(options_.bind_address);
        tcp::endpoint endpoint(address, options_.port);

        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Failed to start upload server on {}:{}: {}", options_.bind_address, options_.port, e.what());
        boost::system::error_code ec;
        acceptor_.close(ec);
        return false;
    }

    running_ = true;
    io_context_.restart();
    do_accept();

    auto thread_count = std::max<std::size_t>(1, options_.worker_threads);
    for (std::size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this]() {
            while (running_) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("IO context error: {}", e.what());
                }
            }
        });
    }

    LOG_INFO("Upload server listening on {}:{} with {} workers", options_.bind_address, port_, thread_count);
    return true;
}

void UploadServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping upload server on port {}", port_);

    boost::asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });

    std::vector<std::shared_ptr<Connection>> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open.assign(connections_.begin(), connections_.end());
    }
    for (auto& connection : open) {
        connection->close();
    }

    io_context_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    boost::system::error_code ec;
    acceptor_.close(ec);

    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.clear();
}

std::size_t UploadServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void UploadServer::do_accept() {
    acceptor_.async_accept(boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }

            if (!ec) {
                handle_new_connection(std::move(socket));
            } else if (ec == boost::asio::error::operation_aborted) {
                return;
            } else {
                LOG_WARN("Accept error: {}", ec.message());
            }

            do_accept();
        });
}

void UploadServer::handle_new_connection(tcp::socket socket) {
    auto connection = std::make_shared<Connection>(std::move(socket), handler_, options_.max_message_size,
                                                   options_.payload_timeout);
    LOG_INFO("Accepted connection from {}", connection->get_remote_endpoint());

    connection->set_disconnect_handler(
        [this](std::shared_ptr<Connection> closed) {
            handle_connection_closed(closed);
        });

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.insert(connection);
    }

    connection->start();
}

void UploadServer::handle_connection_closed(const std::shared_ptr<Connection>& connection) {
    LOG_DEBUG("Connection closed: {}", connection->get_remote_endpoint());

    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection);
}

}
