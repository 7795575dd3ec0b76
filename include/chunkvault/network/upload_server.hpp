#pragma once

#include "chunkvault/network/connection.hpp"
#include "chunkvault/network/request_handler.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace chunkvault::network {

struct ServerOptions {
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 9400;          // 0 picks an ephemeral port
    std::size_t worker_threads = 4;
    std::size_t max_message_size = 16 * 1024 * 1024;
    std::chrono::milliseconds payload_timeout{30000};
};

class UploadServer {
public:
    UploadServer(const ServerOptions& options, std::shared_ptr<RequestHandler> handler);
    ~UploadServer();

    UploadServer(const UploadServer&) = delete;
    UploadServer& operator=(const UploadServer&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_; }

    // The bound port; valid after start().
    std::uint16_t port() const { return port_; }
    std::size_t connection_count() const;

private:
    void do_accept();
    void handle_new_connection(tcp::socket socket);
    void handle_connection_closed(const std::shared_ptr<Connection>& connection);

    ServerOptions options_;
    std::shared_ptr<RequestHandler> handler_;
    std::atomic<bool> running_;
    std::uint16_t port_;

    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> workers_;

    std::set<std::shared_ptr<Connection>> connections_;
    mutable std::mutex connections_mutex_;
};

}
