#pragma once

#include "chunkvault/network/protocol.hpp"
#include "chunkvault/network/request_handler.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chunkvault::network {

using boost::asio::ip::tcp;

enum class ConnectionState {
    CONNECTED,
    CLOSING,
    DISCONNECTED
};

// One client socket. Requests are answered strictly in order: the next header
// is not read until the previous response has been written.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>)>;

    // A payload that has not fully arrived within payload_timeout of its header drops the connection.
    // Zero disables the deadline.
    Connection(tcp::socket socket, std::shared_ptr<RequestHandler> handler, std::size_t max_message_size,
               std::chrono::milliseconds payload_timeout = std::chrono::milliseconds(0));
    ~Connection();

    void start();

    // Safe from any thread; the close runs on the connection's strand.
    void close();

    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

    ConnectionState get_state() const { return state_; }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }
    std::uint64_t requests_handled() const { return requests_handled_; }

private:
    void do_read_header();
    void do_read_payload(const MessageHeader& header);
    void dispatch(const MessageHeader& header, std::chrono::milliseconds transfer_time);
    void do_write(std::vector<std::uint8_t> frame);
    void do_close();
    void handle_error(const boost::system::error_code& error);
    void arm_payload_deadline();

    tcp::socket socket_;
    std::shared_ptr<RequestHandler> handler_;
    std::size_t max_message_size_;
    std::chrono::milliseconds payload_timeout_;
    boost::asio::steady_timer payload_timer_;
    bool awaiting_payload_;
    ConnectionState state_;
    std::string remote_endpoint_;
    std::uint64_t requests_handled_;

    DisconnectHandler disconnect_handler_;

    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;
    std::vector<std::uint8_t> write_buffer_;
    std::chrono::steady_clock::time_point payload_started_;
};

}
