#include "chunkvault/network/connection.hpp"
#include "chunkvault/core/logger.hpp"
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace chunkvault::network {

Connection::Connection(tcp::socket socket, std::shared_ptr<RequestHandler> handler, std::size_t max_message_size,
                       std::chrono::milliseconds payload_timeout)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , max_message_size_(max_message_size)
    , payload_timeout_(payload_timeout)
    , payload_timer_(socket_.get_executor())
    , awaiting_payload_(false)
    , state_(ConnectionState::CONNECTED)
    , requests_handled_(0) {

    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    } else {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
}

Connection::~Connection() {
    LOG_DEBUG("Connection to {} destroyed after {} requests", remote_endpoint_, requests_handled_);
}

void Connection::start() {
    LOG_DEBUG("Starting connection to {}", remote_endpoint_);
    auto self = shared_from_this();
    boost::asio::dispatch(socket_.get_executor(), [this, self]() { do_read_header(); });
}

void Connection::close() {
    auto self = shared_from_this();
    boost::asio::post(socket_.get_executor(), [this, self]() { do_close(); });
}

void Connection::do_close() {
    if (state_ != ConnectionState::CONNECTED) {
        return;
    }

    state_ = ConnectionState::CLOSING;
    LOG_DEBUG("Closing connection to {}", remote_endpoint_);

    awaiting_payload_ = false;
    payload_timer_.cancel();

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    state_ = ConnectionState::DISCONNECTED;

    if (disconnect_handler_) {
        disconnect_handler_(shared_from_this());
    }
}

void Connection::do_read_header() {
    if (state_ != ConnectionState::CONNECTED) {
        return;
    }

    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                handle_error(ec);
                return;
            }

            MessageHeader header;
            try {
                header = MessageHeader::deserialize(read_header_buffer_);
            } catch (const std::runtime_error& e) {
                LOG_ERROR("Failed to parse message header from {}: {}", remote_endpoint_, e.what());
                do_close();
                return;
            }

            if (!header.is_valid()) {
                LOG_ERROR("Invalid message header from {}", remote_endpoint_);
                do_close();
                return;
            }

            if (header.payload_size > max_message_size_) {
                LOG_ERROR("Payload too large ({} bytes) from {}", static_cast<std::uint32_t>(header.payload_size), remote_endpoint_);
                do_close();
                return;
            }

            do_read_payload(header);
        });
}

void Connection::do_read_payload(const MessageHeader& header) {
    read_payload_buffer_.resize(header.payload_size);
    payload_started_ = std::chrono::steady_clock::now();
    arm_payload_deadline();

    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, self, header](boost::system::error_code ec, std::size_t /*length*/) {
            awaiting_payload_ = false;
            payload_timer_.cancel();
            if (ec) {
                handle_error(ec);
                return;
            }

            auto transfer_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - payload_started_);

            if (!header.verify_checksum(read_payload_buffer_)) {
                LOG_ERROR("Checksum mismatch for message from {}", remote_endpoint_);
                do_close();
                return;
            }

            dispatch(header, transfer_time);
        });
}

void Connection::arm_payload_deadline() {
    if (payload_timeout_.count() <= 0) {
        return;
    }

    awaiting_payload_ = true;
    payload_timer_.expires_after(payload_timeout_);

    auto self = shared_from_this();
    payload_timer_.async_wait([this, self](boost::system::error_code ec) {
        // A completed read may race a timer that already expired
        if (ec || !awaiting_payload_) {
            return;
        }
        LOG_WARN("Payload from {} not received within {}ms, dropping connection",
                 remote_endpoint_, payload_timeout_.count());
        do_close();
    });
}

void Connection::dispatch(const MessageHeader& header, std::chrono::milliseconds transfer_time) {
    LOG_DEBUG("Received {} ({} bytes) from {}", to_string(header.type), read_payload_buffer_.size(), remote_endpoint_);

    auto response = handler_->handle(header, read_payload_buffer_, transfer_time);
    ++requests_handled_;

    do_write(encode_frame(response.type, header.message_id, response.payload));
}

void Connection::do_write(std::vector<std::uint8_t> frame) {
    write_buffer_ = std::move(frame);

    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(write_buffer_),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                handle_error(ec);
                return;
            }
            do_read_header();
        });
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_DEBUG("Connection to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Connection operation aborted for {}", remote_endpoint_);
    } else {
        LOG_WARN("Connection error with {}: {}", remote_endpoint_, error.message());
    }

    do_close();
}

}
