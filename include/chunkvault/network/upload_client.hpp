#pragma once

#include "chunkvault/network/protocol.hpp"
#include "chunkvault/transfer/upload_transport.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkvault::network {

using boost::asio::ip::tcp;

struct ClientOptions {
    std::string host = "127.0.0.1";
    std::uint16_t port = 9400;
    std::string auth_token;
    std::chrono::milliseconds timeout{30000};
    std::size_t max_message_size = 16 * 1024 * 1024;
};

// Blocking request/response client. Transport failures are reported as INTERNAL
// and drop the connection; the next call reconnects.
class UploadClient : public transfer::UploadTransport {
public:
    explicit UploadClient(ClientOptions options);
    ~UploadClient() override;

    UploadClient(const UploadClient&) = delete;
    UploadClient& operator=(const UploadClient&) = delete;

    bool connect();
    void disconnect();
    bool is_connected() const { return socket_.is_open(); }

    core::UploadResult start_session(const transfer::StartSessionRequest& request,
                                     transfer::SessionHandle& handle) override;
    core::UploadResult get_status(const std::string& file_id, transfer::SessionStatusReport& report) override;
    core::UploadResult ingest_chunk(const std::string& file_id, uint32_t chunk_number,
                                    std::span<const uint8_t> payload, const std::string& chunk_hash,
                                    uint32_t attempt, transfer::ChunkReceipt& receipt) override;
    core::UploadResult complete(const std::string& file_id, const std::string& expected_hash,
                                transfer::FinalLocation& location) override;
    core::UploadResult cancel(const std::string& file_id) override;

private:
    // Sends one request and waits for its reply. ERROR_RESPONSE replies are decoded into the result.
    core::UploadResult round_trip(MessageType request_type, const std::vector<std::uint8_t>& payload,
                                  MessageType reply_type, std::vector<std::uint8_t>& reply);

    bool run_with_timeout();

    ClientOptions options_;
    boost::asio::io_context io_context_;
    tcp::socket socket_;
    std::uint64_t next_message_id_;
};

}
