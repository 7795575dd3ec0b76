#include "chunkvault/core/cli.hpp"
#include "chunkvault/core/config.hpp"
#include "chunkvault/core/identity.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/network/request_handler.hpp"
#include "chunkvault/network/upload_server.hpp"
#include "chunkvault/storage/chunk_store.hpp"
#include "chunkvault/storage/sqlite_metadata_store.hpp"
#include "chunkvault/storage/storage_config.hpp"
#include "chunkvault/transfer/merge_engine.hpp"
#include "chunkvault/transfer/network_monitor.hpp"
#include "chunkvault/transfer/reaper.hpp"
#include "chunkvault/transfer/session_manager.hpp"
#include "chunkvault/transfer/upload_events.hpp"
#include "chunkvault/transfer/upload_settings.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace chunkvault;

int main(int argc, char* argv[]) {
    core::CommandLineParser parser("chunkvaultd");
    parser.set_usage("chunkvaultd [options]");
    parser.add_option("p", "port", "Listen port (0 for any free port)", true);
    parser.add_option("d", "data-dir", "Directory for chunks, uploads and the database", true);
    parser.add_option("", "bind", "Address to listen on", true);
    parser.add_option("", "log-level", "trace, debug, info, warn, error or critical", true);

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = core::Config::instance();
    config.set_defaults();

    std::string config_file = parser.get_option("config", "~/.chunkvault.conf");
    auto config_path = core::utils::FileUtils::expand_home(config_file);
    if (core::utils::FileUtils::exists(config_path)) {
        if (!config.load_from_file(config_path.string())) {
            std::cerr << "Error: cannot read config file " << config_path << "\n";
            return 1;
        }
    } else if (parser.has_option("config")) {
        std::cerr << "Error: config file " << config_path << " not found\n";
        return 1;
    }
    config.load_from_environment();

    if (parser.has_option("port")) config.set("server.port", parser.get_option("port"));
    if (parser.has_option("data-dir")) config.set("storage.data_dir", parser.get_option("data-dir"));
    if (parser.has_option("bind")) config.set("server.bind_address", parser.get_option("bind"));
    if (parser.has_option("log-level")) config.set("log.level", parser.get_option("log-level"));

    auto log_level = parser.has_option("verbose")
        ? core::LogLevel::Debug
        : core::Logger::parse_level(config.get_string("log.level", "info"));
    core::Logger::initialize(config.get_string("log.file", "chunkvault.log"), log_level);

    LOG_INFO("ChunkVault server starting up");

    if (!crypto::initialize()) {
        LOG_CRITICAL("Failed to initialize crypto library");
        return 1;
    }

    auto settings = transfer::UploadSettings::from_config(config);
    std::string settings_error;
    if (!settings.validate(settings_error)) {
        LOG_CRITICAL("Invalid upload settings: {}", settings_error);
        return 1;
    }

    storage::StorageConfig storage_config(
        core::utils::FileUtils::expand_home(config.get_string("storage.data_dir", "./chunkvault-data")));
    if (!storage_config.create_directories()) {
        LOG_CRITICAL("Cannot create data directories under {}", storage_config.chunk_directory.parent_path().string());
        return 1;
    }

    auto metadata = std::make_shared<storage::SqliteMetadataStore>(storage_config.database_path);
    auto result = metadata->initialize();
    if (!result) {
        LOG_CRITICAL("Cannot open metadata store: {}", result.message);
        return 1;
    }

    auto chunk_store = std::make_shared<storage::ChunkStore>(storage_config, metadata);
    result = chunk_store->initialize();
    if (!result) {
        LOG_CRITICAL("Cannot open chunk store: {}", result.message);
        return 1;
    }

    auto events = std::make_shared<transfer::EventDispatcher>();
    events->subscribe([](const transfer::UploadEvent& event) {
        if (event.chunk_number) {
            LOG_DEBUG("event {} file={} chunk={} {}", transfer::to_string(event.type),
                      event.file_id, *event.chunk_number, event.reason);
        } else {
            LOG_INFO("event {} file={} owner={} {}", transfer::to_string(event.type),
                     event.file_id, event.owner_id, event.reason);
        }
    });
    events->start();

    auto identity = std::make_shared<core::StaticTokenIdentityProvider>(
        core::StaticTokenIdentityProvider::from_string(config.get_string("auth.tokens")));
    if (identity->token_count() == 0) {
        LOG_WARN("No auth tokens configured; every request will be rejected");
    }

    auto merge_engine = std::make_shared<transfer::MergeEngine>(storage_config, chunk_store);
    auto monitor = std::make_shared<transfer::NetworkMonitor>(settings);
    auto sessions = std::make_shared<transfer::SessionManager>(
        settings, metadata, chunk_store, merge_engine, monitor, events);

    transfer::Reaper reaper(sessions, metadata, chunk_store,
                            std::chrono::duration_cast<std::chrono::milliseconds>(settings.session_ttl),
                            std::chrono::duration_cast<std::chrono::milliseconds>(settings.reaper_interval));
    reaper.start();

    network::ServerOptions server_options;
    server_options.bind_address = config.get_string("server.bind_address", "0.0.0.0");
    server_options.port = static_cast<std::uint16_t>(config.get_int("server.port", 9400));
    server_options.worker_threads = static_cast<std::size_t>(config.get_int("server.workers", 4));
    server_options.max_message_size = config.get_uint64("server.max_message_size", 16 * 1024 * 1024);
    server_options.payload_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(settings.chunk_timeout);

    auto handler = std::make_shared<network::RequestHandler>(sessions, identity);
    network::UploadServer server(server_options, handler);
    if (!server.start()) {
        reaper.stop();
        events->stop();
        return 1;
    }

    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signal_number);
        }
    });
    signal_context.run();

    server.stop();
    reaper.stop();
    events->stop();

    LOG_INFO("ChunkVault server stopped");
    core::Logger::shutdown();
    return 0;
}
