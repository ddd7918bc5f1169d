#include "peerdrop/core/command_handler.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/network/tcp_channel.hpp"
#include "peerdrop/presence/presence_client.hpp"
#include "peerdrop/presence/signaling_server.hpp"
#include "peerdrop/storage/download_store.hpp"
#include "peerdrop/transfer/transfer_manager.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>

namespace peerdrop::core {

namespace {

std::atomic<bool> g_shutdown_requested{false};

void handle_shutdown_signal(int) {
    g_shutdown_requested = true;
}

void install_signal_handlers() {
    g_shutdown_requested = false;
    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);
}

// Calls tick every interval until SIGINT/SIGTERM or until tick returns false.
void run_until_shutdown(std::chrono::milliseconds interval, const std::function<bool()>& tick) {
    auto next_tick = std::chrono::steady_clock::now() + interval;
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (std::chrono::steady_clock::now() >= next_tick) {
            if (!tick()) {
                return;
            }
            next_tick += interval;
        }
    }
}

std::optional<std::uint16_t> parse_port(const std::string& value) {
    auto parsed = utils::parse_host_port("localhost:" + value);
    if (!parsed) {
        return std::nullopt;
    }
    return parsed->port;
}

struct TransferSettings {
    std::size_t chunk_size;
    std::chrono::milliseconds handshake_timeout;
    std::uint32_t max_frame_size;
};

TransferSettings load_transfer_settings() {
    auto& config = Config::instance();
    
    TransferSettings settings;
    int chunk_size = config.get_int("transfer.chunk_size", static_cast<int>(transfer::MAX_CHUNK_SIZE));
    settings.chunk_size = static_cast<std::size_t>(
        std::clamp(chunk_size, 1, static_cast<int>(transfer::MAX_CHUNK_SIZE)));
    settings.handshake_timeout = std::chrono::milliseconds(
        std::max(1, config.get_int("transfer.handshake_timeout_ms", 30000)));
    
    // A frame must always fit one full chunk plus the metadata record.
    int max_frame = config.get_int("transfer.max_frame_size", static_cast<int>(network::DEFAULT_MAX_PAYLOAD_SIZE));
    settings.max_frame_size = static_cast<std::uint32_t>(
        std::max(max_frame, static_cast<int>(transfer::MAX_CHUNK_SIZE) + 4096));
    return settings;
}

bool connect_signaling(presence::PresenceClient& client) {
    auto address = Config::instance().get_signaling_address();
    if (!address) {
        LOG_ERROR("Invalid signaling address in settings");
        return false;
    }
    
    return client.connect(address->host, address->port);
}

void print_peers(const presence::PeerSet& peers) {
    if (peers.empty()) {
        std::cout << "No other endpoints online\n";
        return;
    }
    
    std::cout << peers.size() << " endpoint(s) online:\n";
    for (const auto& peer : peers) {
        std::cout << "  " << peer << "\n";
    }
}

void print_progress(const transfer::TransferProgress& progress) {
    std::cout << "\r" << (progress.role == transfer::TransferRole::SENDER ? "-> " : "<- ")
              << progress.peer_id << "  "
              << std::fixed << std::setprecision(1) << progress.percentage() << "% ("
              << utils::StringUtils::format_bytes(progress.bytes_transferred) << " / "
              << utils::StringUtils::format_bytes(progress.total_size) << ")" << std::flush;
}

}

CommandResult ServeCommandHandler::execute(const std::vector<std::string>& args) {
    int port = Config::instance().get_port("signaling.port").value_or(3000);
    
    if (args.size() > 1) {
        auto parsed = parse_port(args[1]);
        if (!parsed) {
            return CommandResult::error("Invalid port: " + args[1]);
        }
        port = *parsed;
    }
    
    presence::SignalingServer server(static_cast<std::uint16_t>(port));
    if (!server.start()) {
        return CommandResult::error("Failed to start signaling server on port " + std::to_string(port));
    }
    
    install_signal_handlers();
    std::cout << "Signaling server listening on port " << server.get_port() << "\n";
    std::cout << "Press Ctrl+C to stop\n";
    
    std::size_t last_size = 0;
    run_until_shutdown(std::chrono::seconds(5), [&]() {
        auto size = server.get_registry().size();
        if (size != last_size) {
            std::cout << "Online endpoints: " << size << "\n";
            last_size = size;
        }
        return true;
    });
    
    LOG_INFO("Signaling server shutting down after {} broadcasts",
             server.get_registry().get_broadcast_count());
    server.stop();
    return CommandResult::ok();
}

CommandResult PeersCommandHandler::execute(const std::vector<std::string>& args) {
    presence::PresenceClient client;
    if (!connect_signaling(client)) {
        return CommandResult::error("Cannot reach signaling server");
    }
    
    if (args.size() > 1 && !client.register_identifier(args[1])) {
        return CommandResult::error("Registration failed");
    }
    
    auto peers = client.query_and_wait(std::chrono::seconds(5));
    if (!peers) {
        return CommandResult::error("No answer from signaling server");
    }
    
    print_peers(client.peers_excluding_self());
    return CommandResult::ok();
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto& config = Config::instance();
    auto name = args[1];
    int port = config.get_port("channel.port").value_or(9000);
    
    if (args.size() > 2) {
        auto parsed = parse_port(args[2]);
        if (!parsed) {
            return CommandResult::error("Invalid port: " + args[2]);
        }
        port = *parsed;
    }
    
    if (name.empty() || name.find('@') != std::string::npos) {
        return CommandResult::error("Name must be non-empty and must not contain '@'");
    }
    
    auto settings = load_transfer_settings();
    storage::DownloadStore store(config.get_download_dir());
    
    network::TcpChannelListener listener(static_cast<std::uint16_t>(port), "0.0.0.0", settings.max_frame_size);
    if (!listener.start()) {
        return CommandResult::error("Cannot listen on port " + std::to_string(port));
    }
    
    network::ChannelAddress address{name, config.get_string("channel.host", "127.0.0.1"), listener.get_port()};
    auto identifier = address.to_identifier();
    
    auto connector = std::make_shared<network::TcpChannelConnector>(identifier, settings.max_frame_size);
    transfer::TransferManager manager(connector, settings.chunk_size, settings.handshake_timeout);
    
    manager.set_progress_handler(print_progress);
    
    manager.set_completion_handler([&store](const transfer::TransferCompletion& completion) {
        std::cout << "\n";
        auto path = store.save(completion.metadata.file_name, completion.payload);
        if (path) {
            std::cout << "Received " << completion.metadata.file_name << " ("
                      << completion.metadata.mime_type << ", "
                      << utils::StringUtils::format_bytes(completion.payload.size()) << ") from "
                      << completion.peer_id << " -> " << path->string() << "\n";
        } else {
            std::cerr << "Received " << completion.metadata.file_name << " but could not save it\n";
        }
    });
    
    manager.set_failure_handler([](const transfer::TransferFailure& failure) {
        std::cerr << "\nTransfer from " << failure.peer_id << " failed: "
                  << transfer::to_string(failure.error) << " (" << failure.message << ")\n";
    });
    
    listener.set_accept_handler([&manager](std::shared_ptr<transfer::PeerChannel> channel) {
        manager.accept_channel(std::move(channel));
    });
    
    presence::PresenceClient presence;
    presence.set_peer_joined_handler([](const std::string& peer) {
        std::cout << "+ " << peer << " is online\n";
    });
    presence.set_peer_left_handler([](const std::string& peer) {
        std::cout << "- " << peer << " went offline\n";
    });
    
    if (!connect_signaling(presence) || !presence.register_identifier(identifier)) {
        listener.stop();
        connector->stop();
        return CommandResult::error("Cannot register with signaling server");
    }
    
    install_signal_handlers();
    std::cout << "Online as " << identifier << "\n";
    std::cout << "Saving files to " << store.get_directory().string() << "\n";
    std::cout << "Press Ctrl+C to stop\n";
    
    run_until_shutdown(std::chrono::seconds(1), [&]() {
        manager.check_timeouts();
        if (!presence.is_connected()) {
            std::cerr << "Lost connection to signaling server\n";
            return false;
        }
        return true;
    });
    
    presence.disconnect();
    listener.stop();
    connector->stop();
    
    auto totals = manager.get_totals();
    LOG_INFO("Receiver stopped: {} completed, {} failed, {} received", totals.completed, totals.failed,
             utils::StringUtils::format_bytes(totals.bytes_received));
    return CommandResult::ok();
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = utils::FileUtils::expand_home(args[1]);
    if (!utils::FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    std::vector<std::string> targets(args.begin() + 2, args.end());
    
    // Presence is advisory here; a target missing from the view is still tried.
    presence::PresenceClient presence;
    if (connect_signaling(presence)) {
        if (auto online = presence.query_and_wait(std::chrono::seconds(3))) {
            for (const auto& target : targets) {
                if (online->count(target) == 0) {
                    std::cerr << "Warning: " << target << " is not registered as online\n";
                }
            }
        }
        presence.disconnect();
    } else {
        std::cerr << "Warning: signaling server unreachable, sending without presence check\n";
    }
    
    auto& config = Config::instance();
    auto settings = load_transfer_settings();
    auto connector = std::make_shared<network::TcpChannelConnector>(
        config.get_string("identity.name", "peerdrop"), settings.max_frame_size);
    transfer::TransferManager manager(connector, settings.chunk_size, settings.handshake_timeout);
    
    std::atomic<std::size_t> failures{0};
    manager.set_progress_handler(print_progress);
    manager.set_completion_handler([](const transfer::TransferCompletion& completion) {
        std::cout << "\nDelivered " << completion.metadata.file_name << " to " << completion.peer_id
                  << " in " << utils::StringUtils::format_duration(completion.duration) << "\n";
    });
    manager.set_failure_handler([&failures](const transfer::TransferFailure& failure) {
        ++failures;
        std::cerr << "\nSending to " << failure.peer_id << " failed during "
                  << transfer::to_string(failure.phase) << ": " << transfer::to_string(failure.error)
                  << " (" << failure.message << ", "
                  << utils::StringUtils::format_bytes(failure.bytes_transferred) << " sent)\n";
    });
    
    auto result = manager.send_file(file_path, targets);
    if (!result) {
        connector->stop();
        return CommandResult::error("Send failed: " + result.message);
    }
    
    install_signal_handlers();
    while (!g_shutdown_requested && !manager.wait_until_idle(std::chrono::seconds(1))) {
        manager.check_timeouts();
    }
    
    connector->stop();
    
    if (failures > 0) {
        return CommandResult::error(std::to_string(failures.load()) + " of " + std::to_string(targets.size()) +
                                    " transfer(s) failed");
    }
    return CommandResult::ok("File sent to " + std::to_string(targets.size()) + " recipient(s)");
}

}
