#include <peerlink/core/config.hpp>
#include <peerlink/core/logger.hpp>
#include <peerlink/core/reactor.hpp>
#include <peerlink/core/task.hpp>
#include <peerlink/session/processor.hpp>
#include <peerlink/session/session.hpp>
#include <peerlink/webrtc/loopback.hpp>
#include <peerlink/webrtc/signaling.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace peerlink;

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

struct Options {
    std::string config_path;
    std::vector<std::string> texts;
    std::vector<std::string> files;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config FILE] [--text TEXT]... [--file PATH]...\n"
              << "Runs an answering endpoint and an offering endpoint over the loopback network,\n"
              << "sends every text and file from the offerer and prints the responses.\n";
}

bool parseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }

        if (arg == "--config") {
            options.config_path = argv[++i];
        } else if (arg == "--text") {
            options.texts.push_back(argv[++i]);
        } else if (arg == "--file") {
            options.files.push_back(argv[++i]);
        } else {
            std::cerr << "Unknown option " << arg << std::endl;
            return false;
        }
    }

    if (options.texts.empty() && options.files.empty()) {
        options.texts.push_back("Hello from peerlink");
    }
    return true;
}

// Menunggu sampai jumlah event tertentu tercapai
class Waiter {
public:
    void signal() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++count_;
        cv_.notify_all();
    }

    bool waitFor(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (count_ < count && g_running) {
            if (cv_.wait_until(lock, std::min(deadline, std::chrono::steady_clock::now() +
                                                        std::chrono::milliseconds(100))) ==
                    std::cv_status::timeout &&
                std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
        }
        return count_ >= count;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t count_ = 0;
};

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Options options;
    if (!parseOptions(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    if (!options.config_path.empty()) {
        auto loaded = core::config().loadFromFile(options.config_path);
        if (loaded.is_error()) {
            std::cerr << "Failed to load config: " << loaded.error().what() << std::endl;
            return 1;
        }
    }

    auto parsed = session::SessionConfig::fromConfig(*core::config().root());
    if (parsed.is_error()) {
        std::cerr << "Invalid configuration: " << parsed.error().what() << std::endl;
        return 1;
    }

    session::SessionConfig base = parsed.value();
    core::Logger::setLevel(base.log_level);
    core::Logger::info("Starting peerlink demo");

    session::SessionConfig server_config = base;
    server_config.role = webrtc::PeerRole::Answerer;
    server_config.endpoint = "server";

    session::SessionConfig client_config = base;
    client_config.role = webrtc::PeerRole::Offerer;
    client_config.endpoint = "client";
    // Klien tidak menyimpan file
    client_config.transfer.download_directory.clear();

    int exit_code = 0;
    try {
        core::Reactor server_reactor;
        core::Reactor client_reactor;
        core::TaskScheduler workers;
        workers.start(2);

        server_reactor.start();
        client_reactor.start();

        auto network = webrtc::LoopbackNetwork::create();
        auto [server_signaling, client_signaling] =
            webrtc::LoopbackSignaling::createPair(server_reactor, client_reactor);

        auto server = session::Session::create(server_reactor, server_signaling,
                                               network->factory(server_reactor), server_config,
                                               std::make_shared<session::EchoProcessor>(), &workers);
        auto client = session::Session::create(client_reactor, client_signaling,
                                               network->factory(client_reactor), client_config);

        server->onText.addListener([](const webrtc::TextMessage& message) {
            core::Logger::info("[server] received text: {}", message.body);
        });
        server->onFileReceived.addListener([](const transfer::ReceivedFile& file) {
            core::Logger::info("[server] received file {} ({} bytes, sha256 {})",
                               file.name, file.data.size(), file.checksum);
        });

        Waiter connected;
        Waiter responses;
        Waiter transfers_done;

        client->onText.addListener([&responses](const webrtc::TextMessage& message) {
            if (message.response) {
                std::cout << "Response: " << message.body << std::endl;
                responses.signal();
            }
        });
        client->onTransferComplete.addListener([&transfers_done](const transfer::TransferInfo& info) {
            core::Logger::info("[client] transfer {} ({}) complete", info.id, info.name);
            transfers_done.signal();
        });
        client->onTransferFailed.addListener(
            [&transfers_done, &responses](const transfer::TransferInfo& info, const core::Error& error) {
                std::cerr << "Transfer of " << info.name << " failed: " << error.what() << std::endl;
                transfers_done.signal();
                // Tidak akan ada jawaban untuk file ini
                responses.signal();
            });
        client->onError.addListener([](const core::Error& error) {
            std::cerr << "Client error: " << error.what() << std::endl;
        });

        std::atomic<bool> connect_ok{true};
        auto on_connect = [&connected, &connect_ok](core::Result<void> result) {
            if (result.is_error()) {
                std::cerr << "Connect failed: " << result.error().what() << std::endl;
                connect_ok = false;
            }
            connected.signal();
        };

        server->connect(on_connect);
        client->connect(on_connect);

        auto negotiation_wait = base.negotiation_timeout + std::chrono::seconds(1);
        if (!connected.waitFor(2, negotiation_wait) || !connect_ok) {
            std::cerr << "Peers did not connect" << std::endl;
            exit_code = 1;
        } else {
            std::size_t expected = 0;
            for (const auto& text : options.texts) {
                auto sent = client->sendText(text);
                if (sent.is_error()) {
                    std::cerr << "Failed to send text: " << sent.error().what() << std::endl;
                    exit_code = 1;
                } else {
                    ++expected;
                }
            }

            std::size_t files = 0;
            for (const auto& path : options.files) {
                auto started = client->sendFile(path);
                if (started.is_error()) {
                    std::cerr << "Failed to send " << path << ": " << started.error().what() << std::endl;
                    exit_code = 1;
                } else {
                    ++expected;
                    ++files;
                }
            }

            transfers_done.waitFor(files, std::chrono::minutes(5));
            if (!responses.waitFor(expected, std::chrono::seconds(30))) {
                std::cerr << "Timed out waiting for responses" << std::endl;
                exit_code = 1;
            }
        }

        client->close();
        server->close();

        // Biarkan bye dan pesan terakhir lewat sebelum reactor berhenti
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        client.reset();
        server.reset();

        client_reactor.stop();
        server_reactor.stop();
        workers.stop();
    }
    catch (const core::Error& e) {
        core::Logger::error("Demo failed: {}", e.what());
        exit_code = 1;
    }

    core::Logger::info("peerlink demo finished");
    return exit_code;
}
