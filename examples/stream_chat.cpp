/**
 * Example: streaming a chat turn from the task-execution backend
 *
 * Demonstrates a plain call (create a conversation) followed by a streaming
 * call whose frames are printed as they arrive. Ctrl+C cancels the stream.
 *
 * Run:
 *   export TASKSTREAM_API_URL="http://localhost:8000"
 *   export TASKSTREAM_ACCESS_TOKEN="your-access-token"
 *   export TASKSTREAM_REFRESH_TOKEN="your-refresh-token"
 *   ./taskstream_example "Summarise yesterday's tasks"
 */

#include "api/request_client.hpp"
#include "core/logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace taskstream;

namespace {

// Only a sig_atomic_t store is safe inside the handler; a watcher thread
// turns it into a cancel()
volatile std::sig_atomic_t g_interrupted = 0;

void handle_sigint(int) {
    g_interrupted = 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <query> [conversation-id]" << std::endl;
        return 1;
    }
    std::string query = argv[1];

    try {
        ClientConfig config = ClientConfig::load();

        LoggerConfig log_config;
        log_config.min_level = config.log_level;
        log_config.enable_json = false;
        Logger::get_instance().configure(log_config);

        std::cout << "Using " << config.to_string() << std::endl;

        RequestClient client(config);

        std::string conversation_id;
        if (argc >= 3) {
            conversation_id = argv[2];
        } else {
            auto created = client.post("/api/v1/conversations", {{"name", query.substr(0, 32)}});
            if (!created.status) {
                std::cerr << "Failed to create conversation: " << created.message << std::endl;
                return 1;
            }
            conversation_id = created.payload.value("conversation_id", "");
            std::cout << "Created conversation " << conversation_id << std::endl;
        }

        CancellationTokenPtr signal = make_cancellation_token();
        std::atomic<bool> finished{false};
        std::signal(SIGINT, handle_sigint);

        std::thread watcher([&signal, &finished] {
            while (!finished.load()) {
                if (g_interrupted) {
                    signal->cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        StreamCallbacks callbacks;
        callbacks.on_message = [](const DataEvent& event) {
            std::cout << event.payload.dump() << std::endl;
        };
        callbacks.on_error = [](const StreamError& error) {
            std::cerr << "Stream failed (" << error.code << "): " << error.message << std::endl;
        };
        callbacks.on_complete = [](const StreamIds& ids) {
            std::cout << "Done: task=" << ids.task_id
                      << " conversation=" << ids.conversation_id
                      << " message=" << ids.message_id << std::endl;
        };

        StreamOptions options;
        options.signal = signal;

        StreamHandle handle = client.start_stream(
            "/api/v1/conversations/" + conversation_id + "/chat",
            {{"query", query}},
            callbacks,
            options);

        SessionState state = SessionState::FAILED;
        try {
            state = handle.wait();
        } catch (...) {
            finished = true;
            watcher.join();
            throw;
        }
        finished = true;
        watcher.join();

        std::cout << "Session ended: " << session_state_to_string(state) << std::endl;
        return state == SessionState::COMPLETED ? 0 : 2;

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const AuthError& e) {
        std::cerr << "Authentication error: " << e.what() << std::endl;
        return 1;
    } catch (const HttpClientError& e) {
        std::cerr << "Request error: " << e.what() << std::endl;
        return 1;
    }
}
