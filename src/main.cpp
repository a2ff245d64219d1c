#include "config.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "gateway.hpp"
#include "http.hpp"
#include "model_catalog.hpp"
#include "plugin.hpp"
#include "prompt.hpp"
#include "query.hpp"
#include "util.hpp"
#include "client/console_renderer.hpp"
#include "client/event_loop.hpp"
#include "client/gateway_client.hpp"
#include "client/message_store.hpp"
#include "client/session_controller.hpp"
#include "server/api.hpp"
#include "server/http_server.hpp"
#include "store/session_store.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};
static std::atomic<bool> g_interrupt{false};

static void shutdown_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void interrupt_handler(int /*sig*/) {
    g_interrupt.store(true);
}

static void print_usage() {
    std::cout << "Usage: sift [options]\n"
              << "       sift serve [--listen HOST:PORT]\n"
              << "\n"
              << "Client options:\n"
              << "  -m, --message TEXT   Claim or text to analyze\n"
              << "  --image PATH         Attach an image (png, jpeg, gif, webp)\n"
              << "  --report TYPE        full_check, context_report or community_note\n"
              << "  --model ID           Model id (see /models)\n"
              << "  --server URL         Analysis server (default from config)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /stop                Stop the current generation\n"
              << "  /restart             Re-run the original query\n"
              << "  /reset               Clear the conversation\n"
              << "  /models              List models offered by the server\n"
              << "  /status              Show session state\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY       API key for OpenAI\n"
              << "  OPENROUTER_API_KEY   API key for OpenRouter\n"
              << "  ANTHROPIC_API_KEY    API key for Anthropic\n"
              << "  OPENAI_BASE_URL      Base URL for the OpenAI API\n"
              << "  SIFT_LISTEN          Server listen address\n"
              << "  SIFT_SERVER_URL      Server URL used by the client\n"
              << "  SIFT_DB_PATH         SQLite database path\n";
}

static std::string mime_for_path(const std::string& path) {
    std::string lower = sift::to_lower(path);
    auto ends_with = [&lower](const std::string& ext) {
        return lower.size() >= ext.size() &&
               lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0;
    };
    if (ends_with(".png")) return "image/png";
    if (ends_with(".jpg") || ends_with(".jpeg")) return "image/jpeg";
    if (ends_with(".gif")) return "image/gif";
    if (ends_with(".webp")) return "image/webp";
    return "";
}

// ── Server ──────────────────────────────────────────────────────

static int run_server(const sift::Config& config) {
    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    sift::PlatformHttpClient http_client;
    sift::ModelCatalog catalog = sift::ModelCatalog::from_config(config);
    sift::PromptSet prompts = sift::PromptSet::from_config(config);

    std::unique_ptr<sift::SessionStore> store;
    try {
        store = sift::PluginRegistry::instance().create_store(config.store.backend, config);
    } catch (const std::exception& e) {
        std::cerr << "Error opening session store: " << e.what() << "\n";
        return 1;
    }

    sift::ConfiguredProviders providers(config, http_client);
    sift::AnalysisGateway gateway(catalog, prompts, *store, providers,
                                  std::chrono::seconds(config.server.handle_ttl));
    sift::ApiRouter router(gateway, catalog, providers);

    sift::HttpServer server(config.server.listen, config.server.max_body,
        [&router](const sift::HttpRequest& req, sift::ResponseChannel& channel) {
            router.handle(req, channel);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cerr << "[server] Listening on " << config.server.listen
              << " (store: " << store->backend_name() << ")\n";

    uint32_t ticks = 0;
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        // Periodic handle eviction
        if (++ticks % 150 == 0) {
            size_t evicted = gateway.handles().evict_expired();
            if (evicted > 0) {
                std::cerr << "[server] Evicted " << evicted << " unclaimed stream handles\n";
            }
        }
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    return 0;
}

// ── Client ──────────────────────────────────────────────────────

static void print_status(const sift::SessionController& controller,
                         const sift::MessageStateStore& store) {
    std::cout << "Status: " << sift::session_status_name(controller.status()) << "\n";
    if (controller.session()) {
        const auto& s = *controller.session();
        std::cout << "Session: " << (s.id.empty() ? "(pending)" : s.id) << "\n"
                  << "Model: " << s.query.model_id << "\n"
                  << "Report: " << s.query.report_type << "\n";
    }
    if (!controller.analysis_id().empty())
        std::cout << "Analysis: " << controller.analysis_id() << "\n";
    std::cout << "Messages: " << store.size() << "\n";
    if (!controller.last_error().empty())
        std::cout << "Last error: " << controller.last_error() << "\n";
}

static void print_models(sift::HttpGatewayClient& gateway) {
    try {
        for (const auto& m : gateway.fetch_models()) {
            std::cout << "  " << m.id << "  " << m.name << " (" << m.provider
                      << (m.supports_vision ? ", vision" : "") << ")\n";
        }
    } catch (const sift::Error& e) {
        std::cout << e.what() << "\n";
    }
}

static int run_client(const sift::Config& config, const std::string& message,
                      const std::string& image_path, const std::string& model,
                      const std::string& report_type) {
    std::signal(SIGINT, interrupt_handler);

    auto loop = std::make_shared<sift::EventLoop>();
    sift::EventBus bus;
    sift::MessageStateStore store(&bus);
    sift::PlatformHttpClient http_client;
    sift::HttpGatewayClient gateway(config.client.server_url, http_client, *loop);
    sift::SessionController controller(store, gateway, *loop, &bus);
    sift::ConsoleRenderer renderer(bus, store, std::cout, std::cerr);

    auto& draft = controller.draft();
    draft.report_type = report_type;
    if (!image_path.empty()) {
        sift::ImageRef image;
        image.path = sift::expand_home(image_path);
        image.mime_type = mime_for_path(image_path);
        if (image.mime_type.empty()) {
            std::cerr << "Error: unsupported image type: " << image_path << "\n";
            return 1;
        }
        draft.image = image;
    }

    bool quit = false;
    sift::CancelToken follow_up_cancel;
    bool in_follow_up = false;

    auto start_from_draft = [&](const std::string& text) {
        sift::AnalysisQuery query;
        query.text = text;
        query.image = draft.image;
        query.report_type = draft.report_type;
        query.model_id = model;
        in_follow_up = false;
        try {
            controller.start(query);
        } catch (const sift::ValidationError& e) {
            std::cout << e.what() << "\n";
        }
    };

    auto handle_line = [&](const std::string& line) {
        if (line == "/quit" || line == "/exit") {
            quit = true;
        } else if (line == "/stop") {
            controller.stop();
        } else if (line == "/restart") {
            in_follow_up = false;
            if (!controller.restart())
                std::cout << "Nothing to restart (or a reply is still streaming).\n";
        } else if (line == "/reset") {
            controller.reset(true);
            draft.report_type = report_type;
        } else if (line == "/models") {
            print_models(gateway);
        } else if (line == "/status") {
            print_status(controller, store);
        } else if (line == "/help") {
            std::cout << "Commands:\n"
                      << "  /stop     Stop the current generation\n"
                      << "  /restart  Re-run the original query\n"
                      << "  /reset    Clear the conversation\n"
                      << "  /models   List available models\n"
                      << "  /status   Show session state\n"
                      << "  /quit     Exit\n"
                      << "  /help     Show this help\n"
                      << "Any other line is a follow-up question, or starts a new\n"
                      << "analysis when there is no conversation.\n";
        } else if (line[0] == '/') {
            std::cout << "Unknown command: " << line << "\n";
        } else if (controller.is_loading()) {
            std::cout << "Still generating; /stop first.\n";
        } else if (!controller.session()) {
            start_from_draft(line);
        } else {
            follow_up_cancel = sift::CancelToken();
            in_follow_up = true;
            controller.follow_up(line, follow_up_cancel);
        }
    };

    std::cout << "Sift analysis client\n"
              << "Server: " << config.client.server_url
              << " | Model: " << model << " | Report: " << report_type << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    if (!message.empty() || draft.image) start_from_draft(message);

    // stdin is read on its own thread; lines are handled on the loop.
    auto on_line = std::make_shared<std::function<void(const std::string&)>>(handle_line);
    std::thread([loop, on_line]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            std::string trimmed = sift::trim(line);
            if (trimmed.empty()) continue;
            loop->post([on_line, trimmed]() {
                if (*on_line) (*on_line)(trimmed);
            });
        }
        loop->post([on_line]() {
            if (*on_line) (*on_line)("/quit");
        });
    }).detach();

    while (!quit) {
        loop->run_one(std::chrono::milliseconds(100));
        if (g_interrupt.exchange(false)) {
            if (!controller.is_loading()) {
                quit = true;
            } else if (in_follow_up) {
                follow_up_cancel.cancel();
            } else {
                controller.stop();
            }
        }
    }

    *on_line = nullptr;
    controller.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string image_path;
    std::string model_name;
    std::string report_type;
    std::string server_url;
    std::string listen;
    bool serve = false;

    int first = 1;
    if (argc > 1 && std::strcmp(argv[1], "serve") == 0) {
        serve = true;
        first = 2;
    }

    for (int i = first; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (serve && std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (!serve && (std::strcmp(argv[i], "-m") == 0 ||
                              std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (!serve && std::strcmp(argv[i], "--image") == 0 && i + 1 < argc) {
            image_path = argv[++i];
        } else if (!serve && std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (!serve && std::strcmp(argv[i], "--report") == 0 && i + 1 < argc) {
            report_type = argv[++i];
        } else if (!serve && std::strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            server_url = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    sift::http_init();
    auto config = sift::Config::load();

    int rc;
    if (serve) {
        if (!listen.empty()) config.server.listen = listen;
        rc = run_server(config);
    } else {
        if (!server_url.empty()) config.client.server_url = server_url;
        rc = run_client(config, message, image_path,
                        model_name.empty() ? config.client.default_model : model_name,
                        report_type.empty() ? config.client.default_report_type
                                            : report_type);
    }

    sift::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
