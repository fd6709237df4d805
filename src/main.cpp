#include "commands.hpp"
#include "config.hpp"
#include "http.hpp"
#include "interceptor.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

// Network client with a manual kill switch so /offline can simulate a
// dropped connection without touching the real network stack.
class SwitchableHttpClient : public netstash::HttpClient {
public:
    std::atomic<bool> online{true};

    netstash::HttpResponse send(const netstash::HttpRequest& request,
                                long timeout_seconds) override {
        if (!online.load()) return netstash::HttpResponse{};
        return inner_.send(request, timeout_seconds);
    }

private:
    netstash::CurlHttpClient inner_;
};

static void print_usage() {
    std::cout << "Usage: netstash [options] [command]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.netstash/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Commands (omit to start the interactive shell):\n"
              << "  get URL              Fetch through the cache\n"
              << "  post URL BODY        Submit JSON through the cache\n"
              << "  status               Per-partition entry counts and sizes\n"
              << "  clear [NAME]         Clear one partition, or everything\n"
              << "  invalidate URL       Drop the cached copy of one URL\n"
              << "  warm URL...          Fetch URLs into their partitions\n"
              << "  preload              Fetch the critical pages\n"
              << "  activate             Precache and activate the configured generation\n"
              << "  replay               Deliver queued submissions now\n"
              << "\n"
              << "Environment variables:\n"
              << "  NETSTASH_ORIGIN          Origin relative URLs resolve against\n"
              << "  NETSTASH_DATA_DIR        Directory for cache.db and queue.db\n"
              << "  NETSTASH_GENERATION      Cache generation number\n"
              << "  NETSTASH_STORE_BACKEND   sqlite or memory\n";
}

static void print_repl_help() {
    std::cout << "Commands:\n"
              << "  /get URL          Fetch through the cache (bare URLs work too)\n"
              << "  /post URL BODY    Submit JSON\n"
              << "  /status           Show cache status\n"
              << "  /clear [NAME]     Clear a partition or everything\n"
              << "  /invalidate URL   Drop one cached URL\n"
              << "  /warm URL...      Warm URLs\n"
              << "  /preload          Fetch the critical pages\n"
              << "  /activate         Precache and activate\n"
              << "  /replay           Deliver queued submissions\n"
              << "  /offline          Simulate a lost connection\n"
              << "  /online           Restore the connection (replays the queue)\n"
              << "  /quit, /exit      Exit\n"
              << "  /help             Show this help\n";
}

// Returns false when the verb is unknown.
static bool run_command(netstash::Interceptor& interceptor, const std::vector<std::string>& args,
                        std::string& out) {
    if (args.empty()) return false;
    const std::string& verb = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (verb == "get" && rest.size() == 1) {
        out = netstash::cmd_get(interceptor, rest[0]);
    } else if (verb == "post" && rest.size() >= 2) {
        std::string body;
        for (size_t i = 1; i < rest.size(); i++) {
            if (i > 1) body += ' ';
            body += rest[i];
        }
        out = netstash::cmd_post(interceptor, rest[0], body);
    } else if (verb == "status" && rest.empty()) {
        out = netstash::cmd_status(interceptor);
    } else if (verb == "clear" && rest.size() <= 1) {
        out = netstash::cmd_clear(interceptor, rest.empty() ? "" : rest[0]);
    } else if (verb == "invalidate" && rest.size() == 1) {
        out = netstash::cmd_invalidate(interceptor, rest[0]);
    } else if (verb == "warm") {
        out = netstash::cmd_warm(interceptor, rest);
    } else if (verb == "preload" && rest.empty()) {
        out = netstash::cmd_preload(interceptor);
    } else if (verb == "activate" && rest.empty()) {
        out = netstash::cmd_activate(interceptor);
    } else if (verb == "replay" && rest.empty()) {
        out = netstash::cmd_replay(interceptor);
    } else {
        return false;
    }
    return true;
}

static std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> words;
    for (auto& w : netstash::split(line, ' ')) {
        if (!w.empty()) words.push_back(w);
    }
    return words;
}

static void run_repl(netstash::Interceptor& interceptor, SwitchableHttpClient& http) {
    std::cout << "netstash interception cache\n"
              << "Generation: " << interceptor.config().generation
              << " | Partitions: " << interceptor.registry().size()
              << " | Store: " << interceptor.store().backend_name() << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    auto queued = netstash::listen<netstash::SubmissionQueuedEvent>(interceptor.bus(),
        [](const netstash::SubmissionQueuedEvent& ev) {
            std::cout << "Queued submission #" << ev.submission_id << " for " << ev.url << "\n";
        });
    auto replayed = netstash::listen<netstash::QueueReplayedEvent>(interceptor.bus(),
        [](const netstash::QueueReplayedEvent& ev) {
            if (ev.delivered == 0 && !ev.rejected) return;
            std::cout << "\nReplayed queue: " << ev.delivered << " delivered, "
                      << ev.remaining << " waiting";
            if (ev.rejected) std::cout << " (oldest rejected by server)";
            std::cout << "\n";
        });

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << (http.online.load() ? "netstash> " : "netstash (offline)> ") << std::flush;

        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }
        line = netstash::trim(line);
        if (line.empty()) continue;

        if (line == "/quit" || line == "/exit") break;
        if (line == "/help") {
            print_repl_help();
            continue;
        }
        if (line == "/offline") {
            http.online.store(false);
            interceptor.set_online(false);
            std::cout << "Network disabled.\n";
            continue;
        }
        if (line == "/online") {
            http.online.store(true);
            interceptor.set_online(true);
            std::cout << "Network restored.\n";
            continue;
        }

        auto words = split_words(line[0] == '/' ? line.substr(1) : "get " + line);
        std::string out;
        if (run_command(interceptor, words, out)) {
            std::cout << out;
        } else {
            std::cout << "Unknown command: " << line << "\n";
        }
    }
}

int main(int argc, char* argv[]) try {
    std::string config_path = netstash::Config::default_path();
    std::vector<std::string> command;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = netstash::expand_home(argv[++i]);
        } else if (argv[i][0] == '-' && command.empty()) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            command.emplace_back(argv[i]);
        }
    }

    netstash::http_init();
    netstash::http_set_abort_flag(&g_shutdown);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto config = netstash::Config::load(config_path);
    SwitchableHttpClient http_client;
    int rc = 0;
    {
        netstash::Interceptor interceptor(std::move(config), http_client);

        if (command.empty()) {
            run_repl(interceptor, http_client);
        } else {
            std::string out;
            if (run_command(interceptor, command, out)) {
                std::cout << out;
            } else {
                std::cerr << "Unknown command: " << command[0] << "\n";
                print_usage();
                rc = 1;
            }
        }
    }

    netstash::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
