#include "pagebridge/net/authenticated_transport.hpp"
#include "pagebridge/net/curl_transport.hpp"
#include "pagebridge/net/graph_endpoints.hpp"
#include "pagebridge/net/token_refresher.hpp"
#include "pagebridge/net/token_store.hpp"
#include "pagebridge/pages/page_client.hpp"
#include "pagebridge/transfer/page_transfer.hpp"
#include "pagebridge/util/clock.hpp"
#include "pagebridge/util/config_parser.hpp"
#include "pagebridge/util/logger.hpp"

#include <cstdio>
#include <fstream>
#include <getopt.h>
#include <sstream>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  update <pageId> <commands.json>   Apply a JSON array of update commands\n"
        "  replace-body <pageId> <file.html> Replace the page body\n"
        "  copy <pageId> <sectionId>         Copy a page to another section\n"
        "  move <pageId> <sectionId>         Copy, then delete the source page\n"
        "  delete <pageId>                   Delete a page\n"
        "  items <pageId>                    List embedded images and files\n"
        "  content <pageId> [--for-update]   Print page HTML\n"
        "\n"
        "Options:\n"
        "  -c, --config      Config file (default: $PAGEBRIDGE_CONFIG)\n"
        "  -u, --for-update  Include generated element IDs in page content\n"
        "  -v, --verbose     Debug logging\n"
        "  -h, --help        Show this help\n",
        argv);
}

bool ReadFile(const std::string &path, std::string &out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) return false;
    std::ostringstream ss;
    ss << is.rdbuf();
    out = ss.str();
    return true;
}

int Fail(const pagebridge::Result &r) {
    std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
    return 1;
}

void ApplyLogging(const pagebridge::config::BridgeConfig &cfg, bool verbose) {
    auto &logger = pagebridge::Logger::Instance();
    logger.SetLevel(verbose ? pagebridge::LogLevel::Debug
                            : pagebridge::ParseLogLevel(cfg.log_level).value_or(pagebridge::LogLevel::Info));
    logger.SetContentLevel(pagebridge::ParseLogLevel(cfg.content_log_level).value_or(pagebridge::LogLevel::Debug));
    if (!cfg.log_file.empty() && !logger.SetLogFile(cfg.log_file)) {
        std::fprintf(stderr, "WARN: cannot open log file: %s\n", cfg.log_file.c_str());
    }
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path;
    bool verbose = false;
    bool for_update = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"for-update", no_argument, nullptr, 'u'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:uv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'u':
                for_update = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    std::vector<std::string> args(argv + optind, argv + argc);
    if (args.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = args[0];

    struct Arity {
        const char *name;
        size_t args;
    };
    static constexpr Arity kCommands[] = {
        {"update", 2}, {"replace-body", 2}, {"copy", 2}, {"move", 2},
        {"delete", 1}, {"items", 1},        {"content", 1},
    };
    bool known = false;
    for (const auto &k : kCommands) {
        if (command == k.name) {
            known = true;
            if (args.size() != k.args + 1) {
                std::fprintf(stderr, "ERROR: '%s' expects %zu argument(s)\n", k.name, k.args);
                PrintUsage(argv[0]);
                return 2;
            }
        }
    }
    if (!known) {
        std::fprintf(stderr, "ERROR: unknown command: %s\n", command.c_str());
        PrintUsage(argv[0]);
        return 2;
    }

    pagebridge::config::BridgeConfig cfg;
    if (auto r = pagebridge::config::LoadBridgeConfig(config_path, cfg); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    ApplyLogging(cfg, verbose);

    pagebridge::TokenSet tokens;
    if (auto r = pagebridge::TokenSet::LoadFromFile(cfg.token_file, tokens); !r.ok) {
        // Requests will fail with a re-authenticate error.
        LogWarn("%s", r.msg.c_str());
    }

    pagebridge::SystemClock clock;
    pagebridge::CurlHttpTransport curl(cfg.http_timeout_seconds);
    pagebridge::OAuthTokenRefresher refresher(curl,
                                              pagebridge::OAuthSettings{
                                                  .client_id = cfg.client_id,
                                                  .tenant_id = cfg.tenant_id,
                                                  .redirect_uri = cfg.redirect_uri,
                                              },
                                              clock);
    pagebridge::AuthenticatedTransport http(curl, &refresher, tokens, cfg.token_file, clock);

    pagebridge::PageClient pages(http, pagebridge::GraphEndpoints(cfg.graph_base_url));
    if (cfg.scale_images) pages.SetImageLimits(pagebridge::ImageLimits{});
    pagebridge::PageTransfer transfer(http, pages, clock,
                                      pagebridge::PollPolicy{
                                          .max_attempts = cfg.poll_max_attempts,
                                          .min_delay_seconds = cfg.poll_min_delay_seconds,
                                          .jitter_base_seconds = cfg.poll_jitter_base_seconds,
                                      });

    if (command == "update" || command == "replace-body") {
        std::string input;
        if (!ReadFile(args[2], input)) {
            std::fprintf(stderr, "ERROR: cannot read %s\n", args[2].c_str());
            return 1;
        }
        if (command == "replace-body") {
            auto r = pages.UpdatePageSimple(args[1], input);
            return r.ok ? 0 : Fail(r);
        }
        auto commands = pagebridge::ParseCommands(input);
        if (!commands) {
            std::fprintf(stderr, "ERROR: %s: %s\n", args[2].c_str(), commands.error().c_str());
            return 1;
        }
        auto r = pages.UpdatePage(args[1], *commands);
        return r.ok ? 0 : Fail(r);
    }

    if (command == "copy") {
        pagebridge::CopyResult out;
        auto r = transfer.Copy(args[1], args[2], out);
        if (!r.ok) return Fail(r);
        std::printf("%s\n", out.new_page_id.c_str());
        return 0;
    }

    if (command == "move") {
        pagebridge::MoveResult out;
        auto r = transfer.Move(args[1], args[2], out);
        if (!r.ok) return Fail(r);
        if (!out.source_deleted) {
            std::fprintf(stderr, "WARN: %s\n", out.warning.c_str());
        }
        std::printf("%s\n", out.new_page_id.c_str());
        return 0;
    }

    if (command == "delete") {
        auto r = pages.DeletePage(args[1]);
        return r.ok ? 0 : Fail(r);
    }

    if (command == "items") {
        std::vector<pagebridge::PageItemInfo> items;
        auto r = pages.ListPageItems(args[1], items);
        if (!r.ok) return Fail(r);
        for (const auto &item : items) {
            std::printf("%s\t%s\t%s\n", item.page_item_id.c_str(), item.type.c_str(),
                        item.mime_type.empty() ? "-" : item.mime_type.c_str());
        }
        return 0;
    }

    std::string html;
    auto r = pages.GetPageContent(args[1], for_update, html);
    if (!r.ok) return Fail(r);
    std::fwrite(html.data(), 1, html.size(), stdout);
    return 0;
}
