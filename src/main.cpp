#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

#include "upstand.hpp"

namespace {

std::atomic<bool> g_Shutdown{false};

void OnSignal(int) {
    g_Shutdown.store(true);
}

// ─────────────────────────────────────
void PrintUsage(const char *argv0) {
    std::fprintf(stderr,
                 "Usage: %s [--port N] [--log-level debug|info|off] [--data-dir PATH]\n"
                 "          [--work-area WIDTHxHEIGHT] [--help]\n",
                 argv0);
}

// ─────────────────────────────────────
bool ParsePort(const std::string &value, unsigned &out) {
    try {
        std::size_t pos = 0;
        const unsigned long port = std::stoul(value, &pos);
        if (pos != value.size() || port == 0 || port > 65535) {
            return false;
        }
        out = static_cast<unsigned>(port);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

// ─────────────────────────────────────
bool ParseWorkArea(const std::string &value, WorkArea &out) {
    const std::size_t sep = value.find('x');
    if (sep == std::string::npos) {
        return false;
    }
    try {
        std::size_t wpos = 0;
        std::size_t hpos = 0;
        const std::string w = value.substr(0, sep);
        const std::string h = value.substr(sep + 1);
        const int width = std::stoi(w, &wpos);
        const int height = std::stoi(h, &hpos);
        if (wpos != w.size() || hpos != h.size() || width <= 0 || height <= 0) {
            return false;
        }
        out.x = 0;
        out.y = 0;
        out.width = width;
        out.height = height;
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

} // namespace

// ─────────────────────────────────────
int main(int argc, char **argv) {
    unsigned port = UPSTAND_DEFAULT_PORT;
    LogLevel level = LOG_INFO;
    std::string dataDir;
    std::optional<WorkArea> workArea;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            PrintUsage(argv[0]);
            return 2;
        }
        const std::string value = argv[++i];
        if (arg == "--port") {
            if (!ParsePort(value, port)) {
                std::fprintf(stderr, "invalid port: %s\n", value.c_str());
                PrintUsage(argv[0]);
                return 2;
            }
        } else if (arg == "--log-level") {
            if (value == "debug") {
                level = LOG_DEBUG;
            } else if (value == "info") {
                level = LOG_INFO;
            } else if (value == "off") {
                level = LOG_OFF;
            } else {
                std::fprintf(stderr, "invalid log level: %s\n", value.c_str());
                PrintUsage(argv[0]);
                return 2;
            }
        } else if (arg == "--data-dir") {
            dataDir = value;
        } else if (arg == "--work-area") {
            WorkArea area;
            if (!ParseWorkArea(value, area)) {
                std::fprintf(stderr, "invalid work area: %s\n", value.c_str());
                PrintUsage(argv[0]);
                return 2;
            }
            workArea = area;
        } else {
            std::fprintf(stderr, "unknown option: %s\n", arg.c_str());
            PrintUsage(argv[0]);
            return 2;
        }
    }

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    Upstand app(port, level, dataDir, workArea);
    if (!app.Start()) {
        return 1;
    }
    app.Run(g_Shutdown);
    return 0;
}
