#include "resumable/console_view.hpp"
#include "resumable/curl_transport.hpp"
#include "resumable/detail/curl_utils.hpp"
#include "resumable/detail/http_headers.hpp"
#include "resumable/scheduler.hpp"
#include "resumable/state_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <pthread.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] [-o <file>] <url> [[-o <file>] <url> ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Download directory (default: current directory)\n"
              << "  -n <count>       Concurrent downloads (default: 5)\n"
              << "  -t <seconds>     Connection and stall timeout (default: 30)\n"
              << "  -r <count>       Retries per download (default: 3)\n"
              << "  -s <directory>   Transfer state directory (default: <directory>/.resumable)\n"
              << "  -H <header>      Extra request header, \"Name: value\" (repeatable)\n"
              << "  -o <file>        Output file name for the next url\n"
              << "  -P               Never resume partial downloads\n"
              << "  -O               Do not overwrite existing files of a different size\n"
              << "  -v               More logging (repeat for debug)\n"
              << "  -q               Errors only\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parseCount(const std::string& text, const char* what, int min, int max) {
    int value = 0;
    try {
        value = std::stoi(text);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string{"Invalid "} + what + ": " + text);
    }
    if (value < min || value > max) {
        throw std::runtime_error(std::string{what} + " is out of range: " + text);
    }
    return value;
}

// SIGINT/SIGTERM are blocked in every thread and consumed here, so a Ctrl-C pauses the run
// instead of killing it mid-chunk. SIGUSR1 only wakes the watcher at shutdown.
class SignalWatcher {
public:
    explicit SignalWatcher(resumable::Scheduler& scheduler) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        thread_ = std::thread([this, &scheduler] {
            int signal = 0;
            if (sigwait(&signals_, &signal) == 0 && signal != SIGUSR1) {
                spdlog::warn("Interrupted, pausing downloads");
                interrupted_ = true;
                scheduler.cancel();
            }
        });
    }

    ~SignalWatcher() {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

    [[nodiscard]] bool interrupted() const { return interrupted_; }

private:
    sigset_t signals_{};
    std::thread thread_;
    std::atomic<bool> interrupted_{false};
};

} // namespace

int main(int argc, char** argv) {
    try {
        resumable::detail::ensureCurlInitialized();

        resumable::TransferOptions options;
        int concurrency = 5;
        std::filesystem::path download_dir = std::filesystem::current_path();
        std::optional<std::filesystem::path> state_dir;
        std::optional<std::string> next_name;
        std::vector<std::pair<std::string, std::optional<std::string>>> urls;
        int verbosity = 0;
        bool quiet = false;

        for (int arg_index = 1; arg_index < argc; ++arg_index) {
            const std::string option = argv[arg_index];
            const bool takes_value = option == "-d" || option == "-n" || option == "-t" || option == "-r" ||
                                     option == "-s" || option == "-H" || option == "-o";

            if (takes_value && arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            if (option == "-d") {
                download_dir = argv[++arg_index];
            } else if (option == "-n") {
                concurrency = parseCount(argv[++arg_index], "concurrent download count", 1, 64);
            } else if (option == "-t") {
                const auto seconds = std::chrono::seconds{parseCount(argv[++arg_index], "timeout", 1, 3600)};
                options.connect_timeout = seconds;
                options.stall_timeout = seconds;
            } else if (option == "-r") {
                options.retry.max_retries = parseCount(argv[++arg_index], "retry count", 0, 100);
            } else if (option == "-s") {
                state_dir = argv[++arg_index];
            } else if (option == "-H") {
                auto header = resumable::detail::parseHeaderLine(argv[++arg_index]);
                if (!header) {
                    throw std::runtime_error(std::string{"Invalid header: "} + argv[arg_index]);
                }
                options.default_headers.push_back(std::move(*header));
            } else if (option == "-o") {
                next_name = argv[++arg_index];
            } else if (option == "-P") {
                options.allow_resume = false;
            } else if (option == "-O") {
                options.overwrite_existing = false;
            } else if (option == "-v" || option == "-vv") {
                verbosity += option == "-vv" ? 2 : 1;
            } else if (option == "-q") {
                quiet = true;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (!option.empty() && option[0] == '-') {
                printUsage(argv[0]);
                return 1;
            } else {
                urls.emplace_back(option, std::move(next_name));
                next_name.reset();
            }
        }

        if (urls.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        auto logger = spdlog::stderr_color_mt("resumable");
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%l] %v");
        spdlog::set_level(quiet            ? spdlog::level::err
                          : verbosity >= 2 ? spdlog::level::debug
                          : verbosity == 1 ? spdlog::level::info
                                           : spdlog::level::warn);

        std::error_code ec;
        std::filesystem::create_directories(download_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: " + download_dir.string() + " - " +
                                     ec.message());
        }

        std::vector<resumable::TransferRequest> requests;
        requests.reserve(urls.size());
        for (auto& [url, name] : urls) {
            const auto file = name ? *name : resumable::filenameFromUrl(url);
            // Without -o the server may rename the file (Content-Disposition, redirects).
            requests.push_back({url, download_dir / file, {}, !name.has_value()});
        }

        auto store = std::make_shared<resumable::StateStore>(state_dir ? *state_dir : download_dir / ".resumable");
        auto transport = std::make_shared<resumable::CurlTransport>(options);
        resumable::Scheduler scheduler(transport, store, options);
        resumable::ConsoleView view(requests);

        resumable::RunSummary summary;
        bool interrupted = false;
        {
            SignalWatcher watcher(scheduler);
            auto feed = scheduler.run(requests, static_cast<std::size_t>(concurrency));
            while (auto update = feed.next()) {
                view.update(*update);
            }
            summary = feed.summary();
            interrupted = watcher.interrupted();
        }
        view.finish(summary);

        if (summary.anyFailed()) {
            return 1;
        }
        return interrupted && summary.paused > 0 ? 130 : 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
