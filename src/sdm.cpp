#include <argparse/argparse.hpp>
#include <chrono>
#include <iostream>
#include <mutex>
#include <sdm/common.hpp>
#include <sdm/http.hpp>
#include <sdm/progress.hpp>
#include <sdm/transfer.hpp>
#include <sdm/url.hpp>

using namespace sdm;

struct Main {
    struct CLI {
        std::string url = {};
        std::string output = {};
        bool no_progress = {};
        Transfer::Options transfer = {};
        HTTP::Options http = {};
    } cli = {};
    std::mutex console = {};
    std::optional<progress_bar> bar = {};
    ChunkPlan plan = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Downloads a single file over HTTP with parallel range requests.");
        program.add_argument("command")
            .help("Command to run, only \"download\" is supported.")
            .required()
            .action([](std::string const& value) -> std::string {
                if (value != "download") {
                    throw std::runtime_error(fmt::format("Unknown command: {}", value));
                }
                return value;
            });
        program.add_argument("url").help("Url of the file to download.").required();
        program.add_argument("-o", "--output")
            .help("Destination file or directory, derived from the url by default.")
            .default_value(std::string{});
        program.add_argument("-w", "--worker")
            .help("Number of parallel connections, 0 picks one from the file size.")
            .default_value(std::uint32_t{0})
            .action([](std::string const& value) -> std::uint32_t { return (std::uint32_t)std::stoul(value); });

        // Retry options
        program.add_argument("--retry")
            .help("Number of retries per chunk [0, 16].")
            .default_value(std::uint32_t{3})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 0u, 16u);
            });
        program.add_argument("--retry-delay")
            .help("Delay between retries in miliseconds [0, 60000].")
            .default_value(std::uint32_t{2000})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 0u, 60000u);
            });
        program.add_argument("--no-progress").help("Do not print progress.").default_value(false).implicit_value(true);

        // Curl options
        program.add_argument("--verbose").help("Curl: verbose logging.").default_value(false).implicit_value(true);
        program.add_argument("--buffer")
            .help("Curl buffer size in killobytes [1, 512].")
            .default_value(long{512 * KiB})
            .action(
                [](std::string const& value) -> long { return std::clamp((long)std::stoul(value), 1l, 512l) * KiB; });
        program.add_argument("--proxy").help("Curl: proxy.").default_value(std::string{});
        program.add_argument("--useragent").help("Curl: user agent string.").default_value(std::string{"sdm/1.0"});
        program.add_argument("--connect-timeout")
            .help("Curl: connect timeout in seconds.")
            .default_value(long{30})
            .action([](std::string const& value) -> long { return (long)std::stoul(value); });
        program.add_argument("--low-speed-limit")
            .help("Curl: abort below this many bytes per second.")
            .default_value(long{1024})
            .action([](std::string const& value) -> long { return (long)std::stoul(value); });
        program.add_argument("--low-speed-time")
            .help("Curl: seconds below the speed limit before abort, 0 disables.")
            .default_value(long{60})
            .action([](std::string const& value) -> long { return (long)std::stoul(value); });
        program.add_argument("--max-redirects")
            .help("Curl: maximum number of redirects to follow.")
            .default_value(long{10})
            .action([](std::string const& value) -> long { return (long)std::stoul(value); });
        program.add_argument("--insecure")
            .help("Curl: do not verify TLS peer and host.")
            .default_value(false)
            .implicit_value(true);

        program.parse_args(argc, argv);

        cli.url = program.get<std::string>("url");
        cli.output = program.get<std::string>("--output");
        cli.no_progress = program.get<bool>("--no-progress");

        cli.transfer = {
            .workers = program.get<std::uint32_t>("--worker"),
            .retry =
                {
                    .retries = program.get<std::uint32_t>("--retry"),
                    .backoff = std::chrono::milliseconds{program.get<std::uint32_t>("--retry-delay")},
                },
        };

        cli.http = {
            .verbose = program.get<bool>("--verbose"),
            .buffer = program.get<long>("--buffer"),
            .proxy = program.get<std::string>("--proxy"),
            .useragent = program.get<std::string>("--useragent"),
            .connect_timeout = program.get<long>("--connect-timeout"),
            .low_speed_limit = program.get<long>("--low-speed-limit"),
            .low_speed_time = program.get<long>("--low-speed-time"),
            .max_redirects = program.get<long>("--max-redirects"),
            .insecure = program.get<bool>("--insecure"),
        };
    }

    auto run() -> void {
        auto const path = resolve_output(cli.url, cli.output);
        sdm_trace("Output file: %s", path.string().c_str());

        auto events = Transfer::Events{};
        events.on_probe = [this](TransferSpec const& spec) {
            if (spec.total_size) {
                std::cout << fmt::format("File size: {} bytes", *spec.total_size) << std::endl;
            }
            if (!spec.supports_ranges) {
                std::cout << "Server does not support partial downloads, falling back to single stream..."
                          << std::endl;
            }
            bar.emplace("DOWNLOAD", cli.no_progress, spec.total_size);
        };
        events.on_plan = [this](ChunkPlan const& chunks) {
            plan = chunks;
            std::lock_guard<std::mutex> lock(console);
            std::cout << fmt::format("Using {} workers...", plan.size()) << std::endl;
        };
        events.on_progress = [this](std::int64_t done, std::optional<std::int64_t>) {
            std::lock_guard<std::mutex> lock(console);
            if (bar) {
                bar->update(done);
            }
        };
        events.on_retry = [this](std::uint32_t index, std::uint32_t attempt, Error const& error) {
            std::lock_guard<std::mutex> lock(console);
            std::cerr << fmt::format("\nRetrying chunk #{} [{}] (attempt {}): {}",
                                     index,
                                     plan[index].range(),
                                     attempt + 1,
                                     error.what())
                      << std::endl;
        };

        auto const start = std::chrono::steady_clock::now();
        auto transfer = Transfer(
            [http = cli.http]() -> std::unique_ptr<HTTP> { return std::make_unique<HTTP::Curl>(http); },
            cli.transfer,
            std::move(events));
        transfer.run(cli.url, path);
        bar.reset();
        auto const elapsed = std::chrono::steady_clock::now() - start;

        auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        auto const seconds = std::chrono::duration<double>(elapsed).count();
        auto const speed = seconds > 0.0 ? (double)transfer.bytes_written() / seconds : 0.0;
        std::cout << "Download completed successfully!" << std::endl;
        std::cout << fmt::format("Downloaded in: {} ms", ms) << std::endl;
        std::cout << fmt::format("Average speed: {}/s", format_bytes(speed)) << std::endl;
    }
};

int main(int argc, char** argv) {
    auto main = Main{};
    try {
        main.parse_args(argc, argv);
        main.run();
    } catch (std::exception const& e) {
        main.bar.reset();
        std::cerr << e.what() << std::endl;
        for (auto const& error : error_stack()) {
            std::cerr << error << std::endl;
        }
        error_stack().clear();
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
