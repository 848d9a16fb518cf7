#include "bulkup/archive/archive_source.hpp"
#include "bulkup/config/config.hpp"
#include "bulkup/events/components.hpp"
#include "bulkup/events/event_bus.hpp"
#include "bulkup/progress/aggregator.hpp"
#include "bulkup/receiver/chunk_assembler.hpp"
#include "bulkup/transfer/file_source.hpp"
#include "bulkup/transfer/upload_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <file>...\n"
              << "  -c, --config <path>    JSON upload settings\n"
              << "  -o, --output <dir>     Where assembled files land (default ./received)\n"
              << "  -s, --staging <dir>    Chunk staging directory (default ./received/.staging)\n"
              << "  -a, --archive          Upload each file as a single-entry tar\n"
              << "  -l, --latency <ms>     Simulated per-chunk latency\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> config_path;
    fs::path output_dir = fs::current_path() / "received";
    std::optional<fs::path> staging_dir;
    bool archive_flag = false;
    int latency_ms = 0;
    std::vector<fs::path> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_dir = fs::path(argv[++i]);
        } else if ((arg == "-s" || arg == "--staging") && i + 1 < argc) {
            staging_dir = fs::path(argv[++i]);
        } else if (arg == "-a" || arg == "--archive") {
            archive_flag = true;
        } else if ((arg == "-l" || arg == "--latency") && i + 1 < argc) {
            latency_ms = std::stoi(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            inputs.emplace_back(arg);
        }
    }

    if (inputs.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    bulkup::config::UploaderConfig config;
    if (config_path) {
        auto loaded = bulkup::config::load_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().message);
            return 1;
        }
        config = loaded.value();
    }
    if (auto res = bulkup::config::apply_logging(config); res.is_error()) {
        spdlog::error("{}", res.error().message);
        return 1;
    }
    const bool use_archive = archive_flag || config.archive;

    bulkup::events::EventBus event_bus;
    bulkup::events::LoggerComponent logger(event_bus);
    bulkup::events::MetricsComponent metrics(event_bus);

    bulkup::receiver::ChunkAssembler assembler(staging_dir.value_or(output_dir / ".staging"));
    auto store = assembler.sender();
    bulkup::transfer::ChunkSender sender = [&store, latency_ms](const bulkup::transfer::ChunkEnvelope& envelope) {
        if (latency_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms));
        }
        return store(envelope);
    };

    std::vector<std::shared_ptr<bulkup::transfer::FileSource>> sources;
    std::uint64_t total_bytes = 0;
    for (const auto& input : inputs) {
        auto opened = bulkup::transfer::DiskFileSource::open(input);
        if (opened.is_error()) {
            spdlog::error("{}", opened.error().message);
            return 1;
        }
        std::shared_ptr<bulkup::transfer::FileSource> source = std::move(opened.value());

        if (use_archive) {
            auto wrapped = bulkup::archive::ArchiveFileSource::create(source);
            if (wrapped.is_error()) {
                spdlog::error("{}", wrapped.error().message);
                return 1;
            }
            source = std::move(wrapped.value());
        }
        total_bytes += source->size();
        sources.push_back(std::move(source));
    }

    bulkup::progress::ProgressAggregator aggregator;
    aggregator.set_total_bytes_to_upload(total_bytes);

    bulkup::transfer::UploadClient client(sender, &aggregator, &event_bus);

    auto options = bulkup::config::to_upload_options(config);
    int last_percent = -1;
    options.on_progress = [&aggregator, &last_percent](const bulkup::transfer::ProgressUpdate&) {
        const auto snap = aggregator.snapshot();
        if (snap.percent_clamped == last_percent) {
            return;
        }
        last_percent = snap.percent_clamped;
        spdlog::info("Overall {}% ({}/{} bytes, {:.1f} KiB/s, eta {})",
                     snap.percent_clamped, snap.loaded_bytes, snap.stable_total,
                     snap.speed_bytes_per_sec / 1024.0,
                     snap.eta_seconds ? std::to_string(*snap.eta_seconds) + "s" : std::string("?"));
    };

    const auto result = client.upload_files(sources, options);

    int exit_code = result.failed.empty() ? 0 : 2;
    for (const auto& name : result.successful) {
        const auto it = std::find_if(sources.begin(), sources.end(),
                                     [&name](const auto& source) { return source->name() == name; });
        if (it != sources.end() && (*it)->size() == 0) {
            // Nothing was sent for an empty file; materialize it directly.
            std::error_code ec;
            fs::create_directories(output_dir, ec);
            std::ofstream empty(output_dir / name, std::ios::binary | std::ios::trunc);
            if (!empty) {
                spdlog::error("Failed to create {}", (output_dir / name).string());
                exit_code = 2;
                continue;
            }
            spdlog::info("Created empty file {}", (output_dir / name).string());
            continue;
        }

        auto placed = assembler.assemble(name, output_dir);
        if (placed.is_error()) {
            spdlog::error("Failed to assemble {}: {}", name, placed.error().message);
            exit_code = 2;
            continue;
        }
        spdlog::info("Stored {}", placed.value().string());
    }

    for (const auto& failure : result.failed) {
        spdlog::error("{} failed ({}): {}", failure.file_name, bulkup::to_string(failure.error.code),
                      failure.error.message);
        assembler.discard(failure.file_name);
    }

    metrics.print_stats();
    return exit_code;
}
