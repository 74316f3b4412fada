#include <strokevault/StrokeVault.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using Clock      = std::chrono::steady_clock;
using DurationMs = std::chrono::duration<double, std::milli>;

struct CliOptions {
    std::size_t strokes = 5000;
    std::size_t edits   = 2000;
    std::size_t repeats = 3;
};

struct ModeConfig {
    std::string_view name;
    bool             insert_per_edit = false;
};

struct RunDurations {
    double               commit_ms = 0.0;
    double               undo_ms   = 0.0;
    double               redo_ms   = 0.0;
    SV::History::HistoryStats stats;
};

struct AggregatedStats {
    double      best_ms     = 0.0;
    double      worst_ms    = 0.0;
    double      mean_ms     = 0.0;
    double      ops_per_sec = 0.0;
    std::size_t samples     = 0;
};

[[noreturn]] void print_usage() {
    std::cout << "StrokeVault history sharing benchmark\n";
    std::cout << "Usage: history_sharing_benchmark [--strokes N] [--edits N] [--repeats N]\n";
    std::exit(1);
}

auto parse_positive(std::string_view value, std::string_view flag) -> std::size_t {
    std::size_t result = 0;
    auto        begin  = value.data();
    auto        end    = value.data() + value.size();
    auto        parsed = std::from_chars(begin, end, result);
    if (parsed.ec != std::errc{} || parsed.ptr != end || result == 0) {
        throw std::runtime_error("invalid value for " + std::string(flag));
    }
    return result;
}

auto parse_cli(int argc, char** argv) -> CliOptions {
    CliOptions opts{};
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::runtime_error(std::string(arg) + " requires a value");
            }
            return argv[++i];
        };
        if (arg == "--help" || arg == "-h") {
            print_usage();
        } else if (arg == "--strokes") {
            opts.strokes = parse_positive(value(), arg);
        } else if (arg == "--edits") {
            opts.edits = parse_positive(value(), arg);
        } else if (arg == "--repeats") {
            opts.repeats = parse_positive(value(), arg);
        } else {
            throw std::runtime_error("unknown flag: " + std::string(arg));
        }
    }
    return opts;
}

auto check(SV::Expected<bool> const& result, std::string_view what) -> void {
    if (!result.has_value()) {
        throw std::runtime_error(std::string(what) + ": " + SV::describeError(result.error()));
    }
    if (!*result) {
        throw std::runtime_error(std::string(what) + " had nothing to do");
    }
}

auto draw(SV::Document& document, double x, double y) -> SV::StrokeHandle {
    auto begun = document.apply(SV::Input::BeginStroke{.pos = {x, y}});
    if (!begun.has_value()) {
        throw std::runtime_error("begin_stroke: " + SV::describeError(begun.error()));
    }
    for (int i = 1; i <= 8; ++i) {
        if (auto appended = document.apply(SV::Input::AppendPoint{.pos = {x + i * 2.0, y + (i % 2)}}); !appended) {
            throw std::runtime_error("append_point: " + SV::describeError(appended.error()));
        }
    }
    if (auto ended = document.apply(SV::Input::EndStroke{}); !ended) {
        throw std::runtime_error("end_stroke: " + SV::describeError(ended.error()));
    }
    return begun->created.front();
}

auto run_sample(ModeConfig mode, CliOptions const& cli) -> RunDurations {
    SV::Config config;
    config.history.maxSnapshots = cli.edits + 2;
    config.render.workerCount   = 1;
    SV::Document document(config);

    std::vector<SV::StrokeHandle> handles;
    handles.reserve(cli.strokes);
    {
        auto gesture = document.beginGesture("Seed");
        for (std::size_t i = 0; i < cli.strokes; ++i) {
            handles.push_back(draw(document, static_cast<double>(i % 100) * 20.0, static_cast<double>(i / 100) * 20.0));
        }
        gesture.commit();
    }
    auto const seeded = document.store().liveCount();

    // Commit latency: every edit records one snapshot.
    auto commit_start = Clock::now();
    for (std::size_t i = 0; i < cli.edits; ++i) {
        if (mode.insert_per_edit) {
            draw(document, static_cast<double>(i) * 3.0, -50.0);
            continue;
        }
        SV::StrokeHandle const one[] = {handles[(i * 7919) % handles.size()]};
        if (auto selected = document.setSelection(one); !selected) {
            throw std::runtime_error("select: " + SV::describeError(selected.error()));
        }
        auto moved = document.apply(SV::Input::MoveSelection{.delta = {1.0, 0.0}});
        if (!moved.has_value() || !moved->committed) {
            throw std::runtime_error(std::string(mode.name) + " move did not commit");
        }
    }
    auto commit_end = Clock::now();
    auto stats      = document.history().stats();

    auto undo_start = Clock::now();
    for (std::size_t i = 0; i < cli.edits; ++i) {
        check(document.undo(), "undo");
    }
    auto undo_end = Clock::now();

    if (document.store().liveCount() != seeded) {
        throw std::runtime_error(std::string(mode.name) + " verification failed after undo");
    }

    auto redo_start = Clock::now();
    for (std::size_t i = 0; i < cli.edits; ++i) {
        check(document.redo(), "redo");
    }
    auto redo_end = Clock::now();

    return {DurationMs(commit_end - commit_start).count(),
            DurationMs(undo_end - undo_start).count(),
            DurationMs(redo_end - redo_start).count(),
            stats};
}

auto aggregate(std::vector<double> const& samples, std::size_t operations) -> AggregatedStats {
    AggregatedStats stats{};
    stats.samples = samples.size();
    if (samples.empty()) {
        return stats;
    }
    stats.best_ms  = *std::min_element(samples.begin(), samples.end());
    stats.worst_ms = *std::max_element(samples.begin(), samples.end());
    stats.mean_ms  = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
    if (stats.mean_ms > 0.0) {
        stats.ops_per_sec = static_cast<double>(operations) / (stats.mean_ms / 1000.0);
    }
    return stats;
}

void report_mode(ModeConfig mode, CliOptions const& cli, std::vector<RunDurations> const& runs) {
    std::vector<double> commit;
    std::vector<double> undo;
    std::vector<double> redo;
    for (auto const& run : runs) {
        commit.push_back(run.commit_ms);
        undo.push_back(run.undo_ms);
        redo.push_back(run.redo_ms);
    }

    auto print_stats = [](char const* label, AggregatedStats const& stats) {
        std::cout << "  " << std::left << std::setw(6) << label << " mean " << std::right << std::setw(8) << std::fixed
                  << std::setprecision(3) << stats.mean_ms << " ms"
                  << "  best " << std::setw(8) << stats.best_ms << " ms"
                  << "  worst " << std::setw(8) << stats.worst_ms << " ms"
                  << "  ops/s " << std::setw(10) << std::setprecision(1) << std::fixed << stats.ops_per_sec << "\n";
    };

    std::cout << "\nMode: " << mode.name << " (repeats=" << runs.size() << ", strokes=" << cli.strokes
              << ", edits=" << cli.edits << ")\n";
    print_stats("commit", aggregate(commit, cli.edits));
    print_stats("undo", aggregate(undo, cli.edits));
    print_stats("redo", aggregate(redo, cli.edits));
    if (!runs.empty()) {
        std::cout << "  history " << SV::History::statsToJson(runs.back().stats).dump() << "\n";
    }
}

void run_benchmark(CliOptions const& cli) {
    ModeConfig const modes[] = {{.name = "translate", .insert_per_edit = false}, {.name = "insert", .insert_per_edit = true}};
    for (auto const& mode : modes) {
        std::vector<RunDurations> runs;
        runs.reserve(cli.repeats);
        for (std::size_t i = 0; i < cli.repeats; ++i) {
            runs.push_back(run_sample(mode, cli));
        }
        report_mode(mode, cli, runs);
    }
}

} // namespace

int main(int argc, char** argv) try {
    auto cli = parse_cli(argc, argv);
    run_benchmark(cli);
    return 0;
} catch (std::exception const& ex) {
    std::cerr << "benchmark failed: " << ex.what() << "\n";
    return 1;
}
