#include "../../include/compression_orchestrator.hpp"
#include "../../include/engine_process.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/level_profile.hpp"
#include "../../include/logger.hpp"
#include "../../include/progress_ticker.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <optional>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace pdfshrink {

CompressionOrchestrator::CompressionOrchestrator(EventBus& bus, OrchestratorConfig config)
    : bus_(bus), config_(std::move(config)) {}

namespace {

// last write time of an existing output, nullopt when there is none yet
std::optional<fs::file_time_type> output_stamp(const fs::path& output) {
    std::error_code ec;
    const auto stamp = fs::last_write_time(output, ec);
    if (ec) {
        return std::nullopt;
    }
    return stamp;
}

} // namespace

std::vector<std::string> CompressionOrchestrator::engine_command(const CompressionRequest& request) const {
    std::vector<std::string> argv{config_.engine};
    const auto args = build_engine_arguments(profile_for_level(request.level()),
                                             request.output_path(), request.input_path());
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

CompressionResult CompressionOrchestrator::run(const CompressionRequest& request) {
    try {
        auto result = execute(request);
        Logger::log(LogLevel::Info, "Compressed " + request.input_path().string() + ": "
                    + std::to_string(result.input_size_bytes) + " -> "
                    + std::to_string(result.output_size_bytes) + " bytes", "orchestrator");
        bus_.publish(CompressionCompleteEvent{request.output_path(), result});
        return result;
    } catch (const ShrinkError& e) {
        Logger::log(LogLevel::Error, std::string(error_kind_name(e.kind())) + ": " + e.what(), "orchestrator");
        bus_.publish(CompressionErrorEvent{e.kind(), e.what()});
        throw;
    }
}

CompressionResult CompressionOrchestrator::execute(const CompressionRequest& request) {
    const LevelProfile& profile = profile_for_level(request.level());

    std::error_code ec;
    const uintmax_t input_size = fs::file_size(request.input_path(), ec);
    if (ec) {
        throw ShrinkError(ErrorKind::InputNotFound,
                          "Input file not found: " + request.input_path().string() + " (" + ec.message() + ")");
    }

    bus_.publish(CompressionStartEvent{request.input_path(), request.output_path(), request.level(), input_size});

    auto argv = engine_command(request);
    std::vector<std::string> args(std::make_move_iterator(argv.begin() + 1), std::make_move_iterator(argv.end()));
    Logger::log(LogLevel::Debug, "Level " + std::to_string(profile.level) + " ("
                + std::string(profile.description) + ")", "orchestrator");
    bus_.publish(EngineLaunchEvent{config_.engine, args});

    ProgressTicker ticker(config_.tick_interval, config_.tick_step, config_.tick_ceiling,
                          [this](const unsigned percent) { bus_.publish(ProgressEvent{percent, false}); });

    // cancel the timer, then tell the display no more ticks are coming
    const auto finish_progress = [&](const bool success) {
        if (success) {
            ticker.complete();
        } else {
            ticker.stop();
        }
        bus_.publish(ProgressEvent{ticker.percent(), true});
    };

    EngineProcess engine(config_.engine, std::move(args));
    Logger::log(LogLevel::Debug, "Launching " + engine.program() + " with "
                + std::to_string(engine.args().size()) + " arguments", "orchestrator");

    // a file left by an earlier run must not pass for this run's output
    const auto previous_output = output_stamp(request.output_path());

    const auto started = std::chrono::steady_clock::now();
    int exit_code = 0;
    try {
        ticker.start();
        engine.start();
        exit_code = engine.wait([&](const OutputStream stream, const std::string_view chunk) {
            Logger::log(LogLevel::Debug, chunk, stream == OutputStream::Stdout ? "gs:stdout" : "gs:stderr");
            if (request.verbose()) {
                bus_.publish(EngineOutputEvent{stream, std::string(chunk)});
            }
        });
    } catch (const ShrinkError&) {
        Logger::log(LogLevel::Debug, "Engine state: " + std::string(engine_state_name(engine.state())),
                    "orchestrator");
        finish_progress(false);
        throw;
    }
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    Logger::log(LogLevel::Debug, "Engine state: " + std::string(engine_state_name(engine.state())),
                "orchestrator");
    bus_.publish(EngineExitEvent{exit_code, duration});

    if (exit_code != 0) {
        finish_progress(false);
        throw EngineFailureError(exit_code, engine.stderr_text());
    }

    // gs can exit 0 without writing anything in some misconfigurations
    const auto current_output = output_stamp(request.output_path());
    const uintmax_t output_size = fs::file_size(request.output_path(), ec);
    if (ec || output_size == 0 || !current_output || current_output == previous_output) {
        finish_progress(false);
        throw ShrinkError(ErrorKind::OutputMissing,
                          "Output file was not created despite successful Ghostscript execution: "
                          + request.output_path().string());
    }

    finish_progress(true);
    return make_result(input_size, output_size, duration);
}

} // namespace pdfshrink
