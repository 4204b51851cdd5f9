#include "run_cli.hpp"
#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "../utils/color.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "cli_parser.hpp"
#include "../report/report_generator.hpp"
#include "../../../libpdfshrink/include/compression_orchestrator.hpp"
#include "../../../libpdfshrink/include/compression_request.hpp"
#include "../../../libpdfshrink/include/errors.hpp"
#include "../../../libpdfshrink/include/event_bus.hpp"
#include "../../../libpdfshrink/include/events.hpp"
#include "../../../libpdfshrink/include/logger.hpp"
#include "../../../libpdfshrink/include/mime_detector.hpp"

using namespace pdfshrink;

static void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file);
        if (!file_sink->is_open()) {
            std::cerr << YELLOW << "Warning: cannot open log file " << settings.log_file.string()
                      << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
        }
    }

    // NONE disables console logging only
    if (const auto level = Logger::string_to_level(settings.log_level)) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = *level;
        Logger::add_sink(std::move(console_sink));
    }
}

static void print_error(const std::exception& e, const bool verbose) {
    std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
    if (!verbose) {
        return;
    }
    if (const auto* shrink = dynamic_cast<const ShrinkError*>(&e)) {
        std::cerr << RED << "  kind: " << error_kind_name(shrink->kind()) << RESET << std::endl;
    }
    if (const auto* failure = dynamic_cast<const EngineFailureError*>(&e)) {
        std::cerr << RED << "  exit code: " << failure->exit_code() << "\n"
                  << "  engine stderr:\n" << failure->stderr_text() << RESET << std::endl;
    }
}

int run_cli(const int argc, const char* const argv[]) {
    CLI::App app{"pdfshrink: A tool to compress PDF files using Ghostscript."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        app.exit(e);
        return 1;
    }

    setup_logging(settings);

    EventBus bus;
    const bool show = !settings.quiet;

    bus.subscribe<CompressionStartEvent>([show](const CompressionStartEvent& e) {
        if (show) print_start_summary(e);
    });

    bus.subscribe<EngineLaunchEvent>([&settings](const EngineLaunchEvent& e) {
        if (!settings.verbose) return;
        std::cout << GRAY << "Ghostscript command: " << RESET << e.program;
        for (const auto& arg : e.args) {
            std::cout << " " << arg;
        }
        std::cout << std::endl;
    });

    bus.subscribe<ProgressEvent>([show](const ProgressEvent& e) {
        if (show) print_progress_bar(e.percent, e.finished);
    });

    // only published for verbose requests
    bus.subscribe<EngineOutputEvent>([](const EngineOutputEvent& e) {
        if (e.stream == OutputStream::Stdout) {
            std::cout << GRAY << "\nGS stdout: " << e.text << RESET << std::endl;
        } else {
            std::cout << YELLOW << "\nGS stderr: " << e.text << RESET << std::endl;
        }
    });

    bus.subscribe<CompressionCompleteEvent>([show](const CompressionCompleteEvent& e) {
        if (show) print_completion_summary(e);
    });

    Result report;
    report.path = settings.input;
    int exit_code = 0;

    try {
        const CompressionRequest request = resolve_request(settings.raw_options());
        report.level = request.level();

        if (request.output_derived() && show) {
            std::cout << YELLOW << "No output specified, using: " << request.output_path().string()
                      << RESET << std::endl;
        }

        OrchestratorConfig config;
        config.engine = settings.engine;
        CompressionOrchestrator orchestrator(bus, config);

        const CompressionResult result = orchestrator.run(request);
        report.size_before = result.input_size_bytes;
        report.size_after = result.output_size_bytes;
        report.ratio = result.ratio;
        report.percent_saved = result.percent_saved;
        report.seconds = static_cast<double>(result.duration.count()) / 1000.0;
        report.success = true;
    } catch (const std::exception& e) {
        print_error(e, settings.verbose);
        report.error_msg = e.what();
        exit_code = 1;
    }

    if (!settings.report_path.empty()) {
        report.mime = MimeDetector::detect(report.path);
        if (!export_csv_report(report, settings.report_path)) {
            std::cerr << RED << "Error: failed to write report " << settings.report_path.string()
                      << RESET << std::endl;
        }
    }

    return exit_code;
}
