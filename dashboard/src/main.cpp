#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <config/Config.hpp>
#include <core/Logger.hpp>
#include <geo/HexagonGeometry.hpp>
#include <networking/AnalyzerClient.hpp>
#include <networking/HttpClient.hpp>

#include "config/DashboardConfig.hpp"
#include "export/ResultExport.hpp"
#include "presentation/MapOverlay.hpp"
#include "presentation/ResultPresenter.hpp"
#include "session/AnalysisSession.hpp"

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_ANALYSIS_FAILED = 2;

std::optional<double> ParseDouble(std::string_view text) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    std::string configPath = "config/dashboard.json";
    std::string command;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> radiusKm;
    std::string csvPath;
    std::string geojsonPath;
    std::string outPath;
    bool verbose = false;
    bool showHelp = false;
    std::string error;

    static CommandLineArgs Parse(int argc, char* argv[]) {
        CommandLineArgs args;

        auto numberOption = [&](int& i, std::string_view name, std::optional<double>& target) {
            if (i + 1 >= argc) {
                args.error = std::string(name) + " needs a value";
                return;
            }
            target = ParseDouble(argv[++i]);
            if (!target) {
                args.error = std::string(name) + ": not a number: " + argv[i];
            }
        };
        auto pathOption = [&](int& i, std::string_view name, std::string& target) {
            if (i + 1 >= argc) {
                args.error = std::string(name) + " needs a value";
                return;
            }
            target = argv[++i];
        };

        for (int i = 1; i < argc && args.error.empty(); ++i) {
            std::string_view arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.showHelp = true;
            } else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            } else if (arg == "--lat") {
                numberOption(i, arg, args.latitude);
            } else if (arg == "--lon") {
                numberOption(i, arg, args.longitude);
            } else if (arg == "--radius") {
                numberOption(i, arg, args.radiusKm);
            } else if (arg == "-c" || arg == "--config") {
                pathOption(i, arg, args.configPath);
            } else if (arg == "--csv") {
                pathOption(i, arg, args.csvPath);
            } else if (arg == "--geojson") {
                pathOption(i, arg, args.geojsonPath);
            } else if (arg == "-o" || arg == "--out") {
                pathOption(i, arg, args.outPath);
            } else if (!arg.empty() && arg.front() == '-') {
                args.error = "unknown option: " + std::string(arg);
            } else if (args.command.empty()) {
                args.command = arg;
            } else {
                args.error = "unexpected argument: " + std::string(arg);
            }
        }

        return args;
    }

    static void PrintHelp() {
        std::cout << "geohex - Hexagon region analysis dashboard\n";
        std::cout << "==========================================\n\n";
        std::cout << "Usage: geohex [options] <command>\n\n";
        std::cout << "Commands:\n";
        std::cout << "  hexagon             Print the region polygon as GeoJSON\n";
        std::cout << "  health              Check that the analyzer is reachable\n";
        std::cout << "  analyze             Analyze the region and print a summary\n";
        std::cout << "  overlay             Write the map overlay GeoJSON\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help          Show this help message\n";
        std::cout << "  -c, --config PATH   Path to dashboard configuration file\n";
        std::cout << "  --lat DEG           Centre latitude\n";
        std::cout << "  --lon DEG           Centre longitude\n";
        std::cout << "  --radius KM         Hexagon radius in kilometres\n";
        std::cout << "  --csv PATH          analyze: also write the result table as CSV\n";
        std::cout << "  --geojson PATH      analyze: also write the analyzer's GeoJSON\n";
        std::cout << "  -o, --out PATH      overlay: output file (default stdout)\n";
        std::cout << "  -v, --verbose       Debug logging\n";
    }
};

int RunHexagon(const GeoHex::Geo::HexagonSpec& spec) {
    auto ring = GeoHex::Geo::GenerateHexagon(spec);
    if (!ring) {
        std::cerr << "Cannot build hexagon: " << GeoHex::Geo::GeometryErrorToString(ring.error()) << "\n";
        return EXIT_USAGE;
    }
    std::cout << GeoHex::Dashboard::ResultExport::HexagonToGeoJson(spec, *ring).dump(2) << "\n";
    return EXIT_SUCCESS;
}

int RunHealth(GeoHex::Net::AnalyzerClient& client) {
    if (!client.CheckHealth()) {
        std::cout << "Analyzer at " << client.GetEndpoint().baseUrl << " is unavailable\n";
        return EXIT_ANALYSIS_FAILED;
    }
    std::cout << "Analyzer at " << client.GetEndpoint().baseUrl << " is healthy\n";
    return EXIT_SUCCESS;
}

int RunAnalyze(GeoHex::Net::AnalyzerClient& client, const GeoHex::Geo::HexagonSpec& spec,
               const CommandLineArgs& args) {
    using namespace GeoHex::Dashboard;

    AnalysisSession session(client);
    auto snapshot = session.Run(spec);
    if (snapshot.state != SessionState::Succeeded || !snapshot.result) {
        const auto& failure = *snapshot.failure;
        std::cerr << "Analysis failed (" << GeoHex::Net::AnalyzerErrorKindToString(failure.kind)
                  << "): " << failure.message << "\n";
        return EXIT_ANALYSIS_FAILED;
    }

    for (const auto& line : ResultPresenter::SummaryLines(spec, *snapshot.result)) {
        std::cout << line << "\n";
    }

    int exitCode = EXIT_SUCCESS;
    if (!args.csvPath.empty()) {
        if (auto written = ResultExport::WriteCsv(args.csvPath, *snapshot.result); !written) {
            std::cerr << "CSV export failed: " << written.error() << "\n";
            exitCode = EXIT_ANALYSIS_FAILED;
        }
    }
    if (!args.geojsonPath.empty()) {
        auto geojson = client.FetchHexagonGeoJson(spec);
        if (!geojson) {
            std::cerr << "GeoJSON download failed: " << geojson.error().message << "\n";
            exitCode = EXIT_ANALYSIS_FAILED;
        } else if (auto written = ResultExport::WriteGeoJson(args.geojsonPath, *geojson); !written) {
            std::cerr << "GeoJSON export failed: " << written.error() << "\n";
            exitCode = EXIT_ANALYSIS_FAILED;
        }
    }
    return exitCode;
}

int RunOverlay(GeoHex::Net::AnalyzerClient& client, const GeoHex::Geo::HexagonSpec& spec,
               const GeoHex::Dashboard::DashboardConfig& settings, const CommandLineArgs& args) {
    using namespace GeoHex::Dashboard;

    // The overlay is still drawn when the analyzer is down, just without results
    std::optional<GeoHex::Geo::AnalysisResult> result;
    if (client.CheckHealth()) {
        if (auto analysis = client.Analyze(spec)) {
            result = std::move(*analysis);
        } else {
            APP_LOG_WARN("[Overlay] Analysis failed: {}", analysis.error().message);
        }
    } else {
        APP_LOG_WARN("[Overlay] {}", GeoHex::Net::ANALYZER_UNAVAILABLE_MESSAGE);
    }

    MapOverlayBuilder builder(settings.marker);
    auto overlay = builder.Build(spec, result ? &*result : nullptr);
    if (!overlay) {
        std::cerr << "Cannot build overlay: " << GeoHex::Geo::GeometryErrorToString(overlay.error()) << "\n";
        return EXIT_USAGE;
    }

    if (args.outPath.empty()) {
        std::cout << overlay->dump(2) << "\n";
        return EXIT_SUCCESS;
    }
    if (auto written = ResultExport::WriteGeoJson(args.outPath, *overlay); !written) {
        std::cerr << "Overlay export failed: " << written.error() << "\n";
        return EXIT_ANALYSIS_FAILED;
    }
    return EXIT_SUCCESS;
}

// Everything after logging is up; main() owns Logger::Shutdown()
int RunCommand(const CommandLineArgs& args, const GeoHex::Dashboard::DashboardConfig& settings) {
    GeoHex::Geo::HexagonSpec spec = settings.region.DefaultSpec();
    if (args.latitude) spec.center.latitude = *args.latitude;
    if (args.longitude) spec.center.longitude = *args.longitude;
    if (args.radiusKm) spec.radiusKm = *args.radiusKm;

    if (!settings.region.AcceptsRadius(spec.radiusKm)) {
        std::cerr << "Radius must be between " << settings.region.minRadiusKm << " and "
                  << settings.region.maxRadiusKm << " km\n";
        return EXIT_USAGE;
    }
    if (!spec.center.IsValid()) {
        std::cerr << "Centre " << spec.center.latitude << ", " << spec.center.longitude
                  << " is not a valid coordinate\n";
        return EXIT_USAGE;
    }

    APP_LOG_INFO("[GeoHex] {} at ({}, {}) radius {} km", args.command,
                 spec.center.latitude, spec.center.longitude, spec.radiusKm);

    if (args.command == "hexagon") {
        return RunHexagon(spec);
    }

    GeoHex::Net::CurlHttpClient http;
    GeoHex::Net::AnalyzerClient client(http, settings.analyzer);

    if (args.command == "health") {
        return RunHealth(client);
    }
    if (args.command == "analyze") {
        return RunAnalyze(client, spec, args);
    }
    if (args.command == "overlay") {
        return RunOverlay(client, spec, settings, args);
    }
    std::cerr << "unknown command: " << args.command << "\n";
    return EXIT_USAGE;
}

} // namespace

/**
 * @brief Main entry point for the GeoHex dashboard
 */
int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp) {
        CommandLineArgs::PrintHelp();
        return EXIT_SUCCESS;
    }
    if (!args.error.empty() || args.command.empty()) {
        std::cerr << (args.error.empty() ? "missing command" : args.error) << "\n\n";
        CommandLineArgs::PrintHelp();
        return EXIT_USAGE;
    }

    auto& config = GeoHex::Config::Instance();
    if (auto loaded = config.Load(args.configPath); !loaded) {
        std::cerr << "Failed to load " << args.configPath << ": "
                  << GeoHex::ConfigErrorToString(loaded.error()) << "\n";
        return EXIT_USAGE;
    }
    auto settings = GeoHex::Dashboard::DashboardConfig::FromConfig(config);

    GeoHex::Logger::Initialize(settings.logFile);
    if (args.verbose) {
        GeoHex::Logger::SetLevel(spdlog::level::debug);
    } else if (auto level = GeoHex::Logger::ParseLevel(settings.logLevel)) {
        GeoHex::Logger::SetLevel(*level);
    } else {
        APP_LOG_WARN("[GeoHex] Unknown log level '{}', keeping info", settings.logLevel);
    }

    const int exitCode = RunCommand(args, settings);

    APP_LOG_DEBUG("[GeoHex] Exiting with code {}", exitCode);
    GeoHex::Logger::Shutdown();
    return exitCode;
}
