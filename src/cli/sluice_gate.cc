#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "gate/feature_scanner.h"
#include "gate/gate_scorer.h"

using namespace Sluice;

namespace {

bool ReadFile(const std::string& path, std::string& content) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    content = buffer.str();
    return !in.bad();
}

void PrintResult(const std::string& path, const GateFeatures& features, double score,
                 Decision decision) {
    std::cout << path << "\n"
              << "  html_bytes=" << features.html_bytes
              << " visible_text_chars=" << features.visible_text_chars
              << " script_bytes=" << features.script_bytes << "\n"
              << "  paragraphs=" << features.paragraph_count
              << " articles=" << features.article_tag_count
              << " headings=" << features.heading_count
              << " og_title=" << (features.has_open_graph_title ? "yes" : "no")
              << " jsonld_article=" << (features.has_jsonld_article ? "yes" : "no") << "\n"
              << "  spa_markers=" << GateScorer::CountSpaMarkers(features.spa_marker_flags)
              << " domain_prior=" << features.domain_prior << "\n"
              << "  score=" << score << " decision=" << ToString(decision) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    cxxopts::Options options("sluice_gate", "Score HTML documents and print the extraction mode");
    options.add_options()
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("p,prior", "Domain prior in [0,1]", cxxopts::value<double>())
        ("hi", "Raw threshold override", cxxopts::value<double>())
        ("lo", "Headless threshold override", cxxopts::value<double>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("files", "HTML files to score", cxxopts::value<std::vector<std::string>>())
        ("h,help", "Print usage");
    options.parse_positional({"files"});
    options.positional_help("FILE...");

    cxxopts::ParseResult arguments;
    try {
        arguments = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 1;
    }

    FLAGS_v = arguments["log_level"].as<int>();
    FLAGS_logtostderr = 1;

    if (arguments.count("help") || !arguments.count("files")) {
        std::cout << options.help() << std::endl;
        return arguments.count("help") ? 0 : 1;
    }

    Configuration& config = Configuration::getInstance();
    if (arguments.count("config")) {
        if (!config.loadFromFile(arguments["config"].as<std::string>())) {
            LOG(ERROR) << "Could not load configuration "
                       << arguments["config"].as<std::string>();
            return 1;
        }
    }

    GateThresholds thresholds = config.gateThresholds();
    if (arguments.count("hi")) {
        thresholds.hi = arguments["hi"].as<double>();
    }
    if (arguments.count("lo")) {
        thresholds.lo = arguments["lo"].as<double>();
    }
    absl::StatusOr<GateScorer> gate = GateScorer::Create(thresholds);
    if (!gate.ok()) {
        LOG(ERROR) << "Invalid gate thresholds: " << gate.status();
        return 1;
    }

    const double prior = arguments.count("prior") ? arguments["prior"].as<double>()
                                                   : config.config().gate.default_domain_prior.get();

    int exit_code = 0;
    for (const auto& path : arguments["files"].as<std::vector<std::string>>()) {
        std::string html;
        if (!ReadFile(path, html)) {
            LOG(ERROR) << "Cannot read " << path;
            exit_code = 1;
            continue;
        }
        const GateFeatures features =
            GateScorer::SanitizeFeatures(FeatureScanner::ScanHtml(html, prior));
        const double score = GateScorer::Score(features);
        const Decision decision = gate->Decide(features);
        VLOG(1) << path << ": score " << score << " -> " << ToString(decision);
        PrintResult(path, features, score, decision);
    }
    return exit_code;
}
