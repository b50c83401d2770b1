#include <iomanip>
#include <iostream>
#include <string>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/configuration.h"
#include "monitor/completeness_checker.h"
#include "scenario.h"

namespace {

void PrintResult(const Completeness::Scenario& scenario,
		const Completeness::CompletenessChecker& checker,
		const Completeness::WindowRetention& retention,
		const Completeness::ReplayResult& result,
		bool verbose) {
	std::cout << "generation:          " << scenario.generation << "\n";
	std::cout << "window size:         " << retention.WindowMs() << " ms\n";
	std::cout << "active window:       " << checker.ActiveWindow() << "\n";
	std::cout << "total partitions:    " << scenario.TotalPartitions() << "\n";
	std::cout << "valid windows:       " << result.num_valid_windows
		<< " (max " << checker.MaxNumWindows() << ")\n";
	std::cout << "windows in range:    " << result.num_windows_in_range << "\n";
	std::cout << "evicted windows:    ";
	for (Completeness::Window window : result.evicted_windows) {
		std::cout << " " << window;
	}
	std::cout << "\n";
	std::cout << "monitored percentages:\n";
	for (const auto& [window, pct] : result.monitored_percentages) {
		std::cout << "  " << window << "\t" << std::fixed << std::setprecision(4) << pct << "\n";
	}
	if (verbose) {
		std::cout << "raw valid partitions:\n";
		for (Completeness::Window window : scenario.Windows()) {
			for (const auto& [topic, num_partitions] : scenario.topics) {
				int count = 0;
				if (checker.RawValidPartitions(window, topic, count)) {
					std::cout << "  " << window << "\t" << topic << "\t" << count << "/" << num_partitions << "\n";
				}
			}
		}
	}
	std::cout << std::flush;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("completeness_replay",
			"Replay a recorded cluster state through the metric completeness checker");
	options.add_options()
		("s,scenario", "Scenario file (YAML)", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");
	// --config, --max-num-windows, --min-pct, --exclusion, ... go to Configuration
	options.allow_unrecognised_options();

	cxxopts::ParseResult arguments;
	try {
		arguments = options.parse(argc, argv);
	} catch (const cxxopts::exceptions::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what();
		std::cerr << options.help() << std::endl;
		return 1;
	}

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		std::cout << "Configuration flags: --config <yaml> --max-num-windows <n> --window-ms <ms>"
			<< " --min-pct <0..1> --retain <n> --exclusion <window_id|legacy_partition_count>" << std::endl;
		return 0;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	if (!arguments.count("scenario")) {
		LOG(ERROR) << "--scenario is required";
		std::cerr << options.help() << std::endl;
		return 1;
	}

	Completeness::Configuration& config = Completeness::Configuration::getInstance();
	config.overrideFromCommandLine(argc, argv);
	if (!config.validate()) {
		LOG(ERROR) << "Configuration validation failed";
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Validation error: " << error;
		}
		return 1;
	}

	Completeness::Scenario scenario;
	if (!Completeness::LoadScenarioFromFile(arguments["scenario"].as<std::string>(), scenario)) {
		return 1;
	}

	const Completeness::Configuration& loaded = Completeness::GetConfig();
	Completeness::CompletenessChecker checker(loaded);
	Completeness::WindowRetention retention(checker, loaded.getWindowMs(), loaded.getNumWindowsToRetain());
	LOG(INFO) << "Replaying " << scenario.valid_partitions.size() << " windows over "
		<< scenario.topics.size() << " topics, exclusion="
		<< Completeness::ActiveWindowExclusionName(checker.Exclusion());

	Completeness::ReplayResult result = Completeness::RunScenario(
			scenario, checker, retention, loaded.getMinMonitoredPartitionsPercentage());
	PrintResult(scenario, checker, retention, result, FLAGS_v >= 1);
	return 0;
}
