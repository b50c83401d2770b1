#include "scenario.h"

#include <limits>

#include "absl/container/flat_hash_map.h"
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Completeness {

namespace {

bool ParseScenarioRoot(const YAML::Node& yaml, Scenario& scenario) {
	if (!yaml["scenario"]) {
		LOG(ERROR) << "Scenario has no 'scenario' section";
		return false;
	}
	auto root = yaml["scenario"];
	Scenario parsed;

	if (root["generation"]) {
		auto generation = root["generation"];
		if (generation["cluster"]) parsed.generation.cluster_generation = generation["cluster"].as<int>();
		if (generation["load"]) parsed.generation.load_generation = generation["load"].as<int64_t>();
	}
	if (root["active_window"]) {
		parsed.active_window = root["active_window"].as<Window>();
	}

	if (!root["topology"] || !root["topology"].IsMap() || root["topology"].size() == 0) {
		LOG(ERROR) << "Scenario needs a non-empty 'topology' map of topic -> partition count";
		return false;
	}
	absl::flat_hash_map<std::string, int> partitions_per_topic;
	for (const auto& entry : root["topology"]) {
		std::string topic = entry.first.as<std::string>();
		int num_partitions = entry.second.as<int>();
		if (num_partitions < 0) {
			LOG(ERROR) << "Topic " << topic << " has a negative partition count";
			return false;
		}
		if (!partitions_per_topic.emplace(topic, num_partitions).second) {
			LOG(ERROR) << "Topic " << topic << " is declared twice";
			return false;
		}
		parsed.topics.emplace_back(topic, num_partitions);
	}

	if (!root["windows"] || !root["windows"].IsSequence()) {
		LOG(ERROR) << "Scenario needs a 'windows' sequence";
		return false;
	}
	for (const auto& window_node : root["windows"]) {
		if (!window_node["window"]) {
			LOG(ERROR) << "Window entry without a 'window' id";
			return false;
		}
		Window window = window_node["window"].as<Window>();
		std::set<TopicPartition>& valid = parsed.valid_partitions[window];
		if (!window_node["valid"]) {
			continue;
		}
		for (const auto& tp_node : window_node["valid"]) {
			std::string text = tp_node.as<std::string>();
			TopicPartition tp;
			if (!ParseTopicPartition(text, tp)) {
				LOG(ERROR) << "Window " << window << ": malformed partition '" << text << "'";
				return false;
			}
			auto it = partitions_per_topic.find(tp.topic);
			if (it == partitions_per_topic.end()) {
				LOG(ERROR) << "Window " << window << ": topic " << tp.topic << " is not in the topology";
				return false;
			}
			if (tp.partition >= it->second) {
				LOG(ERROR) << "Window " << window << ": " << tp << " exceeds the " << it->second
					<< " partitions of " << tp.topic;
				return false;
			}
			valid.insert(tp);
		}
	}

	if (root["queries"]) {
		auto queries = root["queries"];
		if (queries["min_monitored_partitions_percentage"]) {
			parsed.min_monitored_partitions_percentage =
				queries["min_monitored_partitions_percentage"].as<double>();
		}
		if (queries["range"]) {
			auto range = queries["range"];
			Window from = range["from"] ? range["from"].as<Window>() : std::numeric_limits<Window>::min();
			Window to = range["to"] ? range["to"].as<Window>() : std::numeric_limits<Window>::max();
			parsed.range = std::make_pair(from, to);
		}
	}

	scenario = std::move(parsed);
	return true;
}

} // namespace

bool ParseTopicPartition(const std::string& text, TopicPartition& out) {
	size_t dash = text.rfind('-');
	if (dash == std::string::npos || dash == 0 || dash + 1 == text.size()) {
		return false;
	}
	const std::string suffix = text.substr(dash + 1);
	for (char c : suffix) {
		if (c < '0' || c > '9') {
			return false;
		}
	}
	try {
		out.partition = std::stoi(suffix);
	} catch (const std::exception&) {
		return false;
	}
	out.topic = text.substr(0, dash);
	return true;
}

bool LoadScenarioFromFile(const std::string& filename, Scenario& scenario) {
	try {
		YAML::Node yaml = YAML::LoadFile(filename);
		return ParseScenarioRoot(yaml, scenario);
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to parse scenario file " << filename << ": " << e.what();
		return false;
	}
}

bool LoadScenarioFromString(const std::string& yaml_content, Scenario& scenario) {
	try {
		YAML::Node yaml = YAML::Load(yaml_content);
		return ParseScenarioRoot(yaml, scenario);
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to parse scenario: " << e.what();
		return false;
	}
}

std::vector<TopicPartition> Scenario::AllPartitions() const {
	std::vector<TopicPartition> partitions;
	for (const auto& [topic, num_partitions] : topics) {
		for (int p = 0; p < num_partitions; ++p) {
			partitions.emplace_back(topic, p);
		}
	}
	return partitions;
}

std::set<Window> Scenario::Windows() const {
	std::set<Window> windows;
	for (const auto& [window, valid] : valid_partitions) {
		windows.insert(window);
	}
	return windows;
}

int Scenario::TotalPartitions() const {
	int total = 0;
	for (const auto& [topic, num_partitions] : topics) {
		total += num_partitions;
	}
	return total;
}

void Scenario::FillTopology(StaticTopology& topology) const {
	for (const auto& [topic, num_partitions] : topics) {
		topology.SetPartitionCount(topic, num_partitions);
	}
}

bool ScenarioSampleSource::IsValidPartition(Window window, const TopicPartition& tp) const {
	auto it = scenario_.valid_partitions.find(window);
	return it != scenario_.valid_partitions.end() && it->second.count(tp) > 0;
}

ReplayResult RunScenario(const Scenario& scenario,
		CompletenessChecker& checker,
		WindowRetention& retention,
		double min_monitored_partitions_percentage) {
	StaticTopology topology;
	scenario.FillTopology(topology);
	ScenarioSampleSource source(scenario);

	const std::set<Window> windows = scenario.Windows();
	checker.RefreshAllPartitionCompleteness(source, windows, scenario.AllPartitions());

	ReplayResult result;
	// Oldest first, so eviction order matches a live window roll
	for (Window window : windows) {
		std::vector<Window> evicted = retention.Track(window);
		result.evicted_windows.insert(result.evicted_windows.end(), evicted.begin(), evicted.end());
	}

	const double min_pct = scenario.min_monitored_partitions_percentage.value_or(
			min_monitored_partitions_percentage);
	const int total_num_partitions = scenario.TotalPartitions();

	result.num_valid_windows = checker.NumValidWindows(
			scenario.generation, topology, min_pct, total_num_partitions);
	result.monitored_percentages = checker.MonitoredPercentages(
			scenario.generation, topology, total_num_partitions);
	const auto range = scenario.range.value_or(std::make_pair(
				std::numeric_limits<Window>::min(), std::numeric_limits<Window>::max()));
	result.num_windows_in_range = checker.NumWindows(range.first, range.second);

	VLOG(1) << "[Replay] generation " << scenario.generation << " windows="
		<< scenario.valid_partitions.size() << " partitions=" << total_num_partitions
		<< " evicted=" << result.evicted_windows.size()
		<< " valid_windows=" << result.num_valid_windows;
	return result;
}

} // End of namespace Completeness
