#ifndef INCLUDE_REPLAY_SCENARIO_H_
#define INCLUDE_REPLAY_SCENARIO_H_

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "monitor/completeness_checker.h"
#include "monitor/interfaces.h"
#include "monitor/static_topology.h"
#include "monitor/types.h"
#include "monitor/window_retention.h"

namespace Completeness {

/**
 * A recorded cluster state: topology, per-window valid partitions and the
 * queries to run against it
 */
struct Scenario {
	ModelGeneration generation;
	Window active_window = kNoActiveWindow;
	// Topic name -> partition count, in file order
	std::vector<std::pair<std::string, int>> topics;
	// Every window in the scenario, including those without valid partitions
	std::map<Window, std::set<TopicPartition>> valid_partitions;
	std::optional<double> min_monitored_partitions_percentage;
	std::optional<std::pair<Window, Window>> range;

	// All partitions of all topics
	std::vector<TopicPartition> AllPartitions() const;
	std::set<Window> Windows() const;
	int TotalPartitions() const;
	void FillTopology(StaticTopology& topology) const;
};

/**
 * Parse "<topic>-<partition>". The topic may itself contain '-'.
 *
 * @return false if there is no numeric partition suffix
 */
bool ParseTopicPartition(const std::string& text, TopicPartition& out);

// Load a scenario; logs and returns false on malformed input
bool LoadScenarioFromFile(const std::string& filename, Scenario& scenario);
bool LoadScenarioFromString(const std::string& yaml_content, Scenario& scenario);

/**
 * Validity provider answering from a scenario's recorded facts
 */
class ScenarioSampleSource : public SampleValidityProvider {
	public:
		explicit ScenarioSampleSource(const Scenario& scenario) : scenario_(scenario) {}

		bool IsValidPartition(Window window, const TopicPartition& tp) const override;
		Window ActiveWindow() const override { return scenario_.active_window; }

	private:
		const Scenario& scenario_;
};

struct ReplayResult {
	// Windows aged out by the retention helper, oldest first
	std::vector<Window> evicted_windows;
	int num_valid_windows = 0;
	std::map<Window, double> monitored_percentages;
	int num_windows_in_range = 0;
};

/**
 * Feed every recorded fact into `checker` through a bulk refresh, let
 * `retention` age out windows beyond its retained count, then run the
 * scenario's queries
 *
 * @param retention Retention helper bound to `checker`
 * @param min_monitored_partitions_percentage used when the scenario does not set one
 */
ReplayResult RunScenario(const Scenario& scenario,
		CompletenessChecker& checker,
		WindowRetention& retention,
		double min_monitored_partitions_percentage);

} // End of namespace Completeness

#endif // INCLUDE_REPLAY_SCENARIO_H_
