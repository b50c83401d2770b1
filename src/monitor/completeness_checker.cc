#include "completeness_checker.h"

#include <chrono>
#include <tuple>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include <glog/logging.h>

namespace Completeness {

CompletenessChecker::CompletenessChecker(int max_num_windows, ActiveWindowExclusion exclusion) :
	max_num_windows_(max_num_windows),
	exclusion_(exclusion) {
		CHECK_GT(max_num_windows_, 0) << "max_num_windows must be positive";
		VLOG(3) << "\t[CompletenessChecker]\tConstructed max_num_windows=" << max_num_windows_
			<< " exclusion=" << ActiveWindowExclusionName(exclusion_);
	}

CompletenessChecker::CompletenessChecker(const Configuration& config) :
	CompletenessChecker(config.getMaxNumWindows(), config.getActiveWindowExclusion()) {}

CompletenessChecker::~CompletenessChecker() {
	VLOG(3) << "\t[CompletenessChecker]\tDestructed";
}

void CompletenessChecker::UpdatePartitionCompleteness(const SampleValidityProvider& aggregator,
		Window window,
		const TopicPartition& tp) {
	const int increment = aggregator.IsValidPartition(window, tp) ? 1 : 0;
	raw_.Add(window, tp.topic, increment);
	active_window_.store(aggregator.ActiveWindow(), std::memory_order_relaxed);
	VLOG(3) << "[CompletenessChecker] window " << window << " " << tp << " +" << increment;
}

void CompletenessChecker::RefreshAllPartitionCompleteness(const SampleValidityProvider& aggregator,
		const std::set<Window>& windows,
		const std::vector<TopicPartition>& partitions) {
	absl::MutexLock lock(&mutex_);
	raw_.Clear();
	for (Window window : windows) {
		for (const TopicPartition& tp : partitions) {
			UpdatePartitionCompleteness(aggregator, window, tp);
		}
	}
	// An aggregate built before the refresh describes discarded raw data, even
	// if the caller's generation has not moved.
	InvalidateAggregateLocked();
	VLOG(2) << "[CompletenessChecker] Refreshed " << windows.size() << " windows x "
		<< partitions.size() << " partitions";
}

void CompletenessChecker::RemoveWindow(Window window) {
	size_t removed = raw_.RemoveWindow(window);
	if (removed == 0) {
		return;
	}
	// Drop only the evicted window from the cached aggregate so queries served
	// from the cache stop reporting it. The generation stays valid.
	absl::MutexLock lock(&mutex_);
	valid_partitions_by_window_.erase(window);
}

bool CompletenessChecker::IsAggregateValidFor(const ModelGeneration& generation) {
	absl::MutexLock lock(&mutex_);
	return model_generation_.has_value() && *model_generation_ == generation;
}

void CompletenessChecker::ComputeMetricCompletenessLocked(const TopologyProvider& topology,
		const ModelGeneration& generation) {
	if (model_generation_.has_value() && *model_generation_ == generation) {
		return;
	}
	const auto start = std::chrono::steady_clock::now();

	// Copy the raw layer out first so stripe locks are not held while the
	// topology provider is consulted.
	std::vector<std::tuple<Window, std::string, int>> raw_entries;
	raw_.ForEach([&raw_entries](Window window, const std::string& topic, int count) {
		raw_entries.emplace_back(window, topic, count);
	});

	valid_partitions_by_window_.clear();
	absl::flat_hash_map<std::string, int> partitions_per_topic;
	for (const auto& [window, topic, num_valid_partitions] : raw_entries) {
		auto it = partitions_per_topic.find(topic);
		if (it == partitions_per_topic.end()) {
			it = partitions_per_topic.emplace(topic, topology.PartitionCount(topic)).first;
		}
		// Every retained window gets an entry, even if no topic is fully
		// covered, so it reports 0 coverage and ends a valid-window run.
		// Do not skip zero-total windows here.
		int& total = valid_partitions_by_window_[window];
		if (it->second == num_valid_partitions) {
			total += num_valid_partitions;
		}
	}
	model_generation_ = generation;
	num_rebuilds_.fetch_add(1, std::memory_order_relaxed);

	VLOG(1) << "[CompletenessChecker] Rebuilt aggregate for generation " << generation
		<< ": " << valid_partitions_by_window_.size() << " windows, "
		<< partitions_per_topic.size() << " topics in "
		<< std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - start).count() << "us";
}

bool CompletenessChecker::IsActiveEntry(Window window, int valid_partitions, Window active) const {
	switch (exclusion_) {
		case ActiveWindowExclusion::kWindowId:
			return window == active;
		case ActiveWindowExclusion::kLegacyPartitionCount:
			// Compares a partition total against a window id. Kept for
			// compatibility with deployments that relied on the old scan.
			return valid_partitions == active;
	}
	return false;
}

int CompletenessChecker::NumValidWindows(const ModelGeneration& generation,
		const TopologyProvider& topology,
		double min_monitored_partitions_percentage,
		int total_num_partitions) {
	LOG_IF(ERROR, min_monitored_partitions_percentage < 0.0 || min_monitored_partitions_percentage > 1.0)
		<< "Minimum monitored partitions percentage out of range: " << min_monitored_partitions_percentage;

	absl::MutexLock lock(&mutex_);
	ComputeMetricCompletenessLocked(topology, generation);

	const double min_monitored_num_partitions = total_num_partitions * min_monitored_partitions_percentage;
	const Window active = active_window_.load(std::memory_order_relaxed);
	int num_valid_windows = 0;
	for (auto it = valid_partitions_by_window_.begin();
			it != valid_partitions_by_window_.end() && num_valid_windows < max_num_windows_; ++it) {
		const Window window = it->first;
		const int monitored_partitions = it->second;
		if (exclusion_ == ActiveWindowExclusion::kWindowId && IsActiveEntry(window, monitored_partitions, active)) {
			continue;
		}
		if (monitored_partitions < min_monitored_num_partitions) {
			break;
		}
		if (exclusion_ == ActiveWindowExclusion::kLegacyPartitionCount &&
				IsActiveEntry(window, monitored_partitions, active)) {
			continue;
		}
		num_valid_windows++;
	}
	return num_valid_windows;
}

std::map<Window, double> CompletenessChecker::MonitoredPercentages(const ModelGeneration& generation,
		const TopologyProvider& topology,
		int total_num_partitions) {
	LOG_IF(WARNING, total_num_partitions <= 0)
		<< "Total number of partitions is " << total_num_partitions << ", reporting 0 coverage";

	absl::MutexLock lock(&mutex_);
	ComputeMetricCompletenessLocked(topology, generation);

	std::map<Window, double> percentages;
	for (const auto& [window, monitored_partitions] : valid_partitions_by_window_) {
		percentages[window] = total_num_partitions > 0
			? static_cast<double>(monitored_partitions) / total_num_partitions
			: 0.0;
	}
	return percentages;
}

int CompletenessChecker::NumWindows(Window from, Window to) {
	absl::MutexLock lock(&mutex_);

	absl::btree_set<Window, std::greater<Window>> windows;
	raw_.ForEach([&windows](Window window, const std::string&, int) {
		windows.insert(window);
	});
	if (windows.empty()) {
		return 0;
	}

	// The most recent retained window is assumed to be the active one.
	const Window most_recent = *windows.begin();
	int num_windows = 0;
	for (Window window : windows) {
		if (window >= from && window <= to && window != most_recent) {
			num_windows++;
		}
	}
	return num_windows;
}

} // End of namespace Completeness
