#pragma once

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "interfaces.h"

namespace Completeness {

/**
 * Topology provider backed by a topic -> partition count table.
 * Callers bump their ModelGeneration whenever they change the table.
 */
class StaticTopology : public TopologyProvider {
public:
	StaticTopology() = default;

	void SetPartitionCount(const std::string& topic, int num_partitions);

	// Logs a warning and returns 0 for a topic that was never registered
	int PartitionCount(const std::string& topic) const override;

	bool HasTopic(const std::string& topic) const;

	// Sum of the partition counts of all topics
	int TotalPartitions() const;

	// Sorted topic names
	std::vector<std::string> Topics() const;

private:
	mutable absl::Mutex mutex_;
	absl::flat_hash_map<std::string, int> partitions_per_topic_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Completeness
