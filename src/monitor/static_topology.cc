#include "static_topology.h"

#include <algorithm>
#include <glog/logging.h>

namespace Completeness {

void StaticTopology::SetPartitionCount(const std::string& topic, int num_partitions) {
	CHECK_GE(num_partitions, 0) << "Negative partition count for topic " << topic;
	absl::MutexLock lock(&mutex_);
	partitions_per_topic_[topic] = num_partitions;
}

int StaticTopology::PartitionCount(const std::string& topic) const {
	absl::MutexLock lock(&mutex_);
	auto it = partitions_per_topic_.find(topic);
	if (it == partitions_per_topic_.end()) {
		LOG(WARNING) << "Topic " << topic << " is not in the topology";
		return 0;
	}
	return it->second;
}

bool StaticTopology::HasTopic(const std::string& topic) const {
	absl::MutexLock lock(&mutex_);
	return partitions_per_topic_.contains(topic);
}

int StaticTopology::TotalPartitions() const {
	absl::MutexLock lock(&mutex_);
	int total = 0;
	for (const auto& [topic, num_partitions] : partitions_per_topic_) {
		total += num_partitions;
	}
	return total;
}

std::vector<std::string> StaticTopology::Topics() const {
	std::vector<std::string> topics;
	{
		absl::MutexLock lock(&mutex_);
		topics.reserve(partitions_per_topic_.size());
		for (const auto& [topic, num_partitions] : partitions_per_topic_) {
			topics.push_back(topic);
		}
	}
	std::sort(topics.begin(), topics.end());
	return topics;
}

} // namespace Completeness
