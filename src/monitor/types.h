#ifndef INCLUDE_MONITOR_TYPES_H_
#define INCLUDE_MONITOR_TYPES_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace Completeness {

/**
 * Window identifier: start timestamp (ms) of a fixed-size sample window.
 * Larger means more recent.
 */
using Window = int64_t;

/**
 * A single partition of a topic
 */
struct TopicPartition {
	std::string topic;
	int partition = 0;

	TopicPartition() = default;
	TopicPartition(std::string t, int p) : topic(std::move(t)), partition(p) {}

	bool operator==(const TopicPartition& other) const {
		return partition == other.partition && topic == other.topic;
	}
	bool operator!=(const TopicPartition& other) const { return !(*this == other); }
	bool operator<(const TopicPartition& other) const {
		return topic < other.topic || (topic == other.topic && partition < other.partition);
	}

	template <typename H>
	friend H AbslHashValue(H h, const TopicPartition& tp) {
		return H::combine(std::move(h), tp.topic, tp.partition);
	}

	// "<topic>-<partition>", the usual Kafka rendering
	std::string ToString() const { return topic + "-" + std::to_string(partition); }
};

inline std::ostream& operator<<(std::ostream& os, const TopicPartition& tp) {
	return os << tp.ToString();
}

/**
 * Version of the cluster topology and load model an aggregate was computed
 * against. Two generations are equal only if both components match.
 */
struct ModelGeneration {
	int cluster_generation = 0;
	int64_t load_generation = 0;

	ModelGeneration() = default;
	ModelGeneration(int cluster, int64_t load) : cluster_generation(cluster), load_generation(load) {}

	bool operator==(const ModelGeneration& other) const {
		return cluster_generation == other.cluster_generation &&
			load_generation == other.load_generation;
	}
	bool operator!=(const ModelGeneration& other) const { return !(*this == other); }

	std::string ToString() const {
		return std::to_string(cluster_generation) + "-" + std::to_string(load_generation);
	}
};

inline std::ostream& operator<<(std::ostream& os, const ModelGeneration& gen) {
	return os << gen.ToString();
}

} // End of namespace Completeness

#endif // INCLUDE_MONITOR_TYPES_H_
