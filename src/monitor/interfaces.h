#pragma once

#include <string>
#include "types.h"

namespace Completeness {

/**
 * Interface to the metric sample aggregator that owns the samples.
 * Implementations must be safe to call from many producer threads.
 */
class SampleValidityProvider {
public:
	virtual ~SampleValidityProvider() = default;

	// Whether the samples stored for `tp` in `window` are complete enough to use
	virtual bool IsValidPartition(Window window, const TopicPartition& tp) const = 0;

	// Window currently receiving samples. May lag slightly behind.
	virtual Window ActiveWindow() const = 0;
};

/**
 * Interface to the cluster topology
 */
class TopologyProvider {
public:
	virtual ~TopologyProvider() = default;

	// Current number of partitions of `topic`; 0 if the topic is unknown
	virtual int PartitionCount(const std::string& topic) const = 0;
};

} // namespace Completeness
