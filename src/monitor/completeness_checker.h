#ifndef INCLUDE_COMPLETENESS_CHECKER_H_
#define INCLUDE_COMPLETENESS_CHECKER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// External library includes
#include "absl/base/thread_annotations.h"
#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"

#include "common/configuration.h"
#include "interfaces.h"
#include "raw_completeness.h"
#include "types.h"

namespace Completeness {

// Marker value before any update has reported an active window
constexpr Window kNoActiveWindow = -1;

/**
 * Tracks how completely the metric samples of each window cover the cluster's
 * partitions.
 *
 * Two layers describe the same facts. The raw layer holds per-(window, topic)
 * valid-partition counts and takes concurrent writes from sample producers
 * without a global lock. The aggregate layer holds per-window totals where a
 * topic counts only if every one of its partitions is valid. It is rebuilt
 * from the raw layer when a query supplies a model generation different from
 * the one it was built against, and is invalidated by a bulk refresh.
 *
 * Queries, bulk refresh and aggregate rebuild run under one checker-wide
 * mutex. A rebuild reads raw counts that producers may be incrementing at the
 * same time, so aggregates are a best-effort view, not a consistent cut.
 */
class CompletenessChecker {
	public:
		/**
		 * @param max_num_windows Upper bound of NumValidWindows(), must be positive
		 * @param exclusion How the active window is recognized during the valid-window scan
		 */
		explicit CompletenessChecker(int max_num_windows,
				ActiveWindowExclusion exclusion = ActiveWindowExclusion::kWindowId);

		/**
		 * Construct from the checker section of a loaded configuration
		 */
		explicit CompletenessChecker(const Configuration& config);

		~CompletenessChecker();

		CompletenessChecker(const CompletenessChecker&) = delete;
		CompletenessChecker& operator=(const CompletenessChecker&) = delete;

		/**
		 * Record one newly validated (window, partition) fact.
		 *
		 * Adds 1 to the raw count of (window, tp.topic) if the aggregator
		 * reports the partition valid, 0 otherwise, then refreshes the
		 * active-window marker. Safe to call from any number of threads.
		 * Calling it twice for the same fact counts the partition twice.
		 */
		void UpdatePartitionCompleteness(const SampleValidityProvider& aggregator,
				Window window,
				const TopicPartition& tp);

		/**
		 * Discard the raw layer and replay UpdatePartitionCompleteness() for
		 * every (window, partition) pair, then invalidate the aggregate layer.
		 * Queries cannot observe the raw layer half rebuilt.
		 */
		void RefreshAllPartitionCompleteness(const SampleValidityProvider& aggregator,
				const std::set<Window>& windows,
				const std::vector<TopicPartition>& partitions);

		/**
		 * Evict every raw entry of `window`. No-op if the window is unknown.
		 */
		void RemoveWindow(Window window);

		/**
		 * Number of most recent windows, excluding the active one, whose
		 * aggregate valid-partition total reaches
		 * min_monitored_partitions_percentage * total_num_partitions.
		 * The run stops at the first window below the threshold and never
		 * exceeds MaxNumWindows().
		 */
		int NumValidWindows(const ModelGeneration& generation,
				const TopologyProvider& topology,
				double min_monitored_partitions_percentage,
				int total_num_partitions);

		/**
		 * Fraction of `total_num_partitions` covered by each retained window,
		 * ordered by window
		 */
		std::map<Window, double> MonitoredPercentages(const ModelGeneration& generation,
				const TopologyProvider& topology,
				int total_num_partitions);

		/**
		 * Number of retained windows in [from, to], not counting the most
		 * recent retained window, which is taken to be the active one
		 */
		int NumWindows(Window from, Window to);

		/**
		 * Whether the aggregate layer was built against `generation` and has
		 * not been invalidated since
		 */
		bool IsAggregateValidFor(const ModelGeneration& generation);

		// Raw valid-partition count of (window, topic). False if never updated.
		bool RawValidPartitions(Window window, const std::string& topic, int& out) const {
			return raw_.Get(window, topic, out);
		}

		// Best-effort; may lag behind the aggregator
		Window ActiveWindow() const { return active_window_.load(std::memory_order_relaxed); }

		int MaxNumWindows() const { return max_num_windows_; }

		ActiveWindowExclusion Exclusion() const { return exclusion_; }

		// Number of aggregate rebuilds since construction
		uint64_t NumAggregateRebuilds() const { return num_rebuilds_.load(std::memory_order_relaxed); }

	private:
		/**
		 * Rebuild the aggregate layer if it is not valid for `generation`
		 */
		void ComputeMetricCompletenessLocked(const TopologyProvider& topology,
				const ModelGeneration& generation) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

		void InvalidateAggregateLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
			model_generation_.reset();
		}

		// Whether the scanned aggregate entry is treated as the active window
		bool IsActiveEntry(Window window, int valid_partitions, Window active) const;

		const int max_num_windows_;
		const ActiveWindowExclusion exclusion_;

		RawCompleteness raw_;
		std::atomic<Window> active_window_{kNoActiveWindow};
		std::atomic<uint64_t> num_rebuilds_{0};

		absl::Mutex mutex_;
		// Most recent window first
		absl::btree_map<Window, int, std::greater<Window>> valid_partitions_by_window_ ABSL_GUARDED_BY(mutex_);
		// Unset when never built or invalidated
		std::optional<ModelGeneration> model_generation_ ABSL_GUARDED_BY(mutex_);
}; // CompletenessChecker

} // End of namespace Completeness

#endif // INCLUDE_COMPLETENESS_CHECKER_H_
