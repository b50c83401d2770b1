#ifndef INCLUDE_WINDOW_RETENTION_H_
#define INCLUDE_WINDOW_RETENTION_H_

#include <cstdint>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/btree_set.h"
#include "absl/synchronization/mutex.h"

#include "completeness_checker.h"
#include "types.h"

namespace Completeness {

/**
 * Maps sample timestamps onto fixed-size windows and evicts windows from the
 * checker once more than `num_windows_to_retain` are tracked, oldest first.
 */
class WindowRetention {
	public:
		/**
		 * @param checker Checker whose RemoveWindow() is called on eviction
		 * @param window_ms Window size in milliseconds, must be positive
		 * @param num_windows_to_retain Windows kept, including the active one
		 */
		WindowRetention(CompletenessChecker& checker, int64_t window_ms, int num_windows_to_retain);

		// Start of the window containing `timestamp_ms`
		Window WindowOf(int64_t timestamp_ms) const;

		/**
		 * Note that `window` holds samples. Windows falling out of the retained
		 * range are removed from the checker.
		 *
		 * @return the evicted windows, oldest first
		 */
		std::vector<Window> Track(Window window);

		std::vector<Window> RetainedWindows();

		int64_t WindowMs() const { return window_ms_; }

	private:
		CompletenessChecker& checker_;
		const int64_t window_ms_;
		const int num_windows_to_retain_;

		absl::Mutex mutex_;
		absl::btree_set<Window> windows_ ABSL_GUARDED_BY(mutex_);
};

} // End of namespace Completeness

#endif // INCLUDE_WINDOW_RETENTION_H_
