#include "window_retention.h"

#include <glog/logging.h>

namespace Completeness {

WindowRetention::WindowRetention(CompletenessChecker& checker, int64_t window_ms, int num_windows_to_retain) :
	checker_(checker),
	window_ms_(window_ms),
	num_windows_to_retain_(num_windows_to_retain) {
		CHECK_GT(window_ms_, 0) << "window_ms must be positive";
		CHECK_GT(num_windows_to_retain_, 0) << "num_windows_to_retain must be positive";
	}

Window WindowRetention::WindowOf(int64_t timestamp_ms) const {
	int64_t offset = timestamp_ms % window_ms_;
	if (offset < 0) {
		offset += window_ms_;
	}
	return timestamp_ms - offset;
}

std::vector<Window> WindowRetention::Track(Window window) {
	std::vector<Window> evicted;
	{
		absl::MutexLock lock(&mutex_);
		windows_.insert(window);
		while (windows_.size() > static_cast<size_t>(num_windows_to_retain_)) {
			evicted.push_back(*windows_.begin());
			windows_.erase(windows_.begin());
		}
	}
	// Checker locks are taken outside our own.
	for (Window old_window : evicted) {
		VLOG(2) << "[WindowRetention] Evicting window " << old_window;
		checker_.RemoveWindow(old_window);
	}
	return evicted;
}

std::vector<Window> WindowRetention::RetainedWindows() {
	absl::MutexLock lock(&mutex_);
	return std::vector<Window>(windows_.begin(), windows_.end());
}

} // End of namespace Completeness
