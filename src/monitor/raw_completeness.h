#ifndef INCLUDE_RAW_COMPLETENESS_H_
#define INCLUDE_RAW_COMPLETENESS_H_

#include <string>
#include <utility>

#include "common/config.h"
#include "common/striped_hash_map.h"
#include "types.h"

namespace Completeness {

/**
 * Key of the raw layer: one topic within one window
 */
struct WindowTopic {
	Window window = 0;
	std::string topic;

	bool operator==(const WindowTopic& other) const {
		return window == other.window && topic == other.topic;
	}

	template <typename H>
	friend H AbslHashValue(H h, const WindowTopic& key) {
		return H::combine(std::move(h), key.window, key.topic);
	}
};

/**
 * Per-(window, topic) count of partitions whose samples are valid.
 *
 * Writers touching different keys proceed in parallel; increments of the same
 * key are serialized by its stripe lock, so no update is lost. Readers walk
 * the stripes one after another and may observe concurrent increments.
 */
class RawCompleteness {
	public:
		RawCompleteness() = default;
		RawCompleteness(const RawCompleteness&) = delete;
		RawCompleteness& operator=(const RawCompleteness&) = delete;

		/**
		 * Add `delta` to the count of (window, topic), creating it at 0 first
		 */
		void Add(Window window, const std::string& topic, int delta);

		/**
		 * Drop every topic entry of `window`
		 *
		 * @return number of (window, topic) entries removed
		 */
		size_t RemoveWindow(Window window);

		void Clear();

		/**
		 * @param out receives the count if present
		 * @return false if (window, topic) has never been updated
		 */
		bool Get(Window window, const std::string& topic, int& out) const;

		// Calls fn(window, topic, count) for every entry
		template<typename Fn>
		void ForEach(Fn&& fn) const {
			counts_.ForEach([&fn](const WindowTopic& key, int count) {
				fn(key.window, key.topic, count);
			});
		}

		size_t NumEntries() const { return counts_.Size(); }

	private:
		StripedHashMap<WindowTopic, int, kNumRawLayerStripes> counts_;
};

} // End of namespace Completeness

#endif // INCLUDE_RAW_COMPLETENESS_H_
