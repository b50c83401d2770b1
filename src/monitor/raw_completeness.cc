#include "raw_completeness.h"

#include <glog/logging.h>

namespace Completeness {

void RawCompleteness::Add(Window window, const std::string& topic, int delta) {
	counts_.Update(WindowTopic{window, topic}, [delta](int& count) {
		count += delta;
	});
}

size_t RawCompleteness::RemoveWindow(Window window) {
	size_t removed = counts_.EraseIf([window](const WindowTopic& key, int) {
		return key.window == window;
	});
	VLOG(2) << "[RawCompleteness] Removed " << removed << " topic entries of window " << window;
	return removed;
}

void RawCompleteness::Clear() {
	counts_.Clear();
}

bool RawCompleteness::Get(Window window, const std::string& topic, int& out) const {
	return counts_.Get(WindowTopic{window, topic}, out);
}

} // End of namespace Completeness
