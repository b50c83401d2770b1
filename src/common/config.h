#pragma once

#include <cstddef>
#include <cstdint>

/// Raw completeness layer configs
/// Number of independently locked stripes in the raw per-(window, topic) map
constexpr size_t kNumRawLayerStripes = 64;

/// Checker defaults, overridable through Configuration
/// Upper bound on the number of windows a valid-window scan may count
constexpr int kDefaultMaxNumWindows = 20;
/// Default window size (5 minutes)
constexpr int64_t kDefaultWindowMs = 300000;
/// Default fraction of partitions a window must cover to be trusted
constexpr double kDefaultMinMonitoredPartitionsPercentage = 0.995;
