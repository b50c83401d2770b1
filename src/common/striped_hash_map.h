#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <shared_mutex>
#include <mutex>
#include <absl/hash/hash.h>
#include <absl/container/flat_hash_map.h>

namespace Completeness {

// Hash map split into independently locked stripes. A key always lands in
// the same stripe, so writers to keys in different stripes never contend and
// writers to the same key serialize on that stripe's mutex.
template<typename Key, typename Value, size_t NumStripes = 64>
class StripedHashMap {
public:
    StripedHashMap() = default;

    StripedHashMap(const StripedHashMap&) = delete;
    StripedHashMap& operator=(const StripedHashMap&) = delete;

    // Get stripe index for a given key
    size_t GetStripeIndex(const Key& key) const {
        return absl::Hash<Key>{}(key) % NumStripes;
    }

    // Insert-or-update. `fn` receives the stored value, value-initialized on
    // first touch, and runs under the stripe's exclusive lock.
    template<typename Fn>
    void Update(const Key& key, Fn&& fn) {
        Stripe& stripe = stripes_[GetStripeIndex(key)];
        std::unique_lock lock(stripe.mutex);
        fn(stripe.map[key]);
    }

    // Copy out the value for `key`. Returns false if absent.
    bool Get(const Key& key, Value& out) const {
        const Stripe& stripe = stripes_[GetStripeIndex(key)];
        std::shared_lock lock(stripe.mutex);
        auto it = stripe.map.find(key);
        if (it == stripe.map.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    // Erase every entry matching `pred`, one stripe at a time.
    // Returns the number of erased entries.
    template<typename Pred>
    size_t EraseIf(Pred&& pred) {
        size_t erased = 0;
        for (Stripe& stripe : stripes_) {
            std::unique_lock lock(stripe.mutex);
            erased += absl::erase_if(stripe.map, [&pred](const auto& kv) {
                return pred(kv.first, kv.second);
            });
        }
        return erased;
    }

    // Visit every entry under a shared lock on its stripe. Stripes are
    // visited in turn, so the walk is not a point-in-time cut across stripes.
    template<typename Fn>
    void ForEach(Fn&& fn) const {
        for (const Stripe& stripe : stripes_) {
            std::shared_lock lock(stripe.mutex);
            for (const auto& [key, value] : stripe.map) {
                fn(key, value);
            }
        }
    }

    void Clear() {
        for (Stripe& stripe : stripes_) {
            std::unique_lock lock(stripe.mutex);
            stripe.map.clear();
        }
    }

    size_t Size() const {
        size_t total = 0;
        for (const Stripe& stripe : stripes_) {
            std::shared_lock lock(stripe.mutex);
            total += stripe.map.size();
        }
        return total;
    }

private:
    struct alignas(64) Stripe {
        mutable std::shared_mutex mutex;
        absl::flat_hash_map<Key, Value> map;
    };
    std::array<Stripe, NumStripes> stripes_;
};

} // namespace Completeness
