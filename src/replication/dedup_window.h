#ifndef MQBRIDGE_SRC_REPLICATION_DEDUP_WINDOW_H_
#define MQBRIDGE_SRC_REPLICATION_DEDUP_WINDOW_H_

#include <deque>
#include <string>

#include "absl/container/flat_hash_set.h"

#include "common/config.h"

namespace MqBridge {

/**
 * Bounded, insertion-ordered set of message identifiers. When an insert
 * would grow the window past its capacity the oldest `evict_batch`
 * identifiers are dropped first, so suppression only covers recently
 * seen messages. Not thread-safe; owned by the pipeline.
 */
class DedupWindow {
public:
	explicit DedupWindow(size_t capacity = kDedupWindowCapacity,
			size_t evict_batch = kDedupWindowEvictBatch);

	bool Contains(const std::string& id) const;

	// Returns false if `id` was already present.
	bool Insert(const std::string& id);

	size_t size() const { return order_.size(); }
	size_t capacity() const { return capacity_; }

private:
	void EvictOldest();

	const size_t capacity_;
	const size_t evict_batch_;
	absl::flat_hash_set<std::string> ids_;
	std::deque<std::string> order_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_REPLICATION_DEDUP_WINDOW_H_
