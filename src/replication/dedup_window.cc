#include "dedup_window.h"

#include <algorithm>

#include <glog/logging.h>

namespace MqBridge {

DedupWindow::DedupWindow(size_t capacity, size_t evict_batch)
	: capacity_(std::max<size_t>(capacity, 1)),
	  evict_batch_(std::min(std::max<size_t>(evict_batch, 1), std::max<size_t>(capacity, 1))) {}

bool DedupWindow::Contains(const std::string& id) const {
	return ids_.contains(id);
}

bool DedupWindow::Insert(const std::string& id) {
	if (ids_.contains(id)) {
		return false;
	}
	if (order_.size() + 1 > capacity_) {
		EvictOldest();
	}
	ids_.insert(id);
	order_.push_back(id);
	return true;
}

void DedupWindow::EvictOldest() {
	size_t n = std::min(evict_batch_, order_.size());
	for (size_t i = 0; i < n; ++i) {
		ids_.erase(order_.front());
		order_.pop_front();
	}
	VLOG(1) << "[DedupWindow] Evicted " << n << " oldest identifiers, " << order_.size() << " remain";
}

} // namespace MqBridge
