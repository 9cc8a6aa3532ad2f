#include "utils.hpp"
#include "datastore.hpp"

using namespace mrp;

ContextPtr
DataStore::load(Snapshot snapshot) {
	std::lock_guard<std::mutex> loading(loadMutex);
	long next = version() + 1;
	///built outside the lock, a failed build leaves the store untouched
	ContextPtr context = ContextBuilder::build(snapshot, next);
	SnapshotPtr installed = std::make_shared<const Snapshot>(std::move(snapshot));

	std::lock_guard<std::mutex> lock(mutex);
	currentVersion = next;
	currentSnapshot = installed;
	currentContext = context;
	Utils::log(1, "snapshot v%ld installed from %s: %zu orders\n",
		next, installed->source.empty() ? "<memory>" : installed->source.data(), installed->orders.size());
	return context;
}

SnapshotPtr
DataStore::snapshot() const {
	std::lock_guard<std::mutex> lock(mutex);
	return currentSnapshot;
}

ContextPtr
DataStore::context() const {
	std::lock_guard<std::mutex> lock(mutex);
	return currentContext;
}

void
DataStore::acquire(SnapshotPtr& snapshot, ContextPtr& context) const {
	std::lock_guard<std::mutex> lock(mutex);
	snapshot = currentSnapshot;
	context = currentContext;
}

long
DataStore::version() const {
	std::lock_guard<std::mutex> lock(mutex);
	return currentVersion;
}

void
DataStore::clear() {
	std::lock_guard<std::mutex> lock(mutex);
	currentSnapshot.reset();
	currentContext.reset();
}

ContextPtr
mrp::loadContext(Snapshot snapshot) {
	return DataStore::getDataStore()->load(std::move(snapshot));
}
