#pragma once

#include <mutex>

#include "models.hpp"
#include "context.hpp"

namespace mrp {
	///Process-wide holder of the current snapshot and the context built from it.
	///A reload swaps both pointers at once; scenarios already running keep
	///the pair they started with.
	typedef struct DataStore {
		static DataStore* getDataStore() {
			static DataStore instance;
			return &instance;
		}

		///build the context of @snapshot and install both
		///@throw SchemaError, the installed snapshot is kept in that case
		ContextPtr load(Snapshot snapshot);

		SnapshotPtr snapshot() const;
		///nullptr before the first successful load
		ContextPtr context() const;
		long version() const;
		///the installed snapshot and its context, read together
		void acquire(SnapshotPtr& snapshot, ContextPtr& context) const;
		bool loaded() const { return (bool)context(); }

		void clear();

	private:
		mutable std::mutex mutex;
		///serializes reloads, readers only take @mutex
		std::mutex loadMutex;
		SnapshotPtr currentSnapshot;
		ContextPtr currentContext;
		long currentVersion = 0;

		DataStore() {}
	} *PDataStore;

	///install @snapshot in the process-wide data store
	ContextPtr loadContext(Snapshot snapshot);
}
