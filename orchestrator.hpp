#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "models.hpp"
#include "context.hpp"
#include "result.hpp"
#include "worker.hpp"

namespace mrp {
	///Lets a caller abandon a scenario. Units already running finish,
	///their results are discarded.
	typedef struct CancellationToken {
		void cancel() { cancelled.store(true); }
		bool isCancelled() const { return cancelled.load(); }
	private:
		std::atomic<bool> cancelled{ false };
	} *PCancellationToken;

	/**
	 * One unit per order, dispatched over a bounded pool of threads.
	 * Every unit writes only its own result slot; the shared context is
	 * read-only, so nothing on the hot path takes a lock.
	 */
	typedef struct Orchestrator {
		///pool size and extra shift hours from the global settings
		Orchestrator();
		Orchestrator(int workers, double extraShiftHours, std::shared_ptr<const BaseWorker> worker = nullptr);

		///run @orders against @context
		ScenarioResult calculateScenario(const ScenarioParams& params, ContextPtr context, const std::vector<Order>& orders, const CancellationToken* token = nullptr) const;
		///run the orders of the snapshot installed in the data store
		ScenarioResult calculateScenario(const ScenarioParams& params, const CancellationToken* token = nullptr) const;

		///@throw ScenarioValidationError
		static void validate(const ScenarioParams& params);

		int getPoolSize() const;

	private:
		std::vector<UnitResult> dispatch(const std::vector<Order>& orders, const Context& context, const ScenarioParams& params, int today,
			std::vector<UnitFailure>& failures, const CancellationToken* token) const;

		int workers = 0;
		double extraShiftHours = 0;
		std::shared_ptr<const BaseWorker> worker;
	} *POrchestrator;

	///calculate a scenario over the process-wide data store with the global settings
	ScenarioResult calculateScenario(const ScenarioParams& params);
}
