#include "common.hpp"
#include "utils.hpp"
#include "errors.hpp"
#include "globlecontext.hpp"
#include "datastore.hpp"
#include "aggregator.hpp"
#include "orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <system_error>
#include <thread>

using namespace mrp;

Orchestrator::Orchestrator() {
	GlobleContextManager& gContext = *GlobleContextManager::getGlobleContextManager();
	workers = gContext.workers;
	extraShiftHours = gContext.extraShiftHours;
	worker = std::make_shared<MrpWorker>();
}

Orchestrator::Orchestrator(int workers, double extraShiftHours, std::shared_ptr<const BaseWorker> worker/* = nullptr*/)
	: workers(workers), extraShiftHours(extraShiftHours), worker(worker) {
	if (!this->worker) this->worker = std::make_shared<MrpWorker>();
}

int
Orchestrator::getPoolSize() const {
	if (workers > 0) return workers;
	int hardware = (int)std::thread::hardware_concurrency();
	return hardware > 0 ? hardware : 1;
}

//static
void
Orchestrator::validate(const ScenarioParams& params) {
	if (!(params.saturationFactor > 0) || !std::isfinite(params.saturationFactor)) {
		throw ScenarioValidationError("saturationFactor must be a positive number, got " + std::to_string(params.saturationFactor));
	}
	if (params.horizonDays <= 0) {
		throw ScenarioValidationError("horizonDays must be positive, got " + std::to_string(params.horizonDays));
	}
}

std::vector<UnitResult>
Orchestrator::dispatch(const std::vector<Order>& orders, const Context& context, const ScenarioParams& params, int today,
	std::vector<UnitFailure>& failures, const CancellationToken* token) const {
	const size_t TOTAL = orders.size();
	std::vector<UnitResult> units(TOTAL);
	///one slot per unit, empty when the unit succeeded
	std::vector<std::string> errors(TOTAL);
	std::vector<char> failed(TOTAL, 0);
	std::atomic<size_t> next{ 0 };

	auto drain = [&]() {
		for (;;) {
			if (token && token->isCancelled()) return;
			size_t i = next.fetch_add(1);
			if (i >= TOTAL) return;
			try {
				units[i] = worker->run(orders[i], context, params, today);
			}
			catch (const std::exception& e) {
				failed[i] = 1;
				errors[i] = e.what();
			}
			catch (...) {
				failed[i] = 1;
				errors[i] = "unknown error";
			}
		}
	};

	///the calling thread drains too, so a pool of N spawns N-1 threads
	size_t poolSize = (std::min)((size_t)getPoolSize(), TOTAL);
	std::vector<std::thread> pool;
	for (size_t i = 1; i < poolSize; i++) {
		try {
			pool.emplace_back(drain);
		}
		catch (const std::system_error& e) {
			Utils::log(2, "worker pool limited to %zu threads: %s\n", pool.size() + 1, e.what());
			break;
		}
	}
	drain();
	for (auto& t : pool) t.join();

	for (size_t i = 0; i < TOTAL; i++) {
		if (!failed[i]) continue;
		UnitFailure failure;
		failure.unit = i;
		failure.article = orders[i].article;
		failure.message = errors[i];
		failures.push_back(failure);
		units[i] = UnitResult();
	}
	return units;
}

ScenarioResult
Orchestrator::calculateScenario(const ScenarioParams& params, ContextPtr context, const std::vector<Order>& orders, const CancellationToken* token/* = nullptr*/) const {
	validate(params);
	if (!context) throw Error("no context loaded");

	auto t0 = std::chrono::steady_clock::now();
	int today = params.today >= 0 ? params.today : Utils::today();

	///supply side: the extra shift lives in a scenario-local variant, the base context is never touched
	ContextPtr scenarioContext = params.extraShift ? context->withExtraCapacity(extraShiftHours) : context;

	std::vector<UnitFailure> failures;
	std::vector<UnitResult> units = dispatch(orders, *scenarioContext, params, today, failures, token);
	if (token && token->isCancelled()) {
		Utils::log(2, "scenario cancelled, %zu units discarded\n", units.size());
		throw ScenarioCancelledError();
	}

	///failed units are reported, not considered
	std::vector<char> failed(units.size(), 0);
	for (auto& f : failures) failed[f.unit] = 1;
	int considered = 0;
	for (size_t i = 0; i < units.size(); i++) {
		if (!failed[i] && !units[i].skipped) considered++;
	}
	if (considered == 0 && context->empty()) throw EmptyScenarioError();

	for (auto& f : failures) {
		Utils::log(2, "unit %zu (article %s) failed: %s\n", f.unit, f.article.data(), f.message.data());
	}

	ScenarioResult result = Aggregator::aggregate(units, failures, *scenarioContext);
	result.consideredOrders = considered;

	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
	Utils::log(1, "scenario {factor: %.2f, extraShift: %d, horizon: %d}: %d of %zu orders considered, %d manufacturing orders, %zu failures in %lld ms\n",
		params.saturationFactor, params.extraShift ? 1 : 0, params.horizonDays,
		considered, orders.size(),
		result.kpis.totalOrders,
		failures.size(),
		(long long)elapsed);
	return result;
}

ScenarioResult
Orchestrator::calculateScenario(const ScenarioParams& params, const CancellationToken* token/* = nullptr*/) const {
	validate(params);
	SnapshotPtr snapshot;
	ContextPtr context;
	DataStore::getDataStore()->acquire(snapshot, context);
	if (!snapshot || !context) throw Error("no snapshot loaded");
	return calculateScenario(params, context, snapshot->orders.rows, token);
}

ScenarioResult
mrp::calculateScenario(const ScenarioParams& params) {
	return Orchestrator().calculateScenario(params);
}
