#include "common.hpp"
#include "errors.hpp"
#include "worker.hpp"

#include <cmath>

using namespace mrp;

double
MrpWorker::quantityToBuild(double net, double lot) {
	if (lot <= 0) return net;
	return std::ceil(net / lot) * lot;
}

double
MrpWorker::requiredHours(const RoutingStep& step, double quantity) {
	if (step.hourlyRate <= 0) return ZERO_RATE_HOURS;
	return step.setupTime + (quantity / step.hourlyRate) * 60;
}

UnitResult
MrpWorker::run(const Order& order, const Context& context, const ScenarioParams& params, int today) const {
	if (!std::isfinite(order.quantity) || order.quantity < 0) {
		throw MalformedRecordError("order quantity of article '" + order.article + "' is not a non-negative number");
	}

	UnitResult result;
	int daysRemaining = order.dueDate - today;
	if (daysRemaining > params.horizonDays) {
		result.skipped = true;
		return result;
	}

	double net = order.quantity - context.stockOf(order.article) - context.wipOf(order.article);
	if (net <= 0) return result;	///covered by stock and wip

	auto& routing = context.routingOf(order.article);
	if (routing.empty()) {
		result.unrouted = true;
		return result;
	}

	double quantity = quantityToBuild(net, context.lotSizeOf(order.article));
	bool urgent = daysRemaining <= URGENT_DAYS;

	for (auto& step : routing) {
		double hours = requiredHours(step, quantity) * params.saturationFactor;

		ManufacturingOrder mo;
		mo.article = order.article;
		mo.center = step.center;
		mo.phase = step.sequence;
		mo.quantity = quantity;
		mo.requiredHours = hours;
		mo.dueDate = order.dueDate;
		mo.urgent = urgent;
		mo.daysRemaining = daysRemaining;
		mo.orderRef = order.ref;
		result.orders.push_back(mo);

		if (!step.center.empty()) result.load[step.center] += hours;
	}
	return result;
}
