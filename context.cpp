#include "utils.hpp"
#include "errors.hpp"
#include "context.hpp"

#include <algorithm>

using namespace mrp;

//static
const Routing Context::NoRouting = {};

ContextPtr
Context::withExtraCapacity(double hours) const {
	auto variant = std::make_shared<Context>(*this);
	variant->extraHours += hours;
	return variant;
}

namespace {
	template<typename T>
	void require(const Table<T>& table, const char* name) {
		if (!table.present) throw SchemaError(name);
	}

	double nonNegative(double value) {
		return value > 0 ? value : 0.;
	}
}

ContextPtr
ContextBuilder::build(const Snapshot& snapshot, long version/* = 0*/) {
	require(snapshot.orders, "orders");
	require(snapshot.routingSteps, "routingSteps");
	require(snapshot.stock, "stock");
	require(snapshot.wip, "wip");
	require(snapshot.lotRules, "lotRules");
	require(snapshot.centerCapacity, "centerCapacity");

	auto context = std::make_shared<Context>();
	context->version = version;

	for (auto& e : snapshot.stock.rows) {
		if (e.article.empty()) continue;
		context->stock[e.article] += nonNegative(e.quantity);
	}
	for (auto& e : snapshot.wip.rows) {
		if (e.article.empty()) continue;
		context->wip[e.article] += nonNegative(e.quantity);
	}
	for (auto& e : snapshot.lotRules.rows) {
		if (e.article.empty()) continue;
		///a non-positive lot size means no lot rule
		if (e.lotSize > 0) context->lotSize[e.article] = e.lotSize;
		else context->lotSize.erase(e.article);
	}
	for (auto& e : snapshot.routingSteps.rows) {
		if (e.article.empty()) continue;
		context->routing[e.article].push_back(e);
	}
	for (auto& e : context->routing) {
		std::stable_sort(e.second.begin(), e.second.end(), [](const RoutingStep& lhs, const RoutingStep& rhs) {
			return lhs.sequence < rhs.sequence;
		});
	}
	for (auto& e : snapshot.centerCapacity.rows) {
		if (e.center.empty()) continue;
		context->capacity[e.center] += nonNegative(e.hours);
	}

	Utils::log(1, "context v%ld built: %zu stock, %zu wip, %zu lots, %zu routings, %zu centers\n",
		version,
		context->stock.size(),
		context->wip.size(),
		context->lotSize.size(),
		context->routing.size(),
		context->capacity.size());
	return context;
}
