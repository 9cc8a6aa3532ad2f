#pragma once

#include "models.hpp"
#include "context.hpp"
#include "result.hpp"

namespace mrp {
	///Turns one order into manufacturing orders and a partial center load.
	///Implementations must not touch shared mutable state.
	struct BaseWorker {
		virtual ~BaseWorker() {}
		virtual UnitResult run(const Order& order, const Context& context, const ScenarioParams& params, int today) const = 0;
	};

	typedef struct MrpWorker : public BaseWorker {
		/*
		return: the order's net requirement exploded over the article's routing,
		empty when stock and wip cover it or the due date is beyond the horizon
		*/
		virtual UnitResult run(const Order& order, const Context& context, const ScenarioParams& params, int today) const override;

		///@net rounded up to a whole number of lots, @net itself when @lot <= 0
		static double quantityToBuild(double net, double lot);
		///setup plus run time of @quantity on @step, before any scenario factor
		static double requiredHours(const RoutingStep& step, double quantity);
	} *PMrpWorker;
}
