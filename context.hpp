#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>

#include "common.hpp"
#include "models.hpp"

namespace mrp {
	typedef std::vector<RoutingStep> Routing;

	///Read-only lookup structures derived from one snapshot.
	///Never mutated once built; an extra shift produces a separate variant.
	typedef struct Context {
		std::unordered_map<std::string, double> stock;
		std::unordered_map<std::string, double> wip;
		std::unordered_map<std::string, double> lotSize;
		std::unordered_map<std::string, Routing> routing;
		std::unordered_map<std::string, double> capacity;
		///snapshot version it was built from
		long version = 0;
		///granted to every center, listed in @capacity or not
		double extraHours = 0;

		double stockOf(const std::string& article) const { return find(stock, article, 0.); }
		double wipOf(const std::string& article) const { return find(wip, article, 0.); }
		///0 when the article has no lot rule, i.e. no rounding
		double lotSizeOf(const std::string& article) const { return find(lotSize, article, 0.); }
		double capacityOf(const std::string& center) const { return find(capacity, center, 0.) + extraHours; }
		const Routing& routingOf(const std::string& article) const {
			auto it = routing.find(article);
			return it == routing.end() ? NoRouting : it->second;
		}

		bool empty() const {
			return stock.empty() && wip.empty() && lotSize.empty() && routing.empty() && capacity.empty();
		}

		///copy of this context with @hours added to every center
		std::shared_ptr<const Context> withExtraCapacity(double hours) const;

	private:
		template<typename V>
		static V find(const std::unordered_map<std::string, V>& m, const std::string& key, V fallback) {
			auto it = m.find(key);
			return it == m.end() ? fallback : it->second;
		}
		static const Routing NoRouting;
	} *PContext;

	typedef std::shared_ptr<const Context> ContextPtr;

	struct ContextBuilder {
		///@throw SchemaError when one of the six tables is absent
		static ContextPtr build(const Snapshot& snapshot, long version = 0);
	};
}
