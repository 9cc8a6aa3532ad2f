#pragma once

#include <string>
#include <map>
#include <initializer_list>

#include "models.hpp"
#include "utils.hpp"

namespace mrp {
	template<typename Target>
	struct Loader {
		virtual ~Loader() {};
		///@return: 0 on success, <0 on failure
		virtual int load(Target& target, const std::string& filename) = 0;
	};

	///header name (lower case) -> column index
	typedef struct Columns : std::map<std::string, int> {
		void index(const Row& header);
		///index of the first of @names found in the header, -1 when none is
		int find(std::initializer_list<const char*> names) const;
	} *PColumns;

	///One CSV file, one table. The first row is the header; columns are matched
	///by name so their order does not matter. Rows that cannot be parsed are
	///skipped with a warning, a file that cannot be read leaves the table absent.
	template<typename T>
	struct TableLoader : public Loader<Table<T>> {
		virtual int load(Table<T>& table, const std::string& filename) override {
			Columns columns;
			int skipped = 0, rows = 0;
			bool headerOk = true;
			std::vector<T> loaded;
			int result = CSVLoader(filename).load([&](int i, Row& row) {
				if (i == 0) {
					columns.index(row);
					headerOk = bind(columns);
					return;
				}
				if (!headerOk) return;
				rows++;
				T value;
				if (parse(row, value)) loaded.push_back(value);
				else skipped++;
			});
			if (result != 0) return result;
			if (!headerOk) {
				Utils::log(-1, "%s: missing required columns\n", filename.data());
				return -2;
			}
			if (skipped > 0) {
				Utils::log(2, "%s: %d of %d rows skipped\n", filename.data(), skipped, rows);
			}
			table = Table<T>(loaded);
			return 0;
		}

	protected:
		///resolve the column indexes, false when a required one is missing
		virtual bool bind(const Columns& columns) = 0;
		virtual bool parse(const Row& row, T& value) = 0;

		static bool cell(const Row& row, int index, std::string& value) {
			if (index < 0 || index >= (int)row.size()) return false;
			value = row[index];
			return !value.empty();
		}
		static bool number(const Row& row, int index, double& value) {
			std::string text;
			return cell(row, index, text) && Utils::parseNumber(text, value);
		}
	};

	struct OrdersLoader : public TableLoader<Order> {
	protected:
		int article = -1, quantity = -1, dueDate = -1, ref = -1;
		virtual bool bind(const Columns& columns) override;
		virtual bool parse(const Row& row, Order& value) override;
	};

	struct RoutingLoader : public TableLoader<RoutingStep> {
	protected:
		int article = -1, sequence = -1, center = -1, setupTime = -1, hourlyRate = -1;
		virtual bool bind(const Columns& columns) override;
		virtual bool parse(const Row& row, RoutingStep& value) override;
	};

	struct StockLoader : public TableLoader<StockLevel> {
	protected:
		int article = -1, quantity = -1;
		virtual bool bind(const Columns& columns) override;
		virtual bool parse(const Row& row, StockLevel& value) override;
	};

	struct WipLoader : public TableLoader<WipRecord> {
	protected:
		int article = -1, quantity = -1;
		virtual bool bind(const Columns& columns) override;
		virtual bool parse(const Row& row, WipRecord& value) override;
	};

	struct LotRulesLoader : public TableLoader<LotRule> {
	protected:
		int article = -1, lotSize = -1;
		virtual bool bind(const Columns& columns) override;
		virtual bool parse(const Row& row, LotRule& value) override;
	};

	struct CapacityLoader : public TableLoader<CenterCapacity> {
	protected:
		int center = -1, hours = -1;
		virtual bool bind(const Columns& columns) override;
		virtual bool parse(const Row& row, CenterCapacity& value) override;
	};

	///orders.csv, routing.csv, stock.csv, wip.csv, lots.csv and capacity.csv of a directory
	struct SnapshotLoader : public Loader<Snapshot> {
		virtual int load(Snapshot& snapshot, const std::string& directory) override;
	};

	///the six tables as arrays of one JSON document
	struct SnapshotJsonLoader : public Loader<Snapshot> {
		virtual int load(Snapshot& snapshot, const std::string& filename) override;
	};

	struct GlobleContextManager;
	struct GlobleContextLoader : public Loader<GlobleContextManager> {
		virtual int load(GlobleContextManager& context, const std::string& filename = "./data/Settings.csv") override;
	};
}
