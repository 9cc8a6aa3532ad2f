#pragma once

#include <stdexcept>
#include <string>

namespace mrp {
	struct Error : public std::runtime_error {
		explicit Error(const std::string& what) : std::runtime_error(what) {}
	};

	///a required table is absent from the snapshot
	struct SchemaError : public Error {
		std::string table;
		explicit SchemaError(const std::string& table)
			: Error("required table missing: " + table), table(table) {}
	};

	///scenario parameters out of range, raised before any dispatch
	struct ScenarioValidationError : public Error {
		explicit ScenarioValidationError(const std::string& what) : Error(what) {}
	};

	///no order left after horizon filtering and no context data at all
	struct EmptyScenarioError : public Error {
		EmptyScenarioError() : Error("no orders in horizon and no context data") {}
	};

	struct ScenarioCancelledError : public Error {
		ScenarioCancelledError() : Error("scenario cancelled") {}
	};

	///a record a worker cannot interpret; isolated as a unit failure
	struct MalformedRecordError : public Error {
		explicit MalformedRecordError(const std::string& what) : Error(what) {}
	};
}
