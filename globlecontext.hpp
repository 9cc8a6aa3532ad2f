#pragma once

#include <string>

#include "common.hpp"

namespace mrp {
	typedef struct GlobleContextManager {
		static GlobleContextManager* getGlobleContextManager() {
			return instance ? instance : instance = new GlobleContextManager();
		}
	public:
		std::string mqHost = "127.0.0.1";
		std::string mqUsername;
		std::string mqPassword;
		std::string mqQueueName = "mrp.core";
		int port = 5672;
		int mqEnabled = 0;
		///size of the worker pool, 0 = one per hardware thread
		int workers = 0;
		double extraShiftHours = DEFAULT_EXTRA_SHIFT_HOURS;
		///write sequence.csv and saturation.csv after a scenario
		int isResultExported = 0;
		std::string outputDir = ".";

		///restore the defaults above
		void reset() { *this = GlobleContextManager(); }
	private:
		GlobleContextManager() {}
		static GlobleContextManager* instance;

	} *PGlobleContextManager;
}
