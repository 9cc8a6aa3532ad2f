#pragma once

#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <map>
#include <functional>

#ifndef _MRP_UTILS_HPP_
#define _MRP_UTILS_HPP_

#ifndef WIN32
#define vfprintf_s vfprintf
#endif

namespace mrp {
	///ascii escap colors: http://pueblo.sourceforge.net/doc/manual/ansi_color_codes.html
	struct Utils {
		static std::string trim(const std::string& str);
		static void log(int level, const char* format, ...) {
			if (level < 0) level = -1;
			else if (COLORS.count(level) == 0) level = 7;
			const std::string full = COLORS.at(level) + format;
			va_list pal;
			va_start(pal, format);
			vfprintf_s(level < 0 ? stderr : stdout, full.data(), pal);
			va_end(pal);
		}
		static void log(const char* format, ...) {
			va_list pal;
			va_start(pal, format);
			vfprintf_s(stdout, format, pal);
			va_end(pal);
		}

		///"YYYY-MM-DD" -> days since 1970-01-01; a " " or "T" time part after it is ignored
		static bool parseDate(const std::string& text, int& days);
		static std::string formatDate(int days);
		static int daysFromCivil(int y, int m, int d);
		///current UTC date as days since 1970-01-01
		static int today();

		static bool parseNumber(const std::string& text, double& value);
		///whole numbers inside the int range only
		static bool parseInt(const std::string& text, int& value);
	private:
		static const std::map<int, std::string> COLORS;
	};

	typedef std::vector<std::string> Row;
	typedef std::function<void(int, Row&)> RowCallback;
	struct CSVLoader {
		CSVLoader(const std::string& filename);
		///@return: 0 on success, -1 when the file cannot be opened
		int load(RowCallback callback);

	private:
		std::string filename;
	};

	struct CSVWriter {
		CSVWriter(const std::string& filename, const Row& columns = {}, bool append = true);
		virtual ~CSVWriter();
		int write(const Row& row);
		bool good() const { return (bool)ofs; }

	private:
		std::string filename;
		std::ofstream ofs;
	};
}

#endif
