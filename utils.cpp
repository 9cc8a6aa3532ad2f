#include "utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <cstring>
#include <limits>

using namespace mrp;

#if 0
foreground background
black        30         40
red          31         41
green        32         42
yellow       33         43
blue         34         44
magenta      35         45
cyan         36         46
white        37         47

reset             0  (everything back to normal)
bold / bright       1  (often a brighter shade of the same colour)
#endif
//static
const std::map<int, std::string> Utils::COLORS = {
	{-1, "\033[31mERROR:\033[0m"},
	{0, "\033[0m"},
	{1, "\033[32mINFO:\033[0m"},
	{2, "\033[33mWARN:\033[0m"},
	{7, "\033[0m"}
};

std::string
Utils::trim(const std::string& str) {
	size_t begin = 0, end = str.size();
	while (begin < end && std::isspace((unsigned char)str[begin])) begin++;
	while (end > begin && std::isspace((unsigned char)str[end - 1])) end--;
	return str.substr(begin, end - begin);
}

///http://howardhinnant.github.io/date_algorithms.html
int
Utils::daysFromCivil(int y, int m, int d) {
	y -= m <= 2;
	const int era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = (unsigned)(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + (int)doe - 719468;
}

bool
Utils::parseDate(const std::string& text, int& days) {
	std::string value = trim(text);
	int y = 0, m = 0, d = 0;
	if (std::sscanf(value.c_str(), "%d-%d-%d", &y, &m, &d) != 3) return false;
	if (m < 1 || m > 12 || d < 1 || d > 31) return false;
	///only a time part may follow the date
	if (value.size() > 10 && value[10] != ' ' && value[10] != 'T') return false;
	int result = daysFromCivil(y, m, d);
	///rejects days past the end of the month, 2024-02-30 would shift to march
	if (formatDate(result) != value.substr(0, 10)) return false;
	days = result;
	return true;
}

std::string
Utils::formatDate(int days) {
	days += 719468;
	const int era = (days >= 0 ? days : days - 146096) / 146097;
	const unsigned doe = (unsigned)(days - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	const int y = (int)yoe + era * 400 + (m <= 2);

	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", y, m, d);
	return buffer;
}

int
Utils::today() {
	return (int)(std::time(nullptr) / 86400);
}

bool
Utils::parseNumber(const std::string& text, double& value) {
	std::string s = trim(text);
	if (s.empty()) return false;
	char* end = nullptr;
	double result = std::strtod(s.c_str(), &end);
	if (end == s.c_str() || *end != '\0' || !std::isfinite(result)) return false;
	value = result;
	return true;
}

bool
Utils::parseInt(const std::string& text, int& value) {
	double result = 0;
	if (!parseNumber(text, result)) return false;
	if (result != std::floor(result)) return false;
	if (result < (double)std::numeric_limits<int>::min() || result > (double)std::numeric_limits<int>::max()) return false;
	value = (int)result;
	return true;
}

CSVLoader::CSVLoader(const std::string& filename) : filename(filename) {
}

int
CSVLoader::load(RowCallback callback) {
	std::ifstream is(filename);
	if (!is) {
		Utils::log(2, "failed to open file: %s\n", filename.data());
		return -1;
	}

	std::string line;
	Row fields;
	int i = 0;
	while (std::getline(is, line)) {
		if (!line.empty() && line.back() == '\r') line.pop_back();
		if (line.empty() || line.at(0) == '#') continue;
		if (Utils::trim(line).empty()) continue;

		auto pos = std::string::npos;
		while (std::string::npos != (pos = line.find_first_of(','))) {
			fields.push_back(Utils::trim(line.substr(0, pos)));
			line = line.substr(pos + 1);
		}
		fields.push_back(Utils::trim(line));
		callback(i++, fields);
		fields.clear();
	}

	return 0;
}

CSVWriter::CSVWriter(const std::string& filename, const Row& columns/* = {}*/, bool append/* = true*/)
	: filename(filename) {
	if (append)
		ofs.open(filename, std::ofstream::app | std::ofstream::out);
	else
		ofs.open(filename, std::ofstream::out);
	if (!ofs) {
		Utils::log(-1, "failed to open file: %s\n", filename.data());
		return;
	}

	if (!columns.empty()) write(columns);
}

CSVWriter::~CSVWriter() {
	if (ofs) ofs.close();
}

int
CSVWriter::write(const Row& row) {
	if (!ofs) return -1;
	for (size_t i = 0; i < row.size(); i++) {
		ofs << row.at(i) << (i + 1 < row.size() ? "," : "\n");
	}
	return 0;
}
