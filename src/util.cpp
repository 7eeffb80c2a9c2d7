#include <vector>
#include <string>
#include <sstream>
#include <iomanip>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/filesystem.hpp>

#include "hyperidx.h"
#include "util.hpp"

using namespace hyperidx::util;

int hi__loglevel = 0;

void Util::splitString(const std::string &str, std::vector<std::string> &lst) {
	std::vector<std::string> items;
	boost::algorithm::split(items, str, boost::algorithm::is_any_of(","));
	for(std::string &item : items) {
		boost::algorithm::trim(item);
		if(!item.empty())
			lst.push_back(item);
	}
}

void Util::parseDoubles(const std::string &str, std::vector<double> &values) {
	std::vector<std::string> items;
	splitString(str, items);
	for(const std::string &item : items) {
		try {
			values.push_back(boost::lexical_cast<double>(item));
		} catch(const boost::bad_lexical_cast &) {
			hi_inputerr("Not a number: \"" << item << "\" in \"" << str << "\".");
		}
	}
}

void Util::splitAssignment(const std::string &str, std::string &key, std::string &value) {
	size_t pos = str.find('=');
	if(pos == std::string::npos)
		hi_inputerr("Expected key=value but found \"" << str << "\".");
	key = boost::algorithm::trim_copy(str.substr(0, pos));
	value = boost::algorithm::trim_copy(str.substr(pos + 1));
	if(key.empty() || value.empty())
		hi_inputerr("Expected key=value but found \"" << str << "\".");
}

void Util::status(int step, int of, const std::string &message, bool end) {
	if(step < 0)  step = 0;
	if(of <= 0)   of = 1;
	if(step > of) of = step;
	float status = (float) (step * 100) / of;
	std::stringstream out;
	out << "Status: " << std::fixed << std::setprecision(2) << status << "% " << message;
	if(end)
		out << std::endl;
	else
		out << '\r';
	std::cerr << out.str();
	std::cerr.flush();
}

bool Util::mkdir(const std::string &dir) {
	using namespace boost::filesystem;
	path bdir(dir);
	if(!exists(bdir))
		return create_directories(bdir);
	return is_directory(bdir);
}
