/**
 * @file exception.cpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 * @author Nicolas Pope
 */

#include <camgeo/exception.hpp>

#include <loguru.hpp>

#ifdef __GNUC__
#include <execinfo.h>
#include <dlfcn.h>
#include <cxxabi.h>
#include <cstdlib>
#endif

using camgeo::exception;
using std::string;

namespace {

#ifdef __GNUC__
string demangle(const char* name) {
	if (!name) {
		return "[unknown symbol]";
	}
	int status;
	char* demangled = abi::__cxa_demangle(name, NULL, 0, &status);
	if (!demangled) {
		return string(name);
	}
	auto result = string(demangled);
	free(demangled);
	return result;
}
#endif

}

#ifdef __GNUC__
void exception::capture_backtrace() {
	trace_size_ = backtrace(trace_, TRACE_SIZE_MAX_);
}

string exception::decode_backtrace() const {
	char **messages = backtrace_symbols(trace_, trace_size_);
	if (!messages) {
		return string("[bt] no trace");
	}

	string result;

	// first two frames are capture_backtrace() and the constructor
	for (int i=2; i < trace_size_; ++i) {
		result += "[bt] #" + std::to_string(i-2) + " ";

		Dl_info info;
		if (dladdr(trace_[i], &info) && info.dli_sname) {
			string fname = info.dli_fname ? info.dli_fname : "[unknown file]";
			result += fname + ", in " + demangle(info.dli_sname);
		}
		else {
			result += messages[i];
		}
		result += "\n";
	}

	free(messages);
	return result;
}

#else
void exception::capture_backtrace() {}

string exception::decode_backtrace() const {
	return string();
}
#endif

exception::exception(const char *msg) : msg_(msg), processed_(false) {
	capture_backtrace();
}

exception::exception(const camgeo::Formatter &msg) : msg_(msg.str()), processed_(false) {
	capture_backtrace();
}

exception::~exception() {
	if (!processed_) {
		LOG(ERROR) << "Unhandled exception: " << msg_;
		#ifdef __GNUC__
		LOG(ERROR) << "Trace:\n" << decode_backtrace();
		#endif
	}
}
