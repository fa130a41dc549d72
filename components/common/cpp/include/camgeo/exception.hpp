/**
 * @file exception.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 * @author Nicolas Pope
 */

#ifndef _CAMGEO_EXCEPTION_HPP_
#define _CAMGEO_EXCEPTION_HPP_

#include <sstream>
#include <string>

namespace camgeo {

/**
 * Collects a message from stream insertions, used by CAMGEO_Error():
 * CAMGEO_Error("got " << n << " values").
 */
class Formatter {
public:
	Formatter() = default;
	Formatter(const Formatter &) = delete;
	Formatter &operator=(const Formatter &) = delete;

	template <typename T>
	Formatter &operator<<(const T &value) {
		msg_ << value;
		return *this;
	}

	std::string str() const { return msg_.str(); }

private:
	std::ostringstream msg_;
};

/**
 * Library exception. Only thrown at the boundaries (building calibration
 * parameters from arrays, json or files, and image rectification), never by
 * the projection functions. If the message is never read the destructor
 * reports the exception and its backtrace to the log.
 */
class exception : public std::exception
{
	public:
	explicit exception(const char *msg);
	explicit exception(const Formatter &msg);
	~exception();

	const char* what() const throw () {
		processed_ = true;
		return msg_.c_str();
	}

	std::string trace() const throw () {
		return decode_backtrace();
	}

	private:
	std::string decode_backtrace() const;
	void capture_backtrace();

	std::string msg_;
	mutable bool processed_;

#ifdef __GNUC__
	static const int TRACE_SIZE_MAX_ = 16;
	void* trace_[TRACE_SIZE_MAX_];
	int trace_size_;
#endif
};

}

#define CAMGEO_Error(A) (camgeo::exception(camgeo::Formatter() << A << " [" << __FILE__ << ":" << __LINE__ << "]"))

#endif  // _CAMGEO_EXCEPTION_HPP_
