/**
 * @file msgpack.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

/* Extend msgpack for OpenCV fixed size matrix types */

#ifndef _CAMGEO_MSGPACK_HPP_
#define _CAMGEO_MSGPACK_HPP_

#include <msgpack.hpp>
#include <opencv2/core/matx.hpp>

namespace msgpack {
MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS) {
namespace adaptor {

////////////////////////////////////////////////////////////////////////////////
// cv::Matx<T, m, n>, packed as flat row-major array of m*n values

template<typename T, int m, int n>
struct pack<cv::Matx<T, m, n>> {
	template <typename Stream>
	packer<Stream>& operator()(msgpack::packer<Stream>& o, cv::Matx<T, m, n> const& v) const {

		o.pack_array(m*n);
		for (int i = 0; i < m*n; i++) { o.pack(v.val[i]); }

		return o;
	}
};

template<typename T, int m, int n>
struct convert<cv::Matx<T, m, n>> {
	msgpack::object const& operator()(msgpack::object const& o, cv::Matx<T, m, n> &v) const {
		if (o.type != msgpack::type::ARRAY) { throw msgpack::type_error(); }
		if (o.via.array.size != static_cast<uint32_t>(m*n)) { throw msgpack::type_error(); }

		for (int i = 0; i < m*n; i++) { v.val[i] = o.via.array.ptr[i].as<T>(); }

		return o;
	}
};

template <typename T, int m, int n>
struct object_with_zone<cv::Matx<T, m, n>> {
	void operator()(msgpack::object::with_zone& o, cv::Matx<T, m, n> const& v) const {
		o.type = type::ARRAY;
		o.via.array.size = static_cast<uint32_t>(m*n);
		o.via.array.ptr = static_cast<msgpack::object*>(
			o.zone.allocate_align(	sizeof(msgpack::object) * o.via.array.size,
									MSGPACK_ZONE_ALIGNOF(msgpack::object)));

		for (int i = 0; i < m*n; i++) {
			o.via.array.ptr[i] = msgpack::object(v.val[i], o.zone);
		}
	}
};

}  // namespace adaptor
}  // MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
}  // namespace msgpack

#endif
