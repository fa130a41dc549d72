#include <camgeo/geometry/validate.hpp>

#include <algorithm>
#include <cmath>

using cv::Matx33d;
using cv::Matx34d;
using cv::Size;

using std::vector;

namespace {

template <int m, int n>
bool finite(const cv::Matx<double, m, n> &M) {
	for (int i = 0; i < m*n; i++) {
		if (!std::isfinite(M.val[i])) { return false; }
	}
	return true;
}

}

bool camgeo::validate::cameraMatrix(const Matx33d &K) {
	if (!finite(K))						{ return false; }

	if (!(	(K(2, 0) == 0.0) &&
			(K(2, 1) == 0.0) &&
			(K(2, 2) == 1.0)))			{ return false; }

	return true;
}

bool camgeo::validate::rotationMatrix(const Matx33d &R) {
	if (!finite(R))						{ return false; }

	double det = cv::determinant(R);
	if (std::abs(std::abs(det)-1.0) > 0.00001)	{ return false; }

	// TODO: orthogonality (R.t() * R == I) up to floating point error
	return true;
}

bool camgeo::validate::projectionMatrix(const Matx34d &P) {
	if (!finite(P))						{ return false; }

	if (!(	(P(2, 0) == 0.0) &&
			(P(2, 1) == 0.0) &&
			(P(2, 2) == 1.0) &&
			(P(2, 3) == 0.0)))			{ return false; }

	return true;
}

bool camgeo::validate::distortionCoefficients(const vector<double> &D, Size size, const Matx33d &K) {
	if (D.empty()) { return true; }

	if (!(
		(D.size() == 4) ||
		(D.size() == 5) ||
		(D.size() == 8) ||
		(D.size() == 12) ||
		(D.size() == 14))) { return false; }

	for (double d : D) {
		if (!std::isfinite(d)) { return false; }
	}

	const double fx = K(0, 0);
	const double fy = K(1, 1);
	if (!(fx > 0.0 && fy > 0.0) || !std::isfinite(K(0, 2)) || !std::isfinite(K(1, 2))) {
		return false;
	}

	double k[6] = {0.0};

	switch(D.size()) {
		case 14:
		case 12:
		case 8:
			k[3] = D[5];
			k[4] = D[6];
			k[5] = D[7];
			[[fallthrough]];

		case 5:
			k[2] = D[4];
			[[fallthrough]];

		default:
			k[0] = D[0];
			k[1] = D[1];
	}

	// largest normalized radius in image
	double r_max = 0.0;
	for (double u : {0.0, double(size.width)}) {
		for (double v : {0.0, double(size.height)}) {
			const double x = (u - K(0, 2))/fx;
			const double y = (v - K(1, 2))/fy;
			r_max = std::max(r_max, std::sqrt(x*x + y*y));
		}
	}

	const int samples = std::sqrt(size.width*size.width+size.height*size.height) + 1.0;

	bool is_n = true;
	bool is_p = true;

	double dist_prev_n = 0;
	double dist_prev_p = 0;

	for (int i = 1; i <= samples; i++) {
		double r = r_max*i/samples;
		double r2 = r*r;
		double r4 = r2*r2;
		double r6 = r4*r2;

		double rdist = 1.0 + k[0]*r2 + k[1]*r4 + k[2]*r6;
		double irdist2 = 1./(1.0 + k[3]*r2 + k[4]*r4 + k[5]*r6);
		double dist = r*rdist*irdist2;

		if (is_n) {
			if (!(dist < dist_prev_n)) { is_n = false; }
			dist_prev_n = dist;
		}

		if (is_p) {
			if (!(dist > dist_prev_p)) { is_p = false; }
			dist_prev_p = dist;
		}

		if (!is_n && !is_p) { return false; }
	}

	return true;
}
