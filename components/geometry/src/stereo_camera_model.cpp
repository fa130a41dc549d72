/**
 * @file stereo_camera_model.cpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#include <camgeo/geometry/stereo_camera_model.hpp>
#include <camgeo/exception.hpp>

#include <loguru.hpp>

#include <opencv2/calib3d.hpp>

#include <limits>

using camgeo::StereoCameraModel;
using camgeo::StereoCameraInfo;
using camgeo::CameraInfo;

using cv::Matx44d;
using cv::Point2d;
using cv::Point3d;
using cv::Vec4d;

StereoCameraModel::StereoCameraModel() : Q_(Matx44d::zeros()) {}

StereoCameraModel::StereoCameraModel(const CameraInfo &left, const CameraInfo &right) :
		StereoCameraModel() {
	fromCameraInfo(left, right);
}

StereoCameraModel::StereoCameraModel(const StereoCameraInfo &info) :
		StereoCameraModel(info.left, info.right) {}

bool StereoCameraModel::fromCameraInfo(const CameraInfo &left, const CameraInfo &right) {
	const bool left_changed = left_.fromCameraInfo(left);
	const bool right_changed = right_.fromCameraInfo(right);
	updateQ();

	if (right_changed && baseline() == 0.0) {
		LOG(WARNING) << "Stereo camera \"" << tfFrame() << "\": zero baseline, "
					 << "right camera projection matrix has no x-translation";
	}

	return left_changed || right_changed;
}

bool StereoCameraModel::fromCameraInfo(const StereoCameraInfo &info) {
	return fromCameraInfo(info.left, info.right);
}

void StereoCameraModel::updateQ() {
	const double fx = right_.fx();
	const double cx = right_.cx();
	const double cy = right_.cy();
	const double tx = baseline();

	// division by zero is not trapped, Q(3, 2) is infinite for zero baseline
	Q_ = Matx44d::zeros();
	Q_(0, 0) = 1.0;
	Q_(0, 3) = -cx;
	Q_(1, 1) = 1.0;
	Q_(1, 3) = -cy;
	Q_(2, 3) = fx;
	Q_(3, 2) = 1.0 / tx;
}

double StereoCameraModel::baseline() const {
	return -right_.Tx() / right_.fx();
}

std::pair<Point2d, Point2d> StereoCameraModel::project3dToPixel(const Point3d &xyz) const {
	return {left_.project3dToPixel(xyz), right_.project3dToPixel(xyz)};
}

Point3d StereoCameraModel::projectPixelTo3d(const Point2d &left_uv, double disparity) const {
	const Vec4d xyzw = Q_ * Vec4d(left_uv.x, left_uv.y, disparity, 1.0);
	const double w = xyzw[3];

	if (w != 0.0) {
		return Point3d(xyzw[0] / w, xyzw[1] / w, xyzw[2] / w);
	}
	return Point3d(0.0, 0.0, 0.0);
}

void StereoCameraModel::projectDisparityImageTo3d(const cv::Mat &disparity,
		cv::Mat &point_image, bool handle_missing_values) const {

	if (!initialized()) {
		throw CAMGEO_Error("Stereo camera model is not calibrated");
	}
	if (disparity.channels() != 1) {
		throw CAMGEO_Error("Disparity image must have one channel, got " << disparity.channels());
	}

	cv::reprojectImageTo3D(disparity, point_image, cv::Mat(Q_), handle_missing_values);
}

double StereoCameraModel::getZ(double disparity) const {
	if (disparity == 0.0) { return std::numeric_limits<double>::infinity(); }
	return -right_.Tx() / disparity;
}

double StereoCameraModel::getDisparity(double Z) const {
	if (Z == 0.0) { return std::numeric_limits<double>::infinity(); }
	return -right_.Tx() / Z;
}
