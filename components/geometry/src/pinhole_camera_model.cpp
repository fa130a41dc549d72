/**
 * @file pinhole_camera_model.cpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#include <camgeo/geometry/pinhole_camera_model.hpp>
#include <camgeo/geometry/validate.hpp>
#include <camgeo/exception.hpp>

#include <loguru.hpp>

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using camgeo::PinholeCameraModel;
using camgeo::CameraInfo;

using cv::Matx33d;
using cv::Matx34d;
using cv::Point2d;
using cv::Point3d;
using cv::Vec3d;
using cv::Vec4d;

PinholeCameraModel::PinholeCameraModel() :
	initialized_(false), K_(Matx33d::zeros()), K_full_(Matx33d::zeros()),
	R_(Matx33d::zeros()), P_(Matx34d::zeros()), P_full_(Matx34d::zeros()),
	binning_x_(1), binning_y_(1), maps_(std::make_shared<RectificationMaps>()) {}

PinholeCameraModel::PinholeCameraModel(const CameraInfo &info) : PinholeCameraModel() {
	fromCameraInfo(info);
}

bool PinholeCameraModel::fromCameraInfo(const CameraInfo &info) {
	const bool changed = !initialized_ || !info.sameCalibration(info_);

	info_ = info;
	initialized_ = true;

	K_full_ = info.K;
	P_full_ = info.P;
	R_ = info.R;

	if (info.D.empty()) {
		D_ = cv::Mat();
	}
	else {
		D_ = cv::Mat(info.D, true).reshape(1, 1);
	}

	binning_x_ = std::max(1u, info.binning_x);
	binning_y_ = std::max(1u, info.binning_y);

	// ROI all zeros is same as full resolution
	if (info.roi.isFullResolution()) {
		roi_ = cv::Rect(0, 0, info.width, info.height);
	}
	else {
		roi_ = info.roi.rect();
	}

	// adjust K and P for binning and ROI
	const double bx = binning_x_;
	const double by = binning_y_;

	K_ = K_full_;
	K_(0, 0) /= bx;
	K_(1, 1) /= by;
	K_(0, 2) = (K_(0, 2) - roi_.x) / bx;
	K_(1, 2) = (K_(1, 2) - roi_.y) / by;

	P_ = P_full_;
	P_(0, 0) /= bx;
	P_(1, 1) /= by;
	P_(0, 2) = (P_(0, 2) - roi_.x) / bx;
	P_(1, 2) = (P_(1, 2) - roi_.y) / by;

	if (!changed) { return false; }

	maps_ = std::make_shared<RectificationMaps>();

	if (!validate::cameraMatrix(K_full_)) {
		LOG(WARNING) << "Camera \"" << info.frame_id << "\": K is not a valid intrinsic matrix";
	}
	if (!validate::rotationMatrix(R_)) {
		LOG(WARNING) << "Camera \"" << info.frame_id << "\": R is not a rotation matrix";
	}
	if (!validate::projectionMatrix(P_full_)) {
		LOG(WARNING) << "Camera \"" << info.frame_id << "\": P is not a valid projection matrix";
	}
	if (!validate::distortionCoefficients(info.D, fullResolution(), K_full_)) {
		LOG(WARNING) << "Camera \"" << info.frame_id << "\": invalid distortion coefficients ("
					 << info.D.size() << " values, model \"" << info.distortion_model << "\")";
	}

	LOG(INFO)	<< "Camera \"" << info.frame_id << "\" calibrated: "
				<< info.width << "x" << info.height
				<< ", binning " << binning_x_ << "x" << binning_y_
				<< ", roi " << roi_;

	return true;
}

cv::Size PinholeCameraModel::fullResolution() const {
	return cv::Size(info_.width, info_.height);
}

cv::Size PinholeCameraModel::reducedResolution() const {
	return cv::Size(roi_.width / binning_x_, roi_.height / binning_y_);
}

Point2d PinholeCameraModel::project3dToPixel(const Point3d &xyz) const {
	const Vec3d uvw = P_ * Vec4d(xyz.x, xyz.y, xyz.z, 1.0);

	if (uvw[2] != 0.0) {
		return Point2d(uvw[0] / uvw[2], uvw[1] / uvw[2]);
	}
	const double nan = std::numeric_limits<double>::quiet_NaN();
	return Point2d(nan, nan);
}

Point3d PinholeCameraModel::projectPixelTo3dRay(const Point2d &uv) const {
	const double x = (uv.x - cx()) / fx();
	const double y = (uv.y - cy()) / fy();
	const double norm = std::sqrt(x*x + y*y + 1.0);
	return Point3d(x / norm, y / norm, 1.0 / norm);
}

void PinholeCameraModel::initRectificationMaps(RectificationMaps &maps) const {
	DLOG(INFO) << "Rectification maps for \"" << tfFrame() << "\" (" << reducedResolution() << ")";
	cv::initUndistortRectifyMap(K_, D_, R_, P_, reducedResolution(), CV_32FC1,
								maps.x, maps.y);
}

void PinholeCameraModel::rectifyImage(const cv::Mat &raw, cv::Mat &rectified, int interpolation) const {
	if (!initialized_) {
		throw CAMGEO_Error("Camera model is not calibrated");
	}
	if (raw.size() != reducedResolution()) {
		throw CAMGEO_Error("Input has wrong size " << raw.size() << ", expected " << reducedResolution());
	}

	std::shared_ptr<RectificationMaps> maps = maps_;
	std::call_once(maps->once, [this, &maps]() { initRectificationMaps(*maps); });

	if (raw.data == rectified.data) {
		// cv::remap() does not work in place
		cv::Mat tmp;
		cv::remap(raw, tmp, maps->x, maps->y, interpolation);
		rectified = tmp;
	}
	else {
		cv::remap(raw, rectified, maps->x, maps->y, interpolation);
	}
}

Point2d PinholeCameraModel::rectifyPoint(const Point2d &uv_raw) const {
	if (!initialized_) {
		throw CAMGEO_Error("Camera model is not calibrated");
	}

	std::vector<Point2d> src = {uv_raw};
	std::vector<Point2d> dst;
	cv::undistortPoints(src, dst, K_, D_, R_, P_);
	return dst[0];
}

double PinholeCameraModel::getDeltaU(double deltaX, double Z) const {
	if (Z == 0.0) { return std::numeric_limits<double>::infinity(); }
	return fx() * deltaX / Z;
}

double PinholeCameraModel::getDeltaV(double deltaY, double Z) const {
	if (Z == 0.0) { return std::numeric_limits<double>::infinity(); }
	return fy() * deltaY / Z;
}

double PinholeCameraModel::getDeltaX(double deltaU, double Z) const {
	return Z * deltaU / fx();
}

double PinholeCameraModel::getDeltaY(double deltaV, double Z) const {
	return Z * deltaV / fy();
}
