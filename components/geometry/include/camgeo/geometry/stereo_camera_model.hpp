/**
 * @file stereo_camera_model.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#pragma once
#ifndef _CAMGEO_GEOMETRY_STEREO_CAMERA_MODEL_HPP_
#define _CAMGEO_GEOMETRY_STEREO_CAMERA_MODEL_HPP_

#include <camgeo/geometry/camera_info.hpp>
#include <camgeo/geometry/pinhole_camera_model.hpp>

#include <opencv2/core.hpp>

#include <string>
#include <utility>

namespace camgeo {

/**
 * Idealized rectified stereo pair. 3D points are in the frame of the left
 * camera.
 */
class StereoCameraModel {
public:
	StereoCameraModel();
	StereoCameraModel(const CameraInfo &left, const CameraInfo &right);
	explicit StereoCameraModel(const StereoCameraInfo &info);

	/**
	 * Calibrate both cameras and calculate the disparity to depth matrix Q
	 * from the right camera's projection matrix:
	 *
	 *     [ 1  0  0    -cx ]
	 *     [ 0  1  0    -cy ]
	 *     [ 0  0  0     fx ]
	 *     [ 0  0  1/tx   0 ]
	 *
	 * where tx = -Tx/fx is the baseline.
	 *
	 * @return true if calibration of either camera changed.
	 */
	bool fromCameraInfo(const CameraInfo &left, const CameraInfo &right);
	bool fromCameraInfo(const StereoCameraInfo &info);

	bool initialized() const { return left_.initialized() && right_.initialized(); }

	const PinholeCameraModel &left() const { return left_; }
	const PinholeCameraModel &right() const { return right_; }

	/** Frame of the left camera */
	const std::string &tfFrame() const { return left_.tfFrame(); }

	/** Disparity to depth matrix (4x4) */
	const cv::Matx44d &reprojectionMatrix() const { return Q_; }

	/** Stereo baseline, in units of the projection matrix translation */
	double baseline() const;

	/**
	 * Rectified pixel coordinates of 3D point in left and right image.
	 * Inverse of projectPixelTo3d().
	 */
	std::pair<cv::Point2d, cv::Point2d> project3dToPixel(const cv::Point3d &xyz) const;

	/**
	 * 3D point for rectified left pixel and disparity. Returns (0, 0, 0) if
	 * the point is at infinity (disparity 0).
	 */
	cv::Point3d projectPixelTo3d(const cv::Point2d &left_uv, double disparity) const;

	/**
	 * Reproject disparity image (single channel) to 3 channel image of 3D
	 * points (cv::reprojectImageTo3D()).
	 */
	void projectDisparityImageTo3d(const cv::Mat &disparity, cv::Mat &point_image,
								   bool handle_missing_values=false) const;

	/** Depth of disparity. Infinite for zero disparity. */
	double getZ(double disparity) const;

	/** Disparity of depth Z. Infinite for Z = 0. */
	double getDisparity(double Z) const;

private:
	void updateQ();

	PinholeCameraModel left_;
	PinholeCameraModel right_;
	cv::Matx44d Q_;
};

}

#endif
