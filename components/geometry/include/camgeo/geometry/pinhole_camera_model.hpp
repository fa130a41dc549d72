/**
 * @file pinhole_camera_model.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#pragma once
#ifndef _CAMGEO_GEOMETRY_PINHOLE_CAMERA_MODEL_HPP_
#define _CAMGEO_GEOMETRY_PINHOLE_CAMERA_MODEL_HPP_

#include <camgeo/geometry/camera_info.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace camgeo {

/**
 * Idealized monocular camera. Holds calibration matrices adjusted for sensor
 * binning and ROI, and converts between 3D points (in the rectified camera
 * frame) and rectified pixel coordinates.
 *
 * The model is a value type. Const methods may be called concurrently,
 * fromCameraInfo() must not run concurrently with anything else on the same
 * instance. Copies share the rectification maps until recalibrated.
 */
class PinholeCameraModel {
public:
	PinholeCameraModel();
	explicit PinholeCameraModel(const CameraInfo &info);

	/**
	 * Replace calibration. K and P are adjusted for binning and ROI, full
	 * resolution copies are kept in fullIntrinsicMatrix() and
	 * fullProjectionMatrix(). Parameters are not rejected, implausible values
	 * are only logged.
	 *
	 * @return true if calibration changed (CameraInfo::sameCalibration()).
	 * Rectification maps are discarded only in that case.
	 */
	bool fromCameraInfo(const CameraInfo &info);

	/** fromCameraInfo() has been called */
	bool initialized() const { return initialized_; }

	/** Parameters given in last call to fromCameraInfo() */
	const CameraInfo &cameraInfo() const { return info_; }

	/** Frame identifier of the camera (3D points are in this frame) */
	const std::string &tfFrame() const { return info_.frame_id; }
	int64_t stamp() const { return info_.stamp; }

	/** Resolution of the sensor */
	cv::Size fullResolution() const;
	/** Resolution of the images after ROI and binning */
	cv::Size reducedResolution() const;
	/** ROI in full resolution coordinates. All zero ROI is resolved to full image. */
	cv::Rect rawRoi() const { return roi_; }

	unsigned int binningX() const { return binning_x_; }
	unsigned int binningY() const { return binning_y_; }

	/**
	 * Rectified pixel coordinates of 3D point. (NaN, NaN) if the point
	 * projects to infinity (w = 0). Inverse of projectPixelTo3dRay().
	 */
	cv::Point2d project3dToPixel(const cv::Point3d &xyz) const;

	/**
	 * Unit vector from the camera center through rectified pixel (u, v).
	 * Inverse of project3dToPixel() up to scale.
	 */
	cv::Point3d projectPixelTo3dRay(const cv::Point2d &uv) const;

	/**
	 * Undistort and rectify an image (cv::initUndistortRectifyMap() and
	 * cv::remap()). Maps are calculated on first use (once, also with
	 * concurrent callers) and kept until calibration changes.
	 *
	 * Maps and input are reducedResolution(), the size the adjusted K and P
	 * describe, instead of the full sensor size. The two are the same without
	 * binning and ROI. Other sizes throw.
	 */
	void rectifyImage(const cv::Mat &raw, cv::Mat &rectified, int interpolation=cv::INTER_LINEAR) const;

	/** Rectified pixel coordinates of raw pixel (cv::undistortPoints()) */
	cv::Point2d rectifyPoint(const cv::Point2d &uv_raw) const;

	/** Delta u for delta X at depth Z. Infinite if Z is 0. */
	double getDeltaU(double deltaX, double Z) const;
	/** Delta v for delta Y at depth Z. Infinite if Z is 0. */
	double getDeltaV(double deltaY, double Z) const;
	/** Delta X for delta u at depth Z (no special case for Z = 0) */
	double getDeltaX(double deltaU, double Z) const;
	/** Delta Y for delta v at depth Z (no special case for Z = 0) */
	double getDeltaY(double deltaV, double Z) const;

	/** Intrinsic matrix, adjusted for binning and ROI */
	const cv::Matx33d &intrinsicMatrix() const { return K_; }
	/** Distortion coefficients (1xN), empty if no distortion */
	const cv::Mat &distortionCoeffs() const { return D_; }
	/** Rectification rotation */
	const cv::Matx33d &rotationMatrix() const { return R_; }
	/** Projection matrix, adjusted for binning and ROI */
	const cv::Matx34d &projectionMatrix() const { return P_; }
	/** Intrinsic matrix for full resolution */
	const cv::Matx33d &fullIntrinsicMatrix() const { return K_full_; }
	/** Projection matrix for full resolution */
	const cv::Matx34d &fullProjectionMatrix() const { return P_full_; }

	double fx() const { return P_(0, 0); }
	double fy() const { return P_(1, 1); }
	double cx() const { return P_(0, 2); }
	double cy() const { return P_(1, 2); }
	/** x-translation term of projection matrix (-fx * baseline for right camera) */
	double Tx() const { return P_(0, 3); }
	/** y-translation term of projection matrix */
	double Ty() const { return P_(1, 3); }

private:
	struct RectificationMaps {
		std::once_flag once;
		cv::Mat x;
		cv::Mat y;
	};

	void initRectificationMaps(RectificationMaps &maps) const;

	CameraInfo info_;
	bool initialized_;

	cv::Matx33d K_;
	cv::Matx33d K_full_;
	cv::Mat D_;
	cv::Matx33d R_;
	cv::Matx34d P_;
	cv::Matx34d P_full_;

	unsigned int binning_x_;
	unsigned int binning_y_;
	cv::Rect roi_;

	// not part of calibration state, replaced when calibration changes
	std::shared_ptr<RectificationMaps> maps_;
};

}

#endif
