/**
 * @file camera_info.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#pragma once
#ifndef _CAMGEO_GEOMETRY_CAMERA_INFO_HPP_
#define _CAMGEO_GEOMETRY_CAMERA_INFO_HPP_

#include <camgeo/utility/msgpack.hpp>

#include <opencv2/core.hpp>
#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace camgeo {

/**
 * Sub-window of the full sensor resolution that was captured. All zero
 * values are used as "full resolution, no crop".
 */
struct RegionOfInterest {
	unsigned int x_offset = 0;
	unsigned int y_offset = 0;
	unsigned int width = 0;
	unsigned int height = 0;

	/** all fields zero */
	bool isFullResolution() const;

	cv::Rect rect() const;

	bool operator==(const RegionOfInterest &other) const;
	bool operator!=(const RegionOfInterest &other) const { return !(*this == other); }

	MSGPACK_DEFINE(x_offset, y_offset, width, height);
};

/**
 * Calibration parameters of a single camera, as received from the
 * messaging/configuration layer. Matrices are stored in full sensor
 * resolution; binning and ROI are applied by PinholeCameraModel.
 */
struct CameraInfo {
	unsigned int width = 0;
	unsigned int height = 0;

	/** distortion model name (plumb_bob, rational_polynomial, ...) */
	std::string distortion_model;
	/** distortion coefficients in OpenCV order, empty if none */
	std::vector<double> D;

	/** intrinsic camera matrix for the raw (distorted) image */
	cv::Matx33d K = cv::Matx33d::zeros();
	/** rectification rotation */
	cv::Matx33d R = cv::Matx33d::zeros();
	/** projection/camera matrix of the rectified image */
	cv::Matx34d P = cv::Matx34d::zeros();

	/** binning factors, 0 is same as 1 */
	unsigned int binning_x = 0;
	unsigned int binning_y = 0;

	RegionOfInterest roi;

	std::string frame_id;
	/** not interpreted */
	int64_t stamp = 0;

	/**
	 * Build from flat row-major arrays. Throws camgeo::exception if K or R
	 * do not have 9 values or P does not have 12.
	 */
	[[nodiscard]]
	static CameraInfo fromArrays(unsigned int width, unsigned int height,
		const std::vector<double> &K, const std::vector<double> &D,
		const std::vector<double> &R, const std::vector<double> &P);

	/**
	 * Read/write calibration file with cv::FileStorage, format selected by
	 * file extension (yml, xml or json).
	 */
	[[nodiscard]]
	static CameraInfo readFile(const std::string &path);
	void writeFile(const std::string &path) const;

	bool operator==(const CameraInfo &other) const;
	bool operator!=(const CameraInfo &other) const { return !(*this == other); }

	/**
	 * Same resolution, matrices, distortion, binning and ROI. Frame id and
	 * timestamp are ignored.
	 */
	bool sameCalibration(const CameraInfo &other) const;

	MSGPACK_DEFINE(width, height, distortion_model, D, K, R, P, binning_x, binning_y, roi, frame_id, stamp);
};

/** Calibration parameters of a stereo pair */
struct StereoCameraInfo {
	CameraInfo left;
	CameraInfo right;

	[[nodiscard]]
	static StereoCameraInfo readFile(const std::string &path);
	void writeFile(const std::string &path) const;

	MSGPACK_DEFINE(left, right);
};

void to_json(nlohmann::json &j, const RegionOfInterest &roi);
void from_json(const nlohmann::json &j, RegionOfInterest &roi);

void to_json(nlohmann::json &j, const CameraInfo &info);
void from_json(const nlohmann::json &j, CameraInfo &info);

void to_json(nlohmann::json &j, const StereoCameraInfo &info);
void from_json(const nlohmann::json &j, StereoCameraInfo &info);

}

#endif
