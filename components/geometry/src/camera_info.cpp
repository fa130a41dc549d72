/**
 * @file camera_info.cpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#include <camgeo/geometry/camera_info.hpp>
#include <camgeo/exception.hpp>

#include <opencv2/core/persistence.hpp>
#include <nlohmann/json.hpp>

using camgeo::CameraInfo;
using camgeo::StereoCameraInfo;
using camgeo::RegionOfInterest;

using std::string;
using std::vector;

namespace {

template <int m, int n>
cv::Matx<double, m, n> toMatx(const vector<double> &values, const char *name) {
	if (values.size() != static_cast<size_t>(m*n)) {
		throw CAMGEO_Error(name << " must have " << m*n << " values, got " << values.size());
	}
	return cv::Matx<double, m, n>(values.data());
}

template <int m, int n>
cv::Matx<double, m, n> toMatx(const cv::Mat &M, const char *name) {
	if (M.channels() != 1 || M.total() != static_cast<size_t>(m*n)) {
		throw CAMGEO_Error(name << " must be a " << m << "x" << n << " matrix, got "
			<< M.rows << "x" << M.cols << " (" << M.channels() << " channels)");
	}

	cv::Mat flat;
	M.convertTo(flat, CV_64FC1);
	flat = flat.reshape(1, 1);

	cv::Matx<double, m, n> result;
	for (int i = 0; i < m*n; i++) { result.val[i] = flat.at<double>(i); }
	return result;
}

template <int m, int n>
vector<double> toVector(const cv::Matx<double, m, n> &M) {
	return vector<double>(M.val, M.val + m*n);
}

void writeFields(cv::FileStorage &fs, const CameraInfo &info) {
	fs	<< "image_width" << int(info.width)
		<< "image_height" << int(info.height)
		<< "frame_id" << info.frame_id
		<< "camera_matrix" << cv::Mat(info.K)
		<< "distortion_model" << info.distortion_model
		<< "distortion_coefficients" << info.D
		<< "rectification_matrix" << cv::Mat(info.R)
		<< "projection_matrix" << cv::Mat(info.P)
		<< "binning_x" << int(info.binning_x)
		<< "binning_y" << int(info.binning_y)
		<< "roi" << "{"
			<< "x_offset" << int(info.roi.x_offset)
			<< "y_offset" << int(info.roi.y_offset)
			<< "width" << int(info.roi.width)
			<< "height" << int(info.roi.height)
		<< "}"
		// FileStorage has no 64 bit integers
		<< "stamp" << std::to_string(info.stamp);
}

unsigned int readUnsigned(const cv::FileNode &node, const char *name) {
	int value = 0;
	node >> value;
	if (value < 0) {
		throw CAMGEO_Error(name << " must not be negative, got " << value);
	}
	return static_cast<unsigned int>(value);
}

CameraInfo readFields(const cv::FileNode &node) {
	if (!node.isMap()) {
		throw CAMGEO_Error("Missing camera calibration");
	}

	CameraInfo info;
	cv::Mat K, R, P;
	string stamp;

	info.width = readUnsigned(node["image_width"], "image_width");
	info.height = readUnsigned(node["image_height"], "image_height");
	node["frame_id"] >> info.frame_id;
	node["camera_matrix"] >> K;
	node["distortion_model"] >> info.distortion_model;
	node["distortion_coefficients"] >> info.D;
	node["rectification_matrix"] >> R;
	node["projection_matrix"] >> P;
	info.binning_x = readUnsigned(node["binning_x"], "binning_x");
	info.binning_y = readUnsigned(node["binning_y"], "binning_y");

	const cv::FileNode roi = node["roi"];
	if (roi.isMap()) {
		info.roi.x_offset = readUnsigned(roi["x_offset"], "roi.x_offset");
		info.roi.y_offset = readUnsigned(roi["y_offset"], "roi.y_offset");
		info.roi.width = readUnsigned(roi["width"], "roi.width");
		info.roi.height = readUnsigned(roi["height"], "roi.height");
	}

	info.K = toMatx<3, 3>(K, "camera_matrix");
	info.R = toMatx<3, 3>(R, "rectification_matrix");
	info.P = toMatx<3, 4>(P, "projection_matrix");

	node["stamp"] >> stamp;
	if (!stamp.empty()) {
		try {
			info.stamp = std::stoll(stamp);
		}
		catch (const std::logic_error &e) {
			throw CAMGEO_Error("Invalid stamp \"" << stamp << "\": " << e.what());
		}
	}

	return info;
}

void checkOpened(const cv::FileStorage &fs, const string &path) {
	if (!fs.isOpened()) {
		throw CAMGEO_Error("Could not open calibration file: " << path);
	}
}

}

////////////////////////////////////////////////////////////////////////////////

bool RegionOfInterest::isFullResolution() const {
	return x_offset == 0 && y_offset == 0 && width == 0 && height == 0;
}

cv::Rect RegionOfInterest::rect() const {
	return cv::Rect(x_offset, y_offset, width, height);
}

bool RegionOfInterest::operator==(const RegionOfInterest &other) const {
	return	x_offset == other.x_offset && y_offset == other.y_offset &&
			width == other.width && height == other.height;
}

////////////////////////////////////////////////////////////////////////////////

CameraInfo CameraInfo::fromArrays(unsigned int width, unsigned int height,
		const vector<double> &K, const vector<double> &D,
		const vector<double> &R, const vector<double> &P) {

	CameraInfo info;
	info.width = width;
	info.height = height;
	info.K = toMatx<3, 3>(K, "K");
	info.D = D;
	info.R = toMatx<3, 3>(R, "R");
	info.P = toMatx<3, 4>(P, "P");
	return info;
}

bool CameraInfo::sameCalibration(const CameraInfo &other) const {
	return	width == other.width && height == other.height &&
			distortion_model == other.distortion_model && D == other.D &&
			K == other.K && R == other.R && P == other.P &&
			binning_x == other.binning_x && binning_y == other.binning_y &&
			roi == other.roi;
}

bool CameraInfo::operator==(const CameraInfo &other) const {
	return sameCalibration(other) && frame_id == other.frame_id && stamp == other.stamp;
}

CameraInfo CameraInfo::readFile(const string &path) {
	cv::FileStorage fs(path, cv::FileStorage::READ);
	checkOpened(fs, path);
	return readFields(fs.root());
}

void CameraInfo::writeFile(const string &path) const {
	cv::FileStorage fs(path, cv::FileStorage::WRITE);
	checkOpened(fs, path);
	writeFields(fs, *this);
	fs.release();
}

StereoCameraInfo StereoCameraInfo::readFile(const string &path) {
	cv::FileStorage fs(path, cv::FileStorage::READ);
	checkOpened(fs, path);
	StereoCameraInfo info;
	info.left = readFields(fs["left"]);
	info.right = readFields(fs["right"]);
	return info;
}

void StereoCameraInfo::writeFile(const string &path) const {
	cv::FileStorage fs(path, cv::FileStorage::WRITE);
	checkOpened(fs, path);
	fs << "left" << "{";
	writeFields(fs, left);
	fs << "}";
	fs << "right" << "{";
	writeFields(fs, right);
	fs << "}";
	fs.release();
}

////////////////////////////////////////////////////////////////////////////////

void camgeo::to_json(nlohmann::json &j, const RegionOfInterest &roi) {
	j = nlohmann::json{
		{"x_offset", roi.x_offset},
		{"y_offset", roi.y_offset},
		{"width", roi.width},
		{"height", roi.height}
	};
}

void camgeo::from_json(const nlohmann::json &j, RegionOfInterest &roi) {
	roi.x_offset = j.value("x_offset", 0u);
	roi.y_offset = j.value("y_offset", 0u);
	roi.width = j.value("width", 0u);
	roi.height = j.value("height", 0u);
}

void camgeo::to_json(nlohmann::json &j, const CameraInfo &info) {
	j = nlohmann::json{
		{"width", info.width},
		{"height", info.height},
		{"distortion_model", info.distortion_model},
		{"D", info.D},
		{"K", toVector(info.K)},
		{"R", toVector(info.R)},
		{"P", toVector(info.P)},
		{"binning_x", info.binning_x},
		{"binning_y", info.binning_y},
		{"roi", info.roi},
		{"frame_id", info.frame_id},
		{"stamp", info.stamp}
	};
}

void camgeo::from_json(const nlohmann::json &j, CameraInfo &info) {
	// width, height and the matrices are required, rest is optional
	info = CameraInfo::fromArrays(
		j.at("width").get<unsigned int>(),
		j.at("height").get<unsigned int>(),
		j.at("K").get<vector<double>>(),
		j.value("D", vector<double>()),
		j.at("R").get<vector<double>>(),
		j.at("P").get<vector<double>>());

	info.distortion_model = j.value("distortion_model", string());
	info.binning_x = j.value("binning_x", 0u);
	info.binning_y = j.value("binning_y", 0u);
	if (j.contains("roi")) { j.at("roi").get_to(info.roi); }
	info.frame_id = j.value("frame_id", string());
	info.stamp = j.value("stamp", int64_t(0));
}

void camgeo::to_json(nlohmann::json &j, const StereoCameraInfo &info) {
	j = nlohmann::json{
		{"left", info.left},
		{"right", info.right}
	};
}

void camgeo::from_json(const nlohmann::json &j, StereoCameraInfo &info) {
	j.at("left").get_to(info.left);
	j.at("right").get_to(info.right);
}
