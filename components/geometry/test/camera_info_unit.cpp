#include <catch2/catch.hpp>

#include <camgeo/geometry/camera_info.hpp>
#include <camgeo/geometry/pinhole_camera_model.hpp>
#include <camgeo/exception.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

using camgeo::CameraInfo;
using camgeo::StereoCameraInfo;
using camgeo::RegionOfInterest;

static CameraInfo makeCameraInfo() {
	CameraInfo info = CameraInfo::fromArrays(1280, 720,
		{700.0, 0.0, 640.5,  0.0, 710.0, 360.25,  0.0, 0.0, 1.0},
		{-0.28, 0.07, 0.0002, -0.0001, 0.0},
		{0.999, 0.0, 0.0447,  0.0, 1.0, 0.0,  -0.0447, 0.0, 0.999},
		{705.0, 0.0, 630.0, -42.3,  0.0, 705.0, 355.0, 0.0,  0.0, 0.0, 1.0, 0.0});

	info.distortion_model = "plumb_bob";
	info.binning_x = 2;
	info.binning_y = 1;
	info.roi.x_offset = 10;
	info.roi.y_offset = 20;
	info.roi.width = 640;
	info.roi.height = 480;
	info.frame_id = "camera_left_optical";
	info.stamp = 1590000000123456789LL;
	return info;
}

TEST_CASE("CameraInfo::fromArrays()", "") {
	SECTION("Row major matrices") {
		auto info = CameraInfo::fromArrays(4, 3,
			{1, 2, 3, 4, 5, 6, 7, 8, 9}, {},
			{1, 0, 0, 0, 1, 0, 0, 0, 1},
			{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12});

		REQUIRE(info.width == 4);
		REQUIRE(info.height == 3);
		REQUIRE(info.K(0, 2) == 3.0);
		REQUIRE(info.K(2, 0) == 7.0);
		REQUIRE(info.P(1, 3) == 8.0);
		REQUIRE(info.P(2, 0) == 9.0);
		REQUIRE(info.D.empty());
		REQUIRE(info.roi.isFullResolution());
	}

	SECTION("Dimension mismatch") {
		const std::vector<double> m9(9, 0.0);
		const std::vector<double> m12(12, 0.0);

		REQUIRE_THROWS_AS(CameraInfo::fromArrays(1, 1, {1, 2, 3}, {}, m9, m12), camgeo::exception);
		REQUIRE_THROWS_WITH(CameraInfo::fromArrays(1, 1, m9, {}, m12, m12), Catch::Contains("R must have 9 values"));
		REQUIRE_THROWS_WITH(CameraInfo::fromArrays(1, 1, m9, {}, m9, m9), Catch::Contains("P must have 12 values"));
	}
}

TEST_CASE("CameraInfo::sameCalibration()", "") {
	auto a = makeCameraInfo();
	auto b = a;
	b.stamp = 42;
	b.frame_id = "other";
	REQUIRE(a.sameCalibration(b));
	REQUIRE(a != b);

	b.roi.width = 10;
	REQUIRE(!a.sameCalibration(b));

	b = a;
	b.D = {0.1, 0.0, 0.0, 0.0};
	REQUIRE(!a.sameCalibration(b));
}

TEST_CASE("RegionOfInterest", "") {
	RegionOfInterest roi;
	REQUIRE(roi.isFullResolution());

	roi.height = 1;
	REQUIRE(!roi.isFullResolution());

	roi.x_offset = 5;
	REQUIRE(roi.rect() == cv::Rect(5, 0, 0, 1));
}

TEST_CASE("CameraInfo json", "") {
	SECTION("Write and read") {
		auto info = makeCameraInfo();
		nlohmann::json j = info;

		REQUIRE(j["K"].size() == 9);
		REQUIRE(j["P"].size() == 12);
		REQUIRE(j["roi"]["x_offset"] == 10);

		auto info_read = j.get<CameraInfo>();
		REQUIRE(info_read == info);
	}

	SECTION("Optional fields") {
		auto j = nlohmann::json::parse(R"({
			"width": 640, "height": 480,
			"K": [500, 0, 320, 0, 500, 240, 0, 0, 1],
			"R": [1, 0, 0, 0, 1, 0, 0, 0, 1],
			"P": [500, 0, 320, 0, 0, 500, 240, 0, 0, 0, 1, 0]
		})");

		auto info = j.get<CameraInfo>();
		REQUIRE(info.D.empty());
		REQUIRE(info.binning_x == 0);
		REQUIRE(info.roi.isFullResolution());
		REQUIRE(info.frame_id.empty());
		REQUIRE(info.stamp == 0);

		camgeo::PinholeCameraModel model(info);
		auto uv = model.project3dToPixel(cv::Point3d(0.0, 0.0, 1.0));
		REQUIRE(uv.x == 320.0);
		REQUIRE(uv.y == 240.0);
	}

	SECTION("Wrong matrix size") {
		auto j = nlohmann::json::parse(R"({
			"width": 640, "height": 480,
			"K": [500, 0, 320, 0, 500, 240, 0, 0, 1],
			"R": [1, 0, 0, 0, 1, 0, 0, 0, 1],
			"P": [500, 0, 320, 0, 500, 240, 0, 0, 1]
		})");

		REQUIRE_THROWS_AS(j.get<CameraInfo>(), camgeo::exception);
	}

	SECTION("Missing matrix") {
		auto j = nlohmann::json::parse(R"({ "width": 640, "height": 480 })");
		REQUIRE_THROWS_AS(j.get<CameraInfo>(), nlohmann::json::out_of_range);
	}

	SECTION("Stereo pair") {
		StereoCameraInfo stereo;
		stereo.left = makeCameraInfo();
		stereo.right = makeCameraInfo();
		stereo.right.P(0, 3) = -35000.0;

		nlohmann::json j = stereo;
		auto read = j.get<StereoCameraInfo>();
		REQUIRE(read.left == stereo.left);
		REQUIRE(read.right == stereo.right);
	}
}

TEST_CASE("CameraInfo reading/writing file", "") {
	auto info = makeCameraInfo();

	SECTION("yml, json and xml") {
		for (const std::string path : {"/tmp/camgeo_camera.yml", "/tmp/camgeo_camera.json", "/tmp/camgeo_camera.xml"}) {
			info.writeFile(path);
			auto info_read = CameraInfo::readFile(path);

			REQUIRE(info_read.width == info.width);
			REQUIRE(info_read.height == info.height);
			REQUIRE(info_read.distortion_model == "plumb_bob");
			REQUIRE(info_read.D == info.D);
			REQUIRE(info_read.K == info.K);
			REQUIRE(info_read.R == info.R);
			REQUIRE(info_read.P == info.P);
			REQUIRE(info_read.binning_x == 2);
			REQUIRE(info_read.binning_y == 1);
			REQUIRE(info_read.roi == info.roi);
			REQUIRE(info_read.frame_id == info.frame_id);
			REQUIRE(info_read.stamp == info.stamp);
		}
	}

	SECTION("Stereo file") {
		StereoCameraInfo stereo;
		stereo.left = info;
		stereo.right = info;
		stereo.right.frame_id = "camera_right_optical";

		stereo.writeFile("/tmp/camgeo_stereo.yml");
		auto read = StereoCameraInfo::readFile("/tmp/camgeo_stereo.yml");
		REQUIRE(read.left.frame_id == "camera_left_optical");
		REQUIRE(read.right.frame_id == "camera_right_optical");
		REQUIRE(read.right.P == info.P);
	}

	SECTION("Missing file") {
		REQUIRE_THROWS_WITH(CameraInfo::readFile("/tmp/camgeo_does_not_exist.yml"),
							Catch::Contains("Could not open"));
	}

	SECTION("Stereo file without right camera") {
		info.writeFile("/tmp/camgeo_mono.yml");
		REQUIRE_THROWS_AS(StereoCameraInfo::readFile("/tmp/camgeo_mono.yml"), camgeo::exception);
	}
}

TEST_CASE("CameraInfo msgpack", "") {
	auto info = makeCameraInfo();

	std::stringstream buffer;
	msgpack::pack(buffer, info);
	const std::string data = buffer.str();

	msgpack::object_handle oh = msgpack::unpack(data.data(), data.size());
	CameraInfo info_unpacked;
	oh.get().convert(info_unpacked);

	REQUIRE(info_unpacked == info);
}
