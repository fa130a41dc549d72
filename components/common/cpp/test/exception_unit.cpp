#include <catch2/catch.hpp>

#include <camgeo/exception.hpp>

#include <string>

static void fail(int value) {
	throw CAMGEO_Error("bad value " << value);
}

TEST_CASE("camgeo::exception", "") {
	SECTION("Message from formatter") {
		try {
			fail(42);
			FAIL("no exception");
		}
		catch (const camgeo::exception &e) {
			std::string msg = e.what();
			REQUIRE(msg.find("bad value 42") == 0);
			REQUIRE(msg.find("exception_unit.cpp:") != std::string::npos);
		}
	}

	SECTION("Plain message") {
		camgeo::exception e("plain");
		REQUIRE(std::string(e.what()) == "plain");
	}

	SECTION("Caught as std::exception") {
		REQUIRE_THROWS_AS(fail(1), std::exception);
	}
}
