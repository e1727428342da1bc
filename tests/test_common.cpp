#include <catch2/catch.hpp>

#include "Common.h"

TEST_CASE("NormalizeAngle360 maps into [0, 360)") {
    REQUIRE(NormalizeAngle360(0.0f) == Approx(0.0f));
    REQUIRE(NormalizeAngle360(360.0f) == Approx(0.0f));
    REQUIRE(NormalizeAngle360(-90.0f) == Approx(270.0f));
    REQUIRE(NormalizeAngle360(725.0f) == Approx(5.0f));

    float wrapped = NormalizeAngle360(-1e-6f);
    REQUIRE(wrapped >= 0.0f);
    REQUIRE(wrapped < 360.0f);

    for (float angle = -1000.0f; angle < 1000.0f; angle += 37.3f) {
        float once = NormalizeAngle360(angle);
        REQUIRE(once >= 0.0f);
        REQUIRE(once < 360.0f);
        REQUIRE(NormalizeAngle360(once) == Approx(once));
    }
}

TEST_CASE("NormalizeAngle180 maps into (-180, 180]") {
    REQUIRE(NormalizeAngle180(180.0f) == Approx(180.0f));
    REQUIRE(NormalizeAngle180(-180.0f) == Approx(180.0f));
    REQUIRE(NormalizeAngle180(190.0f) == Approx(-170.0f));
    REQUIRE(NormalizeAngle180(-190.0f) == Approx(170.0f));
    REQUIRE(NormalizeAngle180(350.0f) == Approx(-10.0f));

    for (float angle = -1000.0f; angle < 1000.0f; angle += 41.7f) {
        float once = NormalizeAngle180(angle);
        REQUIRE(once > -180.0f);
        REQUIRE(once <= 180.0f);
        REQUIRE(NormalizeAngle180(once) == Approx(once));
    }
}

TEST_CASE("BearingDegrees uses heading 0 along -Z and 90 along +X") {
    REQUIRE(BearingDegrees(0.0, -1.0) == Approx(0.0f).margin(1e-4));
    REQUIRE(BearingDegrees(1.0, 0.0) == Approx(90.0f));
    REQUIRE(NormalizeAngle360(BearingDegrees(0.0, 1.0)) == Approx(180.0f));
    REQUIRE(NormalizeAngle360(BearingDegrees(-1.0, 0.0)) == Approx(270.0f));
}

TEST_CASE("Distance helpers") {
    REQUIRE(Distance2D(0.0, 0.0, 3.0, 4.0) == Approx(5.0f));
    REQUIRE(Distance3D(1.0, 2.0, 3.0, 1.0, 2.0, 3.0) == Approx(0.0f));
    REQUIRE(Distance3D(0.0, 0.0, 0.0, 2.0, 3.0, 6.0) == Approx(7.0f));
}

TEST_CASE("CalculateTurningRate follows Ackermann geometry") {
    SECTION("dead zone at standstill and near-zero steering") {
        REQUIRE(CalculateTurningRate(0.0f, 30.0f, -12.0f) == 0.0f);
        REQUIRE(CalculateTurningRate(0.005f, 30.0f, -12.0f) == 0.0f);
        REQUIRE(CalculateTurningRate(10.0f, 0.05f, 0.0f) == 0.0f);
    }

    SECTION("sign follows steering and direction of travel") {
        float right = CalculateTurningRate(5.0f, 20.0f, CalculateRearSteeringAngle(20.0f));
        float left = CalculateTurningRate(5.0f, -20.0f, CalculateRearSteeringAngle(-20.0f));
        REQUIRE(right > 0.0f);
        REQUIRE(left < 0.0f);
        REQUIRE(left == Approx(-right));
        REQUIRE(CalculateTurningRate(-5.0f, 20.0f, CalculateRearSteeringAngle(20.0f)) < 0.0f);
    }

    SECTION("magnitude at full lock") {
        /* 2 m/s, front 45, rear -18: (1 + 0.3249) / 2 * 2 / 6 rad/s */
        float rate = CalculateTurningRate(2.0f, 45.0f, CalculateRearSteeringAngle(45.0f));
        REQUIRE(rate == Approx(12.65f).epsilon(0.01));
    }
}

TEST_CASE("CalculateRearSteeringAngle counter-steers at 40 percent") {
    REQUIRE(CalculateRearSteeringAngle(45.0f) == Approx(-18.0f));
    REQUIRE(CalculateRearSteeringAngle(-10.0f) == Approx(4.0f));
    REQUIRE(CalculateRearSteeringAngle(0.0f) == Approx(0.0f));
}

TEST_CASE("ClampSteeringAngle limits to 45 degrees") {
    REQUIRE(ClampSteeringAngle(60.0f) == Approx(45.0f));
    REQUIRE(ClampSteeringAngle(-90.0f) == Approx(-45.0f));
    REQUIRE(ClampSteeringAngle(12.5f) == Approx(12.5f));
}

TEST_CASE("UpdateSpeedSmooth never overshoots the target") {
    REQUIRE(UpdateSpeedSmooth(0.0f, 10.0f, 1.0f) == Approx(3.0f));
    REQUIRE(UpdateSpeedSmooth(9.0f, 10.0f, 1.0f) == Approx(10.0f));
    REQUIRE(UpdateSpeedSmooth(10.0f, 0.0f, 1.0f) == Approx(6.0f));
    REQUIRE(UpdateSpeedSmooth(1.0f, 0.0f, 1.0f) == Approx(0.0f));
    REQUIRE(UpdateSpeedSmooth(5.0f, 5.0f, 1.0f) == Approx(5.0f));

    float speed = 0.0f;
    for (int i = 0; i < 100; ++i) {
        speed = UpdateSpeedSmooth(speed, 7.5f, 0.05f);
        REQUIRE(speed <= 7.5f);
    }
    REQUIRE(speed == Approx(7.5f));
}

TEST_CASE("InterpretWingspan sorts out the unit of the raw value") {
    SECTION("semispan in meters") {
        REQUIRE(InterpretWingspan(17.9f) == Approx(35.8f));
        REQUIRE(InterpretWingspan(2.5f) == Approx(5.0f));
        REQUIRE(InterpretWingspan(45.0f) == Approx(90.0f));
    }

    SECTION("full span in feet") {
        REQUIRE(InterpretWingspan(117.5f) == Approx(117.5f * 0.3048f));
        REQUIRE(InterpretWingspan(260.0f) == Approx(79.248f));
    }

    SECTION("implausible values fall back to the default") {
        REQUIRE(InterpretWingspan(0.0f) == Approx(DEFAULT_WINGSPAN_METERS));
        REQUIRE(InterpretWingspan(-5.0f) == Approx(DEFAULT_WINGSPAN_METERS));
        REQUIRE(InterpretWingspan(1000.0f) == Approx(DEFAULT_WINGSPAN_METERS));
    }
}

TEST_CASE("GetStateName names every state") {
    REQUIRE(std::string(GetStateName(STATE_IDLE)) == "STATE_IDLE");
    REQUIRE(std::string(GetStateName(STATE_TRUCKS_APPROACHING)) == "STATE_TRUCKS_APPROACHING");
    REQUIRE(std::string(GetStateName(STATE_TRUCKS_POSITIONING)) == "STATE_TRUCKS_POSITIONING");
    REQUIRE(std::string(GetStateName(STATE_WATER_SPRAYING)) == "STATE_WATER_SPRAYING");
    REQUIRE(std::string(GetStateName(STATE_TRUCKS_LEAVING)) == "STATE_TRUCKS_LEAVING");
}
