#include "domain/maps/GeoCoordinate.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace mc::domain;

TEST(GeoCoordinate, ConstructsWithinRange) {
    GeoCoordinate c(45.5, -122.6);
    EXPECT_DOUBLE_EQ(c.latitude(), 45.5);
    EXPECT_DOUBLE_EQ(c.longitude(), -122.6);
    EXPECT_FALSE(c.is_unknown());
}

TEST(GeoCoordinate, AcceptsBoundaryValues) {
    EXPECT_NO_THROW(GeoCoordinate(90, 180));
    EXPECT_NO_THROW(GeoCoordinate(-90, -180));
}

TEST(GeoCoordinate, ThrowsOnLatitudeOutOfRange) {
    EXPECT_THROW(GeoCoordinate(90.1, 0), std::out_of_range);
    EXPECT_THROW(GeoCoordinate(-91, 0), std::out_of_range);
}

TEST(GeoCoordinate, ThrowsOnLongitudeOutOfRange) {
    EXPECT_THROW(GeoCoordinate(0, 180.5), std::out_of_range);
    EXPECT_THROW(GeoCoordinate(0, -181), std::out_of_range);
}

TEST(GeoCoordinate, DefaultIsUnknown) {
    GeoCoordinate c;
    EXPECT_TRUE(c.is_unknown());
    EXPECT_EQ(c, GeoCoordinate::unknown());
}

TEST(GeoCoordinate, ZeroIsOrigin) {
    EXPECT_EQ(GeoCoordinate::zero(), GeoCoordinate(0, 0));
}

TEST(GeoCoordinate, DistanceToSelfIsZero) {
    GeoCoordinate c(51.5, -0.12);
    EXPECT_DOUBLE_EQ(c.distance_to(c).meters(), 0.0);
}

TEST(GeoCoordinate, DistanceAlongEquatorUsesEarthRadius) {
    GeoCoordinate a(0, 0);
    GeoCoordinate b(0, 1);
    // One degree of arc on a 6,376,500 m sphere.
    EXPECT_NEAR(a.distance_to(b).meters(), 111'290.9, 1.0);
}

TEST(GeoCoordinate, DistanceIsSymmetric) {
    GeoCoordinate seattle(47.6062, -122.3321);
    GeoCoordinate portland(45.5152, -122.6784);
    EXPECT_NEAR(seattle.distance_to(portland).kilometers(),
                portland.distance_to(seattle).kilometers(), 1e-9);
    EXPECT_NEAR(seattle.distance_to(portland).kilometers(), 234.2, 0.1);
}

TEST(GeoCoordinate, DistanceFromUnknownThrows) {
    EXPECT_THROW(GeoCoordinate().distance_to(GeoCoordinate::zero()), std::invalid_argument);
    EXPECT_THROW(GeoCoordinate::zero().distance_to(GeoCoordinate()), std::invalid_argument);
}

TEST(GeoCoordinate, WithSettersValidate) {
    auto c = GeoCoordinate::zero().with_latitude(10);
    EXPECT_DOUBLE_EQ(c.latitude(), 10.0);
    EXPECT_THROW(c.with_longitude(200), std::out_of_range);
}

TEST(GeoCoordinate, ToStringListsBothComponents) {
    EXPECT_EQ(GeoCoordinate(1.5, -2).to_string(), "Latitude: 1.5, Longitude: -2");
}
