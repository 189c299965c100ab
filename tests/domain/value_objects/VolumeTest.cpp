#include "domain/value_objects/Volume.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace mc::domain;

TEST(Volume, StoresCubicMeters) {
    EXPECT_EQ(Volume(1000, VolumeUnit::LITER).cubic_meters(), 1.0);
    EXPECT_EQ(Volume::from_cubic_centimeters(1).cubic_meters(), 0.000001);
    EXPECT_EQ(Volume::from_milliliters(1).cubic_meters(), 0.000001);
    EXPECT_EQ(Volume::from_cubic_feet(1).cubic_meters(), 0.0283168);
    EXPECT_EQ(Volume::from_gallons(1).cubic_meters(), 0.00378541);
}

TEST(Volume, ExposesEveryUnitView) {
    auto v = Volume::from_cubic_meters(1);
    EXPECT_EQ(v.liters(), 1000.0);
    EXPECT_EQ(v.milliliters(), 1'000'000.0);
    EXPECT_EQ(v.cubic_centimeters(), 1'000'000.0);
    EXPECT_EQ(v.cubic_feet(), 1 / 0.0283168);
    EXPECT_EQ(v.gallons(), 1 / 0.00378541);
}

TEST(Volume, FromDimensionsMultipliesMeters) {
    auto v = Volume::from_dimensions(Distance::from_meters(2), Distance::from_centimeters(50),
                                     Distance::from_meters(3));
    EXPECT_EQ(v.cubic_meters(), 3.0);
}

TEST(Volume, AddsAndSubtracts) {
    auto sum = Volume::from_liters(500) + Volume::from_cubic_meters(1);
    EXPECT_EQ(sum.cubic_meters(), 1.5);
    EXPECT_EQ((Volume::from_liters(1) - Volume::from_liters(2)).cubic_meters(), 0.0);
}

TEST(Volume, NegativeInputClampsToZero) {
    EXPECT_EQ(Volume::from_gallons(-1), Volume::zero());
}

TEST(Volume, InfinityClampsToMaxValue) {
    EXPECT_EQ(Volume::infinity(), Volume::max_value());
    EXPECT_EQ(Volume::max_value().cubic_meters(), std::numeric_limits<double>::max());
}

TEST(Volume, CanonicalRoundTripIsExact) {
    Volume v(4.2, VolumeUnit::GALLON);
    EXPECT_EQ(v.cubic_meters(), VolumeTraits::to_canonical(4.2, VolumeUnit::GALLON));
    EXPECT_TRUE(Volume(v.canonical_value(), VolumeTraits::canonical_unit).equals(v));
}

TEST(Volume, ConstructingWithOutOfRangeUnitThrows) {
    try {
        Volume(1, static_cast<VolumeUnit>(99));
        FAIL() << "expected InvalidUnit";
    } catch (const mc::errors::InvalidUnit& e) {
        EXPECT_EQ(e.unit(), "99");
        EXPECT_STREQ(e.what(), "Invalid volume unit: 99");
    }
    EXPECT_THROW(Volume::from_liters(1).in(static_cast<VolumeUnit>(99)), mc::errors::InvalidUnit);
}

TEST(Volume, ToStringOfOutOfRangeValueThrows) {
    EXPECT_THROW(to_string(static_cast<VolumeUnit>(99)), mc::errors::InvalidUnit);
}

TEST(Volume, ParsesSuperscriptAndAsciiForms) {
    EXPECT_EQ(volume_unit_from_string("m\xC2\xB3"), VolumeUnit::CUBIC_METER);
    EXPECT_EQ(volume_unit_from_string("m3"), VolumeUnit::CUBIC_METER);
    EXPECT_EQ(volume_unit_from_string("ft3"), VolumeUnit::CUBIC_FEET);
    EXPECT_EQ(volume_unit_from_string("Cubic Feet"), VolumeUnit::CUBIC_FEET);
    EXPECT_EQ(volume_unit_from_string("cubic centimeters"), VolumeUnit::CUBIC_CENTIMETER);
    EXPECT_EQ(volume_unit_from_string("Gallons"), VolumeUnit::GALLON);
    EXPECT_THROW(volume_unit_from_string("pint"), mc::errors::InvalidUnit);
}

TEST(Volume, ToStringUsesDisplaySymbol) {
    EXPECT_EQ(Volume::from_cubic_meters(2).to_string(), "2 m\xC2\xB3");
    EXPECT_EQ(Volume::from_cubic_meters(1).to_string("l"), "1000 l");
    EXPECT_EQ(Volume::from_liters(2).to_string("liters"), "2 l");
}

TEST(Volume, OrdersByCubicMeters) {
    EXPECT_LT(Volume::from_liters(1), Volume::from_gallons(1));
    EXPECT_EQ(Volume::from_liters(1000), Volume::from_cubic_meters(1));
}
