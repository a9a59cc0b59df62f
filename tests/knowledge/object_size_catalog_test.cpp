// File: tests/knowledge/object_size_catalog_test.cpp

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "knowledge/object_size_catalog.hpp"

using knowledge::ObjectSizeCatalog;
using types::MeasurementAxis;
using types::ObjectCategory;

namespace {

    constexpr const char *kCatalog = R"(
objects:
  - label: person
    display_name: Adult Human
    category: human
    axis: height
    size: 1.70
    variability: 0.08
    reliability: 0.9
    aspect_ratio: 0.4
    aliases: [pedestrian, Man]
  - label: deer
    category: Wildlife
    axis: shoulder-height
    size: 1.0
    variability: 0.15
    reliability: 0.75
    aspect_ratio: 1.4
  - label: stop sign
    category: sign
    axis: width
    size: 0.76
  - label: broken
    category: vehicle
    size: -2.0
  - label: unicorn
    category: mythical
    size: 1.5
  - category: human
    size: 1.0
  - label: overconfident
    category: structure
    size: 2.0
    reliability: 1.5
)";

} // namespace

class ObjectSizeCatalogTest : public ::testing::Test {
protected:
    ObjectSizeCatalog catalog = ObjectSizeCatalog::fromYaml(YAML::Load(kCatalog));
};

TEST_F(ObjectSizeCatalogTest, LoadsValidEntriesOnly) {
    EXPECT_EQ(catalog.size(), 3u);
    EXPECT_FALSE(catalog.lookup("broken").has_value());
    EXPECT_FALSE(catalog.lookup("unicorn").has_value());
    EXPECT_FALSE(catalog.lookup("overconfident").has_value());
}

TEST_F(ObjectSizeCatalogTest, ParsesEveryField) {
    const auto person = catalog.lookup("person");
    ASSERT_TRUE(person.has_value());
    EXPECT_EQ(person->name(), "Adult Human");
    EXPECT_EQ(person->category, ObjectCategory::Human);
    EXPECT_EQ(person->axis, MeasurementAxis::Height);
    EXPECT_DOUBLE_EQ(person->size_meters, 1.70);
    EXPECT_DOUBLE_EQ(person->variability, 0.08);
    EXPECT_DOUBLE_EQ(person->reliability, 0.9);
    EXPECT_DOUBLE_EQ(person->aspect_ratio, 0.4);

    const auto deer = catalog.lookup("deer");
    ASSERT_TRUE(deer.has_value());
    EXPECT_EQ(deer->category, ObjectCategory::Wildlife);
    EXPECT_EQ(deer->axis, MeasurementAxis::ShoulderHeight);
    EXPECT_EQ(deer->name(), "deer");
}

TEST_F(ObjectSizeCatalogTest, DefaultsOptionalFields) {
    const auto sign = catalog.lookup("stop sign");
    ASSERT_TRUE(sign.has_value());
    EXPECT_DOUBLE_EQ(sign->variability, 0.0);
    EXPECT_DOUBLE_EQ(sign->reliability, 1.0);
    EXPECT_DOUBLE_EQ(sign->aspect_ratio, 1.0);
}

TEST_F(ObjectSizeCatalogTest, MatchesCaseAndAliasesLoosely) {
    EXPECT_TRUE(catalog.lookup("PERSON").has_value());
    EXPECT_EQ(catalog.lookup("Pedestrian")->label, "person");
    EXPECT_EQ(catalog.lookup("man")->label, "person");
    EXPECT_EQ(catalog.lookup("StopSign")->label, "stop sign");
    EXPECT_TRUE(catalog.lookup(" Per son").has_value());
    EXPECT_FALSE(catalog.lookup("persons").has_value());
    EXPECT_FALSE(catalog.lookup("car").has_value());
}

TEST_F(ObjectSizeCatalogTest, ListsSizesPerCategory) {
    EXPECT_EQ(catalog.sizesFor(ObjectCategory::Human).size(), 1u);
    EXPECT_EQ(catalog.sizesFor(ObjectCategory::Wildlife).size(), 1u);
    EXPECT_TRUE(catalog.sizesFor(ObjectCategory::Vehicle).empty());
}

TEST_F(ObjectSizeCatalogTest, AddReplacesAnExistingLabel) {
    types::KnownObjectSize car;
    car.label = "car";
    car.category = ObjectCategory::Vehicle;
    car.size_meters = 1.5;
    catalog.add(car, {"sedan"});
    EXPECT_EQ(catalog.size(), 4u);
    EXPECT_EQ(catalog.lookup("Sedan")->label, "car");

    car.size_meters = 1.45;
    catalog.add(car);
    EXPECT_EQ(catalog.size(), 4u);
    EXPECT_DOUBLE_EQ(catalog.lookup("sedan")->size_meters, 1.45);
}

TEST_F(ObjectSizeCatalogTest, CopiesAreIndependent) {
    ObjectSizeCatalog copy = catalog;
    types::KnownObjectSize bus;
    bus.label = "bus";
    bus.category = ObjectCategory::Vehicle;
    bus.size_meters = 3.1;
    copy.add(bus);

    EXPECT_TRUE(copy.lookup("bus").has_value());
    EXPECT_FALSE(catalog.lookup("bus").has_value());
}

TEST(ObjectSizeCatalogLoadTest, AcceptsATopLevelSequence) {
    const auto catalog = ObjectSizeCatalog::fromYaml(YAML::Load("- {label: door, category: structure, size: 2.03}"));
    EXPECT_EQ(catalog.size(), 1u);
}

TEST(ObjectSizeCatalogLoadTest, MissingObjectsGivesAnEmptyCatalog) {
    EXPECT_EQ(ObjectSizeCatalog::fromYaml(YAML::Load("something_else: 1")).size(), 0u);
}

TEST(ObjectSizeCatalogLoadTest, MissingFileThrows) {
    EXPECT_THROW(static_cast<void>(ObjectSizeCatalog::fromFile("/nonexistent/object_sizes.yaml")),
                 std::runtime_error);
}

TEST(ObjectSizeCatalogLoadTest, ShippedCatalogCoversEveryCategory) {
    const auto catalog = ObjectSizeCatalog::fromFile(std::string(RANGEFINDER_TEST_DATA_DIR) + "/object_sizes.yaml");
    for (const auto category: {ObjectCategory::Human, ObjectCategory::Vehicle, ObjectCategory::Wildlife,
                               ObjectCategory::Structure, ObjectCategory::Sign}) {
        EXPECT_FALSE(catalog.sizesFor(category).empty()) << types::toString(category);
    }
    EXPECT_TRUE(catalog.lookup("person").has_value());
    EXPECT_TRUE(catalog.lookup("stop sign").has_value());
}
