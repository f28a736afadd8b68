// ==============================================================================
// test_catalogue_gtest.cpp - Тесты каталога (GoogleTest)
// ==============================================================================

#include "mediascope/catalogue.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>

namespace mediascope::test {

namespace {

MediaRecord make_record(std::string name, std::string codec) {
    MediaRecord r;
    r.name = std::move(name);
    r.container = "mkv";
    r.codec = std::move(codec);
    r.resolution = UNKNOWN;
    r.frame_rate = UNKNOWN;
    r.bitrate = UNKNOWN;
    return r;
}

}  // anonymous namespace

TEST(CatalogueTest, Default_IsEmpty) {
    Catalogue c;

    EXPECT_TRUE(c.empty());
    EXPECT_EQ(c.size(), 0u);
    EXPECT_TRUE(c.filters().empty());
    EXPECT_TRUE(c.view().empty());
}

TEST(CatalogueTest, Append_PreservesOrderWithoutDedup) {
    // Arrange
    Catalogue c;

    // Act
    c.append(make_record("clip", "H.264"));
    c.append(make_record("other", "VP9"));
    c.append(make_record("clip", "H.264"));

    // Assert
    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(c.records()[0].name, "clip");
    EXPECT_EQ(c.records()[1].name, "other");
    EXPECT_EQ(c.records()[2].name, "clip");
}

TEST(CatalogueTest, View_AppliesFilters) {
    Catalogue c;
    c.append(make_record("a", "H.264"));
    c.append(make_record("b", "VP9"));
    c.add_filter({filter::Field::Codec, "VP9"});

    auto v = c.view();

    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0]->name, "b");
}

TEST(CatalogueTest, RemoveLastFilter_LifoOrder) {
    Catalogue c;
    c.add_filter({filter::Field::Codec, "H"});
    c.add_filter({filter::Field::Container, "mkv"});

    EXPECT_TRUE(c.remove_last_filter());
    ASSERT_EQ(c.filters().size(), 1u);
    EXPECT_EQ(c.filters()[0].field, filter::Field::Codec);

    EXPECT_TRUE(c.remove_last_filter());
    EXPECT_FALSE(c.remove_last_filter());
}

TEST(CatalogueTest, Clear_RemovesRecordsAndFilters) {
    Catalogue c;
    c.append(make_record("a", "H.264"));
    c.add_filter({filter::Field::Codec, "H"});

    c.clear();

    EXPECT_TRUE(c.empty());
    EXPECT_TRUE(c.filters().empty());
}

}  // namespace mediascope::test
