// ==============================================================================
// test_filter_gtest.cpp - Тесты фильтрации (GoogleTest)
// ==============================================================================

#include "mediascope/filter.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

namespace mediascope::filter::test {

namespace {

MediaRecord make_record(std::string name, std::string codec, std::string resolution,
                        std::string bitrate) {
    MediaRecord r;
    r.name = std::move(name);
    r.container = "mp4";
    r.codec = std::move(codec);
    r.resolution = std::move(resolution);
    r.frame_rate = "25";
    r.bitrate = std::move(bitrate);
    return r;
}

std::vector<std::string> names(const std::vector<const MediaRecord*>& view) {
    std::vector<std::string> out;
    for (const auto* r : view) {
        out.push_back(r->name);
    }
    return out;
}

}  // anonymous namespace

// ==============================================================================
// Поля
// ==============================================================================

TEST(FilterTest, FieldFromString_CanonicalNames) {
    EXPECT_EQ(field_from_string("container"), Field::Container);
    EXPECT_EQ(field_from_string("codec"), Field::Codec);
    EXPECT_EQ(field_from_string("resolution"), Field::Resolution);
    EXPECT_EQ(field_from_string("frame_rate"), Field::FrameRate);
    EXPECT_EQ(field_from_string("bitrate"), Field::Bitrate);
}

TEST(FilterTest, FieldFromString_CaseAndAlias) {
    EXPECT_EQ(field_from_string("  CODEC "), Field::Codec);
    EXPECT_EQ(field_from_string("fps"), Field::FrameRate);
    EXPECT_FALSE(field_from_string("duration").has_value());
}

TEST(FilterTest, FieldName_RoundTripsForAllFields) {
    for (Field f : all_fields()) {
        EXPECT_EQ(field_from_string(field_name(f)), f);
    }
}

// ==============================================================================
// Предикат
// ==============================================================================

TEST(FilterTest, Predicate_SubstringMatch) {
    auto r = make_record("a", "H.264", "1920x1080", "10.0");

    EXPECT_TRUE((FilterPredicate{Field::Resolution, "192"}).matches(r));
    EXPECT_TRUE((FilterPredicate{Field::Codec, "264"}).matches(r));
    EXPECT_FALSE((FilterPredicate{Field::Codec, "265"}).matches(r));
}

TEST(FilterTest, Predicate_IsCaseSensitive) {
    auto r = make_record("a", "H.264", "1920x1080", "10.0");
    EXPECT_FALSE((FilterPredicate{Field::Codec, "h.264"}).matches(r));
}

TEST(FilterTest, Predicate_LooseBitrateMatch) {
    // "1" совпадает и с "10.0", и с "1.5"
    FilterPredicate p{Field::Bitrate, "1"};

    EXPECT_TRUE(p.matches(make_record("a", "VP9", UNKNOWN, "10.0")));
    EXPECT_TRUE(p.matches(make_record("b", "VP9", UNKNOWN, "1.5")));
    EXPECT_FALSE(p.matches(make_record("c", "VP9", UNKNOWN, "5.0")));
}

TEST(FilterTest, Predicate_Describe) {
    EXPECT_EQ((FilterPredicate{Field::FrameRate, "25"}).describe(), "frame_rate ~ 25");
}

// ==============================================================================
// view
// ==============================================================================

TEST(FilterTest, View_NoPredicates_ReturnsAllInOrder) {
    std::vector<MediaRecord> records = {
        make_record("a", "H.264", "1920x1080", "5.0"),
        make_record("b", "VP9", "1280x720", "2.0"),
        make_record("c", "H.264", "1280x720", "1.0"),
    };

    auto v = view(records, {});

    EXPECT_EQ(names(v), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(FilterTest, View_AndSemantics_PreservesOrder) {
    // Arrange
    std::vector<MediaRecord> records = {
        make_record("a", "H.264", "1920x1080", "5.0"),
        make_record("b", "VP9", "1280x720", "2.0"),
        make_record("c", "H.264", "1280x720", "1.0"),
        make_record("d", "H.264", "1280x720", "3.0"),
    };
    std::vector<FilterPredicate> predicates = {
        {Field::Codec, "H.264"},
        {Field::Resolution, "720"},
    };

    // Act
    auto v = view(records, predicates);

    // Assert
    EXPECT_EQ(names(v), (std::vector<std::string>{"c", "d"}));
    EXPECT_EQ(v[0], &records[2]);
}

TEST(FilterTest, View_NoMatches_Empty) {
    std::vector<MediaRecord> records = {make_record("a", "H.264", "1920x1080", "5.0")};
    EXPECT_TRUE(view(records, {{Field::Codec, "AV1"}}).empty());
}

// ==============================================================================
// parse_filter
// ==============================================================================

TEST(FilterTest, ParseFilter_Valid) {
    auto p = parse_filter("codec=H.264");

    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->field, Field::Codec);
    EXPECT_EQ(p->value, "H.264");
}

TEST(FilterTest, ParseFilter_TrimsAndAcceptsAlias) {
    auto p = parse_filter(" FPS = 30 ");

    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->field, Field::FrameRate);
    EXPECT_EQ(p->value, "30");
}

TEST(FilterTest, ParseFilter_ValueMayContainEquals) {
    auto p = parse_filter("container=a=b");

    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->value, "a=b");
}

TEST(FilterTest, ParseFilter_Invalid) {
    EXPECT_FALSE(parse_filter("H.264").has_value());
    EXPECT_FALSE(parse_filter("codec=").has_value());
    EXPECT_FALSE(parse_filter("size=10").has_value());
    EXPECT_FALSE(parse_filter("=x").has_value());
}

}  // namespace mediascope::filter::test
