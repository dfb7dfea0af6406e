#include "journey_fixtures.hpp"
#include "journey_model.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using nlohmann::json;

TEST(JourneyModel, ReadsShareableExport)
{
    const auto s = shareable_export_from_json(json::parse(alex_shareable_json()));

    EXPECT_EQ(s.sender_name, "Alex");
    ASSERT_EQ(s.export_data.locations.size(), 3u);
    EXPECT_DOUBLE_EQ(s.export_data.locations[0].latitude, 37.7749);
    EXPECT_DOUBLE_EQ(s.export_data.locations[0].longitude, -122.4194);
    EXPECT_EQ(s.export_data.locations[0].timestamp, 1736071200);
    EXPECT_EQ(s.export_data.locations[1].timestamp, 1736101800);
    EXPECT_EQ(s.export_data.export_date, 1741593600);
    EXPECT_EQ(s.export_data.total_locations, 3);
    ASSERT_TRUE(s.export_data.date_range.has_value());
    EXPECT_EQ(s.export_data.date_range->earliest, 1736071200);
    EXPECT_EQ(s.export_data.date_range->latest, 1739524500);
}

TEST(JourneyModel, NullAndMissingRangeAreAbsent)
{
    const auto with_null = journey_export_from_json(json::parse(empty_legacy_json()));
    EXPECT_FALSE(with_null.date_range.has_value());

    const auto missing = journey_export_from_json(
        json{ { "locations", json::array() }, { "exportDate", "2025-03-10T08:00:00Z" }, { "totalLocations", 0 } });
    EXPECT_FALSE(missing.date_range.has_value());
}

TEST(JourneyModel, MissingRequiredKeyThrows)
{
    json j = json::parse(empty_legacy_json());
    j.erase("exportDate");
    EXPECT_THROW(journey_export_from_json(j), json::exception);
}

TEST(JourneyModel, NonObjectThrows)
{
    EXPECT_THROW(journey_export_from_json(json::array()), std::runtime_error);
    EXPECT_THROW(shareable_export_from_json(json("text")), std::runtime_error);
}

TEST(JourneyModel, WriterOmitsAbsentRange)
{
    const auto e = make_journey_export({}, 1741593600);
    EXPECT_EQ(e.total_locations, 0);
    EXPECT_FALSE(e.date_range.has_value());

    const auto j = journey_export_to_json(e);
    EXPECT_FALSE(j.contains("dateRange"));
    EXPECT_EQ(j["exportDate"], "2025-03-10T08:00:00Z");
    EXPECT_TRUE(j["locations"].is_array());
}

TEST(JourneyModel, MakeExportDerivesRangeFromUnorderedSamples)
{
    const auto e = make_journey_export({ { 0.0, 0.0, 300 }, { 0.0, 0.0, 100 }, { 0.0, 0.0, 200 } }, 1000);

    EXPECT_EQ(e.total_locations, 3);
    ASSERT_TRUE(e.date_range.has_value());
    EXPECT_EQ(e.date_range->earliest, 100);
    EXPECT_EQ(e.date_range->latest, 300);
    // sample order is preserved
    EXPECT_EQ(e.locations.front().timestamp, 300);
}

TEST(JourneyModel, WrittenJsonReadsBack)
{
    ShareableJourneyExport s;
    s.sender_name = "Robin";
    s.export_data = make_journey_export({ { 51.5, -0.12, 1736071200 } }, 1741593600);

    const auto back = shareable_export_from_json(shareable_export_to_json(s));
    EXPECT_EQ(back.sender_name, "Robin");
    ASSERT_EQ(back.export_data.locations.size(), 1u);
    EXPECT_DOUBLE_EQ(back.export_data.locations[0].latitude, 51.5);
    EXPECT_EQ(back.export_data.date_range->latest, 1736071200);
}
