#include "entry_points.hpp"
#include "journey_fixtures.hpp"

#include <gtest/gtest.h>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
template <typename Fn>
static HandoffErrorKind error_kind_of(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const HandoffError& e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "no HandoffError thrown";
    return HandoffErrorKind::WakeFailed;
}

struct EntryPointsTest : public ::testing::Test
{
  protected:
    TempDir               tmp;
    InMemoryKeyValueStore store;
    NullWakeSignal        wake;
    StagingChannel        channel{ store, &wake };
};

TEST_F(EntryPointsTest, PreviewAcceptsAnyFilename)
{
    const auto p = tmp.write("whatever.txt", "MAPPED_JOURNEY_V1\n" + alex_shareable_json());

    const auto s = preview_file(p);
    EXPECT_EQ(s.sender_name, "Alex");
    EXPECT_EQ(s.location_count, 3);
    EXPECT_EQ(s.date_range_text, std::optional<std::string>(kAlexRangeText));
}

TEST_F(EntryPointsTest, PreviewRejectsNonJourneyFile)
{
    const auto p = tmp.write("notes.mapped", R"({"foo": 1})");
    EXPECT_EQ(error_kind_of([&] { preview_file(p); }), HandoffErrorKind::NotAJourneyFile);
}

TEST_F(EntryPointsTest, MissingFileIsUnreadable)
{
    EXPECT_EQ(error_kind_of([&] { preview_file(tmp.path / "missing.mapped"); }), HandoffErrorKind::UnreadableInput);
    EXPECT_EQ(error_kind_of([&] { share_file(tmp.path / "missing.mapped", channel); }),
              HandoffErrorKind::UnreadableInput);
    EXPECT_EQ(error_kind_of([&] { read_file_bytes(tmp.path); }), HandoffErrorKind::UnreadableInput);
}

TEST_F(EntryPointsTest, ShareStagesMappedFilesVerbatim)
{
    const std::string bytes = "MAPPED_JOURNEY_V1\n" + alex_shareable_json();
    const auto        p     = tmp.write("Alex_Journey.MAPPED", bytes);

    const auto out = share_file(p, channel);
    EXPECT_EQ(out.bytes_staged, bytes.size());
    EXPECT_FALSE(out.wake_delivered);

    const auto rec = channel.take_staged();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->payload, bytes);
    EXPECT_EQ(rec->filename, "Alex_Journey.MAPPED");
}

TEST_F(EntryPointsTest, ShareRejectsOtherExtensions)
{
    for (const std::string name : { "journey.json", "journey.mapped.json", "journey", "mapped" })
    {
        const auto p = tmp.write(name, empty_legacy_json());
        EXPECT_EQ(error_kind_of([&] { share_file(p, channel); }), HandoffErrorKind::UnsupportedExtension)
            << name;
    }
    EXPECT_FALSE(channel.has_pending());
}

TEST_F(EntryPointsTest, ShareDoesNotValidateContent)
{
    const auto p = tmp.write("junk.mapped", "definitely not json");
    EXPECT_NO_THROW(share_file(p, channel));
    EXPECT_TRUE(channel.has_pending());
}

TEST_F(EntryPointsTest, OpenInAppStagesAnyFile)
{
    const auto p = tmp.write("preview.data", empty_legacy_json());
    open_in_app(p, channel);

    const auto rec = channel.take_staged();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->filename, "preview.data");
    EXPECT_EQ(rec->payload, empty_legacy_json());
}

TEST(HasExtension, CaseInsensitive)
{
    EXPECT_TRUE(has_extension("a.mapped", ".mapped"));
    EXPECT_TRUE(has_extension("a.MaPpEd", ".mapped"));
    EXPECT_FALSE(has_extension("a.mapped.json", ".mapped"));
    EXPECT_FALSE(has_extension("amapped", ".mapped"));
    EXPECT_FALSE(has_extension(".mapped", ".mapped")); // dotfile, no extension
}

TEST(UserMessage, EveryKindHasText)
{
    for (auto kind : { HandoffErrorKind::UnreadableInput, HandoffErrorKind::NotAJourneyFile,
                       HandoffErrorKind::StoreUnavailable, HandoffErrorKind::WakeFailed,
                       HandoffErrorKind::UnsupportedExtension })
    {
        EXPECT_FALSE(user_message(kind).empty());
        EXPECT_STRNE(error_kind_name(kind), "unknown");
    }
    EXPECT_EQ(user_message(HandoffErrorKind::UnsupportedExtension), "Please select a .mapped file");
}
