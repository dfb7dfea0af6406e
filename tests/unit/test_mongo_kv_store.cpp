#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "handoff_error.hpp"
#include "mongo_kv_store.hpp"
#include "staging_channel.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <cstdlib>
#include <map>
#include <mongocxx/exception/error_code.hpp>
#include <optional>
#include <string>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

// -----------------------------------------------------------------------------
// Collection calls redirected to a mock instead of a server
// -----------------------------------------------------------------------------
class MockMongoCollection
{
  public:
    MOCK_METHOD(void, update_one, (const bsoncxx::document::value&, const bsoncxx::document::value&), ());
    MOCK_METHOD(std::optional<bsoncxx::document::value>, find_one, (const bsoncxx::document::value&), ());
    MOCK_METHOD(void, delete_one, (const bsoncxx::document::value&), ());
};

class FakeMongoKeyValueStore : public MongoKeyValueStore
{
  public:
    explicit FakeMongoKeyValueStore(MockMongoCollection* mock)
        : MongoKeyValueStore("mongodb://fake-uri-for-tests", "group.com.novalco.mapped"), mock_(mock)
    {
    }

  protected:
    void upsert_one(bsoncxx::document::view filter, bsoncxx::document::view update) override
    {
        mock_->update_one(bsoncxx::document::value{ filter }, bsoncxx::document::value{ update });
    }

    std::optional<bsoncxx::document::value> find_one(bsoncxx::document::view filter) const override
    {
        return mock_->find_one(bsoncxx::document::value{ filter });
    }

    void delete_one(bsoncxx::document::view filter) override
    {
        mock_->delete_one(bsoncxx::document::value{ filter });
    }

  private:
    MockMongoCollection* mock_;
};

static std::string id_of(const bsoncxx::document::value& filter)
{
    return std::string{ filter.view()["_id"].get_string().value };
}

static mongocxx::exception driver_error()
{
    return mongocxx::exception{ mongocxx::make_error_code(mongocxx::error_code::k_invalid_collection_object),
                                "connection reset" };
}

struct MongoKeyValueStoreTest : public ::testing::Test
{
  protected:
    NiceMock<MockMongoCollection> coll;
    FakeMongoKeyValueStore        store{ &coll };
};

TEST_F(MongoKeyValueStoreTest, SetStringUpsertsValueUnderKeyId)
{
    EXPECT_CALL(coll, update_one(_, _))
        .WillOnce(Invoke([](const bsoncxx::document::value& filter, const bsoncxx::document::value& update) {
            EXPECT_EQ(id_of(filter), "pendingImportData");
            const auto set = update.view()["$set"].get_document().value;
            EXPECT_EQ(std::string{ set["value"].get_string().value }, "QUJD");
        }));

    store.set_string("pendingImportData", "QUJD");
}

TEST_F(MongoKeyValueStoreTest, GetStringReadsValueField)
{
    EXPECT_CALL(coll, find_one(_)).WillOnce(Invoke([](const bsoncxx::document::value& filter) {
        EXPECT_EQ(id_of(filter), "pendingImportFilename");
        return std::optional<bsoncxx::document::value>{ make_document(kvp("_id", "pendingImportFilename"),
                                                                      kvp("value", "Alex_Journey.mapped")) };
    }));

    EXPECT_EQ(store.get_string("pendingImportFilename"), std::optional<std::string>("Alex_Journey.mapped"));
}

TEST_F(MongoKeyValueStoreTest, MissingDocumentIsAbsent)
{
    EXPECT_CALL(coll, find_one(_)).WillOnce(Return(std::nullopt));
    EXPECT_FALSE(store.get_string("pendingImportData").has_value());
}

TEST_F(MongoKeyValueStoreTest, DocumentWithoutStringValueIsAbsent)
{
    EXPECT_CALL(coll, find_one(_))
        .WillOnce(Return(std::optional<bsoncxx::document::value>{ make_document(kvp("_id", "k")) }))
        .WillOnce(Return(std::optional<bsoncxx::document::value>{ make_document(kvp("_id", "k"), kvp("value", 42)) }));

    EXPECT_FALSE(store.get_string("k").has_value());
    EXPECT_FALSE(store.get_string("k").has_value());
}

TEST_F(MongoKeyValueStoreTest, RemoveDeletesByKeyId)
{
    EXPECT_CALL(coll, delete_one(_)).WillOnce(Invoke([](const bsoncxx::document::value& filter) {
        EXPECT_EQ(id_of(filter), "pendingImportData");
    }));

    store.remove("pendingImportData");
}

TEST_F(MongoKeyValueStoreTest, DriverErrorsAreStoreUnavailable)
{
    ON_CALL(coll, update_one(_, _)).WillByDefault(Throw(driver_error()));
    ON_CALL(coll, find_one(_)).WillByDefault(Throw(driver_error()));
    ON_CALL(coll, delete_one(_)).WillByDefault(Throw(driver_error()));

    for (int op = 0; op < 3; ++op)
    {
        try
        {
            if (op == 0)
                store.set_string("k", "v");
            else if (op == 1)
                store.get_string("k");
            else
                store.remove("k");
            FAIL() << "driver error swallowed by op " << op;
        }
        catch (const HandoffError& e)
        {
            EXPECT_EQ(e.kind(), HandoffErrorKind::StoreUnavailable);
        }
    }
}

TEST_F(MongoKeyValueStoreTest, StagingChannelRoundTripsThroughDocuments)
{
    std::map<std::string, std::string> docs;
    ON_CALL(coll, update_one(_, _))
        .WillByDefault(Invoke([&](const bsoncxx::document::value& filter, const bsoncxx::document::value& update) {
            docs[id_of(filter)] = std::string{ update.view()["$set"]["value"].get_string().value };
        }));
    ON_CALL(coll, find_one(_)).WillByDefault(Invoke([&](const bsoncxx::document::value& filter) {
        const auto it = docs.find(id_of(filter));
        if (it == docs.end())
            return std::optional<bsoncxx::document::value>{};
        return std::optional<bsoncxx::document::value>{ make_document(kvp("_id", it->first),
                                                                      kvp("value", it->second)) };
    }));
    ON_CALL(coll, delete_one(_)).WillByDefault(Invoke([&](const bsoncxx::document::value& filter) {
        docs.erase(id_of(filter));
    }));

    StagingChannel channel(store, nullptr);
    channel.stage("p1", "one.mapped");
    channel.stage("p2", "two.mapped");

    const auto rec = channel.take_staged();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->payload, "p2");
    EXPECT_EQ(rec->filename, "two.mapped");
    EXPECT_TRUE(docs.empty());
}

// Opening a client does not contact the server, so these run without MongoDB.
TEST(MongoKeyValueStore, MalformedUriIsStoreUnavailable)
{
    try
    {
        MongoKeyValueStore store("not-a-mongo-uri", "group.com.novalco.mapped");
        FAIL() << "malformed uri accepted";
    }
    catch (const HandoffError& e)
    {
        EXPECT_EQ(e.kind(), HandoffErrorKind::StoreUnavailable);
    }
}

TEST(MongoKeyValueStore, EmptyGroupIsStoreUnavailable)
{
    try
    {
        MongoKeyValueStore store("mongodb://127.0.0.1:27017", "");
        FAIL() << "empty group accepted";
    }
    catch (const HandoffError& e)
    {
        EXPECT_EQ(e.kind(), HandoffErrorKind::StoreUnavailable);
    }
}

// Needs a live server: set JOURNEY_HANDOFF_TEST_MONGO_URI to run.
TEST(MongoKeyValueStore, StageAndTakeAgainstLiveServer)
{
    const char* uri = std::getenv("JOURNEY_HANDOFF_TEST_MONGO_URI");
    if (uri == nullptr)
        GTEST_SKIP() << "JOURNEY_HANDOFF_TEST_MONGO_URI not set";

    MongoKeyValueStore store(uri, "group.journey_handoff.test");
    StagingChannel     channel(store, nullptr);

    channel.stage("p1", "one.mapped");
    channel.stage("p2", "two.mapped");
    const auto rec = channel.take_staged();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->payload, "p2");
    EXPECT_EQ(rec->filename, "two.mapped");
    EXPECT_FALSE(channel.has_pending());
}
