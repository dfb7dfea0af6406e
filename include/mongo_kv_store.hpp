#pragma once
#include "handoff_error.hpp"
#include "kv_store.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/update.hpp>
#include <mongocxx/uri.hpp>
#include <mutex>
#include <string>

// Shared store on a MongoDB server: one collection per sharing group,
// one document {_id: key, value: string} per key.
class MongoKeyValueStore : public IKeyValueStore
{
  public:
    MongoKeyValueStore(const std::string& uri, const std::string& group_id,
                       const std::string& dbname = "journey_handoff")
        : client_{ open_client(uri) }, coll_{ client_[dbname][checked_group(group_id)] }
    {
    }

    void set_string(const std::string& key, const std::string& value) override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        try
        {
            std::scoped_lock lk(mu_);
            upsert_one(key_filter(key), make_document(kvp("$set", make_document(kvp("value", value)))));
        }
        catch (const mongocxx::exception& e)
        {
            throw HandoffError(HandoffErrorKind::StoreUnavailable, std::string("mongo write failed: ") + e.what());
        }
    }

    std::optional<std::string> get_string(const std::string& key) const override
    {
        try
        {
            std::optional<bsoncxx::document::value> doc;
            {
                std::scoped_lock lk(mu_);
                doc = find_one(key_filter(key));
            }
            if (!doc)
                return std::nullopt;
            auto view = doc->view();
            auto it   = view.find("value");
            if (it == view.end() || it->type() != bsoncxx::type::k_string)
                return std::nullopt;
            return std::string{ it->get_string().value };
        }
        catch (const mongocxx::exception& e)
        {
            throw HandoffError(HandoffErrorKind::StoreUnavailable, std::string("mongo read failed: ") + e.what());
        }
    }

    void remove(const std::string& key) override
    {
        try
        {
            std::scoped_lock lk(mu_);
            delete_one(key_filter(key));
        }
        catch (const mongocxx::exception& e)
        {
            throw HandoffError(HandoffErrorKind::StoreUnavailable, std::string("mongo delete failed: ") + e.what());
        }
    }

  protected:
    // Collection access. Called with mu_ held; a mongocxx client is not thread-safe.
    virtual void upsert_one(bsoncxx::document::view filter, bsoncxx::document::view update)
    {
        coll_.update_one(filter, update, mongocxx::options::update{}.upsert(true));
    }

    virtual std::optional<bsoncxx::document::value> find_one(bsoncxx::document::view filter) const
    {
        auto found = coll_.find_one(filter);
        if (!found)
            return std::nullopt;
        return bsoncxx::document::value{ found->view() };
    }

    virtual void delete_one(bsoncxx::document::view filter)
    {
        coll_.delete_one(filter);
    }

  private:
    static bsoncxx::document::value key_filter(const std::string& key)
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        return make_document(kvp("_id", key));
    }

    static const std::string& checked_group(const std::string& group_id)
    {
        if (group_id.empty())
            throw HandoffError(HandoffErrorKind::StoreUnavailable, "empty sharing group id");
        return group_id;
    }

    static mongocxx::client open_client(const std::string& uri)
    {
        // the driver allows exactly one instance per process
        static mongocxx::instance instance{};
        try
        {
            return mongocxx::client{ mongocxx::uri{ uri } };
        }
        catch (const mongocxx::exception& e)
        {
            throw HandoffError(HandoffErrorKind::StoreUnavailable, std::string("cannot open mongo store: ") + e.what());
        }
    }

    mutable std::mutex           mu_;
    mongocxx::client             client_;
    mutable mongocxx::collection coll_;
};
