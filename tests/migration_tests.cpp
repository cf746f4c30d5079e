// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <icnx/store/migration.hpp>
#include "test_support.hpp"

using namespace icnx::store;
using icnx::test::TempDir;
using icnx::test::read_file;
using icnx::test::write_file;

namespace {

nlohmann::json legacy_record(const std::string& id, const std::string& session) {
    return {
        {"id", id},
        {"session_id", session},
        {"url", "https://example.com/" + id},
        {"filename", id + ".jpg"},
        {"dir", "/downloads"},
        {"size", 2048},
        {"status", "completed"},
        {"file_type", "image"},
        {"script_name", nullptr},
        {"source_url", "https://example.com/album"},
        {"created_at", 1700000000},
    };
}

} // namespace

TEST_CASE("migrate_json_history", "[migration]") {
    TempDir dir;
    HistoryStore store(dir / ".icnx" / "history.db");
    auto legacy = dir / "history.json";

    SECTION("Missing file migrates nothing") {
        auto n = migrate_json_history(legacy, store);
        REQUIRE(n.has_value());
        CHECK(*n == 0);
    }

    SECTION("Blank file migrates nothing") {
        write_file(legacy, "  \n");
        auto n = migrate_json_history(legacy, store);
        REQUIRE(n.has_value());
        CHECK(*n == 0);
    }

    SECTION("Plain array") {
        auto doc = nlohmann::json::array({legacy_record("a", "s1"), legacy_record("b", "s1")});
        write_file(legacy, doc.dump());

        auto n = migrate_json_history(legacy, store);
        REQUIRE(n.has_value());
        CHECK(*n == 2);
        CHECK(read_file(legacy) == "[]");

        auto rows = store.read_session("s1");
        REQUIRE(rows.has_value());
        REQUIRE(rows->size() == 2);
        CHECK(rows->front().size == 2048u);
        CHECK(rows->front().source_url == "https://example.com/album");
        CHECK(!rows->front().script_name);
    }

    SECTION("Wrapped in items, malformed records skipped") {
        nlohmann::json doc = {{"items", {legacy_record("a", "s1"), {{"id", "broken"}}, "junk"}}};
        write_file(legacy, doc.dump());

        auto n = migrate_json_history(legacy, store);
        REQUIRE(n.has_value());
        CHECK(*n == 1);

        auto rows = store.read_all();
        REQUIRE(rows.has_value());
        CHECK(rows->size() == 1);
    }

    SECTION("Running twice does not duplicate") {
        write_file(legacy, nlohmann::json::array({legacy_record("a", "s1")}).dump());
        REQUIRE(migrate_json_history(legacy, store).value() == 1);
        auto again = migrate_json_history(legacy, store);
        REQUIRE(again.has_value());
        CHECK(*again == 0);

        auto rows = store.read_all();
        REQUIRE(rows.has_value());
        CHECK(rows->size() == 1);
    }

    SECTION("Invalid JSON is an error and the file is kept") {
        write_file(legacy, "{ not json");
        auto n = migrate_json_history(legacy, store);
        REQUIRE(!n.has_value());
        CHECK(n.error() == StoreErrc::parse_error);
        CHECK(read_file(legacy) == "{ not json");
    }

    SECTION("Object without a record list is an error") {
        write_file(legacy, R"({"version": 1})");
        auto n = migrate_json_history(legacy, store);
        REQUIRE(!n.has_value());
        CHECK(n.error() == StoreErrc::parse_error);
    }
}
