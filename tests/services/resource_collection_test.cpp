/**
 * @file resource_collection_test.cpp
 * @brief Unit tests for image, volume and server collections
 */

#include <osmock/services/resource_collection.hpp>
#include <osmock/services/resource_requests.hpp>

#include "../mocks/memory_json_storage.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

using namespace osmock;
using namespace osmock::services;
using osmock::storage::resource_store;
using osmock::storage::store_state;
using osmock::storage::testing::memory_json_storage;

namespace {

struct collection_fixture {
    std::shared_ptr<memory_json_storage> storage =
        std::make_shared<memory_json_storage>();
    std::shared_ptr<resource_store> store = std::make_shared<resource_store>(storage);
    image_collection images{store, &store_state::images, "Image"};
    volume_collection volumes{store, &store_state::volumes, "Volume"};
    server_collection servers{store, &store_state::servers, "Server"};
};

}  // namespace

// ============================================================================
// Request parsing
// ============================================================================

TEST_CASE("parse_image_request: defaults", "[services][requests]") {
    auto parsed = parse_image_request({{"name", "ubuntu"}});

    REQUIRE(parsed.is_ok());
    const auto& request = parsed.value();
    REQUIRE(request.name == "ubuntu");
    REQUIRE(request.size == 0);
    REQUIRE(request.visibility == "private");
    REQUIRE(request.container_format == "bare");
    REQUIRE(request.disk_format == "qcow2");
}

TEST_CASE("parse_image_request: explicit values and nulls", "[services][requests]") {
    auto parsed = parse_image_request({{"name", "win"},
                                       {"size", 1024},
                                       {"visibility", "public"},
                                       {"container_format", nullptr},
                                       {"disk_format", "raw"}});

    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().size == 1024);
    REQUIRE(parsed.value().visibility == "public");
    REQUIRE(parsed.value().container_format == "bare");
    REQUIRE(parsed.value().disk_format == "raw");
}

TEST_CASE("parse_volume_request: largest signed size is accepted", "[services][requests]") {
    const auto largest = std::numeric_limits<std::int64_t>::max();
    auto parsed = parse_volume_request(
        {{"name", "data"}, {"size", static_cast<std::uint64_t>(largest)}});

    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().size == largest);
}

TEST_CASE("parse requests: invalid bodies are bad requests", "[services][requests]") {
    SECTION("image without name") {
        auto parsed = parse_image_request({{"size", 1}});
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code == error_codes::bad_request);
    }

    SECTION("image with string size") {
        auto parsed = parse_image_request({{"name", "x"}, {"size", "big"}});
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code == error_codes::bad_request);
    }

    SECTION("image size beyond the signed 64-bit range") {
        auto parsed = parse_image_request(
            {{"name", "x"}, {"size", std::numeric_limits<std::uint64_t>::max()}});
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code == error_codes::bad_request);
        REQUIRE(parsed.error().message == "Field 'size' must be an integer");
    }

    SECTION("volume size beyond the signed 64-bit range") {
        const auto too_big =
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1;
        auto parsed = parse_volume_request({{"name", "data"}, {"size", too_big}});
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code == error_codes::bad_request);
    }

    SECTION("volume without size") {
        auto parsed = parse_volume_request({{"name", "data"}});
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code == error_codes::bad_request);
    }

    SECTION("server without image_id") {
        auto parsed = parse_server_request({{"name", "web"}});
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code == error_codes::bad_request);
    }

    SECTION("body is an array") {
        auto parsed = parse_volume_request(nlohmann::json::array());
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code == error_codes::bad_request);
    }
}

TEST_CASE("make_server: BUILD status and optional flavor", "[services][requests]") {
    auto parsed = parse_server_request({{"name", "web"}, {"image_id", "img-1"}});
    REQUIRE(parsed.is_ok());
    REQUIRE_FALSE(parsed.value().flavor_id.has_value());

    auto server = make_server(parsed.value());
    REQUIRE_FALSE(server.id.empty());
    REQUIRE(server.status == "BUILD");
    REQUIRE(server.image_id == std::optional<std::string>("img-1"));
    REQUIRE_FALSE(server.flavor_id.has_value());

    nlohmann::json j = server;
    REQUIRE(j["flavor_id"].is_null());
}

TEST_CASE("make_image: queued with a creation time", "[services][requests]") {
    auto image = make_image(image_create_request{"ubuntu"});

    REQUIRE(image.status == "queued");
    REQUIRE(image.created_at.size() == std::string("2024-01-01T00:00:00.000000Z").size());
    REQUIRE(image.created_at.back() == 'Z');
}

// ============================================================================
// Collection operations
// ============================================================================

TEST_CASE("resource_collection: get after create returns the created entity",
          "[services][collection]") {
    collection_fixture f;

    SECTION("image") {
        auto created = f.images.create(make_image({"ubuntu", 42}));
        REQUIRE(created.is_ok());
        auto fetched = f.images.get(created.value().id);
        REQUIRE(fetched.is_ok());
        REQUIRE(fetched.value() == created.value());
    }

    SECTION("volume") {
        auto created = f.volumes.create(make_volume({"data", 10}));
        REQUIRE(created.is_ok());
        REQUIRE(created.value().status == "available");
        auto fetched = f.volumes.get(created.value().id);
        REQUIRE(fetched.is_ok());
        REQUIRE(fetched.value() == created.value());
    }

    SECTION("server") {
        auto created = f.servers.create(make_server({"web", "img-1", "m1.small"}));
        REQUIRE(created.is_ok());
        auto fetched = f.servers.get(created.value().id);
        REQUIRE(fetched.is_ok());
        REQUIRE(fetched.value() == created.value());
    }
}

TEST_CASE("resource_collection: list keeps insertion order", "[services][collection]") {
    collection_fixture f;

    auto a = f.volumes.create(make_volume({"a", 1}));
    auto b = f.volumes.create(make_volume({"b", 2}));
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());

    auto volumes = f.volumes.list();
    REQUIRE(volumes.size() == 3);
    REQUIRE(volumes[0].name == "vol-1");
    REQUIRE(volumes[1].id == a.value().id);
    REQUIRE(volumes[2].id == b.value().id);
}

TEST_CASE("resource_collection: delete then get and delete again are not found",
          "[services][collection]") {
    collection_fixture f;
    auto created = f.servers.create(make_server({"web", "img-1", std::nullopt}));
    REQUIRE(created.is_ok());
    const auto id = created.value().id;

    REQUIRE(f.servers.remove(id).is_ok());

    auto fetched = f.servers.get(id);
    REQUIRE(fetched.is_err());
    REQUIRE(fetched.error().code == error_codes::not_found);
    REQUIRE(fetched.error().message == "Server not found");

    auto again = f.servers.remove(id);
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == error_codes::not_found);
}

TEST_CASE("resource_collection: unknown id", "[services][collection]") {
    collection_fixture f;

    auto image = f.images.get("missing");
    REQUIRE(image.is_err());
    REQUIRE(image.error().message == "Image not found");

    const auto saves = f.storage->save_count();
    auto removed = f.volumes.remove("missing");
    REQUIRE(removed.is_err());
    REQUIRE(removed.error().message == "Volume not found");
    REQUIRE(f.storage->save_count() == saves);
}

TEST_CASE("resource_collection: create is persisted", "[services][collection]") {
    collection_fixture f;

    auto created = f.images.create(make_image({"ubuntu"}));
    REQUIRE(created.is_ok());

    auto doc = f.storage->document("images");
    REQUIRE(doc.has_value());
    REQUIRE(doc->size() == 2);
    REQUIRE((*doc)[1]["id"] == created.value().id);
    REQUIRE((*doc)[1]["status"] == "queued");
}

TEST_CASE("resource_collection: failed flush is reported and not applied",
          "[services][collection]") {
    collection_fixture f;
    f.storage->set_fail_saves(true);

    auto created = f.volumes.create(make_volume({"data", 10}));

    REQUIRE(created.is_err());
    REQUIRE(created.error().code == error_codes::persistence_failed);
    REQUIRE(f.volumes.list().size() == 1);
}
