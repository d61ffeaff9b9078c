#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "portwarden/infra/port_state_store.hpp"

using namespace portwarden::infra;
namespace fs = std::filesystem;

namespace {

auto make_temp_dir(const std::string& name) -> fs::path {
    auto dir = fs::temp_directory_path() / ("portwarden_test_" + name);
    fs::remove_all(dir);
    return dir;
}

} // namespace

TEST_CASE("JsonFilePortStateStore loads nothing when the file is missing", "[port_state]") {
    auto dir = make_temp_dir("missing");
    JsonFilePortStateStore store(dir);

    CHECK_FALSE(store.load().has_value());
}

TEST_CASE("JsonFilePortStateStore persists the last port", "[port_state]") {
    auto dir = make_temp_dir("persist");

    {
        JsonFilePortStateStore store(dir);
        REQUIRE(store.save(9975).has_value());
        CHECK(fs::exists(dir / "port-state.json"));
        CHECK_FALSE(fs::exists(dir / "port-state.json.tmp"));
    }

    // A fresh instance sees the saved value.
    JsonFilePortStateStore reopened(dir);
    CHECK(reopened.load() == uint16_t{9975});

    std::ifstream in(reopened.path());
    auto j = nlohmann::json::parse(in);
    CHECK(j["last_successful_port"] == 9975);

    fs::remove_all(dir);
}

TEST_CASE("JsonFilePortStateStore clear removes the value", "[port_state]") {
    auto dir = make_temp_dir("clear");
    JsonFilePortStateStore store(dir);
    REQUIRE(store.save(9960).has_value());

    REQUIRE(store.clear().has_value());
    CHECK_FALSE(store.load().has_value());

    // Clearing twice is fine.
    CHECK(store.clear().has_value());

    fs::remove_all(dir);
}

TEST_CASE("JsonFilePortStateStore ignores unusable content", "[port_state]") {
    auto dir = make_temp_dir("corrupt");
    fs::create_directories(dir);
    JsonFilePortStateStore store(dir);

    SECTION("malformed JSON") {
        std::ofstream(store.path()) << "{ nope";
        CHECK_FALSE(store.load().has_value());
    }

    SECTION("out of range value") {
        std::ofstream(store.path()) << R"({"last_successful_port": 70000})";
        CHECK_FALSE(store.load().has_value());
    }

    SECTION("wrong type") {
        std::ofstream(store.path()) << R"({"last_successful_port": "9960"})";
        CHECK_FALSE(store.load().has_value());
    }

    fs::remove_all(dir);
}

TEST_CASE("MemoryPortStateStore", "[port_state]") {
    MemoryPortStateStore store(9975);
    CHECK(store.load() == uint16_t{9975});

    REQUIRE(store.save(9980).has_value());
    CHECK(store.load() == uint16_t{9980});

    REQUIRE(store.clear().has_value());
    CHECK_FALSE(store.load().has_value());
}
