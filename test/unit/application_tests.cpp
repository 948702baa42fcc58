// Copyright (c) 2025 The Unicity Foundation
// Unit tests for target parsing and application configuration

#include <catch2/catch_test_macros.hpp>
#include "application.hpp"
#include <sstream>

using namespace liveprobe::app;

TEST_CASE("ParseTargets - implicit and explicit ids", "[app][targets]") {
    std::vector<ProbeTarget> targets;
    std::string error;

    SECTION("Implicit ids count up from 1") {
        REQUIRE(ParseTargets({"127.0.0.1:80", "10.0.0.2:8545"}, targets, error));
        REQUIRE(targets.size() == 2);
        CHECK(targets[0].id == 1);
        CHECK(targets[0].address == "127.0.0.1:80");
        CHECK(targets[1].id == 2);
        CHECK(targets[1].address == "10.0.0.2:8545");
    }

    SECTION("Explicit ids are kept and skipped by implicit ones") {
        REQUIRE(ParseTargets({"a:1", "1=b:2", "c:3"}, targets, error));
        REQUIRE(targets.size() == 3);
        CHECK(targets[0].id == 2);
        CHECK(targets[0].address == "a:1");
        CHECK(targets[1].id == 1);
        CHECK(targets[1].address == "b:2");
        CHECK(targets[2].id == 3);
    }

    SECTION("Large explicit id") {
        REQUIRE(ParseTargets({"18446744073709551615=[::1]:80"}, targets, error));
        REQUIRE(targets.size() == 1);
        CHECK(targets[0].id == 18446744073709551615ULL);
        CHECK(targets[0].address == "[::1]:80");
    }

    SECTION("Addresses are not validated here") {
        REQUIRE(ParseTargets({"not-an-ip:80", "127.0.0.1"}, targets, error));
        CHECK(targets.size() == 2);
    }

    SECTION("No specs") {
        REQUIRE(ParseTargets({}, targets, error));
        CHECK(targets.empty());
    }
}

TEST_CASE("ParseTargets - rejected specs", "[app][targets]") {
    std::vector<ProbeTarget> targets{{9, "keep:1"}};
    std::string error;

    SECTION("Non-numeric id") {
        CHECK_FALSE(ParseTargets({"web=127.0.0.1:80"}, targets, error));
        CHECK(error.find("invalid request id") != std::string::npos);
    }

    SECTION("Negative id") {
        CHECK_FALSE(ParseTargets({"-1=127.0.0.1:80"}, targets, error));
        CHECK(error.find("invalid request id") != std::string::npos);
    }

    SECTION("Empty id") {
        CHECK_FALSE(ParseTargets({"=127.0.0.1:80"}, targets, error));
    }

    SECTION("Empty address") {
        CHECK_FALSE(ParseTargets({"4="}, targets, error));
        CHECK(error.find("empty address") != std::string::npos);
        CHECK_FALSE(ParseTargets({""}, targets, error));
    }

    SECTION("Duplicate explicit id") {
        CHECK_FALSE(ParseTargets({"1=a:1", "1=b:2"}, targets, error));
        CHECK(error == "duplicate request id 1");
    }

    // Output untouched on failure
    REQUIRE(targets.size() == 1);
    CHECK(targets[0].id == 9);
}

TEST_CASE("Application - initialize validates configuration", "[app]") {
    SECTION("No targets") {
        Application app(AppConfig{});
        CHECK_FALSE(app.initialize());
    }

    SECTION("Non-positive poll interval") {
        AppConfig config;
        config.targets = {{1, "127.0.0.1:80"}};
        config.probe_options.poll_interval = std::chrono::milliseconds(0);
        Application app(config);
        CHECK_FALSE(app.initialize());
    }

    SECTION("Duplicate ids") {
        AppConfig config;
        config.targets = {{1, "127.0.0.1:80"}, {1, "127.0.0.1:81"}};
        Application app(config);
        CHECK_FALSE(app.initialize());
    }

    SECTION("Valid") {
        AppConfig config;
        config.targets = {{1, "127.0.0.1:80"}};
        Application app(config);
        CHECK(app.initialize());
        CHECK_FALSE(app.is_running());
        CHECK(Application::instance() == &app);
    }
}

TEST_CASE("Application - run before initialize fails", "[app]") {
    AppConfig config;
    config.targets = {{1, "127.0.0.1:80"}};
    Application app(config);
    std::ostringstream out;
    CHECK(app.run(out) == 1);
    CHECK(out.str().empty());
}
