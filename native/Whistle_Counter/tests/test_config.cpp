#include <catch2/catch.hpp>
#include "wc/config.hpp"
#include "wc/detector.hpp"

#include <stdexcept>

TEST_CASE("default parameters validate", "[config]") {
    wc::Params p;
    REQUIRE_FALSE(wc::validate(p.detector).has_value());
    REQUIRE(p.detector.block_seconds() == Approx(0.064));
}

TEST_CASE("hysteresis band is mandatory", "[config]") {
    wc::DetectorConfig c;
    c.rise = 3.0;
    c.fall = 3.0;
    auto err = wc::validate(c);
    REQUIRE(err.has_value());
    REQUIRE(err->find("hysteresis") != std::string::npos);

    c.fall = 4.0;
    REQUIRE(wc::validate(c).has_value());
    REQUIRE_THROWS_AS(wc::Detector(c), std::invalid_argument);
}

TEST_CASE("parameter ranges", "[config]") {
    wc::DetectorConfig ok;

    auto bad = [&](auto mutate) {
        wc::DetectorConfig c = ok;
        mutate(c);
        return wc::validate(c).has_value();
    };

    CHECK(bad([](wc::DetectorConfig& c){ c.sample_rate = 0; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.block_size = -1; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.min_duration = -0.1; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.min_duration = 5.0; c.max_duration = 4.0; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.rise = 0.0; c.fall = -1.0; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.fall = 0.0; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.hold_seconds = -0.5; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.alpha = 0.0; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.alpha = 1.5; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.warmup_seconds = -1.0; }));
    CHECK(bad([](wc::DetectorConfig& c){ c.seed_from_first_block = false; c.initial_floor = 0.0; }));

    CHECK_FALSE(bad([](wc::DetectorConfig& c){ c.alpha = 1.0; }));
    CHECK_FALSE(bad([](wc::DetectorConfig& c){ c.hold_seconds = 0.0; c.warmup_seconds = 0.0; }));
    CHECK_FALSE(bad([](wc::DetectorConfig& c){ c.min_duration = 2.0; c.max_duration = 2.0; }));
    // initial_floor is ignored while seeding from the first block
    CHECK_FALSE(bad([](wc::DetectorConfig& c){ c.initial_floor = 0.0; }));
}
