#include <catch2/catch_test_macros.hpp>

#include "call_core/model/audio_level.hpp"

#include <cmath>
#include <limits>

using call_core::truncate_audio_level;

TEST_CASE("silence and noise map to zero") {
    REQUIRE(truncate_audio_level(0.0) == 0.0);
    REQUIRE(truncate_audio_level(0.01) == 0.0);
    REQUIRE(truncate_audio_level(-0.5) == 0.0);
    REQUIRE(truncate_audio_level(std::numeric_limits<double>::quiet_NaN()) == 0.0);
}

TEST_CASE("levels fall into fixed buckets") {
    REQUIRE(truncate_audio_level(0.011) == 0.25);
    REQUIRE(truncate_audio_level(0.19) == 0.25);
    REQUIRE(truncate_audio_level(0.2) == 0.5);
    REQUIRE(truncate_audio_level(0.39) == 0.5);
    REQUIRE(truncate_audio_level(0.4) == 0.75);
    REQUIRE(truncate_audio_level(0.6) == 1.0);
    REQUIRE(truncate_audio_level(1.0) == 1.0);
}

TEST_CASE("grading is monotonic") {
    double previous = 0.0;
    for (int i = 0; i <= 100; ++i) {
        const double graded = truncate_audio_level(i / 100.0);
        REQUIRE(graded >= previous);
        previous = graded;
    }
}
