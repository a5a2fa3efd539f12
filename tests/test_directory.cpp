#include <catch2/catch_test_macros.hpp>

#include "call_core/conversation/directory.hpp"

using namespace call_core;

TEST_CASE("directory upserts, finds and removes conversations") {
    InMemoryConversationDirectory directory;
    REQUIRE_FALSE(directory.find("g1"));

    directory.upsert(ConversationInfo{"g1", CallMode::Group, 5, false, false});
    REQUIRE(directory.find("g1")->member_count == 5);

    directory.upsert(ConversationInfo{"g1", CallMode::Group, 30, true, false});
    REQUIRE(directory.size() == 1);
    REQUIRE(directory.find("g1")->announcements_only);

    REQUIRE(directory.remove("g1"));
    REQUIRE_FALSE(directory.remove("g1"));
    REQUIRE(directory.size() == 0);
}

TEST_CASE("too big to ring is strictly above the limit") {
    ConversationInfo info{"g1", CallMode::Group, 16, false, false};
    REQUIRE_FALSE(is_too_big_to_ring(info, 16));
    info.member_count = 17;
    REQUIRE(is_too_big_to_ring(info, 16));
}
