#include <gtest/gtest.h>
#include "content_digest.hpp"

TEST(ContentDigestTest, Sha256KnownValues) {
    EXPECT_EQ(digest::sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(digest::sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentDigestTest, JsonDigestIgnoresInsertionOrder) {
    Json::Value first(Json::objectValue);
    first["dns"]["port"] = 53;
    first["dhcp"]["active"] = false;

    Json::Value second(Json::objectValue);
    second["dhcp"]["active"] = false;
    second["dns"]["port"] = 53;

    EXPECT_EQ(digest::ofJson(first), digest::ofJson(second));

    second["dns"]["port"] = 5353;
    EXPECT_NE(digest::ofJson(first), digest::ofJson(second));
}

TEST(ContentDigestTest, TrackerDetectsChanges) {
    DigestTracker tracker;
    const std::string key = "pi2.lan:443/config";

    EXPECT_TRUE(tracker.hasChanged(key, "aaa"));
    tracker.update(key, "aaa");
    EXPECT_FALSE(tracker.hasChanged(key, "aaa"));
    EXPECT_TRUE(tracker.hasChanged(key, "bbb"));

    // keys are independent
    EXPECT_TRUE(tracker.hasChanged("pi3.lan:443/config", "aaa"));
}
