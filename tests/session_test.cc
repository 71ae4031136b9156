#include <gtest/gtest.h>

#include "session.hpp"

TEST(SessionTest, VerbCycles) {
    Session session({"genrule"});
    EXPECT_EQ(session.verb(), "build");
    session.cycle_verb();
    EXPECT_EQ(session.verb(), "run");
    session.cycle_verb();
    EXPECT_EQ(session.verb(), "test");
    session.cycle_verb();
    EXPECT_EQ(session.verb(), "build");

    session.set_verb("coverage");
    session.cycle_verb();
    EXPECT_EQ(session.verb(), "build");
}

TEST(SessionTest, KindsAreNormalized) {
    const Session session({"py_test", "genrule", "", "py_test"});
    EXPECT_EQ(session.kinds(), (std::vector<std::string>{"genrule", "py_test"}));

    const Session empty(std::vector<std::string>{});
    EXPECT_EQ(empty.kinds(), (std::vector<std::string>{"genrule"}));
}

TEST(SessionTest, ListenersSeeOnlyRealChanges) {
    Session session({"genrule"});
    std::vector<std::string> verbs;
    std::vector<std::vector<std::string>> kinds;
    session.on_verb_change([&](const std::string& v) { verbs.push_back(v); });
    session.on_kinds_change([&](const std::vector<std::string>& k) { kinds.push_back(k); });

    session.set_verb("build");
    session.cycle_verb();
    EXPECT_EQ(verbs, (std::vector<std::string>{"run"}));

    EXPECT_FALSE(session.set_kinds({"genrule"}));
    EXPECT_TRUE(session.set_kinds({"genrule", "cc_binary"}));
    EXPECT_FALSE(session.set_kinds({"cc_binary", "genrule"}));
    ASSERT_EQ(kinds.size(), 1u);
    EXPECT_EQ(kinds.front(), (std::vector<std::string>{"cc_binary", "genrule"}));
}

TEST(SessionTest, ClearingKindsFallsBackToDefault) {
    Session session({"cc_binary"});
    EXPECT_TRUE(session.set_kinds({}));
    EXPECT_EQ(session.kinds(), (std::vector<std::string>{Session::DEFAULT_KIND}));
}
