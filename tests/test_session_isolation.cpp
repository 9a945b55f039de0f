#include <memguard/security/session_isolation.hpp>
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <sstream>

using namespace memguard;

TEST(SessionIsolationTest, ParentAndChildReachEachOther) {
    SessionIsolationManager mgr;
    mgr.register_session("root");
    mgr.register_session("child", "root");
    
    EXPECT_TRUE(mgr.can_access("child", "root"));
    EXPECT_TRUE(mgr.can_access("root", "child"));
    EXPECT_FALSE(mgr.can_access("child", "sibling"));
}

TEST(SessionIsolationTest, SiblingsAreIsolated) {
    SessionIsolationManager mgr;
    mgr.register_session("root");
    mgr.register_session("a", "root");
    mgr.register_session("b", "root");
    
    EXPECT_FALSE(mgr.can_access("a", "b"));
    EXPECT_FALSE(mgr.can_access("b", "a"));
    // Lineage is one hop only
    mgr.register_session("grandchild", "a");
    EXPECT_FALSE(mgr.can_access("grandchild", "root"));
    EXPECT_FALSE(mgr.can_access("root", "grandchild"));
}

TEST(SessionIsolationTest, UnregisteredSessionReachesOnlyItself) {
    SessionIsolationManager mgr;
    mgr.register_session("root");
    EXPECT_TRUE(mgr.can_access("ghost", "ghost"));
    EXPECT_FALSE(mgr.can_access("ghost", "root"));
    EXPECT_FALSE(mgr.can_access("root", "ghost"));
}

TEST(SessionIsolationTest, RegisterIsCreateOrFetch) {
    SessionIsolationManager mgr;
    mgr.register_session("root");
    SessionLineage first = mgr.register_session("child", "root");
    SessionLineage again = mgr.register_session("child", "other");
    
    EXPECT_EQ("root", first.parent_id);
    EXPECT_EQ("root", again.parent_id);
    
    SessionLineage root;
    ASSERT_TRUE(mgr.lineage("root", root));
    EXPECT_EQ(1u, root.children.size());
    EXPECT_EQ(1u, root.children.count("child"));
    EXPECT_EQ(2u, mgr.session_count());
}

TEST(SessionIsolationTest, UnknownParentIsRecordedButNotLinked) {
    SessionIsolationManager mgr;
    SessionLineage child = mgr.register_session("child", "late-root");
    EXPECT_EQ("late-root", child.parent_id);
    EXPECT_TRUE(mgr.can_access("child", "late-root"));
    
    mgr.register_session("late-root");
    SessionLineage root;
    ASSERT_TRUE(mgr.lineage("late-root", root));
    EXPECT_TRUE(root.children.empty());
    EXPECT_FALSE(mgr.can_access("late-root", "child"));
}

TEST(SessionIsolationTest, SelfParentIsIgnored) {
    SessionIsolationManager mgr;
    SessionLineage s = mgr.register_session("loop", "loop");
    EXPECT_FALSE(s.has_parent());
    EXPECT_TRUE(s.children.empty());
}

TEST(SessionIsolationTest, ConcurrentRegistration) {
    SessionIsolationManager mgr;
    mgr.register_session("root");
    
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.push_back(std::thread([&mgr, t]() {
            for (int i = 0; i < 50; ++i) {
                std::ostringstream id;
                id << "s" << t << "-" << i;
                mgr.register_session(id.str(), "root");
                mgr.can_access(id.str(), "root");
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }
    
    SessionLineage root;
    ASSERT_TRUE(mgr.lineage("root", root));
    EXPECT_EQ(400u, root.children.size());
    EXPECT_EQ(401u, mgr.session_count());
}
