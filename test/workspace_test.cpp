#include <atomic>
#include <thread>
#include <vector>
#include <sandcell/workspace.h>

#include "utils.h"

class WorkspaceTest : public ScratchTest {
 protected:
  SessionKey key{"alice", "s1"};
};

TEST_F(WorkspaceTest, EnsureCreatesOnce) {
  fs::path path = EnsureWorkspace(key);
  EXPECT_EQ(path, kWorkspaceRoot / "alice" / "s1");
  EXPECT_TRUE(fs::is_directory(path));
  EXPECT_EQ(EnsureWorkspace(key), path);
}

TEST_F(WorkspaceTest, SandboxToHost) {
  fs::path ws = SessionWorkspacePath(key);
  EXPECT_EQ(SandboxToHostPath(key, "/workspace"), ws);
  EXPECT_EQ(SandboxToHostPath(key, "/workspace/"), ws);
  EXPECT_EQ(SandboxToHostPath(key, "/workspace/a/b.txt"), ws / "a" / "b.txt");
  EXPECT_EQ(SandboxToHostPath(key, "/workspace/a/../c"), ws / "c");
}

TEST_F(WorkspaceTest, SandboxToHostRejectsOutside) {
  EXPECT_THROW(SandboxToHostPath(key, "/etc/passwd"), WorkspaceError);
  EXPECT_THROW(SandboxToHostPath(key, "/workspace/../etc"), WorkspaceError);
  EXPECT_THROW(SandboxToHostPath(key, "/workspace2/x"), WorkspaceError);
  EXPECT_THROW(SandboxToHostPath(key, "workspace/x"), WorkspaceError);
}

TEST_F(WorkspaceTest, HostToSandbox) {
  fs::path ws = SessionWorkspacePath(key);
  EXPECT_EQ(HostToSandboxPath(key, ws), "/workspace");
  EXPECT_EQ(HostToSandboxPath(key, ws / "out" / "nb.ipynb"), "/workspace/out/nb.ipynb");
  EXPECT_THROW(HostToSandboxPath(key, ws / ".." / "s2"), WorkspaceError);
  EXPECT_THROW(HostToSandboxPath(key, SessionWorkspacePath({"alice", "s2"}) / "x"), WorkspaceError);
}

TEST_F(WorkspaceTest, SessionsAreSeparate) {
  EXPECT_NE(EnsureWorkspace(key), EnsureWorkspace({"alice", "s2"}));
  EXPECT_NE(EnsureWorkspace(key), EnsureWorkspace({"bob", "s1"}));
}

TEST_F(WorkspaceTest, UnsafeIdentifiersRejected) {
  EXPECT_THROW(EnsureWorkspace({"..", "s1"}), std::invalid_argument);
  EXPECT_THROW(EnsureWorkspace({"alice", "a/b"}), std::invalid_argument);
  EXPECT_THROW(EnsureWorkspace({"", "s1"}), std::invalid_argument);
  EXPECT_NO_THROW(EnsureWorkspace({"alice@example.com", "s-1_2.x"}));
}

TEST(SessionTest, ScopedSessionNests) {
  EXPECT_EQ(CurrentSession(), (SessionKey{kDefaultUserId, kDefaultSessionId}));
  {
    ScopedSession outer({"alice", "s1"});
    EXPECT_EQ(CurrentSession().ToString(), "alice/s1");
    {
      ScopedSession inner({"bob", "s2"});
      EXPECT_EQ(CurrentSession().ToString(), "bob/s2");
    }
    EXPECT_EQ(CurrentSession().ToString(), "alice/s1");
  }
  EXPECT_EQ(CurrentSession().user_id, kDefaultUserId);
}

TEST(KeyedMutexTest, ExclusivePerKeyAndReleased) {
  KeyedMutex locks;
  std::atomic_int inside = 0, max_inside = 0, total = 0;
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&, i]() {
      for (int j = 0; j < 50; j++) {
        KeyedMutex::Lock lck(locks, i % 2 ? "a" : "b");
        if (i % 2) {
          int now = ++inside;
          int prev = max_inside;
          while (now > prev && !max_inside.compare_exchange_weak(prev, now));
          inside--;
        }
        total++;
      }
    });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(total, 400);
  EXPECT_EQ(max_inside, 1);
  EXPECT_EQ(locks.Size(), 0u);
  {
    KeyedMutex::Lock lck(locks, "alice/s1");
    EXPECT_EQ(locks.Size(), 1u);
  }
  EXPECT_EQ(locks.Size(), 0u);
}
