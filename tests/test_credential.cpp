#include <gtest/gtest.h>
#include <stexporter/credential.hpp>
#include <stexporter/errors.hpp>

#include <atomic>
#include <boost/thread.hpp>
#include <cstdio>
#include <fstream>
#include <memory>
#include <vector>

using namespace stexporter;

TEST(Credential, RefreshBumpsGeneration) {
  Credential cred("old", [] { return std::string("new"); });
  auto t0 = cred.current();
  EXPECT_EQ(t0.value, "old");
  auto t1 = cred.refresh(t0.generation);
  EXPECT_EQ(t1.value, "new");
  EXPECT_EQ(t1.generation, t0.generation + 1);
  EXPECT_EQ(cred.refresh_count(), 1u);
}

TEST(Credential, StaleGenerationDoesNotRefreshAgain) {
  std::atomic<int> calls{0};
  Credential cred("old", [&] {
    ++calls;
    return std::string("new");
  });
  const auto seen = cred.current().generation;
  cred.refresh(seen);
  auto again = cred.refresh(seen);
  EXPECT_EQ(again.value, "new");
  EXPECT_EQ(calls.load(), 1);
}

TEST(Credential, ConcurrentRefreshIsSingleFlight) {
  std::atomic<int> calls{0};
  Credential cred("old", [&] {
    ++calls;
    boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
    return std::string("new");
  });
  const auto seen = cred.current().generation;

  std::atomic<int> got_new{0};
  std::vector<std::unique_ptr<boost::thread>> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back(std::make_unique<boost::thread>([&] {
      if (cred.refresh(seen).value == "new")
        ++got_new;
    }));
  }
  for (auto &t : threads)
    t->join();

  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(got_new.load(), 8);
  EXPECT_EQ(cred.refresh_count(), 1u);
}

TEST(Credential, SourceFailureReachesCaller) {
  Credential cred("old", []() -> std::string {
    throw AuthError("token revoked", 401);
  });
  EXPECT_THROW(cred.refresh(cred.current().generation), AuthError);
  EXPECT_EQ(cred.current().value, "old");
}

TEST(Credential, NoSourceMeansAuthError) {
  Credential cred("static", {});
  EXPECT_THROW(cred.refresh(cred.current().generation), AuthError);
}

TEST(Credential, EmptyRefreshIsRejected) {
  Credential cred("old", [] { return std::string("  \n"); });
  EXPECT_THROW(cred.refresh(cred.current().generation), AuthError);
}

TEST(Credential, FileSourceReadsFirstNonEmptyLine) {
  const std::string path = ::testing::TempDir() + "stexporter_token.txt";
  {
    std::ofstream f(path);
    f << "\n   abc-token  \nsecond\n";
  }
  EXPECT_EQ(file_token_source(path)(), "abc-token");
  std::remove(path.c_str());
  EXPECT_THROW(file_token_source(path)(), AuthError);
}
