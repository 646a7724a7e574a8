#include <thread>

#include "selector.h"
#include "utils.h"

namespace {

SelectorOptions Options(bool local_available, long interval = 60000) {
  SelectorOptions opt;
  opt.local_available = local_available;
  opt.probe_interval = interval;
  return opt;
}

} // namespace

TEST(Selector, PrefersContainer) {
  auto runtime = std::make_shared<FakeRuntime>();
  BackendSelector selector(runtime, Options(true));
  EXPECT_EQ(selector.Select(), Backend::CONTAINER);
}

TEST(Selector, FallsBackToLocal) {
  auto runtime = std::make_shared<FakeRuntime>();
  runtime->reachable = false;
  BackendSelector selector(runtime, Options(true));
  EXPECT_EQ(selector.Select(), Backend::LOCAL_RESTRICTED);
}

TEST(Selector, NothingAvailable) {
  auto runtime = std::make_shared<FakeRuntime>();
  runtime->reachable = false;
  BackendSelector selector(runtime, Options(false));
  EXPECT_EQ(selector.Select(), Backend::NONE);
}

TEST(Selector, FallbackDisabled) {
  auto runtime = std::make_shared<FakeRuntime>();
  runtime->reachable = false;
  SelectorOptions opt = Options(true);
  opt.allow_local = false;
  BackendSelector selector(runtime, opt);
  EXPECT_EQ(selector.Select(), Backend::NONE);
}

TEST(Selector, NoRuntime) {
  BackendSelector selector(nullptr, Options(true));
  EXPECT_EQ(selector.Select(), Backend::LOCAL_RESTRICTED);
}

TEST(Selector, ForcedLocalSkipsProbe) {
  auto runtime = std::make_shared<FakeRuntime>();
  SelectorOptions opt = Options(true);
  opt.forced = Backend::LOCAL_RESTRICTED;
  BackendSelector selector(runtime, opt);
  EXPECT_EQ(selector.Select(), Backend::LOCAL_RESTRICTED);
  EXPECT_EQ(runtime->ping_count.load(), 0);
}

TEST(Selector, ForcedContainerNeverFallsBack) {
  auto runtime = std::make_shared<FakeRuntime>();
  runtime->reachable = false;
  SelectorOptions opt = Options(true);
  opt.forced = Backend::CONTAINER;
  BackendSelector selector(runtime, opt);
  EXPECT_EQ(selector.Select(), Backend::NONE);
  runtime->reachable = true;
  selector.Invalidate();
  EXPECT_EQ(selector.Select(), Backend::CONTAINER);
}

TEST(Selector, CachesProbe) {
  auto runtime = std::make_shared<FakeRuntime>();
  BackendSelector selector(runtime, Options(true));
  for (int i = 0; i < 5; i++) EXPECT_EQ(selector.Select(), Backend::CONTAINER);
  EXPECT_EQ(runtime->ping_count.load(), 1);
  // a change is not seen until the cache expires or is invalidated
  runtime->reachable = false;
  EXPECT_EQ(selector.Select(), Backend::CONTAINER);
  selector.Invalidate();
  EXPECT_EQ(selector.Select(), Backend::LOCAL_RESTRICTED);
  EXPECT_EQ(runtime->ping_count.load(), 2);
}

TEST(Selector, RefreshesAfterInterval) {
  auto runtime = std::make_shared<FakeRuntime>();
  BackendSelector selector(runtime, Options(true, 0));
  EXPECT_EQ(selector.Select(), Backend::CONTAINER);
  runtime->reachable = false;
  EXPECT_EQ(selector.Select(), Backend::LOCAL_RESTRICTED);
  EXPECT_EQ(runtime->ping_count.load(), 2);
}

TEST(Selector, OneProbeInFlight) {
  auto runtime = std::make_shared<FakeRuntime>();
  runtime->ping_delay = 200;
  BackendSelector selector(runtime, Options(true));
  std::vector<std::thread> threads;
  std::vector<Backend> results(8);
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&, i]() { results[i] = selector.Select(); });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(runtime->ping_count.load(), 1);
  for (auto i : results) EXPECT_EQ(i, Backend::CONTAINER);
}

TEST(Selector, StaleValueDuringProbe) {
  auto runtime = std::make_shared<FakeRuntime>();
  BackendSelector selector(runtime, Options(true, 0));
  EXPECT_EQ(selector.Select(), Backend::CONTAINER);
  runtime->reachable = false;
  runtime->ping_delay = 300;
  std::thread prober([&]() { selector.Select(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  // the probe started by the other thread is still running
  EXPECT_EQ(selector.Select(), Backend::CONTAINER);
  prober.join();
  EXPECT_EQ(runtime->ping_count.load(), 2);
}
