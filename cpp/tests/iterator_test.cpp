#include <gtest/gtest.h>
#include "iterator.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <set>
#include <thread>
#include <vector>

using namespace siphon;
using namespace std::chrono_literals;
using siphon::test::FakeClient;
using siphon::test::make_requests;

TEST(ResponseIteratorTest, YieldsOneResultPerRequest) {
  auto client = std::make_shared<FakeClient>();
  auto requests = make_requests(7);
  ResponseIterator it(client, nullptr, requests);
  Context ctx;

  std::set<std::string> urls;
  while (it.advance(ctx)) {
    auto cur = it.current();
    ASSERT_NE(cur, nullptr);
    ASSERT_NE(cur->response, nullptr);
    EXPECT_EQ(cur->response->status_code, 200);
    urls.insert(cur->url);
  }

  EXPECT_EQ(urls.size(), 7u);
  EXPECT_FALSE(it.err().has_value());
  EXPECT_EQ(it.state(), ResponseIterator::State::Exhausted);
  EXPECT_EQ(client->calls(), 7u);
}

TEST(ResponseIteratorTest, StartsLazily) {
  auto client = std::make_shared<FakeClient>();
  ResponseIterator it(client, nullptr, make_requests(3));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(client->calls(), 0u);
  EXPECT_EQ(it.state(), ResponseIterator::State::Unstarted);
  EXPECT_EQ(it.current(), nullptr);

  Context ctx;
  EXPECT_TRUE(it.advance(ctx));
  EXPECT_EQ(it.state(), ResponseIterator::State::Running);
}

TEST(ResponseIteratorTest, ResolvesTableAndDatabase) {
  auto client = std::make_shared<FakeClient>();
  std::vector<RequestSpec> requests(2);
  requests[0].request.url = "https://api.test/v2/orders";
  requests[0].database = "shop";
  requests[1].request.url = "https://api.test/v2/users";
  requests[1].table = "people";

  ResponseIterator it(client, nullptr, requests, nullptr, 1);
  Context ctx;
  std::map<std::string, std::string> tables;
  while (it.advance(ctx)) {
    auto cur = it.current();
    tables[cur->url] = cur->database + "/" + cur->table;
  }
  EXPECT_EQ(tables["https://api.test/v2/orders"], "shop/v2orders");
  EXPECT_EQ(tables["https://api.test/v2/users"], "/people");
}

TEST(ResponseIteratorTest, CancelledBeforeFirstAdvance) {
  auto client = std::make_shared<FakeClient>();
  ResponseIterator it(client, nullptr, make_requests(3));
  Context ctx;
  ctx.cancel();

  EXPECT_FALSE(it.advance(ctx));
  auto err = it.err();
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, ErrorCode::Cancelled);
  EXPECT_EQ(it.state(), ResponseIterator::State::Canceled);
  EXPECT_EQ(client->calls(), 0u);
}

TEST(ResponseIteratorTest, EndOfStreamIsNotAnError) {
  auto client = std::make_shared<FakeClient>();
  ResponseIterator it(client, nullptr, make_requests(1));
  Context ctx;
  EXPECT_TRUE(it.advance(ctx));
  EXPECT_FALSE(it.advance(ctx));
  EXPECT_FALSE(it.err().has_value());

  // Sticky: later calls neither advance nor change the error.
  EXPECT_FALSE(it.advance(ctx));
  EXPECT_FALSE(it.err().has_value());
  EXPECT_EQ(it.state(), ResponseIterator::State::Exhausted);
}

TEST(ResponseIteratorTest, CancelWhileWaiting) {
  auto client = std::make_shared<FakeClient>();
  FakeClient::Route slow;
  slow.delay = 300ms;
  client->set_default(slow);

  ResponseIterator it(client, nullptr, make_requests(2));
  Context ctx;
  std::thread canceller([&] {
    std::this_thread::sleep_for(30ms);
    ctx.cancel();
  });
  EXPECT_FALSE(it.advance(ctx));
  canceller.join();

  ASSERT_TRUE(it.err().has_value());
  EXPECT_EQ(it.err()->code, ErrorCode::Cancelled);
  EXPECT_FALSE(it.advance(Context()));
  EXPECT_FALSE(it.close().has_value());
}

TEST(ResponseIteratorTest, TransportFailureYieldsEmptyResult) {
  auto client = std::make_shared<FakeClient>();
  auto requests = make_requests(4);
  FakeClient::Route down;
  down.fail = true;
  client->route(requests[2].request.url, down);

  ResponseIterator it(client, nullptr, requests);
  Context ctx;
  int with_response = 0, without_response = 0;
  while (it.advance(ctx)) {
    auto cur = it.current();
    if (cur->response) {
      with_response++;
    } else {
      without_response++;
      ASSERT_TRUE(cur->error.has_value());
      EXPECT_EQ(cur->error->code, ErrorCode::RequestFailed);
    }
  }

  EXPECT_EQ(with_response, 3);
  EXPECT_EQ(without_response, 1);
  auto err = it.err();
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, ErrorCode::RequestFailed);
  EXPECT_NE(err->message.find(requests[2].request.url), std::string::npos);
  EXPECT_EQ(it.state(), ResponseIterator::State::Errored);
}

TEST(ResponseIteratorTest, CloseIsIdempotent) {
  auto client = std::make_shared<FakeClient>();
  ResponseIterator it(client, nullptr, make_requests(2));
  Context ctx;
  EXPECT_TRUE(it.advance(ctx));
  EXPECT_FALSE(it.close().has_value());
  EXPECT_FALSE(it.close().has_value());
  EXPECT_TRUE(it.closed());
  EXPECT_FALSE(it.advance(ctx));
}

TEST(ResponseIteratorTest, CloseBeforeStart) {
  auto client = std::make_shared<FakeClient>();
  ResponseIterator it(client, nullptr, make_requests(2));
  EXPECT_FALSE(it.close().has_value());
  EXPECT_FALSE(it.advance(Context()));
  EXPECT_EQ(client->calls(), 0u);
}

TEST(ResponseIteratorTest, CloseConcurrentWithReaders) {
  auto client = std::make_shared<FakeClient>();
  ResponseIterator it(client, nullptr, make_requests(8));
  Context ctx;
  ASSERT_TRUE(it.advance(ctx));

  std::atomic<bool> stop{false};
  std::vector<std::thread> readers;
  for (int i = 0; i < 4; i++) {
    readers.emplace_back([&] {
      while (!stop) {
        (void)it.err();
        (void)it.current();
      }
    });
  }
  EXPECT_FALSE(it.close().has_value());
  EXPECT_FALSE(it.close().has_value());
  stop = true;
  for (auto& t : readers) t.join();
  EXPECT_TRUE(it.closed());
}

TEST(ResponseIteratorTest, RateLimiterCancellationIsRecorded) {
  auto client = std::make_shared<FakeClient>();
  // One free token, then a ten second wait.
  auto limiter = std::make_shared<TokenBucket>(1, 10s, 1);
  auto errors = std::make_shared<ErrorSlot>();
  ResponseIterator it(client, limiter, make_requests(2), errors, 2);

  Context ctx;
  ASSERT_TRUE(it.advance(ctx));
  ctx.cancel();
  EXPECT_FALSE(it.advance(ctx));
  EXPECT_EQ(it.err()->code, ErrorCode::Cancelled);
  it.close();

  // The waiting request was abandoned without being sent.
  EXPECT_EQ(client->calls(), 1u);
  auto recorded = errors->get();
  ASSERT_TRUE(recorded.has_value());
  EXPECT_EQ(recorded->code, ErrorCode::Cancelled);
}

TEST(ResponseIteratorTest, OtherStageErrorsDoNotFailIteration) {
  auto client = std::make_shared<FakeClient>();
  auto run_errors = std::make_shared<ErrorSlot>();
  run_errors->record(Error{ErrorCode::StorageFailed, "upsert items into postgres: refused"});

  ResponseIterator it(client, nullptr, make_requests(3), run_errors);
  Context ctx;
  int n = 0;
  while (it.advance(ctx)) n++;

  EXPECT_EQ(n, 3);
  EXPECT_FALSE(it.err().has_value());
  EXPECT_EQ(it.state(), ResponseIterator::State::Exhausted);
  EXPECT_EQ(run_errors->get()->code, ErrorCode::StorageFailed);
}

TEST(ResponseIteratorTest, FetchErrorsReachTheSharedRegister) {
  auto client = std::make_shared<FakeClient>();
  auto requests = make_requests(2);
  FakeClient::Route down;
  down.fail = true;
  client->route(requests[0].request.url, down);
  auto run_errors = std::make_shared<ErrorSlot>();

  ResponseIterator it(client, nullptr, requests, run_errors);
  Context ctx;
  while (it.advance(ctx)) {
  }
  ASSERT_TRUE(it.err().has_value());
  EXPECT_EQ(it.err()->code, ErrorCode::RequestFailed);
  ASSERT_TRUE(run_errors->has_error());
  EXPECT_EQ(run_errors->get()->code, ErrorCode::RequestFailed);
}
