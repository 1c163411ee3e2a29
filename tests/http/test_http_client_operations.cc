#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "conduit/http/client_errors.h"
#include "conduit/http/connection_driver.h"
#include "conduit/http/http_client_operations.h"
#include "mocks/network_mocks.h"

namespace conduit {
namespace http {
namespace {

using namespace std::chrono_literals;

class HttpClientOperationsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = event::createLibeventDispatcherFactory()->createDispatcher(
        "test");
    dispatcher_->run(event::RunType::NonBlock);
    channel_ = std::make_shared<test::FakeChannel>(*dispatcher_);
    ConnectionDriver::initializePipeline(*channel_);
  }

  void TearDown() override { channel_->close(); }

  void start(HttpMethod method,
             RequestHandler handler,
             const std::string& url = "http://example.com/path?q=1") {
    sink_ = std::make_shared<CompletionSink<HttpClientResponsePtr>>(
        [this](Result<HttpClientResponsePtr> result) { result_ = result; });
    ops_ = HttpClientOperations::create(channel_, sink_, options_);
    ops_->prepareRequest(get<Uri>(Uri::parse(url)), method);
    channel_->operations().set(ops_);
    ops_->start(std::move(handler));
  }

  const Error* error() const {
    return result_ ? get_error(*result_) : nullptr;
  }

  HttpClientResponsePtr response() const {
    if (!result_) {
      return nullptr;
    }
    auto* value = get_value(*result_);
    return value ? *value : nullptr;
  }

  static std::string fullBody(HttpClientResponse& response) {
    Result<std::string> body = Error();
    receiveString(response).subscribe(
        [&](Result<std::string> r) { body = r; });
    return is_success(body) ? get<std::string>(body) : "<error>";
  }

  ExchangeOptions options_;
  event::DispatcherPtr dispatcher_;
  std::shared_ptr<test::FakeChannel> channel_;
  ResponseSinkPtr sink_;
  HttpClientOperationsSharedPtr ops_;
  optional<Result<HttpClientResponsePtr>> result_;
};

TEST_F(HttpClientOperationsTest, BareRequestSendsDefaultHead) {
  start(HttpMethod::GET, nullptr);

  EXPECT_EQ(
      "GET /path?q=1 HTTP/1.1\r\nHost: example.com\r\nAccept: */*\r\n\r\n",
      channel_->written());
  EXPECT_TRUE(ops_->hasSentHeaders());
  EXPECT_FALSE(result_.has_value());

  channel_->deliver(test::httpResponse(200, "OK", {}, "ok"));

  ASSERT_NE(nullptr, response());
  EXPECT_EQ(200, response()->status());
  EXPECT_EQ("OK", response()->reason());
  EXPECT_EQ("ok", fullBody(*response()));
  // The exchange ends with its connection
  EXPECT_FALSE(channel_->isOpen());
}

TEST_F(HttpClientOperationsTest, MutatorsThrowOnceHeadersAreSent) {
  start(HttpMethod::GET, [](HttpClientRequest& req) {
    req.header("X-Trace", "abc").addCookie(Cookie("session", "1"));
    return req.sendHeaders();
  });

  EXPECT_NE(std::string::npos, channel_->written().find("X-Trace: abc\r\n"));
  EXPECT_NE(std::string::npos, channel_->written().find("Cookie: session=1\r\n"));

  try {
    ops_->addHeader("X-Late", "1");
    FAIL() << "expected HeaderLocked";
  } catch (const ClientException& e) {
    EXPECT_EQ(ClientErrorCode::HeaderLocked, e.code());
  }
  EXPECT_THROW(ops_->header("X-Late", "1"), ClientException);
  EXPECT_THROW(ops_->addCookie(Cookie("late", "1")), ClientException);
  EXPECT_THROW(ops_->keepAlive(false), ClientException);
  EXPECT_THROW(ops_->disableChunkedTransfer(), ClientException);
  EXPECT_FALSE(ops_->requestHeaders().has("X-Late"));
}

TEST_F(HttpClientOperationsTest, LatchIsSetExactlyOnce) {
  start(HttpMethod::GET, [](HttpClientRequest&) {
    return Completion([](const CompletionSinkPtr<std::nullptr_t>&) {});
  });
  ASSERT_FALSE(ops_->hasSentHeaders());

  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      if (ops_->markHeadersSent()) {
        winners++;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(1, winners.load());
  EXPECT_TRUE(ops_->hasSentHeaders());
}

TEST_F(HttpClientOperationsTest, SendSetsContentLength) {
  start(HttpMethod::POST,
        [](HttpClientRequest& req) { return req.send("data"); });

  const std::string& written = channel_->written();
  EXPECT_EQ(0u, written.find("POST /path?q=1 HTTP/1.1\r\n"));
  EXPECT_NE(std::string::npos, written.find("Content-Length: 4\r\n"));
  EXPECT_EQ(std::string::npos, written.find("Transfer-Encoding"));
  EXPECT_EQ("\r\n\r\ndata", written.substr(written.size() - 8));
}

TEST_F(HttpClientOperationsTest, StreamedBodyIsChunked) {
  auto parts = std::make_shared<std::vector<std::string>>(
      std::vector<std::string>{"ab", "cde"});
  start(HttpMethod::PUT, [parts](HttpClientRequest& req) {
    return req.sendStream([parts](std::string& chunk) {
      if (parts->empty()) {
        return false;
      }
      chunk = parts->front();
      parts->erase(parts->begin());
      return true;
    });
  });

  const std::string& written = channel_->written();
  EXPECT_NE(std::string::npos, written.find("Transfer-Encoding: chunked\r\n"));
  EXPECT_EQ("\r\n\r\n2\r\nab\r\n3\r\ncde\r\n0\r\n\r\n",
            written.substr(written.find("\r\n\r\n")));
}

TEST_F(HttpClientOperationsTest, StreamWaitsForWritability) {
  channel_->setWritable(false);
  int pulled = 0;
  start(HttpMethod::POST, [&pulled](HttpClientRequest& req) {
    req.disableChunkedTransfer().flushEach();
    return req.sendStream([&pulled](std::string& chunk) {
      if (pulled == 2) {
        return false;
      }
      chunk = "x";
      ++pulled;
      return true;
    });
  });
  EXPECT_EQ(0, pulled);

  channel_->setWritable(true);
  EXPECT_EQ(2, pulled);
  EXPECT_EQ("xx", channel_->written().substr(channel_->written().size() - 2));
}

TEST_F(HttpClientOperationsTest, HandlerExceptionBecomesHandlerError) {
  start(HttpMethod::GET, [](HttpClientRequest&) -> Completion {
    throw std::runtime_error("handler blew up");
  });

  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HandlerError));
  EXPECT_EQ("handler blew up", error()->message);
  EXPECT_FALSE(channel_->isOpen());
}

TEST_F(HttpClientOperationsTest, HandlerErrorCompletionFailsExchange) {
  start(HttpMethod::GET, [](HttpClientRequest&) {
    return Completion::error(Error(7, "refused by handler"));
  });
  ASSERT_NE(nullptr, error());
  EXPECT_EQ(7, error()->code);
  EXPECT_FALSE(channel_->isOpen());
}

TEST_F(HttpClientOperationsTest, ErrorStatusFailsWithHttpStatus) {
  start(HttpMethod::GET, nullptr);
  channel_->deliver(test::httpResponse(404, "Not Found", {}, "missing"));

  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HttpStatus));
  ASSERT_TRUE(error()->status.has_value());
  EXPECT_EQ(404, *error()->status);
  EXPECT_NE(std::string::npos, error()->message.find("404"));
  EXPECT_FALSE(channel_->isOpen());
}

TEST_F(HttpClientOperationsTest, RedirectSignalledWhenFollowing) {
  options_.follow_redirect = true;
  start(HttpMethod::GET, nullptr);
  channel_->deliver(
      test::httpResponse(302, "Found", {"Location: ../next?x=2"}, ""));

  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(isRedirect(*error()));
  EXPECT_EQ(302, *error()->status);
  EXPECT_EQ("http://example.com/next?x=2", *error()->location);
}

TEST_F(HttpClientOperationsTest, FollowRedirectFromHandler) {
  start(HttpMethod::GET, [](HttpClientRequest& req) {
    req.followRedirect();
    return req.sendHeaders();
  });
  EXPECT_TRUE(ops_->isFollowRedirect());
  channel_->deliver(
      test::httpResponse(301, "Moved", {"Location: https://b.example/"}, ""));
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(isRedirect(*error()));
}

TEST_F(HttpClientOperationsTest, RedirectWithoutFollowIsStatusError) {
  start(HttpMethod::GET, nullptr);
  channel_->deliver(
      test::httpResponse(301, "Moved", {"Location: /elsewhere"}, ""));
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HttpStatus));
  EXPECT_EQ(301, *error()->status);
}

TEST_F(HttpClientOperationsTest, RedirectWithoutLocationIsStatusError) {
  options_.follow_redirect = true;
  start(HttpMethod::GET, nullptr);
  channel_->deliver(test::httpResponse(307, "Temporary Redirect", {}, ""));
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HttpStatus));
}

TEST_F(HttpClientOperationsTest, InvalidLocationFailsWithInvalidUri) {
  options_.follow_redirect = true;
  start(HttpMethod::GET, nullptr);
  channel_->deliver(
      test::httpResponse(302, "Found", {"Location: ftp://files/"}, ""));
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::InvalidUri));
}

TEST_F(HttpClientOperationsTest, RedirectCapDisablesFollowing) {
  options_.follow_redirect = true;
  options_.max_redirects = 2;
  sink_ = std::make_shared<CompletionSink<HttpClientResponsePtr>>(
      [this](Result<HttpClientResponsePtr> result) { result_ = result; });
  ops_ = HttpClientOperations::create(channel_, sink_, options_);
  ops_->prepareRequest(get<Uri>(Uri::parse("http://example.com/")),
                       HttpMethod::GET);
  ops_->setRedirectHistory(RedirectHistory().append("http://a/"));
  EXPECT_TRUE(ops_->isFollowRedirect());

  ops_->setRedirectHistory(
      RedirectHistory().append("http://a/").append("http://b/"));
  EXPECT_FALSE(ops_->isFollowRedirect());
  EXPECT_EQ(2u, ops_->redirectedFrom().size());
}

TEST_F(HttpClientOperationsTest, UnsupportedVersionRejected) {
  start(HttpMethod::GET, nullptr);
  HttpResponseHead head;
  head.status = 200;
  head.version_major = 2;
  head.version_minor = 0;
  ops_->onResponseHeadersReceived(head);

  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::UnsupportedVersion));
}

TEST_F(HttpClientOperationsTest, DuplicateHeadIgnoredByDefault) {
  start(HttpMethod::GET, nullptr);
  HttpResponseHead first;
  first.status = 200;
  HttpResponseHead second;
  second.status = 500;

  ops_->onResponseHeadersReceived(first);
  ops_->onResponseHeadersReceived(second);

  ASSERT_NE(nullptr, response());
  EXPECT_EQ(200, response()->status());
  EXPECT_TRUE(channel_->isOpen());
}

TEST_F(HttpClientOperationsTest, DuplicateHeadFailsUnderStrictPolicy) {
  options_.duplicate_response_head = DuplicateHeadPolicy::Fail;
  start(HttpMethod::GET, nullptr);
  HttpResponseHead head;
  head.status = 200;

  ops_->onResponseHeadersReceived(head);
  ASSERT_NE(nullptr, response());
  HttpClientResponsePtr first = response();

  Result<std::string> body = std::string();
  receiveString(*first).subscribe([&](Result<std::string> r) { body = r; });
  ops_->onResponseHeadersReceived(head);

  EXPECT_FALSE(channel_->isOpen());
  ASSERT_TRUE(is_error(body));
  EXPECT_TRUE(hasCode(*get_error(body), ClientErrorCode::ProtocolError));
}

TEST_F(HttpClientOperationsTest, CloseBeforeResponseIsConnectionClosed) {
  start(HttpMethod::GET, nullptr);
  channel_->close();
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::ConnectionClosed));
  EXPECT_TRUE(ops_->isDisposed());
}

TEST_F(HttpClientOperationsTest, CloseMidBodyFailsBody) {
  start(HttpMethod::GET, nullptr);
  channel_->deliver(
      "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc");
  ASSERT_NE(nullptr, response());

  Result<std::string> body = std::string();
  receiveString(*response()).subscribe(
      [&](Result<std::string> r) { body = r; });
  channel_->close();

  ASSERT_TRUE(is_error(body));
  EXPECT_FALSE(get_error(body)->message.empty());
}

TEST_F(HttpClientOperationsTest, GarbageIsProtocolError) {
  start(HttpMethod::GET, nullptr);
  channel_->deliver("SMTP ready\r\n\r\n");
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::ProtocolError));
  EXPECT_FALSE(channel_->isOpen());
}

TEST_F(HttpClientOperationsTest, ResponseTimeoutFailsAndCloses) {
  options_.response_timeout = 20ms;
  start(HttpMethod::GET, nullptr);

  ASSERT_TRUE(test::runUntil(*dispatcher_, [&]() { return result_.has_value(); }));
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::Timeout));
  EXPECT_FALSE(channel_->isOpen());
}

TEST_F(HttpClientOperationsTest, TimerStopsOnceHeadArrives) {
  options_.response_timeout = 20ms;
  start(HttpMethod::GET, nullptr);
  channel_->deliver("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n");
  ASSERT_NE(nullptr, response());

  EXPECT_FALSE(test::runUntil(*dispatcher_,
                              [&]() { return !channel_->isOpen(); }, 80ms));
}

TEST_F(HttpClientOperationsTest, CancelDisposesExchange) {
  start(HttpMethod::GET, nullptr);
  sink_->cancel();
  EXPECT_FALSE(channel_->isOpen());
  EXPECT_FALSE(result_.has_value());
  EXPECT_TRUE(ops_->isDisposed());
}

TEST_F(HttpClientOperationsTest, ResponseCookiesParsed) {
  start(HttpMethod::GET, nullptr);
  channel_->deliver(test::httpResponse(
      200, "OK", {"Set-Cookie: a=1; Path=/", "Set-Cookie: a=2", "Set-Cookie: b=3"},
      ""));
  ASSERT_NE(nullptr, response());

  CookieMap cookies = response()->responseCookies();
  ASSERT_EQ(2u, cookies.size());
  ASSERT_EQ(2u, cookies["a"].size());
  EXPECT_EQ("2", cookies["a"][1].value);
  EXPECT_EQ("/", cookies["a"][0].path);
  EXPECT_EQ("3", cookies["b"][0].value);
}

TEST_F(HttpClientOperationsTest, SlowConsumerPausesReads) {
  options_.read_buffer_high_watermark = 4;
  start(HttpMethod::GET, nullptr);
  channel_->deliver(
      "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
      "a\r\n0123456789\r\n");
  ASSERT_NE(nullptr, response());
  EXPECT_FALSE(channel_->readEnabled());

  std::string seen;
  auto subscription = response()->receive()->subscribe(
      [&](std::string chunk) { seen += chunk; },
      [](const optional<Error>&) {});
  subscription->request(BodySubscription::kUnbounded);

  EXPECT_EQ("0123456789", seen);
  EXPECT_TRUE(channel_->readEnabled());
}

TEST_F(HttpClientOperationsTest, OnCloseCompletesWhenChannelCloses) {
  start(HttpMethod::GET, nullptr);
  channel_->deliver("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n");
  ASSERT_NE(nullptr, response());

  bool closed = false;
  response()->onClose().subscribe(
      [&](Result<std::nullptr_t>) { closed = true; });
  EXPECT_FALSE(closed);

  response()->dispose();
  EXPECT_TRUE(closed);
  EXPECT_TRUE(response()->isDisposed());
}

TEST_F(HttpClientOperationsTest, ReadIdleFiresWithoutTraffic) {
  start(HttpMethod::GET, nullptr);
  channel_->deliver("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n");
  ASSERT_NE(nullptr, response());

  bool idle = false;
  response()->onReadIdle(20ms, [&]() { idle = true; });
  EXPECT_TRUE(test::runUntil(*dispatcher_, [&]() { return idle; }));
}

}  // namespace
}  // namespace http
}  // namespace conduit
