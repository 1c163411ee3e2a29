#include <string>

#include <gtest/gtest.h>

#include "conduit/http/client_errors.h"
#include "conduit/http/redirect_bridge.h"
#include "mocks/network_mocks.h"

namespace conduit {
namespace http {
namespace {

// Serves /hop/<k>: redirects to /hop/<k+1> until k reaches hops, then 200
std::string hopResponder(int hops, const std::string& head) {
  std::string path = test::requestPath(head);
  const std::string prefix = "/hop/";
  if (path.compare(0, prefix.size(), prefix) != 0) {
    return test::httpResponse(404, "Not Found", {}, "");
  }
  int k = std::stoi(path.substr(prefix.size()));
  if (k < hops) {
    return test::httpResponse(
        302, "Found", {"Location: /hop/" + std::to_string(k + 1)}, "");
  }
  return test::httpResponse(200, "OK", {}, "arrived");
}

class RedirectBridgeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = event::createLibeventDispatcherFactory()->createDispatcher(
        "test");
    dispatcher_->run(event::RunType::NonBlock);
    options_.follow_redirect = true;
  }

  void TearDown() override {
    if (connector_) {
      for (auto& channel : connector_->channels()) {
        channel->close();
      }
    }
  }

  void serve(test::ScriptedConnector::Responder responder) {
    connector_ = std::make_shared<test::ScriptedConnector>(
        *dispatcher_, std::move(responder));
    bridge_ = std::make_unique<RedirectBridge>(
        std::make_shared<ConnectionDriver>(connector_, options_));
  }

  void serveHops(int hops) {
    serve([hops](const network::ConnectRequest&, const std::string& head) {
      return hopResponder(hops, head);
    });
  }

  bool request(const std::string& url,
               RequestHandler handler = nullptr,
               HttpMethod method = HttpMethod::GET) {
    handle_ = bridge_->request(get<Uri>(Uri::parse(url)), method,
                               std::move(handler))
                  .subscribe([this](Result<HttpClientResponsePtr> result) {
                    result_ = result;
                    ++completions_;
                  });
    return test::runUntil(
        *dispatcher_, [this]() { return result_.has_value(); },
        std::chrono::milliseconds(5000));
  }

  const Error* error() const { return get_error(*result_); }
  HttpClientResponsePtr response() const {
    auto* value = get_value(*result_);
    return value ? *value : nullptr;
  }

  ExchangeOptions options_;
  event::DispatcherPtr dispatcher_;
  std::shared_ptr<test::ScriptedConnector> connector_;
  std::unique_ptr<RedirectBridge> bridge_;
  DisposablePtr handle_;
  optional<Result<HttpClientResponsePtr>> result_;
  int completions_{0};
};

TEST_F(RedirectBridgeTest, NoRedirectPassesThrough) {
  serveHops(0);
  ASSERT_TRUE(request("http://example.com/hop/0"));
  ASSERT_NE(nullptr, response());
  EXPECT_EQ(200, response()->status());
  EXPECT_TRUE(response()->redirectedFrom().empty());
  EXPECT_EQ(1u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, FollowsToAnotherHost) {
  serve([](const network::ConnectRequest& request, const std::string&) {
    if (request.host == "old.example") {
      return test::httpResponse(
          301, "Moved Permanently",
          {"Location: https://new.example:8443/landing"}, "");
    }
    return test::httpResponse(200, "OK", {}, "hello");
  });

  ASSERT_TRUE(request("http://old.example/start?x=1"));
  ASSERT_NE(nullptr, response());
  EXPECT_EQ(200, response()->status());
  EXPECT_EQ((std::vector<std::string>{"http://old.example/start?x=1"}),
            response()->redirectedFrom().entries());

  ASSERT_EQ(2u, connector_->requests().size());
  const network::ConnectRequest& second = connector_->requests()[1];
  EXPECT_EQ("new.example", second.host);
  EXPECT_EQ(8443, second.port);
  EXPECT_TRUE(second.secure);
  // Each attempt gets its own connection, the previous one is closed
  EXPECT_FALSE(connector_->channels()[0]->isOpen());
  EXPECT_EQ(1, completions_);
}

TEST_F(RedirectBridgeTest, FiftyRedirectsAreFollowed) {
  serveHops(50);
  ASSERT_TRUE(request("http://example.com/hop/0"));

  ASSERT_NE(nullptr, response());
  EXPECT_EQ(200, response()->status());
  RedirectHistory history = response()->redirectedFrom();
  EXPECT_EQ(50u, history.size());
  EXPECT_EQ("http://example.com/hop/0", history.entries().front());
  EXPECT_EQ("http://example.com/hop/49", history.last());
  EXPECT_EQ(51u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, FiftyFirstRedirectFails) {
  serveHops(51);
  ASSERT_TRUE(request("http://example.com/hop/0"));

  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HttpStatus));
  EXPECT_EQ(302, *error()->status);
  EXPECT_EQ(51u, connector_->requests().size());
  EXPECT_EQ(1, completions_);
}

TEST_F(RedirectBridgeTest, ConfiguredCapBelowFifty) {
  options_.max_redirects = 3;
  serveHops(4);
  ASSERT_TRUE(request("http://example.com/hop/0"));
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HttpStatus));
  EXPECT_EQ(4u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, DisabledFollowReturnsRedirectStatus) {
  options_.follow_redirect = false;
  serveHops(1);
  ASSERT_TRUE(request("http://example.com/hop/0"));
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HttpStatus));
  EXPECT_EQ(302, *error()->status);
  EXPECT_EQ(1u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, HandlerRunsOnEveryAttempt) {
  options_.follow_redirect = false;
  std::vector<std::string> heads;
  serve([&heads](const network::ConnectRequest&, const std::string& head) {
    heads.push_back(head);
    return hopResponder(2, head);
  });

  int calls = 0;
  ASSERT_TRUE(request(
      "http://example.com/hop/0",
      [&calls](HttpClientRequest& req) {
        ++calls;
        req.followRedirect().header("X-Attempt", std::to_string(calls));
        return req.send("payload");
      },
      HttpMethod::PUT));

  ASSERT_NE(nullptr, response());
  EXPECT_EQ(3, calls);
  ASSERT_EQ(3u, heads.size());
  // The method is kept across redirects
  EXPECT_EQ(0u, heads[2].find("PUT /hop/2 HTTP/1.1\r\n"));
  EXPECT_NE(std::string::npos, heads[2].find("X-Attempt: 3\r\n"));
}

TEST_F(RedirectBridgeTest, OtherFailuresEndTheChain) {
  serve([](const network::ConnectRequest&, const std::string& head) {
    if (test::requestPath(head) == "/a") {
      return test::httpResponse(307, "Temporary Redirect", {"Location: /b"}, "");
    }
    return test::httpResponse(500, "Internal Server Error", {}, "");
  });

  ASSERT_TRUE(request("http://example.com/a"));
  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HttpStatus));
  EXPECT_EQ(500, *error()->status);
  EXPECT_EQ(2u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, EachSubscriptionStartsFromOriginalTarget) {
  serveHops(2);
  Single<HttpClientResponsePtr> single = bridge_->request(
      get<Uri>(Uri::parse("http://example.com/hop/0")), HttpMethod::GET,
      nullptr);

  std::vector<size_t> history_sizes;
  auto first = single.subscribe([&](Result<HttpClientResponsePtr> r) {
    history_sizes.push_back(get<HttpClientResponsePtr>(r)->redirectedFrom().size());
  });
  ASSERT_TRUE(test::runUntil(*dispatcher_,
                             [&]() { return history_sizes.size() == 1; }));
  auto second = single.subscribe([&](Result<HttpClientResponsePtr> r) {
    history_sizes.push_back(get<HttpClientResponsePtr>(r)->redirectedFrom().size());
  });
  ASSERT_TRUE(test::runUntil(*dispatcher_,
                             [&]() { return history_sizes.size() == 2; }));

  EXPECT_EQ((std::vector<size_t>{2, 2}), history_sizes);
  EXPECT_EQ(6u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, DisposeWhileNextHopConnects) {
  serve([this](const network::ConnectRequest&, const std::string& head) {
    connector_->holdConnections(true);
    return hopResponder(1, head);
  });

  handle_ = bridge_->request(get<Uri>(Uri::parse("http://example.com/hop/0")),
                             HttpMethod::GET, nullptr)
                .subscribe([this](Result<HttpClientResponsePtr> result) {
                  result_ = result;
                });
  ASSERT_TRUE(test::runUntil(
      *dispatcher_, [this]() { return connector_->requests().size() == 2; }));
  handle_->dispose();

  EXPECT_EQ(1, connector_->cancelledConnects());
  ASSERT_EQ(1u, connector_->channels().size());
  EXPECT_FALSE(connector_->channels()[0]->isOpen());
  test::runUntil(*dispatcher_, []() { return false; },
                 std::chrono::milliseconds(50));
  EXPECT_FALSE(result_.has_value());
  EXPECT_EQ(2u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, DisposeDuringNextHopExchange) {
  bool second_hop_sent = false;
  serve([&second_hop_sent](const network::ConnectRequest&,
                           const std::string& head) {
    if (test::requestPath(head) == "/hop/1") {
      // No answer; the exchange stays open
      second_hop_sent = true;
      return std::string();
    }
    return hopResponder(1, head);
  });

  handle_ = bridge_->request(get<Uri>(Uri::parse("http://example.com/hop/0")),
                             HttpMethod::GET, nullptr)
                .subscribe([this](Result<HttpClientResponsePtr> result) {
                  result_ = result;
                });
  ASSERT_TRUE(
      test::runUntil(*dispatcher_, [&]() { return second_hop_sent; }));
  ASSERT_EQ(2u, connector_->channels().size());
  EXPECT_TRUE(connector_->channels()[1]->isOpen());
  handle_->dispose();

  EXPECT_TRUE(test::runUntil(*dispatcher_, [this]() {
    return !connector_->channels()[1]->isOpen();
  }));
  test::runUntil(*dispatcher_, []() { return false; },
                 std::chrono::milliseconds(50));
  EXPECT_FALSE(result_.has_value());
  EXPECT_EQ(2u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, RedirectWithoutLocationIsStatusFailure) {
  serveHops(0);
  ASSERT_TRUE(request("http://example.com/hop/0",
                      [](HttpClientRequest&) -> Completion {
                        Error moved(static_cast<int>(ClientErrorCode::Redirect),
                                    "moved");
                        moved.status = 302;
                        throw ClientException(moved);
                      }));

  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HttpStatus));
  EXPECT_EQ(302, *error()->status);
  EXPECT_EQ(1u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, UnresolvableLocationIsInvalidUri) {
  serveHops(0);
  ASSERT_TRUE(request("http://example.com/hop/0",
                      [](HttpClientRequest&) -> Completion {
                        throw ClientException(
                            redirectError(302, "ftp://files.example/x"));
                      }));

  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::InvalidUri));
  EXPECT_EQ(1u, connector_->requests().size());
}

TEST_F(RedirectBridgeTest, RedirectLoopStopsAtConfiguredCap) {
  options_.max_redirects = 3;
  serveHops(0);
  ASSERT_TRUE(request("http://example.com/hop/0",
                      [](HttpClientRequest&) -> Completion {
                        throw ClientException(
                            redirectError(307, "http://example.com/hop/0"));
                      }));

  ASSERT_NE(nullptr, error());
  EXPECT_TRUE(hasCode(*error(), ClientErrorCode::HttpStatus));
  EXPECT_EQ(307, *error()->status);
  EXPECT_EQ(4u, connector_->requests().size());
}

}  // namespace
}  // namespace http
}  // namespace conduit
