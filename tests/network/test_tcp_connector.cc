#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "conduit/event/event_loop.h"
#include "conduit/network/connector.h"
#include "mocks/network_mocks.h"

namespace conduit {
namespace network {
namespace {

using namespace std::chrono_literals;

// Listening socket on 127.0.0.1 with an ephemeral port
class LoopbackListener {
 public:
  LoopbackListener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    EXPECT_EQ(0, ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)));
    EXPECT_EQ(0, ::listen(fd_, 4));
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~LoopbackListener() {
    if (accepted_ >= 0) {
      ::close(accepted_);
    }
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  uint16_t port() const { return port_; }

  int accept() {
    accepted_ = ::accept(fd_, nullptr, nullptr);
    return accepted_;
  }

  void closeListener() {
    ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_{-1};
  int accepted_{-1};
  uint16_t port_{0};
};

class CollectingFilter : public ReadFilter {
 public:
  void initializeReadFilterCallbacks(ReadFilterCallbacks&) override {}
  void onRead(MessagePtr message) override {
    if (auto* bytes = dynamic_cast<BytesMessage*>(message.get())) {
      received += bytes->data().toString();
    }
  }
  void onChannelInactive() override { inactive = true; }

  std::string received;
  bool inactive{false};
};

class TcpConnectorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = event::createLibeventDispatcherFactory()->createDispatcher(
        "test");
    dispatcher_->run(event::RunType::NonBlock);
  }

  std::shared_ptr<TcpConnector> makeConnector(
      std::chrono::milliseconds timeout = 2000ms) {
    TcpConnectorConfig config;
    config.connect_timeout = timeout;
    return std::make_shared<TcpConnector>(*dispatcher_, config);
  }

  event::DispatcherPtr dispatcher_;
};

TEST_F(TcpConnectorTest, ConnectsAndExchangesBytes) {
  LoopbackListener listener;
  auto connector = makeConnector();

  ChannelSharedPtr channel;
  bool done = false;
  auto handle = connector->connect(
      ConnectRequest{"127.0.0.1", listener.port(), false},
      [&](Result<ChannelSharedPtr> result) {
        done = true;
        if (auto* value = get_value(result)) {
          channel = *value;
        }
      });

  ASSERT_TRUE(test::runUntil(*dispatcher_, [&]() { return done; }));
  ASSERT_NE(nullptr, channel);
  EXPECT_TRUE(channel->isOpen());
  EXPECT_FALSE(channel->secure());
  EXPECT_EQ(listener.port(), channel->remoteAddress()->port());

  int server = listener.accept();
  ASSERT_GE(server, 0);

  auto collector = std::make_shared<CollectingFilter>();
  channel->pipeline().addLast("collector", collector);

  OwnedBuffer out("ping");
  channel->write(out);
  EXPECT_EQ(0u, out.length());

  std::string got;
  ASSERT_TRUE(test::runUntil(*dispatcher_, [&]() {
    char buf[16];
    ssize_t n = ::recv(server, buf, sizeof(buf), MSG_DONTWAIT);
    if (n > 0) {
      got.append(buf, n);
    }
    return got == "ping";
  }));

  ASSERT_EQ(4, ::send(server, "pong", 4, 0));
  ASSERT_TRUE(test::runUntil(*dispatcher_,
                             [&]() { return collector->received == "pong"; }));

  bool closed = false;
  channel->addCloseCallback([&]() { closed = true; });
  ::shutdown(server, SHUT_RDWR);
  ASSERT_TRUE(test::runUntil(*dispatcher_, [&]() { return closed; }));
  EXPECT_TRUE(collector->inactive);
  EXPECT_FALSE(channel->isOpen());
}

TEST_F(TcpConnectorTest, RefusedPortReportsError) {
  uint16_t port;
  {
    LoopbackListener listener;
    port = listener.port();
    listener.closeListener();
  }
  auto connector = makeConnector();

  optional<Error> error;
  bool done = false;
  auto handle = connector->connect(ConnectRequest{"127.0.0.1", port, false},
                                   [&](Result<ChannelSharedPtr> result) {
                                     done = true;
                                     if (auto* e = get_error(result)) {
                                       error = *e;
                                     }
                                   });

  ASSERT_TRUE(test::runUntil(*dispatcher_, [&]() { return done; }));
  ASSERT_TRUE(error.has_value());
  EXPECT_NE(std::string::npos, error->message.find("127.0.0.1"));
}

TEST_F(TcpConnectorTest, SecureRequestWithoutContextFails) {
  auto connector = makeConnector();

  optional<Error> error;
  auto handle = connector->connect(ConnectRequest{"127.0.0.1", 443, true},
                                   [&](Result<ChannelSharedPtr> result) {
                                     if (auto* e = get_error(result)) {
                                       error = *e;
                                     }
                                   });

  ASSERT_TRUE(
      test::runUntil(*dispatcher_, [&]() { return error.has_value(); }));
  EXPECT_NE(std::string::npos, error->message.find("TLS"));
}

TEST_F(TcpConnectorTest, DisposedAttemptNeverCallsBack) {
  LoopbackListener listener;
  auto connector = makeConnector();

  bool called = false;
  auto handle = connector->connect(
      ConnectRequest{"127.0.0.1", listener.port(), false},
      [&](Result<ChannelSharedPtr>) { called = true; });
  handle->dispose();

  EXPECT_FALSE(test::runUntil(*dispatcher_, [&]() { return called; }, 200ms));
}

}  // namespace
}  // namespace network
}  // namespace conduit
