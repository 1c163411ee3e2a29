#include <future>
#include <iostream>
#include <string>

#include "conduit/client/http_client.h"
#include "conduit/http/websocket_operations.h"

using namespace conduit;

// Sends each argument as a text message and prints what the server returns
int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <ws-url> <message>...\n";
    return 1;
  }
  const std::string url = argv[1];
  const int expected = argc - 2;

  config::ClientConfig config;
  client::HttpClient client(config);

  std::promise<int> done;
  DisposablePtr session = client.websocket(
      url,
      [argv, expected](http::WebSocketInbound& in,
                       http::WebSocketOutbound& out) {
        return Completion([&in, &out, argv, expected](
                              const CompletionSinkPtr<std::nullptr_t>& sink) {
          auto received = std::make_shared<int>(0);
          in.receive(
              [sink, received, expected](http::WebSocketMessage message) {
                std::cout << message.data << "\n";
                if (++*received == expected) {
                  sink->success(nullptr);
                }
              },
              [sink](const optional<Error>& error) {
                if (error) {
                  sink->error(*error);
                } else {
                  sink->success(nullptr);
                }
              });
          for (int i = 0; i < expected; ++i) {
            out.sendText(argv[i + 2]).subscribe([sink](Result<std::nullptr_t> r) {
              if (auto* error = get_error(r)) {
                sink->error(*error);
              }
            });
          }
        });
      })
      .subscribe([&done](Result<std::nullptr_t> result) {
        if (auto* error = get_error(result)) {
          std::cerr << "Session failed: " << error->message << "\n";
          done.set_value(2);
          return;
        }
        done.set_value(0);
      });

  return done.get_future().get();
}
