#include <future>
#include <iostream>
#include <string>

#include "conduit/client/http_client.h"
#include "conduit/config/client_config.h"
#include "conduit/http/client_errors.h"

using namespace conduit;

namespace {

void printUsage(const char* program) {
  std::cerr << "Usage: " << program << " <url> [config.yaml|config.json]\n"
            << "  Fetches url, following redirects, and prints the body\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }
  const std::string url = argv[1];

  config::ClientConfig config;
  try {
    if (argc > 2) {
      config = config::loadClientConfigFile(argv[2]);
    } else {
      config.follow_redirect = true;
    }
  } catch (const config::ConfigValidationError& e) {
    std::cerr << "Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  client::HttpClient client(config);

  std::promise<int> done;
  DisposablePtr request =
      client.get(url)
          .flatMap([](http::HttpClientResponsePtr response) {
            std::cerr << http::httpVersionToString(response->responseVersion())
                      << " " << response->status() << " "
                      << response->reason() << "\n";
            for (const auto& redirect : response->redirectedFrom().entries()) {
              std::cerr << "  redirected from " << redirect << "\n";
            }
            return http::receiveString(*response);
          })
          .subscribe([&done](Result<std::string> body) {
            if (auto* error = get_error(body)) {
              std::cerr << "Request failed: " << error->message << "\n";
              done.set_value(2);
              return;
            }
            std::cout << get<std::string>(body);
            done.set_value(0);
          });

  return done.get_future().get();
}
