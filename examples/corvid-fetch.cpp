#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include "corvid/client-config.hpp"
#include "corvid/client-request.hpp"
#include "corvid/client-response.hpp"
#include "corvid/http-method.hpp"
#include "corvid/reactor.hpp"
#include "corvid/signal-handler.hpp"

using namespace corvid;

// Usage: corvid-fetch host port path [name=value ...] [--post]
// Parameters go in the query string, or in an urlencoded body with --post.
int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "Usage: " << argv[0] << " host port path [name=value ...] [--post]\n";
    return EXIT_FAILURE;
  }
  uint16_t port = 0;
  const char* portEnd = argv[2] + std::strlen(argv[2]);
  const auto [ptr, errc] = std::from_chars(argv[2], portEnd, port);
  if (errc != std::errc{} || ptr != portEnd || port == 0) {
    std::cerr << "Invalid port number: " << argv[2] << '\n';
    return EXIT_FAILURE;
  }

  SignalHandler::Enable();

  int exitCode = EXIT_FAILURE;
  try {
    Reactor reactor;
    ClientRequest request(reactor, argv[1], port, ClientConfig{}.withRequestTimeout(std::chrono::seconds{10}));
    for (int argPos = 4; argPos < argc; ++argPos) {
      const std::string_view arg(argv[argPos]);
      if (arg == "--post") {
        request.setMethod(http::Method::POST);
        continue;
      }
      const auto eqPos = arg.find('=');
      if (eqPos == std::string_view::npos) {
        std::cerr << "Ignoring argument without '=': " << arg << '\n';
        continue;
      }
      request.setParameter(arg.substr(0, eqPos), arg.substr(eqPos + 1));
    }

    bool done = false;
    request.open(argv[3], [&](ClientResponse response) {
      done = true;
      if (!response.ok()) {
        std::cerr << "Request failed (" << ClientErrorToStr(response.error) << "): " << response.errorMessage << '\n';
        return;
      }
      std::cout << response.status << ' ' << response.reason << '\n';
      for (const auto& [name, value] : response.headers) {
        std::cout << name << ": " << value << '\n';
      }
      std::cout << '\n' << response.body;
      exitCode = response.status < 400 ? EXIT_SUCCESS : EXIT_FAILURE;
    });
    reactor.runUntil([&done] { return done; });
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
  return exitCode;
}
