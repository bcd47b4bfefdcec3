#include <iostream>

#include "stub/server.hpp"

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: health-backend-stub <fixture.json>\n";
    return 2;
  }

  status_poller::stub::Server server(argv[1]);
  return server.run(std::cin, std::cout, std::cerr);
}
