#include <stdlib.h>
#include <chrono>
#include <thread>

int main(int argc, char** argv) {
  std::this_thread::sleep_for(
      std::chrono::milliseconds(static_cast<int>(atof(argv[1]) * 1000)));
  return 0;
}
