#include <vcsflow/app.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  return vcsflow::App{}.run(argc, argv);
}
