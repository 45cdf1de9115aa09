#pragma once

namespace vcsflow {

class App {
public:
  int run(int argc, char **argv);
};

} // namespace vcsflow
