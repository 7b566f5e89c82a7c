#include "app/ReclaimApp.hpp"

int main(int argc, char *argv[]) {
  reclaim::ReclaimApp app;
  return app.run(argc, argv);
}
