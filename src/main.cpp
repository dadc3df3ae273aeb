#include "pipeline/positioning_driver.h"

int main(int argc, char** argv) {
  return pipeline::RunPositioningCli(argc, argv);
}
