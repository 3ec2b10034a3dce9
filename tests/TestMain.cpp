/*****************************************************************
 * File:      TestMain.cpp
 * Category:  tests
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Entry point for the host test binary.
 *
 * Usage:
 *    monoled_tests               run every registered test
 *    monoled_tests FrameBuffer   run a single category
 *****************************************************************/

#include "TestFramework.hpp"

int main(int argc, char** argv){
  monoled::test::TestRunner& runner = monoled::test::TestRunner::instance();

  const char* category = argc > 1 ? argv[1] : nullptr;
  runner.run(category);
  runner.printSummary();

  if(runner.getPassedCount() + runner.getFailedCount() == 0){
    printf("No tests matched\n");
    return 1;
  }
  return runner.getFailedCount() == 0 ? 0 : 1;
}
