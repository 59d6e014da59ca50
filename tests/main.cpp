#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char** argv) {
  std::cout << "========================================" << std::endl;
  std::cout << "  MBX Channel Test Suite" << std::endl;
  std::cout << "========================================" << std::endl;

  ::testing::InitGoogleTest(&argc, argv);

  int result = RUN_ALL_TESTS();

  std::cout << "========================================" << std::endl;
  std::cout << (result == 0 ? "All tests passed!" : "Some tests failed!") << std::endl;
  std::cout << "========================================" << std::endl;

  return result;
}
