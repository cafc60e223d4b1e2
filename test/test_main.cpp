#include <pulljson/pulljson.hpp>

#include <iostream>

void test_numbers();
void test_strings();
void test_recognizer();
void test_basic_parse();
void test_errors();
void test_parse_items();
void test_writer();
void test_random();

int main() {
  // Exercise the session's debug and trace logging paths.
  pulljson::set_log_level(spdlog::level::trace);
  test_basic_parse();
  pulljson::set_log_level(spdlog::level::warn);

  test_numbers();
  test_strings();
  test_recognizer();
  test_errors();
  test_parse_items();
  test_writer();
  test_random();

  std::cout << "pulljson tests passed\n";
  return 0;
}
