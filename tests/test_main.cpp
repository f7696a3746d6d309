#include "test_framework.hpp"

#include "toolsmith/observability/global.hpp"
#include "toolsmith/observability/noop_observer.hpp"

#include <csignal>
#include <iostream>
#include <memory>

void register_common_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_config_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_script_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_tools_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_capability_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_security_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_gateway_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_runtime_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_reply_parser_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_observability_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_gateway_integration_tests(std::vector<toolsmith::tests::TestCase> &tests);
void register_runtime_integration_tests(std::vector<toolsmith::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);
  toolsmith::observability::set_global_observer(
      std::make_unique<toolsmith::observability::NoopObserver>());

  std::vector<toolsmith::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_script_tests(tests);
  register_tools_tests(tests);
  register_capability_tests(tests);
  register_security_tests(tests);
  register_gateway_tests(tests);
  register_runtime_tests(tests);
  register_reply_parser_tests(tests);
  register_observability_tests(tests);
  register_gateway_integration_tests(tests);
  register_runtime_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
