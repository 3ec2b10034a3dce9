/*****************************************************************
 * File:      TestFramework.hpp
 * Category:  tests
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Minimal host-side test framework for the MonoOled drivers.
 *
 * Features:
 *    - Test case registration by category
 *    - Assertion macros with line-numbered failure messages
 *    - Runner with console summary and process exit code
 *****************************************************************/

#ifndef MONOLED_TESTS_TEST_FRAMEWORK_HPP_
#define MONOLED_TESTS_TEST_FRAMEWORK_HPP_

#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <string.h>

namespace monoled::test{

// ============================================================
// Test Framework Constants
// ============================================================

constexpr int MAX_TESTS = 256;
constexpr int MAX_TEST_NAME = 64;
constexpr int MAX_MESSAGE = 256;

// ============================================================
// Test Result
// ============================================================

enum class TestStatus{
  NOT_RUN   = 0,
  PASSED    = 1,
  FAILED    = 2,
  SKIPPED   = 3
};

struct TestResult{
  TestStatus status;
  char name[MAX_TEST_NAME];
  char message[MAX_MESSAGE];
  int assertions_passed;
  int assertions_failed;

  TestResult() : status(TestStatus::NOT_RUN), assertions_passed(0),
                 assertions_failed(0){
    name[0] = '\0';
    message[0] = '\0';
  }
};

typedef void (*TestFunction)();

struct TestCase{
  char name[MAX_TEST_NAME];
  char category[MAX_TEST_NAME];
  TestFunction func;

  TestCase() : func(nullptr){
    name[0] = '\0';
    category[0] = '\0';
  }
};

// ============================================================
// Test Context (for assertion tracking)
// ============================================================

class TestContext{
public:
  static TestContext& instance(){
    static TestContext ctx;
    return ctx;
  }

  void beginTest(const char* name){
    current_result_ = TestResult();
    strncpy(current_result_.name, name, MAX_TEST_NAME - 1);
    current_result_.status = TestStatus::PASSED;
    in_test_ = true;
  }

  void endTest(){
    in_test_ = false;
  }

  void assertPass(){
    if(in_test_) current_result_.assertions_passed++;
  }

  void assertFail(const char* message){
    if(!in_test_) return;
    current_result_.assertions_failed++;
    current_result_.status = TestStatus::FAILED;
    if(current_result_.message[0] == '\0'){
      strncpy(current_result_.message, message, MAX_MESSAGE - 1);
    }
  }

  void setSkipped(const char* reason){
    if(!in_test_) return;
    current_result_.status = TestStatus::SKIPPED;
    strncpy(current_result_.message, reason, MAX_MESSAGE - 1);
  }

  const TestResult& getResult() const{ return current_result_; }

private:
  TestContext() : in_test_(false){}
  TestResult current_result_;
  bool in_test_;
};

// ============================================================
// Assertion Macros
// ============================================================

#define TEST_ASSERT(condition) \
  do{ \
    if(condition){ \
      monoled::test::TestContext::instance().assertPass(); \
    }else{ \
      char msg_[256]; \
      snprintf(msg_, sizeof(msg_), "Assertion failed: %s (line %d)", #condition, __LINE__); \
      monoled::test::TestContext::instance().assertFail(msg_); \
    } \
  }while(0)

#define TEST_ASSERT_MSG(condition, message) \
  do{ \
    if(condition){ \
      monoled::test::TestContext::instance().assertPass(); \
    }else{ \
      monoled::test::TestContext::instance().assertFail(message); \
    } \
  }while(0)

#define TEST_ASSERT_EQ(expected, actual) \
  do{ \
    long long exp_ = (long long)(expected); \
    long long act_ = (long long)(actual); \
    if(exp_ == act_){ \
      monoled::test::TestContext::instance().assertPass(); \
    }else{ \
      char msg_[256]; \
      snprintf(msg_, sizeof(msg_), "Expected %lld, got %lld: %s (line %d)", \
               exp_, act_, #actual, __LINE__); \
      monoled::test::TestContext::instance().assertFail(msg_); \
    } \
  }while(0)

#define TEST_ASSERT_RESULT(expected, actual) \
  do{ \
    monoled::hal::HalResult exp_ = (expected); \
    monoled::hal::HalResult act_ = (actual); \
    if(exp_ == act_){ \
      monoled::test::TestContext::instance().assertPass(); \
    }else{ \
      char msg_[256]; \
      snprintf(msg_, sizeof(msg_), "Expected %s, got %s: %s (line %d)", \
               monoled::hal::halResultToString(exp_), \
               monoled::hal::halResultToString(act_), #actual, __LINE__); \
      monoled::test::TestContext::instance().assertFail(msg_); \
    } \
  }while(0)

#define TEST_FAIL(message) \
  monoled::test::TestContext::instance().assertFail(message)

#define TEST_SKIP(reason) \
  do{ \
    monoled::test::TestContext::instance().setSkipped(reason); \
    return; \
  }while(0)

// ============================================================
// Test Runner
// ============================================================

class TestRunner{
public:
  static TestRunner& instance(){
    static TestRunner runner;
    return runner;
  }

  bool registerTest(const char* name, const char* category, TestFunction func){
    if(test_count_ >= MAX_TESTS) return false;

    TestCase& tc = tests_[test_count_];
    strncpy(tc.name, name, MAX_TEST_NAME - 1);
    strncpy(tc.category, category, MAX_TEST_NAME - 1);
    tc.func = func;
    test_count_++;
    return true;
  }

  /** Run every test, or only one category when filter is non-null */
  void run(const char* category = nullptr){
    passed_count_ = 0;
    failed_count_ = 0;
    skipped_count_ = 0;

    for(int i = 0; i < test_count_; i++){
      if(!tests_[i].func) continue;
      if(category && strcmp(tests_[i].category, category) != 0) continue;
      runTest(tests_[i]);
    }
  }

  int getTestCount() const{ return test_count_; }
  int getPassedCount() const{ return passed_count_; }
  int getFailedCount() const{ return failed_count_; }
  int getSkippedCount() const{ return skipped_count_; }

  void printSummary() const{
    printf("\n%d passed, %d failed, %d skipped\n",
           passed_count_, failed_count_, skipped_count_);
  }

private:
  TestRunner() : test_count_(0), passed_count_(0),
                 failed_count_(0), skipped_count_(0){}

  void runTest(const TestCase& tc){
    TestContext& ctx = TestContext::instance();
    ctx.beginTest(tc.name);

    tc.func();

    ctx.endTest();

    const TestResult& result = ctx.getResult();
    switch(result.status){
      case TestStatus::PASSED:
        passed_count_++;
        printf("[ PASS ] %s/%s (%d)\n", tc.category, tc.name, result.assertions_passed);
        break;
      case TestStatus::FAILED:
        failed_count_++;
        printf("[ FAIL ] %s/%s: %s\n", tc.category, tc.name, result.message);
        break;
      case TestStatus::SKIPPED:
        skipped_count_++;
        printf("[ SKIP ] %s/%s: %s\n", tc.category, tc.name, result.message);
        break;
      default:
        break;
    }
  }

  TestCase tests_[MAX_TESTS];
  int test_count_;
  int passed_count_;
  int failed_count_;
  int skipped_count_;
};

// Test registration macro
#define REGISTER_TEST(name, category) \
  static void test_##name(); \
  static bool test_registered_##name = \
    monoled::test::TestRunner::instance().registerTest(#name, category, test_##name); \
  static void test_##name()

} // namespace monoled::test

#endif // MONOLED_TESTS_TEST_FRAMEWORK_HPP_
