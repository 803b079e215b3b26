#include "Module.h"
#include <gtest/gtest.h>

class TestModule : public icpt::Module {
public:
  TestModule(const std::string &name) : icpt::Module(name) {}
};

TEST(ModuleTest, LogReturnsLoggerReference) {
  TestModule module("icpt_test.module");

  EXPECT_NO_THROW({
    module.log().info << "Test message";
    module.log().debug << "Debug message";
    module.log().warning << "Warning message";
  });

  EXPECT_EQ(module.log().getName(), "module");
  EXPECT_EQ(module.log().getFullName(), "icpt_test.module");
}

TEST(ModuleTest, LogIsConst) {
  const TestModule module("icpt_test.const_module");
  EXPECT_NO_THROW(module.log().info << "Const test message");
  EXPECT_EQ(module.log().getName(), "const_module");
}

TEST(ModuleTest, ModulesWithSameNameShareLogger) {
  TestModule a("icpt_test.shared");
  TestModule b("icpt_test.shared");
  EXPECT_EQ(a.log(), b.log());
}
