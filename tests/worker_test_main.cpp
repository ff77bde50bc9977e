#include <gtest/gtest.h>

#include "worker/interpreter.hpp"

namespace {

// The interpreter can only be started once per process, so every worker
// suite shares it.
class InterpreterEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        evalbox::worker::InitializeInterpreter();
    }
};

}  // namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new InterpreterEnvironment);
    return RUN_ALL_TESTS();
}
