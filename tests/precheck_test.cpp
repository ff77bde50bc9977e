#include <gtest/gtest.h>

#include "sandbox/precheck.hpp"

namespace evalbox::sandbox {
namespace {

TEST(PrecheckTest, PlainScriptPasses) {
    const auto result = Precheck("x = [i * i for i in range(10)]\nprint(sum(x))\n");
    EXPECT_TRUE(result.passed);
    EXPECT_TRUE(result.matched.empty());
}

TEST(PrecheckTest, SubclassWalkIsRejected) {
    const auto result = Precheck("().__class__.__bases__[0].__subclasses__()");
    EXPECT_FALSE(result.passed);
    // First token in list order wins, not first occurrence in the source.
    EXPECT_EQ(result.matched, "__subclasses__");
}

TEST(PrecheckTest, EveryDenylistedTokenIsDetected) {
    for (const auto& token : PrecheckDenylist()) {
        const auto result = Precheck("value = something." + token + "\n");
        EXPECT_FALSE(result.passed) << token;
    }
}

TEST(PrecheckTest, FrameWalkingIsRejected) {
    const auto result = Precheck("try:\n    1/0\nexcept Exception as e:\n    e.__traceback__.tb_frame\n");
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.matched, "tb_frame");
}

TEST(PrecheckTest, DescriptionNamesTheToken) {
    const auto result = Precheck("print.__self__");
    ASSERT_FALSE(result.passed);
    EXPECT_NE(DescribeSuspiciousPattern(result).find("__self__"), std::string::npos);
}

}  // namespace
}  // namespace evalbox::sandbox
