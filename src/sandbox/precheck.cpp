#include "sandbox/precheck.hpp"

namespace evalbox::sandbox {

const std::vector<std::string>& PrecheckDenylist() {
    static const std::vector<std::string> kDeniedTokens = {
        "__subclasses__",
        "__loader__",
        "__spec__",
        "__bases__",
        "__base__",
        "__code__",
        "__getattribute__",
        "__setattr__",
        "__delattr__",
        "mro",
        "__class__",
        "__dict__",
        "__globals__",
        "__builtins__",
        "__self__",
        "__import__",
        "tb_frame",
        "f_globals",
        "f_builtins",
        "f_back",
        "gi_frame",
        "cr_frame"
    };
    return kDeniedTokens;
}

PrecheckResult Precheck(const std::string& source) {
    PrecheckResult result{};
    for (const auto& token : PrecheckDenylist()) {
        if (source.find(token) != std::string::npos) {
            result.passed = false;
            result.matched = token;
            return result;
        }
    }
    return result;
}

std::string DescribeSuspiciousPattern(const PrecheckResult& result) {
    return "Suspicious pattern '" + result.matched + "' found in the script; it was not run.";
}

}  // namespace evalbox::sandbox
