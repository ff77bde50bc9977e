#pragma once

#include <string>
#include <vector>

namespace evalbox::sandbox {

struct PrecheckResult {
    bool passed = true;
    std::string matched;
};

// Substring scan for introspection / escape primitives. A heuristic layered
// in front of the capability surface, not a substitute for it.
PrecheckResult Precheck(const std::string& source);

const std::vector<std::string>& PrecheckDenylist();

std::string DescribeSuspiciousPattern(const PrecheckResult& result);

}  // namespace evalbox::sandbox
