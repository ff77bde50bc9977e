#pragma once

#include <boost/python/dict.hpp>
#include <boost/python/object.hpp>

#include <string>
#include <vector>

namespace evalbox::worker {

// The complete set of names a script can see. Built once per process from
// the live interpreter and never mutated afterwards; every run receives a
// namespace assembled from fresh copies of it.
class CapabilitySurface {
public:
    // Requires a running interpreter; the first call builds the template.
    static const CapabilitySurface& Instance();

    // `output` becomes the script's `output`; the sandbox `print` appends to it.
    boost::python::dict NewNamespace(const boost::python::object& output) const;

    static const std::vector<std::string>& RemovedBuiltins();
    static const std::vector<std::string>& ModuleNames();
    // "module.attribute" names left out of the proxies although they are public.
    static const std::vector<std::string>& HiddenAttributes();

private:
    struct ModuleTemplate {
        std::string name;
        boost::python::dict attributes;
        std::vector<ModuleTemplate> children;
    };

    CapabilitySurface();

    static ModuleTemplate Snapshot(const std::string& name, const boost::python::object& module, bool keep_submodules);
    static bool IsHidden(const std::string& module, const std::string& attribute);
    static boost::python::object MakeProxy(const ModuleTemplate& module, const std::string& qualified_name);

    boost::python::dict builtins_;
    std::vector<ModuleTemplate> modules_;
};

// The sandbox replacement for print(*values, sep=" ", end="\n").
boost::python::object MakePrintFunction(const boost::python::object& output);

}  // namespace evalbox::worker
