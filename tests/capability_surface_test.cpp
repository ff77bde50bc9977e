#include <gtest/gtest.h>

#include <boost/python.hpp>

#include <memory>
#include <string>

#include "worker/capability_surface.hpp"
#include "worker/raw_result.hpp"

namespace py = boost::python;

namespace evalbox::worker {
namespace {

class CapabilitySurfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        raw_ = std::make_shared<RawResult>();
        globals_ = CapabilitySurface::Instance().NewNamespace(py::object(raw_));
    }

    void Exec(const char* code) {
        py::exec(code, globals_, globals_);
    }

    // True when `code` raises an exception of type `expected`.
    bool Raises(const char* code, PyObject* expected) {
        try {
            Exec(code);
        } catch (const py::error_already_set&) {
            const bool matches = PyErr_ExceptionMatches(expected) != 0;
            PyErr_Clear();
            return matches;
        }
        return false;
    }

    std::string Text() const {
        return py::extract<std::string>(raw_->text)();
    }

    std::shared_ptr<RawResult> raw_;
    py::dict globals_;
};

TEST_F(CapabilitySurfaceTest, ExposesModulesPrintAndOutput) {
    for (const auto& name : CapabilitySurface::ModuleNames()) {
        EXPECT_TRUE(globals_.has_key(name)) << name;
    }
    EXPECT_TRUE(globals_.has_key("print"));
    EXPECT_TRUE(globals_.has_key("output"));
    Exec("output.text = 'set directly'");
    EXPECT_EQ(Text(), "set directly");
}

TEST_F(CapabilitySurfaceTest, RemovedBuiltinsAreAbsent) {
    const py::dict builtins = py::extract<py::dict>(globals_["__builtins__"]);
    for (const auto& name : CapabilitySurface::RemovedBuiltins()) {
        if (name == "print") {
            continue;
        }
        EXPECT_FALSE(builtins.has_key(name)) << name;
    }
    EXPECT_TRUE(builtins.has_key("len"));
    EXPECT_TRUE(builtins.has_key("range"));
    EXPECT_TRUE(Raises("open('/etc/hostname')", PyExc_NameError));
    EXPECT_TRUE(Raises("eval('1')", PyExc_NameError));
    EXPECT_TRUE(Raises("import os", PyExc_ImportError));
}

TEST_F(CapabilitySurfaceTest, PrintHonoursSepAndEnd) {
    Exec("print(1, 'two', 3.5)\nprint('a', 'b', sep='-', end='!')\nprint(sep=None, end=None)");
    EXPECT_EQ(Text(), "1 two 3.5\na-b!\n");
}

TEST_F(CapabilitySurfaceTest, PrintRejectsBadArguments) {
    EXPECT_TRUE(Raises("print('x', sep=1)", PyExc_TypeError));
    EXPECT_TRUE(Raises("print('x', file=None)", PyExc_TypeError));
    Exec("print('kept', flush=True)");
    EXPECT_EQ(Text(), "kept\n");
}

TEST_F(CapabilitySurfaceTest, PrintRecoversFromNonStringText) {
    Exec("output.text = 7\nprint('x')");
    EXPECT_EQ(Text(), "7x\n");
}

TEST_F(CapabilitySurfaceTest, ModulesAreFreshPerNamespace) {
    Exec("math.pi = 3\nmath.extra = 1\ngfx.draw.line = None");

    auto other_raw = std::make_shared<RawResult>();
    py::dict other = CapabilitySurface::Instance().NewNamespace(py::object(other_raw));
    py::exec("print(math.pi > 3.14, hasattr(math, 'extra'), gfx.draw.line is None)", other, other);
    EXPECT_EQ(py::extract<std::string>(other_raw->text)(), "True False False\n");

    // The real modules behind the proxies are untouched too.
    EXPECT_GT(py::extract<double>(py::import("math").attr("pi"))(), 3.14);
}

TEST_F(CapabilitySurfaceTest, ProxiesCarryNoImportMetadata) {
    Exec("print('__spec__' in dir(math), '__loader__' in dir(gfx.draw))");
    EXPECT_EQ(Text(), "False False\n");
}

TEST_F(CapabilitySurfaceTest, AddFrameTakesAnOptionalDelay) {
    Exec("s = gfx.Surface((2, 2))\n"
         "output.add_frame(s, 40)\n"
         "output.add_frame(s, delay=None)\n"
         "output.add_frame(s, 12.9)");
    ASSERT_EQ(raw_->frame_delays.size(), 2u);
    EXPECT_EQ(raw_->frame_delays[0].delay_ms, 40);
    EXPECT_EQ(raw_->frame_delays[1].delay_ms, 12);

    EXPECT_TRUE(Raises("output.add_frame(s, -1)", PyExc_ValueError));
    EXPECT_TRUE(Raises("output.add_frame(s, 65536)", PyExc_ValueError));
    EXPECT_TRUE(Raises("output.add_frame(s, float('nan'))", PyExc_ValueError));
    EXPECT_TRUE(Raises("output.add_frame(s, 'slow')", PyExc_TypeError));
    EXPECT_TRUE(Raises("output.add_frame('frame', 10)", PyExc_TypeError));
    EXPECT_EQ(py::len(raw_->frames), 3);
    EXPECT_EQ(raw_->frame_delays.size(), 2u);
}

TEST_F(CapabilitySurfaceTest, StringFormatterIsNotExposed) {
    Exec("print(hasattr(string, 'Formatter'), string.ascii_lowercase[:3], string.Template('$a').substitute(a=1))");
    EXPECT_EQ(Text(), "False abc 1\n");
    // get_field would walk a dotted name into a function's globals.
    EXPECT_TRUE(Raises("f = string.Formatter()\n"
                       "g = f.get_field('0.__glo' + 'bals__', (random.Random.seed,), {})[0]\n"
                       "o = g['_o' + 's']\n"
                       "print(o.getpid() > 0)",
                       PyExc_AttributeError));
    EXPECT_EQ(Text(), "False abc 1\n");
}

TEST_F(CapabilitySurfaceTest, RectArithmeticSaturates) {
    Exec("r = gfx.Rect(2147483640, 0, 100, 2)\n"
         "print(r.right, r.collidepoint((1e300, 0)), r.collidepoint((float('nan'), 0)))\n"
         "s = gfx.Surface((4, 4))\n"
         "s.fill('red', (2147483640, 0, 100, 2))\n"
         "print(s.get_at((3, 0)) == gfx.Color(0, 0, 0))");
    EXPECT_EQ(Text(), "2147483647 False False\nTrue\n");
}

}  // namespace
}  // namespace evalbox::worker
