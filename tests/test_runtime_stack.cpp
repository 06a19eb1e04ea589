#include <catch2/catch_all.hpp>
#include "../src/Runtime/RuntimeStack.hpp"

using namespace timewarp;

namespace {

ForFrame loop(const std::string& var, size_t line) {
    ForFrame f;
    f.varKey = var;
    f.limit = 10;
    f.resume.line = line;
    return f;
}

} // namespace

TEST_CASE("RuntimeStack FOR push and find", "[stack]") {
    RuntimeStack st;
    st.pushFor(loop("I", 1));
    st.pushFor(loop("J", 2));
    REQUIRE(st.forDepth() == 2);
    REQUIRE(st.topFor()->varKey == "J");

    // NEXT I closes the inner J loop.
    ForFrame* f = st.findFor("I");
    REQUIRE(f != nullptr);
    REQUIRE(f->resume.line == 1);
    REQUIRE(st.forDepth() == 1);

    REQUIRE(st.findFor("K") == nullptr);
    st.popFor();
    REQUIRE(st.topFor() == nullptr);
}

TEST_CASE("RuntimeStack FOR on an open variable replaces the loop", "[stack]") {
    RuntimeStack st;
    st.pushFor(loop("I", 1));
    st.pushFor(loop("J", 2));
    st.pushFor(loop("I", 5));
    REQUIRE(st.forDepth() == 1);
    REQUIRE(st.topFor()->resume.line == 5);
}

TEST_CASE("RuntimeStack GOSUB push and pop", "[stack]") {
    RuntimeStack st;
    GosubFrame g;
    g.returnTo.line = 3;
    g.returnTo.stmt = 1;
    g.callerLine = 30;
    st.pushGosub(g);
    REQUIRE(st.gosubDepth() == 1);

    GosubFrame out;
    REQUIRE(st.popGosub(out));
    REQUIRE(out.returnTo.line == 3);
    REQUIRE(out.returnTo.stmt == 1);
    REQUIRE(out.callerLine == 30);
    REQUIRE_FALSE(st.popGosub(out));

    st.pushGosub(g);
    st.pushFor(loop("I", 1));
    st.clear();
    REQUIRE(st.gosubDepth() == 0);
    REQUIRE(st.forDepth() == 0);
}
