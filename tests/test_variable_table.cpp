#include <catch2/catch_all.hpp>
#include <functional>
#include <limits>
#include "../src/Runtime/VariableTable.hpp"

using namespace timewarp;

namespace {

uint16_t errorCodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const TWError& e) {
        return e.getErrorCode();
    }
    return 0;
}

} // namespace

TEST_CASE("VariableTable scalars", "[variables]") {
    VariableTable vars;
    REQUIRE_FALSE(vars.has("A"));
    REQUIRE(errorCodeOf([&] { vars.get("A"); }) == ErrorCodes::UNDEFINED_VARIABLE);
    REQUIRE(vars.tryGet("A") == nullptr);

    vars.set("A", Value::makeNumber(5));
    vars.set("N$", Value::makeText("Ada"));
    REQUIRE(vars.get("A").num == 5.0);
    REQUIRE(vars.get("N$").text == "Ada");
    REQUIRE(vars.size() == 2);
}

TEST_CASE("VariableTable type checks follow the name suffix", "[variables]") {
    VariableTable vars;
    REQUIRE(errorCodeOf([&] { vars.set("A$", Value::makeNumber(5)); }) == ErrorCodes::TYPE_MISMATCH);
    REQUIRE(errorCodeOf([&] { vars.set("A", Value::makeText("x")); }) == ErrorCodes::TYPE_MISMATCH);

    vars.set("T", Value::makeBoolean(true));
    vars.set("F", Value::makeBoolean(false));
    REQUIRE(vars.get("T").num == -1.0);
    REQUIRE(vars.get("F").num == 0.0);
}

TEST_CASE("VariableTable arrays", "[variables]") {
    VariableTable vars;
    vars.dimArray("A", 3);
    REQUIRE(vars.isArray("A"));
    REQUIRE(vars.getElement("A", 3).num == 0.0);
    vars.setElement("A", 2, Value::makeNumber(9));
    REQUIRE(vars.getElement("A", 2).num == 9.0);
    REQUIRE(errorCodeOf([&] { vars.getElement("A", 4); }) == ErrorCodes::SUBSCRIPT_OUT_OF_RANGE);
    REQUIRE(errorCodeOf([&] { vars.getElement("A", -1); }) == ErrorCodes::SUBSCRIPT_OUT_OF_RANGE);
    REQUIRE(errorCodeOf([&] { vars.dimArray("A", 5); }) == ErrorCodes::DUPLICATE_DEFINITION);
    REQUIRE(errorCodeOf([&] { vars.dimArray("B", -2); }) == ErrorCodes::ILLEGAL_FUNCTION_CALL);
}

TEST_CASE("VariableTable arrays used without DIM cover 0..10", "[variables]") {
    VariableTable vars;
    REQUIRE(vars.getElement("S$", 10).text.empty());
    REQUIRE(errorCodeOf([&] { vars.getElement("S$", 11); }) == ErrorCodes::SUBSCRIPT_OUT_OF_RANGE);
    REQUIRE(errorCodeOf([&] { vars.dimArray("S$", 20); }) == ErrorCodes::DUPLICATE_DEFINITION);
}

TEST_CASE("VariableTable rejects non-finite subscripts", "[variables]") {
    VariableTable vars;
    vars.dimArray("A", 3);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    REQUIRE(errorCodeOf([&] { vars.getElement("A", nan); }) == ErrorCodes::SUBSCRIPT_OUT_OF_RANGE);
    REQUIRE(errorCodeOf([&] { vars.setElement("A", nan, Value::makeNumber(1)); }) ==
            ErrorCodes::SUBSCRIPT_OUT_OF_RANGE);
    REQUIRE(errorCodeOf([&] { vars.getElement("A", -inf); }) == ErrorCodes::SUBSCRIPT_OUT_OF_RANGE);
    REQUIRE(errorCodeOf([&] { vars.dimArray("B", nan); }) == ErrorCodes::ILLEGAL_FUNCTION_CALL);
}
