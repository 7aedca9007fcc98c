// File: tests/test_arithmetic.cpp
// Purpose: Cover the arithmetic, comparison and logic words.
// Key invariants: Float promotion when either operand is a float; divide is
//                 always a float; faults leave both operands in place.

#include <gtest/gtest.h>

#include "kapila.h"

#include <cmath>
#include <cstdint>
#include <limits>

using namespace kapila;

namespace {

Value binary(Session& s, Value left, Value right, Code code) {
    s.pushValue(left);
    s.pushValue(right);
    code(s);
    EXPECT_EQ(s.depth(), 1u);
    return s.pop();
}

Value ints(Session& s, std::int64_t a, std::int64_t b, Code code) {
    return binary(s, Value::makeInteger(a), Value::makeInteger(b), code);
}

FaultKind faultOf(Session& s, Value left, Value right, Code code) {
    s.pushValue(left);
    s.pushValue(right);
    auto kind = FaultKind::UnknownWord;
    try {
        code(s);
        ADD_FAILURE() << "expected RuntimeFault";
    }
    catch (const RuntimeFault& fault) {
        kind = fault.kind();
    }
    EXPECT_EQ(s.depth(), 2u);
    s.stack().clear();
    return kind;
}

} // namespace

TEST(ArithmeticTest, IntegerOperationsStayInteger) {
    Session s;
    const std::int64_t samples[][2] = {{5, 3}, {-7, 2}, {0, 0}, {123456789, -987654321}};
    for (auto& pair: samples) {
        auto sum = ints(s, pair[0], pair[1], add);
        ASSERT_TRUE(sum.isInteger());
        EXPECT_EQ(sum.asInteger(), pair[0] + pair[1]);

        auto difference = ints(s, pair[0], pair[1], subtract);
        EXPECT_EQ(difference.asInteger(), pair[0] - pair[1]);

        auto product = ints(s, pair[0], pair[1], multiply);
        EXPECT_EQ(product.asInteger(), pair[0] * pair[1]);
    }
}

TEST(ArithmeticTest, FloatOperandPromotes) {
    Session s;
    auto sum = binary(s, Value::makeInteger(1), Value::makeFloat(0.5), add);
    ASSERT_TRUE(sum.isFloat());
    EXPECT_DOUBLE_EQ(sum.asFloat(), 1.5);

    auto product = binary(s, Value::makeFloat(2.5), Value::makeInteger(4), multiply);
    ASSERT_TRUE(product.isFloat());
    EXPECT_DOUBLE_EQ(product.asFloat(), 10.0);
}

TEST(ArithmeticTest, DivideAlwaysProducesFloat) {
    Session s;
    auto q = ints(s, 7, 2, divide);
    ASSERT_TRUE(q.isFloat());
    EXPECT_DOUBLE_EQ(q.asFloat(), 3.5);

    auto exact = ints(s, 8, 4, divide);
    ASSERT_TRUE(exact.isFloat());
    EXPECT_DOUBLE_EQ(exact.asFloat(), 2.0);
}

TEST(ArithmeticTest, DivideByZeroFollowsIeee) {
    Session s;
    auto inf = ints(s, 1, 0, divide);
    EXPECT_TRUE(std::isinf(inf.asFloat()));
    auto nan = ints(s, 0, 0, divide);
    EXPECT_TRUE(std::isnan(nan.asFloat()));
}

TEST(ArithmeticTest, IntegerOverflowWraps) {
    Session s;
    auto max = std::numeric_limits<std::int64_t>::max();
    auto min = std::numeric_limits<std::int64_t>::min();
    EXPECT_EQ(ints(s, max, 1, add).asInteger(), min);
    EXPECT_EQ(ints(s, min, 1, subtract).asInteger(), max);
}

TEST(ArithmeticTest, ModuloOnIntegers) {
    Session s;
    EXPECT_EQ(ints(s, 17, 5, modulo).asInteger(), 2);
    EXPECT_EQ(ints(s, -17, 5, modulo).asInteger(), -2);
    EXPECT_EQ(ints(s, std::numeric_limits<std::int64_t>::min(), -1, modulo).asInteger(), 0);
}

TEST(ArithmeticTest, ModuloFaults) {
    Session s;
    EXPECT_EQ(faultOf(s, Value::makeInteger(5), Value::makeInteger(0), modulo),
              FaultKind::DivideByZero);
    EXPECT_EQ(faultOf(s, Value::makeFloat(5.5), Value::makeInteger(2), modulo),
              FaultKind::TypeMismatch);
}

TEST(ArithmeticTest, NonNumericOperandsMismatch) {
    Session s;
    auto text = Value::makeText("1", 1, false);
    EXPECT_EQ(faultOf(s, text, Value::makeInteger(1), add), FaultKind::TypeMismatch);
    EXPECT_EQ(faultOf(s, Value::makeBoolean(true), Value::makeInteger(1), divide),
              FaultKind::TypeMismatch);
}

TEST(ComparisonTest, NumericOrdering) {
    Session s;
    EXPECT_TRUE(ints(s, 3, 5, less).asBoolean());
    EXPECT_FALSE(ints(s, 3, 5, greater).asBoolean());
    EXPECT_TRUE(ints(s, 5, 5, lessOrEqual).asBoolean());
    EXPECT_TRUE(ints(s, 5, 5, greaterOrEqual).asBoolean());
    EXPECT_TRUE(binary(s, Value::makeFloat(3.5), Value::makeInteger(3), greater).asBoolean());
}

TEST(ComparisonTest, TextOrdersBytewise) {
    Session s;
    auto apple = Value::makeText("apple", 5, false);
    auto banana = Value::makeText("banana", 6, false);
    auto app = Value::makeText("app", 3, false);
    EXPECT_TRUE(binary(s, apple, banana, less).asBoolean());
    EXPECT_TRUE(binary(s, app, apple, less).asBoolean());
    EXPECT_FALSE(binary(s, apple, app, lessOrEqual).asBoolean());
}

TEST(ComparisonTest, OrderingMixedTypesMismatches) {
    Session s;
    EXPECT_EQ(faultOf(s, Value::makeBoolean(true), Value::makeBoolean(false), less),
              FaultKind::TypeMismatch);
    EXPECT_EQ(faultOf(s, Value::makeText("a", 1, false), Value::makeInteger(1), greater),
              FaultKind::TypeMismatch);
}

TEST(ComparisonTest, Equality) {
    Session s;
    EXPECT_TRUE(binary(s, Value::makeInteger(2), Value::makeFloat(2.0), equal).asBoolean());
    EXPECT_TRUE(binary(s, Value::makeText("hi", 2, false),
                       Value::makeText("hi", 2, false), equal).asBoolean());
    EXPECT_FALSE(binary(s, Value::makeText("hi", 2, false),
                        Value::makeText("hip", 3, false), equal).asBoolean());
    EXPECT_TRUE(binary(s, Value::makeBoolean(false), Value::makeBoolean(false), equal).asBoolean());
    EXPECT_FALSE(binary(s, Value::makeText("1", 1, false), Value::makeInteger(1), equal).asBoolean());
    EXPECT_FALSE(binary(s, Value::makeBoolean(true), Value::makeInteger(1), equal).asBoolean());

    EXPECT_FALSE(ints(s, 4, 4, notEqual).asBoolean());
    EXPECT_TRUE(ints(s, 4, 5, notEqual).asBoolean());
}

TEST(ComparisonTest, ListsAreEqualOnlyToThemselves) {
    Session s;
    auto a = Value::makeList(s.newList());
    auto b = Value::makeList(s.newList());
    EXPECT_TRUE(binary(s, a, a, equal).asBoolean());
    EXPECT_FALSE(binary(s, a, b, equal).asBoolean());
}

TEST(LogicTest, BooleanOperators) {
    Session s;
    auto t = Value::makeBoolean(true);
    auto f = Value::makeBoolean(false);
    EXPECT_FALSE(binary(s, t, f, logicalAnd).asBoolean());
    EXPECT_TRUE(binary(s, t, t, logicalAnd).asBoolean());
    EXPECT_TRUE(binary(s, f, t, logicalOr).asBoolean());
    EXPECT_FALSE(binary(s, f, f, logicalOr).asBoolean());

    s.pushBoolean(false);
    logicalNot(s);
    EXPECT_TRUE(s.pop().asBoolean());
}

TEST(LogicTest, NonBooleanOperandMismatches) {
    Session s;
    EXPECT_EQ(faultOf(s, Value::makeBoolean(true), Value::makeInteger(1), logicalAnd),
              FaultKind::TypeMismatch);
    EXPECT_EQ(faultOf(s, Value::makeInteger(0), Value::makeBoolean(true), logicalOr),
              FaultKind::TypeMismatch);

    s.pushInteger(1);
    EXPECT_THROW(logicalNot(s), RuntimeFault);
    EXPECT_TRUE(s.pop().isInteger());
}
