#include "common/error.hpp"
#include "document/document.hpp"
#include "document/value.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

namespace docdb {

// ── Factories ────────────────────────────────────────────────────────────────

TEST(ValueTest, DefaultIsNull) {
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.type(), ValueType::Null);
}

TEST(ValueTest, IntegerPicksSmallestWidth) {
    EXPECT_EQ(Value::integer(1).type(), ValueType::Int8);
    EXPECT_EQ(Value::integer(-129).type(), ValueType::Int16);
    EXPECT_EQ(Value::integer(70'000).type(), ValueType::Int32);
    EXPECT_EQ(Value::integer(int64_t{1} << 40).type(), ValueType::Int64);
    EXPECT_EQ(Value::integer(70'000).as_int64(), 70'000);
}

TEST(ValueTest, DocumentRequiresPointer) {
    EXPECT_THROW((void)Value::document(nullptr), std::invalid_argument);
}

TEST(ValueTest, TypeNames) {
    EXPECT_STREQ(to_string(ValueType::Float64), "float64");
    EXPECT_STREQ(to_string(ValueType::Document), "document");
}

// ── Conversions ──────────────────────────────────────────────────────────────

TEST(ValueTest, FloatWithFractionDoesNotConvertToInteger) {
    int64_t out = 0;
    EXPECT_EQ(Value::float64(1.5).convert_to_int64(out), errc::conversion_failed);
}

TEST(ValueTest, IntegralFloatConvertsToInteger) {
    int64_t out = 0;
    ASSERT_FALSE(Value::float64(42.0).convert_to_int64(out));
    EXPECT_EQ(out, 42);
}

TEST(ValueTest, HugeFloatDoesNotConvertToInteger) {
    int64_t out = 0;
    EXPECT_EQ(Value::float64(1e19).convert_to_int64(out), errc::conversion_failed);
    EXPECT_EQ(Value::float64(std::numeric_limits<double>::infinity()).convert_to_int64(out),
              errc::conversion_failed);
}

TEST(ValueTest, TextDoesNotConvertToNumber) {
    double d = 0;
    EXPECT_EQ(Value::text("1").convert_to_float64(d), errc::conversion_failed);
}

TEST(ValueTest, ConvertToNarrowerIntegerChecksRange) {
    Value out;
    EXPECT_EQ(Value::int64(300).convert_to(ValueType::Int8, out), errc::conversion_failed);
    ASSERT_FALSE(Value::int64(100).convert_to(ValueType::Int8, out));
    EXPECT_EQ(out.type(), ValueType::Int8);
    EXPECT_EQ(out.as_int64(), 100);
}

TEST(ValueTest, TextAndBlobConvertIntoEachOther) {
    Value out;
    ASSERT_FALSE(Value::text("abc").convert_to(ValueType::Blob, out));
    EXPECT_EQ(out.type(), ValueType::Blob);
    EXPECT_EQ(out.as_bytes(), "abc");
}

// ── Truthiness ───────────────────────────────────────────────────────────────

TEST(ValueTest, Truthiness) {
    EXPECT_FALSE(Value::null().is_truthy());
    EXPECT_FALSE(Value::boolean(false).is_truthy());
    EXPECT_FALSE(Value::integer(0).is_truthy());
    EXPECT_FALSE(Value::float64(0.0).is_truthy());
    EXPECT_FALSE(Value::text("").is_truthy());
    EXPECT_FALSE(Value::array({}).is_truthy());
    EXPECT_FALSE(Value::document(std::make_shared<FieldBuffer>()).is_truthy());

    EXPECT_TRUE(Value::integer(-1).is_truthy());
    EXPECT_TRUE(Value::text("x").is_truthy());
    EXPECT_TRUE(Value::array({Value::null()}).is_truthy());

    auto doc = std::make_shared<FieldBuffer>();
    doc->add("a", Value::null());
    EXPECT_TRUE(Value::document(doc).is_truthy());
}

// ── Comparison ───────────────────────────────────────────────────────────────

TEST(ValueTest, NumbersCompareAcrossWidths) {
    EXPECT_EQ(compare_values(Value::int8(1), Value::int64(1)).value_or(99), 0);
    EXPECT_EQ(compare_values(Value::integer(2), Value::float64(2.0)).value_or(99), 0);
    EXPECT_EQ(compare_values(Value::integer(1), Value::float64(1.5)).value_or(99), -1);
    EXPECT_EQ(compare_values(Value::float64(3.0), Value::integer(2)).value_or(99), 1);
}

TEST(ValueTest, DifferentTypesAreNotComparable) {
    EXPECT_FALSE(compare_values(Value::integer(1), Value::text("1")).has_value());
    EXPECT_FALSE(compare_values(Value::text("a"), Value::blob("a")).has_value());
    EXPECT_FALSE(compare_values(Value::null(), Value::boolean(false)).has_value());
}

TEST(ValueTest, NullEqualsNull) {
    EXPECT_TRUE(values_equal(Value::null(), Value::null()));
}

TEST(ValueTest, TextComparesBytewise) {
    EXPECT_EQ(compare_values(Value::text("abc"), Value::text("abd")).value_or(99), -1);
    EXPECT_EQ(compare_values(Value::text("b"), Value::text("abc")).value_or(99), 1);
    EXPECT_EQ(compare_values(Value::text("ab"), Value::text("abc")).value_or(99), -1);
}

TEST(ValueTest, ArraysCompareElementWise) {
    auto a = Value::array({Value::integer(1), Value::integer(2)});
    auto b = Value::array({Value::integer(1), Value::integer(3)});
    auto c = Value::array({Value::integer(1)});
    EXPECT_EQ(compare_values(a, b).value_or(99), -1);
    EXPECT_EQ(compare_values(c, a).value_or(99), -1);
    EXPECT_TRUE(values_equal(a, Value::array({Value::float64(1.0), Value::integer(2)})));
}

TEST(ValueTest, DocumentsOnlySupportEquality) {
    auto x = std::make_shared<FieldBuffer>();
    x->add("a", Value::integer(1)).add("b", Value::text("t"));
    auto y = std::make_shared<FieldBuffer>();
    y->add("b", Value::text("t")).add("a", Value::integer(1));
    auto z = std::make_shared<FieldBuffer>();
    z->add("a", Value::integer(2));

    EXPECT_TRUE(values_equal(Value::document(x), Value::document(y)));
    EXPECT_FALSE(compare_values(Value::document(x), Value::document(z)).has_value());
}

// ── Rendering ────────────────────────────────────────────────────────────────

TEST(ValueTest, ToString) {
    EXPECT_EQ(Value::null().to_string(), "null");
    EXPECT_EQ(Value::boolean(true).to_string(), "true");
    EXPECT_EQ(Value::integer(-7).to_string(), "-7");
    EXPECT_EQ(Value::float64(1.5).to_string(), "1.5");
    EXPECT_EQ(Value::text("a\"b").to_string(), "\"a\\\"b\"");
    EXPECT_EQ(Value::blob("\x01\xAB").to_string(), "\"\\x01AB\"");
    EXPECT_EQ(Value::array({Value::integer(1), Value::text("x")}).to_string(), "[1, \"x\"]");

    auto doc = std::make_shared<FieldBuffer>();
    doc->add("a", Value::integer(1));
    EXPECT_EQ(Value::document(doc).to_string(), "{\"a\": 1}");
}

} // namespace docdb
