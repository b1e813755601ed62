/**
 * Value model tests
 *
 * Number construction and rendering, object ordering, equality, the total
 * order used for set normalization, JSON rendering and error code names.
 */

#include <cstdint>
#include <limits>
#include <string>

#include "toon-test-common.hh"

namespace havTOON
{
  // =============================================================================
  // Number
  // =============================================================================

  TEST(NumberTest, IntegerText)
  {
    EXPECT_EQ(Number::Integer(0).Text(), "0");
    EXPECT_EQ(Number::Integer(42).Text(), "42");
    EXPECT_EQ(Number::Integer(-42).Text(), "-42");
    EXPECT_EQ(Number::Integer(std::numeric_limits<std::int64_t>::min()).Text(), "-9223372036854775808");
    EXPECT_EQ(Number::Unsigned(std::numeric_limits<std::uint64_t>::max()).Text(), "18446744073709551615");
  }

  TEST(NumberTest, RealTextIsShortestWithoutExponent)
  {
    EXPECT_EQ(Number::Real(1.5).Text(), "1.5");
    EXPECT_EQ(Number::Real(-0.25).Text(), "-0.25");
    EXPECT_EQ(Number::Real(0.1).Text(), "0.1");
    EXPECT_EQ(Number::Real(100.0).Text(), "100");
    EXPECT_EQ(Number::Real(1e-7).Text(), "0.0000001");
    EXPECT_EQ(Number::Real(1e21).Text(), "1000000000000000000000");
    EXPECT_EQ(Number::Real(123456.789).Text(), "123456.789");
    EXPECT_EQ(Number::Real(0.1 + 0.2).Text(), "0.30000000000000004");
    EXPECT_EQ(Number::Real(-0.0).Text(), "0");
  }

  TEST(NumberTest, Classification)
  {
    EXPECT_TRUE(Number::Integer(9007199254740991LL).IsSafeInteger());
    EXPECT_FALSE(Number::Integer(9007199254740992LL).IsSafeInteger());
    EXPECT_TRUE(Number::Integer(-9007199254740991LL).IsSafeInteger());
    EXPECT_FALSE(Number::Real(1.0).IsSafeInteger());

    EXPECT_TRUE(Number::Real(-0.0).IsNegativeZero());
    EXPECT_FALSE(Number::Real(0.0).IsNegativeZero());
    EXPECT_FALSE(Number::Real(std::numeric_limits<double>::infinity()).IsFinite());
    EXPECT_FALSE(Number::Real(std::numeric_limits<double>::quiet_NaN()).IsFinite());
    EXPECT_TRUE(Number::Unsigned(std::numeric_limits<std::uint64_t>::max()).IsFinite());
  }

  TEST(NumberTest, AsInt64)
  {
    std::int64_t out = 0;
    EXPECT_TRUE(Number::Integer(-7).AsInt64(out));
    EXPECT_EQ(out, -7);
    EXPECT_TRUE(Number::Integer(std::numeric_limits<std::int64_t>::min()).AsInt64(out));
    EXPECT_EQ(out, std::numeric_limits<std::int64_t>::min());
    EXPECT_FALSE(Number::Unsigned(std::numeric_limits<std::uint64_t>::max()).AsInt64(out));
    EXPECT_FALSE(Number::Real(2.0).AsInt64(out));
  }

  TEST(NumberTest, EqualityAcrossRepresentations)
  {
    EXPECT_EQ(Number::Integer(2), Number::Real(2.0));
    EXPECT_EQ(Number::Integer(0), Number::Real(-0.0));
    EXPECT_NE(Number::Integer(-1), Number::Unsigned(1));
    EXPECT_EQ(Number::FromParts(true, 0), Number::Integer(0));
  }

  // =============================================================================
  // Value and Object
  // =============================================================================

  TEST(ValueTest, ConstructorsPickTheRightAlternative)
  {
    EXPECT_TRUE(Value().isNull());
    EXPECT_TRUE(Value(nullptr).isNull());
    EXPECT_TRUE(Value(true).isBool());
    EXPECT_TRUE(Value(1).isNumber());
    EXPECT_TRUE(Value(1u).isNumber());
    EXPECT_TRUE(Value(2.5).isNumber());
    EXPECT_TRUE(Value("text").isString());
    EXPECT_TRUE(Value(std::string_view("text")).isString());
    EXPECT_TRUE(Value(Array{1, 2}).isArray());
    EXPECT_TRUE(Value(Object{}).isObject());
    EXPECT_TRUE(Value(Number::Integer(3)).asNumber().IsInteger());
    EXPECT_FALSE(Value(3.0).asNumber().IsInteger());
  }

  TEST(ObjectTest, KeepsInsertionOrderAndReplacesInPlace)
  {
    Object object{{"b", 1}, {"a", 2}};
    object.Set("c", 3);
    object.Set("b", 4);

    ASSERT_EQ(object.Size(), 3u);
    EXPECT_EQ(object.Items()[0].first, "b");
    EXPECT_EQ(object.Items()[1].first, "a");
    EXPECT_EQ(object.Items()[2].first, "c");
    EXPECT_EQ(*object.Find("b"), Value(4));
    EXPECT_TRUE(object.Contains("a"));
    EXPECT_FALSE(object.Contains("z"));
    EXPECT_EQ(object.Find("z"), nullptr);
  }

  TEST(ObjectTest, InitializerListDuplicatesKeepFirstPosition)
  {
    Object object{{"k", 1}, {"other", 2}, {"k", 3}};
    ASSERT_EQ(object.Size(), 2u);
    EXPECT_EQ(object.Items()[0].first, "k");
    EXPECT_EQ(object.Items()[0].second, Value(3));
  }

  TEST(ObjectTest, ManyKeysKeepOrderAndLookups)
  {
    const int count = 100000;
    Object object;
    for (int i = 0; i < count; ++i)
    {
      object.Set("k" + std::to_string(i), i);
    }
    for (int i = 0; i < count; i += 2)
    {
      object.Set("k" + std::to_string(i), -i);
    }

    ASSERT_EQ(object.Size(), static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i)
    {
      const Object::Item& item = object.Items()[static_cast<std::size_t>(i)];
      ASSERT_EQ(item.first, "k" + std::to_string(i));
      const Value* found = object.Find(item.first);
      ASSERT_NE(found, nullptr);
      ASSERT_EQ(*found, Value(i % 2 == 0 ? -i : i));
    }
    EXPECT_FALSE(object.Contains("k" + std::to_string(count)));

    // Copies carry their own lookup table
    Object copy = object;
    copy.Set("k1", "changed");
    copy.Set("extra", true);
    EXPECT_EQ(*copy.Find("k1"), Value("changed"));
    EXPECT_EQ(*object.Find("k1"), Value(1));
    EXPECT_EQ(copy.Items().back().first, "extra");
    EXPECT_FALSE(object.Contains("extra"));

    Object moved = std::move(copy);
    EXPECT_EQ(*moved.Find("extra"), Value(true));
    EXPECT_EQ(moved.Size(), static_cast<std::size_t>(count) + 1);
  }

  TEST(ValueTest, EqualityIsOrderSensitiveForObjects)
  {
    Value ab = Object{{"a", 1}, {"b", 2}};
    Value ba = Object{{"b", 2}, {"a", 1}};
    EXPECT_NE(ab, ba);
    EXPECT_EQ(ab, Value(Object{{"a", 1}, {"b", 2.0}}));
    EXPECT_NE(Value(1), Value("1"));
    EXPECT_NE(Value(nullptr), Value(false));
  }

  // =============================================================================
  // Compare
  // =============================================================================

  TEST(CompareTest, RanksKindsBeforeContent)
  {
    std::vector<Value> ordered{nullptr, false, true, -5, 0, 2.5, "", "a", Array{}, Array{1}, Object{}};
    for (std::size_t i = 0; i + 1 < ordered.size(); ++i)
    {
      EXPECT_LT(Compare(ordered[i], ordered[i + 1]), 0) << i;
      EXPECT_GT(Compare(ordered[i + 1], ordered[i]), 0) << i;
    }
    EXPECT_EQ(Compare(Value(1), Value(1.0)), 0);
    EXPECT_LT(Compare(Value(-10), Value(-2)), 0);
    EXPECT_LT(Compare(Value(Number::Unsigned(18446744073709551615ULL)), Value(Number::Real(1e30))), 0);
  }

  // =============================================================================
  // JSON rendering and error names
  // =============================================================================

  TEST(JsonTest, CompactInsertionOrder)
  {
    Value value = Object{{"b", 1}, {"a", Array{true, nullptr, "x\n", 1.5}}};
    EXPECT_EQ(ToJsonString(value), R"({"b":1,"a":[true,null,"x\n",1.5]})");
    EXPECT_EQ(ToJsonString(Value(std::string("\x01"))), "\"\\u0001\"");
  }

  TEST(ErrorCodeTest, NamesAndSyntaxFamily)
  {
    EXPECT_STREQ(ToString(ErrorCode::ArrayLengthMismatch), "ArrayLengthMismatch");
    EXPECT_STREQ(ToString(ErrorCode::OK), "OK");
    EXPECT_TRUE(IsSyntaxError(ErrorCode::SyntaxError));
    EXPECT_TRUE(IsSyntaxError(ErrorCode::UnterminatedString));
    EXPECT_TRUE(IsSyntaxError(ErrorCode::InvalidEscape));
    EXPECT_FALSE(IsSyntaxError(ErrorCode::IndentationError));

    Error error;
    EXPECT_FALSE(static_cast<bool>(error));
    error.code = ErrorCode::IoError;
    EXPECT_TRUE(static_cast<bool>(error));
  }
}
