/**
 * Encoder tests
 *
 * Exact text for every layout: objects, inline / tabular / list arrays,
 * list items holding objects and arrays, quoting, delimiters, options.
 */

#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <variant>

#include "toon-test-common.hh"

namespace havTOON
{
  namespace
  {
    // `levels` containers, counting the root array: arrays of list-item objects whose first field is the next array
    Value NestedItems(std::size_t levels)
    {
      Value value = Array{};
      for (std::size_t level = 1; level < levels; ++level)
      {
        if (value.isArray())
        {
          value = Object{{"items", std::move(value)}, {"id", static_cast<int>(level)}};
        }
        else
        {
          value = Array{std::move(value), "tail"};
        }
      }
      return value;
    }

    NativeValue NativeNestedItems(std::size_t levels)
    {
      NativeValue value = NativeArray{};
      for (std::size_t level = 1; level < levels; ++level)
      {
        if (std::holds_alternative<NativeArray>(value))
        {
          value = NativeObject{{"items", std::move(value)}, {"id", static_cast<int>(level)}};
        }
        else
        {
          value = NativeArray{std::move(value), "tail"};
        }
      }
      return value;
    }
  } // namespace

  // =============================================================================
  // Objects and primitives
  // =============================================================================

  TEST(EncodeTest, FlatObject)
  {
    EXPECT_EQ(EncodeOk(Object{{"name", "Alice"}, {"age", 30}}), "name: Alice\nage: 30");
  }

  TEST(EncodeTest, NestedObjects)
  {
    Value value = Object{{"user", Object{{"id", 1}, {"profile", Object{{"city", "Paris"}}}}}, {"ok", true}};
    EXPECT_EQ(EncodeOk(value), "user:\n  id: 1\n  profile:\n    city: Paris\nok: true");
  }

  TEST(EncodeTest, EmptyContainers)
  {
    EXPECT_EQ(EncodeOk(Object{}), "");
    EXPECT_EQ(EncodeOk(Object{{"meta", Object{}}}), "meta:");
    EXPECT_EQ(EncodeOk(Object{{"items", Array{}}}), "items[0]:");
    EXPECT_EQ(EncodeOk(Array{}), "[0]:");
  }

  TEST(EncodeTest, RootPrimitives)
  {
    EXPECT_EQ(EncodeOk(Value("hello")), "hello");
    EXPECT_EQ(EncodeOk(Value(42)), "42");
    EXPECT_EQ(EncodeOk(Value(-1.5)), "-1.5");
    EXPECT_EQ(EncodeOk(Value(nullptr)), "null");
    EXPECT_EQ(EncodeOk(Value(false)), "false");
    EXPECT_EQ(EncodeOk(Value("")), "\"\"");
  }

  TEST(EncodeTest, NumbersAreWrittenPositionally)
  {
    Value value = Object{{"x", 1.5}, {"y", -0.25}, {"z", 1e-7}, {"w", 2.0}, {"big", 1e21}};
    EXPECT_EQ(EncodeOk(value), "x: 1.5\ny: -0.25\nz: 0.0000001\nw: 2\nbig: 1000000000000000000000");
  }

  TEST(EncodeTest, UnsafeIntegersAreQuoted)
  {
    Value value = Object{{"n", Number::Unsigned(9007199254740993ULL)}, {"m", Number::Integer(-9007199254740991LL)}};
    EXPECT_EQ(EncodeOk(value), "n: \"9007199254740993\"\nm: -9007199254740991");
  }

  TEST(EncodeTest, NoTrailingNewline)
  {
    std::string text = EncodeOk(Object{{"a", Array{Object{{"b", 1}}, 2}}});
    ASSERT_FALSE(text.empty());
    EXPECT_NE(text.back(), '\n');
  }

  // =============================================================================
  // Arrays
  // =============================================================================

  TEST(EncodeTest, InlinePrimitiveArray)
  {
    EXPECT_EQ(EncodeOk(Object{{"tags", Array{"a", "b", "c"}}}), "tags[3]: a,b,c");
    EXPECT_EQ(EncodeOk(Object{{"mixed", Array{1, "x", true, nullptr}}}), "mixed[4]: 1,x,true,null");
    EXPECT_EQ(EncodeOk(Array{1, 2, 3}), "[3]: 1,2,3");
  }

  TEST(EncodeTest, TabularArray)
  {
    Value value = Object{{"users", Array{Object{{"id", 1}, {"name", "Alice"}}, Object{{"id", 2}, {"name", "Bob"}}}}};
    EXPECT_EQ(EncodeOk(value), "users[2]{id,name}:\n  1,Alice\n  2,Bob");
  }

  TEST(EncodeTest, TabularRowsFollowHeaderOrder)
  {
    Value value = Array{Object{{"id", 1}, {"name", "A"}}, Object{{"name", "B"}, {"id", 2}}};
    EXPECT_EQ(EncodeOk(value), "[2]{id,name}:\n  1,A\n  2,B");
  }

  TEST(EncodeTest, ListArrayOfMixedItems)
  {
    Value value = Object{{"items", Array{1, Object{{"a", 1}}, "x"}}};
    EXPECT_EQ(EncodeOk(value), "items[3]:\n  - 1\n  - a: 1\n  - x");
  }

  TEST(EncodeTest, ListItemObjectsWithSeveralFields)
  {
    Value value = Object{{"items", Array{Object{{"a", 1}, {"b", 2}}, Object{{"c", 3}}}}};
    EXPECT_EQ(EncodeOk(value), "items[2]:\n  - a: 1\n    b: 2\n  - c: 3");
  }

  TEST(EncodeTest, ListItemFirstFieldNestedObject)
  {
    Value value = Object{{"items", Array{Object{{"meta", Object{{"x", 1}, {"y", 2}}}, {"id", 5}}}}};
    EXPECT_EQ(EncodeOk(value), "items[1]:\n  - meta:\n      x: 1\n      y: 2\n    id: 5");
  }

  TEST(EncodeTest, ListItemFirstFieldArrays)
  {
    Value inlineFirst = Array{Object{{"tags", Array{"a", "b"}}, {"id", 1}}};
    EXPECT_EQ(EncodeOk(inlineFirst), "[1]:\n  - tags[2]: a,b\n    id: 1");

    Value tabularFirst = Array{Object{{"rows", Array{Object{{"x", 1}}, Object{{"x", 2}}}}, {"id", 1}}};
    EXPECT_EQ(EncodeOk(tabularFirst), "[1]:\n  - rows[2]{x}:\n    1\n    2\n    id: 1");

    Value listFirst = Array{Object{{"parts", Array{Array{1}, "p"}}, {"id", 1}}};
    EXPECT_EQ(EncodeOk(listFirst), "[1]:\n  - parts[2]:\n    - [1]: 1\n    - p\n    id: 1");
  }

  TEST(EncodeTest, NestedArraysAndEmptyItems)
  {
    EXPECT_EQ(EncodeOk(Array{Array{1, 2}, Array{}}), "[2]:\n  - [2]: 1,2\n  - [0]:");
    EXPECT_EQ(EncodeOk(Array{Object{}, 1}), "[2]:\n  -\n  - 1");
    Value tables = Array{Array{Object{{"k", 1}}, Object{{"k", 2}}}};
    EXPECT_EQ(EncodeOk(tables), "[1]:\n  - [2]{k}:\n    1\n    2");
  }

  // =============================================================================
  // Quoting
  // =============================================================================

  TEST(EncodeTest, StringQuoting)
  {
    auto field = [](const char* text) { return EncodeOk(Object{{"v", text}}); };
    EXPECT_EQ(field("hello world"), "v: hello world");
    EXPECT_EQ(field("café"), "v: café");
    EXPECT_EQ(field("a|b"), "v: a|b");
    EXPECT_EQ(field("true"), "v: \"true\"");
    EXPECT_EQ(field("null"), "v: \"null\"");
    EXPECT_EQ(field("42"), "v: \"42\"");
    EXPECT_EQ(field("-3.5e2"), "v: \"-3.5e2\"");
    EXPECT_EQ(field("05"), "v: \"05\"");
    EXPECT_EQ(field("-"), "v: \"-\"");
    EXPECT_EQ(field("- item"), "v: \"- item\"");
    EXPECT_EQ(field(" padded"), "v: \" padded\"");
    EXPECT_EQ(field("a,b"), "v: \"a,b\"");
    EXPECT_EQ(field("x:y"), "v: \"x:y\"");
    EXPECT_EQ(field("[3]"), "v: \"[3]\"");
    EXPECT_EQ(field("{}"), "v: \"{}\"");
    EXPECT_EQ(field("say \"hi\""), "v: \"say \\\"hi\\\"\"");
    EXPECT_EQ(field("back\\slash"), "v: \"back\\\\slash\"");
    EXPECT_EQ(field("line\nbreak"), "v: \"line\\nbreak\"");
    EXPECT_EQ(field("tab\there"), "v: \"tab\\there\"");
    EXPECT_EQ(field(""), "v: \"\"");
  }

  TEST(EncodeTest, KeyQuoting)
  {
    EXPECT_EQ(EncodeOk(Object{{"a.b_c", 1}}), "a.b_c: 1");
    EXPECT_EQ(EncodeOk(Object{{"my key", 1}}), "\"my key\": 1");
    EXPECT_EQ(EncodeOk(Object{{"1abc", 1}}), "\"1abc\": 1");
    EXPECT_EQ(EncodeOk(Object{{"", 1}}), "\"\": 1");
    EXPECT_EQ(EncodeOk(Object{{"a-b", Array{1}}}), "\"a-b\"[1]: 1");
    Value table = Array{Object{{"first name", "A"}}};
    EXPECT_EQ(EncodeOk(table), "[1]{\"first name\"}:\n  A");
  }

  // =============================================================================
  // Options
  // =============================================================================

  TEST(EncodeTest, TabDelimiter)
  {
    EncodeOptions options;
    options.delimiter = Delimiter::Tab;
    EXPECT_EQ(EncodeOk(Object{{"t", Array{"a", "b c", "d,e"}}}, options), "t[3\t]: a\tb c\t\"d,e\"");
  }

  TEST(EncodeTest, PipeDelimiter)
  {
    EncodeOptions options;
    options.delimiter = Delimiter::Pipe;
    Value value = Object{{"users", Array{Object{{"id", 1}, {"name", "Alice"}}, Object{{"id", 2}, {"name", "a|b"}}}}};
    EXPECT_EQ(EncodeOk(value, options), "users[2|]{id|name}:\n  1|Alice\n  2|\"a|b\"");
  }

  TEST(EncodeTest, LengthMarker)
  {
    EncodeOptions options;
    options.lengthMarker = true;
    EXPECT_EQ(EncodeOk(Object{{"tags", Array{"a", "b", "c"}}}, options), "tags[#3]: a,b,c");
    options.delimiter = Delimiter::Pipe;
    EXPECT_EQ(EncodeOk(Object{{"tags", Array{1, 2}}}, options), "tags[#2|]: 1|2");
  }

  TEST(EncodeTest, IndentWidth)
  {
    Value value = Object{{"a", Object{{"b", Array{Object{{"c", 1}, {"d", 2}}, 3}}}}};
    EncodeOptions options;
    options.indent = 4;
    EXPECT_EQ(EncodeOk(value, options), "a:\n    b[2]:\n        - c: 1\n            d: 2\n        - 3");
  }

  TEST(EncodeTest, ZeroIndentEncodesAsOne)
  {
    EncodeOptions zero;
    zero.indent = 0;
    EncodeOptions one;
    one.indent = 1;
    Value value = Object{{"a", Object{{"b", 1}}}, {"c", Array{Object{{"d", 1}, {"e", 2}}, 1}}};
    EXPECT_EQ(EncodeOk(value, zero), EncodeOk(value, one));
    EXPECT_EQ(EncodeOk(Object{{"a", Object{{"b", 1}}}}, zero), "a:\n b: 1");
  }

  // =============================================================================
  // Failures
  // =============================================================================

  TEST(EncodeTest, NonFiniteNumbersNeedNormalizing)
  {
    std::string out = "untouched";
    Error error;
    Value value = Object{{"x", std::numeric_limits<double>::infinity()}};
    EXPECT_EQ(Encode(value, out, {}, &error), ErrorCode::NormalizationError);
    EXPECT_EQ(error.code, ErrorCode::NormalizationError);
    EXPECT_EQ(out, "untouched");
    EXPECT_THROW(EncodeOrThrow(value), EncodeException);
    EXPECT_EQ(EncodeOk(Normalize(value)), "x: null");
  }

  TEST(EncodeTest, InvalidOptions)
  {
    std::string out;
    EncodeOptions negative;
    negative.indent = -1;
    EXPECT_EQ(Encode(Value(1), out, negative), ErrorCode::InvalidOptions);

    EncodeOptions noDepth;
    noDepth.maxDepth = 0;
    EXPECT_EQ(Encode(Value(1), out, noDepth), ErrorCode::InvalidOptions);
  }

  TEST(EncodeTest, DepthLimit)
  {
    Value deep = 1;
    for (int i = 0; i < 2000; ++i)
    {
      Object wrapper;
      wrapper.Set("a", std::move(deep));
      deep = std::move(wrapper);
    }
    std::string out;
    Error error;
    EXPECT_EQ(Encode(deep, out, {}, &error), ErrorCode::DepthExceeded);
    EXPECT_EQ(error.code, ErrorCode::DepthExceeded);

    Value shallow = 1;
    for (int i = 0; i < 50; ++i)
    {
      Object wrapper;
      wrapper.Set("a", std::move(shallow));
      shallow = std::move(wrapper);
    }
    EXPECT_EQ(Encode(shallow, out), ErrorCode::OK);
  }

  TEST(EncodeTest, DepthCountsContainersLikeNormalize)
  {
    EncodeOptions options;
    options.maxDepth = 7;
    std::string out;

    for (std::size_t levels = 1; levels <= options.maxDepth; ++levels)
    {
      EXPECT_EQ(Encode(NestedItems(levels), out, options), ErrorCode::OK) << levels;
      EXPECT_EQ(EncodeNative(NativeNestedItems(levels), out, options), ErrorCode::OK) << levels;
    }
    EXPECT_EQ(DecodeOrThrow(EncodeOrThrow(NestedItems(options.maxDepth), options)), NestedItems(options.maxDepth));

    Error error;
    EXPECT_EQ(Encode(NestedItems(options.maxDepth + 1), out, options, &error), ErrorCode::DepthExceeded);
    EXPECT_EQ(error.code, ErrorCode::DepthExceeded);
    EXPECT_EQ(EncodeNative(NativeNestedItems(options.maxDepth + 1), out, options), ErrorCode::DepthExceeded);
  }

  TEST(EncodeTest, DepthCountsTabularRowsAndEmptyContainers)
  {
    EncodeOptions options;
    options.maxDepth = 2;
    std::string out;

    EXPECT_EQ(Encode(Object{{"t", Array{Object{{"a", 1}}}}}, out, options), ErrorCode::DepthExceeded);
    EXPECT_EQ(Encode(Array{Object{{"a", 1}}}, out, options), ErrorCode::OK);
    EXPECT_EQ(Encode(Object{{"a", Object{{"b", Object{}}}}}, out, options), ErrorCode::DepthExceeded);
    EXPECT_EQ(Encode(Object{{"a", Object{}}}, out, options), ErrorCode::OK);
    EXPECT_EQ(Encode(Array{Array{}, 1}, out, options), ErrorCode::OK);
    EXPECT_EQ(Encode(Array{Array{Array{}, 1}, 1}, out, options), ErrorCode::DepthExceeded);
  }

  // =============================================================================
  // Determinism
  // =============================================================================

  TEST(EncodeTest, SameInputSameText)
  {
    Value value = Object{
      {"z", 1},
      {"a", Array{Object{{"k", 1}, {"j", 2}}, Object{{"k", 3}, {"j", 4}}}},
      {"m", Array{Object{{"rows", Array{Object{{"x", 1}}}}, {"more", Array{1, 2}}}, "s"}},
    };
    for (Delimiter delimiter : {Delimiter::Comma, Delimiter::Tab, Delimiter::Pipe})
    {
      EncodeOptions options;
      options.delimiter = delimiter;
      const std::string first = EncodeOk(value, options);
      EXPECT_EQ(EncodeOk(value, options), first);

      std::string native;
      ASSERT_EQ(EncodeNative(NativeValue(value), native, options), ErrorCode::OK);
      EXPECT_EQ(native, first);
    }
  }
}
