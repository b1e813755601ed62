/*
havTOON.hpp

ABOUT

Havoc's single-file TOON (Token-Oriented Object Notation) library for C++.

TOON renders objects with indentation (like CSON / YAML) and arrays either inline, as CSV-like tables or as dash
lists, each behind a length header such as `[3]:` or `[2]{id,name}:`. The result is a compact, fully reversible
text form of JSON-shaped data.

REVISION HISTORY

v0.1 (2026-10-19) - First release.

LICENSE

MIT License

Copyright (c) 2025 René Nicolaus

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef HAVTOON_HPP
#define HAVTOON_HPP

#ifdef _WIN32
  #ifdef _MBCS
    #error "_MBCS is defined, but only Unicode is supported"
  #endif
  #undef _UNICODE
  #define _UNICODE
  #undef UNICODE
  #define UNICODE

  #undef NOMINMAX
  #define NOMINMAX

  #undef STRICT
  #define STRICT

  #ifndef _WIN32_WINNT
    #define _WIN32_WINNT _WIN32_WINNT_WINXP
  #endif
  #ifdef _MSC_VER
    #include <SDKDDKVer.h>
  #endif

  #undef WIN32_LEAN_AND_MEAN
  #define WIN32_LEAN_AND_MEAN
  #include <windows.h>
#endif

#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

static_assert(sizeof(unsigned long long) == 8, "expected uint64 to be 8 bytes");
static_assert(std::numeric_limits<double>::is_iec559, "expected IEEE-754 doubles");

namespace havTOON
{
#ifdef _WIN32
  // Convert UTF-8 to UTF-16; keep the trailing null when forFileStream is true so _wfopen can use data()
  inline std::wstring ConvertStringToWString(const std::string& value, bool forFileStream = false)
  {
    int numChars = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, value.c_str(), -1, nullptr, 0);
    if (numChars <= 0)
    {
      return {};
    }

    std::wstring wstr(static_cast<std::size_t>(numChars), L'\0');
    int written = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, value.c_str(), -1, wstr.data(), numChars);
    if (written <= 0)
    {
      return {};
    }

    if (!forFileStream && !wstr.empty() && wstr.back() == L'\0')
    {
      wstr.pop_back();
    }

    return wstr;
  }

  // Cross-platform FILE opener that accepts UTF-8 paths and uses wide APIs on Windows
  inline std::unique_ptr<std::FILE, decltype(&std::fclose)>
  OpenFileUTF8(const std::string& path, const std::string& mode)
  {
    std::unique_ptr<std::FILE, decltype(&std::fclose)> fileStream(nullptr, &std::fclose);
    std::wstring modeW = ConvertStringToWString(mode, true);
    std::wstring pathW = ConvertStringToWString(path, true);
    std::FILE* file = nullptr;
    if (_wfopen_s(&file, pathW.c_str(), modeW.c_str()) == 0)
    {
      fileStream.reset(file);
    }
    return fileStream;
  }
#else
  inline std::unique_ptr<std::FILE, decltype(&std::fclose)>
  OpenFileUTF8(const std::string& path, const std::string& mode)
  {
    std::unique_ptr<std::FILE, decltype(&std::fclose)> fileStream(nullptr, &std::fclose);
    fileStream.reset(std::fopen(path.c_str(), mode.c_str()));
    return fileStream;
  }
#endif

  struct LocationEntry
  {
    std::size_t line = 1;
    std::size_t column = 1;
  };

  enum class ErrorCode : std::uint8_t
  {
    OK,
    NormalizationError,
    CyclicReference,
    DepthExceeded,
    InvalidOptions,
    InvalidUtf8,
    SyntaxError,
    UnterminatedString,
    InvalidEscape,
    IndentationError,
    ArrayLengthMismatch,
    TabularRowArity,
    DelimiterMismatch,
    BlankLineInArray,
    IoError,
  };

  inline const char* ToString(ErrorCode code)
  {
    switch (code)
    {
      case ErrorCode::OK: return "OK";
      case ErrorCode::NormalizationError: return "NormalizationError";
      case ErrorCode::CyclicReference: return "CyclicReference";
      case ErrorCode::DepthExceeded: return "DepthExceeded";
      case ErrorCode::InvalidOptions: return "InvalidOptions";
      case ErrorCode::InvalidUtf8: return "InvalidUtf8";
      case ErrorCode::SyntaxError: return "SyntaxError";
      case ErrorCode::UnterminatedString: return "UnterminatedString";
      case ErrorCode::InvalidEscape: return "InvalidEscape";
      case ErrorCode::IndentationError: return "IndentationError";
      case ErrorCode::ArrayLengthMismatch: return "ArrayLengthMismatch";
      case ErrorCode::TabularRowArity: return "TabularRowArity";
      case ErrorCode::DelimiterMismatch: return "DelimiterMismatch";
      case ErrorCode::BlankLineInArray: return "BlankLineInArray";
      case ErrorCode::IoError: return "IoError";
    }
    return "Unknown";
  }

  // Malformed quoting, escapes, keys and headers all belong to the syntax family
  inline bool IsSyntaxError(ErrorCode code)
  {
    return code == ErrorCode::SyntaxError || code == ErrorCode::UnterminatedString ||
      code == ErrorCode::InvalidEscape;
  }

  struct Error
  {
    ErrorCode code = ErrorCode::OK;
    LocationEntry where{};
    std::string message;

    explicit operator bool() const
    {
      return code != ErrorCode::OK;
    }
  };

  // Largest integer magnitude a double-precision consumer can represent exactly (2^53 - 1)
  inline constexpr std::uint64_t kMaxSafeInteger = 9007199254740991ULL;
  inline constexpr std::size_t kDefaultMaxDepth = 1000;

  namespace detail
  {
    inline std::string FormatMagnitude(bool negative, std::uint64_t magnitude)
    {
      char buffer[24];
      char* end = buffer + sizeof(buffer);
      char* cursor = end;
      do
      {
        *--cursor = static_cast<char>('0' + magnitude % 10);
        magnitude /= 10;
      } while (magnitude != 0);

      std::string out;
      if (negative)
      {
        out.push_back('-');
      }
      out.append(cursor, end);
      return out;
    }

    // Shortest digit string that survives a round trip through strtod, written without an exponent
    inline std::string FormatDouble(double value)
    {
      if (std::isnan(value))
      {
        return "NaN";
      }
      if (std::isinf(value))
      {
        return value < 0 ? "-Infinity" : "Infinity";
      }
      if (value == 0.0)
      {
        return "0";
      }

      char buffer[40];
      for (int precision = 1; precision <= 17; ++precision)
      {
        std::snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, value);
        if (std::strtod(buffer, nullptr) == value)
        {
          break;
        }
      }

      // buffer is [-]d[.ddd]e(+|-)xx
      std::string_view text(buffer);
      bool negative = false;
      if (!text.empty() && text.front() == '-')
      {
        negative = true;
        text.remove_prefix(1);
      }
      std::size_t exponentPos = text.find('e');
      std::string digits;
      for (char c : text.substr(0, exponentPos))
      {
        if (c != '.')
        {
          digits.push_back(c);
        }
      }
      int exponent = std::atoi(std::string(text.substr(exponentPos + 1)).c_str());
      while (digits.size() > 1 && digits.back() == '0')
      {
        digits.pop_back();
      }

      std::string out;
      if (negative)
      {
        out.push_back('-');
      }
      const int digitCount = static_cast<int>(digits.size());
      if (exponent >= digitCount - 1)
      {
        out += digits;
        out.append(static_cast<std::size_t>(exponent - (digitCount - 1)), '0');
      }
      else if (exponent < 0)
      {
        out += "0.";
        out.append(static_cast<std::size_t>(-exponent - 1), '0');
        out += digits;
      }
      else
      {
        out.append(digits, 0, static_cast<std::size_t>(exponent + 1));
        out.push_back('.');
        out.append(digits, static_cast<std::size_t>(exponent + 1), std::string::npos);
      }
      return out;
    }
  } // namespace detail

  // A JSON number that remembers whether it was an integer. Integers keep sign and full 64-bit magnitude so both
  // int64 and uint64 ranges survive; everything else is a double.
  class Number
  {
  public:
    Number() = default;

    static Number Integer(std::int64_t value)
    {
      Number number;
      number.mNegative = value < 0;
      number.mMagnitude = value < 0 ? 0 - static_cast<std::uint64_t>(value) : static_cast<std::uint64_t>(value);
      return number;
    }

    static Number Unsigned(std::uint64_t value)
    {
      Number number;
      number.mMagnitude = value;
      return number;
    }

    static Number FromParts(bool negative, std::uint64_t magnitude)
    {
      Number number;
      number.mNegative = negative && magnitude != 0;
      number.mMagnitude = magnitude;
      return number;
    }

    static Number Real(double value)
    {
      Number number;
      number.mIsInteger = false;
      number.mReal = value;
      return number;
    }

    bool IsInteger() const
    {
      return mIsInteger;
    }

    bool IsNegative() const
    {
      return mIsInteger ? mNegative : std::signbit(mReal);
    }

    std::uint64_t Magnitude() const
    {
      return mMagnitude;
    }

    bool IsSafeInteger() const
    {
      return mIsInteger && mMagnitude <= kMaxSafeInteger;
    }

    bool IsFinite() const
    {
      return mIsInteger || std::isfinite(mReal);
    }

    bool IsNegativeZero() const
    {
      return !mIsInteger && mReal == 0.0 && std::signbit(mReal);
    }

    double AsDouble() const
    {
      if (!mIsInteger)
      {
        return mReal;
      }
      double magnitude = static_cast<double>(mMagnitude);
      return mNegative ? -magnitude : magnitude;
    }

    // False when the number is not an integer or does not fit
    bool AsInt64(std::int64_t& out) const
    {
      constexpr std::uint64_t limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
      if (!mIsInteger)
      {
        return false;
      }
      if (mNegative)
      {
        if (mMagnitude > limit + 1)
        {
          return false;
        }
        out = mMagnitude == limit + 1 ? std::numeric_limits<std::int64_t>::min()
                                      : -static_cast<std::int64_t>(mMagnitude);
        return true;
      }
      if (mMagnitude > limit)
      {
        return false;
      }
      out = static_cast<std::int64_t>(mMagnitude);
      return true;
    }

    std::string Text() const
    {
      return mIsInteger ? detail::FormatMagnitude(mNegative, mMagnitude) : detail::FormatDouble(mReal);
    }

  private:
    bool mIsInteger = true;
    bool mNegative = false;
    std::uint64_t mMagnitude = 0;
    double mReal = 0.0;
  };

  // Integers compare exactly; any other pairing compares numerically, so 1 == 1.0
  inline bool operator==(const Number& a, const Number& b)
  {
    if (a.IsInteger() && b.IsInteger())
    {
      return a.IsNegative() == b.IsNegative() && a.Magnitude() == b.Magnitude();
    }
    return a.AsDouble() == b.AsDouble();
  }

  inline bool operator!=(const Number& a, const Number& b)
  {
    return !(a == b);
  }

  struct Value;

  using Array = std::vector<Value>;

  // Insertion-ordered mapping with unique keys
  class Object
  {
  public:
    using Item = std::pair<std::string, Value>;
    using ItemList = std::vector<Item>;

    Object() = default;
    Object(std::initializer_list<Item> items);

    // Replaces the value in place when the key exists, appends otherwise
    Value& Set(std::string key, Value value);

    const Value* Find(std::string_view key) const;
    Value* Find(std::string_view key);
    bool Contains(std::string_view key) const;

    std::size_t Size() const;
    bool Empty() const;

    const ItemList& Items() const
    {
      return mItems;
    }

    ItemList::const_iterator begin() const;
    ItemList::const_iterator end() const;

  private:
    ItemList mItems;
    std::unordered_map<std::string, std::size_t> mIndex; // Key to position in mItems
  };

  struct Value : std::variant<std::nullptr_t, bool, Number, std::string, Array, Object>
  {
    using Base = std::variant<std::nullptr_t, bool, Number, std::string, Array, Object>;

    Value() : Base(std::in_place_type<std::nullptr_t>, nullptr)
    {}
    Value(std::nullptr_t) : Base(std::in_place_type<std::nullptr_t>, nullptr)
    {}
    Value(bool value) : Base(std::in_place_type<bool>, value)
    {}
    Value(int value) : Base(std::in_place_type<Number>, Number::Integer(value))
    {}
    Value(long value) : Base(std::in_place_type<Number>, Number::Integer(value))
    {}
    Value(long long value) : Base(std::in_place_type<Number>, Number::Integer(value))
    {}
    Value(unsigned value) : Base(std::in_place_type<Number>, Number::Unsigned(value))
    {}
    Value(unsigned long value) : Base(std::in_place_type<Number>, Number::Unsigned(value))
    {}
    Value(unsigned long long value) : Base(std::in_place_type<Number>, Number::Unsigned(value))
    {}
    Value(float value) : Base(std::in_place_type<Number>, Number::Real(value))
    {}
    Value(double value) : Base(std::in_place_type<Number>, Number::Real(value))
    {}
    Value(Number value) : Base(std::in_place_type<Number>, value)
    {}
    Value(const char* value) : Base(std::in_place_type<std::string>, value)
    {}
    Value(std::string value) : Base(std::in_place_type<std::string>, std::move(value))
    {}
    Value(std::string_view value) : Base(std::in_place_type<std::string>, value)
    {}
    Value(Array value) : Base(std::in_place_type<Array>, std::move(value))
    {}
    Value(Object value) : Base(std::in_place_type<Object>, std::move(value))
    {}

    bool isNull() const
    {
      return std::holds_alternative<std::nullptr_t>(*this);
    }

    bool isBool() const
    {
      return std::holds_alternative<bool>(*this);
    }

    bool isNumber() const
    {
      return std::holds_alternative<Number>(*this);
    }

    bool isString() const
    {
      return std::holds_alternative<std::string>(*this);
    }

    bool isArray() const
    {
      return std::holds_alternative<Array>(*this);
    }

    bool isObject() const
    {
      return std::holds_alternative<Object>(*this);
    }

    // Null, bool, number or string
    bool isPrimitive() const
    {
      return !isArray() && !isObject();
    }

    bool asBool() const
    {
      return std::get<bool>(*this);
    }

    const Number& asNumber() const
    {
      return std::get<Number>(*this);
    }

    const std::string& asString() const
    {
      return std::get<std::string>(*this);
    }

    const Array& asArray() const
    {
      return std::get<Array>(*this);
    }

    const Object& asObject() const
    {
      return std::get<Object>(*this);
    }

    Array& asArray()
    {
      return std::get<Array>(*this);
    }

    Object& asObject()
    {
      return std::get<Object>(*this);
    }
  };

  inline Object::Object(std::initializer_list<Item> items)
  {
    mItems.reserve(items.size());
    mIndex.reserve(items.size());
    for (const auto& item : items)
    {
      Set(item.first, item.second);
    }
  }

  inline Value& Object::Set(std::string key, Value value)
  {
    auto found = mIndex.find(key);
    if (found != mIndex.end())
    {
      Value& existing = mItems[found->second].second;
      existing = std::move(value);
      return existing;
    }
    mIndex.emplace(key, mItems.size());
    mItems.emplace_back(std::move(key), std::move(value));
    return mItems.back().second;
  }

  inline const Value* Object::Find(std::string_view key) const
  {
    auto found = mIndex.find(std::string(key));
    if (found == mIndex.end())
    {
      return nullptr;
    }
    return &mItems[found->second].second;
  }

  inline Value* Object::Find(std::string_view key)
  {
    auto found = mIndex.find(std::string(key));
    if (found == mIndex.end())
    {
      return nullptr;
    }
    return &mItems[found->second].second;
  }

  inline bool Object::Contains(std::string_view key) const
  {
    return Find(key) != nullptr;
  }

  inline std::size_t Object::Size() const
  {
    return mItems.size();
  }

  inline bool Object::Empty() const
  {
    return mItems.empty();
  }

  inline Object::ItemList::const_iterator Object::begin() const
  {
    return mItems.begin();
  }

  inline Object::ItemList::const_iterator Object::end() const
  {
    return mItems.end();
  }

  inline bool operator==(const Value& a, const Value& b);

  // Order-sensitive: insertion order is part of a mapping's identity
  inline bool operator==(const Object& a, const Object& b)
  {
    return a.Items() == b.Items();
  }

  inline bool operator!=(const Object& a, const Object& b)
  {
    return !(a == b);
  }

  inline bool operator==(const Value& a, const Value& b)
  {
    if (a.index() != b.index())
    {
      return false;
    }
    if (a.isNull())
    {
      return true;
    }
    if (a.isBool())
    {
      return a.asBool() == b.asBool();
    }
    if (a.isNumber())
    {
      return a.asNumber() == b.asNumber();
    }
    if (a.isString())
    {
      return a.asString() == b.asString();
    }
    if (a.isArray())
    {
      return a.asArray() == b.asArray();
    }
    return a.asObject() == b.asObject();
  }

  inline bool operator!=(const Value& a, const Value& b)
  {
    return !(a == b);
  }

  // Total order over values: null < bool < number < string < array < object, then by content.
  // Returns <0, 0 or >0.
  inline int Compare(const Value& a, const Value& b)
  {
    if (a.index() != b.index())
    {
      return a.index() < b.index() ? -1 : 1;
    }
    if (a.isNull())
    {
      return 0;
    }
    if (a.isBool())
    {
      return static_cast<int>(a.asBool()) - static_cast<int>(b.asBool());
    }
    if (a.isNumber())
    {
      const Number& x = a.asNumber();
      const Number& y = b.asNumber();
      if (x.IsInteger() && y.IsInteger())
      {
        if (x.IsNegative() != y.IsNegative())
        {
          return x.IsNegative() ? -1 : 1;
        }
        if (x.Magnitude() == y.Magnitude())
        {
          return 0;
        }
        bool less = x.Magnitude() < y.Magnitude();
        return (less != x.IsNegative()) ? -1 : 1;
      }
      double dx = x.AsDouble();
      double dy = y.AsDouble();
      return dx < dy ? -1 : (dy < dx ? 1 : 0);
    }
    if (a.isString())
    {
      int result = a.asString().compare(b.asString());
      return result < 0 ? -1 : (result > 0 ? 1 : 0);
    }
    if (a.isArray())
    {
      const Array& x = a.asArray();
      const Array& y = b.asArray();
      for (std::size_t index = 0; index < x.size() && index < y.size(); ++index)
      {
        int result = Compare(x[index], y[index]);
        if (result != 0)
        {
          return result;
        }
      }
      return x.size() == y.size() ? 0 : (x.size() < y.size() ? -1 : 1);
    }
    const Object::ItemList& x = a.asObject().Items();
    const Object::ItemList& y = b.asObject().Items();
    for (std::size_t index = 0; index < x.size() && index < y.size(); ++index)
    {
      int result = x[index].first.compare(y[index].first);
      if (result != 0)
      {
        return result < 0 ? -1 : 1;
      }
      result = Compare(x[index].second, y[index].second);
      if (result != 0)
      {
        return result;
      }
    }
    return x.size() == y.size() ? 0 : (x.size() < y.size() ? -1 : 1);
  }

  // ------------------------------------------------------------------------------------------------------------------
  // Native input model
  // ------------------------------------------------------------------------------------------------------------------

  struct Date
  {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
  };

  struct DateTime
  {
    Date date;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    std::uint32_t nanosecond = 0;
    std::optional<int> utcOffsetMinutes; // Absent -> naive local time
  };

  // Arbitrary-precision decimal in its textual form, e.g. "12.50"
  struct Decimal
  {
    std::string text;
  };

  // Arbitrary-precision integer as decimal digits with optional sign
  struct BigInteger
  {
    std::string digits;
  };

  // Anything without a data representation (callables, handles, ...)
  struct Opaque
  {
    std::string typeName;
  };

  struct NativeValue;

  using NativeArray = std::vector<NativeValue>;
  using NativeObject = std::vector<std::pair<std::string, NativeValue>>;
  using NativeRef = std::shared_ptr<NativeValue>;
  using TimePoint = std::chrono::system_clock::time_point;

  struct NativeSet
  {
    std::vector<NativeValue> items;
  };

  struct NativeValue : std::variant<
                         std::nullptr_t,
                         bool,
                         std::int64_t,
                         std::uint64_t,
                         double,
                         std::string,
                         Date,
                         DateTime,
                         TimePoint,
                         Decimal,
                         BigInteger,
                         NativeArray,
                         NativeSet,
                         NativeObject,
                         NativeRef,
                         Opaque,
                         Value>
  {
    using Base = std::variant<
      std::nullptr_t,
      bool,
      std::int64_t,
      std::uint64_t,
      double,
      std::string,
      Date,
      DateTime,
      TimePoint,
      Decimal,
      BigInteger,
      NativeArray,
      NativeSet,
      NativeObject,
      NativeRef,
      Opaque,
      Value>;

    NativeValue() : Base(std::in_place_type<std::nullptr_t>, nullptr)
    {}
    NativeValue(std::nullptr_t) : Base(std::in_place_type<std::nullptr_t>, nullptr)
    {}
    NativeValue(bool value) : Base(std::in_place_type<bool>, value)
    {}
    NativeValue(int value) : Base(std::in_place_type<std::int64_t>, value)
    {}
    NativeValue(long value) : Base(std::in_place_type<std::int64_t>, value)
    {}
    NativeValue(long long value) : Base(std::in_place_type<std::int64_t>, value)
    {}
    NativeValue(unsigned value) : Base(std::in_place_type<std::uint64_t>, value)
    {}
    NativeValue(unsigned long value) : Base(std::in_place_type<std::uint64_t>, value)
    {}
    NativeValue(unsigned long long value) : Base(std::in_place_type<std::uint64_t>, value)
    {}
    NativeValue(float value) : Base(std::in_place_type<double>, value)
    {}
    NativeValue(double value) : Base(std::in_place_type<double>, value)
    {}
    NativeValue(long double value) : Base(std::in_place_type<double>, static_cast<double>(value))
    {}
    NativeValue(const char* value) : Base(std::in_place_type<std::string>, value)
    {}
    NativeValue(std::string value) : Base(std::in_place_type<std::string>, std::move(value))
    {}
    NativeValue(std::string_view value) : Base(std::in_place_type<std::string>, value)
    {}
    NativeValue(Date value) : Base(std::in_place_type<Date>, value)
    {}
    NativeValue(DateTime value) : Base(std::in_place_type<DateTime>, value)
    {}
    NativeValue(TimePoint value) : Base(std::in_place_type<TimePoint>, value)
    {}
    NativeValue(Decimal value) : Base(std::in_place_type<Decimal>, std::move(value))
    {}
    NativeValue(BigInteger value) : Base(std::in_place_type<BigInteger>, std::move(value))
    {}
    NativeValue(NativeArray value) : Base(std::in_place_type<NativeArray>, std::move(value))
    {}
    NativeValue(NativeSet value) : Base(std::in_place_type<NativeSet>, std::move(value))
    {}
    NativeValue(NativeObject value) : Base(std::in_place_type<NativeObject>, std::move(value))
    {}
    NativeValue(NativeRef value) : Base(std::in_place_type<NativeRef>, std::move(value))
    {}
    NativeValue(Opaque value) : Base(std::in_place_type<Opaque>, std::move(value))
    {}
    NativeValue(Value value) : Base(std::in_place_type<Value>, std::move(value))
    {}
  };

  // ------------------------------------------------------------------------------------------------------------------
  // Normalizer
  // ------------------------------------------------------------------------------------------------------------------

  namespace detail
  {
    inline void AppendPadded(std::string& out, long long value, int width)
    {
      char buffer[32];
      std::snprintf(buffer, sizeof(buffer), "%0*lld", width, value);
      out += buffer;
    }

    inline std::string FormatDate(const Date& date)
    {
      std::string out;
      if (date.year < 0)
      {
        out.push_back('-');
      }
      AppendPadded(out, date.year < 0 ? -static_cast<long long>(date.year) : date.year, 4);
      out.push_back('-');
      AppendPadded(out, date.month, 2);
      out.push_back('-');
      AppendPadded(out, date.day, 2);
      return out;
    }

    // ISO-8601 with as much sub-second precision as the source carries
    inline std::string FormatDateTime(const DateTime& dateTime)
    {
      std::string out = FormatDate(dateTime.date);
      out.push_back('T');
      AppendPadded(out, dateTime.hour, 2);
      out.push_back(':');
      AppendPadded(out, dateTime.minute, 2);
      out.push_back(':');
      AppendPadded(out, dateTime.second, 2);
      if (dateTime.nanosecond != 0)
      {
        out.push_back('.');
        if (dateTime.nanosecond % 1000 == 0)
        {
          AppendPadded(out, dateTime.nanosecond / 1000, 6);
        }
        else
        {
          AppendPadded(out, dateTime.nanosecond, 9);
        }
      }
      if (dateTime.utcOffsetMinutes)
      {
        int offset = *dateTime.utcOffsetMinutes;
        out.push_back(offset < 0 ? '-' : '+');
        if (offset < 0)
        {
          offset = -offset;
        }
        AppendPadded(out, offset / 60, 2);
        out.push_back(':');
        AppendPadded(out, offset % 60, 2);
      }
      return out;
    }

    // Days since 1970-01-01 to a proleptic Gregorian civil date
    inline Date CivilFromDays(long long days)
    {
      days += 719468;
      const long long era = (days >= 0 ? days : days - 146096) / 146097;
      const unsigned dayOfEra = static_cast<unsigned>(days - era * 146097);
      const unsigned yearOfEra = (dayOfEra - dayOfEra / 1460 + dayOfEra / 36524 - dayOfEra / 146096) / 365;
      const unsigned dayOfYear = dayOfEra - (365 * yearOfEra + yearOfEra / 4 - yearOfEra / 100);
      const unsigned monthIndex = (5 * dayOfYear + 2) / 153;
      Date date;
      date.day = dayOfYear - (153 * monthIndex + 2) / 5 + 1;
      date.month = monthIndex < 10 ? monthIndex + 3 : monthIndex - 9;
      date.year = static_cast<int>(static_cast<long long>(yearOfEra) + era * 400 + (date.month <= 2 ? 1 : 0));
      return date;
    }

    inline DateTime ToDateTime(TimePoint timePoint)
    {
      using namespace std::chrono;
      constexpr long long nanosPerDay = 86400LL * 1000000000LL;
      long long nanos = duration_cast<nanoseconds>(timePoint.time_since_epoch()).count();
      long long days = nanos / nanosPerDay;
      long long rest = nanos % nanosPerDay;
      if (rest < 0)
      {
        rest += nanosPerDay;
        --days;
      }
      DateTime dateTime;
      dateTime.date = CivilFromDays(days);
      long long seconds = rest / 1000000000LL;
      dateTime.hour = static_cast<unsigned>(seconds / 3600);
      dateTime.minute = static_cast<unsigned>((seconds / 60) % 60);
      dateTime.second = static_cast<unsigned>(seconds % 60);
      dateTime.nanosecond = static_cast<std::uint32_t>(rest % 1000000000LL);
      dateTime.utcOffsetMinutes = 0;
      return dateTime;
    }

    inline Value NormalizeInteger(bool negative, std::uint64_t magnitude)
    {
      Number number = Number::FromParts(negative, magnitude);
      if (!number.IsSafeInteger())
      {
        // Beyond 2^53 - 1 a double consumer would silently round; keep the digits instead
        return number.Text();
      }
      return number;
    }

    inline Value NormalizeDouble(double value)
    {
      if (!std::isfinite(value))
      {
        return nullptr;
      }
      if (value == 0.0)
      {
        return Number::Integer(0);
      }
      return Number::Real(value);
    }

    inline Value NormalizeDecimal(const Decimal& decimal)
    {
      std::string text(decimal.text);
      const char* begin = text.c_str();
      char* endPtr = nullptr;
      double value = std::strtod(begin, &endPtr);
      if (text.empty() || endPtr == begin || *endPtr != '\0')
      {
        return nullptr;
      }
      return NormalizeDouble(value);
    }

    inline Value NormalizeBigInteger(const BigInteger& bigInteger)
    {
      std::string_view digits(bigInteger.digits);
      bool negative = false;
      if (!digits.empty() && (digits.front() == '-' || digits.front() == '+'))
      {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
      }
      if (digits.empty())
      {
        return nullptr;
      }
      for (char c : digits)
      {
        if (c < '0' || c > '9')
        {
          return nullptr;
        }
      }
      while (digits.size() > 1 && digits.front() == '0')
      {
        digits.remove_prefix(1);
      }

      // Anything longer than 16 digits is certainly above 2^53 - 1
      if (digits.size() <= 16)
      {
        std::uint64_t magnitude = 0;
        for (char c : digits)
        {
          magnitude = magnitude * 10 + static_cast<std::uint64_t>(c - '0');
        }
        if (magnitude <= kMaxSafeInteger)
        {
          return Number::FromParts(negative, magnitude);
        }
      }
      std::string out;
      if (negative && digits != "0")
      {
        out.push_back('-');
      }
      out.append(digits.begin(), digits.end());
      return out;
    }

    class Normalizer
    {
    public:
      explicit Normalizer(std::size_t maxDepth) : mMaxDepth(maxDepth)
      {}

      Value Run(const NativeValue& input)
      {
        return NormalizeNative(input, 0);
      }

      Value Run(const Value& input)
      {
        return NormalizeValue(input, 0);
      }

      bool FoundCycle() const
      {
        return mFoundCycle;
      }

      bool TooDeep() const
      {
        return mTooDeep;
      }

    private:
      std::size_t mMaxDepth;
      bool mFoundCycle = false;
      bool mTooDeep = false;
      std::vector<const NativeValue*> mPath; // Referenced values currently being expanded

      Value NormalizeValue(const Value& input, std::size_t depth)
      {
        if (input.isNumber())
        {
          const Number& number = input.asNumber();
          if (number.IsInteger())
          {
            return NormalizeInteger(number.IsNegative(), number.Magnitude());
          }
          return NormalizeDouble(number.AsDouble());
        }
        if (input.isArray())
        {
          if (depth >= mMaxDepth)
          {
            mTooDeep = true;
            return nullptr;
          }
          Array array;
          array.reserve(input.asArray().size());
          for (const auto& item : input.asArray())
          {
            array.push_back(NormalizeValue(item, depth + 1));
          }
          return array;
        }
        if (input.isObject())
        {
          if (depth >= mMaxDepth)
          {
            mTooDeep = true;
            return nullptr;
          }
          Object object;
          for (const auto& [key, value] : input.asObject())
          {
            object.Set(key, NormalizeValue(value, depth + 1));
          }
          return object;
        }
        return input;
      }

      Value NormalizeNative(const NativeValue& input, std::size_t depth)
      {
        if (std::holds_alternative<std::nullptr_t>(input))
        {
          return nullptr;
        }
        if (std::holds_alternative<bool>(input))
        {
          return std::get<bool>(input);
        }
        if (std::holds_alternative<std::int64_t>(input))
        {
          std::int64_t value = std::get<std::int64_t>(input);
          Number number = Number::Integer(value);
          return NormalizeInteger(number.IsNegative(), number.Magnitude());
        }
        if (std::holds_alternative<std::uint64_t>(input))
        {
          return NormalizeInteger(false, std::get<std::uint64_t>(input));
        }
        if (std::holds_alternative<double>(input))
        {
          return NormalizeDouble(std::get<double>(input));
        }
        if (std::holds_alternative<std::string>(input))
        {
          return std::get<std::string>(input);
        }
        if (std::holds_alternative<Date>(input))
        {
          return FormatDate(std::get<Date>(input));
        }
        if (std::holds_alternative<DateTime>(input))
        {
          return FormatDateTime(std::get<DateTime>(input));
        }
        if (std::holds_alternative<TimePoint>(input))
        {
          return FormatDateTime(ToDateTime(std::get<TimePoint>(input)));
        }
        if (std::holds_alternative<Decimal>(input))
        {
          return NormalizeDecimal(std::get<Decimal>(input));
        }
        if (std::holds_alternative<BigInteger>(input))
        {
          return NormalizeBigInteger(std::get<BigInteger>(input));
        }
        if (std::holds_alternative<Value>(input))
        {
          return NormalizeValue(std::get<Value>(input), depth);
        }
        if (std::holds_alternative<Opaque>(input))
        {
          return nullptr;
        }

        // Containers and references from here on
        if (depth >= mMaxDepth)
        {
          mTooDeep = true;
          return nullptr;
        }

        if (std::holds_alternative<NativeArray>(input))
        {
          Array array;
          array.reserve(std::get<NativeArray>(input).size());
          for (const auto& item : std::get<NativeArray>(input))
          {
            array.push_back(NormalizeNative(item, depth + 1));
          }
          return array;
        }
        if (std::holds_alternative<NativeSet>(input))
        {
          Array array;
          array.reserve(std::get<NativeSet>(input).items.size());
          for (const auto& item : std::get<NativeSet>(input).items)
          {
            array.push_back(NormalizeNative(item, depth + 1));
          }
          // Unordered input, deterministic output
          std::stable_sort(
            array.begin(), array.end(), [](const Value& a, const Value& b) { return Compare(a, b) < 0; });
          return array;
        }
        if (std::holds_alternative<NativeObject>(input))
        {
          Object object;
          for (const auto& [key, value] : std::get<NativeObject>(input))
          {
            object.Set(key, NormalizeNative(value, depth + 1));
          }
          return object;
        }

        const NativeRef& reference = std::get<NativeRef>(input);
        if (!reference)
        {
          return nullptr;
        }
        if (std::find(mPath.begin(), mPath.end(), reference.get()) != mPath.end())
        {
          mFoundCycle = true;
          return nullptr;
        }
        mPath.push_back(reference.get());
        Value result = NormalizeNative(*reference, depth + 1);
        mPath.pop_back();
        return result;
      }
    };
  } // namespace detail

  // Maps native input onto the value model. Never fails: anything without a data representation (callables,
  // non-finite floats, cyclic back-references, nesting beyond kDefaultMaxDepth) becomes null.
  inline Value Normalize(const NativeValue& input)
  {
    detail::Normalizer normalizer(kDefaultMaxDepth);
    return normalizer.Run(input);
  }

  inline Value Normalize(const Value& input)
  {
    detail::Normalizer normalizer(kDefaultMaxDepth);
    return normalizer.Run(input);
  }

  // ------------------------------------------------------------------------------------------------------------------
  // Tabular eligibility
  // ------------------------------------------------------------------------------------------------------------------

  // Field order for the tabular form, or nullopt when the array has to use another form. Eligible arrays are
  // non-empty, hold only objects sharing one non-empty key set, and have primitive values throughout. Column order
  // comes from the first element.
  inline std::optional<std::vector<std::string>> TabularFields(const Array& array)
  {
    if (array.empty() || !array.front().isObject() || array.front().asObject().Empty())
    {
      return std::nullopt;
    }

    std::vector<std::string> fields;
    fields.reserve(array.front().asObject().Size());
    for (const auto& item : array.front().asObject())
    {
      fields.push_back(item.first);
    }

    for (const auto& element : array)
    {
      if (!element.isObject())
      {
        return std::nullopt;
      }
      const Object& object = element.asObject();
      if (object.Size() != fields.size())
      {
        return std::nullopt;
      }
      for (const auto& field : fields)
      {
        const Value* value = object.Find(field);
        if (!value || !value->isPrimitive())
        {
          return std::nullopt;
        }
      }
    }
    return fields;
  }

  // ------------------------------------------------------------------------------------------------------------------
  // Encoder
  // ------------------------------------------------------------------------------------------------------------------

  enum class Delimiter : char
  {
    Comma = ',',
    Tab = '\t',
    Pipe = '|',
  };

  struct EncodeOptions
  {
    int indent = 2; // Spaces per indent level; 0 is written as 1
    Delimiter delimiter = Delimiter::Comma;
    bool lengthMarker = false; // Write lengths as [#N]
    std::size_t maxDepth = kDefaultMaxDepth;
  };

  struct EncodeException : std::exception
  {
    Error error;
    explicit EncodeException(Error e) : error(std::move(e))
    {}
    const char* what() const noexcept override
    {
      return error.message.c_str();
    }
  };

  namespace detail
  {
    inline void WriteIndent(std::string& out, int level, int width)
    {
      out.append(static_cast<std::size_t>(level * width), ' ');
    }

    inline bool IsDigit(char c)
    {
      return c >= '0' && c <= '9';
    }

    // -?\d+(\.\d+)?([eE][+-]?\d+)? ; leading zeros included, so "05" also counts
    inline bool IsNumericLike(std::string_view text)
    {
      std::size_t index = 0;
      if (index < text.size() && text[index] == '-')
      {
        ++index;
      }
      std::size_t start = index;
      while (index < text.size() && IsDigit(text[index]))
      {
        ++index;
      }
      if (index == start)
      {
        return false;
      }
      if (index < text.size() && text[index] == '.')
      {
        ++index;
        start = index;
        while (index < text.size() && IsDigit(text[index]))
        {
          ++index;
        }
        if (index == start)
        {
          return false;
        }
      }
      if (index < text.size() && (text[index] == 'e' || text[index] == 'E'))
      {
        ++index;
        if (index < text.size() && (text[index] == '+' || text[index] == '-'))
        {
          ++index;
        }
        start = index;
        while (index < text.size() && IsDigit(text[index]))
        {
          ++index;
        }
        if (index == start)
        {
          return false;
        }
      }
      return index == text.size();
    }

    inline bool IsWhitespace(char c)
    {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    }

    // [A-Za-z_][A-Za-z0-9_.]*
    inline bool IsValidUnquotedKey(std::string_view key)
    {
      if (key.empty())
      {
        return false;
      }
      char c0 = key[0];
      if (!((c0 >= 'A' && c0 <= 'Z') || (c0 >= 'a' && c0 <= 'z') || c0 == '_'))
      {
        return false;
      }
      for (char c : key)
      {
        if (!((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || IsDigit(c) || c == '_' || c == '.'))
        {
          return false;
        }
      }
      return true;
    }

    inline bool IsSafeUnquoted(std::string_view value, char delimiter)
    {
      if (value.empty())
      {
        return false;
      }
      if (IsWhitespace(value.front()) || IsWhitespace(value.back()))
      {
        return false;
      }
      if (value == "null" || value == "true" || value == "false" || IsNumericLike(value))
      {
        return false;
      }
      if (value.front() == '-')
      {
        return false; // Would read as a list item marker or a negative number
      }
      for (char c : value)
      {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F)
        {
          return false;
        }
        switch (c)
        {
          case ':':
          case '[':
          case ']':
          case '{':
          case '}':
          case ',':
          case '"':
          case '\\': return false;
          default: break;
        }
        if (c == delimiter)
        {
          return false;
        }
      }
      return true;
    }

    inline void WriteStringQuoted(std::string_view value, std::string& out)
    {
      out.push_back('"');
      for (char c : value)
      {
        switch (c)
        {
          case '"': out += "\\\""; break;
          case '\\': out += "\\\\"; break;
          case '\n': out += "\\n"; break;
          case '\r': out += "\\r"; break;
          case '\t': out += "\\t"; break;
          default: out.push_back(c); break;
        }
      }
      out.push_back('"');
    }

    inline void WriteString(std::string_view value, char delimiter, std::string& out)
    {
      if (IsSafeUnquoted(value, delimiter))
      {
        out.append(value.begin(), value.end());
      }
      else
      {
        WriteStringQuoted(value, out);
      }
    }

    inline void WriteKey(std::string_view key, std::string& out)
    {
      if (IsValidUnquotedKey(key))
      {
        out.append(key.begin(), key.end());
      }
      else
      {
        WriteStringQuoted(key, out);
      }
    }

    // Fails only on input that did not go through Normalize
    inline ErrorCode WritePrimitive(const Value& value, char delimiter, std::string& out)
    {
      if (value.isNull())
      {
        out += "null";
      }
      else if (value.isBool())
      {
        out += (value.asBool() ? "true" : "false");
      }
      else if (value.isNumber())
      {
        const Number& number = value.asNumber();
        if (!number.IsFinite())
        {
          return ErrorCode::NormalizationError;
        }
        if (number.IsInteger() && !number.IsSafeInteger())
        {
          WriteStringQuoted(number.Text(), out);
        }
        else
        {
          out += number.Text();
        }
      }
      else
      {
        WriteString(value.asString(), delimiter, out);
      }
      return ErrorCode::OK;
    }

    inline bool IsArrayOfPrimitives(const Array& array)
    {
      return std::all_of(array.begin(), array.end(), [](const Value& value) { return value.isPrimitive(); });
    }

    // Depth-first writer driven by an explicit task stack instead of recursion
    class Encoder
    {
    public:
      Encoder(const EncodeOptions& options) :
        mIndent(options.indent == 0 ? 1 : options.indent),
        mDelimiter(static_cast<char>(options.delimiter)),
        mLengthMarker(options.lengthMarker),
        mMaxDepth(options.maxDepth)
      {}

      ErrorCode Run(const Value& value, std::string& out, Error* error)
      {
        mOut.clear();
        mTasks.clear();
        mFirstLine = true;

        ErrorCode errorCode = ErrorCode::OK;
        if (value.isPrimitive())
        {
          errorCode = WritePrimitive(value, mDelimiter, mOut);
        }
        else if (value.isArray())
        {
          errorCode = EmitArray(nullptr, value.asArray(), 0, false, 0);
        }
        else if (!value.asObject().Empty())
        {
          errorCode = Push(TaskKind::ObjectFields, &value.asObject(), nullptr, 0, 0, 0);
        }

        while (errorCode == ErrorCode::OK && !mTasks.empty())
        {
          Task& task = mTasks.back();
          const int depth = task.depth;
          const std::size_t childLevel = task.level + 1;
          if (task.kind == TaskKind::ObjectFields)
          {
            const Object::ItemList& items = task.object->Items();
            if (task.index >= items.size())
            {
              mTasks.pop_back();
              continue;
            }
            const Object::Item& item = items[task.index++];
            errorCode = EmitField(item.first, item.second, depth, false, childLevel);
          }
          else
          {
            const Array& items = *task.array;
            if (task.index >= items.size())
            {
              mTasks.pop_back();
              continue;
            }
            const Value& item = items[task.index++];
            errorCode = EmitListItem(item, depth, childLevel);
          }
        }

        if (errorCode != ErrorCode::OK)
        {
          if (error)
          {
            error->code = errorCode;
            error->where = {};
            error->message = errorCode == ErrorCode::NormalizationError
              ? "Non-finite number reached the encoder; normalize the value first"
              : "Nesting exceeds the configured maximum depth";
          }
          return errorCode;
        }

        out = std::move(mOut);
        if (error)
        {
          *error = {};
        }
        return ErrorCode::OK;
      }

    private:
      enum class TaskKind : std::uint8_t
      {
        ObjectFields,
        ListItems,
      };

      struct Task
      {
        TaskKind kind;
        const Object* object;
        const Array* array;
        std::size_t index;
        int depth;
        std::size_t level; // Container nesting of object or array, the root being 0
      };

      int mIndent;
      char mDelimiter;
      bool mLengthMarker;
      std::size_t mMaxDepth;
      std::string mOut;
      std::vector<Task> mTasks;
      bool mFirstLine = true;

      // Counts containers the same way the normalizer does, so both entry points share one limit
      ErrorCode CheckLevel(std::size_t level) const
      {
        return level >= mMaxDepth ? ErrorCode::DepthExceeded : ErrorCode::OK;
      }

      ErrorCode
      Push(TaskKind kind, const Object* object, const Array* array, std::size_t index, int depth, std::size_t level)
      {
        ErrorCode errorCode = CheckLevel(level);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        mTasks.push_back(Task{kind, object, array, index, depth, level});
        return ErrorCode::OK;
      }

      void BeginLine(int depth)
      {
        if (!mFirstLine)
        {
          mOut.push_back('\n');
        }
        mFirstLine = false;
        WriteIndent(mOut, depth, mIndent);
      }

      void WriteHeader(std::size_t length, const std::vector<std::string>* fields)
      {
        mOut.push_back('[');
        if (mLengthMarker)
        {
          mOut.push_back('#');
        }
        mOut += std::to_string(length);
        if (mDelimiter != ',')
        {
          mOut.push_back(mDelimiter);
        }
        mOut.push_back(']');
        if (fields)
        {
          mOut.push_back('{');
          for (std::size_t index = 0; index < fields->size(); ++index)
          {
            if (index > 0)
            {
              mOut.push_back(mDelimiter);
            }
            WriteKey((*fields)[index], mOut);
          }
          mOut.push_back('}');
        }
        mOut.push_back(':');
      }

      ErrorCode WriteJoined(const Array& values)
      {
        for (std::size_t index = 0; index < values.size(); ++index)
        {
          if (index > 0)
          {
            mOut.push_back(mDelimiter);
          }
          ErrorCode errorCode = WritePrimitive(values[index], mDelimiter, mOut);
          if (errorCode != ErrorCode::OK)
          {
            return errorCode;
          }
        }
        return ErrorCode::OK;
      }

      // key: value | key: (nested fields) | key[N]... ; dashed puts "- " in front and nests objects one level deeper
      ErrorCode EmitField(const std::string& key, const Value& value, int depth, bool dashed, std::size_t level)
      {
        if (value.isArray())
        {
          return EmitArray(&key, value.asArray(), depth, dashed, level);
        }

        BeginLine(depth);
        if (dashed)
        {
          mOut += "- ";
        }
        WriteKey(key, mOut);
        if (value.isObject())
        {
          mOut.push_back(':');
          if (value.asObject().Empty())
          {
            return CheckLevel(level);
          }
          return Push(TaskKind::ObjectFields, &value.asObject(), nullptr, 0, depth + (dashed ? 2 : 1), level);
        }
        mOut += ": ";
        return WritePrimitive(value, mDelimiter, mOut);
      }

      ErrorCode EmitArray(const std::string* key, const Array& array, int depth, bool dashed, std::size_t level)
      {
        ErrorCode errorCode = CheckLevel(level);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        BeginLine(depth);
        if (dashed)
        {
          mOut += "- ";
        }
        if (key)
        {
          WriteKey(*key, mOut);
        }

        if (array.empty())
        {
          WriteHeader(0, nullptr);
          return ErrorCode::OK;
        }

        if (IsArrayOfPrimitives(array))
        {
          WriteHeader(array.size(), nullptr);
          mOut.push_back(' ');
          return WriteJoined(array);
        }

        if (auto fields = TabularFields(array))
        {
          errorCode = CheckLevel(level + 1); // Each row is an object
          if (errorCode != ErrorCode::OK)
          {
            return errorCode;
          }
          WriteHeader(array.size(), &*fields);
          for (const auto& element : array)
          {
            const Object& row = element.asObject();
            BeginLine(depth + 1);
            for (std::size_t index = 0; index < fields->size(); ++index)
            {
              if (index > 0)
              {
                mOut.push_back(mDelimiter);
              }
              errorCode = WritePrimitive(*row.Find((*fields)[index]), mDelimiter, mOut);
              if (errorCode != ErrorCode::OK)
              {
                return errorCode;
              }
            }
          }
          return ErrorCode::OK;
        }

        WriteHeader(array.size(), nullptr);
        // The array is part of the caller's value, so it outlives the task
        return Push(TaskKind::ListItems, nullptr, &array, 0, depth + 1, level);
      }

      ErrorCode EmitListItem(const Value& value, int depth, std::size_t level)
      {
        if (value.isPrimitive())
        {
          BeginLine(depth);
          mOut += "- ";
          return WritePrimitive(value, mDelimiter, mOut);
        }
        if (value.isArray())
        {
          return EmitArray(nullptr, value.asArray(), depth, true, level);
        }

        const Object& object = value.asObject();
        ErrorCode errorCode = CheckLevel(level);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        if (object.Empty())
        {
          BeginLine(depth);
          mOut.push_back('-');
          return ErrorCode::OK;
        }

        // Remaining fields go below the first one, so queue them before anything the first field queues
        if (object.Size() > 1)
        {
          errorCode = Push(TaskKind::ObjectFields, &object, nullptr, 1, depth + 1, level);
          if (errorCode != ErrorCode::OK)
          {
            return errorCode;
          }
        }
        const Object::Item& first = object.Items().front();
        return EmitField(first.first, first.second, depth, true, level + 1);
      }
    };
  } // namespace detail

  namespace detail
  {
    inline ErrorCode CheckOptions(const EncodeOptions& options, Error* error)
    {
      if (options.indent >= 0 && options.maxDepth > 0)
      {
        return ErrorCode::OK;
      }
      if (error)
      {
        error->code = ErrorCode::InvalidOptions;
        error->where = {};
        error->message = options.indent < 0 ? "Indent must not be negative" : "maxDepth must be at least 1";
      }
      return ErrorCode::InvalidOptions;
    }
  } // namespace detail

  inline ErrorCode
  Encode(const Value& value, std::string& out, const EncodeOptions& options = {}, Error* error = nullptr)
  {
    ErrorCode errorCode = detail::CheckOptions(options, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    detail::Encoder encoder(options);
    return encoder.Run(value, out, error);
  }

  // Normalize, then encode. Unlike Normalize, cycles and excessive nesting are reported instead of nulled.
  inline ErrorCode
  EncodeNative(const NativeValue& value, std::string& out, const EncodeOptions& options = {}, Error* error = nullptr)
  {
    ErrorCode errorCode = detail::CheckOptions(options, error);
    if (errorCode != ErrorCode::OK)
    {
      return errorCode;
    }
    detail::Normalizer normalizer(options.maxDepth);
    Value normalized = normalizer.Run(value);
    if (normalizer.FoundCycle() || normalizer.TooDeep())
    {
      errorCode = normalizer.FoundCycle() ? ErrorCode::CyclicReference : ErrorCode::DepthExceeded;
      if (error)
      {
        error->code = errorCode;
        error->where = {};
        error->message = normalizer.FoundCycle() ? "Input refers back to one of its own containers"
                                                 : "Nesting exceeds the configured maximum depth";
      }
      return errorCode;
    }
    return Encode(normalized, out, options, error);
  }

  inline std::string EncodeOrThrow(const Value& value, const EncodeOptions& options = {})
  {
    std::string out;
    Error error;
    ErrorCode errorCode = Encode(value, out, options, &error);
    if (errorCode != ErrorCode::OK)
    {
      throw EncodeException(error);
    }
    return out;
  }

  inline std::string EncodeNativeOrThrow(const NativeValue& value, const EncodeOptions& options = {})
  {
    std::string out;
    Error error;
    ErrorCode errorCode = EncodeNative(value, out, options, &error);
    if (errorCode != ErrorCode::OK)
    {
      throw EncodeException(error);
    }
    return out;
  }

  // ------------------------------------------------------------------------------------------------------------------
  // Decoder
  // ------------------------------------------------------------------------------------------------------------------

  struct DecodeOptions
  {
    int indent = 2; // Spaces per indent level
    bool strict = true;
    std::size_t maxDepth = kDefaultMaxDepth;
  };

  struct DecodeException : std::exception
  {
    Error error;
    explicit DecodeException(Error e) : error(std::move(e))
    {}
    const char* what() const noexcept override
    {
      return error.message.c_str();
    }
  };

  namespace detail
  {
    inline int HexValue(char c)
    {
      if (c >= '0' && c <= '9')
      {
        return c - '0';
      }
      if (c >= 'a' && c <= 'f')
      {
        return 10 + (c - 'a');
      }
      if (c >= 'A' && c <= 'F')
      {
        return 10 + (c - 'A');
      }
      return -1;
    }

    inline void AppendUTF8(std::string& out, std::uint32_t codePoint)
    {
      if (codePoint <= 0x7F)
      {
        out.push_back(static_cast<char>(codePoint));
      }
      else if (codePoint <= 0x7FF)
      {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
      }
      else if (codePoint <= 0xFFFF)
      {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
      }
      else
      {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
      }
    }

    // Rejects overlong forms, surrogates, code points above U+10FFFF and a BOM anywhere but offset 0.
    // On failure `where` holds the line and column of the offending byte.
    inline bool ValidateUTF8(std::string_view text, LocationEntry& where)
    {
      std::size_t index = 0;
      where = {};

      auto bumpColumn = [&](std::uint32_t codePoint) {
        if (codePoint == '\n')
        {
          ++where.line;
          where.column = 1;
        }
        else
        {
          ++where.column;
        }
      };

      while (index < text.size())
      {
        unsigned char c = static_cast<unsigned char>(text[index]);

        if (
          c == 0xEF && index + 2 < text.size() && static_cast<unsigned char>(text[index + 1]) == 0xBB &&
          static_cast<unsigned char>(text[index + 2]) == 0xBF)
        {
          if (index != 0)
          {
            return false;
          }
          index += 3;
          continue;
        }

        if (c <= 0x7F)
        {
          ++index;
          bumpColumn(c);
          continue;
        }

        std::uint32_t codePoint = 0;
        std::size_t length = 0;
        if ((c & 0xE0) == 0xC0)
        {
          length = 2;
          codePoint = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
          length = 3;
          codePoint = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
          length = 4;
          codePoint = c & 0x07;
        }
        else
        {
          return false;
        }

        if (index + length > text.size())
        {
          return false;
        }
        for (std::size_t k = 1; k < length; ++k)
        {
          unsigned char cc = static_cast<unsigned char>(text[index + k]);
          if ((cc & 0xC0) != 0x80)
          {
            return false;
          }
          codePoint = (codePoint << 6) | (cc & 0x3F);
        }

        if (
          (length == 2 && codePoint < 0x80) || (length == 3 && codePoint < 0x800) ||
          (length == 4 && (codePoint < 0x10000 || codePoint > 0x10FFFF)) ||
          (codePoint >= 0xD800 && codePoint <= 0xDFFF))
        {
          return false;
        }

        index += length;
        bumpColumn(codePoint);
      }
      return true;
    }

    inline std::string_view TrimLeft(std::string_view text)
    {
      while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
      {
        text.remove_prefix(1);
      }
      return text;
    }

    inline std::string_view TrimRight(std::string_view text)
    {
      while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
      {
        text.remove_suffix(1);
      }
      return text;
    }

    inline std::string_view Trim(std::string_view text)
    {
      return TrimRight(TrimLeft(text));
    }

    // Index of the quote closing the string opened at `open`, honoring backslash escapes
    inline std::size_t FindClosingQuote(std::string_view text, std::size_t open)
    {
      std::size_t index = open + 1;
      while (index < text.size())
      {
        if (text[index] == '\\' && index + 1 < text.size())
        {
          index += 2;
          continue;
        }
        if (text[index] == '"')
        {
          return index;
        }
        ++index;
      }
      return std::string_view::npos;
    }

    inline std::size_t FindUnquoted(std::string_view text, char target, std::size_t start = 0)
    {
      bool inQuotes = false;
      for (std::size_t index = start; index < text.size(); ++index)
      {
        char c = text[index];
        if (inQuotes)
        {
          if (c == '\\')
          {
            ++index;
          }
          else if (c == '"')
          {
            inQuotes = false;
          }
          continue;
        }
        if (c == '"')
        {
          inQuotes = true;
        }
        else if (c == target)
        {
          return index;
        }
      }
      return std::string_view::npos;
    }

    // Splits on the delimiter outside of quotes; cells are returned untrimmed
    inline std::vector<std::string_view> SplitDelimited(std::string_view text, char delimiter)
    {
      std::vector<std::string_view> cells;
      std::size_t start = 0;
      bool inQuotes = false;
      for (std::size_t index = 0; index < text.size(); ++index)
      {
        char c = text[index];
        if (inQuotes)
        {
          if (c == '\\')
          {
            ++index;
          }
          else if (c == '"')
          {
            inQuotes = false;
          }
          continue;
        }
        if (c == '"')
        {
          inQuotes = true;
        }
        else if (c == delimiter)
        {
          cells.push_back(text.substr(start, index - start));
          start = index + 1;
        }
      }
      cells.push_back(text.substr(start));
      return cells;
    }

    // True when the body splits into exactly `expected` cells on some delimiter other than the declared one
    inline bool SplitsOnOtherDelimiter(std::string_view body, char declared, std::size_t expected)
    {
      if (expected < 2)
      {
        return false;
      }
      for (char candidate : {',', '\t', '|'})
      {
        if (candidate != declared && SplitDelimited(body, candidate).size() == expected)
        {
          return true;
        }
      }
      return false;
    }

    inline bool IsListItem(std::string_view content)
    {
      return content == "-" || (content.size() >= 2 && content[0] == '-' && content[1] == ' ');
    }

    inline bool IsKeyValueLine(std::string_view content)
    {
      return FindUnquoted(content, ':') != std::string_view::npos;
    }

    // A row has its first unquoted delimiter before any unquoted colon, or no unquoted colon at all
    inline bool IsDataRow(std::string_view content, char delimiter)
    {
      if (IsListItem(content))
      {
        return false;
      }
      std::size_t colon = FindUnquoted(content, ':');
      if (colon == std::string_view::npos)
      {
        return true;
      }
      // `key[N...]{...}:` is an array header even when its brackets or braces hold the delimiter. Cells never carry
      // an unquoted '['.
      std::size_t bracket = FindUnquoted(content, '[');
      if (bracket != std::string_view::npos && bracket < colon)
      {
        return false;
      }
      std::size_t split = FindUnquoted(content, delimiter);
      return split != std::string_view::npos && split < colon;
    }

    // -?(0|[1-9]\d*)(\.\d+)?([eE][+-]?\d+)?
    inline bool ParseNumber(std::string_view text, Number& out)
    {
      std::size_t index = 0;
      bool negative = false;
      if (index < text.size() && text[index] == '-')
      {
        negative = true;
        ++index;
      }
      if (index >= text.size() || !IsDigit(text[index]))
      {
        return false;
      }
      const std::size_t digitsBegin = index;
      if (text[index] == '0')
      {
        ++index;
        if (index < text.size() && IsDigit(text[index]))
        {
          return false; // Leading zeros make it a string
        }
      }
      else
      {
        while (index < text.size() && IsDigit(text[index]))
        {
          ++index;
        }
      }
      const std::size_t digitsEnd = index;

      bool isInteger = true;
      if (index < text.size() && text[index] == '.')
      {
        isInteger = false;
        ++index;
        if (index >= text.size() || !IsDigit(text[index]))
        {
          return false;
        }
        while (index < text.size() && IsDigit(text[index]))
        {
          ++index;
        }
      }
      if (index < text.size() && (text[index] == 'e' || text[index] == 'E'))
      {
        isInteger = false;
        ++index;
        if (index < text.size() && (text[index] == '+' || text[index] == '-'))
        {
          ++index;
        }
        if (index >= text.size() || !IsDigit(text[index]))
        {
          return false;
        }
        while (index < text.size() && IsDigit(text[index]))
        {
          ++index;
        }
      }
      if (index != text.size())
      {
        return false;
      }

      if (isInteger)
      {
        std::uint64_t magnitude = 0;
        bool overflow = false;
        for (std::size_t k = digitsBegin; k < digitsEnd; ++k)
        {
          std::uint64_t digit = static_cast<std::uint64_t>(text[k] - '0');
          if (magnitude > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
          {
            overflow = true;
            break;
          }
          magnitude = magnitude * 10 + digit;
        }
        if (!overflow)
        {
          out = Number::FromParts(negative, magnitude);
          if (magnitude > kMaxSafeInteger)
          {
            // Digits the encoder writes for a large double read back as that double
            double value = std::strtod(std::string(text).c_str(), nullptr);
            if (std::isfinite(value) && FormatDouble(value) == text)
            {
              out = Number::Real(value);
            }
          }
          return true;
        }
      }

      std::string buffer(text);
      double value = std::strtod(buffer.c_str(), nullptr);
      if (!std::isfinite(value))
      {
        return false;
      }
      out = Number::Real(value);
      return true;
    }

    struct ArrayHeader
    {
      std::optional<std::string> key;
      std::size_t length = 0;
      char delimiter = ',';
      bool hasLengthMarker = false;
      bool hasFields = false;
      std::vector<std::string> fields;
      std::string_view rest; // Inline values after the colon, trimmed
    };
  } // namespace detail

  class Decoder
  {
  public:
    explicit Decoder(std::string_view src) : mSrc(src)
    {}

    ErrorCode Decode(Value& out, const DecodeOptions& options = {}, Error* error = nullptr)
    {
      // Reset previous state for a fresh decode
      mOptions = options;
      mError = {};
      mLines.clear();
      mBlankLines.clear();
      mFrames.clear();
      mCursor = 0;
      mLastConsumed = 0;
      mResult = nullptr;

      ErrorCode errorCode = DecodeDocument();
      if (errorCode != ErrorCode::OK)
      {
        mFrames.clear();
        if (error)
        {
          *error = mError;
        }
        return errorCode;
      }

      out = std::move(mResult);
      if (error)
      {
        *error = {};
      }
      return ErrorCode::OK;
    }

    const Error& LastError() const
    {
      return mError;
    }

  protected:
    struct Line
    {
      std::string_view content; // Without indentation and trailing whitespace
      int depth;
      std::size_t number;
      std::size_t column; // Where content starts
    };

    enum class FrameKind : std::uint8_t
    {
      Object,
      ListArray,
      ListItemObject,
    };

    struct Frame
    {
      FrameKind kind;
      std::string key;
      Value value;
      int baseDepth = 0; // Object: shallowest depth that still belongs to it
      int depth = -1;    // Depth of the lines this frame consumes; -1 until the first one is seen
      std::size_t declared = 0;
      const Line* header = nullptr;
      std::size_t firstLine = 0;
    };

    std::string_view mSrc;
    DecodeOptions mOptions;
    std::vector<Line> mLines;
    std::vector<std::size_t> mBlankLines; // Ascending line numbers
    std::size_t mCursor = 0;
    std::size_t mLastConsumed = 0;
    std::vector<Frame> mFrames;
    Value mResult;
    Error mError;

    ErrorCode Fail(ErrorCode code, std::size_t line, std::size_t column, std::string message)
    {
      mError.code = code;
      mError.where = {line, column};
      mError.message = std::move(message);
      return code;
    }

    ErrorCode Fail(ErrorCode code, const Line& line, std::string message)
    {
      return Fail(code, line.number, line.column, std::move(message));
    }

    const Line* Peek() const
    {
      return mCursor < mLines.size() ? &mLines[mCursor] : nullptr;
    }

    void Advance()
    {
      mLastConsumed = mLines[mCursor].number;
      ++mCursor;
    }

    ErrorCode DecodeDocument()
    {
      if (mOptions.indent < 1)
      {
        return Fail(ErrorCode::InvalidOptions, 1, 1, "Indent must be at least 1");
      }
      if (mOptions.maxDepth == 0)
      {
        return Fail(ErrorCode::InvalidOptions, 1, 1, "maxDepth must be at least 1");
      }

      // Validate UTF-8 up front (strips leading BOM)
      LocationEntry bad;
      if (!detail::ValidateUTF8(mSrc, bad))
      {
        return Fail(ErrorCode::InvalidUtf8, bad.line, bad.column, "Invalid UTF-8 encoding");
      }
      std::string_view text = mSrc;
      if (
        text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
      {
        text.remove_prefix(3);
      }

      ErrorCode errorCode = Scan(text);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      if (mLines.empty())
      {
        // Empty document -> empty object
        mResult = Object();
        return ErrorCode::OK;
      }

      errorCode = DecodeRoot();
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      if (const Line* line = Peek())
      {
        return Fail(ErrorCode::SyntaxError, *line, "Unexpected content at this indentation");
      }
      return ErrorCode::OK;
    }

    ErrorCode Scan(std::string_view text)
    {
      const std::size_t indent = static_cast<std::size_t>(mOptions.indent);
      std::size_t number = 0;
      std::size_t pos = 0;
      while (true)
      {
        std::size_t end = text.find('\n', pos);
        if (end == std::string_view::npos)
        {
          end = text.size();
        }
        std::string_view raw = text.substr(pos, end - pos);
        ++number;
        if (!raw.empty() && raw.back() == '\r')
        {
          raw.remove_suffix(1);
        }

        std::size_t index = 0;
        std::size_t columns = 0;
        bool sawTab = false;
        while (index < raw.size() && (raw[index] == ' ' || raw[index] == '\t'))
        {
          if (raw[index] == '\t')
          {
            sawTab = true;
            columns += indent;
          }
          else
          {
            ++columns;
          }
          ++index;
        }

        std::string_view content = detail::TrimRight(raw.substr(index));
        if (content.empty())
        {
          mBlankLines.push_back(number);
        }
        else
        {
          if (mOptions.strict && sawTab)
          {
            return Fail(ErrorCode::IndentationError, number, index + 1, "Tabs are not allowed in indentation");
          }
          if (mOptions.strict && columns % indent != 0)
          {
            return Fail(
              ErrorCode::IndentationError,
              number,
              index + 1,
              "Indentation of " + std::to_string(columns) + " spaces is not a multiple of " +
                std::to_string(indent));
          }
          mLines.push_back(Line{content, static_cast<int>(columns / indent), number, index + 1});
        }

        if (end >= text.size())
        {
          break;
        }
        pos = end + 1;
      }
      return ErrorCode::OK;
    }

    ErrorCode DecodeRoot()
    {
      const Line& first = mLines.front();
      detail::ArrayHeader header;
      bool isHeader = false;
      ErrorCode errorCode = ParseArrayHeader(first, first.content, header, isHeader);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }

      if (isHeader && !header.key)
      {
        Advance();
        errorCode = DecodeArray(std::string(), header, first, first.depth);
      }
      else if (!isHeader && mLines.size() == 1 && !detail::IsKeyValueLine(first.content))
      {
        Advance();
        Value value;
        errorCode = ParsePrimitive(first.content, first, value);
        if (errorCode == ErrorCode::OK)
        {
          errorCode = Emit(std::string(), std::move(value));
        }
      }
      else
      {
        errorCode = PushFrame(FrameKind::Object, std::string(), Object(), 0, -1, 0, first);
      }
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      return Run();
    }

    ErrorCode PushFrame(
      FrameKind kind,
      std::string key,
      Value value,
      int baseDepth,
      int depth,
      std::size_t declared,
      const Line& line)
    {
      if (mFrames.size() >= mOptions.maxDepth)
      {
        return Fail(ErrorCode::DepthExceeded, line, "Nesting exceeds the configured maximum depth");
      }
      Frame frame;
      frame.kind = kind;
      frame.key = std::move(key);
      frame.value = std::move(value);
      frame.baseDepth = baseDepth;
      frame.depth = depth;
      frame.declared = declared;
      frame.header = &line;
      mFrames.push_back(std::move(frame));
      return ErrorCode::OK;
    }

    // Hands a finished value to the innermost open container, or makes it the result
    ErrorCode Emit(std::string key, Value value)
    {
      if (mFrames.empty())
      {
        mResult = std::move(value);
        return ErrorCode::OK;
      }
      Frame& parent = mFrames.back();
      if (parent.kind == FrameKind::ListArray)
      {
        parent.value.asArray().push_back(std::move(value));
      }
      else
      {
        parent.value.asObject().Set(std::move(key), std::move(value));
      }
      return ErrorCode::OK;
    }

    ErrorCode Close()
    {
      Frame frame = std::move(mFrames.back());
      mFrames.pop_back();
      if (frame.kind == FrameKind::ListArray)
      {
        ErrorCode errorCode = FinishListArray(frame);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
      }
      return Emit(std::move(frame.key), std::move(frame.value));
    }

    ErrorCode Run()
    {
      while (!mFrames.empty())
      {
        Frame& frame = mFrames.back();
        const Line* line = Peek();
        ErrorCode errorCode = ErrorCode::OK;

        switch (frame.kind)
        {
          case FrameKind::Object:
          {
            if (!line || line->depth < frame.baseDepth)
            {
              errorCode = Close();
              break;
            }
            if (frame.depth < 0)
            {
              frame.depth = line->depth;
            }
            if (line->depth != frame.depth)
            {
              errorCode = Close();
              break;
            }
            if (detail::IsListItem(line->content))
            {
              return Fail(ErrorCode::SyntaxError, *line, "List item outside of an array");
            }
            Advance();
            errorCode = DecodeField(*line, line->content, line->depth, line->depth);
            break;
          }
          case FrameKind::ListItemObject:
          {
            if (!line || line->depth != frame.depth || detail::IsListItem(line->content))
            {
              errorCode = Close();
              break;
            }
            Advance();
            errorCode = DecodeField(*line, line->content, line->depth, line->depth);
            break;
          }
          case FrameKind::ListArray:
          {
            if (
              frame.value.asArray().size() >= frame.declared || !line || line->depth != frame.depth ||
              !detail::IsListItem(line->content))
            {
              errorCode = Close();
              break;
            }
            if (frame.firstLine == 0)
            {
              frame.firstLine = line->number;
            }
            Advance();
            errorCode = DecodeListItem(*line);
            break;
          }
        }

        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
      }
      return ErrorCode::OK;
    }

    ErrorCode CheckBlankLines(std::size_t firstLine, std::size_t lastLine)
    {
      if (!mOptions.strict || firstLine == 0)
      {
        return ErrorCode::OK;
      }
      auto blank = std::upper_bound(mBlankLines.begin(), mBlankLines.end(), firstLine);
      if (blank != mBlankLines.end() && *blank < lastLine)
      {
        return Fail(ErrorCode::BlankLineInArray, *blank, 1, "Blank lines are not allowed inside arrays");
      }
      return ErrorCode::OK;
    }

    ErrorCode FinishListArray(const Frame& frame)
    {
      const std::size_t count = frame.value.asArray().size();
      const Line* next = Peek();
      auto isSiblingItem = [&](const Line* line) {
        return line && line->depth == frame.depth && detail::IsListItem(line->content);
      };

      if (!mOptions.strict)
      {
        // Skip surplus items together with everything nested below them
        while (isSiblingItem(next))
        {
          Advance();
          while ((next = Peek()) && next->depth > frame.depth)
          {
            Advance();
          }
        }
        return ErrorCode::OK;
      }

      if (count < frame.declared)
      {
        return Fail(
          ErrorCode::ArrayLengthMismatch,
          *frame.header,
          "Expected " + std::to_string(frame.declared) + " list items, but got " + std::to_string(count));
      }
      if (isSiblingItem(next))
      {
        return Fail(
          ErrorCode::ArrayLengthMismatch,
          *next,
          "Expected " + std::to_string(frame.declared) + " list items, but found more");
      }
      return CheckBlankLines(frame.firstLine, mLastConsumed);
    }

    // One `key: ...` line. A list item's first field passes its item depth as arrayBaseDepth (rows and items nest
    // one level below the dash) and the sibling field depth as objectBaseDepth.
    ErrorCode DecodeField(const Line& line, std::string_view content, int arrayBaseDepth, int objectBaseDepth)
    {
      detail::ArrayHeader header;
      bool isHeader = false;
      ErrorCode errorCode = ParseArrayHeader(line, content, header, isHeader);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      if (isHeader)
      {
        if (!header.key)
        {
          return Fail(ErrorCode::SyntaxError, line, "Array header is missing its key");
        }
        std::string key = std::move(*header.key);
        return DecodeArray(std::move(key), header, line, arrayBaseDepth);
      }

      std::string key;
      std::string_view rest;
      errorCode = ParseKey(line, content, key, rest);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      rest = detail::Trim(rest);
      if (rest.empty())
      {
        const Line* next = Peek();
        if (next && next->depth > objectBaseDepth)
        {
          return PushFrame(FrameKind::Object, std::move(key), Object(), objectBaseDepth + 1, -1, 0, line);
        }
        return Emit(std::move(key), Object());
      }

      Value value;
      errorCode = ParsePrimitive(rest, line, value);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      return Emit(std::move(key), std::move(value));
    }

    ErrorCode DecodeListItem(const Line& line)
    {
      const int itemDepth = line.depth;
      if (line.content == "-")
      {
        return Emit(std::string(), Object());
      }
      std::string_view after = detail::TrimLeft(line.content.substr(2));
      if (after.empty())
      {
        return Emit(std::string(), Object());
      }

      detail::ArrayHeader header;
      bool isHeader = false;
      ErrorCode errorCode = ParseArrayHeader(line, after, header, isHeader);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      if (isHeader && !header.key)
      {
        return DecodeArray(std::string(), header, line, itemDepth);
      }

      if (isHeader || detail::IsKeyValueLine(after))
      {
        errorCode =
          PushFrame(FrameKind::ListItemObject, std::string(), Object(), itemDepth + 1, itemDepth + 1, 0, line);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        return DecodeField(line, after, itemDepth, itemDepth + 1);
      }

      Value value;
      errorCode = ParsePrimitive(after, line, value);
      if (errorCode != ErrorCode::OK)
      {
        return errorCode;
      }
      return Emit(std::string(), std::move(value));
    }

    ErrorCode DecodeArray(std::string key, const detail::ArrayHeader& header, const Line& line, int baseDepth)
    {
      if (!header.rest.empty())
      {
        if (header.hasFields)
        {
          return Fail(ErrorCode::SyntaxError, line, "Tabular header cannot be followed by inline values");
        }
        return DecodeInline(std::move(key), header, line);
      }
      if (header.hasFields)
      {
        return DecodeTabular(std::move(key), header, line, baseDepth);
      }
      return PushFrame(
        FrameKind::ListArray, std::move(key), Array(), baseDepth + 1, baseDepth + 1, header.length, line);
    }

    ErrorCode DecodeInline(std::string key, const detail::ArrayHeader& header, const Line& line)
    {
      std::vector<std::string_view> cells = detail::SplitDelimited(header.rest, header.delimiter);
      if (mOptions.strict && cells.size() != header.length)
      {
        if (detail::SplitsOnOtherDelimiter(header.rest, header.delimiter, header.length))
        {
          return Fail(
            ErrorCode::DelimiterMismatch, line, "Values are separated by a different delimiter than the header");
        }
        return Fail(
          ErrorCode::ArrayLengthMismatch,
          line,
          "Expected " + std::to_string(header.length) + " values, but got " + std::to_string(cells.size()));
      }

      const std::size_t count = std::min(cells.size(), header.length);
      Array array;
      array.reserve(count);
      for (std::size_t index = 0; index < count; ++index)
      {
        Value value;
        ErrorCode errorCode = ParsePrimitive(cells[index], line, value);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        array.push_back(std::move(value));
      }
      return Emit(std::move(key), std::move(array));
    }

    ErrorCode DecodeTabular(std::string key, const detail::ArrayHeader& header, const Line& line, int baseDepth)
    {
      const int rowDepth = baseDepth + 1;
      const std::size_t width = header.fields.size();
      Array rows;
      std::size_t firstRow = 0;
      std::size_t lastRow = 0;

      const Line* next = Peek();
      while (rows.size() < header.length && next && next->depth == rowDepth &&
             detail::IsDataRow(next->content, header.delimiter))
      {
        const Line& row = *next;
        Advance();
        if (firstRow == 0)
        {
          firstRow = row.number;
        }
        lastRow = row.number;

        std::vector<std::string_view> cells = detail::SplitDelimited(row.content, header.delimiter);
        if (mOptions.strict && cells.size() != width)
        {
          if (detail::SplitsOnOtherDelimiter(row.content, header.delimiter, width))
          {
            return Fail(
              ErrorCode::DelimiterMismatch, row, "Row is separated by a different delimiter than the header");
          }
          return Fail(
            ErrorCode::TabularRowArity,
            row,
            "Expected " + std::to_string(width) + " values in row, but got " + std::to_string(cells.size()));
        }

        Object object;
        for (std::size_t index = 0; index < width && index < cells.size(); ++index)
        {
          Value value;
          ErrorCode errorCode = ParsePrimitive(cells[index], row, value);
          if (errorCode != ErrorCode::OK)
          {
            return errorCode;
          }
          object.Set(header.fields[index], std::move(value));
        }
        rows.push_back(std::move(object));
        next = Peek();
      }

      auto isRow = [&](const Line* candidate) {
        return candidate && candidate->depth == rowDepth && detail::IsDataRow(candidate->content, header.delimiter);
      };

      if (mOptions.strict)
      {
        if (rows.size() < header.length)
        {
          return Fail(
            ErrorCode::ArrayLengthMismatch,
            line,
            "Expected " + std::to_string(header.length) + " rows, but got " + std::to_string(rows.size()));
        }
        if (isRow(next))
        {
          return Fail(
            ErrorCode::ArrayLengthMismatch,
            *next,
            "Expected " + std::to_string(header.length) + " rows, but found more");
        }
        ErrorCode errorCode = CheckBlankLines(firstRow, lastRow);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
      }
      else
      {
        while (isRow(next))
        {
          Advance();
          next = Peek();
        }
      }
      return Emit(std::move(key), std::move(rows));
    }

    // Tells array headers apart from ordinary lines. isHeader stays false for anything that is not shaped like
    // `[key][...]...:`; once a key is followed by '[' the rest must be a well-formed header.
    ErrorCode
    ParseArrayHeader(const Line& line, std::string_view content, detail::ArrayHeader& out, bool& isHeader)
    {
      isHeader = false;
      if (content.empty() || !detail::IsKeyValueLine(content))
      {
        return ErrorCode::OK;
      }

      std::optional<std::string> key;
      std::size_t pos = 0;
      if (content.front() == '"')
      {
        std::size_t closing = detail::FindClosingQuote(content, 0);
        if (closing == std::string_view::npos || closing + 1 >= content.size() || content[closing + 1] != '[')
        {
          return ErrorCode::OK;
        }
        std::string unescaped;
        ErrorCode errorCode = Unescape(content.substr(1, closing - 1), line, unescaped);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        key = std::move(unescaped);
        pos = closing + 1;
      }
      else
      {
        std::size_t bracket = content.find('[');
        if (bracket == std::string_view::npos)
        {
          return ErrorCode::OK;
        }
        std::size_t colon = content.find(':');
        if (colon < bracket)
        {
          return ErrorCode::OK;
        }
        std::string_view prefix = content.substr(0, bracket);
        if (prefix.find('"') != std::string_view::npos)
        {
          return ErrorCode::OK;
        }
        prefix = detail::Trim(prefix);
        if (!prefix.empty())
        {
          key = std::string(prefix);
        }
        pos = bracket;
      }

      isHeader = true;
      std::size_t close = content.find(']', pos);
      if (close == std::string_view::npos)
      {
        return Fail(ErrorCode::SyntaxError, line, "Malformed array header: missing ']'");
      }

      std::string_view segment = content.substr(pos + 1, close - pos - 1);
      out.hasLengthMarker = false;
      if (!segment.empty() && segment.front() == '#')
      {
        out.hasLengthMarker = true;
        segment.remove_prefix(1);
      }
      out.delimiter = ',';
      if (!segment.empty() && (segment.back() == ',' || segment.back() == '\t' || segment.back() == '|'))
      {
        out.delimiter = segment.back();
        segment.remove_suffix(1);
      }
      if (segment.empty())
      {
        return Fail(ErrorCode::SyntaxError, line, "Malformed array header: missing length");
      }
      std::size_t length = 0;
      for (char c : segment)
      {
        if (!detail::IsDigit(c))
        {
          return Fail(ErrorCode::SyntaxError, line, "Malformed array header: invalid length");
        }
        std::size_t digit = static_cast<std::size_t>(c - '0');
        if (length > (std::numeric_limits<std::size_t>::max() - digit) / 10)
        {
          return Fail(ErrorCode::SyntaxError, line, "Array length is too large");
        }
        length = length * 10 + digit;
      }
      out.length = length;

      std::size_t p = close + 1;
      out.hasFields = false;
      out.fields.clear();
      if (p < content.size() && content[p] == '{')
      {
        std::size_t brace = detail::FindUnquoted(content, '}', p + 1);
        if (brace == std::string_view::npos)
        {
          return Fail(ErrorCode::SyntaxError, line, "Malformed array header: missing '}'");
        }
        for (std::string_view cell : detail::SplitDelimited(content.substr(p + 1, brace - p - 1), out.delimiter))
        {
          cell = detail::Trim(cell);
          if (cell.empty())
          {
            return Fail(ErrorCode::SyntaxError, line, "Tabular header has an empty field name");
          }
          std::string field;
          if (cell.front() == '"')
          {
            ErrorCode errorCode = ParseQuoted(cell, line, field);
            if (errorCode != ErrorCode::OK)
            {
              return errorCode;
            }
          }
          else
          {
            field = std::string(cell);
          }
          out.fields.push_back(std::move(field));
        }
        out.hasFields = true;
        p = brace + 1;
      }

      if (p >= content.size() || content[p] != ':')
      {
        return Fail(ErrorCode::SyntaxError, line, "Malformed array header: expected ':'");
      }
      out.rest = detail::Trim(content.substr(p + 1));
      out.key = std::move(key);
      return ErrorCode::OK;
    }

    ErrorCode ParseKey(const Line& line, std::string_view content, std::string& key, std::string_view& rest)
    {
      if (!content.empty() && content.front() == '"')
      {
        std::size_t closing = detail::FindClosingQuote(content, 0);
        if (closing == std::string_view::npos)
        {
          return Fail(ErrorCode::UnterminatedString, line, "Unterminated quoted key");
        }
        ErrorCode errorCode = Unescape(content.substr(1, closing - 1), line, key);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        if (closing + 1 >= content.size() || content[closing + 1] != ':')
        {
          return Fail(ErrorCode::SyntaxError, line, "Expected ':' after key");
        }
        rest = content.substr(closing + 2);
        return ErrorCode::OK;
      }

      std::size_t colon = content.find(':');
      if (colon == std::string_view::npos)
      {
        return Fail(ErrorCode::SyntaxError, line, "Expected ':' after key");
      }
      std::string_view name = detail::Trim(content.substr(0, colon));
      if (name.empty())
      {
        return Fail(ErrorCode::SyntaxError, line, "Missing key before ':'");
      }
      key = std::string(name);
      rest = content.substr(colon + 1);
      return ErrorCode::OK;
    }

    ErrorCode ParsePrimitive(std::string_view token, const Line& line, Value& out)
    {
      std::string_view text = detail::Trim(token);
      if (text.empty())
      {
        out = std::string();
        return ErrorCode::OK;
      }
      if (text.front() == '"')
      {
        std::string value;
        ErrorCode errorCode = ParseQuoted(text, line, value);
        if (errorCode != ErrorCode::OK)
        {
          return errorCode;
        }
        out = std::move(value);
        return ErrorCode::OK;
      }
      if (text == "null")
      {
        out = nullptr;
      }
      else if (text == "true")
      {
        out = true;
      }
      else if (text == "false")
      {
        out = false;
      }
      else
      {
        Number number;
        if (detail::ParseNumber(text, number))
        {
          out = number;
        }
        else
        {
          out = std::string(text);
        }
      }
      return ErrorCode::OK;
    }

    // text starts with '"' and must end with the matching quote
    ErrorCode ParseQuoted(std::string_view text, const Line& line, std::string& out)
    {
      std::size_t closing = detail::FindClosingQuote(text, 0);
      if (closing == std::string_view::npos)
      {
        return Fail(ErrorCode::UnterminatedString, line, "Unterminated string");
      }
      if (closing + 1 != text.size())
      {
        return Fail(ErrorCode::SyntaxError, line, "Unexpected characters after closing quote");
      }
      return Unescape(text.substr(1, closing - 1), line, out);
    }

    static bool ReadHex4(std::string_view text, std::size_t start, std::uint32_t& codePoint)
    {
      if (start + 4 > text.size())
      {
        return false;
      }
      codePoint = 0;
      for (std::size_t index = start; index < start + 4; ++index)
      {
        int hexValue = detail::HexValue(text[index]);
        if (hexValue < 0)
        {
          return false;
        }
        codePoint = (codePoint << 4) | static_cast<std::uint32_t>(hexValue);
      }
      return true;
    }

    ErrorCode Unescape(std::string_view text, const Line& line, std::string& out)
    {
      out.clear();
      out.reserve(text.size());
      for (std::size_t index = 0; index < text.size(); ++index)
      {
        char c = text[index];
        if (c != '\\')
        {
          out.push_back(c);
          continue;
        }
        if (index + 1 >= text.size())
        {
          return Fail(ErrorCode::InvalidEscape, line, "Dangling backslash in string");
        }
        char escaped = text[++index];
        switch (escaped)
        {
          case '\\': out.push_back('\\'); break;
          case '"': out.push_back('"'); break;
          case 'n': out.push_back('\n'); break;
          case 'r': out.push_back('\r'); break;
          case 't': out.push_back('\t'); break;
          case 'u':
          {
            // Unicode escape \uXXXX with optional surrogate pair
            std::uint32_t codePoint = 0;
            if (!ReadHex4(text, index + 1, codePoint))
            {
              return Fail(ErrorCode::InvalidEscape, line, "Invalid unicode escape");
            }
            index += 4;
            if (codePoint >= 0xD800 && codePoint <= 0xDBFF)
            {
              std::uint32_t lowSurrogate = 0;
              if (
                index + 2 >= text.size() || text[index + 1] != '\\' || text[index + 2] != 'u' ||
                !ReadHex4(text, index + 3, lowSurrogate))
              {
                return Fail(ErrorCode::InvalidEscape, line, "Unpaired surrogate");
              }
              if (lowSurrogate < 0xDC00 || lowSurrogate > 0xDFFF)
              {
                return Fail(ErrorCode::InvalidEscape, line, "Invalid low surrogate");
              }
              index += 6;
              codePoint = 0x10000 + (((codePoint - 0xD800) << 10) | (lowSurrogate - 0xDC00));
            }
            else if (codePoint >= 0xDC00 && codePoint <= 0xDFFF)
            {
              return Fail(ErrorCode::InvalidEscape, line, "Unpaired surrogate");
            }
            detail::AppendUTF8(out, codePoint);
            break;
          }
          default: return Fail(ErrorCode::InvalidEscape, line, std::string("Invalid escape '\\") + escaped + "'");
        }
      }
      return ErrorCode::OK;
    }
  };

  inline ErrorCode
  Decode(std::string_view src, Value& out, const DecodeOptions& options = {}, Error* error = nullptr)
  {
    Decoder decoder(src);
    return decoder.Decode(out, options, error);
  }

  inline Value DecodeOrThrow(std::string_view src, const DecodeOptions& options = {})
  {
    Value value;
    Error error;
    ErrorCode errorCode = Decode(src, value, options, &error);
    if (errorCode != ErrorCode::OK)
    {
      throw DecodeException(error);
    }
    return value;
  }

  // ------------------------------------------------------------------------------------------------------------------
  // Files
  // ------------------------------------------------------------------------------------------------------------------

  inline ErrorCode
  DecodeFile(const std::string& path, Value& out, const DecodeOptions& options = {}, Error* error = nullptr)
  {
    auto fail = [error](const char* message) {
      if (error)
      {
        error->code = ErrorCode::IoError;
        error->where = {};
        error->message = message;
      }
      return ErrorCode::IoError;
    };

    auto fileStream = OpenFileUTF8(path, "rb");
    if (!fileStream)
    {
      return fail("Failed to open file");
    }
    if (std::fseek(fileStream.get(), 0, SEEK_END) != 0)
    {
      return fail("Failed to read file");
    }
    long size = std::ftell(fileStream.get());
    if (size < 0 || std::fseek(fileStream.get(), 0, SEEK_SET) != 0)
    {
      return fail("Failed to read file");
    }
    std::string data(static_cast<std::size_t>(size), '\0');
    if (!data.empty())
    {
      if (std::fread(&data[0], 1, static_cast<std::size_t>(size), fileStream.get()) != static_cast<std::size_t>(size))
      {
        return fail("Failed to read file");
      }
    }
    return Decode(std::string_view(data), out, options, error);
  }

  inline Value DecodeFileOrThrow(const std::string& path, const DecodeOptions& options = {})
  {
    Value value;
    Error error;
    ErrorCode errorCode = DecodeFile(path, value, options, &error);
    if (errorCode != ErrorCode::OK)
    {
      throw DecodeException(error);
    }
    return value;
  }

  inline bool
  EncodeFile(const std::string& path, const Value& value, const EncodeOptions& options = {}, Error* error = nullptr)
  {
    std::string text;
    if (Encode(value, text, options, error) != ErrorCode::OK)
    {
      return false;
    }

    auto fileStream = OpenFileUTF8(path, "wb");
    if (!fileStream)
    {
      if (error)
      {
        error->code = ErrorCode::IoError;
        error->where = {};
        error->message = "Failed to open file for writing";
      }
      return false;
    }
    if (!text.empty())
    {
      if (std::fwrite(text.data(), 1, text.size(), fileStream.get()) != text.size())
      {
        if (error)
        {
          error->code = ErrorCode::IoError;
          error->where = {};
          error->message = "Failed to write file";
        }
        return false;
      }
    }
    if (error)
    {
      *error = {};
    }
    return true;
  }

  // Compact JSON without pretty-printing; keys keep their insertion order
  inline std::string ToJsonString(const Value& value)
  {
    std::string out;

    struct Writer
    {
      static void JsonString(const std::string& value, std::string& out)
      {
        out.push_back('"');
        for (char c : value)
        {
          switch (c)
          {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
              if (static_cast<unsigned char>(c) < 0x20)
              {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
                out += buffer;
              }
              else
              {
                out.push_back(c);
              }
              break;
          }
        }
        out.push_back('"');
      }

      static void Write(const Value& value, std::string& out)
      {
        if (value.isNull())
        {
          out += "null";
        }
        else if (value.isBool())
        {
          out += (value.asBool() ? "true" : "false");
        }
        else if (value.isNumber())
        {
          // JSON has no spelling for NaN or infinity
          out += value.asNumber().IsFinite() ? value.asNumber().Text() : "null";
        }
        else if (value.isString())
        {
          JsonString(value.asString(), out);
        }
        else if (value.isArray())
        {
          out.push_back('[');
          bool first = true;
          for (const auto& element : value.asArray())
          {
            if (!first)
            {
              out.push_back(',');
            }
            first = false;
            Write(element, out);
          }
          out.push_back(']');
        }
        else
        {
          out.push_back('{');
          bool first = true;
          for (const auto& [key, element] : value.asObject())
          {
            if (!first)
            {
              out.push_back(',');
            }
            first = false;
            JsonString(key, out);
            out.push_back(':');
            Write(element, out);
          }
          out.push_back('}');
        }
      }
    };

    Writer::Write(value, out);
    return out;
  }
}

#endif
