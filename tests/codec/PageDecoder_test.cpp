#include "catalog/ColumnDescriptor.hpp"
#include "codec/PageDecoder.hpp"
#include "common/Status.hpp"
#include "util/PageBuilder.hpp"

#include <google/protobuf/util/message_differencer.h>
#include <google/protobuf/util/time_util.h>

#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>

namespace {
Pancake::FieldValue ListOf(std::vector<Pancake::FieldValue> elems) {
  Pancake::FieldValue fv;
  for (auto &elem : elems) {
    *fv.mutable_list_val()->add_vals() = std::move(elem);
  }
  return fv;
}

Pancake::FieldValue Str(std::string s) {
  Pancake::FieldValue fv;
  fv.set_string_val(std::move(s));
  return fv;
}
} // namespace

TEST(PageDecoderTest, EmptyPageHoldsNoValues) {
  using namespace Pancake;
  PageDecoder decoder(ColumnDescriptor("age", idl::INT64));
  std::vector<FieldValue> values;
  EXPECT_TRUE(decoder.Decode(RawColumnPage{}, values).ok());
  EXPECT_TRUE(values.empty());

  // a header alone is a page of zero rows too
  auto header_only = PageBuilder(idl::INT64).Build();
  EXPECT_TRUE(decoder.Decode(header_only, 0, values).ok());
  EXPECT_TRUE(values.empty());
}

TEST(PageDecoderTest, Int64WithNulls) {
  using namespace Pancake;
  PageDecoder decoder(ColumnDescriptor("age", idl::INT64));
  auto data = PageBuilder(idl::INT64)
                  .Int64(3)
                  .Null()
                  .Int64(-7)
                  .Int64(std::numeric_limits<int64_t>::max())
                  .Build();
  std::vector<FieldValue> values;
  ASSERT_TRUE(decoder.Decode(data, 0, values).ok());
  ASSERT_EQ(values.size(), 4);
  EXPECT_EQ(values[0].int64_val(), 3);
  EXPECT_EQ(values[1].value_case(), FieldValue::VALUE_NOT_SET);
  EXPECT_EQ(values[2].int64_val(), -7);
  EXPECT_EQ(values[3].int64_val(), std::numeric_limits<int64_t>::max());
}

TEST(PageDecoderTest, EveryAtomType) {
  using namespace Pancake;
  using google::protobuf::util::TimeUtil;

  {
    FieldValue fv;
    fv.set_bool_val(true);
    auto data = PageBuilder(idl::BOOL).Value(fv).Null().Build();
    std::vector<FieldValue> values;
    ASSERT_TRUE(PageDecoder(ColumnDescriptor("flag", idl::BOOL))
                    .Decode(data, 0, values)
                    .ok());
    ASSERT_EQ(values.size(), 2);
    EXPECT_EQ(values[0].value_case(), FieldValue::kBoolVal);
    EXPECT_TRUE(values[0].bool_val());
    EXPECT_EQ(values[1].value_case(), FieldValue::VALUE_NOT_SET);
  }
  {
    FieldValue fv;
    fv.set_float32_val(1.5f);
    auto data = PageBuilder(idl::FLOAT32).Value(fv).Build();
    std::vector<FieldValue> values;
    ASSERT_TRUE(PageDecoder(ColumnDescriptor("f", idl::FLOAT32))
                    .Decode(data, 0, values)
                    .ok());
    ASSERT_EQ(values.size(), 1);
    EXPECT_FLOAT_EQ(values[0].float32_val(), 1.5f);
  }
  {
    FieldValue fv;
    fv.set_float64_val(-2.25);
    auto data = PageBuilder(idl::FLOAT64).Value(fv).Build();
    std::vector<FieldValue> values;
    ASSERT_TRUE(PageDecoder(ColumnDescriptor("d", idl::FLOAT64))
                    .Decode(data, 0, values)
                    .ok());
    ASSERT_EQ(values.size(), 1);
    EXPECT_DOUBLE_EQ(values[0].float64_val(), -2.25);
  }
  {
    auto data = PageBuilder(idl::STRING).String("hello").String("").Build();
    std::vector<FieldValue> values;
    ASSERT_TRUE(PageDecoder(ColumnDescriptor("name", idl::STRING))
                    .Decode(data, 0, values)
                    .ok());
    ASSERT_EQ(values.size(), 2);
    EXPECT_EQ(values[0].string_val(), "hello");
    EXPECT_EQ(values[1].value_case(), FieldValue::kStringVal);
    EXPECT_EQ(values[1].string_val(), "");
  }
  {
    FieldValue fv;
    fv.set_bytes_val(std::string("\x00\xff\x80", 3));
    auto data = PageBuilder(idl::BYTES).Value(fv).Build();
    std::vector<FieldValue> values;
    ASSERT_TRUE(PageDecoder(ColumnDescriptor("blob", idl::BYTES))
                    .Decode(data, 0, values)
                    .ok());
    ASSERT_EQ(values.size(), 1);
    EXPECT_EQ(values[0].bytes_val(), std::string("\x00\xff\x80", 3));
  }
  {
    FieldValue fv;
    *fv.mutable_timestamp_val() =
        TimeUtil::MicrosecondsToTimestamp(1'640'995'200'123'456);
    auto data = PageBuilder(idl::TIMESTAMP_MICROS).Value(fv).Build();
    std::vector<FieldValue> values;
    ASSERT_TRUE(PageDecoder(ColumnDescriptor("ts", idl::TIMESTAMP_MICROS))
                    .Decode(data, 0, values)
                    .ok());
    ASSERT_EQ(values.size(), 1);
    EXPECT_EQ(values[0].timestamp_val().seconds(), 1'640'995'200);
    EXPECT_EQ(values[0].timestamp_val().nanos(), 123'456'000);
  }
}

TEST(PageDecoderTest, NestedLists) {
  using namespace Pancake;
  ColumnDescriptor column("tags", idl::STRING, 2);
  auto nested = ListOf({ListOf({Str("a"), Str("b")}), ListOf({}),
                        ListOf({Str("c")})});
  auto data = PageBuilder(idl::STRING, 2)
                  .Value(nested)
                  .Null()
                  .Value(ListOf({}))
                  .Build();

  std::vector<FieldValue> values;
  ASSERT_TRUE(PageDecoder(column).Decode(data, 0, values).ok());
  ASSERT_EQ(values.size(), 3);
  EXPECT_TRUE(
      google::protobuf::util::MessageDifferencer::Equals(values[0], nested));
  EXPECT_EQ(values[1].value_case(), FieldValue::VALUE_NOT_SET);
  // an empty list is present, not null
  EXPECT_EQ(values[2].value_case(), FieldValue::kListVal);
  EXPECT_EQ(values[2].list_val().vals_size(), 0);
}

TEST(PageDecoderTest, ImplicitNullsPrecedeEncodedValues) {
  using namespace Pancake;
  PageDecoder decoder(ColumnDescriptor("age", idl::INT64));
  RawColumnPage page;
  page.data_ = PageBuilder(idl::INT64).Int64(9).Build();
  page.implicit_nulls_count_ = 2;

  std::vector<FieldValue> values;
  ASSERT_TRUE(decoder.Decode(page, values).ok());
  ASSERT_EQ(values.size(), 3);
  EXPECT_EQ(values[0].value_case(), FieldValue::VALUE_NOT_SET);
  EXPECT_EQ(values[1].value_case(), FieldValue::VALUE_NOT_SET);
  EXPECT_EQ(values[2].int64_val(), 9);

  // a page may consist of implicit nulls only
  values.clear();
  ASSERT_TRUE(decoder.Decode(std::string_view{}, 4, values).ok());
  EXPECT_EQ(values.size(), 4);
}

TEST(PageDecoderTest, AppendsToExistingValues) {
  using namespace Pancake;
  PageDecoder decoder(ColumnDescriptor("age", idl::INT64));
  std::vector<FieldValue> values;
  ASSERT_TRUE(
      decoder.Decode(PageBuilder(idl::INT64).Int64(1).Build(), 0, values).ok());
  ASSERT_TRUE(
      decoder.Decode(PageBuilder(idl::INT64).Int64(2).Build(), 0, values).ok());
  ASSERT_EQ(values.size(), 2);
  EXPECT_EQ(values[0].int64_val(), 1);
  EXPECT_EQ(values[1].int64_val(), 2);
}

TEST(PageDecoderTest, TruncatedPagesFail) {
  using namespace Pancake;
  PageDecoder decoder(ColumnDescriptor("age", idl::INT64));
  auto data = PageBuilder(idl::INT64).Int64(1).Int64(2).Build();
  // every proper prefix past the header cuts a value short
  for (size_t len = 1; len < data.size(); len++) {
    if (len == PAGE_HEADER_SIZE || len == PAGE_HEADER_SIZE + 9) {
      continue;
    }
    std::vector<FieldValue> values;
    auto status = decoder.Decode(std::string_view(data).substr(0, len), 0,
                                 values);
    EXPECT_EQ(status.Code(), ErrorCode::DecodeError) << "prefix " << len;
  }

  PageDecoder strings(ColumnDescriptor("name", idl::STRING));
  auto short_string =
      PageBuilder(idl::STRING).RawByte(PRESENT_MARKER).RawUint32(10).RawBytes(
          "abc").Build();
  std::vector<FieldValue> values;
  EXPECT_EQ(strings.Decode(short_string, 0, values).Code(),
            ErrorCode::DecodeError);
}

TEST(PageDecoderTest, OversizedListCountFails) {
  using namespace Pancake;
  PageDecoder decoder(ColumnDescriptor("tags", idl::INT64, 1));
  auto data = PageBuilder(idl::INT64, 1)
                  .RawByte(PRESENT_MARKER)
                  .RawUint32(0xFFFFFFFF)
                  .Build();
  std::vector<FieldValue> values;
  EXPECT_EQ(decoder.Decode(data, 0, values).Code(), ErrorCode::DecodeError);
}

TEST(PageDecoderTest, HeaderMismatches) {
  using namespace Pancake;
  std::vector<FieldValue> values;

  auto strings = PageBuilder(idl::STRING).String("x").Build();
  EXPECT_EQ(PageDecoder(ColumnDescriptor("age", idl::INT64))
                .Decode(strings, 0, values)
                .Code(),
            ErrorCode::TypeMismatchError);

  auto nested = PageBuilder(idl::INT64, 1).Build();
  EXPECT_EQ(PageDecoder(ColumnDescriptor("age", idl::INT64))
                .Decode(nested, 0, values)
                .Code(),
            ErrorCode::TypeMismatchError);

  std::string bad_version = PageBuilder(idl::INT64).Build();
  bad_version[0] = 7;
  EXPECT_EQ(PageDecoder(ColumnDescriptor("age", idl::INT64))
                .Decode(bad_version, 0, values)
                .Code(),
            ErrorCode::DecodeError);

  std::string bad_tag = PageBuilder(idl::INT64).Build();
  bad_tag[1] = 99;
  EXPECT_EQ(PageDecoder(ColumnDescriptor("age", idl::INT64))
                .Decode(bad_tag, 0, values)
                .Code(),
            ErrorCode::DecodeError);

  EXPECT_EQ(PageDecoder(ColumnDescriptor("age", idl::INT64))
                .Decode(std::string_view("\x01\x01", 2), 0, values)
                .Code(),
            ErrorCode::DecodeError);
  EXPECT_TRUE(values.empty());
}

TEST(PageDecoderTest, MalformedValues) {
  using namespace Pancake;
  std::vector<FieldValue> values;

  auto bad_marker = PageBuilder(idl::INT64).RawByte(0x02).Build();
  EXPECT_EQ(PageDecoder(ColumnDescriptor("age", idl::INT64))
                .Decode(bad_marker, 0, values)
                .Code(),
            ErrorCode::DecodeError);

  auto bad_bool =
      PageBuilder(idl::BOOL).RawByte(PRESENT_MARKER).RawByte(2).Build();
  EXPECT_EQ(PageDecoder(ColumnDescriptor("flag", idl::BOOL))
                .Decode(bad_bool, 0, values)
                .Code(),
            ErrorCode::DecodeError);

  auto bad_utf8 = PageBuilder(idl::STRING)
                      .RawByte(PRESENT_MARKER)
                      .RawUint32(2)
                      .RawBytes("\xc3\x28")
                      .Build();
  EXPECT_EQ(PageDecoder(ColumnDescriptor("name", idl::STRING))
                .Decode(bad_utf8, 0, values)
                .Code(),
            ErrorCode::DecodeError);

  // the same bytes are fine as BYTES
  auto raw = PageBuilder(idl::BYTES)
                 .RawByte(PRESENT_MARKER)
                 .RawUint32(2)
                 .RawBytes("\xc3\x28")
                 .Build();
  EXPECT_TRUE(PageDecoder(ColumnDescriptor("blob", idl::BYTES))
                  .Decode(raw, 0, values)
                  .ok());
  EXPECT_EQ(values.size(), 1);
}

TEST(PageDecoderTest, FailureLeavesValuesUntouched) {
  using namespace Pancake;
  PageDecoder decoder(ColumnDescriptor("age", idl::INT64));
  std::vector<FieldValue> values;
  ASSERT_TRUE(
      decoder.Decode(PageBuilder(idl::INT64).Int64(1).Build(), 0, values).ok());

  // two good rows, then garbage
  auto data =
      PageBuilder(idl::INT64).Int64(2).Int64(3).RawByte(0x05).Build();
  EXPECT_FALSE(decoder.Decode(data, 3, values).ok());
  ASSERT_EQ(values.size(), 1);
  EXPECT_EQ(values[0].int64_val(), 1);
}

TEST(PageDecoderTest, DecodingIsDeterministic) {
  using namespace Pancake;
  PageDecoder decoder(ColumnDescriptor("name", idl::STRING));
  auto good = PageBuilder(idl::STRING).String("a").Null().String("b").Build();
  std::vector<FieldValue> first, second;
  ASSERT_TRUE(decoder.Decode(good, 1, first).ok());
  ASSERT_TRUE(decoder.Decode(good, 1, second).ok());
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); i++) {
    EXPECT_TRUE(
        google::protobuf::util::MessageDifferencer::Equals(first[i], second[i]));
  }

  auto bad = good.substr(0, good.size() - 1);
  std::vector<FieldValue> ignored;
  auto s1 = decoder.Decode(bad, 0, ignored);
  auto s2 = decoder.Decode(bad, 0, ignored);
  EXPECT_EQ(s1.Code(), ErrorCode::DecodeError);
  EXPECT_EQ(s1.ToString(), s2.ToString());
}
