#include "catalog/ColumnDescriptor.hpp"
#include "codec/PageDecoder.hpp"
#include "util/PageBuilder.hpp"

#include <benchmark/benchmark.h>
#include <string>
#include <vector>

using namespace Pancake;

static constexpr int kRowsPerPage = 100'000;

static std::string Int64Page() {
  PageBuilder builder(idl::INT64);
  for (int i = 0; i < kRowsPerPage; i++) {
    if (i % 10 == 0) {
      builder.Null();
    } else {
      builder.Int64(i * 7919LL);
    }
  }
  return builder.Build();
}

static std::string StringPage() {
  PageBuilder builder(idl::STRING);
  for (int i = 0; i < kRowsPerPage; i++) {
    builder.String("user_" + std::to_string(i));
  }
  return builder.Build();
}

static std::string NestedPage() {
  PageBuilder builder(idl::INT64, 1);
  for (int i = 0; i < kRowsPerPage / 10; i++) {
    FieldValue list;
    for (int j = 0; j < 10; j++) {
      list.mutable_list_val()->add_vals()->set_int64_val(i + j);
    }
    builder.Value(list);
  }
  return builder.Build();
}

static void BM_DecodeInt64Page(benchmark::State &state) {
  static const auto data = Int64Page();
  PageDecoder decoder(ColumnDescriptor("id", idl::INT64));
  for (auto _ : state) {
    std::vector<FieldValue> values;
    auto s = decoder.Decode(data, 0, values);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(values);
  }
  state.SetItemsProcessed(state.iterations() * kRowsPerPage);
  state.SetBytesProcessed(state.iterations() *
                          static_cast<int64_t>(data.size()));
}

static void BM_DecodeStringPage(benchmark::State &state) {
  static const auto data = StringPage();
  PageDecoder decoder(ColumnDescriptor("name", idl::STRING));
  for (auto _ : state) {
    std::vector<FieldValue> values;
    auto s = decoder.Decode(data, 0, values);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(values);
  }
  state.SetItemsProcessed(state.iterations() * kRowsPerPage);
  state.SetBytesProcessed(state.iterations() *
                          static_cast<int64_t>(data.size()));
}

static void BM_DecodeNestedPage(benchmark::State &state) {
  static const auto data = NestedPage();
  PageDecoder decoder(ColumnDescriptor("scores", idl::INT64, 1));
  for (auto _ : state) {
    std::vector<FieldValue> values;
    auto s = decoder.Decode(data, 0, values);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(values);
  }
  state.SetItemsProcessed(state.iterations() * kRowsPerPage / 10);
}

BENCHMARK(BM_DecodeInt64Page);
BENCHMARK(BM_DecodeStringPage);
BENCHMARK(BM_DecodeNestedPage);
