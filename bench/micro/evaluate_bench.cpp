#include <benchmark/benchmark.h>
#include <sift/codec.hpp>
#include <sift/expression.hpp>
#include <sift/text/parser.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace {

const char* kExpr = R"(Name is "bob" and Age > 30 and (Tags contains "go" or not (City is "paris")))";

auto make_records(std::size_t n) -> std::vector<sift::Value> {
  std::vector<sift::Value> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    sift::Value::map_t m;
    m["Name"] = (i % 3 == 0) ? "bob" : "alice";
    m["Age"] = static_cast<std::int64_t>(i % 60);
    m["City"] = (i % 2 == 0) ? "paris" : "oslo";
    m["Tags"] = sift::Value::list_t{"news", (i % 5 == 0) ? "go" : "rust"};
    out.emplace_back(std::move(m));
  }
  return out;
}

} // namespace

static void BM_ParseExpression(benchmark::State& state) {
  for (auto _ : state) {
    auto q = sift::text::parse(kExpr);
    benchmark::DoNotOptimize(q);
  }
}
BENCHMARK(BM_ParseExpression);

static void BM_EvaluateMap(benchmark::State& state) {
  const auto q = sift::text::parse(kExpr).value();
  const auto records = make_records(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    std::size_t hits = 0;
    for (const auto& r : records) {
      auto m = q.evaluate(r);
      if (m && *m) ++hits;
    }
    benchmark::DoNotOptimize(hits);
  }
  state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_EvaluateMap)->Arg(1024)->Arg(16384);

struct person {
  std::string name;
  int age;
};

static void BM_EvaluateSchema(benchmark::State& state) {
  const auto people = sift::schema<person>{}.field("Name", &person::name).field("Age", &person::age);
  const auto q = sift::all_of({sift::is("Name", "bob"), sift::gt("Age", 30)});
  const person p{"bob", 35};
  const auto rec = people.bind(p);
  for (auto _ : state) {
    auto m = q.evaluate(rec);
    benchmark::DoNotOptimize(m);
  }
}
BENCHMARK(BM_EvaluateSchema);

static void BM_CodecRoundTrip(benchmark::State& state) {
  const auto q = sift::text::parse(kExpr).value();
  for (auto _ : state) {
    auto bytes = sift::codec::encode(q);
    auto back = sift::codec::decode(*bytes);
    benchmark::DoNotOptimize(back);
  }
}
BENCHMARK(BM_CodecRoundTrip);

BENCHMARK_MAIN();
