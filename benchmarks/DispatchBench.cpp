#include <iostream>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Proxy/Proxy.hpp>

using namespace NGIN;

namespace BenchDemo
{
  struct ICalc
  {
    virtual ~ICalc() = default;
    virtual int Add(int a, int b) = 0;
  };

  class Calc : public ICalc
  {
  public:
    int Add(int a, int b) override { return a + b; }
  };
}

namespace NGIN::Proxy
{
  template <>
  struct Describe<BenchDemo::ICalc>
  {
    static void Do(InterfaceBuilder<BenchDemo::ICalc> &b) { b.Method<&BenchDemo::ICalc::Add>(); }

    template <class Base>
    struct Forwarder : Base
    {
      int Add(int a, int b) override { return this->template Forward<&BenchDemo::ICalc::Add>(a, b); }
    };
  };
}

int main()
{
  using namespace NGIN::Proxy;
  using BenchDemo::ICalc;

  auto sumHandler = MakeHandler([](ProxyObject &, const Method &, std::span<const Any> args) -> Any
                                { return Any{args[0].Cast<int>() + args[1].Cast<int>()}; });

  BenchDemo::Calc real;
  auto forwardHandler = MakeHandler([&real](ProxyObject &, const Method &m, std::span<const Any> args) -> Any
                                    { return m.Invoke(static_cast<ICalc &>(real), args).value(); });

  auto proxy = CreateProxy<ICalc>(sumHandler).value();
  auto forwarding = CreateProxy<ICalc>(forwardHandler).value();

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ICalc *c = &real;
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += c->Add(i, 1);
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct virtual Add 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    auto *c = proxy->As<ICalc>();
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += c->Add(i, 1);
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Proxy Add via handler 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    auto *c = forwarding->As<ICalc>();
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += c->Add(i, 1);
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Proxy Add forwarded to real object 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    NGIN::UIntSize made = 0;
    for (int i=0;i<1000;++i) {
      auto p = CreateProxy<ICalc>(sumHandler);
      made += p.has_value() ? 1 : 0;
    }
    ctx.doNotOptimize(made);
    ctx.stop(); }, "Create proxy from cached blueprint 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    const auto name = GetInterface<ICalc>().value().QualifiedName();
    ctx.start();
    NGIN::UIntSize found = 0;
    for (int i=0;i<10000;++i) {
      found += ResolveMethod(name, 0).has_value() ? 1 : 0;
    }
    ctx.doNotOptimize(found);
    ctx.stop(); }, "ResolveMethod 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
