#include <NGIN/Proxy/Proxy.hpp>

#include <iostream>
#include <string>
#include <utility>

namespace Demo {
  struct ICalc {
    virtual ~ICalc() = default;
    virtual int Add(int a, int b) = 0;
  };

  struct ILogger : ICalc {
    virtual void Log(std::string message) = 0;
  };
}

namespace NGIN::Proxy {
  template <>
  struct Describe<Demo::ICalc> {
    static void Do(InterfaceBuilder<Demo::ICalc> &b) { b.Method<&Demo::ICalc::Add>(); }

    template <class Base>
    struct Forwarder : Base {
      int Add(int a, int b) override { return this->template Forward<&Demo::ICalc::Add>(a, b); }
    };
  };

  template <>
  struct Describe<Demo::ILogger> {
    using Extends = InterfaceList<Demo::ICalc>;

    static void Do(InterfaceBuilder<Demo::ILogger> &b) { b.Method<&Demo::ILogger::Log>(); }

    template <class Base>
    struct Forwarder : Base {
      void Log(std::string message) override { this->template Forward<&Demo::ILogger::Log>(std::move(message)); }
    };
  };
}

int main() {
  using namespace NGIN::Proxy;
  std::cout << "Library: " << LibraryName() << "\n";

  auto handler = MakeHandler([](ProxyObject &, const Method &m, std::span<const Any> args) -> Any {
    std::cout << m.GetDeclaringInterface().QualifiedName() << "::" << m.GetName()
              << " #" << m.GetIndex() << " (" << args.size() << " args)\n";
    if (m.GetName() == "Add")
      return Any{args[0].Cast<int>() + args[1].Cast<int>()};
    if (m.GetName() == "Log")
      std::cout << "  log: " << args[0].Cast<std::string>() << "\n";
    return Any::MakeVoid();
  });

  auto proxy = CreateProxy<Demo::ILogger>(handler);
  if (!proxy) {
    std::cout << "create failed: " << ToString(proxy.error().code) << " " << proxy.error().message << "\n";
    return 1;
  }

  auto *logger = (*proxy)->As<Demo::ILogger>();
  std::cout << "Add(2, 3) = " << logger->Add(2, 3) << "\n";
  logger->Log("hello from a proxy");

  auto blueprint = (*proxy)->GetBlueprint();
  std::cout << "Blueprint: " << blueprint.Name() << "\n";
  for (NGIN::UIntSize i = 0; i < blueprint.InterfaceCount(); ++i)
    std::cout << "  implements " << blueprint.InterfaceAt(i).QualifiedName() << "\n";
  for (NGIN::UIntSize i = 0; i < blueprint.MethodCount(); ++i)
    std::cout << "  slot " << i << ": " << blueprint.MethodAt(i).GetName() << "\n";

  return 0;
}
