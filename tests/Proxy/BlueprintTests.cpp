// BlueprintTests.cpp: interface closure flattening, diamond handling and blueprint validation

#include <catch2/catch_test_macros.hpp>

#include "TestInterfaces.hpp"

#include <array>
#include <string>
#include <type_traits>

TEST_CASE("ClosureIsFlattenedInTraversalOrder", "[proxy][Blueprint]")
{
  using namespace NGIN::Proxy;
  using Closure = detail::ClosureOf<InterfaceList<ProxyDemo::IWidget>>;

  STATIC_REQUIRE(std::is_same_v<Closure, InterfaceList<ProxyDemo::IWidget, ProxyDemo::INamed, ProxyDemo::IShape, ProxyDemo::IColored>>);
  STATIC_REQUIRE(std::is_same_v<detail::DirectBases<InterfaceList<ProxyDemo::ILogger, ProxyDemo::ICalc>>, InterfaceList<ProxyDemo::ILogger>>);

  auto proxy = CreateProxy<ProxyDemo::IWidget>(std::make_shared<ProxyTest::RecordingHandler>());
  REQUIRE(proxy.has_value());
  auto blueprint = (*proxy)->GetBlueprint();

  REQUIRE(blueprint.InterfaceCount() == NGIN::UIntSize{4});
  CHECK(blueprint.InterfaceAt(0).QualifiedName() == detail::TypeNameOf<ProxyDemo::IWidget>());
  CHECK(blueprint.InterfaceAt(1).QualifiedName() == detail::TypeNameOf<ProxyDemo::INamed>());
  CHECK(blueprint.InterfaceAt(2).QualifiedName() == detail::TypeNameOf<ProxyDemo::IShape>());
  CHECK(blueprint.InterfaceAt(3).QualifiedName() == detail::TypeNameOf<ProxyDemo::IColored>());
}

TEST_CASE("SharedAncestorIsGeneratedOnce", "[proxy][Blueprint]")
{
  using namespace NGIN::Proxy;

  auto handler = std::make_shared<ProxyTest::RecordingHandler>();
  auto proxy = CreateProxy<ProxyDemo::IWidget>(handler);
  REQUIRE(proxy.has_value());
  auto blueprint = (*proxy)->GetBlueprint();

  // Resize, Name, Area, Color
  REQUIRE(blueprint.MethodCount() == NGIN::UIntSize{4});
  NGIN::UIntSize areaSlots = 0;
  for (NGIN::UIntSize i = 0; i < blueprint.MethodCount(); ++i)
  {
    if (blueprint.MethodAt(i).GetName() == "Area")
      ++areaSlots;
  }
  CHECK(areaSlots == 1);

  handler->result = Any{12.5};
  auto *shape = (*proxy)->As<ProxyDemo::IShape>();
  REQUIRE(shape != nullptr);
  CHECK(shape->Area() == 12.5);
  CHECK(handler->lastName == "Area");
  CHECK(handler->lastIndex == 0u);
}

TEST_CASE("EveryReachableMethodIsDispatchable", "[proxy][Blueprint]")
{
  using namespace NGIN::Proxy;

  auto handler = std::make_shared<ProxyTest::RecordingHandler>();
  auto proxy = CreateProxy<ProxyDemo::IWidget>(handler);
  REQUIRE(proxy.has_value());
  auto *widget = (*proxy)->As<ProxyDemo::IWidget>();
  REQUIRE(widget != nullptr);

  handler->result = Any{std::string{"gizmo"}};
  CHECK(widget->Name() == "gizmo");
  CHECK(handler->lastName == "Name");
  CHECK(handler->lastIndex == 0u);

  handler->result = Any{0xff00ffu};
  CHECK(widget->Color() == 0xff00ffu);
  CHECK(handler->lastName == "Color");

  handler->result = Any{1.0};
  CHECK(widget->Area() == 1.0);
  CHECK(handler->lastName == "Area");

  widget->Resize(0.5);
  CHECK(handler->lastName == "Resize");
  CHECK(handler->calls == 4);

  CHECK((*proxy)->As<ProxyDemo::INamed>() != nullptr);
  CHECK((*proxy)->As<ProxyDemo::IColored>() != nullptr);
  CHECK((*proxy)->As<ProxyDemo::ICalc>() == nullptr);
}

TEST_CASE("HandlerSeesTheDeclaringInterface", "[proxy][Blueprint]")
{
  using namespace NGIN::Proxy;

  std::string declaring;
  auto proxy = CreateProxy<ProxyDemo::ILogger>(MakeHandler(
      [&declaring](ProxyObject &, const Method &m, std::span<const Any>) -> Any
      {
        declaring = std::string(m.GetDeclaringInterface().QualifiedName());
        return Any{0};
      }));
  REQUIRE(proxy.has_value());

  (void)(*proxy)->As<ProxyDemo::ILogger>()->Add(1, 2);
  CHECK(declaring == detail::TypeNameOf<ProxyDemo::ICalc>());
  (*proxy)->As<ProxyDemo::ILogger>()->Log("y");
  CHECK(declaring == detail::TypeNameOf<ProxyDemo::ILogger>());
}

TEST_CASE("SameSignatureFromDistinctInterfacesFails", "[proxy][Blueprint]")
{
  using namespace NGIN::Proxy;

  auto &factory = ProxyFactory::GetInstance();
  const auto before = factory.BlueprintCount();

  auto proxy = factory.Create<ProxyDemo::IPingBoth>(std::make_shared<ProxyTest::RecordingHandler>());
  REQUIRE_FALSE(proxy.has_value());
  CHECK(proxy.error().code == ErrorCode::SynthesisFailure);
  CHECK(factory.BlueprintCount() == before);

  // Each interface on its own is fine.
  CHECK(factory.Create<ProxyDemo::IPingA>(std::make_shared<ProxyTest::RecordingHandler>()).has_value());
  CHECK(factory.Create<ProxyDemo::IPingB>(std::make_shared<ProxyTest::RecordingHandler>()).has_value());
}

TEST_CASE("ConstAndNonConstMethodsAreDistinct", "[proxy][Blueprint]")
{
  using namespace NGIN::Proxy;

  std::string declaring;
  auto proxy = CreateProxy<ProxyDemo::IReadWrite>(MakeHandler(
      [&declaring](ProxyObject &, const Method &m, std::span<const Any>) -> Any
      {
        declaring = std::string(m.GetDeclaringInterface().QualifiedName());
        return Any{m.IsConst() ? 1 : 2};
      }));
  REQUIRE(proxy.has_value());
  CHECK((*proxy)->GetBlueprint().MethodCount() == NGIN::UIntSize{2});

  const auto *reader = (*proxy)->As<ProxyDemo::IRead>();
  REQUIRE(reader != nullptr);
  CHECK(reader->Get() == 1);
  CHECK(declaring == detail::TypeNameOf<ProxyDemo::IRead>());

  auto *writer = (*proxy)->As<ProxyDemo::IWrite>();
  REQUIRE(writer != nullptr);
  CHECK(writer->Get() == 2);
  CHECK(declaring == detail::TypeNameOf<ProxyDemo::IWrite>());
}

TEST_CASE("BuildBlueprintValidatesItsInputs", "[proxy][Blueprint]")
{
  using namespace NGIN::Proxy;

  const std::array<const detail::InterfaceInfo *, 1> calc{&detail::InterfaceInfoOf<ProxyDemo::ICalc>()};
  const std::array<const detail::InterfaceInfo *, 1> null{nullptr};
  auto construct = &detail::ConstructProxy<InterfaceList<ProxyDemo::ICalc>>;

  auto empty = detail::BuildBlueprint({}, "EmptyProxy", construct, 0);
  REQUIRE_FALSE(empty.has_value());
  CHECK(empty.error().code == ErrorCode::InvalidArgument);

  auto nullEntry = detail::BuildBlueprint(null, "NullProxy", construct, 1);
  REQUIRE_FALSE(nullEntry.has_value());
  CHECK(nullEntry.error().code == ErrorCode::InvalidArgument);

  auto noName = detail::BuildBlueprint(calc, "", construct, 1);
  REQUIRE_FALSE(noName.has_value());
  CHECK(noName.error().code == ErrorCode::InvalidArgument);

  auto noConstructor = detail::BuildBlueprint(calc, "CalcProxy", nullptr, 1);
  REQUIRE_FALSE(noConstructor.has_value());
  CHECK(noConstructor.error().code == ErrorCode::InvalidArgument);

  auto mismatch = detail::BuildBlueprint(calc, "CalcProxy", construct, 3);
  REQUIRE_FALSE(mismatch.has_value());
  CHECK(mismatch.error().code == ErrorCode::SynthesisFailure);

  auto ok = detail::BuildBlueprint(calc, "CalcProxy", construct, 1);
  REQUIRE(ok.has_value());
  Blueprint blueprint{ok->get()};
  CHECK(blueprint.Name() == "CalcProxy");
  CHECK(blueprint.MethodCount() == NGIN::UIntSize{1});
  CHECK(blueprint.MethodAt(0).GetName() == "Add");

  auto instance = blueprint.Instantiate(std::make_shared<ProxyTest::RecordingHandler>());
  REQUIRE(instance.has_value());
  CHECK((*instance)->As<ProxyDemo::ICalc>()->Add(1, 1) == 0);
}
