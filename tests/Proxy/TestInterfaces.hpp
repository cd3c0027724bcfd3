// TestInterfaces.hpp: interfaces and descriptions shared by the proxy tests
#pragma once

#include <NGIN/Proxy/Proxy.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace ProxyDemo
{
  struct ICalc
  {
    virtual ~ICalc() = default;
    virtual int Add(int a, int b) = 0;
  };

  struct ILogger : ICalc
  {
    virtual void Log(std::string message) = 0;
    virtual std::size_t Count() const = 0;
  };

  // Diamond: IWidget reaches IShape through both INamed and IColored.
  struct IShape
  {
    virtual ~IShape() = default;
    virtual double Area() const = 0;
  };

  struct INamed : virtual IShape
  {
    virtual std::string Name() const = 0;
  };

  struct IColored : virtual IShape
  {
    virtual std::uint32_t Color() const = 0;
  };

  struct IWidget : INamed, IColored
  {
    virtual void Resize(double factor) = 0;
  };

  // Two unrelated interfaces declaring the same method.
  struct IPingA
  {
    virtual ~IPingA() = default;
    virtual void Ping(int value) = 0;
  };

  struct IPingB
  {
    virtual ~IPingB() = default;
    virtual void Ping(int value) = 0;
  };

  struct IPingBoth : IPingA, IPingB
  {
  };

  // Same name and parameters, differing only in const.
  struct IRead
  {
    virtual ~IRead() = default;
    virtual int Get() const = 0;
  };

  struct IWrite
  {
    virtual ~IWrite() = default;
    virtual int Get() = 0;
  };

  struct IReadWrite : IRead, IWrite
  {
  };

  // Only First is described; Second has a forwarder but no descriptor.
  struct IPartial
  {
    virtual ~IPartial() = default;
    virtual int First() = 0;
    virtual int Second() = 0;
  };

  struct ISettings
  {
    virtual ~ISettings() = default;
    virtual int GetVolume() const = 0;
    virtual void SetVolume(int volume) = 0;
    virtual std::string GetLabel() const = 0;
  };

  enum class Mode : std::uint8_t
  {
    Off = 0,
    On = 1,
    Auto = 2,
  };

  struct Payload
  {
    int id{0};
    std::string name;
  };

  struct IConversions
  {
    virtual ~IConversions() = default;
    virtual bool Flag() = 0;
    virtual std::int8_t I8() = 0;
    virtual std::uint8_t U8() = 0;
    virtual std::int16_t I16() = 0;
    virtual std::uint16_t U16() = 0;
    virtual std::int32_t I32() = 0;
    virtual std::uint32_t U32() = 0;
    virtual std::int64_t I64() = 0;
    virtual std::uint64_t U64() = 0;
    virtual float F32() = 0;
    virtual double F64() = 0;
    virtual Mode GetMode() = 0;
    virtual Payload GetPayload() = 0;
    virtual const Payload *Find(int id) = 0;
  };

  struct IOutParams
  {
    virtual ~IOutParams() = default;
    virtual void Fill(int &out) = 0;
    virtual bool TryGet(const std::string &key, std::string &value) = 0;
  };

  struct IBadTwice
  {
    virtual ~IBadTwice() = default;
    virtual void Run() = 0;
  };

  struct IBadProperty
  {
    virtual ~IBadProperty() = default;
    virtual int Get() const = 0;
  };

  struct IBadSetter
  {
    virtual ~IBadSetter() = default;
    virtual int Get() const = 0;
    virtual void Set(int a, int b) = 0;
  };

  struct IBadGetter
  {
    virtual ~IBadGetter() = default;
    virtual void Get() const = 0;
  };

  // Concrete types used as proxy targets.
  class Calculator : public ICalc
  {
  public:
    int Add(int a, int b) override { return a + b; }
  };

  class ConsoleLogger : public ILogger
  {
  public:
    int Add(int a, int b) override { return a + b; }
    void Log(std::string message) override
    {
      last = std::move(message);
      ++count;
    }
    std::size_t Count() const override { return count; }

    std::string last;
    std::size_t count{0};
  };

  struct Plain
  {
    int value{0};
  };
} // namespace ProxyDemo

namespace NGIN::Proxy
{
  template <>
  struct Describe<ProxyDemo::ICalc>
  {
    static void Do(InterfaceBuilder<ProxyDemo::ICalc> &b) { b.Method<&ProxyDemo::ICalc::Add>(); }

    template <class Base>
    struct Forwarder : Base
    {
      int Add(int a, int b) override { return this->template Forward<&ProxyDemo::ICalc::Add>(a, b); }
    };
  };

  template <>
  struct Describe<ProxyDemo::ILogger>
  {
    using Extends = InterfaceList<ProxyDemo::ICalc>;

    static void Do(InterfaceBuilder<ProxyDemo::ILogger> &b)
    {
      b.Method<&ProxyDemo::ILogger::Log>();
      b.Method<&ProxyDemo::ILogger::Count>();
    }

    template <class Base>
    struct Forwarder : Base
    {
      void Log(std::string message) override { this->template Forward<&ProxyDemo::ILogger::Log>(std::move(message)); }
      std::size_t Count() const override { return this->template Forward<&ProxyDemo::ILogger::Count>(); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IShape>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IShape> &b) { b.Method<&ProxyDemo::IShape::Area>(); }

    template <class Base>
    struct Forwarder : Base
    {
      double Area() const override { return this->template Forward<&ProxyDemo::IShape::Area>(); }
    };
  };

  template <>
  struct Describe<ProxyDemo::INamed>
  {
    using Extends = InterfaceList<ProxyDemo::IShape>;

    static void Do(InterfaceBuilder<ProxyDemo::INamed> &b) { b.Method<&ProxyDemo::INamed::Name>(); }

    template <class Base>
    struct Forwarder : Base
    {
      std::string Name() const override { return this->template Forward<&ProxyDemo::INamed::Name>(); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IColored>
  {
    using Extends = InterfaceList<ProxyDemo::IShape>;

    static void Do(InterfaceBuilder<ProxyDemo::IColored> &b) { b.Method<&ProxyDemo::IColored::Color>(); }

    template <class Base>
    struct Forwarder : Base
    {
      std::uint32_t Color() const override { return this->template Forward<&ProxyDemo::IColored::Color>(); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IWidget>
  {
    using Extends = InterfaceList<ProxyDemo::INamed, ProxyDemo::IColored>;

    static void Do(InterfaceBuilder<ProxyDemo::IWidget> &b) { b.Method<&ProxyDemo::IWidget::Resize>(); }

    template <class Base>
    struct Forwarder : Base
    {
      void Resize(double factor) override { this->template Forward<&ProxyDemo::IWidget::Resize>(factor); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IPingA>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IPingA> &b) { b.Method<&ProxyDemo::IPingA::Ping>(); }

    template <class Base>
    struct Forwarder : Base
    {
      void Ping(int value) override { this->template Forward<&ProxyDemo::IPingA::Ping>(value); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IPingB>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IPingB> &b) { b.Method<&ProxyDemo::IPingB::Ping>(); }

    template <class Base>
    struct Forwarder : Base
    {
      void Ping(int value) override { this->template Forward<&ProxyDemo::IPingB::Ping>(value); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IPingBoth>
  {
    using Extends = InterfaceList<ProxyDemo::IPingA, ProxyDemo::IPingB>;

    static void Do(InterfaceBuilder<ProxyDemo::IPingBoth> &) {}

    template <class Base>
    struct Forwarder : Base
    {
    };
  };

  template <>
  struct Describe<ProxyDemo::IRead>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IRead> &b) { b.Method<&ProxyDemo::IRead::Get>(); }

    template <class Base>
    struct Forwarder : Base
    {
      int Get() const override { return this->template Forward<&ProxyDemo::IRead::Get>(); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IWrite>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IWrite> &b) { b.Method<&ProxyDemo::IWrite::Get>(); }

    template <class Base>
    struct Forwarder : Base
    {
      int Get() override { return this->template Forward<&ProxyDemo::IWrite::Get>(); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IReadWrite>
  {
    using Extends = InterfaceList<ProxyDemo::IRead, ProxyDemo::IWrite>;

    static void Do(InterfaceBuilder<ProxyDemo::IReadWrite> &) {}

    template <class Base>
    struct Forwarder : Base
    {
    };
  };

  template <>
  struct Describe<ProxyDemo::IPartial>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IPartial> &b) { b.Method<&ProxyDemo::IPartial::First>(); }

    template <class Base>
    struct Forwarder : Base
    {
      int First() override { return this->template Forward<&ProxyDemo::IPartial::First>(); }
      int Second() override { return this->template Forward<&ProxyDemo::IPartial::Second>(); }
    };
  };

  template <>
  struct Describe<ProxyDemo::ISettings>
  {
    static void Do(InterfaceBuilder<ProxyDemo::ISettings> &b)
    {
      b.Method<&ProxyDemo::ISettings::GetVolume>();
      b.Method<&ProxyDemo::ISettings::SetVolume>();
      b.Method<&ProxyDemo::ISettings::GetLabel>();
      b.Property<&ProxyDemo::ISettings::GetVolume, &ProxyDemo::ISettings::SetVolume>("Volume");
      b.Property<&ProxyDemo::ISettings::GetLabel>("Label");
    }

    template <class Base>
    struct Forwarder : Base
    {
      int GetVolume() const override { return this->template Forward<&ProxyDemo::ISettings::GetVolume>(); }
      void SetVolume(int volume) override { this->template Forward<&ProxyDemo::ISettings::SetVolume>(volume); }
      std::string GetLabel() const override { return this->template Forward<&ProxyDemo::ISettings::GetLabel>(); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IConversions>
  {
    using I = ProxyDemo::IConversions;

    static void Do(InterfaceBuilder<I> &b)
    {
      b.Method<&I::Flag>();
      b.Method<&I::I8>();
      b.Method<&I::U8>();
      b.Method<&I::I16>();
      b.Method<&I::U16>();
      b.Method<&I::I32>();
      b.Method<&I::U32>();
      b.Method<&I::I64>();
      b.Method<&I::U64>();
      b.Method<&I::F32>();
      b.Method<&I::F64>();
      b.Method<&I::GetMode>();
      b.Method<&I::GetPayload>();
      b.Method<&I::Find>();
    }

    template <class Base>
    struct Forwarder : Base
    {
      bool Flag() override { return this->template Forward<&I::Flag>(); }
      std::int8_t I8() override { return this->template Forward<&I::I8>(); }
      std::uint8_t U8() override { return this->template Forward<&I::U8>(); }
      std::int16_t I16() override { return this->template Forward<&I::I16>(); }
      std::uint16_t U16() override { return this->template Forward<&I::U16>(); }
      std::int32_t I32() override { return this->template Forward<&I::I32>(); }
      std::uint32_t U32() override { return this->template Forward<&I::U32>(); }
      std::int64_t I64() override { return this->template Forward<&I::I64>(); }
      std::uint64_t U64() override { return this->template Forward<&I::U64>(); }
      float F32() override { return this->template Forward<&I::F32>(); }
      double F64() override { return this->template Forward<&I::F64>(); }
      ProxyDemo::Mode GetMode() override { return this->template Forward<&I::GetMode>(); }
      ProxyDemo::Payload GetPayload() override { return this->template Forward<&I::GetPayload>(); }
      const ProxyDemo::Payload *Find(int id) override { return this->template Forward<&I::Find>(id); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IOutParams>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IOutParams> &b)
    {
      b.Method<&ProxyDemo::IOutParams::Fill>();
      b.Method<&ProxyDemo::IOutParams::TryGet>();
    }

    template <class Base>
    struct Forwarder : Base
    {
      void Fill(int &out) override { this->template Forward<&ProxyDemo::IOutParams::Fill>(out); }
      bool TryGet(const std::string &key, std::string &value) override
      {
        return this->template Forward<&ProxyDemo::IOutParams::TryGet>(key, value);
      }
    };
  };

  template <>
  struct Describe<ProxyDemo::IBadTwice>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IBadTwice> &b)
    {
      b.Method<&ProxyDemo::IBadTwice::Run>();
      b.Method<&ProxyDemo::IBadTwice::Run>("RunAgain");
    }

    template <class Base>
    struct Forwarder : Base
    {
      void Run() override { this->template Forward<&ProxyDemo::IBadTwice::Run>(); }
    };
  };

  template <>
  struct Describe<ProxyDemo::IBadProperty>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IBadProperty> &b) { b.Property<&ProxyDemo::IBadProperty::Get>("Value"); }
  };

  template <>
  struct Describe<ProxyDemo::IBadSetter>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IBadSetter> &b)
    {
      b.Method<&ProxyDemo::IBadSetter::Get>();
      b.Method<&ProxyDemo::IBadSetter::Set>();
      b.Property<&ProxyDemo::IBadSetter::Get, &ProxyDemo::IBadSetter::Set>("Value");
    }
  };

  template <>
  struct Describe<ProxyDemo::IBadGetter>
  {
    static void Do(InterfaceBuilder<ProxyDemo::IBadGetter> &b)
    {
      b.Method<&ProxyDemo::IBadGetter::Get>();
      b.Property<&ProxyDemo::IBadGetter::Get>("Value");
    }
  };

  template <>
  struct Implements<ProxyDemo::Calculator>
  {
    using type = InterfaceList<ProxyDemo::ICalc>;
  };

  template <>
  struct Implements<ProxyDemo::ConsoleLogger>
  {
    using type = InterfaceList<ProxyDemo::ILogger, ProxyDemo::ICalc>;
  };
} // namespace NGIN::Proxy

namespace ProxyTest
{
  // Records the last call and answers with a fixed value.
  struct RecordingHandler : NGIN::Proxy::IInvocationHandler
  {
    NGIN::Proxy::Any Invoke(NGIN::Proxy::ProxyObject &, const NGIN::Proxy::Method &method,
                            std::span<const NGIN::Proxy::Any> args) override
    {
      lastName = std::string(method.GetName());
      lastIndex = method.GetIndex();
      lastArgCount = args.size();
      if (!args.empty() && args[0].GetTypeId() == NGIN::Proxy::detail::TypeIdOf<std::string>())
        lastText = args[0].Cast<std::string>();
      ++calls;
      return result;
    }

    NGIN::Proxy::Any result{0};
    std::string lastName;
    NGIN::UInt32 lastIndex{NGIN::Proxy::InvalidIndex};
    std::size_t lastArgCount{0};
    std::string lastText;
    int calls{0};
  };

  inline std::string BlueprintNameOf(std::string_view qualifiedName)
  {
    return std::string(qualifiedName) + std::string(NGIN::Proxy::ProxySuffix);
  }
} // namespace ProxyTest
