#include <NGIN/Proxy/Proxy.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace Demo {
  struct IStore {
    virtual ~IStore() = default;
    virtual void Put(std::string key, int value) = 0;
    virtual int Get(const std::string &key) const = 0;
  };

  class MemoryStore : public IStore {
  public:
    void Put(std::string key, int value) override {
      m_key = std::move(key);
      m_value = value;
    }
    int Get(const std::string &key) const override { return key == m_key ? m_value : -1; }

  private:
    std::string m_key;
    int m_value{0};
  };
}

namespace NGIN::Proxy {
  template <>
  struct Describe<Demo::IStore> {
    static void Do(InterfaceBuilder<Demo::IStore> &b) {
      b.Method<&Demo::IStore::Put>();
      b.Method<&Demo::IStore::Get>();
    }

    template <class Base>
    struct Forwarder : Base {
      void Put(std::string key, int value) override {
        this->template Forward<&Demo::IStore::Put>(std::move(key), value);
      }
      int Get(const std::string &key) const override { return this->template Forward<&Demo::IStore::Get>(key); }
    };
  };
}

// Times every call and forwards it to a real store.
int main() {
  using namespace NGIN::Proxy;

  Demo::MemoryStore real;
  auto handler = MakeHandler([&real](ProxyObject &, const Method &m, std::span<const Any> args) -> Any {
    const auto start = std::chrono::steady_clock::now();
    auto result = m.Invoke(static_cast<Demo::IStore &>(real), args);
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
    std::cout << m.GetName() << " took " << elapsed.count() << "ns\n";
    if (!result)
      throw DispatchError(result.error());
    return std::move(*result);
  });

  auto proxy = CreateProxy<Demo::IStore>(handler);
  if (!proxy) {
    std::cout << "create failed: " << proxy.error().message << "\n";
    return 1;
  }

  auto *store = (*proxy)->As<Demo::IStore>();
  store->Put("answer", 42);
  std::cout << "Get(answer) = " << store->Get("answer") << "\n";
  std::cout << "Get(other) = " << store->Get("other") << "\n";
  return 0;
}
