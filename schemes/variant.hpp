#ifndef SCHEMES_VARIANT_HPP
#define SCHEMES_VARIANT_HPP

#include "error.hpp"

#include <memory>
#include <ostream>
#include <type_traits>
#include <utility>

namespace schemes {

template<class...> struct overload;

template<> struct overload<> {
  void operator()() const;
};

template<class F, class ... Fs>
struct overload<F, Fs...>: F, overload<Fs...> {
  using F::operator();
  using overload<Fs...>::operator();

  overload(F f, Fs...fs): F{f}, overload<Fs...>{fs...} { }
};


namespace detail {

template<std::size_t I, class T>
struct type_index {
  friend constexpr std::integral_constant<std::size_t, I> get_index(type_index, const T*) { return {}; }
};

template<class Is, class... Ts>
struct type_indices;

template<std::size_t... Is, class... Ts>
struct type_indices<std::index_sequence<Is...>, Ts...>: type_index<Is, Ts>... { };

} // namespace detail


// immutable tagged union. alternatives are boxed and shared between copies, so
// a variant may name alternatives that are still incomplete (recursive
// positions of pattern functors)
template<class... Args>
class variant {
  struct base {
    const std::size_t index;
  };

  template<class T>
  struct derived: base {
    const T value;

    derived(std::size_t index, const T& value): base{index}, value(value) {}
  };

  using type_index = detail::type_indices<std::index_sequence_for<Args...>, Args...>;

  template<class T>
  using index_of = decltype(get_index(type_index{}, (const T*)nullptr));

  template<class T, class Result, class Visitor>
  static Result thunk(const base* ptr, const Visitor& visitor) {
    return visitor(static_cast<const derived<T>*>(ptr)->value);
  }

  std::shared_ptr<const base> storage;

public:
  template<class T, std::size_t I = index_of<T>::value>
  variant(const T& value):
    storage(std::make_shared<derived<T>>(I, value)) {}

  variant(const variant&) = default;
  variant(variant&&) = default;

  variant& operator=(const variant&) = default;
  variant& operator=(variant&&) = default;

  template<class Visitor>
  friend auto visit(const variant& self, const Visitor& visitor) {
    using result_type =
        std::common_type_t<std::result_of_t<const Visitor&(const Args&)>...>;
    using thunk_type = result_type (*)(const base*, const Visitor&);

    const thunk_type table[] = {&variant::thunk<Args, result_type, Visitor>...};
    return table[self.storage->index](self.storage.get(), visitor);
  }

  template<class... Cases>
  friend auto match(const variant& self, Cases... cases) {
    return visit(self, overload<Cases...>{cases...});
  }

  template<class T>
  const T* cast() const {
    if(storage->index == index_of<T>::value) {
      return &static_cast<const derived<T>*>(storage.get())->value;
    }

    return nullptr;
  }

  template<class T>
  const T& get() const {
    if(const T* res = cast<T>()) {
      return *res;
    }

    throw bad_access("variant: alternative not held");
  }

  std::size_t type() const { return storage->index; }

  friend bool operator==(const variant& lhs, const variant& rhs) {
    if(lhs.type() != rhs.type()) return false;
    if(lhs.storage == rhs.storage) return true;

    return visit(lhs, [&](const auto& value) -> bool {
      using type = std::decay_t<decltype(value)>;
      return value == rhs.template get<type>();
    });
  }

  friend bool operator!=(const variant& lhs, const variant& rhs) {
    return !(lhs == rhs);
  }

  friend bool operator<(const variant& lhs, const variant& rhs) {
    if(lhs.type() != rhs.type()) return lhs.type() < rhs.type();

    return visit(lhs, [&](const auto& value) -> bool {
      using type = std::decay_t<decltype(value)>;
      return value < rhs.template get<type>();
    });
  }

  friend std::ostream& operator<<(std::ostream& out, const variant& self) {
    visit(self, [&](const auto& value) { out << value; });
    return out;
  }
};

} // namespace schemes

#endif
