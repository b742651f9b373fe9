#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "tg/diagnostics/event_bus.h"
#include "tg/fault.h"

namespace tg {

  // Failure carrier, convertible into any Outcome with a compatible error type.
  template <typename E = Fault>
  class Unexpected {
  public:
    explicit Unexpected(E error) : error_(std::move(error)) {}

    const E& Error() const& noexcept { return error_; }
    E&& Error() && noexcept { return std::move(error_); }

  private:
    E error_;
  };

  template <typename E>
  Unexpected<std::decay_t<E>> Fail(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
  }

  inline diagnostics::Event MakeFailureEvent(const Fault& fault, std::string_view operation) {
    return diagnostics::FaultEvent(fault, operation);
  }

  template <typename T, typename E = Fault>
  class Outcome;

  namespace detail {
    template <typename>
    struct IsOutcome : std::false_type {};
    template <typename T, typename E>
    struct IsOutcome<Outcome<T, E>> : std::true_type {};

    template <typename>
    struct IsUnexpected : std::false_type {};
    template <typename E>
    struct IsUnexpected<Unexpected<E>> : std::true_type {};

    template <typename E>
    void AppendContext(E& error, std::string_view context) {
      if constexpr (requires(E& e) { e.WithContext(std::string{}); }) {
        if (!context.empty()) {
          error.WithContext(std::string(context));
        }
      }
    }
  } // namespace detail

  // Success(T) or Failure(E); both states are terminal. There is deliberately
  // no accessor that aborts on the wrong state: use TryValue/TryFault, Match,
  // ValueOr, the chaining operations, Propagate/TG_TRY, or LogAndDrop.
  // Discarding an Outcome is diagnosed by the compiler ([[nodiscard]]), and the
  // build promotes that diagnostic to an error.
  template <typename T, typename E>
  class [[nodiscard]] Outcome {
    static_assert(!std::is_reference_v<T>, "Outcome cannot hold references");
    static_assert(!detail::IsUnexpected<T>::value, "Outcome value cannot be Unexpected");

  public:
    using value_type = T;
    using error_type = E;

    static Outcome Success(T value) { return Outcome(std::in_place_index<0>, std::move(value)); }
    static Outcome Failure(E error) { return Outcome(std::in_place_index<1>, std::move(error)); }

    template <typename U = T>
      requires(std::is_constructible_v<T, U &&> &&
               !std::is_same_v<std::remove_cvref_t<U>, Outcome> &&
               !detail::IsUnexpected<std::remove_cvref_t<U>>::value)
    Outcome(U&& value) : state_(std::in_place_index<0>, std::forward<U>(value)) {}

    template <typename G>
      requires std::is_constructible_v<E, G &&>
    Outcome(Unexpected<G> failure) : state_(std::in_place_index<1>, std::move(failure).Error()) {}

    bool IsSuccess() const noexcept { return state_.index() == 0; }
    bool IsFailure() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return IsSuccess(); }

    T* TryValue() noexcept { return std::get_if<0>(&state_); }
    const T* TryValue() const noexcept { return std::get_if<0>(&state_); }
    E* TryFault() noexcept { return std::get_if<1>(&state_); }
    const E* TryFault() const noexcept { return std::get_if<1>(&state_); }

    template <typename U>
    T ValueOr(U&& fallback) const& {
      if (const T* value = TryValue()) {
        return *value;
      }
      return static_cast<T>(std::forward<U>(fallback));
    }

    template <typename U>
    T ValueOr(U&& fallback) && {
      if (T* value = TryValue()) {
        return std::move(*value);
      }
      return static_cast<T>(std::forward<U>(fallback));
    }

    template <typename OnSuccess, typename OnFailure>
    auto Match(OnSuccess&& on_success, OnFailure&& on_failure) &&
        -> std::invoke_result_t<OnSuccess, T&&> {
      static_assert(std::is_same_v<std::invoke_result_t<OnSuccess, T&&>,
                                   std::invoke_result_t<OnFailure, E&&>>,
                    "Match handlers must return the same type");
      if (T* value = TryValue()) {
        return std::invoke(std::forward<OnSuccess>(on_success), std::move(*value));
      }
      return std::invoke(std::forward<OnFailure>(on_failure), std::move(*TryFault()));
    }

    template <typename OnSuccess, typename OnFailure>
    auto Match(OnSuccess&& on_success, OnFailure&& on_failure) const&
        -> std::invoke_result_t<OnSuccess, const T&> {
      static_assert(std::is_same_v<std::invoke_result_t<OnSuccess, const T&>,
                                   std::invoke_result_t<OnFailure, const E&>>,
                    "Match handlers must return the same type");
      if (const T* value = TryValue()) {
        return std::invoke(std::forward<OnSuccess>(on_success), *value);
      }
      return std::invoke(std::forward<OnFailure>(on_failure), *TryFault());
    }

    // Transforms the success value; a failure passes through untouched and
    // |fn| is never invoked.
    template <typename F>
    auto Map(F&& fn) && -> Outcome<std::invoke_result_t<F, T&&>, E> {
      using U = std::invoke_result_t<F, T&&>;
      if (T* value = TryValue()) {
        return Outcome<U, E>::Success(std::invoke(std::forward<F>(fn), std::move(*value)));
      }
      return Outcome<U, E>::Failure(std::move(*TryFault()));
    }

    // |fn| returns another Outcome with the same error type; the first failure
    // in a chain is the one that survives.
    template <typename F>
    auto AndThen(F&& fn) && -> std::invoke_result_t<F, T&&> {
      using Next = std::invoke_result_t<F, T&&>;
      static_assert(detail::IsOutcome<Next>::value, "AndThen continuation must return an Outcome");
      static_assert(std::is_same_v<typename Next::error_type, E>,
                    "AndThen continuation must keep the error type");
      if (T* value = TryValue()) {
        return std::invoke(std::forward<F>(fn), std::move(*value));
      }
      return Next::Failure(std::move(*TryFault()));
    }

    template <typename F>
    auto MapFault(F&& fn) && -> Outcome<T, std::invoke_result_t<F, E&&>> {
      using G = std::invoke_result_t<F, E&&>;
      if (T* value = TryValue()) {
        return Outcome<T, G>::Success(std::move(*value));
      }
      return Outcome<T, G>::Failure(std::invoke(std::forward<F>(fn), std::move(*TryFault())));
    }

    // Hands the failure (with |context| appended) back for the caller to
    // return; nullopt on success. The outcome must not be inspected after a
    // failure has been taken out.
    [[nodiscard]] std::optional<Unexpected<E>> Propagate(std::string_view context = {}) {
      E* error = TryFault();
      if (!error) {
        return std::nullopt;
      }
      E taken = std::move(*error);
      detail::AppendContext(taken, context);
      return Unexpected<E>(std::move(taken));
    }

    // The only sanctioned discard: records the failure once on |bus|,
    // regardless of the bus's severity filter. Returns true when the record
    // reached a subscriber; false for a success or when nothing received it.
    bool LogAndDrop(diagnostics::EventBus& bus, std::string_view operation) && {
      const E* error = TryFault();
      if (!error) {
        return false;
      }
      return bus.PublishRecord(MakeFailureEvent(*error, operation));
    }

  private:
    template <std::size_t I, typename... Args>
    explicit Outcome(std::in_place_index_t<I> tag, Args&&... args)
        : state_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> state_;
  };

} // namespace tg

#define TG_DETAIL_CONCAT_INNER(a, b) a##b
#define TG_DETAIL_CONCAT(a, b) TG_DETAIL_CONCAT_INNER(a, b)

// Evaluates |expr| (an Outcome); on failure returns it from the enclosing
// function with |context| appended.
#define TG_TRY_CONTEXT(expr, context)                                            \
  do {                                                                           \
    auto tg_try_outcome_ = (expr);                                               \
    if (auto tg_try_failure_ = tg_try_outcome_.Propagate(context)) {             \
      return *std::move(tg_try_failure_);                                        \
    }                                                                            \
  } while (0)

#define TG_TRY(expr) TG_TRY_CONTEXT(expr, std::string_view{})

// Declares or assigns |lhs| from the success value of |expr|, returning the
// failure from the enclosing function otherwise.
#define TG_TRY_ASSIGN(lhs, expr)                                       \
  TG_DETAIL_TRY_ASSIGN(TG_DETAIL_CONCAT(tg_try_assign_, __LINE__),     \
                       TG_DETAIL_CONCAT(tg_try_failure_, __LINE__), lhs, expr)

#define TG_DETAIL_TRY_ASSIGN(tmp, failure, lhs, expr)                  \
  auto tmp = (expr);                                                   \
  if (auto failure = tmp.Propagate()) {                                \
    return *std::move(failure);                                        \
  }                                                                    \
  lhs = std::move(*tmp.TryValue())
