#pragma once
#include "storyflow/context.hpp"
#include "storyflow/error.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace storyflow {

template <typename T> struct result_value;
template <typename T> struct result_value<Result<T>> {
  using type = T;
};

// Short-circuiting sequence of named steps. Each step receives the previous
// step's value and returns a Result; the first error stops the chain and is
// handed back unchanged apart from the step name. Nothing is rolled back.
template <typename T> class Pipeline {
public:
  Pipeline(Context& ctx, Result<T> state) : ctx_(&ctx), state_(std::move(state)) {}

  template <typename F> auto then(std::string_view step, F&& fn) && {
    using Next = typename result_value<std::invoke_result_t<F, T&&>>::type;
    if (!state_.ok()) {
      return Pipeline<Next>(*ctx_, Result<Next>(std::move(state_.error())));
    }
    ctx_->log().debug("step {}: start", step);
    Result<Next> next = std::forward<F>(fn)(std::move(state_).value());
    return Pipeline<Next>(*ctx_, settle(std::move(next), step));
  }

  Result<T> finish() && { return std::move(state_); }

private:
  template <typename U> Result<U> settle(Result<U> r, std::string_view step) {
    if (r.ok()) {
      ctx_->log().debug("step {}: ok", step);
      return r;
    }
    Error& err = r.error();
    if (err.step.empty())
      err.step = std::string(step);
    ctx_->log().error("step {} failed: {}", err.step, err.message);
    return r;
  }

  Context* ctx_;
  Result<T> state_;
};

// Run the first step of a pipeline.
template <typename F> auto start(Context& ctx, std::string_view step, F&& fn) {
  using First = typename result_value<std::invoke_result_t<F>>::type;
  struct Seed {};
  return Pipeline<Seed>(ctx, Result<Seed>(Seed{})).then(step, [&](Seed) -> Result<First> {
    return std::forward<F>(fn)();
  });
}

} // namespace storyflow
