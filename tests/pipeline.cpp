#include "storyflow/pipeline.hpp"

#include "support.hpp"

#include <iostream>

using testing::expect;
using storyflow::ErrorKind;
using storyflow::Result;

int main() {
  try {
    auto ctx = storyflow::Context::quiet();

    // values flow from step to step
    auto ok = storyflow::start(ctx, "parse", [] { return Result<int>(20); })
                  .then("double", [](int v) { return Result<int>(v * 2); })
                  .then("render", [](int v) { return Result<std::string>(std::to_string(v + 2)); })
                  .finish();
    expect(ok.ok() && ok.value() == "42", "three steps");

    // the first error stops the chain and names its step
    int later_steps = 0;
    auto failed =
        storyflow::start(ctx, "load", [] { return Result<int>(1); })
            .then("check",
                  [](int) -> Result<int> {
                    return storyflow::make_error(ErrorKind::Validation, "bad input", "fix it");
                  })
            .then("write",
                  [&](int v) {
                    ++later_steps;
                    return Result<int>(v);
                  })
            .finish();
    expect(!failed.ok(), "error propagates");
    expect(later_steps == 0, "later steps skipped");
    expect(failed.error().step == "check", "step attached");
    expect(failed.error().kind == ErrorKind::Validation, "kind unchanged");
    expect(failed.error().hint == "fix it", "hint unchanged");
    expect(storyflow::describe(failed.error()).find("check") != std::string::npos, "describe");

    // a step name set deeper down is kept
    auto nested = storyflow::start(ctx, "outer", [] {
                    storyflow::Error e = storyflow::make_error(ErrorKind::Git, "clone failed");
                    e.step = "inner";
                    return Result<int>(std::move(e));
                  }).finish();
    expect(nested.error().step == "inner", "inner step kept");

    // void results
    bool ran = false;
    auto done = storyflow::start(ctx, "touch",
                                 [&]() -> Result<void> {
                                   ran = true;
                                   return {};
                                 })
                    .finish();
    expect(done.ok() && ran, "void step");

    expect(storyflow::exit_code_for(ErrorKind::Validation) == 1, "validation exit code");
    expect(storyflow::exit_code_for(ErrorKind::StateConflict) == 2, "conflict exit code");
    expect(storyflow::exit_code_for(ErrorKind::Git) == 3, "git exit code");
    expect(storyflow::exit_code_for(ErrorKind::Busy) == 4, "busy exit code");
    expect(storyflow::exit_code_for(ErrorKind::Timeout) == 4, "timeout exit code");

    std::cout << "pipeline test OK\n";
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
