#pragma once

#include <exception>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace comic_mt {

struct StageFailure {
    std::string stage;
    std::string message;
};

// Outcome of one pipeline stage for one image (or one translation batch).
template <typename T>
class StageResult {
public:
    static StageResult success(T value) { return StageResult(std::move(value)); }
    static StageResult failure(std::string stage, std::string message) {
        return StageResult(StageFailure{std::move(stage), std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(state_); }
    const T& value() const { return std::get<T>(state_); }
    T take() { return std::move(std::get<T>(state_)); }

    const StageFailure& error() const { return std::get<StageFailure>(state_); }

private:
    explicit StageResult(T value) : state_(std::move(value)) {}
    explicit StageResult(StageFailure failure) : state_(std::move(failure)) {}

    std::variant<T, StageFailure> state_;
};

// Invokes a collaborator and converts anything it throws into a failure tagged with stage.
template <typename Fn>
auto run_stage(const std::string& stage, Fn&& fn) -> StageResult<std::invoke_result_t<Fn>> {
    using Result = StageResult<std::invoke_result_t<Fn>>;
    try {
        return Result::success(std::forward<Fn>(fn)());
    } catch (const std::exception& ex) {
        return Result::failure(stage, ex.what());
    } catch (...) {
        return Result::failure(stage, "Unknown " + stage + " error");
    }
}

}  // namespace comic_mt
