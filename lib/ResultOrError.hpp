#ifndef VNC_LEDGER_RESULT_OR_ERROR_HPP
#define VNC_LEDGER_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace vnc {

/**
 * Common base for module error types.
 * Modules derive their own Error from it so results from different modules
 * do not silently convert into each other.
 */
struct RoeErrorBase {
  int32_t code{ 0 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : code(-1), message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : code(-1), message(std::move(msg)) {}
};

/**
 * Value-or-error result type.
 *
 * A function returning ResultOrError<T, E> either returns a T (implicitly
 * converted) or an E (implicitly converted, or via error()).
 */
template <typename T, typename E = RoeErrorBase> class ResultOrError {
public:
  ResultOrError(const T &value) : storage_(std::in_place_index<0>, value) {}
  ResultOrError(T &&value) : storage_(std::in_place_index<0>, std::move(value)) {}
  ResultOrError(const E &err) : storage_(std::in_place_index<1>, err) {}
  ResultOrError(E &&err) : storage_(std::in_place_index<1>, std::move(err)) {}

  static ResultOrError error(const E &err) { return ResultOrError(err); }
  static ResultOrError error(E &&err) { return ResultOrError(std::move(err)); }

  bool isOk() const { return storage_.index() == 0; }
  bool isError() const { return storage_.index() == 1; }
  explicit operator bool() const { return isOk(); }

  const T &value() const {
    if (!isOk()) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return std::get<0>(storage_);
  }

  T &value() {
    if (!isOk()) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return std::get<0>(storage_);
  }

  T valueOr(const T &defaultValue) const { return isOk() ? value() : defaultValue; }

  const E &error() const {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return std::get<1>(storage_);
  }

  E &error() {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return std::get<1>(storage_);
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }
  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  std::variant<T, E> storage_;
};

// Specialization for operations that only report success or failure
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() = default;
  ResultOrError(const E &err) : error_(err) {}
  ResultOrError(E &&err) : error_(std::move(err)) {}

  static ResultOrError error(const E &err) { return ResultOrError(err); }
  static ResultOrError error(E &&err) { return ResultOrError(std::move(err)); }

  bool isOk() const { return !error_.has_value(); }
  bool isError() const { return error_.has_value(); }
  explicit operator bool() const { return isOk(); }

  const E &error() const {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return *error_;
  }

  E &error() {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return *error_;
  }

private:
  std::optional<E> error_;
};

} // namespace vnc

#endif // VNC_LEDGER_RESULT_OR_ERROR_HPP
