#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace agency {

struct StepTag {};
struct ExecutionTag {};
struct InvocationTag {};

// Phantom-typed string identifier; different tags do not convert.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs,
                                       const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using StepId = TypedId<StepTag>;
using ExecutionId = TypedId<ExecutionTag>;
using InvocationId = TypedId<InvocationTag>;

namespace detail {
inline auto generate_short_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}
}  // namespace detail

// "exec_<unix ms>_<8 hex>"
inline auto generate_execution_id() -> ExecutionId {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return ExecutionId{std::format("exec_{}_{}", ms, detail::generate_short_uuid())};
}

inline auto generate_invocation_id(const ExecutionId& execution_id)
    -> InvocationId {
  return InvocationId{std::format("{}_inv", execution_id.value())};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace agency

template <typename Tag>
struct std::hash<agency::TypedId<Tag>> {
  auto operator()(const agency::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<agency::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const agency::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
