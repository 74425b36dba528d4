// gql_coerce/ast/ast_context.hpp - Per-request arena
//
// One AstContext backs one request (or one field task when fields run in
// parallel). It holds the parser's nodes, the RawValues normalized from them
// or from variable JSON, and the strings both point into. Nothing is freed
// before the context itself.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gql_coerce
{

class AstNode;

/**
 * Monotonic arena for request-scoped data.
 *
 * Only trivially destructible types may live here since destructors are
 * never run. Not thread-safe.
 *
 * @code
 *   AstContext ctx;
 *   auto * n = ctx.create<IntValueNode>(42);
 *   std::string_view key = ctx.intern(json_key);
 *   gsl::span<RawValue> elems = ctx.allocate_array<RawValue>(3);
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), strings_(&arena_)
  {
  }

  // The pmr resource is pinned in place.
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /// Construct a node in the arena.
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "create<T>: T must be an AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "create<T>: nodes must be trivially destructible (use string_view / gsl::span members)");
    return new (raw_allocate<T>(1)) T(std::forward<Args>(args)...);
  }

  /// Copy s into the arena once; equal strings share storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (const auto found = strings_.find(s); found != strings_.end()) {
      return *found;
    }
    char * const buf = static_cast<char *>(arena_.allocate(s.empty() ? 1 : s.size(), 1));
    std::memcpy(buf, s.data(), s.size());
    return *strings_.emplace(buf, s.size()).first;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const { return strings_.count(s) != 0; }

  [[nodiscard]] size_t get_string_count() const noexcept { return strings_.size(); }

  /// n value-initialized elements.
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t n)
  {
    if (n == 0) return {};
    T * const first = raw_allocate<T>(n);
    std::uninitialized_value_construct_n(first, n);
    return gsl::span<T>(first, n);
  }

  /// Arena copy of vec's elements.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    if (vec.empty()) return {};
    T * const first = raw_allocate<T>(vec.size());
    std::uninitialized_copy(vec.begin(), vec.end(), first);
    return gsl::span<T>(first, vec.size());
  }

private:
  template <typename T>
  T * raw_allocate(size_t n)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena storage is never destroyed");
    return static_cast<T *>(arena_.allocate(sizeof(T) * n, alignof(T)));
  }

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> strings_;
};

}  // namespace gql_coerce
