#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace tabula {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values.
/// Element references go through the vector's reference types so that
/// Column<bool> (bit-packed storage) behaves like every other column.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;
    using reference = typename std::vector<T>::reference;
    using const_reference = typename std::vector<T>::const_reference;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    /// Number of elements.
    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    /// Whether the column is empty.
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Immutable element access (bounds-checked).
    [[nodiscard]] auto at(size_type idx) const -> const_reference { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const_reference {
        return data_[idx];
    }

    /// Unchecked mutable element access.
    [[nodiscard]] auto operator[](size_type idx) noexcept -> reference { return data_[idx]; }

    /// Read-only view of the underlying storage.
    [[nodiscard]] auto values() const noexcept -> const std::vector<T>& { return data_; }

    /// Append a value.
    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    /// Construct a value in-place.
    template <typename... Args>
        requires std::constructible_from<T, Args...>
    void emplace_back(Args&&... args) {
        data_.emplace_back(std::forward<Args>(args)...);
    }

    /// Reserve capacity.
    void reserve(size_type capacity) { data_.reserve(capacity); }

    /// Remove all elements.
    void clear() noexcept { data_.clear(); }

    /// Gather the elements at `positions` (in that order) into a new column.
    [[nodiscard]] auto take(std::span<const std::size_t> positions) const -> Column<T> {
        std::vector<T> result;
        result.reserve(positions.size());
        for (auto pos : positions) {
            result.push_back(data_.at(pos));
        }
        return Column<T>{std::move(result)};
    }

    /// Evaluate a predicate per element into a boolean mask.
    template <std::predicate<const T&> Pred>
    [[nodiscard]] auto mask(Pred pred) const -> std::vector<bool> {
        std::vector<bool> result;
        result.reserve(data_.size());
        for (const auto& value : data_) {
            result.push_back(pred(value));
        }
        return result;
    }

    auto operator==(const Column&) const -> bool = default;

    // Iterator support
    [[nodiscard]] auto begin() noexcept { return data_.begin(); }
    [[nodiscard]] auto end() noexcept { return data_.end(); }
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

}  // namespace tabula
