#pragma once
#include <algorithm>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <vector>

namespace swipe {

  // Row-major dense matrix. One row per embedding.
  template <typename T> class Matrix {
  public:
    using value_type = T;
    using Scalar = T;

    Matrix() = default;

    Matrix(size_t rows, size_t cols) : rows_(rows), cols_(cols), data_(rows * cols) {}

    Matrix(size_t rows, size_t cols, const T* src)
        : rows_(rows), cols_(cols), data_(src, src + rows * cols) {}

    [[nodiscard]] size_t rows() const noexcept { return rows_; }
    [[nodiscard]] size_t cols() const noexcept { return cols_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_ == 0; }

    [[nodiscard]] T* data() noexcept { return data_.data(); }
    [[nodiscard]] const T* data() const noexcept { return data_.data(); }

    T& operator()(size_t row, size_t col) { return data_[row * cols_ + col]; }
    const T& operator()(size_t row, size_t col) const { return data_[row * cols_ + col]; }

    [[nodiscard]] std::span<T> row(size_t r) noexcept {
      return {data_.data() + r * cols_, cols_};
    }
    [[nodiscard]] std::span<const T> row(size_t r) const noexcept {
      return {data_.data() + r * cols_, cols_};
    }

    // The first appended row fixes the column count of an empty matrix.
    void append_row(std::span<const T> values) {
      if (rows_ == 0 && cols_ == 0) {
        cols_ = values.size();
      }
      if (values.size() != cols_) [[unlikely]] {
        throw std::invalid_argument("row width does not match matrix columns");
      }
      data_.insert(data_.end(), values.begin(), values.end());
      ++rows_;
    }

    void reserve_rows(size_t rows) { data_.reserve(rows * cols_); }

    void resize(size_t rows, size_t cols) {
      rows_ = rows;
      cols_ = cols;
      data_.resize(rows * cols);
    }

  private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<T> data_;
  };

  template <typename Scalar> using EmbeddingMatrix = Matrix<Scalar>;

}  // namespace swipe
