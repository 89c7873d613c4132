#pragma once

#include <cstddef>

namespace excelcsv {
namespace core {

// C++17 下的只读视图，用于 SAX 回调传递属性数组
template<typename T>
class span {
public:
    using element_type = T;
    using size_type = std::size_t;
    using iterator = T*;

    constexpr span() noexcept : data_(nullptr), size_(0) {}
    constexpr span(T* data, size_type size) noexcept : data_(data), size_(size) {}

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }

    constexpr T* data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr T& operator[](size_type idx) const { return data_[idx]; }

private:
    T* data_;
    size_type size_;
};

}} // namespace excelcsv::core
