#pragma once
#include <algorithm>
#include <bit>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string_view>
#include <type_traits>

namespace gatecore {

namespace detail {

template <typename T>
constexpr T to_big_endian(T value) noexcept {
    static_assert(std::is_integral_v<T>);
    if constexpr (std::endian::native == std::endian::little && sizeof(T) > 1) {
        using U = std::make_unsigned_t<T>;
        auto v = static_cast<U>(value);
        U r = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            r = static_cast<U>((r << 8) | (v & 0xff));
            v = static_cast<U>(v >> 8);
        }
        return static_cast<T>(r);
    } else {
        return value;
    }
}

}  // namespace detail

// 只读视图，按网络字节序读取
class read_buffer {
  public:
    constexpr read_buffer() = default;

    constexpr read_buffer(const void* ptr, size_t capacity) : ptr_(ptr), capacity_(capacity) {}

    constexpr explicit read_buffer(const std::string_view& strv) : ptr_(strv.data()), capacity_(strv.size()) {}

    [[nodiscard]] constexpr const uint8_t* begin() const { return static_cast<const uint8_t*>(ptr_); }

    [[nodiscard]] constexpr const uint8_t* end() const { return static_cast<const uint8_t*>(ptr_) + capacity_; }

    [[nodiscard]] constexpr const uint8_t* begin_read() const { return static_cast<const uint8_t*>(ptr_) + read_; }

    [[nodiscard]] constexpr size_t capacity() const { return capacity_; }

    [[nodiscard]] constexpr size_t readable() const { return capacity_ - read_; }

    inline size_t read(void* dest, size_t size) {
        size = (std::min)(readable(), size);
        if (size > 0) {
            std::memcpy(dest, begin_read(), size);
        }
        read_ += size;
        return size;
    }

    /**
     * \brief 读取一个大端整数
     * \return 剩余字节不足时返回false，读指针不移动
     */
    template <typename T>
    bool read_integer(T& value) {
        if (readable() < sizeof(T)) {
            return false;
        }

        T raw;
        std::memcpy(&raw, begin_read(), sizeof(T));
        read_ += sizeof(T);
        value = detail::to_big_endian(raw);
        return true;
    }

    constexpr read_buffer& operator+=(size_t bytes) noexcept {
        read_ = (std::min)(read_ + bytes, capacity_);
        return *this;
    }

    constexpr explicit operator std::string_view() const noexcept {
        if (const auto sz = readable(); sz > 0) {
            return {reinterpret_cast<const char*>(begin_read()), sz};
        }

        return {};
    }

  private:
    const void* ptr_{nullptr};
    size_t capacity_{0};
    size_t read_{0};
};

// 可增长的字节缓冲，带有前置空间用于回填包头
class byte_buffer {
  public:
    static constexpr size_t fixed_size = 256;

    explicit byte_buffer(size_t prependable = 0) {
        if (prependable > capacity_) {
            grow(prependable);
        }
        read_ = prependable;
        write_ = prependable;
    }

    byte_buffer(const void* ptr, size_t len) : byte_buffer(0) { append(ptr, len); }

    byte_buffer(const byte_buffer& other) : byte_buffer(0) {
        reserve(other.capacity_);
        read_ = other.read_;
        write_ = other.write_;
        std::memcpy(data_, other.data_, write_);
    }

    byte_buffer(byte_buffer&& other) noexcept : capacity_(other.capacity_), read_(other.read_), write_(other.write_) {
        if (other.data_ != other.store_) {
            data_ = other.data_;
        } else {
            std::memcpy(store_, other.store_, write_);
            data_ = store_;
        }
        other.data_ = other.store_;
        other.capacity_ = fixed_size;
        other.read_ = 0;
        other.write_ = 0;
    }

    ~byte_buffer() noexcept {
        if (data_ != store_) {
            alloc_.deallocate(data_, capacity_);
        }
    }

    byte_buffer& operator=(const byte_buffer& other) {
        if (this != std::addressof(other)) {
            reserve(other.capacity_);
            read_ = other.read_;
            write_ = other.write_;
            std::memcpy(data_, other.data_, write_);
        }
        return *this;
    }

    byte_buffer& operator=(byte_buffer&& other) noexcept {
        if (this != std::addressof(other)) {
            [[maybe_unused]] byte_buffer temp = std::move(*this);
            capacity_ = other.capacity_;
            read_ = other.read_;
            write_ = other.write_;
            if (other.data_ != other.store_) {
                data_ = other.data_;
            } else {
                std::memcpy(store_, other.store_, write_);
                data_ = store_;
            }
            other.data_ = other.store_;
            other.capacity_ = fixed_size;
            other.read_ = 0;
            other.write_ = 0;
        }
        return *this;
    }

    uint8_t* begin_read() { return data_ + read_; }

    uint8_t* begin_write() { return data_ + write_; }

    [[nodiscard]] const uint8_t* begin_read() const { return data_ + read_; }

    [[nodiscard]] const uint8_t* end_read() const { return data_ + write_; }

    [[nodiscard]] size_t readable() const { return write_ - read_; }

    [[nodiscard]] size_t writable() const { return capacity_ - write_; }

    [[nodiscard]] size_t prependable() const { return read_; }

    [[nodiscard]] size_t capacity() const { return capacity_; }

    explicit operator read_buffer() const noexcept { return {begin_read(), readable()}; }

    explicit operator std::string_view() const noexcept {
        return {reinterpret_cast<const char*>(begin_read()), readable()};
    }

    void clear(size_t prependable = 0) noexcept {
        prependable = (std::min)(prependable, capacity_);
        read_ = prependable;
        write_ = prependable;
    }

    void make_sure_writable(size_t len) {
        if (const auto sz = writable(); sz < len) {
            grow(capacity_ + len - sz);
        }
    }

    void reserve(size_t size) {
        if (size > capacity_) {
            grow(size);
        }
    }

    void append(const void* buf, size_t len) {
        if (len == 0) {
            return;
        }
        make_sure_writable(len);
        std::memmove(begin_write(), buf, len);
        write_ += len;
    }

    void append(std::string_view str) { append(str.data(), str.size()); }

    template <typename T>
    void write_integer(T value) {
        const T raw = detail::to_big_endian(value);
        append(&raw, sizeof(T));
    }

    bool prepend(const void* buf, size_t len) noexcept {
        if (prependable() < len) {
            return false;
        }

        std::memmove(begin_read() - len, buf, len);
        read_ -= len;
        return true;
    }

    void written(size_t sz) noexcept { write_ += (std::min)(sz, writable()); }

    void read(size_t sz) noexcept { read_ += (std::min)(sz, readable()); }

    // 把未读数据移动到头部
    void shrink() noexcept {
        if (read_ == 0) {
            return;
        }

        const auto size = readable();
        std::memmove(data_, begin_read(), size);
        read_ = 0;
        write_ = size;
    }

  private:
    void grow(size_t size) {
        size_t new_capacity = capacity_ + capacity_ / 2;
        if (size > new_capacity) {
            new_capacity = size;
        }

        uint8_t* new_data = alloc_.allocate(new_capacity);
        std::memcpy(new_data, data_, write_);

        if (data_ != store_) {
            alloc_.deallocate(data_, capacity_);
        }

        data_ = new_data;
        capacity_ = new_capacity;
    }

    uint8_t store_[fixed_size]{};
    uint8_t* data_{store_};
    size_t capacity_{fixed_size};
    size_t read_{0};
    size_t write_{0};
    std::allocator<uint8_t> alloc_;
};

using byte_buffer_ptr = std::shared_ptr<byte_buffer>;

}  // namespace gatecore
