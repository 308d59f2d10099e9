/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_VERTEXARRAY_H_
#define _TERRA_GLOBE_VERTEXARRAY_H_

#include <cstddef>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace terra { namespace globe {
    template <typename T>
    class VertexArray final {
    public:
        using value_type = T;
        using iterator = T*;
        using const_iterator = const T*;

        VertexArray() = default;

        VertexArray(const VertexArray& other) : _size(other._size), _capacity(other._size), _data(other._size > 0 ? new T[other._size] : nullptr) {
            std::copy(other.begin(), other.end(), _data.get());
        }

        VertexArray(VertexArray&& other) noexcept : _size(other._size), _capacity(other._capacity), _data(std::move(other._data)) {
            other._size = other._capacity = 0;
        }

        VertexArray& operator = (const VertexArray& other) {
            if (this != &other) {
                VertexArray copy(other);
                swap(copy);
            }
            return *this;
        }

        VertexArray& operator = (VertexArray&& other) noexcept {
            VertexArray moved(std::move(other));
            swap(moved);
            return *this;
        }

        bool empty() const { return _size == 0; }
        std::size_t size() const { return _size; }
        std::size_t capacity() const { return _capacity; }

        const T* data() const { return _data.get(); }
        T* data() { return _data.get(); }

        const_iterator begin() const { return _data.get(); }
        const_iterator end() const { return _data.get() + _size; }
        const_iterator cbegin() const { return begin(); }
        const_iterator cend() const { return end(); }
        iterator begin() { return _data.get(); }
        iterator end() { return _data.get() + _size; }

        const T& operator [] (std::size_t i) const { return _data[i]; }
        T& operator [] (std::size_t i) { return _data[i]; }

        const T& at(std::size_t i) const {
            if (i >= _size) {
                throw std::out_of_range("VertexArray index out of range");
            }
            return _data[i];
        }

        const T& front() const { return _data[0]; }
        const T& back() const { return _data[_size - 1]; }

        void clear() {
            _size = 0;
        }

        void reserve(std::size_t capacity) {
            if (capacity > _capacity) {
                std::unique_ptr<T[]> data(new T[capacity]);
                std::move(begin(), end(), data.get());
                _data = std::move(data);
                _capacity = capacity;
            }
        }

        void resize(std::size_t size) {
            reserve(size);
            std::fill(_data.get() + std::min(_size, size), _data.get() + size, T());
            _size = size;
        }

        void shrink_to_fit() {
            if (_capacity > _size) {
                std::unique_ptr<T[]> data(_size > 0 ? new T[_size] : nullptr);
                std::move(begin(), end(), data.get());
                _data = std::move(data);
                _capacity = _size;
            }
        }

        void swap(VertexArray& other) noexcept {
            std::swap(_size, other._size);
            std::swap(_capacity, other._capacity);
            std::swap(_data, other._data);
        }

        template <typename... Args>
        void append(const Args&... values) {
            grow(_size + sizeof...(Args));
            appendValues(values...);
        }

        void fill(const T& value, std::size_t count) {
            grow(_size + count);
            std::fill(_data.get() + _size, _data.get() + _size + count, value);
            _size += count;
        }

    private:
        void grow(std::size_t size) {
            if (size > _capacity) {
                reserve(std::max(size, _capacity * 2));
            }
        }

        void appendValues() { }

        template <typename... Args>
        void appendValues(const T& value, const Args&... values) {
            _data[_size++] = value;
            appendValues(values...);
        }

        std::size_t _size = 0;
        std::size_t _capacity = 0;
        std::unique_ptr<T[]> _data;
    };

    template <typename T>
    bool operator == (const VertexArray<T>& array1, const VertexArray<T>& array2) {
        return array1.size() == array2.size() && std::equal(array1.begin(), array1.end(), array2.begin());
    }

    template <typename T>
    bool operator != (const VertexArray<T>& array1, const VertexArray<T>& array2) {
        return !(array1 == array2);
    }
} }

#endif
