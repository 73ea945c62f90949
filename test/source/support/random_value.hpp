#pragma once

#include <cstdint>
#include <limits>
#include <random>
#include <string>

#include "bencode/value.hpp"

/*
 * Deterministic generator of value trees. Fixed seed so a failing case can be
 * reproduced.
 */
class RandomValueGenerator
{
public:
  explicit RandomValueGenerator(uint32_t seed)
      : m_rng {seed}
  {
  }

  template<typename T>
  T generate_in_range(T min, T max)
  {
    std::uniform_int_distribution<T> uni {min, max};
    return uni(m_rng);
  }

  bencode::BeValue generate(int max_depth)
  {
    auto kind = generate_in_range<int>(0, max_depth > 0 ? 3 : 1);

    switch (kind) {
      case 0:
        return generate_integer();
      case 1:
        return generate_bytes(32);
      case 2: {
        bencode::List list {};
        auto count = generate_in_range<size_t>(0, 5);
        for (size_t i = 0; i < count; i++) {
          list.push_back(generate(max_depth - 1));
        }
        return list;
      }
      default: {
        bencode::Dict dict {};
        auto count = generate_in_range<size_t>(0, 5);
        for (size_t i = 0; i < count; i++) {
          dict.insert_or_assign(generate_bytes(8), generate(max_depth - 1));
        }
        return dict;
      }
    }
  }

private:
  bencode::Integer generate_integer()
  {
    switch (generate_in_range<int>(0, 3)) {
      case 0:
        return std::numeric_limits<bencode::Integer>::min();
      case 1:
        return std::numeric_limits<bencode::Integer>::max();
      case 2:
        return generate_in_range<bencode::Integer>(-1000, 1000);
      default:
        return generate_in_range<bencode::Integer>(
            std::numeric_limits<bencode::Integer>::min(),
            std::numeric_limits<bencode::Integer>::max());
    }
  }

  // Full byte range, so keys and values are usually not text
  bencode::ByteString generate_bytes(size_t max_length)
  {
    bencode::ByteString bytes(generate_in_range<size_t>(0, max_length), '\0');
    for (auto& byte : bytes) {
      byte = static_cast<char>(generate_in_range<int>(0, 255));
    }

    return bytes;
  }

  std::mt19937 m_rng;
};
