#pragma once

namespace bencode
{
constexpr char INT_PREFIX = 'i';
constexpr char LIST_PREFIX = 'l';
constexpr char DICT_PREFIX = 'd';
constexpr char SUFFIX = 'e';
constexpr char STRING_LENGTH_DELIMITER = ':';
constexpr char NEGATIVE_SIGN = '-';

constexpr bool is_digit(char c)
{
  return '0' <= c && c <= '9';
}

}  // namespace bencode
