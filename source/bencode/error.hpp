#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace bencode
{
enum class DecodeErrc : uint8_t
{
  EmptyInput,
  UnrecognizedType,
  EmptyInteger,
  MalformedInteger,
  InvalidLengthPrefix,
  TruncatedString,
  TruncatedDictionary,
  NonStringKey,
  DuplicateKey,
  UnorderedKeys,
  NestingTooDeep,
};

struct DecodeError
{
  DecodeErrc errc;
  size_t offset;  // absolute position in the top-level input

  bool operator==(const DecodeError&) const = default;
};

std::string_view to_string(DecodeErrc errc);

std::string to_string(const DecodeError& error);

}  // namespace bencode

template<>
struct fmt::formatter<bencode::DecodeErrc> : fmt::formatter<std::string_view>
{
  auto format(bencode::DecodeErrc errc, fmt::format_context& ctx) const
      -> fmt::format_context::iterator
  {
    return fmt::formatter<std::string_view>::format(bencode::to_string(errc),
                                                    ctx);
  }
};

template<>
struct fmt::formatter<bencode::DecodeError> : fmt::formatter<std::string_view>
{
  auto format(const bencode::DecodeError& error,
              fmt::format_context& ctx) const -> fmt::format_context::iterator
  {
    return fmt::formatter<std::string_view>::format(bencode::to_string(error),
                                                    ctx);
  }
};
