#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

#include "bencode/error.hpp"
#include "bencode/value.hpp"

namespace bencode
{
enum class KeyOrder : uint8_t
{
  Strict,   // unsorted dictionary keys are an UnorderedKeys error
  Reorder,  // unsorted keys are accepted and stored sorted
};

struct DecoderOptions
{
  static constexpr int DEFAULT_MAX_DEPTH = 64;

  // Maximum number of nested lists/dictionaries.
  int max_depth = DEFAULT_MAX_DEPTH;

  KeyOrder key_order = KeyOrder::Strict;
};

struct DecodeResult
{
  BeValue result;
  size_t used_chars;
};

/*
 * Recursive descent decoder. Decodes exactly one value from the front of the
 * input and reports how many bytes it used; anything after it is left alone.
 */
class BDecoder
{
public:
  BDecoder() = default;

  explicit BDecoder(DecoderOptions options);

  std::expected<BeValue, DecodeError> operator()(std::string_view value) const;

  std::expected<DecodeResult, DecodeError> decode(std::string_view value) const;

  std::expected<DecodeResult, DecodeError> decode(
      std::span<const uint8_t> value) const;

  const DecoderOptions& options() const { return m_options; }

private:
  using Result = std::expected<DecodeResult, DecodeError>;

  Result decode_int(std::string_view value, size_t offset) const;
  Result decode_string(std::string_view value, size_t offset) const;
  Result decode_dict(std::string_view value, size_t offset, int depth) const;
  Result decode_list(std::string_view value, size_t offset, int depth) const;
  Result decode_value(std::string_view value, size_t offset, int depth) const;

  DecoderOptions m_options {};
};

std::expected<DecodeResult, DecodeError> decode(std::string_view input,
                                                DecoderOptions options = {});

}  // namespace bencode
