#include <charconv>
#include <system_error>
#include <utility>

#include "bencode/decoder.hpp"

#include "auxiliary/error_propagation_macro.hpp"
#include "bencode/tokens.hpp"

namespace bencode
{
namespace
{
std::unexpected<DecodeError> fail(DecodeErrc errc, size_t offset)
{
  return std::unexpected {DecodeError {.errc = errc, .offset = offset}};
}

bool is_string_prefix(char c)
{
  // '-' is routed to the string decoder so negative lengths get a precise error
  return is_digit(c) || c == NEGATIVE_SIGN;
}

/*
 * Checks whether the container being decoded ends at `index`.
 * true: the terminator is there. false: another element follows.
 */
std::expected<bool, DecodeError> reached_suffix(std::string_view value,
                                                size_t index,
                                                size_t offset,
                                                DecodeErrc on_exhausted)
{
  if (index >= value.length()) {
    return fail(on_exhausted, offset + index);
  }

  return value[index] == SUFFIX;
}
}  // namespace

BDecoder::BDecoder(DecoderOptions options)
    : m_options {options}
{
}

BDecoder::Result BDecoder::decode_int(std::string_view value,
                                      size_t offset) const
{
  auto end_index = value.find(SUFFIX, 1);
  if (end_index == std::string_view::npos) {
    return fail(DecodeErrc::MalformedInteger, offset + value.length());
  }

  auto digits = value.substr(1, end_index - 1);
  auto digits_offset = offset + 1;

  if (digits.empty()) {
    return fail(DecodeErrc::EmptyInteger, digits_offset);
  }

  size_t first_digit = 0;
  if (digits.front() == NEGATIVE_SIGN) {
    // Rejects "-", "-0" and "-0..." alike
    if (digits.length() == 1 || digits[1] == '0') {
      return fail(DecodeErrc::MalformedInteger, digits_offset + 1);
    }
    first_digit = 1;
  } else if (digits.front() == '0' && digits.length() > 1) {
    return fail(DecodeErrc::MalformedInteger, digits_offset);
  }

  for (size_t i = first_digit; i < digits.length(); i++) {
    if (!is_digit(digits[i])) {
      return fail(DecodeErrc::MalformedInteger, digits_offset + i);
    }
  }

  Integer int_value {};
  auto result = std::from_chars(
      digits.data(), digits.data() + digits.length(), int_value);

  if (result.ec != std::errc {} || result.ptr != digits.data() + digits.length())
  {
    return fail(DecodeErrc::MalformedInteger, digits_offset);
  }

  return DecodeResult {.result = int_value, .used_chars = end_index + 1};
}

BDecoder::Result BDecoder::decode_string(std::string_view value,
                                         size_t offset) const
{
  size_t index_of_delimiter = 0;
  while (index_of_delimiter < value.length()
         && is_digit(value[index_of_delimiter]))
  {
    index_of_delimiter++;
  }

  if (index_of_delimiter == value.length()) {
    return fail(DecodeErrc::TruncatedString, offset + index_of_delimiter);
  }

  if (index_of_delimiter == 0
      || value[index_of_delimiter] != STRING_LENGTH_DELIMITER)
  {
    return fail(DecodeErrc::InvalidLengthPrefix, offset + index_of_delimiter);
  }

  size_t length {};
  auto result =
      std::from_chars(value.data(), value.data() + index_of_delimiter, length);

  if (result.ec != std::errc {}) {
    return fail(DecodeErrc::InvalidLengthPrefix, offset);
  }

  ++index_of_delimiter;

  if (length > value.length() - index_of_delimiter) {
    return fail(DecodeErrc::TruncatedString, offset + value.length());
  }

  return DecodeResult {
      .result = ByteString(value.substr(index_of_delimiter, length)),
      .used_chars = index_of_delimiter + length};
}

BDecoder::Result BDecoder::decode_dict(std::string_view value,
                                       size_t offset,
                                       int depth) const
{
  Dict values {};
  size_t index = 1;

  while (!BENCODE_TRY(reached_suffix(
      value, index, offset, DecodeErrc::TruncatedDictionary)))
  {
    auto key_offset = offset + index;
    auto key_prefix = value[index];

    if (key_prefix == INT_PREFIX || key_prefix == LIST_PREFIX
        || key_prefix == DICT_PREFIX)
    {
      return fail(DecodeErrc::NonStringKey, key_offset);
    }
    if (!is_string_prefix(key_prefix)) {
      return fail(DecodeErrc::UnrecognizedType, key_offset);
    }

    auto [key, key_used_chars] =
        BENCODE_TRY(decode_string(value.substr(index), key_offset));
    auto key_bytes = std::move(boost::get<ByteString>(key));
    index += key_used_chars;

    if (values.contains(key_bytes)) {
      return fail(DecodeErrc::DuplicateKey, key_offset);
    }
    // Every earlier key was accepted in order, so the last one is the largest
    if (m_options.key_order == KeyOrder::Strict && !values.empty()
        && key_bytes < values.rbegin()->first)
    {
      return fail(DecodeErrc::UnorderedKeys, key_offset);
    }

    // A key must be followed by a value before the dictionary may end
    if (BENCODE_TRY(reached_suffix(
            value, index, offset, DecodeErrc::TruncatedDictionary)))
    {
      return fail(DecodeErrc::TruncatedDictionary, offset + index);
    }

    auto [val, val_used_chars] =
        BENCODE_TRY(decode_value(value.substr(index), offset + index, depth));

    values.emplace(std::move(key_bytes), std::move(val));

    index += val_used_chars;
  }

  return DecodeResult {.result = std::move(values), .used_chars = ++index};
}

BDecoder::Result BDecoder::decode_list(std::string_view value,
                                       size_t offset,
                                       int depth) const
{
  List values {};
  size_t index = 1;

  while (!BENCODE_TRY(
      reached_suffix(value, index, offset, DecodeErrc::EmptyInput)))
  {
    auto [result, used_chars] =
        BENCODE_TRY(decode_value(value.substr(index), offset + index, depth));
    values.push_back(std::move(result));
    index += used_chars;
  }

  return DecodeResult {.result = std::move(values), .used_chars = ++index};
}

BDecoder::Result BDecoder::decode_value(std::string_view value,
                                        size_t offset,
                                        int depth) const
{
  if (value.empty()) {
    return fail(DecodeErrc::EmptyInput, offset);
  }

  switch (value.front()) {
    case INT_PREFIX:
      return decode_int(value, offset);
    case DICT_PREFIX:
      if (depth >= m_options.max_depth) {
        return fail(DecodeErrc::NestingTooDeep, offset);
      }
      return decode_dict(value, offset, depth + 1);
    case LIST_PREFIX:
      if (depth >= m_options.max_depth) {
        return fail(DecodeErrc::NestingTooDeep, offset);
      }
      return decode_list(value, offset, depth + 1);
    default:
      if (is_string_prefix(value.front())) {
        return decode_string(value, offset);
      }

      return fail(DecodeErrc::UnrecognizedType, offset);
  }
}

std::expected<DecodeResult, DecodeError> BDecoder::decode(
    std::string_view value) const
{
  return decode_value(value, 0, 0);
}

std::expected<DecodeResult, DecodeError> BDecoder::decode(
    std::span<const uint8_t> value) const
{
  return decode(std::string_view {reinterpret_cast<const char*>(value.data()),
                                  value.size()});
}

std::expected<BeValue, DecodeError> BDecoder::operator()(
    std::string_view value) const
{
  return BENCODE_TRY(decode(value)).result;
}

std::expected<DecodeResult, DecodeError> decode(std::string_view input,
                                                DecoderOptions options)
{
  return BDecoder {options}.decode(input);
}

}  // namespace bencode
