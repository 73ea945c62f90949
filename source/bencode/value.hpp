#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/variant.hpp>

namespace bencode
{
// Dictionary keys compare as raw unsigned bytes (std::char_traits<char>::lt),
// so a Dict is always in canonical key order.
using BeValue = boost::make_recursive_variant<
    std::int64_t,
    std::string,
    std::map<std::string, boost::recursive_variant_, std::less<>>,
    std::vector<boost::recursive_variant_>>::type;

enum BeValueTypeIndex : uint8_t
{
  IInt64 = 0,
  IString = 1,
  IDict = 2,
  IList = 3,
};

using Integer = std::int64_t;

/// Raw bytes. Not guaranteed to be valid text, see as_text().
using ByteString = std::string;

using List = std::vector<BeValue>;

using Dict = std::map<std::string, BeValue, std::less<>>;

enum class ValueError : uint8_t
{
  WrongType,
  MissingField,
  DuplicateKey,
  NotText,
};

std::string_view to_string(BeValueTypeIndex index);

std::string_view to_string(ValueError error);

BeValueTypeIndex type_of(const BeValue& value);

BeValue make_bytes(std::span<const uint8_t> bytes);

/*
 * Builds a dictionary from entries in any order. Fails on a repeated key
 * instead of letting one entry silently replace another.
 */
std::expected<Dict, ValueError> make_dict(
    std::vector<std::pair<std::string, BeValue>> entries);

std::expected<Integer, ValueError> as_int(const BeValue& value);

std::expected<std::span<const uint8_t>, ValueError> as_bytes(
    const BeValue& value);

/// Views a byte string as text, failing with NotText unless it is valid UTF-8.
std::expected<std::string_view, ValueError> as_text(const BeValue& value);

std::expected<const List*, ValueError> as_list(const BeValue& value);

std::expected<const Dict*, ValueError> as_dict(const BeValue& value);

template<typename T>
std::expected<const T*, ValueError> get_field(const Dict& dict,
                                              std::string_view field_name)
{
  auto it = dict.find(field_name);
  if (it == dict.end())
    return std::unexpected {ValueError::MissingField};

  const T* field = boost::get<T>(&it->second);

  if (field == nullptr)
    return std::unexpected {ValueError::WrongType};

  return field;
}

}  // namespace bencode
