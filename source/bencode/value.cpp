#include "bencode/value.hpp"

namespace bencode
{
namespace
{
// Number of continuation bytes announced by a UTF-8 lead byte, or -1 when the
// byte can't start a sequence.
int utf8_continuation_count(uint8_t lead)
{
  if (lead < 0x80)
    return 0;
  if (lead >= 0xC2 && lead <= 0xDF)
    return 1;
  if (lead >= 0xE0 && lead <= 0xEF)
    return 2;
  if (lead >= 0xF0 && lead <= 0xF4)
    return 3;

  return -1;
}

bool is_valid_utf8(std::string_view bytes)
{
  size_t index = 0;

  while (index < bytes.length()) {
    auto lead = static_cast<uint8_t>(bytes[index]);
    int continuation = utf8_continuation_count(lead);

    if (continuation < 0
        || bytes.length() - index <= static_cast<size_t>(continuation))
    {
      return false;
    }

    // Second byte range excludes overlong forms and UTF-16 surrogates.
    uint8_t min_second = 0x80;
    uint8_t max_second = 0xBF;
    if (lead == 0xE0)
      min_second = 0xA0;
    else if (lead == 0xED)
      max_second = 0x9F;
    else if (lead == 0xF0)
      min_second = 0x90;
    else if (lead == 0xF4)
      max_second = 0x8F;

    for (int i = 1; i <= continuation; i++) {
      auto byte = static_cast<uint8_t>(bytes[index + i]);
      uint8_t low = (i == 1) ? min_second : 0x80;
      uint8_t high = (i == 1) ? max_second : 0xBF;
      if (byte < low || byte > high)
        return false;
    }

    index += continuation + 1;
  }

  return true;
}
}  // namespace

std::string_view to_string(BeValueTypeIndex index)
{
  switch (index) {
    case BeValueTypeIndex::IInt64:
      return "integer";
    case BeValueTypeIndex::IString:
      return "string";
    case BeValueTypeIndex::IDict:
      return "dictionary";
    case BeValueTypeIndex::IList:
      return "list";
  }

  return "unknown";
}

std::string_view to_string(ValueError error)
{
  switch (error) {
    case ValueError::WrongType:
      return "WrongType";
    case ValueError::MissingField:
      return "MissingField";
    case ValueError::DuplicateKey:
      return "DuplicateKey";
    case ValueError::NotText:
      return "NotText";
  }

  return "Unknown";
}

BeValueTypeIndex type_of(const BeValue& value)
{
  return static_cast<BeValueTypeIndex>(value.which());
}

BeValue make_bytes(std::span<const uint8_t> bytes)
{
  return ByteString(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::expected<Dict, ValueError> make_dict(
    std::vector<std::pair<std::string, BeValue>> entries)
{
  Dict dict {};

  for (auto& [key, value] : entries) {
    auto [it, inserted] = dict.try_emplace(std::move(key), std::move(value));
    if (!inserted)
      return std::unexpected {ValueError::DuplicateKey};
  }

  return dict;
}

std::expected<Integer, ValueError> as_int(const BeValue& value)
{
  const Integer* integer = boost::get<Integer>(&value);
  if (integer == nullptr)
    return std::unexpected {ValueError::WrongType};

  return *integer;
}

std::expected<std::span<const uint8_t>, ValueError> as_bytes(
    const BeValue& value)
{
  const ByteString* bytes = boost::get<ByteString>(&value);
  if (bytes == nullptr)
    return std::unexpected {ValueError::WrongType};

  return std::span<const uint8_t> {
      reinterpret_cast<const uint8_t*>(bytes->data()), bytes->size()};
}

std::expected<std::string_view, ValueError> as_text(const BeValue& value)
{
  const ByteString* bytes = boost::get<ByteString>(&value);
  if (bytes == nullptr)
    return std::unexpected {ValueError::WrongType};

  if (!is_valid_utf8(*bytes))
    return std::unexpected {ValueError::NotText};

  return std::string_view {*bytes};
}

std::expected<const List*, ValueError> as_list(const BeValue& value)
{
  const List* list = boost::get<List>(&value);
  if (list == nullptr)
    return std::unexpected {ValueError::WrongType};

  return list;
}

std::expected<const Dict*, ValueError> as_dict(const BeValue& value)
{
  const Dict* dict = boost::get<Dict>(&value);
  if (dict == nullptr)
    return std::unexpected {ValueError::WrongType};

  return dict;
}

}  // namespace bencode
