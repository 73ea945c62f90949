#include "bencode/error.hpp"

namespace bencode
{
std::string_view to_string(DecodeErrc errc)
{
  switch (errc) {
    case DecodeErrc::EmptyInput:
      return "EmptyInput";
    case DecodeErrc::UnrecognizedType:
      return "UnrecognizedType";
    case DecodeErrc::EmptyInteger:
      return "EmptyInteger";
    case DecodeErrc::MalformedInteger:
      return "MalformedInteger";
    case DecodeErrc::InvalidLengthPrefix:
      return "InvalidLengthPrefix";
    case DecodeErrc::TruncatedString:
      return "TruncatedString";
    case DecodeErrc::TruncatedDictionary:
      return "TruncatedDictionary";
    case DecodeErrc::NonStringKey:
      return "NonStringKey";
    case DecodeErrc::DuplicateKey:
      return "DuplicateKey";
    case DecodeErrc::UnorderedKeys:
      return "UnorderedKeys";
    case DecodeErrc::NestingTooDeep:
      return "NestingTooDeep";
  }

  return "Unknown";
}

std::string to_string(const DecodeError& error)
{
  return fmt::format("{} at offset {}", to_string(error.errc), error.offset);
}

}  // namespace bencode
