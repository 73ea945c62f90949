#pragma once

#include <cstddef>
#include <string>

#include <boost/variant.hpp>

#include "bencode/value.hpp"

namespace bencode
{
/*
 * Canonical encoder. Dict keeps its keys sorted and unique, so every value is
 * encodable and dictionaries always come out in raw byte key order.
 */
class BEncoder : public boost::static_visitor<std::string>
{
public:
  BEncoder() = default;

  std::string operator()(const BeValue& value) const;
  std::string operator()(Integer value) const;
  std::string operator()(const ByteString& value) const;
  std::string operator()(const List& values) const;
  std::string operator()(const Dict& values) const;
};

std::string encode(const BeValue& value);

/// Exact number of bytes encode() produces for the value.
size_t encoded_size(const BeValue& value);

}  // namespace bencode
