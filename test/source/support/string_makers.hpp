#pragma once

#include <string>

#include <catch2/catch_tostring.hpp>

#include "bencode/dump.hpp"
#include "bencode/error.hpp"
#include "bencode/value.hpp"

namespace Catch
{
template<>
struct StringMaker<bencode::BeValue>
{
  static std::string convert(const bencode::BeValue& value)
  {
    return bencode::dump(value, {.multiline = false});
  }
};

template<>
struct StringMaker<bencode::DecodeErrc>
{
  static std::string convert(bencode::DecodeErrc errc)
  {
    return std::string {bencode::to_string(errc)};
  }
};

template<>
struct StringMaker<bencode::DecodeError>
{
  static std::string convert(const bencode::DecodeError& error)
  {
    return bencode::to_string(error);
  }
};

template<>
struct StringMaker<bencode::ValueError>
{
  static std::string convert(bencode::ValueError error)
  {
    return std::string {bencode::to_string(error)};
  }
};
}  // namespace Catch
