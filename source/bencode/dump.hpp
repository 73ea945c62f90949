#pragma once

#include <cstddef>
#include <string>

#include "bencode/value.hpp"

namespace bencode
{
/*
 * Readable rendering of a value for logs and diagnostics. Not Bencode and not
 * meant to be parsed back; use encode() for that.
 */
struct DumpOptions
{
  // Containers nested deeper than this are shown as "..."
  size_t max_depth = 16;

  // Per container, 0 means unlimited
  size_t max_items = 64;

  // Per string, 0 means unlimited
  size_t max_string_bytes = 64;

  bool multiline = true;

  size_t indent_spaces = 2;
};

std::string dump(const BeValue& value, DumpOptions options = {});

}  // namespace bencode
