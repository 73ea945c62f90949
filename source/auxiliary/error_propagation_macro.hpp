#pragma once

#include <expected>
#include <utility>

// Evaluates an expression yielding std::expected. On error returns the error
// from the enclosing function, otherwise evaluates to the contained value.
#define BENCODE_TRY(m) \
  ({ \
    auto bencode_try_result = (m); \
    if (!bencode_try_result.has_value()) \
      return std::unexpected(std::move(bencode_try_result).error()); \
    std::move(bencode_try_result).value(); \
  })
