#include <string>

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include "bencode/decoder.hpp"
#include "bencode/error.hpp"

using bencode::DecodeErrc;
using bencode::DecodeError;

TEST_CASE("Error kinds have names", "[error]")
{
  REQUIRE(bencode::to_string(DecodeErrc::EmptyInput) == "EmptyInput");
  REQUIRE(bencode::to_string(DecodeErrc::UnrecognizedType) == "UnrecognizedType");
  REQUIRE(bencode::to_string(DecodeErrc::EmptyInteger) == "EmptyInteger");
  REQUIRE(bencode::to_string(DecodeErrc::MalformedInteger) == "MalformedInteger");
  REQUIRE(bencode::to_string(DecodeErrc::InvalidLengthPrefix)
          == "InvalidLengthPrefix");
  REQUIRE(bencode::to_string(DecodeErrc::TruncatedString) == "TruncatedString");
  REQUIRE(bencode::to_string(DecodeErrc::TruncatedDictionary)
          == "TruncatedDictionary");
  REQUIRE(bencode::to_string(DecodeErrc::NonStringKey) == "NonStringKey");
  REQUIRE(bencode::to_string(DecodeErrc::DuplicateKey) == "DuplicateKey");
  REQUIRE(bencode::to_string(DecodeErrc::UnorderedKeys) == "UnorderedKeys");
  REQUIRE(bencode::to_string(DecodeErrc::NestingTooDeep) == "NestingTooDeep");
}

TEST_CASE("Errors format with their offset", "[error]")
{
  DecodeError error {DecodeErrc::TruncatedString, 5};

  REQUIRE(bencode::to_string(error) == "TruncatedString at offset 5");
  REQUIRE(fmt::format("{}", error) == "TruncatedString at offset 5");
  REQUIRE(fmt::format("[{}]", DecodeErrc::NonStringKey) == "[NonStringKey]");
}

TEST_CASE("Decode failure can be reported as text", "[error]")
{
  auto result = bencode::decode("l4:spami42");

  REQUIRE_FALSE(result.has_value());
  REQUIRE(fmt::format("decode failed: {}", result.error())
          == "decode failed: MalformedInteger at offset 10");
}
