#include "bencode/encoder.hpp"

#include "bencode/tokens.hpp"

namespace bencode
{
namespace
{
size_t decimal_digits(Integer value)
{
  // Sign counts as a character; INT64_MIN can't be negated, so count on the
  // unsigned magnitude.
  size_t count = value < 0 ? 2 : 1;
  auto magnitude = value < 0 ? 0 - static_cast<uint64_t>(value)
                             : static_cast<uint64_t>(value);

  while (magnitude >= 10) {
    magnitude /= 10;
    count++;
  }

  return count;
}

class SizeCounter : public boost::static_visitor<size_t>
{
public:
  SizeCounter() = default;

  size_t operator()(Integer value) const { return decimal_digits(value) + 2; }

  size_t operator()(const ByteString& value) const
  {
    return decimal_digits(static_cast<Integer>(value.length())) + 1
        + value.length();
  }

  size_t operator()(const List& values) const
  {
    size_t size = 2;
    for (const auto& value : values) {
      size += boost::apply_visitor(*this, value);
    }

    return size;
  }

  size_t operator()(const Dict& values) const
  {
    size_t size = 2;
    for (const auto& [key, value] : values) {
      size += (*this)(key) + boost::apply_visitor(*this, value);
    }

    return size;
  }
};

class Appender : public boost::static_visitor<void>
{
public:
  explicit Appender(std::string& out)
      : m_out {out}
  {
  }

  void operator()(Integer value) const
  {
    m_out += INT_PREFIX;
    m_out += std::to_string(value);
    m_out += SUFFIX;
  }

  void operator()(const ByteString& value) const
  {
    m_out += std::to_string(value.length());
    m_out += STRING_LENGTH_DELIMITER;
    m_out += value;
  }

  void operator()(const List& values) const
  {
    m_out += LIST_PREFIX;

    for (const auto& value : values) {
      boost::apply_visitor(*this, value);
    }

    m_out += SUFFIX;
  }

  void operator()(const Dict& values) const
  {
    m_out += DICT_PREFIX;

    for (const auto& [key, value] : values) {
      (*this)(key);
      boost::apply_visitor(*this, value);
    }

    m_out += SUFFIX;
  }

private:
  std::string& m_out;
};

template<typename T>
std::string encode_alternative(const T& value)
{
  std::string out;
  out.reserve(SizeCounter()(value));
  Appender {out}(value);

  return out;
}
}  // namespace

std::string BEncoder::operator()(const BeValue& value) const
{
  return boost::apply_visitor(*this, value);
}

std::string BEncoder::operator()(Integer value) const
{
  return encode_alternative(value);
}

std::string BEncoder::operator()(const ByteString& value) const
{
  return encode_alternative(value);
}

std::string BEncoder::operator()(const List& values) const
{
  return encode_alternative(values);
}

std::string BEncoder::operator()(const Dict& values) const
{
  return encode_alternative(values);
}

std::string encode(const BeValue& value)
{
  return BEncoder()(value);
}

size_t encoded_size(const BeValue& value)
{
  return boost::apply_visitor(SizeCounter(), value);
}

}  // namespace bencode
