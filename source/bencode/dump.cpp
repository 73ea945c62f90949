#include <algorithm>
#include <iterator>

#include "bencode/dump.hpp"

#include <fmt/format.h>

namespace bencode
{
namespace
{
bool is_printable(std::string_view bytes)
{
  return std::all_of(bytes.begin(), bytes.end(), [](char c) {
    auto byte = static_cast<uint8_t>(c);
    return byte >= 0x20 && byte < 0x7F;
  });
}

class Dumper : public boost::static_visitor<void>
{
public:
  Dumper(const DumpOptions& options, std::string& out, size_t depth)
      : m_options {options}
      , m_out {out}
      , m_depth {depth}
  {
  }

  void operator()(Integer value) const
  {
    fmt::format_to(std::back_inserter(m_out), "{}", value);
  }

  void operator()(const ByteString& value) const
  {
    std::string_view shown {value};
    bool truncated = false;
    if (m_options.max_string_bytes != 0
        && value.length() > m_options.max_string_bytes)
    {
      shown = shown.substr(0, m_options.max_string_bytes);
      truncated = true;
    }

    if (is_printable(value)) {
      m_out += '"';
      for (char c : shown) {
        if (c == '"' || c == '\\') {
          m_out += '\\';
        }
        m_out += c;
      }
      m_out += truncated ? "...\"" : "\"";

      if (truncated) {
        fmt::format_to(
            std::back_inserter(m_out), " ({} bytes)", value.length());
      }
      return;
    }

    fmt::format_to(std::back_inserter(m_out), "<{} bytes: ", value.length());
    for (char c : shown) {
      fmt::format_to(
          std::back_inserter(m_out), "{:02x}", static_cast<uint8_t>(c));
    }
    m_out += truncated ? "...>" : ">";
  }

  void operator()(const List& values) const
  {
    write_container(values, '[', ']', [this](const BeValue& value) {
      boost::apply_visitor(nested(), value);
    });
  }

  void operator()(const Dict& values) const
  {
    write_container(values, '{', '}', [this](const auto& entry) {
      (*this)(entry.first);
      m_out += ": ";
      boost::apply_visitor(nested(), entry.second);
    });
  }

private:
  Dumper nested() const { return Dumper {m_options, m_out, m_depth + 1}; }

  void new_line(size_t depth) const
  {
    m_out += '\n';
    m_out.append(depth * m_options.indent_spaces, ' ');
  }

  template<typename Container, typename WriteItem>
  void write_container(const Container& items,
                       char open,
                       char close,
                       WriteItem write_item) const
  {
    m_out += open;

    if (items.empty()) {
      m_out += close;
      return;
    }

    if (m_depth >= m_options.max_depth) {
      m_out += "...";
      m_out += close;
      return;
    }

    size_t count = 0;
    for (const auto& item : items) {
      if (count > 0) {
        m_out += m_options.multiline ? "," : ", ";
      }
      if (m_options.multiline) {
        new_line(m_depth + 1);
      }

      if (m_options.max_items != 0 && count == m_options.max_items) {
        fmt::format_to(std::back_inserter(m_out),
                       "... ({} more)",
                       items.size() - count);
        break;
      }

      write_item(item);
      count++;
    }

    if (m_options.multiline) {
      new_line(m_depth);
    }
    m_out += close;
  }

  const DumpOptions& m_options;
  std::string& m_out;
  size_t m_depth;
};
}  // namespace

std::string dump(const BeValue& value, DumpOptions options)
{
  std::string out;
  boost::apply_visitor(Dumper {options, out, 0}, value);

  return out;
}

}  // namespace bencode
