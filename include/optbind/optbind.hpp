#ifndef OPTBIND_HPP
#define OPTBIND_HPP

#pragma once

#include <algorithm>
#include <any>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

// optbind resolves a flat list of command-line tokens against a set of
// declared options. Declaration happens once through the builders on `parser`,
// resolution happens per call to `parser::parse` and never touches the parser.
//
// Only options are resolved here: positional arguments are handed back
// untouched in `parse_result::positionals()` and help/usage rendering is left
// to whoever reads `parser::definitions()`.

#define OPTBIND_VERSION_MAJOR 0
#define OPTBIND_VERSION_MINOR 1
#define OPTBIND_VERSION_PATCH 0

#define OPTBIND_CONCAT_V_(mj, mi, pa) v_##mj##_##mi##_##pa
#define OPTBIND_CONCAT_V(mj, mi, pa) OPTBIND_CONCAT_V_(mj, mi, pa)

// using c++20 inline nested namespace extension.
#define OPTBIND_SET_NAMESPACE                                                  \
  namespace optbind::inline OPTBIND_CONCAT_V(OPTBIND_VERSION_MAJOR,            \
                                             OPTBIND_VERSION_MINOR,            \
                                             OPTBIND_VERSION_PATCH)

// 1: resolution decisions, 2: token classification, 3: token stream mechanics
#ifndef OPTBIND_DEBUG_LEVEL
#define OPTBIND_DEBUG_LEVEL 0
#endif

#define OPTBIND_DEBUG_L1(...)                                                  \
  do                                                                           \
  {                                                                            \
    if constexpr(OPTBIND_DEBUG_LEVEL >= 1)                                     \
      std::cerr << "[optbind:L1] " << fmt::format(__VA_ARGS__) << "\n";       \
  } while(false)

#define OPTBIND_DEBUG_L2(...)                                                  \
  do                                                                           \
  {                                                                            \
    if constexpr(OPTBIND_DEBUG_LEVEL >= 2)                                     \
      std::cerr << "[optbind:L2] " << fmt::format(__VA_ARGS__) << "\n";       \
  } while(false)

#define OPTBIND_DEBUG_L3(...)                                                  \
  do                                                                           \
  {                                                                            \
    if constexpr(OPTBIND_DEBUG_LEVEL >= 3)                                     \
      std::cerr << "[optbind:L3] " << fmt::format(__VA_ARGS__) << "\n";       \
  } while(false)

OPTBIND_SET_NAMESPACE
{
  namespace utf8
  {
    using code_point = uint32_t;

    // constants for utf-8 bit patterns
    namespace detail
    {
      constexpr uint8_t ASCII_MASK = 0x80;
      constexpr uint8_t TWO_BYTE_MASK = 0xE0;
      constexpr uint8_t TWO_BYTE_SIG = 0xC0;
      constexpr uint8_t THREE_BYTE_MASK = 0xF0;
      constexpr uint8_t THREE_BYTE_SIG = 0xE0;
      constexpr uint8_t FOUR_BYTE_MASK = 0xF8;
      constexpr uint8_t FOUR_BYTE_SIG = 0xF0;
      constexpr uint8_t CONTINUATION_MASK = 0xC0;
      constexpr uint8_t CONTINUATION_SIG = 0x80;

      // get the expected byte count for a utf-8 sequence based on the first byte
      inline size_t get_sequence_length(uint8_t first_byte)
      {
        if((first_byte & ASCII_MASK) == 0)
          return 1;
        if((first_byte & TWO_BYTE_MASK) == TWO_BYTE_SIG)
          return 2;
        if((first_byte & THREE_BYTE_MASK) == THREE_BYTE_SIG)
          return 3;
        if((first_byte & FOUR_BYTE_MASK) == FOUR_BYTE_SIG)
          return 4;
        return 0; // invalid
      }

      // validate continuation bytes in a utf-8 sequence
      inline bool validate_continuation(std::string_view input, size_t pos,
                                        size_t count)
      {
        for(size_t i = 1; i < count; ++i)
        {
          if(pos + i >= input.size() || (static_cast<uint8_t>(input[pos + i]) &
                                         CONTINUATION_MASK) != CONTINUATION_SIG)
          {
            return false;
          }
        }
        return true;
      }
    } // namespace detail

    // advance position by one utf-8 character
    inline bool advance_one_char(std::string_view input, size_t& pos)
    {
      if(pos >= input.size())
        return false;

      uint8_t first_byte = static_cast<uint8_t>(input[pos]);
      size_t bytes = detail::get_sequence_length(first_byte);
      if(bytes == 0 || pos + bytes > input.size() ||
         !detail::validate_continuation(input, pos, bytes))
      {
        return false;
      }
      pos += bytes;
      return true;
    }

    // check if string is a single utf-8 character
    inline bool is_single_char(std::string_view str)
    {
      if(str.empty())
        return false;

      uint8_t first_byte = static_cast<uint8_t>(str[0]);
      size_t bytes = detail::get_sequence_length(first_byte);
      return (bytes != 0 && str.length() == bytes &&
              detail::validate_continuation(str, 0, bytes));
    }

    // first utf-8 character of str, empty if str doesn't start with one
    inline std::string_view first_char(std::string_view str)
    {
      size_t end = 0;
      if(!advance_one_char(str, end))
        return {};
      return str.substr(0, end);
    }

    inline bool is_digit(code_point cp) { return cp >= U'0' && cp <= U'9'; }
  } // namespace utf8

  namespace detail
  {
    // outputFile, output_file and OutputFile all become output-file,
    // acronyms stay together: URLPath -> url-path
    inline std::string to_kebab_case(std::string_view key)
    {
      auto is_upper = [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; };
      auto is_lower = [](char c) { return std::islower(static_cast<unsigned char>(c)) != 0; };
      auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

      std::string out;
      out.reserve(key.size() + 4);
      for(size_t i = 0; i < key.size(); ++i)
      {
        const char ch = key[i];
        if(ch == '_' || ch == ' ' || ch == '-')
        {
          if(!out.empty() && out.back() != '-')
            out.push_back('-');
          continue;
        }

        if(is_upper(ch))
        {
          const bool prev_lower = i > 0 && (is_lower(key[i - 1]) || is_digit(key[i - 1]));
          const bool prev_upper = i > 0 && is_upper(key[i - 1]);
          const bool next_lower = i + 1 < key.size() && is_lower(key[i + 1]);
          if(!out.empty() && out.back() != '-' && (prev_lower || (prev_upper && next_lower)))
            out.push_back('-');
          out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
          continue;
        }
        out.push_back(ch);
      }

      if(!out.empty() && out.back() == '-')
        out.pop_back();
      return out;
    }

    // -5, +3, -1.5, -2e10 ...
    inline bool looks_like_number(std::string_view str)
    {
      size_t i = 0;
      if(i < str.size() && (str[i] == '-' || str[i] == '+'))
        ++i;

      bool has_digits = false;
      bool has_dot = false;
      for(; i < str.size(); ++i)
      {
        const char ch = str[i];
        if(utf8::is_digit(static_cast<utf8::code_point>(ch)))
        {
          has_digits = true;
        }
        else if(ch == '.' && !has_dot)
        {
          has_dot = true;
        }
        else if((ch == 'e' || ch == 'E') && has_digits)
        {
          ++i;
          if(i < str.size() && (str[i] == '-' || str[i] == '+'))
            ++i;
          if(i >= str.size())
            return false;
          for(; i < str.size(); ++i)
          {
            if(!utf8::is_digit(static_cast<utf8::code_point>(str[i])))
              return false;
          }
          return true;
        }
        else
        {
          return false;
        }
      }
      return has_digits;
    }

    template <typename T> struct is_std_vector : std::false_type {};
    template <typename U, typename A> struct is_std_vector<std::vector<U, A>> : std::true_type {};
    template <typename T> inline constexpr bool is_std_vector_v = is_std_vector<T>::value;

    template <typename T> struct element_of { using type = T; };
    template <typename U, typename A> struct element_of<std::vector<U, A>> { using type = U; };
    template <typename T> using element_of_t = typename element_of<T>::type;
  } // namespace detail

  // config

  enum class multiflag_policy
  {
    disabled,     // -xvf is never split, it's an unknown option unless declared as is
    validate_all, // split only if every character is a declared short flag
    lax           // apply the valid flags, report the invalid ones
  };

  enum class scan_contention_policy
  {
    declaration_order, // contested values go to the earliest declared option
    report             // same, plus an ambiguous_consumption error when that reorders occurrences
  };

  struct parse_config
  {
    std::string long_prefix{ "--" };
    std::string short_prefix{ "-" };
    char inline_value_separator{ '=' };
    bool allow_terminator{ true };
    std::string terminator{ "--" };
    bool negative_numbers_are_values{ false };
    multiflag_policy multiflags{ multiflag_policy::validate_all };
    scan_contention_policy scan_contention{ scan_contention_policy::declaration_order };
  };

  // conversion

  template <typename T>
  concept is_expected_compatible = requires(T t)
  {
    requires std::is_move_constructible_v<T>;
    requires std::is_move_assignable_v<T>;
    requires std::is_destructible_v<T>;
  };

  // base converter template
  template <typename T>
  requires std::is_default_constructible_v<T> && is_expected_compatible<T>
  struct converter
  {
    static std::expected<T, std::string> convert(const std::string& input)
    {
      if constexpr(std::is_unsigned_v<T>)
      {
        // istream happily wraps "-1" around
        if(!input.empty() && input.front() == '-')
          return std::unexpected(fmt::format("'{}' is negative", input));
      }

      std::stringstream ss(input);
      ss >> std::noskipws;

      // int8_t and uint8_t would be read as a character
      if constexpr(std::is_integral_v<T> && sizeof(T) == 1 && !std::is_same_v<T, char>)
      {
        int wide{};
        if(!(ss >> wide) || !ss.eof())
          return std::unexpected(fmt::format("cannot convert '{}'", input));
        if(wide < std::numeric_limits<T>::min() || wide > std::numeric_limits<T>::max())
          return std::unexpected(fmt::format("'{}' is out of range", input));
        return static_cast<T>(wide);
      }
      else
      {
        T result{};
        if(!(ss >> result) || !ss.eof())
        {
          return std::unexpected(fmt::format("cannot convert '{}'", input));
        }
        return result;
      }
    }
  };

  // default bool specialization
  template <>
  struct converter<bool>
  {
    static std::expected<bool, std::string>
    convert(const std::string& input)
    {
      std::string lower = input;
      std::transform(lower.begin(), lower.end(), lower.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      if(lower == "true" || lower == "1" || lower == "yes" || lower == "y")
        return true;
      if(lower == "false" || lower == "0" || lower == "no" || lower == "n")
        return false;
      return std::unexpected(fmt::format("'{}' is not a boolean", input));
    }
  };

  template <>
  struct converter<std::string>
  {
    static std::expected<std::string, std::string>
    convert(const std::string& input)
    {
      return input;
    }
  };

  // customization point for type-specific conversion rules
  template <typename T>
  struct conversion_traits
  {
    static std::expected<T, std::string> convert(const std::string& input)
    {
      return converter<T>::convert(input); // Fallback to default converter
    }
  };

  // convenience function to use the converter
  template <typename T>
  std::expected<T, std::string> convert(const std::string& input)
  {
    return conversion_traits<T>::convert(input);
  }

  // names

  class name_element
  {
  public:
    enum class kind : uint8_t
    {
      long_name,   // long prefix + key in kebab case
      short_name,  // short prefix + first character of the key
      custom_long, // long prefix (or short prefix if single dash) + name
      custom_short // short prefix + one utf-8 character
    };

  public:
    static name_element long_name()
    {
      return name_element{ kind::long_name, {}, false };
    }

    static name_element short_name()
    {
      return name_element{ kind::short_name, {}, false };
    }

    static name_element custom_long(std::string name, bool single_dash = false)
    {
      if(name.empty())
        throw std::invalid_argument("custom long name can't be empty");
      return name_element{ kind::custom_long, std::move(name), single_dash };
    }

    // must be one utf-8 char e.g. 'o' or "é"
    static name_element custom_short(std::string ch)
    {
      if(!utf8::is_single_char(ch))
        throw std::invalid_argument(fmt::format("'{}' is not a single utf-8 character", ch));
      return name_element{ kind::custom_short, std::move(ch), false };
    }

    static name_element custom_short(char ch)
    {
      return custom_short(std::string(1, ch));
    }

    kind get_kind() const { return m_kind; }

    const std::string& get_value() const { return m_value; }

    bool is_single_dash() const { return m_single_dash; }

    // the full spelling for key, nullopt if the key has nothing to derive it from
    std::optional<std::string> spelling(std::string_view key, const parse_config& cfg) const
    {
      switch(m_kind)
      {
        case kind::long_name:
        {
          auto body = detail::to_kebab_case(key);
          if(body.empty())
            return std::nullopt;
          return cfg.long_prefix + body;
        }
        case kind::short_name:
        {
          auto ch = utf8::first_char(key);
          if(ch.empty())
            return std::nullopt;
          return cfg.short_prefix + std::string(ch);
        }
        case kind::custom_long:
          return (m_single_dash ? cfg.short_prefix : cfg.long_prefix) + m_value;
        case kind::custom_short:
          return cfg.short_prefix + m_value;
      }
      return std::nullopt;
    }

  private:
    name_element(kind k, std::string value, bool single_dash)
      : m_kind(k), m_value(std::move(value)), m_single_dash(single_dash)
    {
    }

  private:
    kind m_kind{ kind::long_name };
    std::string m_value;
    bool m_single_dash{ false };
  };

  class name_specification
  {
  public:
    name_specification() : m_elements{ name_element::long_name() } {}

    name_specification(std::initializer_list<name_element> elements)
      : m_elements(elements)
    {
    }

    static name_specification long_and_short()
    {
      return { name_element::long_name(), name_element::short_name() };
    }

    const std::vector<name_element>& get_elements() const { return m_elements; }

    // ordered, without duplicates
    std::vector<std::string> make_names(std::string_view key, const parse_config& cfg) const
    {
      std::vector<std::string> names;
      for(const auto& element : m_elements)
      {
        auto name = element.spelling(key, cfg);
        if(name && std::find(names.begin(), names.end(), *name) == names.end())
          names.push_back(std::move(*name));
      }
      return names;
    }

  private:
    std::vector<name_element> m_elements;
  };

  // storage

  // token positions that produced a value, diagnostics only
  struct parse_origin
  {
    std::vector<size_t> positions;
    bool defaulted{ false };

    static parse_origin from_default()
    {
      parse_origin origin;
      origin.defaulted = true;
      return origin;
    }

    bool is_default() const { return defaulted; }

    void merge(const parse_origin& other)
    {
      for(auto pos : other.positions)
      {
        if(std::find(positions.begin(), positions.end(), pos) == positions.end())
          positions.push_back(pos);
      }
      defaulted = defaulted && other.defaulted;
    }

    bool operator==(const parse_origin&) const = default;
  };

  class value_store
  {
  public:
    struct entry
    {
      std::any value;
      parse_origin origin;
    };

  public:
    value_store() = default;

    // overwrite
    void set(const std::string& key, std::any value, parse_origin origin)
    {
      auto& e = m_entries[key];
      e.value = std::move(value);
      e.origin = std::move(origin);
    }

    // mutate in place, the entry starts out as T{} if there is none yet
    template <typename T, typename FUN>
    void update(const std::string& key, const parse_origin& origin, FUN&& fun)
    {
      auto it = m_entries.find(key);
      if(m_entries.end() == it)
        it = m_entries.emplace(key, entry{ std::any{ T{} }, {} }).first;

      T* current = std::any_cast<T>(&it->second.value);
      if(current == nullptr)
      {
        it->second.value = T{};
        it->second.origin = {};
        current = std::any_cast<T>(&it->second.value);
      }
      std::forward<FUN>(fun)(*current);
      it->second.origin.merge(origin);
    }

    const entry* find(const std::string& key) const
    {
      const auto it = m_entries.find(key);
      if(m_entries.end() != it)
        return &it->second;
      return nullptr;
    }

    bool contains(const std::string& key) const
    {
      return m_entries.find(key) != m_entries.end();
    }

    size_t size() const
    {
      return m_entries.size();
    }

  private:
    std::unordered_map<std::string, entry> m_entries;
  };

  // definitions

  enum class value_arity : uint8_t
  {
    none, // flags and counters
    single,
    array
  };

  enum class single_value_strategy : uint8_t
  {
    next,              // the token right after the name, whatever it looks like
    unconditional,     // same as next, but meant for values like -5
    scanning_for_value // the first plain value after the name, skipping options
  };

  enum class array_strategy : uint8_t
  {
    single_value,              // one plain value per occurrence (scanning)
    unconditional_single_value, // one token per occurrence, whatever it looks like
    up_to_next_option,         // every value up to the next option
    remaining                  // every remaining token, verbatim
  };

  enum class parsing_strategy : uint8_t
  {
    none,
    next,
    unconditional,
    scanning_for_value,
    single_value,
    unconditional_single_value,
    up_to_next_option,
    remaining,
    passthrough
  };

  constexpr parsing_strategy to_parsing_strategy(single_value_strategy s)
  {
    switch(s)
    {
      case single_value_strategy::next:
        return parsing_strategy::next;
      case single_value_strategy::unconditional:
        return parsing_strategy::unconditional;
      case single_value_strategy::scanning_for_value:
        return parsing_strategy::scanning_for_value;
    }
    return parsing_strategy::next;
  }

  constexpr parsing_strategy to_parsing_strategy(array_strategy s)
  {
    switch(s)
    {
      case array_strategy::single_value:
        return parsing_strategy::single_value;
      case array_strategy::unconditional_single_value:
        return parsing_strategy::unconditional_single_value;
      case array_strategy::up_to_next_option:
        return parsing_strategy::up_to_next_option;
      case array_strategy::remaining:
        return parsing_strategy::remaining;
    }
    return parsing_strategy::single_value;
  }

  constexpr std::string_view parsing_strategy_to_string(const parsing_strategy ps)
  {
    using namespace std::string_view_literals;
    switch(ps)
    {
      case parsing_strategy::none:
        return "none"sv;
      case parsing_strategy::next:
        return "next"sv;
      case parsing_strategy::unconditional:
        return "unconditional"sv;
      case parsing_strategy::scanning_for_value:
        return "scanning_for_value"sv;
      case parsing_strategy::single_value:
        return "single_value"sv;
      case parsing_strategy::unconditional_single_value:
        return "unconditional_single_value"sv;
      case parsing_strategy::up_to_next_option:
        return "up_to_next_option"sv;
      case parsing_strategy::remaining:
        return "remaining"sv;
      case parsing_strategy::passthrough:
        return "passthrough"sv;
    }
    return "unknown"sv;
  }

  // immutable once registration is over, read by the resolver and by
  // whatever renders help
  struct option_definition
  {
    using convert_function = std::function<std::expected<void, std::string>(const std::string&, std::any&)>;
    using update_function = std::function<void(value_store&, const std::string&, std::any&&, const parse_origin&)>;
    using default_function = std::function<std::any()>;

    std::string key;
    name_specification name_spec;
    std::vector<std::string> names;
    value_arity arity{ value_arity::single };
    parsing_strategy strategy{ parsing_strategy::next };
    default_function default_provider;
    convert_function convert;
    update_function update;
    bool required{ false };
    size_t declaration_index{ 0 };

    bool has_default() const { return static_cast<bool>(default_provider); }

    bool is_required() const { return required; }

    bool is_flag() const { return arity == value_arity::none; }

    bool is_scanning() const
    {
      return strategy == parsing_strategy::scanning_for_value ||
             strategy == parsing_strategy::single_value;
    }

    std::string display_name() const
    {
      if(names.empty())
        return key;
      return fmt::format("{}", fmt::join(names, "/"));
    }
  };

  // errors

  enum class error_code
  {
    none,

    // parse errors

    missing_value,         // an option matched but no eligible value token was found
    unrecognized_option,   // an option-like token no declared option owns
    ambiguous_consumption, // several scanning options contested the same value
    unexpected_value,      // a flag was given an inline value
    malformed_multiflag,   // a multi-flag (e.g., -abc) contains invalid flags

    // evaluation errors

    invalid_value,   // a raw value failed the option's conversion
    missing_required // a required option without default was never given
  };

  enum class error_type
  {
    none,
    parse_error,
    evaluation_error
  };

  constexpr std::string_view error_code_to_string(const error_code ec)
  {
    using namespace std::string_view_literals;
    switch(ec)
    {
      case error_code::none:
        return "none"sv;
      case error_code::missing_value:
        return "missing_value"sv;
      case error_code::unrecognized_option:
        return "unrecognized_option"sv;
      case error_code::ambiguous_consumption:
        return "ambiguous_consumption"sv;
      case error_code::unexpected_value:
        return "unexpected_value"sv;
      case error_code::malformed_multiflag:
        return "malformed_multiflag"sv;
      case error_code::invalid_value:
        return "invalid_value"sv;
      case error_code::missing_required:
        return "missing_required"sv;
    }
    return "unknown"sv;
  }

  struct error
  {
    error_type type{ error_type::none };
    error_code code{ error_code::none };
    std::string key;                    // empty for unrecognized options
    std::vector<std::string> names;     // declared spellings of the offending option
    std::string token;                  // offending raw token, if any
    std::optional<size_t> position;     // token position, or where a value was expected
    std::string reason;                 // conversion failure, invalid_value only
    std::string message;

    bool operator==(const error&) const = default;
  };

  using error_list = std::vector<error>;

  // results

  enum class access_error
  {
    not_found,    // no value bound (absent and no default)
    type_mismatch // bound, but not as the requested type
  };

  namespace detail
  {
    class resolver;
  } // namespace detail

  // only a successful resolution can create one of these
  class parse_result
  {
  public:
    template <typename T>
    std::expected<T, access_error> get(const std::string& key) const
    {
      const auto* e = m_values.find(key);
      if(e == nullptr)
        return std::unexpected(access_error::not_found);

      const T* value = std::any_cast<T>(&e->value);
      if(value == nullptr)
        return std::unexpected(access_error::type_mismatch);
      return *value;
    }

    template <typename T>
    std::optional<T> find(const std::string& key) const
    {
      auto value = get<T>(key);
      if(!value)
        return std::nullopt;
      return std::move(*value);
    }

    template <typename T>
    T value_or(const std::string& key, T fallback) const
    {
      auto value = get<T>(key);
      if(!value)
        return fallback;
      return std::move(*value);
    }

    bool contains(const std::string& key) const
    {
      return m_values.contains(key);
    }

    std::expected<std::reference_wrapper<const parse_origin>, access_error> get_origin(const std::string& key) const
    {
      const auto* e = m_values.find(key);
      if(e == nullptr)
        return std::unexpected(access_error::not_found);
      return std::cref(e->origin);
    }

    // plain values no option claimed, and everything after the terminator
    const std::vector<std::string>& positionals() const
    {
      return m_positionals;
    }

    const value_store& values() const
    {
      return m_values;
    }

  private:
    parse_result(value_store values, std::vector<std::string> positionals)
      : m_values(std::move(values)), m_positionals(std::move(positionals))
    {
    }

  private:
    value_store m_values;
    std::vector<std::string> m_positionals;

  private:
    friend class detail::resolver;
  };

  using resolution_outcome = std::expected<parse_result, error_list>;

  // builders

  class parser;

  template <typename DERIVED>
  class basic_builder
  {
  public:
    DERIVED& set_names(name_specification spec)
    {
      m_definition->name_spec = std::move(spec);
      m_definition->names = m_definition->name_spec.make_names(m_definition->key, *m_config);
      return self();
    }

    const option_definition& get_definition() const
    {
      return *m_definition;
    }

  protected:
    basic_builder(option_definition* definition, const parse_config* cfg)
      : m_definition(definition), m_config(cfg)
    {
    }

    DERIVED& self() { return static_cast<DERIVED&>(*this); }

  protected:
    option_definition* m_definition{ nullptr };
    const parse_config* m_config{ nullptr };
  };

  template <typename T>
  class option_builder : public basic_builder<option_builder<T>>
  {
  public:
    using value_type = T;
    using element_type = detail::element_of_t<T>;
    using transform_function = std::function<std::expected<element_type, std::string>(const std::string&)>;

    static constexpr bool is_array = detail::is_std_vector_v<T>;

  public:
    option_builder& set_strategy(single_value_strategy s) requires(!is_array)
    {
      this->m_definition->strategy = to_parsing_strategy(s);
      return *this;
    }

    option_builder& set_strategy(array_strategy s) requires(is_array)
    {
      this->m_definition->strategy = to_parsing_strategy(s);
      return *this;
    }

    // array options always default to the empty sequence
    option_builder& set_default(T value) requires(!is_array)
    {
      this->m_definition->default_provider = [value = std::move(value)]() { return std::any{ value }; };
      return *this;
    }

    option_builder& set_default_provider(std::function<T()> provider) requires(!is_array)
    {
      this->m_definition->default_provider = [provider = std::move(provider)]() { return std::any{ provider() }; };
      return *this;
    }

    option_builder& set_required(bool required = true) requires(!is_array)
    {
      this->m_definition->required = required;
      return *this;
    }

    // replaces conversion_traits<element_type> for this option
    option_builder& set_transform(transform_function fn)
    {
      this->m_definition->convert = [fn = std::move(fn)](const std::string& raw, std::any& out) -> std::expected<void, std::string>
      {
        auto converted = fn(raw);
        if(!converted)
          return std::unexpected(std::move(converted.error()));
        out = std::move(*converted);
        return {};
      };
      return *this;
    }

  private:
    option_builder(option_definition* definition, const parse_config* cfg)
      : basic_builder<option_builder<T>>(definition, cfg)
    {
      set_transform([](const std::string& raw) { return conversion_traits<element_type>::convert(raw); });

      if constexpr(is_array)
      {
        this->m_definition->update = [](value_store& store, const std::string& key, std::any&& value, const parse_origin& origin)
        {
          store.update<T>(key, origin, [&value](T& seq) { seq.push_back(std::any_cast<element_type>(std::move(value))); });
        };
        this->m_definition->default_provider = []() { return std::any{ T{} }; };
      }
      else
      {
        this->m_definition->update = [](value_store& store, const std::string& key, std::any&& value, const parse_origin& origin)
        {
          store.set(key, std::move(value), origin);
        };
      }
    }

  private:
    friend class parser;
  };

  class flag_builder : public basic_builder<flag_builder>
  {
  private:
    flag_builder(option_definition* definition, const parse_config* cfg)
      : basic_builder<flag_builder>(definition, cfg)
    {
    }

  private:
    friend class parser;
  };

  namespace detail
  {
    enum class token_class : uint8_t
    {
      value,         // plain value
      option,        // exact match of a declared name
      inline_option, // declared name with an attached value (--name=value)
      grouped_flags, // -xvf made of declared short flags
      terminator,    // --
      unrecognized   // option-like, but nobody owns it
    };

    constexpr std::string_view token_class_to_string(const token_class tc)
    {
      using namespace std::string_view_literals;
      switch(tc)
      {
        case token_class::value:
          return "value"sv;
        case token_class::option:
          return "option"sv;
        case token_class::inline_option:
          return "inline_option"sv;
        case token_class::grouped_flags:
          return "grouped_flags"sv;
        case token_class::terminator:
          return "terminator"sv;
        case token_class::unrecognized:
          return "unrecognized"sv;
      }
      return "unknown"sv;
    }

    struct token
    {
      token() = default;
      token(std::string lit, size_t pos)
        : literal(std::move(lit)), position(pos)
      {
      }

      std::string literal;
      size_t position{ 0 }; // index in the original argument list
    };

    // indexed view over the arguments, claimed tokens are never handed out
    // again, everything else keeps its relative order
    class token_stream
    {
    public:
      token_stream() = default;
      explicit token_stream(const std::vector<std::string>& args)
      {
        m_tokens.reserve(args.size());
        for(size_t i = 0; i < args.size(); ++i)
          m_tokens.emplace_back(args[i], i);
        m_claimed.assign(args.size(), false);
      }

      size_t size() const { return m_tokens.size(); }

      size_t cursor() const { return m_cursor; }

      bool at_end() const { return !first_unclaimed(m_cursor).has_value(); }

      bool is_claimed(size_t position) const
      {
        return position >= m_claimed.size() || m_claimed[position];
      }

      // offset-th unclaimed token at or after the cursor
      std::optional<token> peek(size_t offset = 0) const
      {
        for(size_t i = m_cursor; i < m_tokens.size(); ++i)
        {
          if(m_claimed[i])
            continue;
          if(offset == 0)
            return m_tokens[i];
          --offset;
        }
        return std::nullopt;
      }

      std::optional<token> consume()
      {
        auto index = first_unclaimed(m_cursor);
        if(!index)
          return std::nullopt;
        return claim_and_advance(*index);
      }

      template <typename PRED>
      std::optional<token> consume_if(PRED&& pred)
      {
        auto index = first_unclaimed(m_cursor);
        if(!index || !pred(std::as_const(m_tokens[*index])))
          return std::nullopt;
        return claim_and_advance(*index);
      }

      // claims a token anywhere in the stream, the cursor stays where it is
      std::optional<token> remove(size_t position)
      {
        if(is_claimed(position))
          return std::nullopt;
        OPTBIND_DEBUG_L3("token_stream: removing '{}' at {}, cursor at {}",
                         m_tokens[position].literal, position, m_cursor);
        m_claimed[position] = true;
        return m_tokens[position];
      }

      // first unclaimed token after position
      std::optional<token> next_after(size_t position) const
      {
        auto index = first_unclaimed(position + 1);
        if(!index)
          return std::nullopt;
        return m_tokens[*index];
      }

      std::vector<token> unclaimed_after(size_t position) const
      {
        std::vector<token> out;
        for(size_t i = position + 1; i < m_tokens.size(); ++i)
        {
          if(!m_claimed[i])
            out.push_back(m_tokens[i]);
        }
        return out;
      }

    private:
      std::optional<size_t> first_unclaimed(size_t from) const
      {
        for(size_t i = from; i < m_tokens.size(); ++i)
        {
          if(!m_claimed[i])
            return i;
        }
        return std::nullopt;
      }

      token claim_and_advance(size_t index)
      {
        OPTBIND_DEBUG_L3("token_stream: consuming '{}' at {}", m_tokens[index].literal, index);
        m_claimed[index] = true;
        m_cursor = index + 1;
        return m_tokens[index];
      }

    private:
      std::vector<token> m_tokens;
      std::vector<bool> m_claimed;
      size_t m_cursor{ 0 };
    };

    struct classification
    {
      token_class type{ token_class::value };
      const option_definition* definition{ nullptr };
      std::optional<std::string> inline_value;
      std::vector<const option_definition*> flags; // grouped_flags only
      std::vector<std::string> invalid_flags;      // grouped_flags under lax policy
    };

    class name_matcher
    {
    public:
      name_matcher(const std::deque<option_definition>& definitions, const parse_config& cfg)
        : m_config(cfg)
      {
        for(const auto& def : definitions)
        {
          if(def.strategy == parsing_strategy::passthrough)
          {
            if(m_passthrough == nullptr)
              m_passthrough = &def;
            continue;
          }
          for(const auto& name : def.names)
          {
            // first declaration wins a clash
            if(!m_names.emplace(name, &def).second)
              OPTBIND_DEBUG_L1("name '{}' of '{}' is already taken", name, def.key);
          }
        }
      }

      const option_definition* passthrough() const { return m_passthrough; }

      const option_definition* find(std::string_view name) const
      {
        const auto it = m_names.find(std::string(name));
        if(m_names.end() != it)
          return it->second;
        return nullptr;
      }

      // starts with a prefix and isn't a bare prefix, negative numbers can opt out
      bool is_option_like(std::string_view literal) const
      {
        auto has_prefix = [&literal](const std::string& prefix)
        {
          return !prefix.empty() && literal.size() > prefix.size() && literal.starts_with(prefix);
        };

        if(!has_prefix(m_config.short_prefix) && !has_prefix(m_config.long_prefix))
          return false;
        if(m_config.negative_numbers_are_values && looks_like_number(literal))
          return false;
        return true;
      }

      classification classify(std::string_view literal) const
      {
        classification result = classify_impl(literal);
        OPTBIND_DEBUG_L2("classified '{}' as {}", literal, token_class_to_string(result.type));
        return result;
      }

    private:
      classification classify_impl(std::string_view literal) const
      {
        classification result;

        if(const auto* def = find(literal))
        {
          result.type = token_class::option;
          result.definition = def;
          return result;
        }

        if(m_config.allow_terminator && literal == m_config.terminator)
        {
          result.type = token_class::terminator;
          return result;
        }

        if(!is_option_like(literal))
        {
          result.type = token_class::value;
          return result;
        }

        const auto sep = literal.find(m_config.inline_value_separator);
        if(std::string_view::npos != sep)
        {
          if(const auto* def = find(literal.substr(0, sep)))
          {
            result.type = token_class::inline_option;
            result.definition = def;
            result.inline_value = std::string(literal.substr(sep + 1));
            return result;
          }
          result.type = token_class::unrecognized;
          return result;
        }

        if(classify_multiflag(literal, result))
          return result;

        result.type = token_class::unrecognized;
        return result;
      }

      bool classify_multiflag(std::string_view literal, classification& result) const
      {
        if(m_config.multiflags == multiflag_policy::disabled)
          return false;

        const auto& sp = m_config.short_prefix;
        const auto& lp = m_config.long_prefix;
        if(!literal.starts_with(sp) || (lp.size() > sp.size() && literal.starts_with(lp)))
          return false;

        std::vector<const option_definition*> valid_flags;
        std::vector<std::string> invalid_flags;
        const auto body = literal.substr(sp.size());

        // parse utf-8 characters as potential flags
        size_t pos = 0;
        while(pos < body.size())
        {
          size_t end_pos = pos;
          if(!utf8::advance_one_char(body, end_pos))
            return false; // broken utf-8 is never a multi-flag

          const auto flag_str = sp + std::string(body.substr(pos, end_pos - pos));
          const auto* def = find(flag_str);
          if(def != nullptr && def->is_flag())
          {
            valid_flags.push_back(def);
          }
          else
          {
            invalid_flags.push_back(flag_str);
            if(m_config.multiflags == multiflag_policy::validate_all)
              return false;
          }
          pos = end_pos;
        }

        if(valid_flags.empty())
          return false;

        result.type = token_class::grouped_flags;
        result.flags = std::move(valid_flags);
        result.invalid_flags = std::move(invalid_flags);
        return true;
      }

    private:
      const parse_config& m_config;
      std::unordered_map<std::string, const option_definition*> m_names;
      const option_definition* m_passthrough{ nullptr };
    };

    // one resolution, created and thrown away by parser::parse
    class resolver
    {
    public:
      resolver(const std::deque<option_definition>& definitions, const parse_config& cfg,
               const std::vector<std::string>& args)
        : m_definitions(definitions), m_config(cfg), m_matcher(definitions, cfg), m_stream(args)
      {
      }

      resolver(const resolver&) = delete;
      resolver& operator=(const resolver&) = delete;

      resolution_outcome run()
      {
        OPTBIND_DEBUG_L1("resolving {} token(s) against {} definition(s)",
                         m_stream.size(), m_definitions.size());

        // every branch of resolve_one consumes at least the current token
        while(auto tok = m_stream.peek())
          resolve_one(*tok);

        value_store store;
        apply_defaults_and_transforms(store);

        if(!m_errors.empty())
        {
          OPTBIND_DEBUG_L1("resolution failed with {} error(s)", m_errors.size());
          return std::unexpected(std::move(m_errors));
        }
        return parse_result{ std::move(store), std::move(m_positionals) };
      }

    private:
      struct raw_occurrence
      {
        std::string value;
        parse_origin origin;
      };

      struct contender
      {
        const option_definition* definition;
        token name;
      };

    private:
      void resolve_one(const token& tok)
      {
        auto cls = m_matcher.classify(tok.literal);
        switch(cls.type)
        {
          case token_class::value:
          {
            m_stream.consume();
            m_positionals.push_back(tok.literal);
            break;
          }
          case token_class::terminator:
          {
            m_stream.consume();
            while(auto rest = m_stream.consume())
              m_positionals.push_back(rest->literal);
            break;
          }
          case token_class::unrecognized:
          {
            m_stream.consume();
            resolve_unrecognized(tok);
            break;
          }
          case token_class::grouped_flags:
          {
            m_stream.consume();
            resolve_grouped_flags(tok, cls);
            break;
          }
          case token_class::option:
          case token_class::inline_option:
          {
            m_stream.consume();
            resolve_occurrence(*cls.definition, tok, cls.inline_value);
            break;
          }
        }
      }

      void resolve_occurrence(const option_definition& def, const token& name,
                              const std::optional<std::string>& inline_value)
      {
        m_mentioned.insert(def.key);
        OPTBIND_DEBUG_L1("'{}' matched '{}' ({}) at {}", name.literal, def.key,
                         parsing_strategy_to_string(def.strategy), name.position);

        if(def.is_flag())
        {
          if(inline_value)
          {
            set_unexpected_value(def, name, *inline_value);
            return;
          }
          record(def, std::string{}, parse_origin{ { name.position } });
          return;
        }

        // an attached value replaces the look-ahead, except for remaining
        // which still takes the rest of the stream
        if(inline_value && def.strategy != parsing_strategy::remaining)
        {
          record(def, *inline_value, parse_origin{ { name.position } });
          return;
        }

        switch(def.strategy)
        {
          case parsing_strategy::next:
          case parsing_strategy::unconditional:
          case parsing_strategy::unconditional_single_value:
          {
            resolve_next(def, name);
            break;
          }
          case parsing_strategy::scanning_for_value:
          case parsing_strategy::single_value:
          {
            resolve_scanning(def, name);
            break;
          }
          case parsing_strategy::up_to_next_option:
          {
            resolve_up_to_next_option(def, name);
            break;
          }
          case parsing_strategy::remaining:
          {
            resolve_remaining(def, name, inline_value);
            break;
          }
          case parsing_strategy::none:
          case parsing_strategy::passthrough:
          default:
            break;
        }
      }

      // we are right behind the name token, take whatever comes next
      void resolve_next(const option_definition& def, const token& name)
      {
        auto value = m_stream.consume();
        if(!value)
        {
          set_missing_value(def, name, name.position + 1);
          return;
        }
        record(def, value->literal, parse_origin{ { name.position, value->position } });
      }

      // every scanning occurrence between this one and the first candidate
      // value competes for the same values, they are handed out in
      // declaration order
      void resolve_scanning(const option_definition& def, const token& name)
      {
        std::vector<contender> group{ contender{ &def, name } };
        for(const auto& tok : m_stream.unclaimed_after(name.position))
        {
          const auto cls = m_matcher.classify(tok.literal);
          if(cls.type == token_class::value || cls.type == token_class::terminator)
            break;
          if(cls.type == token_class::option && cls.definition->is_scanning())
          {
            group.push_back(contender{ cls.definition, tok });
            continue;
          }
          // the tokens after this one belong to that option's own resolution
          if(takes_following_tokens(cls))
            break;
        }

        auto ordered = group;
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const contender& a, const contender& b)
                         {
                           return a.definition->declaration_index < b.definition->declaration_index;
                         });

        if(group.size() > 1)
          OPTBIND_DEBUG_L1("{} scanning occurrences contend for the values after {}",
                           group.size(), name.position);

        for(size_t i = 0; i < ordered.size(); ++i)
        {
          const auto& c = ordered[i];
          if(c.name.position != name.position)
          {
            m_stream.remove(c.name.position);
            m_mentioned.insert(c.definition->key);
          }

          auto value = find_plain_value_after(name.position);
          if(m_config.scan_contention == scan_contention_policy::report &&
             c.name.position != group[i].name.position)
          {
            set_ambiguous_consumption(*c.definition, c.name, value);
          }

          if(!value)
          {
            set_missing_value(*c.definition, c.name, c.name.position + 1);
            continue;
          }
          m_stream.remove(value->position);
          record(*c.definition, value->literal, parse_origin{ { c.name.position, value->position } });
        }
      }

      void resolve_up_to_next_option(const option_definition& def, const token& name)
      {
        size_t count = 0;
        auto is_plain_value = [this](const token& t)
        {
          return m_matcher.classify(t.literal).type == token_class::value;
        };

        while(auto value = m_stream.consume_if(is_plain_value))
        {
          record(def, value->literal, parse_origin{ { name.position, value->position } });
          ++count;
        }

        if(count == 0)
          set_missing_value(def, name, name.position + 1);
      }

      // claims the rest of the stream, nothing gets matched after this
      void resolve_remaining(const option_definition& def, const token& name,
                             const std::optional<std::string>& inline_value)
      {
        if(inline_value)
          record(def, *inline_value, parse_origin{ { name.position } });

        while(auto value = m_stream.consume())
          record(def, value->literal, parse_origin{ { name.position, value->position } });
      }

      void resolve_unrecognized(const token& tok)
      {
        if(const auto* pt = m_matcher.passthrough())
        {
          record(*pt, tok.literal, parse_origin{ { tok.position } });
          return;
        }
        set_unrecognized_option(tok);
      }

      void resolve_grouped_flags(const token& tok, const classification& cls)
      {
        for(const auto* def : cls.flags)
        {
          m_mentioned.insert(def->key);
          record(*def, std::string{}, parse_origin{ { tok.position } });
        }
        for(const auto& invalid : cls.invalid_flags)
          set_malformed_multiflag(tok, invalid);
      }

      // value-taking options that read the stream without scanning it
      static bool takes_following_tokens(const classification& cls)
      {
        if(cls.type == token_class::option)
          return !cls.definition->is_flag() && !cls.definition->is_scanning();
        if(cls.type == token_class::inline_option)
          return cls.definition->strategy == parsing_strategy::remaining;
        return false;
      }

      std::optional<token> find_plain_value_after(size_t position) const
      {
        for(const auto& tok : m_stream.unclaimed_after(position))
        {
          const auto cls = m_matcher.classify(tok.literal);
          if(cls.type == token_class::terminator)
            return std::nullopt;
          if(cls.type == token_class::value)
            return tok;
        }
        return std::nullopt;
      }

      void record(const option_definition& def, std::string value, parse_origin origin)
      {
        OPTBIND_DEBUG_L2("'{}' <- '{}'", def.key, value);
        m_occurrences[def.key].push_back(raw_occurrence{ std::move(value), std::move(origin) });
      }

      void apply_defaults_and_transforms(value_store& store)
      {
        for(const auto& def : m_definitions)
        {
          const auto it = m_occurrences.find(def.key);
          if(m_occurrences.end() == it || it->second.empty())
          {
            if(def.has_default())
            {
              store.set(def.key, def.default_provider(), parse_origin::from_default());
            }
            else if(def.required && !m_mentioned.contains(def.key))
            {
              set_missing_required(def);
            }
            continue;
          }

          for(const auto& occurrence : it->second)
          {
            std::any converted;
            auto status = def.convert(occurrence.value, converted);
            if(!status)
            {
              set_invalid_value(def, occurrence, status.error());
              continue;
            }
            def.update(store, def.key, std::move(converted), occurrence.origin);
          }
        }
      }

      // errors

      error& push_error(error_type type, error_code code)
      {
        auto& err = m_errors.emplace_back();
        err.type = type;
        err.code = code;
        return err;
      }

      void set_missing_value(const option_definition& def, const token& name, size_t expected_at)
      {
        auto& err = push_error(error_type::parse_error, error_code::missing_value);
        err.key = def.key;
        err.names = def.names;
        err.token = name.literal;
        err.position = expected_at;
        err.message = fmt::format("Missing value for '{}' (expected at position {})",
                                  name.literal, expected_at);
      }

      void set_unrecognized_option(const token& tok)
      {
        auto& err = push_error(error_type::parse_error, error_code::unrecognized_option);
        err.token = tok.literal;
        err.position = tok.position;
        err.message = fmt::format("Unknown option '{}' at position {}", tok.literal, tok.position);
      }

      void set_ambiguous_consumption(const option_definition& def, const token& name,
                                     const std::optional<token>& value)
      {
        auto& err = push_error(error_type::parse_error, error_code::ambiguous_consumption);
        err.key = def.key;
        err.names = def.names;
        err.token = value ? value->literal : name.literal;
        err.position = value ? value->position : name.position;
        err.message = fmt::format("'{}' at position {} took its value ahead of an earlier occurrence",
                                  name.literal, name.position);
      }

      void set_unexpected_value(const option_definition& def, const token& name, const std::string& value)
      {
        auto& err = push_error(error_type::parse_error, error_code::unexpected_value);
        err.key = def.key;
        err.names = def.names;
        err.token = name.literal;
        err.position = name.position;
        err.message = fmt::format("Flag '{}' doesn't take a value, but '{}' was given",
                                  def.display_name(), value);
      }

      void set_malformed_multiflag(const token& tok, const std::string& invalid_flag)
      {
        auto& err = push_error(error_type::parse_error, error_code::malformed_multiflag);
        err.token = tok.literal;
        err.position = tok.position;
        err.message = fmt::format("Multi-flag '{}' contains invalid flag '{}'", tok.literal, invalid_flag);
      }

      void set_invalid_value(const option_definition& def, const raw_occurrence& occurrence,
                             const std::string& reason)
      {
        auto& err = push_error(error_type::evaluation_error, error_code::invalid_value);
        err.key = def.key;
        err.names = def.names;
        err.token = occurrence.value;
        if(!occurrence.origin.positions.empty())
          err.position = occurrence.origin.positions.back();
        err.reason = reason;
        err.message = fmt::format("Invalid value '{}' for '{}': {}",
                                  occurrence.value, def.display_name(), reason);
      }

      void set_missing_required(const option_definition& def)
      {
        auto& err = push_error(error_type::evaluation_error, error_code::missing_required);
        err.key = def.key;
        err.names = def.names;
        err.message = fmt::format("Missing required option '{}'", def.display_name());
      }

    private:
      const std::deque<option_definition>& m_definitions;
      const parse_config& m_config;
      name_matcher m_matcher;
      token_stream m_stream;
      std::unordered_map<std::string, std::vector<raw_occurrence>> m_occurrences;
      std::unordered_set<std::string> m_mentioned;
      std::vector<std::string> m_positionals;
      error_list m_errors;
    };
  } // namespace detail

  class parser
  {
  public:
    parser() = default;
    explicit parser(parse_config cfg) : m_config(std::move(cfg)) {}

    // builders point into this parser, copying or moving it would leave them dangling
    parser(const parser&) = delete;
    parser(parser&&) = delete;

    // build stage(pre parse)

    template <typename T>
    option_builder<T> add_option(const std::string& key) // e.g. --output file
    {
      constexpr bool is_array = detail::is_std_vector_v<T>;
      auto& def = add_definition(key, is_array ? value_arity::array : value_arity::single,
                                 is_array ? parsing_strategy::single_value : parsing_strategy::next);
      return option_builder<T>{ &def, &m_config };
    }

    flag_builder add_flag(const std::string& key) // e.g. --verbose, bound to bool
    {
      auto& def = add_definition(key, value_arity::none, parsing_strategy::none);
      def.convert = [](const std::string&, std::any& out) -> std::expected<void, std::string>
      {
        out = true;
        return {};
      };
      def.update = [](value_store& store, const std::string& k, std::any&& value, const parse_origin& origin)
      {
        store.set(k, std::move(value), origin);
      };
      def.default_provider = []() { return std::any{ false }; };
      return flag_builder{ &def, &m_config };
    }

    flag_builder add_counter(const std::string& key) // e.g. -vvv, bound to int
    {
      auto& def = add_definition(key, value_arity::none, parsing_strategy::none);
      def.convert = [](const std::string&, std::any& out) -> std::expected<void, std::string>
      {
        out = 1;
        return {};
      };
      def.update = [](value_store& store, const std::string& k, std::any&& value, const parse_origin& origin)
      {
        store.update<int>(k, origin, [&value](int& count) { count += std::any_cast<int>(value); });
      };
      def.default_provider = []() { return std::any{ 0 }; };
      return flag_builder{ &def, &m_config };
    }

    // collects unknown option-like tokens instead of reporting them
    parser& add_passthrough(const std::string& key)
    {
      auto& def = add_definition(key, value_arity::array, parsing_strategy::passthrough);
      def.name_spec = name_specification{};
      def.names.clear();
      def.convert = [](const std::string& raw, std::any& out) -> std::expected<void, std::string>
      {
        out = raw;
        return {};
      };
      def.update = [](value_store& store, const std::string& k, std::any&& value, const parse_origin& origin)
      {
        using seq_type = std::vector<std::string>;
        store.update<seq_type>(k, origin, [&value](seq_type& seq) { seq.push_back(std::any_cast<std::string>(std::move(value))); });
      };
      def.default_provider = []() { return std::any{ std::vector<std::string>{} }; };
      return *this;
    }

    // names are spelled with the prefixes in here, changing it respells them
    void set_config(parse_config cfg)
    {
      m_config = std::move(cfg);
      for(auto& def : m_definitions)
      {
        if(def.strategy != parsing_strategy::passthrough)
          def.names = def.name_spec.make_names(def.key, m_config);
      }
    }

    const parse_config& config() const
    {
      return m_config;
    }

    const std::deque<option_definition>& definitions() const
    {
      return m_definitions;
    }

    const option_definition* find_definition(const std::string& key) const
    {
      for(const auto& def : m_definitions)
      {
        if(def.key == key)
          return &def;
      }
      return nullptr;
    }

    // argv[0] is the program name and is skipped
    resolution_outcome parse(int argc, char** argv) const
    {
      std::vector<std::string> args;
      for(auto i = 1; i < argc; i++)
      {
        args.emplace_back(argv[i]);
      }
      return parse(args);
    }

    // args hold no program name
    resolution_outcome parse(const std::vector<std::string>& args) const
    {
      detail::resolver rs{ m_definitions, m_config, args };
      return rs.run();
    }

  private:
    option_definition& add_definition(const std::string& key, value_arity arity, parsing_strategy strategy)
    {
      auto& def = m_definitions.emplace_back();
      def.key = key;
      def.arity = arity;
      def.strategy = strategy;
      def.declaration_index = m_definitions.size() - 1;
      def.names = def.name_spec.make_names(key, m_config);
      return def;
    }

  private:
    parse_config m_config;
    std::deque<option_definition> m_definitions; // deque: builders keep pointers
  };
} // namespace optbind::inline v_0_1_0

#endif // OPTBIND_HPP
