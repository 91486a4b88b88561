/* This file is part of Arbor project: https://github.com/sierkov/arbor/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/arbor/blob/main/LICENSE */

#include <bit>
#include <cmath>
#include <sstream>
#include <arbor/cbor/value.hpp>

namespace arbor::cbor {
    std::string_view type_name(const value_type type)
    {
        switch (type) {
            case value_type::null: return "null";
            case value_type::undefined: return "undefined";
            case value_type::boolean: return "boolean";
            case value_type::integer: return "integer";
            case value_type::big_integer: return "big integer";
            case value_type::floating: return "float";
            case value_type::bytes: return "bytes";
            case value_type::text: return "text";
            case value_type::array: return "array";
            case value_type::object: return "object";
            case value_type::map: return "map";
            case value_type::tag: return "tag";
            default: throw error("unsupported value type: {}", static_cast<int>(type));
        }
    }

    big_int value::as_big_int() const
    {
        switch (type()) {
            case value_type::integer: return big_int { std::get<int64_t>(_content) };
            case value_type::big_integer: return std::get<big_int>(_content);
            default: _throw_type_mismatch(value_type::big_integer);
        }
    }

    void value::_throw_type_mismatch(const value_type exp_type) const
    {
        throw error("invalid cbor value access, expecting type {} while the present value is {}: {}",
            exp_type, type(), to_string());
    }

    bool value::operator==(const value &o) const
    {
        if (_content.index() != o._content.index())
            return false;
        return std::visit([&](const auto &a) {
            using T = std::decay_t<decltype(a)>;
            const auto &b = std::get<T>(o._content);
            if constexpr (std::is_same_v<T, double>) {
                // bit-level comparison distinguishes signed zeros and signed NaNs
                return std::bit_cast<uint64_t>(a) == std::bit_cast<uint64_t>(b);
            } else if constexpr (std::is_same_v<T, object>) {
                if (a.size() != b.size())
                    return false;
                for (auto ai = a.begin(), bi = b.begin(); ai != a.end(); ++ai, ++bi) {
                    if (ai->first != bi->first || ai->second != bi->second)
                        return false;
                }
                return true;
            } else if constexpr (std::is_same_v<T, tagged>) {
                return a.id == b.id && *a.val == *b.val;
            } else {
                return a == b;
            }
        }, _content);
    }

    static void write_text(std::ostream &os, const std::string_view s)
    {
        os << '"';
        for (const char c: s) {
            switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (static_cast<uint8_t>(c) < 0x20)
                        os << fmt::format("\\u{:04x}", static_cast<int>(c));
                    else
                        os << c;
                    break;
            }
        }
        os << '"';
    }

    static void write_float(std::ostream &os, const double v)
    {
        if (std::isnan(v)) {
            os << (std::signbit(v) ? "-NaN" : "NaN");
            return;
        }
        if (std::isinf(v)) {
            os << (v < 0 ? "-Infinity" : "Infinity");
            return;
        }
        auto s = fmt::format("{}", v);
        if (s.find_first_of(".e") == std::string::npos)
            s += ".0";
        os << s;
    }

    // Renders the value in the diagnostic notation of RFC 7049 section 6
    void value::to_stream(std::ostream &os) const
    {
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, null_t>) {
                os << "null";
            } else if constexpr (std::is_same_v<T, undefined_t>) {
                os << "undefined";
            } else if constexpr (std::is_same_v<T, bool>) {
                os << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, big_int>) {
                os << v;
            } else if constexpr (std::is_same_v<T, double>) {
                write_float(os, v);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                os << fmt::format("h'{}'", buffer { v });
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_text(os, v);
            } else if constexpr (std::is_same_v<T, cbor::array>) {
                os << '[';
                for (size_t i = 0; i < v.size(); ++i) {
                    if (i > 0)
                        os << ", ";
                    v[i].to_stream(os);
                }
                os << ']';
            } else if constexpr (std::is_same_v<T, object>) {
                os << '{';
                for (auto it = v.begin(); it != v.end(); ++it) {
                    if (it != v.begin())
                        os << ", ";
                    write_text(os, it->first);
                    os << ": ";
                    it->second.to_stream(os);
                }
                os << '}';
            } else if constexpr (std::is_same_v<T, cbor::map>) {
                os << '{';
                for (size_t i = 0; i < v.size(); ++i) {
                    if (i > 0)
                        os << ", ";
                    v[i].first.to_stream(os);
                    os << ": ";
                    v[i].second.to_stream(os);
                }
                os << '}';
            } else if constexpr (std::is_same_v<T, tagged>) {
                os << v.id << '(';
                v.val->to_stream(os);
                os << ')';
            } else {
                static_assert(sizeof(T) == 0, "unsupported value alternative");
            }
        }, _content);
    }

    std::string value::to_string() const
    {
        std::ostringstream ss {};
        to_stream(ss);
        return ss.str();
    }
}
