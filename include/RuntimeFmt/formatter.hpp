#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "errors.hpp"

namespace RuntimeFmt {

enum class Align : std::uint8_t {
    none,
    left,
    right,
    center
};

enum class Sign : std::uint8_t {
    none,
    plus,
    minus,
    space
};

// Standard options parsed out of a replacement field by the interpreter.
// Width and precision are already resolved here: a dynamic width taken from
// another field is stored as a plain number before rendering starts.
struct FormatSpec {
    char fill = ' ';
    Align align = Align::none;
    Sign sign = Sign::none;
    bool alternate = false;
    bool zero_pad = false;
    std::optional<std::size_t> width;
    std::optional<std::size_t> precision;

    /// Builds the {fmt} replacement field for this option set.
    /// `presentation` is the {fmt} type character, '\0' for the default one.
    /// Returns nullopt if the options cannot be spelled in {fmt} syntax.
    std::optional<std::string> to_fmt_spec(char presentation) const {
        if(fill == '{' || fill == '}') {
            return std::nullopt;
        }
        std::string out = "{:";
        if(align != Align::none) {
            out.push_back(fill);
            switch(align) {
            case Align::left:   out.push_back('<'); break;
            case Align::right:  out.push_back('>'); break;
            case Align::center: out.push_back('^'); break;
            case Align::none: break;
            }
        } else if(fill != ' ') {
            // {fmt} only accepts a fill together with an alignment
            return std::nullopt;
        }
        switch(sign) {
        case Sign::plus:  out.push_back('+'); break;
        case Sign::minus: out.push_back('-'); break;
        case Sign::space: out.push_back(' '); break;
        case Sign::none: break;
        }
        if(alternate) out.push_back('#');
        if(zero_pad)  out.push_back('0');
        if(width) {
            out += std::to_string(*width);
        }
        if(precision) {
            out.push_back('.');
            out += std::to_string(*precision);
        }
        if(presentation != '\0') {
            out.push_back(presentation);
        }
        out.push_back('}');
        return out;
    }
};


// The sink handed to every capability for the duration of one call.
// It does not own the buffer and must not outlive it.
class Formatter {
    fmt::memory_buffer & m_out;
    FormatSpec m_spec;

public:
    explicit Formatter(fmt::memory_buffer & out, FormatSpec spec = {}):
        m_out(out), m_spec(spec)
    {}

    Formatter(const Formatter&) = delete;
    Formatter& operator=(const Formatter&) = delete;

    const FormatSpec & spec() const {
        return m_spec;
    }

    // For capability implementations that render on their own.
    // Options are not applied to what is written through it.
    fmt::appender out() {
        return fmt::appender(m_out);
    }

    // Raw text, options are not applied.
    FormatResult write(std::string_view text) {
        m_out.append(text.data(), text.data() + text.size());
        return {};
    }

    // Renders `value` with the current options and the given presentation type.
    // Nothing is written if {fmt} rejects the combination.
    template<class T>
    FormatResult write_value(const T & value, char presentation) {
        const std::optional<std::string> field = m_spec.to_fmt_spec(presentation);
        if(!field) {
            return FormatError::INVALID_SPEC;
        }
        const std::size_t mark = m_out.size();
        try {
            fmt::format_to(fmt::appender(m_out), fmt::runtime(*field), value);
        } catch(const fmt::format_error &) {
            m_out.resize(mark);
            return FormatError::INVALID_SPEC;
        }
        return {};
    }
};

} // namespace RuntimeFmt
