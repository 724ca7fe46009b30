#include <leptjson-cpp/serialize.hpp>

#include "text/unicode.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace leptjson_cpp {

namespace {

class Writer {
public:
    explicit Writer(std::size_t indent) : indent_{indent} {}

    auto take() -> std::string { return std::move(out_); }

    void write(const Value& value, std::size_t depth) {
        std::visit(overload{
            [&](const Null&) { out_ += "null"; },
            [&](bool b) { out_ += b ? "true" : "false"; },
            [&](double n) { write_number(n); },
            [&](const std::string& s) { write_string(s); },
            [&](const Array& a) { write_array(a, depth); },
            [&](const Object& o) { write_object(o, depth); },
        }, value.storage());
    }

private:
    void write_number(double n) {
        if (!std::isfinite(n)) {
            out_ += "null";
            return;
        }
        auto buf = std::array<char, 32>{};
        auto result = std::to_chars(buf.data(), buf.data() + buf.size(), n);
        out_.append(buf.data(), result.ptr);
    }

    void write_string(const std::string& s) {
        out_.push_back('"');
        for (char c : s) {
            switch (c) {
                case '"':  out_ += "\\\""; break;
                case '\\': out_ += "\\\\"; break;
                case '\b': out_ += "\\b";  break;
                case '\f': out_ += "\\f";  break;
                case '\n': out_ += "\\n";  break;
                case '\r': out_ += "\\r";  break;
                case '\t': out_ += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        text::append_control_escape(static_cast<unsigned char>(c), out_);
                    } else {
                        out_.push_back(c);
                    }
            }
        }
        out_.push_back('"');
    }

    void write_array(const Array& elements, std::size_t depth) {
        if (elements.empty()) {
            out_ += "[]";
            return;
        }
        out_.push_back('[');
        for (std::size_t i = 0; i < elements.size(); ++i) {
            if (i > 0) out_.push_back(',');
            newline(depth + 1);
            write(elements[i], depth + 1);
        }
        newline(depth);
        out_.push_back(']');
    }

    void write_object(const Object& members, std::size_t depth) {
        if (members.empty()) {
            out_ += "{}";
            return;
        }
        out_.push_back('{');
        for (std::size_t i = 0; i < members.size(); ++i) {
            if (i > 0) out_.push_back(',');
            newline(depth + 1);
            write_string(members[i].key);
            out_ += indent_ > 0 ? ": " : ":";
            write(members[i].value, depth + 1);
        }
        newline(depth);
        out_.push_back('}');
    }

    void newline(std::size_t depth) {
        if (indent_ == 0) return;
        out_.push_back('\n');
        out_.append(depth * indent_, ' ');
    }

    std::size_t indent_;
    std::string out_;
};

}  // anonymous namespace

auto stringify(const Value& value) -> std::string {
    return stringify(value, StringifyOptions{});
}

auto stringify(const Value& value, const StringifyOptions& options) -> std::string {
    auto writer = Writer{options.indent};
    writer.write(value, 0);
    return writer.take();
}

auto operator<<(std::ostream& os, const Value& value) -> std::ostream& {
    return os << stringify(value);
}

}  // namespace leptjson_cpp
