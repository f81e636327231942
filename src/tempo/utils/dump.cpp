// src/tempo/utils/dump.cpp
#include "tempo/utils/dump.hpp"
#include <cstdio>
#include <stdexcept>

namespace tempo {
namespace utils {

Value Value::array(std::initializer_list<Value> items) {
    Value result = table();
    for (const auto& item : items) {
        result.push(item);
    }
    return result;
}

Value Value::table(std::initializer_list<Field> fields) {
    return Value(Table(fields));
}

Value& Value::push(Value value) {
    if (!is_table()) {
        throw std::logic_error("push() on a value that is not a table");
    }
    auto& fields = std::get<Table>(data_);
    fields.emplace_back(static_cast<double>(fields.size() + 1), std::move(value));
    return *this;
}

Value& Value::set(Key key, Value value) {
    if (!is_table()) {
        throw std::logic_error("set() on a value that is not a table");
    }
    auto& fields = std::get<Table>(data_);
    for (auto& field : fields) {
        if (field.first == key) {
            field.second = std::move(value);
            return *this;
        }
    }
    fields.emplace_back(std::move(key), std::move(value));
    return *this;
}

std::string format_number(double n) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.14g", n);
    return buffer;
}

std::string quote_string(const std::string& s) {
    std::string out = "\"";
    for (unsigned char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\0':
                out += "\\000";
                break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\%03u", static_cast<unsigned>(c));
                    out += escaped;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
    return out;
}

namespace {

void dump_into(const Value& value, std::string& out);

struct DumpVisitor {
    std::string& out;

    void operator()(std::monostate) const {
        throw std::invalid_argument("Unsupported type nil");
    }
    void operator()(bool b) const {
        out += b ? "true" : "false";
    }
    void operator()(double n) const {
        out += format_number(n);
    }
    void operator()(const std::string& s) const {
        out += quote_string(s);
    }
    void operator()(const Value::Table& fields) const {
        out += '{';
        double position = 1;
        for (const auto& [key, item] : fields) {
            if (const double* index = std::get_if<double>(&key)) {
                // Keys that continue the sequence are implied by position
                if (*index != position) {
                    out += '[' + format_number(*index) + "]=";
                }
            } else {
                out += '[' + quote_string(std::get<std::string>(key)) + "]=";
            }
            dump_into(item, out);
            out += ',';
            position += 1;
        }
        out += '}';
    }
};

void dump_into(const Value& value, std::string& out) {
    std::visit(DumpVisitor{out}, value.data());
}

} // namespace

std::string dump(const Value& value) {
    std::string out;
    dump_into(value, out);
    return out;
}

} // namespace utils
} // namespace tempo
