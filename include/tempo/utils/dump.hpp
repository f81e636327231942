// include/tempo/utils/dump.hpp
#pragma once
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tempo {
namespace utils {

// Dynamic value: nil, boolean, number, string, or a table of ordered fields
class Value {
public:
    using Key = std::variant<double, std::string>;
    using Field = std::pair<Key, Value>;
    using Table = std::vector<Field>;

    Value() = default;
    Value(bool b) : data_(b) {}
    Value(int n) : data_(static_cast<double>(n)) {}
    Value(double n) : data_(n) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Table t) : data_(std::move(t)) {}

    // Sequence with keys 1..n
    static Value array(std::initializer_list<Value> items);
    static Value table(std::initializer_list<Field> fields = {});

    bool is_nil() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_table() const { return std::holds_alternative<Table>(data_); }

    // Appends at the next position, key = field count + 1
    Value& push(Value value);
    Value& set(Key key, Value value);

    const std::variant<std::monostate, bool, double, std::string, Table>& data() const { return data_; }

private:
    std::variant<std::monostate, bool, double, std::string, Table> data_;
};

// Table-constructor literal, e.g. {1,2,["name"]="x",}. Throws
// std::invalid_argument when the tree contains nil.
std::string dump(const Value& value);

std::string format_number(double n);
std::string quote_string(const std::string& s);

} // namespace utils
} // namespace tempo
