// Runtime value model: tagged union of the data that flows through scripts and pipelines.
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <optional>
#include <utility>

namespace objsh
{

    namespace ast
    {
        struct Stmt;
        struct Expr;
        using StmtPtr = std::shared_ptr<Stmt>;
        using ExprPtr = std::shared_ptr<Expr>;
        using StmtList = std::vector<StmtPtr>;
    }

    struct Value;
    class Record;
    struct Function;
    struct DeferredBlock;

    using List = std::vector<Value>;

    enum class ValueKind
    {
        Null,
        Boolean,
        Number,
        String,
        Record,
        List,
        Function,
        Block
    };

    // Payloads of Record/List/Function/Block are immutable once built, so copies share them freely.
    struct Value
    {
        using RecordPtr = std::shared_ptr<const Record>;
        using ListPtr = std::shared_ptr<const List>;
        using FunctionPtr = std::shared_ptr<const Function>;
        using BlockPtr = std::shared_ptr<const DeferredBlock>;
        using data_t = std::variant<std::monostate, bool, double, std::string, RecordPtr, ListPtr, FunctionPtr, BlockPtr>;

        data_t data;

        Value() = default;
        Value(bool b) : data(b) {}
        Value(double d) : data(d) {}
        Value(int i) : data(static_cast<double>(i)) {}
        Value(std::string s) : data(std::move(s)) {}
        Value(const char *s) : data(std::string(s)) {}
        Value(List l) : data(std::make_shared<const List>(std::move(l))) {}
        Value(Record r);
        Value(Function f);
        Value(DeferredBlock b);

        static Value null() { return Value{}; }

        ValueKind kind() const { return static_cast<ValueKind>(data.index()); }
        bool is_null() const { return std::holds_alternative<std::monostate>(data); }
        bool is_bool() const { return std::holds_alternative<bool>(data); }
        bool is_number() const { return std::holds_alternative<double>(data); }
        bool is_string() const { return std::holds_alternative<std::string>(data); }
        bool is_record() const { return std::holds_alternative<RecordPtr>(data); }
        bool is_list() const { return std::holds_alternative<ListPtr>(data); }
        bool is_function() const { return std::holds_alternative<FunctionPtr>(data); }
        bool is_block() const { return std::holds_alternative<BlockPtr>(data); }

        bool as_bool() const { return std::get<bool>(data); }
        double as_number() const { return std::get<double>(data); }
        const std::string &as_string() const { return std::get<std::string>(data); }
        const Record &as_record() const { return *std::get<RecordPtr>(data); }
        const List &as_list() const { return *std::get<ListPtr>(data); }
        const Function &as_function() const { return *std::get<FunctionPtr>(data); }
        const DeferredBlock &as_block() const { return *std::get<BlockPtr>(data); }
    };

    // Insertion-ordered mapping with case-insensitive keys (hashtables and ad-hoc objects).
    class Record
    {
    public:
        using Entry = std::pair<std::string, Value>;

        const Value *find(std::string_view key) const;
        // Replaces an existing key in place (keeping its position and spelling), otherwise appends.
        void set(std::string key, Value value);
        bool contains(std::string_view key) const { return find(key) != nullptr; }

        const std::vector<Entry> &entries() const { return entries_; }
        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

    private:
        std::vector<Entry> entries_;
    };

    struct Parameter
    {
        std::string name;
        ast::ExprPtr default_value; // may be null
    };

    struct Function
    {
        std::string name;
        std::vector<Parameter> params;
        ast::StmtList body;
    };

    struct DeferredBlock
    {
        ast::StmtList body;
    };

    inline Value::Value(Record r) : data(std::make_shared<const Record>(std::move(r))) {}
    inline Value::Value(Function f) : data(std::make_shared<const Function>(std::move(f))) {}
    inline Value::Value(DeferredBlock b) : data(std::make_shared<const DeferredBlock>(std::move(b))) {}

    // Conversions (pure, never throw)
    bool to_boolean(const Value &v);
    std::optional<double> to_number(const Value &v);
    std::optional<double> parse_number(std::string_view text);
    std::string to_display_string(const Value &v);
    std::string format_number(double d);
    std::optional<Value> get_property(const Value &v, std::string_view name);

    // Name of the variant for diagnostics: Null, Boolean, Number, String, Record, List, Function, ScriptBlock.
    const char *kind_name(const Value &v);

    // Structural equality; Functions and blocks compare by identity.
    bool values_equal(const Value &a, const Value &b);

    // ASCII case-insensitive helpers shared by scope lookup, records and stage names.
    bool iequals(std::string_view a, std::string_view b);
    std::string to_lower(std::string_view s);
    int icompare(std::string_view a, std::string_view b);

} // namespace objsh
