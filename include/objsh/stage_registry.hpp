// Registry of named pipeline stages (built-in commands) and the context they are invoked with.
#pragma once
#include "objsh/value.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace objsh {

// Implemented by the evaluator so stages can run script blocks they receive as arguments.
class BlockRunner {
public:
    virtual ~BlockRunner() = default;
    virtual Value run_block(const DeferredBlock& block, const Value& input) = 0;
};

struct StageContext {
    const List& input;       // whole upstream collection (empty outside a pipeline)
    const List& positional;
    const Record& named;     // -Name value pairs; bare switches are Boolean true
    BlockRunner& runner;

    const Value* named_arg(std::string_view name) const { return named.find(name); }
};

using StageFn = std::function<Value(StageContext&)>;

class StageRegistry {
    struct Entry { std::string name; StageFn fn; };
public:
    class Handle {
    public:
        const std::string& name() const { return entry_->name; }
    private:
        friend class StageRegistry;
        explicit Handle(const Entry* e): entry_(e) {}
        const Entry* entry_;
    };

    // Registers (or replaces) a stage; names are matched case-insensitively.
    StageRegistry& add_stage(std::string name, StageFn fn);
    std::optional<Handle> resolve(std::string_view name) const;
    Value invoke(const Handle& h, const List& input, const List& positional, const Record& named, BlockRunner& runner) const;
    // Registration order, original spelling.
    std::vector<std::string> names() const;
    size_t size() const { return stages_.size(); }

private:
    std::unordered_map<std::string, Entry> stages_; // lowercased name -> entry
    std::vector<std::string> order_;
};

} // namespace objsh
