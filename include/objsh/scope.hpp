// Variable frames and the scope stack with global:/local:/script: qualifiers.
#pragma once
#include "objsh/value.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <optional>

namespace objsh {

enum class FrameKind { Global, Function, Block };

// One level of the stack: insertion-ordered bindings, names matched case-insensitively.
class Frame {
public:
    explicit Frame(FrameKind kind = FrameKind::Block): kind_(kind) {}

    FrameKind kind() const { return kind_; }
    const Value* get(std::string_view name) const;
    bool contains(std::string_view name) const { return get(name)!=nullptr; }
    void set(std::string_view name, Value value);
    const std::vector<std::pair<std::string, Value>>& bindings() const { return bindings_; }

private:
    FrameKind kind_;
    std::vector<std::pair<std::string, Value>> bindings_;
    std::unordered_map<std::string, size_t> index_; // lowercased name -> slot
};

enum class ScopeQualifier { None, Global, Local, Script };

struct QualifiedName {
    ScopeQualifier qualifier = ScopeQualifier::None;
    std::string_view base;
};

// Splits "global:x" style names. Unrecognized prefixes stay part of the name.
QualifiedName parse_qualifier(std::string_view name);

class ScopeStack {
public:
    ScopeStack();

    void push_frame(FrameKind kind = FrameKind::Block);
    // Throws std::logic_error when only the global frame remains.
    void pop_frame();
    size_t depth() const { return frames_.size(); }

    std::optional<Value> read(std::string_view name) const;
    void write(std::string_view name, Value value);
    // Always binds in the innermost frame (parameters, the pipeline item).
    void define(std::string_view name, Value value);

    Frame& global_frame() { return frames_.front(); }
    const Frame& global_frame() const { return frames_.front(); }
    Frame& local_frame() { return frames_.back(); }
    const Frame& local_frame() const { return frames_.back(); }
    // script: has no frame of its own yet and resolves to the global frame.
    Frame& script_frame() { return frames_.front(); }
    const Frame& script_frame() const { return frames_.front(); }

    // Names visible from the innermost frame (used for suggestions).
    std::vector<std::string> visible_names() const;

    void set_trace(bool on){ trace_ = on; }

private:
    // Index of the outermost frame an unqualified walk may visit before jumping to global.
    size_t walk_floor() const;

    std::vector<Frame> frames_;
    bool trace_ = false;
};

// Pops the frame it pushed on every exit path.
class FrameGuard {
public:
    FrameGuard(ScopeStack& scope, FrameKind kind): scope_(scope) { scope_.push_frame(kind); }
    ~FrameGuard(){ scope_.pop_frame(); }
    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;
private:
    ScopeStack& scope_;
};

} // namespace objsh
