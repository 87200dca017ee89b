#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace runscope::obs {

// Identifiers attached to every structured log line emitted on this thread.
struct Context {
    std::string analysis_id;
    std::string request_id;
    std::string entity;
    std::string project;
};

inline thread_local std::optional<Context> g_context;

inline auto HasContext() -> bool { return g_context.has_value(); }

// Only valid when HasContext().
inline auto GetContext() -> const Context& { return *g_context; }

// The active context, or an empty one to extend.
inline auto CurrentContext() -> Context { return g_context.value_or(Context{}); }

inline void SetContext(const Context& ctx) { g_context = ctx; }

inline void ClearContext() { g_context.reset(); }

// Non-empty entries only.
inline auto ContextFields(const Context& ctx) -> nlohmann::json {
    nlohmann::json j = nlohmann::json::object();
    if (!ctx.analysis_id.empty()) { j["analysis_id"] = ctx.analysis_id; }
    if (!ctx.request_id.empty()) { j["request_id"] = ctx.request_id; }
    if (!ctx.entity.empty()) { j["entity"] = ctx.entity; }
    if (!ctx.project.empty()) { j["project"] = ctx.project; }
    return j;
}

// Installs a context for the current scope and restores the enclosing one on exit.
class ScopedContext {
public:
    explicit ScopedContext(const Context& ctx) : saved_(g_context) { g_context = ctx; }

    ~ScopedContext() { g_context = saved_; }

    ScopedContext(const ScopedContext&) = delete;
    auto operator=(const ScopedContext&) -> ScopedContext& = delete;

private:
    std::optional<Context> saved_;
};

} // namespace runscope::obs
